/**
 * @file implicit_vr_codec.cpp
 * @brief Implementation of Implicit VR Little Endian encoder/decoder
 */

#include "dicom_ul/encoding/implicit_vr_codec.hpp"

#include "codec_detail.hpp"

#include <array>
#include <utility>

namespace dicom_ul::encoding {

using namespace detail;

namespace {

struct implicit_vr_entry {
    uint32_t tag;
    vr_type vr;
};

// Command group (PS3.7 Annex E) and the query keys most often seen in
// C-FIND / C-MOVE identifiers.
constexpr std::array<implicit_vr_entry, 40> implicit_vr_table = {{
    {0x00000000, vr_type::UL}, {0x00000002, vr_type::UI},
    {0x00000003, vr_type::UI}, {0x00000100, vr_type::US},
    {0x00000110, vr_type::US}, {0x00000120, vr_type::US},
    {0x00000600, vr_type::AE}, {0x00000700, vr_type::US},
    {0x00000800, vr_type::US}, {0x00000900, vr_type::US},
    {0x00000901, vr_type::AT}, {0x00000902, vr_type::LO},
    {0x00000903, vr_type::US}, {0x00001000, vr_type::UI},
    {0x00001001, vr_type::UI}, {0x00001002, vr_type::US},
    {0x00001005, vr_type::AT}, {0x00001008, vr_type::US},
    {0x00001020, vr_type::US}, {0x00001021, vr_type::US},
    {0x00001022, vr_type::US}, {0x00001023, vr_type::US},
    {0x00001030, vr_type::AE}, {0x00001031, vr_type::US},
    {0x00080005, vr_type::CS}, {0x00080016, vr_type::UI},
    {0x00080018, vr_type::UI}, {0x00080020, vr_type::DA},
    {0x00080030, vr_type::TM}, {0x00080050, vr_type::SH},
    {0x00080052, vr_type::CS}, {0x00080060, vr_type::CS},
    {0x00100010, vr_type::PN}, {0x00100020, vr_type::LO},
    {0x00100030, vr_type::DA}, {0x00100040, vr_type::CS},
    {0x0020000D, vr_type::UI}, {0x0020000E, vr_type::UI},
    {0x00200010, vr_type::SH}, {0x00200013, vr_type::IS},
}};

template <typename T>
implicit_vr_codec::result<T> codec_error(int code, const std::string& message) {
    return make_ul_error<T>(code, message, "encoding");
}

}  // namespace

vr_type implicit_vr_codec::implicit_vr_for(core::dicom_tag tag) noexcept {
    for (const auto& entry : implicit_vr_table) {
        if (entry.tag == tag.combined()) {
            return entry.vr;
        }
    }
    if (tag.is_group_length()) {
        return vr_type::UL;
    }
    return vr_type::UN;
}

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> implicit_vr_codec::encode(const core::dicom_dataset& dataset) {
    std::vector<uint8_t> buffer;
    for (const auto& [tag, element] : dataset) {
        append_element(buffer, element);
    }
    return buffer;
}

std::vector<uint8_t> implicit_vr_codec::encode_element(
    const core::dicom_element& element) {
    std::vector<uint8_t> buffer;
    append_element(buffer, element);
    return buffer;
}

void implicit_vr_codec::append_element(std::vector<uint8_t>& buffer,
                                       const core::dicom_element& element) {
    write_tag(buffer, element.tag());

    if (element.is_sequence()) {
        write_le32(buffer, undefined_length);
        for (const auto& item : element.sequence_items()) {
            auto content = encode(item);
            write_tag(buffer, item_tag);
            write_le32(buffer, static_cast<uint32_t>(content.size()));
            buffer.insert(buffer.end(), content.begin(), content.end());
        }
        write_tag(buffer, sequence_delimitation_tag);
        write_le32(buffer, 0);
        return;
    }

    auto value = element.raw_data();
    const bool needs_padding = (value.size() % 2) != 0;
    write_le32(buffer, static_cast<uint32_t>(value.size() + (needs_padding ? 1 : 0)));
    buffer.insert(buffer.end(), value.begin(), value.end());
    if (needs_padding) {
        buffer.push_back(static_cast<uint8_t>(padding_char(element.vr())));
    }
}

// ============================================================================
// Decoding
// ============================================================================

implicit_vr_codec::result<core::dicom_dataset> implicit_vr_codec::decode(
    std::span<const uint8_t> data) {
    return decode_dataset(data, 0);
}

implicit_vr_codec::result<core::dicom_element> implicit_vr_codec::decode_element(
    std::span<const uint8_t>& data) {
    return decode_element_at(data, 0);
}

implicit_vr_codec::result<core::dicom_dataset> implicit_vr_codec::decode_dataset(
    std::span<const uint8_t> data, int depth) {
    core::dicom_dataset dataset;
    while (!data.empty()) {
        auto element = decode_element_at(data, depth);
        if (element.is_err()) {
            return element.error();
        }
        dataset.insert(std::move(element.value()));
    }
    return dataset;
}

implicit_vr_codec::result<core::dicom_element> implicit_vr_codec::decode_element_at(
    std::span<const uint8_t>& data, int depth) {
    if (data.size() < 8) {
        return codec_error<core::dicom_element>(
            error_codes::insufficient_data,
            "Insufficient data for element header: " + std::to_string(data.size()) +
                " bytes");
    }

    const core::dicom_tag tag{read_le16(data.data()), read_le16(data.data() + 2)};
    const uint32_t length = read_le32(data.data() + 4);

    if (tag.is_item_delimiter_group()) {
        return codec_error<core::dicom_element>(
            error_codes::invalid_sequence,
            "Unexpected delimiter " + tag.to_string() + " outside a sequence");
    }

    data = data.subspan(8);

    if (length == undefined_length) {
        return decode_sequence(tag, data, true, depth + 1);
    }

    if (data.size() < length) {
        return codec_error<core::dicom_element>(
            error_codes::insufficient_data,
            "Value of " + tag.to_string() + " exceeds buffer: length " +
                std::to_string(length) + ", available " + std::to_string(data.size()));
    }

    auto value = data.subspan(0, length);
    data = data.subspan(length);

    const auto vr = implicit_vr_for(tag);
    if (vr == vr_type::SQ) {
        return decode_sequence(tag, value, false, depth + 1);
    }
    return core::dicom_element(tag, vr, value);
}

implicit_vr_codec::result<core::dicom_element> implicit_vr_codec::decode_sequence(
    core::dicom_tag tag, std::span<const uint8_t>& data, bool undefined, int depth) {
    if (depth > max_sequence_depth) {
        return codec_error<core::dicom_element>(error_codes::invalid_sequence,
                                                "Sequence nesting too deep");
    }

    core::dicom_element sequence(tag, vr_type::SQ);

    while (true) {
        if (data.empty() && !undefined) {
            break;
        }
        if (data.size() < 8) {
            return codec_error<core::dicom_element>(
                error_codes::insufficient_data,
                "Truncated sequence " + tag.to_string());
        }

        const core::dicom_tag marker{read_le16(data.data()), read_le16(data.data() + 2)};
        const uint32_t item_length = read_le32(data.data() + 4);
        data = data.subspan(8);

        if (marker == sequence_delimitation_tag) {
            if (!undefined) {
                return codec_error<core::dicom_element>(
                    error_codes::invalid_sequence,
                    "Sequence delimiter inside defined-length sequence");
            }
            break;
        }
        if (marker != item_tag) {
            return codec_error<core::dicom_element>(
                error_codes::invalid_sequence,
                "Expected item tag in sequence " + tag.to_string() + ", got " +
                    marker.to_string());
        }

        if (item_length != undefined_length) {
            if (data.size() < item_length) {
                return codec_error<core::dicom_element>(
                    error_codes::insufficient_data, "Truncated sequence item");
            }
            auto item = decode_dataset(data.subspan(0, item_length), depth);
            if (item.is_err()) {
                return item.error();
            }
            data = data.subspan(item_length);
            sequence.sequence_items().push_back(std::move(item.value()));
            continue;
        }

        core::dicom_dataset item;
        while (true) {
            if (data.size() < 8) {
                return codec_error<core::dicom_element>(
                    error_codes::insufficient_data, "Missing item delimiter");
            }
            const core::dicom_tag next{read_le16(data.data()), read_le16(data.data() + 2)};
            if (next == item_delimitation_tag) {
                data = data.subspan(8);
                break;
            }
            auto element = decode_element_at(data, depth);
            if (element.is_err()) {
                return element.error();
            }
            item.insert(std::move(element.value()));
        }
        sequence.sequence_items().push_back(std::move(item));
    }

    return sequence;
}

}  // namespace dicom_ul::encoding
