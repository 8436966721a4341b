/**
 * @file explicit_vr_codec.cpp
 * @brief Implementation of Explicit VR Little Endian encoder/decoder
 */

#include "dicom_ul/encoding/explicit_vr_codec.hpp"

#include "codec_detail.hpp"

#include <dicom_ul/encoding/vr_type.hpp>

#include <utility>

namespace dicom_ul::encoding {

using namespace detail;

namespace {

template <typename T>
explicit_vr_codec::result<T> codec_error(int code, const std::string& message) {
    return make_ul_error<T>(code, message, "encoding");
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> explicit_vr_codec::encode(const core::dicom_dataset& dataset) {
    std::vector<uint8_t> buffer;
    buffer.reserve(1024);
    for (const auto& [tag, element] : dataset) {
        append_element(buffer, element);
    }
    return buffer;
}

std::vector<uint8_t> explicit_vr_codec::encode_element(
    const core::dicom_element& element) {
    std::vector<uint8_t> buffer;
    append_element(buffer, element);
    return buffer;
}

void explicit_vr_codec::append_element(std::vector<uint8_t>& buffer,
                                       const core::dicom_element& element) {
    write_tag(buffer, element.tag());
    const auto code = vr_code(element.vr());
    buffer.push_back(static_cast<uint8_t>(code[0]));
    buffer.push_back(static_cast<uint8_t>(code[1]));

    if (element.is_sequence()) {
        write_le16(buffer, 0x0000);
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
    const auto length = static_cast<uint32_t>(value.size() + (needs_padding ? 1 : 0));

    if (has_explicit_32bit_length(element.vr())) {
        write_le16(buffer, 0x0000);
        write_le32(buffer, length);
    } else {
        // Values of short-form VRs never exceed 0xFFFF in a valid data set
        write_le16(buffer, static_cast<uint16_t>(length));
    }

    buffer.insert(buffer.end(), value.begin(), value.end());
    if (needs_padding) {
        buffer.push_back(static_cast<uint8_t>(padding_char(element.vr())));
    }
}

// ============================================================================
// Decoding
// ============================================================================

explicit_vr_codec::result<core::dicom_dataset> explicit_vr_codec::decode(
    std::span<const uint8_t> data) {
    return decode_dataset(data, 0);
}

explicit_vr_codec::result<core::dicom_element> explicit_vr_codec::decode_element(
    std::span<const uint8_t>& data) {
    return decode_element_at(data, 0);
}

explicit_vr_codec::result<core::dicom_dataset> explicit_vr_codec::decode_dataset(
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

explicit_vr_codec::result<core::dicom_element> explicit_vr_codec::decode_element_at(
    std::span<const uint8_t>& data, int depth) {
    if (data.size() < 8) {
        return codec_error<core::dicom_element>(
            error_codes::insufficient_data, "Insufficient data to decode element");
    }

    const core::dicom_tag tag{read_le16(data.data()), read_le16(data.data() + 2)};
    if (tag.is_item_delimiter_group()) {
        return codec_error<core::dicom_element>(
            error_codes::invalid_sequence,
            "Unexpected delimiter " + tag.to_string() + " outside a sequence");
    }

    auto vr_opt = vr_from_bytes(data[4], data[5]);
    if (!vr_opt) {
        return codec_error<core::dicom_element>(
            error_codes::invalid_tag_encoding,
            "Unknown VR in element " + tag.to_string());
    }
    const vr_type vr = *vr_opt;

    uint32_t length = 0;
    size_t header_size = 8;
    if (has_explicit_32bit_length(vr)) {
        if (data.size() < 12) {
            return codec_error<core::dicom_element>(
                error_codes::insufficient_data,
                "Insufficient data for extended VR format");
        }
        length = read_le32(data.data() + 8);
        header_size = 12;
    } else {
        length = read_le16(data.data() + 6);
    }

    data = data.subspan(header_size);

    if (length == undefined_length) {
        if (vr != vr_type::SQ) {
            return codec_error<core::dicom_element>(
                error_codes::invalid_length_encoding,
                "Undefined length on non-sequence element " + tag.to_string());
        }
        return decode_sequence(tag, data, true, depth + 1);
    }

    if (data.size() < length) {
        return codec_error<core::dicom_element>(
            error_codes::insufficient_data,
            "Insufficient data for value of " + tag.to_string());
    }

    auto value = data.subspan(0, length);
    data = data.subspan(length);

    if (vr == vr_type::SQ) {
        return decode_sequence(tag, value, false, depth + 1);
    }
    return core::dicom_element(tag, vr, value);
}

explicit_vr_codec::result<core::dicom_element> explicit_vr_codec::decode_sequence(
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

        // Item and delimiter headers are always in implicit form
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
                "Expected Item tag in sequence " + tag.to_string());
        }

        if (item_length != undefined_length) {
            if (data.size() < item_length) {
                return codec_error<core::dicom_element>(
                    error_codes::insufficient_data, "Insufficient data for item content");
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
                    error_codes::insufficient_data,
                    "Insufficient data for item delimiter check");
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
