/**
 * @file explicit_vr_codec_test.cpp
 * @brief Unit tests for the Explicit VR Little Endian codec
 */

#include <catch2/catch_test_macros.hpp>

#include <dicom_ul/core/dicom_dataset.hpp>
#include <dicom_ul/encoding/explicit_vr_codec.hpp>

#include <vector>

using namespace dicom_ul::core;
using namespace dicom_ul::encoding;

namespace {

constexpr dicom_tag patient_name{0x0010, 0x0010};
constexpr dicom_tag patient_id{0x0010, 0x0020};
constexpr dicom_tag rows{0x0028, 0x0010};
constexpr dicom_tag referenced_series{0x0008, 0x1115};
constexpr dicom_tag series_uid{0x0020, 0x000E};
constexpr dicom_tag unknown_private{0x0009, 0x1010};

uint16_t read_le16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

uint32_t read_le32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

}  // namespace

TEST_CASE("explicit_vr_codec 16-bit length VRs", "[encoding][explicit]") {
    auto elem = dicom_element::from_string(patient_name, vr_type::PN, "DOE^JOHN");
    auto bytes = explicit_vr_codec::encode_element(elem);

    // Group (2) + Element (2) + VR (2) + Length16 (2) + Value (8)
    REQUIRE(bytes.size() == 16);
    CHECK(read_le16(bytes.data()) == 0x0010);
    CHECK(read_le16(bytes.data() + 2) == 0x0010);
    CHECK(bytes[4] == 'P');
    CHECK(bytes[5] == 'N');
    CHECK(read_le16(bytes.data() + 6) == 8);
}

TEST_CASE("explicit_vr_codec 32-bit length VRs", "[encoding][explicit]") {
    const std::vector<uint8_t> value{0x01, 0x02, 0x03, 0x04};
    dicom_element elem(unknown_private, vr_type::UN, value);
    auto bytes = explicit_vr_codec::encode_element(elem);

    // Tag (4) + VR (2) + Reserved (2) + Length32 (4) + Value (4)
    REQUIRE(bytes.size() == 16);
    CHECK(bytes[4] == 'U');
    CHECK(bytes[5] == 'N');
    CHECK(read_le16(bytes.data() + 6) == 0);
    CHECK(read_le32(bytes.data() + 8) == 4);
}

TEST_CASE("explicit_vr_codec dataset round trip", "[encoding][explicit]") {
    dicom_dataset ds;
    ds.set_string(patient_name, vr_type::PN, "DOE^JOHN");
    ds.set_string(patient_id, vr_type::LO, "12345");
    ds.set_numeric<uint16_t>(rows, vr_type::US, 512);

    SECTION("flat data set") {
        auto decoded = explicit_vr_codec::decode(explicit_vr_codec::encode(ds));
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == ds);
    }

    SECTION("nested sequence") {
        dicom_dataset item;
        item.set_string(series_uid, vr_type::UI, "1.2.3.4");
        dicom_element sequence(referenced_series, vr_type::SQ);
        sequence.sequence_items().push_back(item);
        ds.insert(sequence);

        auto decoded = explicit_vr_codec::decode(explicit_vr_codec::encode(ds));
        REQUIRE(decoded.is_ok());
        const auto* seq = decoded.value().get(referenced_series);
        REQUIRE(seq != nullptr);
        REQUIRE(seq->sequence_items().size() == 1);
        CHECK(seq->sequence_items()[0].get_string(series_uid) == "1.2.3.4");
    }
}

TEST_CASE("explicit_vr_codec rejects malformed input", "[encoding][explicit]") {
    dicom_dataset ds;
    ds.set_string(patient_name, vr_type::PN, "DOE^JOHN");
    auto bytes = explicit_vr_codec::encode(ds);

    SECTION("unknown VR bytes") {
        bytes[4] = 'Z';
        bytes[5] = 'Z';
        auto decoded = explicit_vr_codec::decode(bytes);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == dicom_ul::error_codes::invalid_tag_encoding);
    }

    SECTION("truncated value") {
        bytes.resize(bytes.size() - 3);
        auto decoded = explicit_vr_codec::decode(bytes);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == dicom_ul::error_codes::insufficient_data);
    }

    SECTION("undefined length on a non-sequence") {
        dicom_element elem(unknown_private, vr_type::UN,
                           std::vector<uint8_t>{0x00, 0x00});
        auto raw = explicit_vr_codec::encode_element(elem);
        raw[8] = raw[9] = raw[10] = raw[11] = 0xFF;
        auto decoded = explicit_vr_codec::decode(raw);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == dicom_ul::error_codes::invalid_length_encoding);
    }
}
