/**
 * @file implicit_vr_codec_test.cpp
 * @brief Unit tests for the Implicit VR Little Endian codec
 */

#include <catch2/catch_test_macros.hpp>

#include <dicom_ul/core/dicom_dataset.hpp>
#include <dicom_ul/encoding/implicit_vr_codec.hpp>

#include <vector>

using namespace dicom_ul::core;
using namespace dicom_ul::encoding;

namespace {

constexpr dicom_tag command_field_tag{0x0000, 0x0100};
constexpr dicom_tag affected_sop_class{0x0000, 0x0002};
constexpr dicom_tag patient_name{0x0010, 0x0010};
constexpr dicom_tag private_tag{0x0009, 0x1001};

}  // namespace

TEST_CASE("implicit_vr_codec element layout", "[encoding][implicit]") {
    auto elem = dicom_element::from_numeric<uint16_t>(command_field_tag, vr_type::US, 0x0030);
    auto bytes = implicit_vr_codec::encode_element(elem);

    // Tag (4) + Length32 (4) + Value (2)
    const std::vector<uint8_t> expected{0x00, 0x00, 0x00, 0x01,
                                        0x02, 0x00, 0x00, 0x00,
                                        0x30, 0x00};
    CHECK(bytes == expected);
}

TEST_CASE("implicit_vr_codec resolves command group VRs", "[encoding][implicit]") {
    CHECK(implicit_vr_codec::implicit_vr_for(command_field_tag) == vr_type::US);
    CHECK(implicit_vr_codec::implicit_vr_for(affected_sop_class) == vr_type::UI);
    CHECK(implicit_vr_codec::implicit_vr_for(dicom_tag{0x0000, 0x0000}) == vr_type::UL);
    CHECK(implicit_vr_codec::implicit_vr_for(private_tag) == vr_type::UN);
}

TEST_CASE("implicit_vr_codec dataset round trip", "[encoding][implicit]") {
    dicom_dataset ds;
    ds.set_numeric<uint16_t>(command_field_tag, vr_type::US, 0x0020);
    ds.set_string(affected_sop_class, vr_type::UI, "1.2.840.10008.5.1.4.1.2.2.1");
    ds.set_string(patient_name, vr_type::PN, "DOE^JOHN");

    auto decoded = implicit_vr_codec::decode(implicit_vr_codec::encode(ds));

    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == ds);
}

TEST_CASE("implicit_vr_codec decodes unknown tags as UN", "[encoding][implicit]") {
    dicom_dataset ds;
    ds.set_string(private_tag, vr_type::LO, "VENDOR");

    auto decoded = implicit_vr_codec::decode(implicit_vr_codec::encode(ds));

    REQUIRE(decoded.is_ok());
    const auto* elem = decoded.value().get(private_tag);
    REQUIRE(elem != nullptr);
    CHECK(elem->vr() == vr_type::UN);
    CHECK(elem->as_string() == "VENDOR");
}

TEST_CASE("implicit_vr_codec rejects truncated input", "[encoding][implicit]") {
    dicom_dataset ds;
    ds.set_string(patient_name, vr_type::PN, "DOE^JOHN");
    auto bytes = implicit_vr_codec::encode(ds);

    SECTION("value shorter than its length") {
        bytes.pop_back();
        auto decoded = implicit_vr_codec::decode(bytes);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == dicom_ul::error_codes::insufficient_data);
    }

    SECTION("partial element header") {
        std::vector<uint8_t> header(bytes.begin(), bytes.begin() + 5);
        CHECK(implicit_vr_codec::decode(header).is_err());
    }

    SECTION("empty input is an empty data set") {
        auto decoded = implicit_vr_codec::decode(std::vector<uint8_t>{});
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().empty());
    }
}
