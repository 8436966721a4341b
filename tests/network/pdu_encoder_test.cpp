/**
 * @file pdu_encoder_test.cpp
 * @brief Byte-layout tests for pdu_encoder
 */

#include <catch2/catch_test_macros.hpp>

#include "dicom_ul/network/pdu_encoder.hpp"
#include "dicom_ul/network/pdu_types.hpp"

#include <dicom_ul/core/result.hpp>

#include <string>
#include <vector>

using namespace dicom_ul::network;

namespace {

uint16_t read_uint16_be(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

uint32_t read_uint32_be(const std::vector<uint8_t>& data, size_t offset) {
    return (static_cast<uint32_t>(data[offset]) << 24) |
           (static_cast<uint32_t>(data[offset + 1]) << 16) |
           (static_cast<uint32_t>(data[offset + 2]) << 8) |
           static_cast<uint32_t>(data[offset + 3]);
}

std::string read_string(const std::vector<uint8_t>& data, size_t offset, size_t length) {
    return std::string(data.begin() + static_cast<std::ptrdiff_t>(offset),
                       data.begin() + static_cast<std::ptrdiff_t>(offset + length));
}

associate_rq make_echo_rq() {
    associate_rq rq;
    rq.called_ae_title = "ARCHIVE";
    rq.calling_ae_title = "ECHOSCU";
    rq.application_context = DICOM_APPLICATION_CONTEXT;
    rq.presentation_contexts.emplace_back(
        1, "1.2.840.10008.1.1", std::vector<std::string>{"1.2.840.10008.1.2"});
    rq.user_info.max_pdu_length = DEFAULT_MAX_PDU_LENGTH;
    rq.user_info.implementation_class_uid = "1.2.3.4";
    return rq;
}

}  // namespace

TEST_CASE("pdu_encoder A-ASSOCIATE-RQ", "[network][pdu_encoder]") {
    auto bytes = pdu_encoder::encode_associate_rq(make_echo_rq());

    SECTION("fixed header") {
        CHECK(bytes[0] == 0x01);
        CHECK(bytes[1] == 0x00);
        CHECK(read_uint32_be(bytes, 2) == bytes.size() - PDU_HEADER_SIZE);
        CHECK(read_uint16_be(bytes, 6) == DICOM_PROTOCOL_VERSION);
        CHECK(read_uint16_be(bytes, 8) == 0x0000);
    }

    SECTION("AE titles are space padded to 16 bytes") {
        CHECK(read_string(bytes, 10, 16) == "ARCHIVE         ");
        CHECK(read_string(bytes, 26, 16) == "ECHOSCU         ");
        for (size_t i = 42; i < 74; ++i) {
            CHECK(bytes[i] == 0x00);
        }
    }

    SECTION("application context item comes first") {
        REQUIRE(bytes.size() > ASSOCIATE_FIXED_SIZE + 4);
        CHECK(bytes[ASSOCIATE_FIXED_SIZE] == static_cast<uint8_t>(item_type::application_context));
        const auto length = read_uint16_be(bytes, ASSOCIATE_FIXED_SIZE + 2);
        CHECK(length % 2 == 0);
        CHECK(read_string(bytes, ASSOCIATE_FIXED_SIZE + 4, 21) == DICOM_APPLICATION_CONTEXT);
    }

    SECTION("presentation context item follows") {
        const size_t app_len = read_uint16_be(bytes, ASSOCIATE_FIXED_SIZE + 2);
        const size_t pc = ASSOCIATE_FIXED_SIZE + 4 + app_len;
        CHECK(bytes[pc] == static_cast<uint8_t>(item_type::presentation_context_rq));
        CHECK(bytes[pc + 4] == 1);
        CHECK(bytes[pc + 8] == static_cast<uint8_t>(item_type::abstract_syntax));
    }
}

TEST_CASE("pdu_encoder A-ASSOCIATE-AC", "[network][pdu_encoder]") {
    associate_ac ac;
    ac.called_ae_title = "ARCHIVE";
    ac.calling_ae_title = "ECHOSCU";
    ac.application_context = DICOM_APPLICATION_CONTEXT;
    ac.presentation_contexts.emplace_back(1, presentation_context_result::acceptance,
                                          "1.2.840.10008.1.2");
    ac.presentation_contexts.emplace_back(
        3, presentation_context_result::abstract_syntax_not_supported);
    ac.user_info.max_pdu_length = 32768;

    auto bytes = pdu_encoder::encode_associate_ac(ac);

    CHECK(bytes[0] == 0x02);
    CHECK(read_uint32_be(bytes, 2) == bytes.size() - PDU_HEADER_SIZE);

    SECTION("rejected contexts carry no transfer syntax sub-item") {
        // Locate the second context item by walking the items
        size_t pos = ASSOCIATE_FIXED_SIZE;
        std::vector<size_t> contexts;
        while (pos + 4 <= bytes.size()) {
            if (bytes[pos] == static_cast<uint8_t>(item_type::presentation_context_ac)) {
                contexts.push_back(pos);
            }
            pos += 4 + read_uint16_be(bytes, pos + 2);
        }
        REQUIRE(contexts.size() == 2);
        CHECK(bytes[contexts[1] + 6] ==
              static_cast<uint8_t>(presentation_context_result::abstract_syntax_not_supported));
        CHECK(read_uint16_be(bytes, contexts[1] + 2) == 4);
        CHECK(read_uint16_be(bytes, contexts[0] + 2) > 4);
    }
}

TEST_CASE("pdu_encoder::validate catches items over 65535 bytes", "[network][pdu_encoder]") {
    CHECK(pdu_encoder::validate(make_echo_rq()).is_ok());

    SECTION("transfer syntax list too long for one context item") {
        auto rq = make_echo_rq();
        rq.presentation_contexts[0].transfer_syntaxes.assign(
            2000, "1.2.840.10008.1.2.4.999999999999999999999999999");
        auto result = pdu_encoder::validate(rq);
        REQUIRE(result.is_err());
        CHECK(result.error().code == dicom_ul::error_codes::pdu_too_large);
        CHECK(result.error().message.find("0x20") != std::string::npos);
    }

    SECTION("implementation version name too long") {
        associate_ac ac;
        ac.called_ae_title = "ARCHIVE";
        ac.calling_ae_title = "ECHOSCU";
        ac.presentation_contexts.emplace_back(1, presentation_context_result::acceptance,
                                              "1.2.840.10008.1.2");
        ac.user_info.implementation_version_name = std::string(70000, 'V');
        auto result = pdu_encoder::validate(ac);
        REQUIRE(result.is_err());
        CHECK(result.error().code == dicom_ul::error_codes::pdu_too_large);
        CHECK(result.error().message.find("0x55") != std::string::npos);
    }

    SECTION("the enclosing user information item is checked too") {
        auto rq = make_echo_rq();
        rq.user_info.implementation_version_name = std::string(0xFFFF, 'V');
        CHECK(pdu_encoder::validate(rq).is_err());
        rq.user_info.implementation_version_name.clear();
        rq.user_info.implementation_class_uid.clear();
        // 8-byte Maximum Length item plus a version item of 4 + n bytes
        rq.user_info.implementation_version_name = std::string(0xFFFF - 8 - 4, 'V');
        CHECK(pdu_encoder::validate(rq).is_ok());
    }
}

TEST_CASE("pdu_encoder fixed-size PDUs", "[network][pdu_encoder]") {
    SECTION("A-ASSOCIATE-RJ") {
        auto bytes = pdu_encoder::encode_associate_rj(associate_rj(
            reject_result::rejected_permanent,
            static_cast<uint8_t>(reject_source::service_user),
            static_cast<uint8_t>(reject_reason_user::called_ae_not_recognized)));
        REQUIRE(bytes.size() == 10);
        CHECK(bytes[0] == 0x03);
        CHECK(read_uint32_be(bytes, 2) == 4);
        CHECK(bytes[7] == 1);
        CHECK(bytes[8] == 1);
        CHECK(bytes[9] == 7);
    }

    SECTION("A-RELEASE-RQ and A-RELEASE-RP") {
        auto rq = pdu_encoder::encode_release_rq();
        auto rp = pdu_encoder::encode_release_rp();
        CHECK(rq == std::vector<uint8_t>{0x05, 0, 0, 0, 0, 4, 0, 0, 0, 0});
        CHECK(rp == std::vector<uint8_t>{0x06, 0, 0, 0, 0, 4, 0, 0, 0, 0});
    }

    SECTION("A-ABORT") {
        auto bytes = pdu_encoder::encode_abort(abort_source::service_provider,
                                               abort_reason::unexpected_pdu);
        CHECK(bytes == std::vector<uint8_t>{0x07, 0, 0, 0, 0, 4, 0, 0, 2, 2});
    }
}

TEST_CASE("pdu_encoder P-DATA-TF", "[network][pdu_encoder]") {
    std::vector<presentation_data_value> pdvs;
    pdvs.emplace_back(1, true, true, std::vector<uint8_t>{0xAA, 0xBB, 0xCC});
    pdvs.emplace_back(1, false, false, std::vector<uint8_t>{0x01});

    auto bytes = pdu_encoder::encode_p_data_tf(pdvs);

    REQUIRE(bytes.size() == PDU_HEADER_SIZE + (PDV_HEADER_SIZE + 3) + (PDV_HEADER_SIZE + 1));
    CHECK(bytes[0] == 0x04);
    CHECK(read_uint32_be(bytes, 2) == bytes.size() - PDU_HEADER_SIZE);

    // First item: length covers context ID + control header + data
    CHECK(read_uint32_be(bytes, 6) == 5);
    CHECK(bytes[10] == 1);
    CHECK(bytes[11] == 0x03);
    CHECK(bytes[12] == 0xAA);

    // Second item: data fragment, not last
    CHECK(read_uint32_be(bytes, 15) == 3);
    CHECK(bytes[20] == 0x00);
}

TEST_CASE("pdu_encoder dispatches on the variant", "[network][pdu_encoder]") {
    CHECK(pdu_encoder::encode(pdu{release_rq_pdu{}}) == pdu_encoder::encode_release_rq());
    CHECK(pdu_encoder::encode(pdu{abort_pdu{}}) ==
          pdu_encoder::encode_abort(abort_source::service_user, abort_reason::not_specified));
    CHECK(pdu_encoder::encode(pdu{make_echo_rq()}) ==
          pdu_encoder::encode_associate_rq(make_echo_rq()));
}
