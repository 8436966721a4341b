/**
 * @file dimse_message_test.cpp
 * @brief Unit tests for dimse_message, command fields and status codes
 */

#include <catch2/catch_test_macros.hpp>

#include <dicom_ul/network/dimse/dimse_message.hpp>

#include <dicom_ul/core/dicom_dataset.hpp>
#include <dicom_ul/encoding/implicit_vr_codec.hpp>

#include <optional>
#include <string>

using namespace dicom_ul;
using namespace dicom_ul::network::dimse;
using dicom_ul::core::dicom_dataset;
using dicom_ul::core::dicom_tag;
using dicom_ul::encoding::vr_type;

namespace {

constexpr const char* IMPLICIT_VR_LE = "1.2.840.10008.1.2";
constexpr const char* EXPLICIT_VR_LE = "1.2.840.10008.1.2.1";
constexpr const char* STUDY_ROOT_FIND = "1.2.840.10008.5.1.4.1.2.2.1";
constexpr const char* CT_IMAGE_STORAGE = "1.2.840.10008.5.1.4.1.1.2";

constexpr dicom_tag patient_name{0x0010, 0x0010};
constexpr dicom_tag query_level{0x0008, 0x0052};

dicom_dataset make_identifier() {
    dicom_dataset ds;
    ds.set_string(query_level, vr_type::CS, "STUDY");
    ds.set_string(patient_name, vr_type::PN, "DOE^*");
    return ds;
}

dimse_message round_trip(const dimse_message& msg, const char* ts) {
    auto encoded = dimse_message::encode(msg, ts);
    REQUIRE(encoded.is_ok());
    auto decoded = dimse_message::decode(encoded.value().first, encoded.value().second, ts);
    REQUIRE(decoded.is_ok());
    return std::move(decoded.value());
}

}  // namespace

// ============================================================================
// command_field
// ============================================================================

TEST_CASE("command_field classification", "[dimse][command_field]") {
    CHECK(is_request(command_field::c_find_rq));
    CHECK(is_response(command_field::c_find_rsp));
    CHECK(is_request(command_field::c_cancel_rq));
    CHECK(is_dimse_n(command_field::n_action_rsp));
    CHECK_FALSE(is_dimse_n(command_field::c_move_rq));
    CHECK(get_response_command(command_field::c_get_rq) == command_field::c_get_rsp);

    CHECK(to_command_field(0x0030) == std::optional{command_field::c_echo_rq});
    CHECK_FALSE(to_command_field(0x0031).has_value());
}

// ============================================================================
// status codes
// ============================================================================

TEST_CASE("status code classification", "[dimse][status]") {
    CHECK(classify(status_success) == status_class::success);
    CHECK(classify(status_pending) == status_class::pending);
    CHECK(classify(status_pending_warning) == status_class::pending);
    CHECK(classify(status_cancel) == status_class::cancel);
    CHECK(classify(status_warning_coercion) == status_class::warning);
    CHECK(classify(status_error_unable_to_process) == status_class::failure);
    CHECK(classify(0xA123) == status_class::failure);

    CHECK_FALSE(is_final(status_pending));
    CHECK(is_final(status_success));
    CHECK(is_final(status_cancel));
    CHECK(is_final(status_error_processing_failure));

    CHECK(status_description(status_error_unrecognized_operation) ==
          "Error: Unrecognized operation");
    CHECK(status_description(0xA123) == "Failure");
}

// ============================================================================
// Construction and accessors
// ============================================================================

TEST_CASE("dimse_message request construction", "[dimse][dimse_message]") {
    auto rq = make_c_find_rq(7, STUDY_ROOT_FIND, priority_high);

    CHECK(rq.command() == command_field::c_find_rq);
    CHECK(rq.message_id() == 7);
    CHECK(rq.is_request());
    CHECK(rq.is_valid());
    CHECK(rq.affected_sop_class_uid() == STUDY_ROOT_FIND);
    CHECK(rq.priority() == priority_high);
    CHECK_FALSE(rq.has_dataset());
    CHECK(rq.dataset().is_err());

    SECTION("command data set type follows the data set") {
        CHECK_FALSE(dimse_message::announces_dataset(rq.command_set()));
        rq.set_dataset(make_identifier());
        CHECK(dimse_message::announces_dataset(rq.command_set()));
        REQUIRE(rq.dataset().is_ok());
        CHECK(rq.dataset().value().get().get_string(query_level) == "STUDY");
        rq.clear_dataset();
        CHECK_FALSE(dimse_message::announces_dataset(rq.command_set()));
    }
}

TEST_CASE("dimse_message responses", "[dimse][dimse_message]") {
    SECTION("make_response copies identifying attributes") {
        auto rq = make_c_store_rq(11, CT_IMAGE_STORAGE, "1.2.3.4.5");
        auto rsp = make_response(rq, status_success);
        CHECK(rsp.command() == command_field::c_store_rsp);
        CHECK(rsp.is_response());
        CHECK(rsp.is_valid());
        CHECK(rsp.message_id_responded_to() == 11);
        CHECK(rsp.affected_sop_class_uid() == CT_IMAGE_STORAGE);
        CHECK(rsp.affected_sop_instance_uid() == "1.2.3.4.5");
        CHECK(rsp.status() == status_success);
    }

    SECTION("N-SET response maps requested UIDs to affected UIDs") {
        auto rq = make_n_set_rq(3, "1.2.840.10008.5.1.1.40", "1.2.9");
        auto rsp = make_response(rq, status_success);
        CHECK(rsp.command() == command_field::n_set_rsp);
        CHECK(rsp.affected_sop_class_uid() == "1.2.840.10008.5.1.1.40");
        CHECK(rsp.affected_sop_instance_uid() == "1.2.9");
    }

    SECTION("error comment is truncated to 64 characters") {
        auto rsp = make_c_echo_rsp(1, status_error_processing_failure);
        rsp.set_error_comment(std::string(100, 'x'));
        CHECK(rsp.error_comment().size() == 64);
    }

    SECTION("retrieve response counters") {
        auto rsp = make_retrieve_rsp(command_field::c_move_rsp, 5, STUDY_ROOT_FIND,
                                     status_pending, 3, 1, 0, 0);
        CHECK(rsp.remaining_subops() == std::optional<uint16_t>{3});
        CHECK(rsp.completed_subops() == std::optional<uint16_t>{1});
        CHECK(rsp.failed_subops() == std::optional<uint16_t>{0});
    }

    SECTION("C-CANCEL names the cancelled request") {
        auto cancel = make_c_cancel_rq(42);
        CHECK(cancel.command() == command_field::c_cancel_rq);
        CHECK(cancel.message_id_responded_to() == 42);
        CHECK(cancel.is_valid());
        CHECK_FALSE(cancel.command_set().contains(tag_message_id));
    }
}

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("dimse_message command set encoding", "[dimse][dimse_message]") {
    auto rq = make_c_echo_rq(1);
    auto encoded = dimse_message::encode(rq, IMPLICIT_VR_LE);
    REQUIRE(encoded.is_ok());
    CHECK(encoded.value().second.empty());

    auto command_set = encoding::implicit_vr_codec::decode(encoded.value().first);
    REQUIRE(command_set.is_ok());

    SECTION("group length counts the bytes after itself") {
        auto length = command_set.value().get_numeric<uint32_t>(tag_command_group_length);
        REQUIRE(length.has_value());
        // Group length element: tag(4) + length(4) + value(4)
        CHECK(*length == encoded.value().first.size() - 12);
    }

    SECTION("command field and data set type") {
        CHECK(command_set.value().get_numeric<uint16_t>(tag_command_field) ==
              std::optional<uint16_t>{0x0030});
        CHECK(command_set.value().get_numeric<uint16_t>(tag_command_data_set_type) ==
              std::optional<uint16_t>{command_data_set_type_null});
    }
}

TEST_CASE("dimse_message encode and decode", "[dimse][dimse_message]") {
    SECTION("request with an identifier in both little endian syntaxes") {
        auto rq = make_c_find_rq(9, STUDY_ROOT_FIND);
        rq.set_dataset(make_identifier());

        for (const char* ts : {IMPLICIT_VR_LE, EXPLICIT_VR_LE}) {
            auto decoded = round_trip(rq, ts);
            CHECK(decoded.command() == command_field::c_find_rq);
            CHECK(decoded.message_id() == 9);
            REQUIRE(decoded.has_dataset());
            CHECK(decoded.dataset().value().get().get_string(patient_name) == "DOE^*");
        }
    }

    SECTION("response without data set") {
        auto decoded = round_trip(make_c_echo_rsp(4, status_success), IMPLICIT_VR_LE);
        CHECK(decoded.is_response());
        CHECK(decoded.message_id_responded_to() == 4);
        CHECK(decoded.status() == status_success);
        CHECK_FALSE(decoded.has_dataset());
    }

    SECTION("unsupported data set transfer syntax") {
        auto rq = make_c_find_rq(9, STUDY_ROOT_FIND);
        rq.set_dataset(make_identifier());
        auto encoded = dimse_message::encode(rq, "1.2.840.10008.1.2.2");
        REQUIRE(encoded.is_err());
        CHECK(encoded.error().code == error_codes::unsupported_transfer_syntax);
    }

    SECTION("command set without a command field") {
        dicom_dataset cmd;
        cmd.set_numeric<uint16_t>(tag_message_id, vr_type::US, 1);
        auto bytes = encoding::implicit_vr_codec::encode(cmd);
        auto decoded = dimse_message::decode(bytes, {}, IMPLICIT_VR_LE);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::dimse_error);
    }

    SECTION("request without a message ID") {
        dicom_dataset cmd;
        cmd.set_numeric<uint16_t>(tag_command_field, vr_type::US, 0x0020);
        auto bytes = encoding::implicit_vr_codec::encode(cmd);
        CHECK(dimse_message::decode(bytes, {}, IMPLICIT_VR_LE).is_err());
    }

    SECTION("truncated command set") {
        auto encoded = dimse_message::encode(make_c_echo_rq(1), IMPLICIT_VR_LE);
        REQUIRE(encoded.is_ok());
        auto bytes = encoded.value().first;
        bytes.resize(bytes.size() - 3);
        CHECK(dimse_message::decode(bytes, {}, IMPLICIT_VR_LE).is_err());
    }
}

TEST_CASE("dimse_message retrieve and storage factories", "[dimse][dimse_message]") {
    constexpr const char* STUDY_ROOT_MOVE = "1.2.840.10008.5.1.4.1.2.2.2";
    constexpr const char* STUDY_ROOT_GET = "1.2.840.10008.5.1.4.1.2.2.3";

    SECTION("C-MOVE-RQ names its destination") {
        auto rq = make_c_move_rq(11, STUDY_ROOT_MOVE, "ARCHIVE", priority_high);
        auto decoded = round_trip(rq, IMPLICIT_VR_LE);
        CHECK(decoded.command() == command_field::c_move_rq);
        CHECK(decoded.move_destination() == "ARCHIVE");
        CHECK(decoded.priority() == priority_high);
    }

    SECTION("C-GET-RQ") {
        auto rq = make_c_get_rq(12, STUDY_ROOT_GET);
        CHECK(rq.is_valid());
        CHECK(rq.affected_sop_class_uid() == STUDY_ROOT_GET);
        CHECK(rq.priority() == priority_medium);
    }

    SECTION("C-STORE-RSP echoes the instance") {
        auto rsp = make_c_store_rsp(4, CT_IMAGE_STORAGE, "1.2.3.4.5", status_warning_coercion);
        auto decoded = round_trip(rsp, EXPLICIT_VR_LE);
        CHECK(decoded.message_id_responded_to() == 4);
        CHECK(decoded.affected_sop_instance_uid() == "1.2.3.4.5");
        CHECK(decoded.status() == status_warning_coercion);
    }
}

TEST_CASE("dimse_message DIMSE-N factories", "[dimse][dimse_message]") {
    constexpr const char* MPPS = "1.2.840.10008.3.1.2.3.3";
    constexpr const char* COMMITMENT = "1.2.840.10008.1.20.1";
    constexpr const char* INSTANCE = "1.2.826.0.1.3680043.2.1";

    SECTION("N-CREATE-RQ may leave the instance to the performer") {
        auto rq = make_n_create_rq(20, MPPS);
        CHECK(rq.affected_sop_class_uid() == MPPS);
        CHECK(rq.affected_sop_instance_uid().empty());
        CHECK(make_n_create_rq(21, MPPS, INSTANCE).affected_sop_instance_uid() == INSTANCE);
    }

    SECTION("N-GET-RQ carries the attribute identifier list") {
        auto rq = make_n_get_rq(22, MPPS, INSTANCE, {patient_name, query_level});
        auto decoded = round_trip(rq, IMPLICIT_VR_LE);
        CHECK(decoded.requested_sop_class_uid() == MPPS);
        CHECK(decoded.requested_sop_instance_uid() == INSTANCE);

        const auto tags = decoded.attribute_identifier_list();
        REQUIRE(tags.size() == 2);
        CHECK(tags[0] == patient_name);
        CHECK(tags[1] == query_level);

        CHECK(make_n_get_rq(23, MPPS, INSTANCE).attribute_identifier_list().empty());
    }

    SECTION("N-EVENT-REPORT-RQ and its response keep the event type") {
        auto rq = make_n_event_report_rq(24, COMMITMENT, INSTANCE, 1);
        REQUIRE(rq.event_type_id().has_value());
        CHECK(*rq.event_type_id() == 1);

        auto rsp = make_response(rq, status_success);
        CHECK(rsp.command() == command_field::n_event_report_rsp);
        CHECK(rsp.event_type_id() == std::optional<uint16_t>{1});
        CHECK(rsp.affected_sop_instance_uid() == INSTANCE);
    }

    SECTION("N-ACTION-RQ") {
        auto rq = make_n_action_rq(25, COMMITMENT, INSTANCE, 1);
        CHECK(rq.action_type_id() == std::optional<uint16_t>{1});
        CHECK_FALSE(rq.event_type_id().has_value());
    }

    SECTION("N-DELETE-RQ response is addressed through the affected attributes") {
        auto rq = make_n_delete_rq(26, MPPS, INSTANCE);
        CHECK(rq.affected_sop_class_uid().empty());

        auto rsp = make_response(rq, status_success);
        CHECK(rsp.command() == command_field::n_delete_rsp);
        CHECK(rsp.message_id_responded_to() == 26);
        CHECK(rsp.affected_sop_class_uid() == MPPS);
        CHECK(rsp.affected_sop_instance_uid() == INSTANCE);
    }
}
