/**
 * @file association_test.cpp
 * @brief Unit tests for the association state machine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "dicom_ul/network/association.hpp"
#include "dicom_ul/network/pdu_types.hpp"

#include <dicom_ul/core/result.hpp>

#include <string>
#include <vector>

using namespace dicom_ul;
using namespace dicom_ul::network;
using namespace std::chrono_literals;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

constexpr const char* VERIFICATION_SOP_CLASS = "1.2.840.10008.1.1";
constexpr const char* CT_IMAGE_STORAGE = "1.2.840.10008.5.1.4.1.1.2";
constexpr const char* IMPLICIT_VR_LE = "1.2.840.10008.1.2";
constexpr const char* EXPLICIT_VR_LE = "1.2.840.10008.1.2.1";

const association::time_point t0{};

engine_config test_config() {
    engine_config config("SCP");
    config.artim_timeout = 10s;
    config.idle_timeout = 60s;
    config.max_pdu_length = 16384;
    return config;
}

associate_rq make_rq() {
    associate_rq rq;
    rq.called_ae_title = "SCP";
    rq.calling_ae_title = "SCU";
    rq.application_context = DICOM_APPLICATION_CONTEXT;
    rq.presentation_contexts.emplace_back(
        1, VERIFICATION_SOP_CLASS, std::vector<std::string>{IMPLICIT_VR_LE});
    rq.presentation_contexts.emplace_back(
        3, CT_IMAGE_STORAGE, std::vector<std::string>{EXPLICIT_VR_LE, IMPLICIT_VR_LE});
    rq.user_info.max_pdu_length = 32768;
    return rq;
}

associate_ac make_ac() {
    associate_ac ac;
    ac.called_ae_title = "SCP";
    ac.calling_ae_title = "SCU";
    ac.application_context = DICOM_APPLICATION_CONTEXT;
    ac.presentation_contexts.emplace_back(1, presentation_context_result::acceptance,
                                          IMPLICIT_VR_LE);
    ac.presentation_contexts.emplace_back(
        3, presentation_context_result::abstract_syntax_not_supported);
    ac.user_info.max_pdu_length = 8192;
    return ac;
}

p_data_tf_pdu make_data(uint8_t context_id) {
    return p_data_tf_pdu({presentation_data_value(context_id, true, true, {0x00})});
}

/// Requester driven to Established
association established_requester() {
    association assoc(test_config());
    REQUIRE(assoc.issue_request(make_rq(), t0).is_ok());
    auto t = assoc.on_pdu(pdu{make_ac()}, t0);
    REQUIRE(t.to == association_state::established);
    return assoc;
}

/// Acceptor driven to WaitingForResponse
association waiting_acceptor() {
    association assoc(test_config());
    auto t = assoc.on_pdu(pdu{make_rq()}, t0);
    REQUIRE(t.to == association_state::waiting_for_response);
    return assoc;
}

/// Acceptor driven to Established
association established_acceptor() {
    auto assoc = waiting_acceptor();
    REQUIRE(assoc.accept(make_ac(), t0).is_ok());
    return assoc;
}

std::vector<pdu> every_pdu_kind() {
    return {pdu{make_rq()},
            pdu{make_ac()},
            pdu{associate_rj(reject_result::rejected_permanent, 1, 1)},
            pdu{make_data(1)},
            pdu{release_rq_pdu{}},
            pdu{release_rp_pdu{}},
            pdu{abort_pdu{}}};
}

}  // namespace

// =============================================================================
// Requester
// =============================================================================

TEST_CASE("association requester establishment", "[association][requester]") {
    association assoc(test_config());
    CHECK(assoc.state() == association_state::idle);

    auto issued = assoc.issue_request(make_rq(), t0);
    REQUIRE(issued.is_ok());
    CHECK(issued.value().to == association_state::request_sent);
    CHECK(issued.value().event == association_event::request_issued);
    REQUIRE(issued.value().outbound.has_value());

    SECTION("outbound request carries the local limits") {
        const auto& rq = std::get<associate_rq>(*issued.value().outbound);
        CHECK(rq.user_info.max_pdu_length == 16384);
        CHECK_FALSE(rq.user_info.implementation_class_uid.empty());
        CHECK(assoc.role() == association_role::requester);
    }

    SECTION("accept establishes with only the accepted contexts") {
        auto t = assoc.on_pdu(pdu{make_ac()}, t0 + 1s);
        CHECK(t.from == association_state::request_sent);
        CHECK(t.to == association_state::established);
        CHECK(t.event == association_event::established);
        CHECK_FALSE(t.outbound.has_value());

        REQUIRE(assoc.accepted_contexts().size() == 1);
        CHECK(assoc.context_for(VERIFICATION_SOP_CLASS) == std::optional<uint8_t>{1});
        CHECK_FALSE(assoc.context_for(CT_IMAGE_STORAGE).has_value());
        CHECK(assoc.find_context(1)->transfer_syntax == IMPLICIT_VR_LE);
        CHECK(assoc.find_context(3) == nullptr);
        CHECK(assoc.peer_max_pdu_length() == 8192);
        CHECK(assoc.outbound_max_pdu_length() == 8192);
    }

    SECTION("reject closes with a description") {
        auto t = assoc.on_pdu(
            pdu{associate_rj(reject_result::rejected_permanent,
                             static_cast<uint8_t>(reject_source::service_user),
                             static_cast<uint8_t>(reject_reason_user::called_ae_not_recognized))},
            t0);
        CHECK(t.to == association_state::closed);
        CHECK(t.event == association_event::rejected);
        REQUIRE(t.error.has_value());
        CHECK(t.error->code == error_codes::association_rejected);
        REQUIRE(assoc.rejection().has_value());
        CHECK(assoc.rejection()->description.find("called AE title not recognized") !=
              std::string::npos);
    }

    SECTION("accept naming an unproposed transfer syntax aborts") {
        auto ac = make_ac();
        ac.presentation_contexts[0].transfer_syntax = EXPLICIT_VR_LE;
        auto t = assoc.on_pdu(pdu{ac}, t0);
        CHECK(t.to == association_state::aborted);
        REQUIRE(t.outbound.has_value());
        CHECK(type_of(*t.outbound) == pdu_type::abort);
    }
}

TEST_CASE("association::issue_request validation", "[association][requester]") {
    association assoc(test_config());

    SECTION("empty context list") {
        auto rq = make_rq();
        rq.presentation_contexts.clear();
        auto result = assoc.issue_request(rq, t0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::no_acceptable_context);
    }

    SECTION("even context ID") {
        auto rq = make_rq();
        rq.presentation_contexts[0].id = 2;
        CHECK(assoc.issue_request(rq, t0).is_err());
    }

    SECTION("AE title too long") {
        auto rq = make_rq();
        rq.calling_ae_title = "A_VERY_LONG_AE_TITLE";
        auto result = assoc.issue_request(rq, t0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_ae_title);
    }

    SECTION("item too large to encode") {
        auto rq = make_rq();
        rq.user_info.implementation_version_name = std::string(70000, 'V');
        auto result = assoc.issue_request(rq, t0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::pdu_too_large);
        CHECK(assoc.state() == association_state::idle);
    }

    SECTION("second request") {
        REQUIRE(assoc.issue_request(make_rq(), t0).is_ok());
        auto result = assoc.issue_request(make_rq(), t0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_association_state);
    }

    CHECK((assoc.state() == association_state::idle ||
           assoc.state() == association_state::request_sent));
}

// =============================================================================
// Acceptor
// =============================================================================

TEST_CASE("association acceptor decisions", "[association][acceptor]") {
    auto assoc = waiting_acceptor();
    CHECK(assoc.role() == association_role::acceptor);
    CHECK(assoc.calling_ae() == "SCU");
    CHECK(assoc.called_ae() == "SCP");
    CHECK(assoc.peer_max_pdu_length() == 32768);

    SECTION("accept") {
        auto t = assoc.accept(make_ac(), t0);
        REQUIRE(t.is_ok());
        CHECK(t.value().to == association_state::established);
        REQUIRE(t.value().outbound.has_value());
        const auto& ac = std::get<associate_ac>(*t.value().outbound);
        CHECK(ac.user_info.max_pdu_length == 16384);
        CHECK(assoc.outbound_max_pdu_length() == 16384);
    }

    SECTION("accept without any accepted context is refused") {
        auto ac = make_ac();
        ac.presentation_contexts[0] =
            presentation_context_ac(1, presentation_context_result::user_rejection);
        auto t = assoc.accept(ac, t0);
        REQUIRE(t.is_err());
        CHECK(t.error().code == error_codes::no_acceptable_context);
        CHECK(assoc.state() == association_state::waiting_for_response);
    }

    SECTION("accept must answer every proposed context") {
        auto ac = make_ac();
        ac.presentation_contexts.pop_back();
        CHECK(assoc.accept(ac, t0).is_err());
    }

    SECTION("accept with an item too large to encode is refused") {
        auto ac = make_ac();
        ac.user_info.implementation_version_name = std::string(70000, 'V');
        auto t = assoc.accept(ac, t0);
        REQUIRE(t.is_err());
        CHECK(t.error().code == error_codes::pdu_too_large);
        CHECK(assoc.state() == association_state::waiting_for_response);
        CHECK(assoc.accepted_contexts().empty());
    }

    SECTION("reject") {
        associate_rj rj(reject_result::rejected_permanent,
                        static_cast<uint8_t>(reject_source::service_user),
                        static_cast<uint8_t>(reject_reason_user::calling_ae_not_recognized));
        auto t = assoc.reject(rj, t0);
        REQUIRE(t.is_ok());
        CHECK(t.value().to == association_state::closed);
        REQUIRE(t.value().outbound.has_value());
        CHECK(std::get<associate_rj>(*t.value().outbound) == rj);
    }
}

TEST_CASE("association rejects a peer Maximum Length too small for P-DATA",
          "[association][limits]") {
    SECTION("in an A-ASSOCIATE-RQ") {
        association assoc(test_config());
        auto rq = make_rq();
        rq.user_info.max_pdu_length = 8;
        auto t = assoc.on_pdu(pdu{rq}, t0);
        CHECK(t.to == association_state::aborted);
        REQUIRE(t.outbound.has_value());
        CHECK(std::get<abort_pdu>(*t.outbound).reason == abort_reason::invalid_pdu_parameter);
        CHECK(t.error->code == error_codes::unexpected_pdu);
    }

    SECTION("in an A-ASSOCIATE-AC") {
        association assoc(test_config());
        REQUIRE(assoc.issue_request(make_rq(), t0).is_ok());
        auto ac = make_ac();
        ac.user_info.max_pdu_length = MIN_DATA_PDU_LENGTH - 1;
        auto t = assoc.on_pdu(pdu{ac}, t0);
        CHECK(t.to == association_state::aborted);
        REQUIRE(t.outbound.has_value());
        CHECK(std::get<abort_pdu>(*t.outbound).reason == abort_reason::invalid_pdu_parameter);
        CHECK(assoc.accepted_contexts().empty());
    }

    SECTION("the smallest usable limit and unlimited are accepted") {
        const uint32_t limit = GENERATE(MIN_DATA_PDU_LENGTH, UNLIMITED_MAX_PDU_LENGTH);
        association assoc(test_config());
        auto rq = make_rq();
        rq.user_info.max_pdu_length = limit;
        auto t = assoc.on_pdu(pdu{rq}, t0);
        CHECK(t.to == association_state::waiting_for_response);
        CHECK(assoc.peer_max_pdu_length() == limit);
    }
}

// =============================================================================
// Data transfer
// =============================================================================

TEST_CASE("association P-DATA-TF handling", "[association][data]") {
    auto assoc = established_requester();

    SECTION("data on an accepted context") {
        auto t = assoc.on_pdu(pdu{make_data(1)}, t0);
        CHECK(t.event == association_event::data_received);
        CHECK(t.to == association_state::established);
        CHECK_FALSE(t.outbound.has_value());
    }

    SECTION("data on a rejected context aborts") {
        auto t = assoc.on_pdu(pdu{make_data(3)}, t0);
        CHECK(t.to == association_state::aborted);
        REQUIRE(t.outbound.has_value());
        CHECK(std::get<abort_pdu>(*t.outbound).reason == abort_reason::unexpected_pdu_parameter);
    }
}

// =============================================================================
// Release
// =============================================================================

TEST_CASE("association release", "[association][release]") {
    SECTION("locally initiated") {
        auto assoc = established_requester();
        auto t = assoc.issue_release(t0);
        REQUIRE(t.is_ok());
        CHECK(t.value().to == association_state::releasing);
        CHECK(type_of(*t.value().outbound) == pdu_type::release_rq);

        SECTION("data may still arrive while releasing") {
            CHECK(assoc.on_pdu(pdu{make_data(1)}, t0).event == association_event::data_received);
        }

        auto done = assoc.on_pdu(pdu{release_rp_pdu{}}, t0);
        CHECK(done.to == association_state::closed);
        CHECK(done.event == association_event::released);
        CHECK(assoc.is_closed());
    }

    SECTION("peer initiated") {
        auto assoc = established_acceptor();
        auto t = assoc.on_pdu(pdu{release_rq_pdu{}}, t0);
        CHECK(t.to == association_state::releasing);
        CHECK(t.event == association_event::release_request_received);
        CHECK_FALSE(t.outbound.has_value());
        CHECK(assoc.peer_requested_release());

        auto rp = assoc.complete_release(t0);
        REQUIRE(rp.is_ok());
        CHECK(rp.value().to == association_state::closed);
        CHECK(type_of(*rp.value().outbound) == pdu_type::release_rp);
    }

    SECTION("collision answers and keeps waiting") {
        auto assoc = established_requester();
        REQUIRE(assoc.issue_release(t0).is_ok());

        auto t = assoc.on_pdu(pdu{release_rq_pdu{}}, t0);
        CHECK(t.from == association_state::releasing);
        CHECK(t.to == association_state::releasing);
        CHECK(t.event == association_event::release_request_received);
        REQUIRE(t.outbound.has_value());
        CHECK(type_of(*t.outbound) == pdu_type::release_rp);

        CHECK(assoc.on_pdu(pdu{release_rp_pdu{}}, t0).to == association_state::closed);
    }

    SECTION("complete_release without a peer request") {
        auto assoc = established_requester();
        auto result = assoc.complete_release(t0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_association_state);
    }

    SECTION("issue_release outside Established") {
        association assoc(test_config());
        CHECK(assoc.issue_release(t0).is_err());
    }
}

// =============================================================================
// Abort
// =============================================================================

TEST_CASE("association abort paths", "[association][abort]") {
    SECTION("local abort sends A-ABORT once") {
        auto assoc = established_requester();
        auto t = assoc.issue_abort(t0);
        CHECK(t.to == association_state::aborted);
        CHECK(type_of(*t.outbound) == pdu_type::abort);

        auto again = assoc.issue_abort(t0);
        CHECK(again.event == association_event::none);
        CHECK_FALSE(again.outbound.has_value());
    }

    SECTION("peer abort") {
        auto assoc = established_acceptor();
        auto t = assoc.on_pdu(
            pdu{abort_pdu(abort_source::service_provider, abort_reason::unrecognized_pdu)}, t0);
        CHECK(t.to == association_state::aborted);
        CHECK_FALSE(t.outbound.has_value());
        REQUIRE(assoc.abort_details().has_value());
        CHECK(assoc.abort_details()->reason == abort_reason::unrecognized_pdu);
    }

    SECTION("framing error maps to a provider abort") {
        auto assoc = established_acceptor();
        auto t = assoc.on_framing_error(
            error_info{error_codes::invalid_pdu_type, "bad type", "test"}, t0);
        CHECK(t.to == association_state::aborted);
        CHECK(std::get<abort_pdu>(*t.outbound).reason == abort_reason::unrecognized_pdu);
        CHECK(t.error->code == error_codes::invalid_pdu_type);
    }

    SECTION("transport error aborts without sending") {
        auto assoc = established_acceptor();
        auto t = assoc.on_transport_error(
            error_info{error_codes::connection_closed, "peer closed", "test"}, t0);
        CHECK(t.to == association_state::aborted);
        CHECK_FALSE(t.outbound.has_value());
    }

    SECTION("unexpected PDU in Established") {
        auto assoc = established_acceptor();
        auto t = assoc.on_pdu(pdu{make_rq()}, t0);
        CHECK(t.to == association_state::aborted);
        CHECK(t.error->code == error_codes::unexpected_pdu);
        CHECK(std::get<abort_pdu>(*t.outbound).source == abort_source::service_provider);
    }
}

// =============================================================================
// Totality
// =============================================================================

TEST_CASE("association handles every PDU in every state", "[association][state]") {
    auto drive = [](int which) {
        association assoc(test_config());
        switch (which) {
            case 0:
                break;
            case 1:
                (void)assoc.issue_request(make_rq(), t0);
                break;
            case 2:
                (void)assoc.on_pdu(pdu{make_rq()}, t0);
                break;
            case 3:
                (void)assoc.issue_request(make_rq(), t0);
                (void)assoc.on_pdu(pdu{make_ac()}, t0);
                break;
            case 4:
                (void)assoc.issue_request(make_rq(), t0);
                (void)assoc.on_pdu(pdu{make_ac()}, t0);
                (void)assoc.issue_release(t0);
                break;
            case 5:
                (void)assoc.issue_request(make_rq(), t0);
                (void)assoc.on_pdu(pdu{make_ac()}, t0);
                (void)assoc.on_pdu(pdu{release_rq_pdu{}}, t0);
                break;
            case 6:
                (void)assoc.issue_request(make_rq(), t0);
                (void)assoc.on_pdu(pdu{make_ac()}, t0);
                (void)assoc.issue_release(t0);
                (void)assoc.on_pdu(pdu{release_rp_pdu{}}, t0);
                break;
            default:
                (void)assoc.issue_abort(t0);
                (void)assoc.issue_request(make_rq(), t0);
                (void)assoc.issue_abort(t0);
                break;
        }
        return assoc;
    };

    for (int which = 0; which <= 7; ++which) {
        for (const auto& received : every_pdu_kind()) {
            auto assoc = drive(which);
            const auto before = assoc.state();
            auto t = assoc.on_pdu(received, t0);

            CAPTURE(which, to_string(before), to_string(type_of(received)));
            CHECK(t.from == before);
            CHECK(t.to == assoc.state());

            if (before == association_state::closed) {
                // Anything after close is a protocol error
                CHECK(t.to == association_state::aborted);
            }
            if (before == association_state::aborted) {
                CHECK(t.to == association_state::aborted);
                CHECK(t.event == association_event::none);
            }
            if (t.to == association_state::aborted && before != association_state::aborted &&
                type_of(received) != pdu_type::abort) {
                REQUIRE(t.outbound.has_value());
                CHECK(type_of(*t.outbound) == pdu_type::abort);
            }
        }
    }
}

// =============================================================================
// Timers
// =============================================================================

TEST_CASE("association ARTIM timer", "[association][timer]") {
    SECTION("bounds the wait for an accept") {
        association assoc(test_config());
        REQUIRE(assoc.issue_request(make_rq(), t0).is_ok());
        CHECK(assoc.next_deadline() == std::optional{t0 + 10s});

        CHECK_FALSE(assoc.check_timers(t0 + 9s).has_value());
        auto t = assoc.check_timers(t0 + 10s);
        REQUIRE(t.has_value());
        CHECK(t->to == association_state::aborted);
        CHECK(t->error->code == error_codes::artim_timeout);
        CHECK(type_of(*t->outbound) == pdu_type::abort);
    }

    SECTION("is cleared once established") {
        auto assoc = established_requester();
        CHECK(assoc.next_deadline() == std::optional{t0 + 60s});
        CHECK_FALSE(assoc.check_timers(t0 + 30s).has_value());
    }

    SECTION("restarts when releasing") {
        auto assoc = established_requester();
        REQUIRE(assoc.issue_release(t0 + 5s).is_ok());
        CHECK(assoc.next_deadline() == std::optional{t0 + 15s});
        REQUIRE(assoc.check_timers(t0 + 15s).has_value());
        CHECK(assoc.state() == association_state::aborted);
    }

    SECTION("nothing fires after close") {
        auto assoc = established_requester();
        (void)assoc.issue_abort(t0);
        CHECK_FALSE(assoc.check_timers(t0 + 1h).has_value());
        CHECK_FALSE(assoc.next_deadline().has_value());
    }
}

TEST_CASE("association idle timer", "[association][timer]") {
    auto assoc = established_acceptor();

    SECTION("fires after silence") {
        auto t = assoc.check_timers(t0 + 60s);
        REQUIRE(t.has_value());
        CHECK(t->error->code == error_codes::idle_timeout);
        CHECK(assoc.state() == association_state::aborted);
    }

    SECTION("inbound traffic resets it") {
        (void)assoc.on_pdu(pdu{make_data(1)}, t0 + 50s);
        CHECK_FALSE(assoc.check_timers(t0 + 60s).has_value());
        CHECK(assoc.check_timers(t0 + 110s).has_value());
    }

    SECTION("note_activity resets it") {
        assoc.note_activity(t0 + 59s);
        CHECK_FALSE(assoc.check_timers(t0 + 60s).has_value());
    }

    SECTION("zero disables it") {
        auto config = test_config();
        config.idle_timeout = 0s;
        association quiet(config);
        (void)quiet.on_pdu(pdu{make_rq()}, t0);
        REQUIRE(quiet.accept(make_ac(), t0).is_ok());
        CHECK_FALSE(quiet.next_deadline().has_value());
        CHECK_FALSE(quiet.check_timers(t0 + 24h).has_value());
    }
}

// =============================================================================
// rejection_info
// =============================================================================

TEST_CASE("rejection_info description", "[association][rejection]") {
    SECTION("service user") {
        rejection_info info(associate_rj(reject_result::rejected_transient, 1, 3));
        CHECK(info.description.find("transient") != std::string::npos);
        CHECK(info.description.find("calling AE title not recognized") != std::string::npos);
    }

    SECTION("ACSE provider") {
        rejection_info info(associate_rj(reject_result::rejected_permanent, 2, 2));
        CHECK(info.description.find("protocol version not supported") != std::string::npos);
    }

    SECTION("unknown reason") {
        rejection_info info(associate_rj(reject_result::rejected_permanent, 1, 42));
        CHECK(info.description.find("unknown (42)") != std::string::npos);
    }
}

TEST_CASE("association_state to_string", "[association][state]") {
    CHECK(std::string(to_string(association_state::established)) == "Established");
    CHECK(std::string(to_string(association_state::request_sent)) == "RequestSent");
    CHECK(std::string(to_string(association_event::release_requested)) == "release-requested");
}
