/**
 * @file association.cpp
 * @brief DICOM Association state machine implementation
 */

#include "dicom_ul/network/association.hpp"
#include "dicom_ul/network/context_negotiator.hpp"
#include "dicom_ul/network/pdu_encoder.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <type_traits>
#include <variant>

namespace dicom_ul::network {

namespace {

constexpr const char* assoc_module = "association";

error_info state_error(const std::string& operation, association_state state) {
    return error_info{error_codes::invalid_association_state,
                      operation + " not allowed in state " + to_string(state),
                      assoc_module};
}

abort_reason abort_reason_for(const error_info& error) {
    switch (error.code) {
        case error_codes::invalid_pdu_type:
            return abort_reason::unrecognized_pdu;
        case error_codes::invalid_item_type:
            return abort_reason::unrecognized_pdu_parameter;
        default:
            return abort_reason::invalid_pdu_parameter;
    }
}

bool proposes(const presentation_context_rq& pc, const std::string& transfer_syntax) {
    return std::find(pc.transfer_syntaxes.begin(), pc.transfer_syntaxes.end(),
                     transfer_syntax) != pc.transfer_syntaxes.end();
}

/// A peer Maximum Length must leave room for at least one PDV payload byte
bool carries_data(uint32_t max_pdu_length) {
    return max_pdu_length == UNLIMITED_MAX_PDU_LENGTH || max_pdu_length >= MIN_DATA_PDU_LENGTH;
}

}  // namespace

// =============================================================================
// rejection_info Implementation
// =============================================================================

void rejection_info::build_description() {
    std::ostringstream oss;
    oss << "Association rejected: ";

    if (result == reject_result::rejected_permanent) {
        oss << "permanent, ";
    } else {
        oss << "transient, ";
    }

    switch (static_cast<reject_source>(source)) {
        case reject_source::service_user:
            oss << "source=service-user, ";
            switch (static_cast<reject_reason_user>(reason)) {
                case reject_reason_user::no_reason:
                    oss << "reason=no reason given";
                    break;
                case reject_reason_user::application_context_not_supported:
                    oss << "reason=application context not supported";
                    break;
                case reject_reason_user::calling_ae_not_recognized:
                    oss << "reason=calling AE title not recognized";
                    break;
                case reject_reason_user::called_ae_not_recognized:
                    oss << "reason=called AE title not recognized";
                    break;
                default:
                    oss << "reason=unknown (" << static_cast<int>(reason) << ")";
            }
            break;
        case reject_source::service_provider_acse:
            oss << "source=service-provider (ACSE), ";
            switch (static_cast<reject_reason_provider_acse>(reason)) {
                case reject_reason_provider_acse::no_reason:
                    oss << "reason=no reason given";
                    break;
                case reject_reason_provider_acse::protocol_version_not_supported:
                    oss << "reason=protocol version not supported";
                    break;
                default:
                    oss << "reason=unknown (" << static_cast<int>(reason) << ")";
            }
            break;
        case reject_source::service_provider_presentation:
            oss << "source=service-provider (Presentation), ";
            if (reason == 1) {
                oss << "reason=temporary congestion";
            } else if (reason == 2) {
                oss << "reason=local limit exceeded";
            } else {
                oss << "reason=unknown (" << static_cast<int>(reason) << ")";
            }
            break;
        default:
            oss << "source=unknown (" << static_cast<int>(source) << ")";
    }

    description = oss.str();
}

// =============================================================================
// Construction
// =============================================================================

association::association(engine_config config) : config_(std::move(config)) {}

// =============================================================================
// Local commands
// =============================================================================

Result<transition> association::issue_request(associate_rq rq, time_point now) {
    if (state_ != association_state::idle) {
        return state_error("A-ASSOCIATE request", state_);
    }
    if (rq.calling_ae_title.empty() || rq.calling_ae_title.size() > AE_TITLE_LENGTH ||
        rq.called_ae_title.empty() || rq.called_ae_title.size() > AE_TITLE_LENGTH) {
        return make_ul_error<transition>(error_codes::invalid_ae_title,
            "AE titles must be 1-16 characters", assoc_module);
    }
    if (rq.presentation_contexts.empty()) {
        return make_ul_error<transition>(error_codes::no_acceptable_context,
            "A-ASSOCIATE-RQ proposes no presentation context", assoc_module);
    }
    auto ids = context_negotiator::validate_context_ids(rq.presentation_contexts);
    if (ids.is_err()) {
        return ids.error();
    }

    if (rq.application_context.empty()) {
        rq.application_context = DICOM_APPLICATION_CONTEXT;
    }
    rq.user_info.max_pdu_length = config_.max_pdu_length;
    if (rq.user_info.implementation_class_uid.empty()) {
        rq.user_info.implementation_class_uid = config_.implementation_class_uid;
    }
    if (rq.user_info.implementation_version_name.empty()) {
        rq.user_info.implementation_version_name = config_.implementation_version_name;
    }
    auto encodable = pdu_encoder::validate(rq);
    if (encodable.is_err()) {
        return encodable.error();
    }

    role_ = association_role::requester;
    calling_ae_ = rq.calling_ae_title;
    called_ae_ = rq.called_ae_title;
    request_ = rq;

    auto t = make(association_state::request_sent, association_event::request_issued,
                  pdu{std::move(rq)});
    update_timers(t.from, now);
    return t;
}

Result<transition> association::accept(associate_ac ac, time_point now) {
    if (state_ != association_state::waiting_for_response) {
        return state_error("A-ASSOCIATE accept", state_);
    }

    std::map<uint8_t, accepted_presentation_context> table;
    std::set<uint8_t> answered;
    for (const auto& result : ac.presentation_contexts) {
        auto proposed = std::find_if(
            request_.presentation_contexts.begin(), request_.presentation_contexts.end(),
            [&](const presentation_context_rq& pc) { return pc.id == result.id; });
        if (proposed == request_.presentation_contexts.end() ||
            !answered.insert(result.id).second) {
            return make_ul_error<transition>(error_codes::invalid_presentation_context_id,
                "Context " + std::to_string(result.id) + " was not proposed once",
                assoc_module);
        }
        if (result.accepted()) {
            if (!proposes(*proposed, result.transfer_syntax)) {
                return make_ul_error<transition>(error_codes::negotiation_failed,
                    "Context " + std::to_string(result.id) +
                        " accepted with a transfer syntax that was not proposed",
                    assoc_module);
            }
            table[result.id] = accepted_presentation_context{
                result.id, proposed->abstract_syntax, result.transfer_syntax};
        }
    }
    if (answered.size() != request_.presentation_contexts.size()) {
        return make_ul_error<transition>(error_codes::invalid_presentation_context_id,
            "Every proposed presentation context must be answered", assoc_module);
    }
    if (table.empty()) {
        return make_ul_error<transition>(error_codes::no_acceptable_context,
            "No presentation context accepted", assoc_module);
    }

    if (ac.called_ae_title.empty()) {
        ac.called_ae_title = request_.called_ae_title;
    }
    if (ac.calling_ae_title.empty()) {
        ac.calling_ae_title = request_.calling_ae_title;
    }
    if (ac.application_context.empty()) {
        ac.application_context = DICOM_APPLICATION_CONTEXT;
    }
    ac.user_info.max_pdu_length = config_.max_pdu_length;
    if (ac.user_info.implementation_class_uid.empty()) {
        ac.user_info.implementation_class_uid = config_.implementation_class_uid;
    }
    if (ac.user_info.implementation_version_name.empty()) {
        ac.user_info.implementation_version_name = config_.implementation_version_name;
    }
    auto encodable = pdu_encoder::validate(ac);
    if (encodable.is_err()) {
        return encodable.error();
    }

    accepted_contexts_ = std::move(table);
    auto t = make(association_state::established, association_event::established,
                  pdu{std::move(ac)});
    last_activity_ = now;
    update_timers(t.from, now);
    return t;
}

Result<transition> association::reject(const associate_rj& rj, time_point now) {
    if (state_ != association_state::waiting_for_response) {
        return state_error("A-ASSOCIATE reject", state_);
    }
    rejection_ = rejection_info(rj);
    auto t = make(association_state::closed, association_event::rejected, pdu{rj},
                  error_info{error_codes::association_rejected, rejection_->description,
                             assoc_module});
    update_timers(t.from, now);
    return t;
}

Result<transition> association::issue_release(time_point now) {
    if (state_ != association_state::established) {
        return state_error("A-RELEASE request", state_);
    }
    release_initiated_locally_ = true;
    auto t = make(association_state::releasing, association_event::release_requested,
                  pdu{release_rq_pdu{}});
    update_timers(t.from, now);
    return t;
}

Result<transition> association::complete_release(time_point now) {
    if (!peer_requested_release()) {
        return state_error("A-RELEASE response", state_);
    }
    auto t = make(association_state::closed, association_event::released,
                  pdu{release_rp_pdu{}});
    update_timers(t.from, now);
    return t;
}

transition association::issue_abort(time_point now) {
    if (is_closed()) {
        return make(state_, association_event::none);
    }
    abort_ = abort_pdu{abort_source::service_user, abort_reason::not_specified};
    auto t = make(association_state::aborted, association_event::aborted, pdu{*abort_},
                  error_info{error_codes::association_aborted,
                             "Association aborted by local user", assoc_module});
    update_timers(t.from, now);
    return t;
}

// =============================================================================
// Inbound events
// =============================================================================

transition association::on_pdu(const pdu& received, time_point now) {
    last_activity_ = now;

    auto t = std::visit(
        [this](const auto& value) -> transition {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, associate_rq>) {
                return on_associate_rq(value);
            } else if constexpr (std::is_same_v<T, associate_ac>) {
                return on_associate_ac(value);
            } else if constexpr (std::is_same_v<T, associate_rj>) {
                return on_associate_rj(value);
            } else if constexpr (std::is_same_v<T, p_data_tf_pdu>) {
                return on_p_data(value);
            } else if constexpr (std::is_same_v<T, release_rq_pdu>) {
                return on_release_rq();
            } else if constexpr (std::is_same_v<T, release_rp_pdu>) {
                return on_release_rp();
            } else {
                return on_abort(value);
            }
        },
        received);

    update_timers(t.from, now);
    return t;
}

transition association::on_framing_error(const error_info& error, time_point now) {
    if (state_ == association_state::aborted) {
        return make(state_, association_event::none);
    }
    abort_ = abort_pdu{abort_source::service_provider, abort_reason_for(error)};
    auto t = make(association_state::aborted, association_event::aborted, pdu{*abort_},
                  error);
    update_timers(t.from, now);
    return t;
}

transition association::on_transport_error(const error_info& error, time_point now) {
    if (is_closed()) {
        return make(state_, association_event::none);
    }
    auto t = make(association_state::aborted, association_event::aborted, std::nullopt,
                  error);
    update_timers(t.from, now);
    return t;
}

std::optional<transition> association::check_timers(time_point now) {
    if (is_closed()) {
        return std::nullopt;
    }

    std::optional<error_info> expired;
    if (artim_deadline_ && now >= *artim_deadline_) {
        expired = error_info{error_codes::artim_timeout,
                             std::string("ARTIM expired in state ") + to_string(state_),
                             assoc_module};
    } else if (state_ == association_state::established &&
               config_.idle_timeout.count() > 0 &&
               now >= last_activity_ + config_.idle_timeout) {
        expired = error_info{error_codes::idle_timeout,
                             "No traffic within " +
                                 std::to_string(config_.idle_timeout.count()) + " s",
                             assoc_module};
    }
    if (!expired) {
        return std::nullopt;
    }

    abort_ = abort_pdu{abort_source::service_provider, abort_reason::not_specified};
    auto t = make(association_state::aborted, association_event::aborted, pdu{*abort_},
                  std::move(expired));
    update_timers(t.from, now);
    return t;
}

std::optional<association::time_point> association::next_deadline() const {
    if (artim_deadline_) {
        return artim_deadline_;
    }
    if (state_ == association_state::established && config_.idle_timeout.count() > 0) {
        return last_activity_ + config_.idle_timeout;
    }
    return std::nullopt;
}

void association::note_activity(time_point now) {
    last_activity_ = now;
}

// =============================================================================
// Queries
// =============================================================================

uint32_t association::outbound_max_pdu_length() const noexcept {
    const uint32_t local = config_.max_pdu_length;
    if (local == UNLIMITED_MAX_PDU_LENGTH) {
        return peer_max_pdu_;
    }
    if (peer_max_pdu_ == UNLIMITED_MAX_PDU_LENGTH) {
        return local;
    }
    return std::min(local, peer_max_pdu_);
}

const accepted_presentation_context* association::find_context(uint8_t id) const {
    auto it = accepted_contexts_.find(id);
    return it != accepted_contexts_.end() ? &it->second : nullptr;
}

std::optional<uint8_t> association::context_for(std::string_view abstract_syntax) const {
    for (const auto& [id, context] : accepted_contexts_) {
        if (context.abstract_syntax == abstract_syntax) {
            return id;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Per-PDU handling
// =============================================================================

transition association::on_associate_rq(const associate_rq& rq) {
    if (state_ != association_state::idle) {
        return protocol_violation(pdu{rq}, "A-ASSOCIATE-RQ on an active association");
    }

    if (!carries_data(rq.user_info.max_pdu_length)) {
        return protocol_violation(pdu{rq},
            "Maximum Length " + std::to_string(rq.user_info.max_pdu_length) +
                " cannot carry P-DATA",
            abort_reason::invalid_pdu_parameter);
    }

    role_ = association_role::acceptor;
    request_ = rq;
    calling_ae_ = rq.calling_ae_title;
    called_ae_ = rq.called_ae_title;
    peer_max_pdu_ = rq.user_info.max_pdu_length;
    remote_implementation_class_ = rq.user_info.implementation_class_uid;
    remote_implementation_version_ = rq.user_info.implementation_version_name;

    return make(association_state::waiting_for_response, association_event::request_received);
}

transition association::on_associate_ac(const associate_ac& ac) {
    if (state_ != association_state::request_sent) {
        return protocol_violation(pdu{ac}, "unsolicited A-ASSOCIATE-AC");
    }

    if (!carries_data(ac.user_info.max_pdu_length)) {
        return protocol_violation(pdu{ac},
            "Maximum Length " + std::to_string(ac.user_info.max_pdu_length) +
                " cannot carry P-DATA",
            abort_reason::invalid_pdu_parameter);
    }

    std::map<uint8_t, accepted_presentation_context> table;
    std::set<uint8_t> answered;
    for (const auto& result : ac.presentation_contexts) {
        auto proposed = std::find_if(
            request_.presentation_contexts.begin(), request_.presentation_contexts.end(),
            [&](const presentation_context_rq& pc) { return pc.id == result.id; });
        if (proposed == request_.presentation_contexts.end() ||
            !answered.insert(result.id).second) {
            return protocol_violation(pdu{ac},
                "A-ASSOCIATE-AC answers unproposed context " + std::to_string(result.id),
                abort_reason::invalid_pdu_parameter);
        }
        if (!result.accepted()) {
            continue;
        }
        if (!proposes(*proposed, result.transfer_syntax)) {
            return protocol_violation(pdu{ac},
                "A-ASSOCIATE-AC selects unproposed transfer syntax " + result.transfer_syntax,
                abort_reason::invalid_pdu_parameter);
        }
        table[result.id] = accepted_presentation_context{
            result.id, proposed->abstract_syntax, result.transfer_syntax};
    }

    accepted_contexts_ = std::move(table);
    peer_max_pdu_ = ac.user_info.max_pdu_length;
    remote_implementation_class_ = ac.user_info.implementation_class_uid;
    remote_implementation_version_ = ac.user_info.implementation_version_name;

    return make(association_state::established, association_event::established);
}

transition association::on_associate_rj(const associate_rj& rj) {
    if (state_ != association_state::request_sent) {
        return protocol_violation(pdu{rj}, "unsolicited A-ASSOCIATE-RJ");
    }
    rejection_ = rejection_info(rj);
    return make(association_state::closed, association_event::rejected, std::nullopt,
                error_info{error_codes::association_rejected, rejection_->description,
                           assoc_module});
}

transition association::on_p_data(const p_data_tf_pdu& data) {
    const bool may_receive =
        state_ == association_state::established ||
        (state_ == association_state::releasing && release_initiated_locally_);
    if (!may_receive) {
        return protocol_violation(pdu{data}, "P-DATA-TF outside an established association");
    }

    for (const auto& pdv : data.pdvs) {
        if (accepted_contexts_.find(pdv.context_id) == accepted_contexts_.end()) {
            return protocol_violation(pdu{data},
                "P-DATA-TF on unaccepted presentation context " +
                    std::to_string(pdv.context_id),
                abort_reason::unexpected_pdu_parameter);
        }
    }

    return make(state_, association_event::data_received);
}

transition association::on_release_rq() {
    if (state_ == association_state::established) {
        release_initiated_locally_ = false;
        return make(association_state::releasing, association_event::release_request_received);
    }
    if (state_ == association_state::releasing && release_initiated_locally_) {
        // Release collision: answer and keep waiting for the peer's response
        return make(association_state::releasing, association_event::release_request_received,
                    pdu{release_rp_pdu{}});
    }
    return protocol_violation(pdu{release_rq_pdu{}}, "unexpected A-RELEASE-RQ");
}

transition association::on_release_rp() {
    if (state_ == association_state::releasing && release_initiated_locally_) {
        return make(association_state::closed, association_event::released);
    }
    return protocol_violation(pdu{release_rp_pdu{}}, "unexpected A-RELEASE-RP");
}

transition association::on_abort(const abort_pdu& abort) {
    if (state_ == association_state::aborted) {
        return make(state_, association_event::none);
    }
    abort_ = abort;
    return make(association_state::aborted, association_event::aborted, std::nullopt,
                error_info{error_codes::association_aborted,
                           "A-ABORT received (source " +
                               std::to_string(static_cast<int>(abort.source)) + ", reason " +
                               std::to_string(static_cast<int>(abort.reason)) + ")",
                           assoc_module});
}

// =============================================================================
// Helpers
// =============================================================================

transition association::make(association_state to, association_event event,
                             std::optional<pdu> outbound,
                             std::optional<error_info> error) {
    transition t;
    t.from = state_;
    t.to = to;
    t.event = event;
    t.outbound = std::move(outbound);
    t.error = std::move(error);
    state_ = to;
    return t;
}

transition association::protocol_violation(const pdu& received, const std::string& detail,
                                           abort_reason reason) {
    if (state_ == association_state::aborted) {
        return make(state_, association_event::none);
    }
    abort_ = abort_pdu{abort_source::service_provider, reason};
    return make(association_state::aborted, association_event::aborted, pdu{*abort_},
                error_info{error_codes::unexpected_pdu,
                           std::string(to_string(type_of(received))) + " in state " +
                               to_string(state_) + ": " + detail,
                           assoc_module});
}

bool association::artim_applies() const noexcept {
    return state_ == association_state::request_sent ||
           state_ == association_state::waiting_for_response ||
           state_ == association_state::releasing;
}

void association::update_timers(association_state from, time_point now) {
    if (!artim_applies()) {
        artim_deadline_.reset();
        return;
    }
    if (!artim_deadline_ || from != state_) {
        artim_deadline_ = now + config_.artim_timeout;
    }
}

}  // namespace dicom_ul::network
