/**
 * @file association.hpp
 * @brief DICOM Association state machine per PS3.8
 *
 * The association class is a pure state machine: it consumes inbound PDUs,
 * local commands and the clock, and answers each with a transition record
 * telling the caller which PDU to emit and whether the connection ends.
 * It performs no I/O; association_handler drives it over a transport.
 *
 * @see DICOM PS3.8 Section 9.2 - DICOM Upper Layer Protocol State Machine
 */

#ifndef DICOM_UL_NETWORK_ASSOCIATION_HPP
#define DICOM_UL_NETWORK_ASSOCIATION_HPP

#include "dicom_ul/network/engine_config.hpp"
#include "dicom_ul/network/pdu_types.hpp"

#include <dicom_ul/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace dicom_ul::network {

// =============================================================================
// Association State
// =============================================================================

/**
 * @brief Association lifecycle states.
 *
 * Collapsed form of PS3.8 Table 9-10: transport connection states are owned
 * by the transport, so only the association-level states remain.
 */
enum class association_state {
    idle,                  ///< Sta1/Sta2: no association activity yet
    request_sent,          ///< Sta5: A-ASSOCIATE-RQ sent, awaiting AC/RJ
    waiting_for_response,  ///< Sta3: A-ASSOCIATE-RQ received, local decision pending
    established,           ///< Sta6: ready for P-DATA
    releasing,             ///< Sta7/Sta8: release in progress
    closed,                ///< Released or rejected
    aborted                ///< Terminal after A-ABORT, timer expiry or error
};

[[nodiscard]] constexpr const char* to_string(association_state state) noexcept {
    switch (state) {
        case association_state::idle: return "Idle";
        case association_state::request_sent: return "RequestSent";
        case association_state::waiting_for_response: return "WaitingForResponse";
        case association_state::established: return "Established";
        case association_state::releasing: return "Releasing";
        case association_state::closed: return "Closed";
        case association_state::aborted: return "Aborted";
    }
    return "Unknown";
}

enum class association_role {
    requester,  ///< Issued the A-ASSOCIATE-RQ (SCU side)
    acceptor    ///< Received the A-ASSOCIATE-RQ (SCP side)
};

/**
 * @brief Lifecycle event produced by a transition
 */
enum class association_event {
    none,
    request_issued,
    request_received,
    established,
    rejected,
    release_requested,          ///< local A-RELEASE-RQ sent
    release_request_received,   ///< peer asked to release
    released,
    aborted,
    data_received
};

[[nodiscard]] constexpr const char* to_string(association_event event) noexcept {
    switch (event) {
        case association_event::none: return "none";
        case association_event::request_issued: return "request-issued";
        case association_event::request_received: return "request-received";
        case association_event::established: return "established";
        case association_event::rejected: return "rejected";
        case association_event::release_requested: return "release-requested";
        case association_event::release_request_received: return "release-request-received";
        case association_event::released: return "released";
        case association_event::aborted: return "aborted";
        case association_event::data_received: return "data-received";
    }
    return "unknown";
}

// =============================================================================
// Negotiated data
// =============================================================================

/**
 * @brief Entry of the accepted presentation context table
 */
struct accepted_presentation_context {
    uint8_t id{0};
    std::string abstract_syntax;
    std::string transfer_syntax;

    friend bool operator==(const accepted_presentation_context&,
                           const accepted_presentation_context&) = default;
};

/**
 * @brief Information about an association rejection.
 */
struct rejection_info {
    reject_result result{reject_result::rejected_permanent};
    uint8_t source{0};
    uint8_t reason{0};
    std::string description;

    rejection_info() = default;
    explicit rejection_info(const associate_rj& rj)
        : result(rj.result), source(rj.source), reason(rj.reason) {
        build_description();
    }

private:
    void build_description();
};

/**
 * @brief Result of feeding one event into the state machine
 *
 * The caller must send @c outbound (when present) before acting on the new
 * state, and close the transport when the new state is terminal.
 */
struct transition {
    association_state from{association_state::idle};
    association_state to{association_state::idle};
    association_event event{association_event::none};

    /// PDU to write to the peer as part of this transition
    std::optional<pdu> outbound;

    /// Why the association ended abnormally (aborts, rejects, timeouts)
    std::optional<error_info> error;

    [[nodiscard]] bool is_terminal() const noexcept {
        return to == association_state::closed || to == association_state::aborted;
    }
};

// =============================================================================
// Association Class
// =============================================================================

/**
 * @brief State machine for one association.
 *
 * Every (state, inbound PDU) combination is handled: either a defined
 * transition applies or the association moves to Aborted and, when the
 * transport may still be written, an A-ABORT is emitted. Instances are not
 * synchronized; one owner feeds events in arrival order.
 *
 * Timers:
 * - ARTIM runs while in RequestSent, WaitingForResponse and Releasing.
 * - The idle timer runs while Established and is re-armed by any inbound PDU
 *   or note_activity(). A zero idle_timeout disables it.
 *
 * @example Acceptor side
 * @code
 * association assoc(config);
 * auto t = assoc.on_pdu(received, association::clock::now());
 * if (t.to == association_state::waiting_for_response) {
 *     auto accepted = assoc.accept(build_ac(assoc.request()), now);
 *     // send accepted.value().outbound
 * }
 * @endcode
 */
class association {
public:
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;

    explicit association(engine_config config);

    // =========================================================================
    // Local commands
    // =========================================================================

    /**
     * @brief Idle -> RequestSent, emitting the A-ASSOCIATE-RQ
     *
     * Empty user-information fields are filled from the configuration.
     */
    [[nodiscard]] Result<transition> issue_request(associate_rq rq, time_point now);

    /**
     * @brief WaitingForResponse -> Established, emitting the A-ASSOCIATE-AC
     *
     * Every context of the request must be answered exactly once and at least
     * one must be accepted; otherwise no_acceptable_context or
     * invalid_presentation_context_id is returned and the state is unchanged.
     */
    [[nodiscard]] Result<transition> accept(associate_ac ac, time_point now);

    /**
     * @brief WaitingForResponse -> Closed, emitting the A-ASSOCIATE-RJ
     */
    [[nodiscard]] Result<transition> reject(const associate_rj& rj, time_point now);

    /**
     * @brief Established -> Releasing, emitting the A-RELEASE-RQ
     */
    [[nodiscard]] Result<transition> issue_release(time_point now);

    /**
     * @brief Answer a peer release request: Releasing -> Closed with A-RELEASE-RP
     *
     * Called once all outbound data for the association has been written.
     */
    [[nodiscard]] Result<transition> complete_release(time_point now);

    /**
     * @brief Any live state -> Aborted, emitting A-ABORT (service-user)
     */
    transition issue_abort(time_point now);

    // =========================================================================
    // Inbound events
    // =========================================================================

    /**
     * @brief Feed one decoded PDU
     */
    transition on_pdu(const pdu& received, time_point now);

    /**
     * @brief The byte stream could not be framed or decoded
     *
     * Emits A-ABORT (service-provider) with a reason derived from the error.
     */
    transition on_framing_error(const error_info& error, time_point now);

    /**
     * @brief The transport failed or closed; no PDU can be emitted
     */
    transition on_transport_error(const error_info& error, time_point now);

    /**
     * @brief Expire ARTIM or the idle timer if their deadline has passed
     * @return Transition to Aborted on expiry, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<transition> check_timers(time_point now);

    /**
     * @brief Earliest pending timer deadline, if any timer is running
     */
    [[nodiscard]] std::optional<time_point> next_deadline() const;

    /**
     * @brief Re-arm the idle timer (outbound traffic counts as activity)
     */
    void note_activity(time_point now);

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] association_state state() const noexcept { return state_; }
    [[nodiscard]] std::optional<association_role> role() const noexcept { return role_; }
    [[nodiscard]] bool is_established() const noexcept {
        return state_ == association_state::established;
    }
    [[nodiscard]] bool is_closed() const noexcept {
        return state_ == association_state::closed || state_ == association_state::aborted;
    }

    /// True while releasing because the peer sent A-RELEASE-RQ
    [[nodiscard]] bool peer_requested_release() const noexcept {
        return state_ == association_state::releasing && !release_initiated_locally_;
    }

    [[nodiscard]] std::string_view calling_ae() const noexcept { return calling_ae_; }
    [[nodiscard]] std::string_view called_ae() const noexcept { return called_ae_; }

    /// The A-ASSOCIATE-RQ issued or received
    [[nodiscard]] const associate_rq& request() const noexcept { return request_; }

    [[nodiscard]] const engine_config& config() const noexcept { return config_; }

    /// Max PDU length the peer advertised (0 = unlimited)
    [[nodiscard]] uint32_t peer_max_pdu_length() const noexcept { return peer_max_pdu_; }

    /**
     * @brief Largest P-DATA-TF PDU length this side may send
     *
     * Minimum of the local and peer limits, where 0 means unlimited.
     */
    [[nodiscard]] uint32_t outbound_max_pdu_length() const noexcept;

    [[nodiscard]] std::string_view remote_implementation_class() const noexcept {
        return remote_implementation_class_;
    }
    [[nodiscard]] std::string_view remote_implementation_version() const noexcept {
        return remote_implementation_version_;
    }

    [[nodiscard]] const std::map<uint8_t, accepted_presentation_context>&
    accepted_contexts() const noexcept {
        return accepted_contexts_;
    }

    [[nodiscard]] const accepted_presentation_context* find_context(uint8_t id) const;

    /**
     * @brief First accepted context for an abstract syntax
     */
    [[nodiscard]] std::optional<uint8_t> context_for(std::string_view abstract_syntax) const;

    [[nodiscard]] const std::optional<rejection_info>& rejection() const noexcept {
        return rejection_;
    }

    [[nodiscard]] const std::optional<abort_pdu>& abort_details() const noexcept {
        return abort_;
    }

private:
    transition make(association_state to, association_event event,
                    std::optional<pdu> outbound = std::nullopt,
                    std::optional<error_info> error = std::nullopt);

    transition protocol_violation(const pdu& received, const std::string& detail,
                                  abort_reason reason = abort_reason::unexpected_pdu);

    transition on_associate_rq(const associate_rq& rq);
    transition on_associate_ac(const associate_ac& ac);
    transition on_associate_rj(const associate_rj& rj);
    transition on_p_data(const p_data_tf_pdu& data);
    transition on_release_rq();
    transition on_release_rp();
    transition on_abort(const abort_pdu& abort);

    void update_timers(association_state from, time_point now);
    [[nodiscard]] bool artim_applies() const noexcept;

    engine_config config_;
    association_state state_{association_state::idle};
    std::optional<association_role> role_;

    std::string calling_ae_;
    std::string called_ae_;
    associate_rq request_;
    uint32_t peer_max_pdu_{UNLIMITED_MAX_PDU_LENGTH};
    std::string remote_implementation_class_;
    std::string remote_implementation_version_;
    std::map<uint8_t, accepted_presentation_context> accepted_contexts_;

    bool release_initiated_locally_{false};
    std::optional<rejection_info> rejection_;
    std::optional<abort_pdu> abort_;

    std::optional<time_point> artim_deadline_;
    time_point last_activity_{};
};

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_ASSOCIATION_HPP
