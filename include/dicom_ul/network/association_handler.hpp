/**
 * @file association_handler.hpp
 * @brief Drives one association over one transport connection
 *
 * The handler owns the transport, the association state machine and the
 * DIMSE multiplexer. A reader thread frames PDUs from the byte stream and
 * feeds them to the state machine; a worker thread invokes the capability
 * set for incoming requests and streams the responses back out.
 *
 * @see DICOM PS3.8 - Network Communication Support for Message Exchange
 * @see DICOM PS3.7 - Message Exchange
 */

#ifndef DICOM_UL_NETWORK_ASSOCIATION_HANDLER_HPP
#define DICOM_UL_NETWORK_ASSOCIATION_HANDLER_HPP

#include "dicom_ul/network/association.hpp"
#include "dicom_ul/network/context_negotiator.hpp"
#include "dicom_ul/network/dimse/dimse_message.hpp"
#include "dicom_ul/network/dimse/pdv_assembler.hpp"
#include "dicom_ul/network/engine_config.hpp"
#include "dicom_ul/network/transport.hpp"

#include <dicom_ul/core/result.hpp>
#include <dicom_ul/services/capability_set.hpp>
#include <dicom_ul/services/response_stream.hpp>

#include <kcenon/thread/lockfree/lockfree_queue.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dicom_ul::network {

// =============================================================================
// Handler Callbacks
// =============================================================================
//
// Callbacks run on the handler's reader or worker thread. They may query the
// handler but must not destroy it.

using association_established_callback =
    std::function<void(const std::string& calling_ae, const std::string& called_ae)>;

using association_rejected_callback = std::function<void(const rejection_info& rejection)>;

using association_released_callback = std::function<void()>;

/**
 * @brief Called once when the association aborts
 *
 * @p abort is the A-ABORT source/reason when one was sent or received, and
 * empty for transport failures.
 */
using association_aborted_callback =
    std::function<void(const error_info& reason, const std::optional<abort_pdu>& abort)>;

// =============================================================================
// Association Handler
// =============================================================================

/**
 * @class association_handler
 * @brief Runs the Upper Layer protocol for one connection
 *
 * ### Acceptor
 * @code
 * association_handler handler(transport, config, negotiator, services);
 * handler.start();
 * handler.wait_until_closed(std::chrono::minutes{5});
 * @endcode
 * The incoming A-ASSOCIATE-RQ is checked against the configured AE title
 * and calling-AE whitelist, then negotiated. A request with malformed
 * context IDs or without any acceptable context is rejected.
 *
 * ### Requester
 * @code
 * association_handler handler(transport, config, negotiator);
 * auto est = handler.request_association(rq);
 * auto responses = handler.send_request(1, make_c_echo_rq(1));
 * auto all = responses.value().collect();
 * handler.release();
 * @endcode
 *
 * ### Threading
 * PDUs are processed strictly in arrival order on the reader thread.
 * Requests are answered one at a time on the worker thread; the PDUs of
 * one DIMSE message are written to the transport without interleaving.
 * An abort or a transport failure closes every open response stream,
 * drops queued requests without invoking their handlers and clears the
 * reassembly buffers.
 */
class association_handler {
public:
    using clock = association::clock;
    using time_point = association::time_point;

    /**
     * @param services Handlers for incoming requests; may be null for a
     *        handler that only issues requests
     */
    association_handler(std::shared_ptr<transport> connection,
                        engine_config config,
                        context_negotiator negotiator,
                        std::shared_ptr<const services::capability_set> services = nullptr);

    /**
     * @brief Aborts a live association and joins the threads
     *
     * Must not run on the reader or worker thread, so a callback may not
     * destroy the handler that invoked it. Hand the destruction to another
     * thread instead.
     */
    ~association_handler();

    association_handler(const association_handler&) = delete;
    association_handler& operator=(const association_handler&) = delete;
    association_handler(association_handler&&) = delete;
    association_handler& operator=(association_handler&&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Start as acceptor: wait for the peer's A-ASSOCIATE-RQ
     * @return invalid_association_state if already started
     */
    [[nodiscard]] VoidResult start();

    /**
     * @brief Start as requester and block until the peer answers
     *
     * Returns when the association is established, rejected or aborted
     * (ARTIM bounds the wait). An accept without any accepted context is
     * aborted and reported as no_acceptable_context.
     */
    [[nodiscard]] VoidResult request_association(associate_rq rq);

    /**
     * @brief Send A-RELEASE-RQ and wait for the A-RELEASE-RP
     */
    [[nodiscard]] VoidResult release();

    /**
     * @brief Send A-ABORT (service-user) and close the connection
     */
    void abort();

    /**
     * @brief Block until the association is closed or aborted
     * @return false on timeout
     */
    bool wait_until_closed(std::chrono::milliseconds timeout);

    // =========================================================================
    // DIMSE
    // =========================================================================

    /**
     * @brief Send a request on an accepted context
     * @return A stream yielding the peer's responses; it ends after the
     *         first final (non-pending) response
     */
    [[nodiscard]] Result<services::response_stream> send_request(
        uint8_t context_id, const dimse::dimse_message& request);

    /**
     * @brief Ask the peer to cancel an outstanding C-FIND/C-GET/C-MOVE
     */
    [[nodiscard]] VoidResult cancel_request(uint8_t context_id, uint16_t message_id);

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] association_state state() const noexcept;

    [[nodiscard]] bool is_established() const noexcept;

    [[nodiscard]] bool is_closed() const noexcept;

    [[nodiscard]] std::string calling_ae() const;

    [[nodiscard]] std::string called_ae() const;

    [[nodiscard]] std::map<uint8_t, accepted_presentation_context> accepted_contexts() const;

    /// Context ID accepted for an abstract syntax, if any
    [[nodiscard]] std::optional<uint8_t> context_for(const std::string& abstract_syntax) const;

    [[nodiscard]] std::optional<rejection_info> rejection() const;

    /// Why the association ended abnormally, if it did
    [[nodiscard]] std::optional<error_info> last_error() const;

    // =========================================================================
    // Callbacks
    // =========================================================================

    void set_established_callback(association_established_callback callback);

    void set_rejected_callback(association_rejected_callback callback);

    void set_released_callback(association_released_callback callback);

    void set_aborted_callback(association_aborted_callback callback);

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] uint64_t pdus_received() const noexcept;

    [[nodiscard]] uint64_t pdus_sent() const noexcept;

    /// DIMSE messages reassembled and dispatched
    [[nodiscard]] uint64_t messages_processed() const noexcept;

private:
    /// One reassembled request waiting for the worker
    struct pending_request {
        std::optional<services::dimse_service> service;
        services::service_request request;
    };

    /// Request currently being answered by the worker
    struct in_flight_request {
        uint16_t message_id{0};
        bool multi_response{false};
        services::response_stream stream;
        bool cancelled{false};
    };

    using request_queue = kcenon::thread::concurrent_queue<pending_request>;

    // Reader thread
    void run_reader();
    bool read_once(std::vector<uint8_t>& chunk);
    void process_buffer();
    void handle_transition(const transition& t, const pdu* received = nullptr);
    void handle_associate_request();
    void handle_data(const p_data_tf_pdu& data);
    void handle_message(dimse::assembled_message assembled);
    void handle_response(dimse::dimse_message message);
    void handle_cancel(const dimse::dimse_message& message);
    void handle_peer_release();
    void fail_protocol(const error_info& error);

    // Worker thread
    void run_worker();
    void answer(pending_request job);
    bool send_response(const services::service_request& request,
                       dimse::dimse_message response);
    bool send_failure(const pending_request& job, const std::string& comment);
    void finish_release_if_idle();

    // Shared helpers
    VoidResult send_message(uint8_t context_id, const dimse::dimse_message& message);
    VoidResult send_pdu(const pdu& value);
    void send_outbound(const transition& t);
    void enter_terminal_state();
    void start_threads();
    void notify(const transition& t);
    void record(const transition& t);

    std::shared_ptr<transport> transport_;
    engine_config config_;
    context_negotiator negotiator_;
    std::shared_ptr<const services::capability_set> services_;

    // Guards association_, pending_responses_, last_error_ and callbacks_
    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    association association_;
    std::optional<error_info> last_error_;
    std::map<uint16_t, std::shared_ptr<services::response_writer>> pending_responses_;

    // Serializes whole DIMSE messages and single PDUs on the transport
    std::mutex write_mutex_;

    // Reader-thread only
    std::vector<uint8_t> receive_buffer_;
    dimse::pdv_assembler assembler_;

    std::unique_ptr<request_queue> requests_;
    std::atomic<std::size_t> outstanding_{0};
    std::atomic<bool> release_pending_{false};

    std::mutex in_flight_mutex_;
    std::optional<in_flight_request> in_flight_;

    std::atomic<association_state> state_{association_state::idle};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::thread reader_;
    std::thread worker_;

    std::mutex callback_mutex_;
    association_established_callback established_callback_;
    association_rejected_callback rejected_callback_;
    association_released_callback released_callback_;
    association_aborted_callback aborted_callback_;

    std::atomic<uint64_t> pdus_received_{0};
    std::atomic<uint64_t> pdus_sent_{0};
    std::atomic<uint64_t> messages_processed_{0};
};

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_ASSOCIATION_HANDLER_HPP
