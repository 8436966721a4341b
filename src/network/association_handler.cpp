/**
 * @file association_handler.cpp
 * @brief Association handler implementation
 */

#include "dicom_ul/network/association_handler.hpp"
#include "dicom_ul/network/dimse/pdv_fragmenter.hpp"
#include "dicom_ul/network/pdu_decoder.hpp"
#include "dicom_ul/network/pdu_encoder.hpp"

#include <dicom_ul/integration/logger_adapter.hpp>
#include <dicom_ul/services/dimse_service.hpp>

#include <algorithm>
#include <span>

namespace dicom_ul::network {

using integration::logger_adapter;

namespace {

constexpr const char* handler_module = "association_handler";

/// Longest single wait on the transport; timers are re-checked after it
constexpr std::chrono::milliseconds reader_poll_interval{100};

/// Longest single wait on the request queue
constexpr std::chrono::milliseconds worker_poll_interval{100};

associate_rj make_rj(reject_source source, uint8_t reason) {
    return associate_rj(reject_result::rejected_permanent, static_cast<uint8_t>(source), reason);
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

association_handler::association_handler(
    std::shared_ptr<transport> connection,
    engine_config config,
    context_negotiator negotiator,
    std::shared_ptr<const services::capability_set> services)
    : transport_(std::move(connection))
    , config_(config)
    , negotiator_(std::move(negotiator))
    , services_(std::move(services))
    , association_(std::move(config))
    , requests_(std::make_unique<request_queue>()) {}

association_handler::~association_handler() {
    if (started_.load() && !is_closed()) {
        abort();
    }
    enter_terminal_state();

    for (auto* thread : {&reader_, &worker_}) {
        if (thread->joinable()) {
            thread->join();
        }
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

VoidResult association_handler::start() {
    if (started_.exchange(true)) {
        return make_ul_void_error(error_codes::invalid_association_state,
                                  "Handler already started", handler_module);
    }
    logger_adapter::debug("Waiting for A-ASSOCIATE-RQ from {}", transport_->remote_address());
    start_threads();
    return ok();
}

VoidResult association_handler::request_association(associate_rq rq) {
    if (started_.exchange(true)) {
        return make_ul_void_error(error_codes::invalid_association_state,
                                  "Handler already started", handler_module);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto issued = association_.issue_request(std::move(rq), clock::now());
        if (issued.is_err()) {
            started_ = false;
            return VoidResult(issued.error());
        }
        record(issued.value());
        logger_adapter::info("A-ASSOCIATE-RQ {} -> {} ({} contexts)",
                             association_.calling_ae(), association_.called_ae(),
                             association_.request().presentation_contexts.size());
        send_outbound(issued.value());
    }

    start_threads();

    std::unique_lock<std::mutex> lock(mutex_);
    state_cv_.wait_for(lock, config_.artim_timeout + std::chrono::seconds{1}, [this] {
        return association_.state() != association_state::request_sent;
    });

    switch (association_.state()) {
        case association_state::established:
            if (association_.accepted_contexts().empty()) {
                lock.unlock();
                logger_adapter::warn("Peer accepted no presentation context, aborting");
                abort();
                return make_ul_void_error(error_codes::no_acceptable_context,
                                          "No presentation context accepted", handler_module);
            }
            return ok();
        case association_state::closed:
            return make_ul_void_error(error_codes::association_rejected,
                                      association_.rejection()
                                          ? association_.rejection()->description
                                          : std::string("Association rejected"),
                                      handler_module);
        case association_state::aborted:
            if (last_error_) {
                return VoidResult(*last_error_);
            }
            return make_ul_void_error(error_codes::association_aborted,
                                      "Association aborted", handler_module);
        default:
            lock.unlock();
            abort();
            return make_ul_void_error(error_codes::connection_timeout,
                                      "No answer to A-ASSOCIATE-RQ", handler_module);
    }
}

VoidResult association_handler::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto issued = association_.issue_release(clock::now());
        if (issued.is_err()) {
            return VoidResult(issued.error());
        }
        record(issued.value());
        send_outbound(issued.value());
    }

    std::unique_lock<std::mutex> lock(mutex_);
    state_cv_.wait_for(lock, config_.artim_timeout + std::chrono::seconds{1},
                       [this] { return association_.is_closed(); });

    if (association_.state() == association_state::closed) {
        return ok();
    }
    if (last_error_) {
        return VoidResult(*last_error_);
    }
    return make_ul_void_error(error_codes::connection_timeout,
                              "No answer to A-RELEASE-RQ", handler_module);
}

void association_handler::abort() {
    transition t = [this] {
        std::lock_guard<std::mutex> lock(mutex_);
        auto aborted = association_.issue_abort(clock::now());
        record(aborted);
        send_outbound(aborted);
        return aborted;
    }();
    handle_transition(t);
}

bool association_handler::wait_until_closed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return association_.is_closed(); });
}

void association_handler::start_threads() {
    reader_ = std::thread([this] { run_reader(); });
    worker_ = std::thread([this] { run_worker(); });
}

// =============================================================================
// DIMSE
// =============================================================================

Result<services::response_stream> association_handler::send_request(
    uint8_t context_id, const dimse::dimse_message& request) {
    if (!request.is_request() || request.command() == dimse::command_field::c_cancel_rq) {
        return make_ul_error<services::response_stream>(error_codes::dimse_error,
            std::string(dimse::to_string(request.command())) + " is not a request",
            handler_module);
    }

    auto [stream, writer] = services::response_stream::channel();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!association_.is_established()) {
            return make_ul_error<services::response_stream>(
                error_codes::invalid_association_state,
                std::string("Cannot send a request in state ") +
                    to_string(association_.state()),
                handler_module);
        }
        if (!association_.find_context(context_id)) {
            return make_ul_error<services::response_stream>(
                error_codes::invalid_presentation_context_id,
                "Presentation context " + std::to_string(context_id) + " not accepted",
                handler_module);
        }
        if (!pending_responses_.emplace(request.message_id(), writer).second) {
            return make_ul_error<services::response_stream>(error_codes::dimse_error,
                "Message ID " + std::to_string(request.message_id()) + " already outstanding",
                handler_module);
        }
    }

    auto sent = send_message(context_id, request);
    if (sent.is_err()) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_responses_.erase(request.message_id());
        return Result<services::response_stream>(sent.error());
    }
    return stream;
}

VoidResult association_handler::cancel_request(uint8_t context_id, uint16_t message_id) {
    if (!is_established()) {
        return make_ul_void_error(error_codes::invalid_association_state,
                                  "C-CANCEL requires an established association",
                                  handler_module);
    }
    return send_message(context_id, dimse::make_c_cancel_rq(message_id));
}

// =============================================================================
// State Queries
// =============================================================================

association_state association_handler::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool association_handler::is_established() const noexcept {
    return state() == association_state::established;
}

bool association_handler::is_closed() const noexcept {
    const auto current = state();
    return current == association_state::closed || current == association_state::aborted;
}

std::string association_handler::calling_ae() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::string(association_.calling_ae());
}

std::string association_handler::called_ae() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::string(association_.called_ae());
}

std::map<uint8_t, accepted_presentation_context>
association_handler::accepted_contexts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return association_.accepted_contexts();
}

std::optional<uint8_t> association_handler::context_for(
    const std::string& abstract_syntax) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return association_.context_for(abstract_syntax);
}

std::optional<rejection_info> association_handler::rejection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return association_.rejection();
}

std::optional<error_info> association_handler::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

// =============================================================================
// Callbacks
// =============================================================================

void association_handler::set_established_callback(association_established_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    established_callback_ = std::move(callback);
}

void association_handler::set_rejected_callback(association_rejected_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    rejected_callback_ = std::move(callback);
}

void association_handler::set_released_callback(association_released_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    released_callback_ = std::move(callback);
}

void association_handler::set_aborted_callback(association_aborted_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    aborted_callback_ = std::move(callback);
}

// =============================================================================
// Statistics
// =============================================================================

uint64_t association_handler::pdus_received() const noexcept {
    return pdus_received_.load(std::memory_order_relaxed);
}

uint64_t association_handler::pdus_sent() const noexcept {
    return pdus_sent_.load(std::memory_order_relaxed);
}

uint64_t association_handler::messages_processed() const noexcept {
    return messages_processed_.load(std::memory_order_relaxed);
}

// =============================================================================
// Reader Thread
// =============================================================================

void association_handler::run_reader() {
    std::vector<uint8_t> chunk(std::max<std::size_t>(config_.read_buffer_size, PDU_HEADER_SIZE));
    while (!stopping_.load() && read_once(chunk)) {
    }

    // Nothing reassembled after the end may reach a handler
    assembler_.reset();
    receive_buffer_.clear();
}

bool association_handler::read_once(std::vector<uint8_t>& chunk) {
    auto wait = reader_poll_interval;

    std::optional<transition> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock::now();

        // A request being answered counts as traffic for the idle timer
        if (outstanding_.load() > 0 && association_.is_established()) {
            association_.note_activity(now);
        }
        expired = association_.check_timers(now);
        if (expired) {
            record(*expired);
            send_outbound(*expired);
        } else if (auto deadline = association_.next_deadline()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 *deadline - now) + std::chrono::milliseconds{1};
            wait = std::clamp(remaining, std::chrono::milliseconds{1}, reader_poll_interval);
        }
    }
    if (expired) {
        logger_adapter::warn("{}", expired->error ? expired->error->message
                                                  : std::string("Timer expired"));
        handle_transition(*expired);
        return false;
    }

    auto received = transport_->receive(chunk, wait);
    if (received.is_err()) {
        if (received.error().code == error_codes::receive_timeout) {
            return true;
        }
        if (stopping_.load()) {
            return false;
        }
        transition t = [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            auto failed = association_.on_transport_error(received.error(), clock::now());
            record(failed);
            return failed;
        }();
        if (t.from != t.to) {
            logger_adapter::warn("Transport failure in state {}: {}", to_string(t.from),
                                 received.error().message);
        }
        handle_transition(t);
        return false;
    }

    receive_buffer_.insert(receive_buffer_.end(), chunk.begin(),
                           chunk.begin() + static_cast<std::ptrdiff_t>(received.value()));
    process_buffer();
    return !stopping_.load();
}

void association_handler::process_buffer() {
    while (!stopping_.load()) {
        auto total = pdu_decoder::pdu_length(receive_buffer_);
        if (!total) {
            return;
        }

        // Refuse an oversized PDU before buffering its body
        const std::size_t body = *total - PDU_HEADER_SIZE;
        if (config_.max_incoming_pdu_length != 0 && body > config_.max_incoming_pdu_length) {
            fail_protocol(error_info{error_codes::pdu_too_large,
                "PDU body of " + std::to_string(body) + " bytes exceeds limit of " +
                    std::to_string(config_.max_incoming_pdu_length),
                handler_module});
            return;
        }
        if (receive_buffer_.size() < *total) {
            return;
        }

        auto decoded = pdu_decoder::decode(
            std::span<const uint8_t>(receive_buffer_.data(), *total),
            config_.max_incoming_pdu_length);
        receive_buffer_.erase(receive_buffer_.begin(),
                              receive_buffer_.begin() + static_cast<std::ptrdiff_t>(*total));
        if (decoded.is_err()) {
            fail_protocol(decoded.error());
            return;
        }
        pdus_received_.fetch_add(1, std::memory_order_relaxed);

        const pdu& received = decoded.value();
        logger_adapter::trace("Received {}", to_string(type_of(received)));
        transition t = [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            auto next = association_.on_pdu(received, clock::now());
            record(next);
            send_outbound(next);
            return next;
        }();
        if (t.event == association_event::aborted && t.outbound && t.error) {
            logger_adapter::log_protocol_error(transport_->remote_address(),
                                               to_string(t.from), t.error->message);
        }
        handle_transition(t, &received);
    }
}

void association_handler::handle_transition(const transition& t, const pdu* received) {
    switch (t.event) {
        case association_event::request_received:
            handle_associate_request();
            return;
        case association_event::data_received:
            if (received) {
                handle_data(std::get<p_data_tf_pdu>(*received));
            }
            return;
        case association_event::release_request_received:
            if (t.from == association_state::established) {
                handle_peer_release();
            }
            return;
        default:
            break;
    }

    if (t.from != t.to && t.is_terminal()) {
        enter_terminal_state();
    }
    notify(t);
}

void association_handler::handle_associate_request() {
    transition t = [this] {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock::now();
        const associate_rq& rq = association_.request();
        logger_adapter::info("A-ASSOCIATE-RQ {} -> {} from {}", rq.calling_ae_title,
                             rq.called_ae_title, transport_->remote_address());

        std::optional<associate_rj> rj;
        std::vector<presentation_context_ac> results;
        if (rq.called_ae_title != config_.ae_title) {
            logger_adapter::warn("Called AE title mismatch: expected '{}', got '{}'",
                                 config_.ae_title, rq.called_ae_title);
            rj = make_rj(reject_source::service_user,
                         static_cast<uint8_t>(reject_reason_user::called_ae_not_recognized));
        } else if (!config_.is_calling_ae_allowed(rq.calling_ae_title)) {
            logger_adapter::warn("Calling AE title not allowed: {}", rq.calling_ae_title);
            rj = make_rj(reject_source::service_user,
                         static_cast<uint8_t>(reject_reason_user::calling_ae_not_recognized));
        } else if (rq.application_context != DICOM_APPLICATION_CONTEXT) {
            logger_adapter::warn("Unsupported application context {}", rq.application_context);
            rj = make_rj(reject_source::service_user,
                         static_cast<uint8_t>(
                             reject_reason_user::application_context_not_supported));
        } else {
            auto negotiated = negotiator_.negotiate(rq.presentation_contexts);
            if (negotiated.is_err()) {
                logger_adapter::warn("Malformed presentation contexts: {}",
                                     negotiated.error().message);
                rj = make_rj(reject_source::service_provider_acse,
                             static_cast<uint8_t>(reject_reason_provider_acse::no_reason));
            } else {
                results = std::move(negotiated.value());
                const bool any_accepted =
                    std::any_of(results.begin(), results.end(),
                                [](const presentation_context_ac& pc) { return pc.accepted(); });
                if (!any_accepted) {
                    logger_adapter::warn("No acceptable presentation context");
                    rj = make_rj(reject_source::service_user,
                                 static_cast<uint8_t>(reject_reason_user::no_reason));
                }
            }
        }

        Result<transition> decided = [&]() -> Result<transition> {
            if (rj) {
                return association_.reject(*rj, now);
            }
            associate_ac ac;
            ac.called_ae_title = rq.called_ae_title;
            ac.calling_ae_title = rq.calling_ae_title;
            ac.presentation_contexts = std::move(results);
            return association_.accept(std::move(ac), now);
        }();

        if (decided.is_err()) {
            logger_adapter::error("Association decision failed: {}", decided.error().message);
            auto aborted = association_.issue_abort(now);
            record(aborted);
            send_outbound(aborted);
            return aborted;
        }
        record(decided.value());
        send_outbound(decided.value());
        return decided.value();
    }();

    handle_transition(t);
}

void association_handler::handle_data(const p_data_tf_pdu& data) {
    for (const auto& pdv : data.pdvs) {
        auto added = assembler_.add(pdv);
        if (added.is_err()) {
            fail_protocol(added.error());
            return;
        }
        if (added.value()) {
            handle_message(std::move(*added.value()));
            if (stopping_.load()) {
                return;
            }
        }
    }
}

void association_handler::handle_message(dimse::assembled_message assembled) {
    std::string abstract_syntax;
    std::string transfer_syntax;
    std::string calling;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* context = association_.find_context(assembled.context_id);
        if (!context) {
            return;
        }
        abstract_syntax = context->abstract_syntax;
        transfer_syntax = context->transfer_syntax;
        calling = std::string(association_.calling_ae());
    }

    auto decoded = dimse::dimse_message::decode(assembled.command, assembled.dataset,
                                                transfer_syntax);
    if (decoded.is_err()) {
        fail_protocol(decoded.error());
        return;
    }
    messages_processed_.fetch_add(1, std::memory_order_relaxed);

    auto message = std::move(decoded.value());
    logger_adapter::debug("{} (message {}) on context {}", dimse::to_string(message.command()),
                          message.is_response() ? message.message_id_responded_to()
                                                : message.message_id(),
                          static_cast<int>(assembled.context_id));

    if (message.is_response()) {
        handle_response(std::move(message));
        return;
    }
    if (message.command() == dimse::command_field::c_cancel_rq) {
        handle_cancel(message);
        return;
    }

    pending_request job;
    job.service = services::service_for(message.command());
    job.request.context_id = assembled.context_id;
    job.request.abstract_syntax = std::move(abstract_syntax);
    job.request.transfer_syntax = std::move(transfer_syntax);
    job.request.calling_ae = std::move(calling);
    job.request.message = std::move(message);

    outstanding_.fetch_add(1);
    requests_->enqueue(std::move(job));
}

void association_handler::handle_response(dimse::dimse_message message) {
    const uint16_t id = message.message_id_responded_to();
    const bool final = dimse::is_final(message.status());

    std::shared_ptr<services::response_writer> writer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_responses_.find(id);
        if (it == pending_responses_.end()) {
            logger_adapter::warn("Response for unknown message {} discarded", id);
            return;
        }
        writer = it->second;
        if (final) {
            pending_responses_.erase(it);
        }
    }

    auto pushed = writer->push(std::move(message));
    if (pushed.is_err()) {
        logger_adapter::debug("Response for message {} dropped: {}", id,
                              pushed.error().message);
    }
    if (final) {
        writer->finish();
    }
}

void association_handler::handle_cancel(const dimse::dimse_message& message) {
    const uint16_t id = message.message_id_responded_to();
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    if (in_flight_ && in_flight_->message_id == id && in_flight_->multi_response) {
        logger_adapter::info("C-CANCEL for message {}", id);
        in_flight_->cancelled = true;
        in_flight_->stream.close();
        return;
    }
    logger_adapter::debug("C-CANCEL for message {} matches no running operation", id);
}

void association_handler::handle_peer_release() {
    logger_adapter::debug("A-RELEASE-RQ received, {} request(s) outstanding",
                          outstanding_.load());
    release_pending_ = true;
    finish_release_if_idle();
}

void association_handler::fail_protocol(const error_info& error) {
    transition t = [&] {
        std::lock_guard<std::mutex> lock(mutex_);
        auto aborted = association_.on_framing_error(error, clock::now());
        record(aborted);
        send_outbound(aborted);
        return aborted;
    }();
    logger_adapter::log_protocol_error(transport_->remote_address(), to_string(t.from),
                                       error.message);
    handle_transition(t);
}

// =============================================================================
// Worker Thread
// =============================================================================

void association_handler::run_worker() {
    while (!stopping_.load()) {
        auto job = requests_->wait_dequeue(worker_poll_interval);
        if (!job) {
            continue;
        }
        if (!stopping_.load()) {
            answer(std::move(*job));
        }
        outstanding_.fetch_sub(1);
        finish_release_if_idle();
    }
}

void association_handler::answer(pending_request job) {
    const auto& request = job.request;

    if (!job.service) {
        logger_adapter::warn("Unrecognized command {:#06x}",
                             static_cast<unsigned>(request.message.command()));
        send_response(request, dimse::make_response(request.message,
                                                    dimse::status_error_unrecognized_operation));
        return;
    }
    const auto service = *job.service;

    auto stream = services_
        ? services_->invoke(service, request)
        : services::response_stream::failed(error_info{error_codes::service_not_registered,
              "No services configured", handler_module});
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_ = in_flight_request{request.message.message_id(),
                                       services::is_multi_response(service), stream, false};
    }

    while (!stopping_.load()) {
        auto next = stream.next();
        if (stopping_.load()) {
            break;
        }
        if (next.is_err()) {
            bool cancelled = false;
            {
                std::lock_guard<std::mutex> lock(in_flight_mutex_);
                cancelled = in_flight_ && in_flight_->cancelled;
            }
            if (cancelled) {
                send_response(request,
                              dimse::make_response(request.message, dimse::status_cancel));
            } else {
                logger_adapter::warn("{} failed: {}", services::to_string(service),
                                     next.error().message);
                send_failure(job, next.error().message);
            }
            break;
        }
        if (!next.value()) {
            logger_adapter::warn("{} ended without a final response",
                                 services::to_string(service));
            send_failure(job, "No final response produced");
            break;
        }

        auto response = std::move(*next.value());
        const bool final = dimse::is_final(response.status());
        if (!send_response(request, std::move(response)) || final) {
            break;
        }
    }

    stream.close();
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.reset();
}

bool association_handler::send_response(const services::service_request& request,
                                        dimse::dimse_message response) {
    response.set_message_id_responded_to(request.message.message_id());
    auto sent = send_message(request.context_id, response);
    if (sent.is_err()) {
        logger_adapter::warn("Cannot send {}: {}", dimse::to_string(response.command()),
                             sent.error().message);
        return false;
    }
    return true;
}

bool association_handler::send_failure(const pending_request& job, const std::string& comment) {
    auto response =
        dimse::make_response(job.request.message, services::failure_status(*job.service));
    response.set_error_comment(comment);
    return send_response(job.request, std::move(response));
}

void association_handler::finish_release_if_idle() {
    if (outstanding_.load() != 0 || !release_pending_.exchange(false)) {
        return;
    }

    std::optional<transition> t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto completed = association_.complete_release(clock::now());
        if (completed.is_ok()) {
            record(completed.value());
            send_outbound(completed.value());
            t = completed.value();
        }
    }
    if (t) {
        handle_transition(*t);
    }
}

// =============================================================================
// Shared Helpers
// =============================================================================

VoidResult association_handler::send_message(uint8_t context_id,
                                             const dimse::dimse_message& message) {
    std::string transfer_syntax;
    uint32_t limit = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* context = association_.find_context(context_id);
        if (!context) {
            return make_ul_void_error(error_codes::invalid_presentation_context_id,
                "Presentation context " + std::to_string(context_id) + " not accepted",
                handler_module);
        }
        transfer_syntax = context->transfer_syntax;
        limit = association_.outbound_max_pdu_length();
    }

    auto encoded = dimse::dimse_message::encode(message, transfer_syntax);
    if (encoded.is_err()) {
        return VoidResult(encoded.error());
    }
    const auto& [command, dataset] = encoded.value();

    dimse::pdv_fragmenter fragmenter(limit);
    auto pdus = fragmenter.fragment(context_id, command, dataset, message.has_dataset());

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (stopping_.load()) {
            return make_ul_void_error(error_codes::connection_closed,
                                      "Association closed", handler_module);
        }
        for (auto& piece : pdus) {
            auto bytes = pdu_encoder::encode(pdu{std::move(piece)});
            auto sent = transport_->send(bytes);
            if (sent.is_err()) {
                return sent;
            }
            pdus_sent_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    association_.note_activity(clock::now());
    return ok();
}

VoidResult association_handler::send_pdu(const pdu& value) {
    auto bytes = pdu_encoder::encode(value);
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto sent = transport_->send(bytes);
    if (sent.is_ok()) {
        pdus_sent_.fetch_add(1, std::memory_order_relaxed);
        logger_adapter::trace("Sent {}", to_string(type_of(value)));
    }
    return sent;
}

void association_handler::send_outbound(const transition& t) {
    if (!t.outbound) {
        return;
    }
    auto sent = send_pdu(*t.outbound);
    if (sent.is_err()) {
        logger_adapter::warn("Cannot send {}: {}", to_string(type_of(*t.outbound)),
                             sent.error().message);
    }
}

void association_handler::record(const transition& t) {
    state_.store(t.to, std::memory_order_release);
    if (t.from != t.to && t.is_terminal() && t.error) {
        last_error_ = t.error;
    }
}

void association_handler::enter_terminal_state() {
    if (stopping_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        if (in_flight_) {
            in_flight_->stream.close();
        }
    }

    // Queued requests are dropped without reaching a handler
    while (requests_->wait_dequeue(std::chrono::milliseconds{0})) {
        outstanding_.fetch_sub(1);
    }
    requests_->notify_all();

    std::map<uint16_t, std::shared_ptr<services::response_writer>> orphaned;
    error_info reason{error_codes::association_aborted, "Association ended", handler_module};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        orphaned.swap(pending_responses_);
        if (association_.state() == association_state::closed) {
            reason.code = error_codes::association_released;
        }
        if (last_error_) {
            reason = *last_error_;
        }
    }
    for (auto& [id, writer] : orphaned) {
        writer->fail(reason);
    }

    transport_->close();
}

void association_handler::notify(const transition& t) {
    state_cv_.notify_all();
    if (t.from == t.to) {
        return;
    }

    std::string calling;
    std::string called;
    std::optional<rejection_info> rejected;
    std::optional<abort_pdu> abort_details;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calling = std::string(association_.calling_ae());
        called = std::string(association_.called_ae());
        rejected = association_.rejection();
        abort_details = association_.abort_details();
    }

    association_established_callback on_established;
    association_rejected_callback on_rejected;
    association_released_callback on_released;
    association_aborted_callback on_aborted;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_established = established_callback_;
        on_rejected = rejected_callback_;
        on_released = released_callback_;
        on_aborted = aborted_callback_;
    }

    switch (t.event) {
        case association_event::established:
            logger_adapter::log_association_established(calling, called,
                                                        transport_->remote_address());
            if (on_established) {
                on_established(calling, called);
            }
            break;
        case association_event::rejected:
            logger_adapter::log_association_rejected(
                calling, called, rejected ? rejected->description : std::string("rejected"));
            if (on_rejected && rejected) {
                on_rejected(*rejected);
            }
            break;
        case association_event::released:
            logger_adapter::log_association_released(calling, called);
            if (on_released) {
                on_released();
            }
            break;
        case association_event::aborted: {
            error_info reason = t.error.value_or(
                error_info{error_codes::association_aborted, "Association aborted",
                           handler_module});
            logger_adapter::log_association_aborted(calling, called, to_string(t.from),
                                                    reason.message);
            if (on_aborted) {
                on_aborted(reason, abort_details);
            }
            break;
        }
        default:
            break;
    }
}

}  // namespace dicom_ul::network
