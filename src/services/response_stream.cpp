/**
 * @file response_stream.cpp
 * @brief Implementation of the pull-based response sequence
 */

#include <dicom_ul/services/response_stream.hpp>

#include <kcenon/thread/lockfree/lockfree_queue.h>

#include <chrono>
#include <exception>
#include <variant>

namespace dicom_ul::services {

namespace {

struct end_of_stream {};

using channel_item = std::variant<network::dimse::dimse_message, error_info, end_of_stream>;

/// Slice used while waiting on a channel so a close() is noticed promptly
constexpr std::chrono::milliseconds channel_poll_interval{50};

response_stream::next_result closed_error() {
    return make_ul_error<std::optional<network::dimse::dimse_message>>(
        error_codes::stream_closed, "Response stream closed", "services");
}

}  // namespace

struct response_stream::state {
    std::atomic<bool> closed{false};
    bool finished{false};

    // Exactly one of the two sources is set
    generator gen;
    std::unique_ptr<kcenon::thread::concurrent_queue<channel_item>> queue;
};

response_stream::response_stream() : state_(std::make_shared<state>()) {
    state_->finished = true;
}

response_stream::response_stream(std::shared_ptr<state> st) : state_(std::move(st)) {}

response_stream response_stream::from_generator(generator gen) {
    auto st = std::make_shared<state>();
    st->gen = std::move(gen);
    if (!st->gen) {
        st->finished = true;
    }
    return response_stream(std::move(st));
}

response_stream response_stream::single(message_type message) {
    std::vector<message_type> messages;
    messages.push_back(std::move(message));
    return from_messages(std::move(messages));
}

response_stream response_stream::from_messages(std::vector<message_type> messages) {
    auto items = std::make_shared<std::vector<message_type>>(std::move(messages));
    auto index = std::make_shared<std::size_t>(0);
    return from_generator([items, index]() -> next_result {
        if (*index >= items->size()) {
            return std::optional<message_type>{};
        }
        return std::optional<message_type>{std::move((*items)[(*index)++])};
    });
}

response_stream response_stream::failed(error_info error) {
    auto reported = std::make_shared<bool>(false);
    return from_generator([error = std::move(error), reported]() -> next_result {
        if (*reported) {
            return std::optional<message_type>{};
        }
        *reported = true;
        return next_result(error);
    });
}

std::pair<response_stream, std::shared_ptr<response_writer>> response_stream::channel() {
    auto st = std::make_shared<state>();
    st->queue = std::make_unique<kcenon::thread::concurrent_queue<channel_item>>();
    auto writer = std::make_shared<response_writer>(response_writer::access_key{}, st);
    return {response_stream(std::move(st)), std::move(writer)};
}

response_stream::next_result response_stream::next() {
    if (state_->closed.load()) {
        return closed_error();
    }
    if (state_->finished) {
        return std::optional<message_type>{};
    }

    if (state_->gen) {
        auto result = pull_generator();
        if (result.is_err() || !result.value()) {
            state_->finished = true;
        }
        if (state_->closed.load()) {
            return closed_error();
        }
        return result;
    }

    while (true) {
        auto item = state_->queue->wait_dequeue(channel_poll_interval);
        if (state_->closed.load()) {
            return closed_error();
        }
        if (!item) {
            continue;
        }
        if (auto* message = std::get_if<message_type>(&*item)) {
            return std::optional<message_type>{std::move(*message)};
        }
        state_->finished = true;
        if (auto* error = std::get_if<error_info>(&*item)) {
            return next_result(*error);
        }
        return std::optional<message_type>{};
    }
}

response_stream::next_result response_stream::pull_generator() {
    // A lazy handler can fail on any pull, not only when it is invoked
    try {
        return state_->gen();
    } catch (const std::exception& e) {
        return make_ul_error<std::optional<message_type>>(
            error_codes::service_processing_failed, e.what(), "services");
    }
}

void response_stream::close() {
    if (state_->closed.exchange(true)) {
        return;
    }
    if (state_->queue) {
        state_->queue->notify_all();
    }
}

bool response_stream::is_closed() const noexcept {
    return state_->closed.load();
}

Result<std::vector<response_stream::message_type>> response_stream::collect() {
    std::vector<message_type> messages;
    while (true) {
        auto item = next();
        if (item.is_err()) {
            return Result<std::vector<message_type>>(item.error());
        }
        if (!item.value()) {
            return messages;
        }
        messages.push_back(std::move(*item.value()));
    }
}

// ---------------------------------------------------------------------------
// response_writer
// ---------------------------------------------------------------------------

response_writer::response_writer(access_key, std::shared_ptr<response_stream::state> st)
    : state_(std::move(st)) {}

response_writer::~response_writer() {
    finish();
}

VoidResult response_writer::push(network::dimse::dimse_message message) {
    if (finished_.load() || state_->closed.load()) {
        return make_ul_void_error(error_codes::stream_closed,
                                  "Response stream closed", "services");
    }
    state_->queue->enqueue(channel_item{std::move(message)});
    return ok();
}

void response_writer::fail(error_info error) {
    if (finished_.exchange(true)) {
        return;
    }
    state_->queue->enqueue(channel_item{std::move(error)});
}

void response_writer::finish() {
    if (finished_.exchange(true)) {
        return;
    }
    state_->queue->enqueue(channel_item{end_of_stream{}});
}

bool response_writer::is_closed() const noexcept {
    return state_->closed.load();
}

}  // namespace dicom_ul::services
