/**
 * @file memory_transport.cpp
 * @brief Implementation of the in-memory transport pair
 */

#include "dicom_ul/network/memory_transport.hpp"

#include <algorithm>
#include <cstring>

namespace dicom_ul::network {

std::pair<std::shared_ptr<memory_transport>, std::shared_ptr<memory_transport>>
memory_transport::create_pair(const std::string& first_address,
                              const std::string& second_address) {
    auto state = std::make_shared<shared_state>();
    auto a_to_b = std::make_shared<chunk_queue>();
    auto b_to_a = std::make_shared<chunk_queue>();

    // Each end reports the other end's address as its remote address
    std::shared_ptr<memory_transport> first(
        new memory_transport(state, b_to_a, a_to_b, second_address));
    std::shared_ptr<memory_transport> second(
        new memory_transport(state, a_to_b, b_to_a, first_address));

    return {std::move(first), std::move(second)};
}

memory_transport::memory_transport(std::shared_ptr<shared_state> state,
                                   std::shared_ptr<chunk_queue> inbound,
                                   std::shared_ptr<chunk_queue> outbound,
                                   std::string remote_address)
    : state_(std::move(state))
    , inbound_(std::move(inbound))
    , outbound_(std::move(outbound))
    , remote_address_(std::move(remote_address)) {}

VoidResult memory_transport::send(std::span<const uint8_t> data) {
    if (state_->closed.load()) {
        return make_ul_void_error(error_codes::connection_closed,
                                  "Transport closed", "transport");
    }
    if (data.empty()) {
        return ok();
    }

    outbound_->enqueue(std::vector<uint8_t>(data.begin(), data.end()));
    bytes_sent_ += data.size();
    return ok();
}

Result<std::size_t> memory_transport::receive(std::span<uint8_t> buffer,
                                              std::chrono::milliseconds timeout) {
    std::lock_guard lock(read_mutex_);
    ++receive_calls_;

    if (pending_offset_ >= pending_.size()) {
        // Queued bytes remain readable after close; only an empty queue
        // reports connection_closed
        auto wait = state_->closed.load() ? std::chrono::milliseconds{0} : timeout;
        auto chunk = inbound_->wait_dequeue(wait);
        if (!chunk && !state_->closed.load()) {
            return make_ul_error<std::size_t>(error_codes::receive_timeout,
                "No data within " + std::to_string(timeout.count()) + " ms", "transport");
        }
        if (!chunk) {
            // Woken by close(); drain anything enqueued before it
            chunk = inbound_->wait_dequeue(std::chrono::milliseconds{0});
        }
        if (!chunk) {
            return make_ul_error<std::size_t>(error_codes::connection_closed,
                                              "Transport closed", "transport");
        }
        pending_ = std::move(*chunk);
        pending_offset_ = 0;
    }

    const std::size_t count = std::min(buffer.size(), pending_.size() - pending_offset_);
    std::memcpy(buffer.data(), pending_.data() + pending_offset_, count);
    pending_offset_ += count;
    return count;
}

void memory_transport::close() {
    if (state_->closed.exchange(true)) {
        return;
    }
    inbound_->notify_all();
    outbound_->notify_all();
}

bool memory_transport::is_open() const noexcept {
    return !state_->closed.load();
}

}  // namespace dicom_ul::network
