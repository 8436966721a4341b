/**
 * @file memory_transport.hpp
 * @brief In-process transport pair for tests and loopback associations
 */

#ifndef DICOM_UL_NETWORK_MEMORY_TRANSPORT_HPP
#define DICOM_UL_NETWORK_MEMORY_TRANSPORT_HPP

#include "transport.hpp"

#include <kcenon/thread/lockfree/lockfree_queue.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace dicom_ul::network {

/**
 * @brief One end of an in-memory duplex pipe.
 *
 * Every send() becomes one chunk in the peer's inbound queue; receive()
 * drains chunks in order and may split a chunk across calls. Closing either
 * end closes both, but bytes already queued stay readable.
 *
 * @example
 * @code
 * auto [client, server] = memory_transport::create_pair();
 * client->send(bytes);
 * std::array<uint8_t, 64> buf{};
 * auto n = server->receive(buf, std::chrono::seconds{1});
 * @endcode
 */
class memory_transport : public transport {
public:
    using chunk_queue = kcenon::thread::concurrent_queue<std::vector<uint8_t>>;

    [[nodiscard]] static std::pair<std::shared_ptr<memory_transport>,
                                   std::shared_ptr<memory_transport>>
    create_pair(const std::string& first_address = "memory://a",
                const std::string& second_address = "memory://b");

    [[nodiscard]] VoidResult send(std::span<const uint8_t> data) override;

    [[nodiscard]] Result<std::size_t> receive(std::span<uint8_t> buffer,
                                              std::chrono::milliseconds timeout) override;

    void close() override;

    [[nodiscard]] bool is_open() const noexcept override;

    [[nodiscard]] std::string remote_address() const override { return remote_address_; }

    /// Total bytes written by this end
    [[nodiscard]] std::size_t bytes_sent() const noexcept { return bytes_sent_.load(); }

    /// Number of receive() calls made on this end
    [[nodiscard]] std::size_t receive_calls() const noexcept { return receive_calls_.load(); }

private:
    struct shared_state {
        std::atomic<bool> closed{false};
    };

    memory_transport(std::shared_ptr<shared_state> state,
                     std::shared_ptr<chunk_queue> inbound,
                     std::shared_ptr<chunk_queue> outbound,
                     std::string remote_address);

    std::shared_ptr<shared_state> state_;
    std::shared_ptr<chunk_queue> inbound_;
    std::shared_ptr<chunk_queue> outbound_;
    std::string remote_address_;

    std::mutex read_mutex_;
    std::vector<uint8_t> pending_;
    std::size_t pending_offset_{0};

    std::atomic<std::size_t> bytes_sent_{0};
    std::atomic<std::size_t> receive_calls_{0};
};

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_MEMORY_TRANSPORT_HPP
