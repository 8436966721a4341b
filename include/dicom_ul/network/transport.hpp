/**
 * @file transport.hpp
 * @brief Abstract duplex byte stream consumed by the association handler
 *
 * The engine never opens sockets itself. Any reliable, ordered byte stream
 * (plain TCP, TLS, an in-process pipe) is adapted to this interface.
 */

#ifndef DICOM_UL_NETWORK_TRANSPORT_HPP
#define DICOM_UL_NETWORK_TRANSPORT_HPP

#include <dicom_ul/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace dicom_ul::network {

/**
 * @brief Reliable, ordered, unframed byte stream.
 *
 * receive() may return fewer bytes than requested. close() must unblock a
 * receive() pending on another thread, which then reports connection_closed.
 *
 * Error codes:
 * - connection_closed: the stream was closed locally or by the peer
 * - receive_timeout: no byte arrived within the timeout
 * - send_failed: the bytes could not be written
 */
class transport {
public:
    virtual ~transport() = default;

    [[nodiscard]] virtual VoidResult send(std::span<const uint8_t> data) = 0;

    /**
     * @brief Read up to buffer.size() bytes.
     * @return Number of bytes read, always at least 1 on success
     */
    [[nodiscard]] virtual Result<std::size_t> receive(std::span<uint8_t> buffer,
                                                      std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    [[nodiscard]] virtual std::string remote_address() const = 0;
};

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_TRANSPORT_HPP
