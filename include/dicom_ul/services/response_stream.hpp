/**
 * @file response_stream.hpp
 * @brief Pull-based lazy sequence of DIMSE responses
 *
 * A service handler answers a request with a response_stream. The
 * association pulls one response at a time, writes it to the wire and only
 * then pulls the next, so a C-FIND producing thousands of matches never has
 * them all in memory at once.
 */

#ifndef DICOM_UL_SERVICES_RESPONSE_STREAM_HPP
#define DICOM_UL_SERVICES_RESPONSE_STREAM_HPP

#include <dicom_ul/core/result.hpp>
#include <dicom_ul/network/dimse/dimse_message.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace dicom_ul::services {

class response_writer;

/**
 * @brief Finite, ordered, lazily produced responses to one request
 *
 * Copies share the same underlying sequence, which lets one thread pull
 * while another closes it (C-CANCEL, abort). next() must only be called
 * from one thread at a time.
 *
 * @example
 * @code
 * auto stream = response_stream::from_messages({pending1, pending2, final});
 * while (true) {
 *     auto item = stream.next();
 *     if (item.is_err() || !item.value()) break;
 *     send(*item.value());
 * }
 * @endcode
 */
class response_stream {
public:
    using message_type = network::dimse::dimse_message;
    using next_result = Result<std::optional<message_type>>;

    /**
     * @brief Producer called once per pull
     *
     * Returns the next response, std::nullopt at the end of the sequence, or
     * an error which also ends it.
     */
    using generator = std::function<next_result()>;

    /// An already finished, empty sequence
    response_stream();

    [[nodiscard]] static response_stream from_generator(generator gen);

    [[nodiscard]] static response_stream single(message_type message);

    [[nodiscard]] static response_stream from_messages(std::vector<message_type> messages);

    /// A sequence whose first pull reports @p error
    [[nodiscard]] static response_stream failed(error_info error);

    /**
     * @brief A stream fed by another thread
     *
     * The writer pushes responses as they become available; next() blocks
     * until one arrives, the writer finishes or the stream is closed.
     */
    [[nodiscard]] static std::pair<response_stream, std::shared_ptr<response_writer>>
    channel();

    /**
     * @brief Pull the next response
     * @return The response, std::nullopt once the sequence is exhausted, or
     *         an error. After close() every pull reports stream_closed.
     */
    [[nodiscard]] next_result next();

    /**
     * @brief Stop the sequence
     *
     * Wakes a pull blocked on a channel. Producers observe the closure
     * through response_writer::push() or is_closed().
     */
    void close();

    [[nodiscard]] bool is_closed() const noexcept;

    /// Drain everything into a vector, stopping at the first error
    [[nodiscard]] Result<std::vector<message_type>> collect();

private:
    struct state;
    explicit response_stream(std::shared_ptr<state> st);

    /// Runs the generator; an exception it throws ends the sequence
    next_result pull_generator();

    std::shared_ptr<state> state_;

    friend class response_writer;
};

/**
 * @brief Producer side of response_stream::channel()
 *
 * Destroying a writer without calling finish() or fail() ends the stream
 * as if finish() had been called.
 */
class response_writer {
    // Only response_stream::channel() can name this
    struct access_key {
        explicit access_key() = default;
    };

public:
    response_writer(access_key, std::shared_ptr<response_stream::state> st);
    ~response_writer();

    response_writer(const response_writer&) = delete;
    response_writer& operator=(const response_writer&) = delete;

    /**
     * @brief Append a response
     * @return stream_closed if the reader closed the stream or the writer
     *         already finished
     */
    [[nodiscard]] VoidResult push(network::dimse::dimse_message message);

    /// End the sequence with an error
    void fail(error_info error);

    /// End the sequence normally
    void finish();

    [[nodiscard]] bool is_closed() const noexcept;

private:
    std::shared_ptr<response_stream::state> state_;
    std::atomic<bool> finished_{false};

    friend class response_stream;
};

}  // namespace dicom_ul::services

#endif  // DICOM_UL_SERVICES_RESPONSE_STREAM_HPP
