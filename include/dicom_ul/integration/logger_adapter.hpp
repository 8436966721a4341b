/**
 * @file logger_adapter.hpp
 * @brief Adapter for protocol logging using logger_system
 *
 * Provides the process-wide logging facade used by the UL engine: leveled
 * application logging plus an association audit trail (established,
 * rejected, released, aborted) written as JSON lines.
 */

#pragma once

#include <dicom_ul/compat/format.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace dicom_ul::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Entries of the association audit trail
 */
enum class audit_event {
    association_established,
    association_rejected,
    association_released,
    association_aborted,
    protocol_error
};

inline constexpr std::size_t audit_event_count = 5;

/// Name written to the "event" field of an audit record
[[nodiscard]] constexpr auto to_string(audit_event event) noexcept -> std::string_view {
    switch (event) {
        case audit_event::association_established: return "ASSOCIATION_ESTABLISHED";
        case audit_event::association_rejected: return "ASSOCIATION_REJECTED";
        case audit_event::association_released: return "ASSOCIATION_RELEASED";
        case audit_event::association_aborted: return "ASSOCIATION_ABORTED";
        case audit_event::protocol_error: return "PROTOCOL_ERROR";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Append association lifecycle events to the audit file as JSON lines
    bool enable_audit_log{false};

    /// Audit file name inside log_directory
    std::string audit_file_name{"audit.json"};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging facade over logger_system
 *
 * Until initialize() is called every logging call is a no-op, so library
 * code can log unconditionally and applications opt in.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/dicom_ul";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Association {} established", id);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, compat::format(fmt, std::forward<Args>(args)...));
    }

    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Association Audit Trail
    // ─────────────────────────────────────────────────────

    static void log_association_established(const std::string& calling_ae,
                                            const std::string& called_ae,
                                            const std::string& remote_address);

    static void log_association_rejected(const std::string& calling_ae,
                                         const std::string& called_ae,
                                         const std::string& reason);

    static void log_association_released(const std::string& calling_ae,
                                         const std::string& called_ae);

    /**
     * @brief Record an abort with the state it interrupted
     * @param state Association state when the abort happened
     * @param reason Human readable reason (PDU, timer or transport error)
     */
    static void log_association_aborted(const std::string& calling_ae,
                                        const std::string& called_ae,
                                        const std::string& state,
                                        const std::string& reason);

    /**
     * @brief Record a framing or state error that ended an association
     */
    static void log_protocol_error(const std::string& remote_address,
                                   const std::string& state,
                                   const std::string& detail);

    /// Audit events recorded since initialize(), whether or not written to file
    [[nodiscard]] static auto audit_count(audit_event event) noexcept -> std::uint64_t;

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void audit(audit_event event, bool success,
                      const std::map<std::string, std::string>& fields);

    struct state;
    static state& instance();
};

}  // namespace dicom_ul::integration
