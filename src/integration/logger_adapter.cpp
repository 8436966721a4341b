/**
 * @file logger_adapter.cpp
 * @brief logger_system backend and JSON-lines audit trail
 */

#include <dicom_ul/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace dicom_ul::integration {

namespace {

auto to_backend_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::fatal;
        case log_level::off: break;
    }
    return kcenon::logger::log_level::off;
}

/// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
auto utc_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis.count() << 'Z';
    return out.str();
}

}  // namespace

// =============================================================================
// Shared State
// =============================================================================

struct logger_adapter::state {
    // Guards config, backend and audit_path
    std::mutex mutex;
    std::mutex audit_mutex;

    std::atomic<bool> initialized{false};
    std::atomic<log_level> min_level{log_level::info};
    logger_config config;
    std::unique_ptr<kcenon::logger::logger> backend;
    std::filesystem::path audit_path;

    std::array<std::atomic<std::uint64_t>, audit_event_count> audit_counts{};

    ~state() {
        if (backend) {
            backend->flush();
            backend->stop();
        }
    }
};

logger_adapter::state& logger_adapter::instance() {
    static state shared;
    return shared;
}

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    auto& st = instance();
    std::lock_guard lock(st.mutex);
    if (st.initialized) {
        return;
    }

    if (config.enable_file || config.enable_audit_log) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_directory, ec);
    }

    auto backend = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                            config.buffer_size);
    backend->set_min_level(to_backend_level(config.min_level));
    if (config.enable_console) {
        backend->add_writer(std::make_unique<kcenon::logger::console_writer>());
    }
    if (config.enable_file) {
        backend->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
            (config.log_directory / "dicom_ul.log").string(),
            config.max_file_size_mb * 1024 * 1024, config.max_files));
    }
    backend->start();

    st.config = config;
    st.min_level = config.min_level;
    st.backend = std::move(backend);
    st.audit_path = config.enable_audit_log
                        ? config.log_directory / config.audit_file_name
                        : std::filesystem::path{};
    for (auto& count : st.audit_counts) {
        count = 0;
    }
    st.initialized = true;
}

void logger_adapter::shutdown() {
    auto& st = instance();
    std::lock_guard lock(st.mutex);
    if (!st.initialized.exchange(false)) {
        return;
    }
    if (st.backend) {
        st.backend->flush();
        st.backend->stop();
        st.backend.reset();
    }
    st.audit_path.clear();
}

auto logger_adapter::is_initialized() noexcept -> bool {
    return instance().initialized.load();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    auto& st = instance();
    if (!is_level_enabled(level)) {
        return;
    }
    std::lock_guard lock(st.mutex);
    if (st.backend) {
        st.backend->log(to_backend_level(level), message);
    }
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    const auto& st = instance();
    return st.initialized.load() && level != log_level::off &&
           static_cast<int>(level) >= static_cast<int>(st.min_level.load());
}

void logger_adapter::flush() {
    auto& st = instance();
    std::lock_guard lock(st.mutex);
    if (st.backend) {
        st.backend->flush();
    }
}

// =============================================================================
// Association Audit Trail
// =============================================================================

void logger_adapter::log_association_established(const std::string& calling_ae,
                                                 const std::string& called_ae,
                                                 const std::string& remote_address) {
    info("Association established: {} -> {} ({})", calling_ae, called_ae, remote_address);
    audit(audit_event::association_established, true,
          {{"calling_ae", calling_ae}, {"called_ae", called_ae},
           {"remote_address", remote_address}});
}

void logger_adapter::log_association_rejected(const std::string& calling_ae,
                                              const std::string& called_ae,
                                              const std::string& reason) {
    warn("Association rejected: {} -> {}: {}", calling_ae, called_ae, reason);
    audit(audit_event::association_rejected, false,
          {{"calling_ae", calling_ae}, {"called_ae", called_ae}, {"reason", reason}});
}

void logger_adapter::log_association_released(const std::string& calling_ae,
                                              const std::string& called_ae) {
    info("Association released: {} -> {}", calling_ae, called_ae);
    audit(audit_event::association_released, true,
          {{"calling_ae", calling_ae}, {"called_ae", called_ae}});
}

void logger_adapter::log_association_aborted(const std::string& calling_ae,
                                             const std::string& called_ae,
                                             const std::string& state,
                                             const std::string& reason) {
    warn("Association aborted in {}: {} -> {}: {}", state, calling_ae, called_ae, reason);
    audit(audit_event::association_aborted, false,
          {{"calling_ae", calling_ae}, {"called_ae", called_ae}, {"state", state},
           {"reason", reason}});
}

void logger_adapter::log_protocol_error(const std::string& remote_address,
                                        const std::string& state,
                                        const std::string& detail) {
    error("Protocol error from {} in {}: {}", remote_address, state, detail);
    audit(audit_event::protocol_error, false,
          {{"remote_address", remote_address}, {"state", state}, {"detail", detail}});
}

auto logger_adapter::audit_count(audit_event event) noexcept -> std::uint64_t {
    return instance().audit_counts[static_cast<std::size_t>(event)].load();
}

void logger_adapter::audit(audit_event event, bool success,
                           const std::map<std::string, std::string>& fields) {
    auto& st = instance();
    if (!st.initialized.load()) {
        return;
    }
    st.audit_counts[static_cast<std::size_t>(event)].fetch_add(1);

    std::filesystem::path path;
    {
        std::lock_guard lock(st.mutex);
        path = st.audit_path;
    }
    if (path.empty()) {
        return;
    }

    nlohmann::ordered_json record;
    record["timestamp"] = utc_timestamp();
    record["event"] = std::string(to_string(event));
    record["outcome"] = success ? "success" : "failure";
    for (const auto& [key, value] : fields) {
        record[key] = value;
    }

    std::lock_guard lock(st.audit_mutex);
    std::ofstream file(path, std::ios::app);
    if (!file) {
        return;
    }
    file << record.dump() << '\n';
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    auto& st = instance();
    std::lock_guard lock(st.mutex);
    st.min_level = level;
    st.config.min_level = level;
    if (st.backend) {
        st.backend->set_min_level(to_backend_level(level));
    }
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return instance().min_level.load();
}

auto logger_adapter::get_config() -> const logger_config& {
    return instance().config;
}

}  // namespace dicom_ul::integration
