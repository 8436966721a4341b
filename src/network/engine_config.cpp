/**
 * @file engine_config.cpp
 * @brief JSON and environment loading for engine_config
 */

#include "dicom_ul/network/engine_config.hpp"

#include <dicom_ul/registry/uid_registry.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace dicom_ul::network {

namespace {

constexpr const char* config_module = "config";

VoidResult invalid_value(const std::string& field, const std::string& detail) {
    return make_ul_void_error(error_codes::config_invalid_value,
                              field + ": " + detail, config_module);
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

Result<uint64_t> parse_unsigned(const std::string& name, const std::string& text) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return make_ul_error<uint64_t>(error_codes::config_invalid_value,
            name + ": expected a non-negative integer, got '" + text + "'", config_module);
    }
    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return make_ul_error<uint64_t>(error_codes::config_invalid_value,
            name + ": value out of range", config_module);
    }
}

Result<bool> parse_bool(const std::string& name, const std::string& text) {
    if (text == "1" || text == "true" || text == "TRUE") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE") {
        return false;
    }
    return make_ul_error<bool>(error_codes::config_invalid_value,
        name + ": expected a boolean, got '" + text + "'", config_module);
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto first = item.find_first_not_of(' ');
        const auto last = item.find_last_not_of(' ');
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
    }
    return items;
}

}  // namespace

// =============================================================================
// engine_config
// =============================================================================

VoidResult engine_config::validate() const {
    if (ae_title.empty() || ae_title.size() > AE_TITLE_LENGTH) {
        return invalid_value("ae_title", "must be 1-16 characters");
    }
    for (const auto& title : ae_whitelist) {
        if (title.empty() || title.size() > AE_TITLE_LENGTH) {
            return invalid_value("ae_whitelist", "entry '" + title + "' must be 1-16 characters");
        }
    }
    if (max_pdu_length != UNLIMITED_MAX_PDU_LENGTH && max_pdu_length < MIN_MAX_PDU_LENGTH) {
        return invalid_value("max_pdu_length",
            "must be 0 or at least " + std::to_string(MIN_MAX_PDU_LENGTH));
    }
    if (max_incoming_pdu_length != 0 && max_incoming_pdu_length < MIN_MAX_PDU_LENGTH) {
        return invalid_value("max_incoming_pdu_length",
            "must be 0 or at least " + std::to_string(MIN_MAX_PDU_LENGTH));
    }
    if (artim_timeout.count() <= 0) {
        return invalid_value("artim_timeout", "must be positive");
    }
    if (idle_timeout.count() < 0) {
        return invalid_value("idle_timeout", "must not be negative");
    }
    if (implementation_class_uid.empty() || implementation_class_uid.size() > 64 ||
        !registry::uid_registry::is_valid(implementation_class_uid)) {
        return invalid_value("implementation_class_uid", "must be a valid UID");
    }
    if (implementation_version_name.size() > AE_TITLE_LENGTH) {
        return invalid_value("implementation_version_name", "must be at most 16 characters");
    }
    if (read_buffer_size == 0) {
        return invalid_value("read_buffer_size", "must be positive");
    }
    return ok();
}

bool engine_config::is_calling_ae_allowed(const std::string& calling_ae) const {
    if (ae_whitelist.empty() || accept_unknown_calling_ae) {
        return true;
    }
    return std::find(ae_whitelist.begin(), ae_whitelist.end(), calling_ae) !=
           ae_whitelist.end();
}

// =============================================================================
// Loading
// =============================================================================

Result<engine_config> load_engine_config(const std::string& file_path) {
    if (!std::filesystem::exists(file_path)) {
        return make_ul_error<engine_config>(error_codes::config_file_error,
            "Configuration file does not exist: " + file_path, config_module);
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_ul_error<engine_config>(error_codes::config_file_error,
            "Failed to open configuration file: " + file_path, config_module);
    }

    engine_config config;
    try {
        json config_json;
        file >> config_json;

        if (config_json.contains("engine")) {
            const auto& engine = config_json["engine"];

            if (engine.contains("aeTitle")) {
                config.ae_title = engine["aeTitle"].get<std::string>();
            }
            if (engine.contains("maxPduLength")) {
                config.max_pdu_length = engine["maxPduLength"].get<uint32_t>();
            }
            if (engine.contains("maxIncomingPduLength")) {
                config.max_incoming_pdu_length = engine["maxIncomingPduLength"].get<uint32_t>();
            }
            if (engine.contains("artimTimeoutSeconds")) {
                config.artim_timeout = std::chrono::seconds{engine["artimTimeoutSeconds"].get<int>()};
            }
            if (engine.contains("idleTimeoutSeconds")) {
                config.idle_timeout = std::chrono::seconds{engine["idleTimeoutSeconds"].get<int>()};
            }
            if (engine.contains("implementationClassUid")) {
                config.implementation_class_uid = engine["implementationClassUid"].get<std::string>();
            }
            if (engine.contains("implementationVersionName")) {
                config.implementation_version_name =
                    engine["implementationVersionName"].get<std::string>();
            }
            if (engine.contains("allowedCallingAeTitles") &&
                engine["allowedCallingAeTitles"].is_array()) {
                config.ae_whitelist.clear();
                for (const auto& item : engine["allowedCallingAeTitles"]) {
                    config.ae_whitelist.push_back(item.get<std::string>());
                }
            }
            if (engine.contains("acceptUnknownCallingAe")) {
                config.accept_unknown_calling_ae = engine["acceptUnknownCallingAe"].get<bool>();
            }
            if (engine.contains("readBufferSize")) {
                config.read_buffer_size = engine["readBufferSize"].get<std::size_t>();
            }
        }
    } catch (const json::exception& ex) {
        return make_ul_error<engine_config>(error_codes::config_parse_error,
            "JSON parsing error: " + std::string(ex.what()), config_module);
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return valid.error();
    }
    return config;
}

VoidResult apply_environment_overrides(engine_config& config, const std::string& prefix) {
    engine_config updated = config;

    auto apply_unsigned = [&](const char* field, auto& target) -> VoidResult {
        if (auto value = get_env(prefix + field)) {
            auto parsed = parse_unsigned(prefix + field, *value);
            if (parsed.is_err()) {
                return parsed.error();
            }
            target = static_cast<std::remove_reference_t<decltype(target)>>(parsed.value());
        }
        return ok();
    };

    if (auto value = get_env(prefix + "AE_TITLE")) {
        updated.ae_title = *value;
    }
    if (auto status = apply_unsigned("MAX_PDU_LENGTH", updated.max_pdu_length);
        status.is_err()) {
        return status;
    }
    if (auto status = apply_unsigned("MAX_INCOMING_PDU_LENGTH", updated.max_incoming_pdu_length);
        status.is_err()) {
        return status;
    }
    if (auto status = apply_unsigned("READ_BUFFER_SIZE", updated.read_buffer_size);
        status.is_err()) {
        return status;
    }

    if (auto value = get_env(prefix + "ARTIM_TIMEOUT")) {
        auto parsed = parse_unsigned(prefix + "ARTIM_TIMEOUT", *value);
        if (parsed.is_err()) {
            return parsed.error();
        }
        updated.artim_timeout = std::chrono::seconds{static_cast<int64_t>(parsed.value())};
    }
    if (auto value = get_env(prefix + "IDLE_TIMEOUT")) {
        auto parsed = parse_unsigned(prefix + "IDLE_TIMEOUT", *value);
        if (parsed.is_err()) {
            return parsed.error();
        }
        updated.idle_timeout = std::chrono::seconds{static_cast<int64_t>(parsed.value())};
    }
    if (auto value = get_env(prefix + "IMPLEMENTATION_CLASS_UID")) {
        updated.implementation_class_uid = *value;
    }
    if (auto value = get_env(prefix + "IMPLEMENTATION_VERSION_NAME")) {
        updated.implementation_version_name = *value;
    }
    if (auto value = get_env(prefix + "ALLOWED_CALLING_AE")) {
        updated.ae_whitelist = split_list(*value);
    }
    if (auto value = get_env(prefix + "ACCEPT_UNKNOWN_CALLING_AE")) {
        auto parsed = parse_bool(prefix + "ACCEPT_UNKNOWN_CALLING_AE", *value);
        if (parsed.is_err()) {
            return parsed.error();
        }
        updated.accept_unknown_calling_ae = parsed.value();
    }

    if (auto valid = updated.validate(); valid.is_err()) {
        return valid;
    }

    config = std::move(updated);
    return ok();
}

}  // namespace dicom_ul::network
