/**
 * @file engine_config.hpp
 * @brief Configuration of one Upper Layer engine endpoint
 *
 * @see DICOM PS3.8 - Network Communication Support for Message Exchange
 */

#ifndef DICOM_UL_NETWORK_ENGINE_CONFIG_HPP
#define DICOM_UL_NETWORK_ENGINE_CONFIG_HPP

#include "dicom_ul/network/pdu_types.hpp"

#include <dicom_ul/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace dicom_ul::network {

/**
 * @brief Parameters shared by the acceptor and requester sides
 *
 * @example Usage
 * @code
 * auto loaded = load_engine_config("ul.json");
 * if (loaded.is_ok()) {
 *     auto config = loaded.value();
 *     apply_environment_overrides(config);
 * }
 * @endcode
 *
 * JSON layout (every key optional):
 * @code
 * {
 *   "engine": {
 *     "aeTitle": "MY_SCP",
 *     "maxPduLength": 16384,
 *     "maxIncomingPduLength": 4194304,
 *     "artimTimeoutSeconds": 30,
 *     "idleTimeoutSeconds": 300,
 *     "implementationClassUid": "1.2.826.0.1.3680043.2.1545.1",
 *     "implementationVersionName": "DICOM_UL_100",
 *     "allowedCallingAeTitles": ["MODALITY1"],
 *     "acceptUnknownCallingAe": false,
 *     "readBufferSize": 65536
 *   }
 * }
 * @endcode
 */
struct engine_config {
    /// Application Entity Title of this endpoint (16 chars max)
    std::string ae_title{"DICOM_UL"};

    /// Maximum P-DATA-TF length this endpoint advertises (0 = unlimited)
    uint32_t max_pdu_length{DEFAULT_MAX_PDU_LENGTH};

    /// Hard decoder limit for any inbound PDU body
    uint32_t max_incoming_pdu_length{4 * 1024 * 1024};

    /// Bound on RequestSent, WaitingForResponse and Releasing
    std::chrono::seconds artim_timeout{30};

    /// Maximum silence while established (0 = no timeout)
    std::chrono::seconds idle_timeout{300};

    std::string implementation_class_uid{"1.2.826.0.1.3680043.2.1545.1"};

    std::string implementation_version_name{"DICOM_UL_100"};

    /// Calling AE titles allowed to associate (empty = accept all)
    std::vector<std::string> ae_whitelist;

    /// Accept calling AE titles missing from a non-empty whitelist
    bool accept_unknown_calling_ae{false};

    /// Size of the transport read buffer
    std::size_t read_buffer_size{64 * 1024};

    engine_config() = default;

    explicit engine_config(std::string ae) : ae_title(std::move(ae)) {}

    /**
     * @brief Check value ranges
     * @return config_invalid_value naming the first offending field
     */
    [[nodiscard]] VoidResult validate() const;

    /**
     * @brief Whether a calling AE title passes the whitelist policy
     */
    [[nodiscard]] bool is_calling_ae_allowed(const std::string& calling_ae) const;
};

/**
 * @brief Load configuration from a JSON file over the defaults
 *
 * Errors: config_file_error (missing/unreadable), config_parse_error
 * (invalid JSON or wrong value type), config_invalid_value (range check).
 */
[[nodiscard]] Result<engine_config> load_engine_config(const std::string& file_path);

/**
 * @brief Overlay environment variables named <prefix><FIELD>
 *
 * Recognized fields: AE_TITLE, MAX_PDU_LENGTH, MAX_INCOMING_PDU_LENGTH,
 * ARTIM_TIMEOUT, IDLE_TIMEOUT, IMPLEMENTATION_CLASS_UID,
 * IMPLEMENTATION_VERSION_NAME, ALLOWED_CALLING_AE (comma separated),
 * ACCEPT_UNKNOWN_CALLING_AE, READ_BUFFER_SIZE.
 */
[[nodiscard]] VoidResult apply_environment_overrides(engine_config& config,
                                                     const std::string& prefix = "DICOM_UL_");

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_ENGINE_CONFIG_HPP
