/**
 * @file dimse_service.hpp
 * @brief Closed set of DIMSE services a capability set can provide
 *
 * @see DICOM PS3.7 Section 9 - DIMSE-C
 * @see DICOM PS3.7 Section 10 - DIMSE-N
 */

#ifndef DICOM_UL_SERVICES_DIMSE_SERVICE_HPP
#define DICOM_UL_SERVICES_DIMSE_SERVICE_HPP

#include <dicom_ul/network/dimse/command_field.hpp>
#include <dicom_ul/network/dimse/status_codes.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace dicom_ul::services {

/**
 * @brief The service invoked by a request
 *
 * Every switch over this enumeration is exhaustive and has no default, so
 * adding a service makes the compiler point at each place to update.
 */
enum class dimse_service {
    c_echo,
    c_store,
    c_find,
    c_get,
    c_move,
    n_event_report,
    n_get,
    n_set,
    n_action,
    n_create,
    n_delete,
};

constexpr std::size_t dimse_service_count = 11;

constexpr std::array<dimse_service, dimse_service_count> all_dimse_services{
    dimse_service::c_echo,   dimse_service::c_store,        dimse_service::c_find,
    dimse_service::c_get,    dimse_service::c_move,         dimse_service::n_event_report,
    dimse_service::n_get,    dimse_service::n_set,          dimse_service::n_action,
    dimse_service::n_create, dimse_service::n_delete,
};

[[nodiscard]] constexpr std::string_view to_string(dimse_service service) noexcept {
    switch (service) {
        case dimse_service::c_echo: return "C-ECHO";
        case dimse_service::c_store: return "C-STORE";
        case dimse_service::c_find: return "C-FIND";
        case dimse_service::c_get: return "C-GET";
        case dimse_service::c_move: return "C-MOVE";
        case dimse_service::n_event_report: return "N-EVENT-REPORT";
        case dimse_service::n_get: return "N-GET";
        case dimse_service::n_set: return "N-SET";
        case dimse_service::n_action: return "N-ACTION";
        case dimse_service::n_create: return "N-CREATE";
        case dimse_service::n_delete: return "N-DELETE";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr network::dimse::command_field request_command(
    dimse_service service) noexcept {
    using network::dimse::command_field;
    switch (service) {
        case dimse_service::c_echo: return command_field::c_echo_rq;
        case dimse_service::c_store: return command_field::c_store_rq;
        case dimse_service::c_find: return command_field::c_find_rq;
        case dimse_service::c_get: return command_field::c_get_rq;
        case dimse_service::c_move: return command_field::c_move_rq;
        case dimse_service::n_event_report: return command_field::n_event_report_rq;
        case dimse_service::n_get: return command_field::n_get_rq;
        case dimse_service::n_set: return command_field::n_set_rq;
        case dimse_service::n_action: return command_field::n_action_rq;
        case dimse_service::n_create: return command_field::n_create_rq;
        case dimse_service::n_delete: return command_field::n_delete_rq;
    }
    return command_field::c_echo_rq;
}

/**
 * @brief Service invoked by a request command
 * @return std::nullopt for responses, C-CANCEL and undefined values
 */
[[nodiscard]] constexpr std::optional<dimse_service> service_for(
    network::dimse::command_field cmd) noexcept {
    for (auto service : all_dimse_services) {
        if (request_command(service) == cmd) {
            return service;
        }
    }
    return std::nullopt;
}

/**
 * @brief Status of the terminal response sent when the provider fails
 */
[[nodiscard]] constexpr network::dimse::status_code failure_status(
    dimse_service service) noexcept {
    namespace dimse = network::dimse;
    switch (service) {
        case dimse_service::c_echo: return dimse::status_error_processing_failure;
        case dimse_service::c_store: return dimse::status_error_cannot_understand;
        case dimse_service::c_find: return dimse::status_error_unable_to_process;
        case dimse_service::c_get: return dimse::status_error_unable_to_process;
        case dimse_service::c_move: return dimse::status_error_unable_to_process;
        case dimse_service::n_event_report: return dimse::status_error_processing_failure;
        case dimse_service::n_get: return dimse::status_error_processing_failure;
        case dimse_service::n_set: return dimse::status_error_processing_failure;
        case dimse_service::n_action: return dimse::status_error_processing_failure;
        case dimse_service::n_create: return dimse::status_error_processing_failure;
        case dimse_service::n_delete: return dimse::status_error_processing_failure;
    }
    return dimse::status_error_processing_failure;
}

/**
 * @brief Services that may answer with pending responses and honour C-CANCEL
 */
[[nodiscard]] constexpr bool is_multi_response(dimse_service service) noexcept {
    switch (service) {
        case dimse_service::c_find:
        case dimse_service::c_get:
        case dimse_service::c_move:
            return true;
        case dimse_service::c_echo:
        case dimse_service::c_store:
        case dimse_service::n_event_report:
        case dimse_service::n_get:
        case dimse_service::n_set:
        case dimse_service::n_action:
        case dimse_service::n_create:
        case dimse_service::n_delete:
            return false;
    }
    return false;
}

}  // namespace dicom_ul::services

#endif  // DICOM_UL_SERVICES_DIMSE_SERVICE_HPP
