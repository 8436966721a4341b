/**
 * @file command_field.hpp
 * @brief DIMSE command field enumeration
 *
 * @see DICOM PS3.7 Section 9.3 - DIMSE-C Service and Protocol
 * @see DICOM PS3.7 Section 10.3 - DIMSE-N Service and Protocol
 */

#ifndef DICOM_UL_NETWORK_DIMSE_COMMAND_FIELD_HPP
#define DICOM_UL_NETWORK_DIMSE_COMMAND_FIELD_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dicom_ul::network::dimse {

/**
 * @brief Values of the Command Field (0000,0100)
 *
 * A response carries the request value with bit 15 set. C-CANCEL has no
 * response.
 */
enum class command_field : uint16_t {
    c_store_rq = 0x0001,
    c_store_rsp = 0x8001,
    c_get_rq = 0x0010,
    c_get_rsp = 0x8010,
    c_find_rq = 0x0020,
    c_find_rsp = 0x8020,
    c_move_rq = 0x0021,
    c_move_rsp = 0x8021,
    c_echo_rq = 0x0030,
    c_echo_rsp = 0x8030,
    c_cancel_rq = 0x0FFF,

    n_event_report_rq = 0x0100,
    n_event_report_rsp = 0x8100,
    n_get_rq = 0x0110,
    n_get_rsp = 0x8110,
    n_set_rq = 0x0120,
    n_set_rsp = 0x8120,
    n_action_rq = 0x0130,
    n_action_rsp = 0x8130,
    n_create_rq = 0x0140,
    n_create_rsp = 0x8140,
    n_delete_rq = 0x0150,
    n_delete_rsp = 0x8150,
};

/// @name Command Field Utilities
/// @{

[[nodiscard]] constexpr bool is_request(command_field cmd) noexcept {
    return (static_cast<uint16_t>(cmd) & 0x8000) == 0;
}

[[nodiscard]] constexpr bool is_response(command_field cmd) noexcept {
    return (static_cast<uint16_t>(cmd) & 0x8000) != 0;
}

[[nodiscard]] constexpr bool is_dimse_n(command_field cmd) noexcept {
    const auto value = static_cast<uint16_t>(cmd) & 0x7FFF;
    return value >= 0x0100 && value <= 0x0150;
}

namespace detail {

struct command_name {
    command_field command;
    std::string_view name;
};

inline constexpr std::array<command_name, 23> command_names{{
    {command_field::c_store_rq, "C-STORE-RQ"}, {command_field::c_store_rsp, "C-STORE-RSP"},
    {command_field::c_get_rq, "C-GET-RQ"}, {command_field::c_get_rsp, "C-GET-RSP"},
    {command_field::c_find_rq, "C-FIND-RQ"}, {command_field::c_find_rsp, "C-FIND-RSP"},
    {command_field::c_move_rq, "C-MOVE-RQ"}, {command_field::c_move_rsp, "C-MOVE-RSP"},
    {command_field::c_echo_rq, "C-ECHO-RQ"}, {command_field::c_echo_rsp, "C-ECHO-RSP"},
    {command_field::c_cancel_rq, "C-CANCEL-RQ"},
    {command_field::n_event_report_rq, "N-EVENT-REPORT-RQ"},
    {command_field::n_event_report_rsp, "N-EVENT-REPORT-RSP"},
    {command_field::n_get_rq, "N-GET-RQ"}, {command_field::n_get_rsp, "N-GET-RSP"},
    {command_field::n_set_rq, "N-SET-RQ"}, {command_field::n_set_rsp, "N-SET-RSP"},
    {command_field::n_action_rq, "N-ACTION-RQ"}, {command_field::n_action_rsp, "N-ACTION-RSP"},
    {command_field::n_create_rq, "N-CREATE-RQ"}, {command_field::n_create_rsp, "N-CREATE-RSP"},
    {command_field::n_delete_rq, "N-DELETE-RQ"}, {command_field::n_delete_rsp, "N-DELETE-RSP"},
}};

}  // namespace detail

/**
 * @brief Map a raw Command Field value onto the enumeration
 * @return std::nullopt for values PS3.7 does not define
 */
[[nodiscard]] constexpr std::optional<command_field> to_command_field(uint16_t value) noexcept {
    for (const auto& entry : detail::command_names) {
        if (static_cast<uint16_t>(entry.command) == value) {
            return entry.command;
        }
    }
    return std::nullopt;
}

/**
 * @brief Response command for a request
 * @note C-CANCEL-RQ has no response; the result is not a defined command
 */
[[nodiscard]] constexpr command_field get_response_command(command_field request) noexcept {
    return static_cast<command_field>(static_cast<uint16_t>(request) | 0x8000);
}

[[nodiscard]] constexpr command_field get_request_command(command_field response) noexcept {
    return static_cast<command_field>(static_cast<uint16_t>(response) & 0x7FFF);
}

[[nodiscard]] constexpr std::string_view to_string(command_field cmd) noexcept {
    for (const auto& entry : detail::command_names) {
        if (entry.command == cmd) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

/// @}

}  // namespace dicom_ul::network::dimse

#endif  // DICOM_UL_NETWORK_DIMSE_COMMAND_FIELD_HPP
