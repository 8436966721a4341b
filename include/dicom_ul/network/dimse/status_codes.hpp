/**
 * @file status_codes.hpp
 * @brief DIMSE status codes and their classification
 *
 * @see DICOM PS3.7 Annex C - Status Type Encoding
 */

#ifndef DICOM_UL_NETWORK_DIMSE_STATUS_CODES_HPP
#define DICOM_UL_NETWORK_DIMSE_STATUS_CODES_HPP

#include <cstdint>
#include <string_view>

namespace dicom_ul::network::dimse {

using status_code = uint16_t;

/// @name General Status Codes
/// @{

constexpr status_code status_success = 0x0000;

/// More results follow
constexpr status_code status_pending = 0xFF00;

/// More results follow; optional keys were not supported
constexpr status_code status_pending_warning = 0xFF01;

constexpr status_code status_cancel = 0xFE00;

/// @}

/// @name Failure Status Codes
/// @{

constexpr status_code status_refused_out_of_resources = 0xA700;
constexpr status_code status_refused_move_destination_unknown = 0xA801;
constexpr status_code status_refused_sop_class_not_supported = 0x0122;
constexpr status_code status_error_cannot_understand = 0xC000;
constexpr status_code status_error_unable_to_process = 0xC001;
constexpr status_code status_error_no_such_sop_class = 0x0118;
constexpr status_code status_error_unrecognized_operation = 0x0211;

/// Generic DIMSE-N failure, also used for C-ECHO
constexpr status_code status_error_processing_failure = 0x0110;

/// @}

/// @name Warning Status Codes (0xBxxx)
/// @{

constexpr status_code status_warning_coercion = 0xB000;
constexpr status_code status_warning_elements_discarded = 0xB006;
constexpr status_code status_warning_dataset_mismatch = 0xB007;

/// @}

/**
 * @brief Status type per PS3.7 Annex C
 */
enum class status_class { success, pending, cancel, warning, failure };

[[nodiscard]] constexpr bool is_pending(status_code status) noexcept {
    return status == status_pending || status == status_pending_warning;
}

[[nodiscard]] constexpr bool is_warning(status_code status) noexcept {
    const auto high_nibble = (status & 0xF000) >> 12;
    return high_nibble == 0xB || status == 0x0001 || status == 0x0107 ||
           status == 0x0116;
}

/**
 * @brief Classify a status code
 *
 * Anything that is not success, pending, cancel or warning is a failure,
 * including codes this library has no name for.
 */
[[nodiscard]] constexpr status_class classify(status_code status) noexcept {
    if (status == status_success) return status_class::success;
    if (is_pending(status)) return status_class::pending;
    if (status == status_cancel) return status_class::cancel;
    if (is_warning(status)) return status_class::warning;
    return status_class::failure;
}

[[nodiscard]] constexpr bool is_success(status_code status) noexcept {
    return classify(status) == status_class::success;
}

[[nodiscard]] constexpr bool is_failure(status_code status) noexcept {
    return classify(status) == status_class::failure;
}

/**
 * @brief A terminal status ends a response sequence
 */
[[nodiscard]] constexpr bool is_final(status_code status) noexcept {
    return !is_pending(status);
}

[[nodiscard]] constexpr std::string_view to_string(status_class value) noexcept {
    switch (value) {
        case status_class::success: return "Success";
        case status_class::pending: return "Pending";
        case status_class::cancel: return "Cancel";
        case status_class::warning: return "Warning";
        case status_class::failure: return "Failure";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view status_description(status_code status) noexcept {
    switch (status) {
        case status_success: return "Success";
        case status_pending: return "Pending";
        case status_pending_warning: return "Pending (Warning)";
        case status_cancel: return "Canceled";
        case status_refused_out_of_resources: return "Refused: Out of resources";
        case status_refused_move_destination_unknown:
            return "Refused: Move destination unknown";
        case status_refused_sop_class_not_supported:
            return "Refused: SOP class not supported";
        case status_error_cannot_understand: return "Error: Cannot understand";
        case status_error_unable_to_process: return "Error: Unable to process";
        case status_error_no_such_sop_class: return "Error: No such SOP class";
        case status_error_unrecognized_operation: return "Error: Unrecognized operation";
        case status_error_processing_failure: return "Error: Processing failure";
        case status_warning_coercion: return "Warning: Coercion of data elements";
        case status_warning_elements_discarded: return "Warning: Elements discarded";
        case status_warning_dataset_mismatch:
            return "Warning: Data set does not match SOP class";
        default:
            return to_string(classify(status));
    }
}

}  // namespace dicom_ul::network::dimse

#endif  // DICOM_UL_NETWORK_DIMSE_STATUS_CODES_HPP
