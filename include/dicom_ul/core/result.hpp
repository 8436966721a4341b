/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the DICOM UL engine
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for dicom_ul, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace dicom_ul {

/**
 * @brief Result type alias for dicom_ul operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief dicom_ul error codes
 *
 * Error code range: -700 to -899
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int ul_base = -700;

    // Data set errors (-720 to -739)
    constexpr int element_not_found = ul_base - 20;
    constexpr int value_conversion_error = ul_base - 21;
    constexpr int data_size_mismatch = ul_base - 24;

    // Encoding/Decoding errors (-740 to -759)
    constexpr int decode_error = ul_base - 40;
    constexpr int encode_error = ul_base - 41;
    constexpr int invalid_tag_encoding = ul_base - 44;
    constexpr int invalid_length_encoding = ul_base - 45;
    constexpr int insufficient_data = ul_base - 46;
    constexpr int invalid_sequence = ul_base - 47;
    constexpr int unsupported_transfer_syntax = ul_base - 48;

    // Association errors (-760 to -763)
    constexpr int association_rejected = ul_base - 60;
    constexpr int association_aborted = ul_base - 61;
    constexpr int dimse_error = ul_base - 62;
    constexpr int association_released = ul_base - 63;

    // Transport errors (-764 to -769)
    constexpr int connection_closed = ul_base - 64;
    constexpr int connection_timeout = ul_base - 65;
    constexpr int send_failed = ul_base - 66;
    constexpr int receive_failed = ul_base - 67;
    constexpr int receive_timeout = ul_base - 68;

    // Association state errors (-770 to -774)
    constexpr int invalid_association_state = ul_base - 70;
    constexpr int negotiation_failed = ul_base - 71;
    constexpr int no_acceptable_context = ul_base - 72;
    constexpr int invalid_presentation_context_id = ul_base - 73;
    constexpr int unexpected_pdu = ul_base - 74;

    // PDU framing errors (-775 to -785)
    constexpr int pdu_encoding_error = ul_base - 75;
    constexpr int pdu_decoding_error = ul_base - 76;
    constexpr int incomplete_pdu = ul_base - 77;
    constexpr int invalid_pdu_type = ul_base - 78;
    constexpr int malformed_pdu = ul_base - 79;
    constexpr int pdu_too_large = ul_base - 80;
    constexpr int invalid_item_type = ul_base - 81;
    constexpr int invalid_ae_title = ul_base - 82;
    constexpr int invalid_protocol_version = ul_base - 83;

    // Timer errors (-790 to -794)
    constexpr int artim_timeout = ul_base - 90;
    constexpr int idle_timeout = ul_base - 91;

    // Configuration errors (-795 to -799)
    constexpr int config_file_error = ul_base - 95;
    constexpr int config_parse_error = ul_base - 96;
    constexpr int config_invalid_value = ul_base - 97;

    // Service errors (-800 to -819)
    constexpr int service_base = -800;
    constexpr int service_not_registered = service_base - 0;
    constexpr int service_processing_failed = service_base - 1;
    constexpr int stream_closed = service_base - 2;
    constexpr int stream_missing_terminal = service_base - 3;
    constexpr int unknown_command = service_base - 4;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an error result tagged with a module name
 * @tparam T The result value type
 * @param code Error code from dicom_ul::error_codes
 * @param message Error message
 * @param module Module reporting the error ("network", "encoding", ...)
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> make_ul_error(int code, const std::string& message,
                               const std::string& module = "dicom_ul") {
    return Result<T>(error_info{code, message, module});
}

/**
 * @brief Create a void error result tagged with a module name
 */
inline VoidResult make_ul_void_error(int code, const std::string& message,
                                     const std::string& module = "dicom_ul") {
    return VoidResult(error_info{code, message, module});
}

} // namespace dicom_ul

/**
 * @brief Return early if expression is an error
 */
#define DICOM_UL_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define DICOM_UL_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
