#ifndef DICOM_UL_NETWORK_PDU_DECODER_HPP
#define DICOM_UL_NETWORK_PDU_DECODER_HPP

#include "pdu_types.hpp"

#include <dicom_ul/core/result.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace dicom_ul::network {

/// Result type alias for PDU decoding operations
template<typename T>
using DecodeResult = dicom_ul::Result<T>;

/**
 * @brief Strict decoder for DICOM Upper Layer PDUs.
 *
 * decode() expects exactly one PDU: the buffer must hold the 6-byte header
 * and precisely the number of body bytes the header declares. Any
 * truncation, overrun, unknown item or illegal title byte is reported as an
 * error; the decoder never reads past the declared body.
 *
 * Error codes (dicom_ul::error_codes):
 * - incomplete_pdu: fewer bytes than the header declares
 * - pdu_too_large: declared length above the configured maximum
 * - invalid_pdu_type: unknown PDU type byte
 * - malformed_pdu: length mismatch or inconsistent item structure
 * - invalid_item_type: item type not allowed at that position
 * - invalid_ae_title: AE title containing non-printable bytes
 * - invalid_protocol_version: protocol version bit 0 not set
 *
 * @see DICOM PS3.8 Section 9 - Upper Layer Protocol
 */
class pdu_decoder {
public:
    /**
     * @brief Decode one complete PDU.
     * @param data Exactly one PDU (header + body)
     * @param max_pdu_length Largest accepted body length, 0 for no limit
     */
    [[nodiscard]] static DecodeResult<pdu> decode(std::span<const uint8_t> data,
                                                  uint32_t max_pdu_length = 0);

    /**
     * @brief Total PDU length (header + body) announced by a buffer prefix.
     * @return std::nullopt while fewer than 6 bytes are available
     *
     * Lets a stream reader learn how many bytes to wait for before calling
     * decode().
     */
    [[nodiscard]] static std::optional<size_t> pdu_length(
        std::span<const uint8_t> data);

    /**
     * @brief Get the PDU type from buffer without full decoding.
     */
    [[nodiscard]] static std::optional<pdu_type> peek_pdu_type(
        std::span<const uint8_t> data);

private:
    [[nodiscard]] static DecodeResult<associate_rq> decode_associate_rq(
        std::span<const uint8_t> body);

    [[nodiscard]] static DecodeResult<associate_ac> decode_associate_ac(
        std::span<const uint8_t> body);

    [[nodiscard]] static DecodeResult<associate_rj> decode_associate_rj(
        std::span<const uint8_t> body);

    [[nodiscard]] static DecodeResult<p_data_tf_pdu> decode_p_data_tf(
        std::span<const uint8_t> body);

    [[nodiscard]] static DecodeResult<abort_pdu> decode_abort(
        std::span<const uint8_t> body);

    [[nodiscard]] static DecodeResult<presentation_context_rq> decode_presentation_context_rq(
        std::span<const uint8_t> item);

    [[nodiscard]] static DecodeResult<presentation_context_ac> decode_presentation_context_ac(
        std::span<const uint8_t> item);

    [[nodiscard]] static DecodeResult<user_information> decode_user_info_item(
        std::span<const uint8_t> item);

    /**
     * @brief Read an AE Title (16 bytes), trimming space and NUL padding.
     */
    [[nodiscard]] static DecodeResult<std::string> read_ae_title(
        std::span<const uint8_t> data, size_t offset);

    /**
     * @brief Read a UID string, trimming trailing NUL/space padding.
     */
    [[nodiscard]] static std::string read_uid(std::span<const uint8_t> data);
};

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_PDU_DECODER_HPP
