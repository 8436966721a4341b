#ifndef DICOM_UL_NETWORK_PDU_ENCODER_HPP
#define DICOM_UL_NETWORK_PDU_ENCODER_HPP

#include "pdu_types.hpp"

#include <dicom_ul/core/result.hpp>

#include <cstdint>
#include <vector>

namespace dicom_ul::network {

/**
 * @brief Encoder for DICOM PDU (Protocol Data Unit) messages.
 *
 * PDU Structure:
 * @code
 * ┌─────────────────────────────────────┐
 * │ PDU Header                          │
 * ├───────────┬───────────┬─────────────┤
 * │ Type      │ Reserved  │ Length      │
 * │ (1 byte)  │ (1 byte)  │ (4 bytes)   │
 * └───────────┴───────────┴─────────────┘
 * │ PDU Data (variable)                 │
 * └─────────────────────────────────────┘
 * @endcode
 *
 * Every length field is back-patched from the bytes actually written, so
 * the declared length always matches the emitted body. Items carry a 2-byte
 * length; validate() reports association PDUs with an item too large for it,
 * which encoding would otherwise truncate.
 *
 * @see DICOM PS3.8 Section 9 - Upper Layer Protocol
 */
class pdu_encoder {
public:
    /**
     * @brief Encodes any PDU held in the variant.
     */
    [[nodiscard]] static std::vector<uint8_t> encode(const pdu& value);

    /// @name Association PDUs
    /// @{

    /// @see DICOM PS3.8 Section 9.3.2
    [[nodiscard]] static std::vector<uint8_t> encode_associate_rq(
        const associate_rq& rq);

    /// @see DICOM PS3.8 Section 9.3.3
    [[nodiscard]] static std::vector<uint8_t> encode_associate_ac(
        const associate_ac& ac);

    /// @see DICOM PS3.8 Section 9.3.4
    [[nodiscard]] static std::vector<uint8_t> encode_associate_rj(
        const associate_rj& rj);

    /**
     * @brief Checks that every item fits its 2-byte length field
     * @return pdu_too_large naming the first item that does not
     */
    [[nodiscard]] static VoidResult validate(const associate_rq& rq);

    /// @copydoc validate(const associate_rq&)
    [[nodiscard]] static VoidResult validate(const associate_ac& ac);

    /// @}

    /// @name Release and Abort PDUs
    /// @{

    /**
     * @brief Encodes an A-RELEASE-RQ PDU.
     * @return Encoded PDU bytes (always 10 bytes)
     */
    [[nodiscard]] static std::vector<uint8_t> encode_release_rq();

    /**
     * @brief Encodes an A-RELEASE-RP PDU.
     * @return Encoded PDU bytes (always 10 bytes)
     */
    [[nodiscard]] static std::vector<uint8_t> encode_release_rp();

    /**
     * @brief Encodes an A-ABORT PDU.
     * @param source Abort source (0=UL service-user, 2=UL service-provider)
     * @param reason Abort reason (only meaningful when source=2)
     */
    [[nodiscard]] static std::vector<uint8_t> encode_abort(
        abort_source source, abort_reason reason);

    /// @}

    /**
     * @brief Encodes a P-DATA-TF PDU.
     *
     * Each PDV item is written as:
     * - 4-byte item length (context ID + control header + data)
     * - 1-byte Presentation Context ID
     * - 1-byte Message Control Header
     * - Fragment bytes
     *
     * @see DICOM PS3.8 Section 9.3.5
     */
    [[nodiscard]] static std::vector<uint8_t> encode_p_data_tf(
        const std::vector<presentation_data_value>& pdvs);
};

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_PDU_ENCODER_HPP
