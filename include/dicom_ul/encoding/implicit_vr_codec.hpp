/**
 * @file implicit_vr_codec.hpp
 * @brief Encoder/decoder for Implicit VR Little Endian transfer syntax
 *
 * DIMSE command sets are always carried in this encoding; data sets use it
 * when the presentation context negotiated 1.2.840.10008.1.2.
 *
 * @see DICOM PS3.5 Section 7.1.1 - Implicit VR Little Endian Transfer Syntax
 */

#ifndef DICOM_UL_ENCODING_IMPLICIT_VR_CODEC_HPP
#define DICOM_UL_ENCODING_IMPLICIT_VR_CODEC_HPP

#include <dicom_ul/core/dicom_dataset.hpp>
#include <dicom_ul/core/dicom_element.hpp>
#include <dicom_ul/core/result.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace dicom_ul::encoding {

/**
 * @brief Encoder/decoder for Implicit VR Little Endian transfer syntax
 *
 * Implicit VR encoding format:
 * ┌───────────┬───────────┬───────────┬───────┐
 * │ Group     │ Element   │ Length    │ Value │
 * │ (2 bytes) │ (2 bytes) │ (4 bytes) │       │
 * └───────────┴───────────┴───────────┴───────┘
 *
 * The VR is not on the wire. Command group tags and a small set of common
 * query keys resolve to their dictionary VR; everything else decodes as UN,
 * except undefined-length values which can only be sequences.
 */
class implicit_vr_codec {
public:
    template <typename T>
    using result = dicom_ul::Result<T>;

    [[nodiscard]] static std::vector<uint8_t> encode(
        const core::dicom_dataset& dataset);

    [[nodiscard]] static result<core::dicom_dataset> decode(
        std::span<const uint8_t> data);

    [[nodiscard]] static std::vector<uint8_t> encode_element(
        const core::dicom_element& element);

    /**
     * @brief Decode a single element from bytes
     *
     * The span reference is advanced past the decoded element.
     */
    [[nodiscard]] static result<core::dicom_element> decode_element(
        std::span<const uint8_t>& data);

    /**
     * @brief VR assumed for a tag when decoding implicit data
     */
    [[nodiscard]] static vr_type implicit_vr_for(core::dicom_tag tag) noexcept;

private:
    static void append_element(std::vector<uint8_t>& buffer,
                               const core::dicom_element& element);

    static result<core::dicom_dataset> decode_dataset(
        std::span<const uint8_t> data, int depth);

    static result<core::dicom_element> decode_element_at(
        std::span<const uint8_t>& data, int depth);

    static result<core::dicom_element> decode_sequence(
        core::dicom_tag tag, std::span<const uint8_t>& data,
        bool undefined_length, int depth);
};

}  // namespace dicom_ul::encoding

#endif  // DICOM_UL_ENCODING_IMPLICIT_VR_CODEC_HPP
