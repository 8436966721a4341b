/**
 * @file explicit_vr_codec.hpp
 * @brief Encoder/decoder for Explicit VR Little Endian transfer syntax
 *
 * @see DICOM PS3.5 Section 7.1.2 - Explicit VR Little Endian Transfer Syntax
 */

#ifndef DICOM_UL_ENCODING_EXPLICIT_VR_CODEC_HPP
#define DICOM_UL_ENCODING_EXPLICIT_VR_CODEC_HPP

#include <dicom_ul/core/dicom_dataset.hpp>
#include <dicom_ul/core/dicom_element.hpp>
#include <dicom_ul/core/result.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace dicom_ul::encoding {

/**
 * @brief Encoder/decoder for Explicit VR Little Endian transfer syntax
 *
 * Standard format (most VRs):
 * ┌──────────┬──────────┬──────┬──────────┬───────┐
 * │ Group(2) │ Elem(2)  │ VR(2)│ Len(2)   │ Value │
 * └──────────┴──────────┴──────┴──────────┴───────┘
 *
 * Extended format (OB, OD, OF, OL, OV, OW, SQ, SV, UC, UN, UR, UT, UV):
 * ┌──────────┬──────────┬──────┬──────────┬──────────┬───────┐
 * │ Group(2) │ Elem(2)  │ VR(2)│ Rsv(2)   │ Len(4)   │ Value │
 * └──────────┴──────────┴──────┴──────────┴──────────┴───────┘
 *
 * Sequences are written with undefined length and defined-length items.
 * Undefined lengths are only accepted on SQ elements.
 */
class explicit_vr_codec {
public:
    template <typename T>
    using result = dicom_ul::Result<T>;

    [[nodiscard]] static std::vector<uint8_t> encode(
        const core::dicom_dataset& dataset);

    [[nodiscard]] static result<core::dicom_dataset> decode(
        std::span<const uint8_t> data);

    [[nodiscard]] static std::vector<uint8_t> encode_element(
        const core::dicom_element& element);

    [[nodiscard]] static result<core::dicom_element> decode_element(
        std::span<const uint8_t>& data);

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

#endif  // DICOM_UL_ENCODING_EXPLICIT_VR_CODEC_HPP
