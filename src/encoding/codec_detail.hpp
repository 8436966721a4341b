/**
 * @file codec_detail.hpp
 * @brief Little-endian helpers and delimiter tags shared by the VR codecs
 */

#ifndef DICOM_UL_ENCODING_CODEC_DETAIL_HPP
#define DICOM_UL_ENCODING_CODEC_DETAIL_HPP

#include <dicom_ul/core/dicom_tag.hpp>

#include <cstdint>
#include <vector>

namespace dicom_ul::encoding::detail {

constexpr uint16_t read_le16(const uint8_t* data) {
    return static_cast<uint16_t>(static_cast<uint16_t>(data[0]) |
                                 (static_cast<uint16_t>(data[1]) << 8));
}

constexpr uint32_t read_le32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

inline void write_le16(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

inline void write_le32(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

inline void write_tag(std::vector<uint8_t>& buffer, core::dicom_tag tag) {
    write_le16(buffer, tag.group());
    write_le16(buffer, tag.element());
}

constexpr core::dicom_tag item_tag{0xFFFE, 0xE000};
constexpr core::dicom_tag item_delimitation_tag{0xFFFE, 0xE00D};
constexpr core::dicom_tag sequence_delimitation_tag{0xFFFE, 0xE0DD};

constexpr uint32_t undefined_length = 0xFFFFFFFF;

/// Nesting limit for sequences decoded from untrusted input
constexpr int max_sequence_depth = 32;

}  // namespace dicom_ul::encoding::detail

#endif  // DICOM_UL_ENCODING_CODEC_DETAIL_HPP
