#ifndef DICOM_UL_ENCODING_VR_TYPE_HPP
#define DICOM_UL_ENCODING_VR_TYPE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dicom_ul::encoding {

/**
 * @brief DICOM Value Representation (VR) types.
 *
 * The enumerator value is the two ASCII characters of the VR code packed
 * big-endian into a uint16_t ("UI" -> 0x5549), which is also how the code
 * appears on the wire in Explicit VR encodings.
 *
 * @see DICOM PS3.5 Section 6.2
 */
enum class vr_type : uint16_t {
    AE = 0x4145, AS = 0x4153, AT = 0x4154, CS = 0x4353,
    DA = 0x4441, DS = 0x4453, DT = 0x4454, FD = 0x4644,
    FL = 0x464C, IS = 0x4953, LO = 0x4C4F, LT = 0x4C54,
    OB = 0x4F42, OD = 0x4F44, OF = 0x4F46, OL = 0x4F4C,
    OV = 0x4F56, OW = 0x4F57, PN = 0x504E, SH = 0x5348,
    SL = 0x534C, SQ = 0x5351, SS = 0x5353, ST = 0x5354,
    SV = 0x5356, TM = 0x544D, UC = 0x5543, UI = 0x5549,
    UL = 0x554C, UN = 0x554E, UR = 0x5552, US = 0x5553,
    UT = 0x5554, UV = 0x5556,
};

namespace detail {

inline constexpr std::array<vr_type, 34> all_vrs = {
    vr_type::AE, vr_type::AS, vr_type::AT, vr_type::CS, vr_type::DA,
    vr_type::DS, vr_type::DT, vr_type::FD, vr_type::FL, vr_type::IS,
    vr_type::LO, vr_type::LT, vr_type::OB, vr_type::OD, vr_type::OF,
    vr_type::OL, vr_type::OV, vr_type::OW, vr_type::PN, vr_type::SH,
    vr_type::SL, vr_type::SQ, vr_type::SS, vr_type::ST, vr_type::SV,
    vr_type::TM, vr_type::UC, vr_type::UI, vr_type::UL, vr_type::UN,
    vr_type::UR, vr_type::US, vr_type::UT, vr_type::UV,
};

}  // namespace detail

/**
 * @brief Decode a VR from its two wire bytes.
 * @return The VR, or std::nullopt for an unrecognized code
 */
[[nodiscard]] constexpr std::optional<vr_type> vr_from_bytes(uint8_t first,
                                                             uint8_t second) noexcept {
    const auto code = static_cast<uint16_t>((static_cast<uint16_t>(first) << 8) | second);
    for (const auto vr : detail::all_vrs) {
        if (static_cast<uint16_t>(vr) == code) {
            return vr;
        }
    }
    return std::nullopt;
}

/**
 * @brief Two-character code of a VR ("PN", "US", ...)
 */
[[nodiscard]] constexpr std::array<char, 2> vr_code(vr_type vr) noexcept {
    const auto value = static_cast<uint16_t>(vr);
    return {static_cast<char>(value >> 8), static_cast<char>(value & 0xFF)};
}

/**
 * @brief Checks if a VR carries character data.
 */
[[nodiscard]] constexpr bool is_string_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: case vr_type::AS: case vr_type::CS:
        case vr_type::DA: case vr_type::DS: case vr_type::DT:
        case vr_type::IS: case vr_type::LO: case vr_type::LT:
        case vr_type::PN: case vr_type::SH: case vr_type::ST:
        case vr_type::TM: case vr_type::UC: case vr_type::UI:
        case vr_type::UR: case vr_type::UT:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Checks if a VR uses the reserved-bytes + 32-bit length form
 *        in Explicit VR encoding.
 *
 * @see DICOM PS3.5 Section 7.1.2
 */
[[nodiscard]] constexpr bool has_explicit_32bit_length(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::OB: case vr_type::OD: case vr_type::OF:
        case vr_type::OL: case vr_type::OV: case vr_type::OW:
        case vr_type::SQ: case vr_type::SV: case vr_type::UC:
        case vr_type::UN: case vr_type::UR: case vr_type::UT:
        case vr_type::UV:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Padding byte used to bring a value to even length.
 *
 * UI values are padded with NUL, other character VRs with a space.
 */
[[nodiscard]] constexpr char padding_char(vr_type vr) noexcept {
    if (vr == vr_type::UI) {
        return '\0';
    }
    return is_string_vr(vr) ? ' ' : '\0';
}

}  // namespace dicom_ul::encoding

#endif  // DICOM_UL_ENCODING_VR_TYPE_HPP
