/**
 * @file dicom_tag.hpp
 * @brief (group, element) attribute tag
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace dicom_ul::core {

/**
 * @brief Attribute tag packed as (group << 16) | element.
 *
 * Comparing the packed value orders by group and then element, which is
 * the order elements are written in.
 */
class dicom_tag {
public:
    constexpr dicom_tag() noexcept = default;

    constexpr dicom_tag(uint16_t group, uint16_t element) noexcept
        : value_{(static_cast<uint32_t>(group) << 16) | element} {}

    explicit constexpr dicom_tag(uint32_t packed) noexcept : value_{packed} {}

    [[nodiscard]] constexpr auto group() const noexcept -> uint16_t {
        return static_cast<uint16_t>(value_ >> 16);
    }
    [[nodiscard]] constexpr auto element() const noexcept -> uint16_t {
        return static_cast<uint16_t>(value_);
    }
    [[nodiscard]] constexpr auto combined() const noexcept -> uint32_t { return value_; }

    /// (gggg,0000)
    [[nodiscard]] constexpr auto is_group_length() const noexcept -> bool {
        return element() == 0;
    }

    /// Command set fields live in group 0000.
    [[nodiscard]] constexpr auto is_command() const noexcept -> bool { return group() == 0; }

    /// Item and delimitation tags (FFFE,xxxx).
    [[nodiscard]] constexpr auto is_item_delimiter_group() const noexcept -> bool {
        return group() == 0xFFFE;
    }

    /// "(GGGG,EEEE)", upper-case hex
    [[nodiscard]] auto to_string() const -> std::string;

    constexpr auto operator<=>(const dicom_tag&) const noexcept = default;

private:
    uint32_t value_{0};
};

}  // namespace dicom_ul::core
