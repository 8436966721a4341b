/**
 * @file dicom_tag.cpp
 */

#include "dicom_ul/core/dicom_tag.hpp"

#include <string_view>

namespace dicom_ul::core {

auto dicom_tag::to_string() const -> std::string {
    constexpr std::string_view hex = "0123456789ABCDEF";
    std::string text(11, ',');
    text.front() = '(';
    text.back() = ')';
    for (int nibble = 0; nibble < 4; ++nibble) {
        const int shift = 12 - 4 * nibble;
        text[1 + nibble] = hex[(group() >> shift) & 0xF];
        text[6 + nibble] = hex[(element() >> shift) & 0xF];
    }
    return text;
}

}  // namespace dicom_ul::core
