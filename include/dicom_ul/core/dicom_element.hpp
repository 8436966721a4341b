/**
 * @file dicom_element.hpp
 * @brief Tag, VR and value of one data element
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include "dicom_tag.hpp"
#include "result.hpp"

#include <dicom_ul/encoding/vr_type.hpp>

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dicom_ul::core {

class dicom_dataset;

template <typename T>
concept element_number = std::is_arithmetic_v<T>;

/**
 * @brief One element of a command set or data set.
 *
 * Values are kept as the little-endian bytes that go on the wire. SQ
 * elements hold their items as nested datasets and no value bytes.
 */
class dicom_element {
public:
    dicom_element(dicom_tag tag, encoding::vr_type vr) noexcept;
    dicom_element(dicom_tag tag, encoding::vr_type vr, std::span<const uint8_t> bytes);

    // Out of line because dicom_dataset is incomplete here
    dicom_element(const dicom_element&);
    dicom_element(dicom_element&&) noexcept;
    auto operator=(const dicom_element&) -> dicom_element&;
    auto operator=(dicom_element&&) noexcept -> dicom_element&;
    ~dicom_element();

    /// Text value, padded to even length with the VR's padding character.
    [[nodiscard]] static auto from_string(dicom_tag tag, encoding::vr_type vr,
                                          std::string_view text) -> dicom_element;

    template <element_number T>
    [[nodiscard]] static auto from_numeric(dicom_tag tag, encoding::vr_type vr,
                                           T number) -> dicom_element {
        dicom_element elem{tag, vr};
        elem.set_numeric(number);
        return elem;
    }

    [[nodiscard]] auto tag() const noexcept -> dicom_tag { return tag_; }
    [[nodiscard]] auto vr() const noexcept -> encoding::vr_type { return vr_; }
    [[nodiscard]] auto raw_data() const noexcept -> std::span<const uint8_t> { return bytes_; }
    [[nodiscard]] auto length() const noexcept -> uint32_t {
        return static_cast<uint32_t>(bytes_.size());
    }

    /// Value text without its trailing space or NUL padding.
    [[nodiscard]] auto as_string() const -> std::string;

    /// Fails with data_size_mismatch when the value is shorter than T.
    template <element_number T>
    [[nodiscard]] auto as_numeric() const -> Result<T>;

    void set_string(std::string_view text);

    template <element_number T>
    void set_numeric(T number) {
        bytes_.resize(sizeof(T));
        std::memcpy(bytes_.data(), &number, sizeof(T));
    }

    [[nodiscard]] auto is_sequence() const noexcept -> bool {
        return vr_ == encoding::vr_type::SQ;
    }
    [[nodiscard]] auto sequence_items() -> std::vector<dicom_dataset>&;
    [[nodiscard]] auto sequence_items() const -> const std::vector<dicom_dataset>&;

    [[nodiscard]] auto operator==(const dicom_element& other) const -> bool;

private:
    dicom_tag tag_;
    encoding::vr_type vr_;
    std::vector<uint8_t> bytes_;
    std::vector<dicom_dataset> items_;
};

template <element_number T>
auto dicom_element::as_numeric() const -> Result<T> {
    if (bytes_.size() < sizeof(T)) {
        return make_ul_error<T>(error_codes::data_size_mismatch,
                                tag_.to_string() + " holds " +
                                    std::to_string(bytes_.size()) + " bytes, " +
                                    std::to_string(sizeof(T)) + " needed",
                                "core");
    }
    T number{};
    std::memcpy(&number, bytes_.data(), sizeof(T));
    return number;
}

}  // namespace dicom_ul::core
