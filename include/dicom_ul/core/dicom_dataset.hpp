/**
 * @file dicom_dataset.hpp
 * @brief Tag-ordered element collection
 *
 * Holds DIMSE command sets (group 0000) as well as the data sets sent
 * after them. Not thread-safe.
 */

#pragma once

#include "dicom_element.hpp"
#include "dicom_tag.hpp"

#include <dicom_ul/encoding/vr_type.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace dicom_ul::core {

/**
 * @brief Elements keyed and iterated by tag.
 *
 * @code
 * dicom_dataset identifier;
 * identifier.set_string(dicom_tag{0x0008, 0x0052}, encoding::vr_type::CS, "STUDY");
 * auto level = identifier.get_string(dicom_tag{0x0008, 0x0052});
 * @endcode
 */
class dicom_dataset {
public:
    using storage_type = std::map<dicom_tag, dicom_element>;
    using iterator = storage_type::iterator;
    using const_iterator = storage_type::const_iterator;

    [[nodiscard]] auto contains(dicom_tag tag) const noexcept -> bool {
        return elements_.contains(tag);
    }

    /// nullptr when the tag is absent
    [[nodiscard]] auto get(dicom_tag tag) noexcept -> dicom_element*;
    [[nodiscard]] auto get(dicom_tag tag) const noexcept -> const dicom_element*;

    [[nodiscard]] auto get_string(dicom_tag tag, std::string_view fallback = "") const
        -> std::string;

    /// Empty when the tag is absent or its value is shorter than T.
    template <element_number T>
    [[nodiscard]] auto get_numeric(dicom_tag tag) const -> std::optional<T> {
        const auto* elem = get(tag);
        if (elem == nullptr) {
            return std::nullopt;
        }
        auto number = elem->as_numeric<T>();
        return number.is_ok() ? std::optional<T>{number.value()} : std::nullopt;
    }

    /// Replaces any element with the same tag.
    void insert(dicom_element element);

    void set_string(dicom_tag tag, encoding::vr_type vr, std::string_view text) {
        insert(dicom_element::from_string(tag, vr, text));
    }

    template <element_number T>
    void set_numeric(dicom_tag tag, encoding::vr_type vr, T number) {
        insert(dicom_element::from_numeric(tag, vr, number));
    }

    auto remove(dicom_tag tag) -> bool { return elements_.erase(tag) != 0; }
    void clear() noexcept { elements_.clear(); }

    [[nodiscard]] auto begin() noexcept -> iterator { return elements_.begin(); }
    [[nodiscard]] auto end() noexcept -> iterator { return elements_.end(); }
    [[nodiscard]] auto begin() const noexcept -> const_iterator { return elements_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return elements_.end(); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return elements_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return elements_.empty(); }

    [[nodiscard]] auto operator==(const dicom_dataset& other) const -> bool {
        return elements_ == other.elements_;
    }

private:
    storage_type elements_;
};

}  // namespace dicom_ul::core
