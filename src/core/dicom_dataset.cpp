/**
 * @file dicom_dataset.cpp
 */

#include <dicom_ul/core/dicom_dataset.hpp>

namespace dicom_ul::core {

auto dicom_dataset::get(dicom_tag tag) noexcept -> dicom_element* {
    const auto found = elements_.find(tag);
    return found == elements_.end() ? nullptr : &found->second;
}

auto dicom_dataset::get(dicom_tag tag) const noexcept -> const dicom_element* {
    const auto found = elements_.find(tag);
    return found == elements_.end() ? nullptr : &found->second;
}

auto dicom_dataset::get_string(dicom_tag tag, std::string_view fallback) const
    -> std::string {
    const auto* elem = get(tag);
    return elem != nullptr ? elem->as_string() : std::string{fallback};
}

void dicom_dataset::insert(dicom_element element) {
    const auto tag = element.tag();
    elements_.insert_or_assign(tag, std::move(element));
}

}  // namespace dicom_ul::core
