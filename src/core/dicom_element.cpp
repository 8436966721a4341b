/**
 * @file dicom_element.cpp
 */

#include <dicom_ul/core/dicom_element.hpp>
#include <dicom_ul/core/dicom_dataset.hpp>

namespace dicom_ul::core {

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr) noexcept
    : tag_{tag}, vr_{vr} {}

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr,
                             std::span<const uint8_t> bytes)
    : tag_{tag}, vr_{vr}, bytes_(bytes.begin(), bytes.end()) {}

dicom_element::dicom_element(const dicom_element&) = default;
dicom_element::dicom_element(dicom_element&&) noexcept = default;
auto dicom_element::operator=(const dicom_element&) -> dicom_element& = default;
auto dicom_element::operator=(dicom_element&&) noexcept -> dicom_element& = default;
dicom_element::~dicom_element() = default;

auto dicom_element::from_string(dicom_tag tag, encoding::vr_type vr,
                                std::string_view text) -> dicom_element {
    dicom_element elem{tag, vr};
    elem.set_string(text);
    return elem;
}

auto dicom_element::as_string() const -> std::string {
    auto end = bytes_.size();
    while (end > 0 && (bytes_[end - 1] == ' ' || bytes_[end - 1] == '\0')) {
        --end;
    }
    return {bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(end)};
}

void dicom_element::set_string(std::string_view text) {
    bytes_.assign(text.begin(), text.end());
    if (bytes_.size() % 2 == 1) {
        bytes_.push_back(static_cast<uint8_t>(encoding::padding_char(vr_)));
    }
}

auto dicom_element::sequence_items() -> std::vector<dicom_dataset>& { return items_; }

auto dicom_element::sequence_items() const -> const std::vector<dicom_dataset>& {
    return items_;
}

auto dicom_element::operator==(const dicom_element& other) const -> bool {
    return tag_ == other.tag_ && vr_ == other.vr_ && bytes_ == other.bytes_ &&
           items_ == other.items_;
}

}  // namespace dicom_ul::core
