/**
 * @file uid_registry.cpp
 * @brief Implementation of the immutable UID registry
 */

#include "dicom_ul/registry/uid_registry.hpp"

#include <algorithm>
#include <array>

namespace dicom_ul::registry {

namespace {

constexpr std::string_view dicom_root = "1.2.840.10008";

constexpr std::array<std::string_view, 4> presentation_state_classes = {
    "1.2.840.10008.5.1.4.1.1.11.4",  // Blending Softcopy PS
    "1.2.840.10008.5.1.4.1.1.11.2",  // Color Softcopy PS
    "1.2.840.10008.5.1.4.1.1.11.1",  // Grayscale Softcopy PS
    "1.2.840.10008.5.1.4.1.1.11.3",  // Pseudo-Color Softcopy PS
};

constexpr std::array<std::string_view, 10> structured_report_classes = {
    "1.2.840.10008.5.1.4.1.1.88.2",   // Audio SR Trial (Retired)
    "1.2.840.10008.5.1.4.1.1.88.11",  // Basic Text SR
    "1.2.840.10008.5.1.4.1.1.88.65",  // Chest CAD SR
    "1.2.840.10008.5.1.4.1.1.88.33",  // Comprehensive SR
    "1.2.840.10008.5.1.4.1.1.88.4",   // Comprehensive SR Trial (Retired)
    "1.2.840.10008.5.1.4.1.1.88.3",   // Detail SR Trial (Retired)
    "1.2.840.10008.5.1.4.1.1.88.22",  // Enhanced SR
    "1.2.840.10008.5.1.4.1.1.88.50",  // Mammography CAD SR
    "1.2.840.10008.5.1.4.1.1.88.1",   // Text SR Trial (Retired)
    "1.2.840.10008.5.1.4.1.1.88.67",  // X-Ray Radiation Dose SR
};

constexpr std::array<std::string_view, 7> waveform_classes = {
    "1.2.840.10008.5.1.4.1.1.9.1.3",  // Ambulatory ECG
    "1.2.840.10008.5.1.4.1.1.9.4.1",  // Basic Voice Audio
    "1.2.840.10008.5.1.4.1.1.9.3.1",  // Cardiac Electrophysiology
    "1.2.840.10008.5.1.4.1.1.9.1.2",  // General ECG
    "1.2.840.10008.5.1.4.1.1.9.2.1",  // Hemodynamic
    "1.2.840.10008.5.1.4.1.1.9.1.1",  // 12-lead ECG
    "1.2.840.10008.5.1.4.1.1.9",      // Waveform Storage Trial (Retired)
};

constexpr std::array<std::string_view, 2> document_classes = {
    "1.2.840.10008.5.1.4.1.1.104.2",  // Encapsulated CDA
    "1.2.840.10008.5.1.4.1.1.104.1",  // Encapsulated PDF
};

constexpr std::string_view raw_data_storage = "1.2.840.10008.5.1.4.1.1.66";

template <std::size_t N>
bool is_one_of(const std::array<std::string_view, N>& table, std::string_view uid) {
    return std::find(table.begin(), table.end(), uid) != table.end();
}

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

std::string_view trim_uid(std::string_view uid) noexcept {
    while (!uid.empty() && (uid.back() == ' ' || uid.back() == '\0')) {
        uid.remove_suffix(1);
    }
    return uid;
}

std::string_view to_string(uid_type type) noexcept {
    switch (type) {
        case uid_type::transfer_syntax: return "Transfer Syntax";
        case uid_type::sop_class: return "SOP Class";
        case uid_type::meta_sop_class: return "Meta SOP Class";
        case uid_type::service_class: return "Service Class";
        case uid_type::sop_instance: return "Well-known SOP Instance";
        case uid_type::application_context_name: return "Application Context Name";
        case uid_type::application_hosting_model: return "Application Hosting Model";
        case uid_type::coding_scheme: return "Coding Scheme";
        case uid_type::frame_of_reference: return "Well-known Frame of Reference";
        case uid_type::ldap: return "LDAP OID";
        case uid_type::mapping_resource: return "Mapping Resource";
        case uid_type::context_group_name: return "Context Group Name";
        case uid_type::unknown: return "Unknown";
    }
    return "Unknown";
}

std::string_view to_string(storage_category category) noexcept {
    switch (category) {
        case storage_category::none: return "None";
        case storage_category::image: return "Image";
        case storage_category::presentation_state: return "PresentationState";
        case storage_category::structured_report: return "StructuredReport";
        case storage_category::waveform: return "Waveform";
        case storage_category::document: return "Document";
        case storage_category::raw: return "Raw";
        case storage_category::other: return "Other";
        case storage_category::private_class: return "Private";
        case storage_category::volume: return "Volume";
    }
    return "None";
}

std::string uid_descriptor::to_string() const {
    return name + " [" + uid + "]";
}

// ============================================================================
// uid_registry
// ============================================================================

uid_descriptor uid_registry::lookup(std::string_view uid) const {
    const auto trimmed = trim_uid(uid);
    auto it = index_.find(std::string(trimmed));
    if (it != index_.end()) {
        return entries_[it->second];
    }

    uid_descriptor synthesized;
    synthesized.uid = std::string(trimmed);
    synthesized.name = "Unknown";
    synthesized.type = uid_type::unknown;
    return synthesized;
}

bool uid_registry::contains(std::string_view uid) const {
    return index_.find(std::string(trim_uid(uid))) != index_.end();
}

bool uid_registry::is_valid(std::string_view uid) noexcept {
    if (uid.empty()) {
        return false;
    }
    return std::all_of(uid.begin(), uid.end(), [](char c) {
        return c == '.' || (c >= '0' && c <= '9');
    });
}

storage_category uid_registry::category_of(const uid_descriptor& descriptor) {
    const std::string_view uid = descriptor.uid;

    if (descriptor.type == uid_type::sop_class && uid.substr(0, dicom_root.size()) != dicom_root) {
        return storage_category::private_class;
    }

    if (descriptor.type != uid_type::sop_class ||
        descriptor.name.find("Storage") == std::string::npos) {
        return storage_category::none;
    }

    if (descriptor.name.find("Image Storage") != std::string::npos) {
        return storage_category::image;
    }
    if (descriptor.name.find("Volume Storage") != std::string::npos) {
        return storage_category::volume;
    }
    if (is_one_of(presentation_state_classes, uid)) {
        return storage_category::presentation_state;
    }
    if (is_one_of(structured_report_classes, uid)) {
        return storage_category::structured_report;
    }
    if (is_one_of(waveform_classes, uid)) {
        return storage_category::waveform;
    }
    if (is_one_of(document_classes, uid)) {
        return storage_category::document;
    }
    if (uid == raw_data_storage) {
        return storage_category::raw;
    }
    return storage_category::other;
}

bool uid_registry::is_codec_supported(std::string_view transfer_syntax) noexcept {
    const auto ts = trim_uid(transfer_syntax);
    return ts == uids::implicit_vr_little_endian || ts == uids::explicit_vr_little_endian;
}

// ============================================================================
// uid_registry::builder
// ============================================================================

uid_registry::builder& uid_registry::builder::add(uid_descriptor descriptor) {
    descriptor.uid = std::string(trim_uid(descriptor.uid));
    pending_.push_back(std::move(descriptor));
    return *this;
}

uid_registry::builder& uid_registry::builder::add(std::string uid, std::string name,
                                                  uid_type type, bool retired) {
    uid_descriptor descriptor;
    descriptor.uid = std::move(uid);
    descriptor.name = std::move(name);
    descriptor.type = type;
    descriptor.retired = retired;
    return add(std::move(descriptor));
}

std::shared_ptr<const uid_registry> uid_registry::builder::build() const {
    // Private constructor: make_shared cannot reach it
    std::shared_ptr<uid_registry> registry(new uid_registry());
    registry->entries_.reserve(pending_.size());

    for (const auto& descriptor : pending_) {
        auto it = registry->index_.find(descriptor.uid);
        if (it != registry->index_.end()) {
            registry->entries_[it->second] = descriptor;
            continue;
        }
        registry->index_.emplace(descriptor.uid, registry->entries_.size());
        registry->entries_.push_back(descriptor);
    }

    return registry;
}

}  // namespace dicom_ul::registry
