/**
 * @file standard_uids.cpp
 * @brief Standard UID table loaded by uid_registry::builder::with_standard_uids()
 *
 * Subset of DICOM PS3.6 Annex A covering the identifiers exchanged during
 * association negotiation: transfer syntaxes, the application context,
 * verification, storage, query/retrieve and the normalized services.
 */

#include "dicom_ul/registry/uid_registry.hpp"

#include <array>

namespace dicom_ul::registry {

namespace {

/**
 * @brief Registry entry for a Transfer Syntax
 */
struct ts_entry {
    std::string_view uid;
    std::string_view name;
    bool implicit_vr;
    bool little_endian;
    bool encapsulated;
    bool retired;
};

constexpr std::array<ts_entry, 13> transfer_syntaxes = {{
    {"1.2.840.10008.1.2", "Implicit VR Little Endian", true, true, false, false},
    {"1.2.840.10008.1.2.1", "Explicit VR Little Endian", false, true, false, false},
    {"1.2.840.10008.1.2.1.99", "Deflated Explicit VR Little Endian", false, true, false, false},
    {"1.2.840.10008.1.2.2", "Explicit VR Big Endian", false, false, false, true},
    {"1.2.840.10008.1.2.4.50", "JPEG Baseline (Process 1)", false, true, true, false},
    {"1.2.840.10008.1.2.4.51", "JPEG Extended (Process 2 & 4)", false, true, true, false},
    {"1.2.840.10008.1.2.4.57", "JPEG Lossless, Non-Hierarchical (Process 14)", false, true, true, false},
    {"1.2.840.10008.1.2.4.70", "JPEG Lossless, Non-Hierarchical, First-Order Prediction", false, true, true, false},
    {"1.2.840.10008.1.2.4.80", "JPEG-LS Lossless Image Compression", false, true, true, false},
    {"1.2.840.10008.1.2.4.81", "JPEG-LS Lossy (Near-Lossless) Image Compression", false, true, true, false},
    {"1.2.840.10008.1.2.4.90", "JPEG 2000 Image Compression (Lossless Only)", false, true, true, false},
    {"1.2.840.10008.1.2.4.91", "JPEG 2000 Image Compression", false, true, true, false},
    {"1.2.840.10008.1.2.5", "RLE Lossless", false, true, true, false},
}};

struct uid_entry {
    std::string_view uid;
    std::string_view name;
    uid_type type;
    bool retired;
};

constexpr std::array uid_table = {
    // Application context and verification
    uid_entry{"1.2.840.10008.3.1.1.1", "DICOM Application Context Name", uid_type::application_context_name, false},
    uid_entry{"1.2.840.10008.1.1", "Verification SOP Class", uid_type::sop_class, false},

    // Storage commitment and procedure step
    uid_entry{"1.2.840.10008.1.20.1", "Storage Commitment Push Model SOP Class", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.1.20.1.1", "Storage Commitment Push Model SOP Instance", uid_type::sop_instance, false},
    uid_entry{"1.2.840.10008.3.1.2.3.3", "Modality Performed Procedure Step SOP Class", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.1.9", "Basic Grayscale Print Management Meta SOP Class", uid_type::meta_sop_class, false},
    uid_entry{"1.2.840.10008.4.2", "Storage Service Class", uid_type::service_class, false},

    // Image storage
    uid_entry{"1.2.840.10008.5.1.4.1.1.1", "Computed Radiography Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.1.1", "Digital X-Ray Image Storage - For Presentation", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.1.2", "Digital Mammography X-Ray Image Storage - For Presentation", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.2", "CT Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.2.1", "Enhanced CT Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.3.1", "Ultrasound Multi-frame Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.4", "MR Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.4.1", "Enhanced MR Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.6.1", "Ultrasound Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.7", "Secondary Capture Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.12.1", "X-Ray Angiographic Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.20", "Nuclear Medicine Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.128", "Positron Emission Tomography Image Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.481.1", "RT Image Storage", uid_type::sop_class, false},

    // Presentation states
    uid_entry{"1.2.840.10008.5.1.4.1.1.11.1", "Grayscale Softcopy Presentation State Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.11.2", "Color Softcopy Presentation State Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.11.3", "Pseudo-Color Softcopy Presentation State Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.11.4", "Blending Softcopy Presentation State Storage", uid_type::sop_class, false},

    // Structured reports
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.1", "Text SR Storage - Trial", uid_type::sop_class, true},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.2", "Audio SR Storage - Trial", uid_type::sop_class, true},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.3", "Detail SR Storage - Trial", uid_type::sop_class, true},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.4", "Comprehensive SR Storage - Trial", uid_type::sop_class, true},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.11", "Basic Text SR Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.22", "Enhanced SR Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.33", "Comprehensive SR Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.50", "Mammography CAD SR Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.59", "Key Object Selection Document Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.65", "Chest CAD SR Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.88.67", "X-Ray Radiation Dose SR Storage", uid_type::sop_class, false},

    // Waveforms
    uid_entry{"1.2.840.10008.5.1.4.1.1.9", "Waveform Storage - Trial", uid_type::sop_class, true},
    uid_entry{"1.2.840.10008.5.1.4.1.1.9.1.1", "12-lead ECG Waveform Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.9.1.2", "General ECG Waveform Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.9.1.3", "Ambulatory ECG Waveform Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.9.2.1", "Hemodynamic Waveform Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.9.3.1", "Cardiac Electrophysiology Waveform Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.9.4.1", "Basic Voice Audio Waveform Storage", uid_type::sop_class, false},

    // Documents, raw data and other non-image storage
    uid_entry{"1.2.840.10008.5.1.4.1.1.104.1", "Encapsulated PDF Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.104.2", "Encapsulated CDA Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.66", "Raw Data Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.66.1", "Spatial Registration Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.481.2", "RT Dose Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.481.3", "RT Structure Set Storage", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.1.481.5", "RT Plan Storage", uid_type::sop_class, false},

    // Query/Retrieve
    uid_entry{"1.2.840.10008.5.1.4.1.2.1.1", "Patient Root Query/Retrieve Information Model - FIND", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.2.1.2", "Patient Root Query/Retrieve Information Model - MOVE", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.2.1.3", "Patient Root Query/Retrieve Information Model - GET", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.2.2.1", "Study Root Query/Retrieve Information Model - FIND", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.2.2.2", "Study Root Query/Retrieve Information Model - MOVE", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.2.2.3", "Study Root Query/Retrieve Information Model - GET", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.2.3.1", "Patient/Study Only Query/Retrieve Information Model - FIND", uid_type::sop_class, true},
    uid_entry{"1.2.840.10008.5.1.4.1.2.3.2", "Patient/Study Only Query/Retrieve Information Model - MOVE", uid_type::sop_class, true},
    uid_entry{"1.2.840.10008.5.1.4.1.2.3.3", "Patient/Study Only Query/Retrieve Information Model - GET", uid_type::sop_class, true},
    uid_entry{"1.2.840.10008.5.1.4.1.2.4.2", "Composite Instance Root Retrieve - MOVE", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.1.2.4.3", "Composite Instance Root Retrieve - GET", uid_type::sop_class, false},
    uid_entry{"1.2.840.10008.5.1.4.31", "Modality Worklist Information Model - FIND", uid_type::sop_class, false},

    // Miscellaneous well-known identifiers
    uid_entry{"1.2.840.10008.2.16.4", "DICOM Controlled Terminology", uid_type::coding_scheme, false},
    uid_entry{"1.2.840.10008.1.4.1.1", "Talairach Brain Atlas Frame of Reference", uid_type::frame_of_reference, false},
    uid_entry{"1.2.840.10008.7.1.1", "Native DICOM Model", uid_type::application_hosting_model, false},
    uid_entry{"1.2.840.10008.8.1.1", "DICOM Content Mapping Resource", uid_type::mapping_resource, false},
    uid_entry{"1.2.840.10008.15.0.3.1", "dicomDeviceName", uid_type::ldap, false},
    uid_entry{"1.2.840.10008.6.1.1", "Anatomic Modifier (2)", uid_type::context_group_name, false},
};

}  // namespace

uid_registry::builder& uid_registry::builder::with_standard_uids() {
    for (const auto& ts : transfer_syntaxes) {
        uid_descriptor descriptor;
        descriptor.uid = std::string(ts.uid);
        descriptor.name = std::string(ts.name);
        descriptor.type = uid_type::transfer_syntax;
        descriptor.retired = ts.retired;
        descriptor.implicit_vr = ts.implicit_vr;
        descriptor.little_endian = ts.little_endian;
        descriptor.encapsulated = ts.encapsulated;
        add(std::move(descriptor));
    }

    for (const auto& entry : uid_table) {
        add(std::string(entry.uid), std::string(entry.name), entry.type, entry.retired);
    }

    return *this;
}

}  // namespace dicom_ul::registry
