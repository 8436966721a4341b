/**
 * @file uid_registry.hpp
 * @brief Immutable registry of known DICOM unique identifiers
 *
 * The registry maps dotted UID strings to descriptors (name, type, retired
 * flag). It is built once, shared by pointer to every negotiator, and never
 * mutated afterwards, so concurrent lookups need no synchronization.
 *
 * @see DICOM PS3.6 Annex A - Registry of DICOM Unique Identifiers
 */

#ifndef DICOM_UL_REGISTRY_UID_REGISTRY_HPP
#define DICOM_UL_REGISTRY_UID_REGISTRY_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dicom_ul::registry {

/**
 * @brief Classification of a UID (PS3.6 Table A-1 "UID Type" column)
 */
enum class uid_type {
    transfer_syntax,
    sop_class,
    meta_sop_class,
    service_class,
    sop_instance,
    application_context_name,
    application_hosting_model,
    coding_scheme,
    frame_of_reference,
    ldap,
    mapping_resource,
    context_group_name,
    unknown
};

/**
 * @brief Storage category of a SOP class
 */
enum class storage_category {
    none,
    image,
    presentation_state,
    structured_report,
    waveform,
    document,
    raw,
    other,
    private_class,
    volume
};

[[nodiscard]] std::string_view to_string(uid_type type) noexcept;
[[nodiscard]] std::string_view to_string(storage_category category) noexcept;

/**
 * @brief Registered (or synthesized) description of one UID
 *
 * Two descriptors are equal when their UID strings are equal; name, type
 * and retired flag do not take part in identity.
 */
struct uid_descriptor {
    std::string uid;
    std::string name;
    uid_type type{uid_type::unknown};
    bool retired{false};

    /**
     * @brief Transfer syntax encoding flags, meaningful for transfer syntaxes
     */
    bool implicit_vr{false};
    bool little_endian{true};
    bool encapsulated{false};

    [[nodiscard]] bool is_unknown() const noexcept { return type == uid_type::unknown; }

    /// "Name [uid]"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const uid_descriptor& lhs, const uid_descriptor& rhs) noexcept {
        return lhs.uid == rhs.uid;
    }
};

/**
 * @brief Read-only lookup table of UID descriptors
 *
 * @example
 * @code
 * auto registry = uid_registry::builder{}.with_standard_uids().build();
 * auto desc = registry->lookup("1.2.840.10008.1.1");
 * // desc.name == "Verification SOP Class"
 * @endcode
 */
class uid_registry {
public:
    class builder;

    /**
     * @brief Look up a UID, synthesizing an "Unknown" descriptor on miss
     *
     * Trailing spaces and NUL padding are stripped first. Strings that fail
     * is_valid() are still synthesized; callers that need a strict check
     * combine lookup() with is_valid().
     */
    [[nodiscard]] uid_descriptor lookup(std::string_view uid) const;

    [[nodiscard]] bool contains(std::string_view uid) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// Registered descriptors in registration order
    [[nodiscard]] const std::vector<uid_descriptor>& entries() const noexcept {
        return entries_;
    }

    /**
     * @brief Character-class check: non-empty, digits and dots only
     */
    [[nodiscard]] static bool is_valid(std::string_view uid) noexcept;

    [[nodiscard]] static storage_category category_of(const uid_descriptor& descriptor);

    /**
     * @brief True for the uncompressed little endian syntaxes the data set
     *        codecs can read (Implicit and Explicit VR Little Endian)
     */
    [[nodiscard]] static bool is_codec_supported(std::string_view transfer_syntax) noexcept;

private:
    uid_registry() = default;

    std::vector<uid_descriptor> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

/**
 * @brief Accumulates descriptors and produces an immutable registry
 *
 * Later registrations of the same UID replace earlier ones, so private
 * definitions can override the standard table.
 */
class uid_registry::builder {
public:
    builder& with_standard_uids();

    builder& add(uid_descriptor descriptor);

    builder& add(std::string uid, std::string name, uid_type type, bool retired = false);

    [[nodiscard]] std::shared_ptr<const uid_registry> build() const;

private:
    std::vector<uid_descriptor> pending_;
};

/**
 * @brief Remove trailing space and NUL padding from a UID value
 */
[[nodiscard]] std::string_view trim_uid(std::string_view uid) noexcept;

/// Well-known UIDs referenced directly by the protocol engine
namespace uids {
inline constexpr std::string_view application_context = "1.2.840.10008.3.1.1.1";
inline constexpr std::string_view implicit_vr_little_endian = "1.2.840.10008.1.2";
inline constexpr std::string_view explicit_vr_little_endian = "1.2.840.10008.1.2.1";
inline constexpr std::string_view explicit_vr_big_endian = "1.2.840.10008.1.2.2";
inline constexpr std::string_view verification = "1.2.840.10008.1.1";
inline constexpr std::string_view patient_root_find = "1.2.840.10008.5.1.4.1.2.1.1";
inline constexpr std::string_view patient_root_move = "1.2.840.10008.5.1.4.1.2.1.2";
inline constexpr std::string_view patient_root_get = "1.2.840.10008.5.1.4.1.2.1.3";
inline constexpr std::string_view study_root_find = "1.2.840.10008.5.1.4.1.2.2.1";
inline constexpr std::string_view study_root_move = "1.2.840.10008.5.1.4.1.2.2.2";
inline constexpr std::string_view study_root_get = "1.2.840.10008.5.1.4.1.2.2.3";
inline constexpr std::string_view ct_image_storage = "1.2.840.10008.5.1.4.1.1.2";
inline constexpr std::string_view mr_image_storage = "1.2.840.10008.5.1.4.1.1.4";
inline constexpr std::string_view secondary_capture_storage = "1.2.840.10008.5.1.4.1.1.7";
}  // namespace uids

}  // namespace dicom_ul::registry

#endif  // DICOM_UL_REGISTRY_UID_REGISTRY_HPP
