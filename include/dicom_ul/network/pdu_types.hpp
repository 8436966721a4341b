#ifndef DICOM_UL_NETWORK_PDU_TYPES_HPP
#define DICOM_UL_NETWORK_PDU_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace dicom_ul::network {

/**
 * @brief PDU (Protocol Data Unit) types as defined in DICOM PS3.8.
 *
 * These values represent the type field in PDU headers.
 */
enum class pdu_type : uint8_t {
    associate_rq = 0x01,  ///< A-ASSOCIATE-RQ (Association Request)
    associate_ac = 0x02,  ///< A-ASSOCIATE-AC (Association Accept)
    associate_rj = 0x03,  ///< A-ASSOCIATE-RJ (Association Reject)
    p_data_tf = 0x04,     ///< P-DATA-TF (Data Transfer)
    release_rq = 0x05,    ///< A-RELEASE-RQ (Release Request)
    release_rp = 0x06,    ///< A-RELEASE-RP (Release Response)
    abort = 0x07,         ///< A-ABORT (Abort)
};

/**
 * @brief Item types used in variable items of associate PDUs.
 */
enum class item_type : uint8_t {
    application_context = 0x10,
    presentation_context_rq = 0x20,
    presentation_context_ac = 0x21,
    abstract_syntax = 0x30,
    transfer_syntax = 0x40,
    user_information = 0x50,
    maximum_length = 0x51,
    implementation_class_uid = 0x52,
    async_operations_window = 0x53,
    scp_scu_role_selection = 0x54,
    implementation_version_name = 0x55,
};

/**
 * @brief Result values for A-ASSOCIATE-AC presentation context.
 */
enum class presentation_context_result : uint8_t {
    acceptance = 0,
    user_rejection = 1,
    no_reason = 2,  ///< Provider rejection, no reason
    abstract_syntax_not_supported = 3,
    transfer_syntaxes_not_supported = 4,
};

enum class abort_source : uint8_t {
    service_user = 0,
    reserved = 1,
    service_provider = 2,
};

/**
 * @brief Abort reason values when source is service-provider.
 */
enum class abort_reason : uint8_t {
    not_specified = 0,
    unrecognized_pdu = 1,
    unexpected_pdu = 2,
    reserved = 3,
    unrecognized_pdu_parameter = 4,
    unexpected_pdu_parameter = 5,
    invalid_pdu_parameter = 6,
};

enum class reject_result : uint8_t {
    rejected_permanent = 1,
    rejected_transient = 2,
};

enum class reject_source : uint8_t {
    service_user = 1,
    service_provider_acse = 2,
    service_provider_presentation = 3,
};

/**
 * @brief Reject reason values when source is service-user.
 */
enum class reject_reason_user : uint8_t {
    no_reason = 1,
    application_context_not_supported = 2,
    calling_ae_not_recognized = 3,
    called_ae_not_recognized = 7,
};

/**
 * @brief Reject reason values when source is service-provider (ACSE).
 */
enum class reject_reason_provider_acse : uint8_t {
    no_reason = 1,
    protocol_version_not_supported = 2,
};

/**
 * @brief Presentation Data Value (PDV) item for P-DATA-TF.
 *
 * Message control header: bit 0 set for command, bit 1 set for the last
 * fragment of the object.
 */
struct presentation_data_value {
    uint8_t context_id{0};       ///< Presentation Context ID (odd number 1-255)
    bool is_command{false};
    bool is_last{false};
    std::vector<uint8_t> data;

    presentation_data_value() = default;
    presentation_data_value(uint8_t id, bool command, bool last, std::vector<uint8_t> d)
        : context_id(id), is_command(command), is_last(last), data(std::move(d)) {}

    [[nodiscard]] uint8_t control_header() const noexcept {
        return static_cast<uint8_t>((is_command ? 0x01 : 0x00) | (is_last ? 0x02 : 0x00));
    }

    friend bool operator==(const presentation_data_value&,
                           const presentation_data_value&) = default;
};

/**
 * @brief Presentation Context for A-ASSOCIATE-RQ.
 */
struct presentation_context_rq {
    uint8_t id{0};
    std::string abstract_syntax;
    std::vector<std::string> transfer_syntaxes;  ///< In order of preference

    presentation_context_rq() = default;
    presentation_context_rq(uint8_t context_id, std::string abs_syntax,
                            std::vector<std::string> ts_list)
        : id(context_id)
        , abstract_syntax(std::move(abs_syntax))
        , transfer_syntaxes(std::move(ts_list)) {}

    friend bool operator==(const presentation_context_rq&,
                           const presentation_context_rq&) = default;
};

/**
 * @brief Presentation Context for A-ASSOCIATE-AC.
 */
struct presentation_context_ac {
    uint8_t id{0};
    presentation_context_result result{presentation_context_result::acceptance};
    std::string transfer_syntax;  ///< Accepted syntax; empty when rejected

    presentation_context_ac() = default;
    presentation_context_ac(uint8_t context_id, presentation_context_result res,
                            std::string ts = "")
        : id(context_id), result(res), transfer_syntax(std::move(ts)) {}

    [[nodiscard]] bool accepted() const noexcept {
        return result == presentation_context_result::acceptance;
    }

    friend bool operator==(const presentation_context_ac&,
                           const presentation_context_ac&) = default;
};

/**
 * @brief SCP/SCU Role Selection Sub-item.
 */
struct scp_scu_role_selection {
    std::string sop_class_uid;
    bool scu_role{false};
    bool scp_role{false};

    scp_scu_role_selection() = default;
    scp_scu_role_selection(std::string uid, bool scu, bool scp)
        : sop_class_uid(std::move(uid)), scu_role(scu), scp_role(scp) {}

    friend bool operator==(const scp_scu_role_selection&,
                           const scp_scu_role_selection&) = default;
};

/**
 * @brief User Information for A-ASSOCIATE-RQ/AC.
 */
struct user_information {
    uint32_t max_pdu_length{0};  ///< 0 means unlimited
    std::string implementation_class_uid;
    std::string implementation_version_name;
    std::vector<scp_scu_role_selection> role_selections;

    friend bool operator==(const user_information&, const user_information&) = default;
};

struct associate_rq {
    uint16_t protocol_version{0x0001};
    std::string called_ae_title;
    std::string calling_ae_title;
    std::string application_context;
    std::vector<presentation_context_rq> presentation_contexts;
    user_information user_info;

    friend bool operator==(const associate_rq&, const associate_rq&) = default;
};

struct associate_ac {
    uint16_t protocol_version{0x0001};
    std::string called_ae_title;
    std::string calling_ae_title;
    std::string application_context;
    std::vector<presentation_context_ac> presentation_contexts;
    user_information user_info;

    friend bool operator==(const associate_ac&, const associate_ac&) = default;
};

struct associate_rj {
    reject_result result{reject_result::rejected_permanent};
    uint8_t source{0};
    uint8_t reason{0};

    associate_rj() = default;
    associate_rj(reject_result res, uint8_t src, uint8_t rsn)
        : result(res), source(src), reason(rsn) {}

    friend bool operator==(const associate_rj&, const associate_rj&) = default;
};

struct p_data_tf_pdu {
    std::vector<presentation_data_value> pdvs;

    p_data_tf_pdu() = default;
    explicit p_data_tf_pdu(std::vector<presentation_data_value> values)
        : pdvs(std::move(values)) {}

    friend bool operator==(const p_data_tf_pdu&, const p_data_tf_pdu&) = default;
};

struct release_rq_pdu {
    friend bool operator==(const release_rq_pdu&, const release_rq_pdu&) = default;
};

struct release_rp_pdu {
    friend bool operator==(const release_rp_pdu&, const release_rp_pdu&) = default;
};

struct abort_pdu {
    abort_source source{abort_source::service_user};
    abort_reason reason{abort_reason::not_specified};

    abort_pdu() = default;
    abort_pdu(abort_source src, abort_reason rsn) : source(src), reason(rsn) {}

    friend bool operator==(const abort_pdu&, const abort_pdu&) = default;
};

/**
 * @brief Variant type that can hold any of the seven Upper Layer PDUs.
 */
using pdu = std::variant<
    associate_rq,
    associate_ac,
    associate_rj,
    p_data_tf_pdu,
    release_rq_pdu,
    release_rp_pdu,
    abort_pdu
>;

/// @name Conversion Functions
/// @{

[[nodiscard]] constexpr const char* to_string(pdu_type type) noexcept {
    switch (type) {
        case pdu_type::associate_rq: return "A-ASSOCIATE-RQ";
        case pdu_type::associate_ac: return "A-ASSOCIATE-AC";
        case pdu_type::associate_rj: return "A-ASSOCIATE-RJ";
        case pdu_type::p_data_tf: return "P-DATA-TF";
        case pdu_type::release_rq: return "A-RELEASE-RQ";
        case pdu_type::release_rp: return "A-RELEASE-RP";
        case pdu_type::abort: return "A-ABORT";
        default: return "UNKNOWN";
    }
}

[[nodiscard]] constexpr const char* to_string(presentation_context_result result) noexcept {
    switch (result) {
        case presentation_context_result::acceptance: return "acceptance";
        case presentation_context_result::user_rejection: return "user-rejection";
        case presentation_context_result::no_reason: return "no-reason";
        case presentation_context_result::abstract_syntax_not_supported:
            return "abstract-syntax-not-supported";
        case presentation_context_result::transfer_syntaxes_not_supported:
            return "transfer-syntaxes-not-supported";
        default: return "unknown";
    }
}

/**
 * @brief PDU type code of a variant alternative.
 */
[[nodiscard]] constexpr pdu_type type_of(const pdu& value) noexcept {
    return static_cast<pdu_type>(value.index() + 1);
}

/// @}

/// @name Constants
/// @{

constexpr const char* DICOM_APPLICATION_CONTEXT = "1.2.840.10008.3.1.1.1";

constexpr uint16_t DICOM_PROTOCOL_VERSION = 0x0001;

/// AE Title length (fixed 16 characters, space-padded)
constexpr std::size_t AE_TITLE_LENGTH = 16;

/// Type(1) + reserved(1) + length(4)
constexpr std::size_t PDU_HEADER_SIZE = 6;

/// Item length(4) + context ID(1) + control header(1)
constexpr std::size_t PDV_HEADER_SIZE = 6;

/// Offset of the first variable item in A-ASSOCIATE-RQ/AC
constexpr std::size_t ASSOCIATE_FIXED_SIZE = 74;

constexpr uint32_t DEFAULT_MAX_PDU_LENGTH = 16384;

/// Maximum PDU length that can be negotiated (0 = unlimited)
constexpr uint32_t UNLIMITED_MAX_PDU_LENGTH = 0;

/// Smallest max PDU length accepted by configuration
constexpr uint32_t MIN_MAX_PDU_LENGTH = 64;

/// Smallest P-DATA-TF PDU that still carries one payload byte
constexpr uint32_t MIN_DATA_PDU_LENGTH = PDU_HEADER_SIZE + PDV_HEADER_SIZE + 1;

/// @}

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_PDU_TYPES_HPP
