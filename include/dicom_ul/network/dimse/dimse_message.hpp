/**
 * @file dimse_message.hpp
 * @brief DIMSE message encoding and decoding
 *
 * @see DICOM PS3.7 Section 6 - Message Structure
 * @see DICOM PS3.7 Section 9 - DIMSE-C Services
 * @see DICOM PS3.7 Section 10 - DIMSE-N Services
 */

#ifndef DICOM_UL_NETWORK_DIMSE_DIMSE_MESSAGE_HPP
#define DICOM_UL_NETWORK_DIMSE_DIMSE_MESSAGE_HPP

#include "command_field.hpp"
#include "status_codes.hpp"

#include <dicom_ul/core/dicom_dataset.hpp>
#include <dicom_ul/core/dicom_tag.hpp>
#include <dicom_ul/core/result.hpp>
#include <dicom_ul/encoding/vr_type.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dicom_ul::network::dimse {

/// @name DIMSE Command Tags
/// @{

constexpr core::dicom_tag tag_command_group_length{0x0000, 0x0000};
constexpr core::dicom_tag tag_affected_sop_class_uid{0x0000, 0x0002};
constexpr core::dicom_tag tag_requested_sop_class_uid{0x0000, 0x0003};
constexpr core::dicom_tag tag_command_field{0x0000, 0x0100};
constexpr core::dicom_tag tag_message_id{0x0000, 0x0110};
constexpr core::dicom_tag tag_message_id_responded_to{0x0000, 0x0120};
constexpr core::dicom_tag tag_move_destination{0x0000, 0x0600};
constexpr core::dicom_tag tag_priority{0x0000, 0x0700};
constexpr core::dicom_tag tag_command_data_set_type{0x0000, 0x0800};
constexpr core::dicom_tag tag_status{0x0000, 0x0900};
constexpr core::dicom_tag tag_offending_element{0x0000, 0x0901};
constexpr core::dicom_tag tag_error_comment{0x0000, 0x0902};
constexpr core::dicom_tag tag_error_id{0x0000, 0x0903};
constexpr core::dicom_tag tag_affected_sop_instance_uid{0x0000, 0x1000};
constexpr core::dicom_tag tag_requested_sop_instance_uid{0x0000, 0x1001};
constexpr core::dicom_tag tag_event_type_id{0x0000, 0x1002};
constexpr core::dicom_tag tag_attribute_identifier_list{0x0000, 0x1005};
constexpr core::dicom_tag tag_action_type_id{0x0000, 0x1008};
constexpr core::dicom_tag tag_number_of_remaining_subops{0x0000, 0x1020};
constexpr core::dicom_tag tag_number_of_completed_subops{0x0000, 0x1021};
constexpr core::dicom_tag tag_number_of_failed_subops{0x0000, 0x1022};
constexpr core::dicom_tag tag_number_of_warning_subops{0x0000, 0x1023};
constexpr core::dicom_tag tag_move_originator_aet{0x0000, 0x1030};
constexpr core::dicom_tag tag_move_originator_message_id{0x0000, 0x1031};

/// @}

/// @name Command Data Set Type Values
/// @{

/// No data set follows the command
constexpr uint16_t command_data_set_type_null = 0x0101;

/// Any other value announces a data set
constexpr uint16_t command_data_set_type_present = 0x0001;

/// @}

/// @name Priority Values
/// @{

constexpr uint16_t priority_low = 0x0002;
constexpr uint16_t priority_medium = 0x0000;
constexpr uint16_t priority_high = 0x0001;

/// @}

template <typename T>
using dimse_result = dicom_ul::Result<T>;

/**
 * @brief A command set plus an optional data set
 *
 * The command set is always encoded in Implicit VR Little Endian; the data
 * set uses the transfer syntax of the presentation context it travels on.
 *
 * @example
 * @code
 * auto msg = make_c_find_rq(7, registry::uids::study_root_find);
 * msg.set_dataset(std::move(query_keys));
 * auto encoded = dimse_message::encode(msg, registry::uids::explicit_vr_little_endian);
 * @endcode
 */
class dimse_message {
public:
    dimse_message(command_field cmd, uint16_t message_id);

    /// Default-constructed messages are not valid
    dimse_message() = default;

    [[nodiscard]] auto command() const noexcept -> command_field { return command_; }

    /// Message ID of a request; 0 for responses and C-CANCEL
    [[nodiscard]] auto message_id() const noexcept -> uint16_t { return message_id_; }

    [[nodiscard]] auto command_set() noexcept -> core::dicom_dataset& { return command_set_; }
    [[nodiscard]] auto command_set() const noexcept -> const core::dicom_dataset& {
        return command_set_;
    }

    [[nodiscard]] auto has_dataset() const noexcept -> bool { return dataset_.has_value(); }

    [[nodiscard]] auto dataset() -> Result<std::reference_wrapper<core::dicom_dataset>>;
    [[nodiscard]] auto dataset() const
        -> Result<std::reference_wrapper<const core::dicom_dataset>>;

    /// Attach a data set; Command Data Set Type follows
    void set_dataset(core::dicom_dataset ds);
    void clear_dataset() noexcept;

    // ========================================================================
    // Status (for responses)
    // ========================================================================

    [[nodiscard]] auto status() const -> status_code;
    void set_status(status_code status);

    [[nodiscard]] auto error_comment() const -> std::string;

    /// Error Comment (0000,0902) is LO: truncated to 64 characters
    void set_error_comment(std::string_view comment);

    // ========================================================================
    // Common Attributes
    // ========================================================================

    [[nodiscard]] auto affected_sop_class_uid() const -> std::string;
    void set_affected_sop_class_uid(std::string_view uid);

    [[nodiscard]] auto affected_sop_instance_uid() const -> std::string;
    void set_affected_sop_instance_uid(std::string_view uid);

    [[nodiscard]] auto priority() const -> uint16_t;
    void set_priority(uint16_t priority);

    [[nodiscard]] auto message_id_responded_to() const -> uint16_t;
    void set_message_id_responded_to(uint16_t id);

    [[nodiscard]] auto move_destination() const -> std::string;
    void set_move_destination(std::string_view ae_title);

    // ========================================================================
    // DIMSE-N Specific Attributes
    // ========================================================================

    [[nodiscard]] auto requested_sop_class_uid() const -> std::string;
    void set_requested_sop_class_uid(std::string_view uid);

    [[nodiscard]] auto requested_sop_instance_uid() const -> std::string;
    void set_requested_sop_instance_uid(std::string_view uid);

    [[nodiscard]] auto event_type_id() const -> std::optional<uint16_t>;
    void set_event_type_id(uint16_t type_id);

    [[nodiscard]] auto action_type_id() const -> std::optional<uint16_t>;
    void set_action_type_id(uint16_t type_id);

    [[nodiscard]] auto attribute_identifier_list() const -> std::vector<core::dicom_tag>;
    void set_attribute_identifier_list(const std::vector<core::dicom_tag>& tags);

    // ========================================================================
    // Sub-operation Counts (for C-GET/C-MOVE responses)
    // ========================================================================

    [[nodiscard]] auto remaining_subops() const -> std::optional<uint16_t>;
    void set_remaining_subops(uint16_t count);
    [[nodiscard]] auto completed_subops() const -> std::optional<uint16_t>;
    void set_completed_subops(uint16_t count);
    [[nodiscard]] auto failed_subops() const -> std::optional<uint16_t>;
    void set_failed_subops(uint16_t count);
    [[nodiscard]] auto warning_subops() const -> std::optional<uint16_t>;
    void set_warning_subops(uint16_t count);

    // ========================================================================
    // Encoding/Decoding
    // ========================================================================

    /// (command_set_bytes, dataset_bytes)
    using encoded_message = std::pair<std::vector<uint8_t>, std::vector<uint8_t>>;

    /**
     * @brief Encode the command set (with group length) and the data set
     * @param dataset_ts Transfer syntax UID of the presentation context
     * @return unsupported_transfer_syntax if a data set is present and the
     *         syntax is neither Implicit nor Explicit VR Little Endian
     */
    [[nodiscard]] static auto encode(const dimse_message& msg, std::string_view dataset_ts)
        -> dimse_result<encoded_message>;

    /**
     * @brief Decode a message from reassembled command and data bytes
     *
     * An empty @p dataset_data means no data set.
     */
    [[nodiscard]] static auto decode(std::span<const uint8_t> command_data,
                                     std::span<const uint8_t> dataset_data,
                                     std::string_view dataset_ts)
        -> dimse_result<dimse_message>;

    /**
     * @brief Whether a command set announces a following data set
     */
    [[nodiscard]] static auto announces_dataset(const core::dicom_dataset& command_set)
        -> bool;

    /// Required command elements present for the command's kind
    [[nodiscard]] auto is_valid() const noexcept -> bool;

    [[nodiscard]] auto is_request() const noexcept -> bool { return dimse::is_request(command_); }
    [[nodiscard]] auto is_response() const noexcept -> bool {
        return dimse::is_response(command_);
    }

private:
    [[nodiscard]] auto read_us(core::dicom_tag tag) const -> std::optional<uint16_t>;
    void write_us(core::dicom_tag tag, uint16_t value);
    [[nodiscard]] auto read_text(core::dicom_tag tag) const -> std::string;
    void write_text(core::dicom_tag tag, encoding::vr_type vr, std::string_view value);

    void update_data_set_type();

    command_field command_{};
    uint16_t message_id_{0};
    core::dicom_dataset command_set_;
    std::optional<core::dicom_dataset> dataset_;
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * @brief Response skeleton for any request
 *
 * Copies the affected SOP class and instance (or the requested ones for
 * DIMSE-N requests that carry them) and sets Message ID Being Responded To.
 */
[[nodiscard]] auto make_response(const dimse_message& request, status_code status)
    -> dimse_message;

[[nodiscard]] auto make_c_echo_rq(uint16_t message_id,
                                  std::string_view sop_class_uid = "1.2.840.10008.1.1")
    -> dimse_message;

[[nodiscard]] auto make_c_echo_rsp(uint16_t message_id_responded_to,
                                   status_code status = status_success,
                                   std::string_view sop_class_uid = "1.2.840.10008.1.1")
    -> dimse_message;

[[nodiscard]] auto make_c_store_rq(uint16_t message_id, std::string_view sop_class_uid,
                                   std::string_view sop_instance_uid,
                                   uint16_t priority = priority_medium) -> dimse_message;

[[nodiscard]] auto make_c_store_rsp(uint16_t message_id_responded_to,
                                    std::string_view sop_class_uid,
                                    std::string_view sop_instance_uid,
                                    status_code status = status_success) -> dimse_message;

[[nodiscard]] auto make_c_find_rq(uint16_t message_id, std::string_view sop_class_uid,
                                  uint16_t priority = priority_medium) -> dimse_message;

[[nodiscard]] auto make_c_find_rsp(uint16_t message_id_responded_to,
                                   std::string_view sop_class_uid, status_code status)
    -> dimse_message;

[[nodiscard]] auto make_c_get_rq(uint16_t message_id, std::string_view sop_class_uid,
                                 uint16_t priority = priority_medium) -> dimse_message;

[[nodiscard]] auto make_c_move_rq(uint16_t message_id, std::string_view sop_class_uid,
                                  std::string_view move_destination,
                                  uint16_t priority = priority_medium) -> dimse_message;

/**
 * @brief C-GET/C-MOVE response with sub-operation counters
 */
[[nodiscard]] auto make_retrieve_rsp(command_field response_command,
                                     uint16_t message_id_responded_to,
                                     std::string_view sop_class_uid, status_code status,
                                     uint16_t remaining, uint16_t completed,
                                     uint16_t failed, uint16_t warning) -> dimse_message;

/**
 * @brief C-CANCEL-RQ for an outstanding request
 */
[[nodiscard]] auto make_c_cancel_rq(uint16_t message_id_being_cancelled) -> dimse_message;

[[nodiscard]] auto make_n_create_rq(uint16_t message_id, std::string_view sop_class_uid,
                                    std::string_view sop_instance_uid = "") -> dimse_message;

[[nodiscard]] auto make_n_set_rq(uint16_t message_id, std::string_view sop_class_uid,
                                 std::string_view sop_instance_uid) -> dimse_message;

[[nodiscard]] auto make_n_get_rq(uint16_t message_id, std::string_view sop_class_uid,
                                 std::string_view sop_instance_uid,
                                 const std::vector<core::dicom_tag>& attribute_tags = {})
    -> dimse_message;

[[nodiscard]] auto make_n_event_report_rq(uint16_t message_id, std::string_view sop_class_uid,
                                          std::string_view sop_instance_uid,
                                          uint16_t event_type_id) -> dimse_message;

[[nodiscard]] auto make_n_action_rq(uint16_t message_id, std::string_view sop_class_uid,
                                    std::string_view sop_instance_uid,
                                    uint16_t action_type_id) -> dimse_message;

[[nodiscard]] auto make_n_delete_rq(uint16_t message_id, std::string_view sop_class_uid,
                                    std::string_view sop_instance_uid) -> dimse_message;

}  // namespace dicom_ul::network::dimse

#endif  // DICOM_UL_NETWORK_DIMSE_DIMSE_MESSAGE_HPP
