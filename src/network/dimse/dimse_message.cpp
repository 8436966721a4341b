/**
 * @file dimse_message.cpp
 * @brief Command set model, message codec and factories
 */

#include <dicom_ul/network/dimse/dimse_message.hpp>

#include <dicom_ul/encoding/explicit_vr_codec.hpp>
#include <dicom_ul/encoding/implicit_vr_codec.hpp>
#include <dicom_ul/registry/uid_registry.hpp>

namespace dicom_ul::network::dimse {

using encoding::vr_type;

namespace {

constexpr const char* dimse_module = "dimse";

error_info dimse_error(std::string message) {
    return error_info{error_codes::dimse_error, std::move(message), dimse_module};
}

enum class dataset_codec { implicit_le, explicit_le };

Result<dataset_codec> codec_for(std::string_view transfer_syntax) {
    const auto ts = registry::trim_uid(transfer_syntax);
    if (ts == registry::uids::implicit_vr_little_endian) {
        return dataset_codec::implicit_le;
    }
    if (ts == registry::uids::explicit_vr_little_endian) {
        return dataset_codec::explicit_le;
    }
    return make_ul_error<dataset_codec>(error_codes::unsupported_transfer_syntax,
        "No data set codec for transfer syntax " + std::string(ts), dimse_module);
}

std::vector<uint8_t> encode_dataset(dataset_codec codec, const core::dicom_dataset& ds) {
    return codec == dataset_codec::implicit_le ? encoding::implicit_vr_codec::encode(ds)
                                               : encoding::explicit_vr_codec::encode(ds);
}

Result<core::dicom_dataset> decode_dataset(dataset_codec codec, std::span<const uint8_t> bytes) {
    return codec == dataset_codec::implicit_le ? encoding::implicit_vr_codec::decode(bytes)
                                               : encoding::explicit_vr_codec::decode(bytes);
}

/// Request skeleton with the affected SOP class and priority used by DIMSE-C
dimse_message c_request(command_field cmd, uint16_t message_id,
                        std::string_view sop_class_uid, uint16_t priority) {
    dimse_message msg(cmd, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_priority(priority);
    return msg;
}

dimse_message c_response(command_field cmd, uint16_t message_id_responded_to,
                         std::string_view sop_class_uid, status_code status) {
    dimse_message msg(cmd, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_status(status);
    return msg;
}

/// DIMSE-N request addressed through the Requested SOP Class/Instance pair
dimse_message n_request(command_field cmd, uint16_t message_id,
                        std::string_view sop_class_uid, std::string_view sop_instance_uid) {
    dimse_message msg(cmd, message_id);
    msg.set_requested_sop_class_uid(sop_class_uid);
    msg.set_requested_sop_instance_uid(sop_instance_uid);
    return msg;
}

}  // namespace

dimse_message::dimse_message(command_field cmd, uint16_t message_id)
    : command_(cmd), message_id_(message_id) {
    write_us(tag_command_field, static_cast<uint16_t>(cmd));
    // C-CANCEL identifies its target through Message ID Being Responded To
    if (dimse::is_request(cmd) && cmd != command_field::c_cancel_rq) {
        write_us(tag_message_id, message_id);
    }
    update_data_set_type();
}

// ---------------------------------------------------------------------------
// Command set helpers
// ---------------------------------------------------------------------------

auto dimse_message::read_us(core::dicom_tag tag) const -> std::optional<uint16_t> {
    return command_set_.get_numeric<uint16_t>(tag);
}

void dimse_message::write_us(core::dicom_tag tag, uint16_t value) {
    command_set_.set_numeric<uint16_t>(tag, vr_type::US, value);
}

auto dimse_message::read_text(core::dicom_tag tag) const -> std::string {
    return command_set_.get_string(tag);
}

void dimse_message::write_text(core::dicom_tag tag, vr_type vr, std::string_view value) {
    command_set_.set_string(tag, vr, value);
}

// ---------------------------------------------------------------------------
// Data set
// ---------------------------------------------------------------------------

auto dimse_message::dataset() -> Result<std::reference_wrapper<core::dicom_dataset>> {
    if (!dataset_) {
        return dimse_error(std::string(to_string(command_)) + " carries no data set");
    }
    return std::ref(*dataset_);
}

auto dimse_message::dataset() const
    -> Result<std::reference_wrapper<const core::dicom_dataset>> {
    if (!dataset_) {
        return dimse_error(std::string(to_string(command_)) + " carries no data set");
    }
    return std::cref(*dataset_);
}

void dimse_message::set_dataset(core::dicom_dataset ds) {
    dataset_ = std::move(ds);
    update_data_set_type();
}

void dimse_message::clear_dataset() noexcept {
    dataset_.reset();
    update_data_set_type();
}

// ---------------------------------------------------------------------------
// Attributes
// ---------------------------------------------------------------------------

auto dimse_message::status() const -> status_code {
    return read_us(tag_status).value_or(status_success);
}

void dimse_message::set_status(status_code status) { write_us(tag_status, status); }

auto dimse_message::error_comment() const -> std::string { return read_text(tag_error_comment); }

void dimse_message::set_error_comment(std::string_view comment) {
    write_text(tag_error_comment, vr_type::LO, comment.substr(0, 64));
}

auto dimse_message::affected_sop_class_uid() const -> std::string {
    return read_text(tag_affected_sop_class_uid);
}

void dimse_message::set_affected_sop_class_uid(std::string_view uid) {
    write_text(tag_affected_sop_class_uid, vr_type::UI, uid);
}

auto dimse_message::affected_sop_instance_uid() const -> std::string {
    return read_text(tag_affected_sop_instance_uid);
}

void dimse_message::set_affected_sop_instance_uid(std::string_view uid) {
    write_text(tag_affected_sop_instance_uid, vr_type::UI, uid);
}

auto dimse_message::priority() const -> uint16_t {
    return read_us(tag_priority).value_or(priority_medium);
}

void dimse_message::set_priority(uint16_t priority) { write_us(tag_priority, priority); }

auto dimse_message::message_id_responded_to() const -> uint16_t {
    return read_us(tag_message_id_responded_to).value_or(0);
}

void dimse_message::set_message_id_responded_to(uint16_t id) {
    write_us(tag_message_id_responded_to, id);
}

auto dimse_message::move_destination() const -> std::string {
    return read_text(tag_move_destination);
}

void dimse_message::set_move_destination(std::string_view ae_title) {
    write_text(tag_move_destination, vr_type::AE, ae_title);
}

auto dimse_message::requested_sop_class_uid() const -> std::string {
    return read_text(tag_requested_sop_class_uid);
}

void dimse_message::set_requested_sop_class_uid(std::string_view uid) {
    write_text(tag_requested_sop_class_uid, vr_type::UI, uid);
}

auto dimse_message::requested_sop_instance_uid() const -> std::string {
    return read_text(tag_requested_sop_instance_uid);
}

void dimse_message::set_requested_sop_instance_uid(std::string_view uid) {
    write_text(tag_requested_sop_instance_uid, vr_type::UI, uid);
}

auto dimse_message::event_type_id() const -> std::optional<uint16_t> {
    return read_us(tag_event_type_id);
}

void dimse_message::set_event_type_id(uint16_t type_id) { write_us(tag_event_type_id, type_id); }

auto dimse_message::action_type_id() const -> std::optional<uint16_t> {
    return read_us(tag_action_type_id);
}

void dimse_message::set_action_type_id(uint16_t type_id) {
    write_us(tag_action_type_id, type_id);
}

auto dimse_message::attribute_identifier_list() const -> std::vector<core::dicom_tag> {
    std::vector<core::dicom_tag> tags;
    const auto* list = command_set_.get(tag_attribute_identifier_list);
    if (list == nullptr) {
        return tags;
    }

    // AT: (group, element) pairs, each half little-endian
    const auto bytes = list->raw_data();
    for (std::size_t i = 0; i + 4 <= bytes.size(); i += 4) {
        tags.emplace_back(static_cast<uint16_t>(bytes[i] | (bytes[i + 1] << 8)),
                          static_cast<uint16_t>(bytes[i + 2] | (bytes[i + 3] << 8)));
    }
    return tags;
}

void dimse_message::set_attribute_identifier_list(const std::vector<core::dicom_tag>& tags) {
    std::vector<uint8_t> bytes;
    bytes.reserve(tags.size() * 4);
    for (const auto& tag : tags) {
        for (uint16_t half : {tag.group(), tag.element()}) {
            bytes.push_back(static_cast<uint8_t>(half & 0xFF));
            bytes.push_back(static_cast<uint8_t>(half >> 8));
        }
    }
    command_set_.insert(
        core::dicom_element(tag_attribute_identifier_list, vr_type::AT, bytes));
}

auto dimse_message::remaining_subops() const -> std::optional<uint16_t> {
    return read_us(tag_number_of_remaining_subops);
}

void dimse_message::set_remaining_subops(uint16_t count) {
    write_us(tag_number_of_remaining_subops, count);
}

auto dimse_message::completed_subops() const -> std::optional<uint16_t> {
    return read_us(tag_number_of_completed_subops);
}

void dimse_message::set_completed_subops(uint16_t count) {
    write_us(tag_number_of_completed_subops, count);
}

auto dimse_message::failed_subops() const -> std::optional<uint16_t> {
    return read_us(tag_number_of_failed_subops);
}

void dimse_message::set_failed_subops(uint16_t count) {
    write_us(tag_number_of_failed_subops, count);
}

auto dimse_message::warning_subops() const -> std::optional<uint16_t> {
    return read_us(tag_number_of_warning_subops);
}

void dimse_message::set_warning_subops(uint16_t count) {
    write_us(tag_number_of_warning_subops, count);
}

// ---------------------------------------------------------------------------
// Wire form
// ---------------------------------------------------------------------------

auto dimse_message::encode(const dimse_message& msg, std::string_view dataset_ts)
    -> dimse_result<encoded_message> {
    encoded_message out;

    if (msg.dataset_) {
        auto codec = codec_for(dataset_ts);
        if (codec.is_err()) {
            return codec.error();
        }
        out.second = encode_dataset(codec.value(), *msg.dataset_);
    }

    // Command Group Length counts every command element after itself
    core::dicom_dataset command_set = msg.command_set_;
    command_set.remove(tag_command_group_length);
    const auto body = encoding::implicit_vr_codec::encode(command_set);
    command_set.set_numeric<uint32_t>(tag_command_group_length, vr_type::UL,
                                      static_cast<uint32_t>(body.size()));
    out.first = encoding::implicit_vr_codec::encode(command_set);
    return out;
}

auto dimse_message::decode(std::span<const uint8_t> command_data,
                           std::span<const uint8_t> dataset_data,
                           std::string_view dataset_ts) -> dimse_result<dimse_message> {
    auto command_set = encoding::implicit_vr_codec::decode(command_data);
    if (command_set.is_err()) {
        return dimse_error("Undecodable command set: " + command_set.error().message);
    }

    const auto field = command_set.value().get_numeric<uint16_t>(tag_command_field);
    if (!field) {
        return dimse_error("Command set without Command Field (0000,0100)");
    }
    const auto cmd = static_cast<command_field>(*field);

    const auto id = command_set.value().get_numeric<uint16_t>(tag_message_id);
    if (!id && dimse::is_request(cmd) && cmd != command_field::c_cancel_rq) {
        return dimse_error(std::string(to_string(cmd)) + " without Message ID (0000,0110)");
    }

    dimse_message msg;
    msg.command_ = cmd;
    msg.message_id_ = id.value_or(0);
    msg.command_set_ = std::move(command_set.value());

    if (dataset_data.empty()) {
        return msg;
    }

    auto codec = codec_for(dataset_ts);
    if (codec.is_err()) {
        return codec.error();
    }
    auto ds = decode_dataset(codec.value(), dataset_data);
    if (ds.is_err()) {
        return dimse_error("Undecodable data set: " + ds.error().message);
    }
    msg.dataset_ = std::move(ds.value());
    return msg;
}

auto dimse_message::announces_dataset(const core::dicom_dataset& command_set) -> bool {
    return command_set.get_numeric<uint16_t>(tag_command_data_set_type)
               .value_or(command_data_set_type_null) != command_data_set_type_null;
}

auto dimse_message::is_valid() const noexcept -> bool {
    if (!command_set_.contains(tag_command_field)) {
        return false;
    }
    if (is_response() || command_ == command_field::c_cancel_rq) {
        return command_set_.contains(tag_message_id_responded_to);
    }
    return command_set_.contains(tag_message_id);
}

void dimse_message::update_data_set_type() {
    write_us(tag_command_data_set_type,
             dataset_ ? command_data_set_type_present : command_data_set_type_null);
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

auto make_response(const dimse_message& request, status_code status) -> dimse_message {
    dimse_message msg(get_response_command(request.command()), 0);
    msg.set_message_id_responded_to(request.message_id());

    // DIMSE-N requests name their target in the Requested attributes
    auto sop_class = request.affected_sop_class_uid();
    if (sop_class.empty()) {
        sop_class = request.requested_sop_class_uid();
    }
    auto sop_instance = request.affected_sop_instance_uid();
    if (sop_instance.empty()) {
        sop_instance = request.requested_sop_instance_uid();
    }
    if (!sop_class.empty()) {
        msg.set_affected_sop_class_uid(sop_class);
    }
    if (!sop_instance.empty()) {
        msg.set_affected_sop_instance_uid(sop_instance);
    }

    if (auto event = request.event_type_id()) {
        msg.set_event_type_id(*event);
    }
    if (auto action = request.action_type_id()) {
        msg.set_action_type_id(*action);
    }
    msg.set_status(status);
    return msg;
}

auto make_c_echo_rq(uint16_t message_id, std::string_view sop_class_uid) -> dimse_message {
    dimse_message msg(command_field::c_echo_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    return msg;
}

auto make_c_echo_rsp(uint16_t message_id_responded_to, status_code status,
                     std::string_view sop_class_uid) -> dimse_message {
    return c_response(command_field::c_echo_rsp, message_id_responded_to, sop_class_uid,
                      status);
}

auto make_c_store_rq(uint16_t message_id, std::string_view sop_class_uid,
                     std::string_view sop_instance_uid, uint16_t priority) -> dimse_message {
    auto msg = c_request(command_field::c_store_rq, message_id, sop_class_uid, priority);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    return msg;
}

auto make_c_store_rsp(uint16_t message_id_responded_to, std::string_view sop_class_uid,
                      std::string_view sop_instance_uid, status_code status)
    -> dimse_message {
    auto msg = c_response(command_field::c_store_rsp, message_id_responded_to, sop_class_uid,
                          status);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    return msg;
}

auto make_c_find_rq(uint16_t message_id, std::string_view sop_class_uid, uint16_t priority)
    -> dimse_message {
    return c_request(command_field::c_find_rq, message_id, sop_class_uid, priority);
}

auto make_c_find_rsp(uint16_t message_id_responded_to, std::string_view sop_class_uid,
                     status_code status) -> dimse_message {
    return c_response(command_field::c_find_rsp, message_id_responded_to, sop_class_uid,
                      status);
}

auto make_c_get_rq(uint16_t message_id, std::string_view sop_class_uid, uint16_t priority)
    -> dimse_message {
    return c_request(command_field::c_get_rq, message_id, sop_class_uid, priority);
}

auto make_c_move_rq(uint16_t message_id, std::string_view sop_class_uid,
                    std::string_view move_destination, uint16_t priority) -> dimse_message {
    auto msg = c_request(command_field::c_move_rq, message_id, sop_class_uid, priority);
    msg.set_move_destination(move_destination);
    return msg;
}

auto make_retrieve_rsp(command_field response_command, uint16_t message_id_responded_to,
                       std::string_view sop_class_uid, status_code status,
                       uint16_t remaining, uint16_t completed, uint16_t failed,
                       uint16_t warning) -> dimse_message {
    auto msg = c_response(response_command, message_id_responded_to, sop_class_uid, status);
    // Remaining is only meaningful while sub-operations are still running
    if (is_pending(status)) {
        msg.set_remaining_subops(remaining);
    }
    msg.set_completed_subops(completed);
    msg.set_failed_subops(failed);
    msg.set_warning_subops(warning);
    return msg;
}

auto make_c_cancel_rq(uint16_t message_id_being_cancelled) -> dimse_message {
    dimse_message msg(command_field::c_cancel_rq, 0);
    msg.set_message_id_responded_to(message_id_being_cancelled);
    return msg;
}

auto make_n_create_rq(uint16_t message_id, std::string_view sop_class_uid,
                      std::string_view sop_instance_uid) -> dimse_message {
    dimse_message msg(command_field::n_create_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    if (!sop_instance_uid.empty()) {
        msg.set_affected_sop_instance_uid(sop_instance_uid);
    }
    return msg;
}

auto make_n_set_rq(uint16_t message_id, std::string_view sop_class_uid,
                   std::string_view sop_instance_uid) -> dimse_message {
    return n_request(command_field::n_set_rq, message_id, sop_class_uid, sop_instance_uid);
}

auto make_n_get_rq(uint16_t message_id, std::string_view sop_class_uid,
                   std::string_view sop_instance_uid,
                   const std::vector<core::dicom_tag>& attribute_tags) -> dimse_message {
    auto msg = n_request(command_field::n_get_rq, message_id, sop_class_uid, sop_instance_uid);
    if (!attribute_tags.empty()) {
        msg.set_attribute_identifier_list(attribute_tags);
    }
    return msg;
}

auto make_n_event_report_rq(uint16_t message_id, std::string_view sop_class_uid,
                            std::string_view sop_instance_uid, uint16_t event_type_id)
    -> dimse_message {
    dimse_message msg(command_field::n_event_report_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_event_type_id(event_type_id);
    return msg;
}

auto make_n_action_rq(uint16_t message_id, std::string_view sop_class_uid,
                      std::string_view sop_instance_uid, uint16_t action_type_id)
    -> dimse_message {
    auto msg =
        n_request(command_field::n_action_rq, message_id, sop_class_uid, sop_instance_uid);
    msg.set_action_type_id(action_type_id);
    return msg;
}

auto make_n_delete_rq(uint16_t message_id, std::string_view sop_class_uid,
                      std::string_view sop_instance_uid) -> dimse_message {
    return n_request(command_field::n_delete_rq, message_id, sop_class_uid, sop_instance_uid);
}

}  // namespace dicom_ul::network::dimse
