/**
 * @file pdv_assembler.cpp
 * @brief Implementation of PDV reassembly
 */

#include <dicom_ul/network/dimse/pdv_assembler.hpp>

#include <dicom_ul/encoding/implicit_vr_codec.hpp>
#include <dicom_ul/network/dimse/dimse_message.hpp>

namespace dicom_ul::network::dimse {

namespace {

using assembly_result = Result<std::optional<assembled_message>>;

assembly_result sequence_error(uint8_t context_id, const std::string& detail) {
    return make_ul_error<std::optional<assembled_message>>(error_codes::dimse_error,
        "Presentation context " + std::to_string(context_id) + ": " + detail, "dimse");
}

}  // namespace

Result<std::optional<assembled_message>> pdv_assembler::add(
    const presentation_data_value& pdv) {
    auto& buffer = buffers_[pdv.context_id];

    if (pdv.is_command) {
        if (buffer.command_complete) {
            buffers_.erase(pdv.context_id);
            return sequence_error(pdv.context_id,
                                  "command fragment while a data set is pending");
        }
        buffer.command.insert(buffer.command.end(), pdv.data.begin(), pdv.data.end());
        if (!pdv.is_last) {
            return std::optional<assembled_message>{};
        }

        auto command_set = encoding::implicit_vr_codec::decode(buffer.command);
        if (command_set.is_err()) {
            buffers_.erase(pdv.context_id);
            return sequence_error(pdv.context_id,
                                  "undecodable command set: " + command_set.error().message);
        }
        buffer.command_complete = true;
        buffer.expects_dataset = dimse_message::announces_dataset(command_set.value());
    } else {
        if (!buffer.command_complete) {
            buffers_.erase(pdv.context_id);
            return sequence_error(pdv.context_id, "data fragment before its command");
        }
        if (!buffer.expects_dataset) {
            buffers_.erase(pdv.context_id);
            return sequence_error(pdv.context_id,
                                  "data fragment for a command without a data set");
        }
        buffer.data.insert(buffer.data.end(), pdv.data.begin(), pdv.data.end());
        if (!pdv.is_last) {
            return std::optional<assembled_message>{};
        }
    }

    // Command closed and, if announced, data closed
    if (buffer.expects_dataset && pdv.is_command) {
        return std::optional<assembled_message>{};
    }

    assembled_message message;
    message.context_id = pdv.context_id;
    message.command = std::move(buffer.command);
    message.dataset = std::move(buffer.data);
    message.has_dataset = buffer.expects_dataset;
    buffers_.erase(pdv.context_id);
    return std::optional<assembled_message>{std::move(message)};
}

void pdv_assembler::reset() noexcept {
    buffers_.clear();
}

std::size_t pdv_assembler::buffered_bytes() const noexcept {
    std::size_t total = 0;
    for (const auto& [id, buffer] : buffers_) {
        total += buffer.command.size() + buffer.data.size();
    }
    return total;
}

}  // namespace dicom_ul::network::dimse
