/**
 * @file pdv_assembler.hpp
 * @brief Reassembly of PDV fragments into complete DIMSE messages
 *
 * @see DICOM PS3.8 Annex E - Message Control Header Encoding
 */

#ifndef DICOM_UL_NETWORK_DIMSE_PDV_ASSEMBLER_HPP
#define DICOM_UL_NETWORK_DIMSE_PDV_ASSEMBLER_HPP

#include <dicom_ul/core/result.hpp>
#include <dicom_ul/network/pdu_types.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace dicom_ul::network::dimse {

/**
 * @brief Command and data bytes of one reassembled message
 */
struct assembled_message {
    uint8_t context_id{0};
    std::vector<uint8_t> command;
    std::vector<uint8_t> dataset;
    bool has_dataset{false};
};

/**
 * @brief Per-context reassembly buffers
 *
 * Each presentation context holds at most one command object and one data
 * object in progress. Fragments are appended in arrival order; the last
 * command fragment closes the command object, and if its Command Data Set
 * Type announces a data set the message completes with the last data
 * fragment. Violations (data before its command, a second command while a
 * data set is pending, data for a command that announced none) are
 * reported as dimse_error and leave the context's buffers cleared.
 */
class pdv_assembler {
public:
    /**
     * @brief Append one fragment
     * @return The completed message, std::nullopt while incomplete, or an
     *         error for an out-of-order fragment
     */
    [[nodiscard]] Result<std::optional<assembled_message>> add(
        const presentation_data_value& pdv);

    /**
     * @brief Drop every in-progress buffer
     */
    void reset() noexcept;

    /// True when no context has a partial message
    [[nodiscard]] bool idle() const noexcept { return buffers_.empty(); }

    [[nodiscard]] std::size_t buffered_bytes() const noexcept;

private:
    struct context_buffer {
        std::vector<uint8_t> command;
        std::vector<uint8_t> data;
        bool command_complete{false};
        bool expects_dataset{false};
    };

    std::map<uint8_t, context_buffer> buffers_;
};

}  // namespace dicom_ul::network::dimse

#endif  // DICOM_UL_NETWORK_DIMSE_PDV_ASSEMBLER_HPP
