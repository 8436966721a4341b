/**
 * @file pdv_fragmenter.hpp
 * @brief Splitting of encoded DIMSE messages into P-DATA-TF PDUs
 */

#ifndef DICOM_UL_NETWORK_DIMSE_PDV_FRAGMENTER_HPP
#define DICOM_UL_NETWORK_DIMSE_PDV_FRAGMENTER_HPP

#include <dicom_ul/network/pdu_types.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace dicom_ul::network::dimse {

/**
 * @brief Cuts command and data objects into PDVs and packs them into PDUs
 *
 * With a limit L (the smaller of both sides' maximum PDU lengths), every
 * produced P-DATA-TF PDU including its 6-byte header stays within L, so a
 * single PDV carries at most L - 12 payload bytes. A limit of 0 means
 * unlimited: each object travels in one PDV. Limits of 12 or less leave no
 * room for payload and are treated as 13.
 *
 * The command object's fragments always precede the data object's, and the
 * last fragment of each object carries the last-fragment flag.
 */
class pdv_fragmenter {
public:
    explicit pdv_fragmenter(uint32_t max_pdu_length) noexcept;

    /**
     * @brief Fragment one message
     * @param has_dataset emit data PDVs (even for an empty data object)
     */
    [[nodiscard]] std::vector<p_data_tf_pdu> fragment(uint8_t context_id,
                                                      std::span<const uint8_t> command,
                                                      std::span<const uint8_t> dataset,
                                                      bool has_dataset) const;

    /// Largest payload of one PDV, or 0 for unlimited
    [[nodiscard]] std::size_t max_fragment_payload() const noexcept { return max_payload_; }

    [[nodiscard]] static std::size_t max_fragment_payload(uint32_t max_pdu_length) noexcept;

private:
    void append_object(std::vector<presentation_data_value>& pdvs, uint8_t context_id,
                       std::span<const uint8_t> bytes, bool is_command) const;

    uint32_t max_pdu_length_;
    std::size_t max_payload_;
};

}  // namespace dicom_ul::network::dimse

#endif  // DICOM_UL_NETWORK_DIMSE_PDV_FRAGMENTER_HPP
