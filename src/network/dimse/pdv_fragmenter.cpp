/**
 * @file pdv_fragmenter.cpp
 * @brief Implementation of DIMSE message fragmentation
 */

#include <dicom_ul/network/dimse/pdv_fragmenter.hpp>

#include <algorithm>

namespace dicom_ul::network::dimse {

namespace {

/// PDU header plus PDV header
constexpr std::size_t fragment_overhead = PDU_HEADER_SIZE + PDV_HEADER_SIZE;

/// A limit that leaves no room for payload is raised to one payload byte
std::size_t usable_limit(uint32_t max_pdu_length) noexcept {
    return std::max<std::size_t>(max_pdu_length, MIN_DATA_PDU_LENGTH);
}

}  // namespace

pdv_fragmenter::pdv_fragmenter(uint32_t max_pdu_length) noexcept
    : max_pdu_length_(max_pdu_length)
    , max_payload_(max_fragment_payload(max_pdu_length)) {}

std::size_t pdv_fragmenter::max_fragment_payload(uint32_t max_pdu_length) noexcept {
    if (max_pdu_length == UNLIMITED_MAX_PDU_LENGTH) {
        return 0;
    }
    return usable_limit(max_pdu_length) - fragment_overhead;
}

std::vector<p_data_tf_pdu> pdv_fragmenter::fragment(uint8_t context_id,
                                                    std::span<const uint8_t> command,
                                                    std::span<const uint8_t> dataset,
                                                    bool has_dataset) const {
    std::vector<presentation_data_value> pdvs;
    append_object(pdvs, context_id, command, true);
    if (has_dataset) {
        append_object(pdvs, context_id, dataset, false);
    }

    std::vector<p_data_tf_pdu> pdus;
    if (max_payload_ == 0) {
        pdus.emplace_back(std::move(pdvs));
        return pdus;
    }

    // Pack consecutive PDVs while the whole PDU stays within the limit
    const std::size_t body_limit = usable_limit(max_pdu_length_) - PDU_HEADER_SIZE;
    p_data_tf_pdu current;
    std::size_t current_body = 0;
    for (auto& pdv : pdvs) {
        const std::size_t item_size = PDV_HEADER_SIZE + pdv.data.size();
        if (!current.pdvs.empty() && current_body + item_size > body_limit) {
            pdus.push_back(std::move(current));
            current = p_data_tf_pdu{};
            current_body = 0;
        }
        current_body += item_size;
        current.pdvs.push_back(std::move(pdv));
    }
    if (!current.pdvs.empty()) {
        pdus.push_back(std::move(current));
    }
    return pdus;
}

void pdv_fragmenter::append_object(std::vector<presentation_data_value>& pdvs,
                                   uint8_t context_id, std::span<const uint8_t> bytes,
                                   bool is_command) const {
    if (bytes.empty() || max_payload_ == 0) {
        pdvs.emplace_back(context_id, is_command, true,
                          std::vector<uint8_t>(bytes.begin(), bytes.end()));
        return;
    }

    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const std::size_t chunk = std::min(max_payload_, bytes.size() - offset);
        auto piece = bytes.subspan(offset, chunk);
        offset += chunk;
        pdvs.emplace_back(context_id, is_command, offset == bytes.size(),
                          std::vector<uint8_t>(piece.begin(), piece.end()));
    }
}

}  // namespace dicom_ul::network::dimse
