/**
 * @file context_negotiator.cpp
 * @brief Implementation of presentation context negotiation
 */

#include "dicom_ul/network/context_negotiator.hpp"

#include <dicom_ul/integration/logger_adapter.hpp>

#include <algorithm>
#include <bitset>

namespace dicom_ul::network {

using integration::logger_adapter;

context_negotiator::context_negotiator(
    negotiation_policy policy, std::shared_ptr<const registry::uid_registry> registry)
    : policy_(std::move(policy)), registry_(std::move(registry)) {
    if (!registry_) {
        registry_ = registry::uid_registry::builder{}.with_standard_uids().build();
    }
}

negotiation_policy context_negotiator::make_policy(
    const std::vector<std::string>& abstract_syntaxes,
    const std::vector<std::string>& transfer_syntaxes) {
    negotiation_policy policy;
    for (const auto& abstract_syntax : abstract_syntaxes) {
        policy[abstract_syntax] = transfer_syntaxes;
    }
    return policy;
}

VoidResult context_negotiator::validate_context_ids(
    const std::vector<presentation_context_rq>& proposed) {
    std::bitset<256> seen;
    for (const auto& pc : proposed) {
        if (pc.id == 0 || pc.id % 2 == 0) {
            return make_ul_void_error(error_codes::invalid_presentation_context_id,
                "Presentation context ID " + std::to_string(pc.id) + " is not odd",
                "negotiator");
        }
        if (seen.test(pc.id)) {
            return make_ul_void_error(error_codes::invalid_presentation_context_id,
                "Presentation context ID " + std::to_string(pc.id) + " is duplicated",
                "negotiator");
        }
        seen.set(pc.id);
    }
    return ok();
}

bool context_negotiator::supports_abstract_syntax(const std::string& uid) const {
    return policy_.find(std::string(registry::trim_uid(uid))) != policy_.end();
}

Result<std::vector<presentation_context_ac>> context_negotiator::negotiate(
    const std::vector<presentation_context_rq>& proposed) const {
    auto ids = validate_context_ids(proposed);
    if (ids.is_err()) {
        return ids.error();
    }

    std::vector<presentation_context_ac> results;
    results.reserve(proposed.size());
    for (const auto& pc : proposed) {
        results.push_back(negotiate_one(pc));
    }
    return results;
}

presentation_context_ac context_negotiator::negotiate_one(
    const presentation_context_rq& pc) const {
    const auto abstract_syntax = registry_->lookup(pc.abstract_syntax);

    auto it = policy_.find(abstract_syntax.uid);
    if (!registry::uid_registry::is_valid(abstract_syntax.uid) || it == policy_.end()) {
        logger_adapter::debug("Context {}: abstract syntax {} not supported", pc.id,
                              abstract_syntax.to_string());
        return presentation_context_ac{
            pc.id, presentation_context_result::abstract_syntax_not_supported};
    }

    const auto& supported = it->second;
    for (const auto& proposed_ts : pc.transfer_syntaxes) {
        const std::string ts{registry::trim_uid(proposed_ts)};
        if (std::find(supported.begin(), supported.end(), ts) != supported.end()) {
            logger_adapter::debug("Context {}: accepted {} with {}", pc.id,
                                  abstract_syntax.to_string(),
                                  registry_->lookup(ts).to_string());
            return presentation_context_ac{pc.id, presentation_context_result::acceptance, ts};
        }
    }

    logger_adapter::debug("Context {}: no common transfer syntax for {}", pc.id,
                          abstract_syntax.to_string());
    return presentation_context_ac{
        pc.id, presentation_context_result::transfer_syntaxes_not_supported};
}

}  // namespace dicom_ul::network
