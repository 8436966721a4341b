/**
 * @file context_negotiator.hpp
 * @brief Presentation context negotiation for the acceptor side
 *
 * @see DICOM PS3.8 Section 9.3.3.2 - Presentation Context Item (AC)
 */

#ifndef DICOM_UL_NETWORK_CONTEXT_NEGOTIATOR_HPP
#define DICOM_UL_NETWORK_CONTEXT_NEGOTIATOR_HPP

#include "dicom_ul/network/pdu_types.hpp"

#include <dicom_ul/core/result.hpp>
#include <dicom_ul/registry/uid_registry.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dicom_ul::network {

/**
 * @brief Local capabilities: abstract syntax -> supported transfer syntaxes
 *
 * std::map keeps iteration order independent of insertion and hashing.
 */
using negotiation_policy = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Decides the A-ASSOCIATE-AC result of each proposed context.
 *
 * For each proposed context, in request order:
 * - an abstract syntax missing from the policy, or not a well-formed UID,
 *   yields abstract_syntax_not_supported;
 * - otherwise the requester's transfer syntaxes are walked in the order
 *   proposed and the first one the policy lists is accepted;
 * - no overlap yields transfer_syntaxes_not_supported.
 *
 * Context IDs that are even, zero or duplicated make the whole request
 * invalid; negotiate() then returns invalid_presentation_context_id and the
 * association must be rejected rather than answered per context.
 *
 * The negotiator holds no mutable state; one instance may serve any number
 * of associations concurrently.
 */
class context_negotiator {
public:
    context_negotiator(negotiation_policy policy,
                       std::shared_ptr<const registry::uid_registry> registry);

    [[nodiscard]] Result<std::vector<presentation_context_ac>> negotiate(
        const std::vector<presentation_context_rq>& proposed) const;

    /**
     * @brief Check IDs without negotiating (odd, non-zero, unique)
     */
    [[nodiscard]] static VoidResult validate_context_ids(
        const std::vector<presentation_context_rq>& proposed);

    [[nodiscard]] bool supports_abstract_syntax(const std::string& uid) const;

    [[nodiscard]] const negotiation_policy& policy() const noexcept { return policy_; }

    [[nodiscard]] const registry::uid_registry& uid_registry() const noexcept {
        return *registry_;
    }

    /**
     * @brief Policy accepting each abstract syntax with the given syntaxes
     */
    [[nodiscard]] static negotiation_policy make_policy(
        const std::vector<std::string>& abstract_syntaxes,
        const std::vector<std::string>& transfer_syntaxes);

private:
    [[nodiscard]] presentation_context_ac negotiate_one(
        const presentation_context_rq& pc) const;

    negotiation_policy policy_;
    std::shared_ptr<const registry::uid_registry> registry_;
};

}  // namespace dicom_ul::network

#endif  // DICOM_UL_NETWORK_CONTEXT_NEGOTIATOR_HPP
