/**
 * @file capability_set.hpp
 * @brief Registry of the DIMSE services an application entity provides
 */

#ifndef DICOM_UL_SERVICES_CAPABILITY_SET_HPP
#define DICOM_UL_SERVICES_CAPABILITY_SET_HPP

#include "dimse_service.hpp"
#include "response_stream.hpp"

#include <dicom_ul/core/result.hpp>
#include <dicom_ul/network/dimse/dimse_message.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dicom_ul::services {

/**
 * @brief Everything a handler knows about one incoming request
 */
struct service_request {
    /// Presentation context the request arrived on
    uint8_t context_id{0};

    /// Abstract syntax negotiated for that context
    std::string abstract_syntax;

    /// Transfer syntax of the request's data set
    std::string transfer_syntax;

    /// Calling AE title of the association
    std::string calling_ae;

    network::dimse::dimse_message message;
};

/**
 * @brief Produces the responses for one request
 *
 * The returned stream must end with exactly one non-pending response.
 * A handler may report failure by returning response_stream::failed(), by
 * letting the stream yield an error, or by throwing; the association then
 * answers with the service's failure status.
 */
using service_handler = std::function<response_stream(const service_request&)>;

/**
 * @brief Maps each dimse_service to at most one handler
 *
 * Built before the association starts and read-only afterwards, so it can
 * be shared by several associations without locking.
 *
 * @example
 * @code
 * capability_set caps;
 * caps.on(dimse_service::c_echo, [](const service_request& rq) {
 *     return response_stream::single(make_response(rq.message, status_success));
 * });
 * @endcode
 */
class capability_set {
public:
    capability_set() = default;

    /**
     * @brief Register or replace the handler for @p service
     */
    capability_set& on(dimse_service service, service_handler handler);

    /**
     * @brief Answer C-ECHO with a single success response
     */
    capability_set& with_verification();

    [[nodiscard]] bool supports(dimse_service service) const noexcept;

    /// Registered services in enumeration order
    [[nodiscard]] std::vector<dimse_service> services() const;

    /**
     * @brief Run the handler for @p service
     *
     * A missing handler yields a stream failing with service_not_registered;
     * an exception escaping the handler yields one failing with
     * service_processing_failed. Never throws.
     */
    [[nodiscard]] response_stream invoke(dimse_service service,
                                         const service_request& request) const;

private:
    std::array<service_handler, dimse_service_count> handlers_{};
};

}  // namespace dicom_ul::services

#endif  // DICOM_UL_SERVICES_CAPABILITY_SET_HPP
