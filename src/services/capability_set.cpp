/**
 * @file capability_set.cpp
 * @brief Implementation of the service handler registry
 */

#include <dicom_ul/services/capability_set.hpp>

#include <dicom_ul/integration/logger_adapter.hpp>

#include <exception>

namespace dicom_ul::services {

namespace {

constexpr std::size_t index_of(dimse_service service) noexcept {
    return static_cast<std::size_t>(service);
}

}  // namespace

capability_set& capability_set::on(dimse_service service, service_handler handler) {
    handlers_[index_of(service)] = std::move(handler);
    return *this;
}

capability_set& capability_set::with_verification() {
    return on(dimse_service::c_echo, [](const service_request& request) {
        return response_stream::single(
            network::dimse::make_response(request.message, network::dimse::status_success));
    });
}

bool capability_set::supports(dimse_service service) const noexcept {
    return static_cast<bool>(handlers_[index_of(service)]);
}

std::vector<dimse_service> capability_set::services() const {
    std::vector<dimse_service> result;
    for (auto service : all_dimse_services) {
        if (supports(service)) {
            result.push_back(service);
        }
    }
    return result;
}

response_stream capability_set::invoke(dimse_service service,
                                       const service_request& request) const {
    const auto& handler = handlers_[index_of(service)];
    if (!handler) {
        return response_stream::failed(error_info{error_codes::service_not_registered,
            std::string(to_string(service)) + " is not provided", "services"});
    }

    try {
        return handler(request);
    } catch (const std::exception& e) {
        integration::logger_adapter::warn("{} handler threw: {}", to_string(service), e.what());
        return response_stream::failed(error_info{error_codes::service_processing_failed,
            std::string(to_string(service)) + " handler failed: " + e.what(), "services"});
    }
}

}  // namespace dicom_ul::services
