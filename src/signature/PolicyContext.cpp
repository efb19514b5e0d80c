/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PolicyContext.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"


namespace carrier {
namespace signature {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Policy", level);
}

PolicyContext::PolicyContext(Policy policy)
    : policy(std::move(policy))
{}

/**
 * The most specific scope wins: the exact identity, then its namespaces from
 * the most specific, then the transport's "" scope, then the global default.
 */
const PolicyRequirements& PolicyContext::requirementsForImage(const UnparsedImage& image) const {
    auto transportName = image.getTransportName();
    auto transport = policy.transports.find(transportName);
    if(transport != policy.transports.cend()) {
        const auto& scopes = transport->second;
        auto identity = image.getPolicyConfigurationIdentity();
        auto it = scopes.find(identity);
        if(it != scopes.cend()) {
            printLog(boost::format("Using transport %s policy section %s") % transportName % identity,
                     libcarrier::LogLevel::DEBUG);
            return it->second;
        }
        for(const auto& name : image.getPolicyConfigurationNamespaces()) {
            it = scopes.find(name);
            if(it != scopes.cend()) {
                printLog(boost::format("Using transport %s specific policy section %s") % transportName % name,
                         libcarrier::LogLevel::DEBUG);
                return it->second;
            }
        }
        it = scopes.find("");
        if(it != scopes.cend()) {
            printLog(boost::format("Using transport %s policy section \"\"") % transportName,
                     libcarrier::LogLevel::DEBUG);
            return it->second;
        }
    }
    printLog(boost::format("Using default policy section"), libcarrier::LogLevel::DEBUG);
    return policy.defaultRequirements;
}

void PolicyContext::checkImageAllowed(UnparsedImage& image) const {
    auto logName = image.getTransportName() + ":" + image.getPolicyConfigurationIdentity();
    printLog(boost::format("Checking policy for image %s") % logName, libcarrier::LogLevel::DEBUG);

    const auto& requirements = requirementsForImage(image);
    if(requirements.empty()) {
        CARRIER_THROW_TYPED_ERROR(libcarrier::PolicyRejectedError,
                                  "Source image rejected: List of verification policy requirements must not be empty");
    }
    for(size_t i=0; i<requirements.size(); ++i) {
        auto reason = requirements[i]->isRunningImageAllowed(image);
        if(!reason.empty()) {
            printLog(boost::format("Requirement %d: denied, done") % i, libcarrier::LogLevel::DEBUG);
            auto message = boost::format("Source image rejected: %s") % reason;
            CARRIER_THROW_TYPED_ERROR(libcarrier::PolicyRejectedError, message.str());
        }
        printLog(boost::format("Requirement %d: allowed") % i, libcarrier::LogLevel::DEBUG);
    }
    printLog(boost::format("Overall: allowed"), libcarrier::LogLevel::DEBUG);
}

}
}
