/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Transports.hpp"

#include <map>
#include <mutex>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "transports/OCILayout.hpp"
#include "transports/Directory.hpp"


namespace carrier {
namespace transports {

namespace {

struct Registry {
    Registry() {
        transports["oci"] = std::make_shared<OCITransport>();
        transports["dir"] = std::make_shared<DirectoryTransport>();
    }
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<const ImageTransport>> transports;
};

Registry& getRegistry() {
    static Registry registry;
    return registry;
}

}

void Transports::registerTransport(std::shared_ptr<const ImageTransport> transport) {
    auto& registry = getRegistry();
    std::lock_guard<std::mutex> lock{registry.mutex};
    auto name = transport->getName();
    if(registry.transports.count(name) > 0) {
        auto message = boost::format("Duplicate image transport name %s") % name;
        CARRIER_THROW_ERROR(message.str());
    }
    registry.transports[name] = std::move(transport);
}

std::shared_ptr<const ImageTransport> Transports::get(const std::string& name) {
    auto& registry = getRegistry();
    std::lock_guard<std::mutex> lock{registry.mutex};
    auto it = registry.transports.find(name);
    if(it == registry.transports.cend()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> Transports::getNames() {
    auto& registry = getRegistry();
    std::lock_guard<std::mutex> lock{registry.mutex};
    auto names = std::vector<std::string>{};
    for(const auto& entry : registry.transports) {
        names.push_back(entry.first);
    }
    return names;
}

std::unique_ptr<ImageReference> parseImageName(const std::string& imageName) {
    auto separator = imageName.find(':');
    if(separator == std::string::npos) {
        auto message = boost::format("Invalid image name \"%s\", expected colon-separated transport:reference") % imageName;
        CARRIER_THROW_ERROR(message.str());
    }
    auto transportName = imageName.substr(0, separator);
    auto transport = Transports::get(transportName);
    if(!transport) {
        auto message = boost::format("Invalid image name \"%s\", unknown transport \"%s\"") % imageName % transportName;
        CARRIER_THROW_ERROR(message.str());
    }
    try {
        return transport->parseReference(imageName.substr(separator + 1));
    }
    catch(const libcarrier::Error& e) {
        auto message = boost::format("Invalid image name \"%s\"") % imageName;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

std::string imageNameOf(const ImageReference& reference) {
    return reference.getTransport().getName() + ":" + reference.stringWithinTransport();
}

}
}
