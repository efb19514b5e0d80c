/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ManifestConversion.hpp"

#include <set>
#include <algorithm>

#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/Manifest.hpp"
#include "image/mediaTypes.hpp"


namespace carrier {
namespace copy {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Copy", level);
}

namespace {

// Strings in insertion order, each one at most once
class OrderedSet {
public:
    void append(const std::string& s) {
        if(included.insert(s).second) {
            list.push_back(s);
        }
    }
    const std::vector<std::string>& getList() const { return list; }

private:
    std::vector<std::string> list;
    std::set<std::string> included;
};

}

const std::vector<std::string>& getPreferredManifestMIMETypes() {
    // schema2 doesn't need changes when uploaded elsewhere. Unsigned schema1 is left out:
    // registries require a signature even when the unsigned type is used.
    static const auto types = std::vector<std::string>{
        image::mediatype::dockerV2Schema2,
        image::mediatype::dockerV2Schema1Signed
    };
    return types;
}

const std::vector<std::string>& getAllManifestMIMETypes() {
    static const auto types = std::vector<std::string>{
        image::mediatype::ociImageManifest,
        image::mediatype::dockerV2Schema2,
        image::mediatype::dockerV2Schema1Signed,
        image::mediatype::dockerV2Schema1
    };
    return types;
}

const std::vector<std::string>& getSupportedListMIMETypes() {
    static const auto types = std::vector<std::string>{
        image::mediatype::dockerV2List,
        image::mediatype::ociImageIndex
    };
    return types;
}

static void throwNoSupportedType(const ManifestConversionInputs& inputs,
                                 const std::vector<std::string>& destSupportedManifestMIMETypes,
                                 bool restrictiveCompressionRequired) {
    auto compressionName = inputs.requestedCompressionFormat
        ? inputs.requestedCompressionFormat->getName()
        : std::string{};

    if(!inputs.forceManifestMIMEType.empty()) {
        if(inputs.requiresOCIEncryption && restrictiveCompressionRequired) {
            auto message = boost::format("compression using %s, and encryption, required together with format %s, which does not support both")
                % compressionName % inputs.forceManifestMIMEType;
            CARRIER_THROW_ERROR(message.str());
        }
        else if(inputs.requiresOCIEncryption) {
            auto message = boost::format("encryption required together with format %s, which does not support encryption")
                % inputs.forceManifestMIMEType;
            CARRIER_THROW_ERROR(message.str());
        }
        else if(restrictiveCompressionRequired) {
            auto message = boost::format("compression using %s required together with format %s, which does not support it")
                % compressionName % inputs.forceManifestMIMEType;
            CARRIER_THROW_ERROR(message.str());
        }
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError,
                                  "Internal error: forceManifestMIMEType was rejected for an unknown reason");
    }

    if(inputs.destSupportedManifestMIMETypes.empty()) {
        if(!restrictiveCompressionRequired) {
            CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError,
                                      "Internal error: destination accepts any manifest type but none was supported");
        }
        auto message = boost::format("compression using %s required, but none of the known manifest formats support it")
            % compressionName;
        CARRIER_THROW_ERROR(message.str());
    }

    auto destMIMEList = boost::algorithm::join(destSupportedManifestMIMETypes, ", ");
    if(inputs.requiresOCIEncryption && restrictiveCompressionRequired) {
        auto message = boost::format("compression using %s, and encryption, required but the destination only supports MIME types [%s], none of which support both")
            % compressionName % destMIMEList;
        CARRIER_THROW_ERROR(message.str());
    }
    else if(inputs.requiresOCIEncryption) {
        auto message = boost::format("encryption required but the destination only supports MIME types [%s], none of which support encryption")
            % destMIMEList;
        CARRIER_THROW_ERROR(message.str());
    }
    else if(restrictiveCompressionRequired) {
        auto message = boost::format("compression using %s required but the destination only supports MIME types [%s], none of which support it")
            % compressionName % destMIMEList;
        CARRIER_THROW_ERROR(message.str());
    }
    CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError,
                              "Internal error: no supported manifest type although no restriction was requested");
}

ManifestConversionPlan determineManifestConversion(const ManifestConversionInputs& inputs) {
    auto srcType = inputs.srcMIMEType;
    auto normalizedSrcType = image::normalizedMIMEType(srcType);
    if(srcType != normalizedSrcType) {
        printLog(boost::format("Source manifest MIME type %s, treating it as %s") % srcType % normalizedSrcType,
                 libcarrier::LogLevel::DEBUG);
        srcType = normalizedSrcType;
    }

    auto destSupportedManifestMIMETypes = inputs.destSupportedManifestMIMETypes;
    if(!inputs.forceManifestMIMEType.empty()) {
        destSupportedManifestMIMETypes = {inputs.forceManifestMIMEType};
    }
    if(destSupportedManifestMIMETypes.empty()) {
        destSupportedManifestMIMETypes = getAllManifestMIMETypes();
    }

    auto restrictiveCompressionRequired = inputs.requestedCompressionFormat
        && !image::compressionAlgorithmIsUniversallySupported(*inputs.requestedCompressionFormat);
    auto supportedByDest = std::set<std::string>{};
    for(const auto& type : destSupportedManifestMIMETypes) {
        if(inputs.requiresOCIEncryption && !image::supportsEncryption(type)) {
            continue;
        }
        if(restrictiveCompressionRequired
           && !image::mimeTypeSupportsCompressionAlgorithm(type, *inputs.requestedCompressionFormat)) {
            continue;
        }
        supportedByDest.insert(type);
    }
    if(supportedByDest.empty()) {
        throwNoSupportedType(inputs, destSupportedManifestMIMETypes, restrictiveCompressionRequired);
    }

    auto prioritizedTypes = OrderedSet{};

    // keep the original manifest if possible
    if(supportedByDest.count(srcType) > 0) {
        prioritizedTypes.append(srcType);
    }
    if(!inputs.cannotModifyManifestReason.empty()) {
        printLog(boost::format("We can't modify the manifest, hoping for the best..."), libcarrier::LogLevel::DEBUG);
        auto plan = ManifestConversionPlan{};
        plan.preferredMIMEType = srcType;
        return plan;
    }

    for(const auto& type : getPreferredManifestMIMETypes()) {
        if(supportedByDest.count(type) > 0) {
            prioritizedTypes.append(type);
        }
    }
    for(const auto& type : destSupportedManifestMIMETypes) {
        if(supportedByDest.count(type) > 0) {
            prioritizedTypes.append(type);
        }
    }

    const auto& list = prioritizedTypes.getList();
    printLog(boost::format("Manifest has MIME type %s, ordered candidate list [%s]")
                % srcType % boost::algorithm::join(list, ", "),
             libcarrier::LogLevel::DEBUG);

    auto plan = ManifestConversionPlan{};
    plan.preferredMIMEType = list.front();
    plan.otherMIMETypeCandidates.assign(list.cbegin() + 1, list.cend());
    plan.preferredMIMETypeNeedsConversion = plan.preferredMIMEType != srcType;
    if(!plan.preferredMIMETypeNeedsConversion) {
        printLog(boost::format("... will first try using the original manifest unmodified"), libcarrier::LogLevel::DEBUG);
    }
    return plan;
}

ListConversionPlan determineListConversion(const std::string& currentListMIMEType,
                                           std::vector<std::string> destSupportedMIMETypes,
                                           const std::string& forcedListMIMEType) {
    if(destSupportedMIMETypes.empty()) {
        destSupportedMIMETypes = getSupportedListMIMETypes();
    }
    if(!forcedListMIMEType.empty()) {
        destSupportedMIMETypes = {forcedListMIMEType};
    }

    auto prioritizedTypes = OrderedSet{};
    if(std::find(destSupportedMIMETypes.cbegin(), destSupportedMIMETypes.cend(), currentListMIMEType)
       != destSupportedMIMETypes.cend()) {
        prioritizedTypes.append(currentListMIMEType);
    }
    for(const auto& type : destSupportedMIMETypes) {
        if(image::isMultiImage(type)) {
            prioritizedTypes.append(type);
        }
    }

    printLog(boost::format("Manifest list has MIME type %s, ordered candidate list [%s]")
                % currentListMIMEType % boost::algorithm::join(destSupportedMIMETypes, ", "),
             libcarrier::LogLevel::DEBUG);

    const auto& list = prioritizedTypes.getList();
    if(list.empty()) {
        auto message = boost::format("destination does not support any supported manifest list types (%s)")
            % boost::algorithm::join(getSupportedListMIMETypes(), ", ");
        CARRIER_THROW_ERROR(message.str());
    }

    auto plan = ListConversionPlan{};
    plan.selectedListType = list.front();
    plan.otherListTypeCandidates.assign(list.cbegin() + 1, list.cend());
    if(plan.selectedListType != currentListMIMEType) {
        printLog(boost::format("... will convert to %s first, and then try [%s]")
                    % plan.selectedListType % boost::algorithm::join(plan.otherListTypeCandidates, ", "),
                 libcarrier::LogLevel::DEBUG);
    }
    else {
        printLog(boost::format("... will use the original manifest list type, and then try [%s]")
                    % boost::algorithm::join(plan.otherListTypeCandidates, ", "),
                 libcarrier::LogLevel::DEBUG);
    }
    return plan;
}

}
}
