/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "MultipleImageCopier.hpp"

#include <set>
#include <algorithm>

#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/Manifest.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "copy/Copier.hpp"
#include "copy/ImageCopier.hpp"
#include "copy/ManifestConversion.hpp"
#include "copy/UnparsedInstance.hpp"


namespace carrier {
namespace copy {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Copy", level);
}

static std::string platformKey(const boost::optional<image::Platform>& platform) {
    if(!platform) {
        return "";
    }
    return image::getPlatformComparableKey(*platform);
}

static std::map<std::string, std::set<std::string>> platformCompressionMap(const image::ManifestList& list,
                                                                           const std::vector<image::Digest>& instanceDigests) {
    auto map = std::map<std::string, std::set<std::string>>{};
    for(const auto& digest : instanceDigests) {
        auto details = image::ListUpdate{};
        try {
            details = list.getInstance(digest);
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("getting details for instance %s") % digest;
            CARRIER_RETHROW_ERROR(e, message.str());
        }
        auto& names = map[platformKey(details.readOnly.platform)];
        names.insert(details.readOnly.compressionAlgorithmNames.cbegin(), details.readOnly.compressionAlgorithmNames.cend());
    }
    return map;
}

std::vector<InstanceCopy> prepareInstanceCopies(const image::ManifestList& list,
                                                const std::vector<image::Digest>& instanceDigests,
                                                const Options& options) {
    auto copies = std::vector<InstanceCopy>{};
    if(options.imageListSelection == ImageListSelection::CopySpecificImages
       && !options.ensureCompressionVariantsExist.empty()) {
        CARRIER_THROW_ERROR("EnsureCompressionVariantsExist is not implemented for CopySpecificImages");
    }
    for(const auto& variant : options.ensureCompressionVariantsExist) {
        try {
            compression::algorithmByName(variant.algorithm.getName());
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("invalid algorithm \"%s\" in option.EnsureCompressionVariantsExist")
                % variant.algorithm.getName();
            CARRIER_RETHROW_ERROR(e, message.str());
        }
    }

    auto compressionsByPlatform = platformCompressionMap(list, instanceDigests);
    for(size_t i = 0; i < instanceDigests.size(); ++i) {
        const auto& digest = instanceDigests[i];
        if(options.imageListSelection == ImageListSelection::CopySpecificImages
           && std::find(options.instances.cbegin(), options.instances.cend(), digest) == options.instances.cend()) {
            printLog(boost::format("Skipping instance %s (%d/%d)") % digest % (i + 1) % instanceDigests.size(),
                     libcarrier::LogLevel::DEBUG);
            continue;
        }
        auto details = list.getInstance(digest);

        auto copy = InstanceCopy{};
        copy.kind = InstanceCopyKind::Copy;
        copy.sourceDigest = digest;
        copy.copyForceCompressionFormat = shouldRequireCompressionFormatMatch(options);
        copies.push_back(copy);

        auto& platformCompressions = compressionsByPlatform[platformKey(details.readOnly.platform)];
        for(const auto& variant : options.ensureCompressionVariantsExist) {
            if(platformCompressions.count(variant.algorithm.getName()) > 0) {
                continue;
            }
            auto clone = InstanceCopy{};
            clone.kind = InstanceCopyKind::Clone;
            clone.sourceDigest = digest;
            clone.cloneArtifactType = details.readOnly.artifactType;
            clone.cloneCompressionVariant = variant;
            clone.clonePlatform = details.readOnly.platform;
            clone.cloneAnnotations = details.readOnly.annotations;
            copies.push_back(clone);
            platformCompressions.insert(variant.algorithm.getName());
        }
    }
    return copies;
}

std::string copyMultipleImages(Copier& session) {
    const auto& options = session.getOptions();
    auto& destination = session.getDestination();

    auto manifestList = std::pair<std::string, std::string>{};
    try {
        manifestList = session.getUnparsedToplevel().getManifest();
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "reading manifest list");
    }
    auto originalList = std::unique_ptr<image::ManifestList>{};
    try {
        originalList = image::listFromBlob(manifestList.first, manifestList.second);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("parsing manifest list \"%s\"") % manifestList.first;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
    auto updatedList = originalList->clone();

    auto signatures = session.sourceSignatures(session.getUnparsedToplevel(),
                                               "Getting image list signatures",
                                               "Checking if image list destination supports signatures");

    auto destIsDigestedReference = false;
    auto destReference = destination.getReference().getDockerReference();
    if(destReference && !destReference->digest.empty()) {
        destIsDigestedReference = true;
        if(!image::manifestMatchesDigest(manifestList.first, image::Digest::parse(destReference->digest))) {
            CARRIER_THROW_ERROR("Digest of source image's manifest would not match destination reference");
        }
    }

    auto cannotModifyManifestListReason = std::string{};
    if(!signatures.empty()) {
        cannotModifyManifestListReason = "Would invalidate signatures";
    }
    if(destIsDigestedReference) {
        cannotModifyManifestListReason = "Destination specifies a digest";
    }
    if(options.preserveDigests) {
        cannotModifyManifestListReason = "Instructed to preserve digests";
    }

    // A forced image manifest type implies the matching list type
    auto forceListMIMEType = options.forceManifestMIMEType;
    if(forceListMIMEType == image::mediatype::dockerV2Schema1
       || forceListMIMEType == image::mediatype::dockerV2Schema1Signed
       || forceListMIMEType == image::mediatype::dockerV2Schema2) {
        forceListMIMEType = image::mediatype::dockerV2List;
    }
    else if(forceListMIMEType == image::mediatype::ociImageManifest) {
        forceListMIMEType = image::mediatype::ociImageIndex;
    }

    auto conversion = ListConversionPlan{};
    try {
        conversion = determineListConversion(manifestList.second,
                                             destination.getSupportedManifestMIMETypes(),
                                             forceListMIMEType);
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "determining manifest list type to write to destination");
    }
    if(conversion.selectedListType != originalList->getMIMEType() && !cannotModifyManifestListReason.empty()) {
        auto message = boost::format("Manifest list must be converted to type \"%s\" to be written to destination,"
                                     " but we cannot modify it: \"%s\"")
            % conversion.selectedListType % cannotModifyManifestListReason;
        CARRIER_THROW_ERROR(message.str());
    }

    auto instanceDigests = updatedList->getInstances();
    auto instanceCopies = std::vector<InstanceCopy>{};
    try {
        instanceCopies = prepareInstanceCopies(*updatedList, instanceDigests, options);
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "preparing instances for copy");
    }
    printLog(boost::format("Copying %d images generated from %d images in list")
                % instanceCopies.size() % instanceDigests.size(),
             libcarrier::LogLevel::INFO);

    auto edits = std::vector<image::ListEdit>{};
    for(size_t i = 0; i < instanceCopies.size(); ++i) {
        const auto& instance = instanceCopies[i];
        UnparsedInstance unparsedInstance{session.getRawSource(), instance.sourceDigest};

        if(instance.kind == InstanceCopyKind::Copy) {
            printLog(boost::format("Copying image %s (%d/%d)") % instance.sourceDigest % (i + 1) % instanceCopies.size(),
                     libcarrier::LogLevel::INFO);
            auto singleOptions = CopySingleImageOptions{};
            singleOptions.requireCompressionFormatMatch = instance.copyForceCompressionFormat;
            auto updated = CopySingleImageResult{};
            try {
                updated = copySingleImage(session, unparsedInstance, instance.sourceDigest, singleOptions);
            }
            catch(libcarrier::Error& e) {
                auto message = boost::format("copying image %d/%d from manifest list") % (i + 1) % instanceCopies.size();
                CARRIER_RETHROW_ERROR(e, message.str());
            }
            auto edit = image::ListEdit{};
            edit.operation = image::ListOperation::Update;
            edit.updateOldDigest = instance.sourceDigest;
            edit.updateDigest = updated.manifestDigest;
            edit.updateSize = static_cast<int64_t>(updated.manifest.size());
            edit.updateMediaType = updated.manifestMIMEType;
            edit.updateCompressionAlgorithms = updated.compressionAlgorithms;
            edits.push_back(std::move(edit));
        }
        else {
            printLog(boost::format("Replicating image %s (%d/%d)") % instance.sourceDigest % (i + 1) % instanceCopies.size(),
                     libcarrier::LogLevel::INFO);
            auto singleOptions = CopySingleImageOptions{};
            singleOptions.requireCompressionFormatMatch = true;
            singleOptions.compressionFormat = instance.cloneCompressionVariant->algorithm;
            singleOptions.compressionLevel = instance.cloneCompressionVariant->level;
            auto updated = CopySingleImageResult{};
            try {
                updated = copySingleImage(session, unparsedInstance, instance.sourceDigest, singleOptions);
            }
            catch(libcarrier::Error& e) {
                auto message = boost::format("replicating image %d/%d from manifest list") % (i + 1) % instanceCopies.size();
                CARRIER_RETHROW_ERROR(e, message.str());
            }
            auto edit = image::ListEdit{};
            edit.operation = image::ListOperation::Add;
            edit.addDigest = updated.manifestDigest;
            edit.addSize = static_cast<int64_t>(updated.manifest.size());
            edit.addMediaType = updated.manifestMIMEType;
            edit.addArtifactType = instance.cloneArtifactType;
            edit.addPlatform = instance.clonePlatform;
            edit.addAnnotations = instance.cloneAnnotations;
            edit.addCompressionAlgorithms = updated.compressionAlgorithms;
            edits.push_back(std::move(edit));
        }
    }

    try {
        updatedList->editInstances(edits);
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "updating manifest list");
    }

    printLog(boost::format("Writing manifest list to image destination"), libcarrier::LogLevel::INFO);
    auto listTypes = std::vector<std::string>{conversion.selectedListType};
    listTypes.insert(listTypes.end(), conversion.otherListTypeCandidates.cbegin(), conversion.otherListTypeCandidates.cend());
    auto originalSerialized = originalList->serialize();
    auto errors = std::vector<std::string>{};
    auto written = boost::optional<std::string>{};
    for(const auto& listType : listTypes) {
        printLog(boost::format("Trying to use manifest list type %s") % listType, libcarrier::LogLevel::DEBUG);

        auto attemptedList = std::unique_ptr<image::ManifestList>{};
        try {
            attemptedList = listType != updatedList->getMIMEType()
                ? updatedList->convertToMIMEType(listType)
                : updatedList->clone();
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("converting manifest list to list with MIME type \"%s\"") % listType;
            CARRIER_RETHROW_ERROR(e, message.str());
        }

        auto attempted = attemptedList->serialize();
        if(attempted != originalSerialized) {
            if(!cannotModifyManifestListReason.empty()) {
                auto message = boost::format("Manifest list must be converted to type \"%s\" to be written to destination,"
                                             " but we cannot modify it: \"%s\"")
                    % listType % cannotModifyManifestListReason;
                CARRIER_THROW_ERROR(message.str());
            }
            printLog(boost::format("Manifest list has been updated"), libcarrier::LogLevel::DEBUG);
        }
        else {
            // Unchanged, keep the original bytes
            attempted = manifestList.first;
        }

        try {
            destination.putManifest(attempted, listType, boost::none);
        }
        catch(libcarrier::Error& e) {
            printLog(boost::format("Upload of manifest list type %s failed: %s") % listType % e.what(),
                     libcarrier::LogLevel::DEBUG);
            errors.push_back((boost::format("%s(%s)") % listType % e.what()).str());
            continue;
        }
        written = attempted;
        break;
    }
    if(!written) {
        auto message = boost::format("Uploading manifest list failed, attempted the following formats: %s")
            % boost::algorithm::join(errors, ", ");
        CARRIER_THROW_ERROR(message.str());
    }

    auto newSignatures = session.createSignatures(*written, options.signIdentity);
    signatures.insert(signatures.end(), newSignatures.cbegin(), newSignatures.cend());
    printLog(boost::format("Storing list signatures"), libcarrier::LogLevel::INFO);
    try {
        destination.putSignatures(signatures, boost::none);
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "writing signatures");
    }
    return *written;
}

}
}
