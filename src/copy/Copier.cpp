/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Copier.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/Manifest.hpp"
#include "image/ManifestList.hpp"
#include "blobinfocache/MemoryCache.hpp"
#include "transports/Transports.hpp"
#include "copy/ImageCopier.hpp"
#include "copy/MultipleImageCopier.hpp"


namespace carrier {
namespace copy {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Copy", level);
}

std::string copyImage(const signature::PolicyContext& policyContext,
                      const transports::ImageReference& destRef,
                      const transports::ImageReference& srcRef,
                      const Options& options) {
    printLog(boost::format("Copying %s to %s") % transports::imageNameOf(srcRef) % transports::imageNameOf(destRef),
             libcarrier::LogLevel::INFO);

    auto destination = std::unique_ptr<transports::ImageDestination>{};
    try {
        destination = destRef.newImageDestination(options.destinationContext);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("initializing destination %s") % transports::imageNameOf(destRef);
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    auto rawSource = std::unique_ptr<transports::ImageSource>{};
    try {
        rawSource = srcRef.newImageSource(options.sourceContext);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("initializing source %s") % transports::imageNameOf(srcRef);
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    Copier copier{policyContext, *destination, *rawSource, options};
    return copier.copy();
}

bool shouldRequireCompressionFormatMatch(const Options& options) {
    if(options.forceCompressionFormat && !options.destinationCompressionFormat) {
        CARRIER_THROW_ERROR("cannot use ForceCompressionFormat with undefined default compression format");
    }
    return options.forceCompressionFormat;
}

bool supportsMultipleImages(const transports::ImageDestination& destination) {
    auto mimeTypes = destination.getSupportedManifestMIMETypes();
    if(mimeTypes.empty()) {
        return true;
    }
    for(const auto& mimeType : mimeTypes) {
        if(image::isMultiImage(mimeType)) {
            return true;
        }
    }
    return false;
}

Copier::Copier(const signature::PolicyContext& policyContext,
               transports::ImageDestination& destination,
               transports::ImageSource& rawSource,
               const Options& options)
    : policyContext(policyContext)
    , destination(destination)
    , rawSource(rawSource)
    , options(options)
    , unparsedToplevel{rawSource, boost::none}
    , blobInfoCache{options.blobInfoCache}
{
    if(!blobInfoCache) {
        blobInfoCache = std::make_shared<blobinfocache::MemoryCache>();
    }

    // Blobs are copied in parallel only if both sides allow it. Otherwise the copy
    // counts as a single blob copy against a semaphore shared with other copies.
    if(destination.hasThreadSafePutBlob() && rawSource.hasThreadSafeGetBlob()) {
        if(options.concurrentBlobCopiesSemaphore) {
            concurrentBlobCopiesSemaphore = options.concurrentBlobCopiesSemaphore;
        }
        else {
            auto permits = options.maxParallelDownloads > 0 ? options.maxParallelDownloads : DEFAULT_MAX_PARALLEL_DOWNLOADS;
            concurrentBlobCopiesSemaphore = std::make_shared<Semaphore>(permits);
        }
    }
    else {
        concurrentBlobCopiesSemaphore = std::make_shared<Semaphore>(1);
        if(options.concurrentBlobCopiesSemaphore) {
            externalSemaphorePermit.reset(new SemaphorePermit{*options.concurrentBlobCopiesSemaphore,
                                                              options.cancellation.get()});
        }
    }
}

std::string Copier::copy() {
    auto toplevelMIMEType = std::string{};
    try {
        toplevelMIMEType = unparsedToplevel.getManifest().second;
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("reading manifest for %s") % transports::imageNameOf(rawSource.getReference());
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    auto copiedManifest = std::string{};
    if(!image::isMultiImage(toplevelMIMEType)) {
        if(!options.ensureCompressionVariantsExist.empty()) {
            CARRIER_THROW_ERROR("EnsureCompressionVariantsExist is not implemented when not creating a multi-architecture image");
        }
        auto singleOptions = CopySingleImageOptions{};
        singleOptions.requireCompressionFormatMatch = shouldRequireCompressionFormatMatch(options);
        copiedManifest = copySingleImage(*this, unparsedToplevel, boost::none, singleOptions).manifest;
    }
    else if(options.imageListSelection == ImageListSelection::CopySystemImage) {
        if(!options.ensureCompressionVariantsExist.empty()) {
            CARRIER_THROW_ERROR("EnsureCompressionVariantsExist is not implemented when not creating a multi-architecture image");
        }
        auto singleOptions = CopySingleImageOptions{};
        singleOptions.requireCompressionFormatMatch = shouldRequireCompressionFormatMatch(options);

        auto list = image::listFromBlob(unparsedToplevel.getManifest().first, toplevelMIMEType);
        auto instanceDigest = image::Digest{};
        try {
            instanceDigest = list->chooseInstanceByCompression(options.platformChoice, options.preferGzipInstances);
        }
        catch(libcarrier::Error& e) {
            CARRIER_RETHROW_ERROR(e, "choosing an image from manifest list");
        }
        printLog(boost::format("Source is a manifest list; copying (only) instance %s for current system") % instanceDigest,
                 libcarrier::LogLevel::DEBUG);

        UnparsedInstance unparsedInstance{rawSource, instanceDigest};
        try {
            copiedManifest = copySingleImage(*this, unparsedInstance, boost::none, singleOptions).manifest;
        }
        catch(libcarrier::Error& e) {
            CARRIER_RETHROW_ERROR(e, "copying system image from manifest list");
        }
    }
    else {
        if(!supportsMultipleImages(destination)) {
            auto message = boost::format("copying multiple images: destination transport \"%s\" does not support"
                                         " copying multiple images as a group")
                % destination.getReference().getTransport().getName();
            CARRIER_THROW_ERROR(message.str());
        }
        copiedManifest = copyMultipleImages(*this);
    }

    try {
        destination.commit();
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "committing the finished image");
    }
    printLog(boost::format("Copy of %s to %s completed")
                % transports::imageNameOf(rawSource.getReference())
                % transports::imageNameOf(destination.getReference()),
             libcarrier::LogLevel::DEBUG);
    return copiedManifest;
}

bool Copier::reportsProgress() const {
    return options.progress && options.progressInterval.count() > 0;
}

void Copier::reportProgress(const ProgressEvent& event) {
    if(options.progress) {
        options.progress->offer(event);
    }
}

std::vector<std::string> Copier::sourceSignatures(UnparsedInstance& instance,
                                                  const std::string& gettingSignaturesMessage,
                                                  const std::string& checkingDestinationMessage) {
    if(options.removeSignatures) {
        return {};
    }

    printLog(boost::format(gettingSignaturesMessage), libcarrier::LogLevel::INFO);
    auto signatures = std::vector<std::string>{};
    try {
        signatures = instance.getSignatures();
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "reading signatures");
    }

    if(!signatures.empty()) {
        printLog(boost::format(checkingDestinationMessage), libcarrier::LogLevel::INFO);
        try {
            destination.supportsSignatures();
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("Can not copy signatures to %s") % transports::imageNameOf(destination.getReference());
            CARRIER_RETHROW_ERROR(e, message.str());
        }
    }
    return signatures;
}

std::vector<std::string> Copier::createSignatures(const std::string& manifest,
                                                  const boost::optional<image::DockerReference>& identity) {
    if(options.signers.empty()) {
        return {};
    }

    auto signedIdentity = identity;
    if(!signedIdentity) {
        signedIdentity = destination.getReference().getDockerReference();
        if(!signedIdentity) {
            auto message = boost::format("Cannot determine canonical Docker reference for destination %s")
                % transports::imageNameOf(destination.getReference());
            CARRIER_THROW_ERROR(message.str());
        }
    }

    try {
        destination.supportsSignatures();
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("Can not sign image: destination %s does not support signatures")
            % transports::imageNameOf(destination.getReference());
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    auto signatures = std::vector<std::string>{};
    for(size_t i = 0; i < options.signers.size(); ++i) {
        auto& signer = *options.signers[i];
        printLog(boost::format(signer.getProgressMessage()), libcarrier::LogLevel::INFO);
        try {
            signatures.push_back(signer.signImageManifest(manifest, *signedIdentity));
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("creating signature %d") % (i + 1);
            CARRIER_RETHROW_ERROR(e, message.str());
        }
    }
    return signatures;
}

}
}
