/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_Copier_hpp
#define carrier_copy_Copier_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/optional.hpp>

#include "image/DockerReference.hpp"
#include "signature/Signer.hpp"
#include "signature/PolicyContext.hpp"
#include "blobinfocache/BlobInfoCache.hpp"
#include "transports/ImageReference.hpp"
#include "transports/ImageSource.hpp"
#include "transports/ImageDestination.hpp"
#include "copy/Options.hpp"
#include "copy/Semaphore.hpp"
#include "copy/ProgressChannel.hpp"
#include "copy/UnparsedInstance.hpp"


namespace carrier {
namespace copy {

/**
 * Copies the image referenced by srcRef to destRef, after checking that the
 * policy admits it. Returns the manifest written to the destination: the one of
 * the copied instance when a single image is picked from a list.
 */
std::string copyImage(const signature::PolicyContext& policyContext,
                      const transports::ImageReference& destRef,
                      const transports::ImageReference& srcRef,
                      const Options& options = Options{});

/**
 * State shared by all the images copied by one copyImage call.
 */
class Copier {
public:
    Copier(const signature::PolicyContext& policyContext,
           transports::ImageDestination& destination,
           transports::ImageSource& rawSource,
           const Options& options);
    Copier(const Copier&) = delete;
    Copier& operator=(const Copier&) = delete;

    // Copies the image(s) and commits the destination
    std::string copy();

    const signature::PolicyContext& getPolicyContext() const { return policyContext; }
    transports::ImageDestination& getDestination() { return destination; }
    transports::ImageSource& getRawSource() { return rawSource; }
    const Options& getOptions() const { return options; }
    UnparsedInstance& getUnparsedToplevel() { return unparsedToplevel; }
    blobinfocache::BlobInfoCache& getBlobInfoCache() { return *blobInfoCache; }
    Semaphore& getConcurrentBlobCopiesSemaphore() { return *concurrentBlobCopiesSemaphore; }
    const CancellationToken* getCancellationToken() const { return options.cancellation.get(); }

    bool reportsProgress() const;
    void reportProgress(const ProgressEvent& event);

    // Signatures to carry over from the source, checking that the destination can store them
    std::vector<std::string> sourceSignatures(UnparsedInstance& instance,
                                              const std::string& gettingSignaturesMessage,
                                              const std::string& checkingDestinationMessage);
    // Signatures of the configured signers over manifest
    std::vector<std::string> createSignatures(const std::string& manifest,
                                              const boost::optional<image::DockerReference>& identity);

private:
    const signature::PolicyContext& policyContext;
    transports::ImageDestination& destination;
    transports::ImageSource& rawSource;
    const Options& options;
    UnparsedInstance unparsedToplevel;
    std::shared_ptr<blobinfocache::BlobInfoCache> blobInfoCache;
    std::shared_ptr<Semaphore> concurrentBlobCopiesSemaphore;
    // Held for the whole copy when blobs are copied one at a time
    std::unique_ptr<SemaphorePermit> externalSemaphorePermit;
};

// Whether reused blobs must be compressed with the destination compression format
bool shouldRequireCompressionFormatMatch(const Options& options);

// Whether the destination accepts manifest lists
bool supportsMultipleImages(const transports::ImageDestination& destination);

}
}

#endif
