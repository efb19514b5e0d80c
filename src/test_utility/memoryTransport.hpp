/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_test_utility_memoryTransport_hpp
#define carrier_test_utility_memoryTransport_hpp

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <chrono>
#include <utility>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/DockerReference.hpp"
#include "transports/ImageReference.hpp"
#include "transports/ImageSource.hpp"
#include "transports/ImageDestination.hpp"


namespace test_utility {
namespace memory {

/**
 * Contents and behaviour of an in-memory image location, shared by the
 * references, sources and destinations created for it.
 */
struct MemoryStore {
    mutable std::mutex mutex;

    std::map<std::string, std::string> blobs;
    std::pair<std::string, std::string> manifest;
    std::map<std::string, std::pair<std::string, std::string>> instanceManifests;
    std::vector<std::string> signatures;
    std::map<std::string, std::vector<std::string>> instanceSignatures;
    bool committed = false;

    // Statistics
    std::map<std::string, size_t> blobReads;
    std::vector<std::string> putBlobDigests;
    std::vector<std::string> partialBlobDigests;
    std::map<std::string, size_t> blobChunkReads;
    size_t putManifestCalls = 0;
    size_t concurrentPutBlobs = 0;
    size_t maxConcurrentPutBlobs = 0;

    // Capabilities
    boost::optional<carrier::image::DockerReference> dockerReference;
    std::vector<std::string> supportedManifestMIMETypes;
    std::set<std::string> rejectedManifestMIMETypes;
    // Manifest types whose upload fails for reasons unrelated to the format
    std::set<std::string> failingManifestMIMETypes;
    bool acceptsSignatures = true;
    carrier::transports::LayerCompression desiredLayerCompression = carrier::transports::LayerCompression::PreserveOriginal;
    bool threadSafe = true;
    std::chrono::milliseconds putBlobDelay{0};
    // Ranged reads when used as source, chunked uploads when used as destination
    bool rangedReads = false;
    bool partialUploads = false;
    // Partial uploads ask for a full copy if set
    std::string partialUploadFallbackReason;

    bool hasBlob(const carrier::image::Digest& digest) const;
    std::string getBlob(const carrier::image::Digest& digest) const;
    size_t getBlobReads(const carrier::image::Digest& digest) const;
    size_t getBlobChunkReads(const carrier::image::Digest& digest) const;
    size_t getBlobCount() const;
};

class MemoryTransport : public carrier::transports::ImageTransport {
public:
    std::string getName() const override;
    std::unique_ptr<carrier::transports::ImageReference> parseReference(const std::string& reference) const override;
    void validatePolicyConfigurationScope(const std::string& scope) const override;
};

const MemoryTransport& getMemoryTransport();

class MemoryReference : public carrier::transports::ImageReference {
public:
    MemoryReference(std::shared_ptr<MemoryStore> store, const std::string& name);

    const carrier::transports::ImageTransport& getTransport() const override;
    std::string stringWithinTransport() const override;
    boost::optional<carrier::image::DockerReference> getDockerReference() const override;
    std::string getPolicyConfigurationIdentity() const override;
    std::vector<std::string> getPolicyConfigurationNamespaces() const override;
    std::unique_ptr<carrier::transports::ImageSource> newImageSource(const carrier::transports::TransportContext& context) const override;
    std::unique_ptr<carrier::transports::ImageDestination> newImageDestination(const carrier::transports::TransportContext& context) const override;

    const std::shared_ptr<MemoryStore>& getStore() const { return store; }

private:
    std::shared_ptr<MemoryStore> store;
    std::string name;
};

class MemorySource : public carrier::transports::ImageSource {
public:
    explicit MemorySource(const MemoryReference& reference);

    const carrier::transports::ImageReference& getReference() const override;
    std::pair<std::string, std::string> getManifest(const boost::optional<carrier::image::Digest>& instanceDigest) override;
    bool hasThreadSafeGetBlob() const override;
    carrier::transports::BlobStream getBlob(const carrier::image::BlobInfo& info,
                                            carrier::blobinfocache::BlobInfoCache& cache) override;
    bool supportsGetBlobAt() const override;
    std::vector<std::unique_ptr<carrier::stream::Reader>> getBlobAt(const carrier::image::BlobInfo& info,
                                                                    const std::vector<carrier::transports::ImageSourceChunk>& chunks) override;
    std::vector<std::string> getSignatures(const boost::optional<carrier::image::Digest>& instanceDigest) override;

private:
    MemoryReference reference;
};

class MemoryDestination : public carrier::transports::ImageDestination {
public:
    explicit MemoryDestination(const MemoryReference& reference);

    const carrier::transports::ImageReference& getReference() const override;
    std::vector<std::string> getSupportedManifestMIMETypes() const override;
    void supportsSignatures() const override;
    carrier::transports::LayerCompression getDesiredLayerCompression() const override;
    bool acceptsForeignLayerURLs() const override;
    bool mustMatchRuntimeOS() const override;
    bool ignoresEmbeddedDockerReference() const override;
    bool hasThreadSafePutBlob() const override;
    bool supportsPutBlobPartial() const override;
    carrier::transports::UploadedBlob putBlob(carrier::stream::Reader& stream,
                                              const carrier::image::BlobInfo& inputInfo,
                                              const carrier::transports::PutBlobOptions& options) override;
    carrier::transports::PartialBlobResult putBlobPartial(carrier::transports::BlobChunkAccessor& chunkAccessor,
                                                          const carrier::image::BlobInfo& srcInfo,
                                                          const carrier::transports::PutBlobPartialOptions& options) override;
    boost::optional<carrier::transports::ReusedBlob> tryReusingBlob(const carrier::image::BlobInfo& info,
                                                                    const carrier::transports::TryReusingBlobOptions& options) override;
    void putManifest(const std::string& manifest, const std::string& mimeType,
                     const boost::optional<carrier::image::Digest>& instanceDigest) override;
    void putSignatures(const std::vector<std::string>& signatures,
                       const boost::optional<carrier::image::Digest>& instanceDigest) override;
    void commit() override;

private:
    MemoryReference reference;
};

// A reference to a new, empty store
std::unique_ptr<MemoryReference> makeMemoryReference(const std::string& name = "image");

}
}

#endif
