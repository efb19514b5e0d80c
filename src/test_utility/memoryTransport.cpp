/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "memoryTransport.hpp"

#include <cstdint>
#include <thread>
#include <algorithm>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "image/Digester.hpp"
#include "stream/StringReader.hpp"


namespace test_utility {
namespace memory {

namespace {

// Keeps track of the blob uploads in progress
class ConcurrentUpload {
public:
    explicit ConcurrentUpload(MemoryStore& store) : store(store) {
        std::lock_guard<std::mutex> lock{store.mutex};
        ++store.concurrentPutBlobs;
        store.maxConcurrentPutBlobs = std::max(store.maxConcurrentPutBlobs, store.concurrentPutBlobs);
    }
    ~ConcurrentUpload() {
        std::lock_guard<std::mutex> lock{store.mutex};
        --store.concurrentPutBlobs;
    }

private:
    MemoryStore& store;
};

}

bool MemoryStore::hasBlob(const carrier::image::Digest& digest) const {
    std::lock_guard<std::mutex> lock{mutex};
    return blobs.count(digest.string()) > 0;
}

std::string MemoryStore::getBlob(const carrier::image::Digest& digest) const {
    std::lock_guard<std::mutex> lock{mutex};
    auto it = blobs.find(digest.string());
    if(it == blobs.cend()) {
        auto message = boost::format("blob %s not found in memory store") % digest;
        CARRIER_THROW_ERROR(message.str());
    }
    return it->second;
}

size_t MemoryStore::getBlobReads(const carrier::image::Digest& digest) const {
    std::lock_guard<std::mutex> lock{mutex};
    auto it = blobReads.find(digest.string());
    return it == blobReads.cend() ? 0 : it->second;
}

size_t MemoryStore::getBlobChunkReads(const carrier::image::Digest& digest) const {
    std::lock_guard<std::mutex> lock{mutex};
    auto it = blobChunkReads.find(digest.string());
    return it == blobChunkReads.cend() ? 0 : it->second;
}

size_t MemoryStore::getBlobCount() const {
    std::lock_guard<std::mutex> lock{mutex};
    return blobs.size();
}

std::string MemoryTransport::getName() const {
    return "memory";
}

std::unique_ptr<carrier::transports::ImageReference> MemoryTransport::parseReference(const std::string& reference) const {
    return std::unique_ptr<carrier::transports::ImageReference>{
        new MemoryReference{std::make_shared<MemoryStore>(), reference}};
}

void MemoryTransport::validatePolicyConfigurationScope(const std::string&) const {}

const MemoryTransport& getMemoryTransport() {
    static const MemoryTransport transport;
    return transport;
}

MemoryReference::MemoryReference(std::shared_ptr<MemoryStore> store, const std::string& name)
    : store{std::move(store)}
    , name{name}
{}

const carrier::transports::ImageTransport& MemoryReference::getTransport() const {
    return getMemoryTransport();
}

std::string MemoryReference::stringWithinTransport() const {
    return name;
}

boost::optional<carrier::image::DockerReference> MemoryReference::getDockerReference() const {
    std::lock_guard<std::mutex> lock{store->mutex};
    return store->dockerReference;
}

std::string MemoryReference::getPolicyConfigurationIdentity() const {
    return name;
}

std::vector<std::string> MemoryReference::getPolicyConfigurationNamespaces() const {
    return {};
}

std::unique_ptr<carrier::transports::ImageSource> MemoryReference::newImageSource(const carrier::transports::TransportContext&) const {
    std::lock_guard<std::mutex> lock{store->mutex};
    if(store->manifest.first.empty()) {
        auto message = boost::format("no image stored in memory image %s") % name;
        CARRIER_THROW_ERROR(message.str());
    }
    return std::unique_ptr<carrier::transports::ImageSource>{new MemorySource{*this}};
}

std::unique_ptr<carrier::transports::ImageDestination> MemoryReference::newImageDestination(const carrier::transports::TransportContext&) const {
    return std::unique_ptr<carrier::transports::ImageDestination>{new MemoryDestination{*this}};
}

MemorySource::MemorySource(const MemoryReference& reference)
    : reference{reference}
{}

const carrier::transports::ImageReference& MemorySource::getReference() const {
    return reference;
}

std::pair<std::string, std::string> MemorySource::getManifest(const boost::optional<carrier::image::Digest>& instanceDigest) {
    auto& store = *reference.getStore();
    std::lock_guard<std::mutex> lock{store.mutex};
    if(!instanceDigest) {
        return store.manifest;
    }
    auto it = store.instanceManifests.find(instanceDigest->string());
    if(it == store.instanceManifests.cend()) {
        auto message = boost::format("manifest %s not found in memory store") % *instanceDigest;
        CARRIER_THROW_ERROR(message.str());
    }
    return it->second;
}

bool MemorySource::hasThreadSafeGetBlob() const {
    std::lock_guard<std::mutex> lock{reference.getStore()->mutex};
    return reference.getStore()->threadSafe;
}

carrier::transports::BlobStream MemorySource::getBlob(const carrier::image::BlobInfo& info,
                                                      carrier::blobinfocache::BlobInfoCache&) {
    auto& store = *reference.getStore();
    auto blob = store.getBlob(info.digest);
    {
        std::lock_guard<std::mutex> lock{store.mutex};
        ++store.blobReads[info.digest.string()];
    }
    auto stream = carrier::transports::BlobStream{};
    stream.size = static_cast<int64_t>(blob.size());
    stream.reader.reset(new carrier::stream::StringReader{std::move(blob)});
    return stream;
}

bool MemorySource::supportsGetBlobAt() const {
    std::lock_guard<std::mutex> lock{reference.getStore()->mutex};
    return reference.getStore()->rangedReads;
}

std::vector<std::unique_ptr<carrier::stream::Reader>> MemorySource::getBlobAt(const carrier::image::BlobInfo& info,
                                                                              const std::vector<carrier::transports::ImageSourceChunk>& chunks) {
    auto& store = *reference.getStore();
    auto blob = store.getBlob(info.digest);
    auto readers = std::vector<std::unique_ptr<carrier::stream::Reader>>{};
    for(const auto& chunk : chunks) {
        if(chunk.offset > blob.size()) {
            auto message = boost::format("chunk at offset %d is beyond the end of blob %s (%d bytes)")
                % chunk.offset % info.digest % blob.size();
            CARRIER_THROW_ERROR(message.str());
        }
        auto length = chunk.length == UINT64_MAX ? std::string::npos : static_cast<size_t>(chunk.length);
        readers.emplace_back(new carrier::stream::StringReader{blob.substr(chunk.offset, length)});
    }
    std::lock_guard<std::mutex> lock{store.mutex};
    store.blobChunkReads[info.digest.string()] += chunks.size();
    return readers;
}

std::vector<std::string> MemorySource::getSignatures(const boost::optional<carrier::image::Digest>& instanceDigest) {
    auto& store = *reference.getStore();
    std::lock_guard<std::mutex> lock{store.mutex};
    if(!instanceDigest) {
        return store.signatures;
    }
    auto it = store.instanceSignatures.find(instanceDigest->string());
    return it == store.instanceSignatures.cend() ? std::vector<std::string>{} : it->second;
}

MemoryDestination::MemoryDestination(const MemoryReference& reference)
    : reference{reference}
{}

const carrier::transports::ImageReference& MemoryDestination::getReference() const {
    return reference;
}

std::vector<std::string> MemoryDestination::getSupportedManifestMIMETypes() const {
    std::lock_guard<std::mutex> lock{reference.getStore()->mutex};
    return reference.getStore()->supportedManifestMIMETypes;
}

void MemoryDestination::supportsSignatures() const {
    std::lock_guard<std::mutex> lock{reference.getStore()->mutex};
    if(!reference.getStore()->acceptsSignatures) {
        CARRIER_THROW_ERROR("Pushing signatures to a memory destination is not supported");
    }
}

carrier::transports::LayerCompression MemoryDestination::getDesiredLayerCompression() const {
    std::lock_guard<std::mutex> lock{reference.getStore()->mutex};
    return reference.getStore()->desiredLayerCompression;
}

bool MemoryDestination::acceptsForeignLayerURLs() const {
    return false;
}

bool MemoryDestination::mustMatchRuntimeOS() const {
    return false;
}

bool MemoryDestination::ignoresEmbeddedDockerReference() const {
    return true;
}

bool MemoryDestination::hasThreadSafePutBlob() const {
    std::lock_guard<std::mutex> lock{reference.getStore()->mutex};
    return reference.getStore()->threadSafe;
}

bool MemoryDestination::supportsPutBlobPartial() const {
    std::lock_guard<std::mutex> lock{reference.getStore()->mutex};
    return reference.getStore()->partialUploads;
}

carrier::transports::UploadedBlob MemoryDestination::putBlob(carrier::stream::Reader& stream,
                                                             const carrier::image::BlobInfo& inputInfo,
                                                             const carrier::transports::PutBlobOptions&) {
    auto& store = *reference.getStore();
    ConcurrentUpload upload{store};

    auto blob = carrier::stream::readAll(stream);
    auto delay = std::chrono::milliseconds{};
    {
        std::lock_guard<std::mutex> lock{store.mutex};
        delay = store.putBlobDelay;
    }
    if(delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    auto digester = carrier::image::Digester{carrier::image::Digest::SHA256};
    digester.update(blob.data(), blob.size());
    auto uploaded = carrier::transports::UploadedBlob{};
    uploaded.digest = digester.digest();
    uploaded.size = static_cast<int64_t>(blob.size());
    if(inputInfo.size != -1 && inputInfo.size != uploaded.size) {
        auto message = boost::format("Size mismatch when copying %s, expected %d, got %d")
            % inputInfo.digest % inputInfo.size % uploaded.size;
        CARRIER_THROW_ERROR(message.str());
    }

    std::lock_guard<std::mutex> lock{store.mutex};
    store.blobs[uploaded.digest.string()] = std::move(blob);
    store.putBlobDigests.push_back(uploaded.digest.string());
    return uploaded;
}

carrier::transports::PartialBlobResult MemoryDestination::putBlobPartial(carrier::transports::BlobChunkAccessor& chunkAccessor,
                                                                       const carrier::image::BlobInfo& srcInfo,
                                                                       const carrier::transports::PutBlobPartialOptions&) {
    auto& store = *reference.getStore();
    auto result = carrier::transports::PartialBlobResult{};
    {
        std::lock_guard<std::mutex> lock{store.mutex};
        result.fallbackReason = store.partialUploadFallbackReason;
    }
    if(result.fallbackReason.empty() && srcInfo.size < 0) {
        result.fallbackReason = "blob size is unknown";
    }
    if(!result.fallbackReason.empty()) {
        result.status = carrier::transports::PartialBlobResult::Status::FallbackRequested;
        return result;
    }

    // two chunks, the second one up to the end of the blob
    auto half = static_cast<uint64_t>(srcInfo.size) / 2;
    auto chunks = std::vector<carrier::transports::ImageSourceChunk>(2);
    chunks[0].offset = 0;
    chunks[0].length = half;
    chunks[1].offset = half;
    chunks[1].length = UINT64_MAX;

    auto blob = std::string{};
    for(auto& reader : chunkAccessor.getBlobAt(srcInfo, chunks)) {
        blob += carrier::stream::readAll(*reader);
    }
    auto digest = carrier::image::Digest::fromBytes(blob);
    if(digest != srcInfo.digest) {
        auto message = boost::format("chunks of blob %s assembled to %s") % srcInfo.digest % digest;
        CARRIER_THROW_TYPED_ERROR(libcarrier::DigestMismatchError, message.str());
    }

    std::lock_guard<std::mutex> lock{store.mutex};
    result.status = carrier::transports::PartialBlobResult::Status::Uploaded;
    result.blob.digest = digest;
    result.blob.size = static_cast<int64_t>(blob.size());
    store.blobs[digest.string()] = std::move(blob);
    store.partialBlobDigests.push_back(digest.string());
    return result;
}

boost::optional<carrier::transports::ReusedBlob> MemoryDestination::tryReusingBlob(const carrier::image::BlobInfo& info,
                                                                                   const carrier::transports::TryReusingBlobOptions& options) {
    if(!carrier::transports::originalCandidateMatchesTryReusingBlobOptions(options)) {
        return boost::none;
    }
    auto& store = *reference.getStore();
    std::lock_guard<std::mutex> lock{store.mutex};
    auto it = store.blobs.find(info.digest.string());
    if(it == store.blobs.cend()) {
        return boost::none;
    }
    auto reused = carrier::transports::ReusedBlob{};
    reused.digest = info.digest;
    reused.size = static_cast<int64_t>(it->second.size());
    return reused;
}

void MemoryDestination::putManifest(const std::string& manifest, const std::string& mimeType,
                                    const boost::optional<carrier::image::Digest>& instanceDigest) {
    auto& store = *reference.getStore();
    std::lock_guard<std::mutex> lock{store.mutex};
    ++store.putManifestCalls;
    if(store.rejectedManifestMIMETypes.count(mimeType) > 0) {
        auto message = boost::format("manifest type %s rejected by memory destination") % mimeType;
        CARRIER_THROW_TYPED_ERROR(libcarrier::ManifestTypeRejectedError, message.str());
    }
    if(store.failingManifestMIMETypes.count(mimeType) > 0) {
        auto message = boost::format("memory destination failed to store manifest of type %s") % mimeType;
        CARRIER_THROW_ERROR(message.str());
    }
    if(instanceDigest) {
        store.instanceManifests[instanceDigest->string()] = {manifest, mimeType};
    }
    else {
        store.manifest = {manifest, mimeType};
    }
}

void MemoryDestination::putSignatures(const std::vector<std::string>& signatures,
                                      const boost::optional<carrier::image::Digest>& instanceDigest) {
    if(!signatures.empty()) {
        supportsSignatures();
    }
    auto& store = *reference.getStore();
    std::lock_guard<std::mutex> lock{store.mutex};
    if(instanceDigest) {
        store.instanceSignatures[instanceDigest->string()] = signatures;
    }
    else {
        store.signatures = signatures;
    }
}

void MemoryDestination::commit() {
    auto& store = *reference.getStore();
    std::lock_guard<std::mutex> lock{store.mutex};
    store.committed = true;
}

std::unique_ptr<MemoryReference> makeMemoryReference(const std::string& name) {
    return std::unique_ptr<MemoryReference>{new MemoryReference{std::make_shared<MemoryStore>(), name}};
}

}
}
