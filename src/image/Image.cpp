/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Image.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/json.hpp"
#include "image/mediaTypes.hpp"
#include "image/Schema1.hpp"
#include "image/Schema2.hpp"
#include "image/OCI1.hpp"
#include "blobinfocache/NoCache.hpp"
#include "transports/ImageSource.hpp"


namespace carrier {
namespace image {

namespace json = libcarrier::json;

// Larger config blobs are rejected
static const size_t MAX_CONFIG_BODY_SIZE = 4 * 1024 * 1024;

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Image", level);
}

Image::Image(std::unique_ptr<Manifest> manifest,
             transports::ImageSource* source,
             const boost::optional<std::string>& configBlob)
    : manifest{std::move(manifest)}
    , source{source}
    , configBlob{configBlob}
{}

std::pair<std::string, std::string> Image::getManifest() const {
    return {manifest->serialize(), manifest->getMIMEType()};
}

BlobInfo Image::getConfigInfo() const {
    return manifest->getConfigInfo();
}

std::string Image::getConfigBlob() {
    auto configInfo = manifest->getConfigInfo();
    if(configInfo.digest.empty()) {
        return "";
    }
    if(configBlob) {
        return *configBlob;
    }
    if(source == nullptr) {
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError,
                                  "Internal error: neither source nor config blob set in image");
    }

    printLog(boost::format("Reading config blob %s") % configInfo.digest, libcarrier::LogLevel::DEBUG);
    auto cache = blobinfocache::NoCache{};
    auto blob = source->getBlob(configInfo, cache);
    auto data = std::string{};
    char buffer[32768];
    while(true) {
        auto bytes = blob.reader->read(buffer, sizeof(buffer));
        if(bytes == 0) {
            break;
        }
        data.append(buffer, bytes);
        if(data.size() > MAX_CONFIG_BODY_SIZE) {
            auto message = boost::format("config blob %s exceeded maximum allowed size of %d bytes")
                % configInfo.digest % MAX_CONFIG_BODY_SIZE;
            CARRIER_THROW_ERROR(message.str());
        }
    }

    auto computedDigest = Digest::fromBytes(data);
    if(computedDigest != configInfo.digest) {
        auto message = boost::format("Download config.json digest %s does not match expected %s")
            % computedDigest % configInfo.digest;
        CARRIER_THROW_TYPED_ERROR(libcarrier::DigestMismatchError, message.str());
    }
    configBlob = data;
    return data;
}

std::vector<BlobInfo> Image::getLayerInfos() const {
    return toBlobInfos(manifest->getLayerInfos());
}

bool Image::embeddedDockerReferenceConflicts(const DockerReference& reference) const {
    // only schema1 embeds a reference, without the domain
    auto schema1 = dynamic_cast<const Schema1*>(manifest.get());
    if(schema1 == nullptr) {
        return false;
    }
    return schema1->getName() != reference.path || schema1->getTag() != reference.tag;
}

bool Image::updatedImageNeedsLayerDiffIDs(const ManifestUpdateOptions& options) const {
    if(dynamic_cast<const Schema1*>(manifest.get()) == nullptr) {
        return false;
    }
    return options.manifestMIMEType == mediatype::dockerV2Schema2
        || options.manifestMIMEType == mediatype::ociImageManifest;
}

bool Image::supportsEncryption() const {
    return dynamic_cast<const OCI1*>(manifest.get()) != nullptr;
}

bool Image::canChangeLayerCompression(const std::string& mimeType) const {
    return manifest->canChangeLayerCompression(mimeType);
}

static bool isSchema1MIMEType(const std::string& mimeType) {
    return mimeType == mediatype::dockerV2Schema1 || mimeType == mediatype::dockerV2Schema1Signed;
}

std::unique_ptr<Image> Image::updatedImage(const ManifestUpdateOptions& options) {
    auto optionsCopy = options;

    auto currentMIMEType = normalizedMIMEType(manifest->getMIMEType());
    auto targetMIMEType = normalizedMIMEType(options.manifestMIMEType);
    auto needsConversion = !options.manifestMIMEType.empty()
        && targetMIMEType != currentMIMEType
        && !(isSchema1MIMEType(targetMIMEType) && isSchema1MIMEType(currentMIMEType));

    if(needsConversion) {
        auto converted = convert(optionsCopy);
        optionsCopy.manifestMIMEType.clear();
        return converted->updatedImage(optionsCopy);
    }

    auto updated = std::unique_ptr<Image>{new Image{manifest->clone(), source, configBlob}};
    updated->applyUpdates(optionsCopy);
    return updated;
}

void Image::applyUpdates(const ManifestUpdateOptions& options) {
    if(options.layerInfos) {
        manifest->updateLayerInfos(*options.layerInfos);
    }
    auto schema1 = dynamic_cast<Schema1*>(manifest.get());
    if(schema1 != nullptr && options.embeddedDockerReference) {
        schema1->setEmbeddedReference(options.embeddedDockerReference->path, options.embeddedDockerReference->tag);
    }
}

std::unique_ptr<Image> Image::convert(ManifestUpdateOptions& options) {
    auto target = options.manifestMIMEType;
    if(dynamic_cast<const OCI1*>(manifest.get()) != nullptr && target == mediatype::dockerV2Schema2) {
        return convertOCI1ToSchema2(options);
    }
    else if(dynamic_cast<const Schema2*>(manifest.get()) != nullptr && target == mediatype::ociImageManifest) {
        return convertSchema2ToOCI1();
    }
    else if(dynamic_cast<const Schema1*>(manifest.get()) != nullptr) {
        if(target == mediatype::dockerV2Schema2) {
            return convertSchema1ToSchema2(options);
        }
        else if(target == mediatype::ociImageManifest) {
            auto schema2 = convertSchema1ToSchema2(options);
            return schema2->convertSchema2ToOCI1();
        }
    }
    auto message = boost::format("Unsupported conversion type: %s (from %s)") % target % manifest->getMIMEType();
    CARRIER_THROW_TYPED_ERROR(libcarrier::ManifestTypeRejectedError, message.str());
}

/**
 * Decryption and zstd layers can't be represented in Docker manifests, so the
 * corresponding edits are applied to the OCI manifest before converting it.
 * Returns the edits to apply before the conversion, none if there are none, and
 * removes them from options.
 */
static boost::optional<std::vector<BlobInfo>> layerEditsOfOCIOnlyFeatures(const OCI1& manifest,
                                                                          ManifestUpdateOptions& options) {
    if(!options.layerInfos) {
        return boost::none;
    }

    auto originalInfos = toBlobInfos(manifest.getLayerInfos());
    if(originalInfos.size() != options.layerInfos->size()) {
        auto message = boost::format("preparing to decrypt before conversion: %d layers vs. %d layer edits")
            % originalInfos.size() % options.layerInfos->size();
        CARRIER_THROW_ERROR(message.str());
    }

    // unless overridden below, the OCI-only pass keeps the original compression and crypto
    auto ociOnlyEdits = *options.layerInfos;
    auto laterEdits = *options.layerInfos;
    auto needsOCIOnlyEdits = false;
    for(size_t i=0; i<options.layerInfos->size(); ++i) {
        const auto& edit = (*options.layerInfos)[i];
        ociOnlyEdits[i].compressionOperation = CompressionOperation::PreserveOriginal;
        ociOnlyEdits[i].compressionAlgorithm = boost::none;
        ociOnlyEdits[i].cryptoOperation = CryptoOperation::PreserveOriginal;

        if(edit.cryptoOperation == CryptoOperation::Decrypt) {
            needsOCIOnlyEdits = true;
            ociOnlyEdits[i].cryptoOperation = CryptoOperation::Decrypt;
            laterEdits[i].cryptoOperation = CryptoOperation::PreserveOriginal;
        }

        if(originalInfos[i].mediaType == mediatype::ociImageLayerZstd
           || originalInfos[i].mediaType == mediatype::ociImageLayerNonDistributableZstd) {
            needsOCIOnlyEdits = true;
            ociOnlyEdits[i].compressionOperation = edit.compressionOperation;
            ociOnlyEdits[i].compressionAlgorithm = edit.compressionAlgorithm;
            laterEdits[i].compressionOperation = CompressionOperation::PreserveOriginal;
            laterEdits[i].compressionAlgorithm = boost::none;
        }
    }
    if(!needsOCIOnlyEdits) {
        return boost::none;
    }

    options.layerInfos = laterEdits;
    return ociOnlyEdits;
}

std::unique_ptr<Image> Image::convertOCI1ToSchema2(ManifestUpdateOptions& options) const {
    const auto& original = static_cast<const OCI1&>(*manifest);
    if(original.getConfig().mediaType != mediatype::ociImageConfig) {
        auto message = boost::format("Unsupported conversion of non-image OCI artifact with config type \"%s\" to %s")
            % original.getConfig().mediaType % mediatype::dockerV2Schema2;
        CARRIER_THROW_TYPED_ERROR(libcarrier::ManifestTypeRejectedError, message.str());
    }

    auto ociManifest = original.clone();
    auto ociOnlyEdits = layerEditsOfOCIOnlyFeatures(original, options);
    if(ociOnlyEdits) {
        ociManifest->updateLayerInfos(*ociOnlyEdits);
    }
    const auto& oci = static_cast<const OCI1&>(*ociManifest);

    auto config = Descriptor{};
    config.mediaType = mediatype::dockerV2Schema2Config;
    config.size = oci.getConfig().size;
    config.digest = oci.getConfig().digest;
    config.urls = oci.getConfig().urls;

    auto layers = std::vector<Descriptor>{};
    for(const auto& ociLayer : oci.getLayers()) {
        auto layer = Descriptor{};
        layer.size = ociLayer.size;
        layer.digest = ociLayer.digest;
        layer.urls = ociLayer.urls;

        const auto& type = ociLayer.mediaType;
        if(type == mediatype::ociImageLayerNonDistributable) {
            layer.mediaType = mediatype::dockerV2Schema2ForeignLayer;
        }
        else if(type == mediatype::ociImageLayerNonDistributableGzip) {
            layer.mediaType = mediatype::dockerV2Schema2ForeignLayerGzip;
        }
        else if(type == mediatype::ociImageLayerNonDistributableZstd) {
            auto message = boost::format("Error during manifest conversion: \"%s\": zstd compression is not supported for docker images") % type;
            CARRIER_THROW_TYPED_ERROR(libcarrier::CompressionIncompatibleError, message.str());
        }
        else if(type == mediatype::ociImageLayer) {
            layer.mediaType = mediatype::dockerV2SchemaLayerUncompressed;
        }
        else if(type == mediatype::ociImageLayerGzip) {
            layer.mediaType = mediatype::dockerV2Schema2Layer;
        }
        else if(type == mediatype::ociImageLayerZstd) {
            auto message = boost::format("Error during manifest conversion: \"%s\": zstd compression is not officially supported for docker images") % type;
            CARRIER_THROW_TYPED_ERROR(libcarrier::CompressionIncompatibleError, message.str());
        }
        else if(type.size() > mediatype::encryptedSuffix.size()
                && type.compare(type.size() - mediatype::encryptedSuffix.size(), std::string::npos, mediatype::encryptedSuffix) == 0) {
            auto message = boost::format("during manifest conversion: encrypted layers (\"%s\") are not supported in docker images") % type;
            CARRIER_THROW_TYPED_ERROR(libcarrier::ManifestTypeRejectedError, message.str());
        }
        else {
            auto message = boost::format("Unknown media type during manifest conversion: \"%s\"") % type;
            CARRIER_THROW_ERROR(message.str());
        }
        layers.push_back(layer);
    }

    // the config blob is unchanged, only its descriptor's media type differs
    auto converted = std::unique_ptr<Manifest>{new Schema2{config, layers}};
    return std::unique_ptr<Image>{new Image{std::move(converted), source, configBlob}};
}

std::unique_ptr<Image> Image::convertSchema2ToOCI1() {
    const auto& original = static_cast<const Schema2&>(*manifest);
    auto ociConfig = ociConfigFromDockerConfig(getConfigBlob());

    auto config = Descriptor{};
    config.mediaType = mediatype::ociImageConfig;
    config.size = static_cast<int64_t>(ociConfig.size());
    config.digest = Digest::fromBytes(ociConfig);

    auto layers = std::vector<Descriptor>{};
    for(const auto& schema2Layer : original.getLayers()) {
        auto layer = Descriptor{};
        layer.size = schema2Layer.size;
        layer.digest = schema2Layer.digest;
        layer.urls = schema2Layer.urls;

        const auto& type = schema2Layer.mediaType;
        if(type == mediatype::dockerV2Schema2ForeignLayer) {
            layer.mediaType = mediatype::ociImageLayerNonDistributable;
        }
        else if(type == mediatype::dockerV2Schema2ForeignLayerGzip) {
            layer.mediaType = mediatype::ociImageLayerNonDistributableGzip;
        }
        else if(type == mediatype::dockerV2SchemaLayerUncompressed) {
            layer.mediaType = mediatype::ociImageLayer;
        }
        else if(type == mediatype::dockerV2Schema2Layer) {
            layer.mediaType = mediatype::ociImageLayerGzip;
        }
        else if(type == mediatype::dockerV2SchemaLayerZstd) {
            layer.mediaType = mediatype::ociImageLayerZstd;
        }
        else {
            auto message = boost::format("Unknown media type during manifest conversion: \"%s\"") % type;
            CARRIER_THROW_ERROR(message.str());
        }
        layers.push_back(layer);
    }

    auto converted = std::unique_ptr<Manifest>{new OCI1{config, layers}};
    return std::unique_ptr<Image>{new Image{std::move(converted), source, ociConfig}};
}

std::unique_ptr<Image> Image::convertSchema1ToSchema2(ManifestUpdateOptions& options) const {
    const auto& original = static_cast<const Schema1&>(*manifest);
    const auto& compatibility = original.getV1Compatibility();
    const auto& uploadedLayerInfos = options.informationOnly.layerInfos;
    const auto& layerDiffIDs = options.informationOnly.layerDiffIDs;

    if(compatibility.empty()) {
        auto message = boost::format("Cannot convert an image with 0 history entries to %s") % mediatype::dockerV2Schema2;
        CARRIER_THROW_ERROR(message.str());
    }
    // in manifest order, i.e. base layer first
    auto layerInfos = original.getLayerInfos();
    if(!uploadedLayerInfos.empty() && uploadedLayerInfos.size() != layerInfos.size()) {
        auto message = boost::format("Internal error: uploaded %d blobs, but schema1 manifest has %d fsLayers")
            % uploadedLayerInfos.size() % layerInfos.size();
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, message.str());
    }
    if(!layerDiffIDs.empty() && layerDiffIDs.size() != layerInfos.size()) {
        auto message = boost::format("Internal error: collected %d DiffID values, but schema1 manifest has %d fsLayers")
            % layerDiffIDs.size() % layerInfos.size();
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, message.str());
    }

    auto convertedLayerUpdates = std::vector<BlobInfo>{};
    if(options.layerInfos && options.layerInfos->size() != layerInfos.size()) {
        auto message = boost::format("Error converting image: layer edits for %d layers vs %d existing layers")
            % options.layerInfos->size() % layerInfos.size();
        CARRIER_THROW_ERROR(message.str());
    }

    // throwaway layers are dropped, they have no counterpart in schema2
    auto diffIDs = std::vector<Digest>{};
    auto layers = std::vector<Descriptor>{};
    for(size_t v2Index=0; v2Index<layerInfos.size(); ++v2Index) {
        if(layerInfos[v2Index].emptyLayer) {
            continue;
        }
        auto layer = Descriptor{};
        layer.mediaType = mediatype::dockerV2Schema2Layer;
        layer.size = uploadedLayerInfos.empty() ? 0 : uploadedLayerInfos[v2Index].size;
        layer.digest = layerInfos[v2Index].digest;
        layers.push_back(layer);
        if(options.layerInfos) {
            convertedLayerUpdates.push_back((*options.layerInfos)[v2Index]);
        }
        diffIDs.push_back(layerDiffIDs.empty() ? Digest{} : layerDiffIDs[v2Index]);
    }

    auto configJSON = original.toSchema2Config(diffIDs);
    auto config = Descriptor{};
    config.mediaType = mediatype::dockerV2Schema2Config;
    config.size = static_cast<int64_t>(configJSON.size());
    config.digest = Digest::fromBytes(configJSON);

    if(options.layerInfos) {
        options.layerInfos = convertedLayerUpdates;
    }
    auto converted = std::unique_ptr<Manifest>{new Schema2{config, layers}};
    return std::unique_ptr<Image>{new Image{std::move(converted), nullptr, configJSON}};
}

static void copyMember(const rapidjson::Value& from, rapidjson::Value& to, const char* key,
                       rapidjson::Document::AllocatorType& allocator) {
    if(from.HasMember(key) && !from[key].IsNull()) {
        to.AddMember(rapidjson::Value{key, allocator}, rapidjson::Value{from[key], allocator}, allocator);
    }
}

std::string ociConfigFromDockerConfig(const std::string& dockerConfig) {
    rapidjson::Document docker;
    try {
        docker = json::parse(dockerConfig);
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse Docker image configuration");
    }
    if(!docker.IsObject()) {
        CARRIER_THROW_ERROR("Failed to parse Docker image configuration: expected JSON object");
    }

    rapidjson::Document oci{rapidjson::kObjectType};
    auto& allocator = oci.GetAllocator();

    for(const char* key : {"created", "author", "architecture", "os", "os.version", "os.features", "variant"}) {
        copyMember(docker, oci, key, allocator);
    }

    auto config = rapidjson::Value{rapidjson::kObjectType};
    if(docker.HasMember("config") && docker["config"].IsObject()) {
        for(const char* key : {"User", "ExposedPorts", "Env", "Entrypoint", "Cmd", "Volumes",
                               "WorkingDir", "Labels", "StopSignal", "ArgsEscaped"}) {
            copyMember(docker["config"], config, key, allocator);
        }
    }
    oci.AddMember("config", config, allocator);

    auto rootfs = rapidjson::Value{rapidjson::kObjectType};
    if(docker.HasMember("rootfs") && docker["rootfs"].IsObject()) {
        copyMember(docker["rootfs"], rootfs, "type", allocator);
        copyMember(docker["rootfs"], rootfs, "diff_ids", allocator);
    }
    oci.AddMember("rootfs", rootfs, allocator);

    if(docker.HasMember("history") && docker["history"].IsArray()) {
        auto history = rapidjson::Value{rapidjson::kArrayType};
        for(rapidjson::SizeType i=0; i<docker["history"].Size(); ++i) {
            const auto& entry = docker["history"][i];
            auto item = rapidjson::Value{rapidjson::kObjectType};
            if(entry.IsObject()) {
                for(const char* key : {"created", "created_by", "author", "comment", "empty_layer"}) {
                    copyMember(entry, item, key, allocator);
                }
            }
            history.PushBack(item, allocator);
        }
        oci.AddMember("history", history, allocator);
    }

    return json::serialize(oci);
}

SourcedImage::SourcedImage(std::unique_ptr<Manifest> manifest, transports::ImageSource& source,
                           const std::string& manifestBlob, const std::string& manifestMIMEType)
    : Image{std::move(manifest), &source}
    , manifestBlob{manifestBlob}
    , manifestMIMEType{manifestMIMEType}
    , manifestDigest{image::manifestDigest(manifestBlob)}
{}

std::unique_ptr<SourcedImage> SourcedImage::fromSource(transports::ImageSource& source,
                                                       const boost::optional<Digest>& instanceDigest) {
    auto manifest = source.getManifest(instanceDigest);
    const auto& blob = manifest.first;
    auto mimeType = manifest.second.empty() ? guessMIMEType(blob) : manifest.second;
    if(instanceDigest && !manifestMatchesDigest(blob, *instanceDigest)) {
        auto message = boost::format("Manifest of instance %s does not match its digest") % *instanceDigest;
        CARRIER_THROW_TYPED_ERROR(libcarrier::DigestMismatchError, message.str());
    }
    auto parsed = manifestFromBlob(blob, mimeType);
    return std::unique_ptr<SourcedImage>{new SourcedImage{std::move(parsed), source, blob, mimeType}};
}

std::pair<std::string, std::string> SourcedImage::getManifest() const {
    return {manifestBlob, manifestMIMEType};
}

}
}
