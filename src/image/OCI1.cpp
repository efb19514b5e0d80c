/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "OCI1.hpp"

#include <algorithm>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "image/mediaTypes.hpp"
#include "image/compressionVariants.hpp"


namespace carrier {
namespace image {

namespace json = libcarrier::json;

OCI1::OCI1(const Descriptor& config, const std::vector<Descriptor>& layers)
    : schemaVersion{2}
    , mediaType{mediatype::ociImageManifest}
    , config{config}
    , layers{layers}
{}

std::unique_ptr<OCI1> OCI1::fromBlob(const std::string& manifestBlob) {
    auto manifest = std::unique_ptr<OCI1>{new OCI1{}};
    try {
        auto document = json::parse(manifestBlob);
        validateUnambiguousManifestFormat(manifestBlob, mediatype::ociImageManifest,
                                          AllowedFieldConfig | AllowedFieldLayers);

        manifest->schemaVersion = json::getInt64(document, "schemaVersion");
        manifest->mediaType = json::getStringOrDefault(document, "mediaType");
        manifest->artifactType = json::getStringOrDefault(document, "artifactType");
        if(document.HasMember("config")) {
            manifest->config = descriptorFromJSON(document["config"]);
        }
        if(document.HasMember("layers") && document["layers"].IsArray()) {
            for(const auto& layer : document["layers"].GetArray()) {
                manifest->layers.push_back(descriptorFromJSON(layer));
            }
        }
        if(document.HasMember("subject") && document["subject"].IsObject()) {
            manifest->subject = descriptorFromJSON(document["subject"]);
        }
        manifest->annotations = json::getStringMap(document, "annotations");
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse OCI image manifest");
    }
    return manifest;
}

std::string OCI1::getMIMEType() const {
    return mediatype::ociImageManifest;
}

BlobInfo OCI1::getConfigInfo() const {
    return blobInfoFromDescriptor(config, DescriptorStyle::OCI);
}

std::vector<LayerInfo> OCI1::getLayerInfos() const {
    auto infos = std::vector<LayerInfo>{};
    infos.reserve(layers.size());
    for(const auto& layer : layers) {
        auto info = LayerInfo{};
        static_cast<BlobInfo&>(info) = blobInfoFromDescriptor(layer, DescriptorStyle::OCI);
        infos.push_back(info);
    }
    return infos;
}

std::string getEncryptedMediaType(const std::string& mediaType) {
    auto parts = std::vector<std::string>{};
    boost::split(parts, mediaType, boost::is_any_of("+"));
    if(std::find(parts.cbegin() + 1, parts.cend(), "encrypted") != parts.cend()) {
        auto message = boost::format("unsupported mediaType: \"%s\" already encrypted") % mediaType;
        CARRIER_THROW_ERROR(message.str());
    }
    const auto& unsuffixed = parts.front();
    if(unsuffixed == mediatype::dockerV2Schema2Layer
       || unsuffixed == mediatype::ociImageLayer
       || unsuffixed == mediatype::ociImageLayerNonDistributable) {
        return mediaType + mediatype::encryptedSuffix;
    }
    auto message = boost::format("unsupported mediaType to encrypt: \"%s\"") % mediaType;
    CARRIER_THROW_ERROR(message.str());
}

std::string getDecryptedMediaType(const std::string& mediaType) {
    if(!boost::ends_with(mediaType, mediatype::encryptedSuffix)) {
        auto message = boost::format("unsupported mediaType to decrypt: \"%s\"") % mediaType;
        CARRIER_THROW_ERROR(message.str());
    }
    return mediaType.substr(0, mediaType.size() - mediatype::encryptedSuffix.size());
}

void OCI1::updateLayerInfos(const std::vector<BlobInfo>& layerInfos) {
    if(layers.size() != layerInfos.size()) {
        auto message = boost::format("Error preparing updated manifest: layer count changed from %d to %d")
            % layers.size() % layerInfos.size();
        CARRIER_THROW_ERROR(message.str());
    }

    auto original = layers;
    layers = std::vector<Descriptor>(layerInfos.size());
    for(size_t i=0; i<layerInfos.size(); ++i) {
        const auto& info = layerInfos[i];
        auto mimeType = original[i].mediaType;

        if(info.cryptoOperation == CryptoOperation::Decrypt) {
            if(!boost::ends_with(mimeType, mediatype::encryptedSuffix)) {
                auto message = boost::format("error preparing updated manifest: decryption specified"
                                             " but original mediatype is not encrypted: \"%s\"") % mimeType;
                CARRIER_THROW_ERROR(message.str());
            }
            mimeType = getDecryptedMediaType(mimeType);
        }

        try {
            mimeType = updatedMIMEType(getOCI1CompressionMIMETypeSets(), mimeType, info);
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("preparing updated manifest, layer %s") % info.digest;
            CARRIER_RETHROW_ERROR(e, message.str());
        }

        if(info.cryptoOperation == CryptoOperation::Encrypt) {
            try {
                mimeType = getEncryptedMediaType(mimeType);
            }
            catch(libcarrier::Error& e) {
                auto message = boost::format("error preparing updated manifest: encryption specified"
                                             " but no counterpart for mediatype: \"%s\"") % mimeType;
                CARRIER_RETHROW_ERROR(e, message.str());
            }
        }

        layers[i].mediaType = mimeType;
        layers[i].digest = info.digest;
        layers[i].size = info.size;
        layers[i].annotations = info.annotations;
        layers[i].urls = info.urls;
    }
}

std::string OCI1::serialize() const {
    auto document = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = document.GetAllocator();

    document.AddMember("schemaVersion", rapidjson::Value{schemaVersion}, allocator);
    if(!mediaType.empty()) {
        document.AddMember("mediaType", rapidjson::Value{mediaType.c_str(), allocator}, allocator);
    }
    if(!artifactType.empty()) {
        document.AddMember("artifactType", rapidjson::Value{artifactType.c_str(), allocator}, allocator);
    }
    document.AddMember("config", descriptorToJSON(config, DescriptorStyle::OCI, allocator), allocator);
    auto layersJSON = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& layer : layers) {
        layersJSON.PushBack(descriptorToJSON(layer, DescriptorStyle::OCI, allocator), allocator);
    }
    document.AddMember("layers", layersJSON, allocator);
    if(subject) {
        document.AddMember("subject", descriptorToJSON(*subject, DescriptorStyle::OCI, allocator), allocator);
    }
    if(!annotations.empty()) {
        json::setStringMap(document, "annotations", annotations, allocator);
    }

    return json::serialize(document);
}

bool OCI1::canChangeLayerCompression(const std::string& mimeType) const {
    if(config.mediaType != mediatype::ociImageConfig) {
        return false;
    }
    return compressionVariantsRecognizeMIMEType(getOCI1CompressionMIMETypeSets(), mimeType);
}

std::unique_ptr<Manifest> OCI1::clone() const {
    return std::unique_ptr<Manifest>{new OCI1{*this}};
}

}
}
