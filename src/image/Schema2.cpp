/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Schema2.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "image/mediaTypes.hpp"
#include "image/compressionVariants.hpp"


namespace carrier {
namespace image {

Schema2::Schema2(const Descriptor& config, const std::vector<Descriptor>& layers)
    : schemaVersion{2}
    , mediaType{mediatype::dockerV2Schema2}
    , config{config}
    , layers{layers}
{}

bool Schema2::isSupportedMediaType(const std::string& mediaType) {
    return mediaType == mediatype::dockerV2List
        || mediaType == mediatype::dockerV2Schema1
        || mediaType == mediatype::dockerV2Schema1Signed
        || mediaType == mediatype::dockerV2Schema2Config
        || mediaType == mediatype::dockerV2Schema2ForeignLayer
        || mediaType == mediatype::dockerV2Schema2ForeignLayerGzip
        || mediaType == mediatype::dockerV2Schema2Layer
        || mediaType == mediatype::dockerV2Schema2
        || mediaType == mediatype::dockerV2SchemaLayerUncompressed
        || mediaType == mediatype::dockerV2SchemaLayerZstd;
}

static void checkSupportedMediaType(const std::string& mediaType) {
    if(!Schema2::isSupportedMediaType(mediaType)) {
        auto message = boost::format("unsupported docker v2s2 media type: \"%s\"") % mediaType;
        CARRIER_THROW_ERROR(message.str());
    }
}

std::unique_ptr<Schema2> Schema2::fromBlob(const std::string& manifestBlob) {
    auto manifest = std::unique_ptr<Schema2>{new Schema2{}};
    try {
        validateUnambiguousManifestFormat(manifestBlob, mediatype::dockerV2Schema2,
                                          AllowedFieldConfig | AllowedFieldLayers);

        auto json = libcarrier::json::parse(manifestBlob);
        manifest->schemaVersion = libcarrier::json::getInt64(json, "schemaVersion");
        manifest->mediaType = libcarrier::json::getStringOrDefault(json, "mediaType");
        checkSupportedMediaType(manifest->mediaType);

        if(json.HasMember("config")) {
            manifest->config = descriptorFromJSON(json["config"]);
            checkSupportedMediaType(manifest->config.mediaType);
        }
        if(json.HasMember("layers") && json["layers"].IsArray()) {
            for(const auto& layer : json["layers"].GetArray()) {
                manifest->layers.push_back(descriptorFromJSON(layer));
                checkSupportedMediaType(manifest->layers.back().mediaType);
            }
        }
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse Docker schema2 manifest");
    }
    return manifest;
}

std::string Schema2::getMIMEType() const {
    return mediaType;
}

BlobInfo Schema2::getConfigInfo() const {
    return blobInfoFromDescriptor(config, DescriptorStyle::Schema2);
}

std::vector<LayerInfo> Schema2::getLayerInfos() const {
    auto infos = std::vector<LayerInfo>{};
    for(const auto& layer : layers) {
        auto info = LayerInfo{};
        static_cast<BlobInfo&>(info) = blobInfoFromDescriptor(layer, DescriptorStyle::Schema2);
        infos.push_back(info);
    }
    return infos;
}

void Schema2::updateLayerInfos(const std::vector<BlobInfo>& layerInfos) {
    if(layers.size() != layerInfos.size()) {
        auto message = boost::format("Error preparing updated manifest: layer count changed from %d to %d")
            % layers.size() % layerInfos.size();
        CARRIER_THROW_ERROR(message.str());
    }

    auto original = layers;
    for(size_t i=0; i<layerInfos.size(); ++i) {
        const auto& info = layerInfos[i];
        auto mimeType = original[i].mediaType;
        if(!isSupportedMediaType(mimeType)) {
            auto message = boost::format("Error preparing updated manifest: unknown media type of original layer %s: \"%s\"")
                % info.digest % mimeType;
            CARRIER_THROW_ERROR(message.str());
        }
        try {
            mimeType = updatedMIMEType(getSchema2CompressionMIMETypeSets(), mimeType, info);
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("preparing updated manifest, layer %s") % info.digest;
            CARRIER_RETHROW_ERROR(e, message.str());
        }
        layers[i] = Descriptor{};
        layers[i].mediaType = mimeType;
        layers[i].digest = info.digest;
        layers[i].size = info.size;
        layers[i].urls = info.urls;
        if(info.cryptoOperation != CryptoOperation::PreserveOriginal) {
            auto message = boost::format("encryption change (for layer %s) is not supported in schema2 manifests") % info.digest;
            CARRIER_THROW_ERROR(message.str());
        }
    }
}

std::string Schema2::serialize() const {
    auto json = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = json.GetAllocator();

    json.AddMember("schemaVersion", rapidjson::Value{schemaVersion}, allocator);
    json.AddMember("mediaType", rapidjson::Value{mediaType.c_str(), allocator}, allocator);
    json.AddMember("config", descriptorToJSON(config, DescriptorStyle::Schema2, allocator), allocator);
    auto layersJSON = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& layer : layers) {
        layersJSON.PushBack(descriptorToJSON(layer, DescriptorStyle::Schema2, allocator), allocator);
    }
    json.AddMember("layers", layersJSON, allocator);

    return libcarrier::json::serialize(json);
}

bool Schema2::canChangeLayerCompression(const std::string& mimeType) const {
    return compressionVariantsRecognizeMIMEType(getSchema2CompressionMIMETypeSets(), mimeType);
}

std::unique_ptr<Manifest> Schema2::clone() const {
    return std::unique_ptr<Manifest>{new Schema2{*this}};
}

}
}
