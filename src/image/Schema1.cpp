/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Schema1.hpp"

#include <set>
#include <map>

#include <boost/format.hpp>
#include <boost/regex.hpp>
#include <boost/algorithm/string/join.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "image/mediaTypes.hpp"
#include "image/compressionVariants.hpp"


namespace carrier {
namespace image {

namespace json = libcarrier::json;

static const std::string zeroTime = "0001-01-01T00:00:00Z";

std::unique_ptr<Schema1> Schema1::fromBlob(const std::string& manifestBlob) {
    auto manifest = std::unique_ptr<Schema1>{new Schema1{}};
    try {
        auto document = json::parse(manifestBlob);
        manifest->schemaVersion = json::getInt64(document, "schemaVersion");
        if(manifest->schemaVersion != 1) {
            auto message = boost::format("unsupported schema version %d") % manifest->schemaVersion;
            CARRIER_THROW_ERROR(message.str());
        }
        validateUnambiguousManifestFormat(manifestBlob, mediatype::dockerV2Schema1Signed,
                                          AllowedFieldFSLayers | AllowedFieldHistory);

        manifest->name = json::getStringOrDefault(document, "name");
        manifest->tag = json::getStringOrDefault(document, "tag");
        manifest->architecture = json::getStringOrDefault(document, "architecture");
        if(document.HasMember("fsLayers") && document["fsLayers"].IsArray()) {
            for(const auto& layer : document["fsLayers"].GetArray()) {
                manifest->fsLayers.push_back(Digest::parse(json::getString(layer, "blobSum")));
            }
        }
        if(document.HasMember("history") && document["history"].IsArray()) {
            for(const auto& entry : document["history"].GetArray()) {
                manifest->history.push_back(json::getString(entry, "v1Compatibility"));
            }
        }

        manifest->initialize();
        manifest->fixManifestLayers();
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse Docker schema1 manifest");
    }
    return manifest;
}

void Schema1::initialize() {
    if(fsLayers.size() != history.size()) {
        CARRIER_THROW_ERROR("length of history not equal to number of layers");
    }
    if(fsLayers.empty()) {
        CARRIER_THROW_ERROR("no FSLayers in manifest");
    }

    extractedV1Compatibility.clear();
    for(size_t i=0; i<history.size(); ++i) {
        try {
            auto document = json::parse(history[i]);
            auto compat = V1Compatibility{};
            compat.id = json::getStringOrDefault(document, "id");
            compat.parent = json::getStringOrDefault(document, "parent");
            compat.comment = json::getStringOrDefault(document, "comment");
            compat.created = json::getStringOrDefault(document, "created", zeroTime);
            compat.author = json::getStringOrDefault(document, "author");
            if(document.HasMember("container_config") && document["container_config"].IsObject()) {
                compat.cmd = getStringArray(document["container_config"], "Cmd");
            }
            if(document.HasMember("throwaway") && document["throwaway"].IsBool()) {
                compat.throwAway = document["throwaway"].GetBool();
            }
            extractedV1Compatibility.push_back(compat);
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("parsing v2s1 history entry %d") % i;
            CARRIER_RETHROW_ERROR(e, message.str());
        }
    }
}

void Schema1::fixManifestLayers() {
    static const auto validHex = boost::regex{"^([a-f0-9]{64})$"};
    for(const auto& compat : extractedV1Compatibility) {
        if(!boost::regex_match(compat.id, validHex)) {
            auto message = boost::format("image ID \"%s\" is invalid") % compat.id;
            CARRIER_THROW_ERROR(message.str());
        }
    }
    if(!extractedV1Compatibility.back().parent.empty()) {
        CARRIER_THROW_ERROR("Invalid parent ID in the base layer of the image");
    }

    auto seen = std::set<std::string>{};
    auto lastID = std::string{};
    for(const auto& compat : extractedV1Compatibility) {
        // consecutive duplicates are removed below
        if(compat.id != lastID && seen.count(compat.id)) {
            auto message = boost::format("ID %s appears multiple times in manifest") % compat.id;
            CARRIER_THROW_ERROR(message.str());
        }
        lastID = compat.id;
        seen.insert(lastID);
    }

    // iterate backwards so that removals don't shift the indexes still to be visited
    for(int i = static_cast<int>(extractedV1Compatibility.size()) - 2; i >= 0; --i) {
        const auto& current = extractedV1Compatibility[i];
        const auto& next = extractedV1Compatibility[i+1];
        if(current.id == next.id) {
            fsLayers.erase(fsLayers.begin() + i);
            history.erase(history.begin() + i);
            extractedV1Compatibility.erase(extractedV1Compatibility.begin() + i);
        }
        else if(current.parent != next.id) {
            auto message = boost::format("Invalid parent ID. Expected %s, got \"%s\"") % next.id % current.parent;
            CARRIER_THROW_ERROR(message.str());
        }
    }
}

std::string Schema1::getMIMEType() const {
    return mediatype::dockerV2Schema1;
}

BlobInfo Schema1::getConfigInfo() const {
    return BlobInfo{};
}

std::vector<LayerInfo> Schema1::getLayerInfos() const {
    auto infos = std::vector<LayerInfo>{};
    infos.reserve(fsLayers.size());
    for(auto i = fsLayers.size(); i-- > 0;) {
        auto info = LayerInfo{};
        info.digest = fsLayers[i];
        info.size = -1;
        info.emptyLayer = extractedV1Compatibility[i].throwAway;
        infos.push_back(info);
    }
    return infos;
}

void Schema1::updateLayerInfos(const std::vector<BlobInfo>& layerInfos) {
    // throwaway layers are part of the layer infos, so the counts must match exactly
    if(fsLayers.size() != layerInfos.size()) {
        auto message = boost::format("Error preparing updated manifest: layer count changed from %d to %d")
            % fsLayers.size() % layerInfos.size();
        CARRIER_THROW_ERROR(message.str());
    }

    auto updated = std::vector<Digest>(layerInfos.size());
    for(size_t i=0; i<layerInfos.size(); ++i) {
        const auto& info = layerInfos[i];
        // schema1 has no layer MIME types, the lookup only rejects unsupported compression algorithms
        try {
            updatedMIMEType(getSchema1CompressionMIMETypeSets(), mediatype::dockerV2Schema2Layer, info);
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("preparing updated manifest, layer %s") % info.digest;
            CARRIER_RETHROW_ERROR(e, message.str());
        }
        updated[(layerInfos.size() - 1) - i] = info.digest;
        if(info.cryptoOperation != CryptoOperation::PreserveOriginal) {
            auto message = boost::format("encryption change (for layer %s) is not supported in schema1 manifests") % info.digest;
            CARRIER_THROW_ERROR(message.str());
        }
    }
    fsLayers = std::move(updated);
}

void Schema1::setEmbeddedReference(const std::string& name, const std::string& tag) {
    this->name = name;
    this->tag = tag;
}

std::string Schema1::serialize() const {
    auto document = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = document.GetAllocator();

    document.AddMember("name", rapidjson::Value{name.c_str(), allocator}, allocator);
    document.AddMember("tag", rapidjson::Value{tag.c_str(), allocator}, allocator);
    document.AddMember("architecture", rapidjson::Value{architecture.c_str(), allocator}, allocator);

    auto layersJSON = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& layer : fsLayers) {
        auto entry = rapidjson::Value{rapidjson::kObjectType};
        entry.AddMember("blobSum", rapidjson::Value{layer.string().c_str(), allocator}, allocator);
        layersJSON.PushBack(entry, allocator);
    }
    document.AddMember("fsLayers", layersJSON, allocator);

    auto historyJSON = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& entry : history) {
        auto value = rapidjson::Value{rapidjson::kObjectType};
        value.AddMember("v1Compatibility", rapidjson::Value{entry.c_str(), allocator}, allocator);
        historyJSON.PushBack(value, allocator);
    }
    document.AddMember("history", historyJSON, allocator);
    document.AddMember("schemaVersion", rapidjson::Value{schemaVersion}, allocator);

    return json::serialize(document);
}

bool Schema1::canChangeLayerCompression(const std::string&) const {
    return true;
}

std::unique_ptr<Manifest> Schema1::clone() const {
    return std::unique_ptr<Manifest>{new Schema1{*this}};
}

std::string Schema1::toSchema2Config(const std::vector<Digest>& diffIDs) const {
    auto config = rapidjson::Document{};
    try {
        config = json::parse(history.front());
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "decoding configuration");
    }
    if(!config.IsObject()) {
        CARRIER_THROW_ERROR("decoding configuration: expected JSON object");
    }
    auto& allocator = config.GetAllocator();

    for(const char* key : {"id", "parent", "parent_id", "layer_id", "throwaway", "Size"}) {
        config.RemoveMember(key);
    }

    auto rootfs = rapidjson::Value{rapidjson::kObjectType};
    rootfs.AddMember("type", "layers", allocator);
    if(!diffIDs.empty()) {
        auto diffIDsJSON = rapidjson::Value{rapidjson::kArrayType};
        for(const auto& diffID : diffIDs) {
            diffIDsJSON.PushBack(rapidjson::Value{diffID.string().c_str(), allocator}, allocator);
        }
        rootfs.AddMember("diff_ids", diffIDsJSON, allocator);
    }

    auto historyJSON = rapidjson::Value{rapidjson::kArrayType};
    for(auto it = extractedV1Compatibility.crbegin(); it != extractedV1Compatibility.crend(); ++it) {
        auto item = rapidjson::Value{rapidjson::kObjectType};
        item.AddMember("created", rapidjson::Value{it->created.c_str(), allocator}, allocator);
        if(!it->author.empty()) {
            item.AddMember("author", rapidjson::Value{it->author.c_str(), allocator}, allocator);
        }
        auto createdBy = boost::algorithm::join(it->cmd, " ");
        if(!createdBy.empty()) {
            item.AddMember("created_by", rapidjson::Value{createdBy.c_str(), allocator}, allocator);
        }
        if(!it->comment.empty()) {
            item.AddMember("comment", rapidjson::Value{it->comment.c_str(), allocator}, allocator);
        }
        if(it->throwAway) {
            item.AddMember("empty_layer", true, allocator);
        }
        historyJSON.PushBack(item, allocator);
    }

    config.RemoveMember("rootfs");
    config.RemoveMember("history");
    config.AddMember("rootfs", rootfs, allocator);
    config.AddMember("history", historyJSON, allocator);

    // members are emitted in lexicographic order, as for any re-encoded config
    auto sorted = std::map<std::string, rapidjson::Value*>{};
    for(auto it = config.MemberBegin(); it != config.MemberEnd(); ++it) {
        sorted[std::string(it->name.GetString(), it->name.GetStringLength())] = &it->value;
    }
    auto result = rapidjson::Document{rapidjson::kObjectType};
    auto& resultAllocator = result.GetAllocator();
    for(auto& member : sorted) {
        result.AddMember(rapidjson::Value{member.first.c_str(), resultAllocator},
                         rapidjson::Value{*member.second, resultAllocator},
                         resultAllocator);
    }
    return json::serialize(result);
}

}
}
