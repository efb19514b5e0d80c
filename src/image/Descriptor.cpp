/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Descriptor.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"


namespace carrier {
namespace image {

namespace json = libcarrier::json;

std::vector<std::string> getStringArray(const rapidjson::Value& object, const char* key) {
    auto result = std::vector<std::string>{};
    if(!object.HasMember(key) || object[key].IsNull()) {
        return result;
    }
    if(!object[key].IsArray()) {
        auto message = boost::format("Expected JSON array member \"%s\"") % key;
        CARRIER_THROW_ERROR(message.str());
    }
    for(const auto& value : object[key].GetArray()) {
        if(!value.IsString()) {
            auto message = boost::format("Expected strings in JSON array \"%s\"") % key;
            CARRIER_THROW_ERROR(message.str());
        }
        result.emplace_back(value.GetString(), value.GetStringLength());
    }
    return result;
}

static rapidjson::Value stringArrayToJSON(const std::vector<std::string>& strings,
                                          rapidjson::Document::AllocatorType& allocator) {
    auto array = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& s : strings) {
        array.PushBack(rapidjson::Value{s.c_str(), allocator}, allocator);
    }
    return array;
}

Platform platformFromJSON(const rapidjson::Value& json) {
    if(!json.IsObject()) {
        CARRIER_THROW_ERROR("Expected JSON object for platform");
    }
    auto platform = Platform{};
    platform.architecture = json::getStringOrDefault(json, "architecture");
    platform.os = json::getStringOrDefault(json, "os");
    platform.osVersion = json::getStringOrDefault(json, "os.version");
    platform.osFeatures = getStringArray(json, "os.features");
    platform.variant = json::getStringOrDefault(json, "variant");
    platform.features = getStringArray(json, "features");
    return platform;
}

rapidjson::Value platformToJSON(const Platform& platform, DescriptorStyle style,
                                 rapidjson::Document::AllocatorType& allocator) {
    auto json = rapidjson::Value{rapidjson::kObjectType};
    json.AddMember("architecture", rapidjson::Value{platform.architecture.c_str(), allocator}, allocator);
    json.AddMember("os", rapidjson::Value{platform.os.c_str(), allocator}, allocator);
    if(!platform.osVersion.empty()) {
        json.AddMember("os.version", rapidjson::Value{platform.osVersion.c_str(), allocator}, allocator);
    }
    if(!platform.osFeatures.empty()) {
        json.AddMember("os.features", stringArrayToJSON(platform.osFeatures, allocator), allocator);
    }
    if(!platform.variant.empty()) {
        json.AddMember("variant", rapidjson::Value{platform.variant.c_str(), allocator}, allocator);
    }
    if(style == DescriptorStyle::Schema2 && !platform.features.empty()) {
        json.AddMember("features", stringArrayToJSON(platform.features, allocator), allocator);
    }
    return json;
}

Descriptor descriptorFromJSON(const rapidjson::Value& json) {
    if(!json.IsObject()) {
        CARRIER_THROW_ERROR("Expected JSON object for descriptor");
    }

    auto descriptor = Descriptor{};
    try {
        descriptor.mediaType = json::getStringOrDefault(json, "mediaType");
        auto digest = json::getStringOrDefault(json, "digest");
        if(!digest.empty()) {
            descriptor.digest = Digest::parse(digest);
        }
        if(json.HasMember("size")) {
            descriptor.size = json::getInt64(json, "size");
        }
        descriptor.urls = getStringArray(json, "urls");
        descriptor.annotations = json::getStringMap(json, "annotations");
        if(json.HasMember("platform") && !json["platform"].IsNull()) {
            descriptor.platform = platformFromJSON(json["platform"]);
        }
        descriptor.artifactType = json::getStringOrDefault(json, "artifactType");
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse descriptor");
    }
    return descriptor;
}

rapidjson::Value descriptorToJSON(const Descriptor& descriptor, DescriptorStyle style,
                                  rapidjson::Document::AllocatorType& allocator) {
    auto json = rapidjson::Value{rapidjson::kObjectType};
    auto digest = descriptor.digest.string();

    if(style == DescriptorStyle::Schema2) {
        json.AddMember("mediaType", rapidjson::Value{descriptor.mediaType.c_str(), allocator}, allocator);
        json.AddMember("size", rapidjson::Value{descriptor.size}, allocator);
        json.AddMember("digest", rapidjson::Value{digest.c_str(), allocator}, allocator);
        if(!descriptor.urls.empty()) {
            json.AddMember("urls", stringArrayToJSON(descriptor.urls, allocator), allocator);
        }
        if(descriptor.platform) {
            json.AddMember("platform", platformToJSON(*descriptor.platform, style, allocator), allocator);
        }
        return json;
    }

    json.AddMember("mediaType", rapidjson::Value{descriptor.mediaType.c_str(), allocator}, allocator);
    json.AddMember("digest", rapidjson::Value{digest.c_str(), allocator}, allocator);
    json.AddMember("size", rapidjson::Value{descriptor.size}, allocator);
    if(!descriptor.urls.empty()) {
        json.AddMember("urls", stringArrayToJSON(descriptor.urls, allocator), allocator);
    }
    json::setStringMap(json, "annotations", descriptor.annotations, allocator);
    if(descriptor.platform) {
        json.AddMember("platform", platformToJSON(*descriptor.platform, style, allocator), allocator);
    }
    if(!descriptor.artifactType.empty()) {
        json.AddMember("artifactType", rapidjson::Value{descriptor.artifactType.c_str(), allocator}, allocator);
    }
    return json;
}

BlobInfo blobInfoFromDescriptor(const Descriptor& descriptor, DescriptorStyle style) {
    auto info = BlobInfo{};
    info.digest = descriptor.digest;
    info.size = descriptor.size;
    info.urls = descriptor.urls;
    info.mediaType = descriptor.mediaType;
    if(style == DescriptorStyle::OCI) {
        info.annotations = descriptor.annotations;
    }
    return info;
}

}
}
