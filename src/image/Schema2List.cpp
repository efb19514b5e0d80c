/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Schema2List.hpp"

#include <algorithm>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "image/Manifest.hpp"
#include "image/mediaTypes.hpp"
#include "image/OCI1Index.hpp"


namespace carrier {
namespace image {

namespace json = libcarrier::json;

Schema2List::Schema2List(const std::vector<Descriptor>& manifests)
    : schemaVersion{2}
    , mediaType{mediatype::dockerV2List}
{
    for(const auto& manifest : manifests) {
        auto descriptor = Descriptor{};
        descriptor.mediaType = manifest.mediaType;
        descriptor.size = manifest.size;
        descriptor.digest = manifest.digest;
        descriptor.urls = manifest.urls;
        descriptor.platform = manifest.platform ? *manifest.platform : Platform{};
        this->manifests.push_back(descriptor);
    }
}

std::unique_ptr<Schema2List> Schema2List::fromBlob(const std::string& manifestBlob) {
    auto list = std::unique_ptr<Schema2List>{new Schema2List{}};
    try {
        auto document = json::parse(manifestBlob);
        validateUnambiguousManifestFormat(manifestBlob, mediatype::dockerV2List, AllowedFieldManifests);

        list->schemaVersion = json::getInt64(document, "schemaVersion");
        list->mediaType = json::getStringOrDefault(document, "mediaType");
        if(document.HasMember("manifests") && document["manifests"].IsArray()) {
            for(const auto& manifest : document["manifests"].GetArray()) {
                auto descriptor = descriptorFromJSON(manifest);
                if(!descriptor.platform) {
                    descriptor.platform = Platform{};
                }
                list->manifests.push_back(descriptor);
            }
        }
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse Docker manifest list");
    }
    return list;
}

std::string Schema2List::getMIMEType() const {
    return mediaType;
}

std::vector<Digest> Schema2List::getInstances() const {
    auto instances = std::vector<Digest>{};
    for(const auto& manifest : manifests) {
        instances.push_back(manifest.digest);
    }
    return instances;
}

ListUpdate Schema2List::getInstance(const Digest& instanceDigest) const {
    for(const auto& manifest : manifests) {
        if(manifest.digest == instanceDigest) {
            auto update = ListUpdate{};
            update.digest = manifest.digest;
            update.size = manifest.size;
            update.mediaType = manifest.mediaType;
            update.readOnly.compressionAlgorithmNames = { compression::GZIP_ALGORITHM_NAME };
            auto platform = *manifest.platform;
            platform.features.clear();
            update.readOnly.platform = platform;
            return update;
        }
    }
    auto message = boost::format("unable to find instance %s passed to Schema2List::getInstance") % instanceDigest;
    CARRIER_THROW_ERROR(message.str());
}

void Schema2List::editInstances(const std::vector<ListEdit>& edits) {
    auto added = std::vector<Descriptor>{};
    for(size_t i=0; i<edits.size(); ++i) {
        const auto& edit = edits[i];
        if(edit.operation == ListOperation::Update) {
            if(edit.updateOldDigest.empty()) {
                CARRIER_THROW_ERROR("Schema2List::editInstances: attempting to update an instance with an empty digest");
            }
            if(edit.updateDigest.empty()) {
                CARRIER_THROW_ERROR("Schema2List::editInstances: modified digest is empty");
            }
            auto target = std::find_if(manifests.begin(), manifests.end(), [&edit](const Descriptor& d) {
                return d.digest == edit.updateOldDigest;
            });
            if(target == manifests.end()) {
                auto message = boost::format("Schema2List::editInstances: digest %s not found") % edit.updateOldDigest;
                CARRIER_THROW_ERROR(message.str());
            }
            target->digest = edit.updateDigest;
            if(edit.updateSize < 0) {
                auto message = boost::format("update %d of %d passed to Schema2List::editInstances had an invalid size (%d)")
                    % (i+1) % edits.size() % edit.updateSize;
                CARRIER_THROW_ERROR(message.str());
            }
            target->size = edit.updateSize;
            if(edit.updateMediaType.empty()) {
                auto message = boost::format("update %d of %d passed to Schema2List::editInstances had no media type (was \"%s\")")
                    % (i+1) % edits.size() % target->mediaType;
                CARRIER_THROW_ERROR(message.str());
            }
            target->mediaType = edit.updateMediaType;
        }
        else if(edit.operation == ListOperation::Add) {
            if(!edit.addPlatform) {
                CARRIER_THROW_ERROR("adding a schema2 list instance with no platform specified is not supported");
            }
            auto descriptor = Descriptor{};
            descriptor.digest = edit.addDigest;
            descriptor.size = edit.addSize;
            descriptor.mediaType = edit.addMediaType;
            descriptor.platform = *edit.addPlatform;
            added.push_back(descriptor);
        }
        else {
            CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, "Internal error: invalid list edit operation");
        }
    }
    manifests.insert(manifests.end(), added.cbegin(), added.cend());
}

Digest Schema2List::chooseInstanceByCompression(const PlatformChoice& choice, bool) const {
    auto wantedPlatforms = getWantedPlatforms(choice);
    for(const auto& wanted : wantedPlatforms) {
        for(const auto& manifest : manifests) {
            if(matchesPlatform(*manifest.platform, wanted)) {
                return manifest.digest;
            }
        }
    }
    auto message = boost::format("no image found in manifest list for architecture \"%s\", variant \"%s\", OS \"%s\"")
        % wantedPlatforms.front().architecture % wantedPlatforms.front().variant % wantedPlatforms.front().os;
    CARRIER_THROW_ERROR(message.str());
}

std::string Schema2List::serialize() const {
    auto document = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = document.GetAllocator();

    document.AddMember("schemaVersion", rapidjson::Value{schemaVersion}, allocator);
    document.AddMember("mediaType", rapidjson::Value{mediaType.c_str(), allocator}, allocator);
    auto manifestsJSON = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& manifest : manifests) {
        manifestsJSON.PushBack(descriptorToJSON(manifest, DescriptorStyle::Schema2, allocator), allocator);
    }
    document.AddMember("manifests", manifestsJSON, allocator);

    return json::serialize(document);
}

std::unique_ptr<OCI1Index> Schema2List::toOCI1Index() const {
    auto components = std::vector<Descriptor>{};
    for(const auto& manifest : manifests) {
        auto descriptor = Descriptor{};
        descriptor.mediaType = manifest.mediaType;
        descriptor.size = manifest.size;
        descriptor.digest = manifest.digest;
        descriptor.urls = manifest.urls;
        auto platform = *manifest.platform;
        platform.features.clear();
        descriptor.platform = platform;
        components.push_back(descriptor);
    }
    return std::unique_ptr<OCI1Index>{new OCI1Index{components, {}}};
}

std::unique_ptr<ManifestList> Schema2List::convertToMIMEType(const std::string& mimeType) const {
    auto normalized = normalizedMIMEType(mimeType);
    if(normalized == mediatype::dockerV2List) {
        return clone();
    }
    else if(normalized == mediatype::ociImageIndex) {
        return toOCI1Index();
    }
    else if(normalized == mediatype::dockerV2Schema1
            || normalized == mediatype::dockerV2Schema1Signed
            || normalized == mediatype::ociImageManifest
            || normalized == mediatype::dockerV2Schema2) {
        auto message = boost::format("Can not convert manifest list to MIME type \"%s\", which is not a list type") % mimeType;
        CARRIER_THROW_ERROR(message.str());
    }
    auto message = boost::format("Unimplemented manifest list MIME type %s") % mimeType;
    CARRIER_THROW_ERROR(message.str());
}

std::unique_ptr<ManifestList> Schema2List::clone() const {
    return std::unique_ptr<ManifestList>{new Schema2List{*this}};
}

}
}
