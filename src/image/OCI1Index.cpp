/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "OCI1Index.hpp"

#include <algorithm>
#include <limits>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "libcarrier/utility/process.hpp"
#include "image/Manifest.hpp"
#include "image/mediaTypes.hpp"
#include "image/Schema2List.hpp"


namespace carrier {
namespace image {

namespace json = libcarrier::json;

const std::string OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD = "io.github.containers.compression.zstd";
const std::string OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD_VALUE = "true";

OCI1Index::OCI1Index(const std::vector<Descriptor>& manifests, const std::map<std::string, std::string>& annotations)
    : schemaVersion{2}
    , mediaType{mediatype::ociImageIndex}
    , manifests{manifests}
    , annotations{annotations}
{}

std::unique_ptr<OCI1Index> OCI1Index::fromBlob(const std::string& manifestBlob) {
    auto index = std::unique_ptr<OCI1Index>{new OCI1Index{{}, {}}};
    try {
        auto document = json::parse(manifestBlob);
        validateUnambiguousManifestFormat(manifestBlob, mediatype::ociImageIndex, AllowedFieldManifests);

        index->schemaVersion = json::getInt64(document, "schemaVersion");
        index->mediaType = json::getStringOrDefault(document, "mediaType", mediatype::ociImageIndex);
        index->artifactType = json::getStringOrDefault(document, "artifactType");
        if(document.HasMember("manifests") && document["manifests"].IsArray()) {
            for(const auto& manifest : document["manifests"].GetArray()) {
                index->manifests.push_back(descriptorFromJSON(manifest));
            }
        }
        if(document.HasMember("subject") && document["subject"].IsObject()) {
            index->subject = descriptorFromJSON(document["subject"]);
        }
        index->annotations = json::getStringMap(document, "annotations");
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse OCI image index");
    }
    return index;
}

std::string OCI1Index::getMIMEType() const {
    return mediatype::ociImageIndex;
}

std::vector<Digest> OCI1Index::getInstances() const {
    auto instances = std::vector<Digest>{};
    for(const auto& manifest : manifests) {
        instances.push_back(manifest.digest);
    }
    return instances;
}

static bool instanceIsZstd(const Descriptor& manifest) {
    auto it = manifest.annotations.find(OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD);
    return it != manifest.annotations.cend() && it->second == OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD_VALUE;
}

static void addCompressionAnnotations(const std::vector<compression::Algorithm>& algorithms,
                                      std::map<std::string, std::string>& annotations) {
    for(const auto& algorithm : algorithms) {
        if(algorithm.getBaseVariantName() == compression::ZSTD_ALGORITHM_NAME) {
            annotations[OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD] = OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD_VALUE;
        }
    }
}

ListUpdate OCI1Index::getInstance(const Digest& instanceDigest) const {
    for(const auto& manifest : manifests) {
        if(manifest.digest == instanceDigest) {
            auto update = ListUpdate{};
            update.digest = manifest.digest;
            update.size = manifest.size;
            update.mediaType = manifest.mediaType;
            update.readOnly.platform = manifest.platform;
            update.readOnly.annotations = manifest.annotations;
            update.readOnly.compressionAlgorithmNames = {
                instanceIsZstd(manifest) ? compression::ZSTD_ALGORITHM_NAME : compression::GZIP_ALGORITHM_NAME
            };
            update.readOnly.artifactType = manifest.artifactType;
            return update;
        }
    }
    auto message = boost::format("unable to find instance %s in OCI1Index") % instanceDigest;
    CARRIER_THROW_ERROR(message.str());
}

void OCI1Index::editInstances(const std::vector<ListEdit>& edits) {
    auto added = std::vector<Descriptor>{};
    auto updatedAnnotations = false;
    for(size_t i=0; i<edits.size(); ++i) {
        const auto& edit = edits[i];
        if(edit.operation == ListOperation::Update) {
            if(edit.updateOldDigest.empty()) {
                CARRIER_THROW_ERROR("OCI1Index::editInstances: attempting to update an instance with an empty digest");
            }
            if(edit.updateDigest.empty()) {
                CARRIER_THROW_ERROR("OCI1Index::editInstances: modified digest is empty");
            }
            auto target = std::find_if(manifests.begin(), manifests.end(), [&edit](const Descriptor& d) {
                return d.digest == edit.updateOldDigest;
            });
            if(target == manifests.end()) {
                auto message = boost::format("OCI1Index::editInstances: digest %s not found") % edit.updateOldDigest;
                CARRIER_THROW_ERROR(message.str());
            }
            target->digest = edit.updateDigest;
            if(edit.updateSize < 0) {
                auto message = boost::format("update %d of %d passed to OCI1Index::editInstances had an invalid size (%d)")
                    % (i+1) % edits.size() % edit.updateSize;
                CARRIER_THROW_ERROR(message.str());
            }
            target->size = edit.updateSize;
            if(edit.updateMediaType.empty()) {
                auto message = boost::format("update %d of %d passed to OCI1Index::editInstances had no media type (was \"%s\")")
                    % (i+1) % edits.size() % target->mediaType;
                CARRIER_THROW_ERROR(message.str());
            }
            target->mediaType = edit.updateMediaType;
            if(edit.updateAnnotations) {
                updatedAnnotations = true;
                if(edit.updateAffectAnnotations) {
                    target->annotations = *edit.updateAnnotations;
                }
                else {
                    for(const auto& kv : *edit.updateAnnotations) {
                        target->annotations[kv.first] = kv.second;
                    }
                }
            }
            addCompressionAnnotations(edit.updateCompressionAlgorithms, target->annotations);
        }
        else if(edit.operation == ListOperation::Add) {
            auto descriptor = Descriptor{};
            descriptor.mediaType = edit.addMediaType;
            descriptor.artifactType = edit.addArtifactType;
            descriptor.size = edit.addSize;
            descriptor.digest = edit.addDigest;
            descriptor.platform = edit.addPlatform;
            descriptor.annotations = edit.addAnnotations;
            addCompressionAnnotations(edit.addCompressionAlgorithms, descriptor.annotations);
            added.push_back(descriptor);
        }
        else {
            CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, "Internal error: invalid list edit operation");
        }
    }

    manifests.insert(manifests.end(), added.cbegin(), added.cend());
    // zstd instances go last so that clients unaware of the annotation pick a gzip instance
    if(!added.empty() || updatedAnnotations) {
        std::stable_sort(manifests.begin(), manifests.end(), [](const Descriptor& a, const Descriptor& b) {
            return !instanceIsZstd(a) && instanceIsZstd(b);
        });
    }
}

namespace {

struct InstanceCandidate {
    // index in the wanted platforms, lower is preferred
    size_t platformIndex;
    bool isZstd;
    size_t manifestPosition;
    Digest digest;

    bool isPreferredOver(const InstanceCandidate& other, bool preferGzip) const {
        if(platformIndex != other.platformIndex) {
            return platformIndex < other.platformIndex;
        }
        if(isZstd != other.isZstd) {
            return preferGzip ? !isZstd : isZstd;
        }
        return manifestPosition < other.manifestPosition;
    }
};

}

Digest OCI1Index::chooseInstanceByCompression(const PlatformChoice& choice, bool preferGzip) const {
    auto wantedPlatforms = getWantedPlatforms(choice);
    auto bestMatch = boost::optional<InstanceCandidate>{};

    for(size_t position=0; position<manifests.size(); ++position) {
        const auto& manifest = manifests[position];
        auto candidate = InstanceCandidate{ std::numeric_limits<size_t>::max(), instanceIsZstd(manifest),
                                            position, manifest.digest };
        if(manifest.platform) {
            auto wanted = std::find_if(wantedPlatforms.cbegin(), wantedPlatforms.cend(), [&manifest](const Platform& p) {
                return matchesPlatform(*manifest.platform, p);
            });
            if(wanted == wantedPlatforms.cend()) {
                continue;
            }
            candidate.platformIndex = static_cast<size_t>(wanted - wantedPlatforms.cbegin());
        }
        if(!bestMatch || candidate.isPreferredOver(*bestMatch, preferGzip)) {
            bestMatch = candidate;
        }
    }

    if(bestMatch) {
        return bestMatch->digest;
    }
    auto message = boost::format("no image found in image index for architecture \"%s\", variant \"%s\", OS \"%s\"")
        % wantedPlatforms.front().architecture % wantedPlatforms.front().variant % wantedPlatforms.front().os;
    CARRIER_THROW_ERROR(message.str());
}

std::string OCI1Index::serialize() const {
    auto document = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = document.GetAllocator();

    document.AddMember("schemaVersion", rapidjson::Value{schemaVersion}, allocator);
    if(!mediaType.empty()) {
        document.AddMember("mediaType", rapidjson::Value{mediaType.c_str(), allocator}, allocator);
    }
    if(!artifactType.empty()) {
        document.AddMember("artifactType", rapidjson::Value{artifactType.c_str(), allocator}, allocator);
    }
    auto manifestsJSON = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& manifest : manifests) {
        manifestsJSON.PushBack(descriptorToJSON(manifest, DescriptorStyle::OCI, allocator), allocator);
    }
    document.AddMember("manifests", manifestsJSON, allocator);
    if(subject) {
        document.AddMember("subject", descriptorToJSON(*subject, DescriptorStyle::OCI, allocator), allocator);
    }
    json::setStringMap(document, "annotations", annotations, allocator);

    return json::serialize(document);
}

std::unique_ptr<Schema2List> OCI1Index::toSchema2List() const {
    auto components = std::vector<Descriptor>{};
    for(const auto& manifest : manifests) {
        auto descriptor = Descriptor{};
        descriptor.mediaType = manifest.mediaType;
        descriptor.size = manifest.size;
        descriptor.digest = manifest.digest;
        descriptor.urls = manifest.urls;
        if(manifest.platform) {
            descriptor.platform = *manifest.platform;
            descriptor.platform->features.clear();
        }
        else {
            auto platform = Platform{};
            platform.os = libcarrier::process::getOperatingSystem();
            platform.architecture = libcarrier::process::getArchitecture();
            descriptor.platform = platform;
        }
        components.push_back(descriptor);
    }
    return std::unique_ptr<Schema2List>{new Schema2List{components}};
}

std::unique_ptr<ManifestList> OCI1Index::convertToMIMEType(const std::string& mimeType) const {
    auto normalized = normalizedMIMEType(mimeType);
    if(normalized == mediatype::dockerV2List) {
        return toSchema2List();
    }
    else if(normalized == mediatype::ociImageIndex) {
        return clone();
    }
    else if(normalized == mediatype::dockerV2Schema1
            || normalized == mediatype::dockerV2Schema1Signed
            || normalized == mediatype::ociImageManifest
            || normalized == mediatype::dockerV2Schema2) {
        auto message = boost::format("Can not convert image index to MIME type \"%s\", which is not a list type") % mimeType;
        CARRIER_THROW_ERROR(message.str());
    }
    auto message = boost::format("Unimplemented manifest MIME type %s") % mimeType;
    CARRIER_THROW_ERROR(message.str());
}

std::unique_ptr<ManifestList> OCI1Index::clone() const {
    return std::unique_ptr<ManifestList>{new OCI1Index{*this}};
}

}
}
