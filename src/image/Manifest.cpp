/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Manifest.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "libcarrier/utility/base64.hpp"
#include "libcarrier/utility/string.hpp"
#include "image/mediaTypes.hpp"
#include "image/Schema1.hpp"
#include "image/Schema2.hpp"
#include "image/OCI1.hpp"


namespace carrier {
namespace image {

std::unique_ptr<Manifest> manifestFromBlob(const std::string& manifestBlob, const std::string& mimeType) {
    auto normalized = normalizedMIMEType(mimeType);
    if(normalized == mediatype::dockerV2Schema1 || normalized == mediatype::dockerV2Schema1Signed) {
        return Schema1::fromBlob(manifestBlob);
    }
    else if(normalized == mediatype::ociImageManifest) {
        return OCI1::fromBlob(manifestBlob);
    }
    else if(normalized == mediatype::dockerV2Schema2) {
        return Schema2::fromBlob(manifestBlob);
    }
    else if(normalized == mediatype::dockerV2List || normalized == mediatype::ociImageIndex) {
        CARRIER_THROW_ERROR("Treating manifest lists as individual manifests is not implemented");
    }
    auto message = boost::format("Unimplemented manifest MIME type \"%s\" (normalized as \"%s\")") % mimeType % normalized;
    CARRIER_THROW_ERROR(message.str());
}

std::string guessMIMEType(const std::string& manifestBlob) {
    auto json = rapidjson::Document{};
    json.Parse(manifestBlob.c_str(), manifestBlob.size());
    if(json.HasParseError() || !json.IsObject()) {
        return "";
    }

    auto mediaType = std::string{};
    if(json.HasMember("mediaType") && json["mediaType"].IsString()) {
        mediaType = json["mediaType"].GetString();
    }
    if(mediaType == mediatype::dockerV2Schema2
       || mediaType == mediatype::dockerV2List
       || mediaType == mediatype::ociImageManifest
       || mediaType == mediatype::ociImageIndex) {
        return mediaType;
    }

    auto schemaVersion = int64_t{0};
    if(json.HasMember("schemaVersion") && json["schemaVersion"].IsInt64()) {
        schemaVersion = json["schemaVersion"].GetInt64();
    }

    if(schemaVersion == 1) {
        if(json.HasMember("signatures") && !json["signatures"].IsNull()) {
            return mediatype::dockerV2Schema1Signed;
        }
        return mediatype::dockerV2Schema1;
    }
    else if(schemaVersion == 2) {
        // Most likely an OCI manifest or index without the optional mediaType field
        auto configMediaType = std::string{};
        if(json.HasMember("config") && json["config"].IsObject()
           && json["config"].HasMember("mediaType") && json["config"]["mediaType"].IsString()) {
            configMediaType = json["config"]["mediaType"].GetString();
        }
        if(configMediaType == mediatype::ociImageConfig) {
            return mediatype::ociImageManifest;
        }
        else if(configMediaType == mediatype::dockerV2Schema2Config) {
            return mediatype::dockerV2Schema2;
        }
        if(json.HasMember("manifests") && json["manifests"].IsArray() && !json["manifests"].Empty()) {
            if(configMediaType.empty()) {
                return mediatype::ociImageIndex;
            }
            return configMediaType;
        }
        return mediatype::ociImageManifest;
    }
    return "";
}

std::string normalizedMIMEType(const std::string& mimeType) {
    if(mimeType == mediatype::dockerV2Schema1
       || mimeType == mediatype::dockerV2Schema1Signed
       || mimeType == mediatype::ociImageManifest
       || mimeType == mediatype::ociImageIndex
       || mimeType == mediatype::dockerV2Schema2
       || mimeType == mediatype::dockerV2List) {
        return mimeType;
    }
    // "application/json" and unknown values: registries which predate schema2 answer
    // with a generic or bogus MIME type, treat those as signed schema1
    return mediatype::dockerV2Schema1Signed;
}

/**
 * Extracts the payload of a JWS "pretty signature": the manifest bytes as they
 * were before the "signatures" member was spliced in.
 */
static std::string getSchema1SignedPayload(const std::string& manifestBlob) {
    auto json = libcarrier::json::parse(manifestBlob);
    if(!json.HasMember("signatures") || !json["signatures"].IsArray() || json["signatures"].Empty()) {
        CARRIER_THROW_ERROR("missing signatures in signed schema1 manifest");
    }

    auto formatLength = int64_t{-1};
    auto formatTail = std::string{};
    for(const auto& signature : json["signatures"].GetArray()) {
        auto protectedHeader = libcarrier::json::parse(
            libcarrier::base64::decodeURL(libcarrier::json::getString(signature, "protected")));
        auto length = libcarrier::json::getInt64(protectedHeader, "formatLength");
        auto tail = libcarrier::base64::decodeURL(libcarrier::json::getString(protectedHeader, "formatTail"));
        if(formatLength == -1) {
            formatLength = length;
            formatTail = tail;
        }
        else if(length != formatLength || tail != formatTail) {
            CARRIER_THROW_ERROR("inconsistent format of signatures in signed schema1 manifest");
        }
    }

    if(formatLength < 0 || static_cast<size_t>(formatLength) > manifestBlob.size()) {
        auto message = boost::format("invalid format length %d in signed schema1 manifest") % formatLength;
        CARRIER_THROW_ERROR(message.str());
    }
    return manifestBlob.substr(0, formatLength) + formatTail;
}

Digest manifestDigest(const std::string& manifestBlob) {
    if(guessMIMEType(manifestBlob) == mediatype::dockerV2Schema1Signed) {
        try {
            return Digest::fromBytes(getSchema1SignedPayload(manifestBlob));
        }
        catch(libcarrier::Error& e) {
            CARRIER_RETHROW_ERROR(e, "Failed to compute digest of signed schema1 manifest");
        }
    }
    return Digest::fromBytes(manifestBlob);
}

bool manifestMatchesDigest(const std::string& manifestBlob, const Digest& expected) {
    return manifestDigest(manifestBlob) == expected;
}

bool isMultiImage(const std::string& mimeType) {
    return mimeType == mediatype::dockerV2List || mimeType == mediatype::ociImageIndex;
}

bool supportsEncryption(const std::string& mimeType) {
    return mimeType == mediatype::ociImageManifest;
}

const std::vector<std::string>& getDefaultRequestedManifestMIMETypes() {
    static const auto types = std::vector<std::string>{
        mediatype::ociImageManifest,
        mediatype::dockerV2Schema2,
        mediatype::dockerV2Schema1Signed,
        mediatype::dockerV2Schema1,
        mediatype::dockerV2List,
        mediatype::ociImageIndex
    };
    return types;
}

bool compressionAlgorithmIsUniversallySupported(const compression::Algorithm& algorithm) {
    return algorithm.getName() == compression::GZIP_ALGORITHM_NAME;
}

bool mimeTypeSupportsCompressionAlgorithm(const std::string& mimeType, const compression::Algorithm& algorithm) {
    if(compressionAlgorithmIsUniversallySupported(algorithm)) {
        return true;
    }
    if(algorithm.getName() == compression::ZSTD_ALGORITHM_NAME
       || algorithm.getName() == compression::ZSTD_CHUNKED_ALGORITHM_NAME) {
        return mimeType == mediatype::ociImageManifest;
    }
    // bzip2 and xz are known algorithms, but no manifest format describes them
    return false;
}

void validateUnambiguousManifestFormat(const std::string& manifestBlob, const std::string& expectedMIMEType,
                                       unsigned allowedFields) {
    static const auto fields = std::vector<std::pair<const char*, unsigned>>{
        {"config", AllowedFieldConfig},
        {"fsLayers", AllowedFieldFSLayers},
        {"history", AllowedFieldHistory},
        {"layers", AllowedFieldLayers},
        {"manifests", AllowedFieldManifests}
    };

    auto json = libcarrier::json::parse(manifestBlob);
    if(!json.IsObject()) {
        auto message = boost::format("manifest is not a JSON object, expected %s") % expectedMIMEType;
        CARRIER_THROW_ERROR(message.str());
    }

    auto mediaType = libcarrier::json::getStringOrDefault(json, "mediaType");
    if(!mediaType.empty() && mediaType != expectedMIMEType) {
        auto message = boost::format("manifest has mediaType \"%s\", expected \"%s\"") % mediaType % expectedMIMEType;
        CARRIER_THROW_ERROR(message.str());
    }

    auto unexpected = std::vector<std::string>{};
    for(const auto& field : fields) {
        if(json.HasMember(field.first) && !json[field.first].IsNull() && !(allowedFields & field.second)) {
            unexpected.push_back(field.first);
        }
    }
    if(!unexpected.empty()) {
        auto message = boost::format("rejecting ambiguous manifest, unexpected fields %s in supposedly %s")
            % libcarrier::string::join(unexpected, ", ") % expectedMIMEType;
        CARRIER_THROW_ERROR(message.str());
    }
}

bool candidateCompressionMatchesReuseConditions(const ReuseConditions& conditions,
                                                const boost::optional<compression::Algorithm>& candidateCompression) {
    if(conditions.requiredCompression) {
        if(!candidateCompression
           || (conditions.requiredCompression->getName() != candidateCompression->getName()
               && conditions.requiredCompression->getName() != candidateCompression->getBaseVariantName())) {
            return false;
        }
    }

    if(conditions.possibleManifestFormats && candidateCompression) {
        auto supported = false;
        for(const auto& format : *conditions.possibleManifestFormats) {
            if(mimeTypeSupportsCompressionAlgorithm(format, *candidateCompression)) {
                supported = true;
                break;
            }
        }
        if(!supported) {
            return false;
        }
    }

    return true;
}

}
}
