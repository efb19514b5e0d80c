/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Signature.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "libcarrier/utility/base64.hpp"


namespace carrier {
namespace signature {

namespace json = libcarrier::json;
namespace rj = rapidjson;

const std::string SIMPLE_SIGNING_TYPE{"atomic container signature"};

std::string Signature::serialize() const {
    auto document = rj::Document{};
    document.SetObject();
    auto& allocator = document.GetAllocator();
    document.AddMember("payload", rj::Value{libcarrier::base64::encode(payload).c_str(), allocator}, allocator);
    document.AddMember("signature", rj::Value{libcarrier::base64::encode(signature).c_str(), allocator}, allocator);
    return json::serialize(document);
}

Signature Signature::parse(const std::string& blob) {
    try {
        auto document = rj::Document{};
        document = json::parse(blob);
        if(!document.IsObject()) {
            CARRIER_THROW_ERROR("signature envelope is not a JSON object");
        }
        auto result = Signature{};
        result.payload = libcarrier::base64::decode(json::getString(document, "payload"));
        result.signature = libcarrier::base64::decode(json::getString(document, "signature"));
        return result;
    }
    catch(const libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse signature");
    }
}

std::string SimpleSigningPayload::serialize() const {
    auto document = rj::Document{};
    document.SetObject();
    auto& allocator = document.GetAllocator();

    auto image = rj::Value{rj::kObjectType};
    image.AddMember("docker-manifest-digest", rj::Value{manifestDigest.string().c_str(), allocator}, allocator);
    auto identity = rj::Value{rj::kObjectType};
    identity.AddMember("docker-reference", rj::Value{dockerReference.c_str(), allocator}, allocator);
    auto critical = rj::Value{rj::kObjectType};
    critical.AddMember("type", rj::Value{SIMPLE_SIGNING_TYPE.c_str(), allocator}, allocator);
    critical.AddMember("image", image, allocator);
    critical.AddMember("identity", identity, allocator);

    auto optional = rj::Value{rj::kObjectType};
    if(!creator.empty()) {
        optional.AddMember("creator", rj::Value{creator.c_str(), allocator}, allocator);
    }
    optional.AddMember("timestamp", rj::Value{timestamp}, allocator);

    document.AddMember("critical", critical, allocator);
    document.AddMember("optional", optional, allocator);
    return json::serialize(document);
}

SimpleSigningPayload SimpleSigningPayload::parse(const std::string& payload) {
    try {
        auto document = rj::Document{};
        document = json::parse(payload);
        if(!document.IsObject() || !document.HasMember("critical") || !document["critical"].IsObject()) {
            CARRIER_THROW_ERROR("missing \"critical\" object");
        }
        const auto& critical = document["critical"];
        auto type = json::getString(critical, "type");
        if(type != SIMPLE_SIGNING_TYPE) {
            auto message = boost::format("unrecognized signature type \"%s\"") % type;
            CARRIER_THROW_ERROR(message.str());
        }
        if(!critical.HasMember("image") || !critical.HasMember("identity")) {
            CARRIER_THROW_ERROR("\"critical\" must contain \"image\" and \"identity\"");
        }

        auto result = SimpleSigningPayload{};
        result.manifestDigest = image::Digest::parse(json::getString(critical["image"], "docker-manifest-digest"));
        result.dockerReference = json::getString(critical["identity"], "docker-reference");
        if(document.HasMember("optional") && document["optional"].IsObject()) {
            const auto& optional = document["optional"];
            result.creator = json::getStringOrDefault(optional, "creator");
            if(optional.HasMember("timestamp")) {
                result.timestamp = json::getInt64(optional, "timestamp");
            }
        }
        return result;
    }
    catch(const libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to parse simple signing payload");
    }
}

}
}
