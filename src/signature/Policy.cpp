/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Policy.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/json.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/Manifest.hpp"
#include "crypto/OpenSSL.hpp"
#include "signature/Signature.hpp"


namespace carrier {
namespace signature {

namespace json = libcarrier::json;
namespace rj = rapidjson;

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Policy", level);
}

namespace {

// "domain/path" of a reference string, or empty if it doesn't parse
std::string repositoryOf(const std::string& reference) {
    try {
        return image::DockerReference::parse(reference).getName();
    }
    catch(const libcarrier::Error&) {
        return "";
    }
}

// Exact match for tagged images, repository match for images referenced by digest
class MatchRepoDigestOrExact : public PolicyReferenceMatch {
public:
    bool matchesDockerReference(const UnparsedImage& image, const std::string& signatureDockerReference) const override {
        auto reference = image.getDockerReference();
        if(!reference) {
            return false;
        }
        if(!reference->digest.empty()) {
            return reference->getName() == repositoryOf(signatureDockerReference);
        }
        if(reference->tag.empty()) {
            return false;
        }
        return reference->string() == signatureDockerReference;
    }
};

class MatchExact : public PolicyReferenceMatch {
public:
    bool matchesDockerReference(const UnparsedImage& image, const std::string& signatureDockerReference) const override {
        auto reference = image.getDockerReference();
        if(!reference || reference->isNameOnly()) {
            return false;
        }
        return reference->string() == signatureDockerReference;
    }
};

class MatchRepository : public PolicyReferenceMatch {
public:
    bool matchesDockerReference(const UnparsedImage& image, const std::string& signatureDockerReference) const override {
        auto reference = image.getDockerReference();
        if(!reference) {
            return false;
        }
        return reference->getName() == repositoryOf(signatureDockerReference);
    }
};

// The signature must name a fixed reference, as needed by transports without Docker references
class ExactReference : public PolicyReferenceMatch {
public:
    explicit ExactReference(const std::string& dockerReference) : dockerReference{dockerReference} {}
    bool matchesDockerReference(const UnparsedImage&, const std::string& signatureDockerReference) const override {
        return dockerReference == signatureDockerReference;
    }

private:
    std::string dockerReference;
};

std::unique_ptr<PolicyReferenceMatch> parseReferenceMatch(const rj::Value& json) {
    auto type = json::getString(json, "type");
    if(type == "matchRepoDigestOrExact") {
        return std::unique_ptr<PolicyReferenceMatch>{new MatchRepoDigestOrExact{}};
    }
    else if(type == "matchExact") {
        return std::unique_ptr<PolicyReferenceMatch>{new MatchExact{}};
    }
    else if(type == "matchRepository") {
        return std::unique_ptr<PolicyReferenceMatch>{new MatchRepository{}};
    }
    else if(type == "exactReference") {
        auto reference = json::getString(json, "dockerReference");
        auto parsed = image::DockerReference::parse(reference);
        if(parsed.isNameOnly()) {
            auto message = boost::format("dockerReference %s contains neither a tag nor digest") % reference;
            CARRIER_THROW_ERROR(message.str());
        }
        return std::unique_ptr<PolicyReferenceMatch>{new ExactReference{reference}};
    }
    auto message = boost::format("Unknown policy reference match type \"%s\"") % type;
    CARRIER_THROW_ERROR(message.str());
}

std::shared_ptr<const PolicyRequirement> parseRequirement(const rj::Value& json,
                                                          const boost::filesystem::path& baseDirectory) {
    if(!json.IsObject()) {
        CARRIER_THROW_ERROR("Policy requirement is not a JSON object");
    }
    auto type = json::getString(json, "type");
    if(type == "insecureAcceptAnything") {
        return std::make_shared<InsecureAcceptAnything>();
    }
    else if(type == "reject") {
        return std::make_shared<Reject>();
    }
    else if(type == "signedBy") {
        auto keyType = json::getString(json, "keyType");
        if(keyType != "PEMPublicKey") {
            auto message = boost::format("Unsupported signedBy keyType \"%s\", only \"PEMPublicKey\" is supported") % keyType;
            CARRIER_THROW_ERROR(message.str());
        }
        auto keys = std::vector<std::string>{};
        if(json.HasMember("keyPath")) {
            auto path = boost::filesystem::path{json::getString(json, "keyPath")};
            if(path.is_relative()) {
                path = baseDirectory / path;
            }
            keys.push_back(libcarrier::filesystem::readFile(path));
        }
        else if(json.HasMember("keyData")) {
            keys.push_back(json::getString(json, "keyData"));
        }
        else {
            CARRIER_THROW_ERROR("signedBy requirement needs \"keyPath\" or \"keyData\"");
        }
        // fail on invalid keys when loading the policy, not when the first image is checked
        for(const auto& key : keys) {
            crypto::loadPublicKeyPEM(key);
        }
        auto identity = std::unique_ptr<PolicyReferenceMatch>{new MatchRepoDigestOrExact{}};
        if(json.HasMember("signedIdentity")) {
            identity = parseReferenceMatch(json["signedIdentity"]);
        }
        return std::make_shared<SignedBy>(std::move(keys), std::move(identity));
    }
    auto message = boost::format("Unknown policy requirement type \"%s\"") % type;
    CARRIER_THROW_ERROR(message.str());
}

PolicyRequirements parseRequirements(const rj::Value& json, const boost::filesystem::path& baseDirectory) {
    if(!json.IsArray()) {
        CARRIER_THROW_ERROR("Policy requirements must be a JSON array");
    }
    if(json.Empty()) {
        CARRIER_THROW_ERROR("Policy requirements list must not be empty");
    }
    auto requirements = PolicyRequirements{};
    for(rj::SizeType i=0; i<json.Size(); ++i) {
        requirements.push_back(parseRequirement(json[i], baseDirectory));
    }
    return requirements;
}

}

std::string InsecureAcceptAnything::isRunningImageAllowed(UnparsedImage&) const {
    return "";
}

std::string Reject::isRunningImageAllowed(UnparsedImage& image) const {
    return (boost::format("Running image %s:%s is rejected by policy.")
        % image.getTransportName() % image.getPolicyConfigurationIdentity()).str();
}

SignedBy::SignedBy(std::vector<std::string> publicKeysPEM, std::unique_ptr<PolicyReferenceMatch> signedIdentity)
    : publicKeysPEM(std::move(publicKeysPEM))
    , signedIdentity(std::move(signedIdentity))
{}

std::string SignedBy::isRunningImageAllowed(UnparsedImage& image) const {
    auto manifest = image.getManifest().first;
    auto signatures = image.getSignatures();
    if(signatures.empty()) {
        return "A signature was required, but no signature exists";
    }
    auto reasons = std::vector<std::string>{};
    for(const auto& signature : signatures) {
        auto reason = verifySignature(image, manifest, signature);
        if(reason.empty()) {
            return "";
        }
        reasons.push_back(reason);
    }
    return "None of the signatures were accepted, reasons: " + boost::algorithm::join(reasons, "; ");
}

std::string SignedBy::verifySignature(UnparsedImage& image, const std::string& manifest, const std::string& blob) const {
    auto envelope = Signature{};
    auto payload = SimpleSigningPayload{};
    try {
        envelope = Signature::parse(blob);
        payload = SimpleSigningPayload::parse(envelope.payload);
    }
    catch(const libcarrier::Error& e) {
        return e.what();
    }

    auto verified = false;
    for(const auto& pem : publicKeysPEM) {
        auto key = crypto::loadPublicKeyPEM(pem);
        if(crypto::verify(key.get(), envelope.payload, envelope.signature)) {
            verified = true;
            break;
        }
    }
    if(!verified) {
        return "Signature by key not trusted";
    }
    if(!image::manifestMatchesDigest(manifest, payload.manifestDigest)) {
        return (boost::format("Signature for manifest digest %s does not match the image") % payload.manifestDigest).str();
    }
    if(!signedIdentity->matchesDockerReference(image, payload.dockerReference)) {
        return (boost::format("Signature for identity %s is not accepted") % payload.dockerReference).str();
    }
    printLog(boost::format("Accepted signature of %s for %s") % payload.manifestDigest % payload.dockerReference,
             libcarrier::LogLevel::DEBUG);
    return "";
}

Policy Policy::fromFile(const boost::filesystem::path& file) {
    try {
        auto document = rj::Document{};
        document = json::read(file);
        return fromJSON(document, file.parent_path());
    }
    catch(const libcarrier::Error& e) {
        auto message = boost::format("Failed to load policy from %s") % file;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

Policy Policy::fromJSON(const rj::Value& json, const boost::filesystem::path& baseDirectory) {
    if(!json.IsObject()) {
        CARRIER_THROW_ERROR("Policy is not a JSON object");
    }
    if(!json.HasMember("default")) {
        CARRIER_THROW_ERROR("Policy is missing the \"default\" requirements");
    }
    auto policy = Policy{};
    policy.defaultRequirements = parseRequirements(json["default"], baseDirectory);

    if(json.HasMember("transports")) {
        const auto& transports = json["transports"];
        if(!transports.IsObject()) {
            CARRIER_THROW_ERROR("Policy \"transports\" is not a JSON object");
        }
        for(auto transport = transports.MemberBegin(); transport != transports.MemberEnd(); ++transport) {
            if(!transport->value.IsObject()) {
                auto message = boost::format("Policy scopes of transport %s are not a JSON object") % transport->name.GetString();
                CARRIER_THROW_ERROR(message.str());
            }
            auto& scopes = policy.transports[transport->name.GetString()];
            for(auto scope = transport->value.MemberBegin(); scope != transport->value.MemberEnd(); ++scope) {
                scopes[scope->name.GetString()] = parseRequirements(scope->value, baseDirectory);
            }
        }
    }
    return policy;
}

}
}
