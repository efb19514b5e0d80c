/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_signature_Policy_hpp
#define carrier_signature_Policy_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <utility>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "image/DockerReference.hpp"


namespace carrier {
namespace signature {

/**
 * The image being admitted. Signatures are fetched only if a requirement needs them.
 */
class UnparsedImage {
public:
    virtual ~UnparsedImage() = default;
    virtual std::string getTransportName() const = 0;
    virtual std::string getPolicyConfigurationIdentity() const = 0;
    virtual std::vector<std::string> getPolicyConfigurationNamespaces() const = 0;
    virtual boost::optional<image::DockerReference> getDockerReference() const = 0;
    // Manifest blob and MIME type
    virtual std::pair<std::string, std::string> getManifest() = 0;
    virtual std::vector<std::string> getSignatures() = 0;
};

// How the identity claimed by a signature must relate to the image reference
class PolicyReferenceMatch {
public:
    virtual ~PolicyReferenceMatch() = default;
    virtual bool matchesDockerReference(const UnparsedImage& image, const std::string& signatureDockerReference) const = 0;
};

class PolicyRequirement {
public:
    virtual ~PolicyRequirement() = default;
    // Returns an empty string if allowed, the reason for the rejection otherwise
    virtual std::string isRunningImageAllowed(UnparsedImage& image) const = 0;
};

using PolicyRequirements = std::vector<std::shared_ptr<const PolicyRequirement>>;

class InsecureAcceptAnything : public PolicyRequirement {
public:
    std::string isRunningImageAllowed(UnparsedImage&) const override;
};

class Reject : public PolicyRequirement {
public:
    std::string isRunningImageAllowed(UnparsedImage& image) const override;
};

class SignedBy : public PolicyRequirement {
public:
    SignedBy(std::vector<std::string> publicKeysPEM, std::unique_ptr<PolicyReferenceMatch> signedIdentity);
    std::string isRunningImageAllowed(UnparsedImage& image) const override;

private:
    std::string verifySignature(UnparsedImage& image, const std::string& manifest, const std::string& blob) const;

private:
    std::vector<std::string> publicKeysPEM;
    std::unique_ptr<PolicyReferenceMatch> signedIdentity;
};

/**
 * The contents of policy.json: the default requirements and per-transport
 * requirements keyed by scope.
 */
struct Policy {
    PolicyRequirements defaultRequirements;
    std::map<std::string, std::map<std::string, PolicyRequirements>> transports;

    // Relative key paths are resolved against the directory of the policy file
    static Policy fromFile(const boost::filesystem::path& file);
    static Policy fromJSON(const rapidjson::Value& json, const boost::filesystem::path& baseDirectory);
};

}
}

#endif
