/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_ImageReference_hpp
#define carrier_transports_ImageReference_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "image/DockerReference.hpp"


namespace carrier {
namespace transports {

class ImageSource;
class ImageDestination;
class ImageTransport;

// Settings shared by the transports of one copy operation
struct TransportContext {
    // Staging area for blobs whose digest is not known until fully written
    boost::filesystem::path tempDir;
};

/**
 * An image location within a transport, e.g. an image in an OCI layout directory.
 */
class ImageReference {
public:
    virtual ~ImageReference() = default;

    virtual const ImageTransport& getTransport() const = 0;
    // The reference without the "TRANSPORT:" prefix, parseable by the transport
    virtual std::string stringWithinTransport() const = 0;
    // The Docker reference which identifies the image in signatures, if any
    virtual boost::optional<image::DockerReference> getDockerReference() const = 0;
    // Identity used to look up admission policy requirements
    virtual std::string getPolicyConfigurationIdentity() const = 0;
    // Scopes containing the identity, most specific first
    virtual std::vector<std::string> getPolicyConfigurationNamespaces() const = 0;

    virtual std::unique_ptr<ImageSource> newImageSource(const TransportContext& context) const = 0;
    virtual std::unique_ptr<ImageDestination> newImageDestination(const TransportContext& context) const = 0;
};

class ImageTransport {
public:
    virtual ~ImageTransport() = default;

    virtual std::string getName() const = 0;
    virtual std::unique_ptr<ImageReference> parseReference(const std::string& reference) const = 0;
    // Throws if scope is not valid as a policy scope of this transport
    virtual void validatePolicyConfigurationScope(const std::string& scope) const = 0;
};

}
}

#endif
