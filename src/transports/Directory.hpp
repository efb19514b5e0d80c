/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_Directory_hpp
#define carrier_transports_Directory_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "transports/ImageReference.hpp"


namespace carrier {
namespace transports {

// Content of the "version" file which marks a directory written by the dir transport
extern const std::string DIRECTORY_TRANSPORT_VERSION;

class DirectoryTransport : public ImageTransport {
public:
    static const DirectoryTransport& getInstance();

    std::string getName() const override;
    std::unique_ptr<ImageReference> parseReference(const std::string& reference) const override;
    void validatePolicyConfigurationScope(const std::string& scope) const override;
};

/**
 * An image stored as plain files in a directory: manifest.json, one file per blob named
 * after the digest, signature-N files and a version file.
 */
class DirectoryReference : public ImageReference {
public:
    explicit DirectoryReference(const boost::filesystem::path& directory);

    const ImageTransport& getTransport() const override;
    std::string stringWithinTransport() const override;
    boost::optional<image::DockerReference> getDockerReference() const override;
    std::string getPolicyConfigurationIdentity() const override;
    std::vector<std::string> getPolicyConfigurationNamespaces() const override;
    std::unique_ptr<ImageSource> newImageSource(const TransportContext& context) const override;
    std::unique_ptr<ImageDestination> newImageDestination(const TransportContext& context) const override;

    const boost::filesystem::path& getDirectory() const { return directory; }
    const boost::filesystem::path& getResolvedDirectory() const { return resolvedDirectory; }

    boost::filesystem::path getManifestPath(const boost::optional<image::Digest>& instanceDigest) const;
    boost::filesystem::path getBlobPath(const image::Digest& digest) const;
    // index is zero-based, the files are numbered from 1
    boost::filesystem::path getSignaturePath(size_t index, const boost::optional<image::Digest>& instanceDigest) const;
    boost::filesystem::path getVersionPath() const;

private:
    boost::filesystem::path directory;
    boost::filesystem::path resolvedDirectory;
};

}
}

#endif
