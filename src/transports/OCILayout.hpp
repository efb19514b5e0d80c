/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_OCILayout_hpp
#define carrier_transports_OCILayout_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/filesystem.hpp>

#include "image/Digest.hpp"
#include "image/Descriptor.hpp"
#include "transports/ImageReference.hpp"


namespace carrier {
namespace transports {

extern const std::string OCI_REF_NAME_ANNOTATION;

class OCITransport : public ImageTransport {
public:
    static const OCITransport& getInstance();

    std::string getName() const override;
    std::unique_ptr<ImageReference> parseReference(const std::string& reference) const override;
    void validatePolicyConfigurationScope(const std::string& scope) const override;
};

/**
 * An image in an OCI image layout: "PATH[:REFERENCE]" where REFERENCE is the
 * org.opencontainers.image.ref.name of the image or "@INDEX" of its entry in index.json.
 */
class OCIReference : public ImageReference {
public:
    static const int NO_SOURCE_INDEX = -1;

public:
    OCIReference(const boost::filesystem::path& directory, const std::string& imageName, int sourceIndex = NO_SOURCE_INDEX);

    const ImageTransport& getTransport() const override;
    std::string stringWithinTransport() const override;
    boost::optional<image::DockerReference> getDockerReference() const override;
    std::string getPolicyConfigurationIdentity() const override;
    std::vector<std::string> getPolicyConfigurationNamespaces() const override;
    std::unique_ptr<ImageSource> newImageSource(const TransportContext& context) const override;
    std::unique_ptr<ImageDestination> newImageDestination(const TransportContext& context) const override;

    const boost::filesystem::path& getDirectory() const { return directory; }
    const boost::filesystem::path& getResolvedDirectory() const { return resolvedDirectory; }
    const std::string& getImageName() const { return imageName; }
    int getSourceIndex() const { return sourceIndex; }

    boost::filesystem::path getIndexPath() const;
    boost::filesystem::path getLayoutPath() const;
    boost::filesystem::path getBlobPath(const image::Digest& digest) const;
    // The index.json entry of the referenced image
    image::Descriptor getManifestDescriptor() const;

private:
    boost::filesystem::path directory;
    boost::filesystem::path resolvedDirectory;
    std::string imageName;
    int sourceIndex;
};

// The manifest descriptors and annotations of index.json
struct OCIIndex {
    std::vector<image::Descriptor> manifests;
    std::map<std::string, std::string> annotations;

    static OCIIndex read(const boost::filesystem::path& file);
    std::string serialize() const;
};

void validateOCIImageName(const std::string& image);

}
}

#endif
