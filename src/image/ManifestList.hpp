/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_ManifestList_hpp
#define carrier_image_ManifestList_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <cstdint>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/Platform.hpp"
#include "compression/Algorithm.hpp"


namespace carrier {
namespace image {

// An instance of a list as seen by the list copier
struct ListUpdate {
    Digest digest;
    int64_t size = 0;
    std::string mediaType;
    // Information about the instance, ignored when passed to updateInstances
    struct {
        boost::optional<Platform> platform;
        std::map<std::string, std::string> annotations;
        std::vector<std::string> compressionAlgorithmNames;
        std::string artifactType;
    } readOnly;
};

enum class ListOperation {
    Update,
    Add
};

struct ListEdit {
    ListOperation operation = ListOperation::Update;

    // Update
    Digest updateOldDigest;
    Digest updateDigest;
    int64_t updateSize = -1;
    std::string updateMediaType;
    boost::optional<std::map<std::string, std::string>> updateAnnotations;
    // Replace the annotations instead of merging them into the existing ones
    bool updateAffectAnnotations = false;
    std::vector<compression::Algorithm> updateCompressionAlgorithms;

    // Add
    Digest addDigest;
    int64_t addSize = 0;
    std::string addMediaType;
    std::string addArtifactType;
    boost::optional<Platform> addPlatform;
    std::map<std::string, std::string> addAnnotations;
    std::vector<compression::Algorithm> addCompressionAlgorithms;
};

/**
 * A multi-image manifest (Docker manifest list or OCI image index).
 */
class ManifestList {
public:
    virtual ~ManifestList() = default;

    virtual std::string getMIMEType() const = 0;
    virtual std::vector<Digest> getInstances() const = 0;
    virtual ListUpdate getInstance(const Digest& instanceDigest) const = 0;
    // Updates digest, size and media type of each instance, in list order
    void updateInstances(const std::vector<ListUpdate>& updates);
    virtual void editInstances(const std::vector<ListEdit>& edits) = 0;
    // Picks the instance best matching the runtime platform
    Digest chooseInstance(const PlatformChoice& choice) const;
    // As chooseInstance, among equally good candidates preferGzip selects gzip over zstd instances
    virtual Digest chooseInstanceByCompression(const PlatformChoice& choice, bool preferGzip) const = 0;
    virtual std::string serialize() const = 0;
    virtual std::unique_ptr<ManifestList> convertToMIMEType(const std::string& mimeType) const = 0;
    virtual std::unique_ptr<ManifestList> clone() const = 0;
};

std::unique_ptr<ManifestList> listFromBlob(const std::string& manifestBlob, const std::string& mimeType);

}
}

#endif
