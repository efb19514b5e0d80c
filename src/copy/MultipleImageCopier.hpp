/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_MultipleImageCopier_hpp
#define carrier_copy_MultipleImageCopier_hpp

#include <string>
#include <vector>
#include <map>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/Platform.hpp"
#include "image/ManifestList.hpp"
#include "copy/Options.hpp"


namespace carrier {
namespace copy {

class Copier;

enum class InstanceCopyKind {
    // Copy the instance, updating its entry in the list
    Copy,
    // Add a copy of the instance compressed with cloneCompressionVariant
    Clone
};

struct InstanceCopy {
    InstanceCopyKind kind = InstanceCopyKind::Copy;
    image::Digest sourceDigest;

    // Copy
    bool copyForceCompressionFormat = false;

    // Clone
    std::string cloneArtifactType;
    boost::optional<CompressionVariant> cloneCompressionVariant;
    boost::optional<image::Platform> clonePlatform;
    std::map<std::string, std::string> cloneAnnotations;
};

/**
 * Plans the copies of the instances of a list: one Copy per selected instance, and one
 * Clone per compression variant missing for the platform of the instance.
 */
std::vector<InstanceCopy> prepareInstanceCopies(const image::ManifestList& list,
                                                const std::vector<image::Digest>& instanceDigests,
                                                const Options& options);

// Copies all the (selected) instances of the top-level list and writes the updated list
std::string copyMultipleImages(Copier& session);

}
}

#endif
