/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_ManifestConversion_hpp
#define carrier_copy_ManifestConversion_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "compression/Algorithm.hpp"


namespace carrier {
namespace copy {

struct ManifestConversionInputs {
    std::string srcMIMEType;
    // Empty if the destination accepts any type
    std::vector<std::string> destSupportedManifestMIMETypes;
    std::string forceManifestMIMEType;
    // Only if explicitly requested by the user
    boost::optional<compression::Algorithm> requestedCompressionFormat;
    bool requiresOCIEncryption = false;
    // Empty if the manifest can be modified
    std::string cannotModifyManifestReason;
};

struct ManifestConversionPlan {
    // Used as is or converted to, depending on preferredMIMETypeNeedsConversion
    std::string preferredMIMEType;
    bool preferredMIMETypeNeedsConversion = false;
    // Alternatives to try in order if the preferred type is rejected
    std::vector<std::string> otherMIMETypeCandidates;
};

ManifestConversionPlan determineManifestConversion(const ManifestConversionInputs& inputs);

struct ListConversionPlan {
    std::string selectedListType;
    std::vector<std::string> otherListTypeCandidates;
};

ListConversionPlan determineListConversion(const std::string& currentListMIMEType,
                                           std::vector<std::string> destSupportedMIMETypes,
                                           const std::string& forcedListMIMEType);

// Manifest types to convert to if the original can't be used, most preferred first
const std::vector<std::string>& getPreferredManifestMIMETypes();
const std::vector<std::string>& getAllManifestMIMETypes();
const std::vector<std::string>& getSupportedListMIMETypes();

}
}

#endif
