/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Platform_hpp
#define carrier_image_Platform_hpp

#include <string>
#include <vector>

#include <boost/filesystem.hpp>


namespace carrier {
namespace image {

struct Platform {
    std::string architecture;
    std::string os;
    std::string osVersion;
    std::vector<std::string> osFeatures;
    std::string variant;
    // Docker manifest lists only, dropped by the OCI image index
    std::vector<std::string> features;
};

bool operator==(const Platform&, const Platform&);

// User overrides of the runtime platform, empty fields are detected from the running system
struct PlatformChoice {
    std::string architecture;
    std::string os;
    std::string variant;
};

/**
 * Returns the platforms the runtime can execute, most preferred first.
 * The CPU variant of ARM systems is read from the given cpuinfo file.
 */
std::vector<Platform> getWantedPlatforms(const PlatformChoice& choice,
                                         const boost::filesystem::path& cpuinfo = "/proc/cpuinfo");
bool matchesPlatform(const Platform& image, const Platform& wanted);

// Key grouping platforms which run the same images: architecture, os, os.version, sorted os.features and variant
std::string getPlatformComparableKey(const Platform&);

}
}

#endif
