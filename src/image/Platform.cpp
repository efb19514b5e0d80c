/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Platform.hpp"

#include <fstream>
#include <algorithm>
#include <map>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/algorithm/string.hpp>

#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/process.hpp"
#include "libcarrier/utility/string.hpp"


namespace carrier {
namespace image {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message, "Platform", level);
}

bool operator==(const Platform& lhs, const Platform& rhs) {
    return lhs.architecture == rhs.architecture
        && lhs.os == rhs.os
        && lhs.osVersion == rhs.osVersion
        && lhs.osFeatures == rhs.osFeatures
        && lhs.variant == rhs.variant
        && lhs.features == rhs.features;
}

static boost::optional<std::string> getCPUInfo(const boost::filesystem::path& cpuinfo, const std::string& pattern) {
    std::ifstream is(cpuinfo.string());
    if(!is) {
        printLog(boost::format("Couldn't open %s") % cpuinfo, libcarrier::LogLevel::WARN);
        return {};
    }

    auto line = std::string{};
    while(std::getline(is, line)) {
        auto separator = line.find(':');
        if(separator == std::string::npos) {
            continue;
        }
        auto key = boost::algorithm::trim_copy(line.substr(0, separator));
        if(boost::algorithm::iequals(key, pattern)) {
            return boost::algorithm::trim_copy(line.substr(separator + 1));
        }
    }
    return {};
}

static std::string getCPUVariantArm(const boost::filesystem::path& cpuinfo) {
    auto architecture = getCPUInfo(cpuinfo, "Cpu architecture");
    if(!architecture) {
        printLog(boost::format("Couldn't get cpu architecture from %s") % cpuinfo, libcarrier::LogLevel::WARN);
        return "";
    }

    auto value = boost::algorithm::to_lower_copy(*architecture);
    if(value == "8" || value == "aarch64") {
        return "v8";
    }
    else if(value == "7") {
        auto model = getCPUInfo(cpuinfo, "model name");
        if(!model) {
            printLog(boost::format("Couldn't get cpu model name, it may be the corner case where variant is 6"),
                     libcarrier::LogLevel::WARN);
            return "";
        }
        if(boost::algorithm::starts_with(boost::algorithm::to_lower_copy(*model), "armv6-compatible")) {
            return "v6";
        }
        return "v7";
    }
    else if(value == "7m" || value == "?(12)" || value == "?(13)" || value == "?(14)"
            || value == "?(15)" || value == "?(16)" || value == "?(17)") {
        return "v7";
    }
    else if(value == "6" || value == "6tej") {
        return "v6";
    }
    else if(value == "5" || value == "5t" || value == "5te" || value == "5tej") {
        return "v5";
    }
    else if(value == "4" || value == "4t") {
        return "v4";
    }
    else if(value == "3") {
        return "v3";
    }
    return "";
}

std::vector<Platform> getWantedPlatforms(const PlatformChoice& choice, const boost::filesystem::path& cpuinfo) {
    // Variants which can run on a given architecture, most capable first
    static const auto compatibility = std::map<std::string, std::vector<std::string>>{
        {"arm", {"v8", "v7", "v6", "v5"}},
        {"arm64", {"v8"}}
    };

    auto wantedArchitecture = libcarrier::process::getArchitecture();
    auto wantedVariant = std::string{};
    if(!choice.architecture.empty()) {
        wantedArchitecture = choice.architecture;
    }
    else if(wantedArchitecture == "arm" || wantedArchitecture == "arm64") {
        wantedVariant = getCPUVariantArm(cpuinfo);
    }
    if(!choice.variant.empty()) {
        wantedVariant = choice.variant;
    }

    auto wantedOS = choice.os.empty() ? libcarrier::process::getOperatingSystem() : choice.os;

    auto variants = std::vector<std::string>{};
    auto compatible = compatibility.find(wantedArchitecture);
    if(!wantedVariant.empty()) {
        if(compatible != compatibility.cend()) {
            const auto& order = compatible->second;
            auto it = std::find(order.cbegin(), order.cend(), wantedVariant);
            if(it != order.cend()) {
                variants.assign(it, order.cend());
            }
        }
        if(variants.empty()) {
            variants.push_back(wantedVariant);
        }
        variants.push_back("");
    }
    else {
        variants.push_back("");
        if(compatible != compatibility.cend()) {
            variants.insert(variants.end(), compatible->second.cbegin(), compatible->second.cend());
        }
    }

    auto platforms = std::vector<Platform>{};
    for(const auto& variant : variants) {
        auto platform = Platform{};
        platform.os = wantedOS;
        platform.architecture = wantedArchitecture;
        platform.variant = variant;
        platforms.push_back(platform);
    }
    return platforms;
}

bool matchesPlatform(const Platform& image, const Platform& wanted) {
    return image.architecture == wanted.architecture
        && image.os == wanted.os
        && image.variant == wanted.variant;
}

std::string getPlatformComparableKey(const Platform& platform) {
    auto features = platform.osFeatures;
    std::sort(features.begin(), features.end());
    auto key = boost::format("%s,%s,%s,%s,%s")
        % platform.architecture
        % platform.os
        % platform.osVersion
        % libcarrier::string::join(features, ";")
        % platform.variant;
    return key.str();
}

}
}
