/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_common_Config_hpp
#define carrier_common_Config_hpp

#include <string>
#include <chrono>
#include <cstddef>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "compression/Algorithm.hpp"


namespace carrier {
namespace common {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        Config(const boost::filesystem::path& installationPrefixDir);

        struct BuildTime {
            BuildTime();
            std::string version;
        };

        boost::filesystem::path getTempDir() const;
        boost::filesystem::path getPolicyPath() const;
        size_t getMaxParallelDownloads() const;
        // Zero if progress is not reported
        std::chrono::milliseconds getProgressInterval() const;
        boost::optional<compression::Algorithm> getDefaultCompressionFormat() const;
        boost::optional<int> getDefaultCompressionLevel() const;

        BuildTime buildTime;
        rapidjson::Document json{ rapidjson::kObjectType };

        std::chrono::high_resolution_clock::time_point program_start; // for time measurement
};

}
}

#endif
