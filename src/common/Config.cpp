/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "compression/Algorithms.hpp"
#include "copy/Options.hpp"


namespace carrier {
namespace common {

Config::BuildTime::BuildTime()
    : version{CARRIER_VERSION}
{}

Config::Config(const boost::filesystem::path& installationPrefixDir)
    : Config{installationPrefixDir / "etc/carrier.json", installationPrefixDir / "etc/carrier.schema.json"}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libcarrier::json::readAndValidate(configFilename, configSchemaFilename) }
{}

boost::filesystem::path Config::getTempDir() const {
    auto temp = boost::filesystem::path{ libcarrier::json::getString(json, "tempDir") };
    if (!boost::filesystem::is_directory(temp)) {
        auto message = boost::format("Invalid temporary directory %s") % temp;
        CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::INFO);
    }
    return temp;
}

boost::filesystem::path Config::getPolicyPath() const {
    return libcarrier::json::getString(json, "policyPath");
}

size_t Config::getMaxParallelDownloads() const {
    if(!json.HasMember("maxParallelDownloads")) {
        return copy::DEFAULT_MAX_PARALLEL_DOWNLOADS;
    }
    auto value = libcarrier::json::getInt64(json, "maxParallelDownloads");
    if(value < 1) {
        auto message = boost::format("Invalid maxParallelDownloads %d in configuration: must be at least 1") % value;
        CARRIER_THROW_ERROR(message.str());
    }
    return static_cast<size_t>(value);
}

std::chrono::milliseconds Config::getProgressInterval() const {
    if(!json.HasMember("progressIntervalMs")) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{ libcarrier::json::getInt64(json, "progressIntervalMs") };
}

boost::optional<compression::Algorithm> Config::getDefaultCompressionFormat() const {
    auto name = libcarrier::json::getStringOrDefault(json, "defaultCompressionFormat");
    if(name.empty()) {
        return boost::none;
    }
    try {
        return compression::algorithmByName(name);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("Invalid defaultCompressionFormat \"%s\" in configuration") % name;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

boost::optional<int> Config::getDefaultCompressionLevel() const {
    if(!json.HasMember("defaultCompressionLevel")) {
        return boost::none;
    }
    return static_cast<int>(libcarrier::json::getInt64(json, "defaultCompressionLevel"));
}

}} // namespaces
