/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "test_utility/config.hpp"

#include <rapidjson/document.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "libcarrier/utility/filesystem.hpp"

namespace rj = rapidjson;
using namespace carrier;

namespace test_utility {
namespace config {

boost::filesystem::path getRepoRootDir() {
    return boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
}

static rj::Document makeJSON(const boost::filesystem::path& prefixDir,
                             const boost::filesystem::path& tempDir,
                             const std::string& extraMembers) {
    auto document = rj::Document{ rj::kObjectType };
    auto& allocator = document.GetAllocator();

    document.AddMember( "tempDir",
                        rj::Value{tempDir.c_str(), allocator},
                        allocator);
    document.AddMember( "policyPath",
                        rj::Value{(prefixDir / "etc/policy.json").c_str(), allocator},
                        allocator);

    auto extra = libcarrier::json::parse(extraMembers);
    for(auto member = extra.MemberBegin(); member != extra.MemberEnd(); ++member) {
        if(document.HasMember(member->name)) {
            document.RemoveMember(member->name);
        }
        document.AddMember( rj::Value{member->name, allocator},
                            rj::Value{member->value, allocator},
                            allocator);
    }
    return document;
}

ConfigRAII makeConfig(const std::string& extraMembers) {
    auto raii = ConfigRAII{};
    raii.prefixDir = libcarrier::makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "carrier-test-prefix-dir");
    raii.tempDir = libcarrier::makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "carrier-test-temp-dir");

    auto etcDir = raii.prefixDir.getPath() / "etc";
    libcarrier::filesystem::createFoldersIfNecessary(etcDir);

    auto repoEtcDir = getRepoRootDir() / "etc";
    boost::filesystem::copy_file(repoEtcDir / "carrier.schema.json", etcDir / "carrier.schema.json");
    boost::filesystem::copy_file(repoEtcDir / "policy.json", etcDir / "policy.json");

    auto json = makeJSON(raii.prefixDir.getPath(), raii.tempDir.getPath(), extraMembers);
    libcarrier::filesystem::writeTextFile(libcarrier::json::serialize(json), etcDir / "carrier.json");

    raii.config = std::make_shared<common::Config>(raii.prefixDir.getPath());
    return raii;
}

}
}
