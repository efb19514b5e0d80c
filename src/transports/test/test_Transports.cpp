/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <vector>
#include <algorithm>

#include <boost/filesystem.hpp>

#include "libcarrier/Error.hpp"
#include "transports/Transports.hpp"
#include "transports/Directory.hpp"
#include "transports/OCILayout.hpp"
#include "transports/localPaths.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace transports {
namespace test {

TEST_GROUP(TransportsTestGroup) {
};

TEST(TransportsTestGroup, builtinTransports) {
    auto names = Transports::getNames();
    CHECK(std::find(names.cbegin(), names.cend(), "oci") != names.cend());
    CHECK(std::find(names.cbegin(), names.cend(), "dir") != names.cend());
    CHECK(Transports::get("dir") != nullptr);
    CHECK(Transports::get("docker-daemon") == nullptr);
    CHECK_THROWS(libcarrier::Error, Transports::registerTransport(std::make_shared<DirectoryTransport>()));
}

TEST(TransportsTestGroup, parseImageName) {
    auto reference = parseImageName("dir:/var/tmp/image");
    CHECK_EQUAL(reference->getTransport().getName(), "dir");
    CHECK_EQUAL(reference->stringWithinTransport(), "/var/tmp/image");
    CHECK_EQUAL(imageNameOf(*reference), "dir:/var/tmp/image");

    reference = parseImageName("oci:/var/tmp/layout:app");
    CHECK_EQUAL(reference->getTransport().getName(), "oci");
    CHECK_EQUAL(imageNameOf(*reference), "oci:/var/tmp/layout:app");

    CHECK_THROWS(libcarrier::Error, parseImageName("/var/tmp/image"));
    CHECK_THROWS(libcarrier::Error, parseImageName("unknown:/var/tmp/image"));
    CHECK_THROWS(libcarrier::Error, parseImageName("dir:"));
}

TEST(TransportsTestGroup, ociReferences) {
    auto reference = parseImageName("oci:/var/tmp/layout");
    const auto& plain = dynamic_cast<const OCIReference&>(*reference);
    CHECK(plain.getImageName().empty());
    CHECK_EQUAL(plain.getSourceIndex(), OCIReference::NO_SOURCE_INDEX);

    reference = parseImageName("oci:/var/tmp/layout:library/app:1.0");
    const auto& named = dynamic_cast<const OCIReference&>(*reference);
    CHECK_EQUAL(named.getImageName(), "library/app:1.0");
    CHECK(named.getDirectory() == boost::filesystem::path{"/var/tmp/layout"});

    reference = parseImageName("oci:/var/tmp/layout:@2");
    const auto& indexed = dynamic_cast<const OCIReference&>(*reference);
    CHECK_EQUAL(indexed.getSourceIndex(), 2);
    CHECK_EQUAL(indexed.stringWithinTransport(), "/var/tmp/layout:@2");

    CHECK_THROWS(libcarrier::Error, parseImageName("oci:/var/tmp/layout:@two"));
    CHECK_THROWS(libcarrier::Error, parseImageName("oci:/var/tmp/layout:@-1"));
    CHECK_THROWS(libcarrier::Error, parseImageName("oci:/var/tmp/layout:in valid"));
    CHECK_THROWS(libcarrier::Error, parseImageName("oci::app"));
}

TEST(TransportsTestGroup, policyIdentities) {
    auto reference = parseImageName("dir:/var/tmp/images/app");
    CHECK_EQUAL(reference->getPolicyConfigurationIdentity(), "/var/tmp/images/app");
    auto expected = std::vector<std::string>{"/var/tmp/images", "/var/tmp", "/var"};
    CHECK(reference->getPolicyConfigurationNamespaces() == expected);
    CHECK_FALSE(reference->getDockerReference());
}

TEST(TransportsTestGroup, policyScopes) {
    const auto& dir = DirectoryTransport::getInstance();
    dir.validatePolicyConfigurationScope("/var/tmp/images");
    CHECK_THROWS(libcarrier::Error, dir.validatePolicyConfigurationScope("var/tmp"));
    CHECK_THROWS(libcarrier::Error, dir.validatePolicyConfigurationScope("/"));
    CHECK_THROWS(libcarrier::Error, dir.validatePolicyConfigurationScope("/var/tmp/../images"));
    CHECK_THROWS(libcarrier::Error, dir.validatePolicyConfigurationScope("/var/tmp/"));

    const auto& oci = OCITransport::getInstance();
    oci.validatePolicyConfigurationScope("/var/tmp/layout");
    oci.validatePolicyConfigurationScope("/var/tmp/layout:app");
    CHECK_THROWS(libcarrier::Error, oci.validatePolicyConfigurationScope("/var/tmp/layout:in valid"));
}

TEST(TransportsTestGroup, pathNamespaces) {
    auto expected = std::vector<std::string>{"/a/b", "/a"};
    CHECK(localpaths::pathNamespaces("/a/b/c") == expected);
    CHECK(localpaths::pathNamespaces("/a").empty());
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
