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

#include "image/DockerReference.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace image {
namespace test {

TEST_GROUP(DockerReferenceTestGroup) {
};

TEST(DockerReferenceTestGroup, parseShortName) {
    auto reference = DockerReference::parse("alpine");
    CHECK_EQUAL(reference.domain, std::string{"docker.io"});
    CHECK_EQUAL(reference.path, std::string{"library/alpine"});
    CHECK(reference.isNameOnly());
    CHECK_EQUAL(reference.tagNameOnly().string(), std::string{"docker.io/library/alpine:latest"});
}

TEST(DockerReferenceTestGroup, parseTagAndDigest) {
    auto digest = "sha256:" + std::string(64, 'a');
    auto reference = DockerReference::parse("quay.io/ethcscs/ubuntu:20.04@" + digest);
    CHECK_EQUAL(reference.domain, std::string{"quay.io"});
    CHECK_EQUAL(reference.path, std::string{"ethcscs/ubuntu"});
    CHECK_EQUAL(reference.tag, std::string{"20.04"});
    CHECK_EQUAL(reference.digest, digest);
    CHECK(!reference.isNameOnly());
    CHECK_EQUAL(reference.normalize().string(), "quay.io/ethcscs/ubuntu@" + digest);
}

TEST(DockerReferenceTestGroup, parseDomains) {
    CHECK_EQUAL(DockerReference::parse("index.docker.io/user/image:1").string(),
                std::string{"docker.io/user/image:1"});
    CHECK_EQUAL(DockerReference::parse("localhost/image").domain, std::string{"localhost"});
    CHECK_EQUAL(DockerReference::parse("localhost:5000/org/image:tag").domain, std::string{"localhost:5000"});
    CHECK_EQUAL(DockerReference::parse("user/image").getName(), std::string{"docker.io/user/image"});
}

TEST(DockerReferenceTestGroup, parseErrors) {
    CHECK_THROWS(libcarrier::Error, DockerReference::parse(std::string(64, 'f')));
    CHECK_THROWS(libcarrier::Error, DockerReference::parse("Uppercase/Image"));
    CHECK_THROWS(libcarrier::Error, DockerReference::parse("image:tag with spaces"));
    CHECK_THROWS(libcarrier::Error, DockerReference::parse(""));
}

TEST(DockerReferenceTestGroup, comparison) {
    CHECK(DockerReference::parse("alpine:3.18") == DockerReference::parse("docker.io/library/alpine:3.18"));
    CHECK(DockerReference::parse("alpine:3.18") != DockerReference::parse("alpine:3.19"));
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
