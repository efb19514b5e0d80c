/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_DockerReference_hpp
#define carrier_image_DockerReference_hpp

#include <string>
#include <ostream>


namespace carrier {
namespace image {

/**
 * A normalized Docker reference: domain, repository path, and optionally a tag
 * and/or a digest. Used as signing identity and as the name embedded in schema1
 * manifests.
 */
struct DockerReference {
    std::string domain;
    std::string path;
    std::string tag;
    std::string digest;

    // "domain/path"
    std::string getName() const;
    std::string string() const;
    bool isNameOnly() const;
    // Adds the default tag to references with neither tag nor digest
    DockerReference tagNameOnly() const;
    // Drops the tag if a digest is present, the tag is ignored by pulls in that case
    DockerReference normalize() const;

    static DockerReference parse(const std::string& input);

    static const std::string DEFAULT_DOMAIN;
    static const std::string LEGACY_DEFAULT_DOMAIN;
    static const std::string OFFICIAL_REPOSITORY_NAMESPACE;
    static const std::string DEFAULT_TAG;
};

bool operator==(const DockerReference&, const DockerReference&);
bool operator!=(const DockerReference&, const DockerReference&);

std::ostream& operator<<(std::ostream&, const DockerReference&);

}
}

#endif
