/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_Transports_hpp
#define carrier_transports_Transports_hpp

#include <string>
#include <vector>
#include <memory>

#include "transports/ImageReference.hpp"


namespace carrier {
namespace transports {

/**
 * Registry of the known transports, initialized with the built-in "oci" and "dir".
 */
class Transports {
public:
    static void registerTransport(std::shared_ptr<const ImageTransport> transport);
    // nullptr if unknown
    static std::shared_ptr<const ImageTransport> get(const std::string& name);
    static std::vector<std::string> getNames();
};

// Parses "TRANSPORT:DETAILS"
std::unique_ptr<ImageReference> parseImageName(const std::string& imageName);

// "TRANSPORT:DETAILS" of a reference
std::string imageNameOf(const ImageReference& reference);

}
}

#endif
