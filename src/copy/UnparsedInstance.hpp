/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_UnparsedInstance_hpp
#define carrier_copy_UnparsedInstance_hpp

#include <string>
#include <vector>
#include <utility>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "signature/Policy.hpp"
#include "transports/ImageSource.hpp"


namespace carrier {
namespace copy {

/**
 * An image of a source (the top-level manifest, or one instance of a list) whose
 * manifest is read and verified lazily, as needed by the admission policy.
 */
class UnparsedInstance : public signature::UnparsedImage {
public:
    UnparsedInstance(transports::ImageSource& source, const boost::optional<image::Digest>& instanceDigest);

    std::string getTransportName() const override;
    std::string getPolicyConfigurationIdentity() const override;
    std::vector<std::string> getPolicyConfigurationNamespaces() const override;
    boost::optional<image::DockerReference> getDockerReference() const override;
    std::pair<std::string, std::string> getManifest() override;
    std::vector<std::string> getSignatures() override;

    transports::ImageSource& getSource() const { return source; }
    const boost::optional<image::Digest>& getInstanceDigest() const { return instanceDigest; }

private:
    transports::ImageSource& source;
    boost::optional<image::Digest> instanceDigest;
    boost::optional<std::pair<std::string, std::string>> cachedManifest;
};

}
}

#endif
