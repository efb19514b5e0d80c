/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_signature_PolicyContext_hpp
#define carrier_signature_PolicyContext_hpp

#include "signature/Policy.hpp"


namespace carrier {
namespace signature {

class PolicyContext {
public:
    explicit PolicyContext(Policy policy);

    // Throws PolicyRejectedError if the policy doesn't admit the image
    void checkImageAllowed(UnparsedImage& image) const;
    const PolicyRequirements& requirementsForImage(const UnparsedImage& image) const;

private:
    Policy policy;
};

}
}

#endif
