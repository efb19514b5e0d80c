/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageSource.hpp"
#include "ImageDestination.hpp"

#include "libcarrier/Error.hpp"


namespace carrier {
namespace transports {

std::vector<std::unique_ptr<stream::Reader>> ImageSource::getBlobAt(const image::BlobInfo&,
                                                                    const std::vector<ImageSourceChunk>&) {
    CARRIER_THROW_ERROR("getBlobAt is not supported by this transport");
}

bool originalCandidateMatchesTryReusingBlobOptions(const TryReusingBlobOptions& options) {
    return image::candidateCompressionMatchesReuseConditions(options.reuseConditions, options.originalCompression);
}

PartialBlobResult ImageDestination::putBlobPartial(BlobChunkAccessor&, const image::BlobInfo&,
                                                   const PutBlobPartialOptions&) {
    auto result = PartialBlobResult{};
    result.status = PartialBlobResult::Status::FallbackRequested;
    result.fallbackReason = "partial pulls are not supported by this transport";
    return result;
}

}
}
