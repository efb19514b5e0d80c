/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ManifestList.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "image/Manifest.hpp"
#include "image/mediaTypes.hpp"
#include "image/Schema2List.hpp"
#include "image/OCI1Index.hpp"


namespace carrier {
namespace image {

void ManifestList::updateInstances(const std::vector<ListUpdate>& updates) {
    auto instances = getInstances();
    if(updates.size() != instances.size()) {
        auto message = boost::format("incorrect number of update entries passed to updateInstances: expected %d, got %d")
            % instances.size() % updates.size();
        CARRIER_THROW_ERROR(message.str());
    }
    auto edits = std::vector<ListEdit>{};
    for(size_t i=0; i<updates.size(); ++i) {
        auto edit = ListEdit{};
        edit.operation = ListOperation::Update;
        edit.updateOldDigest = instances[i];
        edit.updateDigest = updates[i].digest;
        edit.updateSize = updates[i].size;
        edit.updateMediaType = updates[i].mediaType;
        edits.push_back(edit);
    }
    editInstances(edits);
}

Digest ManifestList::chooseInstance(const PlatformChoice& choice) const {
    return chooseInstanceByCompression(choice, false);
}

std::unique_ptr<ManifestList> listFromBlob(const std::string& manifestBlob, const std::string& mimeType) {
    auto normalized = normalizedMIMEType(mimeType);
    if(normalized == mediatype::dockerV2List) {
        return Schema2List::fromBlob(manifestBlob);
    }
    else if(normalized == mediatype::ociImageIndex) {
        return OCI1Index::fromBlob(manifestBlob);
    }
    else if(normalized == mediatype::dockerV2Schema1
            || normalized == mediatype::dockerV2Schema1Signed
            || normalized == mediatype::ociImageManifest
            || normalized == mediatype::dockerV2Schema2) {
        auto message = boost::format("Treating single images as manifest lists is not implemented");
        CARRIER_THROW_ERROR(message.str());
    }
    auto message = boost::format("Unimplemented manifest list MIME type \"%s\" (normalized as \"%s\")") % mimeType % normalized;
    CARRIER_THROW_ERROR(message.str());
}

}
}
