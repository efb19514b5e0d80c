/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_BlobFile_hpp
#define carrier_transports_BlobFile_hpp

#include <boost/filesystem.hpp>

#include "libcarrier/PathRAII.hpp"
#include "image/BlobInfo.hpp"
#include "stream/Reader.hpp"
#include "transports/ImageDestination.hpp"


namespace carrier {
namespace transports {

/**
 * A blob being written to a temporary file next to its final location. The file
 * is removed unless it is committed by renaming it to its final path.
 */
class BlobFile {
public:
    BlobFile(const boost::filesystem::path& directory, const std::string& prefix);

    // Writes the stream, verifying the size and digest of inputInfo where known
    UploadedBlob write(stream::Reader& stream, const image::BlobInfo& inputInfo);
    void commit(const boost::filesystem::path& destination);

private:
    libcarrier::PathRAII file;
};

void writeBlobFile(const std::string& content, const boost::filesystem::path& destination);

}
}

#endif
