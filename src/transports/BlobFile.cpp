/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "BlobFile.hpp"

#include <fstream>
#include <vector>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/Digester.hpp"


namespace carrier {
namespace transports {

static const size_t BUFFER_SIZE = 64 * 1024;

BlobFile::BlobFile(const boost::filesystem::path& directory, const std::string& prefix)
    : file{libcarrier::filesystem::makeUniquePathWithRandomSuffix(directory / prefix)}
{}

UploadedBlob BlobFile::write(stream::Reader& stream, const image::BlobInfo& inputInfo) {
    auto algorithm = inputInfo.digest.empty() ? image::Digest::SHA256 : inputInfo.digest.getAlgorithm();
    auto digester = image::Digester{algorithm};
    auto size = int64_t{0};

    {
        std::ofstream os{file.getPath().string(), std::ios::binary | std::ios::trunc};
        if(!os) {
            auto message = boost::format("Failed to create blob file %s") % file.getPath();
            CARRIER_THROW_ERROR(message.str());
        }
        auto buffer = std::vector<char>(BUFFER_SIZE);
        while(true) {
            auto bytes = stream.read(buffer.data(), buffer.size());
            if(bytes == 0) {
                break;
            }
            digester.update(buffer.data(), bytes);
            os.write(buffer.data(), bytes);
            if(!os) {
                auto message = boost::format("Failed to write blob file %s") % file.getPath();
                CARRIER_THROW_ERROR(message.str());
            }
            size += static_cast<int64_t>(bytes);
        }
        os.close();
        if(!os) {
            auto message = boost::format("Failed to close blob file %s") % file.getPath();
            CARRIER_THROW_ERROR(message.str());
        }
    }

    auto blob = UploadedBlob{digester.digest(), size};
    if(inputInfo.size != -1 && size != inputInfo.size) {
        auto message = boost::format("Size mismatch when copying %s, expected %d, got %d")
            % blob.digest % inputInfo.size % size;
        CARRIER_THROW_ERROR(message.str());
    }
    if(!inputInfo.digest.empty() && blob.digest != inputInfo.digest) {
        auto message = boost::format("Digest mismatch when copying blob, expected %s, got %s")
            % inputInfo.digest % blob.digest;
        CARRIER_THROW_TYPED_ERROR(libcarrier::DigestMismatchError, message.str());
    }
    return blob;
}

void BlobFile::commit(const boost::filesystem::path& destination) {
    try {
        libcarrier::filesystem::createFoldersIfNecessary(destination.parent_path());
        boost::filesystem::permissions(file.getPath(), boost::filesystem::perms::owner_read
                                                       | boost::filesystem::perms::owner_write
                                                       | boost::filesystem::perms::group_read
                                                       | boost::filesystem::perms::others_read);
        boost::filesystem::rename(file.getPath(), destination);
    }
    catch(const boost::filesystem::filesystem_error& e) {
        auto message = boost::format("Failed to move blob file %s to %s: %s") % file.getPath() % destination % e.what();
        CARRIER_THROW_ERROR(message.str());
    }
    file.release();
}

void writeBlobFile(const std::string& content, const boost::filesystem::path& destination) {
    libcarrier::filesystem::createFoldersIfNecessary(destination.parent_path());
    libcarrier::filesystem::writeFileAtomically(content, destination);
}

}
}
