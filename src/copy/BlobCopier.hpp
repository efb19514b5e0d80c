/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_BlobCopier_hpp
#define carrier_copy_BlobCopier_hpp

#include <string>
#include <future>
#include <memory>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "image/Image.hpp"
#include "compression/Algorithm.hpp"
#include "stream/Reader.hpp"
#include "stream/Pipe.hpp"
#include "transports/ImageDestination.hpp"


namespace carrier {
namespace copy {

class Copier;

/**
 * Computes the uncompressed digest of a layer in a separate thread, from a copy
 * of the bytes read by the blob pipeline.
 */
class DiffIDComputation {
public:
    DiffIDComputation() = default;
    DiffIDComputation(const DiffIDComputation&) = delete;
    DiffIDComputation& operator=(const DiffIDComputation&) = delete;
    ~DiffIDComputation();

    // decompressor is the compression of the bytes that will be written to the pipe
    void start(const boost::optional<compression::Algorithm>& decompressor);
    bool isStarted() const { return future.valid(); }
    stream::Pipe& getPipe() { return pipe; }
    // Waits for the computation, rethrowing its error
    image::Digest getResult();

private:
    stream::Pipe pipe;
    std::future<image::Digest> future;
};

// The options of an image copy which affect how its blobs are written
struct BlobPipelineSettings {
    // Empty if the manifest can be modified
    std::string cannotModifyManifestReason;
    boost::optional<compression::Algorithm> compressionFormat;
    boost::optional<int> compressionLevel;
};

/**
 * Copies a blob from a stream to the destination, verifying its digest and
 * applying the decryption, compression and encryption steps the image copy
 * requires.
 */
class BlobCopier {
public:
    BlobCopier(Copier& session, const image::Image& sourceImage, const BlobPipelineSettings& settings);

    image::BlobInfo copyBlobFromStream(stream::Reader& srcReader,
                                       const image::BlobInfo& srcInfo,
                                       DiffIDComputation* diffIDComputation,
                                       bool isConfig,
                                       bool toEncrypt,
                                       const boost::optional<size_t>& layerIndex,
                                       bool emptyLayer);

private:
    Copier& session;
    const image::Image& sourceImage;
    const BlobPipelineSettings& settings;
};

// Describes a blob uploaded from a stream with inputInfo
image::BlobInfo updatedBlobInfoFromUpload(const image::BlobInfo& inputInfo, const transports::UploadedBlob& uploaded);
// Describes a blob the destination reused instead of inputInfo
image::BlobInfo updatedBlobInfoFromReuse(const image::BlobInfo& inputInfo, const transports::ReusedBlob& reused);

}
}

#endif
