/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "BlobCopier.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/Digester.hpp"
#include "compression/Compressor.hpp"
#include "crypto/LayerEncryption.hpp"
#include "stream/DigestingReader.hpp"
#include "stream/PeekableReader.hpp"
#include "stream/TeeReader.hpp"
#include "copy/Copier.hpp"
#include "copy/CompressionStep.hpp"
#include "copy/CancellationToken.hpp"
#include "copy/ProgressChannel.hpp"


namespace carrier {
namespace copy {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Copy", level);
}

namespace {

// Marks errors of the source stream, to tell them apart from errors of the destination
class SourceErrorAnnotatingReader : public stream::Reader {
public:
    explicit SourceErrorAnnotatingReader(stream::Reader& source) : source(source) {}

    size_t read(char* buffer, size_t size) override {
        try {
            return source.read(buffer, size);
        }
        catch(std::exception& e) {
            CARRIER_RETHROW_ERROR(e, "happened during read");
        }
    }

private:
    stream::Reader& source;
};

}

static image::Digest computeDiffID(stream::Reader& input, const boost::optional<compression::Algorithm>& decompressor) {
    auto uncompressed = std::unique_ptr<stream::Reader>{};
    auto* reader = &input;
    if(decompressor) {
        uncompressed = compression::newDecompressor(*decompressor, input);
        reader = uncompressed.get();
    }

    auto digester = image::Digester{image::Digest::SHA256};
    char buffer[64 * 1024];
    while(auto bytes = reader->read(buffer, sizeof(buffer))) {
        digester.update(buffer, bytes);
    }
    return digester.digest();
}

DiffIDComputation::~DiffIDComputation() {
    if(!future.valid()) {
        return;
    }
    // Unblocks the computation if the pipeline was abandoned before end of stream
    pipe.closeWriteWithError("blob copy aborted");
    future.wait();
}

void DiffIDComputation::start(const boost::optional<compression::Algorithm>& decompressor) {
    if(future.valid()) {
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, "Internal error: DiffID computation started twice");
    }
    future = std::async(std::launch::async, [this, decompressor]() {
        // The writer blocks on a full pipe unless the read side is closed on every path
        try {
            auto diffID = computeDiffID(pipe, decompressor);
            char buffer[1];
            if(pipe.read(buffer, sizeof(buffer)) > 0) {
                CARRIER_THROW_ERROR("Unexpected data after the end of the compressed layer");
            }
            pipe.closeRead("DiffID computation completed");
            return diffID;
        }
        catch(std::exception& e) {
            pipe.closeRead(e.what());
            throw;
        }
    });
}

image::Digest DiffIDComputation::getResult() {
    if(!future.valid()) {
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, "Internal error: DiffID computation was not started");
    }
    return future.get();
}

BlobCopier::BlobCopier(Copier& session, const image::Image& sourceImage, const BlobPipelineSettings& settings)
    : session(session)
    , sourceImage(sourceImage)
    , settings(settings)
{}

image::BlobInfo BlobCopier::copyBlobFromStream(stream::Reader& srcReader,
                                               const image::BlobInfo& srcInfo,
                                               DiffIDComputation* diffIDComputation,
                                               bool isConfig,
                                               bool toEncrypt,
                                               const boost::optional<size_t>& layerIndex,
                                               bool emptyLayer) {
    if(isConfig && (diffIDComputation || toEncrypt)) {
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError,
            "Internal error: copyBlobFromStream called with isConfig and a layer-only option");
    }

    auto& destination = session.getDestination();
    const auto& options = session.getOptions();
    auto info = srcInfo;
    auto* current = &srcReader;

    auto cancellable = std::unique_ptr<CancellableReader>{};
    if(session.getCancellationToken()) {
        cancellable.reset(new CancellableReader{*current, *session.getCancellationToken()});
        current = cancellable.get();
    }

    // Verify the source bytes, whatever the later steps do with them
    auto digesting = std::unique_ptr<stream::DigestingReader>{};
    try {
        digesting.reset(new stream::DigestingReader{*current, srcInfo.digest});
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("preparing to verify blob %s") % srcInfo.digest;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
    current = digesting.get();

    auto decrypting = std::unique_ptr<crypto::DecryptingReader>{};
    if(crypto::isEncryptedMediaType(info.mediaType) && options.ociDecryptConfig) {
        if(!settings.cannotModifyManifestReason.empty()) {
            auto message = boost::format("layer %s should be decrypted, but we can't modify the manifest: %s")
                % srcInfo.digest % settings.cannotModifyManifestReason;
            CARRIER_THROW_ERROR(message.str());
        }
        decrypting.reset(new crypto::DecryptingReader{*current, info.annotations, *options.ociDecryptConfig});
        current = decrypting.get();
        info.digest = image::Digest{};
        info.size = -1;
        info.annotations = crypto::removeEncryptionAnnotations(info.annotations);
    }

    stream::PeekableReader peekable{*current};
    auto detected = detectCompressionStep(peekable, info);
    current = &peekable;

    auto tee = std::unique_ptr<stream::TeeReader>{};
    if(diffIDComputation) {
        diffIDComputation->start(detected.format);
        tee.reset(new stream::TeeReader{*current, diffIDComputation->getPipe()});
        current = tee.get();
    }

    auto compressionSettings = CompressionStepSettings{};
    compressionSettings.desiredLayerCompression = destination.getDesiredLayerCompression();
    compressionSettings.compressionFormat = settings.compressionFormat;
    compressionSettings.compressionLevel = settings.compressionLevel;
    compressionSettings.canModifyBlob = !isConfig && settings.cannotModifyManifestReason.empty();
    compressionSettings.layerCompressionChangeSupported = sourceImage.canChangeLayerCompression(info.mediaType);
    CompressionStep compressionStep{*current, info, detected, compressionSettings};
    current = &compressionStep.getReader();
    if(compressionStep.changesBlob()) {
        info.digest = image::Digest{};
        info.size = -1;
        info.annotations.clear();
    }

    if(decrypting && toEncrypt) {
        CARRIER_THROW_ERROR("Unable to support both decryption and encryption in the same copy");
    }

    auto encrypting = std::unique_ptr<crypto::EncryptingReader>{};
    if(toEncrypt && !crypto::isEncryptedMediaType(srcInfo.mediaType) && options.ociEncryptConfig) {
        if(!settings.cannotModifyManifestReason.empty()) {
            auto message = boost::format("layer %s should be encrypted, but we can't modify the manifest: %s")
                % srcInfo.digest % settings.cannotModifyManifestReason;
            CARRIER_THROW_ERROR(message.str());
        }
        encrypting.reset(new crypto::EncryptingReader{*current, *options.ociEncryptConfig});
        current = encrypting.get();
        info.digest = image::Digest{};
        info.size = -1;
    }

    auto progress = std::unique_ptr<ProgressReader>{};
    if(session.reportsProgress()) {
        progress.reset(new ProgressReader{*current, *options.progress, options.progressInterval, srcInfo});
        current = progress.get();
    }

    SourceErrorAnnotatingReader annotating{*current};
    auto putOptions = transports::PutBlobOptions{};
    putOptions.cache = &session.getBlobInfoCache();
    putOptions.isConfig = isConfig;
    putOptions.emptyLayer = emptyLayer;
    putOptions.layerIndex = layerIndex;

    auto uploaded = transports::UploadedBlob{};
    try {
        uploaded = destination.putBlob(annotating, info, putOptions);
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "writing blob");
    }

    auto uploadedInfo = updatedBlobInfoFromUpload(info, uploaded);
    compressionStep.updateCompressionEdits(uploadedInfo);
    if(decrypting) {
        uploadedInfo.cryptoOperation = image::CryptoOperation::Decrypt;
    }
    if(encrypting) {
        uploadedInfo.cryptoOperation = image::CryptoOperation::Encrypt;
        for(const auto& annotation : encrypting->getAnnotations()) {
            uploadedInfo.annotations[annotation.first] = annotation.second;
        }
    }

    if(progress) {
        progress->reportDone();
    }

    // The DiffID needs the whole input, even if the destination stopped reading early
    if(diffIDComputation) {
        try {
            char buffer[64 * 1024];
            while(tee->read(buffer, sizeof(buffer)) > 0) {}
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("reading input blob %s") % srcInfo.digest;
            CARRIER_RETHROW_ERROR(e, message.str());
        }
    }

    if(digesting->validationFailed()) {
        auto message = boost::format("Internal error writing blob %s, digest verification failed but was ignored")
            % srcInfo.digest;
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, message.str());
    }
    if(!info.digest.empty() && uploadedInfo.digest != info.digest) {
        auto message = boost::format("Internal error writing blob %s, blob with digest %s saved with digest %s")
            % srcInfo.digest % info.digest % uploadedInfo.digest;
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, message.str());
    }
    if(digesting->validationSucceeded()) {
        compressionStep.recordValidatedDigestData(session.getBlobInfoCache(),
                                                  uploadedInfo.digest,
                                                  srcInfo.digest,
                                                  decrypting || encrypting);
    }

    printLog(boost::format("Copied blob %s as %s") % srcInfo.digest % uploadedInfo.digest,
             libcarrier::LogLevel::DEBUG);
    return uploadedInfo;
}

image::BlobInfo updatedBlobInfoFromUpload(const image::BlobInfo& inputInfo, const transports::UploadedBlob& uploaded) {
    auto info = image::BlobInfo{};
    info.digest = uploaded.digest;
    info.size = uploaded.size;
    info.annotations = inputInfo.annotations;
    info.mediaType = inputInfo.mediaType;
    info.compressionOperation = inputInfo.compressionOperation;
    info.compressionAlgorithm = inputInfo.compressionAlgorithm;
    info.cryptoOperation = inputInfo.cryptoOperation;
    return info;
}

image::BlobInfo updatedBlobInfoFromReuse(const image::BlobInfo& inputInfo, const transports::ReusedBlob& reused) {
    auto info = image::BlobInfo{};
    info.digest = reused.digest;
    info.size = reused.size;
    info.annotations = inputInfo.annotations;
    info.mediaType = inputInfo.mediaType;
    info.compressionOperation = reused.compressionOperation;
    info.compressionAlgorithm = reused.compressionAlgorithm;
    info.cryptoOperation = inputInfo.cryptoOperation;
    // The destination may not know how an unchanged blob is compressed
    if(!info.compressionAlgorithm && reused.digest == inputInfo.digest) {
        info.compressionOperation = inputInfo.compressionOperation;
        info.compressionAlgorithm = inputInfo.compressionAlgorithm;
    }
    for(const auto& annotation : reused.compressionAnnotations) {
        info.annotations[annotation.first] = annotation.second;
    }
    return info;
}

}
}
