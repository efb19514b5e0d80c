/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageCopier.hpp"

#include <set>
#include <tuple>
#include <future>
#include <algorithm>

#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/json.hpp"
#include "image/Manifest.hpp"
#include "image/Platform.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "compression/Detection.hpp"
#include "crypto/LayerEncryption.hpp"
#include "stream/StringReader.hpp"
#include "transports/Transports.hpp"
#include "copy/Copier.hpp"
#include "copy/Semaphore.hpp"


namespace carrier {
namespace copy {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Copy", level);
}

namespace {

// Ranged reads of the source, for destinations assembling blobs from chunks
class SourceChunkAccessor : public transports::BlobChunkAccessor {
public:
    explicit SourceChunkAccessor(transports::ImageSource& source) : source(source) {}

    std::vector<std::unique_ptr<stream::Reader>> getBlobAt(const image::BlobInfo& info,
                                                           const std::vector<transports::ImageSourceChunk>& chunks) override {
        return source.getBlobAt(info, chunks);
    }

private:
    transports::ImageSource& source;
};

}

static bool isEncrypted(const image::Image& sourceImage) {
    for(const auto& layer : sourceImage.getLayerInfos()) {
        if(crypto::isEncryptedMediaType(layer.mediaType)) {
            return true;
        }
    }
    return false;
}

static bool isFormatRejection(const libcarrier::Error& error) {
    return dynamic_cast<const libcarrier::ManifestTypeRejectedError*>(&error) != nullptr
        || dynamic_cast<const libcarrier::CompressionIncompatibleError*>(&error) != nullptr;
}

static bool layerDigestsDiffer(const std::vector<image::BlobInfo>& a, const std::vector<image::BlobInfo>& b) {
    if(a.size() != b.size()) {
        return true;
    }
    for(size_t i = 0; i < a.size(); ++i) {
        if(a[i].digest != b[i].digest) {
            return true;
        }
    }
    return false;
}

static std::vector<compression::Algorithm> algorithmsByNames(const std::set<std::string>& names) {
    auto algorithms = std::vector<compression::Algorithm>{};
    for(const auto& name : names) {
        algorithms.push_back(compression::algorithmByName(name));
    }
    return algorithms;
}

/**
 * Logs a mismatch between the platform of the image and the platforms wanted
 * by a destination which can only store images for the runtime platform.
 */
static void checkImagePlatformForDestination(image::Image& sourceImage,
                                             const transports::ImageDestination& destination,
                                             const image::PlatformChoice& platformChoice) {
    if(!destination.mustMatchRuntimeOS()) {
        return;
    }

    auto configBlob = std::string{};
    try {
        configBlob = sourceImage.getConfigBlob();
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "parsing image configuration");
    }
    if(configBlob.empty()) {
        printLog(boost::format("Image has no configuration, skipping the operating system check"),
                 libcarrier::LogLevel::DEBUG);
        return;
    }

    auto config = libcarrier::json::parse(configBlob);
    auto platform = image::Platform{};
    platform.os = libcarrier::json::getStringOrDefault(config, "os");
    platform.architecture = libcarrier::json::getStringOrDefault(config, "architecture");
    platform.variant = libcarrier::json::getStringOrDefault(config, "variant");

    auto wanted = image::getWantedPlatforms(platformChoice);
    for(const auto& candidate : wanted) {
        if(image::matchesPlatform(platform, candidate)) {
            return;
        }
    }

    auto options = std::vector<std::string>{};
    for(const auto& candidate : wanted) {
        auto option = (boost::format("%s+%s+\"%s\"") % candidate.os % candidate.architecture % candidate.variant).str();
        if(std::find(options.cbegin(), options.cend(), option) == options.cend()) {
            options.push_back(option);
        }
    }
    printLog(boost::format("Image operating system mismatch: image uses OS \"%s\"+architecture \"%s\"+\"%s\", expecting one of \"%s\"")
                % platform.os % platform.architecture % platform.variant % boost::algorithm::join(options, ", "),
             libcarrier::LogLevel::INFO);
}

std::pair<image::CompressionOperation, boost::optional<compression::Algorithm>>
compressionEditsFromBlobInfo(const image::BlobInfo& info) {
    namespace mt = image::mediatype;
    if(info.mediaType == mt::dockerV2Schema2Layer || info.mediaType == mt::ociImageLayerGzip) {
        return {image::CompressionOperation::PreserveOriginal, compression::Gzip};
    }
    if(info.mediaType == mt::dockerV2SchemaLayerZstd || info.mediaType == mt::ociImageLayerZstd) {
        if(!compression::getTOCDigest(info.annotations).empty()) {
            return {image::CompressionOperation::PreserveOriginal, compression::ZstdChunked};
        }
        return {image::CompressionOperation::PreserveOriginal, compression::Zstd};
    }
    if(info.mediaType == mt::dockerV2SchemaLayerUncompressed || info.mediaType == mt::ociImageLayer) {
        return {image::CompressionOperation::Decompress, boost::none};
    }
    return {image::CompressionOperation::PreserveOriginal, boost::none};
}

CopySingleImageResult copySingleImage(Copier& session,
                                      UnparsedInstance& unparsedImage,
                                      const boost::optional<image::Digest>& targetInstance,
                                      const CopySingleImageOptions& options) {
    auto& destination = session.getDestination();

    auto mimeType = std::string{};
    try {
        mimeType = unparsedImage.getManifest().second;
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("reading manifest for %s") % transports::imageNameOf(unparsedImage.getSource().getReference());
        CARRIER_RETHROW_ERROR(e, message.str());
    }
    if(image::isMultiImage(mimeType)) {
        CARRIER_THROW_ERROR("Unexpectedly received a manifest list instead of a manifest for a single image");
    }

    try {
        session.getPolicyContext().checkImageAllowed(unparsedImage);
    }
    catch(libcarrier::Error& e) {
        CARRIER_RETHROW_ERROR(e, "Source image rejected");
    }

    auto sourceImage = std::unique_ptr<image::SourcedImage>{};
    try {
        sourceImage = image::SourcedImage::fromSource(unparsedImage.getSource(), unparsedImage.getInstanceDigest());
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("initializing image from source %s")
            % transports::imageNameOf(unparsedImage.getSource().getReference());
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    // A digested destination reference can only store an image with exactly that manifest
    auto destReference = destination.getReference().getDockerReference();
    auto destinationIsDigested = destReference && !destReference->digest.empty();
    if(destinationIsDigested) {
        auto expected = image::Digest::parse(destReference->digest);
        auto matches = image::manifestMatchesDigest(sourceImage->getManifest().first, expected)
            || image::manifestMatchesDigest(session.getUnparsedToplevel().getManifest().first, expected);
        if(!matches) {
            CARRIER_THROW_ERROR("Digest of source image's manifest would not match destination reference");
        }
    }

    checkImagePlatformForDestination(*sourceImage, destination, session.getOptions().platformChoice);

    auto signatures = session.sourceSignatures(unparsedImage,
                                               "Getting image source signatures",
                                               "Checking if image destination supports signatures");

    auto cannotModifyManifestReason = std::string{};
    if(!signatures.empty()) {
        cannotModifyManifestReason = "Would invalidate signatures";
    }
    if(destinationIsDigested) {
        cannotModifyManifestReason = "Destination specifies a digest";
    }
    if(session.getOptions().preserveDigests) {
        cannotModifyManifestReason = "Instructed to preserve digests";
    }

    ImageCopier copier{session, *sourceImage, cannotModifyManifestReason, options};
    return copier.copy(targetInstance, signatures);
}

ImageCopier::ImageCopier(Copier& session,
                         image::SourcedImage& sourceImage,
                         const std::string& cannotModifyManifestReason,
                         const CopySingleImageOptions& options)
    : session(session)
    , sourceImage(sourceImage)
    , requireCompressionFormatMatch{options.requireCompressionFormatMatch}
    , blobCopier{session, sourceImage, settings}
{
    settings.cannotModifyManifestReason = cannotModifyManifestReason;
    if(options.compressionFormat) {
        settings.compressionFormat = options.compressionFormat;
        settings.compressionLevel = options.compressionLevel;
    }
    else {
        settings.compressionFormat = session.getOptions().destinationCompressionFormat;
        settings.compressionLevel = session.getOptions().destinationCompressionLevel;
    }
}

CopySingleImageResult ImageCopier::copy(const boost::optional<image::Digest>& targetInstance,
                                        const std::vector<std::string>& sourceSignatures) {
    const auto& options = session.getOptions();
    auto& destination = session.getDestination();

    // zstd:chunked is only useful with ranged reads, which encrypted layers don't allow
    if(options.ociEncryptLayers) {
        auto format = settings.compressionFormat ? *settings.compressionFormat : DEFAULT_COMPRESSION_FORMAT;
        if(format.getName() == compression::ZSTD_CHUNKED_ALGORITHM_NAME) {
            if(requireCompressionFormatMatch) {
                CARRIER_THROW_ERROR("explicitly requested to combine zstd:chunked with encryption, which is not beneficial; use plain zstd instead");
            }
            printLog(boost::format("Compression using zstd:chunked is not beneficial for encrypted layers, using plain zstd instead"),
                     libcarrier::LogLevel::WARN);
            settings.compressionFormat = compression::Zstd;
        }
    }

    canSubstituteBlobs = settings.cannotModifyManifestReason.empty() && options.signers.empty();

    updateEmbeddedDockerReference();

    auto destRequiresOCIEncryption = (isEncrypted(sourceImage) && !options.ociDecryptConfig)
                                     || static_cast<bool>(options.ociEncryptLayers);

    auto conversionInputs = ManifestConversionInputs{};
    conversionInputs.srcMIMEType = sourceImage.getManifest().second;
    conversionInputs.destSupportedManifestMIMETypes = destination.getSupportedManifestMIMETypes();
    conversionInputs.forceManifestMIMEType = options.forceManifestMIMEType;
    conversionInputs.requestedCompressionFormat = settings.compressionFormat;
    conversionInputs.requiresOCIEncryption = destRequiresOCIEncryption;
    conversionInputs.cannotModifyManifestReason = settings.cannotModifyManifestReason;
    manifestConversionPlan = determineManifestConversion(conversionInputs);
    if(manifestConversionPlan.preferredMIMETypeNeedsConversion) {
        manifestUpdates.manifestMIMEType = manifestConversionPlan.preferredMIMEType;
    }

    diffIDsAreNeeded = sourceImage.updatedImageNeedsLayerDiffIDs(manifestUpdates);

    if(options.optimizeDestinationImageAlreadyExists) {
        auto shouldUpdateSignatures = !sourceSignatures.empty() || !options.signers.empty();
        auto noPendingUpdates = noPendingManifestUpdates();
        printLog(boost::format("Checking if we can skip copying: has signatures=%d, OCI encryption=%d,"
                               " no manifest updates=%d, compression match required for reusing blobs=%d")
                    % shouldUpdateSignatures % destRequiresOCIEncryption % noPendingUpdates % requireCompressionFormatMatch,
                 libcarrier::LogLevel::DEBUG);
        if(!shouldUpdateSignatures && !destRequiresOCIEncryption && noPendingUpdates && !requireCompressionFormatMatch) {
            auto matched = compareImageDestinationManifestEqual(targetInstance);
            if(matched) {
                printLog(boost::format("Skipping: image already present at destination"), libcarrier::LogLevel::INFO);
                return *matched;
            }
        }
    }

    auto compressionAlgorithms = copyLayers();

    auto result = CopySingleImageResult{};
    result.manifestMIMEType = manifestConversionPlan.preferredMIMEType;
    try {
        std::tie(result.manifest, result.manifestDigest) = copyUpdatedConfigAndManifest(targetInstance);
    }
    catch(libcarrier::Error& e) {
        printLog(boost::format("Writing manifest using preferred type %s failed: %s")
                    % manifestConversionPlan.preferredMIMEType % e.what(),
                 libcarrier::LogLevel::DEBUG);
        // Only a rejected format can be worked around, with another format
        if(!isFormatRejection(e) || manifestConversionPlan.otherMIMETypeCandidates.empty()) {
            throw;
        }
        if(!settings.cannotModifyManifestReason.empty()) {
            auto message = boost::format("writing manifest failed and we cannot try conversions: \"%s\"")
                % settings.cannotModifyManifestReason;
            CARRIER_RETHROW_ERROR(e, message.str());
        }

        auto errors = std::vector<std::string>{
            (boost::format("%s(%s)") % manifestConversionPlan.preferredMIMEType % e.what()).str()
        };
        auto succeeded = false;
        for(const auto& mimeType : manifestConversionPlan.otherMIMETypeCandidates) {
            printLog(boost::format("Trying to use manifest type %s") % mimeType, libcarrier::LogLevel::DEBUG);
            manifestUpdates.manifestMIMEType = mimeType;
            try {
                std::tie(result.manifest, result.manifestDigest) = copyUpdatedConfigAndManifest(targetInstance);
            }
            catch(libcarrier::Error& attemptError) {
                printLog(boost::format("Upload of manifest type %s failed: %s") % mimeType % attemptError.what(),
                         libcarrier::LogLevel::DEBUG);
                if(!isFormatRejection(attemptError)) {
                    auto message = boost::format("writing manifest using type %s") % mimeType;
                    CARRIER_RETHROW_ERROR(attemptError, message.str());
                }
                errors.push_back((boost::format("%s(%s)") % mimeType % attemptError.what()).str());
                continue;
            }
            result.manifestMIMEType = mimeType;
            succeeded = true;
            break;
        }
        if(!succeeded) {
            auto message = boost::format("Uploading manifest failed, attempted the following formats: %s")
                % boost::algorithm::join(errors, ", ");
            CARRIER_THROW_ERROR(message.str());
        }
    }

    auto signatureInstance = boost::optional<image::Digest>{};
    if(targetInstance) {
        signatureInstance = result.manifestDigest;
    }

    auto signatures = sourceSignatures;
    auto newSignatures = session.createSignatures(result.manifest, options.signIdentity);
    signatures.insert(signatures.end(), newSignatures.cbegin(), newSignatures.cend());
    if(!signatures.empty()) {
        printLog(boost::format("Storing signatures"), libcarrier::LogLevel::INFO);
        try {
            destination.putSignatures(signatures, signatureInstance);
        }
        catch(libcarrier::Error& e) {
            CARRIER_RETHROW_ERROR(e, "writing signatures");
        }
    }

    result.compressionAlgorithms = std::move(compressionAlgorithms);
    return result;
}

void ImageCopier::updateEmbeddedDockerReference() {
    auto& destination = session.getDestination();
    if(destination.ignoresEmbeddedDockerReference()) {
        return;
    }
    auto destReference = destination.getReference().getDockerReference();
    if(!destReference) {
        return;
    }
    if(!sourceImage.embeddedDockerReferenceConflicts(*destReference)) {
        return;
    }

    if(!settings.cannotModifyManifestReason.empty()) {
        auto message = boost::format("Copying a schema1 image with an embedded Docker reference to %s"
                                     " (Docker reference %s) would change the manifest, which we cannot do: \"%s\"")
            % transports::imageNameOf(destination.getReference())
            % destReference->string()
            % settings.cannotModifyManifestReason;
        CARRIER_THROW_ERROR(message.str());
    }
    manifestUpdates.embeddedDockerReference = destReference;
}

bool ImageCopier::noPendingManifestUpdates() const {
    return !manifestUpdates.layerInfos
        && !manifestUpdates.embeddedDockerReference
        && manifestUpdates.manifestMIMEType.empty();
}

boost::optional<CopySingleImageResult> ImageCopier::compareImageDestinationManifestEqual(
        const boost::optional<image::Digest>& targetInstance) {
    auto& destination = session.getDestination();
    auto srcManifestDigest = image::manifestDigest(sourceImage.getManifest().first);

    auto destManifest = std::pair<std::string, std::string>{};
    try {
        auto destinationSource = destination.getReference().newImageSource(session.getOptions().destinationContext);
        destManifest = destinationSource->getManifest(targetInstance);
    }
    catch(libcarrier::Error& e) {
        // Most likely nothing was stored at the destination yet
        printLog(boost::format("Unable to get destination image %s manifest: %s")
                    % transports::imageNameOf(destination.getReference()) % e.what(),
                 libcarrier::LogLevel::DEBUG);
        return boost::none;
    }

    auto destManifestDigest = image::manifestDigest(destManifest.first);
    printLog(boost::format("Comparing source and destination manifest digests: %s vs. %s")
                % srcManifestDigest % destManifestDigest,
             libcarrier::LogLevel::DEBUG);
    if(srcManifestDigest != destManifestDigest) {
        return boost::none;
    }

    auto names = std::set<std::string>{};
    for(const auto& layer : sourceImage.getLayerInfos()) {
        auto edits = compressionEditsFromBlobInfo(layer);
        if(edits.second) {
            names.insert(edits.second->getName());
        }
    }

    auto result = CopySingleImageResult{};
    result.manifest = destManifest.first;
    result.manifestMIMEType = destManifest.second;
    result.manifestDigest = srcManifestDigest;
    result.compressionAlgorithms = algorithmsByNames(names);
    return result;
}

std::vector<compression::Algorithm> ImageCopier::copyLayers() {
    const auto& options = session.getOptions();
    auto srcLayers = sourceImage.getParsedManifest().getLayerInfos();
    auto numLayers = srcLayers.size();

    auto layersToEncrypt = std::set<size_t>{};
    if(options.ociEncryptLayers) {
        if(options.ociEncryptLayers->empty()) {
            for(size_t i = 0; i < numLayers; ++i) {
                layersToEncrypt.insert(i);
            }
        }
        for(auto index : *options.ociEncryptLayers) {
            auto normalized = index < 0 ? index + static_cast<int>(numLayers) : index;
            if(normalized < 0 || normalized >= static_cast<int>(numLayers)) {
                auto message = boost::format("when choosing layers to encrypt, layer index %d out of range (%d layers exist)")
                    % index % numLayers;
                CARRIER_THROW_ERROR(message.str());
            }
            layersToEncrypt.insert(static_cast<size_t>(normalized));
        }
    }

    // Each layer copy holds a permit of the semaphore until it completes
    auto copies = std::vector<std::future<CopiedLayer>>{};
    for(size_t i = 0; i < numLayers; ++i) {
        auto permit = std::unique_ptr<SemaphorePermit>{};
        try {
            permit.reset(new SemaphorePermit{session.getConcurrentBlobCopiesSemaphore(), session.getCancellationToken()});
        }
        catch(libcarrier::Error& e) {
            CARRIER_RETHROW_ERROR(e, "copying layer");
        }
        auto toEncrypt = layersToEncrypt.count(i) > 0;
        const auto& srcLayer = srcLayers[i];
        copies.push_back(std::async(std::launch::async, [this, &srcLayer, toEncrypt, i, permit = std::move(permit)]() mutable {
            auto heldPermit = std::move(permit);
            return copyLayerOrSkipForeign(srcLayer, toEncrypt, i);
        }));
    }

    for(auto& copy : copies) {
        copy.wait();
    }
    // The error of the first failed layer, in manifest order
    auto destInfos = std::vector<image::BlobInfo>{};
    auto diffIDs = std::vector<image::Digest>{};
    for(auto& copy : copies) {
        auto copied = copy.get();
        destInfos.push_back(std::move(copied.destInfo));
        diffIDs.push_back(std::move(copied.diffID));
    }

    manifestUpdates.informationOnly.layerInfos = destInfos;
    if(diffIDsAreNeeded) {
        manifestUpdates.informationOnly.layerDiffIDs = diffIDs;
    }
    if(layerDigestsDiffer(image::toBlobInfos(srcLayers), destInfos)) {
        manifestUpdates.layerInfos = destInfos;
    }

    auto names = std::set<std::string>{};
    for(const auto& info : destInfos) {
        if(info.compressionAlgorithm) {
            names.insert(info.compressionAlgorithm->getName());
        }
    }
    return algorithmsByNames(names);
}

ImageCopier::CopiedLayer ImageCopier::copyLayerOrSkipForeign(const image::LayerInfo& srcLayer,
                                                             bool toEncrypt,
                                                             size_t layerIndex) {
    const auto& options = session.getOptions();
    if(!options.downloadForeignLayers
       && session.getDestination().acceptsForeignLayerURLs()
       && !srcLayer.urls.empty()) {
        if(diffIDsAreNeeded) {
            CARRIER_THROW_ERROR("getting DiffID for foreign layers is unimplemented");
        }
        printLog(boost::format("Skipping foreign layer %s copy to %s")
                    % srcLayer.digest % transports::imageNameOf(session.getDestination().getReference()),
                 libcarrier::LogLevel::INFO);
        return CopiedLayer{srcLayer, image::Digest{}};
    }

    try {
        return copyLayer(srcLayer, toEncrypt, layerIndex, srcLayer.emptyLayer);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("copying layer %s") % srcLayer.digest;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

ImageCopier::CopiedLayer ImageCopier::copyLayer(const image::BlobInfo& srcLayer,
                                                bool toEncrypt,
                                                size_t layerIndex,
                                                bool emptyLayer) {
    const auto& options = session.getOptions();
    auto& destination = session.getDestination();
    auto& rawSource = session.getRawSource();
    auto& cache = session.getBlobInfoCache();

    auto srcInfo = srcLayer;
    if(srcInfo.compressionOperation == image::CompressionOperation::PreserveOriginal && !srcInfo.compressionAlgorithm) {
        std::tie(srcInfo.compressionOperation, srcInfo.compressionAlgorithm) = compressionEditsFromBlobInfo(srcInfo);
    }

    auto cachedDiffID = image::Digest{};
    if(diffIDsAreNeeded) {
        cachedDiffID = cache.uncompressedDigest(srcInfo.digest);
    }
    auto diffIDIsNeeded = diffIDsAreNeeded && cachedDiffID.empty();
    auto encryptingOrDecrypting = toEncrypt
        || (crypto::isEncryptedMediaType(srcInfo.mediaType) && options.ociDecryptConfig);
    auto canAvoidProcessingCompleteLayer = !diffIDIsNeeded && !encryptingOrDecrypting;

    if(canAvoidProcessingCompleteLayer) {
        auto reuseOptions = transports::TryReusingBlobOptions{};
        reuseOptions.cache = &cache;
        reuseOptions.canSubstitute = canSubstituteBlobs && sourceImage.canChangeLayerCompression(srcInfo.mediaType);
        reuseOptions.emptyLayer = emptyLayer;
        reuseOptions.layerIndex = layerIndex;
        reuseOptions.srcReference = &rawSource.getReference();
        auto formats = std::vector<std::string>{manifestConversionPlan.preferredMIMEType};
        formats.insert(formats.end(),
                       manifestConversionPlan.otherMIMETypeCandidates.cbegin(),
                       manifestConversionPlan.otherMIMETypeCandidates.cend());
        reuseOptions.reuseConditions.possibleManifestFormats = formats;
        if(requireCompressionFormatMatch) {
            reuseOptions.reuseConditions.requiredCompression = settings.compressionFormat;
        }
        reuseOptions.originalCompression = srcInfo.compressionAlgorithm;
        reuseOptions.tocDigest = compression::getTOCDigest(srcInfo.annotations);

        auto reused = boost::optional<transports::ReusedBlob>{};
        try {
            reused = destination.tryReusingBlob(srcInfo, reuseOptions);
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("trying to reuse blob %s at destination") % srcInfo.digest;
            CARRIER_RETHROW_ERROR(e, message.str());
        }
        if(reused) {
            printLog(boost::format("Skipping blob %s (already present)") % srcInfo.digest, libcarrier::LogLevel::DEBUG);
            if(session.reportsProgress()) {
                auto event = ProgressEvent{};
                event.event = ProgressEventType::Skipped;
                event.artifact = srcInfo;
                session.reportProgress(event);
            }
            return CopiedLayer{updatedBlobInfoFromReuse(srcInfo, *reused), cachedDiffID};
        }
    }

    if(canAvoidProcessingCompleteLayer && rawSource.supportsGetBlobAt() && destination.supportsPutBlobPartial()) {
        auto chunkAccessor = SourceChunkAccessor{rawSource};
        auto partialOptions = transports::PutBlobPartialOptions{};
        partialOptions.cache = &cache;
        partialOptions.emptyLayer = emptyLayer;
        partialOptions.layerIndex = layerIndex;

        auto partial = transports::PartialBlobResult{};
        try {
            partial = destination.putBlobPartial(chunkAccessor, srcInfo, partialOptions);
        }
        catch(libcarrier::Error& e) {
            auto message = boost::format("partial pull of blob %s") % srcInfo.digest;
            CARRIER_RETHROW_ERROR(e, message.str());
        }
        if(partial.status == transports::PartialBlobResult::Status::Uploaded) {
            printLog(boost::format("Retrieved partial blob %s") % srcInfo.digest, libcarrier::LogLevel::DEBUG);
            return CopiedLayer{updatedBlobInfoFromUpload(srcInfo, partial.blob), cachedDiffID};
        }
        printLog(boost::format("Falling back to a full copy of blob %s: %s") % srcInfo.digest % partial.fallbackReason,
                 libcarrier::LogLevel::DEBUG);
    }

    auto srcStream = transports::BlobStream{};
    try {
        srcStream = rawSource.getBlob(srcInfo, cache);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("reading blob %s") % srcInfo.digest;
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    auto streamInfo = image::BlobInfo{};
    streamInfo.digest = srcInfo.digest;
    streamInfo.size = srcStream.size;
    streamInfo.mediaType = srcInfo.mediaType;
    streamInfo.annotations = srcInfo.annotations;

    DiffIDComputation diffIDComputation;
    auto destInfo = blobCopier.copyBlobFromStream(*srcStream.reader,
                                                  streamInfo,
                                                  diffIDIsNeeded ? &diffIDComputation : nullptr,
                                                  false,
                                                  toEncrypt,
                                                  layerIndex,
                                                  emptyLayer);

    auto diffID = cachedDiffID;
    if(diffIDIsNeeded) {
        try {
            diffID = diffIDComputation.getResult();
        }
        catch(libcarrier::Error& e) {
            CARRIER_RETHROW_ERROR(e, "computing layer DiffID");
        }
        // Only trust the pair if the layer bytes are what the source digest says
        if(!encryptingOrDecrypting) {
            cache.recordDigestUncompressedPair(srcInfo.digest, diffID);
        }
    }
    return CopiedLayer{destInfo, diffID};
}

std::pair<std::string, image::Digest> ImageCopier::copyUpdatedConfigAndManifest(
        const boost::optional<image::Digest>& targetInstance) {
    auto* pendingImage = static_cast<image::Image*>(&sourceImage);
    auto updatedImage = std::unique_ptr<image::Image>{};
    if(!noPendingManifestUpdates()) {
        if(!settings.cannotModifyManifestReason.empty()) {
            auto message = boost::format("Internal error: copy needs an updated manifest but that was known to be forbidden: \"%s\"")
                % settings.cannotModifyManifestReason;
            CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, message.str());
        }
        if(!diffIDsAreNeeded && sourceImage.updatedImageNeedsLayerDiffIDs(manifestUpdates)) {
            auto message = boost::format("Can not convert image to %s, preparing DiffIDs for this case is not supported")
                % manifestUpdates.manifestMIMEType;
            CARRIER_THROW_TYPED_ERROR(libcarrier::ManifestTypeRejectedError, message.str());
        }
        try {
            updatedImage = sourceImage.updatedImage(manifestUpdates);
        }
        catch(libcarrier::Error& e) {
            CARRIER_RETHROW_ERROR(e, "creating an updated image manifest");
        }
        pendingImage = updatedImage.get();
    }

    auto manifest = pendingImage->getManifest();
    copyConfig(*pendingImage);

    auto digest = image::manifestDigest(manifest.first);
    auto instanceDigest = boost::optional<image::Digest>{};
    if(targetInstance) {
        instanceDigest = digest;
    }
    try {
        session.getDestination().putManifest(manifest.first, manifest.second, instanceDigest);
    }
    catch(libcarrier::Error& e) {
        printLog(boost::format("Error %s while writing manifest:\n%s") % e.what() % manifest.first,
                 libcarrier::LogLevel::DEBUG);
        CARRIER_RETHROW_ERROR(e, "writing manifest");
    }
    return {manifest.first, digest};
}

void ImageCopier::copyConfig(image::Image& pendingImage) {
    auto srcInfo = pendingImage.getConfigInfo();
    if(srcInfo.digest.empty()) {
        return;
    }
    if(srcInfo.size == -1) {
        auto message = boost::format("copying config blob %s: unknown size") % srcInfo.digest;
        CARRIER_THROW_ERROR(message.str());
    }

    SemaphorePermit permit{session.getConcurrentBlobCopiesSemaphore(), session.getCancellationToken()};

    auto configBlob = std::string{};
    try {
        configBlob = pendingImage.getConfigBlob();
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("reading config blob %s") % srcInfo.digest;
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    auto reader = stream::StringReader{configBlob};
    auto destInfo = image::BlobInfo{};
    try {
        destInfo = blobCopier.copyBlobFromStream(reader, srcInfo, nullptr, true, false, boost::none, false);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("copying config blob %s") % srcInfo.digest;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
    if(destInfo.digest != srcInfo.digest) {
        auto message = boost::format("Internal error: copying uncompressed config blob %s changed digest to %s")
            % srcInfo.digest % destInfo.digest;
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, message.str());
    }
}

}
}
