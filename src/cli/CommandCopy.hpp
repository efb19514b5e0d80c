/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_cli_CommandCopy_hpp
#define carrier_cli_CommandCopy_hpp

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <chrono>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>

#include "libcarrier/CLIArguments.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"
#include "cli/HelpMessage.hpp"
#include "image/mediaTypes.hpp"
#include "image/DockerReference.hpp"
#include "compression/Algorithms.hpp"
#include "crypto/EncryptConfig.hpp"
#include "signature/Policy.hpp"
#include "signature/PolicyContext.hpp"
#include "signature/Signer.hpp"
#include "transports/ImageReference.hpp"
#include "transports/Transports.hpp"
#include "copy/Options.hpp"
#include "copy/Copier.hpp"
#include "copy/ProgressChannel.hpp"


namespace carrier {
namespace cli {

/**
 * Logs the events of a progress channel on a background thread, for as long
 * as the object lives.
 */
class ProgressLogger {
public:
    explicit ProgressLogger(std::shared_ptr<copy::ProgressChannel> channel)
        : channel{std::move(channel)}
        , thread{[this]() { run(); }}
    {}

    ~ProgressLogger() {
        channel->close();
        thread.join();
    }

private:
    void run() {
        while(auto event = channel->take()) {
            auto digest = event->artifact.digest.string();
            switch(event->event) {
            case copy::ProgressEventType::NewArtifact:
                utility::printLog(boost::format("Copying blob %s") % digest, libcarrier::LogLevel::INFO);
                break;
            case copy::ProgressEventType::Read:
                utility::printLog(boost::format("Blob %s: %d bytes") % digest % event->offset, libcarrier::LogLevel::INFO);
                break;
            case copy::ProgressEventType::Skipped:
                utility::printLog(boost::format("Blob %s already exists at destination") % digest, libcarrier::LogLevel::INFO);
                break;
            case copy::ProgressEventType::Done:
                utility::printLog(boost::format("Blob %s done (%d bytes)") % digest % event->offset, libcarrier::LogLevel::INFO);
                break;
            }
        }
    }

private:
    std::shared_ptr<copy::ProgressChannel> channel;
    std::thread thread;
};

class CommandCopy : public Command {
public:
    CommandCopy() {
        initializeOptionsDescription();
    }

    CommandCopy(const libcarrier::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto policyContext = makePolicyContext();

        if(options.progressInterval.count() > 0) {
            options.progress = std::make_shared<copy::ProgressChannel>();
        }

        auto manifest = std::string{};
        {
            auto progressLogger = std::unique_ptr<ProgressLogger>{};
            if(options.progress) {
                progressLogger.reset(new ProgressLogger{options.progress});
            }
            manifest = copy::copyImage(*policyContext, *destinationReference, *sourceReference, options);
        }

        utility::printLog(boost::format("Copied %s to %s (manifest %s)")
                            % transports::imageNameOf(*sourceReference)
                            % transports::imageNameOf(*destinationReference)
                            % image::Digest::fromBytes(manifest),
                          libcarrier::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Copy an image from one location to another";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("carrier copy [OPTIONS] SOURCE-IMAGE DESTINATION-IMAGE")
            .setDescription(getBriefDescription() + "\n\n"
                            "Images are named TRANSPORT:DETAILS, supported transports: "
                            + boost::algorithm::join(transports::Transports::getNames(), ", "))
            .setOptionsDescription(optionsDescription);
        std::cout << printer;
    }

// these methods are public for test purpose
public:
    const copy::Options& getOptions() const {
        return options;
    }

    const transports::ImageReference& getSourceReference() const {
        return *sourceReference;
    }

    const transports::ImageReference& getDestinationReference() const {
        return *destinationReference;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("remove-signatures", "Do not copy the signatures of the source image")
            ("sign-by-key",
                boost::program_options::value<std::string>(&signByKey),
                "Sign the image with the PEM private key at the given path")
            ("sign-passphrase-file",
                boost::program_options::value<std::string>(&signPassphraseFile),
                "Read the passphrase of the signing key from the given file")
            ("sign-identity",
                boost::program_options::value<std::string>(&signIdentity),
                "Identity of the signed image, by default the destination reference")
            ("dest-compress-format",
                boost::program_options::value<std::string>(&compressFormat),
                "Compression algorithm of the layers written to the destination (gzip, zstd, zstd:chunked, xz);"
                " zstd:chunked layers carry no table of contents")
            ("dest-compress-level",
                boost::program_options::value<int>(&compressLevel),
                "Compression level of the layers written to the destination")
            ("force-compression", "Use --dest-compress-format for all the layers, also those already compressed")
            ("format,f",
                boost::program_options::value<std::string>(&manifestFormat),
                "Manifest type of the destination image (oci, v2s2 or v2s1)")
            ("all,a", "Copy all the images of a manifest list")
            ("instance",
                boost::program_options::value<std::vector<std::string>>(&instances),
                "Copy only the image of a manifest list with the given digest (repeatable)")
            ("encrypt-layer",
                boost::program_options::value<std::vector<int>>(&encryptLayers),
                "Index of a layer to encrypt, negative values count from the top layer (repeatable). "
                "All layers are encrypted if not given")
            ("encryption-key",
                boost::program_options::value<std::vector<std::string>>(&encryptionKeys),
                "PEM public key of a recipient of the encrypted layers (repeatable)")
            ("decryption-key",
                boost::program_options::value<std::vector<std::string>>(&decryptionKeys),
                "PEM private key used to decrypt the layers of the source (repeatable)")
            ("max-parallel-downloads",
                boost::program_options::value<size_t>(&maxParallelDownloads),
                "Maximum number of blobs copied in parallel")
            ("optimize-destination", "Skip the copy if the destination already holds the image")
            ("download-foreign-layers", "Copy the contents of foreign layers")
            ("ensure-compression-variants",
                boost::program_options::value<std::vector<std::string>>(&compressionVariants),
                "Compression algorithm which must be available for every platform of a copied list (repeatable)")
            ("preserve-digests", "Fail if the copy would change the digest of any image")
            ("policy",
                boost::program_options::value<std::string>(&policyPath),
                "Path of the admission policy, by default the one of the configuration")
            ("insecure-policy", "Accept any source image, ignoring the admission policy")
            ("progress-interval",
                boost::program_options::value<int64_t>(&progressInterval),
                "Interval in milliseconds between progress reports, 0 disables them");
    }

    void parseCommandArguments(const libcarrier::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of copy command"), libcarrier::LogLevel::DEBUG);

        libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the copy command expects exactly two positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 2, 2, "copy");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            sourceReference = transports::parseImageName(positionalArgs.argv()[0]);
            destinationReference = transports::parseImageName(positionalArgs.argv()[1]);

            options.sourceContext.tempDir = conf->getTempDir();
            options.destinationContext.tempDir = conf->getTempDir();

            parseSigningOptions(values);
            parseCompressionOptions(values);
            parseManifestOptions(values);
            parseEncryptionOptions(values);

            options.maxParallelDownloads = values.count("max-parallel-downloads")
                ? maxParallelDownloads
                : conf->getMaxParallelDownloads();
            if(options.maxParallelDownloads == 0) {
                CARRIER_THROW_ERROR("Invalid value of '--max-parallel-downloads': must be at least 1");
            }

            options.optimizeDestinationImageAlreadyExists = values.count("optimize-destination");
            options.downloadForeignLayers = values.count("download-foreign-layers");
            options.preserveDigests = values.count("preserve-digests");

            if(values.count("progress-interval")) {
                if(progressInterval < 0) {
                    CARRIER_THROW_ERROR("Invalid value of '--progress-interval': must not be negative");
                }
                options.progressInterval = std::chrono::milliseconds{progressInterval};
            }
            else {
                options.progressInterval = conf->getProgressInterval();
            }

            isInsecurePolicy = values.count("insecure-policy");
            if(isInsecurePolicy && values.count("policy")) {
                CARRIER_THROW_ERROR("The options '--policy' and '--insecure-policy' cannot be used together");
            }
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'carrier help copy'") % e.what();
            cli::utility::printLog(message, libcarrier::LogLevel::GENERAL, std::cerr);
            CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libcarrier::LogLevel::DEBUG);
    }

    void parseSigningOptions(const boost::program_options::variables_map& values) {
        options.removeSignatures = values.count("remove-signatures");

        if(values.count("sign-passphrase-file") && !values.count("sign-by-key")) {
            CARRIER_THROW_ERROR("The option '--sign-passphrase-file' requires '--sign-by-key'");
        }
        if(values.count("sign-by-key")) {
            auto passphrase = boost::optional<std::string>{};
            if(values.count("sign-passphrase-file")) {
                auto content = libcarrier::filesystem::readFile(signPassphraseFile);
                boost::algorithm::trim_right_if(content, boost::is_any_of("\r\n"));
                passphrase = content;
            }
            options.signers.push_back(std::make_shared<signature::PEMSigner>(signByKey, passphrase));
        }

        if(values.count("sign-identity")) {
            if(!values.count("sign-by-key")) {
                CARRIER_THROW_ERROR("The option '--sign-identity' requires '--sign-by-key'");
            }
            options.signIdentity = image::DockerReference::parse(signIdentity);
        }
    }

    void parseCompressionOptions(const boost::program_options::variables_map& values) {
        if(values.count("dest-compress-format")) {
            options.destinationCompressionFormat = compression::algorithmByName(compressFormat);
        }
        else {
            options.destinationCompressionFormat = conf->getDefaultCompressionFormat();
        }

        if(values.count("dest-compress-level")) {
            options.destinationCompressionLevel = compressLevel;
        }
        else {
            options.destinationCompressionLevel = conf->getDefaultCompressionLevel();
        }

        options.forceCompressionFormat = values.count("force-compression");
        if(options.forceCompressionFormat && !options.destinationCompressionFormat) {
            CARRIER_THROW_ERROR("The option '--force-compression' requires a compression format,"
                                " set with '--dest-compress-format' or in the configuration");
        }

        for(const auto& name : compressionVariants) {
            options.ensureCompressionVariantsExist.push_back(
                copy::CompressionVariant{compression::algorithmByName(name), boost::none});
        }
    }

    void parseManifestOptions(const boost::program_options::variables_map& values) {
        if(values.count("format")) {
            if(manifestFormat == "oci") {
                options.forceManifestMIMEType = image::mediatype::ociImageManifest;
            }
            else if(manifestFormat == "v2s2") {
                options.forceManifestMIMEType = image::mediatype::dockerV2Schema2;
            }
            else if(manifestFormat == "v2s1") {
                options.forceManifestMIMEType = image::mediatype::dockerV2Schema1Signed;
            }
            else {
                auto message = boost::format("Unknown manifest format '%s', expected one of oci, v2s2, v2s1")
                    % manifestFormat;
                CARRIER_THROW_ERROR(message.str());
            }
        }

        if(values.count("all") && values.count("instance")) {
            CARRIER_THROW_ERROR("The options '--all' and '--instance' cannot be used together");
        }
        if(values.count("all")) {
            options.imageListSelection = copy::ImageListSelection::CopyAllImages;
        }
        else if(values.count("instance")) {
            options.imageListSelection = copy::ImageListSelection::CopySpecificImages;
            for(const auto& instance : instances) {
                options.instances.push_back(image::Digest::parse(instance));
            }
        }
    }

    void parseEncryptionOptions(const boost::program_options::variables_map& values) {
        if(values.count("encrypt-layer") && !values.count("encryption-key")) {
            CARRIER_THROW_ERROR("The option '--encrypt-layer' requires '--encryption-key'");
        }
        if(values.count("encryption-key")) {
            auto keys = std::vector<boost::filesystem::path>(encryptionKeys.cbegin(), encryptionKeys.cend());
            options.ociEncryptConfig = crypto::EncryptConfig::fromKeyFiles(keys);
            options.ociEncryptLayers = encryptLayers;
        }
        if(values.count("decryption-key")) {
            auto keys = std::vector<boost::filesystem::path>(decryptionKeys.cbegin(), decryptionKeys.cend());
            options.ociDecryptConfig = crypto::DecryptConfig::fromKeyFiles(keys);
        }
    }

    std::unique_ptr<signature::PolicyContext> makePolicyContext() const {
        auto policy = signature::Policy{};
        if(isInsecurePolicy) {
            utility::printLog("Admission policy disabled, any source image is accepted", libcarrier::LogLevel::WARN);
            policy.defaultRequirements.push_back(std::make_shared<signature::InsecureAcceptAnything>());
        }
        else {
            auto path = policyPath.empty() ? conf->getPolicyPath() : boost::filesystem::path{policyPath};
            utility::printLog(boost::format("Reading admission policy %s") % path, libcarrier::LogLevel::DEBUG);
            policy = signature::Policy::fromFile(path);
        }
        return std::unique_ptr<signature::PolicyContext>{ new signature::PolicyContext{std::move(policy)} };
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;

    std::shared_ptr<transports::ImageReference> sourceReference;
    std::shared_ptr<transports::ImageReference> destinationReference;
    copy::Options options;
    bool isInsecurePolicy = false;

    std::string signByKey;
    std::string signPassphraseFile;
    std::string signIdentity;
    std::string compressFormat;
    int compressLevel = 0;
    std::string manifestFormat;
    std::vector<std::string> instances;
    std::vector<int> encryptLayers;
    std::vector<std::string> encryptionKeys;
    std::vector<std::string> decryptionKeys;
    size_t maxParallelDownloads = 0;
    std::vector<std::string> compressionVariants;
    std::string policyPath;
    int64_t progressInterval = 0;
};

}
}

#endif
