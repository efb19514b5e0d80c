/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/CLIArguments.hpp"
#include "libcarrier/PathRAII.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "transports/Transports.hpp"
#include "transports/Directory.hpp"
#include "transports/OCILayout.hpp"
#include "cli/CLI.hpp"
#include "cli/CommandObjectsFactory.hpp"
#include "cli/CommandCopy.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandVersion.hpp"
#include "test_utility/config.hpp"
#include "test_utility/images.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace cli {
namespace test {

TEST_GROUP(CLITestGroup) {
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
};

static std::unique_ptr<cli::Command> generateCommandFromCLIArguments(const libcarrier::CLIArguments& args,
                                                                     std::shared_ptr<common::Config> config) {
    auto cli = cli::CLI{};
    return cli.parseCommandLine(args, std::move(config));
}

template<class ExpectedDynamicType>
void checkCommandDynamicType(const cli::Command& command) {
    CHECK(dynamic_cast<const ExpectedDynamicType*>(&command) != nullptr);
}

static std::unique_ptr<cli::CommandCopy> generateCopyCommand(const libcarrier::CLIArguments& args,
                                                            std::shared_ptr<common::Config> config) {
    auto factory = cli::CommandObjectsFactory{};
    auto command = factory.makeCommandObject("copy", args, std::move(config));
    return std::unique_ptr<cli::CommandCopy>{ dynamic_cast<cli::CommandCopy*>(command.release()) };
}

TEST(CLITestGroup, LogLevel) {
    auto& logger = libcarrier::Logger::getInstance();
    generateCommandFromCLIArguments({"carrier"}, configRAII.config);
    CHECK(logger.getLevel() == libcarrier::LogLevel::WARN);

    generateCommandFromCLIArguments({"carrier", "--verbose"}, configRAII.config);
    CHECK(logger.getLevel() == libcarrier::LogLevel::INFO);

    generateCommandFromCLIArguments({"carrier", "--debug"}, configRAII.config);
    CHECK(logger.getLevel() == libcarrier::LogLevel::DEBUG);
}

TEST(CLITestGroup, CommandTypes) {
    auto command = generateCommandFromCLIArguments({"carrier"}, configRAII.config);
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"carrier", "help"}, configRAII.config);
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"carrier", "--help"}, configRAII.config);
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"carrier", "help", "copy"}, configRAII.config);
    checkCommandDynamicType<cli::CommandHelpOfCommand>(*command);

    command = generateCommandFromCLIArguments({"carrier", "copy", "dir:/tmp/a", "oci:/tmp/b"}, configRAII.config);
    checkCommandDynamicType<cli::CommandCopy>(*command);

    command = generateCommandFromCLIArguments({"carrier", "version"}, configRAII.config);
    checkCommandDynamicType<cli::CommandVersion>(*command);

    command = generateCommandFromCLIArguments({"carrier", "--version"}, configRAII.config);
    checkCommandDynamicType<cli::CommandVersion>(*command);
}

TEST(CLITestGroup, UnrecognizedCommandsAndOptions) {
    CHECK_THROWS(libcarrier::Error, generateCommandFromCLIArguments({"carrier", "--mpi", "copy"}, configRAII.config));
    CHECK_THROWS(libcarrier::Error, generateCommandFromCLIArguments({"carrier", "---copy"}, configRAII.config));
    CHECK_THROWS(libcarrier::Error, generateCommandFromCLIArguments({"carrier", "pull", "image"}, configRAII.config));
    CHECK_THROWS(libcarrier::Error, generateCommandFromCLIArguments({"carrier", "help", "pull"}, configRAII.config));
    CHECK_THROWS(libcarrier::Error, generateCommandFromCLIArguments({"carrier", "version", "--all"}, configRAII.config));
}

TEST(CLITestGroup, copyDefaults) {
    auto command = generateCopyCommand({"copy", "dir:/var/tmp/source", "oci:/var/tmp/layout:image"}, configRAII.config);
    CHECK_EQUAL(transports::imageNameOf(command->getSourceReference()), std::string{"dir:/var/tmp/source"});
    CHECK_EQUAL(transports::imageNameOf(command->getDestinationReference()), std::string{"oci:/var/tmp/layout:image"});

    const auto& options = command->getOptions();
    CHECK_FALSE(options.removeSignatures);
    CHECK(options.signers.empty());
    CHECK(!options.destinationCompressionFormat);
    CHECK(!options.destinationCompressionLevel);
    CHECK_FALSE(options.forceCompressionFormat);
    CHECK(options.forceManifestMIMEType.empty());
    CHECK(options.imageListSelection == copy::ImageListSelection::CopySystemImage);
    CHECK(!options.ociEncryptLayers);
    CHECK(!options.ociEncryptConfig);
    CHECK(!options.ociDecryptConfig);
    CHECK_EQUAL(options.maxParallelDownloads, copy::DEFAULT_MAX_PARALLEL_DOWNLOADS);
    CHECK_FALSE(options.optimizeDestinationImageAlreadyExists);
    CHECK_FALSE(options.preserveDigests);
    CHECK_EQUAL(options.progressInterval.count(), 0);
    CHECK(options.sourceContext.tempDir == configRAII.tempDir.getPath());
}

TEST(CLITestGroup, copyOptions) {
    auto command = generateCopyCommand(
        {"copy",
         "--remove-signatures",
         "--dest-compress-format", "zstd",
         "--dest-compress-level=9",
         "--force-compression",
         "--format", "v2s2",
         "--max-parallel-downloads", "2",
         "--optimize-destination",
         "--preserve-digests",
         "--ensure-compression-variants", "gzip",
         "--ensure-compression-variants", "zstd",
         "--progress-interval", "500",
         "--insecure-policy",
         "dir:/var/tmp/source", "dir:/var/tmp/destination"},
        configRAII.config);

    const auto& options = command->getOptions();
    CHECK(options.removeSignatures);
    CHECK_EQUAL(options.destinationCompressionFormat->getName(), compression::ZSTD_ALGORITHM_NAME);
    CHECK_EQUAL(*options.destinationCompressionLevel, 9);
    CHECK(options.forceCompressionFormat);
    CHECK_EQUAL(options.forceManifestMIMEType, image::mediatype::dockerV2Schema2);
    CHECK_EQUAL(options.maxParallelDownloads, 2);
    CHECK(options.optimizeDestinationImageAlreadyExists);
    CHECK(options.preserveDigests);
    CHECK_EQUAL(options.ensureCompressionVariantsExist.size(), 2);
    CHECK_EQUAL(options.ensureCompressionVariantsExist[0].algorithm.getName(), compression::GZIP_ALGORITHM_NAME);
    CHECK_EQUAL(options.progressInterval.count(), 500);
}

TEST(CLITestGroup, copyImageListSelection) {
    {
        auto command = generateCopyCommand({"copy", "--all", "dir:/a", "dir:/b"}, configRAII.config);
        CHECK(command->getOptions().imageListSelection == copy::ImageListSelection::CopyAllImages);
    }
    {
        auto first = image::Digest::fromBytes("first instance").string();
        auto second = image::Digest::fromBytes("second instance").string();
        auto command = generateCopyCommand({"copy", "--instance", first, "--instance", second, "dir:/a", "dir:/b"},
                                           configRAII.config);
        const auto& options = command->getOptions();
        CHECK(options.imageListSelection == copy::ImageListSelection::CopySpecificImages);
        CHECK_EQUAL(options.instances.size(), 2);
        CHECK_EQUAL(options.instances[1].string(), second);
    }
    CHECK_THROWS(libcarrier::Error, generateCopyCommand(
        {"copy", "--all", "--instance", image::Digest::fromBytes("instance").string(), "dir:/a", "dir:/b"},
        configRAII.config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--instance", "not-a-digest", "dir:/a", "dir:/b"},
                                                        configRAII.config));
}

TEST(CLITestGroup, copyDefaultsFromConfiguration) {
    auto customRAII = test_utility::config::makeConfig(
        R"({"maxParallelDownloads": 3, "progressIntervalMs": 250,)"
        R"( "defaultCompressionFormat": "zstd", "defaultCompressionLevel": 5})");
    auto command = generateCopyCommand({"copy", "dir:/a", "dir:/b"}, customRAII.config);
    const auto& options = command->getOptions();
    CHECK_EQUAL(options.maxParallelDownloads, 3);
    CHECK_EQUAL(options.progressInterval.count(), 250);
    CHECK_EQUAL(options.destinationCompressionFormat->getName(), compression::ZSTD_ALGORITHM_NAME);
    CHECK_EQUAL(*options.destinationCompressionLevel, 5);

    // the command line has the last word
    command = generateCopyCommand({"copy", "--max-parallel-downloads", "1", "dir:/a", "dir:/b"}, customRAII.config);
    CHECK_EQUAL(command->getOptions().maxParallelDownloads, 1);
}

TEST(CLITestGroup, invalidCopyArguments) {
    auto config = configRAII.config;
    // number of images
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "dir:/a"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "dir:/a", "dir:/b", "dir:/c"}, config));
    // image names
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "dir:/a", "docker://image"}, config));
    // option values
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--format", "v3", "dir:/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--dest-compress-format", "lz4", "dir:/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--max-parallel-downloads", "0", "dir:/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--progress-interval", "-1", "dir:/a", "dir:/b"}, config));
    // option combinations
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--force-compression", "dir:/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--encrypt-layer", "0", "dir:/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--sign-identity", "example.com/image", "dir:/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--sign-passphrase-file", "/passphrase", "dir:/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--policy", "/policy.json", "--insecure-policy", "dir:/a", "dir:/b"}, config));
    // missing key files
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--encryption-key", "/missing.pem", "dir:/a", "dir:/b"}, config));
    CHECK_THROWS(libcarrier::Error, generateCopyCommand({"copy", "--sign-by-key", "/missing.pem", "dir:/a", "dir:/b"}, config));
}

TEST(CLITestGroup, copyFromDirectoryToOCILayout) {
    auto workDir = libcarrier::makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "carrier-test-cli");
    auto sourceDir = workDir.getPath() / "source";
    auto layoutDir = workDir.getPath() / "layout";

    auto testImage = test_utility::images::makeOCIImage({"first layer", "second layer"});
    libcarrier::filesystem::createFoldersIfNecessary(sourceDir);
    libcarrier::filesystem::writeTextFile(transports::DIRECTORY_TRANSPORT_VERSION, sourceDir / "version");
    libcarrier::filesystem::writeTextFile(testImage.manifest, sourceDir / "manifest.json");
    for(const auto& blob : testImage.blobs) {
        auto digest = image::Digest::parse(blob.first);
        libcarrier::filesystem::writeTextFile(blob.second, sourceDir / digest.getEncoded());
    }

    auto source = "dir:" + sourceDir.string();
    auto destination = "oci:" + layoutDir.string() + ":copied";
    auto command = generateCommandFromCLIArguments({"carrier", "copy", source, destination}, configRAII.config);
    command->execute();

    auto reference = transports::OCIReference{layoutDir, "copied"};
    auto index = transports::OCIIndex::read(reference.getIndexPath());
    CHECK_EQUAL(index.manifests.size(), 1);
    CHECK_EQUAL(index.manifests[0].digest.string(), testImage.digest.string());
    CHECK_EQUAL(index.manifests[0].annotations.at(transports::OCI_REF_NAME_ANNOTATION), std::string{"copied"});
    for(const auto& blob : testImage.blobs) {
        auto path = reference.getBlobPath(image::Digest::parse(blob.first));
        CHECK_EQUAL(libcarrier::filesystem::readFile(path), blob.second);
    }
}

TEST(CLITestGroup, copyRejectedByPolicy) {
    auto workDir = libcarrier::makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "carrier-test-cli");
    auto policy = workDir.getPath() / "policy.json";
    libcarrier::filesystem::writeTextFile(R"({"default": [{"type": "reject"}]})", policy);

    auto sourceDir = workDir.getPath() / "source";
    auto testImage = test_utility::images::makeOCIImage({"layer"});
    libcarrier::filesystem::createFoldersIfNecessary(sourceDir);
    libcarrier::filesystem::writeTextFile(testImage.manifest, sourceDir / "manifest.json");
    for(const auto& blob : testImage.blobs) {
        libcarrier::filesystem::writeTextFile(blob.second, sourceDir / image::Digest::parse(blob.first).getEncoded());
    }

    auto command = generateCommandFromCLIArguments(
        {"carrier", "copy", "--policy", policy.string(), "dir:" + sourceDir.string(), "dir:" + (workDir.getPath() / "destination").string()},
        configRAII.config);
    CHECK_THROWS(libcarrier::PolicyRejectedError, command->execute());
    CHECK_FALSE(boost::filesystem::exists(workDir.getPath() / "destination" / "manifest.json"));
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
