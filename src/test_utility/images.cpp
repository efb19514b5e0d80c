/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "images.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>

#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "compression/Compressor.hpp"
#include "stream/StringReader.hpp"


namespace test_utility {
namespace images {

namespace mt = carrier::image::mediatype;

std::string gzipped(const std::string& data) {
    auto source = carrier::stream::StringReader{data};
    auto annotations = std::map<std::string, std::string>{};
    auto compressor = carrier::compression::newCompressor(carrier::compression::Gzip, source, boost::none, annotations);
    return carrier::stream::readAll(*compressor);
}

static std::string makeConfig(const std::vector<std::string>& layerContents, const std::string& architecture) {
    auto diffIDs = std::vector<std::string>{};
    for(const auto& content : layerContents) {
        diffIDs.push_back("\"" + carrier::image::Digest::fromBytes(content).string() + "\"");
    }
    auto config = boost::format("{\"architecture\":\"%s\",\"os\":\"linux\",\"config\":{\"Env\":[\"PATH=/usr/bin\"]},"
                                "\"rootfs\":{\"type\":\"layers\",\"diff_ids\":[%s]}}")
        % architecture % boost::algorithm::join(diffIDs, ",");
    return config.str();
}

static TestImage makeImage(const std::vector<std::string>& layerContents,
                           const std::string& architecture,
                           const std::string& manifestMIMEType,
                           const std::string& configMIMEType,
                           const std::string& compressedLayerMIMEType,
                           const std::string& uncompressedLayerMIMEType,
                           bool compressLayers) {
    auto image = TestImage{};
    image.mimeType = manifestMIMEType;
    image.config = makeConfig(layerContents, architecture);
    image.configDigest = carrier::image::Digest::fromBytes(image.config);
    image.blobs[image.configDigest.string()] = image.config;

    auto layers = std::vector<std::string>{};
    for(const auto& content : layerContents) {
        auto blob = compressLayers ? gzipped(content) : content;
        auto digest = carrier::image::Digest::fromBytes(blob);
        image.layerDigests.push_back(digest);
        image.blobs[digest.string()] = blob;
        auto layer = boost::format("{\"mediaType\":\"%s\",\"size\":%d,\"digest\":\"%s\"}")
            % (compressLayers ? compressedLayerMIMEType : uncompressedLayerMIMEType) % blob.size() % digest;
        layers.push_back(layer.str());
    }

    auto manifest = boost::format("{\"schemaVersion\":2,\"mediaType\":\"%s\","
                                  "\"config\":{\"mediaType\":\"%s\",\"size\":%d,\"digest\":\"%s\"},"
                                  "\"layers\":[%s]}")
        % manifestMIMEType % configMIMEType % image.config.size() % image.configDigest
        % boost::algorithm::join(layers, ",");
    image.manifest = manifest.str();
    image.digest = carrier::image::Digest::fromBytes(image.manifest);
    return image;
}

TestImage makeOCIImage(const std::vector<std::string>& layerContents,
                       const std::string& architecture,
                       bool compressLayers) {
    return makeImage(layerContents, architecture, mt::ociImageManifest, mt::ociImageConfig,
                     mt::ociImageLayerGzip, mt::ociImageLayer, compressLayers);
}

TestImage makeSchema2Image(const std::vector<std::string>& layerContents, const std::string& architecture) {
    return makeImage(layerContents, architecture, mt::dockerV2Schema2, mt::dockerV2Schema2Config,
                     mt::dockerV2Schema2Layer, mt::dockerV2SchemaLayerUncompressed, true);
}

TestImage makeSchema1Image(const std::vector<std::string>& layerBlobs, const std::string& architecture) {
    auto image = TestImage{};
    image.mimeType = mt::dockerV2Schema1;

    auto ids = std::vector<std::string>{};
    for(size_t i = 0; i < layerBlobs.size(); ++i) {
        ids.push_back(carrier::image::Digest::fromBytes("layer id " + std::to_string(i)).getEncoded());
        auto digest = carrier::image::Digest::fromBytes(layerBlobs[i]);
        image.layerDigests.push_back(digest);
        image.blobs[digest.string()] = layerBlobs[i];
    }

    // top-most layer first
    auto fsLayers = std::vector<std::string>{};
    auto history = std::vector<std::string>{};
    for(auto i = layerBlobs.size(); i-- > 0;) {
        fsLayers.push_back((boost::format("{\"blobSum\":\"%s\"}") % image.layerDigests[i]).str());
        auto compatibility = "{\\\"id\\\":\\\"" + ids[i] + "\\\"";
        if(i > 0) {
            compatibility += ",\\\"parent\\\":\\\"" + ids[i-1] + "\\\"";
        }
        compatibility += ",\\\"created\\\":\\\"2023-01-01T00:00:00Z\\\"";
        if(i == layerBlobs.size() - 1) {
            compatibility += ",\\\"architecture\\\":\\\"" + architecture + "\\\""
                             ",\\\"os\\\":\\\"linux\\\""
                             ",\\\"config\\\":{\\\"Env\\\":[\\\"PATH=/usr/bin\\\"]}";
        }
        compatibility += "}";
        history.push_back("{\"v1Compatibility\":\"" + compatibility + "\"}");
    }

    auto manifest = boost::format("{\"schemaVersion\":1,\"name\":\"library/test\",\"tag\":\"latest\","
                                  "\"architecture\":\"%s\",\"fsLayers\":[%s],\"history\":[%s]}")
        % architecture % boost::algorithm::join(fsLayers, ",") % boost::algorithm::join(history, ",");
    image.manifest = manifest.str();
    image.digest = carrier::image::Digest::fromBytes(image.manifest);
    return image;
}

void storeImage(memory::MemoryStore& store, const TestImage& image) {
    std::lock_guard<std::mutex> lock{store.mutex};
    store.blobs.insert(image.blobs.cbegin(), image.blobs.cend());
    store.manifest = {image.manifest, image.mimeType};
}

std::string storeList(memory::MemoryStore& store, const std::vector<TestImage>& images, const std::string& listMIMEType) {
    auto entries = std::vector<std::string>{};
    for(const auto& image : images) {
        auto architecture = image.config.substr(image.config.find("\"architecture\":\"") + 16);
        architecture = architecture.substr(0, architecture.find('"'));
        auto entry = boost::format("{\"mediaType\":\"%s\",\"size\":%d,\"digest\":\"%s\","
                                   "\"platform\":{\"architecture\":\"%s\",\"os\":\"linux\"}}")
            % image.mimeType % image.manifest.size() % image.digest % architecture;
        entries.push_back(entry.str());
    }
    auto list = boost::format("{\"schemaVersion\":2,\"mediaType\":\"%s\",\"manifests\":[%s]}")
        % listMIMEType % boost::algorithm::join(entries, ",");

    std::lock_guard<std::mutex> lock{store.mutex};
    for(const auto& image : images) {
        store.blobs.insert(image.blobs.cbegin(), image.blobs.cend());
        store.instanceManifests[image.digest.string()] = {image.manifest, image.mimeType};
    }
    store.manifest = {list.str(), listMIMEType};
    return list.str();
}

}
}
