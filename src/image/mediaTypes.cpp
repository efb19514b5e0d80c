/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "mediaTypes.hpp"


namespace carrier {
namespace image {
namespace mediatype {

const std::string dockerV2Schema1{"application/vnd.docker.distribution.manifest.v1+json"};
const std::string dockerV2Schema1Signed{"application/vnd.docker.distribution.manifest.v1+prettyjws"};
const std::string dockerV2Schema2{"application/vnd.docker.distribution.manifest.v2+json"};
const std::string dockerV2Schema2Config{"application/vnd.docker.container.image.v1+json"};
const std::string dockerV2Schema2Layer{"application/vnd.docker.image.rootfs.diff.tar.gzip"};
const std::string dockerV2SchemaLayerUncompressed{"application/vnd.docker.image.rootfs.diff.tar"};
const std::string dockerV2SchemaLayerZstd{"application/vnd.docker.image.rootfs.diff.tar.zstd"};
const std::string dockerV2List{"application/vnd.docker.distribution.manifest.list.v2+json"};
const std::string dockerV2Schema2ForeignLayer{"application/vnd.docker.image.rootfs.foreign.diff.tar"};
const std::string dockerV2Schema2ForeignLayerGzip{"application/vnd.docker.image.rootfs.foreign.diff.tar.gzip"};

const std::string ociDescriptor{"application/vnd.oci.descriptor.v1+json"};
const std::string ociLayoutHeader{"application/vnd.oci.layout.header.v1+json"};
const std::string ociImageManifest{"application/vnd.oci.image.manifest.v1+json"};
const std::string ociImageIndex{"application/vnd.oci.image.index.v1+json"};
const std::string ociImageConfig{"application/vnd.oci.image.config.v1+json"};
const std::string ociImageLayer{"application/vnd.oci.image.layer.v1.tar"};
const std::string ociImageLayerGzip{"application/vnd.oci.image.layer.v1.tar+gzip"};
const std::string ociImageLayerZstd{"application/vnd.oci.image.layer.v1.tar+zstd"};
const std::string ociImageLayerNonDistributable{"application/vnd.oci.image.layer.nondistributable.v1.tar"};
const std::string ociImageLayerNonDistributableGzip{"application/vnd.oci.image.layer.nondistributable.v1.tar+gzip"};
const std::string ociImageLayerNonDistributableZstd{"application/vnd.oci.image.layer.nondistributable.v1.tar+zstd"};

const std::string encryptedSuffix{"+encrypted"};

}
}
}
