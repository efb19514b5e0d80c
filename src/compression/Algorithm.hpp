/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_compression_Algorithm_hpp
#define carrier_compression_Algorithm_hpp

#include <string>


namespace carrier {
namespace compression {

/**
 * A compression algorithm known to the engine.
 *
 * Variants (e.g. "zstd:chunked") produce data which is a valid instance of a
 * base algorithm (e.g. "zstd"): manifest formats and MIME types are selected
 * according to the base variant, whereas the variant name itself is what
 * the user requests and what decides how the data is produced.
 */
class Algorithm {
public:
    Algorithm() = default;
    Algorithm(const std::string& name, const std::string& baseVariantName, const std::string& prefix)
        : name{name}
        , baseVariantName{baseVariantName}
        , prefix{prefix}
    {}

    const std::string& getName() const { return name; }
    const std::string& getBaseVariantName() const {
        return baseVariantName.empty() ? name : baseVariantName;
    }
    // Leading bytes identifying a stream compressed with this algorithm; empty for variants
    const std::string& getPrefix() const { return prefix; }

private:
    std::string name;
    std::string baseVariantName;
    std::string prefix;
};

inline bool operator==(const Algorithm& lhs, const Algorithm& rhs) {
    return lhs.getName() == rhs.getName();
}

inline bool operator!=(const Algorithm& lhs, const Algorithm& rhs) {
    return !(lhs == rhs);
}

const std::string GZIP_ALGORITHM_NAME{"gzip"};
const std::string BZIP2_ALGORITHM_NAME{"bzip2"};
const std::string XZ_ALGORITHM_NAME{"xz"};
const std::string ZSTD_ALGORITHM_NAME{"zstd"};
const std::string ZSTD_CHUNKED_ALGORITHM_NAME{"zstd:chunked"};

}
}

#endif
