/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Digest_hpp
#define carrier_image_Digest_hpp

#include <string>
#include <ostream>


namespace carrier {
namespace image {

/**
 * Content address of a blob or manifest in the form "<algorithm>:<hex-encoded hash>".
 * A default-constructed Digest is empty, i.e. "not known yet".
 */
class Digest {
public:
    static const std::string SHA256;
    static const std::string SHA512;

public:
    Digest() = default;
    static Digest parse(const std::string& digest);
    static Digest fromBytes(const std::string& data, const std::string& algorithm = SHA256);

    bool empty() const { return algorithm.empty(); }
    const std::string& getAlgorithm() const { return algorithm; }
    const std::string& getEncoded() const { return encoded; }
    std::string string() const;

    static bool isSupportedAlgorithm(const std::string& algorithm);

private:
    Digest(const std::string& algorithm, const std::string& encoded);

private:
    std::string algorithm;
    std::string encoded;
};

bool operator==(const Digest&, const Digest&);
bool operator!=(const Digest&, const Digest&);
bool operator<(const Digest&, const Digest&);
std::ostream& operator<<(std::ostream&, const Digest&);

}
}

#endif
