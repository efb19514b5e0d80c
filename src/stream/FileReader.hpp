/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_FileReader_hpp
#define carrier_stream_FileReader_hpp

#include <fstream>
#include <cstdint>
#include <limits>

#include <boost/filesystem.hpp>

#include "stream/Reader.hpp"


namespace carrier {
namespace stream {

class FileReader : public Reader {
public:
    explicit FileReader(const boost::filesystem::path& file);
    // Reads at most length bytes starting at offset
    FileReader(const boost::filesystem::path& file, uint64_t offset, uint64_t length);
    size_t read(char* buffer, size_t size) override;

private:
    boost::filesystem::path file;
    std::ifstream is;
    uint64_t remaining;
};

}
}

#endif
