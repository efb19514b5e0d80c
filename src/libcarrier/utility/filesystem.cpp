/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/logging.hpp"
#include "libcarrier/utility/string.hpp"

/**
 * Utility functions for filesystem manipulation
 */

namespace libcarrier {
namespace filesystem {

size_t getFileSize(const boost::filesystem::path& filename) {
    struct stat st;
    if(stat(filename.c_str(), &st) != 0) {
        auto message = boost::format("Failed to retrieve size of file %s. Stat failed: %s")
            % filename % strerror(errno);
        CARRIER_THROW_ERROR(message.str());
    }
    return st.st_size;
}

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    auto currentPath = boost::filesystem::path("");

    if(!boost::filesystem::exists(path)) {
        logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);
    }

    for(const auto& element : path) {
        currentPath /= element;
        if(!boost::filesystem::exists(currentPath)) {
            bool created = false;
            try {
                created = boost::filesystem::create_directory(currentPath);
            } catch(const std::exception& e) {
                auto message = boost::format("Failed to create directory %s") % currentPath;
                CARRIER_RETHROW_ERROR(e, message.str());
            }
            if(!created) {
                // the creation might have failed because another process concurrently
                // created the same directory. So check whether the directory was indeed
                // created by another process.
                if(!boost::filesystem::is_directory(currentPath)) {
                    auto message = boost::format("Failed to create directory %s") % currentPath;
                    CARRIER_THROW_ERROR(message.str());
                }
            }
        }
    }
}

void createFileIfNecessary(const boost::filesystem::path& path) {
    // NOTE: Broken symlinks will NOT be recognized as existing and hence will be overridden.
    if(boost::filesystem::exists(path)){
        logMessage(boost::format{"File %s already exists"} % path, LogLevel::DEBUG);
        return;
    }

    logMessage(boost::format{"Creating file %s"} % path, LogLevel::DEBUG);
    if(!path.parent_path().empty() && !boost::filesystem::exists(path.parent_path())) {
        createFoldersIfNecessary(path.parent_path());
    }
    std::ofstream of(path.c_str());
    if(!of.is_open()) {
        auto message = boost::format("Failed to create file %s") % path;
        CARRIER_THROW_ERROR(message.str());
    }
}

void removeFile(const boost::filesystem::path& path) {
    if(boost::filesystem::exists(path)) {
        boost::filesystem::remove(path);
    }
}

std::string readFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string(), std::ios::binary);
    if(!ifs) {
        auto message = boost::format("Failed to open file %s") % path;
        CARRIER_THROW_ERROR(message.str());
    }
    auto s = std::string(   std::istreambuf_iterator<char>(ifs),
                            std::istreambuf_iterator<char>());
    return s;
}

void writeTextFile(const std::string& text, const boost::filesystem::path& filename, const std::ios_base::openmode mode) {
    try {
        if(!filename.parent_path().empty()) {
            createFoldersIfNecessary(filename.parent_path());
        }
        auto ofs = std::ofstream{filename.string(), mode | std::ios_base::binary};
        if (!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            CARRIER_THROW_ERROR(message.str());
        }
        ofs << text;
        if(!ofs) {
            auto message = boost::format("Failed to write to %s") % filename;
            CARRIER_THROW_ERROR(message.str());
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write text file %s") % filename;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Writes the content to a temporary file in the same directory and renames it over the
 * target, so that concurrent readers never observe a partially written file.
 */
void writeFileAtomically(const std::string& content, const boost::filesystem::path& filename) {
    auto temporaryFile = makeUniquePathWithRandomSuffix(filename);
    try {
        writeTextFile(content, temporaryFile);
        boost::filesystem::rename(temporaryFile, filename);
    }
    catch(const std::exception& e) {
        auto ec = boost::system::error_code{};
        boost::filesystem::remove(temporaryFile, ec);
        auto message = boost::format("Failed to write file %s") % filename;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    auto uniquePath = std::string{};

    do {
        const size_t sizeOfRandomSuffix = 16;
        uniquePath = path.string() + "-" + string::generateRandom(sizeOfRandomSuffix);
    } while(boost::filesystem::exists(uniquePath));

    return uniquePath;
}

}}
