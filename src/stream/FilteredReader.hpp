/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_FilteredReader_hpp
#define carrier_stream_FilteredReader_hpp

#include <memory>
#include <ios>

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include "stream/Reader.hpp"


namespace carrier {
namespace stream {

/**
 * Runs the bytes of a Reader through a chain of Boost.Iostreams input filters,
 * e.g. boost::iostreams::gzip_decompressor. Filters are pushed before the first
 * read, the first filter pushed is the one closest to the consumer.
 */
class FilteredReader : public Reader {
public:
    explicit FilteredReader(Reader& source);
    explicit FilteredReader(std::unique_ptr<Reader> source);

    template<class Filter>
    void push(const Filter& filter) {
        stream.push(filter);
    }

    size_t read(char* buffer, size_t size) override;

private:
    // Boost.Iostreams Source pulling from a Reader
    class ReaderDevice : public boost::iostreams::source {
    public:
        explicit ReaderDevice(Reader& reader) : reader(&reader) {}
        std::streamsize read(char* buffer, std::streamsize size);
    private:
        Reader* reader;
    };

private:
    std::unique_ptr<Reader> ownedSource;
    Reader& source;
    boost::iostreams::filtering_istream stream;
    bool isComplete = false;
};

}
}

#endif
