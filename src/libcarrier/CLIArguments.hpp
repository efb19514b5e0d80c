/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcarrier_CLIArguments_hpp
#define libcarrier_CLIArguments_hpp

#include <initializer_list>
#include <vector>
#include <string>
#include <ostream>

namespace libcarrier {

/**
 * Owning, null-terminated argv array, as expected by boost::program_options
 * and by the command parsers.
 */
class CLIArguments {
public:
    using const_iterator = typename std::vector<char*>::const_iterator;

public:
    CLIArguments();
    CLIArguments(const CLIArguments& rhs);
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);
    template<class InputIter>
    CLIArguments(InputIter begin, InputIter end) : CLIArguments() {
        for(InputIter arg=begin; arg!=end; ++arg) {
            push_back(*arg);
        }
    };

    ~CLIArguments();

    CLIArguments& operator=(const CLIArguments& rhs);
    void push_back(const std::string& arg);

    int argc() const;
    char** argv() const;

    const_iterator begin() const;
    const_iterator end() const;

    bool empty() const;
    void clear();
    std::string string() const;

private:
    std::vector<char*> args;
};

bool operator==(const CLIArguments&, const CLIArguments&);
std::ostream& operator<<(std::ostream&, const CLIArguments&);

}

#endif
