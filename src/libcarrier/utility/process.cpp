/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <climits>
#include <unistd.h>
#include <sys/utsname.h>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libcarrier/Error.hpp"


namespace libcarrier {
namespace process {

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        CARRIER_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

/**
 * Returns the architecture of the running kernel, using the names of the
 * OCI image specification (GOARCH values).
 */
std::string getArchitecture() {
    auto buffer = utsname{};
    if(uname(&buffer) != 0) {
        auto message = boost::format("failed to retrieve machine architecture (%s)") % strerror(errno);
        CARRIER_THROW_ERROR(message.str());
    }
    auto machine = std::string{buffer.machine};
    if(machine == "x86_64") {
        return "amd64";
    }
    else if(machine == "aarch64") {
        return "arm64";
    }
    else if(machine == "i386" || machine == "i686") {
        return "386";
    }
    else if(boost::starts_with(machine, "armv")) {
        return "arm";
    }
    return machine;
}

std::string getOperatingSystem() {
    auto buffer = utsname{};
    if(uname(&buffer) != 0) {
        auto message = boost::format("failed to retrieve operating system name (%s)") % strerror(errno);
        CARRIER_THROW_ERROR(message.str());
    }
    return boost::to_lower_copy(std::string{buffer.sysname});
}

}}
