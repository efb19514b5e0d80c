/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <tuple>
#include <vector>

#include <boost/program_options.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/CLIArguments.hpp"
#include "cli/Utility.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace cli {
namespace test {

TEST_GROUP(CLIUtilityTestGroup) {
    void setup() {
        optionsDescription.add_options()
            ("all,a", "Copy all")
            ("preserve-digests", "Preserve digests")
            ("format,f", boost::program_options::value<std::string>(&format), "Manifest format")
            ("instance", boost::program_options::value<std::vector<std::string>>(&instances), "Instance");
    }

    std::tuple<libcarrier::CLIArguments, libcarrier::CLIArguments> group(const libcarrier::CLIArguments& args) {
        return utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    }

    boost::program_options::options_description optionsDescription;
    std::string format;
    std::vector<std::string> instances;
};

TEST(CLIUtilityTestGroup, commandNameOnly) {
    libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy"});
    CHECK(positionalArgs.empty());
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy"}));

    std::tie(nameAndOptionArgs, positionalArgs) = group({});
    CHECK(nameAndOptionArgs.empty());
    CHECK(positionalArgs.empty());
}

TEST(CLIUtilityTestGroup, positionalArgumentsEndTheOptions) {
    libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "--all", "dir:/a", "--preserve-digests", "dir:/b"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "--all"}));
    CHECK(positionalArgs == libcarrier::CLIArguments({"dir:/a", "--preserve-digests", "dir:/b"}));
}

TEST(CLIUtilityTestGroup, optionValues) {
    libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;

    // separated value
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "--format", "oci", "dir:/a", "dir:/b"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "--format", "oci"}));
    CHECK(positionalArgs == libcarrier::CLIArguments({"dir:/a", "dir:/b"}));

    // adjacent value
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "--format=oci", "dir:/a"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "--format=oci"}));
    CHECK(positionalArgs == libcarrier::CLIArguments({"dir:/a"}));

    // repeated option
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "--instance", "a", "--instance", "b", "dir:/a"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "--instance", "a", "--instance", "b"}));

    // value missing at the end of the arguments
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "--format"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "--format"}));
    CHECK(positionalArgs.empty());
}

TEST(CLIUtilityTestGroup, shortOptions) {
    libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;

    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "-f", "v2s2", "dir:/a"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "-f", "v2s2"}));
    CHECK(positionalArgs == libcarrier::CLIArguments({"dir:/a"}));

    // sticky short options
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "-af", "oci", "dir:/a"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "-af", "oci"}));
    CHECK(positionalArgs == libcarrier::CLIArguments({"dir:/a"}));

    // sticky value
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "-foci", "dir:/a"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "-foci"}));
    CHECK(positionalArgs == libcarrier::CLIArguments({"dir:/a"}));
}

TEST(CLIUtilityTestGroup, unknownOptionsAreLeftToTheParser) {
    libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = group({"copy", "--unknown", "dir:/a"});
    CHECK(nameAndOptionArgs == libcarrier::CLIArguments({"copy", "--unknown"}));
    CHECK(positionalArgs == libcarrier::CLIArguments({"dir:/a"}));
}

TEST(CLIUtilityTestGroup, optionInsteadOfCommandName) {
    CHECK_THROWS(libcarrier::Error, group({"--all", "dir:/a"}));
}

TEST(CLIUtilityTestGroup, validateNumberOfPositionalArguments) {
    utility::validateNumberOfPositionalArguments({"dir:/a", "dir:/b"}, 2, 2, "copy");
    utility::validateNumberOfPositionalArguments({}, 0, 1, "help");
    CHECK_THROWS(libcarrier::Error, utility::validateNumberOfPositionalArguments({"dir:/a"}, 2, 2, "copy"));
    CHECK_THROWS(libcarrier::Error, utility::validateNumberOfPositionalArguments({"a", "b", "c"}, 2, 2, "copy"));
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
