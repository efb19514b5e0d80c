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
#include <vector>
#include <algorithm>

#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "copy/ManifestConversion.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace copy {
namespace test {

namespace mt = image::mediatype;

static std::string conversionError(const ManifestConversionInputs& inputs) {
    try {
        determineManifestConversion(inputs);
    }
    catch(const libcarrier::Error& e) {
        return e.what();
    }
    FAIL("determineManifestConversion was expected to throw");
    return "";
}

TEST_GROUP(ManifestConversionTestGroup) {
};

TEST(ManifestConversionTestGroup, sourceTypeIsPreferredWhenSupported) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::ociImageManifest;
    inputs.destSupportedManifestMIMETypes = {mt::dockerV2Schema2, mt::ociImageManifest};

    auto plan = determineManifestConversion(inputs);
    CHECK_EQUAL(plan.preferredMIMEType, mt::ociImageManifest);
    CHECK_FALSE(plan.preferredMIMETypeNeedsConversion);
    CHECK(plan.otherMIMETypeCandidates == std::vector<std::string>{mt::dockerV2Schema2});
}

TEST(ManifestConversionTestGroup, anyTypeAcceptedKeepsSource) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::dockerV2Schema2;

    auto plan = determineManifestConversion(inputs);
    CHECK_EQUAL(plan.preferredMIMEType, mt::dockerV2Schema2);
    CHECK_FALSE(plan.preferredMIMETypeNeedsConversion);
    // the preferred types come first, then the remaining known types
    auto expected = std::vector<std::string>{mt::dockerV2Schema1Signed, mt::ociImageManifest, mt::dockerV2Schema1};
    CHECK(plan.otherMIMETypeCandidates == expected);
}

TEST(ManifestConversionTestGroup, conversionToPreferredType) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::dockerV2Schema1Signed;
    inputs.destSupportedManifestMIMETypes = {mt::ociImageManifest, mt::dockerV2Schema2};

    auto plan = determineManifestConversion(inputs);
    CHECK_EQUAL(plan.preferredMIMEType, mt::dockerV2Schema2);
    CHECK(plan.preferredMIMETypeNeedsConversion);
    CHECK(plan.otherMIMETypeCandidates == std::vector<std::string>{mt::ociImageManifest});
}

TEST(ManifestConversionTestGroup, planIsDeterministic) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::dockerV2Schema1;
    inputs.destSupportedManifestMIMETypes = {mt::dockerV2Schema1Signed, mt::ociImageManifest, mt::dockerV2Schema2};

    auto first = determineManifestConversion(inputs);
    for(int i = 0; i < 5; ++i) {
        auto plan = determineManifestConversion(inputs);
        CHECK_EQUAL(plan.preferredMIMEType, first.preferredMIMEType);
        CHECK(plan.otherMIMETypeCandidates == first.otherMIMETypeCandidates);
    }
    // no candidate appears twice
    auto all = first.otherMIMETypeCandidates;
    all.push_back(first.preferredMIMEType);
    std::sort(all.begin(), all.end());
    CHECK(std::adjacent_find(all.cbegin(), all.cend()) == all.cend());
}

TEST(ManifestConversionTestGroup, cannotModifyKeepsSourceWithoutAlternatives) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::dockerV2Schema2;
    inputs.destSupportedManifestMIMETypes = {mt::ociImageManifest};
    inputs.cannotModifyManifestReason = "Would invalidate signatures";

    auto plan = determineManifestConversion(inputs);
    CHECK_EQUAL(plan.preferredMIMEType, mt::dockerV2Schema2);
    CHECK_FALSE(plan.preferredMIMETypeNeedsConversion);
    CHECK(plan.otherMIMETypeCandidates.empty());
}

TEST(ManifestConversionTestGroup, forcedTypeIsUsed) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::ociImageManifest;
    inputs.forceManifestMIMEType = mt::dockerV2Schema2;

    auto plan = determineManifestConversion(inputs);
    CHECK_EQUAL(plan.preferredMIMEType, mt::dockerV2Schema2);
    CHECK(plan.preferredMIMETypeNeedsConversion);
    CHECK(plan.otherMIMETypeCandidates.empty());
}

TEST(ManifestConversionTestGroup, forcedFormatConflictsWithCompression) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::ociImageManifest;
    inputs.forceManifestMIMEType = mt::dockerV2Schema1Signed;
    inputs.requestedCompressionFormat = compression::Zstd;

    auto message = conversionError(inputs);
    CHECK(message.find(compression::ZSTD_ALGORITHM_NAME) != std::string::npos);
    CHECK(message.find(mt::dockerV2Schema1Signed) != std::string::npos);
}

TEST(ManifestConversionTestGroup, zstdRestrictsCandidatesToOCI) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::dockerV2Schema2;
    inputs.destSupportedManifestMIMETypes = {mt::dockerV2Schema2, mt::ociImageManifest};
    inputs.requestedCompressionFormat = compression::Zstd;

    auto plan = determineManifestConversion(inputs);
    CHECK_EQUAL(plan.preferredMIMEType, mt::ociImageManifest);
    CHECK(plan.preferredMIMETypeNeedsConversion);
    CHECK(plan.otherMIMETypeCandidates.empty());
}

TEST(ManifestConversionTestGroup, encryptionRequiresOCI) {
    auto inputs = ManifestConversionInputs{};
    inputs.srcMIMEType = mt::dockerV2Schema2;
    inputs.destSupportedManifestMIMETypes = {mt::dockerV2Schema2};
    inputs.requiresOCIEncryption = true;

    auto message = conversionError(inputs);
    CHECK(message.find("encryption required") != std::string::npos);
    CHECK(message.find(mt::dockerV2Schema2) != std::string::npos);

    inputs.destSupportedManifestMIMETypes = {mt::dockerV2Schema2, mt::ociImageManifest};
    auto plan = determineManifestConversion(inputs);
    CHECK_EQUAL(plan.preferredMIMEType, mt::ociImageManifest);
}

TEST(ManifestConversionTestGroup, listConversion) {
    auto plan = determineListConversion(mt::dockerV2List, {}, "");
    CHECK_EQUAL(plan.selectedListType, mt::dockerV2List);
    CHECK(plan.otherListTypeCandidates == std::vector<std::string>{mt::ociImageIndex});

    plan = determineListConversion(mt::dockerV2List, {mt::ociImageManifest, mt::ociImageIndex}, "");
    CHECK_EQUAL(plan.selectedListType, mt::ociImageIndex);
    CHECK(plan.otherListTypeCandidates.empty());

    plan = determineListConversion(mt::ociImageIndex, {}, mt::dockerV2List);
    CHECK_EQUAL(plan.selectedListType, mt::dockerV2List);

    CHECK_THROWS(libcarrier::Error, determineListConversion(mt::ociImageIndex, {mt::ociImageManifest}, ""));
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
