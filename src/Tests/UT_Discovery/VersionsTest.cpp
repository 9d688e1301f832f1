//----------------------------------------------------------------------------------------------------------------------
#include "Components/Discovery/Versions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

TEST(VersionNumberSuite, ParseTest)
{
    using Series = Discovery::VersionNumber::Series;

    auto const optLegacy = Discovery::VersionNumber::Parse("r0.6.1");
    ASSERT_TRUE(optLegacy);
    EXPECT_EQ(optLegacy->series, Series::Legacy);
    EXPECT_EQ(optLegacy->major, std::uint32_t(0));
    EXPECT_EQ(optLegacy->minor, std::uint32_t(6));
    EXPECT_EQ(optLegacy->patch, std::uint32_t(1));

    auto const optStable = Discovery::VersionNumber::Parse("v1.1");
    ASSERT_TRUE(optStable);
    EXPECT_EQ(optStable->series, Series::Stable);
    EXPECT_EQ(optStable->major, std::uint32_t(1));
    EXPECT_EQ(optStable->minor, std::uint32_t(1));

    EXPECT_GT(*optStable, *optLegacy); // Every stable release supersedes the legacy series.

    EXPECT_FALSE(Discovery::VersionNumber::Parse(""));
    EXPECT_FALSE(Discovery::VersionNumber::Parse("r"));
    EXPECT_FALSE(Discovery::VersionNumber::Parse("r0.6")); // Legacy versions require a patch component.
    EXPECT_FALSE(Discovery::VersionNumber::Parse("v1"));
    EXPECT_FALSE(Discovery::VersionNumber::Parse("x1.2.3"));
    EXPECT_FALSE(Discovery::VersionNumber::Parse("r0.a.1"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VersionsSuite, SupportThresholdTest)
{
    EXPECT_FALSE(Discovery::Versions({ "r0.0.1" }, {}).IsSupportedByClient());
    EXPECT_FALSE(Discovery::Versions({ "r0.4.0" }, {}).IsSupportedByClient());
    EXPECT_FALSE(Discovery::Versions({}, {}).IsSupportedByClient());
    EXPECT_FALSE(Discovery::Versions({ "unknown" }, {}).IsSupportedByClient());

    EXPECT_TRUE(Discovery::Versions({ "r0.5.0" }, {}).IsSupportedByClient());
    EXPECT_TRUE(Discovery::Versions({ "r0.0.1", "r0.5.0" }, {}).IsSupportedByClient());
    EXPECT_TRUE(Discovery::Versions({ "v1.2" }, {}).IsSupportedByClient());

    // Older servers implementing lazy loading are still usable. 
    EXPECT_TRUE(Discovery::Versions({ "r0.4.0" }, { { "m.lazy_load_members", true } }).IsSupportedByClient());
    EXPECT_FALSE(Discovery::Versions({ "r0.4.0" }, { { "m.lazy_load_members", false } }).IsSupportedByClient());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VersionsSuite, LoginAndRegistrationTest)
{
    EXPECT_TRUE(Discovery::Versions({ "r0.6.0" }, {}).IsLoginAndRegistrationSupported());
    EXPECT_TRUE(Discovery::Versions({ "v1.1" }, {}).IsLoginAndRegistrationSupported());
    EXPECT_FALSE(Discovery::Versions({ "r0.5.0" }, {}).IsLoginAndRegistrationSupported());

    Discovery::Versions::UnstableFeatures const features = {
        { "m.require_identity_server", false },
        { "m.id_access_token", true },
        { "m.separate_add_and_bind", true }
    };
    EXPECT_TRUE(Discovery::Versions({ "r0.5.0" }, features).IsLoginAndRegistrationSupported());

    // Every feature must be explicitly advertised. 
    auto incomplete = features;
    incomplete.erase("m.require_identity_server");
    EXPECT_FALSE(Discovery::Versions({ "r0.5.0" }, incomplete).IsLoginAndRegistrationSupported());

    auto required = features;
    required["m.require_identity_server"] = true;
    EXPECT_FALSE(Discovery::Versions({ "r0.5.0" }, required).IsLoginAndRegistrationSupported());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VersionsSuite, ReadTest)
{
    auto const optVersions = Discovery::Versions::Read(boost::json::parse(
        R"({"versions":["r0.5.0","v1.1"],"unstable_features":{"m.lazy_load_members":true,"org.example":{"x":1}}})"));
    ASSERT_TRUE(optVersions);
    EXPECT_EQ(optVersions->GetVersions(), (std::vector<std::string>{ "r0.5.0", "v1.1" }));
    ASSERT_EQ(optVersions->GetUnstableFeatures().size(), std::size_t(1));
    EXPECT_TRUE(optVersions->GetUnstableFeatures().at("m.lazy_load_members"));

    auto const optMinimal = Discovery::Versions::Read(boost::json::parse(R"({"versions":[]})"));
    ASSERT_TRUE(optMinimal);
    EXPECT_TRUE(optMinimal->GetUnstableFeatures().empty());

    EXPECT_FALSE(Discovery::Versions::Read(boost::json::parse(R"([])")));
    EXPECT_FALSE(Discovery::Versions::Read(boost::json::parse(R"({})")));
    EXPECT_FALSE(Discovery::Versions::Read(boost::json::parse(R"({"versions":[1]})")));
    EXPECT_FALSE(Discovery::Versions::Read(boost::json::parse(R"({"versions":[],"unstable_features":[]})")));
}

//----------------------------------------------------------------------------------------------------------------------
