//----------------------------------------------------------------------------------------------------------------------
// File: Versions.hpp
// Description: The protocol versions advertised by a homeserver and the compatibility rules of this client.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

struct VersionNumber;
class Versions;

namespace Features {
    constexpr std::string_view LazyLoadMembers = "m.lazy_load_members";
    constexpr std::string_view RequireIdentityServer = "m.require_identity_server";
    constexpr std::string_view IdAccessToken = "m.id_access_token";
    constexpr std::string_view SeparateAddAndBind = "m.separate_add_and_bind";
}

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

// An ordered view of a version string. Legacy versions are of the form "r0.6.1", stable versions are of the form
// "v1.2" and are newer than every legacy version. 
struct Discovery::VersionNumber
{
    enum class Series : std::uint32_t { Legacy, Stable };

    [[nodiscard]] static std::optional<VersionNumber> Parse(std::string_view version);

    [[nodiscard]] auto operator<=>(VersionNumber const& other) const = default;

    Series series;
    std::uint32_t major;
    std::uint32_t minor;
    std::uint32_t patch;
};

//----------------------------------------------------------------------------------------------------------------------

class Discovery::Versions
{
public:
    using UnstableFeatures = std::map<std::string, bool, std::less<>>;

    static constexpr VersionNumber MinimumSupported{ VersionNumber::Series::Legacy, 0, 5, 0 };
    static constexpr VersionNumber MinimumLoginAndRegistration{ VersionNumber::Series::Legacy, 0, 6, 0 };

    Versions() = default;
    Versions(std::vector<std::string> versions, UnstableFeatures features);

    [[nodiscard]] static std::optional<Versions> Read(boost::json::value const& json);

    [[nodiscard]] std::vector<std::string> const& GetVersions() const;
    [[nodiscard]] UnstableFeatures const& GetUnstableFeatures() const;

    [[nodiscard]] bool IsSupportedByClient() const;
    [[nodiscard]] bool IsLoginAndRegistrationSupported() const;

private:
    [[nodiscard]] bool SupportsAtLeast(VersionNumber const& minimum) const;
    [[nodiscard]] std::optional<bool> GetFeature(std::string_view feature) const;

    std::vector<std::string> m_versions;
    UnstableFeatures m_features;
};

//----------------------------------------------------------------------------------------------------------------------
