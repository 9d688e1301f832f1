//----------------------------------------------------------------------------------------------------------------------
// File: Versions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Versions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <boost/lexical_cast.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Versions = "versions";
constexpr std::string_view UnstableFeatures = "unstable_features";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::VersionNumber> Discovery::VersionNumber::Parse(std::string_view version)
{
    if (version.size() < 2) { return {}; }

    Series series;
    switch (version.front()) {
        case 'r': series = Series::Legacy; break;
        case 'v': series = Series::Stable; break;
        default: return {};
    }
    version.remove_prefix(1);

    // Stable versions omit the patch component, legacy versions require it. 
    std::array<std::uint32_t, 3> components = { 0, 0, 0 };
    std::size_t const required = (series == Series::Legacy) ? 3 : 2;
    std::size_t parsed = 0;
    while (parsed < components.size()) {
        auto const boundary = version.find('.');
        auto const component = version.substr(0, boundary);
        bool const numeric = !component.empty() && std::ranges::all_of(component, [] (char c) { return c >= '0' && c <= '9'; });
        if (!numeric || !boost::conversion::try_lexical_convert(component.data(), component.size(), components[parsed])) {
            return {};
        }
        ++parsed;
        if (boundary == std::string_view::npos) { break; }
        version.remove_prefix(boundary + 1);
    }

    if (parsed < required) { return {}; }
    return VersionNumber{ series, components[0], components[1], components[2] };
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Versions::Versions(std::vector<std::string> versions, UnstableFeatures features)
    : m_versions(std::move(versions))
    , m_features(std::move(features))
{
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::Versions> Discovery::Versions::Read(boost::json::value const& json)
{
    // JSON Schema:
    // {
    //     "versions": [String],
    //     "unstable_features": Optional { String: Boolean }
    // }
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    auto const versions = pObject->find(symbols::Versions);
    if (versions == pObject->end() || !versions->value().is_array()) { return {}; }

    Versions result;
    for (auto const& version : versions->value().get_array()) {
        if (!version.is_string()) { return {}; }
        result.m_versions.emplace_back(version.get_string());
    }

    if (auto const itr = pObject->find(symbols::UnstableFeatures); itr != pObject->end()) {
        if (!itr->value().is_object()) { return {}; }
        for (auto const& [feature, enabled] : itr->value().get_object()) {
            if (!enabled.is_bool()) { continue; } // Unknown feature shapes are ignored. 
            result.m_features.emplace(std::string{ feature }, enabled.get_bool());
        }
    }

    return result;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> const& Discovery::Versions::GetVersions() const { return m_versions; }

//----------------------------------------------------------------------------------------------------------------------

Discovery::Versions::UnstableFeatures const& Discovery::Versions::GetUnstableFeatures() const { return m_features; }

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Versions::IsSupportedByClient() const
{
    return SupportsAtLeast(MinimumSupported) || GetFeature(Features::LazyLoadMembers).value_or(false);
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Versions::IsLoginAndRegistrationSupported() const
{
    if (SupportsAtLeast(MinimumLoginAndRegistration)) { return true; }

    // Servers predating r0.6.0 may still implement the identity server changes registration depends upon. 
    return GetFeature(Features::RequireIdentityServer) == false &&
        GetFeature(Features::IdAccessToken) == true &&
        GetFeature(Features::SeparateAddAndBind) == true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Versions::SupportsAtLeast(VersionNumber const& minimum) const
{
    return std::ranges::any_of(m_versions, [&minimum] (std::string const& version) {
        auto const optVersion = VersionNumber::Parse(version);
        return optVersion && *optVersion >= minimum;
    });
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<bool> Discovery::Versions::GetFeature(std::string_view feature) const
{
    if (auto const itr = m_features.find(feature); itr != m_features.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
