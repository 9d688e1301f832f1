//----------------------------------------------------------------------------------------------------------------------
// File: Uri.hpp
// Description: A lightweight view of the scheme, authority, and path of a server address. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network {
//----------------------------------------------------------------------------------------------------------------------

class Uri;

constexpr std::string_view SecureScheme = "https";
constexpr std::string_view InsecureScheme = "http";
constexpr std::string_view SchemeSeperator = "://";

//----------------------------------------------------------------------------------------------------------------------
} // Network namespace
//----------------------------------------------------------------------------------------------------------------------

class Network::Uri
{
public:
    Uri();

    // Note: Parsing never fails outright. An address typed without a scheme (e.g. "example.org") is preserved, but 
    // has no host. Callers that require a routable address should check IsRoutable(). 
    [[nodiscard]] static Uri Parse(std::string_view uri);

    [[nodiscard]] bool operator==(Uri const& other) const;

    [[nodiscard]] std::string const& ToString() const;
    [[nodiscard]] std::string const& GetScheme() const;
    [[nodiscard]] std::optional<std::string> const& GetHost() const;
    [[nodiscard]] std::optional<std::uint16_t> const& GetPort() const;
    [[nodiscard]] std::string const& GetPath() const;

    [[nodiscard]] bool HasHost() const;
    [[nodiscard]] bool IsRoutable() const;

    // Joins a relative path onto this address, treating the address as a directory (i.e. the base url of an API). 
    [[nodiscard]] std::string Resolve(std::string_view path) const;

private:
    [[nodiscard]] bool ParseAuthority(std::string_view authority);

    std::string m_uri;
    std::string m_scheme;
    std::optional<std::string> m_optHost;
    std::optional<std::uint16_t> m_optPort;
    std::string m_path;
};

//----------------------------------------------------------------------------------------------------------------------
