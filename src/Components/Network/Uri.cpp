//----------------------------------------------------------------------------------------------------------------------
// File: Uri.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Uri.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/lexical_cast.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string ToLower(std::string_view value);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Network::Uri::Uri()
    : m_uri()
    , m_scheme()
    , m_optHost()
    , m_optPort()
    , m_path()
{
}

//----------------------------------------------------------------------------------------------------------------------

Network::Uri Network::Uri::Parse(std::string_view uri)
{
    Uri parsed;
    parsed.m_uri = uri;

    auto const boundary = uri.find(SchemeSeperator);
    if (boundary == std::string_view::npos || boundary == 0) { return parsed; } // An opaque address has no host.

    parsed.m_scheme = local::ToLower(uri.substr(0, boundary));

    std::string_view remainder = uri.substr(boundary + SchemeSeperator.size());
    auto const pathBoundary = remainder.find_first_of("/?#");
    std::string_view const authority = remainder.substr(0, pathBoundary);
    if (pathBoundary != std::string_view::npos) {
        std::string_view const path = remainder.substr(pathBoundary);
        parsed.m_path = path.substr(0, path.find_first_of("?#"));
    }

    if (!parsed.ParseAuthority(authority)) {
        parsed.m_optHost.reset();
        parsed.m_optPort.reset();
    }

    return parsed;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::Uri::operator==(Uri const& other) const { return m_uri == other.m_uri; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Network::Uri::ToString() const { return m_uri; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Network::Uri::GetScheme() const { return m_scheme; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Network::Uri::GetHost() const { return m_optHost; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint16_t> const& Network::Uri::GetPort() const { return m_optPort; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Network::Uri::GetPath() const { return m_path; }

//----------------------------------------------------------------------------------------------------------------------

bool Network::Uri::HasHost() const { return m_optHost.has_value(); }

//----------------------------------------------------------------------------------------------------------------------

bool Network::Uri::IsRoutable() const
{
    return HasHost() && (m_scheme == SecureScheme || m_scheme == InsecureScheme);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Network::Uri::Resolve(std::string_view path) const
{
    std::string resolved = m_uri;
    if (resolved.empty() || resolved.back() != '/') { resolved.push_back('/'); }
    while (!path.empty() && path.front() == '/') { path.remove_prefix(1); }
    resolved.append(path);
    return resolved;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::Uri::ParseAuthority(std::string_view authority)
{
    // Discard any user information, it is never used to route a request. 
    if (auto const position = authority.rfind('@'); position != std::string_view::npos) {
        authority.remove_prefix(position + 1);
    }

    if (authority.empty()) { return false; }

    std::string_view host;
    std::optional<std::string_view> optPort;
    if (authority.front() == '[') {
        // IPv6 literals are bracketed, the port follows the closing bracket. 
        auto const closing = authority.find(']');
        if (closing == std::string_view::npos) { return false; }
        host = authority.substr(1, closing - 1);
        auto const trailing = authority.substr(closing + 1);
        if (!trailing.empty()) {
            if (trailing.front() != ':') { return false; }
            optPort = trailing.substr(1);
        }
    } else {
        auto const separator = authority.rfind(':');
        host = authority.substr(0, separator);
        if (separator != std::string_view::npos) { optPort = authority.substr(separator + 1); }
    }

    if (host.empty()) { return false; }

    // A port separator must be followed by the port. 
    if (optPort) {
        auto const port = *optPort;
        if (port.empty()) { return false; }
        if (!std::ranges::all_of(port, [] (char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return false;
        }

        try {
            auto const value = boost::lexical_cast<std::uint32_t>(port.data(), port.size());
            if (value == 0 || value > std::numeric_limits<std::uint16_t>::max()) { return false; }
            m_optPort = static_cast<std::uint16_t>(value);
        } catch (boost::bad_lexical_cast const&) {
            return false;
        }
    }

    m_optHost = local::ToLower(host);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::ToLower(std::string_view value)
{
    std::string lowered;
    lowered.reserve(value.size());
    std::ranges::transform(value, std::back_inserter(lowered), [] (char c) -> char {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return lowered;
}

//----------------------------------------------------------------------------------------------------------------------
