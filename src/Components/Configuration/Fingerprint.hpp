//----------------------------------------------------------------------------------------------------------------------
// File: Fingerprint.hpp
// Description: A certificate digest the user has accepted for a server, used for pinning and trust prompts. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Fingerprint;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Fingerprint
{
public:
    enum class HashType : std::uint32_t { Sha1, Sha256 };
    using Digest = std::vector<std::uint8_t>;

    Fingerprint(Digest digest, HashType type);

    [[nodiscard]] static std::optional<Fingerprint> Compute(std::span<std::uint8_t const> certificate, HashType type);
    [[nodiscard]] static std::optional<Fingerprint> FromHex(std::string_view hex, HashType type);
    [[nodiscard]] static std::optional<Fingerprint> Read(boost::json::value const& json);

    [[nodiscard]] bool operator==(Fingerprint const& other) const = default;

    [[nodiscard]] Digest const& GetDigest() const;
    [[nodiscard]] HashType GetHashType() const;

    // Computes the digest of a DER encoded certificate using this fingerprint's hash type and compares the result. 
    [[nodiscard]] bool Matches(std::span<std::uint8_t const> certificate) const;

    // Uppercase hex octets seperated by colons (e.g. "AB:CD:EF"), the form shown to a user in a trust prompt. 
    [[nodiscard]] std::string GetDisplayable() const;
    [[nodiscard]] std::string GetHex() const;

    [[nodiscard]] boost::json::value Write() const;

private:
    Digest m_digest;
    HashType m_type;
};

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string_view HashTypeToString(Fingerprint::HashType type);
[[nodiscard]] std::optional<Fingerprint::HashType> ParseHashType(std::string_view type);

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
