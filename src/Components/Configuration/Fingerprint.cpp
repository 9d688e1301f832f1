//----------------------------------------------------------------------------------------------------------------------
// File: Fingerprint.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Fingerprint.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cctype>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] EVP_MD const* GetMessageDigest(Configuration::Fingerprint::HashType type);
[[nodiscard]] std::optional<std::uint8_t> DecodeNibble(char c);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Digest = "digest";
constexpr std::string_view HashType = "hash_type";
constexpr std::string_view Sha1 = "sha1";
constexpr std::string_view Sha256 = "sha256";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Configuration::Fingerprint::Fingerprint(Digest digest, HashType type)
    : m_digest(std::move(digest))
    , m_type(type)
{
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::Fingerprint> Configuration::Fingerprint::Compute(
    std::span<std::uint8_t const> certificate, HashType type)
{
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> buffer{};
    std::uint32_t size = 0;
    if (EVP_Digest(certificate.data(), certificate.size(), buffer.data(), &size, local::GetMessageDigest(type), nullptr) != 1) {
        return {};
    }
    return Fingerprint{ Digest(buffer.begin(), buffer.begin() + size), type };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::Fingerprint> Configuration::Fingerprint::FromHex(std::string_view hex, HashType type)
{
    Digest digest;
    digest.reserve(hex.size() / 2);

    std::optional<std::uint8_t> optHigh;
    for (char const c : hex) {
        if (c == ':' || c == ' ') { continue; } // Displayable fingerprints use colons to seperate the octets.
        auto const optNibble = local::DecodeNibble(c);
        if (!optNibble) { return {}; }
        if (optHigh) {
            digest.emplace_back(static_cast<std::uint8_t>((*optHigh << 4) | *optNibble));
            optHigh.reset();
        } else {
            optHigh = optNibble;
        }
    }

    if (optHigh || digest.empty()) { return {}; }
    if (digest.size() != static_cast<std::size_t>(EVP_MD_size(local::GetMessageDigest(type)))) { return {}; }
    return Fingerprint{ std::move(digest), type };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::Fingerprint> Configuration::Fingerprint::Read(boost::json::value const& json)
{
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    auto const* const pDigest = pObject->if_contains(symbols::Digest);
    auto const* const pType = pObject->if_contains(symbols::HashType);
    if (!pDigest || !pDigest->is_string() || !pType || !pType->is_string()) { return {}; }

    auto const optType = ParseHashType(pType->get_string());
    if (!optType) { return {}; }

    return FromHex(pDigest->get_string(), *optType);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Fingerprint::Digest const& Configuration::Fingerprint::GetDigest() const { return m_digest; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Fingerprint::HashType Configuration::Fingerprint::GetHashType() const { return m_type; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Fingerprint::Matches(std::span<std::uint8_t const> certificate) const
{
    auto const optComputed = Compute(certificate, m_type);
    return optComputed && optComputed->m_digest == m_digest;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::Fingerprint::GetDisplayable() const
{
    constexpr std::string_view Alphabet = "0123456789ABCDEF";
    std::string displayable;
    displayable.reserve(m_digest.size() * 3);
    for (auto const octet : m_digest) {
        if (!displayable.empty()) { displayable.push_back(':'); }
        displayable.push_back(Alphabet[octet >> 4]);
        displayable.push_back(Alphabet[octet & 0x0F]);
    }
    return displayable;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::Fingerprint::GetHex() const
{
    constexpr std::string_view Alphabet = "0123456789abcdef";
    std::string hex;
    hex.reserve(m_digest.size() * 2);
    for (auto const octet : m_digest) {
        hex.push_back(Alphabet[octet >> 4]);
        hex.push_back(Alphabet[octet & 0x0F]);
    }
    return hex;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::value Configuration::Fingerprint::Write() const
{
    boost::json::object json;
    json[symbols::Digest] = GetHex();
    json[symbols::HashType] = HashTypeToString(m_type);
    return json;
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Configuration::HashTypeToString(Fingerprint::HashType type)
{
    switch (type) {
        case Fingerprint::HashType::Sha1: return symbols::Sha1;
        case Fingerprint::HashType::Sha256: return symbols::Sha256;
    }
    return "";
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::Fingerprint::HashType> Configuration::ParseHashType(std::string_view type)
{
    if (type == symbols::Sha1) { return Fingerprint::HashType::Sha1; }
    if (type == symbols::Sha256) { return Fingerprint::HashType::Sha256; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

EVP_MD const* local::GetMessageDigest(Configuration::Fingerprint::HashType type)
{
    using HashType = Configuration::Fingerprint::HashType;
    switch (type) {
        case HashType::Sha1: return EVP_sha1();
        case HashType::Sha256: return EVP_sha256();
    }
    return EVP_sha256();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint8_t> local::DecodeNibble(char c)
{
    if (c >= '0' && c <= '9') { return static_cast<std::uint8_t>(c - '0'); }
    if (c >= 'a' && c <= 'f') { return static_cast<std::uint8_t>(c - 'a' + 10); }
    if (c >= 'A' && c <= 'F') { return static_cast<std::uint8_t>(c - 'A' + 10); }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
