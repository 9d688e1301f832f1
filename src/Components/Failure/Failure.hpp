//----------------------------------------------------------------------------------------------------------------------
// File: Failure.hpp
// Description: The failures surfaced by discovery and authentication. Failures are returned as values, a caller 
// inspects the variant rather than catching an exception.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Fingerprint.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Failure {
//----------------------------------------------------------------------------------------------------------------------

// The request never produced an HTTP response (e.g. unresolvable host, refused connection, timeout).
struct Transport
{
    std::string reason;
};

// The server presented a certificate that is not trusted by the configuration. The caller may offer to trust the 
// fingerprint and retry with ServerConnectionConfig::WithAllowedFingerprint. 
struct UnrecognizedCertificate
{
    std::string uri;
    Configuration::Fingerprint fingerprint;
};

// The server responded with a non-successful status. The errcode and message are taken from the standard error body
// when one is provided. 
struct ServerError
{
    std::int32_t code;
    std::string errcode;
    std::string message;
};

struct MalformedResponse
{
    std::string reason;
};

struct SessionNotFound
{
    std::string sessionId;
};

using Reason = std::variant<Transport, UnrecognizedCertificate, ServerError, MalformedResponse, SessionNotFound>;

template<typename ValueType>
using Expected = std::variant<ValueType, Reason>;

using Status = Expected<std::monostate>;

[[nodiscard]] ServerError NotFound();

// Note: Only an HTTP 404 is considered "not found". Every other failure, certificate errors included, is definitive. 
[[nodiscard]] bool IsNotFound(Reason const& reason);

[[nodiscard]] std::string ToString(Reason const& reason);

template<typename ValueType>
[[nodiscard]] bool HasValue(Expected<ValueType> const& expected) { return std::holds_alternative<ValueType>(expected); }

template<typename ValueType>
[[nodiscard]] Reason const* GetReason(Expected<ValueType> const& expected) { return std::get_if<Reason>(&expected); }

//----------------------------------------------------------------------------------------------------------------------
} // Failure namespace
//----------------------------------------------------------------------------------------------------------------------
