//----------------------------------------------------------------------------------------------------------------------
// File: Http.hpp
// Description: The request and response shapes exchanged with the transport collaborator. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network::Http {
//----------------------------------------------------------------------------------------------------------------------

enum class Method : std::uint32_t { Get, Post };

struct Request;
struct Response;

namespace Status {
    constexpr std::int32_t Ok = 200;
    constexpr std::int32_t Unauthorized = 401;
    constexpr std::int32_t NotFound = 404;
}

[[nodiscard]] constexpr std::string_view MethodToString(Method method)
{
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
    }
    return "";
}

//----------------------------------------------------------------------------------------------------------------------
} // Network::Http namespace
//----------------------------------------------------------------------------------------------------------------------

struct Network::Http::Request
{
    Method method;
    std::string url;
    std::optional<std::string> body;
};

//----------------------------------------------------------------------------------------------------------------------

struct Network::Http::Response
{
    [[nodiscard]] bool IsSuccessful() const { return status >= 200 && status < 300; }

    std::int32_t status;
    std::string body;
};

//----------------------------------------------------------------------------------------------------------------------
