//----------------------------------------------------------------------------------------------------------------------
// File: StatusCode.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

enum class StatusCode : std::uint32_t { Success, FileError, DecodeError, InputError };

[[nodiscard]] constexpr std::string_view StatusCodeToString(StatusCode status)
{
    switch (status) {
        case StatusCode::Success: return "Success";
        case StatusCode::FileError: return "FileError";
        case StatusCode::DecodeError: return "DecodeError";
        case StatusCode::InputError: return "InputError";
    }
    return "";
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
