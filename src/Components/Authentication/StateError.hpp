//----------------------------------------------------------------------------------------------------------------------
// File: StateError.hpp
// Description: Raised when an authentication operation is invoked while the pending session can not support it. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <stdexcept>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Authentication {
//----------------------------------------------------------------------------------------------------------------------

class StateError;

//----------------------------------------------------------------------------------------------------------------------
} // Authentication namespace
//----------------------------------------------------------------------------------------------------------------------

class Authentication::StateError : public std::logic_error
{
public:
    explicit StateError(std::string const& what) : std::logic_error(what) {}
};

//----------------------------------------------------------------------------------------------------------------------
