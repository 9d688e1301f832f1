//----------------------------------------------------------------------------------------------------------------------
// File: Session.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Session/SessionParams.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class ISession
{
public:
    virtual ~ISession() = default;

    [[nodiscard]] virtual std::string const& GetSessionId() const = 0;
    [[nodiscard]] virtual Session::Params const& GetParams() const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
