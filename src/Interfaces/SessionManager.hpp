//----------------------------------------------------------------------------------------------------------------------
// File: SessionManager.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Session.hpp"
#include "Components/Session/SessionParams.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

class ISessionManager
{
public:
    virtual ~ISessionManager() = default;

    // Returns the live session for the parameters, creating it if it has not been materialized yet. 
    [[nodiscard]] virtual std::shared_ptr<ISession> GetOrCreateSession(Session::Params const& params) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
