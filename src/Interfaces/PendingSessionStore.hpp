//----------------------------------------------------------------------------------------------------------------------
// File: PendingSessionStore.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Authentication/PendingSessionData.hpp"
#include "Components/Configuration/StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

class IPendingSessionStore
{
public:
    virtual ~IPendingSessionStore() = default;

    [[nodiscard]] virtual std::optional<Authentication::PendingSessionData> Load() const = 0;
    virtual Configuration::StatusCode Save(Authentication::PendingSessionData const& data) = 0;
    virtual Configuration::StatusCode Delete() = 0;
};

//----------------------------------------------------------------------------------------------------------------------
