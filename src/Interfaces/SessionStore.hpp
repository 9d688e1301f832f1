//----------------------------------------------------------------------------------------------------------------------
// File: SessionStore.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/StatusCode.hpp"
#include "Components/Session/SessionParams.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class ISessionStore
{
public:
    virtual ~ISessionStore() = default;

    [[nodiscard]] virtual std::optional<Session::Params> Get(std::string_view sessionId) const = 0;
    [[nodiscard]] virtual std::optional<Session::Params> GetLast() const = 0; // The most recently saved session.
    [[nodiscard]] virtual std::vector<Session::Params> GetAll() const = 0;

    virtual Configuration::StatusCode Save(Session::Params const& params) = 0;
    virtual Configuration::StatusCode Delete(std::string_view sessionId) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
