//----------------------------------------------------------------------------------------------------------------------
// File: WellKnownResolver.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/ServerConnectionConfig.hpp"
#include "Components/Discovery/Outcome.hpp"
#include "Components/Failure/Failure.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IWellKnownResolver
{
public:
    virtual ~IWellKnownResolver() = default;

    // Looks up the client discovery document for the domain of a user identifier (e.g. "@alice:example.org"). When a 
    // configuration is provided, its transport options are used for the lookup. Failures that prevent the lookup 
    // from being interpreted at all (e.g. an unrecognized certificate) are returned as a failure. 
    [[nodiscard]] virtual Failure::Expected<Discovery::WellKnownResult> Resolve(
        std::string_view matrixId,
        std::optional<Configuration::ServerConnectionConfig> const& optConfig) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
