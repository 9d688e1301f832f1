//----------------------------------------------------------------------------------------------------------------------
// File: ClientFactory.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "HttpClient.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

class IClientFactory
{
public:
    virtual ~IClientFactory() = default;

    // Builds a transport configured with the pinning and TLS options of the provided configuration. 
    [[nodiscard]] virtual std::shared_ptr<IHttpClient> BuildClient(Configuration::ServerConnectionConfig const& config) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
