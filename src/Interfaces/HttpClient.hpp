//----------------------------------------------------------------------------------------------------------------------
// File: HttpClient.hpp
// Description: The transport used to issue requests to a homeserver. Implementations own the TLS behavior described by
// the connection configuration they were built for. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Failure/Failure.hpp"
#include "Components/Network/Http.hpp"
//----------------------------------------------------------------------------------------------------------------------

class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    // Note: Any response received from the server, including error statuses, is a value. A failure is only returned 
    // when no response was received or the server's certificate was rejected. 
    [[nodiscard]] virtual Failure::Expected<Network::Http::Response> Execute(Network::Http::Request const& request) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
