//----------------------------------------------------------------------------------------------------------------------
// File: Failure.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Failure.hpp"
#include "Components/Network/Http.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

Failure::ServerError Failure::NotFound()
{
    return ServerError{ Network::Http::Status::NotFound, "", "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool Failure::IsNotFound(Reason const& reason)
{
    auto const* const pError = std::get_if<ServerError>(&reason);
    return pError && pError->code == Network::Http::Status::NotFound;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Failure::ToString(Reason const& reason)
{
    std::ostringstream oss;
    std::visit(VariantVisitor{
        [&oss] (Transport const& failure) { oss << "transport failure (" << failure.reason << ")"; },
        [&oss] (UnrecognizedCertificate const& failure) {
            oss << "unrecognized certificate for " << failure.uri << " [" << failure.fingerprint.GetDisplayable() << "]";
        },
        [&oss] (ServerError const& failure) {
            oss << "server error " << failure.code;
            if (!failure.errcode.empty()) { oss << " " << failure.errcode; }
            if (!failure.message.empty()) { oss << ": " << failure.message; }
        },
        [&oss] (MalformedResponse const& failure) { oss << "malformed response (" << failure.reason << ")"; },
        [&oss] (SessionNotFound const& failure) { oss << "unknown session " << failure.sessionId; },
    }, reason);
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------
