//----------------------------------------------------------------------------------------------------------------------
// File: Outcome.hpp
// Description: The terminal results of discovery delivered to a caller. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------
namespace LoginFlow {
//----------------------------------------------------------------------------------------------------------------------

// The homeserver was reached and is compatible. The flows are listed in the order advertised by the server. 
struct Success
{
    [[nodiscard]] bool operator==(Success const& other) const = default;

    std::vector<std::string> loginFlows;
    bool supportsLoginAndRegistration;
    std::string homeServerUrl;
};

// The homeserver was reached, but does not advertise a version this client supports. This is not a failure. 
struct OutdatedHomeserver
{
    [[nodiscard]] bool operator==(OutdatedHomeserver const& other) const = default;
};

//----------------------------------------------------------------------------------------------------------------------
} // LoginFlow namespace
//----------------------------------------------------------------------------------------------------------------------

using LoginFlowResult = std::variant<LoginFlow::Success, LoginFlow::OutdatedHomeserver>;

//----------------------------------------------------------------------------------------------------------------------
namespace WellKnown {
//----------------------------------------------------------------------------------------------------------------------

// The discovery document pointed to a valid homeserver (and identity server, when one was advertised).
struct Prompt
{
    [[nodiscard]] bool operator==(Prompt const& other) const = default;

    std::string homeServerUrl;
    std::optional<std::string> identityServerUrl;
};

struct InvalidMatrixId { [[nodiscard]] bool operator==(InvalidMatrixId const&) const = default; };

// The domain does not publish a discovery document.
struct Ignore { [[nodiscard]] bool operator==(Ignore const&) const = default; };

// The document exists but could not be used (e.g. it is malformed or has no homeserver). 
struct FailPrompt { [[nodiscard]] bool operator==(FailPrompt const&) const = default; };

// The document advertised servers that could not be validated. 
struct FailError { [[nodiscard]] bool operator==(FailError const&) const = default; };

//----------------------------------------------------------------------------------------------------------------------
} // WellKnown namespace
//----------------------------------------------------------------------------------------------------------------------

using WellKnownResult = std::variant<
    WellKnown::Prompt, WellKnown::InvalidMatrixId, WellKnown::Ignore, WellKnown::FailPrompt, WellKnown::FailError>;

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------
