//----------------------------------------------------------------------------------------------------------------------
// File: Registration.hpp
// Description: The user-interactive authentication flows advertised by a homeserver while registering an account. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Authentication {
//----------------------------------------------------------------------------------------------------------------------

struct FlowResponse;
struct Stage;
struct FlowResult;

namespace Stages {
    constexpr std::string_view ReCaptcha = "m.login.recaptcha";
    constexpr std::string_view Terms = "m.login.terms";
    constexpr std::string_view Dummy = "m.login.dummy";
    constexpr std::string_view Email = "m.login.email.identity";
    constexpr std::string_view Msisdn = "m.login.msisdn";
}

//----------------------------------------------------------------------------------------------------------------------
} // Authentication namespace
//----------------------------------------------------------------------------------------------------------------------

// The body of a 401 response to a registration request. 
struct Authentication::FlowResponse
{
    [[nodiscard]] static std::optional<FlowResponse> Read(boost::json::value const& json);

    std::vector<std::vector<std::string>> flows;
    std::vector<std::string> completed;
    std::optional<std::string> session;
    boost::json::object params;
};

//----------------------------------------------------------------------------------------------------------------------

struct Authentication::Stage
{
    [[nodiscard]] bool operator==(Stage const& other) const = default;

    std::string type;
    bool mandatory; // The stage appears in every advertised flow. 
    boost::json::value params; // The stage's entry in the response parameters (e.g. the recaptcha public key). 
};

//----------------------------------------------------------------------------------------------------------------------

struct Authentication::FlowResult
{
    [[nodiscard]] static FlowResult Create(FlowResponse const& response);

    std::vector<Stage> missingStages;
    std::vector<std::string> completedStages;
};

//----------------------------------------------------------------------------------------------------------------------
