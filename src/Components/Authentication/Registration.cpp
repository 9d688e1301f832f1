//----------------------------------------------------------------------------------------------------------------------
// File: Registration.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Registration.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::vector<std::string>> ReadStrings(boost::json::value const& json);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Flows = "flows";
constexpr std::string_view Stages = "stages";
constexpr std::string_view Completed = "completed";
constexpr std::string_view Session = "session";
constexpr std::string_view Params = "params";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Authentication::FlowResponse> Authentication::FlowResponse::Read(boost::json::value const& json)
{
    // JSON Schema:
    // {
    //     "flows": [{ "stages": [String] }],
    //     "completed": Optional [String],
    //     "session": Optional String,
    //     "params": Optional Object
    // }
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    auto const flows = pObject->find(symbols::Flows);
    if (flows == pObject->end() || !flows->value().is_array()) { return {}; }

    FlowResponse response;
    for (auto const& flow : flows->value().get_array()) {
        auto const* const pFlow = flow.if_object();
        if (!pFlow) { return {}; }
        auto const stages = pFlow->find(symbols::Stages);
        if (stages == pFlow->end()) { return {}; }
        auto optStages = local::ReadStrings(stages->value());
        if (!optStages) { return {}; }
        response.flows.emplace_back(std::move(*optStages));
    }

    if (auto const itr = pObject->find(symbols::Completed); itr != pObject->end()) {
        auto optCompleted = local::ReadStrings(itr->value());
        if (!optCompleted) { return {}; }
        response.completed = std::move(*optCompleted);
    }

    if (auto const itr = pObject->find(symbols::Session); itr != pObject->end() && itr->value().is_string()) {
        response.session = std::string{ itr->value().get_string() };
    }

    if (auto const itr = pObject->find(symbols::Params); itr != pObject->end() && itr->value().is_object()) {
        response.params = itr->value().get_object();
    }

    return response;
}

//----------------------------------------------------------------------------------------------------------------------

Authentication::FlowResult Authentication::FlowResult::Create(FlowResponse const& response)
{
    FlowResult result;
    result.completedStages = response.completed;

    auto const contains = [] (auto const& range, std::string const& value) {
        return std::ranges::find(range, value) != range.end();
    };

    for (auto const& flow : response.flows) {
        for (auto const& type : flow) {
            if (contains(response.completed, type)) { continue; }
            bool const listed = std::ranges::any_of(result.missingStages, [&type] (Stage const& stage) {
                return stage.type == type;
            });
            if (listed) { continue; }

            bool const mandatory = std::ranges::all_of(response.flows, [&] (auto const& other) {
                return contains(other, type);
            });

            boost::json::value params;
            if (auto const itr = response.params.find(type); itr != response.params.end()) { params = itr->value(); }
            result.missingStages.emplace_back(Stage{ type, mandatory, std::move(params) });
        }
    }

    return result;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::vector<std::string>> local::ReadStrings(boost::json::value const& json)
{
    auto const* const pArray = json.if_array();
    if (!pArray) { return {}; }

    std::vector<std::string> strings;
    strings.reserve(pArray->size());
    for (auto const& value : *pArray) {
        if (!value.is_string()) { return {}; }
        strings.emplace_back(value.get_string());
    }
    return strings;
}

//----------------------------------------------------------------------------------------------------------------------
