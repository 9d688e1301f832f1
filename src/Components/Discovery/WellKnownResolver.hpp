//----------------------------------------------------------------------------------------------------------------------
// File: WellKnownResolver.hpp
// Description: The default resolver for a domain's client discovery document. The advertised servers are validated
// before they are offered to the caller. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Documents.hpp"
#include "Outcome.hpp"
#include "Interfaces/WellKnownResolver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IClientFactory;

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class WellKnownResolver;

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::WellKnownResolver final : public IWellKnownResolver
{
public:
    explicit WellKnownResolver(std::shared_ptr<IClientFactory> const& spClientFactory);

    // Extracts the server name of a fully qualified user identifier (e.g. "example.org" from "@alice:example.org"). 
    [[nodiscard]] static std::optional<std::string> GetDomain(std::string_view matrixId);

    // IWellKnownResolver {
    [[nodiscard]] virtual Failure::Expected<WellKnownResult> Resolve(
        std::string_view matrixId,
        std::optional<Configuration::ServerConnectionConfig> const& optConfig) override;
    // } IWellKnownResolver

private:
    [[nodiscard]] WellKnownResult Validate(
        ClientWellKnown const& document, Configuration::ServerConnectionConfig const& config) const;

    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IClientFactory> m_spClientFactory;
};

//----------------------------------------------------------------------------------------------------------------------
