//----------------------------------------------------------------------------------------------------------------------
// File: ServiceProvider.hpp
// Description: A type indexed registry used to hand shared services to the components that depend on them.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <any>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Core {
//----------------------------------------------------------------------------------------------------------------------

class ServiceProvider;

//----------------------------------------------------------------------------------------------------------------------
} // Core namespace
//----------------------------------------------------------------------------------------------------------------------

class Core::ServiceProvider final 
{
public:
    ServiceProvider() = default;

    template<typename Service>
    bool Register(std::shared_ptr<Service> const& spService);

    template<typename Service>
    [[nodiscard]] bool Contains() const;

    template<typename Service>
    [[nodiscard]] std::weak_ptr<Service> Fetch() const;

    // Note: Used by components that can not operate without the service. Throws if the service has not been 
    // registered or the registered instance has expired. 
    template<typename Service>
    [[nodiscard]] std::shared_ptr<Service> Require() const;

private:
    std::unordered_map<std::type_index, std::any> m_services;
};

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
bool Core::ServiceProvider::Register(std::shared_ptr<Service> const& spService)
{
    if (!spService) { return false; }
    auto const [itr, result] = m_services.insert_or_assign(typeid(Service), std::weak_ptr<Service>{ spService });
    assert(itr != m_services.end());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
bool Core::ServiceProvider::Contains() const { return m_services.contains(typeid(Service)); }

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
std::weak_ptr<Service> Core::ServiceProvider::Fetch() const
{
    if (auto const itr = m_services.find(typeid(Service)); itr != m_services.end()) {
        auto const& [key, store] = *itr;
        return std::any_cast<std::weak_ptr<Service>>(store);
    }

    return std::weak_ptr<Service>{};
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
std::shared_ptr<Service> Core::ServiceProvider::Require() const
{
    if (auto spService = Fetch<Service>().lock(); spService) { return spService; }
    throw std::invalid_argument(std::string{ "Missing required service: " } + typeid(Service).name());
}

//----------------------------------------------------------------------------------------------------------------------
