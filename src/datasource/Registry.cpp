#include "datasource/Registry.hpp"
#include "datasource/FileDatasource.hpp"
#include "datasource/TextDatasource.hpp"
#include "credentials/Channel.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <utility>

using namespace lb::logging;

namespace lb::datasource {

const std::map<std::string, DatasourceFactory>& Registry::factories_() {
    static const std::map<std::string, DatasourceFactory> factories = {
        {FileDatasource::TYPE, [](const credentials::Credentials& c) -> std::unique_ptr<Datasource> {
            return std::make_unique<FileDatasource>(c);
        }},
        {TextDatasource::TYPE, [](const credentials::Credentials& c) -> std::unique_ptr<Datasource> {
            return std::make_unique<TextDatasource>(c);
        }}
    };
    return factories;
}

std::unique_ptr<Datasource> Registry::create(const credentials::Credentials& credentials) {
    const auto data = credentials::Channel::get(credentials.id());
    return create(data->datasource.type, credentials);
}

std::unique_ptr<Datasource> Registry::create(const std::string& type, const credentials::Credentials& credentials) {
    const auto& factories = factories_();
    const auto it = factories.find(type);
    if (it == factories.end()) {
        LogRegistry::datasource()->error("[Registry] Unknown datasource type '{}'", type);
        throw std::invalid_argument("Unknown datasource type: " + type);
    }

    auto datasource = it->second(credentials);

    std::vector<InstantiationHandler> handlers;
    {
        std::scoped_lock lock(handlers_mutex_);
        for (const auto& [handle, handler] : handlers_) handlers.push_back(handler);
    }
    for (const auto& handler : handlers) handler(type, *datasource);

    LogRegistry::datasource()->debug("[Registry] Created '{}' datasource", type);
    return datasource;
}

bool Registry::isRegistered(const std::string& type) {
    return factories_().contains(type);
}

std::vector<std::string> Registry::types() {
    std::vector<std::string> out;
    for (const auto& [type, factory] : factories_()) out.push_back(type);
    return out;
}

unsigned int Registry::addInstantiationHandler(InstantiationHandler handler) {
    std::scoped_lock lock(handlers_mutex_);
    const auto handle = next_handle_++;
    handlers_.emplace(handle, std::move(handler));
    return handle;
}

void Registry::removeInstantiationHandler(const unsigned int handle) {
    std::scoped_lock lock(handlers_mutex_);
    handlers_.erase(handle);
}

}
