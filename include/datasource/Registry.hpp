#pragma once

#include "datasource/Datasource.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lb::datasource {

using DatasourceFactory = std::function<std::unique_ptr<Datasource>(const credentials::Credentials&)>;
using InstantiationHandler = std::function<void(const std::string& type, Datasource& datasource)>;

// Static lookup table of the built-in datasource types ("file", "text").
class Registry {
public:
    // Type is taken from the credentials' datasource config
    static std::unique_ptr<Datasource> create(const credentials::Credentials& credentials);

    // Throws std::invalid_argument for unknown types
    static std::unique_ptr<Datasource> create(const std::string& type, const credentials::Credentials& credentials);

    [[nodiscard]] static bool isRegistered(const std::string& type);
    [[nodiscard]] static std::vector<std::string> types();

    // Handlers run after every datasource created through the registry
    static unsigned int addInstantiationHandler(InstantiationHandler handler);
    static void removeInstantiationHandler(unsigned int handle);

private:
    static const std::map<std::string, DatasourceFactory>& factories_();

    static inline std::mutex handlers_mutex_;
    static inline std::map<unsigned int, InstantiationHandler> handlers_;
    static inline unsigned int next_handle_ = 1;
};

}
