#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace lb::credentials {

struct DatasourceConfig {
    std::string type{};
    std::filesystem::path path{};
    std::optional<std::string> content{};  // pre-loaded encrypted content, bypasses the first read
};

struct CredentialsData {
    DatasourceConfig datasource{};
    std::string masterPassword{};
};

/**
 * Opaque handle to a master password and, optionally, a datasource
 * configuration. The data behind a handle lives in the credentials Channel
 * for as long as at least one copy of the handle exists.
 */
class Credentials {
public:
    static Credentials fromDatasource(DatasourceConfig datasource, std::string masterPassword);
    static Credentials fromPassword(std::string masterPassword);

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& masterPassword() const { return data_->masterPassword; }
    [[nodiscard]] const DatasourceConfig& datasource() const { return data_->datasource; }

    [[nodiscard]] bool operator==(const Credentials& other) const { return id_ == other.id_; }

private:
    explicit Credentials(std::shared_ptr<const CredentialsData> data);

    std::string id_;
    std::shared_ptr<const CredentialsData> data_;
};

}
