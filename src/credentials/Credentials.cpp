#include "credentials/Credentials.hpp"
#include "credentials/Channel.hpp"
#include "logging/LogRegistry.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <utility>

using namespace lb::logging;

namespace lb::credentials {

Credentials::Credentials(std::shared_ptr<const CredentialsData> data)
    : id_(boost::uuids::to_string(boost::uuids::random_generator()())),
      data_(std::move(data)) {
    Channel::add(id_, data_);
    LogRegistry::credentials()->debug("[Credentials] Registered credentials {} (datasource type: '{}')",
                                      id_, data_->datasource.type);
}

Credentials Credentials::fromDatasource(DatasourceConfig datasource, std::string masterPassword) {
    auto data = std::make_shared<CredentialsData>();
    data->datasource = std::move(datasource);
    data->masterPassword = std::move(masterPassword);
    return Credentials(std::move(data));
}

Credentials Credentials::fromPassword(std::string masterPassword) {
    return fromDatasource({}, std::move(masterPassword));
}

}
