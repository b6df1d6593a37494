#include "datasource/TextDatasource.hpp"
#include "datasource/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <utility>

using namespace lb::logging;
using namespace lb::types;

namespace lb::datasource {

TextDatasource::TextDatasource(const credentials::Credentials& credentials, std::shared_ptr<const ContentCodec> codec)
    : Datasource(TYPE, credentials, std::move(codec)) {}

History TextDatasource::load(const credentials::Credentials& credentials) {
    if (!content_.hasContent()) {
        LogRegistry::datasource()->error("[TextDatasource] load() called before any content was set");
        throw StorageError("Failed to load vault: content not set");
    }
    return decodeCached(credentials);
}

void TextDatasource::save(const History& history, const credentials::Credentials& credentials) {
    content_.setContent(codec_->encode(history, credentials));
}

}
