#pragma once

#include "datasource/Datasource.hpp"
#include "datasource/TextCodec.hpp"

namespace lb::datasource {

// In-memory datasource: content arrives via setContent() or the credentials' datasource config.
class TextDatasource final : public Datasource {
public:
    static constexpr auto TYPE = "text";

    explicit TextDatasource(const credentials::Credentials& credentials,
                            std::shared_ptr<const ContentCodec> codec = std::make_shared<TextCodec>());

    // Throws StorageError when no content has been set
    types::History load(const credentials::Credentials& credentials) override;

    // Encodes history and keeps the result as the current content
    void save(const types::History& history, const credentials::Credentials& credentials) override;

    // Throws std::logic_error when no content has been set
    [[nodiscard]] const types::EncryptedContent& content() const { return content_.content(); }
};

}
