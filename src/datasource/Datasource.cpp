#include "datasource/Datasource.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <utility>

using namespace lb::logging;
using namespace lb::types;

namespace lb::datasource {

namespace {

[[noreturn]] void unsupported(const std::string& type, const std::string& op) {
    LogRegistry::datasource()->error("[Datasource] {} is not supported by '{}' datasources", op, type);
    throw std::logic_error("Attachments not supported by datasource type: " + type);
}

}

Datasource::Datasource(std::string type, credentials::Credentials credentials, std::shared_ptr<const ContentCodec> codec)
    : codec_(std::move(codec)), type_(std::move(type)), credentials_(std::move(credentials)) {
    if (!codec_) throw std::invalid_argument("Datasource requires a content codec");

    if (const auto& content = credentials_.datasource().content) {
        content_.setContent(*content);
        LogRegistry::datasource()->debug("[Datasource] '{}' datasource starts with {} bytes of preset content",
                                         type_, content->size());
    }
}

Buffer Datasource::getAttachment(const VaultID&, const AttachmentID&, const std::optional<credentials::Credentials>&) {
    unsupported(type_, "getAttachment");
}

AttachmentDetails Datasource::getAttachmentDetails(const VaultID&, const AttachmentID&) {
    unsupported(type_, "getAttachmentDetails");
}

void Datasource::putAttachment(const VaultID&, const AttachmentID&, const Buffer&,
                               const std::optional<credentials::Credentials>&) {
    unsupported(type_, "putAttachment");
}

void Datasource::removeAttachment(const VaultID&, const AttachmentID&) {
    unsupported(type_, "removeAttachment");
}

void Datasource::setContent(EncryptedContent content) {
    content_.setContent(std::move(content));
}

void Datasource::clearContent() {
    content_.clear();
}

History Datasource::decodeCached(const credentials::Credentials& credentials) const {
    return codec_->decode(content_.content(), credentials);
}

}
