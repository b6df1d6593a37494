#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace lb::datasource {

enum class ErrorKind {
    NotFound,
    StorageFault,
    DecodeFault,
    EncodeFault
};

std::string_view to_string(ErrorKind kind);

class DatasourceError : public std::runtime_error {
public:
    DatasourceError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Target path does not exist
class NotFoundError : public DatasourceError {
public:
    explicit NotFoundError(const std::string& message) : DatasourceError(ErrorKind::NotFound, message) {}
};

// Directory creation, read, write or delete failed for any reason other than absence
class StorageError : public DatasourceError {
public:
    explicit StorageError(const std::string& message) : DatasourceError(ErrorKind::StorageFault, message) {}
};

// Data was reached but could not be decrypted or deserialized
class DecodeError : public DatasourceError {
public:
    explicit DecodeError(const std::string& message) : DatasourceError(ErrorKind::DecodeFault, message) {}
};

// Serialization or encryption failed, nothing was written
class EncodeError : public DatasourceError {
public:
    explicit EncodeError(const std::string& message) : DatasourceError(ErrorKind::EncodeFault, message) {}
};

}
