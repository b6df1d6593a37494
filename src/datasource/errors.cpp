#include "datasource/errors.hpp"

namespace lb::datasource {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::StorageFault: return "StorageFault";
    case ErrorKind::DecodeFault: return "DecodeFault";
    case ErrorKind::EncodeFault: return "EncodeFault";
    default: return "Unknown";
    }
}

DatasourceError::DatasourceError(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}
