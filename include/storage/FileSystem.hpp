#pragma once

#include "types/Vault.hpp"

#include <cstdint>
#include <filesystem>

namespace lb::storage {

struct FileStat {
    uintmax_t size{0};
};

/**
 * Backing store primitives used by datasources. Paths are absolute.
 *
 * Implementations throw datasource::NotFoundError when the target of
 * readFile, stat or remove does not exist and datasource::StorageError for
 * every other failure. No handle outlives the call that opened it.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Recursive; an existing directory is not an error
    virtual void createDirectories(const std::filesystem::path& path) = 0;

    [[nodiscard]] virtual types::Buffer readFile(const std::filesystem::path& path) const = 0;

    // Replaces any existing content
    virtual void writeFile(const std::filesystem::path& path, const types::Buffer& data) = 0;

    [[nodiscard]] virtual FileStat stat(const std::filesystem::path& path) const = 0;

    virtual void remove(const std::filesystem::path& path) = 0;
};

}
