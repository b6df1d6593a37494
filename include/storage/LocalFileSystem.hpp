#pragma once

#include "storage/FileSystem.hpp"

namespace lb::storage {

class LocalFileSystem final : public FileSystem {
public:
    // Atomic writes default to config storage.atomic_writes
    LocalFileSystem();
    explicit LocalFileSystem(bool atomicWrites);
    ~LocalFileSystem() override = default;

    void createDirectories(const std::filesystem::path& path) override;
    [[nodiscard]] types::Buffer readFile(const std::filesystem::path& path) const override;
    void writeFile(const std::filesystem::path& path, const types::Buffer& data) override;
    [[nodiscard]] FileStat stat(const std::filesystem::path& path) const override;
    void remove(const std::filesystem::path& path) override;

    [[nodiscard]] bool atomicWrites() const { return atomicWrites_; }

private:
    bool atomicWrites_;

    static void writeDirect(const std::filesystem::path& path, const types::Buffer& data);
    static void writeAtomic(const std::filesystem::path& path, const types::Buffer& data);
};

}
