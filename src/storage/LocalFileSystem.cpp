#include "storage/LocalFileSystem.hpp"
#include "config/ConfigRegistry.hpp"
#include "datasource/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fstream>
#include <random>
#include <string>

namespace fs = std::filesystem;

using namespace lb::config;
using namespace lb::datasource;
using namespace lb::logging;
using namespace lb::types;

namespace lb::storage {

namespace {

std::string generate_random_suffix(const size_t length = 8) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

[[noreturn]] void fail(const std::string& op, const fs::path& path, const std::string& reason) {
    LogRegistry::storage()->error("[LocalFileSystem] {} failed for {}: {}", op, path.string(), reason);
    throw StorageError(op + " failed for " + path.string() + ": " + reason);
}

[[noreturn]] void notFound(const std::string& op, const fs::path& path) {
    LogRegistry::storage()->debug("[LocalFileSystem] {}: no such file {}", op, path.string());
    throw NotFoundError(op + " failed, no such file: " + path.string());
}

// Throws unless path names an existing non-directory
void requireFile(const std::string& op, const fs::path& path) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) notFound(op, path);
    if (ec) fail(op, path, ec.message());
    if (fs::is_directory(st)) fail(op, path, "is a directory");
}

}

LocalFileSystem::LocalFileSystem() : atomicWrites_(ConfigRegistry::get().storage.atomic_writes) {}

LocalFileSystem::LocalFileSystem(const bool atomicWrites) : atomicWrites_(atomicWrites) {}

void LocalFileSystem::createDirectories(const fs::path& path) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (fs::exists(st)) {
        if (!fs::is_directory(st)) fail("createDirectories", path, "path exists and is not a directory");
        return;
    }

    fs::create_directories(path, ec);
    if (ec) fail("createDirectories", path, ec.message());
    LogRegistry::storage()->debug("[LocalFileSystem] Created directory {}", path.string());
}

Buffer LocalFileSystem::readFile(const fs::path& path) const {
    requireFile("readFile", path);

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) fail("readFile", path, "failed to open file");

    const std::streamsize size = in.tellg();
    if (size < 0) fail("readFile", path, "failed to determine file size");
    in.seekg(0, std::ios::beg);

    Buffer buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        fail("readFile", path, "short read");

    LogRegistry::storage()->debug("[LocalFileSystem] Read {} bytes from {}", buffer.size(), path.string());
    return buffer;
}

void LocalFileSystem::writeFile(const fs::path& path, const Buffer& data) {
    if (atomicWrites_) writeAtomic(path, data);
    else writeDirect(path, data);
    LogRegistry::storage()->debug("[LocalFileSystem] Wrote {} bytes to {}", data.size(), path.string());
}

FileStat LocalFileSystem::stat(const fs::path& path) const {
    requireFile("stat", path);

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) fail("stat", path, ec.message());
    return {size};
}

void LocalFileSystem::remove(const fs::path& path) {
    requireFile("remove", path);

    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) fail("remove", path, ec.message());
    if (!removed) notFound("remove", path);
    LogRegistry::storage()->debug("[LocalFileSystem] Removed {}", path.string());
}

void LocalFileSystem::writeDirect(const fs::path& path, const Buffer& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) fail("writeFile", path, "failed to open file for writing");
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) fail("writeFile", path, "write error");
}

void LocalFileSystem::writeAtomic(const fs::path& path, const Buffer& data) {
    const auto tmp = path.parent_path() / ("." + path.filename().string() + ".tmp-" + generate_random_suffix());

    try {
        writeDirect(tmp, data);
    } catch (const StorageError&) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw;
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        fail("writeFile", path, "rename from temporary file failed: " + ec.message());
    }
}

}
