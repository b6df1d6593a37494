// Config
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Datasources
#include "credentials/Credentials.hpp"
#include "datasource/FileDatasource.hpp"
#include "datasource/errors.hpp"
#include "storage/LocalFileSystem.hpp"

// Misc
#include "util/cmdLineHelpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using namespace lb::config;
using namespace lb::credentials;
using namespace lb::datasource;
using namespace lb::logging;
using namespace lb::storage;
using namespace lb::types;

namespace {

constexpr auto DEFAULT_CONFIG_PATH = "/etc/lockbox/config.yaml";

constexpr int EXIT_USAGE = 2;

void printUsage() {
    fmt::print(stderr,
        "usage: lockbox [-c <config.yaml>] <vault-file> <command> [args...]\n"
        "       lockbox [-c <config.yaml>] config\n"
        "\n"
        "commands:\n"
        "  init                                          create an empty vault\n"
        "  show                                          print the vault history\n"
        "  append <entry>                                append a history entry\n"
        "  attach put <vaultID> <attachmentID> <file> [--raw]\n"
        "  attach get <vaultID> <attachmentID> <file> [--raw]\n"
        "  attach info <vaultID> <attachmentID>\n"
        "  attach rm <vaultID> <attachmentID>\n"
        "\n"
        "The master password is read from LB_PASSWORD. --raw skips attachment encryption.\n");
}

void initRuntime(const std::optional<fs::path>& configPath) {
    if (configPath) ConfigRegistry::init(*configPath);
    else if (fs::exists(DEFAULT_CONFIG_PATH)) ConfigRegistry::init(fs::path(DEFAULT_CONFIG_PATH));
    else {
        Config cfg;
        cfg.logging.log_dir = fs::temp_directory_path() / "lockbox";
        ConfigRegistry::init(cfg);
    }
    LogRegistry::init(ConfigRegistry::get().logging.log_dir);
}

std::string requirePassword() {
    const char* pw = std::getenv("LB_PASSWORD");
    if (!pw || !*pw) throw std::invalid_argument("LB_PASSWORD is not set");
    return pw;
}

int runAttach(FileDatasource& ds, const Credentials& creds, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        printUsage();
        return EXIT_USAGE;
    }

    const auto& sub = args[0];
    const auto& vaultID = args[1];
    const auto& attachmentID = args[2];
    const bool raw = args.size() > 4 && args[4] == "--raw";
    const auto maybeCreds = raw ? std::nullopt : std::optional(creds);

    if (sub == "put" && args.size() >= 4) {
        const auto data = LocalFileSystem(false).readFile(args[3]);
        ds.putAttachment(vaultID, attachmentID, data, maybeCreds);
        LogRegistry::lockbox()->info("[*] Stored attachment {} ({})", attachmentID, lb::util::human_bytes(data.size()));
        return EXIT_SUCCESS;
    }

    if (sub == "get" && args.size() >= 4) {
        const auto data = ds.getAttachment(vaultID, attachmentID, maybeCreds);
        LocalFileSystem(false).writeFile(args[3], data);
        LogRegistry::lockbox()->info("[*] Wrote attachment {} to {}", attachmentID, args[3]);
        return EXIT_SUCCESS;
    }

    if (sub == "info") {
        const auto details = ds.getAttachmentDetails(vaultID, attachmentID);
        fmt::print("{}\n", nlohmann::json(details).dump(2));
        fmt::print("size on disk: {}\n", lb::util::human_bytes(details.size));
        return EXIT_SUCCESS;
    }

    if (sub == "rm") {
        ds.removeAttachment(vaultID, attachmentID);
        return EXIT_SUCCESS;
    }

    printUsage();
    return EXIT_USAGE;
}

int run(const fs::path& vaultPath, const std::string& command, const std::vector<std::string>& args) {
    const auto creds = Credentials::fromDatasource({FileDatasource::TYPE, vaultPath, std::nullopt}, requirePassword());
    FileDatasource ds(creds);

    if (command == "init") {
        if (fs::exists(vaultPath)) throw std::invalid_argument("Vault already exists: " + vaultPath.string());
        ds.save({}, creds);
        LogRegistry::lockbox()->info("[*] Created vault {}", vaultPath.string());
        return EXIT_SUCCESS;
    }

    if (command == "show") {
        for (const auto& entry : ds.load(creds)) fmt::print("{}\n", entry);
        return EXIT_SUCCESS;
    }

    if (command == "append" && args.size() == 1) {
        auto history = ds.load(creds);
        history.push_back(args[0]);
        ds.save(history, creds);
        return EXIT_SUCCESS;
    }

    if (command == "attach") return runAttach(ds, creds, args);

    printUsage();
    return EXIT_USAGE;
}

}

int main(const int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::optional<fs::path> configPath;
    if (args.size() >= 2 && args[0] == "-c") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    try {
        initRuntime(configPath);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to initialize lockbox: {}\n", e.what());
        return EXIT_FAILURE;
    }

    try {
        if (args[0] == "config") {
            fmt::print("{}\n", nlohmann::json(ConfigRegistry::get()).dump(2));
            return EXIT_SUCCESS;
        }

        if (args.size() < 2) {
            printUsage();
            return EXIT_USAGE;
        }

        return run(args[0], args[1], std::vector<std::string>(args.begin() + 2, args.end()));
    } catch (const DatasourceError& e) {
        LogRegistry::lockbox()->error("[!] {}: {}", to_string(e.kind()), e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        LogRegistry::lockbox()->error("[!] {}", e.what());
        return EXIT_FAILURE;
    }
}
