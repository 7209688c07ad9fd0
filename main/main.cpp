// Sync
#include "sync/SyncController.hpp"
#include "sync/Monitor.hpp"

// Cloud
#include "cloud/DropboxClient.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "config/ConfigStore.hpp"
#include "log/Registry.hpp"
#include "shell/Prompt.hpp"

// Libraries
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <fmt/core.h>

using namespace sdbx::config;
using namespace sdbx::cloud;
using namespace sdbx::sync;
using namespace sdbx::shell;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

constexpr auto USAGE = R"(Usage: sisyphosdbx [command] [args]

Commands:
  run                 Start syncing and keep running until interrupted (default)
  status              Show account, Dropbox folder and sync state
  exclude <path>      Exclude a Dropbox folder from sync and delete its local copy
  include <path>      Include an excluded Dropbox folder and download it
  select-folders      Choose interactively which top-level folders to exclude
  set-dir [path]      Move the local Dropbox folder, asks for the location if omitted
  get-dir             Print the local Dropbox folder
  unlink              Unlink the Dropbox account, local files are kept
  help                Show this message
)";

std::string formatLastSync(const std::optional<double>& ts) {
    if (!ts) return "never";
    const auto t = static_cast<std::time_t>(*ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

int runForever(SyncController& controller) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (controller.refreshAccountInfo()) std::cout << controller << std::endl;
    sdbx::log::Registry::sisyphos()->info("[*] Syncing {}", controller.getDropboxDirectory().string());

    while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

    sdbx::log::Registry::sisyphos()->info("[!] Signal received. Shutting down gracefully...");
    controller.pauseSync();
    return EXIT_SUCCESS;
}

int printStatus(SyncController& controller, const ConfigStore& store) {
    (void)controller.refreshAccountInfo();

    std::cout << controller << '\n'
              << fmt::format("  Dropbox folder:   {}\n", controller.getDropboxDirectory().string())
              << fmt::format("  Last sync:        {}\n", formatLastSync(store.getTimestamp("internal", "lastsync")));

    const auto excluded = store.getStringList("main", "excluded_folders");
    std::cout << "  Excluded folders: " << (excluded.empty() ? "none" : "") << '\n';
    for (const auto& f : excluded) std::cout << "    " << f << '\n';

    return EXIT_SUCCESS;
}

int runCommand(const std::string& command, const std::vector<std::string>& args) {
    const auto& cfg = ConfigRegistry::get();

    const auto store = std::make_shared<YamlConfigStore>(cfg.sync.state_file);
    const auto client = std::make_shared<DropboxClient>(store, cfg.dropbox);
    const auto monitor = std::make_shared<Monitor>(client, store, cfg.monitor);
    const auto prompt = std::make_shared<Prompt>(std::cin, std::cout);

    SyncController controller(store, client, monitor, prompt, command == "run");

    if (command == "run") return runForever(controller);
    if (command == "status") return printStatus(controller, *store);

    if (command == "exclude") {
        if (args.empty()) throw std::invalid_argument("exclude requires a Dropbox path");
        controller.excludeFolder(args.front());
        return EXIT_SUCCESS;
    }

    if (command == "include") {
        if (args.empty()) throw std::invalid_argument("include requires a Dropbox path");
        return controller.includeFolder(args.front()) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (command == "select-folders") return controller.selectExcludedFolders() ? EXIT_SUCCESS : EXIT_FAILURE;

    if (command == "set-dir") {
        std::optional<std::filesystem::path> target;
        if (!args.empty()) target = args.front();
        controller.setDropboxDirectory(target);
        std::cout << controller.getDropboxDirectory().string() << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "get-dir") {
        std::cout << controller.getDropboxDirectory().string() << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "unlink") {
        controller.unlink();
        std::cout << "Dropbox account unlinked." << std::endl;
        return EXIT_SUCCESS;
    }

    return EXIT_FAILURE;
}

bool isKnownCommand(const std::string& command) {
    static const std::vector<std::string> commands{
        "run", "status", "exclude", "include", "select-folders", "set-dir", "get-dir", "unlink"
    };
    return std::ranges::find(commands, command) != commands.end();
}
}

int main(const int argc, char** argv) {
    const std::vector<std::string> argvec(argv + 1, argv + argc);
    const std::string command = argvec.empty() ? "run" : argvec.front();
    const std::vector<std::string> args = argvec.empty() ? std::vector<std::string>{}
                                                         : std::vector(argvec.begin() + 1, argvec.end());

    if (command == "help" || command == "--help" || command == "-h") {
        std::cout << USAGE;
        return EXIT_SUCCESS;
    }

    if (!isKnownCommand(command)) {
        std::cerr << "Unknown command: " << command << "\n\n" << USAGE;
        return EXIT_FAILURE;
    }

    try {
        ConfigRegistry::init();
        sdbx::log::Registry::init(sdbx::paths::getLogPath());

        sdbx::log::Registry::sisyphos()->debug("[*] Running command '{}' with settings from {}", command,
                                               ConfigRegistry::source().string());
        const auto rc = runCommand(command, args);
        sdbx::log::Registry::flush();
        return rc;
    } catch (const QuitRequested&) {
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (sdbx::log::Registry::isInitialized()) {
            sdbx::log::Registry::sisyphos()->error("[-] {} failed: {}", command, e.what());
            sdbx::log::Registry::flush();
        } else {
            std::cerr << "sisyphosdbx: " << e.what() << std::endl;
        }
        return EXIT_FAILURE;
    }
}
