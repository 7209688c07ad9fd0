#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>

namespace sdbx::log {

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "sisyphosdbx.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto cnf = config::ConfigRegistry::get().logging;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("sisyphos",   sub_levels.sisyphos);
    makeLogger("sync",       sub_levels.sync);
    makeLogger("cloud",      sub_levels.cloud);
    makeLogger("filesystem", sub_levels.filesystem);
    makeLogger("config",     sub_levels.config);
    makeLogger("shell",      sub_levels.shell);

    initialized_ = true;
    spdlog::get("sisyphos")->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::flush() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
}

}
