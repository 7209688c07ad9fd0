#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace sdbx::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> sisyphos() { return get("sisyphos"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> cloud()    { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> fs()       { return get("filesystem"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }
    static std::shared_ptr<spdlog::logger> shell()    { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

    // Flushes every logger, e.g. before the process exits.
    static void flush();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
