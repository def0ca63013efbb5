#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>


#ifdef _WIN32
    #include <shlobj.h>
    #include <knownfolders.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace rsprog::infra {
    void Config::merge_with(const Config& other) {
        if (other.include_raw_output) include_raw_output = true;
        if (other.cache_capacity) cache_capacity = other.cache_capacity;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.print_snapshots) print_snapshots = true;
        if (other.log_level) log_level = other.log_level;
        if (other.report_path) report_path = other.report_path;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".rsprog.yaml");

        // 2. Глобальный файл
    #ifdef _WIN32
        PWSTR appdata_path = nullptr;
        if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr, &appdata_path))) {
            paths.push_back(std::filesystem::path(appdata_path) / "rsprog" / "config.yaml");
            CoTaskMemFree(appdata_path);
        }
    #else
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "rsprog" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (!home) {
                if (const passwd* pw = getpwuid(getuid())) home = pw->pw_dir;
            }
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "rsprog" / "config.yaml");
            }
        }
    #endif

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["raw_output"]) cfg.include_raw_output = config["raw_output"].as<bool>();
            if (config["cache_capacity"]) {
                const auto capacity = config["cache_capacity"].as<std::size_t>();
                if (capacity == 0) {
                    return std::unexpected(fmt::format("{}: cache_capacity must be positive", path.string()));
                }
                cfg.cache_capacity = capacity;
            }

            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["print_snapshots"]) cfg.print_snapshots = config["print_snapshots"].as<bool>();
            if (config["log_level"]) {
                auto level = config["log_level"].as<std::string>();
                if (auto parsed = parse_log_level(level); !parsed) {
                    return std::unexpected(fmt::format("{}: {}", path.string(), parsed.error().message));
                }
                cfg.log_level = std::move(level);
            }
            if (config["report"]) cfg.report_path = config["report"].as<std::string>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден - пустой конфиг, не ошибка
        return Config{};
    }

    auto parse_log_level(std::string_view name) -> Result<spdlog::level::level_enum> {
        const std::string level_name(name);
        const auto level = spdlog::level::from_str(level_name);
        if (level == spdlog::level::off && level_name != "off") {
            return std::unexpected(make_error(ErrorCode::ConfigError,
                fmt::format("Unknown log level '{}'", level_name)));
        }
        return level;
    }

    [[nodiscard]]
    auto config_from_cli(const __CLI& args) -> Config {
        Config cfg{};
        cfg.include_raw_output = args.raw_output;
        cfg.cache_capacity = args.cache_capacity;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        cfg.print_snapshots = args.print_snapshots;
        cfg.log_level = args.log_level;
        if (args.report) cfg.report_path = *args.report;
        return cfg;
    }

} // namespace rsprog::infra
