#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>
#include "../error_handler/error.hpp"

namespace rsprog::args_parser{
    struct CLIArgs;
}

namespace rsprog::infra {

struct Config {
    // Сессия
    bool include_raw_output = false;
    std::optional<std::size_t> cache_capacity;

    // Вывод
    bool progress = true;
    bool quiet = false;
    bool print_snapshots = false;
    std::optional<std::string> log_level;
    std::optional<std::filesystem::path> report_path;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.rsprog.yaml
///   2. ~/.config/rsprog/config.yaml (Linux/macOS)
///   3. %APPDATA%/rsprog/config.yaml (Windows)
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Читает конкретный файл. Отсутствие файла - ошибка.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Имя уровня логирования -> spdlog. Неизвестное имя - ConfigError,
/// а не молчаливое "off", как у spdlog::level::from_str.
[[nodiscard]] auto parse_log_level(std::string_view name) -> Result<spdlog::level::level_enum>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const rsprog::args_parser::CLIArgs& args) -> Config;

} // namespace rsprog::infra
