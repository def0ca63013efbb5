#pragma once

#include <filesystem>
#include <optional>
#include "../core/session/snapshot.hpp"
#include "../infra/error_handler/error.hpp"

namespace rsprog::extensions {

/// Итог сессии в YAML: корень, сумма байт, код выхода rsync,
/// все завершённые пути, summary и сырая история (если собиралась).
[[nodiscard]] auto save_report(const std::filesystem::path& source_root,
                               const core::Snapshot& snapshot,
                               std::optional<int> exit_code,
                               const std::filesystem::path& report_file)
    -> infra::VoidResult;

} // namespace rsprog::extensions
