#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rsprog::adapters::stream {

/// Режет кусок вывода на фрагменты, каждый заканчивается ровно одним \r или \n.
/// Незавершённый остаток копится в carry до следующего куска.
[[nodiscard]] auto split_fragments(std::string_view chunk, std::string& carry)
    -> std::vector<std::string>;

/// Читает поток (pipe от rsync --progress) посимвольно и отдаёт фрагменты
/// сразу по получении \r или \n.
class FragmentReader {
public:
    explicit FragmentReader(std::istream& in);

    // std::nullopt - поток закончился, см. exit_code()
    [[nodiscard]] auto next() -> std::optional<std::string>;

    // 0 после чистого EOF, 1 при ошибке чтения
    [[nodiscard]] auto exit_code() const -> std::optional<int> { return exit_code_; }
    [[nodiscard]] auto bytes_read() const -> std::uint64_t { return bytes_read_; }

private:
    std::istream& in_;
    std::string buffer_;
    std::optional<int> exit_code_;
    std::uint64_t bytes_read_ = 0;
};

} // namespace rsprog::adapters::stream
