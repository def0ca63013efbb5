#include "stream.hpp"
#include <spdlog/spdlog.h>

namespace rsprog::adapters::stream {

auto split_fragments(std::string_view chunk, std::string& carry)
    -> std::vector<std::string>
{
    std::vector<std::string> fragments;
    for (const char c : chunk) {
        carry.push_back(c);
        if (c == '\r' || c == '\n') {
            fragments.push_back(std::move(carry));
            carry.clear();
        }
    }
    return fragments;
}

FragmentReader::FragmentReader(std::istream& in)
    : in_(in) {}

auto FragmentReader::next() -> std::optional<std::string> {
    if (exit_code_) {
        return std::nullopt;
    }

    char c = 0;
    while (in_.get(c)) {
        ++bytes_read_;
        buffer_.push_back(c);
        if (c == '\r' || c == '\n') {
            std::string fragment = std::move(buffer_);
            buffer_.clear();
            return fragment;
        }
    }

    if (!buffer_.empty()) {
        spdlog::warn("Discarding {} trailing bytes without a line ending", buffer_.size());
        buffer_.clear();
    }

    exit_code_ = in_.bad() ? 1 : 0;
    return std::nullopt;
}

} // namespace rsprog::adapters::stream
