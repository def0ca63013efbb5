#include "snapshot.hpp"
#include <algorithm>

namespace rsprog::core {

// Длинная цепочка shared_ptr рекурсивно разрушалась бы через ~Node,
// поэтому разматываем её в цикле, пока узлом владеем только мы.
RawHistory::~RawHistory() {
    auto node = std::move(head_);
    while (node && node.use_count() == 1) {
        auto previous = node->previous;
        node.reset();
        node = std::move(previous);
    }
}

auto RawHistory::append(std::string fragment) const -> RawHistory {
    RawHistory next;
    next.head_ = std::make_shared<const Node>(Node{std::move(fragment), head_});
    next.size_ = size_ + 1;
    return next;
}

auto RawHistory::to_vector() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(size_);
    for (auto node = head_.get(); node != nullptr; node = node->previous.get()) {
        out.push_back(node->fragment);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

auto Snapshot::completed_paths() const -> const Ledger& {
    static const Ledger empty{};
    return ledger ? *ledger : empty;
}

bool Snapshot::operator==(const Snapshot& other) const {
    return in_progress_stats == other.in_progress_stats
        && transferring_path == other.transferring_path
        && last_completed_path == other.last_completed_path
        && last_completed_path_stats == other.last_completed_path_stats
        && total_transferred == other.total_transferred
        && summary == other.summary
        && last_reading == other.last_reading
        && completed_paths() == other.completed_paths()
        && raw_output() == other.raw_output();
}

} // namespace rsprog::core
