#include "action_history.hpp"

#include <format>

const char* to_string(ActionOutcome outcome) {
    switch (outcome) {
        case ActionOutcome::Executed: return "executed";
        case ActionOutcome::Failed: return "failed";
        case ActionOutcome::Skipped: return "skipped";
    }
    return "unknown";
}

std::string ActionRecord::describe() const {
    std::string line = std::format("{}: {}", to_string(kind), target.empty() ? "unknown" : target);
    if (at) line += std::format(" at ({}, {})", at->x, at->y);
    line += std::format(" -> {}", to_string(outcome));
    if (!detail.empty()) line += ": " + detail.substr(0, 50);
    return line;
}

void ActionHistory::push(ActionRecord record) {
    if (capacity_ == 0) return;
    while (records_.size() >= capacity_) {
        records_.pop_front();
    }
    records_.push_back(std::move(record));
}

std::string ActionHistory::trace(size_t n) const {
    std::string out;
    size_t start = records_.size() > n ? records_.size() - n : 0;
    for (size_t i = start; i < records_.size(); i++) {
        if (!out.empty()) out += '\n';
        out += "- " + records_[i].describe();
    }
    return out;
}

int ActionHistory::trailing_repeats(const ActionRecord& record) const {
    int count = 0;
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (!it->same_action(record)) break;
        count++;
    }
    return count;
}
