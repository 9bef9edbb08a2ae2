#pragma once

#include "action.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

enum class ActionOutcome { Executed, Failed, Skipped };

const char* to_string(ActionOutcome outcome);

struct ActionRecord {
    ActionKind kind = ActionKind::Wait;
    std::string target;
    std::optional<coords::Point> at;   // resolved pixels, after clamping
    ActionOutcome outcome = ActionOutcome::Executed;
    std::string detail;                // failure or skip reason
    bool clamped = false;

    // "CLICK: OK button at (960, 540) -> executed"
    std::string describe() const;

    // Same action aimed at the same element.
    bool same_action(const ActionRecord& other) const {
        return kind == other.kind && target == other.target;
    }
};

// Most recent actions of the current task, oldest first. Never exceeds capacity.
class ActionHistory {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10;

    explicit ActionHistory(size_t capacity = DEFAULT_CAPACITY) : capacity_(capacity) {}

    void push(ActionRecord record);
    void clear() { records_.clear(); }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    size_t capacity() const { return capacity_; }

    const ActionRecord* last() const { return records_.empty() ? nullptr : &records_.back(); }
    const std::deque<ActionRecord>& records() const { return records_; }

    // Last n records, one "- ..." line each.
    std::string trace(size_t n) const;

    // Length of the trailing run of records matching `record`.
    int trailing_repeats(const ActionRecord& record) const;

private:
    size_t capacity_;
    std::deque<ActionRecord> records_;
};
