// =============================================================================
// journal.cpp - Undo log and transaction scopes
// =============================================================================

#include "peg/journal.hpp"
#include <utility>

namespace peg {

void Journal::record(Action undo) {
    if (depth_ == 0) return;
    undo_log_.push_back(std::move(undo));
}

void Journal::defer(Action action) {
    if (depth_ == 0) {
        action();
        return;
    }
    deferred_.push_back(std::move(action));
}

void Journal::rollback_to(size_t undo_mark, size_t deferred_mark) noexcept {
    while (undo_log_.size() > undo_mark) {
        Action undo = std::move(undo_log_.back());
        undo_log_.pop_back();
        undo();
    }
    deferred_.resize(deferred_mark);
}

// =============================================================================
// Scope
// =============================================================================

Journal::Scope::Scope(Journal& journal)
    : journal_(journal),
      undo_mark_(journal.undo_log_.size()),
      deferred_mark_(journal.deferred_.size()) {
    ++journal_.depth_;
}

Journal::Scope::~Scope() {
    if (done_) return;
    journal_.rollback_to(undo_mark_, deferred_mark_);
    --journal_.depth_;
    if (journal_.depth_ == 0) ++journal_.rollbacks_;
}

void Journal::Scope::commit() {
    if (done_) return;
    done_ = true;
    --journal_.depth_;

    // Nested scopes fold into their parent
    if (journal_.depth_ > 0) return;

    journal_.undo_log_.clear();
    std::vector<Action> deferred = std::move(journal_.deferred_);
    journal_.deferred_.clear();
    ++journal_.commits_;

    for (auto& action : deferred) {
        action();
    }
}

} // namespace peg
