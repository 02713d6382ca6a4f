#ifndef PEG_JOURNAL_HPP
#define PEG_JOURNAL_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace peg {

// =============================================================================
// Journal - Append-only undo log giving each operation an atomic boundary
// =============================================================================
//
// Mutations made while a Scope is open record an undo entry. When the outermost
// scope commits, the log is cleared and deferred actions run in order. When any
// scope is destroyed without commit, every entry recorded since it opened is
// undone in reverse order and its deferred actions are dropped.
//
// Mutations made with no open scope are final and record nothing.

class Journal {
public:
    using Action = std::function<void()>;

    Journal() = default;
    ~Journal() = default;

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    // Record how to undo a mutation that has already been applied
    void record(Action undo);

    // Run `action` once the outermost scope commits (dropped on rollback)
    void defer(Action action);

    bool active() const noexcept { return depth_ > 0; }
    size_t depth() const noexcept { return depth_; }
    size_t pending() const noexcept { return undo_log_.size(); }

    uint64_t commits() const noexcept { return commits_; }
    uint64_t rollbacks() const noexcept { return rollbacks_; }

    class Scope {
    public:
        explicit Scope(Journal& journal);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        void commit();

    private:
        Journal& journal_;
        size_t undo_mark_;
        size_t deferred_mark_;
        bool done_ = false;
    };

private:
    void rollback_to(size_t undo_mark, size_t deferred_mark) noexcept;

    std::vector<Action> undo_log_;
    std::vector<Action> deferred_;
    size_t depth_ = 0;
    uint64_t commits_ = 0;
    uint64_t rollbacks_ = 0;
};

} // namespace peg

#endif // PEG_JOURNAL_HPP
