#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace flash_amm::core {

/**
 * @brief Undo log giving every top-level call all-or-nothing semantics
 *
 * Stores mutate state in place and record an inverse action here. A
 * TransactionScope marks the journal position on entry; if the scope is
 * left without commit() every inverse recorded since the mark runs in
 * reverse order. Committing a nested scope folds its entries into the
 * enclosing one, committing the outermost scope discards them.
 *
 * Mutations made while no scope is open are not recorded.
 *
 * WARNING: Not thread-safe. One journal per execution context.
 */
class Journal {
  public:
    using Undo = std::function<void()>;

    Journal() {
        entries_.reserve(256);
    }

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    void record(Undo undo) {
        if (depth_ > 0) {
            entries_.push_back(std::move(undo));
        }
    }

    [[nodiscard]] bool in_transaction() const noexcept {
        return depth_ > 0;
    }

    [[nodiscard]] std::size_t depth() const noexcept {
        return depth_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return entries_.size();
    }

  private:
    friend class TransactionScope;

    std::size_t begin() noexcept {
        ++depth_;
        return entries_.size();
    }

    void commit(std::size_t) noexcept {
        if (--depth_ == 0) {
            entries_.clear();
        }
    }

    void rollback(std::size_t mark) noexcept {
        while (entries_.size() > mark) {
            Undo undo = std::move(entries_.back());
            entries_.pop_back();
            try {
                undo();
            } catch (const std::exception& e) {
                // Inverse actions only restore values captured at record time
                spdlog::error("Journal rollback step failed: {}", e.what());
            }
        }
        --depth_;
    }

    std::vector<Undo> entries_;
    std::size_t depth_{0};
};

/**
 * @brief RAII rollback boundary over a Journal
 *
 * @code
 *   TransactionScope tx(journal);
 *   ledger.apply_delta(pool, d0, d1);   // journaled
 *   vault.transfer(...);                // may throw -> everything above undone
 *   tx.commit();
 * @endcode
 */
class TransactionScope {
  public:
    explicit TransactionScope(Journal& journal) noexcept : journal_(journal), mark_(journal.begin()) {}

    ~TransactionScope() {
        if (!committed_) {
            journal_.rollback(mark_);
        }
    }

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;
    TransactionScope(TransactionScope&&) = delete;
    TransactionScope& operator=(TransactionScope&&) = delete;

    void commit() noexcept {
        if (!committed_) {
            committed_ = true;
            journal_.commit(mark_);
        }
    }

  private:
    Journal& journal_;
    std::size_t mark_;
    bool committed_{false};
};

}  // namespace flash_amm::core
