#pragma once

#include "editor/core/logging.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace editor {

// Bounded snapshot history with cursor-based undo/redo and a re-entrant
// batch mode. Every entry is a full value of T; stored entries are never
// mutated. While a batch is open, commits only update the live value and
// the whole batch collapses into one entry when the outermost endBatch runs.
template <typename T, typename Equal = std::equal_to<T>>
class HistoryManager {
public:
    static constexpr std::size_t kDefaultMaxEntries = 50;

    explicit HistoryManager(T initial, std::size_t maxEntries = kDefaultMaxEntries, Equal equal = Equal())
        : maxEntries_(maxEntries > 0 ? maxEntries : 1), equal_(std::move(equal)) {
        snapshots_.push_back(std::move(initial));
    }

    // Public API
    bool canUndo() const noexcept { return cursor_ > 0; }
    bool canRedo() const noexcept { return cursor_ + 1 < snapshots_.size(); }

    // Snapshot under the cursor; the last committed value.
    const T& current() const noexcept { return snapshots_[cursor_]; }

    // In-progress value while batching, otherwise the current snapshot.
    const T& live() const noexcept { return batchDepth_ > 0 && live_ ? *live_ : current(); }

    bool isBatching() const noexcept { return batchDepth_ > 0; }
    std::size_t getBatchDepth() const noexcept { return batchDepth_; }
    std::size_t getHistorySize() const noexcept { return snapshots_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::size_t getMaxEntries() const noexcept { return maxEntries_; }
    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }
    const T& at(std::size_t index) const { return snapshots_.at(index); }

    // Records `value` as a new entry. Returns true when an entry was pushed.
    bool commit(const T& value) {
        if (batchDepth_ > 0) {
            live_ = value;
            return false;
        }
        return pushEntry(value);
    }

    void startBatch() {
        if (batchDepth_ == 0) {
            batchBaseline_ = current();
            live_ = current();
        }
        batchDepth_++;
    }

    // Closes one level of batching. When the outermost level closes, a single
    // entry is pushed unless `finalValue` equals the baseline captured by the
    // matching startBatch.
    bool endBatch(const T& finalValue) {
        if (batchDepth_ == 0) return false;
        live_ = finalValue;
        if (--batchDepth_ > 0) return false;

        const bool unchanged = batchBaseline_ && equal_(finalValue, *batchBaseline_);
        clearBatch();
        if (unchanged) {
            EDITOR_LOG_DEBUG("history: batch closed without changes");
            return false;
        }
        return pushEntry(finalValue);
    }

    bool endBatch() {
        if (batchDepth_ == 0) return false;
        const T finalValue = live_ ? *live_ : current();
        return endBatch(finalValue);
    }

    // Drops an open batch without recording anything.
    void cancelBatch() {
        if (batchDepth_ == 0) return;
        EDITOR_LOG_DEBUG("history: batch cancelled at depth %zu", batchDepth_);
        clearBatch();
    }

    std::optional<T> undo() {
        cancelBatch();
        if (!canUndo()) return std::nullopt;
        cursor_--;
        historyGeneration_++;
        return snapshots_[cursor_];
    }

    std::optional<T> redo() {
        cancelBatch();
        if (!canRedo()) return std::nullopt;
        cursor_++;
        historyGeneration_++;
        return snapshots_[cursor_];
    }

    // Replaces the whole history with `value`. An open batch stays open and
    // is re-based on `value` so the gesture in progress still closes cleanly.
    void reset(const T& value) {
        snapshots_.clear();
        snapshots_.push_back(value);
        cursor_ = 0;
        if (batchDepth_ > 0) {
            batchBaseline_ = value;
            live_ = value;
        }
        historyGeneration_++;
    }

private:
    bool pushEntry(const T& value) {
        if (equal_(value, snapshots_[cursor_])) return false;

        if (cursor_ + 1 < snapshots_.size()) {
            snapshots_.erase(snapshots_.begin() + static_cast<std::ptrdiff_t>(cursor_ + 1), snapshots_.end());
        }
        snapshots_.push_back(value);
        cursor_ = snapshots_.size() - 1;

        while (snapshots_.size() > maxEntries_) {
            snapshots_.erase(snapshots_.begin());
            cursor_--;
        }
        historyGeneration_++;
        EDITOR_LOG_DEBUG("history: pushed entry %zu/%zu", cursor_ + 1, snapshots_.size());
        return true;
    }

    void clearBatch() {
        batchDepth_ = 0;
        batchBaseline_.reset();
        live_.reset();
    }

    std::vector<T> snapshots_;
    std::size_t cursor_ = 0;
    std::size_t maxEntries_;
    std::size_t batchDepth_ = 0;
    std::optional<T> batchBaseline_;
    std::optional<T> live_;
    std::uint32_t historyGeneration_ = 0;
    Equal equal_;
};

} // namespace editor
