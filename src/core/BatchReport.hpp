/**
 * @file BatchReport.hpp
 * @brief Per-item outcomes of batch operations
 *
 * A batch (tile inspection, manifest rows) keeps going when one item fails.
 * Structural failures that invalidate the whole batch are still thrown as
 * RasterError by the caller.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "RasterError.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace demforge {

struct ItemError {
    RasterErrorCode code;
    std::string message;
};

/**
 * @brief Success value or typed error for one item
 */
template <typename T>
class ItemResult {
public:
    static ItemResult ok(T value) {
        ItemResult result;
        result.value_ = std::move(value);
        return result;
    }

    static ItemResult failure(RasterErrorCode code, const std::string& message) {
        ItemResult result;
        result.error_ = ItemError{code, message};
        return result;
    }

    static ItemResult failure(const RasterError& error) {
        return failure(error.code(), error.what());
    }

    bool is_ok() const { return value_.has_value(); }
    const T& value() const { return *value_; }
    const ItemError& error() const { return *error_; }

private:
    ItemResult() = default;

    std::optional<T> value_;
    std::optional<ItemError> error_;
};

/**
 * @brief Ordered per-item results of one batch
 */
template <typename T>
class BatchReport {
public:
    struct Entry {
        std::string item_id;
        ItemResult<T> result;
    };

    void add(const std::string& item_id, ItemResult<T> result) {
        if (result.is_ok()) {
            ++success_count_;
        } else {
            ++failure_count_;
        }
        entries_.push_back(Entry{item_id, std::move(result)});
    }

    const std::vector<Entry>& entries() const { return entries_; }
    size_t success_count() const { return success_count_; }
    size_t failure_count() const { return failure_count_; }
    size_t size() const { return entries_.size(); }

    /**
     * @brief Successful values in input order
     */
    std::vector<T> successes() const {
        std::vector<T> values;
        values.reserve(success_count_);
        for (const auto& entry : entries_) {
            if (entry.result.is_ok()) {
                values.push_back(entry.result.value());
            }
        }
        return values;
    }

    /**
     * @brief "12 succeeded, 1 failed" followed by one line per failure
     */
    std::string summary() const {
        std::string text = std::to_string(success_count_) + " succeeded, " +
                           std::to_string(failure_count_) + " failed";
        for (const auto& entry : entries_) {
            if (!entry.result.is_ok()) {
                text += "\n  " + entry.item_id + ": " +
                        error_code_name(entry.result.error().code) + ": " +
                        entry.result.error().message;
            }
        }
        return text;
    }

private:
    std::vector<Entry> entries_;
    size_t success_count_ = 0;
    size_t failure_count_ = 0;
};

} // namespace demforge
