/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag
 *
 * Checked between whole tiles, windows, strips or pipeline stages, never in
 * the middle of a computation. Cancelling does not undo partial writes.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <atomic>

namespace demforge {

class CancellationToken {
public:
    CancellationToken() = default;

    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace demforge
