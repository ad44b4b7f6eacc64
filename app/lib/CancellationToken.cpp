/*
 * Cancellation token implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CancellationToken.hpp"

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>())
{}

void CancellationToken::cancel() const
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const
{
    return state_->cancelled.load();
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled.load(); });
}
