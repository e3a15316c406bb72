/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024, kcenon
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#include "kcenon/stream/core/flow_signal.h"

namespace kcenon::stream::core
{
    flow_signal::flow_signal() : state_(std::make_shared<state>()) {}

    auto flow_signal::fulfilled(std::error_code ec) -> flow_signal
    {
        flow_signal signal;
        signal.fulfill(ec);
        return signal;
    }

    auto flow_signal::fulfill(std::error_code ec) const -> bool
    {
        continuation_t waiter;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->fulfilled)
            {
                return false;
            }
            state_->fulfilled = true;
            state_->ec = ec;
            waiter = std::move(state_->waiter);
        }

        // Run the waiter outside the lock; it may fulfill other signals.
        if (waiter)
        {
            waiter(ec);
        }
        return true;
    }

    auto flow_signal::is_fulfilled() const -> bool
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->fulfilled;
    }

    auto flow_signal::error() const -> std::error_code
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->ec;
    }

    auto flow_signal::on_fulfilled(continuation_t cont) const -> bool
    {
        std::error_code ec;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->waited)
            {
                return false;
            }
            state_->waited = true;

            if (!state_->fulfilled)
            {
                state_->waiter = std::move(cont);
                return true;
            }
            ec = state_->ec;
        }

        if (cont)
        {
            cont(ec);
        }
        return true;
    }

} // namespace kcenon::stream::core
