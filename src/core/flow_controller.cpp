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

#include "kcenon/stream/core/flow_controller.h"
#include "kcenon/stream/integration/logger_integration.h"

#include <algorithm>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::stream::core
{
    struct flow_controller::shared_state
    {
        struct entry
        {
            uint64_t sequence;
            std::size_t bytes;
            bool drained;
            std::error_code ec;
            flow_signal consumed;
        };

        explicit shared_state(std::size_t cap) : max_in_flight(std::max<std::size_t>(cap, 1)) {}

        mutable std::mutex mutex;
        std::deque<entry> pending;
        std::size_t max_in_flight;
        std::size_t bytes_in_flight{0};
        std::size_t max_observed{0};
        uint64_t next_sequence{0};
        uint64_t drained_count{0};
        bool abandoned{false};
        std::error_code abandon_ec;
    };

    flow_controller::flow_controller(std::size_t max_in_flight)
        : state_(std::make_shared<shared_state>(max_in_flight))
    {
    }

    flow_controller::~flow_controller() = default;

    auto flow_controller::on_chunk_written(flow_signal drained, std::size_t bytes) -> VoidResult
    {
        uint64_t sequence = 0;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);

            if (state_->abandoned)
            {
                return error_void(error_codes::stream_system::cancelled,
                                  "Flow controller was abandoned",
                                  "flow_controller",
                                  state_->abandon_ec.message());
            }

            if (state_->pending.size() >= state_->max_in_flight)
            {
                return error_void(error_codes::stream_system::protocol_violation,
                                  "In-flight limit reached",
                                  "flow_controller",
                                  "limit=" + std::to_string(state_->max_in_flight));
            }

            sequence = state_->next_sequence++;
            state_->pending.push_back({sequence, bytes, false, {}, flow_signal{}});
            state_->bytes_in_flight += bytes;
            state_->max_observed = std::max(state_->max_observed, state_->pending.size());
        }

        std::weak_ptr<shared_state> weak = state_;
        drained.on_fulfilled([weak, sequence](std::error_code ec) {
            if (auto state = weak.lock())
            {
                mark_drained(state, sequence, ec);
            }
        });

        return ok();
    }

    auto flow_controller::await_consumed() -> flow_signal
    {
        std::lock_guard<std::mutex> lock(state_->mutex);

        if (state_->abandoned)
        {
            return flow_signal::fulfilled(state_->abandon_ec);
        }

        if (state_->pending.empty())
        {
            return flow_signal::fulfilled();
        }

        return state_->pending.back().consumed;
    }

    auto flow_controller::abandon(std::error_code ec) -> void
    {
        std::vector<flow_signal> to_fail;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->abandoned)
            {
                return;
            }
            state_->abandoned = true;
            state_->abandon_ec = ec;

            for (auto& item : state_->pending)
            {
                to_fail.push_back(item.consumed);
            }
            state_->pending.clear();
            state_->bytes_in_flight = 0;
        }

        for (auto& signal : to_fail)
        {
            signal.fulfill(ec);
        }
    }

    auto flow_controller::mark_drained(const std::shared_ptr<shared_state>& state,
                                       uint64_t sequence,
                                       std::error_code ec) -> void
    {
        std::vector<std::pair<flow_signal, std::error_code>> ready;
        {
            std::lock_guard<std::mutex> lock(state->mutex);

            auto it = std::find_if(state->pending.begin(), state->pending.end(),
                                   [sequence](const shared_state::entry& item) {
                                       return item.sequence == sequence;
                                   });
            if (it == state->pending.end())
            {
                // Abandoned in the meantime.
                return;
            }
            it->drained = true;
            it->ec = ec;

            while (!state->pending.empty() && state->pending.front().drained)
            {
                auto& front = state->pending.front();
                ready.emplace_back(front.consumed, front.ec);
                state->bytes_in_flight -= front.bytes;
                ++state->drained_count;
                state->pending.pop_front();
            }
        }

        if (ec)
        {
            STREAM_LOG_DEBUG("[flow_controller] Write " + std::to_string(sequence) +
                             " failed to drain: " + ec.message());
        }

        for (auto& [signal, result] : ready)
        {
            signal.fulfill(result);
        }
    }

    auto flow_controller::is_abandoned() const -> bool
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->abandoned;
    }

    auto flow_controller::in_flight() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->pending.size();
    }

    auto flow_controller::bytes_in_flight() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->bytes_in_flight;
    }

    auto flow_controller::max_observed_in_flight() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->max_observed;
    }

    auto flow_controller::total_written() const -> uint64_t
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->next_sequence;
    }

    auto flow_controller::total_drained() const -> uint64_t
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->drained_count;
    }

    auto flow_controller::max_in_flight() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->max_in_flight;
    }

} // namespace kcenon::stream::core
