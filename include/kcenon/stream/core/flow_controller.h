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

#pragma once

#include "kcenon/stream/core/flow_signal.h"
#include "kcenon/stream/types/result.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <system_error>

namespace kcenon::stream::core
{
    /*!
     * \class flow_controller
     * \brief Tracks how much written data the transport has drained
     *
     * Every write handed to the transport is registered together with the
     * transport's own drain signal. The controller turns those signals into
     * consumer-facing signals with two guarantees:
     * - exactly one consumer signal per registered write;
     * - consumer signals are fulfilled in write order (FIFO), so the signal
     *   for write i is never fulfilled before the one for write i-1, even if
     *   the transport reports completions out of order.
     *
     * The number of registered but not yet drained writes is capped
     * (max_in_flight, 1 for a stream_writer). Exceeding the cap is reported
     * as a protocol violation instead of queuing.
     *
     * A transport signal that fires after the controller was destroyed or
     * abandoned is ignored.
     *
     * ### Thread Safety
     * All public methods are thread-safe. Consumer signals are fulfilled
     * outside the internal lock.
     */
    class flow_controller
    {
    public:
        /*!
         * \brief Construct a flow controller
         * \param max_in_flight Maximum number of undrained writes
         */
        explicit flow_controller(std::size_t max_in_flight = 1);

        ~flow_controller();

        flow_controller(const flow_controller&) = delete;
        auto operator=(const flow_controller&) -> flow_controller& = delete;

        /*!
         * \brief Register a write handed to the transport
         * \param drained Transport signal fulfilled when the data left the
         *                local send buffer
         * \param bytes Payload size, for accounting
         * \return Error (protocol_violation) when the in-flight cap is reached
         */
        auto on_chunk_written(flow_signal drained, std::size_t bytes) -> VoidResult;

        /*!
         * \brief Signal for the most recent write
         *
         * Fulfilled once that write and every earlier one has drained. With
         * nothing in flight the returned signal is already fulfilled. After
         * abandon() the signal is fulfilled with the abandon error.
         */
        [[nodiscard]] auto await_consumed() -> flow_signal;

        /*!
         * \brief Fail every pending consumer signal with \p ec
         *
         * Sticky: later registrations are refused and later waits complete
         * immediately with \p ec.
         */
        auto abandon(std::error_code ec) -> void;

        [[nodiscard]] auto is_abandoned() const -> bool;

        //! Registered writes not yet drained
        [[nodiscard]] auto in_flight() const -> std::size_t;

        //! Bytes of registered writes not yet drained
        [[nodiscard]] auto bytes_in_flight() const -> std::size_t;

        //! Highest in_flight() value ever observed
        [[nodiscard]] auto max_observed_in_flight() const -> std::size_t;

        [[nodiscard]] auto total_written() const -> uint64_t;
        [[nodiscard]] auto total_drained() const -> uint64_t;
        [[nodiscard]] auto max_in_flight() const -> std::size_t;

    private:
        struct shared_state;

        static auto mark_drained(const std::shared_ptr<shared_state>& state,
                                 uint64_t sequence,
                                 std::error_code ec) -> void;

        std::shared_ptr<shared_state> state_;
    };

} // namespace kcenon::stream::core
