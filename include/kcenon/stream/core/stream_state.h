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

#include <cstdint>
#include <string_view>

namespace kcenon::stream::core
{
    /*!
     * \enum stream_state
     * \brief Lifecycle of a stream_writer
     *
     * \code
     *   idle ──write headers──► awaiting_consumption ◄──write chunk──┐
     *                                 │ signal fulfilled              │
     *                                 ▼                               │
     *                             producing ──────────────────────────┘
     *                                 │ end-of-stream      │ error / cancel
     *                                 ▼                    ▼
     *                               closed               failed
     * \endcode
     *
     * closed and failed are terminal. Cancellation moves any state to failed.
     */
    enum class stream_state : uint8_t
    {
        idle = 0,
        awaiting_consumption = 1,
        producing = 2,
        closed = 3,
        failed = 4
    };

    /*!
     * \enum termination_reason
     * \brief Why a stream reached a terminal state
     */
    enum class termination_reason : uint8_t
    {
        none = 0,               //!< Stream has not terminated
        source_exhausted = 1,   //!< Normal end of stream (closed)
        source_error = 2,       //!< chunk_source failed to produce a chunk
        transport_error = 3,    //!< Write, drain or close failed
        cancelled = 4,          //!< Peer disconnected or caller cancelled
        protocol_violation = 5  //!< Session or flow contract misuse
    };

    [[nodiscard]] constexpr auto is_terminal(stream_state state) noexcept -> bool
    {
        return state == stream_state::closed || state == stream_state::failed;
    }

    [[nodiscard]] constexpr auto to_string(stream_state state) noexcept -> std::string_view
    {
        switch (state)
        {
        case stream_state::idle:
            return "idle";
        case stream_state::awaiting_consumption:
            return "awaiting_consumption";
        case stream_state::producing:
            return "producing";
        case stream_state::closed:
            return "closed";
        case stream_state::failed:
            return "failed";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr auto to_string(termination_reason reason) noexcept
        -> std::string_view
    {
        switch (reason)
        {
        case termination_reason::none:
            return "none";
        case termination_reason::source_exhausted:
            return "source_exhausted";
        case termination_reason::source_error:
            return "source_error";
        case termination_reason::transport_error:
            return "transport_error";
        case termination_reason::cancelled:
            return "cancelled";
        case termination_reason::protocol_violation:
            return "protocol_violation";
        }
        return "unknown";
    }

} // namespace kcenon::stream::core
