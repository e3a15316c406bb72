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

#include "kcenon/stream/interfaces/i_response_session.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

namespace kcenon::stream::session
{
    /*!
     * \enum session_phase
     * \brief Where a session is in its call order
     */
    enum class session_phase : uint8_t
    {
        created = 0,       //!< Nothing written yet
        headers_sent = 1,  //!< Headers written, chunks may follow
        closed = 2,        //!< close() accepted
        aborted = 3        //!< abort() accepted
    };

    /*!
     * \class response_session_base
     * \brief Enforces the i_response_session call order
     *
     * Concrete transports implement the do_* hooks; this base rejects
     * out-of-order calls with error_codes::stream_system::protocol_violation:
     * - write_chunk() before write_headers();
     * - write_headers() twice;
     * - any write, close() or abort() after the session finished.
     *
     * It also implements cancellation fan-out: notify_cancelled() fires every
     * subscribed callback once. Cancellation after the session finished is
     * ignored.
     *
     * ### Thread Safety
     * The phase is guarded by a mutex; do_* hooks are called with the mutex
     * released and must not be called concurrently by the user.
     */
    class response_session_base : public interfaces::i_response_session
    {
    public:
        response_session_base() = default;
        ~response_session_base() override = default;

        response_session_base(const response_session_base&) = delete;
        response_session_base& operator=(const response_session_base&) = delete;

        auto write_headers(const interfaces::response_head& head)
            -> Result<core::flow_signal> override;

        auto write_chunk(core::chunk data) -> Result<core::flow_signal> override;

        auto close() -> VoidResult override;

        auto abort(const error_info& reason) -> VoidResult override;

        auto on_cancelled(cancel_callback_t callback) -> void override;

        [[nodiscard]] auto is_cancelled() const -> bool override;

        [[nodiscard]] auto phase() const -> session_phase;

        [[nodiscard]] auto is_finished() const -> bool;

    protected:
        virtual auto do_write_headers(const interfaces::response_head& head)
            -> Result<core::flow_signal> = 0;
        virtual auto do_write_chunk(core::chunk data) -> Result<core::flow_signal> = 0;
        virtual auto do_close() -> VoidResult = 0;
        virtual auto do_abort(const error_info& reason) -> VoidResult = 0;

        /*!
         * \brief Raise cancellation; safe to call repeatedly and from any thread
         */
        auto notify_cancelled() -> void;

    private:
        auto violation(const std::string& message) const -> error_info;

        mutable std::mutex mutex_;
        session_phase phase_{session_phase::created};
        std::atomic<bool> cancelled_{false};
        std::vector<cancel_callback_t> cancel_callbacks_;
    };

} // namespace kcenon::stream::session
