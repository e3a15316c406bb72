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

#include "kcenon/stream/session/response_session_base.h"
#include "kcenon/stream/integration/logger_integration.h"

namespace kcenon::stream::session
{
    auto response_session_base::write_headers(const interfaces::response_head& head)
        -> Result<core::flow_signal>
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ == session_phase::headers_sent)
            {
                return violation("Headers already sent");
            }
            if (phase_ != session_phase::created)
            {
                return violation("Session is finished");
            }
            phase_ = session_phase::headers_sent;
        }

        return do_write_headers(head);
    }

    auto response_session_base::write_chunk(core::chunk data) -> Result<core::flow_signal>
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ == session_phase::created)
            {
                return violation("Headers must be sent before data");
            }
            if (phase_ != session_phase::headers_sent)
            {
                return violation("Session is finished");
            }
        }

        return do_write_chunk(std::move(data));
    }

    auto response_session_base::close() -> VoidResult
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ == session_phase::created)
            {
                return violation("Headers must be sent before close");
            }
            if (phase_ != session_phase::headers_sent)
            {
                return violation("Session is finished");
            }
            phase_ = session_phase::closed;
        }

        return do_close();
    }

    auto response_session_base::abort(const error_info& reason) -> VoidResult
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ == session_phase::closed || phase_ == session_phase::aborted)
            {
                return violation("Session is finished");
            }
            phase_ = session_phase::aborted;
        }

        return do_abort(reason);
    }

    auto response_session_base::on_cancelled(cancel_callback_t callback) -> void
    {
        if (!callback)
        {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load(std::memory_order_acquire))
            {
                cancel_callbacks_.push_back(std::move(callback));
                return;
            }
        }

        callback();
    }

    auto response_session_base::is_cancelled() const -> bool
    {
        return cancelled_.load(std::memory_order_acquire);
    }

    auto response_session_base::phase() const -> session_phase
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return phase_;
    }

    auto response_session_base::is_finished() const -> bool
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return phase_ == session_phase::closed || phase_ == session_phase::aborted;
    }

    auto response_session_base::notify_cancelled() -> void
    {
        std::vector<cancel_callback_t> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ == session_phase::closed || phase_ == session_phase::aborted)
            {
                return;
            }
            if (cancelled_.exchange(true, std::memory_order_acq_rel))
            {
                return;
            }
            callbacks.swap(cancel_callbacks_);
        }

        STREAM_LOG_DEBUG("[response_session] Cancelled, notifying " +
                         std::to_string(callbacks.size()) + " subscriber(s)");

        for (auto& callback : callbacks)
        {
            callback();
        }
    }

    auto response_session_base::violation(const std::string& message) const -> error_info
    {
        return error_info(error_codes::stream_system::protocol_violation, message,
                          "response_session");
    }

} // namespace kcenon::stream::session
