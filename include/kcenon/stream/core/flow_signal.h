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

#include <asio/associated_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <type_traits>
#include <utility>

namespace kcenon::stream::core
{
    /*!
     * \class flow_signal
     * \brief One-shot "chunk drained" notification
     *
     * A flow_signal is fulfilled exactly once, optionally with an error code
     * describing why the transport could not drain the data. It has exactly
     * one waiter, registered either as a plain continuation (on_fulfilled)
     * or as an asio asynchronous operation (async_wait).
     *
     * Copies share the same underlying state; the signal is a handle.
     *
     * ### Thread Safety
     * fulfill() may be called from any thread. The continuation runs on the
     * fulfilling thread; async_wait() completions are posted to the
     * handler's associated executor.
     *
     * ### Usage Example
     * \code
     * flow_signal drained;
     * session.on_write_complete([drained](std::error_code ec) { drained.fulfill(ec); });
     *
     * std::error_code ec;
     * co_await drained.async_wait(asio::redirect_error(asio::use_awaitable, ec));
     * \endcode
     */
    class flow_signal
    {
    public:
        using continuation_t = std::function<void(std::error_code)>;

        flow_signal();

        /*!
         * \brief Create a signal that is already fulfilled
         * \param ec Result carried by the signal
         */
        static auto fulfilled(std::error_code ec = {}) -> flow_signal;

        /*!
         * \brief Fulfill the signal
         * \param ec Drain result; non-zero means the transport failed
         * \return true on the first call, false if already fulfilled
         */
        auto fulfill(std::error_code ec = {}) const -> bool;

        [[nodiscard]] auto is_fulfilled() const -> bool;

        /*!
         * \brief Error the signal was fulfilled with (empty while pending)
         */
        [[nodiscard]] auto error() const -> std::error_code;

        /*!
         * \brief Register the single waiter
         * \param cont Called once with the fulfilment result; immediately
         *             if the signal is already fulfilled
         * \return false if a waiter was already registered
         */
        auto on_fulfilled(continuation_t cont) const -> bool;

        /*!
         * \brief Wait asynchronously for the signal
         *
         * Completion signature is void(std::error_code). A second waiter
         * completes with asio::error::already_started.
         */
        template<typename CompletionToken>
        auto async_wait(CompletionToken&& token) const
        {
            return asio::async_initiate<CompletionToken, void(std::error_code)>(
                [self = *this](auto handler) {
                    using handler_t = std::decay_t<decltype(handler)>;
                    auto shared = std::make_shared<handler_t>(std::move(handler));

                    auto deliver = [shared](std::error_code ec) {
                        auto executor = asio::get_associated_executor(*shared);
                        asio::post(executor, [shared, ec]() { std::move(*shared)(ec); });
                    };

                    if (!self.on_fulfilled(deliver))
                    {
                        deliver(asio::error::already_started);
                    }
                },
                token);
        }

    private:
        struct state
        {
            std::mutex mutex;
            bool fulfilled{false};
            bool waited{false};
            std::error_code ec;
            continuation_t waiter;
        };

        std::shared_ptr<state> state_;
    };

} // namespace kcenon::stream::core
