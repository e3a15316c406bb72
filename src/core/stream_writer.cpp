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

#include "kcenon/stream/core/stream_writer.h"
#include "kcenon/stream/integration/logger_integration.h"

#include <asio/co_spawn.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <exception>
#include <utility>

namespace kcenon::stream::core
{
    namespace
    {
        auto classify(const error_info& err) -> termination_reason
        {
            return err.code == error_codes::stream_system::protocol_violation
                       ? termination_reason::protocol_violation
                       : termination_reason::transport_error;
        }
    } // namespace

    auto stream_writer::create(asio::any_io_executor executor,
                               std::shared_ptr<interfaces::i_response_session> session,
                               std::unique_ptr<chunk_source> source,
                               stream_options options) -> std::shared_ptr<stream_writer>
    {
        return std::shared_ptr<stream_writer>(new stream_writer(
            std::move(executor), std::move(session), std::move(source), std::move(options)));
    }

    stream_writer::stream_writer(asio::any_io_executor executor,
                                 std::shared_ptr<interfaces::i_response_session> session,
                                 std::unique_ptr<chunk_source> source,
                                 stream_options options)
        : strand_(asio::make_strand(std::move(executor)))
        , session_(std::move(session))
        , source_(std::move(source))
        , options_(std::move(options))
        , flow_(1)
    {
    }

    stream_writer::~stream_writer()
    {
        if (finished_.load(std::memory_order_acquire))
        {
            return;
        }

        if (!started_.load(std::memory_order_acquire))
        {
            // A writer that was never started still owns its source.
            if (source_)
            {
                source_->release();
            }
            return;
        }

        // Dropped while suspended on a drain that never came. Abandoning the
        // flow in finish() wakes the coroutine, which finds the writer gone.
        STREAM_LOG_DEBUG("[stream_writer:" + options_.name + "] Destroyed before completion");
        finish_cancelled();
    }

    auto stream_writer::start(completion_handler_t on_complete) -> VoidResult
    {
        if (!session_ || !source_)
        {
            return error_void(error_codes::common_errors::invalid_argument,
                              "Stream requires a session and a source",
                              "stream_writer",
                              options_.name);
        }

        if (started_.exchange(true, std::memory_order_acq_rel))
        {
            return error_void(error_codes::stream_system::protocol_violation,
                              "Stream already started",
                              "stream_writer",
                              options_.name);
        }

        on_complete_ = std::move(on_complete);

        std::weak_ptr<stream_writer> weak = weak_from_this();
        session_->on_cancelled([weak]() {
            if (auto self = weak.lock())
            {
                self->cancel();
            }
        });

        STREAM_LOG_DEBUG("[stream_writer:" + options_.name + "] Starting");

        asio::co_spawn(strand_, run(shared_from_this()), [weak](std::exception_ptr failure) {
            auto self = weak.lock();
            if (!failure || !self)
            {
                return;
            }
            try
            {
                std::rethrow_exception(failure);
            }
            catch (const std::exception& e)
            {
                self->fail(termination_reason::transport_error,
                           error_info(error_codes::common_errors::internal_error,
                                      "Stream coroutine failed", "stream_writer", e.what()));
            }
            catch (...)
            {
                self->fail(termination_reason::transport_error,
                           error_info(error_codes::common_errors::internal_error,
                                      "Stream coroutine failed with unknown exception",
                                      "stream_writer"));
            }
        });

        return ok();
    }

    auto stream_writer::cancel() -> void
    {
        if (finished_.load(std::memory_order_acquire))
        {
            return;
        }
        if (cancel_requested_.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }

        STREAM_LOG_DEBUG("[stream_writer:" + options_.name + "] Cancellation requested");

        // Wake a coroutine suspended on the flow signal.
        asio::post(strand_, [self = shared_from_this()]() {
            self->flow_.abandon(asio::error::operation_aborted);
        });
    }

    auto stream_writer::run(std::shared_ptr<stream_writer> self) -> asio::awaitable<void>
    {
        // The frame owns the writer only while it runs. While suspended the
        // writer owns the frame (through the flow signal's waiter).
        std::weak_ptr<stream_writer> weak_self = self;

        if (cancel_requested_.load(std::memory_order_acquire))
        {
            finish_cancelled();
            co_return;
        }

        // Headers are the first write and gate the first chunk.
        auto headers = session_->write_headers(options_.head);
        if (headers.is_err())
        {
            fail(classify(headers.error()), headers.error());
            co_return;
        }
        if (auto registered = flow_.on_chunk_written(headers.value(), 0); registered.is_err())
        {
            if (cancel_requested_.load(std::memory_order_acquire))
            {
                finish_cancelled();
            }
            else
            {
                fail(termination_reason::protocol_violation, registered.error());
            }
            co_return;
        }
        set_state(stream_state::awaiting_consumption);

        uint64_t index = 0;
        bool last_written = false;

        for (;;)
        {
            std::error_code ec;
            {
                auto consumed = flow_.await_consumed();
                self.reset();
                co_await consumed.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            }

            self = weak_self.lock();
            if (!self)
            {
                // Destroyed while suspended; the destructor already finished.
                co_return;
            }

            if (cancel_requested_.load(std::memory_order_acquire))
            {
                finish_cancelled();
                co_return;
            }

            if (ec)
            {
                fail(termination_reason::transport_error,
                     error_info(error_codes::stream_system::transport_error,
                                "Transport failed to drain data",
                                "stream_writer",
                                ec.message()));
                co_return;
            }

            if (last_written)
            {
                close_session();
                co_return;
            }

            set_state(stream_state::producing);
            auto produced = produce(index);

            if (cancel_requested_.load(std::memory_order_acquire))
            {
                // The chunk produced while cancelling is dropped here.
                finish_cancelled();
                co_return;
            }

            if (produced.is_err())
            {
                fail(termination_reason::source_error, produced.error());
                co_return;
            }

            if (!produced.value().has_value())
            {
                close_session();
                co_return;
            }

            chunk next = std::move(*produced.value());
            if (next.index() != index)
            {
                fail(termination_reason::source_error,
                     error_info(error_codes::stream_system::source_error,
                                "Chunk index out of order",
                                "stream_writer",
                                "expected=" + std::to_string(index) +
                                    " got=" + std::to_string(next.index())));
                co_return;
            }

            last_written = next.is_last();
            const auto size = next.size();

            auto written = session_->write_chunk(std::move(next));
            if (written.is_err())
            {
                fail(classify(written.error()), written.error());
                co_return;
            }

            chunks_written_.fetch_add(1, std::memory_order_relaxed);
            bytes_written_.fetch_add(size, std::memory_order_relaxed);

            if (auto registered = flow_.on_chunk_written(written.value(), size);
                registered.is_err())
            {
                if (cancel_requested_.load(std::memory_order_acquire))
                {
                    finish_cancelled();
                }
                else
                {
                    fail(termination_reason::protocol_violation, registered.error());
                }
                co_return;
            }

            ++index;
            set_state(stream_state::awaiting_consumption);
        }
    }

    auto stream_writer::produce(uint64_t index) -> next_result
    {
        try
        {
            return source_->next(index);
        }
        catch (const std::exception& e)
        {
            return error<std::optional<chunk>>(error_codes::stream_system::source_error,
                                               "Chunk source threw",
                                               "stream_writer",
                                               e.what());
        }
    }

    auto stream_writer::set_state(stream_state next) -> void
    {
        stream_state previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = state_;
            state_ = next;
        }

        STREAM_LOG_TRACE("[stream_writer:" + options_.name + "] " +
                         std::string(to_string(previous)) + " -> " +
                         std::string(to_string(next)));
    }

    auto stream_writer::close_session() -> void
    {
        auto closed = session_->close();
        if (closed.is_err())
        {
            // The session refused the close; nothing left to abort.
            finish(stream_state::failed, classify(closed.error()), closed.error());
            return;
        }

        STREAM_LOG_DEBUG("[stream_writer:" + options_.name + "] Closed after " +
                         std::to_string(chunks_written()) + " chunk(s)");
        finish(stream_state::closed, termination_reason::source_exhausted, std::nullopt);
    }

    auto stream_writer::fail(termination_reason why, error_info cause) -> void
    {
        if (finished_.load(std::memory_order_acquire))
        {
            return;
        }

        STREAM_LOG_ERROR("[stream_writer:" + options_.name + "] " +
                         std::string(to_string(why)) + ": " + cause.message +
                         (cause.details.empty() ? "" : " (" + cause.details + ")"));

        if (session_)
        {
            auto aborted = session_->abort(cause);
            if (aborted.is_err())
            {
                STREAM_LOG_WARN("[stream_writer:" + options_.name +
                                "] Abort refused: " + aborted.error().message);
            }
        }

        finish(stream_state::failed, why, std::move(cause));
    }

    auto stream_writer::finish_cancelled() -> void
    {
        if (finished_.load(std::memory_order_acquire))
        {
            return;
        }

        STREAM_LOG_INFO("[stream_writer:" + options_.name + "] Cancelled after " +
                        std::to_string(chunks_written()) + " chunk(s)");

        error_info cause(error_codes::stream_system::cancelled, "Stream cancelled",
                         "stream_writer", options_.name);

        if (session_)
        {
            auto aborted = session_->abort(cause);
            if (aborted.is_err())
            {
                STREAM_LOG_DEBUG("[stream_writer:" + options_.name +
                                 "] Abort refused: " + aborted.error().message);
            }
        }

        finish(stream_state::failed, termination_reason::cancelled, std::move(cause));
    }

    auto stream_writer::finish(stream_state final_state,
                               termination_reason why,
                               std::optional<error_info> cause) -> void
    {
        if (finished_.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = final_state;
            reason_ = why;
            last_error_ = cause;
        }

        if (source_)
        {
            source_->release();
            source_.reset();
        }
        session_.reset();

        // Late transport completions must not find a live waiter.
        flow_.abandon(asio::error::operation_aborted);

        auto handler = std::move(on_complete_);
        on_complete_ = nullptr;
        if (!handler)
        {
            return;
        }

        if (final_state == stream_state::closed || why == termination_reason::cancelled)
        {
            handler(ok());
        }
        else
        {
            handler(VoidResult(*cause));
        }
    }

    auto stream_writer::state() const -> stream_state
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    auto stream_writer::reason() const -> termination_reason
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    auto stream_writer::last_error() const -> std::optional<error_info>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

    auto stream_writer::is_cancelled() const -> bool
    {
        return reason() == termination_reason::cancelled;
    }

    auto stream_writer::is_started() const -> bool
    {
        return started_.load(std::memory_order_acquire);
    }

    auto stream_writer::chunks_written() const -> uint64_t
    {
        return chunks_written_.load(std::memory_order_relaxed);
    }

    auto stream_writer::bytes_written() const -> uint64_t
    {
        return bytes_written_.load(std::memory_order_relaxed);
    }

    auto stream_writer::flow() const -> const flow_controller&
    {
        return flow_;
    }

    auto stream_writer::name() const -> const std::string&
    {
        return options_.name;
    }

} // namespace kcenon::stream::core
