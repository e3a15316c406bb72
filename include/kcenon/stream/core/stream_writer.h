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

#include "kcenon/stream/core/chunk_source.h"
#include "kcenon/stream/core/flow_controller.h"
#include "kcenon/stream/core/stream_state.h"
#include "kcenon/stream/interfaces/i_response_session.h"
#include "kcenon/stream/types/result.h"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::stream::core
{
    /*!
     * \struct stream_options
     * \brief Per-stream settings
     */
    struct stream_options
    {
        //! Status line and headers written before the first chunk
        interfaces::response_head head;

        //! Name used in log records
        std::string name = "stream";
    };

    /*!
     * \class stream_writer
     * \brief Backpressure-aware streaming response writer
     *
     * Pulls chunks from a chunk_source and writes them to an
     * i_response_session, one at a time: the next chunk is produced only
     * after the flow signal of the previous write (headers count as the
     * first write) has been fulfilled. At most one chunk is ever in flight,
     * so memory use is bounded regardless of source or transport speed.
     *
     * The writer runs as a coroutine on its own strand. Waiting for a flow
     * signal suspends the coroutine and gives the thread back to the
     * executor; independent writers share nothing and run in parallel.
     *
     * ### Termination
     * - end-of-stream, or a drained chunk marked last: close() -> closed
     * - source error: abort() -> failed (source_error)
     * - write/drain/close failure: abort() -> failed (transport_error)
     * - cancel() or session cancellation: abort() -> failed (cancelled)
     *
     * On every termination the source is released and the session is closed
     * or aborted exactly once, and the completion handler runs exactly once.
     * The completion receives ok() for closed and for cancelled streams;
     * use is_cancelled() or reason() to tell them apart.
     *
     * ### Ownership
     * The caller keeps the writer alive until the completion runs. A
     * suspended writer holds no reference to itself, so dropping the last
     * reference to an unfinished writer terminates it as cancelled: the
     * session is aborted, the source released and the completion called
     * from the destructor.
     *
     * ### Usage Example
     * \code
     * auto writer = stream_writer::create(socket.get_executor(), session,
     *                                     std::make_unique<buffer_chunk_source>(body, 8192));
     * writer->start([](const VoidResult& result) {
     *     if (result.is_err()) {
     *         STREAM_LOG_ERROR(result.error().message);
     *     }
     * });
     * // keep `writer` until the completion has run
     * \endcode
     */
    class stream_writer : public std::enable_shared_from_this<stream_writer>
    {
    public:
        using completion_handler_t = std::function<void(const VoidResult&)>;

        /*!
         * \brief Create a writer bound to one session and one source
         * \param executor Executor the writer's strand is built on
         * \param session Transport; exclusively used by this writer
         * \param source Chunk producer; ownership moves to the writer
         * \param options Per-stream settings
         */
        static auto create(asio::any_io_executor executor,
                           std::shared_ptr<interfaces::i_response_session> session,
                           std::unique_ptr<chunk_source> source,
                           stream_options options = {}) -> std::shared_ptr<stream_writer>;

        ~stream_writer();

        stream_writer(const stream_writer&) = delete;
        stream_writer& operator=(const stream_writer&) = delete;

        /*!
         * \brief Start streaming
         * \param on_complete Called once when the stream terminates
         * \return protocol_violation if already started, invalid_argument
         *         (writer stays startable) without a session or a source
         */
        auto start(completion_handler_t on_complete = nullptr) -> VoidResult;

        /*!
         * \brief Request cancellation; safe from any thread
         *
         * An in-progress next() call is not interrupted, but its chunk is
         * discarded and nothing further is written.
         */
        auto cancel() -> void;

        [[nodiscard]] auto state() const -> stream_state;
        [[nodiscard]] auto reason() const -> termination_reason;
        [[nodiscard]] auto last_error() const -> std::optional<error_info>;
        [[nodiscard]] auto is_cancelled() const -> bool;
        [[nodiscard]] auto is_started() const -> bool;

        //! Chunks handed to the session
        [[nodiscard]] auto chunks_written() const -> uint64_t;

        //! Payload bytes handed to the session
        [[nodiscard]] auto bytes_written() const -> uint64_t;

        [[nodiscard]] auto flow() const -> const flow_controller&;

        [[nodiscard]] auto name() const -> const std::string&;

    private:
        stream_writer(asio::any_io_executor executor,
                      std::shared_ptr<interfaces::i_response_session> session,
                      std::unique_ptr<chunk_source> source,
                      stream_options options);

        auto run(std::shared_ptr<stream_writer> self) -> asio::awaitable<void>;

        auto produce(uint64_t index) -> next_result;

        auto set_state(stream_state next) -> void;

        auto close_session() -> void;

        auto fail(termination_reason why, error_info cause) -> void;

        auto finish_cancelled() -> void;

        auto finish(stream_state final_state,
                    termination_reason why,
                    std::optional<error_info> cause) -> void;

        asio::strand<asio::any_io_executor> strand_;
        std::shared_ptr<interfaces::i_response_session> session_;
        std::unique_ptr<chunk_source> source_;
        stream_options options_;
        flow_controller flow_;
        completion_handler_t on_complete_;

        mutable std::mutex mutex_;
        stream_state state_{stream_state::idle};
        termination_reason reason_{termination_reason::none};
        std::optional<error_info> last_error_;

        std::atomic<bool> started_{false};
        std::atomic<bool> cancel_requested_{false};
        std::atomic<bool> finished_{false};
        std::atomic<uint64_t> chunks_written_{0};
        std::atomic<uint64_t> bytes_written_{0};
    };

} // namespace kcenon::stream::core
