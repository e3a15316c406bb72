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

/**
 * @file stream_context.h
 * @brief Execution context shared by stream writers
 *
 * @author kcenon
 * @date 2025-01-13
 */

#pragma once

#include <memory>

#include <asio/any_io_executor.hpp>
#include <asio/io_context.hpp>
#include <asio/strand.hpp>

#include "kcenon/stream/config/stream_config.h"
#include "kcenon/stream/integration/thread_integration.h"
#include "kcenon/stream/types/result.h"

namespace kcenon::stream::core {

/**
 * @class stream_context
 * @brief Owns an io_context and the worker threads that run it
 *
 * Each worker thread runs io_context::run() until stop(). Writers created
 * on executor() get their own strand, so independent streams progress in
 * parallel on the shared workers.
 *
 * A context can be started again after stop().
 *
 * @note stop() joins the workers and must not be called from a handler
 *       running on this context.
 *
 * ### Usage Example
 * @code
 * stream_context ctx(config::stream_config::production());
 * ctx.start();
 * auto writer = stream_writer::create(ctx.executor(), session, std::move(source));
 * writer->start();
 * @endcode
 */
class stream_context {
public:
    /**
     * @brief Construct with a configuration; workers come from a basic_thread_pool
     */
    explicit stream_context(config::stream_config cfg = {});

    /**
     * @brief Construct with an application supplied thread pool
     * @param cfg Configuration (thread_pool.worker_count is ignored)
     * @param pool Pool whose workers run the io_context; it is not stopped by stop()
     */
    stream_context(config::stream_config cfg,
                   std::shared_ptr<integration::thread_pool_interface> pool);

    ~stream_context();

    stream_context(const stream_context&) = delete;
    stream_context& operator=(const stream_context&) = delete;

    /**
     * @brief Start the worker threads
     * @return context_already_running if already started
     */
    auto start() -> VoidResult;

    /**
     * @brief Stop the io_context and join the worker threads
     * @return context_not_running if not started
     */
    auto stop() -> VoidResult;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto executor() -> asio::any_io_executor;

    /**
     * @brief Create a new strand on this context
     */
    [[nodiscard]] auto make_strand() -> asio::strand<asio::any_io_executor>;

    auto io_context() -> asio::io_context&;

    [[nodiscard]] auto config() const -> const config::stream_config&;

    /**
     * @brief Number of threads running the io_context (0 while stopped)
     */
    [[nodiscard]] auto worker_count() const -> size_t;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

} // namespace kcenon::stream::core
