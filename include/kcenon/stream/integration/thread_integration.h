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

/**
 * @file thread_integration.h
 * @brief Thread pool abstraction used to run stream_system's io_context
 *
 * @author kcenon
 * @date 2025-09-20
 */

#include <cstddef>
#include <functional>
#include <future>
#include <memory>

namespace kcenon::stream::integration {

/**
 * @class thread_pool_interface
 * @brief Abstract interface for thread pool integration
 *
 * Allows stream_context to run on an application supplied pool instead of
 * the built-in basic_thread_pool.
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    /**
     * @brief Submit a task to the thread pool
     * @param task The task to execute
     * @return Future for the task result
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the thread pool is running
     */
    virtual bool is_running() const = 0;

    /**
     * @brief Get pending task count
     */
    virtual size_t pending_tasks() const = 0;

    /**
     * @brief Stop the pool and join its workers
     * @param wait_for_tasks Whether queued tasks run before the workers exit
     */
    virtual void stop(bool wait_for_tasks = true) = 0;
};

/**
 * @class basic_thread_pool
 * @brief Fixed-size std::thread pool
 */
class basic_thread_pool : public thread_pool_interface {
public:
    /**
     * @brief Construct with specified number of threads
     * @param num_threads Number of worker threads (0 = hardware concurrency)
     */
    explicit basic_thread_pool(size_t num_threads = 0);

    ~basic_thread_pool() override;

    basic_thread_pool(const basic_thread_pool&) = delete;
    basic_thread_pool& operator=(const basic_thread_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    size_t worker_count() const override;
    bool is_running() const override;
    size_t pending_tasks() const override;
    void stop(bool wait_for_tasks = true) override;

    /**
     * @brief Get completed tasks count
     */
    size_t completed_tasks() const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

} // namespace kcenon::stream::integration
