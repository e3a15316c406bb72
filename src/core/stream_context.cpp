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
 * @file stream_context.cpp
 * @brief Implementation of stream_context
 *
 * @author kcenon
 * @date 2025-01-13
 */

#include "kcenon/stream/core/stream_context.h"
#include "kcenon/stream/integration/logger_integration.h"

#include <asio/executor_work_guard.hpp>

#include <algorithm>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace kcenon::stream::core {

class stream_context::impl {
public:
    using work_guard_t = asio::executor_work_guard<asio::io_context::executor_type>;

    impl(config::stream_config cfg,
         std::shared_ptr<integration::thread_pool_interface> pool)
        : config_(std::move(cfg))
        , external_pool_(std::move(pool)) {}

    ~impl() {
        if (running_) {
            stop();
        }
    }

    VoidResult start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return error_void(error_codes::stream_system::context_already_running,
                              "Stream context is already running",
                              "stream_context");
        }

        if (config_.logger.install_basic_logger) {
            integration::logger_integration_manager::instance().set_logger(
                std::make_shared<integration::basic_logger>(config_.logger.min_level));
        }

        if (io_context_.stopped()) {
            io_context_.restart();
        }
        work_guard_.emplace(asio::make_work_guard(io_context_));

        pool_ = external_pool_;
        if (!pool_) {
            auto count = config_.thread_pool.worker_count;
            if (count == 0) {
                count = std::max(1u, std::thread::hardware_concurrency());
            }
            pool_ = std::make_shared<integration::basic_thread_pool>(count);
        }

        const auto workers = pool_->worker_count();
        const auto& name = config_.thread_pool.pool_name;
        for (size_t i = 0; i < workers; ++i) {
            runners_.push_back(pool_->submit([this, name, i]() {
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    STREAM_LOG_ERROR("[stream_context] Exception in " + name + " worker " +
                                     std::to_string(i) + ": " + e.what());
                }
            }));
        }

        running_ = true;
        STREAM_LOG_INFO("[stream_context] Started " + name + " with " +
                        std::to_string(workers) + " worker(s)");
        return ok();
    }

    VoidResult stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return error_void(error_codes::stream_system::context_not_running,
                              "Stream context is not running",
                              "stream_context");
        }

        work_guard_.reset();
        io_context_.stop();

        for (auto& runner : runners_) {
            runner.wait();
        }
        runners_.clear();

        if (!external_pool_ && pool_) {
            pool_->stop(true);
        }
        pool_.reset();

        running_ = false;
        STREAM_LOG_INFO("[stream_context] Stopped " + config_.thread_pool.pool_name);
        return ok();
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    size_t worker_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return runners_.size();
    }

    asio::io_context& context() { return io_context_; }

    const config::stream_config& config() const { return config_; }

private:
    config::stream_config config_;
    std::shared_ptr<integration::thread_pool_interface> external_pool_;
    std::shared_ptr<integration::thread_pool_interface> pool_;

    asio::io_context io_context_;
    std::optional<work_guard_t> work_guard_;
    std::vector<std::future<void>> runners_;

    mutable std::mutex mutex_;
    bool running_{false};
};

stream_context::stream_context(config::stream_config cfg)
    : pimpl_(std::make_unique<impl>(std::move(cfg), nullptr)) {}

stream_context::stream_context(config::stream_config cfg,
                               std::shared_ptr<integration::thread_pool_interface> pool)
    : pimpl_(std::make_unique<impl>(std::move(cfg), std::move(pool))) {}

stream_context::~stream_context() = default;

auto stream_context::start() -> VoidResult {
    return pimpl_->start();
}

auto stream_context::stop() -> VoidResult {
    return pimpl_->stop();
}

auto stream_context::is_running() const -> bool {
    return pimpl_->is_running();
}

auto stream_context::executor() -> asio::any_io_executor {
    return pimpl_->context().get_executor();
}

auto stream_context::make_strand() -> asio::strand<asio::any_io_executor> {
    return asio::make_strand(executor());
}

auto stream_context::io_context() -> asio::io_context& {
    return pimpl_->context();
}

auto stream_context::config() const -> const config::stream_config& {
    return pimpl_->config();
}

auto stream_context::worker_count() const -> size_t {
    return pimpl_->worker_count();
}

} // namespace kcenon::stream::core
