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
 * @file stream_config.h
 * @brief Configuration structures for stream_system
 *
 * @author kcenon
 * @date 2025-01-13
 */

#pragma once

#include <cstddef>
#include <string>
#include "kcenon/stream/integration/logger_integration.h"

namespace kcenon::stream::config {

/**
 * @struct thread_pool_config
 * @brief Configuration for the worker threads that run the io_context
 */
struct thread_pool_config {
    /// Number of worker threads (0 = auto-detect via hardware_concurrency)
    size_t worker_count = 0;

    /// Thread pool name, used in log records
    std::string pool_name = "stream_pool";
};

/**
 * @struct logger_config
 * @brief Configuration for logging
 */
struct logger_config {
    /// Minimum log level to record
    integration::log_level min_level = integration::log_level::info;

    /// Install a basic_logger with min_level when the context starts
    bool install_basic_logger = true;
};

/**
 * @struct flow_config
 * @brief Defaults used by the built-in chunk sources
 */
struct flow_config {
    /// Payload size of one chunk produced by buffer and file sources
    size_t default_chunk_size = 8192;
};

/**
 * @struct stream_config
 * @brief Complete configuration for stream_system
 */
struct stream_config {
    thread_pool_config thread_pool;
    logger_config logger;
    flow_config flow;

    /**
     * @brief Create development configuration
     */
    static stream_config development() {
        stream_config cfg;
        cfg.logger.min_level = integration::log_level::debug;
        cfg.thread_pool.worker_count = 2;
        return cfg;
    }

    /**
     * @brief Create production configuration
     */
    static stream_config production() {
        stream_config cfg;
        cfg.logger.min_level = integration::log_level::info;
        cfg.thread_pool.worker_count = 0;
        cfg.flow.default_chunk_size = 64 * 1024;
        return cfg;
    }

    /**
     * @brief Create testing configuration
     */
    static stream_config testing() {
        stream_config cfg;
        cfg.logger.min_level = integration::log_level::warn;
        cfg.thread_pool.worker_count = 4;
        cfg.flow.default_chunk_size = 1024;
        return cfg;
    }
};

} // namespace kcenon::stream::config
