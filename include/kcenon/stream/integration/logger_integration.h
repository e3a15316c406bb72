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
 * @file logger_integration.h
 * @brief Logger integration interface for stream_system
 *
 * Provides a pluggable logger_interface with a standalone console
 * implementation (basic_logger). When built with BUILD_WITH_COMMON_SYSTEM
 * the default logger forwards to common_system's GlobalLoggerRegistry.
 *
 * All stream_system components log through the STREAM_LOG_* macros, which
 * skip message formatting when the level is disabled.
 *
 * @author kcenon
 * @date 2025-09-20
 */

#include <memory>
#include <string>

#ifdef BUILD_WITH_COMMON_SYSTEM
#include <kcenon/common/interfaces/global_logger_registry.h>
#endif

namespace kcenon::stream::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level : int {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @class logger_interface
 * @brief Abstract interface for logger integration
 */
class logger_interface {
public:
    virtual ~logger_interface() = default;

    /**
     * @brief Log a message with specified level
     * @param level Log severity level
     * @param message Message to log
     */
    virtual void log(log_level level, const std::string& message) = 0;

    /**
     * @brief Log a message with source location information
     * @param level Log severity level
     * @param message Message to log
     * @param file Source file name
     * @param line Line number
     * @param function Function name
     */
    virtual void log(log_level level, const std::string& message,
                    const std::string& file, int line,
                    const std::string& function) = 0;

    /**
     * @brief Check if a log level is enabled
     * @param level Log level to check
     * @return true if the level is enabled
     */
    virtual bool is_level_enabled(log_level level) const = 0;

    /**
     * @brief Flush any buffered log messages
     */
    virtual void flush() = 0;
};

#ifdef BUILD_WITH_COMMON_SYSTEM

/**
 * @brief Convert stream log_level to common_system log_level
 */
inline kcenon::common::interfaces::log_level to_common_level(log_level level) {
    switch (level) {
        case log_level::trace: return kcenon::common::interfaces::log_level::trace;
        case log_level::debug: return kcenon::common::interfaces::log_level::debug;
        case log_level::info: return kcenon::common::interfaces::log_level::info;
        case log_level::warn: return kcenon::common::interfaces::log_level::warning;
        case log_level::error: return kcenon::common::interfaces::log_level::error;
        case log_level::fatal: return kcenon::common::interfaces::log_level::critical;
        default: return kcenon::common::interfaces::log_level::info;
    }
}

/**
 * @class common_system_logger_adapter
 * @brief Adapter that forwards logger_interface calls to common_system's ILogger
 */
class common_system_logger_adapter : public logger_interface {
public:
    /**
     * @brief Constructor with optional named logger
     * @param logger_name Name of the logger in GlobalLoggerRegistry (empty for default)
     */
    explicit common_system_logger_adapter(const std::string& logger_name = "");

    ~common_system_logger_adapter() override = default;

    void log(log_level level, const std::string& message) override;
    void log(log_level level, const std::string& message,
            const std::string& file, int line,
            const std::string& function) override;
    bool is_level_enabled(log_level level) const override;
    void flush() override;

private:
    std::string logger_name_;
    std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;
};

#endif // BUILD_WITH_COMMON_SYSTEM

/**
 * @class basic_logger
 * @brief Console logger for standalone use
 *
 * Writes one timestamped line per record; error and fatal records go to
 * stderr, everything else to stdout.
 */
class basic_logger : public logger_interface {
public:
    /**
     * @brief Constructor with minimum log level
     * @param min_level Minimum level to log (default: info)
     */
    explicit basic_logger(log_level min_level = log_level::info);

    ~basic_logger() override;

    void log(log_level level, const std::string& message) override;
    void log(log_level level, const std::string& message,
            const std::string& file, int line,
            const std::string& function) override;
    bool is_level_enabled(log_level level) const override;
    void flush() override;

    /**
     * @brief Set minimum log level
     * @param level New minimum level
     */
    void set_min_level(log_level level);

    /**
     * @brief Get current minimum log level
     * @return Current minimum level
     */
    log_level get_min_level() const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @class logger_integration_manager
 * @brief Process-wide holder of the active logger
 */
class logger_integration_manager {
public:
    /**
     * @brief Get the singleton instance
     * @return Reference to the singleton instance
     */
    static logger_integration_manager& instance();

    /**
     * @brief Set the logger implementation
     * @param logger Logger to use (nullptr restores the default logger)
     */
    void set_logger(std::shared_ptr<logger_interface> logger);

    /**
     * @brief Get the current logger
     * @return Current logger
     */
    std::shared_ptr<logger_interface> get_logger();

    /**
     * @brief Check if a level would be emitted by the current logger
     */
    bool is_level_enabled(log_level level);

    void log(log_level level, const std::string& message);

    void log(log_level level, const std::string& message,
            const std::string& file, int line, const std::string& function);

private:
    logger_integration_manager();
    ~logger_integration_manager();

    class impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Level name padded to five characters ("TRACE", "INFO ", ...)
 */
const char* to_string(log_level level);

} // namespace kcenon::stream::integration

// =============================================================================
// Convenience macros
// =============================================================================

#define STREAM_LOG(level, msg)                                                         \
    do {                                                                               \
        auto& stream_log_manager_ =                                                    \
            ::kcenon::stream::integration::logger_integration_manager::instance();     \
        if (stream_log_manager_.is_level_enabled(level)) {                             \
            stream_log_manager_.log(level, msg, __FILE__, __LINE__, __func__);         \
        }                                                                              \
    } while (0)

#define STREAM_LOG_TRACE(msg) STREAM_LOG(::kcenon::stream::integration::log_level::trace, msg)
#define STREAM_LOG_DEBUG(msg) STREAM_LOG(::kcenon::stream::integration::log_level::debug, msg)
#define STREAM_LOG_INFO(msg) STREAM_LOG(::kcenon::stream::integration::log_level::info, msg)
#define STREAM_LOG_WARN(msg) STREAM_LOG(::kcenon::stream::integration::log_level::warn, msg)
#define STREAM_LOG_ERROR(msg) STREAM_LOG(::kcenon::stream::integration::log_level::error, msg)
#define STREAM_LOG_FATAL(msg) STREAM_LOG(::kcenon::stream::integration::log_level::fatal, msg)
