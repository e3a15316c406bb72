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

#include "kcenon/stream/sources/file_chunk_source.h"
#include "kcenon/stream/integration/logger_integration.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace kcenon::stream::sources
{
    auto file_chunk_source::resolve_under(const std::string& root, const std::string& name)
        -> Result<std::string>
    {
        namespace fs = std::filesystem;

        if (name.empty())
        {
            return error<std::string>(error_codes::common_errors::invalid_argument,
                                      "Empty file name", "file_chunk_source", root);
        }

        const fs::path relative(name);
        if (relative.has_root_path())
        {
            return error<std::string>(error_codes::common_errors::permission_denied,
                                      "Path outside the served root", "file_chunk_source", name);
        }

        std::error_code ec;
        const auto base = fs::weakly_canonical(fs::path(root), ec);
        if (ec)
        {
            return error<std::string>(error_codes::common_errors::io_error,
                                      "Cannot resolve root", "file_chunk_source",
                                      root + ": " + ec.message());
        }

        const auto resolved = fs::weakly_canonical(base / relative, ec);
        if (ec)
        {
            return error<std::string>(error_codes::common_errors::io_error,
                                      "Cannot resolve path", "file_chunk_source",
                                      name + ": " + ec.message());
        }

        // weakly_canonical follows symlinks, so this also catches links out of the root.
        const auto inside = resolved.lexically_relative(base);
        if (inside.empty() || inside == "." || *inside.begin() == "..")
        {
            STREAM_LOG_WARN("[file_chunk_source] Refused " + name + " outside " + base.string());
            return error<std::string>(error_codes::common_errors::permission_denied,
                                      "Path outside the served root", "file_chunk_source", name);
        }

        return ok(resolved.string());
    }

    auto file_chunk_source::open_under(const std::string& root, const std::string& name,
                                       std::size_t chunk_size)
        -> Result<std::unique_ptr<file_chunk_source>>
    {
        auto resolved = resolve_under(root, name);
        if (resolved.is_err())
        {
            return Result<std::unique_ptr<file_chunk_source>>(resolved.error());
        }
        return open(resolved.value(), chunk_size);
    }

    auto file_chunk_source::open(const std::string& path, std::size_t chunk_size)
        -> Result<std::unique_ptr<file_chunk_source>>
    {
        if (chunk_size == 0)
        {
            return error<std::unique_ptr<file_chunk_source>>(
                error_codes::common_errors::invalid_argument, "Chunk size must be positive",
                "file_chunk_source", path);
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return error<std::unique_ptr<file_chunk_source>>(
                error_codes::common_errors::not_found, "File not found", "file_chunk_source",
                path);
        }

        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            return error<std::unique_ptr<file_chunk_source>>(
                error_codes::common_errors::io_error, "Cannot stat file", "file_chunk_source",
                path + ": " + ec.message());
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            return error<std::unique_ptr<file_chunk_source>>(
                error_codes::common_errors::not_found, "Cannot open file", "file_chunk_source",
                path);
        }

        STREAM_LOG_DEBUG("[file_chunk_source] Opened " + path + " (" + std::to_string(size) +
                         " bytes)");

        return Result<std::unique_ptr<file_chunk_source>>(std::unique_ptr<file_chunk_source>(
            new file_chunk_source(path, std::move(file), size, chunk_size)));
    }

    file_chunk_source::file_chunk_source(std::string path, std::ifstream file, uint64_t size,
                                         std::size_t chunk_size)
        : path_(std::move(path)), file_(std::move(file)), file_size_(size), chunk_size_(chunk_size)
    {
    }

    file_chunk_source::~file_chunk_source() = default;

    auto file_chunk_source::next(uint64_t index) -> core::next_result
    {
        if (!file_.is_open())
        {
            return error<std::optional<core::chunk>>(error_codes::common_errors::not_initialized,
                                                     "File already released",
                                                     "file_chunk_source", path_);
        }

        const uint64_t offset = index * chunk_size_;
        if (offset >= file_size_)
        {
            return core::end_of_stream();
        }

        const auto wanted =
            static_cast<std::size_t>(std::min<uint64_t>(chunk_size_, file_size_ - offset));
        std::vector<uint8_t> buffer(wanted);

        file_.seekg(static_cast<std::streamoff>(offset));
        file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
        const auto got = static_cast<std::size_t>(file_.gcount());

        if (got != wanted)
        {
            file_.clear();
            return error<std::optional<core::chunk>>(
                error_codes::common_errors::io_error, "Short read", "file_chunk_source",
                path_ + " offset=" + std::to_string(offset) + " expected=" +
                    std::to_string(wanted) + " got=" + std::to_string(got));
        }

        return core::produced(core::chunk(index, std::move(buffer), offset + got == file_size_));
    }

    auto file_chunk_source::release() -> void
    {
        if (file_.is_open())
        {
            file_.close();
            STREAM_LOG_DEBUG("[file_chunk_source] Closed " + path_);
        }
    }

} // namespace kcenon::stream::sources
