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

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

namespace kcenon::stream::sources
{
    /*!
     * \class file_chunk_source
     * \brief Streams a file in fixed-size segments
     *
     * The file stays open until release(). The segment that reaches the
     * size observed at open() is marked last; an empty file produces no
     * chunks.
     */
    class file_chunk_source : public core::chunk_source
    {
    public:
        /*!
         * \brief Open \p path for streaming
         * \return not_found if the file does not exist or cannot be opened,
         *         invalid_argument for a zero chunk size
         */
        static auto open(const std::string& path, std::size_t chunk_size)
            -> Result<std::unique_ptr<file_chunk_source>>;

        /*!
         * \brief Resolve \p name against \p root, refusing paths outside it
         *
         * Absolute names, ".." traversal and symlinks leading out of the
         * root are refused with permission_denied; an empty name is
         * invalid_argument.
         *
         * \return Canonical path of the target inside \p root
         */
        static auto resolve_under(const std::string& root, const std::string& name)
            -> Result<std::string>;

        /*!
         * \brief resolve_under() followed by open()
         */
        static auto open_under(const std::string& root, const std::string& name,
                               std::size_t chunk_size)
            -> Result<std::unique_ptr<file_chunk_source>>;

        ~file_chunk_source() override;

        auto next(uint64_t index) -> core::next_result override;

        auto release() -> void override;

        [[nodiscard]] auto path() const -> const std::string& { return path_; }
        [[nodiscard]] auto file_size() const -> uint64_t { return file_size_; }
        [[nodiscard]] auto is_open() const -> bool { return file_.is_open(); }

    private:
        file_chunk_source(std::string path, std::ifstream file, uint64_t size,
                          std::size_t chunk_size);

        std::string path_;
        std::ifstream file_;
        uint64_t file_size_;
        std::size_t chunk_size_;
    };

} // namespace kcenon::stream::sources
