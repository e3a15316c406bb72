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

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::stream::core
{
    /*!
     * \class chunk
     * \brief One unit of response payload
     *
     * A chunk carries a zero-based sequence index, an immutable byte payload
     * and an end-of-stream flag. A chunk marked last ends the stream once it
     * has been drained; the source is not asked for another chunk.
     *
     * Chunks are move-only in practice: the source hands one to the writer by
     * value and the writer hands it on to the transport.
     */
    class chunk
    {
    public:
        chunk(uint64_t index, std::vector<uint8_t> data, bool last = false)
            : index_(index), data_(std::move(data)), last_(last)
        {
        }

        /*!
         * \brief Build a chunk from text
         */
        static auto from_string(uint64_t index, std::string_view text, bool last = false)
            -> chunk
        {
            return chunk(index, std::vector<uint8_t>(text.begin(), text.end()), last);
        }

        [[nodiscard]] auto index() const noexcept -> uint64_t { return index_; }
        [[nodiscard]] auto data() const noexcept -> const std::vector<uint8_t>& { return data_; }
        [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }
        [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }
        [[nodiscard]] auto is_last() const noexcept -> bool { return last_; }

        /*!
         * \brief Move the payload out, leaving the chunk empty
         */
        auto release() && -> std::vector<uint8_t> { return std::move(data_); }

    private:
        uint64_t index_;
        std::vector<uint8_t> data_;
        bool last_;
    };

} // namespace kcenon::stream::core
