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

#include "kcenon/stream/sources/buffer_chunk_source.h"

#include <algorithm>
#include <utility>

namespace kcenon::stream::sources
{
    buffer_chunk_source::buffer_chunk_source(std::vector<uint8_t> body, std::size_t chunk_size)
        : body_(std::move(body)), chunk_size_(chunk_size)
    {
    }

    auto buffer_chunk_source::from_string(std::string_view text, std::size_t chunk_size)
        -> buffer_chunk_source
    {
        return buffer_chunk_source(std::vector<uint8_t>(text.begin(), text.end()), chunk_size);
    }

    auto buffer_chunk_source::chunk_count() const -> uint64_t
    {
        if (chunk_size_ == 0)
        {
            return 0;
        }
        return (body_.size() + chunk_size_ - 1) / chunk_size_;
    }

    auto buffer_chunk_source::next(uint64_t index) -> core::next_result
    {
        if (chunk_size_ == 0)
        {
            return error<std::optional<core::chunk>>(error_codes::common_errors::invalid_argument,
                                                     "Chunk size must be positive",
                                                     "buffer_chunk_source");
        }

        if (index >= chunk_count())
        {
            return core::end_of_stream();
        }

        const auto offset = static_cast<std::size_t>(index) * chunk_size_;
        const auto end = std::min(offset + chunk_size_, body_.size());

        return core::produced(core::chunk(
            index,
            std::vector<uint8_t>(body_.begin() + static_cast<std::ptrdiff_t>(offset),
                                 body_.begin() + static_cast<std::ptrdiff_t>(end)),
            end == body_.size()));
    }

    auto buffer_chunk_source::release() -> void
    {
        body_.clear();
        body_.shrink_to_fit();
    }

} // namespace kcenon::stream::sources
