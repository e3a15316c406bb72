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
#include <string_view>
#include <vector>

namespace kcenon::stream::sources
{
    /*!
     * \class buffer_chunk_source
     * \brief Streams an in-memory body in fixed-size slices
     *
     * The final slice is marked last, so the stream closes as soon as it
     * drains. An empty body produces no chunks.
     */
    class buffer_chunk_source : public core::chunk_source
    {
    public:
        buffer_chunk_source(std::vector<uint8_t> body, std::size_t chunk_size);

        static auto from_string(std::string_view text, std::size_t chunk_size)
            -> buffer_chunk_source;

        auto next(uint64_t index) -> core::next_result override;

        auto release() -> void override;

        [[nodiscard]] auto total_size() const -> std::size_t { return body_.size(); }
        [[nodiscard]] auto chunk_size() const -> std::size_t { return chunk_size_; }

        //! Number of chunks the body splits into
        [[nodiscard]] auto chunk_count() const -> uint64_t;

    private:
        std::vector<uint8_t> body_;
        std::size_t chunk_size_;
    };

} // namespace kcenon::stream::sources
