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

#include "kcenon/stream/core/chunk.h"
#include "kcenon/stream/types/result.h"

#include <cstdint>
#include <optional>
#include <utility>

namespace kcenon::stream::core
{
    //! Result of chunk_source::next(): a chunk, end-of-stream (nullopt) or an error
    using next_result = Result<std::optional<chunk>>;

    /*!
     * \brief Build a next_result carrying a chunk
     */
    inline auto produced(chunk value) -> next_result
    {
        return next_result(std::optional<chunk>(std::move(value)));
    }

    /*!
     * \brief Build a next_result signalling end-of-stream
     */
    inline auto end_of_stream() -> next_result
    {
        return next_result(std::optional<chunk>{});
    }

    /*!
     * \class chunk_source
     * \brief Application supplied producer of response chunks
     *
     * ### Contract
     * - next() is called with strictly increasing indices starting at 0, and
     *   only after the previous chunk has been drained by the transport.
     * - A returned chunk must carry the requested index.
     * - An error result is terminal: next() is not called again.
     * - End-of-stream (nullopt) is terminal as well.
     * - release() is called exactly once when the stream terminates, whatever
     *   the reason. Open files, cursors and the like should be freed there.
     *
     * next() runs on the writer's strand and may block; a slow source only
     * delays its own stream.
     */
    class chunk_source
    {
    public:
        virtual ~chunk_source() = default;

        /*!
         * \brief Produce the chunk at \p index
         */
        virtual auto next(uint64_t index) -> next_result = 0;

        /*!
         * \brief Release resources held by the source
         */
        virtual auto release() -> void {}
    };

} // namespace kcenon::stream::core
