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

#include <functional>
#include <utility>

namespace kcenon::stream::sources
{
    /*!
     * \class function_chunk_source
     * \brief Adapts a callable to the chunk_source interface
     *
     * \code
     * auto source = std::make_unique<function_chunk_source>(
     *     [rows](uint64_t index) -> core::next_result {
     *         if (index == rows.size()) {
     *             return core::end_of_stream();
     *         }
     *         return core::produced(core::chunk::from_string(index, rows[index]));
     *     });
     * \endcode
     */
    class function_chunk_source : public core::chunk_source
    {
    public:
        using next_fn = std::function<core::next_result(uint64_t)>;
        using release_fn = std::function<void()>;

        explicit function_chunk_source(next_fn next, release_fn release = nullptr)
            : next_(std::move(next)), release_(std::move(release))
        {
        }

        auto next(uint64_t index) -> core::next_result override
        {
            if (!next_)
            {
                return error<std::optional<core::chunk>>(
                    error_codes::common_errors::not_initialized,
                    "No producer function", "function_chunk_source");
            }
            return next_(index);
        }

        auto release() -> void override
        {
            next_ = nullptr;
            if (auto fn = std::exchange(release_, nullptr))
            {
                fn();
            }
        }

    private:
        next_fn next_;
        release_fn release_;
    };

} // namespace kcenon::stream::sources
