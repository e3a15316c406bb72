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
 * @file stream_system.h
 * @brief Umbrella header for stream_system
 *
 * Backpressure-aware streaming of chunked responses: a stream_writer pulls
 * chunks from a chunk_source and writes them to an i_response_session,
 * producing the next chunk only after the previous one has drained.
 *
 * @author kcenon
 * @date 2025-01-13
 */

#include "kcenon/stream/types/result.h"

#include "kcenon/stream/config/stream_config.h"
#include "kcenon/stream/integration/logger_integration.h"
#include "kcenon/stream/integration/thread_integration.h"

#include "kcenon/stream/core/chunk.h"
#include "kcenon/stream/core/chunk_source.h"
#include "kcenon/stream/core/flow_controller.h"
#include "kcenon/stream/core/flow_signal.h"
#include "kcenon/stream/core/stream_context.h"
#include "kcenon/stream/core/stream_state.h"
#include "kcenon/stream/core/stream_writer.h"

#include "kcenon/stream/interfaces/i_response_session.h"
#include "kcenon/stream/session/response_session_base.h"
#include "kcenon/stream/session/tcp_response_session.h"

#include "kcenon/stream/sources/buffer_chunk_source.h"
#include "kcenon/stream/sources/file_chunk_source.h"
#include "kcenon/stream/sources/function_chunk_source.h"

#include "kcenon/stream/http/error_handler_chain.h"
#include "kcenon/stream/http/http_status.h"
