/**
 * @file stream_writer_bench.cpp
 * @brief Per-chunk overhead of the writer, the flow controller and chunk framing
 */

#include <benchmark/benchmark.h>

#include "kcenon/stream/core/flow_controller.h"
#include "kcenon/stream/core/stream_writer.h"
#include "kcenon/stream/integration/logger_integration.h"
#include "kcenon/stream/session/response_session_base.h"
#include "kcenon/stream/session/tcp_response_session.h"
#include "kcenon/stream/sources/buffer_chunk_source.h"

#include <asio/io_context.hpp>

#include <memory>
#include <vector>

using namespace kcenon::stream;

namespace {

// Session that drains every write immediately and discards the bytes.
class null_session : public session::response_session_base {
protected:
    auto do_write_headers(const interfaces::response_head&) -> Result<core::flow_signal> override {
        return core::flow_signal::fulfilled();
    }
    auto do_write_chunk(core::chunk data) -> Result<core::flow_signal> override {
        benchmark::DoNotOptimize(data.data().data());
        return core::flow_signal::fulfilled();
    }
    auto do_close() -> VoidResult override { return ok(); }
    auto do_abort(const error_info&) -> VoidResult override { return ok(); }
};

void quiet_logging() {
    integration::logger_integration_manager::instance().set_logger(
        std::make_shared<integration::basic_logger>(integration::log_level::error));
}

} // namespace

static void BM_StreamWriter_FullStream(benchmark::State& state) {
    quiet_logging();
    const auto chunk_size = static_cast<size_t>(state.range(0));
    const std::vector<uint8_t> body(1024 * 1024, 0x5a);

    for (auto _ : state) {
        asio::io_context io;
        auto writer = core::stream_writer::create(
            io.get_executor(), std::make_shared<null_session>(),
            std::make_unique<sources::buffer_chunk_source>(body, chunk_size));
        (void)writer->start();
        io.run();
        benchmark::DoNotOptimize(writer->chunks_written());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(body.size()));
}
BENCHMARK(BM_StreamWriter_FullStream)->Arg(1024)->Arg(8192)->Arg(65536);

static void BM_FlowController_WriteDrainCycle(benchmark::State& state) {
    core::flow_controller flow;
    for (auto _ : state) {
        core::flow_signal drained;
        (void)flow.on_chunk_written(drained, 4096);
        auto consumed = flow.await_consumed();
        drained.fulfill();
        benchmark::DoNotOptimize(consumed.is_fulfilled());
    }
}
BENCHMARK(BM_FlowController_WriteDrainCycle);

static void BM_ChunkFraming(benchmark::State& state) {
    const std::vector<uint8_t> payload(static_cast<size_t>(state.range(0)), 0x41);
    for (auto _ : state) {
        auto frame = session::frame_chunk(payload);
        benchmark::DoNotOptimize(frame.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(payload.size()));
}
BENCHMARK(BM_ChunkFraming)->Arg(64)->Arg(8192)->Arg(65536);
