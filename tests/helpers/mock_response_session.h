/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, kcenon
All rights reserved.
*****************************************************************************/

#pragma once

#include "kcenon/stream/session/response_session_base.h"

#include <asio/any_io_executor.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::stream::testing
{

/**
 * @brief How a mock session fulfils flow signals
 */
enum class drain_mode
{
	immediate, ///< Signal fulfilled before write returns
	manual,    ///< Test calls drain_next()
	deferred   ///< Fulfilment posted to an executor
};

/**
 * @brief One call recorded by mock_response_session
 */
struct recorded_event
{
	enum class kind
	{
		headers,
		chunk,
		close,
		abort
	};

	kind type;
	uint64_t index{0};
	std::vector<uint8_t> payload;
	bool last{false};
	int status_code{0};
	std::string abort_message;
	int abort_code{0};
};

/**
 * @brief Recording i_response_session double
 *
 * Records every call in order and tracks how many flow signals are
 * outstanding. Failures can be injected per chunk index. Thread-safe.
 */
class mock_response_session : public session::response_session_base
{
public:
	explicit mock_response_session(drain_mode mode = drain_mode::immediate,
								   asio::any_io_executor executor = {})
		: mode_(mode), executor_(std::move(executor))
	{
	}

	// Failure injection
	void fail_write_at(uint64_t index) { fail_write_at_ = index; }
	void fail_drain_at(uint64_t index) { fail_drain_at_ = index; }
	void fail_headers() { fail_headers_ = true; }
	void fail_close() { fail_close_ = true; }

	/**
	 * @brief Called after each accepted chunk write, outside the lock
	 */
	void set_on_chunk(std::function<void(uint64_t)> fn) { on_chunk_ = std::move(fn); }

	/**
	 * @brief Fulfil the oldest outstanding signal (manual mode)
	 * @return false if nothing was outstanding
	 */
	bool drain_next(std::error_code ec = {})
	{
		core::flow_signal signal;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (pending_.empty())
			{
				return false;
			}
			signal = pending_.front();
			pending_.pop_front();
		}
		settle(signal, ec);
		return true;
	}

	/**
	 * @brief Raise peer-disconnect cancellation
	 */
	void simulate_disconnect() { notify_cancelled(); }

	// Inspection
	std::vector<recorded_event> events() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return events_;
	}

	std::vector<uint64_t> chunk_indices() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		std::vector<uint64_t> out;
		for (const auto& e : events_)
		{
			if (e.type == recorded_event::kind::chunk)
			{
				out.push_back(e.index);
			}
		}
		return out;
	}

	std::vector<size_t> chunk_sizes() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		std::vector<size_t> out;
		for (const auto& e : events_)
		{
			if (e.type == recorded_event::kind::chunk)
			{
				out.push_back(e.payload.size());
			}
		}
		return out;
	}

	int headers_calls() const { return count(recorded_event::kind::headers); }
	int chunk_calls() const { return count(recorded_event::kind::chunk); }
	int close_calls() const { return count(recorded_event::kind::close); }
	int abort_calls() const { return count(recorded_event::kind::abort); }

	size_t outstanding() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return outstanding_;
	}

	size_t max_outstanding() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return max_outstanding_;
	}

	size_t pending_manual() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return pending_.size();
	}

	std::optional<recorded_event> last_abort() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		for (auto it = events_.rbegin(); it != events_.rend(); ++it)
		{
			if (it->type == recorded_event::kind::abort)
			{
				return *it;
			}
		}
		return std::nullopt;
	}

protected:
	auto do_write_headers(const interfaces::response_head& head)
		-> Result<core::flow_signal> override
	{
		recorded_event e{recorded_event::kind::headers};
		e.status_code = head.status_code;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			events_.push_back(std::move(e));
		}
		if (fail_headers_)
		{
			return error<core::flow_signal>(error_codes::stream_system::transport_error,
											"simulated header failure", "mock_response_session");
		}
		return issue(std::error_code{});
	}

	auto do_write_chunk(core::chunk data) -> Result<core::flow_signal> override
	{
		const auto index = data.index();
		if (fail_write_at_ && *fail_write_at_ == index)
		{
			return error<core::flow_signal>(error_codes::stream_system::transport_error,
											"simulated write failure", "mock_response_session");
		}

		recorded_event e{recorded_event::kind::chunk};
		e.index = index;
		e.last = data.is_last();
		e.payload = std::move(data).release();
		{
			std::lock_guard<std::mutex> lock(mutex_);
			events_.push_back(std::move(e));
		}

		std::error_code ec;
		if (fail_drain_at_ && *fail_drain_at_ == index)
		{
			ec = asio::error::connection_reset;
		}

		auto signal = issue(ec);
		if (on_chunk_)
		{
			on_chunk_(index);
		}
		return signal;
	}

	auto do_close() -> VoidResult override
	{
		{
			std::lock_guard<std::mutex> lock(mutex_);
			events_.push_back(recorded_event{recorded_event::kind::close});
		}
		if (fail_close_)
		{
			return error_void(error_codes::stream_system::transport_error,
							  "simulated close failure", "mock_response_session");
		}
		return ok();
	}

	auto do_abort(const error_info& reason) -> VoidResult override
	{
		recorded_event e{recorded_event::kind::abort};
		e.abort_message = reason.message;
		e.abort_code = reason.code;
		std::lock_guard<std::mutex> lock(mutex_);
		events_.push_back(std::move(e));
		return ok();
	}

private:
	core::flow_signal issue(std::error_code ec)
	{
		core::flow_signal signal;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			++outstanding_;
			if (outstanding_ > max_outstanding_)
			{
				max_outstanding_ = outstanding_;
			}
		}

		switch (mode_)
		{
		case drain_mode::immediate:
			settle(signal, ec);
			break;
		case drain_mode::manual:
			if (ec)
			{
				// Failed drains do not wait for the test.
				settle(signal, ec);
			}
			else
			{
				std::lock_guard<std::mutex> lock(mutex_);
				pending_.push_back(signal);
			}
			break;
		case drain_mode::deferred:
			asio::post(executor_, [this, signal, ec]() { settle(signal, ec); });
			break;
		}
		return signal;
	}

	void settle(const core::flow_signal& signal, std::error_code ec)
	{
		{
			std::lock_guard<std::mutex> lock(mutex_);
			--outstanding_;
		}
		signal.fulfill(ec);
	}

	int count(recorded_event::kind k) const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		int n = 0;
		for (const auto& e : events_)
		{
			if (e.type == k)
			{
				++n;
			}
		}
		return n;
	}

	drain_mode mode_;
	asio::any_io_executor executor_;

	std::optional<uint64_t> fail_write_at_;
	std::optional<uint64_t> fail_drain_at_;
	bool fail_headers_{false};
	bool fail_close_{false};
	std::function<void(uint64_t)> on_chunk_;

	mutable std::mutex mutex_;
	std::vector<recorded_event> events_;
	std::deque<core::flow_signal> pending_;
	size_t outstanding_{0};
	size_t max_outstanding_{0};
};

} // namespace kcenon::stream::testing
