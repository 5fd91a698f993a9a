/**
 * \file coroIoContext.hpp
 * \brief Cooperative scheduler for the relay's coroutine tasks.
 * \details Suspended coroutines register non-blocking `try_complete()` functors; the loop
 * polls them and resumes the associated handle once the functor reports completion.
 * The loop is driven on the calling thread by `run_until()`. Background producers of
 * readiness (the WebSocket I/O thread) call `wake()` so the loop re-polls at once instead
 * of waiting out the idle poll interval.
 */
#pragma once

#include "logger.hpp"
#include <memory>
#include <atomic>
#include <mutex>
#include <coroutine>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <vector>
#include <functional>
#include <array>
#include <string>

namespace transport {

/** \defgroup coro_context I/O Context
 *  \ingroup coro_module
 *  \brief Event-loop for coroutine scheduling and pending operation polling.
 */

/** \brief Coroutine-aware event loop that polls pending operations and resumes coroutines.
 *  \details Single-threaded by design: every coroutine is resumed on the thread running
 *  `run_until()`. Other threads may only call `wake()`.
 *  \ingroup coro_context
 */
class CoroIoContext : public std::enable_shared_from_this<CoroIoContext> {
public:
	CoroIoContext();
	~CoroIoContext() = default;

	/** \brief Classification of suspension points, used for completion counters. */
	enum class PendingOpCategory : uint8_t { Generic = 0, QueuePush, QueuePop, LocalRead, LocalWrite, Send, Receive, Join, Count };
	static constexpr size_t category_count_ = static_cast<size_t>(PendingOpCategory::Count);

	// --- Driving the loop ---
	/** \brief Poll and resume pending operations on the current thread until `done()` is true.
	 *  \details Sleeps up to the poll interval whenever a pass completes nothing; `wake()`
	 *  cuts the sleep short.
	 */
	void run_until(const std::function<bool()>& done);
	/** \brief Request an immediate re-poll (callable from any thread). */
	void wake();

	/** \brief Upper bound on idle sleep before pending operations are re-polled. */
	void set_poll_interval(std::chrono::milliseconds interval);
	std::chrono::milliseconds poll_interval() const { return poll_interval_; }

	// --- Logger ---
	void set_logger(std::shared_ptr<Logger> logger);
	std::shared_ptr<Logger> get_logger() const;

	// --- Pending operations registration ---
	/** \brief Register a pending operation; resumes `handle` when predicate returns true. */
	void register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle);
	/** \brief Register a categorized pending operation. */
	void register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle);

	/** \brief Awaitable that suspends the caller until `ready()` returns true.
	 *  \details Used to join sibling tasks: `co_await ctx->wait_until([&]{ return a.done() && b.done(); });`
	 */
	auto wait_until(std::function<bool()> ready) {
		struct ConditionAwaitable {
			std::shared_ptr<CoroIoContext> ctx;
			std::function<bool()> ready;
			bool await_ready() const { return ready(); }
			void await_suspend(std::coroutine_handle<> handle) {
				ctx->register_pending(PendingOpCategory::Join, ready, handle);
			}
			void await_resume() const noexcept {}
		};
		return ConditionAwaitable{shared_from_this(), std::move(ready)};
	}

	// --- Statistics ---
	/** \brief Completed suspensions per category. */
	std::array<size_t, category_count_> get_completions_by_category() const;
	/** \brief Total resumptions performed. */
	size_t get_total_operations_processed() const;
	/** \brief Number of polls that found an operation not yet ready. */
	size_t get_total_failed_attempts() const;
	/** \brief One-line summary, e.g. "ops=12 retries=40 [QueuePush=3 QueuePop=3 ...]". */
	std::string format_statistics() const;

	static const char* category_name(PendingOpCategory category);

private:
	/** \brief Run every pending predicate once; returns how many operations completed. */
	size_t process_pending_ops();

	/** \brief Internal representation of a pending operation awaiting readiness. */
	struct PendingOp {
		std::function<bool()> try_complete;      ///< Readiness predicate/work attempt
		std::coroutine_handle<> handle;          ///< Coroutine to resume on success
		PendingOpCategory category{PendingOpCategory::Generic};
	};
	std::vector<PendingOp> pending_ops_;
	std::mutex pending_mutex_;
	std::condition_variable pending_cv_;
	bool wake_requested_{false};

	std::shared_ptr<Logger> logger_;
	std::chrono::milliseconds poll_interval_{std::chrono::milliseconds(10)};

	mutable std::mutex stats_mutex_;
	size_t total_operations_processed_{0};
	size_t total_failed_attempts_{0};
	std::array<size_t, category_count_> completions_by_category_{};
};

} // namespace transport
