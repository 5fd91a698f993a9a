/**
 * \file coroIoContext.cpp
 * \brief Operational implementation for `transport::CoroIoContext`.
 * \details Pending operations are stolen in one batch (swap with a local vector) so that
 * coroutines resumed during the pass can register new operations without contention;
 * unfinished operations are requeued behind them.
 */
#include "coroIoContext.hpp"
#include <exception>
#include <string>

namespace transport {

CoroIoContext::CoroIoContext() = default;

void CoroIoContext::set_logger(std::shared_ptr<Logger> logger) { logger_ = std::move(logger); }
std::shared_ptr<Logger> CoroIoContext::get_logger() const { return logger_; }

void CoroIoContext::set_poll_interval(std::chrono::milliseconds interval) {
    if (interval.count() < 1) interval = std::chrono::milliseconds(1);
    poll_interval_ = interval;
}

void CoroIoContext::wake() {
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        wake_requested_ = true;
    }
    pending_cv_.notify_one();
}

void CoroIoContext::run_until(const std::function<bool()>& done) {
    if (logger_) logger_->debug("CoroIoContext loop started");
    while (!done()) {
        size_t completed = 0;
        try {
            completed = process_pending_ops();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Exception in event loop: " + std::string(e.what()));
        }
        if (completed > 0) continue;
        if (done()) break;
        // Nothing became ready; sleep until woken or the poll interval passes.
        std::unique_lock<std::mutex> lk(pending_mutex_);
        pending_cv_.wait_for(lk, poll_interval_, [this]() { return wake_requested_; });
        wake_requested_ = false;
    }
    if (logger_) logger_->debug("CoroIoContext loop finished");
}

size_t CoroIoContext::process_pending_ops() {
    std::vector<PendingOp> fetched;
    std::vector<PendingOp> requeue;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        if (pending_ops_.empty()) {
            return 0;
        }
        fetched.swap(pending_ops_);
    }

    size_t completed_count = 0;
    for (auto &op : fetched) {
        bool completed = false;
        try {
            if (op.try_complete) completed = op.try_complete();
        } catch (const std::exception &e) {
            if (logger_) logger_->error(std::string("Error in try_complete: ") + e.what());
            completed = true; // resume so the awaiting coroutine can observe its own error state
        }
        if (!completed) {
            requeue.push_back(std::move(op));
            continue;
        }
        ++completed_count;
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            ++total_operations_processed_;
            size_t cat_idx = static_cast<size_t>(op.category);
            if (cat_idx >= category_count_) cat_idx = 0;
            ++completions_by_category_[cat_idx];
        }
        auto h = op.handle;
        if (h && !h.done()) {
            h.resume();
        }
    }

    if (!requeue.empty()) {
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            total_failed_attempts_ += requeue.size();
        }
        std::lock_guard<std::mutex> lk(pending_mutex_);
        for (auto &op : requeue) {
            pending_ops_.push_back(std::move(op));
        }
    }
    return completed_count;
}

void CoroIoContext::register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    register_pending(PendingOpCategory::Generic, std::move(try_complete), handle);
}

void CoroIoContext::register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    std::lock_guard<std::mutex> lk(pending_mutex_);
    PendingOp op{};
    op.try_complete = std::move(try_complete);
    op.handle = handle;
    op.category = category;
    pending_ops_.push_back(std::move(op));
}

std::array<size_t, CoroIoContext::category_count_> CoroIoContext::get_completions_by_category() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return completions_by_category_;
}

size_t CoroIoContext::get_total_operations_processed() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return total_operations_processed_;
}

size_t CoroIoContext::get_total_failed_attempts() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return total_failed_attempts_;
}

const char* CoroIoContext::category_name(PendingOpCategory category) {
    switch (category) {
        case PendingOpCategory::Generic: return "Generic";
        case PendingOpCategory::QueuePush: return "QueuePush";
        case PendingOpCategory::QueuePop: return "QueuePop";
        case PendingOpCategory::LocalRead: return "LocalRead";
        case PendingOpCategory::LocalWrite: return "LocalWrite";
        case PendingOpCategory::Send: return "Send";
        case PendingOpCategory::Receive: return "Receive";
        case PendingOpCategory::Join: return "Join";
        default: return "Unknown";
    }
}

std::string CoroIoContext::format_statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    std::string out = "ops=" + std::to_string(total_operations_processed_) +
                      " retries=" + std::to_string(total_failed_attempts_) + " [";
    bool first = true;
    for (size_t cat = 0; cat < category_count_; ++cat) {
        if (completions_by_category_[cat] == 0) continue;
        if (!first) out += " ";
        first = false;
        out += std::string(category_name(static_cast<PendingOpCategory>(cat))) + "=" +
               std::to_string(completions_by_category_[cat]);
    }
    out += "]";
    return out;
}

} // namespace transport
