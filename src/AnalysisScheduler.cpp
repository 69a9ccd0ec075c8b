/**
 * AnalysisScheduler.cpp - Debounced, cancellable background analysis of the input line
 */

#include "hint/AnalysisScheduler.hpp"
#include "hint/CommandParser.hpp"
#include "hint/Log.hpp"
#include "hint/SuggestionEngine.hpp"

#include <algorithm>

namespace hint {

AnalysisScheduler::AnalysisScheduler(SuggestionEngine& engine, std::chrono::milliseconds debounce,
                                     size_t min_input_length, Callback callback)
    : engine_(engine),
      debounce_(debounce),
      min_input_length_(min_input_length),
      callback_(std::move(callback)) {
    worker_ = std::thread([this]() { workerLoop(); });
}

AnalysisScheduler::~AnalysisScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_worker_ = true;
        generation_++;
        pending_.reset();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AnalysisScheduler::submit(const std::string& input, const TerminalContext& context) {
    if (trim(input).size() < std::max<size_t>(min_input_length_, 1)) {
        cancel();
        Request request{input, context, 0, std::chrono::steady_clock::now()};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request.token = generation_;
        }
        deliver(request, AnalyzeResult{});
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation_++;
        pending_ = Request{input, context, generation_, std::chrono::steady_clock::now() + debounce_};
    }
    cv_.notify_all();
}

void AnalysisScheduler::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation_++;
        pending_.reset();
    }
    cv_.notify_all();

    // Wait out a delivery that passed its token check before the bump
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
}

uint64_t AnalysisScheduler::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

size_t AnalysisScheduler::deliveredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

void AnalysisScheduler::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        cv_.wait(lock, [this]() { return stop_worker_ || pending_.has_value(); });
        if (stop_worker_) {
            return;
        }

        // Sleep until the deadline of whatever request is pending; a newer submit moves it
        while (pending_ && !stop_worker_ && std::chrono::steady_clock::now() < pending_->deadline) {
            auto deadline = pending_->deadline;
            cv_.wait_until(lock, deadline);
        }
        if (stop_worker_) {
            return;
        }
        if (!pending_) {
            continue;
        }

        Request request = std::move(*pending_);
        pending_.reset();

        lock.unlock();
        AnalyzeResult result = engine_.analyze(request.input, request.context);
        deliver(request, result);
        lock.lock();
    }
}

void AnalysisScheduler::deliver(const Request& request, const AnalyzeResult& result) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (request.token != generation_ || stop_worker_) {
            log::debug("scheduler", "discarding stale result for '" + request.input + "'");
            return;
        }
        delivered_++;
    }

    if (callback_) {
        callback_(request.input, result);
    }
}

} // namespace hint
