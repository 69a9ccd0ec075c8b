/**
 * AnalysisScheduler.hpp - Debounced, cancellable background analysis of the input line
 */

#pragma once

#include "hint/Suggestion.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace hint {

class SuggestionEngine;

class AnalysisScheduler {
public:
    // Runs on the worker thread (or on the caller for short input).
    // Must not call back into the scheduler.
    using Callback = std::function<void(const std::string& input, const AnalyzeResult& result)>;

    AnalysisScheduler(SuggestionEngine& engine, std::chrono::milliseconds debounce,
                      size_t min_input_length, Callback callback);
    ~AnalysisScheduler();

    AnalysisScheduler(const AnalysisScheduler&) = delete;
    AnalysisScheduler& operator=(const AnalysisScheduler&) = delete;

    // Replaces any pending request and restarts the quiet period
    void submit(const std::string& input, const TerminalContext& context);

    // Drops the pending request; a result already being computed is never delivered.
    // Returns after any delivery in progress has finished.
    void cancel();

    uint64_t generation() const;
    size_t deliveredCount() const;

private:
    struct Request {
        std::string input;
        TerminalContext context;
        uint64_t token;
        std::chrono::steady_clock::time_point deadline;
    };

    SuggestionEngine& engine_;
    std::chrono::milliseconds debounce_;
    size_t min_input_length_;
    Callback callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Request> pending_;
    uint64_t generation_ = 0;
    size_t delivered_ = 0;
    bool stop_worker_ = false;

    // Held while a result is handed to the callback
    std::mutex delivery_mutex_;

    std::thread worker_;

    void workerLoop();
    void deliver(const Request& request, const AnalyzeResult& result);
};

} // namespace hint
