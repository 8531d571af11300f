// =================================================================
// include/Sieve/RelevantFilesPoller.hpp
// =================================================================
// Header for following a relevant-files job until it finishes and merging
// its result into the selection.

#pragma once

#include "Sieve/EventLoop.hpp"
#include "Sieve/RelevantFilesParser.hpp"
#include "Sieve/SelectionReconciler.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Sieve {

/**
 * @brief Source of job snapshots, e.g. a job store or a file on disk
 */
class JobStatusSource {
public:
    virtual ~JobStatusSource() = default;

    /**
     * @brief Look up the current state of a job
     * @return The job, or std::nullopt if it is not known (yet)
     * @throws std::runtime_error on transport failure
     */
    virtual std::optional<JobRecord> fetchJob(const std::string& job_id) = 0;
};

struct PollerOptions {
    std::chrono::milliseconds poll_interval{1000};
    int max_polls = 120;
    bool merge_with_existing = true;    ///< Passed to applyFromPaths
};

enum class JobPollState {
    IDLE,
    POLLING,
    COMPLETED,
    FAILED,
    CANCELED,
    TIMED_OUT
};

/**
 * @brief Polls one job at a time on the event loop
 *
 * Starting a new job supersedes the previous one; snapshots of the old job
 * that are still queued are dropped. When the job completes its paths are
 * extracted and applied to the reconciler.
 */
class RelevantFilesPoller {
public:
    using CompletionCallback = std::function<void(JobPollState, const SelectionResult&)>;

    RelevantFilesPoller(EventLoop& loop, std::shared_ptr<JobStatusSource> source,
                        SelectionReconciler& reconciler,
                        const PollerOptions& options = PollerOptions());

    ~RelevantFilesPoller();

    RelevantFilesPoller(const RelevantFilesPoller&) = delete;
    RelevantFilesPoller& operator=(const RelevantFilesPoller&) = delete;

    void setCompletionCallback(CompletionCallback callback);

    /**
     * @brief Begin polling a job; the first poll is posted immediately
     * @param job_id Job to follow
     * @param project_directory Root used to relativize absolute result paths
     */
    void start(const std::string& job_id, const std::string& project_directory);

    /**
     * @brief Stop polling; the state becomes CANCELED if a poll was active
     */
    void cancel();

    JobPollState getState() const { return m_state; }
    const std::string& getJobId() const { return m_job_id; }
    const std::string& getError() const { return m_error; }
    const SelectionResult& getLastResult() const { return m_last_result; }
    int getPollCount() const { return m_poll_count; }
    bool isPolling() const { return m_state == JobPollState::POLLING; }

    static std::string stateName(JobPollState state);

private:
    EventLoop& m_loop;
    std::shared_ptr<JobStatusSource> m_source;
    SelectionReconciler& m_reconciler;
    PollerOptions m_options;
    CompletionCallback m_callback;

    JobPollState m_state = JobPollState::IDLE;
    std::string m_job_id;
    std::string m_project_directory;
    std::string m_error;
    SelectionResult m_last_result;
    int m_poll_count = 0;
    uint64_t m_generation = 0;
    std::optional<EventLoop::TimerId> m_timer;

    std::shared_ptr<bool> m_alive;

    void pollOnce(uint64_t generation);
    void scheduleNext(uint64_t generation);
    void finish(JobPollState state, const std::string& error);
    void cancelTimer();
};

} // namespace Sieve
