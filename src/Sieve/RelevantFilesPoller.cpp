// =================================================================
// src/Sieve/RelevantFilesPoller.cpp
// =================================================================
// Implementation for the relevant-files job poller.

#include "Sieve/RelevantFilesPoller.hpp"
#include "Sieve/Logger.hpp"
#include <stdexcept>

namespace Sieve {

RelevantFilesPoller::RelevantFilesPoller(EventLoop& loop, std::shared_ptr<JobStatusSource> source,
                                         SelectionReconciler& reconciler,
                                         const PollerOptions& options)
    : m_loop(loop),
      m_source(std::move(source)),
      m_reconciler(reconciler),
      m_options(options),
      m_alive(std::make_shared<bool>(true)) {}

RelevantFilesPoller::~RelevantFilesPoller() {
    cancelTimer();
}

void RelevantFilesPoller::setCompletionCallback(CompletionCallback callback) {
    m_callback = std::move(callback);
}

void RelevantFilesPoller::start(const std::string& job_id, const std::string& project_directory) {
    if (m_state == JobPollState::POLLING) {
        LOG_DEBUG("RelevantFilesPoller", "Job " + m_job_id + " superseded by " + job_id);
    }
    cancelTimer();

    m_generation++;
    m_job_id = job_id;
    m_project_directory = project_directory;
    m_error.clear();
    m_last_result = SelectionResult();
    m_poll_count = 0;
    m_state = JobPollState::POLLING;

    LOG_INFO("RelevantFilesPoller", "Following job " + job_id);

    uint64_t generation = m_generation;
    std::weak_ptr<bool> alive = m_alive;
    m_timer = m_loop.post([this, alive, generation]() {
        if (alive.expired()) {
            return;
        }
        m_timer.reset();
        pollOnce(generation);
    });
}

void RelevantFilesPoller::cancel() {
    cancelTimer();
    m_generation++;
    if (m_state == JobPollState::POLLING) {
        LOG_INFO("RelevantFilesPoller", "Stopped following job " + m_job_id);
        finish(JobPollState::CANCELED, "");
    }
}

std::string RelevantFilesPoller::stateName(JobPollState state) {
    switch (state) {
        case JobPollState::IDLE: return "idle";
        case JobPollState::POLLING: return "polling";
        case JobPollState::COMPLETED: return "completed";
        case JobPollState::FAILED: return "failed";
        case JobPollState::CANCELED: return "canceled";
        case JobPollState::TIMED_OUT: return "timed out";
        default: return "unknown";
    }
}

void RelevantFilesPoller::pollOnce(uint64_t generation) {
    if (generation != m_generation || m_state != JobPollState::POLLING) {
        return;
    }

    m_poll_count++;

    std::optional<JobRecord> job;
    try {
        job = m_source->fetchJob(m_job_id);
    } catch (const std::runtime_error& e) {
        // Transport hiccups are retried on the next tick
        LOG_WARNING("RelevantFilesPoller", "Status check for job " + m_job_id + " failed: " + e.what());
    }

    if (generation != m_generation) {
        return;
    }

    if (job && !job->id.empty() && job->id != m_job_id) {
        LOG_DEBUG("RelevantFilesPoller", "Ignoring snapshot of job " + job->id);
        job.reset();
    }

    if (job && job->isTerminal()) {
        if (job->status == "completed") {
            RelevantFilesParser parser(m_project_directory);
            std::vector<std::string> paths = parser.extractPaths(*job);
            m_last_result = m_reconciler.applyFromPaths(paths, m_options.merge_with_existing);
            LOG_INFO("RelevantFilesPoller", "Job " + m_job_id + " completed with " +
                     std::to_string(paths.size()) + " paths, " +
                     std::to_string(m_last_result.matched) + " matched");
            finish(JobPollState::COMPLETED, "");
        } else if (job->status == "canceled") {
            finish(JobPollState::CANCELED, job->error_message);
        } else {
            std::string error = job->error_message.empty() ? "Job failed" : job->error_message;
            LOG_WARNING("RelevantFilesPoller", "Job " + m_job_id + " failed: " + error);
            finish(JobPollState::FAILED, error);
        }
        return;
    }

    if (m_poll_count >= m_options.max_polls) {
        LOG_WARNING("RelevantFilesPoller", "Gave up on job " + m_job_id + " after " +
                    std::to_string(m_poll_count) + " polls");
        finish(JobPollState::TIMED_OUT, "Timed out waiting for job " + m_job_id);
        return;
    }

    scheduleNext(generation);
}

void RelevantFilesPoller::scheduleNext(uint64_t generation) {
    std::weak_ptr<bool> alive = m_alive;
    m_timer = m_loop.schedule(m_options.poll_interval, [this, alive, generation]() {
        if (alive.expired()) {
            return;
        }
        m_timer.reset();
        pollOnce(generation);
    });
}

void RelevantFilesPoller::finish(JobPollState state, const std::string& error) {
    m_state = state;
    m_error = error;
    if (m_callback) {
        m_callback(m_state, m_last_result);
    }
}

void RelevantFilesPoller::cancelTimer() {
    if (m_timer) {
        m_loop.cancel(*m_timer);
        m_timer.reset();
    }
}

} // namespace Sieve
