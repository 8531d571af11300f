// =================================================================
// include/Sieve/FileJobSource.hpp
// =================================================================
// Job status source backed by a JSON file exported from the job store.

#pragma once

#include "Sieve/RelevantFilesPoller.hpp"
#include <string>

namespace Sieve {

class SysInteraction;

/**
 * @brief Re-reads one job file on every poll
 *
 * An unreadable or half-written file is reported as "not known yet" so the
 * poller tries again on the next tick.
 */
class FileJobSource : public JobStatusSource {
public:
    FileJobSource(const std::string& job_file, SysInteraction& sys);

    std::optional<JobRecord> fetchJob(const std::string& job_id) override;

private:
    std::string m_job_file;
    SysInteraction& m_sys;
};

} // namespace Sieve
