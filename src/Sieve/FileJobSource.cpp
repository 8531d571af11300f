// =================================================================
// src/Sieve/FileJobSource.cpp
// =================================================================
// Implementation for the file-backed job status source.

#include "Sieve/FileJobSource.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/SysInteraction.hpp"

namespace Sieve {

FileJobSource::FileJobSource(const std::string& job_file, SysInteraction& sys)
    : m_job_file(job_file), m_sys(sys) {}

std::optional<JobRecord> FileJobSource::fetchJob(const std::string& job_id) {
    if (!m_sys.fileExists(m_job_file)) {
        LOG_DEBUG("FileJobSource", "Job file " + m_job_file + " not present yet");
        return std::nullopt;
    }

    try {
        JobRecord job = JobRecord::fromJson(nlohmann::json::parse(m_sys.readFile(m_job_file)));
        if (job.id.empty()) {
            job.id = job_id;
        }
        return job;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING("FileJobSource", "Unreadable job file " + m_job_file + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace Sieve
