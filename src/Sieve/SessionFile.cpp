// =================================================================
// src/Sieve/SessionFile.cpp
// =================================================================
// Implementation for the JSON session store.

#include "Sieve/SessionFile.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/SysInteraction.hpp"
#include <stdexcept>

namespace Sieve {

namespace {

std::vector<std::string> readList(const nlohmann::json& document, const char* key) {
    if (!document.contains(key) || document.at(key).is_null()) {
        return {};
    }
    return document.at(key).get<std::vector<std::string>>();
}

} // namespace

SessionFile::SessionFile(const std::string& path, SysInteraction& sys)
    : m_path(path), m_sys(sys), m_document(nlohmann::json::object()) {}

void SessionFile::load() {
    m_dirty = false;
    m_warnings.clear();

    if (!m_sys.fileExists(m_path)) {
        LOG_INFO("SessionFile", "No session at " + m_path + ", starting empty");
        m_document = nlohmann::json::object();
        m_included.clear();
        m_excluded.clear();
        return;
    }

    m_document = parse(m_sys.readFile(m_path), m_included, m_excluded);
    LOG_DEBUG("SessionFile", "Loaded " + m_path + ": " + std::to_string(m_included.size()) +
              " included, " + std::to_string(m_excluded.size()) + " excluded");
}

bool SessionFile::save() const {
    nlohmann::json document = m_document;
    document["includedFiles"] = m_included;
    document["excludedFiles"] = m_excluded;

    if (!m_sys.writeFile(m_path, document.dump(2) + "\n")) {
        LOG_ERROR("SessionFile", "Failed to write session " + m_path);
        return false;
    }
    return true;
}

void SessionFile::onIncludedFilesChanged(const std::vector<std::string>& included) {
    m_included = included;
    m_dirty = true;
}

void SessionFile::onExcludedFilesChanged(const std::vector<std::string>& excluded) {
    m_excluded = excluded;
    m_dirty = true;
}

void SessionFile::onPathWarnings(const std::vector<std::string>& warnings) {
    m_warnings = warnings;
}

nlohmann::json SessionFile::parse(const std::string& text,
                                  std::vector<std::string>& included,
                                  std::vector<std::string>& excluded) {
    nlohmann::json document = nlohmann::json::parse(text);
    if (!document.is_object()) {
        throw std::runtime_error("Session must be a JSON object");
    }
    included = readList(document, "includedFiles");
    excluded = readList(document, "excludedFiles");
    return document;
}

} // namespace Sieve
