// =================================================================
// include/Sieve/SessionFile.hpp
// =================================================================
// Defines the JSON session store used by the command-line front end.

#pragma once

#include "Sieve/SelectionReconciler.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>

namespace Sieve {

class SysInteraction;

/**
 * @brief A session saved as JSON with "includedFiles" and "excludedFiles"
 *
 * Other keys in the document are preserved on save. The file receives the
 * reconciler's list updates as its observer.
 */
class SessionFile : public SelectionObserver {
public:
    SessionFile(const std::string& path, SysInteraction& sys);

    /**
     * @brief Read the session; a missing file is an empty session
     * @throws nlohmann::json::exception on malformed JSON or wrong field types
     * @throws std::runtime_error if the file exists but cannot be read or
     *         does not hold a JSON object
     */
    void load();

    /**
     * @brief Write the session back
     * @return false if the file could not be written
     */
    bool save() const;

    const std::vector<std::string>& getIncludedFiles() const { return m_included; }
    const std::vector<std::string>& getExcludedFiles() const { return m_excluded; }
    const std::string& getPath() const { return m_path; }

    /// A list changed since load()
    bool isDirty() const { return m_dirty; }

    void onIncludedFilesChanged(const std::vector<std::string>& included) override;
    void onExcludedFilesChanged(const std::vector<std::string>& excluded) override;
    void onPathWarnings(const std::vector<std::string>& warnings) override;

    const std::vector<std::string>& getWarnings() const { return m_warnings; }

    /**
     * @brief Decode a session document
     * @throws nlohmann::json::exception, std::runtime_error
     */
    static nlohmann::json parse(const std::string& text,
                                std::vector<std::string>& included,
                                std::vector<std::string>& excluded);

private:
    std::string m_path;
    SysInteraction& m_sys;
    nlohmann::json m_document;
    std::vector<std::string> m_included;
    std::vector<std::string> m_excluded;
    std::vector<std::string> m_warnings;
    bool m_dirty = false;
};

} // namespace Sieve
