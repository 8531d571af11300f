// =================================================================
// include/Sieve/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Sieve/CliParser.hpp"
#include "Sieve/FileRecord.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Sieve {
    class ConfigParser;
    class ListingClient;
    class SelectionReconciler;
    class SysInteraction;
}

namespace Sieve {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleList();
    int handleSelect();
    int handleFilter();
    int handleApplyJob();

    int dispatch();
    void setupLogging();

    /**
     * @brief Build the listing client selected by listing.backend
     */
    std::shared_ptr<ListingClient> createListingClient() const;

    /**
     * @brief Load the project listing through DirectoryLoader, retries included
     * @param files Receives the records on success
     * @return false if the listing failed after all retries
     */
    bool loadListing(const std::string& directory, FileMap& files);

    std::string projectDirectory() const;

    void printSelectionSummary(const SelectionReconciler& reconciler) const;

    const Commands& m_commands;
    std::unique_ptr<ConfigParser> m_config;
    std::unique_ptr<SysInteraction> m_sys;
};

} // namespace Sieve
