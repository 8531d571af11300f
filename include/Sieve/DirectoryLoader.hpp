// =================================================================
// include/Sieve/DirectoryLoader.hpp
// =================================================================
// Header for loading a directory listing with dedup, abort and retry.

#pragma once

#include "Sieve/Cancellation.hpp"
#include "Sieve/EventLoop.hpp"
#include "Sieve/FileRecord.hpp"
#include "Sieve/ListingClient.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace Sieve {

/**
 * @brief Retry settings for failed loads
 *
 * The n-th retry (1-based) waits base * 2^(n-1), with the base chosen by
 * the class of the failure.
 */
struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds unsuccessful_base_delay{1000};   ///< Listing reported a failure
    std::chrono::milliseconds exception_base_delay{1500};      ///< Transport threw
};

/**
 * @brief Observable state of the loader
 */
struct DirectoryLoadState {
    std::string directory;        ///< Normalized directory being loaded
    FileMap raw_files;            ///< Last successfully loaded listing
    bool is_loading = false;
    bool is_initialized = false;  ///< Set on success or once retries are exhausted
    std::string error;            ///< Last surfaced error, empty when none
    int retry_count = 0;
};

/**
 * @brief Outcome of a single listing attempt
 */
enum class LoadOutcome {
    SUCCESS,        ///< Listing processed and published
    UNSUCCESSFUL,   ///< Listing answered with an error status, error body or unusable paths
    EXCEPTION,      ///< Transport failure
    ABORTED         ///< Token cancelled or directory superseded
};

/**
 * @brief Receives loader output
 */
class DirectoryLoadListener {
public:
    virtual ~DirectoryLoadListener() = default;

    /**
     * @brief Called with a freshly published listing
     * @param directory Normalized directory the listing belongs to
     * @param files Raw records, every one unselected
     */
    virtual void onFilesLoaded(const std::string& directory, const FileMap& files) = 0;

    /**
     * @brief Called whenever the loading flags, error or retry count change
     */
    virtual void onLoadStateChanged(const DirectoryLoadState& state) { (void)state; }
};

/**
 * @brief Fetches the raw listing of the project directory
 *
 * Concurrent loads of the same directory share one request. Loading another
 * directory, calling refresh() or reset() cancels the active request, and a
 * cancelled request settles its future with false without touching the
 * error. Failed loads are retried on the event loop with exponential backoff
 * until the retry budget is spent, after which the state is marked
 * initialized so callers can render the error.
 *
 * All methods must be called from the thread driving the event loop.
 */
class DirectoryLoader {
public:
    /**
     * @brief Construct a loader
     * @param loop Event loop that runs attempts and retry timers
     * @param client Listing source
     * @param policy Retry budget and backoff bases
     */
    DirectoryLoader(EventLoop& loop, std::shared_ptr<ListingClient> client,
                    const RetryPolicy& policy = RetryPolicy());

    ~DirectoryLoader();

    DirectoryLoader(const DirectoryLoader&) = delete;
    DirectoryLoader& operator=(const DirectoryLoader&) = delete;

    void setListener(DirectoryLoadListener* listener);

    /**
     * @brief Set the stats flag and glob sent with every request
     */
    void setListingOptions(bool include_stats, const std::string& pattern);

    /**
     * @brief Load a directory
     *
     * An empty directory clears the state and marks it initialized. A load of
     * the directory already in flight returns the shared future of that
     * request.
     *
     * @param directory Project directory, any separator style
     * @return Future resolved with true on success
     */
    std::shared_future<bool> load(const std::string& directory);

    /**
     * @brief Reload the current directory, cancelling any active request
     * @param preserve_state Keep retry count and error, used by scheduled retries
     * @return Future resolved with true on success
     */
    std::shared_future<bool> refresh(bool preserve_state = false);

    /**
     * @brief Cancel everything and forget the directory
     */
    void reset();

    const DirectoryLoadState& getState() const { return m_state; }

    bool hasPendingRetry() const { return m_retry_timer.has_value(); }
    size_t inFlightCount() const { return m_in_flight.size(); }

    /**
     * @brief Strip trailing separators and unify the directory spelling
     */
    static std::string normalizeDirectory(const std::string& directory);

    /**
     * @brief Build the user-facing message for a failed listing status
     */
    static std::string describeStatus(int status, const std::string& error_text);

private:
    EventLoop& m_loop;
    std::shared_ptr<ListingClient> m_client;
    RetryPolicy m_policy;
    DirectoryLoadListener* m_listener = nullptr;

    bool m_include_stats = true;
    std::string m_pattern = "**/*";

    struct InFlightRequest {
        std::shared_ptr<std::promise<bool>> promise;
        std::shared_future<bool> future;
    };

    DirectoryLoadState m_state;
    std::map<std::string, InFlightRequest> m_in_flight;   ///< Keyed by normalized directory
    std::unique_ptr<CancellationSource> m_cancellation;
    std::optional<EventLoop::TimerId> m_retry_timer;

    // Guards tasks queued on the loop against a destroyed loader
    std::shared_ptr<bool> m_alive;

    std::shared_future<bool> startRequest(const std::string& directory);

    void runAttempt(const std::string& directory, CancellationToken token,
                    std::shared_ptr<std::promise<bool>> promise);

    /**
     * @brief Fetch one listing and turn it into records
     * @param files Receives the records on SUCCESS
     */
    LoadOutcome fetchAndProcess(const std::string& directory, const CancellationToken& token,
                                FileMap& files);

    bool isCurrentRequest(const std::string& directory, const CancellationToken& token) const;

    void handleFailure(const std::string& directory, LoadOutcome outcome);

    void cancelActiveRequest();
    void cancelRetryTimer();
    void notifyStateChanged();
};

} // namespace Sieve
