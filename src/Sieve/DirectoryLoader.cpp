// =================================================================
// src/Sieve/DirectoryLoader.cpp
// =================================================================
// Implementation for loading a directory listing with dedup, abort and retry.

#include "Sieve/DirectoryLoader.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"

namespace Sieve {

static std::shared_future<bool> settledFuture(bool value) {
    std::promise<bool> promise;
    promise.set_value(value);
    return promise.get_future().share();
}

DirectoryLoader::DirectoryLoader(EventLoop& loop, std::shared_ptr<ListingClient> client,
                                 const RetryPolicy& policy)
    : m_loop(loop),
      m_client(std::move(client)),
      m_policy(policy),
      m_alive(std::make_shared<bool>(true)) {}

DirectoryLoader::~DirectoryLoader() {
    cancelRetryTimer();
    if (m_cancellation) {
        m_cancellation->cancel();
    }
}

void DirectoryLoader::setListener(DirectoryLoadListener* listener) {
    m_listener = listener;
}

void DirectoryLoader::setListingOptions(bool include_stats, const std::string& pattern) {
    m_include_stats = include_stats;
    m_pattern = pattern.empty() ? "**/*" : pattern;
}

std::shared_future<bool> DirectoryLoader::load(const std::string& directory) {
    std::string normalized = normalizeDirectory(directory);

    if (normalized.empty()) {
        LOG_DEBUG("DirectoryLoader", "No project directory given, clearing listing");
        reset();
        m_state.is_initialized = true;
        notifyStateChanged();
        return settledFuture(false);
    }

    auto existing = m_in_flight.find(normalized);
    if (existing != m_in_flight.end() && normalized == m_state.directory) {
        LOG_DEBUG("DirectoryLoader", "Reusing in-flight request for " + normalized);
        return existing->second.future;
    }

    cancelRetryTimer();
    cancelActiveRequest();

    if (normalized != m_state.directory) {
        m_state.raw_files.clear();
    }
    m_state.directory = normalized;
    m_state.error.clear();
    m_state.retry_count = 0;
    m_state.is_initialized = false;

    return startRequest(normalized);
}

std::shared_future<bool> DirectoryLoader::refresh(bool preserve_state) {
    if (m_state.directory.empty()) {
        LOG_WARNING("DirectoryLoader", "Cannot refresh files without a project directory");
        m_state.error = "No project directory selected";
        notifyStateChanged();
        return settledFuture(false);
    }

    cancelRetryTimer();
    cancelActiveRequest();

    if (!preserve_state) {
        m_state.retry_count = 0;
        m_state.error.clear();
    }

    return startRequest(m_state.directory);
}

void DirectoryLoader::reset() {
    cancelRetryTimer();
    cancelActiveRequest();
    m_state = DirectoryLoadState();
    notifyStateChanged();
}

std::string DirectoryLoader::normalizeDirectory(const std::string& directory) {
    std::string normalized = PathNormalizer::normalizePath(PathNormalizer::trim(directory));

    while (normalized.size() > 1 && normalized.back() == '/') {
        // Keep the root of a drive ("C:/") intact
        if (normalized.size() == 3 && normalized[1] == ':') {
            break;
        }
        normalized.pop_back();
    }
    return normalized;
}

std::string DirectoryLoader::describeStatus(int status, const std::string& error_text) {
    switch (status) {
        case 400: return "Invalid request: " + error_text;
        case 403: return "Permission denied accessing directory: " + error_text;
        case 404: return "Directory not found: " + error_text;
        case 500: return "Server error: " + error_text;
        default:
            return "Failed to load files (" + std::to_string(status) + "): " + error_text;
    }
}

std::shared_future<bool> DirectoryLoader::startRequest(const std::string& directory) {
    m_cancellation = std::make_unique<CancellationSource>();
    CancellationToken token = m_cancellation->token();

    auto promise = std::make_shared<std::promise<bool>>();
    std::shared_future<bool> future = promise->get_future().share();
    m_in_flight[directory] = InFlightRequest{promise, future};

    m_state.is_loading = true;
    notifyStateChanged();

    std::weak_ptr<bool> alive = m_alive;
    m_loop.post([this, alive, directory, token, promise]() {
        if (alive.expired()) {
            promise->set_value(false);
            return;
        }
        runAttempt(directory, token, promise);
    });

    LOG_DEBUG("DirectoryLoader", "Queued listing request for " + directory);
    return future;
}

void DirectoryLoader::runAttempt(const std::string& directory, CancellationToken token,
                                 std::shared_ptr<std::promise<bool>> promise) {
    FileMap files;
    LoadOutcome outcome = fetchAndProcess(directory, token, files);

    auto entry = m_in_flight.find(directory);
    if (entry != m_in_flight.end() && entry->second.promise == promise) {
        m_in_flight.erase(entry);
    }

    bool success = false;
    if (isCurrentRequest(directory, token)) {
        m_state.is_loading = false;

        if (outcome == LoadOutcome::SUCCESS) {
            success = true;
            m_state.raw_files = files;
            m_state.error.clear();
            m_state.retry_count = 0;
            m_state.is_initialized = true;
            if (m_listener) {
                m_listener->onFilesLoaded(directory, m_state.raw_files);
            }
        } else if (outcome == LoadOutcome::ABORTED) {
            LOG_DEBUG("DirectoryLoader", "Listing request for " + directory + " ended without a result");
        } else {
            handleFailure(directory, outcome);
        }

        notifyStateChanged();
    } else {
        LOG_DEBUG("DirectoryLoader", "Discarding superseded listing request for " + directory);
    }

    promise->set_value(success);
}

LoadOutcome DirectoryLoader::fetchAndProcess(const std::string& directory, const CancellationToken& token,
                                             FileMap& files) {
    if (!isCurrentRequest(directory, token)) {
        return LoadOutcome::ABORTED;
    }

    ListingRequest request;
    request.directory = directory;
    request.include_stats = m_include_stats;
    request.pattern = m_pattern;

    auto start_time = std::chrono::steady_clock::now();
    ListingResponse response;

    try {
        response = m_client->listFiles(request, token);
    } catch (const ListingAbortedError& e) {
        LOG_DEBUG("DirectoryLoader", std::string("Listing request aborted: ") + e.what());
        return LoadOutcome::ABORTED;
    } catch (const std::exception& e) {
        if (!isCurrentRequest(directory, token)) {
            return LoadOutcome::ABORTED;
        }
        LOG_ERROR("DirectoryLoader", std::string("Exception loading file list: ") + e.what());
        m_state.error = std::string("Error loading file list: ") + e.what();
        return LoadOutcome::EXCEPTION;
    }

    if (!isCurrentRequest(directory, token)) {
        return LoadOutcome::ABORTED;
    }

    if (response.status != 200) {
        m_state.error = describeStatus(response.status, response.error);
        LOG_ERROR("DirectoryLoader", "Listing API error (" + std::to_string(response.status) + "): " +
                  response.error);
        return LoadOutcome::UNSUCCESSFUL;
    }

    if (!response.has_files) {
        m_state.error = response.error.empty() ? "Invalid response from server" : response.error;
        LOG_ERROR("DirectoryLoader", "Listing returned no files: " + m_state.error);
        return LoadOutcome::UNSUCCESSFUL;
    }

    bool has_sizes = response.sizes.size() == response.files.size();
    size_t skipped = 0;

    for (size_t i = 0; i < response.files.size(); ++i) {
        const std::string& raw_path = response.files[i];
        if (PathNormalizer::trim(raw_path).empty()) {
            LOG_DEBUG("DirectoryLoader", "Skipping empty file path at index " + std::to_string(i));
            continue;
        }

        std::string normalized = PathNormalizer::normalizePath(PathNormalizer::trim(raw_path));
        std::optional<std::string> relative = PathNormalizer::makeRelative(normalized, directory);
        if (!relative) {
            LOG_DEBUG("DirectoryLoader", "Path is not under the project directory: " + normalized);
            skipped++;
            continue;
        }

        FileRecord record(*relative, PathNormalizer::normalizeForComparison(*relative));
        if (has_sizes) {
            record.size = response.sizes[i];
        }
        files[record.path] = record;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logListingLoad(directory, files.size(), skipped, static_cast<long>(duration.count()));

    if (skipped > files.size()) {
        m_state.error = "Failed to process most file paths (" + std::to_string(skipped) + " errors)";
        files.clear();
        return LoadOutcome::UNSUCCESSFUL;
    }

    return LoadOutcome::SUCCESS;
}

bool DirectoryLoader::isCurrentRequest(const std::string& directory, const CancellationToken& token) const {
    return !token.isCancelled() && directory == m_state.directory;
}

void DirectoryLoader::handleFailure(const std::string& directory, LoadOutcome outcome) {
    m_state.retry_count++;

    if (m_state.retry_count >= m_policy.max_retries) {
        m_state.is_initialized = true;
        LOG_WARNING("DirectoryLoader", "All " + std::to_string(m_state.retry_count) +
                    " attempts to load " + directory + " failed: " + m_state.error);
        return;
    }

    std::chrono::milliseconds base = (outcome == LoadOutcome::EXCEPTION)
        ? m_policy.exception_base_delay
        : m_policy.unsuccessful_base_delay;
    std::chrono::milliseconds delay = base * (1 << (m_state.retry_count - 1));

    LOG_INFO("DirectoryLoader", "Scheduling retry #" + std::to_string(m_state.retry_count) + " for " +
             directory + " in " + std::to_string(delay.count()) + "ms");

    std::weak_ptr<bool> alive = m_alive;
    m_retry_timer = m_loop.schedule(delay, [this, alive, directory]() {
        if (alive.expired()) {
            return;
        }
        m_retry_timer.reset();

        if (directory != m_state.directory) {
            LOG_DEBUG("DirectoryLoader", "Skipping retry, directory changed to " + m_state.directory);
            return;
        }
        refresh(true);
    });
}

void DirectoryLoader::cancelActiveRequest() {
    if (m_cancellation) {
        m_cancellation->cancel();
        m_cancellation.reset();
    }
    // Superseded requests still settle their own futures when their task runs
    m_in_flight.clear();
    m_state.is_loading = false;
}

void DirectoryLoader::cancelRetryTimer() {
    if (m_retry_timer) {
        m_loop.cancel(*m_retry_timer);
        m_retry_timer.reset();
    }
}

void DirectoryLoader::notifyStateChanged() {
    if (m_listener) {
        m_listener->onLoadStateChanged(m_state);
    }
}

} // namespace Sieve
