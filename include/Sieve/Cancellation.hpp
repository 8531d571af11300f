// =================================================================
// include/Sieve/Cancellation.hpp
// =================================================================
// Cancellation sources and the tokens handed to in-flight operations.

#pragma once

#include <atomic>
#include <memory>

namespace Sieve {

/**
 * @brief Read-only view of a cancellation flag
 *
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const { return m_flag && m_flag->load(); }

    /**
     * @brief Check whether two tokens observe the same source
     */
    bool sharesSourceWith(const CancellationToken& other) const { return m_flag == other.m_flag; }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : m_flag(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> m_flag;
};

/**
 * @brief Owner of a cancellation flag
 *
 * cancel() is idempotent. Tokens issued before cancel() observe it.
 */
class CancellationSource {
public:
    CancellationSource() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(m_flag); }

    void cancel() { m_flag->store(true); }

    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace Sieve
