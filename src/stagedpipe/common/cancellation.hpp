/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation: CancellationSource and CancellationToken.
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"

namespace stagedpipe
{

namespace detail
{

/**
 * @brief Shared state between a CancellationSource and its tokens.
 */
struct CancellationState
{
    std::atomic<bool> requested{false};
    std::shared_ptr<const CancellationState> parent{};

    bool is_requested() const noexcept
    {
        for (const CancellationState* s = this; s != nullptr; s = s->parent.get())
        {
            if (s->requested.load(std::memory_order_acquire))
            {
                return true;
            }
        }
        return false;
    }
};

} // namespace detail

/**
 * @brief Read-only view of a cancellation request.
 *
 * @details
 * A token is handed to every behavior along with its context. Cancellation is
 * cooperative: the pipeline never polls the token, a behavior has to test it
 * (typically at entry) and raise `OperationCancelled` to abort the chain.
 *
 * @par Thread Safety
 * - Tokens are cheap to copy and safe to query from any thread.
 * - A request made through the owning source on another thread becomes
 *   visible to subsequent queries (acquire/release ordering).
 */
class CancellationToken
{
public:
    /**
     * @brief Construct a token that can never be cancelled.
     */
    CancellationToken() = default;

    /**
     * @brief A token that can never be cancelled.
     */
    static CancellationToken none()
    {
        return CancellationToken{};
    }

    /**
     * @brief A token whose cancellation is already requested.
     */
    static CancellationToken cancelled();

    /**
     * @brief Check whether this token is attached to a source.
     */
    bool can_be_cancelled() const noexcept
    {
        return m_state != nullptr;
    }

    /**
     * @brief Check whether cancellation has been requested.
     */
    bool is_cancellation_requested() const noexcept
    {
        return m_state && m_state->is_requested();
    }

    /**
     * @brief Raise `OperationCancelled` if cancellation has been requested.
     * @throws OperationCancelled
     */
    void throw_if_cancellation_requested() const
    {
        if (is_cancellation_requested())
        {
            throw OperationCancelled{};
        }
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const detail::CancellationState> state)
        : m_state(std::move(state))
    {}

    std::shared_ptr<const detail::CancellationState> m_state{};
};

/**
 * @brief Owner of a cancellation request.
 *
 * @details
 * The source hands out tokens and is the only party able to request
 * cancellation. A linked source additionally observes a parent token: its
 * tokens report cancellation when either the linked source or the parent has
 * been cancelled. Behaviors use linked sources to derive narrower signals,
 * for example a time-bounded one.
 *
 * @par Thread Safety
 * - `cancel()` may be called from any thread, at any time.
 */
class CancellationSource
{
public:
    CancellationSource();

    /**
     * @brief Create a source that is also cancelled when `parent` is.
     */
    static CancellationSource create_linked(const CancellationToken& parent);

    /**
     * @brief Get a token observing this source.
     */
    CancellationToken token() const
    {
        return CancellationToken{m_state};
    }

    /**
     * @brief Request cancellation. Idempotent.
     */
    void cancel() noexcept;

    /**
     * @brief Check whether cancellation has been requested on this source
     * or on the parent it is linked to.
     */
    bool is_cancellation_requested() const noexcept
    {
        return m_state->is_requested();
    }

private:
    std::shared_ptr<detail::CancellationState> m_state;
};

} // namespace stagedpipe
