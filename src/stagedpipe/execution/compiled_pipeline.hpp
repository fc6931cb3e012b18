/**
 * @file compiled_pipeline.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/cancellation.hpp"
#include "stagedpipe/model/behavior.hpp"

namespace stagedpipe
{

class ChainCompiler;

/**
 * @brief The type-erased result of composing an ordered list of behaviors.
 *
 * @details
 * `entry` runs the first behavior with a continuation into the second, and so
 * on; the continuation after the last behavior does nothing. `entry` is always
 * callable, including for an empty chain.
 */
struct CompiledChain
{
    std::vector<std::string> step_ids;
    std::vector<BehaviorPtr> behaviors;
    ErasedContinuation entry{[](IBehaviorContext&, const CancellationToken&) {}};
};

/**
 * @brief An immutable, reusable pipeline over root context `TRoot`.
 *
 * @details
 * Produced by ChainCompiler. `execute()` runs the composed chain against a
 * caller-owned context. The pipeline holds no per-call state, so any number of
 * calls may run at once from different threads, each with its own context.
 *
 * @par Failures
 * - Exceptions thrown by a behavior, including OperationCancelled, reach the
 *   caller unchanged. The pipeline stays usable afterwards.
 *
 * @par Ownership
 * - Owns the behavior instances via shared_ptr.
 * - Only ChainCompiler constructs it, and always into a
 *   `std::shared_ptr<const CompiledPipeline>`; `execute_async()` keeps the
 *   pipeline alive until the call completes.
 */
template <typename TRoot>
class CompiledPipeline : public std::enable_shared_from_this<CompiledPipeline<TRoot>>
{
    static_assert(std::is_base_of_v<IBehaviorContext, TRoot>,
                  "CompiledPipeline: root context must derive from IBehaviorContext");

public:
    /**
     * @brief Run every step in order against `context`.
     * @param context The root context; owned by the caller.
     * @param token Cancellation token handed unchanged to the first step.
     */
    void execute(TRoot& context, const CancellationToken& token = CancellationToken::none()) const
    {
        m_chain.entry(context, token);
    }

    /**
     * @brief Run the pipeline on a separate thread.
     * @return A future whose `get()` rethrows any failure of the call.
     */
    std::future<void> execute_async(std::shared_ptr<TRoot> context,
                                    CancellationToken token = CancellationToken::none()) const
    {
        if (!context)
        {
            throw std::invalid_argument("CompiledPipeline::execute_async: null context");
        }
        auto self = this->shared_from_this();
        return std::async(std::launch::async,
                          [self = std::move(self), context = std::move(context), token = std::move(token)]() {
                              self->execute(*context, token);
                          });
    }

    size_t size() const noexcept
    {
        return m_chain.behaviors.size();
    }

    bool empty() const noexcept
    {
        return m_chain.behaviors.empty();
    }

    const std::vector<std::string>& step_ids() const noexcept
    {
        return m_chain.step_ids;
    }

    const std::vector<BehaviorPtr>& behaviors() const noexcept
    {
        return m_chain.behaviors;
    }

private:
    friend class ChainCompiler;

    explicit CompiledPipeline(CompiledChain chain)
        : m_chain(std::move(chain))
    {
    }

    CompiledChain m_chain;
};

template <typename TRoot>
using CompiledPipelinePtr = std::shared_ptr<const CompiledPipeline<TRoot>>;

} // namespace stagedpipe
