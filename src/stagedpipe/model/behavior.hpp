/**
 * @file behavior.hpp
 * @brief Interfaces for pipeline behaviors and contexts.
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/cancellation.hpp"
#include "stagedpipe/common/context_shape.hpp"

namespace stagedpipe
{

class ChainCompiler;

/**
 * @brief Marker base of every pipeline context.
 *
 * @details
 * Concrete contexts derive (publicly, non-virtually) from this class. The
 * pipeline passes contexts by reference and never copies or owns them; a
 * context belongs to the caller of `execute()`.
 */
class IBehaviorContext
{
public:
    virtual ~IBehaviorContext() = default;

protected:
    IBehaviorContext() = default;
    IBehaviorContext(const IBehaviorContext&) = default;
    IBehaviorContext& operator=(const IBehaviorContext&) = default;
};

/**
 * @brief The role a behavior plays when stages are stitched together.
 */
enum class BehaviorKind
{
    Ordinary,   ///< Consumes and forwards the same context shape.
    Connector,  ///< Transforms one context shape into the next stage's shape.
    Terminator  ///< Connector that ends the pipeline without forwarding.
};

inline const char* to_string(BehaviorKind kind) noexcept
{
    switch (kind)
    {
    case BehaviorKind::Ordinary:
        return "Ordinary";
    case BehaviorKind::Connector:
        return "Connector";
    case BehaviorKind::Terminator:
        return "Terminator";
    }
    return "Unknown";
}

/**
 * @brief Continuation with the context shape erased.
 *
 * @details
 * Used only inside compiled chains; each link casts the context back to the
 * shape its behavior consumes. Shapes are validated before any link is built.
 */
using ErasedContinuation = std::function<void(IBehaviorContext&, const CancellationToken&)>;

/**
 * @brief Type-erased base of every behavior.
 *
 * @details
 * IBehavior exposes what the ordering and compilation phases need to know
 * about a behavior without knowing its context types: its kind and the shapes
 * of the context it consumes and produces.
 *
 * @par Thread Safety
 * - A compiled pipeline may invoke the same behavior instance from several
 *   threads at once. Implementations holding mutable state synchronize it
 *   themselves.
 *
 * @par Lifecycle
 * - Created by a step factory or an IBuilder while a pipeline is compiled.
 * - Owned by the compiled pipeline via shared_ptr for its whole lifetime.
 */
class IBehavior
{
public:
    virtual ~IBehavior() = 0;

    virtual BehaviorKind kind() const noexcept = 0;

    virtual const ContextShape& input_shape() const noexcept = 0;

    virtual const ContextShape& output_shape() const noexcept = 0;

    /**
     * @brief Get the class name for diagnostics.
     */
    virtual std::string class_name() const
    {
        return typeid(*this).name();
    }

protected:
    IBehavior() = default;

private:
    friend class ChainCompiler;

    /**
     * @brief Build the link that invokes this behavior and then `next`.
     * @note Called once per behavior when a chain is compiled.
     */
    virtual ErasedContinuation make_link(ErasedContinuation next) = 0;

    IBehavior(const IBehavior&) = delete;
    IBehavior(IBehavior&&) = delete;
    IBehavior& operator=(const IBehavior&) = delete;
    IBehavior& operator=(IBehavior&&) = delete;
};

inline IBehavior::~IBehavior() = default;

using BehaviorPtr = std::shared_ptr<IBehavior>;

/**
 * @brief A behavior consuming `TIn` and handing `TOut` to the next step.
 *
 * @details
 * `invoke()` receives the context, the continuation to the rest of the chain
 * and the cancellation token. Not calling `next` short-circuits every later
 * step; throwing propagates to the caller of `execute()` unchanged.
 */
template <typename TIn, typename TOut>
class IBehaviorOf : public IBehavior
{
    static_assert(std::is_base_of_v<IBehaviorContext, TIn>,
                  "IBehaviorOf: input context must derive from IBehaviorContext");
    static_assert(std::is_base_of_v<IBehaviorContext, TOut>,
                  "IBehaviorOf: output context must derive from IBehaviorContext");

public:
    using input_context = TIn;
    using output_context = TOut;
    using Next = std::function<void(TOut&, const CancellationToken&)>;

    static constexpr BehaviorKind behavior_kind =
        std::is_same_v<TIn, TOut> ? BehaviorKind::Ordinary : BehaviorKind::Connector;

    virtual void invoke(TIn& context, const Next& next, const CancellationToken& token) = 0;

    BehaviorKind kind() const noexcept override
    {
        return behavior_kind;
    }

    const ContextShape& input_shape() const noexcept override
    {
        return ContextShape::of<TIn>();
    }

    const ContextShape& output_shape() const noexcept override
    {
        return ContextShape::of<TOut>();
    }

private:
    ErasedContinuation make_link(ErasedContinuation next) override
    {
        Next typed_next = [next = std::move(next)](TOut& context, const CancellationToken& token) {
            next(context, token);
        };
        return [this, typed_next = std::move(typed_next)](IBehaviorContext& context,
                                                          const CancellationToken& token) {
            invoke(static_cast<TIn&>(context), typed_next, token);
        };
    }
};

namespace detail
{

/**
 * @brief The arguments of one `Behavior::invoke` call, as seen by its `next`.
 */
template <typename TContext>
struct BoundNext
{
    TContext* context;
    const std::function<void(TContext&, const CancellationToken&)>* next;
    const CancellationToken* token;
};

/**
 * @brief The `next` handed to the simplified `Behavior::invoke`.
 *
 * @details
 * Holds a single pointer so `std::function` stores it without allocating.
 * Valid only for the duration of the call that created it.
 */
template <typename TContext>
struct ForwardBoundNext
{
    const BoundNext<TContext>* bound;

    void operator()() const
    {
        (*bound->next)(*bound->context, *bound->token);
    }
};

} // namespace detail

/**
 * @brief A behavior that does not change the context shape.
 *
 * @details
 * Implementations override the simplified `invoke()`, whose `next` forwards
 * the unchanged context and the ambient token.
 */
template <typename TContext>
class Behavior : public IBehaviorOf<TContext, TContext>
{
public:
    using typename IBehaviorOf<TContext, TContext>::Next;

    void invoke(TContext& context, const Next& next, const CancellationToken& token) final
    {
        const detail::BoundNext<TContext> bound{&context, &next, &token};
        invoke(context, std::function<void()>{detail::ForwardBoundNext<TContext>{&bound}}, token);
    }

    virtual void invoke(TContext& context,
                        const std::function<void()>& next,
                        const CancellationToken& token) = 0;
};

/**
 * @brief A behavior marking the transition from `TFrom` stage to `TTo` stage.
 */
template <typename TFrom, typename TTo>
class StageConnector : public IBehaviorOf<TFrom, TTo>
{
public:
    static constexpr BehaviorKind behavior_kind = BehaviorKind::Connector;

    BehaviorKind kind() const noexcept override
    {
        return behavior_kind;
    }
};

/**
 * @brief The shape produced by a terminator; never looked up as a stage.
 */
template <typename TContext>
struct TerminatingContext : IBehaviorContext
{
    static constexpr bool terminating = true;

    static std::string shape_name()
    {
        return "terminating(" + ContextShape::of<TContext>().name() + ")";
    }
};

/**
 * @brief A connector that ends the pipeline.
 *
 * @details
 * `invoke()` hands the context to `terminate()` and never calls `next`.
 */
template <typename TContext>
class PipelineTerminator : public StageConnector<TContext, TerminatingContext<TContext>>
{
public:
    using typename StageConnector<TContext, TerminatingContext<TContext>>::Next;

    static constexpr BehaviorKind behavior_kind = BehaviorKind::Terminator;

    BehaviorKind kind() const noexcept final
    {
        return behavior_kind;
    }

    void invoke(TContext& context, const Next& /*next*/, const CancellationToken& token) final
    {
        terminate(context, token);
    }

protected:
    virtual void terminate(TContext& context, const CancellationToken& token) = 0;
};

} // namespace stagedpipe
