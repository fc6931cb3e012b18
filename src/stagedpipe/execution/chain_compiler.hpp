/**
 * @file chain_compiler.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/context_shape.hpp"
#include "stagedpipe/execution/compiled_pipeline.hpp"
#include "stagedpipe/model/builder.hpp"
#include "stagedpipe/model/step_descriptor.hpp"

namespace stagedpipe
{

/**
 * @brief One step of the global order together with its behavior instance.
 */
struct ResolvedStep
{
    std::string step_id;
    BehaviorPtr behavior;
};

/**
 * @brief Turns an ordered step list into a CompiledPipeline.
 *
 * @details
 * Compilation has two phases:
 * 1. `instantiate()` creates one behavior per step, through the step's
 *    factory if it has one and through the IBuilder otherwise.
 * 2. `compose()` validates the shape at every boundary and folds the
 *    behaviors from last to first into a single continuation.
 *
 * @par Validation
 * - The first step must consume the root shape.
 * - Each step must consume the shape the previous step produces.
 * - A terminator may only be the last step.
 * Any violation fails with `ShapeMismatch` before a pipeline exists.
 */
class ChainCompiler
{
public:
    explicit ChainCompiler(IBuilder& builder)
        : m_builder(builder)
    {
    }

    /**
     * @brief Create the behavior of every step, in order.
     * @throws PipelineConfigError with `BehaviorNotBuildable` or `ShapeMismatch`.
     */
    std::vector<ResolvedStep> instantiate(const std::vector<StepDescriptorPtr>& ordered) const;

    /**
     * @brief Validate and fold resolved steps into one chain.
     * @throws PipelineConfigError with `ShapeMismatch`.
     */
    static CompiledChain compose(const ContextShape& root_shape, std::vector<ResolvedStep> steps);

    template <typename TRoot>
    CompiledPipelinePtr<TRoot> compile(const std::vector<StepDescriptorPtr>& ordered) const
    {
        return CompiledPipelinePtr<TRoot>(
            new CompiledPipeline<TRoot>(compose(ContextShape::of<TRoot>(), instantiate(ordered))));
    }

    /**
     * @brief Compile behavior instances directly, without registrations.
     * @details Each step is identified by its behavior's class name.
     */
    template <typename TRoot>
    static CompiledPipelinePtr<TRoot> compile_behaviors(const std::vector<BehaviorPtr>& behaviors)
    {
        std::vector<ResolvedStep> steps;
        steps.reserve(behaviors.size());
        for (const auto& behavior : behaviors)
        {
            if (!behavior)
            {
                throw std::invalid_argument("ChainCompiler::compile_behaviors: null behavior");
            }
            steps.push_back(ResolvedStep{behavior->class_name(), behavior});
        }
        return CompiledPipelinePtr<TRoot>(
            new CompiledPipeline<TRoot>(compose(ContextShape::of<TRoot>(), std::move(steps))));
    }

private:
    static ErasedContinuation link(IBehavior& behavior, ErasedContinuation next)
    {
        return behavior.make_link(std::move(next));
    }

    IBuilder& m_builder;
};

} // namespace stagedpipe
