/**
 * @file chain_compiler.cpp
 */
#include "stagedpipe/execution/chain_compiler.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"
#include "stagedpipe/common/step_id.hpp"

#include <glog/logging.h>

namespace stagedpipe
{

std::vector<ResolvedStep> ChainCompiler::instantiate(const std::vector<StepDescriptorPtr>& ordered) const
{
    std::vector<ResolvedStep> steps;
    steps.reserve(ordered.size());
    for (const auto& descriptor : ordered)
    {
        steps.push_back(ResolvedStep{descriptor->id(), descriptor->create_behavior(m_builder)});
    }
    return steps;
}

CompiledChain ChainCompiler::compose(const ContextShape& root_shape, std::vector<ResolvedStep> steps)
{
    // ========================================================================
    // Boundary validation
    // ========================================================================

    for (size_t i = 0; i < steps.size(); ++i)
    {
        const IBehavior& behavior = *steps[i].behavior;
        const ContextShape& expected = (i == 0) ? root_shape : steps[i - 1].behavior->output_shape();
        if (behavior.input_shape() != expected)
        {
            std::vector<std::string> involved;
            if (i > 0)
            {
                involved.push_back(steps[i - 1].step_id);
            }
            involved.push_back(steps[i].step_id);
            throw PipelineConfigError(
                PipelineConfigErrorCode::ShapeMismatch,
                "Step '" + steps[i].step_id + "' consumes '" + behavior.input_shape().name() +
                    "' but is handed '" + expected.name() + "'" +
                    (i == 0 ? std::string{" (the root context)"}
                            : " by step '" + steps[i - 1].step_id + "'"),
                std::move(involved));
        }
        if (behavior.kind() == BehaviorKind::Terminator && i + 1 != steps.size())
        {
            throw PipelineConfigError(
                PipelineConfigErrorCode::ShapeMismatch,
                "Terminator step '" + steps[i].step_id + "' is followed by step '" +
                    steps[i + 1].step_id + "'",
                {steps[i].step_id, steps[i + 1].step_id});
        }
    }

    // ========================================================================
    // Right-to-left composition
    // ========================================================================

    ErasedContinuation next = [](IBehaviorContext&, const CancellationToken&) {};
    for (size_t i = steps.size(); i-- > 0;)
    {
        next = link(*steps[i].behavior, std::move(next));
    }

    CompiledChain chain;
    chain.entry = std::move(next);
    chain.step_ids.reserve(steps.size());
    chain.behaviors.reserve(steps.size());
    for (auto& step : steps)
    {
        chain.step_ids.push_back(std::move(step.step_id));
        chain.behaviors.push_back(std::move(step.behavior));
    }

    VLOG(1) << "Compiled chain of " << chain.behaviors.size() << " step(s) for '" << root_shape.name()
            << "': " << quote_ids(chain.step_ids);
    return chain;
}

} // namespace stagedpipe
