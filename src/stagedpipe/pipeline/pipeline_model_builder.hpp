/**
 * @file pipeline_model_builder.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/context_shape.hpp"
#include "stagedpipe/model/step_descriptor.hpp"

namespace stagedpipe
{

/**
 * @brief Stitches the live steps of every stage into one global order.
 *
 * @details
 * Steps are grouped into stages by the context shape they consume. Starting at
 * the stage of the root shape, each stage contributes its ordinary steps in
 * dependency order followed by its single stage connector; the connector's
 * output shape selects the next stage.
 *
 * @par Stage rules
 * - No stage for the root shape: `MissingRootStage` (unless there are no steps).
 * - More than one connector in a stage: `AmbiguousStageConnector`.
 * - No connector while other stages remain unvisited: `MissingStageConnector`.
 * - A terminator ends the walk; so does a connector whose output shape has no
 *   stage.
 * - Reaching a stage a second time: `CycleDetected`.
 * - Stages the walk never reaches are logged as warnings and left out.
 */
class PipelineModelBuilder
{
public:
    PipelineModelBuilder(const ContextShape& root_shape, std::vector<StepDescriptorPtr> steps);

    /**
     * @brief Compute the global step order.
     * @throws PipelineConfigError on any stage or ordering violation.
     */
    std::vector<StepDescriptorPtr> build() const;

private:
    struct Stage
    {
        ContextShape shape;
        std::vector<StepDescriptorPtr> steps;
    };

    void sort_stage(const Stage& stage, std::vector<StepDescriptorPtr>& out) const;
    void warn_unreachable(const std::vector<bool>& visited) const;

    ContextShape m_root_shape;
    std::vector<Stage> m_stages;
    std::unordered_map<ContextShape, size_t> m_stage_index;
};

} // namespace stagedpipe
