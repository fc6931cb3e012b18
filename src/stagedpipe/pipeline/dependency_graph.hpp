/**
 * @file dependency_graph.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/step_id.hpp"
#include "stagedpipe/model/step_descriptor.hpp"

namespace stagedpipe
{

/**
 * @brief Index of a step within one DependencyGraph, in registration order.
 */
using StepIdx = size_t;

/**
 * @brief Ordering graph over the ordinary steps of a single stage.
 *
 * @details
 * Each step added becomes a node; its `insert_before` / `insert_after`
 * constraints become edges once `link_dependencies()` runs. `sort()` then
 * returns every step exactly once, after all the steps it must follow, using
 * registration order to break ties.
 *
 * @par Edges
 * - A `Before` constraint from N to X makes N a predecessor of X.
 * - An `After` constraint from N to Y makes Y a predecessor of N.
 * - A constraint to an id outside this graph is dropped when unenforced, and
 *   fails with `UnresolvedDependency` when enforced.
 *
 * @par Sort
 * - Depth-first over predecessors, starting nodes in registration order.
 * - A predecessor still on the visit path fails with `CycleDetected`.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class DependencyGraph
{
public:
    /**
     * @param stage_name Name of the stage, used in error messages and logs.
     */
    explicit DependencyGraph(std::string stage_name);

    /**
     * @brief Add a step as the next node.
     * @return The index assigned to the step.
     * @throws PipelineConfigError with `DuplicateStepId` if the id is already present.
     */
    StepIdx add_step(StepDescriptorPtr step);

    size_t step_count() const noexcept
    {
        return m_steps.size();
    }

    bool contains(const std::string& id) const
    {
        return m_index.find(id) != m_index.end();
    }

    /**
     * @brief Turn the constraints of every added step into edges.
     * @throws PipelineConfigError with `UnresolvedDependency`.
     * @note Called by `sort()` if not called before. No steps may be added after.
     */
    void link_dependencies();

    /**
     * @brief Get the predecessors of a step. Requires linked dependencies.
     */
    const std::vector<StepIdx>& previous(StepIdx idx) const
    {
        return m_previous.at(idx);
    }

    /**
     * @brief Produce the stable topological order of the steps.
     * @throws PipelineConfigError with `UnresolvedDependency` or `CycleDetected`.
     */
    std::vector<StepDescriptorPtr> sort();

private:
    std::vector<std::string> known_ids() const;
    [[noreturn]] void throw_cycle(const std::vector<StepIdx>& path, StepIdx repeated) const;

    std::string m_stage_name;
    std::vector<StepDescriptorPtr> m_steps;
    IdMap<StepIdx> m_index;
    std::vector<std::vector<StepIdx>> m_previous;
    bool m_linked{false};
};

} // namespace stagedpipe
