/**
 * @file dependency_graph.cpp
 */
#include "stagedpipe/pipeline/dependency_graph.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"

#include <glog/logging.h>

namespace stagedpipe
{

DependencyGraph::DependencyGraph(std::string stage_name)
    : m_stage_name(std::move(stage_name))
{
}

StepIdx DependencyGraph::add_step(StepDescriptorPtr step)
{
    if (m_linked)
    {
        throw std::logic_error("DependencyGraph::add_step: dependencies already linked");
    }
    if (!step)
    {
        throw std::invalid_argument("DependencyGraph::add_step: null step");
    }
    if (contains(step->id()))
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::DuplicateStepId,
            "Step id '" + step->id() + "' appears twice in stage '" + m_stage_name + "'",
            {step->id()});
    }

    StepIdx idx = m_steps.size();
    m_index.emplace(step->id(), idx);
    m_steps.push_back(std::move(step));
    m_previous.emplace_back();
    return idx;
}

// ============================================================================
// Edge construction
// ============================================================================

void DependencyGraph::link_dependencies()
{
    if (m_linked)
    {
        return;
    }

    auto link = [this](StepIdx node, const Dependency& dependency) {
        auto it = m_index.find(dependency.depends_on_id);
        if (it == m_index.end())
        {
            if (!dependency.enforced)
            {
                VLOG(2) << "Dropping optional constraint of step '" << dependency.dependant_id
                        << "' on absent step '" << dependency.depends_on_id << "' in stage '"
                        << m_stage_name << "'";
                return;
            }
            const char* relation =
                (dependency.direction == DependencyDirection::Before) ? "before" : "after";
            throw PipelineConfigError(
                PipelineConfigErrorCode::UnresolvedDependency,
                "Step '" + dependency.dependant_id + "' must run " + relation + " step '" +
                    dependency.depends_on_id + "', which is not registered in stage '" +
                    m_stage_name + "'. Steps in this stage: " + quote_ids(known_ids()),
                {dependency.dependant_id, dependency.depends_on_id});
        }

        StepIdx other = it->second;
        if (dependency.direction == DependencyDirection::Before)
        {
            m_previous[other].push_back(node);
        }
        else
        {
            m_previous[node].push_back(other);
        }
    };

    for (StepIdx node = 0; node < m_steps.size(); ++node)
    {
        for (const auto& dependency : m_steps[node]->befores())
        {
            link(node, dependency);
        }
        for (const auto& dependency : m_steps[node]->afters())
        {
            link(node, dependency);
        }
    }
    m_linked = true;
}

// ============================================================================
// Topological sort
// ============================================================================

std::vector<StepDescriptorPtr> DependencyGraph::sort()
{
    link_dependencies();

    enum class Mark : uint8_t
    {
        Unvisited,
        OnPath,
        Done
    };

    std::vector<Mark> marks(m_steps.size(), Mark::Unvisited);
    std::vector<StepDescriptorPtr> result;
    result.reserve(m_steps.size());

    // Each frame is a node on the visit path and the next predecessor to visit.
    std::vector<std::pair<StepIdx, size_t>> stack;

    for (StepIdx start = 0; start < m_steps.size(); ++start)
    {
        if (marks[start] != Mark::Unvisited)
        {
            continue;
        }
        marks[start] = Mark::OnPath;
        stack.emplace_back(start, 0);

        while (!stack.empty())
        {
            auto& [node, next_pos] = stack.back();
            const auto& preds = m_previous[node];
            if (next_pos < preds.size())
            {
                StepIdx pred = preds[next_pos++];
                if (marks[pred] == Mark::OnPath)
                {
                    std::vector<StepIdx> path;
                    path.reserve(stack.size());
                    for (const auto& frame : stack)
                    {
                        path.push_back(frame.first);
                    }
                    throw_cycle(path, pred);
                }
                if (marks[pred] == Mark::Unvisited)
                {
                    marks[pred] = Mark::OnPath;
                    stack.emplace_back(pred, 0);
                }
                continue;
            }

            marks[node] = Mark::Done;
            result.push_back(m_steps[node]);
            stack.pop_back();
        }
    }
    return result;
}

std::vector<std::string> DependencyGraph::known_ids() const
{
    std::vector<std::string> ids;
    ids.reserve(m_steps.size());
    for (const auto& step : m_steps)
    {
        ids.push_back(step->id());
    }
    return ids;
}

void DependencyGraph::throw_cycle(const std::vector<StepIdx>& path, StepIdx repeated) const
{
    auto first = std::find(path.begin(), path.end(), repeated);
    std::vector<std::string> cycle_ids;
    std::string description;
    for (auto it = first; it != path.end(); ++it)
    {
        cycle_ids.push_back(m_steps[*it]->id());
        description += "'" + m_steps[*it]->id() + "' -> ";
    }
    description += "'" + m_steps[repeated]->id() + "'";

    throw PipelineConfigError(
        PipelineConfigErrorCode::CycleDetected,
        "Ordering constraints in stage '" + m_stage_name +
            "' form a cycle (each step must run after the next): " + description,
        std::move(cycle_ids));
}

} // namespace stagedpipe
