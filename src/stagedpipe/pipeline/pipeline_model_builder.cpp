/**
 * @file pipeline_model_builder.cpp
 */
#include "stagedpipe/pipeline/pipeline_model_builder.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"
#include "stagedpipe/common/step_id.hpp"
#include "stagedpipe/pipeline/dependency_graph.hpp"

#include <glog/logging.h>

namespace stagedpipe
{

namespace
{

std::vector<std::string> ids_of(const std::vector<StepDescriptorPtr>& steps)
{
    std::vector<std::string> ids;
    ids.reserve(steps.size());
    for (const auto& step : steps)
    {
        ids.push_back(step->id());
    }
    return ids;
}

} // namespace

PipelineModelBuilder::PipelineModelBuilder(const ContextShape& root_shape,
                                           std::vector<StepDescriptorPtr> steps)
    : m_root_shape(root_shape)
{
    // Stages are kept in order of first registration.
    for (auto& step : steps)
    {
        auto it = m_stage_index.find(step->input_shape());
        if (it == m_stage_index.end())
        {
            it = m_stage_index.emplace(step->input_shape(), m_stages.size()).first;
            m_stages.push_back(Stage{step->input_shape(), {}});
        }
        m_stages[it->second].steps.push_back(std::move(step));
    }
}

std::vector<StepDescriptorPtr> PipelineModelBuilder::build() const
{
    std::vector<StepDescriptorPtr> order;
    if (m_stages.empty())
    {
        VLOG(1) << "No steps registered; pipeline for '" << m_root_shape.name() << "' is empty";
        return order;
    }

    auto root_it = m_stage_index.find(m_root_shape);
    if (root_it == m_stage_index.end())
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::MissingRootStage,
            "No behaviors registered for the root context '" + m_root_shape.name() + "'");
    }

    std::vector<bool> visited(m_stages.size(), false);
    size_t visited_count = 0;
    size_t current = root_it->second;
    const StepDescriptor* entered_by = nullptr;

    while (true)
    {
        const Stage& stage = m_stages[current];
        if (visited[current])
        {
            std::vector<std::string> involved;
            if (entered_by != nullptr)
            {
                involved.push_back(entered_by->id());
            }
            throw PipelineConfigError(
                PipelineConfigErrorCode::CycleDetected,
                "Stage '" + stage.shape.name() + "' is entered a second time" +
                    (entered_by ? " through connector '" + entered_by->id() + "'" : std::string{}),
                std::move(involved));
        }
        visited[current] = true;
        ++visited_count;

        std::vector<StepDescriptorPtr> ordinary;
        std::vector<StepDescriptorPtr> connectors;
        for (const auto& step : stage.steps)
        {
            (step->is_stage_connector() ? connectors : ordinary).push_back(step);
        }

        sort_stage(Stage{stage.shape, std::move(ordinary)}, order);

        if (connectors.size() > 1)
        {
            std::string names;
            for (const auto& connector : connectors)
            {
                if (!names.empty())
                {
                    names += ", ";
                }
                names += "'" + connector->behavior_type().name() + "' (step '" + connector->id() + "')";
            }
            throw PipelineConfigError(
                PipelineConfigErrorCode::AmbiguousStageConnector,
                "Stage '" + stage.shape.name() + "' has more than one stage connector: " + names,
                ids_of(connectors));
        }

        if (connectors.empty())
        {
            if (visited_count < m_stages.size())
            {
                throw PipelineConfigError(
                    PipelineConfigErrorCode::MissingStageConnector,
                    "No stage connector found for stage '" + stage.shape.name() +
                        "' while other stages remain",
                    ids_of(stage.steps));
            }
            break;
        }

        const StepDescriptorPtr& connector = connectors.front();
        order.push_back(connector);
        if (connector->is_terminator())
        {
            break;
        }

        auto next_it = m_stage_index.find(connector->output_shape());
        if (next_it == m_stage_index.end())
        {
            break;
        }
        current = next_it->second;
        entered_by = connector.get();
    }

    warn_unreachable(visited);

    if (VLOG_IS_ON(1))
    {
        VLOG(1) << "Resolved pipeline for '" << m_root_shape.name() << "': "
                << quote_ids(ids_of(order));
    }
    return order;
}

void PipelineModelBuilder::sort_stage(const Stage& stage, std::vector<StepDescriptorPtr>& out) const
{
    DependencyGraph graph(stage.shape.name());
    for (const auto& step : stage.steps)
    {
        graph.add_step(step);
    }
    auto sorted = graph.sort();
    out.insert(out.end(), sorted.begin(), sorted.end());
}

void PipelineModelBuilder::warn_unreachable(const std::vector<bool>& visited) const
{
    for (size_t i = 0; i < m_stages.size(); ++i)
    {
        if (!visited[i])
        {
            LOG(WARNING) << "Stage '" << m_stages[i].shape.name()
                         << "' is not reachable from root context '" << m_root_shape.name()
                         << "'; steps left out: " << quote_ids(ids_of(m_stages[i].steps));
        }
    }
}

} // namespace stagedpipe
