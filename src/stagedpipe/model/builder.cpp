#include "stagedpipe/model/builder.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"

namespace stagedpipe
{

void DefaultBuilder::register_factory(const BehaviorType& type, BehaviorFactory factory)
{
    if (!factory)
    {
        throw std::invalid_argument("DefaultBuilder::register_factory: empty factory");
    }
    m_registrations[type.id()].push_back(Registration{std::move(factory), nullptr});
}

void DefaultBuilder::register_instance(const BehaviorType& type, BehaviorPtr instance)
{
    if (!instance)
    {
        throw std::invalid_argument("DefaultBuilder::register_instance: null instance");
    }
    m_registrations[type.id()].push_back(Registration{{}, std::move(instance)});
}

BehaviorPtr DefaultBuilder::build(const BehaviorType& type)
{
    if (const Registration* registration = find_registration(type.id()))
    {
        return build_from(*registration, type);
    }

    BehaviorPtr instance = type.default_construct();
    if (!instance)
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::BehaviorNotBuildable,
            "No registration or default constructor available to build '" + type.name() + "'");
    }
    track(instance);
    return instance;
}

std::vector<BehaviorPtr> DefaultBuilder::build_all(const BehaviorType& type)
{
    std::vector<const Registration*> registrations;
    collect_registrations(type.id(), registrations);

    std::vector<BehaviorPtr> result;
    result.reserve(registrations.size());
    for (const Registration* registration : registrations)
    {
        result.push_back(build_from(*registration, type));
    }
    return result;
}

std::unique_ptr<IBuilder> DefaultBuilder::create_child_builder()
{
    return std::unique_ptr<IBuilder>(new DefaultBuilder(this));
}

void DefaultBuilder::release(const BehaviorPtr& instance)
{
    auto it = std::find_if(m_tracked.begin(), m_tracked.end(), [&instance](const auto& tracked) {
        return tracked.lock() == instance;
    });
    if (it != m_tracked.end())
    {
        m_tracked.erase(it);
    }
}

size_t DefaultBuilder::tracked_count() const noexcept
{
    return static_cast<size_t>(std::count_if(m_tracked.begin(), m_tracked.end(),
                                             [](const auto& tracked) { return !tracked.expired(); }));
}

const DefaultBuilder::Registration* DefaultBuilder::find_registration(uint32_t type_id) const
{
    for (const DefaultBuilder* b = this; b != nullptr; b = b->m_parent)
    {
        auto it = b->m_registrations.find(type_id);
        if (it != b->m_registrations.end() && !it->second.empty())
        {
            return &it->second.back();
        }
    }
    return nullptr;
}

void DefaultBuilder::collect_registrations(uint32_t type_id,
                                           std::vector<const Registration*>& out) const
{
    // Parent registrations come first.
    if (m_parent != nullptr)
    {
        m_parent->collect_registrations(type_id, out);
    }
    auto it = m_registrations.find(type_id);
    if (it != m_registrations.end())
    {
        for (const auto& registration : it->second)
        {
            out.push_back(&registration);
        }
    }
}

BehaviorPtr DefaultBuilder::build_from(const Registration& registration, const BehaviorType& type)
{
    if (registration.instance)
    {
        return registration.instance;
    }
    BehaviorPtr instance = registration.factory(*this);
    if (!instance)
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::BehaviorNotBuildable,
            "Factory registered for '" + type.name() + "' returned no instance");
    }
    track(instance);
    return instance;
}

void DefaultBuilder::track(const BehaviorPtr& instance)
{
    m_tracked.erase(std::remove_if(m_tracked.begin(), m_tracked.end(),
                                   [](const auto& tracked) { return tracked.expired(); }),
                    m_tracked.end());
    m_tracked.push_back(instance);
}

} // namespace stagedpipe
