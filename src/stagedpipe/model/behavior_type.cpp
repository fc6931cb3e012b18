#include "stagedpipe/model/behavior_type.hpp"

namespace stagedpipe
{

namespace detail
{

uint32_t allocate_behavior_type_id() noexcept
{
    static std::atomic<uint32_t> next_id{1};
    return next_id.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

} // namespace stagedpipe
