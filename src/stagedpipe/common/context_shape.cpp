#include "stagedpipe/common/context_shape.hpp"

namespace stagedpipe
{

uint32_t ContextShape::allocate_id() noexcept
{
    // Id 0 is never handed out.
    static std::atomic<uint32_t> next_id{1};
    return next_id.fetch_add(1, std::memory_order_relaxed);
}

} // namespace stagedpipe
