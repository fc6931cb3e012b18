#include "stagedpipe/common/cancellation.hpp"

namespace stagedpipe
{

CancellationToken CancellationToken::cancelled()
{
    CancellationSource source;
    source.cancel();
    return source.token();
}

CancellationSource::CancellationSource()
    : m_state{std::make_shared<detail::CancellationState>()}
{}

CancellationSource CancellationSource::create_linked(const CancellationToken& parent)
{
    CancellationSource source;
    source.m_state->parent = parent.m_state;
    return source;
}

void CancellationSource::cancel() noexcept
{
    m_state->requested.store(true, std::memory_order_release);
}

} // namespace stagedpipe
