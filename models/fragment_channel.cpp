#include "fragment_channel.hpp" // IWYU pragma: keep

#include <common/runners.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <variant>

void CFragmentChannel::Push(std::string text)
{
    if (!IsClosed())
    {
        events.push(TFragment{std::move(text)});
    }
}

void CFragmentChannel::Complete()
{
    if (Close())
    {
        events.push(TStreamCompleted{});
    }
}

void CFragmentChannel::Fail(std::string message)
{
    if (Close())
    {
        events.push(TStreamFailed{std::move(message)});
    }
}

bool CFragmentChannel::IsClosed() const
{
    return closed.load();
}

bool CFragmentChannel::Close()
{
    return !closed.exchange(true);
}

TStreamEvent CFragmentChannel::Next(const std::chrono::milliseconds maxWait)
{
    if (terminalTaken)
    {
        return TStreamCompleted{};
    }
    auto event = events.wait_pop(maxWait);
    if (!event)
    {
        return TStreamPending{};
    }
    terminalTaken = std::holds_alternative<TStreamCompleted>(*event)
                    || std::holds_alternative<TStreamFailed>(*event);
    return std::move(*event);
}

CProducedFragmentStream::CProducedFragmentStream(std::shared_ptr<CFragmentChannel> channel,
                                                 utility::runner_t producer) :
    channel(std::move(channel)),
    producer(std::move(producer))
{
}

CProducedFragmentStream::~CProducedFragmentStream()
{
    producer.reset();
}

TStreamEvent CProducedFragmentStream::Next(const std::chrono::milliseconds maxWait)
{
    return channel->Next(maxWait);
}
