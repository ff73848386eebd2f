#pragma once

#include "model_host.hpp" // IWYU pragma: keep

#include <common/cm_ctors.h>
#include <common/runners.h>
#include <common/safe_queue.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

/// @brief Passes model output from the producer thread to the relay. Producer pushes fragments
/// and exactly one terminal event (completion or failure), everything after terminal event is
/// dropped.
class CFragmentChannel
{
  public:
    CFragmentChannel() = default;
    ~CFragmentChannel() = default;
    NO_COPYMOVE(CFragmentChannel);

    // Producer side.
    void Push(std::string text);
    void Complete();
    void Fail(std::string message);

    /// @returns true if producer has sent terminal event already.
    [[nodiscard]]
    bool IsClosed() const;

    // Consumer side.
    /// @brief Waits up to maxWait for the next event. After terminal event was taken keeps
    /// returning TStreamCompleted.
    TStreamEvent Next(std::chrono::milliseconds maxWait);

  private:
    bool Close();

    SafeQueue<TStreamEvent> events;
    std::atomic<bool> closed{false};
    bool terminalTaken{false};
};

/// @brief Stream fed by a producer thread. Destroying the stream interrupts and joins the
/// producer.
class CProducedFragmentStream : public IFragmentStream
{
  public:
    CProducedFragmentStream(std::shared_ptr<CFragmentChannel> channel, utility::runner_t producer);
    ~CProducedFragmentStream() override;
    NO_COPYMOVE(CProducedFragmentStream);

    TStreamEvent Next(std::chrono::milliseconds maxWait) override;

  private:
    std::shared_ptr<CFragmentChannel> channel;
    // Must be declared after channel, so it is joined before channel is released.
    utility::runner_t producer;
};
