#pragma once

#include "bridge_config.hpp" // IWYU pragma: keep

#include <common/cancellation.hpp>
#include <common/cm_ctors.h>
#include <models/model_host.hpp>
#include <ollama/httplib.h>
#include <ollama/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

/// @brief Write side of the streamed response to the user.
class IResponseWriter
{
  public:
    virtual ~IResponseWriter() = default;

    /// @returns false if user is gone.
    [[nodiscard]]
    virtual bool IsWritable() const = 0;

    /// @brief Sends data to the user immediately.
    /// @returns false if data could not be sent.
    virtual bool Write(std::string_view data) = 0;

    /// @brief Terminates the body, nothing can be written after.
    virtual void End() = 0;
};

/// @brief IResponseWriter over httplib's sink of the chunked response.
class CDataSinkWriter : public IResponseWriter
{
  public:
    explicit CDataSinkWriter(httplib::DataSink &sink) :
        sink(sink)
    {
    }

    [[nodiscard]]
    bool IsWritable() const override;
    bool Write(std::string_view data) override;
    void End() override;

  private:
    httplib::DataSink &sink;
};

/// @brief State of one streamed chat response: model output is relayed to the user until model
/// finishes, fails or user disconnects. Owned by the response it serves only.
class CStreamSession
{
  public:
    /// @brief Marker written into the stream when model fails after headers were sent.
    static constexpr std::string_view kErrorMarkerPrefix = "\nError from LLM service: ";

    CStreamSession() = delete;
    ~CStreamSession();
    NO_COPYMOVE(CStreamSession);

    CStreamSession(std::shared_ptr<IModelHandle> model, TChatMessages messages,
                   nlohmann::json options, TBridgeConfig config);

    /// @brief Does one step of relaying: starts model on the first call, then passes to the user
    /// whatever model produced meanwhile.
    /// @returns false if connection to the user must be dropped, true otherwise (including the case
    /// when the response was ended normally).
    bool Pump(IResponseWriter &writer);

    /// @brief Disconnect observer. Cancels the model if response was not ended yet. Idempotent.
    void OnClientDisconnected();

    /// @brief Called when the response is released by the server, whatever happened before.
    void Release(bool wasCompleted);

    [[nodiscard]]
    bool IsEnded() const
    {
        return ended.load();
    }

    [[nodiscard]]
    bool IsCancellationRequested() const
    {
        return cancellation.IsCancellationRequested();
    }

    /// @returns Text written into the stream when model fails.
    [[nodiscard]]
    static std::string BuildErrorMarker(const std::string &message);

  private:
    void StartModel();
    bool FinishWithError(IResponseWriter &writer, const std::string &message);
    void Finalize(IResponseWriter &writer);
    bool DropConnection();

    template <typename... taAny>
    void DebugDump(taAny &&...anything) const
    {
        config.ExecIfFittingVerbosity(EBridgeVerbosity::Debug, [&](auto &os) {
            os << "[DEBUG] [" << model->Name() << "] ";
            ((os << std::forward<taAny>(anything)), ...);
            os << std::endl;
        });
    }

    const TBridgeConfig config;
    std::shared_ptr<IModelHandle> model;
    const TChatMessages messages;
    const nlohmann::json options;
    utility::CCancellationSource cancellation;
    std::unique_ptr<IFragmentStream> stream;
    std::atomic<bool> ended{false};
};

/// @brief Turns response into the streamed text/plain one, driven by the session.
void AttachStreamSession(httplib::Response &response, std::shared_ptr<CStreamSession> session);
