#include "streaming_relay.hpp" // IWYU pragma: keep

#include "bridge_config.hpp" // IWYU pragma: keep
#include "bridge_errors.hpp" // IWYU pragma: keep

#include <common/lambda_visitors.h>
#include <common/runners.h>
#include <models/model_host.hpp>
#include <ollama/httplib.h>
#include <ollama/json.hpp>

#include <cstddef>
#include <exception>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

bool CDataSinkWriter::IsWritable() const
{
    return !sink.is_writable || sink.is_writable();
}

bool CDataSinkWriter::Write(const std::string_view data)
{
    return sink.write(data.data(), data.size());
}

void CDataSinkWriter::End()
{
    sink.done();
}

CStreamSession::CStreamSession(std::shared_ptr<IModelHandle> model, TChatMessages messages,
                               nlohmann::json options, TBridgeConfig config) :
    config(std::move(config)),
    model(std::move(model)),
    messages(std::move(messages)),
    options(std::move(options)),
    cancellation(),
    stream(nullptr)
{
}

CStreamSession::~CStreamSession()
{
    // Producer of the stream (if any) must see it is not needed before it is joined.
    if (!IsEnded())
    {
        cancellation.Cancel();
    }
    stream.reset();
}

std::string CStreamSession::BuildErrorMarker(const std::string &message)
{
    std::string marker(kErrorMarkerPrefix);
    marker.append(message);
    marker.append("\n");
    return marker;
}

void CStreamSession::StartModel()
{
    DebugDump("Sending request to the model, thread ", utility::currentThreadId());
    stream = model->SendRequest(messages, options, cancellation.Token());
    if (!stream)
    {
        throw CInvocationError("Model returned no response stream.");
    }
}

bool CStreamSession::Pump(IResponseWriter &writer)
{
    // This is communication to the user, called by server wrapper periodically.
    if (IsEnded())
    {
        return false;
    }
    if (!writer.IsWritable())
    {
        DebugDump("Sink is not writable anymore.");
        return DropConnection();
    }

    try
    {
        if (!stream)
        {
            StartModel();
        }

        const LambdaVisitor visitor{
          [&](const TFragment &fragment) {
              if (fragment.text.empty())
              {
                  return true;
              }
              if (!writer.Write(fragment.text))
              {
                  DebugDump("Failed to write fragment to user.");
                  return DropConnection();
              }
              return true;
          },
          [&](const TStreamCompleted &) {
              DebugDump("Model has finished.");
              Finalize(writer);
              return true;
          },
          [&](const TStreamFailed &failed) {
              return FinishWithError(writer, failed.message);
          },
          [](const TStreamPending &) {
              return true;
          },
        };
        return std::visit(visitor, stream->Next(config.fragmentPollInterval));
    }
    catch (std::exception &e)
    {
        return FinishWithError(writer, e.what());
    }
}

void CStreamSession::OnClientDisconnected()
{
    // Response ended already, nobody waits for the model.
    if (IsEnded())
    {
        return;
    }
    if (cancellation.Cancel())
    {
        config.ExecIfFittingVerbosity(EBridgeVerbosity::Warning, [this](auto &os) {
            os << "[WARNING] Client disconnected during LLM request to " << model->Name()
               << ". Cancelling." << std::endl;
        });
    }
}

void CStreamSession::Release(const bool wasCompleted)
{
    if (!IsEnded())
    {
        DebugDump("Response released before it was ended, completed: ", wasCompleted);
        OnClientDisconnected();
        ended.store(true);
    }
    stream.reset();
}

bool CStreamSession::DropConnection()
{
    OnClientDisconnected();
    ended.store(true);
    return false;
}

bool CStreamSession::FinishWithError(IResponseWriter &writer, const std::string &message)
{
    config.ExecIfFittingVerbosity(EBridgeVerbosity::Error, [&](auto &os) {
        os << "[ERROR] Error during LLM request to " << model->Name() << ": " << message
           << std::endl;
    });
    if (!IsEnded() && writer.IsWritable())
    {
        // Headers were sent already, error can be reported inside of the body only.
        if (!writer.Write(BuildErrorMarker(message)))
        {
            return DropConnection();
        }
    }
    Finalize(writer);
    return true;
}

void CStreamSession::Finalize(IResponseWriter &writer)
{
    if (ended.exchange(true))
    {
        return;
    }
    writer.End();
}

void AttachStreamSession(httplib::Response &response, std::shared_ptr<CStreamSession> session)
{
    response.status = 200;
    response.set_header("X-Content-Type-Options", "nosniff");

    // This is last one, now control is moved to the chunked content provider which can
    // "write" only to the user or disconnect.
    httplib::ContentProviderWithoutLength contentProvider =
      [session](std::size_t /*offset*/, httplib::DataSink &sink) {
          CDataSinkWriter writer(sink);
          return session->Pump(writer);
      };
    response.set_chunked_content_provider(
      "text/plain; charset=utf-8", std::move(contentProvider),
      [session = std::move(session)](bool success) {
          session->Release(success);
      });
}
