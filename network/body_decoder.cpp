#include "body_decoder.hpp" // IWYU pragma: keep

#include "bridge_errors.hpp" // IWYU pragma: keep

#include <ollama/httplib.h>
#include <ollama/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

void CBodyDecoder::Append(const char *data, const std::size_t size)
{
    if (finished)
    {
        throw std::logic_error("Body was already decoded, no more data expected.");
    }
    collected.append(data, size);
}

nlohmann::json CBodyDecoder::Finish()
{
    finished = true;
    try
    {
        return nlohmann::json::parse(collected);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw CMalformedBodyError(e.what());
    }
}

nlohmann::json DecodeJsonBody(const httplib::ContentReader &contentReader)
{
    CBodyDecoder decoder;
    const bool isRead = contentReader([&decoder](const char *data, std::size_t dataLength) {
        decoder.Append(data, dataLength);
        return true;
    });
    if (!isRead)
    {
        throw CIoError("Connection failed while reading request body.");
    }
    return decoder.Finish();
}
