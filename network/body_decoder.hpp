#pragma once

#include <ollama/httplib.h>
#include <ollama/json.hpp>

#include <cstddef>
#include <string>

/// @brief Collects request body in pieces as they arrive and parses it as JSON once the body ends.
class CBodyDecoder
{
  public:
    /// @brief Appends next piece of the body.
    /// @throws std::logic_error if called after Finish().
    void Append(const char *data, std::size_t size);

    /// @brief Parses everything collected so far. Must be called on end of the body only.
    /// @throws CMalformedBodyError if collected bytes are not JSON.
    [[nodiscard]]
    nlohmann::json Finish();

    [[nodiscard]]
    std::size_t CollectedSize() const
    {
        return collected.size();
    }

  private:
    std::string collected;
    bool finished{false};
};

/// @brief Reads whole request body using httplib's streaming reader and parses it.
/// @throws CIoError if connection failed before body ended, CMalformedBodyError if it is not JSON.
nlohmann::json DecodeJsonBody(const httplib::ContentReader &contentReader);
