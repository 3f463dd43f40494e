#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

// A chat-completion provider. Implementations read their settings on every
// call so configuration changes apply to the next request.
class LlmClient {
public:
    virtual ~LlmClient() = default;

    virtual std::string name() const = 0;
    virtual bool is_configured() const = 0;

    virtual std::expected<std::string, std::string>
        complete(const std::string& user_text, const std::string& system_prompt,
                 const std::string& model) = 0;

    virtual std::expected<std::string, std::string>
        describe_image(std::span<const uint8_t> png, const std::string& prompt,
                       const std::string& model) = 0;
};
