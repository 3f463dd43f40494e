#pragma once

#include "llm/llm_client.hpp"
#include "settings_source.hpp"

#include <nlohmann/json.hpp>

class OpenRouterClient : public LlmClient {
public:
    explicit OpenRouterClient(SettingsSource& settings);

    std::string name() const override { return "OpenRouter"; }
    bool is_configured() const override;

    std::expected<std::string, std::string>
        complete(const std::string& user_text, const std::string& system_prompt,
                 const std::string& model) override;

    std::expected<std::string, std::string>
        describe_image(std::span<const uint8_t> png, const std::string& prompt,
                       const std::string& model) override;

    // OPENROUTER_API_KEY wins over the configured key.
    std::string api_key() const;

    static nlohmann::json build_chat_request(const std::string& model,
                                             const std::string& system_prompt,
                                             const std::string& user_text,
                                             double temperature, int max_tokens);
    static nlohmann::json build_vision_request(const std::string& model,
                                               const std::string& prompt,
                                               const std::string& png_base64,
                                               int max_tokens);
    static std::expected<std::string, std::string> parse_response(long status,
                                                                  const std::string& body);

private:
    std::expected<std::string, std::string> post(const Config& cfg, const nlohmann::json& body);

    SettingsSource& settings_;
};
