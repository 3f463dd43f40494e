#include "llm/openrouter_client.hpp"

#include "http_client.hpp"
#include "llm/base64.hpp"

#include <cstdlib>
#include <format>

using json = nlohmann::json;

OpenRouterClient::OpenRouterClient(SettingsSource& settings) : settings_(settings) {}

std::string OpenRouterClient::api_key() const {
    if (const char* env = std::getenv("OPENROUTER_API_KEY"); env && *env) return env;
    return settings_.current()->openrouter.api_key;
}

bool OpenRouterClient::is_configured() const {
    return !api_key().empty();
}

std::expected<std::string, std::string>
OpenRouterClient::complete(const std::string& user_text, const std::string& system_prompt,
                           const std::string& model) {
    auto cfg = settings_.current();
    auto body = build_chat_request(model, system_prompt, user_text,
                                   cfg->openrouter.temperature, cfg->openrouter.max_tokens);
    return post(*cfg, body);
}

std::expected<std::string, std::string>
OpenRouterClient::describe_image(std::span<const uint8_t> png, const std::string& prompt,
                                 const std::string& model) {
    auto cfg = settings_.current();
    auto body = build_vision_request(model, prompt, base64::encode(png), cfg->vision.max_tokens);
    return post(*cfg, body);
}

std::expected<std::string, std::string>
OpenRouterClient::post(const Config& cfg, const json& body) {
    auto key = api_key();
    if (key.empty()) return std::unexpected("OpenRouter API key is not set");

    std::vector<std::string> headers = {
        "Authorization: Bearer " + key,
        "HTTP-Referer: https://github.com/holdtalk/holdtalk",
        "X-Title: holdtalk",
    };

    auto resp = http::post_json(cfg.openrouter.base_url + "/chat/completions", body.dump(),
                                headers, cfg.openrouter.timeout_s);
    if (!resp) return std::unexpected(resp.error());
    return parse_response(resp->status, resp->body);
}

json OpenRouterClient::build_chat_request(const std::string& model,
                                          const std::string& system_prompt,
                                          const std::string& user_text,
                                          double temperature, int max_tokens) {
    return json{
        {"model", model},
        {"messages", json::array({
            {{"role", "system"}, {"content", system_prompt}},
            {{"role", "user"}, {"content", user_text}},
        })},
        {"temperature", temperature},
        {"max_tokens", max_tokens},
        {"stream", false},
    };
}

json OpenRouterClient::build_vision_request(const std::string& model, const std::string& prompt,
                                            const std::string& png_base64, int max_tokens) {
    json content = json::array({
        {{"type", "text"}, {"text", prompt}},
        {{"type", "image_url"},
         {"image_url", {{"url", "data:image/png;base64," + png_base64}}}},
    });
    return json{
        {"model", model},
        {"messages", json::array({{{"role", "user"}, {"content", content}}})},
        {"max_tokens", max_tokens},
        {"stream", false},
    };
}

std::expected<std::string, std::string>
OpenRouterClient::parse_response(long status, const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        if (status >= 400) return std::unexpected(std::format("HTTP {}", status));
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }

    if (j.contains("error")) {
        const auto& err = j["error"];
        std::string msg = err.is_object() ? err.value("message", err.dump()) : err.dump();
        return std::unexpected(std::format("HTTP {}: {}", status, msg));
    }
    if (status >= 400) return std::unexpected(std::format("HTTP {}", status));

    try {
        const auto& choices = j.at("choices");
        if (!choices.is_array() || choices.empty()) {
            return std::unexpected("response has no choices");
        }
        const auto& content = choices[0].at("message").at("content");
        if (!content.is_string()) return std::unexpected("response has no text content");
        return content.get<std::string>();
    } catch (const json::exception& e) {
        return std::unexpected(std::string("unexpected response: ") + e.what());
    }
}
