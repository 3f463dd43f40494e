#include "llm/ollama_client.hpp"

#include "http_client.hpp"
#include "llm/base64.hpp"

#include <format>

using json = nlohmann::json;

namespace {

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace

OllamaClient::OllamaClient(SettingsSource& settings) : settings_(settings) {}

bool OllamaClient::is_configured() const {
    auto cfg = settings_.current();
    return !cfg->ollama.url.empty() && !cfg->ollama.model.empty();
}

std::expected<std::string, std::string>
OllamaClient::complete(const std::string& user_text, const std::string& system_prompt,
                       const std::string& model) {
    auto cfg = settings_.current();
    auto body = build_generate_request(model, system_prompt, user_text,
                                       cfg->ollama.temperature, cfg->ollama.max_tokens);
    return post(*cfg, body);
}

std::expected<std::string, std::string>
OllamaClient::describe_image(std::span<const uint8_t> png, const std::string& prompt,
                             const std::string& model) {
    auto cfg = settings_.current();
    auto body = build_vision_request(model, prompt, base64::encode(png), cfg->vision.max_tokens);
    return post(*cfg, body);
}

std::expected<std::string, std::string>
OllamaClient::post(const Config& cfg, const json& body) {
    if (cfg.ollama.url.empty()) return std::unexpected("Ollama server URL is not set");

    auto resp = http::post_json(strip_trailing_slash(cfg.ollama.url) + "/api/generate",
                                body.dump(), {}, cfg.ollama.timeout_s);
    if (!resp) return std::unexpected(resp.error());
    return parse_response(resp->status, resp->body);
}

json OllamaClient::build_generate_request(const std::string& model,
                                          const std::string& system_prompt,
                                          const std::string& user_text,
                                          double temperature, int max_tokens) {
    return json{
        {"model", model},
        {"prompt", std::format("{}\n\nUser: {}\n\nAssistant:", system_prompt, user_text)},
        {"stream", false},
        {"options", {{"temperature", temperature}, {"num_predict", max_tokens}}},
    };
}

json OllamaClient::build_vision_request(const std::string& model, const std::string& prompt,
                                        const std::string& png_base64, int max_tokens) {
    return json{
        {"model", model},
        {"prompt", prompt},
        {"images", json::array({png_base64})},
        {"stream", false},
        {"options", {{"num_predict", max_tokens}}},
    };
}

std::expected<std::string, std::string>
OllamaClient::parse_response(long status, const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        if (status >= 400) return std::unexpected(std::format("HTTP {}", status));
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }

    if (j.contains("error")) {
        return std::unexpected(std::format("HTTP {}: {}", status,
                                           j["error"].is_string() ? j["error"].get<std::string>()
                                                                  : j["error"].dump()));
    }
    if (status >= 400) return std::unexpected(std::format("HTTP {}", status));

    if (!j.contains("response") || !j["response"].is_string()) {
        return std::unexpected("response field missing");
    }
    auto text = j["response"].get<std::string>();
    if (text.empty()) return std::unexpected("empty response");
    return text;
}
