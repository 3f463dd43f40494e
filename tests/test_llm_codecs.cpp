#include <catch2/catch_test_macros.hpp>

#include "llm/base64.hpp"
#include "llm/ollama_client.hpp"
#include "llm/openrouter_client.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::string b64(const std::string& s) {
    std::vector<uint8_t> bytes(s.begin(), s.end());
    return base64::encode(bytes);
}

} // namespace

TEST_CASE("Base64", "[llm][base64]") {
    REQUIRE(b64("").empty());
    REQUIRE(b64("f") == "Zg==");
    REQUIRE(b64("fo") == "Zm8=");
    REQUIRE(b64("foo") == "Zm9v");
    REQUIRE(b64("foobar") == "Zm9vYmFy");

    std::vector<uint8_t> high = {0xFF, 0xFE, 0xFD};
    REQUIRE(base64::encode(high) == "//79");
}

TEST_CASE("OpenRouter request and response", "[llm][openrouter]") {

    SECTION("ChatRequest") {
        auto j = OpenRouterClient::build_chat_request("anthropic/claude-sonnet-4", "Be brief.",
                                                      "what is 2+2", 0.7, 1000);
        REQUIRE(j["model"] == "anthropic/claude-sonnet-4");
        REQUIRE(j["messages"].size() == 2);
        REQUIRE(j["messages"][0]["role"] == "system");
        REQUIRE(j["messages"][0]["content"] == "Be brief.");
        REQUIRE(j["messages"][1]["role"] == "user");
        REQUIRE(j["messages"][1]["content"] == "what is 2+2");
        REQUIRE(j["max_tokens"] == 1000);
        REQUIRE(j["stream"] == false);
    }

    SECTION("VisionRequestEmbedsImage") {
        auto j = OpenRouterClient::build_vision_request("m", "what is this", "QUJD", 500);
        const auto& content = j["messages"][0]["content"];
        REQUIRE(j["messages"][0]["role"] == "user");
        REQUIRE(content.size() == 2);
        REQUIRE(content[0]["type"] == "text");
        REQUIRE(content[0]["text"] == "what is this");
        REQUIRE(content[1]["type"] == "image_url");
        REQUIRE(content[1]["image_url"]["url"] == "data:image/png;base64,QUJD");
        REQUIRE(j["max_tokens"] == 500);
    }

    SECTION("ParseSuccess") {
        auto r = OpenRouterClient::parse_response(
            200, R"({"choices":[{"message":{"role":"assistant","content":"4"}}]})");
        REQUIRE(r);
        REQUIRE(*r == "4");
    }

    SECTION("ParseApiError") {
        auto r = OpenRouterClient::parse_response(
            401, R"({"error":{"message":"No auth credentials found","code":401}})");
        REQUIRE_FALSE(r);
        REQUIRE(r.error() == "HTTP 401: No auth credentials found");
    }

    SECTION("ParseHtmlErrorPage") {
        auto r = OpenRouterClient::parse_response(502, "<html>Bad Gateway</html>");
        REQUIRE_FALSE(r);
        REQUIRE(r.error() == "HTTP 502");
    }

    SECTION("ParseNoChoices") {
        auto r = OpenRouterClient::parse_response(200, R"({"choices":[]})");
        REQUIRE_FALSE(r);
        REQUIRE(r.error() == "response has no choices");
    }

    SECTION("EnvironmentKeyWins") {
        Logger log(LogLevel::Critical);
        Config cfg;
        cfg.openrouter.api_key = "from-config";
        SettingsSource settings(cfg, "", log);
        OpenRouterClient client(settings);

        ::unsetenv("OPENROUTER_API_KEY");
        REQUIRE(client.api_key() == "from-config");
        REQUIRE(client.is_configured());

        ::setenv("OPENROUTER_API_KEY", "from-env", 1);
        REQUIRE(client.api_key() == "from-env");
        ::unsetenv("OPENROUTER_API_KEY");

        settings.update(Config{});
        REQUIRE_FALSE(client.is_configured());
    }
}

TEST_CASE("Ollama request and response", "[llm][ollama]") {

    SECTION("GenerateRequest") {
        auto j = OllamaClient::build_generate_request("llama3", "Be brief.", "hi", 0.3, 200);
        REQUIRE(j["model"] == "llama3");
        REQUIRE(j["prompt"] == "Be brief.\n\nUser: hi\n\nAssistant:");
        REQUIRE(j["stream"] == false);
        REQUIRE(j["options"]["temperature"] == 0.3);
        REQUIRE(j["options"]["num_predict"] == 200);
    }

    SECTION("VisionRequest") {
        auto j = OllamaClient::build_vision_request("llava", "describe", "QUJD", 300);
        REQUIRE(j["images"] == json::array({"QUJD"}));
        REQUIRE(j["prompt"] == "describe");
        REQUIRE(j["options"]["num_predict"] == 300);
    }

    SECTION("ParseSuccess") {
        auto r = OllamaClient::parse_response(200, R"({"model":"llama3","response":"hello","done":true})");
        REQUIRE(r);
        REQUIRE(*r == "hello");
    }

    SECTION("ParseErrors") {
        auto missing = OllamaClient::parse_response(404, R"({"error":"model 'x' not found"})");
        REQUIRE_FALSE(missing);
        REQUIRE(missing.error() == "HTTP 404: model 'x' not found");

        auto empty = OllamaClient::parse_response(200, R"({"response":""})");
        REQUIRE_FALSE(empty);
        REQUIRE(empty.error() == "empty response");
    }

    SECTION("ConfiguredNeedsUrlAndModel") {
        Logger log(LogLevel::Critical);
        SettingsSource settings(Config{}, "", log);
        OllamaClient client(settings);
        REQUIRE_FALSE(client.is_configured());

        Config cfg;
        cfg.ollama.model = "llama3";
        settings.update(cfg);
        REQUIRE(client.is_configured());
    }
}
