#include "whisper/lan_transcriber.hpp"

#include "http_client.hpp"

#include <chrono>
#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim(std::string text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

} // namespace

LanTranscriber::LanTranscriber(SettingsSource& settings) : settings_(settings) {}

std::expected<TranscriptResult, std::string>
LanTranscriber::transcribe(const std::string& audio_path) {
    auto cfg = settings_.current();
    const auto& w = cfg->whisper;

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    if (curl_mime_filedata(part, audio_path.c_str()) != CURLE_OK) {
        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return std::unexpected(std::format("cannot read {}", audio_path));
    }
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    add_field(mime, "response_format", "verbose_json");

    if (w.api_format == "openai") {
        endpoint = w.url + "/v1/audio/transcriptions";
        add_field(mime, "model", w.model);
        if (!w.language.empty() && w.language != "auto") {
            add_field(mime, "language", w.language);
        }
    } else {
        endpoint = w.url + "/inference";
        add_field(mime, "temperature", "0.0");
        if (!w.language.empty()) {
            add_field(mime, "language", w.language);
        }
    }

    std::string response_body;
    long status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, http::append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        return std::unexpected(std::format("server returned HTTP {}: {}", status,
                                           response_body.substr(0, 200)));
    }

    auto result = parse_response(response_body);
    if (result) {
        result->processing_s = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
    }
    return result;
}

std::expected<TranscriptResult, std::string>
LanTranscriber::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (!j.contains("text")) {
            if (j.contains("error")) {
                const auto& err = j["error"];
                std::string msg = err.is_string() ? err.get<std::string>()
                                                  : err.value("message", err.dump());
                return std::unexpected("server error: " + msg);
            }
            return std::unexpected("unexpected response: " + body.substr(0, 200));
        }

        TranscriptResult result;
        result.text = trim(j["text"].get<std::string>());
        result.language = j.value("language", "");

        if (j.contains("segments") && j["segments"].is_array()) {
            for (const auto& s : j["segments"]) {
                result.segments.push_back(TranscriptSegment{
                    .start_s = s.value("start", 0.0),
                    .end_s = s.value("end", 0.0),
                    .text = trim(s.value("text", "")),
                });
            }
        }
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
