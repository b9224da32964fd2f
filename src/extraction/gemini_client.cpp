#include "gemini_client.hpp"
#include "prompts.hpp"
#include "response_parser.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <managers/job_log.hpp>
#include <util/string_utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <cstdlib>

using json = nlohmann::json;

// ── libcurl callbacks ─────────────────────────────────────────

static size_t curl_write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
static int curl_progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<CancelToken*>(clientp);
    return (token && token->cancelled()) ? 1 : 0;
}

// ── Construction ──────────────────────────────────────────────

GeminiClient::GeminiClient(const ExtractionConfig& config) : config_(config) {}

std::string GeminiClient::api_key() const {
    const char* raw = std::getenv(config_.api_key_env.c_str());
    std::string key = raw ? StringUtils::trim(raw) : "";
    if (key.empty()) {
        throw ExtractionError(config_.api_key_env + " is not set");
    }
    return key;
}

// ── Request ───────────────────────────────────────────────────

static json row_schema() {
    auto nullable_string = json{{"type", "STRING"}, {"nullable", true}};
    return json{
        {"type", "OBJECT"},
        {"properties", {
            {"chartTitle", {{"type", "STRING"}}},
            {"chartSection", {{"type", "STRING"}}},
            {"thisWeekRank", nullable_string},
            {"lastWeekRank", nullable_string},
            {"twoWeeksAgoRank", nullable_string},
            {"weeksOnChart", nullable_string},
            {"title", {{"type", "STRING"}}},
            {"artist", {{"type", "STRING"}}},
            {"label", {{"type", "STRING"}}},
        }},
        {"required", json::array({"chartTitle", "title", "artist", "label"})},
    };
}

json GeminiClient::build_request_body(const ExtractionRequest& request) const {
    std::string prompt = request.mode == ExtractionMode::MissingRows
        ? missing_rows_prompt(request.missing_groups)
        : full_extraction_prompt();

    return json{
        {"systemInstruction", {{"parts", json::array({{{"text", extraction_system_prompt()}}})}}},
        {"contents", json::array({
            {
                {"role", "user"},
                {"parts", json::array({
                    {{"text", prompt}},
                    {{"inlineData", {
                        {"mimeType", request.mime_type},
                        {"data", base64_encode(request.image)},
                    }}},
                })},
            },
        })},
        {"generationConfig", {
            {"temperature", config_.temperature},
            {"responseMimeType", "application/json"},
            {"responseSchema", {
                {"type", "OBJECT"},
                {"properties", {{"rows", {{"type", "ARRAY"}, {"items", row_schema()}}}}},
                {"required", json::array({"rows"})},
            }},
        }},
    };
}

std::string GeminiClient::post(const std::string& url, const std::string& body,
                               const std::string& key, CancelToken* token) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw ExtractionError("curl_easy_init failed");

    std::string response;
    struct curl_slist* headers = nullptr;
    std::string auth = "x-goog-api-key: " + key;
    headers = curl_slist_append(headers, auth.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_secs));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, curl_progress_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, token);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK && token && token->cancelled()) {
        throw CancelledError(token->reason());
    }
    if (res != CURLE_OK) {
        throw ExtractionError(std::string("Gemini request failed: ") + curl_easy_strerror(res));
    }
    if (http_code < 200 || http_code >= 300) {
        std::string detail = response.substr(0, 500);
        auto parsed = json::parse(response, nullptr, false);
        if (!parsed.is_discarded() && parsed.contains("error") &&
            parsed["error"].contains("message") && parsed["error"]["message"].is_string()) {
            detail = parsed["error"]["message"].get<std::string>();
        }
        throw ExtractionError(fmt::format("Gemini returned HTTP {}: {}", http_code, detail));
    }
    return response;
}

// ── Response ──────────────────────────────────────────────────

ExtractionResponse GeminiClient::parse_response_body(const std::string& body,
                                                     const std::string& model) const {
    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw ExtractionError("Gemini response is not JSON");
    }

    auto candidates = doc.find("candidates");
    if (candidates == doc.end() || !candidates->is_array() || candidates->empty()) {
        std::string reason = "no candidates";
        if (doc.contains("promptFeedback") && doc["promptFeedback"].contains("blockReason")) {
            reason = "blocked: " + doc["promptFeedback"]["blockReason"].dump();
        }
        throw ExtractionError("Gemini returned " + reason);
    }

    const auto& first = candidates->at(0);
    std::string text;
    if (first.contains("content") && first["content"].contains("parts") &&
        first["content"]["parts"].is_array()) {
        for (const auto& part : first["content"]["parts"]) {
            if (part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
    }
    if (text.empty()) {
        std::string finish = first.value("finishReason", std::string("unknown"));
        throw ExtractionError("Gemini returned no text (finishReason " + finish + ")");
    }

    ExtractionResponse out;
    out.rows = parse_extraction_response(text);

    json raw = {
        {"model", model},
        {"object", {{"rows", rows_to_json(out.rows)}}},
        {"usage", doc.value("usageMetadata", json::object())},
        {"finishReason", first.value("finishReason", std::string())},
    };
    out.raw_json = raw.dump(2, ' ', false, json::error_handler_t::replace);
    return out;
}

ExtractionResponse GeminiClient::extract(const ExtractionRequest& request) {
    if (request.token) request.token->throw_if_cancelled();

    std::string key = api_key();
    std::string url = fmt::format("{}/models/{}:generateContent", config_.endpoint, request.model);
    std::string body = build_request_body(request).dump();

    chartreader_log(fmt::format("gemini: {} request model={} image={}B body={}B",
                                extraction_mode_name(request.mode), request.model,
                                request.image.size(), body.size()));

    std::string response = post(url, body, key, request.token);
    auto parsed = parse_response_body(response, request.model);

    chartreader_log(fmt::format("gemini: {} response rows={}",
                                extraction_mode_name(request.mode), parsed.rows.size()));
    return parsed;
}
