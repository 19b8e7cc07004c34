#include "ai/ai_client.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <cstdlib>
#include <format>
#include <thread>

namespace querydesk {

namespace {

constexpr std::string_view kInstructions =
    "You are a helpful assistant that converts a developer's natural language request "
    "into a single valid SQL query. Return only the SQL statement, do not wrap it in "
    "markdown or explain it. If the request is ambiguous, return a commented SQL with a "
    "short clarifying comment. Answer in the language of the request.\n\n";

std::string string_member(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

/// First non-empty string among keys
std::string first_text(const nlohmann::json& obj, const char* a, const char* b) {
    auto v = string_member(obj, a);
    return v.empty() ? string_member(obj, b) : v;
}

} // anonymous namespace

// ============================================================================
// ChatStreamParser
// ============================================================================

ChatStreamParser::ChatStreamParser(AiChunkCallback on_chunk)
    : on_chunk_(std::move(on_chunk)) {}

bool ChatStreamParser::feed(std::string_view data) {
    if (done_) return false;
    buffer_.append(data);

    size_t nl;
    while (!done_ && (nl = buffer_.find('\n')) != std::string::npos) {
        const std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        handle_line(line);
    }
    if (done_) buffer_.clear();
    return !done_;
}

void ChatStreamParser::finish() {
    if (done_ || buffer_.empty()) return;
    const std::string line = std::move(buffer_);
    buffer_.clear();
    handle_line(line);
}

void ChatStreamParser::emit(AiChunkKind kind, const std::string& text) {
    if (kind == AiChunkKind::CONTENT) content_ += text;
    if (on_chunk_) on_chunk_(kind, text);
}

void ChatStreamParser::handle_line(std::string_view raw) {
    auto line = utils::trim(raw);
    if (line.empty()) return;

    std::string payload = line.starts_with("data:") ? utils::trim(line.substr(5)) : line;
    if (payload == "[DONE]") {
        done_ = true;
        return;
    }

    // Some servers glue objects together: {...}{...}
    std::vector<std::string> parts;
    if (payload.starts_with('{') && payload.find("}{") != std::string::npos) {
        size_t start = 0;
        size_t pos;
        while ((pos = payload.find("}{", start)) != std::string::npos) {
            parts.push_back(payload.substr(start, pos + 1 - start));
            start = pos + 1;
        }
        parts.push_back(payload.substr(start));
    } else {
        parts.push_back(std::move(payload));
    }

    for (const auto& part : parts) {
        if (done_) return;
        const auto obj = nlohmann::json::parse(part, nullptr, false);
        if (obj.is_discarded() || !obj.is_object()) {
            emit(AiChunkKind::PREVIEW, part);
            continue;
        }
        handle_object(obj);
    }
}

void ChatStreamParser::handle_object(const nlohmann::json& obj) {
    if (obj.contains("usage") && !obj["usage"].is_null()) {
        emit(AiChunkKind::USAGE, obj["usage"].dump());
    }

    bool emitted = false;
    bool stop = false;
    if (obj.contains("choices") && obj["choices"].is_array()) {
        for (const auto& choice : obj["choices"]) {
            if (!choice.is_object()) continue;
            bool piece = false;
            if (choice.contains("delta") && choice["delta"].is_object()) {
                const auto& delta = choice["delta"];
                const auto reasoning = first_text(delta, "reasoning_content", "reasoning");
                if (!reasoning.empty()) {
                    emit(AiChunkKind::REASONING, reasoning);
                    piece = true;
                }
                const auto content = first_text(delta, "content", "text");
                if (!content.empty()) {
                    emit(AiChunkKind::CONTENT, content);
                    piece = true;
                }
            }
            if (!piece && choice.contains("message")) {
                const auto content = first_text(choice["message"], "content", "text");
                if (!content.empty()) {
                    emit(AiChunkKind::CONTENT, content);
                    piece = true;
                }
            }
            emitted = emitted || piece;
            if (string_member(choice, "finish_reason") == "stop") stop = true;
        }
    }

    if (!emitted && obj.contains("message")) {
        const auto content = first_text(obj["message"], "content", "text");
        if (!content.empty()) {
            emit(AiChunkKind::CONTENT, content);
            emitted = true;
        }
    }

    if (!emitted && !stop) {
        nlohmann::json preview = nlohmann::json::object();
        for (const char* key : {"choices", "object", "id"}) {
            if (obj.contains(key)) preview[key] = obj[key];
        }
        if (!preview.empty()) emit(AiChunkKind::PREVIEW, preview.dump());
    }

    if (stop) done_ = true;
}

// ============================================================================
// AiClient helpers
// ============================================================================

AiClient::AiClient(AiConfig config, SchemaSource schema_source)
    : config_(std::move(config)),
      schema_source_(std::move(schema_source)) {}

std::string AiClient::endpoint_url(std::string_view base_url) {
    std::string url(base_url);
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (url.find("/chat") == std::string::npos && url.find("/completions") == std::string::npos) {
        url += "/chat/completions";
    }
    return url;
}

std::pair<std::string, std::string> AiClient::split_url(std::string_view url) {
    const auto scheme_end = url.find("://");
    const size_t host_start = scheme_end == std::string_view::npos ? 0 : scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    if (path_start == std::string_view::npos) {
        return {std::string(url), "/"};
    }
    return {std::string(url.substr(0, path_start)), std::string(url.substr(path_start))};
}

std::string AiClient::resolve_api_key(const std::string& setting) {
    if (setting.empty()) return {};
    if (const char* env = std::getenv(setting.c_str()); env != nullptr) {
        return env;
    }
    return setting;
}

std::string AiClient::build_prompt(const std::string& request, const std::string& schema) {
    std::string prompt;
    if (!schema.empty()) {
        prompt = std::format("Current DB schema:\n```{}```\n\n", schema);
    }
    prompt += kInstructions;
    prompt += std::format("UserInput: ```{}```\n\nSQL:", request);
    return prompt;
}

std::string AiClient::strip_code_fence(std::string_view text) {
    std::string out = utils::trim(text);
    if (out.size() < 6 || !out.starts_with("```") || !out.ends_with("```")) {
        return out;
    }
    auto lines = utils::split(out, '\n');
    if (!lines.empty()) lines.erase(lines.begin());
    if (!lines.empty() && utils::trim(lines.back()).starts_with("```")) lines.pop_back();

    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += lines[i];
    }
    return utils::trim(joined);
}

std::string AiClient::extract_content(const std::string& body) {
    const auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return body;

    if (doc.contains("choices") && doc["choices"].is_array() && !doc["choices"].empty()) {
        const auto& first = doc["choices"][0];
        if (first.is_object()) {
            if (first.contains("message")) {
                auto content = string_member(first["message"], "content");
                if (!content.empty()) return content;
            }
            auto text = string_member(first, "text");
            if (!text.empty()) return text;
        }
    }

    auto result = string_member(doc, "result");
    if (!result.empty()) return result;

    if (doc.contains("data")) {
        if (doc["data"].is_string()) return doc["data"].get<std::string>();
        auto text = string_member(doc["data"], "text");
        if (!text.empty()) return text;
    }
    return body;
}

nlohmann::json AiClient::build_payload(const std::string& prompt, bool stream) const {
    nlohmann::json payload = {
        {"model", config_.model},
        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", prompt}}})},
        {"temperature", 0.0},
        {"max_tokens", config_.max_tokens},
    };
    if (stream) payload["stream"] = true;
    return payload;
}

// ============================================================================
// generate
// ============================================================================

Result<std::string> AiClient::generate(const std::string& request,
                                       AiChunkCallback on_chunk,
                                       const CancelToken* cancel) {
    if (!config_.enabled) {
        return Result<std::string>::error(ErrorCategory::UNAVAILABLE, "AI assistant is disabled");
    }
    if (utils::trim(request).empty()) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR, "Empty prompt");
    }
    if (config_.base_url.empty()) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR, "AI base URL not configured");
    }

    std::string schema;
    if (config_.include_schema && schema_source_) {
        schema = schema_source_();
        utils::log::debug(std::format("Including schema in AI prompt ({} chars)", schema.size()));
    }

    const bool stream = static_cast<bool>(on_chunk);
    const auto url = endpoint_url(config_.base_url);
    const auto [origin, path] = split_url(url);
    const auto api_key = resolve_api_key(config_.api_key);
    const auto body = build_payload(build_prompt(request, schema), stream).dump();

    utils::log::debug(std::format("AI request to {} (api key {})", url, api_key.empty() ? "none" : "set"));

    httplib::Client cli(origin);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    auto canceled = [cancel] { return cancel != nullptr && cancel->is_canceled(); };
    std::string last_error;

    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (canceled()) {
            return Result<std::string>::error(ErrorCategory::CANCELED, "AI request canceled");
        }

        int status = 0;
        bool received = false;
        std::string raw;
        ChatStreamParser parser(on_chunk);

        httplib::Request req;
        req.method = "POST";
        req.path = path;
        req.body = body;
        req.headers = {{"Content-Type", "application/json"}};
        if (!api_key.empty()) {
            req.headers.emplace("Authorization", "Bearer " + api_key);
        }
        req.response_handler = [&status](const httplib::Response& res) {
            status = res.status;
            return true;
        };
        req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
            if (canceled()) return false;
            raw.append(data, len);
            if (stream && status == httplib::StatusCode::OK_200) {
                received = true;
                parser.feed(std::string_view(data, len));
            }
            return true;
        };

        const auto res = cli.send(req);
        if (!res) {
            if (canceled()) {
                return Result<std::string>::error(ErrorCategory::CANCELED, "AI request canceled");
            }
            last_error = std::format("connection error: {}", httplib::to_string(res.error()));
            if (!received && attempt < config_.max_retries) {
                utils::log::warn(std::format("AI request failed ({}), retrying", last_error));
                std::this_thread::sleep_for(std::chrono::milliseconds(500 * (attempt + 1)));
                continue;
            }
            return Result<std::string>::error(ErrorCategory::UNAVAILABLE,
                std::format("AI request failed: {}", last_error));
        }

        if (status == 0) status = res->status;
        if (status == httplib::StatusCode::TooManyRequests_429 || status >= 500) {
            last_error = std::format("HTTP {} - {}", status, raw.substr(0, 200));
            if (attempt < config_.max_retries) {
                utils::log::warn(std::format("AI endpoint returned {}, retrying", status));
                std::this_thread::sleep_for(std::chrono::milliseconds(1000 * (attempt + 1)));
                continue;
            }
            return Result<std::string>::error(ErrorCategory::UNAVAILABLE,
                std::format("AI endpoint error: {}", last_error));
        }
        if (status != httplib::StatusCode::OK_200) {
            return Result<std::string>::error(ErrorCategory::UNAVAILABLE,
                std::format("AI endpoint error: HTTP {} - {}", status, raw.substr(0, 200)));
        }

        std::string text;
        if (stream) {
            parser.finish();
            text = parser.content();
            if (text.empty()) {
                // Server ignored "stream" and answered with one JSON document
                const auto doc = nlohmann::json::parse(raw, nullptr, false);
                if (!doc.is_discarded() && doc.is_object()) {
                    text = extract_content(raw);
                    if (doc.contains("usage") && !doc["usage"].is_null()) {
                        on_chunk(AiChunkKind::USAGE, doc["usage"].dump());
                    }
                }
            }
        } else {
            text = extract_content(raw);
        }
        return Result<std::string>::ok(strip_code_fence(text));
    }

    return Result<std::string>::error(ErrorCategory::UNAVAILABLE,
        std::format("AI request failed: {}", last_error));
}

} // namespace querydesk
