#pragma once

#include "config/config_types.hpp"
#include "core/cancel_token.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace querydesk {

enum class AiChunkKind : uint8_t {
    REASONING,
    CONTENT,
    USAGE,
    PREVIEW
};

[[nodiscard]] inline const char* ai_chunk_kind_to_string(AiChunkKind kind) {
    switch (kind) {
        case AiChunkKind::REASONING: return "reasoning";
        case AiChunkKind::CONTENT:   return "content";
        case AiChunkKind::USAGE:     return "usage";
        case AiChunkKind::PREVIEW:   return "preview";
        default:                     return "unknown";
    }
}

/// Progressive output callback: (kind, text)
using AiChunkCallback = std::function<void(AiChunkKind, const std::string&)>;

/**
 * @brief Incremental parser for a streamed chat-completions response
 *
 * Accepts SSE "data: {...}" lines as well as bare JSON lines, including
 * several objects glued together on one line. The stream ends at "[DONE]"
 * or at a choice with finish_reason "stop".
 */
class ChatStreamParser {
public:
    explicit ChatStreamParser(AiChunkCallback on_chunk = {});

    /// Feed raw response bytes; returns false once the stream has ended
    bool feed(std::string_view data);

    /// Process a trailing line that had no newline
    void finish();

    [[nodiscard]] bool done() const { return done_; }

    /// Concatenated content pieces (reasoning excluded)
    [[nodiscard]] const std::string& content() const { return content_; }

private:
    void handle_line(std::string_view line);
    void handle_object(const nlohmann::json& obj);
    void emit(AiChunkKind kind, const std::string& text);

    AiChunkCallback on_chunk_;
    std::string buffer_;
    std::string content_;
    bool done_ = false;
};

/**
 * @brief Natural-language to SQL through an OpenAI-compatible endpoint
 *
 * Uses httplib::Client. Connection errors, HTTP 5xx and 429 are retried
 * up to max_retries times. The schema description is pulled from the
 * injected schema source when include_schema is set.
 */
class AiClient {
public:
    using SchemaSource = std::function<std::string()>;

    explicit AiClient(AiConfig config, SchemaSource schema_source = {});

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    /**
     * @brief Generate SQL for a natural-language request
     * @param on_chunk When set, the response is streamed and each piece reported
     * @param cancel Checked between received chunks
     * @return SQL text with any surrounding code fence removed
     */
    [[nodiscard]] Result<std::string> generate(const std::string& request,
                                               AiChunkCallback on_chunk = {},
                                               const CancelToken* cancel = nullptr);

    /// base_url with "/chat/completions" appended unless it names an endpoint already
    [[nodiscard]] static std::string endpoint_url(std::string_view base_url);

    /// "https://host:port/path?q" -> {"https://host:port", "/path?q"}
    [[nodiscard]] static std::pair<std::string, std::string> split_url(std::string_view url);

    /// Stored value names an env var if one is set, otherwise it is the key itself
    [[nodiscard]] static std::string resolve_api_key(const std::string& setting);

    [[nodiscard]] static std::string build_prompt(const std::string& request, const std::string& schema);

    [[nodiscard]] static std::string strip_code_fence(std::string_view text);

    /// Text of a non-streamed response body; the raw body when no known field is present
    [[nodiscard]] static std::string extract_content(const std::string& body);

private:
    [[nodiscard]] nlohmann::json build_payload(const std::string& prompt, bool stream) const;

    AiConfig config_;
    SchemaSource schema_source_;
};

} // namespace querydesk
