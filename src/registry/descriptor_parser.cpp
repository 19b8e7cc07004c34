#include "registry/descriptor_parser.hpp"
#include "core/utils.hpp"

#include <format>

namespace querydesk {

namespace {

constexpr std::string_view kSchemaAliases[] = {"currentSchema", "search_path", "schema"};
constexpr std::string_view kTlsFlags[] = {"ssl", "useSSL"};
constexpr std::string_view kTimezoneAliases[] = {"timezone", "servertimezone"};
constexpr std::string_view kEncodingHint = "characterEncoding";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Query string -> ordered params. First value wins; blank values are dropped.
ParamList parse_query(std::string_view query) {
    ParamList params;
    size_t pos = 0;
    while (pos <= query.size()) {
        const auto amp = query.find('&', pos);
        const auto piece = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
        pos = (amp == std::string_view::npos) ? query.size() + 1 : amp + 1;

        const auto eq = piece.find('=');
        if (eq == std::string_view::npos) continue;
        auto key = DescriptorParser::percent_decode(piece.substr(0, eq), true);
        auto value = DescriptorParser::percent_decode(piece.substr(eq + 1), true);
        if (key.empty() || value.empty()) continue;
        params.set_default(std::move(key), std::move(value));
    }
    return params;
}

void consolidate_params(NormalizedFields& fields) {
    auto& params = fields.params;

    // Schema aliases: first alias found (in priority order) wins, all are removed
    std::optional<std::string> schema;
    for (const auto alias : kSchemaAliases) {
        auto value = params.take(alias);
        if (value && !schema) schema = std::move(value);
    }

    // TLS disable flag
    bool disable_tls = false;
    for (const auto flag : kTlsFlags) {
        if (auto value = params.take(flag); value && utils::iequals(*value, "false")) {
            disable_tls = true;
        }
    }
    if (disable_tls) params.set("sslmode", "disable");

    // Timezone aliases are matched case-insensitively
    std::optional<std::string> timezone;
    std::vector<std::string> tz_keys;
    for (const auto& [key, value] : params) {
        for (const auto alias : kTimezoneAliases) {
            if (utils::iequals(key, alias)) {
                tz_keys.push_back(key);
                if (!timezone) timezone = value;
            }
        }
    }
    for (const auto& key : tz_keys) params.erase(key);

    params.erase(kEncodingHint);

    if (schema || timezone) {
        std::string options = params.get("options").value_or("");
        if (schema) options = DescriptorParser::append_option(options, "-c search_path=" + *schema);
        if (timezone) options = DescriptorParser::append_option(options, "-c TimeZone=" + *timezone);
        params.set("options", std::move(options));
    }
    fields.schema = std::move(schema);
}

} // namespace

// ============================================================================
// Encoding helpers
// ============================================================================

std::string DescriptorParser::percent_decode(std::string_view s, bool plus_as_space) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex_value(s[i + 1]);
            const int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += (plus_as_space && s[i] == '+') ? ' ' : s[i];
    }
    return out;
}

std::string DescriptorParser::percent_encode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += kHex[uc >> 4];
            out += kHex[uc & 0x0F];
        }
    }
    return out;
}

std::string DescriptorParser::append_option(const std::string& options, const std::string& fragment) {
    if (options.empty()) return fragment;
    if (options.find(fragment) != std::string::npos) return options;
    return options + " " + fragment;
}

std::string DescriptorParser::kind_from_scheme(std::string_view scheme) {
    const auto lower = utils::to_lower(scheme);
    if (lower.starts_with("postgres")) return "postgresql";
    if (lower.starts_with("mysql") || lower.starts_with("mariadb")) return "mysql";
    return lower.substr(0, lower.find('+'));
}

// ============================================================================
// Parsing
// ============================================================================

Result<NormalizedFields> DescriptorParser::parse(std::string_view descriptor) {
    const auto trimmed = utils::trim(descriptor);
    if (!utils::istarts_with(trimmed, kJdbcPrefix)) {
        return Result<NormalizedFields>::error(ErrorCategory::PARSE_ERROR,
            std::format("Descriptor must start with '{}'", kJdbcPrefix));
    }
    return parse_uri(std::string_view(trimmed).substr(kJdbcPrefix.size()));
}

Result<NormalizedFields> DescriptorParser::parse_uri(std::string_view uri) {
    const auto colon = uri.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Result<NormalizedFields>::error(ErrorCategory::PARSE_ERROR,
            "Descriptor has no scheme");
    }

    NormalizedFields fields;
    fields.kind = kind_from_scheme(uri.substr(0, colon));

    std::string_view rest = uri.substr(colon + 1);
    std::string_view query;
    if (const auto q = rest.find('?'); q != std::string_view::npos) {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    if (const auto hash = query.find('#'); hash != std::string_view::npos) {
        query = query.substr(0, hash);
    }

    if (!rest.starts_with("//")) {
        // Opaque form, only meaningful for file databases: sqlite:/path/to.db
        if (fields.kind != "sqlite" || rest.empty()) {
            return Result<NormalizedFields>::error(ErrorCategory::PARSE_ERROR,
                std::format("Descriptor '{}' is missing '//' after the scheme", uri.substr(0, colon)));
        }
        fields.database = percent_decode(rest);
        fields.params = parse_query(query);
        consolidate_params(fields);
        return Result<NormalizedFields>::ok(std::move(fields));
    }

    rest.remove_prefix(2);
    const auto slash = rest.find('/');
    std::string_view netloc = rest.substr(0, slash);
    std::string_view path = (slash == std::string_view::npos) ? std::string_view{} : rest.substr(slash);

    // Credentials end at the last '@' so passwords may carry raw '@'
    std::string_view hostinfo = netloc;
    if (const auto at = netloc.rfind('@'); at != std::string_view::npos) {
        const auto userinfo = netloc.substr(0, at);
        hostinfo = netloc.substr(at + 1);
        const auto sep = userinfo.find(':');
        fields.user = percent_decode(userinfo.substr(0, sep));
        if (sep != std::string_view::npos) {
            fields.password = percent_decode(userinfo.substr(sep + 1));
        }
    }

    std::string_view port_text;
    if (hostinfo.starts_with('[')) {
        const auto close = hostinfo.find(']');
        if (close == std::string_view::npos) {
            return Result<NormalizedFields>::error(ErrorCategory::PARSE_ERROR,
                "Unterminated IPv6 host literal");
        }
        fields.host = std::string(hostinfo.substr(1, close - 1));
        if (close + 1 < hostinfo.size() && hostinfo[close + 1] == ':') {
            port_text = hostinfo.substr(close + 2);
        }
    } else {
        const auto sep = hostinfo.rfind(':');
        fields.host = percent_decode(hostinfo.substr(0, sep));
        if (sep != std::string_view::npos) port_text = hostinfo.substr(sep + 1);
    }

    if (!port_text.empty()) {
        const auto port = utils::try_parse_int<uint32_t>(port_text);
        if (!port || *port == 0 || *port > 65535) {
            return Result<NormalizedFields>::error(ErrorCategory::PARSE_ERROR,
                std::format("Invalid port '{}'", port_text));
        }
        fields.port = static_cast<uint16_t>(*port);
    }

    if (!path.empty()) fields.database = percent_decode(path.substr(1));

    fields.params = parse_query(query);
    consolidate_params(fields);
    return Result<NormalizedFields>::ok(std::move(fields));
}

} // namespace querydesk
