#include "parser/statement_splitter.hpp"
#include "core/utils.hpp"

#include <regex>

namespace querydesk {

namespace {

// ============================================================================
// Minimal SQL lexer used for FROM-target scanning
// ============================================================================

enum class TokenKind { WORD, QUOTED_IDENT, DOT, LPAREN, RPAREN, SEMICOLON, OTHER, END };

struct Token {
    TokenKind kind = TokenKind::END;
    std::string text;   // unquoted text for QUOTED_IDENT
};

bool is_word_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '$' || uc >= 0x80;
}

class Lexer {
public:
    explicit Lexer(std::string_view sql) : sql_(sql) {}

    Token next() {
        skip_trivia();
        if (pos_ >= sql_.size()) return {TokenKind::END, {}};

        const char c = sql_[pos_];
        switch (c) {
            case '.': ++pos_; return {TokenKind::DOT, "."};
            case '(': ++pos_; return {TokenKind::LPAREN, "("};
            case ')': ++pos_; return {TokenKind::RPAREN, ")"};
            case ';': ++pos_; return {TokenKind::SEMICOLON, ";"};
            case '"': return quoted('"');
            case '`': return quoted('`');
            case '[': return quoted(']');
            case '\'': skip_string(); return {TokenKind::OTHER, "'"};
            default: break;
        }

        if (is_word_char(c)) {
            const size_t start = pos_;
            while (pos_ < sql_.size() && is_word_char(sql_[pos_])) ++pos_;
            return {TokenKind::WORD, std::string(sql_.substr(start, pos_ - start))};
        }
        ++pos_;
        return {TokenKind::OTHER, std::string(1, c)};
    }

private:
    void skip_trivia() {
        while (pos_ < sql_.size()) {
            const char c = sql_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '-' && pos_ + 1 < sql_.size() && sql_[pos_ + 1] == '-') {
                const auto eol = sql_.find('\n', pos_);
                pos_ = (eol == std::string_view::npos) ? sql_.size() : eol + 1;
            } else if (c == '/' && pos_ + 1 < sql_.size() && sql_[pos_ + 1] == '*') {
                const auto close = sql_.find("*/", pos_ + 2);
                pos_ = (close == std::string_view::npos) ? sql_.size() : close + 2;
            } else {
                break;
            }
        }
    }

    void skip_string() {
        ++pos_;
        while (pos_ < sql_.size()) {
            if (sql_[pos_] == '\'') {
                if (pos_ + 1 < sql_.size() && sql_[pos_ + 1] == '\'') {
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                return;
            }
            ++pos_;
        }
    }

    Token quoted(char close) {
        ++pos_;
        std::string text;
        while (pos_ < sql_.size()) {
            const char c = sql_[pos_];
            if (c == close) {
                // Doubled closing quote is an escaped quote character
                if (close != ']' && pos_ + 1 < sql_.size() && sql_[pos_ + 1] == close) {
                    text += close;
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                return {TokenKind::QUOTED_IDENT, std::move(text)};
            }
            text += c;
            ++pos_;
        }
        // Unterminated quote
        return {TokenKind::OTHER, std::move(text)};
    }

    std::string_view sql_;
    size_t pos_ = 0;
};

bool is_identifier(const Token& t) {
    return t.kind == TokenKind::WORD || t.kind == TokenKind::QUOTED_IDENT;
}

} // namespace

// ============================================================================
// Statement splitting
// ============================================================================

std::vector<std::string> StatementSplitter::split(std::string_view sql) {
    std::vector<std::string> statements;
    size_t start = 0;
    while (start <= sql.size()) {
        const auto semi = sql.find(';', start);
        const auto end = (semi == std::string_view::npos) ? sql.size() : semi;
        auto piece = utils::trim(sql.substr(start, end - start));
        if (!piece.empty()) statements.push_back(std::move(piece));
        if (semi == std::string_view::npos) break;
        start = semi + 1;
    }
    return statements;
}

// ============================================================================
// Connection directives
// ============================================================================

DirectiveExtraction StatementSplitter::extract_connection_directive(std::string_view sql) {
    static const std::regex comment_form(
        R"(^\s*--\s*connection\s*:\s*([^\s]+)[^\n]*\n?)", std::regex::icase);
    static const std::regex use_form(
        R"(^\s*USE\s+CONNECTION\s+([^\s;]+)\s*;?)", std::regex::icase);

    const std::string text(sql);
    std::smatch match;
    for (const auto* re : {&comment_form, &use_form}) {
        if (std::regex_search(text, match, *re, std::regex_constants::match_continuous)) {
            DirectiveExtraction out;
            out.connection_name = match[1].str();
            out.remaining_sql = utils::trim(std::string_view(text).substr(
                static_cast<size_t>(match.position(0) + match.length(0))));
            return out;
        }
    }
    return {std::nullopt, text};
}

// ============================================================================
// FROM-target scanning
// ============================================================================

std::optional<std::string> StatementSplitter::extract_primary_table(std::string_view sql) {
    Lexer lexer(sql);
    int depth = 0;

    for (Token tok = lexer.next(); tok.kind != TokenKind::END; tok = lexer.next()) {
        if (tok.kind == TokenKind::LPAREN) { ++depth; continue; }
        if (tok.kind == TokenKind::RPAREN) { if (depth > 0) --depth; continue; }
        if (tok.kind == TokenKind::SEMICOLON && depth == 0) return std::nullopt;
        if (depth != 0 || tok.kind != TokenKind::WORD || !utils::iequals(tok.text, "from")) continue;

        Token part = lexer.next();
        if (!is_identifier(part)) return std::nullopt;

        std::string name = part.text;
        Token after = lexer.next();
        while (after.kind == TokenKind::DOT) {
            part = lexer.next();
            if (!is_identifier(part)) return std::nullopt;
            name += '.';
            name += part.text;
            after = lexer.next();
        }
        return name;
    }
    return std::nullopt;
}

std::vector<std::string> StatementSplitter::split_qualified_name(std::string_view name) {
    std::vector<std::string> parts;
    Lexer lexer(name);
    bool expect_part = true;
    for (Token tok = lexer.next(); tok.kind != TokenKind::END; tok = lexer.next()) {
        if (expect_part && is_identifier(tok)) {
            parts.push_back(tok.text);
            expect_part = false;
        } else if (!expect_part && tok.kind == TokenKind::DOT) {
            expect_part = true;
        } else {
            // Not a plain qualified name; treat the whole text as one opaque identifier
            return {std::string(name)};
        }
    }
    if (parts.empty() || expect_part) return {std::string(name)};
    return parts;
}

} // namespace querydesk
