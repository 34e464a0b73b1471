export module glox:Scanner;

import std;

import fast_float;

import :Error;
import :SourceLocation;
import :SourceText;
import :Token;

namespace glox {

export class Scanner
{
public:
    explicit Scanner(std::string source)
        : m_source(std::move(source))
    {
    }

    // Lexical errors are collected in error_log(); the returned tokens always end with
    // EndOfFile.
    [[nodiscard]] auto scan_tokens() -> std::vector<SourceToken>
    {
        while (!is_at_end()) {
            scan_token();
            m_span.close();
        }

        m_tokens.push_back({Token(TokenType::EndOfFile, ""), m_span});
        return std::move(m_tokens);
    }

    [[nodiscard]] auto error_log() const -> const ErrorLog & { return m_errors; }

    [[nodiscard]] auto source() const -> const SourceText & { return m_source; }

private:
    [[nodiscard]] auto cursor() const -> std::size_t { return m_span.end.index; }

    [[nodiscard]] auto is_at_end() const -> bool { return cursor() >= m_source.size(); }

    // Ill-formed bytes are reported here, wherever they appear, and otherwise scanned as usual
    auto advance() -> std::string_view
    {
        auto grapheme = m_source.at(cursor());
        auto start = m_span.end;
        m_span.end.advance(grapheme);

        if (!is_well_formed(grapheme)) {
            error({start, m_span.end}, "Invalid UTF-8 sequence", escape_bytes(grapheme));
        }
        return grapheme;
    }

    [[nodiscard]] auto peek() const -> std::string_view
    {
        if (is_at_end()) {
            return "";
        }
        return m_source.at(cursor());
    }

    [[nodiscard]] auto peek_next() const -> std::string_view
    {
        if (cursor() + 1 >= m_source.size()) {
            return "";
        }
        return m_source.at(cursor() + 1);
    }

    auto match(std::string_view expected) -> bool
    {
        if (is_at_end() || peek() != expected) {
            return false;
        }

        advance();
        return true;
    }

    auto scan_token() -> void
    {
        using enum TokenType;
        static const std::unordered_map<std::string_view, TokenType> punctuation = {
                {"(", LeftParenthesis},
                {")", RightParenthesis},
                {"{", LeftBrace},
                {"}", RightBrace},
                {",", Comma},
                {".", Dot},
                {"-", Minus},
                {"+", Plus},
                {";", Semicolon},
                {"*", Star},
                {"?", QuestionMark},
                {":", Colon},
        };
        static const std::unordered_map<std::string_view, WhitespaceKind> whitespace = {
                {" ", WhitespaceKind::Space},
                {"\t", WhitespaceKind::Tab},
                {"\r", WhitespaceKind::CarriageReturn},
                {"\n", WhitespaceKind::Newline},
                {"\r\n", WhitespaceKind::Newline},
        };

        auto symbol = advance();

        if (auto it = punctuation.find(symbol); it != punctuation.end()) {
            add_token(it->second);
            return;
        }
        if (auto it = whitespace.find(symbol); it != whitespace.end()) {
            add_token(Whitespace, it->second);
            return;
        }

        // choose a token if next character matches a token continuation
        if (symbol == "!") {
            add_token(match("=") ? BangEqual : Bang);
        }
        else if (symbol == "=") {
            add_token(match("=") ? EqualEqual : Equal);
        }
        else if (symbol == "<") {
            add_token(match("=") ? LessEqual : Less);
        }
        else if (symbol == ">") {
            add_token(match("=") ? GreaterEqual : Greater);
        }
        // slash is a special-case: two continuous slashes define a comment
        else if (symbol == "/") {
            if (match("/")) {
                add_comment();
            }
            else {
                add_token(Slash);
            }
        }
        else if (symbol == "\"") {
            add_string();
        }
        else if (is_digit(symbol)) {
            add_number();
        }
        else if (is_alpha(symbol)) {
            add_identifier();
        }
        // advance() has already reported ill-formed symbols
        else if (is_well_formed(symbol)) {
            error("Unexpected character", std::string{symbol});
        }
    }

    auto add_comment() -> void
    {
        while (!is_at_end() && !SourceLocation::is_newline(peek())) {
            advance();
        }

        // Keep the body only, without the leading "//"
        auto lexeme = get_lexeme();
        auto body = lexeme.substr(2);
        add_token(TokenType::Comment, std::move(body));
    }

    auto add_string() -> void
    {
        while (!is_at_end() && peek() != "\"") {
            advance();
        }

        if (is_at_end()) {
            error("Unterminated String");
            return;
        }

        // Consume closing quote
        advance();

        // Make sure the literal is added without surrounding quotes
        auto lexeme = get_lexeme();
        auto literal = lexeme.substr(1, lexeme.size() - 2);
        add_token(TokenType::String, std::move(literal));
    }

    auto add_number() -> void
    {
        while (is_digit(peek())) {
            advance();
        }

        // Fractional part; a trailing '.' without digits is left for the Dot token
        if (peek() == "." && is_digit(peek_next())) {
            advance(); // consume the '.'
            while (is_digit(peek())) {
                advance();
            }
        }

        auto lexeme = get_lexeme();
        double num = 0;
        auto answer = fast_float::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), num);

        // Out of range literals still yield inf or 0, like any other double conversion
        auto parsed = answer.ec == std::errc() || answer.ec == std::errc::result_out_of_range;
        if (!parsed || answer.ptr != lexeme.data() + lexeme.size()) {
            throw InternalError(std::format("Scanned number '{}' is not a valid double", lexeme));
        }

        add_token(TokenType::Number, num);
    }

    auto add_identifier() -> void
    {
        while (is_alnum(peek())) {
            advance();
        }

        auto lexeme = get_lexeme();
        if (auto keyword = keyword_type(lexeme); keyword.has_value()) {
            add_token(keyword.value());
        }
        else {
            add_token(TokenType::Identifier, lexeme);
        }
    }

    auto add_token(TokenType type, Token::Literal literal = Token::EmptyLiteral{}) -> void
    {
        m_tokens.push_back({Token(type, get_lexeme(), std::move(literal)), m_span});
    }

    [[nodiscard]] auto get_lexeme() const -> std::string { return m_source.slice(m_span); }

    auto error(std::string message, std::optional<std::string> subject = std::nullopt) -> void
    {
        error(m_span, std::move(message), std::move(subject));
    }

    auto error(SourceSpan location, std::string message, std::optional<std::string> subject)
            -> void
    {
        m_errors.push({
                .kind = ErrorKind::Scanning,
                .subject = std::move(subject),
                .location = location,
                .message = std::move(message),
        });
    }

    // Raw bytes are not printable as text, so the subject spells them out, e.g. \xFF
    static auto escape_bytes(std::string_view bytes) -> std::string
    {
        std::string escaped;
        for (auto byte : bytes) {
            escaped += std::format("\\x{:02X}", static_cast<unsigned char>(byte));
        }
        return escaped;
    }

    SourceText m_source;
    std::vector<SourceToken> m_tokens;
    ErrorLog m_errors;

    SourceSpan m_span;
};

} // namespace glox
