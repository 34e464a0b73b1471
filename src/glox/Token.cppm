export module glox:Token;

import std;

import :EnumFormatter;
import :SourceLocation;

namespace {

// helper type for the in-place visitor
template <class... Ts> struct overloads : Ts...
{
    using Ts::operator()...;
};

} // namespace

namespace glox {

export enum class TokenType : std::uint8_t {
    // Single-character tokens
    LeftParenthesis,  // (
    RightParenthesis, // )
    LeftBrace,        // {
    RightBrace,       // }
    Comma,            // ,
    Dot,              // .
    Minus,            // -
    Plus,             // +
    Semicolon,        // ;
    Slash,            // /
    Star,             // *
    QuestionMark,     // ?
    Colon,            // :

    // One or two character tokens
    Bang,         // !
    BangEqual,    // !=
    Equal,        // =
    EqualEqual,   // ==
    Greater,      // >
    GreaterEqual, // >=
    Less,         // <
    LessEqual,    // <=

    // Literals
    Identifier, // variable names
    String,     // "hello"
    Number,     // 4, 10.01

    // Keywords
    And,
    Class,
    Else,
    False,
    Fun,
    For,
    If,
    Nil,
    Or,
    Print,
    Return,
    Super,
    This,
    True,
    Var,
    While,

    // Meta tokens, kept so the token stream covers the whole source
    Comment,    // // to end of line
    Whitespace, // see WhitespaceKind

    EndOfFile,
};

export enum class WhitespaceKind : std::uint8_t {
    Space,
    Tab,
    CarriageReturn,
    Newline,
};

export class Token
{
public:
    // Identifier name, string contents or comment body
    using TextLiteral = std::string;
    using NumberLiteral = double;
    struct EmptyLiteral
    {
        EmptyLiteral() = default;
        // A hack to make Literal (and Token) types implicitly non-copyable; use clone() for
        // explicit copy.
        EmptyLiteral(const EmptyLiteral &) = delete;
        auto operator=(const EmptyLiteral &) -> EmptyLiteral & = delete;
        EmptyLiteral(EmptyLiteral &&) = default;
        auto operator=(EmptyLiteral &&) -> EmptyLiteral & = default;
        ~EmptyLiteral() = default;

        auto operator==(const EmptyLiteral &) const -> bool = default;
    };

    using Literal = std::variant<EmptyLiteral, TextLiteral, NumberLiteral, WhitespaceKind>;

    Token(TokenType type, std::string lexeme, Literal literal = EmptyLiteral{})
        : m_type(type)
        , m_lexeme(std::move(lexeme))
        , m_literal(std::move(literal))
    {
    }

    friend class std::formatter<Token>;

    [[nodiscard]] auto get_type() const -> TokenType { return m_type; }

    [[nodiscard]] auto is(TokenType type) const -> bool { return m_type == type; }

    [[nodiscard]] auto get_lexeme() const -> const std::string & { return m_lexeme; }

    [[nodiscard]] auto get_literal() const -> const Literal & { return m_literal; }

    [[nodiscard]] auto get_text() const -> const TextLiteral & { return std::get<TextLiteral>(m_literal); }

    [[nodiscard]] auto get_number() const -> NumberLiteral { return std::get<NumberLiteral>(m_literal); }

    [[nodiscard]] auto get_whitespace() const -> WhitespaceKind
    {
        return std::get<WhitespaceKind>(m_literal);
    }

    [[nodiscard]] auto clone() const -> Token;

    // Lexeme is presentation only; two tokens are equal when kind and payload match
    auto operator==(const Token & other) const -> bool
    {
        return m_type == other.m_type && m_literal == other.m_literal;
    }

private:
    TokenType m_type;
    std::string m_lexeme;
    Literal m_literal;
};

// A token together with the span of source it was scanned from
export struct SourceToken
{
    Token token;
    SourceSpan span;

    [[nodiscard]] auto clone() const -> SourceToken { return {token.clone(), span}; }
};

export [[nodiscard]] auto keyword_type(std::string_view text) -> std::optional<TokenType>
{
    using enum TokenType;
    static const std::unordered_map<std::string_view, TokenType> keywords = {
            {"and", And},
            {"class", Class},
            {"else", Else},
            {"false", False},
            {"for", For},
            {"fun", Fun},
            {"if", If},
            {"nil", Nil},
            {"or", Or},
            {"print", Print},
            {"return", Return},
            {"super", Super},
            {"this", This},
            {"true", True},
            {"var", Var},
            {"while", While},
    };

    if (auto it = keywords.find(text); it != keywords.end()) {
        return it->second;
    }
    return std::nullopt;
}

// Source spelling of a token kind, used in diagnostics
export [[nodiscard]] auto describe(TokenType type) -> std::string_view
{
    using enum TokenType;
    switch (type) {
    case LeftParenthesis: return "(";
    case RightParenthesis: return ")";
    case LeftBrace: return "{";
    case RightBrace: return "}";
    case Comma: return ",";
    case Dot: return ".";
    case Minus: return "-";
    case Plus: return "+";
    case Semicolon: return ";";
    case Slash: return "/";
    case Star: return "*";
    case QuestionMark: return "?";
    case Colon: return ":";
    case Bang: return "!";
    case BangEqual: return "!=";
    case Equal: return "=";
    case EqualEqual: return "==";
    case Greater: return ">";
    case GreaterEqual: return ">=";
    case Less: return "<";
    case LessEqual: return "<=";
    case Identifier: return "identifier";
    case String: return "string";
    case Number: return "number";
    case And: return "and";
    case Class: return "class";
    case Else: return "else";
    case False: return "false";
    case Fun: return "fun";
    case For: return "for";
    case If: return "if";
    case Nil: return "nil";
    case Or: return "or";
    case Print: return "print";
    case Return: return "return";
    case Super: return "super";
    case This: return "this";
    case True: return "true";
    case Var: return "var";
    case While: return "while";
    case Comment: return "comment";
    case Whitespace: return "whitespace";
    case EndOfFile: return "end of file";
    }
    std::unreachable();
}

export [[nodiscard]] auto describe(const Token & token) -> std::string_view
{
    if (token.get_lexeme().empty()) {
        return describe(token.get_type());
    }
    return token.get_lexeme();
}

auto Token::clone() const -> Token
{
    auto literal = std::visit(
            overloads{
                    [](const EmptyLiteral &) -> Literal { return EmptyLiteral{}; },
                    [](const auto & lit) -> Literal { return lit; },
            },
            m_literal
    );
    return {m_type, m_lexeme, std::move(literal)};
}

} // namespace glox

template <> struct std::formatter<glox::TokenType> : glox::EnumFormatter<glox::TokenType>
{
};

template <>
struct std::formatter<glox::WhitespaceKind> : glox::EnumFormatter<glox::WhitespaceKind>
{
};

template <> struct std::formatter<glox::Token::EmptyLiteral> : std::formatter<std::string_view>
{
    auto format(const glox::Token::EmptyLiteral & /* lit */, std::format_context & ctx) const
    {
        return std::formatter<std::string_view>::format("<empty>", ctx);
    }
};

template <> struct std::formatter<glox::Token::Literal> : std::formatter<std::string_view>
{
    auto format(const glox::Token::Literal & literal, std::format_context & ctx) const
    {
        return std::visit(
                [&](const auto & value) { return std::format_to(ctx.out(), "{}", value); },
                literal
        );
    }
};

template <> struct std::formatter<glox::Token> : std::formatter<std::string_view>
{
    auto format(const glox::Token & token, std::format_context & ctx) const
    {
        return std::format_to(
                ctx.out(),
                "Token(type={}, lexeme={:?}, literal={})",
                token.m_type,
                token.m_lexeme,
                token.m_literal
        );
    }
};

template <> struct std::formatter<glox::SourceToken> : std::formatter<std::string_view>
{
    auto format(const glox::SourceToken & token, std::format_context & ctx) const
    {
        return std::format_to(ctx.out(), "{} @ {}", token.token, token.span);
    }
};
