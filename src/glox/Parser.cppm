export module glox:Parser;

import std;

import :Error;
import :Expr;
import :ParserError;
import :ScopeExit;
import :SourceLocation;
import :Stmt;
import :Token;
import :Value;

using enum glox::TokenType;

namespace {

constexpr const std::size_t MAX_NESTING_DEPTH = 256;

} // namespace

namespace glox {

export class Parser
{
public:
    explicit Parser(std::vector<SourceToken> tokens)
        : m_tokens(std::move(tokens))
    {
    }

    // Syntax errors are collected in error_log(); parsing always runs to the end of input.
    auto parse() -> std::vector<StmtPtr>
    {
        std::erase_if(m_tokens, [](const SourceToken & source_token) {
            return source_token.token.is(Whitespace);
        });

        std::vector<StmtPtr> stmts;
        while (!is_at_end()) {
            auto decl = declaration();
            if (decl.has_value()) {
                stmts.push_back(std::move(decl).value());
            }
        }
        return stmts;
    }

    [[nodiscard]] auto error_log() const -> const ErrorLog & { return m_errors; }

private:
    [[nodiscard]] auto is_at_end() const -> bool { return peek() == nullptr; }

    // nullptr exactly at EndOfFile
    [[nodiscard]] auto peek() const -> const SourceToken *
    {
        if (m_current >= m_tokens.size()) {
            throw InternalError("Consumed all tokens without encountering end of file");
        }

        const auto & source_token = m_tokens[m_current];
        return source_token.token.is(EndOfFile) ? nullptr : &source_token;
    }

    [[nodiscard]] auto previous() const -> const SourceToken &
    {
        if (m_current == 0) {
            throw InternalError("Attempted to read previous token while at index 0");
        }
        return m_tokens[m_current - 1];
    }

    auto advance() -> const SourceToken *
    {
        const auto * source_token = peek();
        if (source_token != nullptr) {
            m_current++;
        }
        return source_token;
    }

    [[nodiscard]] auto check(TokenType type) const -> bool
    {
        const auto * source_token = peek();
        return source_token != nullptr && source_token->token.is(type);
    }

    auto match(TokenType type) -> bool
    {
        if (check(type)) {
            advance();
            return true;
        }
        return false;
    }

    auto match_any(std::same_as<TokenType> auto... types) -> bool { return (match(types) || ...); }

    // Advances, then requires the consumed token to be of the expected kind
    auto consume(TokenType expected, std::string_view where) -> const SourceToken &
    {
        const auto * source_token = advance();
        if (source_token == nullptr) {
            throw error(
                    std::nullopt,
                    std::format("Reached end of file while expecting '{}'", describe(expected))
            );
        }
        if (!source_token->token.is(expected)) {
            throw error(
                    source_token->span,
                    std::format(
                            "Expected '{}' {}, instead found '{}'",
                            describe(expected),
                            where,
                            describe(source_token->token)
                    )
            );
        }
        return *source_token;
    }

    static auto error(std::optional<SourceSpan> location, std::string message) -> ParserError
    {
        return ParserError({
                .kind = ErrorKind::Parsing,
                .subject = std::nullopt,
                .location = location,
                .message = std::move(message),
        });
    }

    // Skip to the next statement boundary so one malformed statement yields one error
    auto synchronize() -> void
    {
        while (!is_at_end()) {
            if (m_current > 0 && previous().token.is(Semicolon)) {
                return;
            }

            switch (peek()->token.get_type()) {
            case Class:
            case For:
            case Fun:
            case If:
            case Print:
            case Return:
            case Var:
            case While: return;
            default: // keep going
                break;
            }

            advance();
        }
    }

    static auto nesting_error(const SourceToken & at) -> ParserError
    {
        return error(
                at.span, std::format("Expression nesting exceeds {} levels", MAX_NESTING_DEPTH)
        );
    }

    // Entered by every grouping and unary operator, so parser recursion follows source nesting
    [[nodiscard]] auto nested()
    {
        if (m_depth >= MAX_NESTING_DEPTH) {
            throw nesting_error(previous());
        }
        m_depth++;
        return ScopeExit{[this]() { m_depth--; }};
    }

    // Records the height of a node built over children of the given height. Operator chains
    // fold into left-deep trees without recursing here, but evaluating, printing and
    // destroying the tree recurse once per level.
    auto grow(const SourceToken & at, std::size_t child_height) -> void
    {
        if (child_height >= MAX_NESTING_DEPTH) {
            throw nesting_error(at);
        }
        m_height = child_height + 1;
    }

    // This is recursive-descent parser, duh!
    // NOLINTBEGIN(misc-no-recursion)

    auto declaration() -> std::optional<StmtPtr>
    {
        try {
            if (match(Var)) {
                return var_declaration();
            }

            return statement();
        }
        catch (const ParserError & error) {
            m_errors.push(error.get_error());
            synchronize();
            return std::nullopt;
        }
    }

    auto var_declaration() -> StmtPtr
    {
        auto name = consume(Identifier, "after 'var'").clone();

        auto init = match(Equal) ? std::optional(expression()) : std::nullopt;
        consume(Semicolon, "after variable declaration");
        return make_unique_stmt<stmt::Var>(std::move(name), std::move(init));
    }

    auto statement() -> StmtPtr
    {
        if (match(Print)) {
            return print_statement();
        }

        return expression_statement();
    }

    auto print_statement() -> StmtPtr
    {
        auto value = expression();
        consume(Semicolon, "after value");
        return make_unique_stmt<stmt::Print>(std::move(value));
    }

    auto expression_statement() -> StmtPtr
    {
        auto expr = expression();
        consume(Semicolon, "after expression");
        return make_unique_stmt<stmt::Expression>(std::move(expr));
    }

    auto expression() -> ExprPtr { return ternary(); }

    auto ternary() -> ExprPtr
    {
        auto expr = equality();
        while (match(QuestionMark)) {
            auto height = m_height;
            auto question = previous().clone();
            auto left_result = equality();
            height = std::max(height, m_height);
            consume(Colon, "in ternary expression");
            auto right_result = equality();
            grow(question, std::max(height, m_height));
            expr = make_unique_expr<expr::Ternary>(
                    std::move(expr),
                    std::move(question),
                    std::move(left_result),
                    std::move(right_result)
            );
        }
        return expr;
    }

    auto equality() -> ExprPtr
    {
        auto expr = comparison();
        while (match_any(BangEqual, EqualEqual)) {
            auto height = m_height;
            auto op = previous().clone();
            auto right = comparison();
            grow(op, std::max(height, m_height));
            expr = make_unique_expr<expr::Binary>(std::move(expr), std::move(op), std::move(right));
        }
        return expr;
    }

    auto comparison() -> ExprPtr
    {
        auto expr = term();
        while (match_any(Greater, GreaterEqual, Less, LessEqual)) {
            auto height = m_height;
            auto op = previous().clone();
            auto right = term();
            grow(op, std::max(height, m_height));
            expr = make_unique_expr<expr::Binary>(std::move(expr), std::move(op), std::move(right));
        }
        return expr;
    }

    auto term() -> ExprPtr
    {
        auto expr = factor();
        while (match_any(Minus, Plus)) {
            auto height = m_height;
            auto op = previous().clone();
            auto right = factor();
            grow(op, std::max(height, m_height));
            expr = make_unique_expr<expr::Binary>(std::move(expr), std::move(op), std::move(right));
        }
        return expr;
    }

    auto factor() -> ExprPtr
    {
        auto expr = unary();
        while (match_any(Slash, Star)) {
            auto height = m_height;
            auto op = previous().clone();
            auto right = unary();
            grow(op, std::max(height, m_height));
            expr = make_unique_expr<expr::Binary>(std::move(expr), std::move(op), std::move(right));
        }
        return expr;
    }

    auto unary() -> ExprPtr
    {
        if (match_any(Bang, Minus)) {
            auto op = previous().clone();
            auto depth = nested();
            auto right = unary();
            grow(op, m_height);
            return make_unique_expr<expr::Unary>(std::move(op), std::move(right));
        }

        return primary();
    }

    auto primary() -> ExprPtr
    {
        const auto * source_token = advance();
        if (source_token == nullptr) {
            throw error(previous().span, "Ran out of tokens while satisfying expression rule");
        }

        // Leaves; grouping raises it below
        m_height = 0;

        const auto & token = source_token->token;
        switch (token.get_type()) {
        case False: return make_unique_expr<expr::Literal>(false);
        case True: return make_unique_expr<expr::Literal>(true);
        case Nil: return make_unique_expr<expr::Literal>(value::Nil{});
        case Number: return make_unique_expr<expr::Literal>(token.get_number());
        case String: return make_unique_expr<expr::Literal>(token.get_text());
        case Identifier: return make_unique_expr<expr::Variable>(source_token->clone());
        case LeftParenthesis: {
            auto depth = nested();
            auto expr = expression();
            grow(*source_token, m_height);
            consume(RightParenthesis, "after expression");
            return make_unique_expr<expr::Grouping>(std::move(expr));
        }
        default:
            throw error(
                    source_token->span,
                    std::format("Expected value or expression, found '{}'", describe(token))
            );
        }
    }

    // NOLINTEND(misc-no-recursion)

    std::vector<SourceToken> m_tokens;
    std::size_t m_current = 0;
    std::size_t m_depth = 0;
    // Height of the expression most recently returned by a rule
    std::size_t m_height = 0;
    ErrorLog m_errors;
};

} // namespace glox
