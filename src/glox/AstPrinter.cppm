export module glox:AstPrinter;

import std;

import :Expr;
import :Stmt;
import :Token;
import :Value;

namespace {

// helper type for the in-place visitor
template <class... Ts> struct overloads : Ts...
{
    using Ts::operator()...;
};

} // namespace

namespace glox {

// Renders statements and expressions as parenthesized prefix notation, e.g. (+ 1 (* 2 3))
export class AstPrinter
{
public:
    auto print(const Stmt & stmt) -> std::string { return std::visit(*this, stmt); }

    auto print(const Expr & expr) -> std::string { return std::visit(*this, expr); }

    // statements

    auto operator()(const stmt::Expression & stmt) -> std::string
    {
        return std::format("Expression Statement: {}", print(*stmt.expr));
    }

    auto operator()(const stmt::Print & stmt) -> std::string
    {
        return std::format("Print Statement: {}", print(*stmt.expr));
    }

    auto operator()(const stmt::Var & stmt) -> std::string
    {
        auto init = stmt.init.transform([this](const auto & e) {
            return std::format(" = {}", print(*e));
        });
        return std::format(
                "Variable Statement: {}{}", stmt.name.token.get_lexeme(), init.value_or("")
        );
    }

    // expressions

    auto operator()(const expr::Binary & expr) -> std::string
    {
        return parenthesize(expr.op.token.get_lexeme(), *expr.left, *expr.right);
    }

    auto operator()(const expr::Grouping & expr) -> std::string
    {
        return parenthesize("group", *expr.expr);
    }

    auto operator()(const expr::Literal & expr) -> std::string
    {
        const auto visitor = overloads{
                [](const value::String & str) { return str; },
                [](value::Nil) { return std::string{"nil"}; },
                [](const auto & val) { return std::format("{}", val); },
        };

        return std::visit(visitor, expr.value);
    }

    auto operator()(const expr::Ternary & expr) -> std::string
    {
        return std::format(
                "({} ? {} : {})",
                print(*expr.condition),
                print(*expr.left_result),
                print(*expr.right_result)
        );
    }

    auto operator()(const expr::Unary & expr) -> std::string
    {
        return parenthesize(expr.op.token.get_lexeme(), *expr.right);
    }

    auto operator()(const expr::Variable & expr) -> std::string
    {
        return expr.name.token.get_lexeme();
    }

private:
    auto parenthesize(std::string_view name, const std::same_as<Expr> auto &... exprs)
            -> std::string
    {
        std::stringstream exprs_joined;
        ((exprs_joined << ' ' << print(exprs)), ...);

        return std::format("({}{})", name, std::move(exprs_joined).str());
    }
};

} // namespace glox
