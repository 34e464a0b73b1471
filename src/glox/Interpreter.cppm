export module glox:Interpreter;

import std;

import :Environment;
import :Error;
import :Expr;
import :ExprOperandConverter;
import :RuntimeError;
import :SourceLocation;
import :Stmt;
import :Token;
import :Value;

namespace glox {

export class Interpreter
{
public:
    explicit Interpreter(std::ostream & out = std::cout)
        : m_out(out)
    {
    }

    // Stops at the first runtime error, which is the only entry of the returned log
    auto interpret(std::span<const StmtPtr> statements) -> ErrorLog
    {
        ErrorLog errors;
        try {
            for (const auto & stmt : statements) {
                execute(*stmt);
            }
        }
        catch (const RuntimeError & err) {
            errors.push(err.get_error());
        }
        return errors;
    }

    auto evaluate(const Expr & expr) -> Value { return std::visit(*this, expr); }

    auto execute(const Stmt & stmt) -> void { std::visit(*this, stmt); }

    // statements

    auto operator()(const stmt::Expression & stmt) -> void { evaluate(*stmt.expr); }

    auto operator()(const stmt::Print & stmt) -> void
    {
        std::println(m_out, "{}", evaluate(*stmt.expr));
    }

    auto operator()(const stmt::Var & stmt) -> void
    {
        m_env.define(
                stmt.name.token.get_lexeme(),
                stmt.init.transform([this](const auto & v) { return evaluate(*v); }
                ).value_or(value::Nil{})
        );
    }

    // expressions

    auto operator()(const expr::Literal & expr) -> Value { return expr.value; }

    auto operator()(const expr::Grouping & expr) -> Value { return evaluate(*expr.expr); }

    auto operator()(const expr::Variable & expr) -> Value { return m_env.get(expr.name); }

    auto operator()(const expr::Unary & expr) -> Value
    {
        using enum TokenType;

        auto right = evaluate(*expr.right);

        ExprOperandConverter conv(expr.op, right);

        switch (expr.op.token.get_type()) {
        case Bang: return !conv.as_truthiness(right);
        case Minus: return -conv.as_number(right);
        default: throw unsupported_operator("unary", expr.op);
        }
    }

    auto operator()(const expr::Binary & expr) -> Value
    {
        using enum TokenType;

        // Both sides are evaluated before the operator is applied; nothing short-circuits
        auto left = evaluate(*expr.left);
        auto right = evaluate(*expr.right);

        ExprOperandConverter conv(expr.op, left, right);

        switch (expr.op.token.get_type()) {
        // Division by zero yields inf or nan
        case Minus: return conv.as_number(left) - conv.as_number(right);
        case Slash: return conv.as_number(left) / conv.as_number(right);
        case Star: return conv.as_number(left) * conv.as_number(right);
        case Plus: return conv.as_number(left) + conv.as_number(right);

        case Greater: return conv.as_number(left) > conv.as_number(right);
        case GreaterEqual: return conv.as_number(left) >= conv.as_number(right);
        case Less: return conv.as_number(left) < conv.as_number(right);
        case LessEqual: return conv.as_number(left) <= conv.as_number(right);

        case BangEqual: return left != right;
        case EqualEqual: return left == right;

        default: throw unsupported_operator("binary", expr.op);
        }
    }

    auto operator()(const expr::Ternary & expr) -> Value
    {
        auto condition = evaluate(*expr.condition);

        // No truthiness here, the condition has to be an actual Boolean
        const auto * selector = std::get_if<value::Boolean>(&condition);
        if (selector == nullptr) {
            throw RuntimeError(
                    expr.question,
                    std::format("Non boolean type used as condition in ternary: {}", condition)
            );
        }

        // Only the selected branch is evaluated
        return evaluate(*selector ? *expr.left_result : *expr.right_result);
    }

private:
    // The parser only builds unary and binary nodes from operators handled above
    static auto unsupported_operator(std::string_view kind, const SourceToken & op)
            -> InternalError
    {
        return InternalError(std::format(
                "Illegal operator for {} expression: {} at {}",
                kind,
                op.token.get_lexeme(),
                op.span.start
        ));
    }

    std::ostream & m_out;
    Environment m_env;
};

} // namespace glox
