export module glox:ExprOperandConverter;

import std;

import :RuntimeError;
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

// Checks operand types for one operator application and reports every operand when a check
// fails
export class ExprOperandConverter
{
public:
    ExprOperandConverter(const SourceToken & op, const Value & operand)
        : m_op(op)
        , m_right(operand)
    {
    }

    ExprOperandConverter(const SourceToken & op, const Value & left, const Value & right)
        : m_op(op)
        , m_left(&left)
        , m_right(right)
    {
    }

    ~ExprOperandConverter() = default;

    // Class stores references, explicitly forbid it from copying/moving
    ExprOperandConverter(ExprOperandConverter const &) = delete;
    ExprOperandConverter(ExprOperandConverter &&) = delete;
    auto operator=(ExprOperandConverter const &) -> ExprOperandConverter & = delete;
    auto operator=(ExprOperandConverter &&) -> ExprOperandConverter & = delete;

    [[nodiscard]] auto as_number(const Value & value) const -> value::Number
    {
        return as<value::Number>(value);
    }

    // Only Boolean and Nil have a truth value; numbers and strings are rejected
    [[nodiscard]] auto as_truthiness(const Value & value) const -> bool
    {
        return std::visit(
                overloads{
                        [](value::Boolean val) { return val; },
                        [](value::Nil) { return false; },
                        [this](const auto &) -> bool { throw illegal_operands(); },
                },
                value
        );
    }

    template <typename T> [[nodiscard]] auto as(const Value & value) const -> const T &
    {
        if (const auto * alternative = std::get_if<T>(&value); alternative != nullptr) {
            return *alternative;
        }
        throw illegal_operands();
    }

private:
    [[nodiscard]] auto illegal_operands() const -> RuntimeError
    {
        const auto & op = m_op.token.get_lexeme();
        if (m_left == nullptr) {
            return {m_op, std::format("Illegal operand for unary '{}' expression: {}", op, m_right)};
        }
        return {m_op,
                std::format(
                        "Illegal operand for binary '{}' expression: {} {} {}",
                        op,
                        *m_left,
                        op,
                        m_right
                )};
    }

    const SourceToken & m_op;
    const Value * m_left = nullptr;
    const Value & m_right;
};

} // namespace glox
