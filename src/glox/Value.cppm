export module glox:Value;

import std;

namespace {

// helper type for the in-place visitor
template <class... Ts> struct overloads : Ts...
{
    using Ts::operator()...;
};

} // namespace

namespace glox {

export namespace value {

using Number = double;
using String = std::string;
using Boolean = bool;

struct Nil
{
    auto operator==(const Nil &) const -> bool = default;
};

} // namespace value

// Both the payload of literal expressions and the result of evaluation. Values of different
// alternatives never compare equal.
export using Value = std::variant<value::Number, value::String, value::Boolean, value::Nil>;

} // namespace glox

template <> struct std::formatter<glox::value::Nil> : std::formatter<std::string_view>
{
    auto format(const glox::value::Nil & /* nil */, std::format_context & ctx) const
    {
        return std::formatter<std::string_view>::format("Nil", ctx);
    }
};

// Debug representation: the alternative name wrapping its payload, e.g. Number(3) or
// String("abc")
template <> struct std::formatter<glox::Value> : std::formatter<std::string_view>
{
    auto format(const glox::Value & value, std::format_context & ctx) const
    {
        return std::visit(
                overloads{
                        [&](glox::value::Number num) {
                            return std::format_to(ctx.out(), "Number({})", num);
                        },
                        [&](const glox::value::String & str) {
                            return std::format_to(ctx.out(), "String({:?})", str);
                        },
                        [&](glox::value::Boolean val) {
                            return std::format_to(ctx.out(), "Boolean({})", val);
                        },
                        [&](glox::value::Nil nil) { return std::format_to(ctx.out(), "{}", nil); },
                },
                value
        );
    }
};
