export module glox:EnumFormatter;

import std;

import magic_enum;

namespace glox {

export template <typename T>
concept IsEnum = std::is_enum_v<T>;

// magic_enum yields an empty name for values outside the reflected range
export template <IsEnum E> [[nodiscard]] auto enum_name_or_value(E e) -> std::string
{
    auto name = magic_enum::enum_name(e);
    if (name.empty()) {
        return std::format("<{}>", std::to_underlying(e));
    }
    return std::string{name};
}

export template <IsEnum E> struct EnumFormatter : std::formatter<std::string_view>
{
    auto format(const E & e, std::format_context & ctx) const
    {
        return std::formatter<std::string_view>::format(enum_name_or_value(e), ctx);
    }
};

} // namespace glox
