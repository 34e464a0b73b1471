export module glox:SourceLocation;

import std;

namespace glox {

export struct SourceLocation
{
    std::size_t line = 1;
    std::size_t column = 1;
    // Absolute position in grapheme clusters, not bytes
    std::size_t index = 0;

    [[nodiscard]] static constexpr auto is_newline(std::string_view grapheme) -> bool
    {
        // "\r\n" is a single extended grapheme cluster
        return grapheme == "\n" || grapheme == "\r\n";
    }

    constexpr auto advance(std::string_view grapheme) -> void
    {
        if (is_newline(grapheme)) {
            line++;
            column = 1;
        }
        else {
            column++;
        }
        index++;
    }

    auto operator==(const SourceLocation &) const -> bool = default;
};

// Half-open: start is inclusive, end is exclusive
export struct SourceSpan
{
    SourceLocation start;
    SourceLocation end;

    // Collapse to a zero-width span at the cursor
    constexpr auto close() -> void { start = end; }

    [[nodiscard]] constexpr auto length() const -> std::size_t { return end.index - start.index; }

    auto operator==(const SourceSpan &) const -> bool = default;
};

} // namespace glox

template <> struct std::formatter<glox::SourceLocation> : std::formatter<std::string_view>
{
    auto format(const glox::SourceLocation & sloc, std::format_context & ctx) const
    {
        return std::format_to(ctx.out(), "{}:{}", sloc.line, sloc.column);
    }
};

template <> struct std::formatter<glox::SourceSpan> : std::formatter<std::string_view>
{
    auto format(const glox::SourceSpan & span, std::format_context & ctx) const
    {
        return std::format_to(ctx.out(), "{}-{}", span.start, span.end);
    }
};
