export module glox:SourceText;

import std;

import :SourceLocation;

namespace glox {

// UTF-8 source text pre-split into extended grapheme clusters. Indexes used by SourceLocation
// refer to positions in this sequence.
export class SourceText
{
public:
    explicit SourceText(std::string text);

    [[nodiscard]] auto size() const -> std::size_t { return m_graphemes.size(); }

    [[nodiscard]] auto at(std::size_t index) const -> std::string_view
    {
        return m_graphemes.at(index);
    }

    [[nodiscard]] auto graphemes() const -> std::span<const std::string> { return m_graphemes; }

    [[nodiscard]] auto text() const -> const std::string & { return m_text; }

    // Original text covered by the span
    [[nodiscard]] auto slice(const SourceSpan & span) const -> std::string;

private:
    std::string m_text;
    std::vector<std::string> m_graphemes;
};

// Character classes are decided by the first code point of a grapheme, so combining marks
// attached to a letter keep it a letter.
export [[nodiscard]] auto is_digit(std::string_view grapheme) -> bool;
export [[nodiscard]] auto is_alpha(std::string_view grapheme) -> bool;
export [[nodiscard]] auto is_alnum(std::string_view grapheme) -> bool;

// False when the grapheme holds bytes that are not UTF-8. ICU segments such bytes one per
// grapheme instead of rejecting the text.
export [[nodiscard]] auto is_well_formed(std::string_view grapheme) -> bool;

} // namespace glox
