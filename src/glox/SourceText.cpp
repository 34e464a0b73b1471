module;

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/utext.h>
#include <unicode/utf8.h>

module glox;

import std;

import :Error;
import :ScopeExit;
import :SourceLocation;
import :SourceText;

namespace glox {

namespace {

auto check_status(UErrorCode status, std::string_view action) -> void
{
    if (U_FAILURE(status)) {
        throw InternalError(std::format("ICU failed to {}: {}", action, u_errorName(status)));
    }
}

auto split_graphemes(std::string_view text) -> std::vector<std::string>
{
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::BreakIterator> iter(
            icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status)
    );
    check_status(status, "create a grapheme iterator");

    // Boundaries of a UTF-8 UText are byte offsets into the original text
    UText * utext = utext_openUTF8(
            nullptr, text.data(), static_cast<std::int64_t>(text.size()), &status
    );
    check_status(status, "open source text");
    ScopeExit close_utext{[&]() { utext_close(utext); }};

    iter->setText(utext, status);
    check_status(status, "attach source text");

    std::vector<std::string> graphemes;
    for (std::int32_t start = iter->first(), end = iter->next(); end != icu::BreakIterator::DONE;
         start = end, end = iter->next()) {
        graphemes.emplace_back(text.substr(
                static_cast<std::size_t>(start), static_cast<std::size_t>(end - start)
        ));
    }
    return graphemes;
}

auto first_code_point(std::string_view grapheme) -> UChar32
{
    if (grapheme.empty()) {
        return U_SENTINEL;
    }

    std::int32_t offset = 0;
    auto length = static_cast<std::int32_t>(grapheme.size());
    UChar32 code_point = 0;
    U8_NEXT(grapheme.data(), offset, length, code_point);
    return code_point;
}

} // namespace

SourceText::SourceText(std::string text)
    : m_text(std::move(text))
    , m_graphemes(split_graphemes(m_text))
{
}

auto SourceText::slice(const SourceSpan & span) const -> std::string
{
    auto first = std::min(span.start.index, m_graphemes.size());
    auto last = std::min(span.end.index, m_graphemes.size());

    std::string result;
    for (auto i = first; i < last; i++) {
        result.append(m_graphemes[i]);
    }
    return result;
}

auto is_digit(std::string_view grapheme) -> bool
{
    return grapheme.size() == 1 && grapheme[0] >= '0' && grapheme[0] <= '9';
}

auto is_alpha(std::string_view grapheme) -> bool
{
    if (grapheme == "_") {
        return true;
    }
    auto code_point = first_code_point(grapheme);
    return code_point >= 0 && u_hasBinaryProperty(code_point, UCHAR_ALPHABETIC) != 0;
}

auto is_alnum(std::string_view grapheme) -> bool
{
    if (is_alpha(grapheme)) {
        return true;
    }
    auto code_point = first_code_point(grapheme);
    return code_point >= 0 && (U_GET_GC_MASK(code_point) & U_GC_N_MASK) != 0;
}

auto is_well_formed(std::string_view grapheme) -> bool
{
    auto length = static_cast<std::int32_t>(grapheme.size());
    for (std::int32_t offset = 0; offset < length;) {
        UChar32 code_point = 0;
        U8_NEXT(grapheme.data(), offset, length, code_point);
        if (code_point < 0) {
            return false;
        }
    }
    return true;
}

} // namespace glox
