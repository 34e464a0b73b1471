export module glox:Error;

import std;

import :EnumFormatter;
import :SourceLocation;

namespace glox {

export enum class ErrorKind : std::uint8_t {
    Scanning,
    Parsing,
    Runtime,
};

// A user-facing diagnostic. Broken internal invariants are InternalError instead.
export struct Error
{
    ErrorKind kind;
    std::optional<std::string> subject;
    std::optional<SourceSpan> location;
    std::string message;
};

export class ErrorLog
{
public:
    auto push(Error error) -> void { m_errors.push_back(std::move(error)); }

    [[nodiscard]] auto empty() const -> bool { return m_errors.empty(); }
    [[nodiscard]] auto size() const -> std::size_t { return m_errors.size(); }

    [[nodiscard]] auto errors() const -> std::span<const Error> { return m_errors; }
    [[nodiscard]] auto front() const -> const Error & { return m_errors.front(); }

    [[nodiscard]] auto begin() const { return m_errors.begin(); }
    [[nodiscard]] auto end() const { return m_errors.end(); }

    auto report(std::ostream & out) const -> void;

private:
    std::vector<Error> m_errors;
};

export class InternalError : public std::logic_error
{
public:
    explicit InternalError(const std::string & what)
        : std::logic_error(what)
    {
    }
};

} // namespace glox

template <> struct std::formatter<glox::ErrorKind> : glox::EnumFormatter<glox::ErrorKind>
{
};

template <> struct std::formatter<glox::Error> : std::formatter<std::string_view>
{
    auto format(const glox::Error & error, std::format_context & ctx) const
    {
        auto out = ctx.out();
        if (error.location.has_value()) {
            const auto & start = error.location->start;
            out = std::format_to(out, "[line: {}, col: {}] ", start.line, start.column);
        }
        out = std::format_to(out, "{} Error ({})", error.kind, error.message);
        if (error.subject.has_value()) {
            out = std::format_to(out, ": {}", error.subject.value());
        }
        return out;
    }
};

namespace glox {

auto ErrorLog::report(std::ostream & out) const -> void
{
    for (const auto & error : m_errors) {
        std::println(out, "{}", error);
    }
}

} // namespace glox
