export module glox:ParserError;

import std;

import :Error;

namespace glox {

// Unwinds the parser back to the enclosing declaration, which logs and resynchronizes
export class ParserError : public std::runtime_error
{
public:
    explicit ParserError(Error error)
        : std::runtime_error(error.message)
        , m_error(std::move(error))
    {
    }

    [[nodiscard]] auto get_error() const -> const Error & { return m_error; }

private:
    Error m_error;
};

} // namespace glox
