export module glox:RuntimeError;

import std;

import :Error;
import :Token;

namespace glox {

export class RuntimeError : public std::runtime_error
{
public:
    RuntimeError(
            const SourceToken & token,
            std::string message,
            std::optional<std::string> subject = std::nullopt
    )
        : std::runtime_error(message)
        , m_error{
                  .kind = ErrorKind::Runtime,
                  .subject = std::move(subject),
                  .location = token.span,
                  .message = std::move(message),
          }
    {
    }

    [[nodiscard]] auto get_error() const -> const Error & { return m_error; }

private:
    Error m_error;
};

} // namespace glox
