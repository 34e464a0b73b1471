export module glox:exits;

import std;

import :Error;

namespace glox {

export enum class ExitCode : std::uint8_t {
    Ok = 0,
    // From sysexits(3)
    IncorrectUsage = 64,
    IncorrectInput = 65,
    SoftwareError = 70,
    InternalError = 71,
    IOError = 74,
};

export [[nodiscard]] constexpr auto to_exit_code(ErrorKind kind) -> ExitCode
{
    switch (kind) {
    case ErrorKind::Scanning:
    case ErrorKind::Parsing: return ExitCode::IncorrectInput;
    case ErrorKind::Runtime: return ExitCode::SoftwareError;
    }
    std::unreachable();
}

export [[noreturn]] auto exit_program(ExitCode code) -> void { std::exit(static_cast<int>(code)); }

} // namespace glox
