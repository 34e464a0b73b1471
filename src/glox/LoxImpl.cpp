module glox;

import std;

import :AstPrinter;
import :Error;
import :Interpreter;
import :Lox;
import :Parser;
import :Scanner;
import :exits;

namespace glox {

namespace {

// Writes the log out and maps it to the exit code of the stage that produced it
auto report(const ErrorLog & errors, std::ostream & err) -> std::optional<ExitCode>
{
    if (errors.empty()) {
        return std::nullopt;
    }
    errors.report(err);
    return to_exit_code(errors.front().kind);
}

} // namespace

auto Lox::run(std::string source) -> ExitCode
{
    try {
        Scanner scanner(std::move(source));
        auto tokens = scanner.scan_tokens();
        if (auto code = report(scanner.error_log(), m_err); code.has_value()) {
            return code.value();
        }

        Parser parser(std::move(tokens));
        auto statements = parser.parse();
        if (auto code = report(parser.error_log(), m_err); code.has_value()) {
            return code.value();
        }

        if (m_options.print_ast) {
            AstPrinter printer;
            for (const auto & stmt : statements) {
                std::println(m_out, "{}", printer.print(*stmt));
            }
        }

        if (auto code = report(m_interpreter.interpret(statements), m_err); code.has_value()) {
            return code.value();
        }
    }
    catch (const InternalError & fault) {
        std::println(m_err, "Internal error: {}", fault.what());
        return ExitCode::InternalError;
    }

    return ExitCode::Ok;
}

} // namespace glox
