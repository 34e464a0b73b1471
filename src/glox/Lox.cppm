export module glox:Lox;

import std;

import :Interpreter;
import :exits;

namespace glox {

export struct Options
{
    // Print every parsed statement before running it
    bool print_ast = false;
};

// Drives source text through scanning, parsing and interpretation. Diagnostics go to the error
// stream, program output to the output stream.
export class Lox
{
public:
    explicit Lox(Options options = {}, std::ostream & out = std::cout, std::ostream & err = std::cerr)
        : m_options(options)
        , m_out(out)
        , m_err(err)
        , m_interpreter(out)
    {
    }

    auto execute(std::span<const std::string_view> args) -> ExitCode
    {
        if (args.size() > 1) {
            std::println(m_err, "Usage: glox [--ast] [script]");
            return ExitCode::IncorrectUsage;
        }
        if (args.size() == 1) {
            return run_file(args[0]);
        }

        return run_prompt(std::cin);
    }

    auto run_file(const std::filesystem::path & filename) -> ExitCode
    {
        std::ifstream script(filename);
        if (!script.is_open()) {
            std::println(m_err, "Failed to open {}", filename.string());
            return ExitCode::IOError;
        }

        std::stringstream buffer;
        buffer << script.rdbuf();
        script.close();

        return run(buffer.str());
    }

    // Every line is a complete program; bindings persist between lines. An empty line or end
    // of input leaves the prompt.
    auto run_prompt(std::istream & in) -> ExitCode
    {
        for (std::string line; std::print(m_out, "> "), std::getline(in, line);) {
            if (line.empty()) {
                break;
            }
            auto code = run(std::move(line));
            if (code == ExitCode::InternalError) {
                return code;
            }
        }
        std::println(m_out, "\nexit");
        return ExitCode::Ok;
    }

    [[nodiscard]] auto run(std::string source) -> ExitCode;

private:
    Options m_options;
    std::ostream & m_out;
    std::ostream & m_err;
    Interpreter m_interpreter;
};

} // namespace glox
