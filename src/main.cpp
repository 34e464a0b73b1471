import std;
import glox;

auto main(int argc, char ** argv) -> int
{
    auto args = std::span(argv, static_cast<std::size_t>(argc))
            | std::views::drop(1) // drop argv[0], it's executable name
            | std::views::transform([](char const * arg) { return std::string_view{arg}; })
            | std::ranges::to<std::vector>();

    glox::Options options;
    if (!args.empty() && args.front() == "--ast") {
        options.print_ast = true;
        args.erase(args.begin());
    }

    glox::Lox lox(options);
    auto code = lox.execute(args);
    if (code != glox::ExitCode::Ok) {
        glox::exit_program(code);
    }
}
