#include <cstdlib>

#include <jinja2cpp/template.h>
#include <yaml-cpp/yaml.h>

import jinja2_yaml_binding;

import std;

// Renders one AST module partition from a node description and a template
auto main(int argc, char * argv[]) -> int
{
    if (argc != 4) {
        std::println(std::cerr, "Usage: grammar_generator <grammar_yaml> <template> <output>");
        return EXIT_FAILURE;
    }

    YAML::Node grammar;
    try {
        grammar = YAML::LoadFile(argv[1]);
    }
    catch (const YAML::Exception & error) {
        std::println(std::cerr, "Failed to load {}: {}", argv[1], error.what());
        return EXIT_FAILURE;
    }

    std::ifstream template_file(argv[2]);
    if (!template_file.is_open()) {
        std::println(std::cerr, "Failed to open {}", argv[2]);
        return EXIT_FAILURE;
    }
    std::stringstream buffer;
    buffer << template_file.rdbuf();
    template_file.close();

    jinja2::Template tmpl;
    if (auto loaded = tmpl.Load(buffer.str(), argv[2]); !loaded) {
        std::println(std::cerr, "{}", loaded.error().ToString());
        return EXIT_FAILURE;
    }

    jinja2::ValuesMap params{{"data", grammar::reflect(grammar)}};

    std::ofstream output(argv[3]);
    if (!output.is_open()) {
        std::println(std::cerr, "Failed to open {} for writing", argv[3]);
        return EXIT_FAILURE;
    }
    if (auto rendered = tmpl.Render(output, params); !rendered) {
        std::println(std::cerr, "{}", rendered.error().ToString());
        return EXIT_FAILURE;
    }
    output.close();
}
