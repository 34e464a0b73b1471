export module glox:Environment;

import std;

import :RuntimeError;
import :Token;
import :Value;

namespace glox {

// Name -> value bindings introduced by 'var' declarations
export class Environment
{
public:
    // Redefinition replaces the previous binding
    auto define(std::string name, Value value) -> void
    {
        m_values.insert_or_assign(std::move(name), std::move(value));
    }

    [[nodiscard]] auto get(const SourceToken & name) const -> const Value &
    {
        const auto & lexeme = name.token.get_lexeme();
        if (auto it = m_values.find(lexeme); it != m_values.end()) {
            return it->second;
        }

        throw RuntimeError(name, "Undefined variable", lexeme);
    }

private:
    std::unordered_map<std::string, Value> m_values;
};

} // namespace glox
