export module glox:ScopeExit;

import std;

namespace glox {

template <typename T>
concept ScopeExitFn = std::invocable<T> && std::same_as<std::invoke_result_t<T>, void>;

// Runs func when the guard leaves scope. Not movable; return it as a prvalue.
export template <ScopeExitFn Func> class ScopeExit
{
public:
    explicit ScopeExit(Func func)
        : m_func(std::move(func))
    {
    }

    ~ScopeExit() { std::invoke(m_func); }

    ScopeExit(const ScopeExit &) = delete;
    ScopeExit(ScopeExit &&) = delete;
    auto operator=(const ScopeExit &) -> ScopeExit & = delete;
    auto operator=(ScopeExit &&) -> ScopeExit & = delete;

private:
    Func m_func;
};

} // namespace glox
