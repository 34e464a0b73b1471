module;

#include <magic_enum/magic_enum.hpp>

export module magic_enum;

export namespace magic_enum {

using magic_enum::enum_name;

} // namespace magic_enum
