module;

#include <fast_float/fast_float.h>

export module fast_float;

export namespace fast_float {

using fast_float::from_chars;
using fast_float::from_chars_result;

} // namespace fast_float
