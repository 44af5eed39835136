#pragma once

#include <string>
#include <string_view>

namespace dsync {

/// Single-quotes a word for a POSIX shell: foo'bar -> 'foo'\''bar'
std::string shell_quote(std::string_view word);

} // namespace dsync
