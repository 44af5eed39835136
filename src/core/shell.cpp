#include "dsync/core/shell.hpp"

namespace dsync {

std::string shell_quote(std::string_view word) {
    std::string quoted;
    quoted.reserve(word.size() + 2);
    quoted.push_back('\'');
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

} // namespace dsync
