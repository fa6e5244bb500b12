#pragma once

#include <string>

#include "ber_tag.hpp"

namespace ber {

// One line per tag, children indented by two spaces:
//   SEQUENCE [C] len=12
//     INTEGER [P] len=1 : 01
std::string dump(const Tag& tag, int indent = 0);

} // namespace ber
