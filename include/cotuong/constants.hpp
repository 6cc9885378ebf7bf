#pragma once

#include <string>

namespace cotuong::core {
const std::string START_FEN = "rnbakabnr/9/1c5c1/p1p1p1p1p/9/9/P1P1P1P1P/1C5C1/9/RNBAKABNR w";
}  // namespace cotuong::core
