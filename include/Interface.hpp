#pragma once
#include "IChessCore.hpp"
#include <string>

namespace GUI {
    // Runs until the window closes. Reset returns to `start_fen`, or the standard
    // starting position when it is empty.
    void Launch(IChessCore& core, std::string start_fen);
}
