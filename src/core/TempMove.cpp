#include "TempMove.hpp"


TempMove::TempMove(Game& game) : game_(game), saved_(game.snapshot()) {
    ++game_.speculation_depth_;
}

TempMove::~TempMove() {
    game_.restore(saved_);
    --game_.speculation_depth_;
}
