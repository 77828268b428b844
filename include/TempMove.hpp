#pragma once

#include "Game.hpp"


// Scoped rollback: whatever happens to the game while this is alive is undone
// when it goes out of scope. Scopes nest.
class TempMove {
public:
    explicit TempMove(Game& game);
    ~TempMove();

    TempMove(const TempMove&) = delete;
    TempMove& operator=(const TempMove&) = delete;

private:
    Game& game_;
    Game::Snapshot saved_;
};
