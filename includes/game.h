#pragma once
#include "config.h"
#include "game_data.h"

// Terminal front end: owns the notcurses session, feeds key presses into
// GameData and draws it every frame.
class Game
{
public:
    Game(const Config &cfg, unsigned seed);

    // Run the game loop (blocking). Returns the process exit status.
    int run();

private:
    enum class DialogType
    {
        None,
        Pause
    };
    void processInput();
    void render() const;
    void renderField(int oy, int ox) const;
    void renderHud(int oy, int hx) const;
    void renderDialog(int oy, int ox) const;

    void openDialog(DialogType t);
    void closeDialog();

    Config cfg;
    GameData data;
    int width;  // board columns, border included
    int height; // board rows, border included
    bool exitRequested{false};
    bool paused{false};
    DialogType dialogType{DialogType::None};
    int dialogIndex{0};
};
