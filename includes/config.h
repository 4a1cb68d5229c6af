#pragma once
#include "direction.h"
#include "log.h"
#include <string>

// Tunables of the game. Every field has a playable default; an INI file can
// override any of them (see loadConfig).
struct Config
{
    // Play field in field units, one unit per terminal cell.
    float fieldWidth{60.0f};
    float fieldHeight{24.0f};

    float snakeWidth{1.0f};
    float speed{10.0f}; // units per second
    float initialLength{4.0f};
    Direction startDirection{Direction::Right};

    float foodSize{1.0f};
    float foodGrowth{2.0f};

    // Seconds between two input ticks. speed * inputInterval must exceed the
    // snake width or a 180 degree turn runs the head into the body.
    float inputInterval{0.12f};
    int frameMs{16};

    std::string logFile{"linesnake.log"};
    LogLevel logLevel{LogLevel::Info};

    // Throws std::runtime_error describing the first bad value.
    void validate() const;
};

// Defaults overlaid with the [field], [snake], [food], [input], [game] and
// [log] sections of an INI file. A missing file gives the defaults; a
// malformed one throws std::runtime_error.
Config loadConfig(const std::string &path);

Direction parseDirection(const std::string &name);
