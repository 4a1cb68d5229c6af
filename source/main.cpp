#include <chrono>
#include <iostream>
#include <stdexcept>
#include "config.h"
#include "game.h"
#include "log.h"

int main(int argc, char **argv)
{
    // Optional INI file overriding the defaults in config.h
    const std::string configPath = argc > 1 ? argv[1] : "linesnake.ini";

    Config cfg;
    try
    {
        cfg = loadConfig(configPath);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "linesnake: " << e.what() << "\n";
        return 1;
    }

    if (!Log::init(cfg.logFile, cfg.logLevel))
    {
        std::cerr << "linesnake: cannot open log file " << cfg.logFile << "\n";
    }
    LOG_INFO("starting with field " << cfg.fieldWidth << "x" << cfg.fieldHeight << " from " << configPath);

    auto seed = static_cast<unsigned>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    Game game(cfg, seed);
    int status = game.run();
    Log::shutdown();
    return status;
}
