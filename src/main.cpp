#include "Game.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

// 用法: tank_battle_sim [ticks] [seed]
int main(int argc, char *argv[])
{
  GameConfig config;

  try
  {
    if (argc > 1)
      config.maxTicks = std::stoi(argv[1]);
    if (argc > 2)
      config.arena.seed = static_cast<unsigned int>(std::stoul(argv[2]));
  }
  catch (const std::exception &e)
  {
    std::cerr << "[Game] Invalid argument: " << e.what() << std::endl;
    std::cerr << "Usage: " << argv[0] << " [ticks] [seed]" << std::endl;
    return 1;
  }

  Game game(config);

  if (!game.init())
  {
    std::cerr << "[Game] Failed to initialize" << std::endl;
    return 1;
  }

  game.run();

  return 0;
}
