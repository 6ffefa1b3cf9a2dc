/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager.
 */

#include "reefsim/core/sim_manager.hpp"

#include <iostream>

#include <SFML/System/Sleep.hpp>

#include "reefsim/core/profile.hpp"
#include "reefsim/game/game_session.hpp"

SimManager::SimManager(Game::GameSession& session)
    : session(session)
    , running(false)
    , paused(false)
    , stepFrame(false)
{
}

void SimManager::run()
{
  std::cout << "SimManager::run() starting" << std::endl;

  running = true;
  frameClock.restart();
  const sf::Time frameBudget = sf::seconds(1.f / targetFPS);

  while (running)
  {
    const sf::Time elapsed = frameClock.restart();
    frame(elapsed.asSeconds());

    if (frameLimit != 0 && framesAdvanced >= frameLimit)
    {
      running = false;
    }

    timeSinceLastProfilerPrint += elapsed;
    if (timeSinceLastProfilerPrint >= profilerPrintInterval)
    {
      Profiling::Profiler::printStats();
      timeSinceLastProfilerPrint = sf::Time::Zero;
    }

    // Yield the rest of the frame budget
    const sf::Time spent = frameClock.getElapsedTime();
    if (running && spent < frameBudget)
    {
      sf::sleep(frameBudget - spent);
    }
  }

  std::cout << "SimManager::run() stopped after " << framesAdvanced << " frames" << std::endl;
}

bool SimManager::frame(double dt)
{
  if (paused && !stepFrame)
  {
    return false;
  }

  // A single step from pause uses the nominal delta, not the time spent paused
  const double step = stepFrame ? SimulatorConstants::DefaultFrameDelta : dt;
  stepFrame = false;

  const Vector intent = inputProvider ? inputProvider(session) : Vector();
  session.update(step, intent);
  ++framesAdvanced;
  return true;
}

void SimManager::togglePause()
{
  paused = !paused;
}

void SimManager::stepOnce()
{
  if (paused)
  {
    stepFrame = true;
  }
}

void SimManager::stop()
{
  running = false;
}
