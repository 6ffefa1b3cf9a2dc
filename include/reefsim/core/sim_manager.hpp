/**
 * @file sim_manager.hpp
 * @brief Host loop driving a GameSession from a wall clock.
 */

#pragma once

#include <functional>
#include <utility>

#include <SFML/System/Clock.hpp>
#include <SFML/System/Time.hpp>

#include "reefsim/core/constants.hpp"
#include "reefsim/math/vector_math.hpp"

namespace Game {
class GameSession;
}

/**
 * @class SimManager
 * @brief Owns the frame loop: timing, pause/step and shutdown.
 *
 * Pausing or stopping never touches session state; bodies and particles stay
 * valid and simply stop advancing.
 */
class SimManager {
 public:
  // Supplies the player's movement intent each frame
  using InputProvider = std::function<Vector(const Game::GameSession&)>;

  explicit SimManager(Game::GameSession& session);

  SimManager(const SimManager&) = delete;
  SimManager& operator=(const SimManager&) = delete;

  /** @brief Runs frames until stop() is called or the frame limit is reached. */
  void run();

  /**
   * @brief Advances one frame unless paused.
   * @param dt Measured wall-clock delta in seconds.
   * @return true if the session was advanced.
   */
  bool frame(double dt);

  /** @brief Toggles the simulation pause state. */
  void togglePause();

  /** @brief Advances the simulation by one frame if currently paused. */
  void stepOnce();

  /** @brief Makes run() return after the current frame. */
  void stop();

  void setInputProvider(InputProvider provider) { inputProvider = std::move(provider); }

  /** @brief Stops run() after this many advanced frames; 0 means unlimited. */
  void setFrameLimit(unsigned int frames) { frameLimit = frames; }

  bool isPaused() const { return paused; }
  bool isRunning() const { return running; }
  unsigned int getFramesAdvanced() const { return framesAdvanced; }

 private:
  Game::GameSession& session;
  InputProvider inputProvider;

  bool running;
  bool paused;
  bool stepFrame;
  unsigned int frameLimit = 0;
  unsigned int framesAdvanced = 0;

  const float targetFPS = static_cast<float>(SimulatorConstants::StepsPerSecond);

  sf::Clock frameClock;

  // Timer for profiler printing
  sf::Time timeSinceLastProfilerPrint;
  const sf::Time profilerPrintInterval = sf::seconds(10.f);
};
