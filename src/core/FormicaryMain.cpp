/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ColonySimulation.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include "core/SimLoop.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/RandomSource.hpp"
#include "world/TileGrid.hpp"
#include <boost/program_options.hpp>
#include <array>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace po = boost::program_options;

const std::string APP_NAME{"Formicary"};
const std::string DEFAULT_CONFIG_PATH{"res/sim_config.json"};

namespace {

SimLoop* g_activeLoop = nullptr;

void handleInterrupt(int) {
  if (g_activeLoop) {
    g_activeLoop->stop();
  }
}

struct RunOptions {
  std::string configPath{DEFAULT_CONFIG_PATH};
  uint64_t ticks{0};
  uint32_t speed{1};
  float fps{30.0f};
  uint64_t statsEvery{500};
  bool seeded{false};
  uint32_t seed{0};
};

// Returns 1 to continue, 0 to exit cleanly (--help), -1 on bad arguments
int parseArguments(int argc, char* argv[], RunOptions& options) {
  po::options_description description(APP_NAME + " options");
  description.add_options()
      ("help,h", "Show this message")
      ("config,c", po::value<std::string>(&options.configPath)->default_value(DEFAULT_CONFIG_PATH),
       "Settings file (JSON)")
      ("ticks,t", po::value<uint64_t>(&options.ticks)->default_value(0), "Ticks to run, 0 runs until interrupted")
      ("speed,s", po::value<uint32_t>(&options.speed)->default_value(1), "Ticks per frame")
      ("fps,f", po::value<float>(&options.fps)->default_value(30.0f), "Frames per second, 0 runs unpaced")
      ("stats-every", po::value<uint64_t>(&options.statsEvery)->default_value(500),
       "Log a colony census every N ticks, 0 disables")
      ("seed", po::value<uint32_t>(), "Seed for a reproducible run");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    FORMICARY_CRITICAL("Main", "Bad arguments: " + std::string(e.what()));
    std::cerr << description << "\n";
    return -1;
  }

  if (vm.count("help")) {
    std::cout << description << "\n";
    return 0;
  }
  if (vm.count("seed")) {
    options.seeded = true;
    options.seed = vm["seed"].as<uint32_t>();
  }
  return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
  RunOptions options;
  const int parsed = parseArguments(argc, argv, options);
  if (parsed <= 0) {
    return parsed;
  }

  FORMICARY_INFO("Main", "Initializing " + APP_NAME);

  // Settings are read once here and snapshotted; nothing re-reads them later
  auto& settingsManager = Formicary::SettingsManager::Instance();
  if (!settingsManager.loadFromFile(options.configPath)) {
    FORMICARY_WARN("Main", "Failed to load " + options.configPath + " - using defaults");
  } else {
    FORMICARY_INFO("Main", "Settings loaded from " + options.configPath);
  }
  const Formicary::SimConfig config = Formicary::SimConfig::fromSettings(settingsManager);

  std::unique_ptr<Formicary::IRandomSource> rng;
  if (options.seeded) {
    FORMICARY_INFO("Main", "Using seed " + std::to_string(options.seed));
    rng = std::make_unique<Formicary::MersenneRandomSource>(options.seed);
  } else {
    rng = std::make_unique<Formicary::MersenneRandomSource>();
  }

  auto terrain = std::make_unique<Formicary::TileGrid>(Formicary::TileGrid::layered(
      config.world.width, config.world.height, config.world.surfaceRow,
      config.world.denseRow, config.world.bedrockRow));

  ColonySimulation simulation;
  if (!simulation.init(config, std::move(terrain), std::move(rng))) {
    FORMICARY_CRITICAL("Main", "Init " + APP_NAME + " Failed");
    simulation.clean();
    return -1;
  }

  if (!simulation.populate()) {
    FORMICARY_CRITICAL("Main", "World has no room for a colony");
    simulation.clean();
    return -1;
  }
  simulation.logStats();

  SimLoop loop(options.fps, options.speed);

#ifndef NDEBUG
  // Tick cost tracking (DEBUG only)
  static constexpr size_t PERF_SAMPLE_COUNT = 10;
  std::array<double, PERF_SAMPLE_COUNT> tickSamples{};
  size_t sampleIndex = 0;
#endif

  loop.setTickHandler([&]() {
#ifndef NDEBUG
    auto tickStart = std::chrono::high_resolution_clock::now();
#endif
    simulation.tick();
#ifndef NDEBUG
    auto tickEnd = std::chrono::high_resolution_clock::now();
    tickSamples[sampleIndex++ % PERF_SAMPLE_COUNT] =
        std::chrono::duration<double, std::milli>(tickEnd - tickStart).count();
#endif
  });

  uint64_t lastStatsTick = 0;
  loop.setFrameHandler([&](uint64_t ticksRun) {
    if (options.statsEvery == 0 || ticksRun - lastStatsTick < options.statsEvery) {
      return;
    }
    lastStatsTick = ticksRun;
    simulation.logStats();

#ifndef NDEBUG
    if (!Formicary::Logger::IsBenchmarkMode()) {
      double avgMs = 0.0;
      for (double sample : tickSamples) {
        avgMs += sample;
      }
      avgMs /= PERF_SAMPLE_COUNT;
      FORMICARY_DEBUG("Main", "Tick cost " + std::to_string(avgMs) + "ms avg, " +
                      std::to_string(loop.getTimestepManager().getCurrentFPS()) + " fps");
    }
#endif
  });

  g_activeLoop = &loop;
  std::signal(SIGINT, handleInterrupt);

  FORMICARY_INFO("Main", "Starting simulation loop");
  const bool completed = loop.run(options.ticks);

  std::signal(SIGINT, SIG_DFL);
  g_activeLoop = nullptr;

  simulation.logStats();
  FORMICARY_INFO("Main", APP_NAME + " shutting down after " + std::to_string(simulation.getTick()) + " ticks");
  simulation.clean();

  return completed ? 0 : -1;
}
