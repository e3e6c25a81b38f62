/**
 * @file Config.h
 * @brief Declares LifeConfig and its environment-variable loader.
 *
 * Recognized variables:
 * - LIFE_WIDTH, LIFE_HEIGHT : grid size (positive integers, default 64x64, product at most kMaxGridCells)
 * - LIFE_DELAY_MS           : delay between generations, clamped to [5,2000] (default 100)
 * - LIFE_SEED               : seed for random fills (default: nondeterministic)
 * - LIFE_START              : pattern | random | blank | glider | pulsar (default pattern)
 * - LIFE_LOG                : log file path (default ./<command>.log)
 * - LOG_LEVEL               : debug | info | warn | error | none (default info)
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "Logger.h"
#include "Universe.h"

/** @brief Initial grid contents selected by LIFE_START. */
enum class StartMode { Pattern, Random, Blank, Glider, Pulsar };

/** @brief Startup settings for the terminal front end. */
struct LifeConfig {
    std::uint32_t width{Universe::kDefaultWidth};
    std::uint32_t height{Universe::kDefaultHeight};
    int stepDelayMs{100};
    bool hasSeed{false};
    std::uint32_t seed{0};
    StartMode start{StartMode::Pattern};
    std::string logFile;                   /**< empty: derive from argv[0] */
    Logger::Level logLevel{Logger::Level::Info};
};

/** @brief Returns the value of a variable, or nullptr when unset. */
using EnvLookup = std::function<const char*(const char*)>;

/** @brief Minimum and maximum generation delay in milliseconds. */
constexpr int kMinStepDelayMs = 5;
constexpr int kMaxStepDelayMs = 2000;

/** @brief Largest accepted LIFE_WIDTH * LIFE_HEIGHT (2^26 cells, 8 MiB per generation buffer). */
constexpr std::uint64_t kMaxGridCells = std::uint64_t(1) << 26;

/** @brief Clamp @p ms into [kMinStepDelayMs, kMaxStepDelayMs]. */
int clampStepDelayMs(int ms);

/** @brief Build a LifeConfig from @p lookup; throws std::invalid_argument naming the bad variable. */
LifeConfig configFromLookup(const EnvLookup& lookup);
/** @brief configFromLookup over the process environment. */
LifeConfig configFromEnv();

/** @brief Apply @p cfg's size and start mode to @p universe. */
void applyStart(const LifeConfig& cfg, Universe& universe);

const char* startModeName(StartMode mode);
