/**
 * @file Config.cpp
 * @brief Environment parsing for LifeConfig.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <memory>
#include <stdexcept>

namespace {
std::string lowered(const char* s) {
    std::string v(s);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return v;
}

/** @brief Parse a base-10 unsigned value in [lo, hi]; throws std::invalid_argument otherwise. */
unsigned long long parseUnsigned(const char* name, const char* text,
                                 unsigned long long lo, unsigned long long hi) {
    const std::string s(text);
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
        throw std::invalid_argument(std::string(name) + ": expected an unsigned integer, got '" + s + "'");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') {
        throw std::invalid_argument(std::string(name) + ": expected an unsigned integer, got '" + s + "'");
    }
    if (v < lo || v > hi) {
        throw std::invalid_argument(std::string(name) + ": " + s + " outside [" + std::to_string(lo) +
                                    ", " + std::to_string(hi) + "]");
    }
    return v;
}
}

int clampStepDelayMs(int ms) {
    if (ms < kMinStepDelayMs) ms = kMinStepDelayMs;
    if (ms > kMaxStepDelayMs) ms = kMaxStepDelayMs;
    return ms;
}

/** @copydoc configFromLookup */
LifeConfig configFromLookup(const EnvLookup& lookup) {
    LifeConfig cfg;
    const auto u32max = std::numeric_limits<std::uint32_t>::max();

    if (const char* v = lookup("LIFE_WIDTH")) {
        cfg.width = static_cast<std::uint32_t>(parseUnsigned("LIFE_WIDTH", v, 1, u32max));
    }
    if (const char* v = lookup("LIFE_HEIGHT")) {
        cfg.height = static_cast<std::uint32_t>(parseUnsigned("LIFE_HEIGHT", v, 1, u32max));
    }
    if (std::uint64_t(cfg.width) * cfg.height > kMaxGridCells) {
        throw std::invalid_argument("LIFE_WIDTH x LIFE_HEIGHT: " + std::to_string(cfg.width) + "x" +
                                    std::to_string(cfg.height) + " exceeds " +
                                    std::to_string(kMaxGridCells) + " cells");
    }
    if (const char* v = lookup("LIFE_DELAY_MS")) {
        auto ms = parseUnsigned("LIFE_DELAY_MS", v, 0, std::numeric_limits<unsigned long long>::max());
        cfg.stepDelayMs = ms > static_cast<unsigned long long>(kMaxStepDelayMs)
                              ? kMaxStepDelayMs
                              : clampStepDelayMs(static_cast<int>(ms));
    }
    if (const char* v = lookup("LIFE_SEED")) {
        cfg.seed = static_cast<std::uint32_t>(parseUnsigned("LIFE_SEED", v, 0, u32max));
        cfg.hasSeed = true;
    }
    if (const char* v = lookup("LIFE_START")) {
        const std::string s = lowered(v);
        if (s == "pattern") cfg.start = StartMode::Pattern;
        else if (s == "random") cfg.start = StartMode::Random;
        else if (s == "blank") cfg.start = StartMode::Blank;
        else if (s == "glider") cfg.start = StartMode::Glider;
        else if (s == "pulsar") cfg.start = StartMode::Pulsar;
        else throw std::invalid_argument("LIFE_START: unknown start mode '" + std::string(v) + "'");
    }
    if (const char* v = lookup("LIFE_LOG")) {
        cfg.logFile = v;
    }
    if (const char* v = lookup("LOG_LEVEL")) {
        if (!Logger::parseLevel(v, cfg.logLevel)) {
            throw std::invalid_argument("LOG_LEVEL: unknown level '" + std::string(v) + "'");
        }
    }
    return cfg;
}

/** @copydoc configFromEnv */
LifeConfig configFromEnv() {
    return configFromLookup([](const char* name) -> const char* { return std::getenv(name); });
}

/** @copydoc applyStart */
void applyStart(const LifeConfig& cfg, Universe& universe) {
    if (cfg.hasSeed) universe.setRandomSource(std::make_unique<MersenneSource>(cfg.seed));
    if (cfg.width != universe.width()) universe.setWidth(cfg.width);
    if (cfg.height != universe.height()) universe.setHeight(cfg.height);

    switch (cfg.start) {
        case StartMode::Pattern:
            universe.fillDefaultPattern();
            break;
        case StartMode::Random:
            universe.random();
            break;
        case StartMode::Blank:
            universe.clear();
            break;
        case StartMode::Glider:
            universe.clear();
            universe.insertGlider(universe.height() / 2, universe.width() / 2);
            break;
        case StartMode::Pulsar:
            universe.clear();
            universe.insertPulsar(universe.height() / 2, universe.width() / 2);
            break;
    }
}

const char* startModeName(StartMode mode) {
    switch (mode) {
        case StartMode::Pattern: return "pattern";
        case StartMode::Random: return "random";
        case StartMode::Blank: return "blank";
        case StartMode::Glider: return "glider";
        case StartMode::Pulsar: return "pulsar";
    }
    return "unknown";
}
