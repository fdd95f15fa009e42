#pragma once

#include "rng.hpp"

#include <cstdint>
#include <string>

// Run seeds.
//
// A run seed is either an integer (used verbatim) or arbitrary text (hashed
// with fnv1a32). Each floor gets its own stream: the run seed value XOR the
// floor index, so floor 0 always reproduces the bare run seed.
struct RunSeed {
    // Text as entered (or the decimal form of an integer seed). Kept so the
    // stats snapshot can show the player what they typed.
    std::string text;
    bool hashed = false;
    uint32_t value = 0;
};

RunSeed runSeedFromInt(uint32_t v);

// Surrounding whitespace is stripped first. Integer-looking text ("42", "-7")
// is used verbatim; anything else is hashed.
RunSeed runSeedFromText(const std::string& s);

uint32_t combinedSeed(const RunSeed& seed, int floorIndex);

// The per-floor deterministic stream. Generation and guard initialization for
// that floor draw from it exactly once, in a fixed order.
RNG floorRng(const RunSeed& seed, int floorIndex);

// Fresh seed for a run started without one. Uses the OS entropy source and
// never touches any floor stream.
uint32_t randomRunSeed();
