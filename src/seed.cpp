#include "seed.hpp"

#include <cctype>
#include <chrono>
#include <random>

namespace {

std::string trimSeed(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool parseSeedInt(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;

    size_t i = 0;
    bool neg = false;
    if (s[0] == '-' || s[0] == '+') {
        neg = (s[0] == '-');
        i = 1;
    }
    if (i >= s.size()) return false;

    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isdigit(c)) return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    if (neg) {
        if (v > 0x80000000ull) return false;
        out = static_cast<uint32_t>(-static_cast<int64_t>(v));
    } else {
        out = static_cast<uint32_t>(v);
    }
    return true;
}

} // namespace

RunSeed runSeedFromInt(uint32_t v) {
    RunSeed s;
    s.text = std::to_string(v);
    s.hashed = false;
    s.value = v;
    return s;
}

RunSeed runSeedFromText(const std::string& raw) {
    // Replay headers and stats snapshots store the seed trimmed, so the
    // trimmed text is the one that gets hashed.
    const std::string text = trimSeed(raw);
    RunSeed s;
    s.text = text;

    uint32_t v = 0;
    if (parseSeedInt(text, v)) {
        s.hashed = false;
        s.value = v;
    } else {
        s.hashed = true;
        s.value = fnv1a32(text.data(), text.size());
    }
    return s;
}

uint32_t combinedSeed(const RunSeed& seed, int floorIndex) {
    return seed.value ^ static_cast<uint32_t>(floorIndex);
}

RNG floorRng(const RunSeed& seed, int floorIndex) {
    return RNG(combinedSeed(seed, floorIndex));
}

uint32_t randomRunSeed() {
    std::random_device rd;
    const uint32_t a = rd();
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return hashCombine(a, static_cast<uint32_t>(now));
}
