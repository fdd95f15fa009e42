#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

// FNV-1a over raw bytes, used for hashing textual run seeds. Bytewise, so the
// result is the same on every platform regardless of char signedness or
// endianness.
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    float next01() {
        // [0,1). A float holds 24 bits of mantissa, so use the top 24 bits.
        return static_cast<float>(nextU32() >> 8) * (1.0f / 16777216.0f);
    }

    bool chance(float p) {
        return next01() < p;
    }

    // Fisher-Yates, walking from the back so every draw comes from this stream.
    template <typename T>
    void shuffle(std::vector<T>& v) {
        if (v.size() < 2) return;
        for (size_t i = v.size() - 1; i > 0; --i) {
            const size_t j = static_cast<size_t>(range(0, static_cast<int>(i)));
            std::swap(v[i], v[j]);
        }
    }

    // Index into `weights` chosen proportionally to its weight. Non-positive
    // weights are never picked. Returns -1 if every weight is non-positive.
    int pickWeighted(const std::vector<int>& weights) {
        int total = 0;
        for (int w : weights) {
            if (w > 0) total += w;
        }
        if (total <= 0) return -1;

        int roll = range(0, total - 1);
        for (size_t i = 0; i < weights.size(); ++i) {
            if (weights[i] <= 0) continue;
            if (roll < weights[i]) return static_cast<int>(i);
            roll -= weights[i];
        }
        return -1;
    }
};

// A tiny integer hash for stable variation.
inline uint32_t hash32(uint32_t x) {
    // Thomas Wang-ish mix
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

// 64-bit FNV-1a accumulator used for determinism checkpoints.
struct Hash64 {
    uint64_t h = 1469598103934665603ull;

    void addByte(uint8_t b) {
        h ^= b;
        h *= 1099511628211ull;
    }

    void addU32(uint32_t v) {
        for (int i = 0; i < 4; ++i) addByte(static_cast<uint8_t>((v >> (i * 8)) & 0xFFu));
    }

    void addI32(int v) { addU32(static_cast<uint32_t>(v)); }
};
