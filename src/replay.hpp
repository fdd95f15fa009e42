#pragma once

#include "config.hpp"
#include "simulation.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Replay recording + playback
// ------------------------------------------------------------
//
// A replay is one floor: the seed, the floor index, any config overrides,
// and the ordered player actions. Optional state-hash checkpoints catch
// desyncs. Line-based and human-readable.
//
// File format (v1):
//
//   @heist_replay 1
//   @game_version 0.1.0
//   @seed 42
//   @floor 0
//   @config wall_density = 0.2
//   @end_header
//
//   A <action>              (up/right/down/left/wait/interact)
//   H <turn> <hash64hex>

enum class ReplayEventType : uint8_t {
    Action = 0,
    StateHash,
};

struct ReplayMeta {
    int formatVersion = 1;
    std::string gameVersion;
    std::string seedText;
    int floorIndex = 0;

    // Applied on top of the default GameConfig, in order.
    ConfigPairs config;
};

struct ReplayEvent {
    ReplayEventType kind = ReplayEventType::Action;
    PlayerAction action;

    // StateHash checkpoint.
    uint32_t turn = 0;
    uint64_t hash = 0;
};

struct ReplayFile {
    ReplayMeta meta;
    std::vector<ReplayEvent> events;
};

// ------------------------------------------------------------
// Writer (streaming)
// ------------------------------------------------------------
class ReplayWriter {
public:
    bool open(const std::filesystem::path& path, const ReplayMeta& meta, std::string* err = nullptr);
    void close();
    bool isOpen() const { return f_.is_open(); }
    std::filesystem::path path() const { return path_; }

    void writeAction(const PlayerAction& a);
    void writeStateHash(uint32_t turn, uint64_t hash);

private:
    void writeLine_(const std::string& line);

    std::filesystem::path path_;
    std::ofstream f_;
};

// ------------------------------------------------------------
// Reader (loads all events)
// ------------------------------------------------------------
bool parseReplayText(const std::string& text, ReplayFile& out, std::string* err = nullptr);
bool loadReplayFile(const std::filesystem::path& path, ReplayFile& out, std::string* err = nullptr);
