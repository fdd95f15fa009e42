#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        size_t idx = 0;
        const std::string t = trim(v);
        const int r = std::stoi(t, &idx);
        if (idx != t.size()) return false;
        out = r;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseFloat(const std::string& v, float& out) {
    try {
        size_t idx = 0;
        const std::string t = trim(v);
        const float r = std::stof(t, &idx);
        if (idx != t.size()) return false;
        out = r;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void setWarn(std::string* warn, const std::string& msg) {
    if (warn) *warn = msg;
}

} // namespace

bool applyConfigKey(GameConfig& cfg, const std::string& rawKey, const std::string& val, std::string* warn) {
    const std::string key = toLower(trim(rawKey));

    auto intKey = [&](int& field, int lo, int hi) -> bool {
        int v = 0;
        if (!parseInt(val, v)) {
            setWarn(warn, "bad integer for " + key + ": " + val);
            return false;
        }
        field = std::clamp(v, lo, hi);
        return true;
    };
    auto floatKey = [&](float& field, float lo, float hi) -> bool {
        float v = 0.0f;
        if (!parseFloat(val, v) || !(v == v)) {
            setWarn(warn, "bad number for " + key + ": " + val);
            return false;
        }
        field = std::clamp(v, lo, hi);
        return true;
    };
    auto boolKey = [&](bool& field) -> bool {
        bool b = false;
        if (!parseBool(val, b)) {
            setWarn(warn, "bad boolean for " + key + ": " + val);
            return false;
        }
        field = b;
        return true;
    };

    if (key == "grid_width")              return intKey(cfg.gridWidth, GEN_MIN_WIDTH, 200);
    if (key == "grid_height")             return intKey(cfg.gridHeight, GEN_MIN_HEIGHT, 200);
    if (key == "wall_density")            return floatKey(cfg.wallDensity, 0.0f, 1.0f);
    if (key == "max_attempts")            return intKey(cfg.maxAttempts, 1, 100000);
    if (key == "floors_per_run")          return intKey(cfg.floorsPerRun, 1, 99);
    if (key == "guards_base")             return intKey(cfg.guardsBase, 0, 64);
    if (key == "guards_per_floor")        return intKey(cfg.guardsPerFloor, 0, 16);
    if (key == "guards_max")              return intKey(cfg.guardsMax, 0, 64);
    if (key == "guard_min_distance")      return intKey(cfg.guardMinDistance, 1, 64);
    if (key == "door_chance_base")        return floatKey(cfg.doorChanceBase, 0.0f, 1.0f);
    if (key == "door_chance_per_floor")   return floatKey(cfg.doorChancePerFloor, 0.0f, 1.0f);
    if (key == "max_doors")               return intKey(cfg.maxDoors, 0, 64);
    if (key == "key_on_every_floor")      return boolKey(cfg.keyOnEveryFloor);
    if (key == "key_min_distance")        return intKey(cfg.keyMinDistance, 0, 64);
    if (key == "slow_terrain_from_floor") return intKey(cfg.slowTerrainFromFloor, 0, 99);
    if (key == "slow_terrain_chance")     return floatKey(cfg.slowTerrainChance, 0.0f, 1.0f);
    if (key == "slow_terrain_cost")       return intKey(cfg.slowTerrainCost, 1, 9);
    if (key == "hazards_base")            return intKey(cfg.hazardsBase, 0, 64);
    if (key == "hazards_per_floor")       return intKey(cfg.hazardsPerFloor, 0, 16);
    if (key == "hazard_alert_radius")     return intKey(cfg.hazardAlertRadius, 0, 200);
    if (key == "vision_range")            return intKey(cfg.visionRange, 0, 200);
    if (key == "chase_turns")             return intKey(cfg.chaseTurns, 0, 999);
    if (key == "alert_turns")             return intKey(cfg.alertTurns, 0, 999);
    if (key == "weighted_pursuit")        return boolKey(cfg.weightedPursuit);

    setWarn(warn, "unknown key ignored: " + key);
    return false;
}

GameConfig loadConfig(const std::string& path, std::string* warnings, ConfigPairs* applied) {
    GameConfig cfg;

    std::ifstream f(path);
    if (!f) return cfg;

    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;

        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = trim(line.substr(0, cut));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            if (warnings) *warnings += "line " + std::to_string(lineNo) + ": missing '='\n";
            continue;
        }

        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));
        std::string warn;
        if (!applyConfigKey(cfg, key, value, &warn)) {
            if (warnings) *warnings += "line " + std::to_string(lineNo) + ": " + warn + "\n";
        } else if (applied) {
            applied->emplace_back(toLower(key), value);
        }
    }

    return cfg;
}

bool writeDefaultConfig(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# Terminal Heist difficulty config
#
# Lines are: key = value
# Comments start with # or ;
# Floor indices count from 0. Ramped values are base + per_floor * floor.

# Layout
grid_width = 24
grid_height = 14
# wall_density: 0..1 chance for each interior cell to start as wall
wall_density = 0.18
# max_attempts: generation retries before the floor is reported as failed
max_attempts = 200

# Run
floors_per_run = 3

# Guards
guards_base = 2
guards_per_floor = 1
guards_max = 6
guard_min_distance = 4

# Doors + keycards
door_chance_base = 0.0
door_chance_per_floor = 0.35
max_doors = 3
key_on_every_floor = true
key_min_distance = 3

# Slow terrain
slow_terrain_from_floor = 1
slow_terrain_chance = 0.06
slow_terrain_cost = 2

# Hazards
hazards_base = 0
hazards_per_floor = 1
hazard_alert_radius = 6

# Guard tuning
# vision_range: 0 = unlimited
vision_range = 8
chase_turns = 6
alert_turns = 4
weighted_pursuit = false
)INI";

    return static_cast<bool>(f);
}

GenParams paramsForFloor(const GameConfig& cfg, int floorIndex) {
    const int ramp = std::max(0, floorIndex);

    GenParams p;
    p.width = cfg.gridWidth;
    p.height = cfg.gridHeight;
    p.wallDensity = cfg.wallDensity;
    p.maxAttempts = cfg.maxAttempts;

    p.guardCount = std::min(cfg.guardsMax, cfg.guardsBase + cfg.guardsPerFloor * ramp);
    p.guardMinDistance = cfg.guardMinDistance;

    p.doorChance = std::min(1.0f, cfg.doorChanceBase + cfg.doorChancePerFloor * static_cast<float>(ramp));
    p.maxDoors = cfg.maxDoors;
    p.placeKey = cfg.keyOnEveryFloor;
    p.keyMinDistance = cfg.keyMinDistance;

    p.slowTerrainChance = (ramp >= cfg.slowTerrainFromFloor) ? cfg.slowTerrainChance : 0.0f;
    p.slowTerrainCost = cfg.slowTerrainCost;

    p.hazardCount = cfg.hazardsBase + cfg.hazardsPerFloor * ramp;
    return p;
}

GuardTuning guardTuningFor(const GameConfig& cfg) {
    GuardTuning t;
    t.visionRange = cfg.visionRange;
    t.chaseTurns = cfg.chaseTurns;
    t.alertTurns = cfg.alertTurns;
    t.weightedPursuit = cfg.weightedPursuit;
    return t;
}
