#include "stats.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

std::string trimStr(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseU32(const std::string& s, uint32_t& out) {
    try {
        const std::string t = trimStr(s);
        if (t.empty() || t[0] == '-') return false;
        size_t idx = 0;
        const unsigned long v = std::stoul(t, &idx);
        if (idx != t.size() || v > 0xFFFFFFFFul) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseI32(const std::string& s, int& out) {
    try {
        const std::string t = trimStr(s);
        size_t idx = 0;
        const int v = std::stoi(t, &idx);
        if (idx != t.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

const char* runOutcomeId(RunOutcome o) {
    switch (o) {
        case RunOutcome::InProgress: return "in_progress";
        case RunOutcome::Won:        return "won";
        case RunOutcome::Lost:       return "lost";
    }
    return "in_progress";
}

bool parseRunOutcome(const std::string& raw, RunOutcome& out) {
    const std::string s = toLower(trimStr(raw));
    if (s == "in_progress") { out = RunOutcome::InProgress; return true; }
    if (s == "won")         { out = RunOutcome::Won; return true; }
    if (s == "lost")        { out = RunOutcome::Lost; return true; }
    return false;
}

uint32_t floorScore(int floorIndex, uint32_t floorTurns) {
    const uint32_t base = 100u + 50u * static_cast<uint32_t>(std::max(0, floorIndex));
    const uint32_t speedBonus = (floorTurns < 150u) ? (150u - floorTurns) : 0u;
    return base + speedBonus;
}

KeyValues statsToKeyValues(const RunStats& s) {
    KeyValues kv;
    kv["run_seed"] = s.runSeed;
    kv["floor_index"] = std::to_string(s.floorIndex);
    kv["floors_cleared"] = std::to_string(s.floorsCleared);
    kv["turn_count"] = std::to_string(s.turnCount);
    kv["floor_turns"] = std::to_string(s.floorTurns);
    kv["inventory.keycard"] = std::to_string(s.keycards);
    kv["inventory.objective"] = s.objectiveCollected ? "1" : "0";
    kv["score"] = std::to_string(s.score);
    kv["outcome"] = runOutcomeId(s.outcome);
    return kv;
}

bool statsFromKeyValues(const KeyValues& kv, RunStats& out, std::string* err) {
    RunStats s;

    auto get = [&](const char* key) -> const std::string* {
        auto it = kv.find(key);
        return it == kv.end() ? nullptr : &it->second;
    };
    auto bad = [&](const char* key) {
        setErr(err, std::string("bad value for ") + key);
        return false;
    };

    if (const auto* v = get("run_seed")) s.runSeed = *v;
    if (const auto* v = get("floor_index"); v && !parseI32(*v, s.floorIndex)) return bad("floor_index");
    if (const auto* v = get("floors_cleared"); v && !parseI32(*v, s.floorsCleared)) return bad("floors_cleared");
    if (const auto* v = get("turn_count"); v && !parseU32(*v, s.turnCount)) return bad("turn_count");
    if (const auto* v = get("floor_turns"); v && !parseU32(*v, s.floorTurns)) return bad("floor_turns");
    if (const auto* v = get("inventory.keycard"); v && !parseI32(*v, s.keycards)) return bad("inventory.keycard");
    if (const auto* v = get("inventory.objective")) {
        int flag = 0;
        if (!parseI32(*v, flag)) return bad("inventory.objective");
        s.objectiveCollected = (flag != 0);
    }
    if (const auto* v = get("score"); v && !parseU32(*v, s.score)) return bad("score");
    if (const auto* v = get("outcome"); v && !parseRunOutcome(*v, s.outcome)) return bad("outcome");

    out = s;
    return true;
}

std::string formatKeyValues(const KeyValues& kv) {
    std::ostringstream ss;
    for (const auto& [k, v] : kv) {
        ss << k << " = " << v << "\n";
    }
    return ss.str();
}

bool parseKeyValues(const std::string& text, KeyValues& out, std::string* err) {
    KeyValues kv;
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string t = trimStr(line);
        if (t.empty() || t[0] == '#' || t[0] == ';') continue;

        const auto eq = t.find('=');
        if (eq == std::string::npos) {
            setErr(err, "missing '=' on line " + std::to_string(lineNo));
            return false;
        }
        const std::string key = trimStr(t.substr(0, eq));
        if (key.empty()) {
            setErr(err, "empty key on line " + std::to_string(lineNo));
            return false;
        }
        kv[key] = trimStr(t.substr(eq + 1));
    }
    out.swap(kv);
    return true;
}
