#include "replay.hpp"

#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

std::string trimCopy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

bool startsWith(const std::string& s, const char* prefix) {
    const size_t n = std::char_traits<char>::length(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
}

std::optional<int> parseInt(const std::string& s) {
    try {
        size_t idx = 0;
        int v = std::stoi(s, &idx, 10);
        if (idx != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<uint64_t> parseHex64(const std::string& s) {
    try {
        size_t idx = 0;
        const unsigned long long v = std::stoull(s, &idx, 16);
        if (idx != s.size()) return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

bool ReplayWriter::open(const std::filesystem::path& path, const ReplayMeta& meta, std::string* err) {
    close();
    path_ = path;
    f_.open(path_, std::ios::out | std::ios::trunc);
    if (!f_) {
        setErr(err, "Failed to open replay for writing: " + path_.string());
        return false;
    }

    // Header
    f_ << "@heist_replay " << meta.formatVersion << "\n";
    f_ << "@game_version " << meta.gameVersion << "\n";
    f_ << "@seed " << meta.seedText << "\n";
    f_ << "@floor " << meta.floorIndex << "\n";
    for (const auto& [k, v] : meta.config) {
        f_ << "@config " << k << " = " << v << "\n";
    }
    f_ << "@end_header\n";
    f_.flush();
    return true;
}

void ReplayWriter::close() {
    if (f_.is_open()) {
        f_.flush();
        f_.close();
    }
}

void ReplayWriter::writeLine_(const std::string& line) {
    if (!f_) return;
    f_ << line << "\n";
}

void ReplayWriter::writeAction(const PlayerAction& a) {
    writeLine_(std::string("A ") + actionToken(a));
}

void ReplayWriter::writeStateHash(uint32_t turn, uint64_t hash) {
    std::ostringstream ss;
    ss << "H " << turn << " " << std::hex << std::setw(16) << std::setfill('0') << hash;
    writeLine_(ss.str());
}

bool parseReplayText(const std::string& text, ReplayFile& out, std::string* err) {
    out = ReplayFile{};

    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    bool inHeader = true;
    bool sawMagic = false;

    while (std::getline(in, line)) {
        ++lineNo;
        line = trimCopy(line);
        if (line.empty()) continue;

        if (inHeader) {
            if (!startsWith(line, "@")) {
                setErr(err, "Replay parse error (event before @end_header) line " + std::to_string(lineNo));
                return false;
            }

            std::string key;
            std::string rest;
            const size_t sp = line.find(' ');
            if (sp == std::string::npos) {
                key = line;
            } else {
                key = line.substr(0, sp);
                rest = trimCopy(line.substr(sp + 1));
            }

            if (key == "@heist_replay") {
                const auto v = parseInt(rest);
                if (!v || *v != 1) {
                    setErr(err, "Unsupported replay format version: " + rest);
                    return false;
                }
                out.meta.formatVersion = *v;
                sawMagic = true;
            } else if (!sawMagic) {
                setErr(err, "Not a heist replay (missing @heist_replay header)");
                return false;
            } else if (key == "@end_header") {
                inHeader = false;
            } else if (key == "@game_version") {
                out.meta.gameVersion = rest;
            } else if (key == "@seed") {
                out.meta.seedText = rest;
            } else if (key == "@floor") {
                const auto v = parseInt(rest);
                if (!v) {
                    setErr(err, "Replay parse error (bad floor) line " + std::to_string(lineNo));
                    return false;
                }
                out.meta.floorIndex = *v;
            } else if (key == "@config") {
                const size_t eq = rest.find('=');
                if (eq == std::string::npos) {
                    setErr(err, "Replay parse error (bad config override) line " + std::to_string(lineNo));
                    return false;
                }
                out.meta.config.emplace_back(trimCopy(rest.substr(0, eq)), trimCopy(rest.substr(eq + 1)));
            }
            // Unknown header keys are ignored for forward compat.
            continue;
        }

        std::istringstream iss(line);
        std::string code;
        iss >> code;

        ReplayEvent ev;
        if (code == "A") {
            std::string tok;
            iss >> tok;
            if (!parseAction(tok, ev.action)) {
                setErr(err, "Replay parse error (bad action '" + tok + "') line " + std::to_string(lineNo));
                return false;
            }
            ev.kind = ReplayEventType::Action;
            out.events.push_back(ev);
            continue;
        }
        if (code == "H") {
            // State hash checkpoint: H <turn> <hash64hex>
            long long turn = -1;
            std::string hex;
            if (!(iss >> turn >> hex) || turn < 0 || turn > 0xFFFFFFFFll) {
                setErr(err, "Replay parse error (bad state hash payload) line " + std::to_string(lineNo));
                return false;
            }
            const auto hv = parseHex64(hex);
            if (!hv) {
                setErr(err, "Replay parse error (bad state hash) line " + std::to_string(lineNo));
                return false;
            }
            ev.kind = ReplayEventType::StateHash;
            ev.turn = static_cast<uint32_t>(turn);
            ev.hash = *hv;
            out.events.push_back(ev);
            continue;
        }

        // Unknown event codes are ignored for forward compat.
    }

    if (inHeader) {
        setErr(err, "Replay parse error (missing @end_header)");
        return false;
    }
    if (out.meta.seedText.empty()) {
        setErr(err, "Replay has no @seed");
        return false;
    }
    return true;
}

bool loadReplayFile(const std::filesystem::path& path, ReplayFile& out, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        setErr(err, "Failed to open replay: " + path.string());
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return parseReplayText(ss.str(), out, err);
}
