// ============================================================================
// peer_directory.cpp — implementation for peer_directory.hpp
// ============================================================================

#include "peer_directory.hpp"
#include "meshz/config.hpp"     // config_dir()

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace meshz {

static std::string lower_ascii(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

void PeerDirectory::merge(const std::vector<link::PeerInfo>& seen) {
    for (auto& kv : entries_) kv.second.online = false;
    for (const auto& p : seen) {
        if (p.id.empty()) continue;
        PeerEntry& e = entries_[p.id];
        e.id = p.id;
        if (!p.name.empty()) e.name = p.name;     // keep a known name if the node sent none
        e.snr_db = p.snr_db;
        e.online = true;
    }
}

void PeerDirectory::upsert(const PeerEntry& e) {
    if (e.id.empty()) return;
    entries_[e.id] = e;
}

const PeerEntry* PeerDirectory::find(const std::string& id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

std::string PeerDirectory::resolve(const std::string& key) const {
    if (key.empty()) return {};
    if (entries_.count(key)) return key;

    const std::string want = lower_ascii(key);
    std::string hit;
    for (const auto& kv : entries_) {
        if (!kv.second.name.empty() && lower_ascii(kv.second.name) == want) {
            if (!hit.empty()) return {};              // ambiguous
            hit = kv.first;
        }
    }
    if (!hit.empty()) return hit;
    if (key[0] == '!') return key;                    // raw node id
    return {};
}

std::string PeerDirectory::display_name(const std::string& id) const {
    const PeerEntry* e = find(id);
    return (e && !e->name.empty()) ? e->name : id;
}

std::vector<PeerEntry> PeerDirectory::list() const {
    std::vector<PeerEntry> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.second);
    std::stable_sort(out.begin(), out.end(), [](const PeerEntry& a, const PeerEntry& b) {
        return a.online > b.online;                   // map order keeps ids sorted
    });
    return out;
}

/*
 * save()
 * ------
 * Write to <file>.tmp, then rename over <file>. A crash mid-write leaves the
 * previous roster intact.
 */
bool PeerDirectory::save(const fs::path& file, std::string& err) const {
    json arr = json::array();
    for (const auto& kv : entries_) {
        const PeerEntry& e = kv.second;
        arr.push_back({{"id", e.id}, {"name", e.name}, {"snr_db", e.snr_db}, {"online", e.online}});
    }

    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) { err = "config dir error: " + ec.message(); return false; }
    }

    fs::path tmp = file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) { err = "open " + tmp.string() + " failed"; return false; }
        out << arr.dump(2) << "\n";
        out.flush();
        if (!out) { err = "write " + tmp.string() + " failed"; return false; }
    }
    fs::rename(tmp, file, ec);
    if (ec) { err = "rename failed: " + ec.message(); return false; }
    return true;
}

bool PeerDirectory::load(const fs::path& file, std::string& err) {
    std::error_code ec;
    if (!fs::exists(file, ec)) { entries_.clear(); return true; }

    std::ifstream in(file);
    if (!in) { err = "open " + file.string() + " failed"; return false; }

    json arr;
    try {
        in >> arr;
    } catch (const json::parse_error& e) {
        err = file.string() + ": " + e.what();
        return false;
    }
    if (!arr.is_array()) { err = file.string() + ": expected a JSON array"; return false; }

    std::map<std::string, PeerEntry> loaded;
    for (const auto& j : arr) {
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) continue;
        PeerEntry e;
        e.id = j["id"].get<std::string>();
        if (e.id.empty()) continue;
        if (j.contains("name") && j["name"].is_string())     e.name = j["name"].get<std::string>();
        if (j.contains("snr_db") && j["snr_db"].is_number()) e.snr_db = j["snr_db"].get<double>();
        e.online = false;                              // nothing is online until a refresh says so
        loaded[e.id] = e;
    }
    entries_.swap(loaded);
    return true;
}

fs::path PeerDirectory::default_path() {
    return config_dir() / "peers.json";
}

} // namespace meshz
