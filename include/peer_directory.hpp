#pragma once
/**
 * @file peer_directory.hpp
 * @brief Roster of peers reachable over the mesh: id → display name, signal quality.
 *
 * @details
 * The link reports who it can hear (`ILink::peers()`); the directory keeps
 * that list between runs so a target can be picked by name before the radio
 * has answered a refresh.
 *
 * Persisted as JSON (nlohmann::json) at `$XDG_CONFIG_HOME/meshz/peers.json`,
 * falling back to `~/.config/meshz/peers.json`:
 *
 * @code
 * [
 *   { "id": "!a1b2c3d4", "name": "ridge", "snr_db": 6.5, "online": true }
 * ]
 * @endcode
 *
 * Writes go to `peers.json.tmp` first and are renamed into place.
 */

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "meshz/link/link_base.hpp"

namespace meshz {

struct PeerEntry {
    std::string id;
    std::string name;        /**< display name; may be empty */
    double      snr_db{0};   /**< last reported SNR */
    bool        online{false}; /**< seen in the most recent refresh */
};

class PeerDirectory {
public:
    /// Merge a fresh roster: listed peers are updated and online, others go offline.
    void merge(const std::vector<link::PeerInfo>& seen);

    /// Insert or replace one entry.
    void upsert(const PeerEntry& e);

    /// Entry for @p id, or nullptr.
    const PeerEntry* find(const std::string& id) const;

    /**
     * @brief Resolve user input to a peer id.
     *
     * Exact id match first, then a unique case-insensitive name match.
     * Input starting with `!` that is not known is taken as an id as-is.
     * @return empty string if nothing (or more than one name) matches.
     */
    std::string resolve(const std::string& key) const;

    /// Name if known and non-empty, else the id.
    std::string display_name(const std::string& id) const;

    /// All entries, online first, then by id.
    std::vector<PeerEntry> list() const;

    size_t size() const { return entries_.size(); }

    /// Write the roster. False with @p err set on failure.
    bool save(const std::filesystem::path& file, std::string& err) const;

    /// Replace the roster from @p file. A missing file is an empty roster.
    bool load(const std::filesystem::path& file, std::string& err);

    /// `$XDG_CONFIG_HOME/meshz/peers.json` (or `~/.config/meshz/peers.json`).
    static std::filesystem::path default_path();

private:
    std::map<std::string, PeerEntry> entries_;
};

} // namespace meshz
