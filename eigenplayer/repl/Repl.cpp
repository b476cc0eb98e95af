#include "repl/Repl.hpp"
#include "core/Core.hpp"
#include "core/Logger.hpp"
#include "persistence/Database.hpp"
#include <cmath>
#include <istream>
#include <ostream>
#include <sstream>

namespace EigenPlayer {

Repl::Repl(Core& core, Database* db, std::istream& in, std::ostream& out)
    : m_core(core)
    , m_db(db)
    , m_in(in)
    , m_out(out) {
}

void Repl::Run() {
    m_out << "EigenPlayer REPL\n";
    m_out << "Type 'help' for available commands, 'quit' to exit\n\n";

    std::string line;
    while (true) {
        if (m_showPrompt) {
            m_out << "> " << std::flush;
        }
        if (!std::getline(m_in, line)) {
            m_out << "\n";
            break;
        }
        if (!ExecuteLine(line)) {
            break;
        }
    }
}

bool Repl::ExecuteLine(const std::string& line) {
    std::istringstream stream(line);
    std::string command;
    if (!(stream >> command)) {
        return true;
    }

    Args args;
    for (std::string word; stream >> word;) {
        args.push_back(word);
    }

    APP_LOG_DEBUG("REPL command '{}' with {} argument(s)", command, args.size());

    if (command == "quit" || command == "exit" || command == "q") {
        m_out << "Goodbye!\n";
        return false;
    } else if (command == "help" || command == "h") {
        PrintHelp();
    } else if (command == "status") {
        PrintStatus();
    } else if (command == "playlist" || command == "pl") {
        ShowPlaylist();
    } else if (command == "playlists") {
        ShowAllPlaylists();
    } else if (command == "history") {
        ShowHistory();
    } else if (command == "play") {
        Play(args);
    } else if (command == "pause") {
        m_core.ExecuteCommand("pause");
        m_out << "Paused\n";
    } else if (command == "stop") {
        m_core.ExecuteCommand("stop");
        m_out << "Stopped\n";
    } else if (command == "next" || command == "n") {
        m_core.ExecuteCommand("next");
    } else if (command == "prev" || command == "p") {
        m_core.ExecuteCommand("prev");
    } else if (command == "add" || command == "a") {
        Add(args);
    } else if (command == "remove" || command == "rm") {
        Remove(args);
    } else if (command == "volume" || command == "vol" || command == "v") {
        Volume(args);
    } else if (command == "eq") {
        Eq(args);
    } else if (command == "load") {
        Load(args);
    } else if (command == "save") {
        Save(args);
    } else {
        m_out << "Unknown command: '" << command << "'. Type 'help' for available commands.\n";
    }
    return true;
}

void Repl::PrintHelp() {
    m_out << "\nAvailable commands:\n"
          << "  play [track]      - Play a track or resume playback\n"
          << "  pause             - Pause playback\n"
          << "  stop              - Stop playback\n"
          << "  next (n)          - Play next track\n"
          << "  prev (p)          - Play previous track\n"
          << "  add (a) <track>   - Add track to current playlist\n"
          << "  remove (rm) <tr>  - Remove track from playlist\n"
          << "  volume (v) [0-1]  - Get or set volume\n"
          << "  eq [on|off]       - Toggle or set the equalizer\n"
          << "  playlist (pl)     - Show current playlist\n"
          << "  playlists         - Show all saved playlists\n"
          << "  load <name>       - Load a saved playlist\n"
          << "  save <name>       - Save current playlist\n"
          << "  history           - Show play history\n"
          << "  status            - Show player status\n"
          << "  help (h)          - Show this help\n"
          << "  quit (q)          - Exit\n\n";
}

void Repl::PrintStatus() {
    m_out << "\n=== Player Status ===\n";
    if (auto playing = m_core.GetBool("playing")) {
        m_out << "Playing: " << (*playing ? "Yes" : "No") << "\n";
    }
    if (auto track = m_core.GetString("current_track")) {
        m_out << "Current track: " << *track << "\n";
    }
    if (auto volume = m_core.GetFloat("volume")) {
        m_out << "Volume: " << std::lround(*volume * 100.0f) << "%\n";
    }
    if (auto eq = m_core.GetBool("enable_eq")) {
        const auto bands = m_core.GetEqBands("eq_bands").value_or(EqBandList{});
        m_out << "Equalizer: " << (*eq ? "on" : "off") << " (" << bands.size() << " bands)\n";
    }
    if (auto playlist = m_core.GetStringList("playlist")) {
        m_out << "Playlist size: " << playlist->size() << " tracks\n";
    }
    m_out << "\n";
}

void Repl::ShowPlaylist() {
    auto playlist = m_core.GetStringList("playlist");
    if (!playlist) {
        return;
    }
    if (playlist->empty()) {
        m_out << "Playlist is empty\n";
        return;
    }

    const auto current = m_core.GetString("current_track").value_or("");
    m_out << "\n=== Current Playlist (" << playlist->size() << " tracks) ===\n";
    for (size_t i = 0; i < playlist->size(); ++i) {
        const auto& track = (*playlist)[i];
        m_out << (track == current ? "> " : "  ") << (i + 1) << ". " << track << "\n";
    }
    m_out << "\n";
}

void Repl::ShowAllPlaylists() {
    if (!RequireDatabase()) {
        return;
    }

    auto playlists = m_db->GetAllPlaylists();
    if (!playlists) {
        m_out << "Failed to get playlists: " << playlists.error().message << "\n";
        return;
    }
    if (playlists->empty()) {
        m_out << "No saved playlists\n";
        return;
    }

    m_out << "\n=== Saved Playlists ===\n";
    for (const auto& name : *playlists) {
        if (auto tracks = m_db->GetPlaylistTracks(name)) {
            m_out << "  " << name << " (" << tracks->size() << " tracks)\n";
        } else {
            m_out << "  " << name << "\n";
        }
    }
    m_out << "\n";
}

void Repl::ShowHistory() {
    if (!RequireDatabase()) {
        return;
    }

    auto history = m_db->GetPlayHistory(kHistoryLimit);
    if (!history) {
        m_out << "Failed to get history: " << history.error().message << "\n";
        return;
    }
    if (history->empty()) {
        m_out << "No play history\n";
        return;
    }

    m_out << "\n=== Play History (last " << kHistoryLimit << ") ===\n";
    for (const auto& entry : *history) {
        m_out << "  " << entry.playedAt << " - " << entry.trackPath << "\n";
    }
    m_out << "\n";
}

void Repl::Play(const Args& args) {
    if (args.empty()) {
        m_core.SetProperty("playing", true);
        m_out << "Resumed playback\n";
        return;
    }
    m_core.ExecuteCommand("play", {Join(args)});
}

void Repl::Add(const Args& args) {
    if (args.empty()) {
        m_out << "Usage: add <track_path>\n";
        return;
    }

    const auto track = Join(args);
    m_core.ExecuteCommand("add", {track});
    if (m_db) {
        if (auto result = m_db->AddTrackToPlaylist(kDefaultPlaylist, track); !result) {
            m_out << "Failed to add to database: " << result.error().message << "\n";
        }
    }
    m_out << "Added: " << track << "\n";
}

void Repl::Remove(const Args& args) {
    if (args.empty()) {
        m_out << "Usage: remove <track_path>\n";
        return;
    }

    const auto track = Join(args);
    m_core.ExecuteCommand("remove", {track});
    if (m_db) {
        if (auto result = m_db->RemoveTrackFromPlaylist(kDefaultPlaylist, track); !result) {
            m_out << "Failed to remove from database: " << result.error().message << "\n";
        }
    }
    m_out << "Removed: " << track << "\n";
}

void Repl::Volume(const Args& args) {
    if (!args.empty()) {
        m_core.ExecuteCommand("volume", args);
        return;
    }
    if (auto volume = m_core.GetFloat("volume")) {
        m_out << "Volume: " << std::lround(*volume * 100.0f) << "%\n";
    }
}

void Repl::Eq(const Args& args) {
    m_core.ExecuteCommand("eq", args);
    if (auto enabled = m_core.GetBool("enable_eq")) {
        m_out << "Equalizer " << (*enabled ? "on" : "off") << "\n";
    }
}

void Repl::Load(const Args& args) {
    if (args.empty()) {
        m_out << "Usage: load <playlist_name>\n";
        return;
    }
    if (!RequireDatabase()) {
        return;
    }

    const auto& name = args[0];
    auto tracks = m_db->GetPlaylistTracks(name);
    if (!tracks) {
        m_out << "Failed to load playlist: " << tracks.error().message << "\n";
        return;
    }

    const auto count = tracks->size();
    m_core.SetProperty("playlist", std::move(*tracks));
    m_out << "Loaded playlist '" << name << "' with " << count << " tracks\n";
}

void Repl::Save(const Args& args) {
    if (args.empty()) {
        m_out << "Usage: save <playlist_name>\n";
        return;
    }
    if (!RequireDatabase()) {
        return;
    }

    const auto& name = args[0];
    auto tracks = m_core.GetStringList("playlist");
    if (!tracks) {
        return;
    }
    if (auto result = m_db->SavePlaylist(name, *tracks); !result) {
        m_out << "Failed to save playlist: " << result.error().message << "\n";
        return;
    }
    m_out << "Saved playlist '" << name << "' with " << tracks->size() << " tracks\n";
}

bool Repl::RequireDatabase() {
    if (!m_db) {
        m_out << "No database available\n";
        return false;
    }
    return true;
}

std::string Repl::Join(const Args& args) {
    std::string joined;
    for (const auto& word : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += word;
    }
    return joined;
}

} // namespace EigenPlayer
