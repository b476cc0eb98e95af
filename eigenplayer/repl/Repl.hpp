#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace EigenPlayer {

class Core;
class Database;

/**
 * @brief Interactive command line of the player
 *
 * Reads one command per line. Playback commands are forwarded to the core;
 * playlist persistence goes through the database, whose "default" playlist
 * mirrors add and remove.
 */
class Repl {
public:
    static constexpr const char* kDefaultPlaylist = "default";
    static constexpr size_t kHistoryLimit = 10;

    /**
     * @param db Playlist storage, may be null to run without persistence
     */
    Repl(Core& core, Database* db, std::istream& in, std::ostream& out);

    /**
     * @brief Read and execute lines until quit or end of input
     */
    void Run();

    /**
     * @brief Execute a single input line
     * @return false when the line asks to quit
     */
    bool ExecuteLine(const std::string& line);

    void SetShowPrompt(bool show) { m_showPrompt = show; }

private:
    using Args = std::vector<std::string>;

    void PrintHelp();
    void PrintStatus();
    void ShowPlaylist();
    void ShowAllPlaylists();
    void ShowHistory();

    void Play(const Args& args);
    void Add(const Args& args);
    void Remove(const Args& args);
    void Volume(const Args& args);
    void Eq(const Args& args);
    void Load(const Args& args);
    void Save(const Args& args);

    bool RequireDatabase();
    static std::string Join(const Args& args);

    Core& m_core;
    Database* m_db;
    std::istream& m_in;
    std::ostream& m_out;
    bool m_showPrompt = true;
};

} // namespace EigenPlayer
