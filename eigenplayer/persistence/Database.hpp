#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace EigenPlayer {

/**
 * @brief SQLite failure with its result code and message
 */
struct DatabaseError {
    int code = 0;
    std::string message;
};

/**
 * @brief One played track with its "YYYY-MM-DD HH:MM:SS" UTC timestamp
 */
struct HistoryEntry {
    std::string trackPath;
    std::string playedAt;
};

/**
 * @brief Playlist and play history storage in SQLite
 *
 * Schema:
 * - playlists(id, name UNIQUE)
 * - playlist_tracks(id, playlist_id, track_path, position)
 * - play_history(id, track_path, played_at)
 *
 * Not thread safe; used from the main thread only.
 */
class Database {
public:
    template<typename T>
    using Result = std::expected<T, DatabaseError>;

    static constexpr const char* kInMemory = ":memory:";

    /**
     * @brief Open (or create) a database file and its tables
     * @param path File path, or ":memory:" for a private in-memory database
     */
    static Result<std::unique_ptr<Database>> Open(const std::string& path);
    static Result<std::unique_ptr<Database>> OpenInMemory() { return Open(kInMemory); }

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // =========== Playlists ===========

    /**
     * @brief Create a playlist; existing playlists are left untouched
     */
    Result<void> CreatePlaylist(const std::string& name);

    /**
     * @brief Delete a playlist and its tracks. Unknown names are not an error.
     */
    Result<void> DeletePlaylist(const std::string& name);

    /**
     * @brief Append a track, creating the playlist if needed
     */
    Result<void> AddTrackToPlaylist(const std::string& playlist, const std::string& track);

    /**
     * @brief Remove every occurrence of a track from a playlist
     */
    Result<void> RemoveTrackFromPlaylist(const std::string& playlist, const std::string& track);

    /**
     * @brief Replace the contents of a playlist in one transaction
     */
    Result<void> SavePlaylist(const std::string& name, const std::vector<std::string>& tracks);

    /**
     * @brief Tracks ordered by position; empty for an unknown playlist
     */
    Result<std::vector<std::string>> GetPlaylistTracks(const std::string& playlist);

    /**
     * @brief Playlist names in alphabetical order
     */
    Result<std::vector<std::string>> GetAllPlaylists();

    // =========== History ===========

    Result<void> LogPlayback(const std::string& track);

    /**
     * @brief Most recent plays first
     */
    Result<std::vector<HistoryEntry>> GetPlayHistory(size_t limit);

    [[nodiscard]] const std::string& GetPath() const { return m_path; }

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const;
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    Database(sqlite3* db, std::string path);

    Result<void> CreateSchema();
    Result<void> Execute(const std::string& sql);
    Result<Statement> Prepare(const std::string& sql);
    Result<void> StepDone(Statement& stmt);
    Result<std::optional<long long>> FindPlaylistId(const std::string& name);
    Result<void> InsertTrack(long long playlistId, const std::string& track);
    DatabaseError MakeError(int code, const std::string& context) const;

    sqlite3* m_db = nullptr;
    std::string m_path;
};

} // namespace EigenPlayer
