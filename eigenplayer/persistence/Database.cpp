#include "persistence/Database.hpp"
#include "core/Logger.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace EigenPlayer {

namespace {

const char* SQL_CREATE_PLAYLISTS = R"(
    CREATE TABLE IF NOT EXISTS playlists (
        id INTEGER PRIMARY KEY,
        name TEXT NOT NULL UNIQUE
    );
)";

const char* SQL_CREATE_PLAYLIST_TRACKS = R"(
    CREATE TABLE IF NOT EXISTS playlist_tracks (
        id INTEGER PRIMARY KEY,
        playlist_id INTEGER,
        track_path TEXT NOT NULL,
        position INTEGER,
        FOREIGN KEY (playlist_id) REFERENCES playlists(id)
    );
)";

const char* SQL_CREATE_PLAY_HISTORY = R"(
    CREATE TABLE IF NOT EXISTS play_history (
        id INTEGER PRIMARY KEY,
        track_path TEXT NOT NULL,
        played_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
    );
)";

const char* SQL_CREATE_INDICES = R"(
    CREATE INDEX IF NOT EXISTS idx_playlist_tracks_playlist
        ON playlist_tracks(playlist_id, position);
)";

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? std::string(text) : std::string();
}

} // namespace

void Database::StatementDeleter::operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
}

Database::Database(sqlite3* db, std::string path)
    : m_db(db)
    , m_path(std::move(path)) {
}

Database::~Database() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

Database::Result<std::unique_ptr<Database>> Database::Open(const std::string& path) {
    if (path != kInMemory) {
        std::filesystem::path dbPath(path);
        if (dbPath.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(dbPath.parent_path(), ec);
        }
    }

    sqlite3* handle = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    const int result = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (result != SQLITE_OK) {
        DatabaseError error{result, handle ? sqlite3_errmsg(handle) : sqlite3_errstr(result)};
        EIGENPLAYER_LOG_ERROR("Failed to open database '{}': {}", path, error.message);
        sqlite3_close(handle);
        return std::unexpected(error);
    }

    std::unique_ptr<Database> db(new Database(handle, path));
    if (auto schema = db->CreateSchema(); !schema) {
        return std::unexpected(schema.error());
    }

    EIGENPLAYER_LOG_INFO("Opened database '{}'", path);
    return db;
}

Database::Result<void> Database::CreateSchema() {
    for (const char* sql : {"PRAGMA foreign_keys=ON;", SQL_CREATE_PLAYLISTS,
                            SQL_CREATE_PLAYLIST_TRACKS, SQL_CREATE_PLAY_HISTORY,
                            SQL_CREATE_INDICES}) {
        if (auto result = Execute(sql); !result) {
            return result;
        }
    }
    return {};
}

Database::Result<void> Database::CreatePlaylist(const std::string& name) {
    auto stmt = Prepare("INSERT OR IGNORE INTO playlists (name) VALUES (?1)");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_text(stmt->get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
    return StepDone(*stmt);
}

Database::Result<void> Database::DeletePlaylist(const std::string& name) {
    auto id = FindPlaylistId(name);
    if (!id) {
        return std::unexpected(id.error());
    }
    if (!*id) {
        return {};
    }

    auto tracks = Prepare("DELETE FROM playlist_tracks WHERE playlist_id = ?1");
    if (!tracks) {
        return std::unexpected(tracks.error());
    }
    sqlite3_bind_int64(tracks->get(), 1, **id);
    if (auto result = StepDone(*tracks); !result) {
        return result;
    }

    auto playlist = Prepare("DELETE FROM playlists WHERE id = ?1");
    if (!playlist) {
        return std::unexpected(playlist.error());
    }
    sqlite3_bind_int64(playlist->get(), 1, **id);
    return StepDone(*playlist);
}

Database::Result<void> Database::AddTrackToPlaylist(const std::string& playlist,
                                                    const std::string& track) {
    if (auto created = CreatePlaylist(playlist); !created) {
        return created;
    }

    auto id = FindPlaylistId(playlist);
    if (!id) {
        return std::unexpected(id.error());
    }
    if (!*id) {
        return std::unexpected(DatabaseError{SQLITE_NOTFOUND, "playlist '" + playlist + "' not found"});
    }
    return InsertTrack(**id, track);
}

Database::Result<void> Database::RemoveTrackFromPlaylist(const std::string& playlist,
                                                         const std::string& track) {
    auto id = FindPlaylistId(playlist);
    if (!id) {
        return std::unexpected(id.error());
    }
    if (!*id) {
        return {};
    }

    auto stmt = Prepare("DELETE FROM playlist_tracks WHERE playlist_id = ?1 AND track_path = ?2");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_int64(stmt->get(), 1, **id);
    sqlite3_bind_text(stmt->get(), 2, track.c_str(), -1, SQLITE_TRANSIENT);
    return StepDone(*stmt);
}

Database::Result<void> Database::SavePlaylist(const std::string& name,
                                              const std::vector<std::string>& tracks) {
    if (auto begin = Execute("BEGIN TRANSACTION;"); !begin) {
        return begin;
    }

    auto body = [&]() -> Result<void> {
        if (auto created = CreatePlaylist(name); !created) {
            return created;
        }
        auto id = FindPlaylistId(name);
        if (!id) {
            return std::unexpected(id.error());
        }
        if (!*id) {
            return std::unexpected(DatabaseError{SQLITE_NOTFOUND, "playlist '" + name + "' not found"});
        }

        auto clear = Prepare("DELETE FROM playlist_tracks WHERE playlist_id = ?1");
        if (!clear) {
            return std::unexpected(clear.error());
        }
        sqlite3_bind_int64(clear->get(), 1, **id);
        if (auto result = StepDone(*clear); !result) {
            return result;
        }

        for (const auto& track : tracks) {
            if (auto result = InsertTrack(**id, track); !result) {
                return result;
            }
        }
        return {};
    };

    auto result = body();
    if (!result) {
        if (auto rollback = Execute("ROLLBACK;"); !rollback) {
            EIGENPLAYER_LOG_ERROR("Rollback failed: {}", rollback.error().message);
        }
        return result;
    }
    return Execute("COMMIT;");
}

Database::Result<std::vector<std::string>> Database::GetPlaylistTracks(const std::string& playlist) {
    auto id = FindPlaylistId(playlist);
    if (!id) {
        return std::unexpected(id.error());
    }

    std::vector<std::string> tracks;
    if (!*id) {
        return tracks;
    }

    auto stmt = Prepare("SELECT track_path FROM playlist_tracks WHERE playlist_id = ?1 ORDER BY position");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_int64(stmt->get(), 1, **id);

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        tracks.push_back(ColumnText(stmt->get(), 0));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(MakeError(rc, "reading playlist tracks"));
    }
    return tracks;
}

Database::Result<std::vector<std::string>> Database::GetAllPlaylists() {
    auto stmt = Prepare("SELECT name FROM playlists ORDER BY name");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    std::vector<std::string> names;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        names.push_back(ColumnText(stmt->get(), 0));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(MakeError(rc, "listing playlists"));
    }
    return names;
}

Database::Result<void> Database::LogPlayback(const std::string& track) {
    auto stmt = Prepare("INSERT INTO play_history (track_path) VALUES (?1)");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_text(stmt->get(), 1, track.c_str(), -1, SQLITE_TRANSIENT);
    return StepDone(*stmt);
}

Database::Result<std::vector<HistoryEntry>> Database::GetPlayHistory(size_t limit) {
    auto stmt = Prepare("SELECT track_path, played_at FROM play_history ORDER BY id DESC LIMIT ?1");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_int64(stmt->get(), 1, static_cast<sqlite3_int64>(limit));

    std::vector<HistoryEntry> history;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        history.push_back(HistoryEntry{ColumnText(stmt->get(), 0), ColumnText(stmt->get(), 1)});
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(MakeError(rc, "reading play history"));
    }
    return history;
}

Database::Result<void> Database::Execute(const std::string& sql) {
    char* errorMessage = nullptr;
    const int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errorMessage);
    if (rc != SQLITE_OK) {
        DatabaseError error{rc, errorMessage ? errorMessage : sqlite3_errstr(rc)};
        sqlite3_free(errorMessage);
        EIGENPLAYER_LOG_ERROR("SQL execution failed: {}", error.message);
        return std::unexpected(error);
    }
    return {};
}

Database::Result<Database::Statement> Database::Prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected(MakeError(rc, "preparing statement"));
    }
    return Statement(stmt);
}

Database::Result<void> Database::StepDone(Statement& stmt) {
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return std::unexpected(MakeError(rc, "executing statement"));
    }
    return {};
}

Database::Result<std::optional<long long>> Database::FindPlaylistId(const std::string& name) {
    auto stmt = Prepare("SELECT id FROM playlists WHERE name = ?1");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_text(stmt->get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_ROW) {
        return std::optional<long long>(sqlite3_column_int64(stmt->get(), 0));
    }
    if (rc == SQLITE_DONE) {
        return std::optional<long long>();
    }
    return std::unexpected(MakeError(rc, "looking up playlist"));
}

Database::Result<void> Database::InsertTrack(long long playlistId, const std::string& track) {
    auto position = Prepare(
        "SELECT COALESCE(MAX(position), -1) + 1 FROM playlist_tracks WHERE playlist_id = ?1");
    if (!position) {
        return std::unexpected(position.error());
    }
    sqlite3_bind_int64(position->get(), 1, playlistId);

    long long next = 0;
    const int rc = sqlite3_step(position->get());
    if (rc == SQLITE_ROW) {
        next = sqlite3_column_int64(position->get(), 0);
    } else if (rc != SQLITE_DONE) {
        return std::unexpected(MakeError(rc, "computing track position"));
    }

    auto insert = Prepare(
        "INSERT INTO playlist_tracks (playlist_id, track_path, position) VALUES (?1, ?2, ?3)");
    if (!insert) {
        return std::unexpected(insert.error());
    }
    sqlite3_bind_int64(insert->get(), 1, playlistId);
    sqlite3_bind_text(insert->get(), 2, track.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert->get(), 3, next);
    return StepDone(*insert);
}

DatabaseError Database::MakeError(int code, const std::string& context) const {
    DatabaseError error{code, std::string(sqlite3_errmsg(m_db))};
    EIGENPLAYER_LOG_ERROR("Database error while {}: {}", context, error.message);
    return error;
}

} // namespace EigenPlayer
