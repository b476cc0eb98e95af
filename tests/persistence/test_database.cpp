/**
 * @file test_database.cpp
 * @brief Unit tests for playlist and history persistence
 */

#include <gtest/gtest.h>

#include "persistence/Database.hpp"

#include "utils/TestHelpers.hpp"

using namespace EigenPlayer;
using namespace EigenPlayer::Test;

using Tracks = std::vector<std::string>;

// =============================================================================
// Test Fixture
// =============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto db = Database::OpenInMemory();
        ASSERT_TRUE(db.has_value()) << db.error().message;
        m_db = std::move(*db);
    }

    Tracks TracksOf(const std::string& playlist) {
        auto tracks = m_db->GetPlaylistTracks(playlist);
        EXPECT_TRUE(tracks.has_value());
        return tracks.value_or(Tracks{});
    }

    std::unique_ptr<Database> m_db;
};

// =============================================================================
// Playlist Tests
// =============================================================================

TEST_F(DatabaseTest, StartsEmpty) {
    auto playlists = m_db->GetAllPlaylists();
    ASSERT_TRUE(playlists.has_value());
    EXPECT_TRUE(playlists->empty());
}

TEST_F(DatabaseTest, CreatePlaylistIsIdempotent) {
    ASSERT_TRUE(m_db->CreatePlaylist("road trip").has_value());
    ASSERT_TRUE(m_db->CreatePlaylist("road trip").has_value());
    EXPECT_EQ((Tracks{"road trip"}), m_db->GetAllPlaylists().value());
}

TEST_F(DatabaseTest, PlaylistsAreListedByName) {
    m_db->CreatePlaylist("zebra");
    m_db->CreatePlaylist("alpha");
    m_db->CreatePlaylist("mid");
    EXPECT_EQ((Tracks{"alpha", "mid", "zebra"}), m_db->GetAllPlaylists().value());
}

TEST_F(DatabaseTest, TracksKeepInsertionOrder) {
    ASSERT_TRUE(m_db->CreatePlaylist("test").has_value());
    ASSERT_TRUE(m_db->AddTrackToPlaylist("test", "track1.mp3").has_value());
    ASSERT_TRUE(m_db->AddTrackToPlaylist("test", "track2.mp3").has_value());
    ASSERT_TRUE(m_db->AddTrackToPlaylist("test", "track3.mp3").has_value());

    EXPECT_EQ((Tracks{"track1.mp3", "track2.mp3", "track3.mp3"}), TracksOf("test"));
}

TEST_F(DatabaseTest, AddTrackCreatesPlaylist) {
    ASSERT_TRUE(m_db->AddTrackToPlaylist("default", "song.flac").has_value());
    EXPECT_EQ((Tracks{"default"}), m_db->GetAllPlaylists().value());
    EXPECT_EQ((Tracks{"song.flac"}), TracksOf("default"));
}

TEST_F(DatabaseTest, RemoveTrackDropsEveryOccurrence) {
    m_db->AddTrackToPlaylist("test", "a.mp3");
    m_db->AddTrackToPlaylist("test", "b.mp3");
    m_db->AddTrackToPlaylist("test", "a.mp3");

    ASSERT_TRUE(m_db->RemoveTrackFromPlaylist("test", "a.mp3").has_value());
    EXPECT_EQ((Tracks{"b.mp3"}), TracksOf("test"));
}

TEST_F(DatabaseTest, AppendAfterRemovalKeepsOrder) {
    m_db->AddTrackToPlaylist("test", "a.mp3");
    m_db->AddTrackToPlaylist("test", "b.mp3");
    m_db->RemoveTrackFromPlaylist("test", "a.mp3");
    m_db->AddTrackToPlaylist("test", "c.mp3");

    EXPECT_EQ((Tracks{"b.mp3", "c.mp3"}), TracksOf("test"));
}

TEST_F(DatabaseTest, UnknownPlaylistIsEmptyNotAnError) {
    EXPECT_TRUE(TracksOf("nothing").empty());
    EXPECT_TRUE(m_db->RemoveTrackFromPlaylist("nothing", "a.mp3").has_value());
    EXPECT_TRUE(m_db->DeletePlaylist("nothing").has_value());
}

TEST_F(DatabaseTest, DeletePlaylistRemovesItsTracks) {
    m_db->AddTrackToPlaylist("test", "a.mp3");
    m_db->AddTrackToPlaylist("keep", "b.mp3");

    ASSERT_TRUE(m_db->DeletePlaylist("test").has_value());
    EXPECT_EQ((Tracks{"keep"}), m_db->GetAllPlaylists().value());
    EXPECT_TRUE(TracksOf("test").empty());
    EXPECT_EQ((Tracks{"b.mp3"}), TracksOf("keep"));

    // A playlist recreated under the same name starts empty
    m_db->CreatePlaylist("test");
    EXPECT_TRUE(TracksOf("test").empty());
}

TEST_F(DatabaseTest, SavePlaylistReplacesContents) {
    m_db->AddTrackToPlaylist("mix", "old.mp3");

    ASSERT_TRUE(m_db->SavePlaylist("mix", {"x.mp3", "y.mp3"}).has_value());
    EXPECT_EQ((Tracks{"x.mp3", "y.mp3"}), TracksOf("mix"));

    ASSERT_TRUE(m_db->SavePlaylist("mix", {"y.mp3"}).has_value());
    EXPECT_EQ((Tracks{"y.mp3"}), TracksOf("mix"));
}

TEST_F(DatabaseTest, SaveEmptyPlaylistCreatesIt) {
    ASSERT_TRUE(m_db->SavePlaylist("empty", {}).has_value());
    EXPECT_EQ((Tracks{"empty"}), m_db->GetAllPlaylists().value());
    EXPECT_TRUE(TracksOf("empty").empty());
}

TEST_F(DatabaseTest, TrackNamesWithQuotesAndSpaces) {
    const std::string odd = "it's \"my\" song; DROP TABLE playlists.mp3";
    ASSERT_TRUE(m_db->AddTrackToPlaylist("test", odd).has_value());
    EXPECT_EQ((Tracks{odd}), TracksOf("test"));
}

// =============================================================================
// History Tests
// =============================================================================

TEST_F(DatabaseTest, HistoryIsNewestFirst) {
    ASSERT_TRUE(m_db->LogPlayback("song1.mp3").has_value());
    ASSERT_TRUE(m_db->LogPlayback("song2.mp3").has_value());

    auto history = m_db->GetPlayHistory(10);
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(2u, history->size());
    EXPECT_EQ("song2.mp3", (*history)[0].trackPath);
    EXPECT_EQ("song1.mp3", (*history)[1].trackPath);
    EXPECT_FALSE((*history)[0].playedAt.empty());
}

TEST_F(DatabaseTest, HistoryHonoursLimit) {
    for (int i = 0; i < 15; ++i) {
        m_db->LogPlayback("song" + std::to_string(i) + ".mp3");
    }

    auto history = m_db->GetPlayHistory(10);
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(10u, history->size());
    EXPECT_EQ("song14.mp3", history->front().trackPath);
    EXPECT_EQ("song5.mp3", history->back().trackPath);
}

// =============================================================================
// File Database Tests
// =============================================================================

TEST(DatabaseFileTest, DataSurvivesReopen) {
    TempDirectory dir;
    const auto path = (dir.Path() / "sub" / "player.db").string();

    {
        auto db = Database::Open(path);
        ASSERT_TRUE(db.has_value());
        (*db)->AddTrackToPlaylist("favourites", "one.flac");
        (*db)->LogPlayback("one.flac");
    }

    auto db = Database::Open(path);
    ASSERT_TRUE(db.has_value());
    EXPECT_EQ((Tracks{"one.flac"}), (*db)->GetPlaylistTracks("favourites").value());
    EXPECT_EQ(1u, (*db)->GetPlayHistory(10).value().size());
    EXPECT_EQ(path, (*db)->GetPath());
}

TEST(DatabaseFileTest, OpenFailsForDirectory) {
    TempDirectory dir;
    auto db = Database::Open(dir.Path().string());
    EXPECT_FALSE(db.has_value());
}
