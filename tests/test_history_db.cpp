#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sqlite3.h>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("ht_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

HistoryEntry make_entry(const std::string& text, const std::string& mode = "plain") {
    HistoryEntry e;
    e.mode = mode;
    e.text = text;
    e.models = "Whisper:base";
    e.language = "en";
    e.duration = 2.5;
    return e;
}

// Moves every row's timestamp into the past through a second connection.
void age_rows(const std::string& path, int days) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    auto sql = "UPDATE transcriptions SET timestamp = strftime('%Y-%m-%dT%H:%M:%f','now','-" +
               std::to_string(days) + " days')";
    REQUIRE(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        auto entry = make_entry("INPUT: hello\n\nLLM RESPONSE: hi there", "prompt");
        entry.llm_response = "hi there";
        entry.models = "Whisper:base + OpenRouter:test/model";
        REQUIRE(db.append(entry));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].id > 0);
        REQUIRE(entries[0].mode == "prompt");
        REQUIRE(entries[0].text == entry.text);
        REQUIRE(entries[0].llm_response == "hi there");
        REQUIRE(entries[0].models == "Whisper:base + OpenRouter:test/model");
        REQUIRE(entries[0].language == "en");
        REQUIRE(entries[0].duration == 2.5);
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.append(make_entry("entry " + std::to_string(i))));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.append(make_entry("first")));
        REQUIRE(db.append(make_entry("second")));
        REQUIRE(db.append(make_entry("third")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].text == "third");
        REQUIRE(entries[1].text == "second");
        REQUIRE(entries[2].text == "first");
    }

    SECTION("NullableFields") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        // Empty strings should be stored as NULL, retrieved as empty
        HistoryEntry e;
        e.mode = "plain";
        e.text = "test";
        REQUIRE(db.append(e));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].llm_response.empty());
        REQUIRE(entries[0].models.empty());
        REQUIRE(entries[0].audio_path.empty());
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.append(make_entry("test")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("AppendWhenClosedFails") {
        HistoryDb db;
        auto result = db.append(make_entry("lost"));
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == "history database is not open");
        REQUIRE(db.prune_older_than(30) == -1);
    }

    SECTION("PruneKeepsRecentRows") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.append(make_entry("fresh")));

        REQUIRE(db.prune_older_than(30) == 0);
        REQUIRE(db.recent(10).size() == 1);
    }

    SECTION("PruneRemovesOldRowsAndAudio") {
        TmpDb tmp;
        auto audio = std::filesystem::temp_directory_path() /
                     ("ht_test_retained_" + std::to_string(getpid()) + ".wav");
        std::ofstream(audio) << "RIFF";

        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        auto entry = make_entry("old");
        entry.audio_path = audio.string();
        REQUIRE(db.append(entry));
        REQUIRE(db.append(make_entry("also old")));

        age_rows(tmp.path, 40);

        REQUIRE(db.prune_older_than(30) == 2);
        REQUIRE(db.recent(10).empty());
        REQUIRE_FALSE(std::filesystem::exists(audio));
    }
}
