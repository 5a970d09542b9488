#include <catch2/catch_test_macros.hpp>
#include "sqlite_adapter.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

using namespace arena_tracker;

namespace {

void remove_db(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

} // namespace

TEST_CASE("SqliteAdapter basic operations", "[storage]") {
    std::string db_path = "/tmp/arena_tracker_test_storage.db";
    remove_db(db_path);

    {
        SqliteAdapter db(db_path);
        REQUIRE(db.path() == db_path);

        SECTION("Schema is created") {
            auto tables = db.query_all(
                "SELECT name FROM sqlite_master WHERE type = 'table' ORDER BY name");
            std::vector<std::string> names;
            for (const auto& row : tables) names.push_back(*row_text(row, "name"));
            REQUIRE(std::find(names.begin(), names.end(), "grp_id_cache") != names.end());
            REQUIRE(std::find(names.begin(), names.end(), "cards") != names.end());
        }

        SECTION("Parameters and typed columns") {
            int changed = db.execute(
                "INSERT INTO grp_id_cache (grp_id, card_name, cmc, mana_cost) VALUES (?, ?, ?, ?)",
                {int64_t{111}, std::string("Llanowar Elves"), 1.0, nullptr});
            REQUIRE(changed == 1);

            auto row = db.query_one("SELECT * FROM grp_id_cache WHERE grp_id = ?", {int64_t{111}});
            REQUIRE(row.has_value());
            REQUIRE(row_int(*row, "grp_id") == std::optional<int64_t>(111));
            REQUIRE(row_text(*row, "card_name") == std::optional<std::string>("Llanowar Elves"));
            REQUIRE(row_real(*row, "cmc") == std::optional<double>(1.0));
            REQUIRE_FALSE(row_text(*row, "mana_cost").has_value());
            REQUIRE_FALSE(row_text(*row, "no_such_column").has_value());
            REQUIRE(row_text(*row, "updated_at").has_value());
        }

        SECTION("Missing rows") {
            REQUIRE_FALSE(db.query_one("SELECT * FROM grp_id_cache WHERE grp_id = ?", {int64_t{1}}).has_value());
            REQUIRE(db.query_all("SELECT * FROM cards").empty());
        }

        SECTION("Invalid SQL throws") {
            REQUIRE_THROWS_AS(db.execute("INSERT INTO nowhere VALUES (1)"), std::runtime_error);
            REQUIRE_THROWS_AS(db.query_all("SELEC nothing"), std::runtime_error);
        }

        SECTION("Constraint violations throw") {
            REQUIRE_THROWS_AS(db.execute("INSERT INTO grp_id_cache (grp_id) VALUES (?)", {int64_t{5}}),
                              std::runtime_error);
        }

        SECTION("Transaction commits") {
            db.transaction([&]() {
                db.execute("INSERT INTO cards (id, name, arena_id) VALUES (?, ?, ?)",
                           {std::string("a"), std::string("Card A"), int64_t{1}});
                db.execute("INSERT INTO cards (id, name, arena_id) VALUES (?, ?, ?)",
                           {std::string("b"), std::string("Card B"), int64_t{2}});
            });
            REQUIRE(db.query_all("SELECT * FROM cards").size() == 2);
        }

        SECTION("Transaction rolls back and rethrows") {
            REQUIRE_THROWS_AS(db.transaction([&]() {
                db.execute("INSERT INTO cards (id, name) VALUES (?, ?)",
                           {std::string("a"), std::string("Card A")});
                throw std::runtime_error("abort");
            }), std::runtime_error);
            REQUIRE(db.query_all("SELECT * FROM cards").empty());
        }
    }

    SECTION("Data survives reopening") {
        {
            SqliteAdapter db(db_path);
            db.execute("INSERT INTO grp_id_cache (grp_id, card_name) VALUES (?, ?)",
                       {int64_t{7}, std::string("Persisted")});
        }
        SqliteAdapter reopened(db_path);
        auto row = reopened.query_one("SELECT card_name FROM grp_id_cache WHERE grp_id = ?", {int64_t{7}});
        REQUIRE(row.has_value());
        REQUIRE(row_text(*row, "card_name") == std::optional<std::string>("Persisted"));
    }

    remove_db(db_path);
}

TEST_CASE("SqliteAdapter rejects an unusable path", "[storage]") {
    REQUIRE_THROWS_AS(SqliteAdapter("/nonexistent_dir/arena_tracker.db"), std::runtime_error);
}
