#include <catch2/catch_test_macros.hpp>
#include "grp_id_resolver.hpp"
#include "scryfall_client.hpp"
#include <atomic>
#include <filesystem>
#include <thread>

using namespace arena_tracker;

namespace {

// Answers for a fixed set of ids after an optional delay
class MockLookup : public CardLookupClient {
public:
    explicit MockLookup(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : delay_(delay) {}

    std::optional<ResolvedCard> fetch(int grp_id) override {
        calls++;
        std::this_thread::sleep_for(delay_);
        if (grp_id == 77777 || grp_id == 88888) {
            ResolvedCard card;
            card.grp_id = grp_id;
            card.name = grp_id == 77777 ? "Sheoldred, the Apocalypse" : "Go for the Throat";
            card.mana_cost = "{2}{B}{B}";
            card.cmc = 4.0;
            return card;
        }
        return std::nullopt;
    }

    std::atomic<int> calls{0};

private:
    std::chrono::milliseconds delay_;
};

std::shared_ptr<SqliteAdapter> open_db(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
    return std::make_shared<SqliteAdapter>(path);
}

} // namespace

TEST_CASE("Concurrent resolves share one remote lookup", "[resolver]") {
    auto remote = std::make_shared<MockLookup>(std::chrono::milliseconds(200));
    GrpIdResolver resolver(nullptr, remote, std::chrono::milliseconds(0));

    ResolvedCard a, b;
    std::thread t1([&]() { a = resolver.resolve(77777); });
    std::thread t2([&]() { b = resolver.resolve(77777); });
    t1.join();
    t2.join();

    REQUIRE(remote->calls == 1);
    REQUIRE(a.name == "Sheoldred, the Apocalypse");
    REQUIRE(b.name == a.name);
    REQUIRE(resolver.get_cached(77777).has_value());
}

TEST_CASE("Unknown ids resolve to a remembered placeholder", "[resolver]") {
    auto remote = std::make_shared<MockLookup>();
    GrpIdResolver resolver(nullptr, remote, std::chrono::milliseconds(0));

    auto first = resolver.resolve(5);
    REQUIRE(first.name == "Unknown (grpId: 5)");
    REQUIRE(first.grp_id == 5);

    auto second = resolver.resolve(5);
    REQUIRE(second.name == first.name);
    REQUIRE(remote->calls == 1);
    REQUIRE(GrpIdResolver::placeholder(9).name == "Unknown (grpId: 9)");
    REQUIRE(is_placeholder_name(first.name));
    REQUIRE_FALSE(is_placeholder_name("Unknown Shores"));
}

TEST_CASE("Resolver tiers and write-back", "[resolver]") {
    std::string db_path = "/tmp/arena_tracker_test_resolver.db";
    auto db = open_db(db_path);
    auto remote = std::make_shared<MockLookup>();
    GrpIdResolver resolver(db, remote, std::chrono::milliseconds(0));

    SECTION("Cache table answers without the remote") {
        db->execute("INSERT INTO grp_id_cache (grp_id, card_name, cmc) VALUES (?, ?, ?)",
                    {int64_t{111}, std::string("Llanowar Elves"), 1.0});
        auto card = resolver.resolve(111);
        REQUIRE(card.name == "Llanowar Elves");
        REQUIRE(card.cmc == 1.0);
        REQUIRE(remote->calls == 0);
    }

    SECTION("Catalog match is written back with its source") {
        db->execute("INSERT INTO cards (id, name, mana_cost, cmc, arena_id) VALUES (?, ?, ?, ?, ?)",
                    {std::string("uuid-1"), std::string("Opt"), std::string("{U}"), 1.0, int64_t{222}});
        auto card = resolver.resolve(222);
        REQUIRE(card.name == "Opt");
        REQUIRE(card.mana_cost == std::optional<std::string>("{U}"));
        REQUIRE(remote->calls == 0);

        auto row = db->query_one("SELECT card_name, source FROM grp_id_cache WHERE grp_id = ?", {int64_t{222}});
        REQUIRE(row.has_value());
        REQUIRE(row_text(*row, "card_name") == std::optional<std::string>("Opt"));
        REQUIRE(row_text(*row, "source") == std::optional<std::string>("arena_id"));
    }

    SECTION("Remote result is persisted") {
        auto card = resolver.resolve(88888);
        REQUIRE(card.name == "Go for the Throat");
        REQUIRE(remote->calls == 1);

        auto row = db->query_one("SELECT source FROM grp_id_cache WHERE grp_id = ?", {int64_t{88888}});
        REQUIRE(row.has_value());
        REQUIRE(row_text(*row, "source") == std::optional<std::string>("scryfall"));

        GrpIdResolver fresh(db, remote, std::chrono::milliseconds(0));
        REQUIRE(fresh.resolve(88888).name == "Go for the Throat");
        REQUIRE(remote->calls == 1);
    }

    SECTION("Placeholders are not persisted") {
        resolver.resolve(4);
        REQUIRE_FALSE(db->query_one("SELECT * FROM grp_id_cache WHERE grp_id = ?", {int64_t{4}}).has_value());
    }

    SECTION("Warm cache loads only uncached ids") {
        db->execute("INSERT INTO grp_id_cache (grp_id, card_name) VALUES (?, ?)", {int64_t{1}, std::string("Island")});
        db->execute("INSERT INTO grp_id_cache (grp_id, card_name) VALUES (?, ?)", {int64_t{2}, std::string("Swamp")});

        REQUIRE(resolver.resolve(1).name == "Island");
        db->execute("UPDATE grp_id_cache SET card_name = ? WHERE grp_id = ?", {std::string("Changed"), int64_t{1}});

        REQUIRE_FALSE(resolver.get_cached(2).has_value());
        resolver.warm_cache({1, 2, 3});

        REQUIRE(resolver.get_cached(1)->name == "Island");
        REQUIRE(resolver.get_cached(2)->name == "Swamp");
        REQUIRE_FALSE(resolver.get_cached(3).has_value());
        REQUIRE(resolver.cache_size() == 2);
        REQUIRE(remote->calls == 0);
    }

    SECTION("Name hints fill gaps only") {
        db->execute("INSERT INTO grp_id_cache (grp_id, card_name, source) VALUES (?, ?, ?)",
                    {int64_t{10}, std::string("Existing"), std::string("scryfall")});

        resolver.set_name_hints({{10, "Overwritten?"}, {11, "Llanowar Elves"}, {12, "748691"}, {13, ""}});

        auto kept = db->query_one("SELECT card_name FROM grp_id_cache WHERE grp_id = ?", {int64_t{10}});
        REQUIRE(row_text(*kept, "card_name") == std::optional<std::string>("Existing"));

        auto hint = db->query_one("SELECT card_name, source FROM grp_id_cache WHERE grp_id = ?", {int64_t{11}});
        REQUIRE(hint.has_value());
        REQUIRE(row_text(*hint, "source") == std::optional<std::string>("game_object"));

        REQUIRE_FALSE(db->query_one("SELECT * FROM grp_id_cache WHERE grp_id = ?", {int64_t{12}}).has_value());
        REQUIRE_FALSE(db->query_one("SELECT * FROM grp_id_cache WHERE grp_id = ?", {int64_t{13}}).has_value());

        REQUIRE(resolver.resolve(11).name == "Llanowar Elves");
    }

    SECTION("resolve_many returns every distinct id") {
        db->execute("INSERT INTO grp_id_cache (grp_id, card_name) VALUES (?, ?)", {int64_t{1}, std::string("Island")});
        auto cards = resolver.resolve_many({1, 77777, 1, 6});
        REQUIRE(cards.size() == 3);
        REQUIRE(cards.at(1).name == "Island");
        REQUIRE(cards.at(77777).name == "Sheoldred, the Apocalypse");
        REQUIRE(cards.at(6).name == "Unknown (grpId: 6)");
    }

    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
}

TEST_CASE("Remote lookups are spaced by the rate limit", "[resolver]") {
    auto remote = std::make_shared<MockLookup>();
    GrpIdResolver resolver(nullptr, remote, std::chrono::milliseconds(50));

    auto begin = std::chrono::steady_clock::now();
    resolver.resolve(77777);
    resolver.resolve(88888);
    resolver.resolve(99999);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(remote->calls == 3);
    REQUIRE(elapsed >= std::chrono::milliseconds(100));
}

TEST_CASE("parse_scryfall_card", "[resolver][scryfall]") {
    SECTION("Single-faced card") {
        auto card = parse_scryfall_card(111, {
            {"name", "Llanowar Elves"},
            {"mana_cost", "{G}"},
            {"cmc", 1.0},
            {"type_line", "Creature - Elf Druid"},
            {"oracle_text", "{T}: Add {G}."},
            {"image_uris", {{"small", "https://img/s.jpg"}, {"normal", "https://img/n.jpg"}}}
        });
        REQUIRE(card.has_value());
        REQUIRE(card->grp_id == 111);
        REQUIRE(card->mana_cost == std::optional<std::string>("{G}"));
        REQUIRE(card->image_uri_normal == std::optional<std::string>("https://img/n.jpg"));
    }

    SECTION("Double-faced card falls back to the front face") {
        auto card = parse_scryfall_card(222, {
            {"name", "Fable of the Mirror-Breaker // Reflection of Kiki-Jiki"},
            {"cmc", 3.0},
            {"type_line", "Enchantment - Saga // Enchantment Creature - Goblin Shaman"},
            {"card_faces", nlohmann::json::array({
                {{"mana_cost", "{2}{R}"}, {"oracle_text", "Front text"},
                 {"image_uris", {{"small", "https://img/front-s.jpg"}}}},
                {{"mana_cost", ""}, {"oracle_text", "Back text"}}
            })}
        });
        REQUIRE(card.has_value());
        REQUIRE(card->mana_cost == std::optional<std::string>("{2}{R}"));
        REQUIRE(card->oracle_text == std::optional<std::string>("Front text"));
        REQUIRE(card->image_uri_small == std::optional<std::string>("https://img/front-s.jpg"));
        REQUIRE_FALSE(card->image_uri_normal.has_value());
    }

    SECTION("Object without a name") {
        REQUIRE_FALSE(parse_scryfall_card(1, {{"object", "error"}}).has_value());
    }
}
