#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "../src/errors.hpp"
#include "../src/mapping_registry.hpp"
#include "../src/slot.hpp"
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Slot model
// ---------------------------------------------------------------------------

TEST_CASE("Default document — eight empty slots in id order", "[registry]") {
    const auto doc = MappingDocument::make_default();

    REQUIRE(doc.slots.size() == 8);
    for (int i = 0; i < 8; ++i) {
        CHECK(doc.slots[i].id == i + 1);
        CHECK(doc.slots[i].label == "Slot " + std::to_string(i + 1));
        CHECK_FALSE(doc.slots[i].filename);
        CHECK_FALSE(doc.slots[i].icon);
    }
}

TEST_CASE("SlotPatch — omitted fields stay, explicit null clears", "[registry]") {
    Slot slot{2, "Horns", std::string("horn.mp3"), std::string("horn.png")};

    SlotPatch keep_icon;
    keep_icon.filename = std::string("tuba.mp3");
    keep_icon.apply(slot);
    CHECK(slot.filename == std::string("tuba.mp3"));
    CHECK(slot.icon == std::string("horn.png"));
    CHECK(slot.label == "Horns");

    SlotPatch clear_icon;
    clear_icon.icon = std::optional<std::string>{};
    clear_icon.apply(slot);
    CHECK_FALSE(slot.icon);
    CHECK(slot.filename == std::string("tuba.mp3"));
}

TEST_CASE("Slot JSON — null references and layout", "[registry]") {
    const json j = MappingDocument::make_default();

    REQUIRE(j.contains("slots"));
    REQUIRE(j["slots"].size() == 8);
    CHECK(j["slots"][0]["id"] == 1);
    CHECK(j["slots"][0]["label"] == "Slot 1");
    CHECK(j["slots"][0]["filename"].is_null());
    CHECK(j["slots"][0]["icon"].is_null());
}

TEST_CASE("Asset type parsing accepts both icon spellings", "[registry]") {
    CHECK(parse_asset_type("music") == AssetType::Music);
    CHECK(parse_asset_type("icon")  == AssetType::Icon);
    CHECK(parse_asset_type("icons") == AssetType::Icon);
    CHECK_FALSE(parse_asset_type("video"));
}

TEST_CASE("Extension filter is case-insensitive", "[registry]") {
    CHECK(accepts_extension(AssetType::Music, "a.mp3"));
    CHECK(accepts_extension(AssetType::Music, "B.WAV"));
    CHECK_FALSE(accepts_extension(AssetType::Music, "c.ogg"));
    CHECK(accepts_extension(AssetType::Icon, "d.JPEG"));
    CHECK(accepts_extension(AssetType::Icon, "e.webp"));
    CHECK_FALSE(accepts_extension(AssetType::Icon, "f.mp3"));
    CHECK_FALSE(accepts_extension(AssetType::Icon, "png"));
}

// ---------------------------------------------------------------------------
// MappingRegistry
// ---------------------------------------------------------------------------

TEST_CASE("load — creates and persists the default document", "[registry]") {
    TempDir tmp;
    MappingRegistry registry(tmp / "data/mappings.json");

    const auto doc = registry.load();

    CHECK(doc == MappingDocument::make_default());
    REQUIRE(std::filesystem::exists(tmp / "data/mappings.json"));
    const json on_disk = json::parse(read_file(tmp / "data/mappings.json"));
    CHECK(on_disk["slots"].size() == 8);
}

TEST_CASE("save then load round-trips every field", "[registry]") {
    TempDir tmp;
    MappingRegistry registry(tmp / "mappings.json");

    auto doc = MappingDocument::make_default();
    doc.slots[0].filename = "intro.mp3";
    doc.slots[4].label    = "Boss Fight";
    doc.slots[4].icon     = "skull.png";
    doc.slots[7].filename = "outro.wav";
    doc.slots[7].icon     = "moon.webp";

    registry.save(doc);
    CHECK(registry.load() == doc);
    CHECK_FALSE(std::filesystem::exists(tmp / "mappings.json.tmp"));
}

TEST_CASE("update_slot — only patched fields change", "[registry]") {
    TempDir tmp;
    MappingRegistry registry(tmp / "mappings.json");
    auto before = registry.load();

    SlotPatch patch;
    patch.filename = std::string("x.mp3");
    registry.update_slot(5, patch);

    const auto after = registry.load();
    CHECK(after.find(5)->filename == std::string("x.mp3"));
    CHECK(after.find(5)->label == before.find(5)->label);
    CHECK(after.find(5)->icon  == before.find(5)->icon);
    for (int id : {1, 2, 3, 4, 6, 7, 8}) {
        CHECK(*after.find(id) == *before.find(id));
    }
}

TEST_CASE("update_slot / clear_slot — unknown id is a silent no-op", "[registry]") {
    TempDir tmp;
    MappingRegistry registry(tmp / "mappings.json");
    const auto before = registry.load();

    SlotPatch patch;
    patch.label = std::string("Nope");
    CHECK_NOTHROW(registry.update_slot(9, patch));
    CHECK_NOTHROW(registry.update_slot(0, patch));
    CHECK_NOTHROW(registry.clear_slot(-1));

    CHECK(registry.load() == before);
}

TEST_CASE("clear_slot — resets references and label", "[registry]") {
    TempDir tmp;
    MappingRegistry registry(tmp / "mappings.json");

    SlotPatch patch;
    patch.filename = std::string("a.mp3");
    patch.icon     = std::string("a.png");
    patch.label    = std::string("Alpha");
    registry.update_slot(2, patch);
    registry.clear_slot(2);

    const Slot* s = registry.load().find(2);
    REQUIRE(s);
    CHECK(s->label == "Slot 2");
    CHECK_FALSE(s->filename);
    CHECK_FALSE(s->icon);
}

TEST_CASE("rename_references — matching music slots follow, others untouched", "[registry]") {
    TempDir tmp;
    MappingRegistry registry(tmp / "mappings.json");

    auto doc = MappingDocument::make_default();
    doc.slots[0].filename = "a.mp3";
    doc.slots[1].filename = "other.mp3";
    doc.slots[2].filename = "a.mp3";
    doc.slots[2].icon     = "a.mp3"; // icon named like the track: must not move
    registry.save(doc);

    registry.rename_references(AssetType::Music, "a.mp3", "b.mp3");

    const auto after = registry.load();
    CHECK(after.slots[0].filename == std::string("b.mp3"));
    CHECK(after.slots[2].filename == std::string("b.mp3"));
    CHECK(after.slots[2].icon == std::string("a.mp3"));
    CHECK(after.slots[1] == doc.slots[1]);
    for (int i = 3; i < 8; ++i) CHECK(after.slots[i] == doc.slots[i]);
}

TEST_CASE("clear_references — icons cleared, filename and label kept", "[registry]") {
    TempDir tmp;
    MappingRegistry registry(tmp / "mappings.json");

    auto doc = MappingDocument::make_default();
    doc.slots[3] = Slot{4, "Rain", std::string("rain.mp3"), std::string("x.png")};
    doc.slots[6] = Slot{7, "Wind", std::string("wind.mp3"), std::string("x.png")};
    doc.slots[7] = Slot{8, "Fire", std::string("fire.mp3"), std::string("y.png")};
    registry.save(doc);

    registry.clear_references(AssetType::Icon, "x.png");

    const auto after = registry.load();
    CHECK_FALSE(after.slots[3].icon);
    CHECK_FALSE(after.slots[6].icon);
    CHECK(after.slots[3].filename == std::string("rain.mp3"));
    CHECK(after.slots[3].label == "Rain");
    CHECK(after.slots[7].icon == std::string("y.png"));
}

TEST_CASE("load — malformed document raises StorageUnavailable", "[registry]") {
    TempDir tmp;
    write_file(tmp / "mappings.json", "{ \"slots\": [ {\"id\": ");
    MappingRegistry registry(tmp / "mappings.json");

    CHECK_THROWS_AS(registry.load(), StorageUnavailable);
}

TEST_CASE("save — unwritable location raises StorageUnavailable", "[registry]") {
    TempDir tmp;
    write_file(tmp / "blocker", "a file where a directory should be");
    MappingRegistry registry(tmp / "blocker/mappings.json");

    CHECK_THROWS_AS(registry.save(MappingDocument::make_default()), StorageUnavailable);
    CHECK_THROWS_AS(registry.load(), StorageUnavailable);
}

TEST_CASE("concurrent updates to different slots are all kept", "[registry]") {
    TempDir tmp;
    MappingRegistry registry(tmp / "mappings.json");
    registry.load();

    std::vector<std::thread> workers;
    for (int id = 1; id <= 8; ++id) {
        workers.emplace_back([&registry, id]() {
            for (int n = 0; n < 10; ++n) {
                SlotPatch patch;
                patch.label = "Worker " + std::to_string(id) + " #" + std::to_string(n);
                registry.update_slot(id, patch);
            }
        });
    }
    for (auto& t : workers) t.join();

    const auto doc = registry.load();
    for (int id = 1; id <= 8; ++id) {
        CHECK(doc.find(id)->label == "Worker " + std::to_string(id) + " #9");
    }
}
