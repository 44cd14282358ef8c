#include <doctest/doctest.h>
#include "iptrack/persistence_store.hpp"
#include "test_support.hpp"

#include <fstream>
#include <sstream>

using namespace iptrack;
using iptrack_test::TempDir;
using iptrack_test::sample_record;
namespace fs = std::filesystem;

static void write_text(const fs::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << text;
}

static std::string read_text(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

TEST_CASE("Missing file loads as an empty snapshot") {
    TempDir dir;
    PersistenceStore store(dir.file("devices.json"));
    CHECK(store.load().empty());
    CHECK_FALSE(fs::exists(store.path()));
}

TEST_CASE("load() creates a missing parent directory") {
    TempDir dir;
    PersistenceStore store(dir.path() / "nested" / "data" / "devices.json");
    CHECK(store.load().empty());
    CHECK(fs::is_directory(dir.path() / "nested" / "data"));
}

TEST_CASE("Malformed file loads as an empty snapshot") {
    TempDir dir;
    write_text(dir.file("devices.json"), "{ this is not json");
    PersistenceStore store(dir.file("devices.json"));
    CHECK(store.load().empty());
}

TEST_CASE("save() then load() returns the same records") {
    TempDir dir;
    PersistenceStore store(dir.file("devices.json"));

    Snapshot s;
    s["mbp"] = sample_record("mbp");
    s["nas"] = sample_record("nas");
    s["nas"].ssh_status = "inactive";
    REQUIRE(store.save(s));

    CHECK(store.load() == s);
    CHECK_FALSE(fs::exists(dir.file("devices.json.tmp")));
}

TEST_CASE("Snapshot file is indented, keyed by hostname, and world-readable") {
    TempDir dir;
    PersistenceStore store(dir.file("devices.json"));
    Snapshot s;
    s["mbp"] = sample_record("mbp");
    REQUIRE(store.save(s));

    const std::string text = read_text(store.path());
    CHECK(text.find("{\n  \"mbp\": {\n    \"") == 0);
    CHECK(text.find("\"lastUpdate\": \"2025-03-14T09:26:53Z\"") != std::string::npos);

    const auto perms = fs::status(store.path()).permissions();
    CHECK((perms & fs::perms::owner_read) != fs::perms::none);
    CHECK((perms & fs::perms::owner_write) != fs::perms::none);
    CHECK((perms & fs::perms::group_read) != fs::perms::none);
    CHECK((perms & fs::perms::others_read) != fs::perms::none);
    CHECK((perms & fs::perms::others_write) == fs::perms::none);
}

TEST_CASE("Saving replaces the previous content entirely") {
    TempDir dir;
    PersistenceStore store(dir.file("devices.json"));
    Snapshot first;
    first["old"] = sample_record("old");
    REQUIRE(store.save(first));

    Snapshot second;
    second["new"] = sample_record("new");
    REQUIRE(store.save(second));

    const Snapshot loaded = store.load();
    CHECK(loaded.size() == 1);
    CHECK(loaded.count("new") == 1);
}

TEST_CASE("Stale generations are skipped") {
    TempDir dir;
    PersistenceStore store(dir.file("devices.json"));

    Snapshot newer;
    newer["a"] = sample_record("a");
    newer["b"] = sample_record("b");
    Snapshot older;
    older["a"] = sample_record("a");

    REQUIRE(store.save(newer, 2));
    CHECK(store.last_written_generation() == 2);
    CHECK(store.save(older, 1));                   // skipped, not an error
    CHECK(store.last_written_generation() == 2);
    CHECK(store.load().size() == 2);
}

TEST_CASE("save() reports failure when the target directory cannot exist") {
    TempDir dir;
    write_text(dir.file("blocker"), "regular file");
    PersistenceStore store(dir.file("blocker") / "devices.json");

    Snapshot s;
    s["a"] = sample_record("a");
    CHECK_FALSE(store.save(s));
    CHECK_FALSE(store.save(s, 1));
    CHECK(store.last_written_generation() == 0);
}

TEST_CASE("An older snapshot never lands after a newer one failed") {
    TempDir dir;
    write_text(dir.file("data"), "regular file, not a directory yet");
    PersistenceStore store(dir.file("data") / "devices.json");

    Snapshot newer;
    newer["a"] = sample_record("a");
    newer["b"] = sample_record("b");
    Snapshot older;
    older["a"] = sample_record("a");

    CHECK_FALSE(store.save(newer, 2));                 // blocked by the regular file

    fs::remove(dir.file("data"));
    CHECK(store.save(older, 1));                       // skipped as stale
    CHECK_FALSE(fs::exists(store.path()));
    CHECK(store.last_written_generation() == 0);

    REQUIRE(store.save(newer, 3));
    CHECK(store.last_written_generation() == 3);
    CHECK(store.load() == newer);
}
