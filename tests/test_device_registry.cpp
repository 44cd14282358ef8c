#include <doctest/doctest.h>
#include "iptrack/device_registry.hpp"
#include "test_support.hpp"

#include <fstream>
#include <thread>
#include <vector>

using namespace iptrack;
using iptrack_test::TempDir;
using iptrack_test::sample_record;
using iptrack_test::sample_update;

TEST_CASE("Unknown host is absent") {
    DeviceRegistry registry(nullptr);
    CHECK_FALSE(registry.get("nope").has_value());
    CHECK(registry.list().empty());
    CHECK(registry.size() == 0);
}

TEST_CASE("Read after write sees the new record") {
    DeviceRegistry registry(nullptr);
    registry.upsert("mbp", sample_record("mbp"));

    auto r = registry.get("mbp");
    REQUIRE(r.has_value());
    CHECK(*r == sample_record("mbp"));
    CHECK(registry.size() == 1);
}

TEST_CASE("A second update replaces the whole record") {
    DeviceRegistry registry(nullptr);
    registry.upsert("mbp", sample_record("mbp"));

    DeviceRecord second = sample_record("mbp");
    second.ipv6_local.clear();
    second.ipv6_public.clear();
    second.ssh_status = "inactive";
    registry.upsert("mbp", second);

    auto r = registry.get("mbp");
    REQUIRE(r.has_value());
    CHECK(r->ipv6_public.empty());      // not merged with the previous value
    CHECK(r->ssh_status == "inactive");
    CHECK(registry.size() == 1);
}

TEST_CASE("list() returns an independent copy") {
    DeviceRegistry registry(nullptr);
    registry.upsert("a", sample_record("a"));
    Snapshot before = registry.list();
    registry.upsert("b", sample_record("b"));
    CHECK(before.size() == 1);
    CHECK(registry.list().size() == 2);
}

TEST_CASE("ingest() validates before storing") {
    DeviceRegistry registry(nullptr);
    const TransportContext ctx{"198.51.100.4:53122", "curl/8.4.0"};
    RejectReason why = RejectReason::None;

    DeviceUpdate no_host = sample_update("");
    CHECK_FALSE(registry.ingest(no_host, ctx, why));
    CHECK(why == RejectReason::MissingHostname);

    DeviceUpdate no_addr = sample_update("mbp");
    no_addr.ipv4_local.clear();
    no_addr.ipv4_public.clear();
    CHECK_FALSE(registry.ingest(no_addr, ctx, why));
    CHECK(why == RejectReason::NoAddress);
    CHECK(registry.size() == 0);

    REQUIRE(registry.ingest(sample_update("mbp"), ctx, why));
    CHECK(why == RejectReason::None);
    auto r = registry.get("mbp");
    REQUIRE(r.has_value());
    CHECK(r->remote_address == ctx.remote_address);
    CHECK(r->user_agent == ctx.user_agent);
}

TEST_CASE("Concurrent updates for distinct hosts all land") {
    DeviceRegistry registry(nullptr);
    constexpr int N = 32;
    constexpr int ROUNDS = 5;

    // host-i receives ROUNDS distinct records; only the last may survive
    auto record_for = [](int i, int k) {
        const std::string host = "host-" + std::to_string(i);
        DeviceRecord r = sample_record(host);
        r.current_user = "u" + std::to_string(i) + "-" + std::to_string(k);
        r.ipv4_local   = "10.0." + std::to_string(i) + "." + std::to_string(k);
        return r;
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&registry, &record_for, i] {
            for (int k = 0; k < ROUNDS; ++k) {
                DeviceRecord r = record_for(i, k);
                registry.upsert(r.hostname, r);
                (void)registry.list();
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(registry.size() == static_cast<std::size_t>(N));
    for (int i = 0; i < N; ++i) {
        auto r = registry.get("host-" + std::to_string(i));
        REQUIRE(r.has_value());
        CHECK(*r == record_for(i, ROUNDS - 1));
    }
}

TEST_CASE("Async persistence: flushed state survives a restart") {
    TempDir dir;
    const auto file = dir.file("devices.json");

    SUBCASE("no records") {
        {
            DeviceRegistry registry(std::make_shared<PersistenceStore>(file));
            registry.load_from_store();
            registry.flush();
        }
        DeviceRegistry reloaded(std::make_shared<PersistenceStore>(file));
        reloaded.load_from_store();
        CHECK(reloaded.size() == 0);
    }

    SUBCASE("one record") {
        {
            DeviceRegistry registry(std::make_shared<PersistenceStore>(file));
            registry.upsert("mbp", sample_record("mbp"));
            registry.flush();
        }
        DeviceRegistry reloaded(std::make_shared<PersistenceStore>(file));
        reloaded.load_from_store();
        auto r = reloaded.get("mbp");
        REQUIRE(r.has_value());
        CHECK(*r == sample_record("mbp"));
    }

    SUBCASE("many records, last write wins") {
        Snapshot expected;
        {
            DeviceRegistry registry(std::make_shared<PersistenceStore>(file));
            for (int i = 0; i < 20; ++i) {
                const std::string host = "h" + std::to_string(i % 7);
                DeviceRecord r = sample_record(host);
                r.current_user = "user" + std::to_string(i);
                registry.upsert(host, r);
                expected[host] = r;
            }
            registry.flush();
            CHECK(registry.list() == expected);
        }
        DeviceRegistry reloaded(std::make_shared<PersistenceStore>(file));
        reloaded.load_from_store();
        CHECK(reloaded.list() == expected);
    }
}

TEST_CASE("Sync persistence writes before upsert returns") {
    TempDir dir;
    auto store = std::make_shared<PersistenceStore>(dir.file("devices.json"));
    DeviceRegistry registry(store, PersistMode::Sync);
    CHECK(registry.persist_mode() == PersistMode::Sync);

    registry.upsert("mbp", sample_record("mbp"));
    CHECK(store->last_written_generation() == 1);

    const Snapshot on_disk = store->load();
    REQUIRE(on_disk.count("mbp") == 1);
    CHECK(on_disk.at("mbp") == sample_record("mbp"));
}

TEST_CASE("Concurrent async saves converge on the newest state") {
    TempDir dir;
    auto store = std::make_shared<PersistenceStore>(dir.file("devices.json"));
    DeviceRegistry registry(store);

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&registry, i] {
            const std::string host = "node" + std::to_string(i);
            registry.upsert(host, sample_record(host));
        });
    }
    for (auto& t : threads) t.join();
    registry.flush();

    CHECK(store->last_written_generation() == 16);
    CHECK(store->load() == registry.list());
}

TEST_CASE("load_from_store() on a malformed file starts empty") {
    TempDir dir;
    {
        std::ofstream out(dir.file("devices.json"));
        out << "garbage";
    }
    DeviceRegistry registry(std::make_shared<PersistenceStore>(dir.file("devices.json")));
    registry.load_from_store();
    CHECK(registry.size() == 0);
}

TEST_CASE("A failing store does not affect upsert") {
    TempDir dir;
    {
        std::ofstream out(dir.file("blocker"));
        out << "regular file";
    }
    auto store = std::make_shared<PersistenceStore>(dir.file("blocker") / "devices.json");

    for (PersistMode mode : {PersistMode::Sync, PersistMode::Async}) {
        DeviceRegistry registry(store, mode);
        registry.upsert("mbp", sample_record("mbp"));
        registry.flush();
        REQUIRE(registry.get("mbp").has_value());
        CHECK(*registry.get("mbp") == sample_record("mbp"));
    }
    CHECK(store->last_written_generation() == 0);
}
