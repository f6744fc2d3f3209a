#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "../fixtures/run_sync.hpp"
#include "../fixtures/scripted_connector.hpp"
#include "toolhub/registry/store.hpp"

using namespace toolhub;
using namespace toolhub::registry;
using namespace toolhub::testing;
namespace fs = std::filesystem;

namespace {

const std::set<std::string> kKnown = {"docs", "flows"};

auto fresh_dir(const std::string& name) -> fs::path {
    auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

auto sample(std::vector<std::string> docs_tools) -> Registry {
    BackendCatalog docs{.owner_id = "docs"};
    for (auto& name : docs_tools) {
        docs.tools.push_back(ToolDefinition{.name = std::move(name), .description = "doc tool"});
    }
    BackendCatalog flows{.owner_id = "flows"};
    flows.tools.push_back(ToolDefinition{.name = "run_flow", .category = "workflows"});
    return *Registry::merge({docs, flows});
}

auto slurp(const fs::path& path) -> std::string {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void scribble(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // anonymous namespace

TEST_CASE("RegistryStore persist and load round trip", "[registry][store]") {
    auto dir = fresh_dir("toolhub_store_roundtrip");
    auto path = dir / "tool_registry.json";
    auto registry = sample({"read", "write"});

    REQUIRE(RegistryStore::persist(registry, path).has_value());
    CHECK(fs::exists(path));
    CHECK_FALSE(fs::exists(path.string() + ".tmp"));

    auto loaded = RegistryStore::load(path, kKnown);
    CHECK_FALSE(loaded.error.has_value());
    CHECK_FALSE(loaded.recovered_from_backup);
    CHECK(loaded.registry == registry);
    CHECK(loaded.registry.tools()[1].name == "write");

    fs::remove_all(dir);
}

TEST_CASE("RegistryStore persist backs up the previous file", "[registry][store]") {
    auto dir = fresh_dir("toolhub_store_backup");
    auto path = dir / "tool_registry.json";

    REQUIRE(RegistryStore::persist(sample({"read"}), path).has_value());
    CHECK_FALSE(fs::exists(backup_path(path)));
    auto first = slurp(path);

    REQUIRE(RegistryStore::persist(sample({"read", "write"}), path).has_value());
    REQUIRE(fs::exists(backup_path(path)));
    CHECK(slurp(backup_path(path)) == first);

    SECTION("an unreadable primary does not replace a good backup") {
        scribble(path, "{ truncated");
        REQUIRE(RegistryStore::persist(sample({"read", "write", "stat"}), path).has_value());
        CHECK(slurp(backup_path(path)) == first);
    }

    fs::remove_all(dir);
}

TEST_CASE("RegistryStore load recovers from the backup", "[registry][store]") {
    auto dir = fresh_dir("toolhub_store_recover");
    auto path = dir / "tool_registry.json";
    auto older = sample({"read"});

    REQUIRE(RegistryStore::persist(older, path).has_value());
    REQUIRE(RegistryStore::persist(sample({"read", "write"}), path).has_value());

    SECTION("primary is not JSON") {
        scribble(path, "not json at all");
    }

    SECTION("primary violates the owner invariant") {
        auto doc = json::parse(slurp(path));
        doc["tools"][0]["owner_id"] = "unknown-backend";
        scribble(path, doc.dump());
    }

    SECTION("primary is missing") {
        fs::remove(path);
    }

    auto loaded = RegistryStore::load(path, kKnown);
    CHECK_FALSE(loaded.error.has_value());
    CHECK(loaded.recovered_from_backup);
    CHECK(loaded.registry == older);

    fs::remove_all(dir);
}

TEST_CASE("RegistryStore load with nothing usable", "[registry][store]") {
    auto dir = fresh_dir("toolhub_store_empty");
    auto path = dir / "tool_registry.json";

    SECTION("no files at all is a clean first start") {
        auto loaded = RegistryStore::load(path, kKnown);
        CHECK_FALSE(loaded.error.has_value());
        CHECK(loaded.registry.empty());
    }

    SECTION("both files corrupt") {
        scribble(path, "garbage");
        scribble(backup_path(path), R"({"schema_version": 1})");
        auto loaded = RegistryStore::load(path, kKnown);
        REQUIRE(loaded.error.has_value());
        CHECK(loaded.error->code() == ErrorCode::RegistryCorrupt);
        CHECK(loaded.registry.empty());
        CHECK_FALSE(loaded.recovered_from_backup);
    }

    fs::remove_all(dir);
}

TEST_CASE("RegistryStore snapshots are never mutated by replace", "[registry][store]") {
    RegistryStore store(fs::temp_directory_path() / "toolhub_unused.json", kKnown);
    CHECK(store.current()->empty());

    store.replace(sample({"read"}));
    auto held = store.current();
    REQUIRE(held->total_tools() == 2);

    auto previous = store.replace(sample({"read", "write"}));
    CHECK(previous == held);
    CHECK(held->total_tools() == 2);
    CHECK(store.current()->total_tools() == 3);
}

TEST_CASE("RegistryStore rebuild asks callable backends only", "[registry][store]") {
    boost::asio::io_context ioc;
    auto docs = ScriptedConnector::create(ioc, "docs", {"read", "write"});
    auto flows = ScriptedConnector::create(ioc, "flows", {"run_flow"});
    REQUIRE(run_sync(ioc, docs->start()).has_value());

    RegistryStore store(fs::temp_directory_path() / "toolhub_unused.json", kKnown);
    std::vector<backend::ConnectorPtr> connectors = {docs, flows};

    auto rebuilt = run_sync(ioc, store.rebuild(connectors));
    REQUIRE(rebuilt.has_value());
    CHECK(rebuilt->total_tools() == 2);
    CHECK(flows->calls("tools.list") == 0);

    REQUIRE(run_sync(ioc, flows->start()).has_value());
    rebuilt = run_sync(ioc, store.rebuild(connectors));
    REQUIRE(rebuilt.has_value());
    CHECK(rebuilt->total_tools() == 3);
}

TEST_CASE("RegistryStore rebuild keeps the tools of a backend that fails to list",
          "[registry][store]") {
    boost::asio::io_context ioc;
    auto docs = ScriptedConnector::create(ioc, "docs", {"read", "write"});
    auto flows = ScriptedConnector::create(ioc, "flows", {"run_flow"});
    REQUIRE(run_sync(ioc, docs->start()).has_value());
    REQUIRE(run_sync(ioc, flows->start()).has_value());

    RegistryStore store(fs::temp_directory_path() / "toolhub_unused.json", kKnown);
    std::vector<backend::ConnectorPtr> connectors = {docs, flows};
    store.replace(*run_sync(ioc, store.rebuild(connectors)));
    CHECK(store.unlisted_backends().empty());

    docs->on("tools.list", [](const json&) { return Reply::missing_ok(); });
    auto rebuilt = run_sync(ioc, store.rebuild(connectors));
    REQUIRE(rebuilt.has_value());
    CHECK(rebuilt->total_tools() == 3);
    REQUIRE(rebuilt->find("read") != nullptr);
    CHECK(rebuilt->find("read")->owner_id == "docs");
    CHECK(store.unlisted_backends() == std::set<std::string>{"docs"});

    SECTION("a later successful listing clears the mark") {
        docs->set_tools({"read"});
        rebuilt = run_sync(ioc, store.rebuild(connectors));
        REQUIRE(rebuilt.has_value());
        CHECK(rebuilt->total_tools() == 2);
        CHECK(rebuilt->find("write") == nullptr);
        CHECK(store.unlisted_backends().empty());
    }

    SECTION("a backend with no previous snapshot contributes nothing") {
        RegistryStore empty(fs::temp_directory_path() / "toolhub_unused.json", kKnown);
        rebuilt = run_sync(ioc, empty.rebuild(connectors));
        REQUIRE(rebuilt.has_value());
        CHECK(rebuilt->total_tools() == 1);
        CHECK(empty.unlisted_backends() == std::set<std::string>{"docs"});
    }
}

TEST_CASE("RegistryStore rebuild is idempotent on disk", "[registry][store]") {
    boost::asio::io_context ioc;
    auto docs = ScriptedConnector::create(ioc, "docs", {"read", "write"});
    auto flows = ScriptedConnector::create(ioc, "flows", {"run_flow"});
    REQUIRE(run_sync(ioc, docs->start()).has_value());
    REQUIRE(run_sync(ioc, flows->start()).has_value());

    auto dir = fresh_dir("toolhub_store_idempotent");
    RegistryStore store(dir / "tool_registry.json", kKnown);
    std::vector<backend::ConnectorPtr> connectors = {docs, flows};

    auto without_timestamp = [&]() {
        auto j = json::parse(slurp(store.path()));
        j.erase("generated_at");
        return j.dump(2);
    };

    auto first = run_sync(ioc, store.rebuild(connectors));
    REQUIRE(first.has_value());
    REQUIRE(store.persist(*first).has_value());
    auto first_bytes = without_timestamp();

    auto second = run_sync(ioc, store.rebuild(connectors));
    REQUIRE(second.has_value());
    REQUIRE(store.persist(*second).has_value());
    CHECK(without_timestamp() == first_bytes);
    CHECK(first->digest() == second->digest());

    fs::remove_all(dir);
}

TEST_CASE("RegistryStore rebuild surfaces collisions", "[registry][store]") {
    boost::asio::io_context ioc;
    auto a = ScriptedConnector::create(ioc, "docs", {"x", "y"});
    auto b = ScriptedConnector::create(ioc, "flows", {"y"});
    REQUIRE(run_sync(ioc, a->start()).has_value());
    REQUIRE(run_sync(ioc, b->start()).has_value());

    RegistryStore store(fs::temp_directory_path() / "toolhub_unused.json", kKnown);
    auto rebuilt = run_sync(ioc, store.rebuild({a, b}));
    REQUIRE_FALSE(rebuilt.has_value());
    CHECK(rebuilt.error().code() == ErrorCode::RegistryCollision);
}
