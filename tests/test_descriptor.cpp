#include <catch2/catch.hpp>
#include <knit/descriptor.hpp>
#include "test_helpers.hpp"

using namespace knit;
using test::TempDir;

// ===== Parsing =====

TEST_CASE("parse full descriptor", "[descriptor]") {
    auto r = PackageDescriptor::parse(R"({
        "name": "@acme/app",
        "version": "1.2.3",
        "dependencies": {"@acme/core": "workspace:*", "lodash": "^4.17.0"},
        "devDependencies": {"@acme/test-utils": "*"},
        "peerDependencies": {"react": ">=18"},
        "optionalDependencies": {"fsevents": "^2"}
    })");
    REQUIRE(r.is_ok());
    const auto& d = r.value();
    REQUIRE(d.name == "@acme/app");
    REQUIRE(d.version.value() == "1.2.3");
    REQUIRE(d.dependencies.at("lodash") == "^4.17.0");
    REQUIRE(d.dev_dependencies.count("@acme/test-utils") == 1);
    REQUIRE(d.peer_dependencies.count("react") == 1);
    REQUIRE(d.optional_dependencies.count("fsevents") == 1);
}

TEST_CASE("parse minimal descriptor", "[descriptor]") {
    auto r = PackageDescriptor::parse(R"({"name": "solo"})");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().version.has_value());
    REQUIRE(r.value().dependencies.empty());
}

TEST_CASE("parse rejects invalid JSON", "[descriptor]") {
    auto r = PackageDescriptor::parse("{ not json", "broken/package.json");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KnitError::Descriptor);
    REQUIRE(r.error().file == "broken/package.json");
}

TEST_CASE("parse rejects non-object documents", "[descriptor]") {
    auto r = PackageDescriptor::parse(R"(["name"])");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KnitError::Descriptor);
}

TEST_CASE("parse requires a name", "[descriptor]") {
    for (const char* text : {R"({"version": "1.0.0"})",
                             R"({"name": ""})",
                             R"({"name": 12})"}) {
        auto r = PackageDescriptor::parse(text, "x/package.json");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KnitError::Descriptor);
        REQUIRE(r.error().message.find("has no name field") != std::string::npos);
    }
}

TEST_CASE("parse rejects wrongly typed fields", "[descriptor]") {
    REQUIRE(PackageDescriptor::parse(R"({"name": "a", "version": 1})").is_err());
    REQUIRE(PackageDescriptor::parse(R"({"name": "a", "dependencies": ["b"]})").is_err());
    // null categories are treated as absent
    REQUIRE(PackageDescriptor::parse(R"({"name": "a", "dependencies": null})").is_ok());
}

// ===== to_node =====

TEST_CASE("to_node unions categories and keeps dev separately", "[descriptor]") {
    auto d = PackageDescriptor::parse(R"({
        "name": "app",
        "dependencies": {"core": "1"},
        "devDependencies": {"tester": "1", "core": "1"},
        "peerDependencies": {"peer": "1"},
        "optionalDependencies": {"opt": "1"}
    })").value();

    auto n = d.to_node("/ws/app/package.json");
    REQUIRE(n.name == "app");
    REQUIRE(n.location == std::filesystem::path("/ws/app"));
    REQUIRE(n.declared_dependencies == NameSet{"core", "opt", "peer", "tester"});
    REQUIRE(n.declared_dev_dependencies == NameSet{"core", "tester"});
    REQUIRE(n.local_dependencies.empty());
}

TEST_CASE("to_node defaults the version", "[descriptor]") {
    auto n = PackageDescriptor::parse(R"({"name": "v"})").value().to_node("/ws/v/package.json");
    REQUIRE(n.version == "0.0.0");

    auto empty = PackageDescriptor::parse(R"({"name": "v", "version": ""})").value();
    REQUIRE(empty.to_node("/ws/v/package.json").version == "0.0.0");
}

// ===== Files =====

TEST_CASE("load descriptor from file", "[descriptor]") {
    TempDir td;
    auto path = td.write_package("package-a",
        R"({"name": "package-a", "version": "1.0.0", "dependencies": {"package-b": "1.0.0"}})");

    auto r = PackageDescriptor::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().name == "package-a");
    REQUIRE(r.value().version.value() == "1.0.0");
    REQUIRE(r.value().dependencies.count("package-b") == 1);
}

TEST_CASE("load missing descriptor fails", "[descriptor]") {
    TempDir td;
    auto r = PackageDescriptor::load(td.path / "nonexistent" / "package.json");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KnitError::Descriptor);
}

TEST_CASE("json parser reads through the DescriptorParser interface", "[descriptor]") {
    TempDir td;
    auto path = td.write_package("p", R"({"name": "p"})");
    JsonDescriptorParser parser;
    const DescriptorParser& iface = parser;
    REQUIRE(iface.parse(path).value().name == "p");
}
