#include <doctest/doctest.h>
#include <apco/compose.hpp>

#include "test_helpers.hpp"

using namespace apco;

// ============================================================================
// Merge
// ============================================================================

TEST_CASE("merge_service lets non-empty child fields win") {
    Service parent;
    parent.name = "base";
    parent.image = "docker://alpine";
    parent.command = {"sleep", "1"};
    parent.set_volume("/data", "./data:/data");
    parent.set_environment("A", "'1'");

    Service child;
    child.name = "web";
    child.command = {"echo", "hi"};

    auto merged = merge_service(parent, child);
    CHECK(merged.name == "web");
    CHECK(merged.image == "docker://alpine");
    CHECK(merged.command == std::vector<std::string>{"echo", "hi"});
    CHECK(merged.volumes.size() == 1);
    CHECK(merged.environment.size() == 1);
}

TEST_CASE("merge_service replaces volumes and environment whole") {
    Service parent;
    parent.set_volume("/a", "./a:/a");
    parent.set_volume("/b", "./b:/b");

    Service child;
    child.set_volume("/c", "./c:/c");

    auto merged = merge_service(parent, child);
    REQUIRE(merged.volumes.size() == 1);
    CHECK(merged.volumes[0].first == "/c");
}

TEST_CASE("rebase_service_paths rewrites build and relative host paths") {
    Service s;
    s.build = ".";
    s.def_file = "base.def";
    s.sif_file = "base.sif";
    s.set_volume("/data", "./data:/data");
    s.set_volume("/abs", "/srv/abs:/abs");

    rebase_service_paths(s, "parent");
    CHECK(s.build == "parent");
    CHECK(s.def_file == "parent/base.def");
    CHECK(s.sif_file == "parent/base.sif");
    CHECK(s.volumes[0].second == "parent/data:/data");
    CHECK(s.volumes[1].second == "/srv/abs:/abs");
}

// ============================================================================
// Resolution across files
// ============================================================================

TEST_CASE("extends pulls the parent service from another file") {
    test::TempDir temp;
    test::write_text(temp.file("base/compose.yaml"),
                     "services:\n"
                     "  base:\n"
                     "    build: .\n"
                     "    volumes:\n"
                     "      - ./data:/data\n"
                     "    environment:\n"
                     "      MODE: prod\n");
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  web:\n"
                     "    extends:\n"
                     "      file: base/compose.yaml\n"
                     "      service: base\n"
                     "    command: echo child\n");

    auto r = parse_compose_file(temp.file("compose.yaml"));
    REQUIRE_MESSAGE(r.ok, r.error);
    REQUIRE(r.services.size() == 1);

    // Paths are relative to the directory of the declaring file
    const auto& s = r.services[0];
    CHECK(s.name == "web");
    CHECK(s.build == "base");
    CHECK(s.def_file == "base/base.def");
    CHECK(s.sif_file == "base/base.sif");
    CHECK(s.command == std::vector<std::string>{"echo", "child"});
    REQUIRE(s.volumes.size() == 1);
    CHECK(s.volumes[0].second == "base/data:/data");
    REQUIRE(s.environment.size() == 1);
    CHECK(s.environment[0].second == "'prod'");
}

TEST_CASE("extends chains across directories rebase each level once") {
    test::TempDir temp;
    test::write_text(temp.file("sub/g.yaml"),
                     "services:\n"
                     "  c:\n"
                     "    build: .\n"
                     "    volumes:\n"
                     "      - ./data:/data\n");
    test::write_text(temp.file("sub/base.yaml"),
                     "services:\n"
                     "  b:\n"
                     "    extends:\n"
                     "      file: g.yaml\n"
                     "      service: c\n");
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  a:\n"
                     "    extends:\n"
                     "      file: sub/base.yaml\n"
                     "      service: b\n");
    test::ScopedCwd cwd(temp.path());

    auto r = parse_compose_file("compose.yaml");
    REQUIRE_MESSAGE(r.ok, r.error);
    REQUIRE(r.services.size() == 1);

    const auto& s = r.services[0];
    CHECK(s.build == "sub");
    CHECK(s.def_file == "sub/c.def");
    CHECK(s.sif_file == "sub/c.sif");
    REQUIRE(s.volumes.size() == 1);
    CHECK(s.volumes[0].second == "sub/data:/data");
}

TEST_CASE("an absolute extends file keeps absolute paths through the chain") {
    test::TempDir temp;
    test::write_text(temp.file("lib/g.yaml"),
                     "services:\n"
                     "  c:\n"
                     "    build: .\n"
                     "    volumes:\n"
                     "      - ./data:/data\n");
    test::write_text(temp.file("lib/base.yaml"),
                     "services:\n"
                     "  b:\n"
                     "    extends:\n"
                     "      file: g.yaml\n"
                     "      service: c\n");
    test::write_text(temp.file("app/compose.yaml"),
                     "services:\n"
                     "  a:\n"
                     "    extends:\n"
                     "      file: " + temp.file("lib/base.yaml") + "\n"
                     "      service: b\n");
    test::ScopedCwd cwd(temp.file("app"));

    auto r = parse_compose_file("compose.yaml");
    REQUIRE_MESSAGE(r.ok, r.error);

    const auto& s = r.services[0];
    std::string lib = temp.path() + "/lib";
    CHECK(s.build == lib);
    CHECK(s.def_file == lib + "/c.def");
    CHECK(s.volumes[0].second == lib + "/data:/data");
}

TEST_CASE("an absolute build in a parent file is not rebased") {
    test::TempDir temp;
    test::write_text(temp.file("base/compose.yaml"),
                     "services:\n"
                     "  base:\n"
                     "    build: /srv/context\n");
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  web:\n"
                     "    extends:\n"
                     "      file: base/compose.yaml\n"
                     "      service: base\n");
    test::ScopedCwd cwd(temp.path());

    auto r = parse_compose_file("compose.yaml");
    REQUIRE_MESSAGE(r.ok, r.error);

    const auto& s = r.services[0];
    CHECK(s.build == "/srv/context");
    CHECK(s.def_file == "base/base.def");
    CHECK(s.sif_file == "base/base.sif");
}

TEST_CASE("rebase_service_paths leaves absolute build paths alone") {
    Service s;
    s.build = "/srv/context";
    s.def_file = "web.def";
    s.sif_file = "/images/web.sif";

    rebase_service_paths(s, "parent");
    CHECK(s.build == "/srv/context");
    CHECK(s.def_file == "parent/web.def");
    CHECK(s.sif_file == "/images/web.sif");
}

TEST_CASE("extends may name a service in the same file") {
    test::TempDir temp;
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  base:\n"
                     "    image: alpine:latest\n"
                     "  web:\n"
                     "    extends:\n"
                     "      file: compose.yaml\n"
                     "      service: base\n"
                     "    command: echo hi\n");

    auto r = parse_compose_file(temp.file("compose.yaml"));
    REQUIRE_MESSAGE(r.ok, r.error);
    REQUIRE(r.services.size() == 2);
    CHECK(r.services[1].image == "docker://alpine:latest");
    CHECK(r.services[1].command == std::vector<std::string>{"echo", "hi"});
}

TEST_CASE("extends forwards warnings from the parent file") {
    test::TempDir temp;
    test::write_text(temp.file("base.yaml"),
                     "services:\n"
                     "  base:\n"
                     "    image: alpine\n"
                     "    networks:\n"
                     "      - front\n");
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  web:\n"
                     "    extends:\n"
                     "      file: base.yaml\n"
                     "      service: base\n");

    auto r = parse_compose_file(temp.file("compose.yaml"));
    REQUIRE(r.ok);
    REQUIRE(r.warnings.size() == 1);
    CHECK(r.warnings[0].key == "unsupported_key");
}

TEST_CASE("extends of a missing service is a missing reference") {
    test::TempDir temp;
    test::write_text(temp.file("base.yaml"), "services:\n  base:\n    image: alpine\n");
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  web:\n"
                     "    extends:\n"
                     "      file: base.yaml\n"
                     "      service: other\n");

    auto r = parse_compose_file(temp.file("compose.yaml"));
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::MissingReference);
}

TEST_CASE("extends of a missing file is a missing reference") {
    test::TempDir temp;
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  web:\n"
                     "    extends:\n"
                     "      file: nowhere.yaml\n"
                     "      service: base\n");

    auto r = parse_compose_file(temp.file("compose.yaml"));
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::MissingReference);
}

TEST_CASE("extends needs both file and service") {
    auto r = parse_compose_string(
        "services:\n"
        "  web:\n"
        "    extends:\n"
        "      service: base\n",
        "compose.yaml");
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::MissingReference);
}

TEST_CASE("extends loops are reported as cycles") {
    test::TempDir temp;
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  a:\n"
                     "    extends:\n"
                     "      file: compose.yaml\n"
                     "      service: b\n"
                     "  b:\n"
                     "    extends:\n"
                     "      file: compose.yaml\n"
                     "      service: a\n");

    auto r = parse_compose_file(temp.file("compose.yaml"));
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::ExtendsCycle);
}

TEST_CASE("a service extending itself is a cycle") {
    test::TempDir temp;
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  a:\n"
                     "    extends:\n"
                     "      file: compose.yaml\n"
                     "      service: a\n");

    auto r = parse_compose_file(temp.file("compose.yaml"));
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::ExtendsCycle);
}

TEST_CASE("extends chains deeper than the resolver limit fail") {
    test::TempDir temp;
    test::write_text(temp.file("c.yaml"), "services:\n  z:\n    image: alpine\n");
    test::write_text(temp.file("b.yaml"),
                     "services:\n"
                     "  y:\n"
                     "    extends:\n"
                     "      file: c.yaml\n"
                     "      service: z\n");
    test::write_text(temp.file("a.yaml"),
                     "services:\n"
                     "  x:\n"
                     "    extends:\n"
                     "      file: b.yaml\n"
                     "      service: y\n");

    auto deep_enough = parse_compose_file(temp.file("a.yaml"));
    REQUIRE_MESSAGE(deep_enough.ok, deep_enough.error);
    CHECK(deep_enough.services[0].image == "docker://alpine");

    ExtendsResolver shallow(1);
    auto too_deep = parse_compose_file(temp.file("a.yaml"), shallow);
    CHECK_FALSE(too_deep.ok);
    CHECK(too_deep.kind == ErrorKind::ExtendsCycle);
}

TEST_CASE("ExtendsResolver caches resolved services") {
    test::TempDir temp;
    std::string base = temp.file("base.yaml");
    test::write_text(base, "services:\n  base:\n    image: alpine\n");

    ExtendsResolver resolver;
    auto first = resolver.resolve(base, "base");
    REQUIRE(first.ok);

    // The cached entry survives the file changing underneath
    test::write_text(base, "services:\n  base:\n    image: busybox\n");
    auto second = resolver.resolve(base, "base");
    REQUIRE(second.ok);
    CHECK(second.service.image == "docker://alpine");
    CHECK(resolver.depth() == 0);
}
