#include <doctest/doctest.h>
#include <apco/compose.hpp>

using namespace apco;

namespace {

ComposeParseResult parse(const std::string& text) {
    return parse_compose_string(text, "compose.yaml");
}

} // namespace

// ============================================================================
// Services and keys
// ============================================================================

TEST_CASE("parses image and command") {
    auto r = parse(
        "services:\n"
        "  valid_alpine:\n"
        "    image: alpine:latest\n"
        "    command: echo \"valid_alpine\"\n");
    REQUIRE(r.ok);
    REQUIRE(r.services.size() == 1);

    const auto& s = r.services[0];
    CHECK(s.name == "valid_alpine");
    CHECK(s.image == "docker://alpine:latest");
    CHECK(s.command == std::vector<std::string>{"echo", "\"valid_alpine\""});
    CHECK_FALSE(s.has_build());
}

TEST_CASE("image keeps an explicit scheme and loses quotes") {
    auto r = parse(
        "services:\n"
        "  a:\n"
        "    image: \"ghcr.io/linuxcontainers/alpine:latest\"\n"
        "  b:\n"
        "    image: oras://registry/app:1\n");
    REQUIRE(r.ok);
    CHECK(r.services[0].image == "docker://ghcr.io/linuxcontainers/alpine:latest");
    CHECK(r.services[1].image == "oras://registry/app:1");
}

TEST_CASE("build derives definition and artifact names") {
    auto r = parse(
        "services:\n"
        "  valid_build:\n"
        "    build: .\n");
    REQUIRE(r.ok);
    const auto& s = r.services[0];
    CHECK(s.build == ".");
    CHECK(s.def_file == "valid_build.def");
    CHECK(s.sif_file == "valid_build.sif");
    CHECK(s.run_image() == "valid_build.sif");
}

TEST_CASE("multiple services keep document order") {
    auto r = parse(
        "services:\n"
        "  db:\n"
        "    image: postgres:16\n"
        "  web:\n"
        "    image: nginx\n"
        "  worker:\n"
        "    build: ./worker\n");
    REQUIRE(r.ok);
    REQUIRE(r.services.size() == 3);
    CHECK(r.services[0].name == "db");
    CHECK(r.services[1].name == "web");
    CHECK(r.services[2].name == "worker");
    CHECK(r.find_service("web") == &r.services[1]);
    CHECK(r.find_service("cache") == nullptr);
}

TEST_CASE("command accepts a bracketed list and a nested list") {
    auto r = parse(
        "services:\n"
        "  a:\n"
        "    image: alpine\n"
        "    command: [\"sh\", \"-c\", \"echo hi\"]\n"
        "  b:\n"
        "    image: alpine\n"
        "    command:\n"
        "      - ls\n"
        "      - -la\n");
    REQUIRE(r.ok);
    CHECK(r.services[0].command == std::vector<std::string>{"sh", "-c", "echo hi"});
    CHECK(r.services[1].command == std::vector<std::string>{"ls", "-la"});
}

// ============================================================================
// Volumes and environment
// ============================================================================

TEST_CASE("volumes drop the mode and are keyed by container path") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "    volumes:\n"
        "      - ./data:/data:ro\n"
        "      - ./:/mount/\n"
        "      - ./other:/data\n");
    REQUIRE(r.ok);
    const auto& volumes = r.services[0].volumes;
    REQUIRE(volumes.size() == 2);
    CHECK(volumes[0].first == "/data");
    CHECK(volumes[0].second == "./other:/data");
    CHECK(volumes[1].first == "/mount/");
    CHECK(volumes[1].second == "./:/mount/");
}

TEST_CASE("volume entries need one or two colons") {
    auto none = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "    volumes:\n"
        "      - ./data\n");
    CHECK_FALSE(none.ok);
    CHECK(none.kind == ErrorKind::Grammar);

    auto three = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "    volumes:\n"
        "      - a:b:c:d\n");
    CHECK_FALSE(three.ok);
}

TEST_CASE("environment values are stored pre-quoted") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "    environment:\n"
        "      EMPTY: null\n"
        "      BARE:\n"
        "      DOUBLE: \"two\"\n"
        "      SINGLE: 'one'\n"
        "      PLAIN: bla\n");
    REQUIRE(r.ok);
    const auto& env = r.services[0].environment;
    REQUIRE(env.size() == 5);
    CHECK(env[0] == std::make_pair(std::string("EMPTY"), std::string("")));
    CHECK(env[1].second == "");
    CHECK(env[2].second == "'two'");
    CHECK(env[3].second == "'one'");
    CHECK(env[4].second == "'bla'");
}

TEST_CASE("environment accepts list form") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "    environment:\n"
        "      - MODE=prod\n"
        "      - DEBUG\n");
    REQUIRE(r.ok);
    const auto& env = r.services[0].environment;
    REQUIRE(env.size() == 2);
    CHECK(env[0].first == "MODE");
    CHECK(env[0].second == "'prod'");
    CHECK(env[1].first == "DEBUG");
    CHECK(env[1].second == "");
}

// ============================================================================
// Ignored content and warnings
// ============================================================================

TEST_CASE("networks are dropped with a warning") {
    auto r = parse(
        "services:\n"
        "  semivalid_networks:\n"
        "    image: alpine:latest\n"
        "    networks:\n"
        "      - backend\n");
    REQUIRE(r.ok);
    CHECK(r.services[0].image == "docker://alpine:latest");
    REQUIRE(r.warnings.size() == 1);
    CHECK(r.warnings[0].key == "unsupported_key");
    CHECK(r.warnings[0].fields.at("key") == "networks");
    CHECK(r.warnings[0].fields.at("service") == "semivalid_networks");
}

TEST_CASE("other top-level sections are skipped") {
    auto r = parse(
        "version: \"3.8\"\n"
        "x-defaults:\n"
        "  restart: always\n"
        "# comment\n"
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "volumes:\n"
        "  data:\n"
        "    driver: local\n");
    REQUIRE(r.ok);
    REQUIRE(r.services.size() == 1);
    REQUIRE(r.warnings.size() == 1);
    CHECK(r.warnings[0].key == "unsupported_section");
    CHECK(r.warnings[0].fields.at("key") == "volumes");
}

// ============================================================================
// Grammar violations
// ============================================================================

TEST_CASE("a space inside a key fails with its location") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "    bad key: value\n");
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::Grammar);
    CHECK(r.error.find("compose.yaml:3:") == 0);
    CHECK(r.services.empty());
}

TEST_CASE("unsupported service keys are grammar violations") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "    ports:\n"
        "      - 80:80\n");
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::Grammar);
    CHECK(r.error.find("ports") != std::string::npos);
}

TEST_CASE("service header with a value is rejected") {
    auto r = parse(
        "services:\n"
        "  app: alpine\n");
    CHECK_FALSE(r.ok);
}

TEST_CASE("duplicate service names are rejected") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "  app:\n"
        "    image: busybox\n");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("duplicate service 'app'") != std::string::npos);
}

TEST_CASE("image value must not contain a space") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine latest\n");
    CHECK_FALSE(r.ok);
}

TEST_CASE("block keys reject inline values") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "    image: alpine\n"
        "    volumes: ./:/data\n");
    CHECK_FALSE(r.ok);
}

TEST_CASE("misplaced indentation is rejected") {
    auto r = parse(
        "services:\n"
        "  app:\n"
        "      image: alpine\n");
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::Grammar);
}

TEST_CASE("an unreadable file is an I/O error") {
    auto r = parse_compose_file("/nonexistent/apco/compose.yaml");
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::Io);
}
