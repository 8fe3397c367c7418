#include <doctest/doctest.h>
#include <apco/compose.hpp>
#include <apco/exec.hpp>
#include <apco/plan.hpp>
#include <apco/platform.hpp>
#include <apco/warnings.hpp>

#include "test_helpers.hpp"

using namespace apco;

namespace {

struct Outcome {
    int exit_code = 0;
    std::vector<std::string> executed;
};

// Carry out a plan the way the command line does: write definitions, then
// stop at the first command that fails
Outcome carry_out(const PlanResult& plan) {
    Outcome outcome;
    for (const auto& step : plan.steps) {
        if (step.kind == PlanStep::Kind::WriteDefinition) {
            auto written = atomic_write_file(step.path, step.content);
            REQUIRE_MESSAGE(written.ok, written.error);
            continue;
        }
        outcome.executed.push_back(exec::format_command_line(step.argv));
        auto result = exec::run_and_wait(step.argv);
        REQUIRE_MESSAGE(result.ok, result.error);
        if (result.exit_code != 0) {
            outcome.exit_code = result.exit_code;
            break;
        }
    }
    return outcome;
}

void write_project(const test::TempDir& temp) {
    test::write_text(temp.file("base/compose.yaml"),
                     "services:\n"
                     "  common:\n"
                     "    build: .\n"
                     "    environment:\n"
                     "      MODE: prod\n");
    test::write_text(temp.file("base/Dockerfile"),
                     "ARG TAG=3.19\n"
                     "FROM alpine:$TAG AS build\n"
                     "RUN apk add --no-cache curl\n"
                     "FROM alpine:$TAG\n"
                     "COPY --from=build /usr/bin/curl /usr/bin/curl\n"
                     "WORKDIR /srv\n"
                     "CMD [\"curl\", \"--version\"]\n");
    test::write_text(temp.file("compose.yaml"),
                     "version: \"3\"\n"
                     "services:\n"
                     "  cache:\n"
                     "    image: redis:7\n"
                     "    networks:\n"
                     "      - back\n"
                     "  app:\n"
                     "    extends:\n"
                     "      file: base/compose.yaml\n"
                     "      service: common\n"
                     "    volumes:\n"
                     "      - ./data:/data:ro\n"
                     "networks:\n"
                     "  back:\n");
}

} // namespace

TEST_CASE("compose project is built and run through the whole pipeline") {
    test::TempDir temp;
    write_project(temp);
    test::ScopedCwd cwd(temp.path());

    auto parsed = parse_compose_file("compose.yaml");
    REQUIRE_MESSAGE(parsed.ok, parsed.error);
    REQUIRE(parsed.services.size() == 2);

    WarningCollector collector;
    collector.emit_all(parsed.warnings);

    PlanRequest request;
    request.binary = "true";
    auto plan = build_plan(parsed.services, request);
    REQUIRE_MESSAGE(plan.ok, plan.error);
    collector.emit_all(plan.warnings);

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 2);
    CHECK(warnings[0].key == "unsupported_key");
    CHECK(warnings[1].key == "unsupported_section");

    auto outcome = carry_out(plan);
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.executed == std::vector<std::string>{
        "true run docker://redis:7",
        "true build -F base/common.sif base/common.def",
        "true run --bind base/data:/data --env MODE='prod' base/common.sif",
    });

    auto def = read_file("base/common.def");
    REQUIRE(def.has_value());
    CHECK(*def ==
          "Bootstrap: docker\n"
          "From: alpine:3.19\n"
          "Stage: build\n"
          "\n"
          "%post\n"
          "TAG=3.19\n"
          "apk add --no-cache curl\n"
          "\n"
          "Bootstrap: docker\n"
          "From: alpine:3.19\n"
          "Stage: stage-2\n"
          "\n"
          "%files from build\n"
          "/usr/bin/curl /usr/bin/curl\n"
          "%post\n"
          "mkdir -p /srv\n"
          "cd /srv\n"
          "%runscript\n"
          "cd /srv\n"
          "exec curl --version \"$@\"\n"
          "%startscript\n"
          "cd /srv\n"
          "exec curl --version \"$@\"\n");
}

TEST_CASE("a failing command stops the remaining steps") {
    test::TempDir temp;
    write_project(temp);
    test::ScopedCwd cwd(temp.path());

    auto parsed = parse_compose_file("compose.yaml");
    REQUIRE(parsed.ok);

    PlanRequest request;
    request.binary = "false";
    auto plan = build_plan(parsed.services, request);
    REQUIRE(plan.ok);

    auto outcome = carry_out(plan);
    CHECK(outcome.exit_code == 1);
    CHECK(outcome.executed.size() == 1);
    CHECK_FALSE(path_exists("base/common.def"));
}

TEST_CASE("strict policy turns translation warnings into errors") {
    test::TempDir temp;
    write_project(temp);
    test::ScopedCwd cwd(temp.path());

    auto parsed = parse_compose_file("compose.yaml");
    REQUIRE(parsed.ok);

    WarningCollector collector;
    collector.set_default_action(WarningAction::Error);
    collector.apply_env_overrides({{"APCO_OVERRIDE_WARNINGS_UNSUPPORTED_SECTION", "ignore"}});
    collector.emit_all(parsed.warnings);
    CHECK(collector.has_errors());

    collector.apply_override("unsupported_key", WarningAction::Warn);
    CHECK_FALSE(collector.has_errors());
}

TEST_CASE("a malformed compose file produces no plan") {
    test::TempDir temp;
    test::write_text(temp.file("compose.yaml"),
                     "services:\n"
                     "  app:\n"
                     "    image: alpine\n"
                     "    restart: always\n");
    test::ScopedCwd cwd(temp.path());

    auto parsed = parse_compose_file("compose.yaml");
    CHECK_FALSE(parsed.ok);
    CHECK(parsed.kind == ErrorKind::Grammar);
    CHECK(parsed.services.empty());
    CHECK(parsed.error.find("compose.yaml:4:") == 0);
}
