#include <doctest/doctest.h>
#include <apco/line_reader.hpp>

#include "test_helpers.hpp"

using namespace apco;

TEST_CASE("LineReader drops blank, comment and extension lines") {
    auto reader = LineReader::from_string(
        "services:\n"
        "\n"
        "  # a comment\n"
        "x-common: &common\n"
        "  web:\n"
        "    \t\n"
        "    image: alpine\n",
        "compose.yaml");

    auto first = reader.next();
    REQUIRE(first.has_value());
    CHECK(first->number == 1);
    CHECK(first->text == "services:");

    auto second = reader.next();
    REQUIRE(second.has_value());
    CHECK(second->number == 5);
    CHECK(second->text == "  web:");

    auto third = reader.next();
    REQUIRE(third.has_value());
    CHECK(third->number == 7);
    CHECK(third->text == "    image: alpine");

    CHECK_FALSE(reader.next().has_value());
}

TEST_CASE("LineReader keeps reporting end of input") {
    auto reader = LineReader::from_string("a: b\n", "compose.yaml");
    REQUIRE(reader.next().has_value());
    CHECK_FALSE(reader.next().has_value());
    CHECK_FALSE(reader.next().has_value());
    CHECK_FALSE(reader.next().has_value());
}

TEST_CASE("LineReader strips carriage returns") {
    auto reader = LineReader::from_string("services:\r\n  web:\r\n", "compose.yaml");
    CHECK(reader.next()->text == "services:");
    CHECK(reader.next()->text == "  web:");
}

TEST_CASE("LineReader Dockerfile filter keeps comments") {
    auto reader = LineReader::from_string(
        "# syntax=docker/dockerfile:1\n"
        "\n"
        "FROM alpine\n",
        "Dockerfile", LineFilter::Dockerfile);

    auto comment = reader.next();
    REQUIRE(comment.has_value());
    CHECK(comment->text == "# syntax=docker/dockerfile:1");
    CHECK(reader.next()->number == 3);
}

TEST_CASE("is_skipped only looks past leading spaces") {
    CHECK(LineReader::is_skipped("   # note", LineFilter::Compose));
    CHECK(LineReader::is_skipped("  x-defaults:", LineFilter::Compose));
    CHECK_FALSE(LineReader::is_skipped("    image: max-x", LineFilter::Compose));
    CHECK_FALSE(LineReader::is_skipped("      - x-ray:/data", LineFilter::Compose));
    CHECK(LineReader::is_skipped("   ", LineFilter::Dockerfile));
    CHECK_FALSE(LineReader::is_skipped("# comment", LineFilter::Dockerfile));
}

TEST_CASE("LineReader reads a file and reports a missing one") {
    test::TempDir temp;
    std::string path = temp.file("compose.yaml");
    test::write_text(path, "services:\n  web:\n");

    LineReader reader(path);
    REQUIRE(reader.is_open());
    CHECK(reader.source_name() == path);
    CHECK(reader.next()->text == "services:");

    LineReader missing(temp.file("nope.yaml"));
    CHECK_FALSE(missing.is_open());
    CHECK_FALSE(missing.next().has_value());
}
