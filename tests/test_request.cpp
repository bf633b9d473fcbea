#include "callscope/errors.hpp"
#include "callscope/request.hpp"
#include "callscope/version.hpp"

#include <catch2/catch.hpp>

#include <algorithm>

namespace callscope::test {

static Request sample_request() {
    Request request;
    request.roots = {"vfs_read", "vfs_write"};
    request.root_patterns = {"^sys_"};
    request.direction = Direction::Reverse;
    request.max_depth = 3;
    request.filters.ignore = {"printk"};
    request.filters.ignore_patterns = {"^trace_", "lock$"};
    request.filters.show_patterns = {"^security_"};
    request.filters.trim = true;
    request.end_function = "do_sys_open";
    request.locations = true;
    request.output = "/tmp/out.svg";
    request.format = "svg";
    request.render.font = "DejaVu Sans";
    request.render.font_size = 14;
    request.render.rankdir = "LR";
    request.keep = true;
    return request;
}

// Replace one field of an encoded record
static std::string with_field(std::string record, size_t index, const std::string &value) {
    size_t start = 0;
    for (size_t i = 0; i < index; ++i) {
        start = record.find(FIELD_DELIMITER, start) + 1;
    }
    size_t end = record.find(FIELD_DELIMITER, start);
    if (end == std::string::npos)
        end = record.size();
    return record.replace(start, end - start, value);
}

TEST_CASE("request: record carries every parameter", "[request]") {
    Request original = sample_request();
    std::string record = original.encode();

    CHECK(record.find('\n') == std::string::npos);
    CHECK(std::count(record.begin(), record.end(), FIELD_DELIMITER) == 18);

    Request decoded = Request::decode(record);
    CHECK(decoded.roots == original.roots);
    CHECK(decoded.root_patterns == original.root_patterns);
    CHECK(decoded.direction == Direction::Reverse);
    CHECK(decoded.max_depth == 3);
    CHECK(decoded.filters.ignore == original.filters.ignore);
    CHECK(decoded.filters.ignore_patterns == original.filters.ignore_patterns);
    CHECK(decoded.filters.show.empty());
    CHECK(decoded.filters.show_patterns == original.filters.show_patterns);
    CHECK(decoded.filters.trim);
    CHECK_FALSE(decoded.filters.no_extern);
    CHECK(decoded.end_function == "do_sys_open");
    CHECK(decoded.locations);
    CHECK(decoded.output == "/tmp/out.svg");
    CHECK(decoded.format == "svg");
    CHECK(decoded.render.font == "DejaVu Sans");
    CHECK(decoded.render.font_size == 14);
    CHECK(decoded.render.rankdir == "LR");
    CHECK(decoded.keep);
}

TEST_CASE("request: trailing carriage return is tolerated", "[request]") {
    Request decoded = Request::decode(sample_request().encode() + "\r");
    CHECK(decoded.keep);
}

TEST_CASE("request: malformed records are rejected", "[request][errors]") {
    std::string record = sample_request().encode();

    SECTION("wrong field count") {
        CHECK_THROWS_AS(Request::decode(record + FIELD_DELIMITER), ConfigError);
        CHECK_THROWS_AS(Request::decode(record.substr(0, record.rfind(FIELD_DELIMITER))),
                        ConfigError);
    }
    SECTION("unsupported version") {
        CHECK_THROWS_AS(Request::decode(with_field(record, 0, "99")), ConfigError);
        CHECK_THROWS_AS(Request::decode("garbage"), ConfigError);
        CHECK_THROWS_AS(Request::decode(""), ConfigError);
    }
    SECTION("bad integers") {
        CHECK_THROWS_AS(Request::decode(with_field(record, 4, "three")), ConfigError);
        CHECK_THROWS_AS(Request::decode(with_field(record, 16, "12pt")), ConfigError);
    }
    SECTION("bad flags and direction") {
        CHECK_THROWS_AS(Request::decode(with_field(record, 9, "yes")), ConfigError);
        CHECK_THROWS_AS(Request::decode(with_field(record, 3, "sideways")), ConfigError);
    }
}

TEST_CASE("request: reserved characters cannot be encoded", "[request][errors]") {
    Request request = sample_request();

    SECTION("field delimiter") {
        request.output = std::string("out") + FIELD_DELIMITER + "x";
        CHECK_THROWS_AS(request.encode(), ConfigError);
    }
    SECTION("newline") {
        request.end_function = "a\nb";
        CHECK_THROWS_AS(request.encode(), ConfigError);
    }
    SECTION("list delimiter inside an item") {
        request.filters.ignore = {"a;b"};
        CHECK_THROWS_AS(request.encode(), ConfigError);
    }
}

TEST_CASE("request: validation", "[request][errors]") {
    Request request = sample_request();
    REQUIRE_NOTHROW(request.validate());

    SECTION("needs a root") {
        request.roots.clear();
        request.root_patterns.clear();
        CHECK_THROWS_AS(request.validate(), ConfigError);
    }
    SECTION("pattern alone is a root") {
        request.roots.clear();
        CHECK_NOTHROW(request.validate());
    }
    SECTION("depth below unlimited") {
        request.max_depth = -2;
        CHECK_THROWS_AS(request.validate(), ConfigError);
    }
    SECTION("unknown rankdir") {
        request.render.rankdir = "XY";
        CHECK_THROWS_AS(request.validate(), ConfigError);
    }
    SECTION("unknown format") {
        request.format = "jpeg2000";
        CHECK_THROWS_AS(request.validate(), ConfigError);
    }
    SECTION("font size") {
        request.render.font_size = 0;
        CHECK_THROWS_AS(request.validate(), ConfigError);
    }
    SECTION("stdout only for plain") {
        request.output = "-";
        CHECK_THROWS_AS(request.validate(), ConfigError);
        request.format = "plain";
        CHECK_NOTHROW(request.validate());
    }
    SECTION("root pattern must compile") {
        request.root_patterns = {"sys_("};
        CHECK_THROWS_AS(request.validate(), ConfigError);
    }
}

TEST_CASE("request: list helpers drop empty items", "[request]") {
    CHECK(split_list("").empty());
    CHECK(split_list("a") == std::vector<std::string>{"a"});
    CHECK(split_list("a;;b;") == std::vector<std::string>{"a", "b"});
    CHECK(join_list({"a", "b", "c"}) == "a;b;c");
    CHECK(join_list({}).empty());
}

TEST_CASE("request: layout is needed for rendered formats only", "[request]") {
    Request request;
    CHECK_FALSE(request.needs_layout());
    request.format = "dot";
    CHECK(request.needs_layout());
}

} // namespace callscope::test
