#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "log.hpp"

using namespace tagsink;

TEST_CASE("Tags are normalized to lowercase single words", "[tags]")
{
    SECTION("Case folding")
    {
        REQUIRE(normalize_tag("SQL") == "sql");
        REQUIRE(normalize_tag("Warning") == "warning");
    }

    SECTION("Empty tag rejected") { REQUIRE_THROWS_AS(normalize_tag(""), invalid_tag_error); }

    SECTION("Whitespace rejected")
    {
        REQUIRE_THROWS_AS(normalize_tag("two words"), invalid_tag_error);
        REQUIRE_THROWS_AS(normalize_tag(" sql"), invalid_tag_error);
        REQUIRE_THROWS_AS(normalize_tag("sql\t"), invalid_tag_error);
    }

    SECTION("Malformed tag in a set")
    {
        REQUIRE_THROWS_AS((tag_set{"sql", ""}), invalid_tag_error);
        REQUIRE_THROWS_AS((tag_set{"bad tag"}), invalid_tag_error);
    }
}

TEST_CASE("Tag sets deduplicate and keep first-seen order", "[tags]")
{
    tag_set tags{"warning", "SQL", "Warning", "blog"};

    REQUIRE(tags.size() == 3);
    REQUIRE(tags.tags() == std::vector<std::string>{"warning", "sql", "blog"});
    REQUIRE(tags.to_string() == "warning,sql,blog");
    REQUIRE(tags.to_string(" ") == "warning sql blog");
}

TEST_CASE("Tag set identity ignores order and case", "[tags]")
{
    REQUIRE(tag_set{"a", "b"} == tag_set{"B", "a"});
    REQUIRE_FALSE(tag_set{"a", "b"} == tag_set{"a"});
    REQUIRE(tag_set{} == tag_set{});
}

TEST_CASE("Tag sets from names", "[tags]")
{
    SECTION("Underscore separated")
    {
        auto tags = tag_set::from_name("blog_sql_warning");
        REQUIRE(tags == tag_set{"blog", "sql", "warning"});
        REQUIRE(tags.tags().front() == "blog");
    }

    SECTION("Single word") { REQUIRE(tag_set::from_name("debug") == tag_set{"debug"}); }

    SECTION("Empty tokens skipped") { REQUIRE(tag_set::from_name("_general__info_") == tag_set{"general", "info"}); }

    SECTION("Custom delimiter") { REQUIRE(tag_set::from_name("a.b", '.') == tag_set{"a", "b"}); }

    SECTION("No tokens")
    {
        REQUIRE_THROWS_AS(tag_set::from_name(""), invalid_tag_error);
        REQUIRE_THROWS_AS(tag_set::from_name("___"), invalid_tag_error);
    }
}

TEST_CASE("Subscription matching", "[tags]")
{
    tag_set emitted{"blog", "sql", "warning"};

    SECTION("Any shared tag matches")
    {
        REQUIRE(matches(emitted, tag_set{"sql"}));
        REQUIRE(matches(emitted, tag_set{"debug", "warning"}));
    }

    SECTION("Disjoint sets do not match") { REQUIRE_FALSE(matches(emitted, tag_set{"debug", "info"})); }

    SECTION("Matching is symmetric")
    {
        tag_set sub{"sql", "error"};
        REQUIRE(matches(emitted, sub) == matches(sub, emitted));
        tag_set other{"net"};
        REQUIRE(matches(emitted, other) == matches(other, emitted));
    }

    SECTION("Matching ignores case") { REQUIRE(matches(tag_set{"SQL"}, tag_set{"sql"})); }

    SECTION("Empty subscription matches nothing")
    {
        REQUIRE_FALSE(matches(emitted, tag_set{}));
        REQUIRE_FALSE(matches(tag_set{}, emitted));
    }
}

TEST_CASE("Tag set intersection keeps the receiver's order", "[tags]")
{
    tag_set emitted{"warning", "blog", "sql"};
    auto common = emitted.intersection(tag_set{"sql", "warning", "debug"});

    REQUIRE(common.tags() == std::vector<std::string>{"warning", "sql"});
    REQUIRE(emitted.intersection(tag_set{"net"}).empty());
}

TEST_CASE("Default tag set", "[tags]")
{
    REQUIRE(tag_set::default_tags() == tag_set{"default"});
    REQUIRE(tag_set::default_tags().contains(DEFAULT_TAG));
}
