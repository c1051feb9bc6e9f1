#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "log.hpp"

using namespace tagsink;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Templates substitute named placeholders", "[template]")
{
    log_template tmpl{"[{tags}] {handler}: ", {"tags", "handler", "trace"}, "template"};

    REQUIRE(tmpl.uses("tags"));
    REQUIRE(tmpl.uses("handler"));
    REQUIRE_FALSE(tmpl.uses("trace"));
    REQUIRE(tmpl.render({{"tags", "SQL"}, {"handler", "db"}}) == "[SQL] db: ");
}

TEST_CASE("Unbound placeholders render empty", "[template]")
{
    log_template tmpl{"{datetime}{trace}{tags} : ", {"datetime", "tags", "trace"}, "template"};

    REQUIRE(tmpl.render({{"tags", "[DEFAULT]"}}) == "[DEFAULT] : ");
    REQUIRE(tmpl.render({}) == " : ");
}

TEST_CASE("Repeated placeholders", "[template]")
{
    log_template tmpl{"{tag}/{tag}", {"tag"}, "tag_template"};
    REQUIRE(tmpl.render({{"tag", "X"}}) == "X/X");
}

TEST_CASE("Brace escapes", "[template]")
{
    log_template literal{"{{literal}}", {"tag"}, "tag_template"};
    REQUIRE(literal.render({}) == "{literal}");

    log_template mixed{"{{{tag}}}", {"tag"}, "tag_template"};
    REQUIRE(mixed.render({{"tag", "SQL"}}) == "{SQL}");
}

TEST_CASE("Format specs pass through to fmt", "[template]")
{
    log_template tmpl{"[{tag:>5}]", {"tag"}, "tag_template"};
    REQUIRE(tmpl.render({{"tag", "ab"}}) == "[   ab]");
}

TEST_CASE("Invalid templates are rejected at construction", "[template]")
{
    SECTION("Unknown placeholder names the option and the expected names")
    {
        REQUIRE_THROWS_WITH((log_template{"{level}", {"tags", "trace"}, "template"}),
                            ContainsSubstring("template") && ContainsSubstring("level") && ContainsSubstring("{tags}"));
        REQUIRE_THROWS_AS((log_template{"{level}", {"tags"}, "template"}), template_error);
    }

    SECTION("Positional placeholders")
    {
        REQUIRE_THROWS_AS((log_template{"{}", {"tag"}, "tag_template"}), template_error);
        REQUIRE_THROWS_AS((log_template{"{0}", {"tag"}, "tag_template"}), template_error);
    }

    SECTION("Unbalanced braces")
    {
        REQUIRE_THROWS_AS((log_template{"{tag", {"tag"}, "tag_template"}), template_error);
        REQUIRE_THROWS_AS((log_template{"tag}", {"tag"}, "tag_template"}), template_error);
    }

    SECTION("Nested fields") { REQUIRE_THROWS_AS((log_template{"{tag:{tag}}", {"tag"}, "tag_template"}), template_error); }
}

TEST_CASE("Plain text templates", "[template]")
{
    log_template tmpl{" : ", {"tags"}, "template"};
    REQUIRE(tmpl.render({{"tags", "ignored"}}) == " : ");
}
