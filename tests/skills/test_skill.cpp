/// @file test_skill.cpp
/// @brief Tests for SkillRecord JSON conversion

#include <catch2/catch_test_macros.hpp>
#include <fixiplug/skills/skill.hpp>

using namespace fixi_skills;

TEST_CASE("SkillRecord: defaults", "[skills][skill]") {
    SkillRecord skill;
    REQUIRE(skill.level == "intermediate");
    REQUIRE(skill.version == "1.0.0");
    REQUIRE(skill.tags.empty());
}

TEST_CASE("SkillRecord: from_json", "[skills][skill]") {
    SECTION("full metadata") {
        auto result = SkillRecord::from_json({
            {"name", "table-sorting"},
            {"pluginName", "table"},
            {"description", "Sort table rows"},
            {"instructions", "Dispatch api:table:sort with a column"},
            {"tags", {"table", "data"}},
            {"level", "beginner"},
            {"version", "2.1.0"},
            {"author", "fixi"},
            {"references", {"docs/table.md"}}});

        REQUIRE(result.is_ok());
        const auto& skill = result.value();
        REQUIRE(skill.name == "table-sorting");
        REQUIRE(skill.plugin_id == "table");
        REQUIRE(skill.has_tag("data"));
        REQUIRE(skill.level == "beginner");
        REQUIRE(skill.version == "2.1.0");
        REQUIRE(skill.references.size() == 1);
    }

    SECTION("defaults applied") {
        auto result = SkillRecord::from_json({{"name", "minimal"}});
        REQUIRE(result.is_ok());
        REQUIRE(result->level == "intermediate");
        REQUIRE(result->version == "1.0.0");
    }

    SECTION("missing name") {
        auto result = SkillRecord::from_json({{"description", "no name"}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<fixi_core::SkillError>());
    }

    SECTION("tags must be an array") {
        auto result = SkillRecord::from_json({{"name", "x"}, {"tags", "oops"}});
        REQUIRE(result.is_err());
    }
}

TEST_CASE("SkillRecord: manifest entry", "[skills][skill]") {
    SkillRecord skill;
    skill.plugin_id = "table";
    skill.name = "table-sorting";
    skill.instructions = "long text";
    skill.tags = {"table"};

    auto brief = skill.to_manifest_entry(false);
    REQUIRE(brief["name"] == "table-sorting");
    REQUIRE(brief["pluginName"] == "table");
    REQUIRE(brief["tags"] == nlohmann::json::array({"table"}));
    REQUIRE_FALSE(brief.contains("instructions"));

    auto full = skill.to_json();
    REQUIRE(full["instructions"] == "long text");
}
