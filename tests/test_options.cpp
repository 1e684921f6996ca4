#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libctdi.hpp>

#include <map>
#include <string>

using namespace libctdi;

TEST_CASE("Options: scope validation level parses case-insensitively", "[options]") {
    REQUIRE(parse_scope_cycle_validation("error") == scope_cycle_validation::error);
    REQUIRE(parse_scope_cycle_validation("Warning") == scope_cycle_validation::warning);
    REQUIRE(parse_scope_cycle_validation("NONE") == scope_cycle_validation::none);
    REQUIRE(parse_scope_cycle_validation("nOnE") == scope_cycle_validation::none);
}

TEST_CASE("Options: unknown scope validation level is rejected", "[options]") {
    try {
        parse_scope_cycle_validation("off");
        FAIL("Expected invalid_option");
    } catch (const invalid_option& e) {
        REQUIRE(e.option() == scope_validation_option);
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("\"off\""));
        REQUIRE_THAT(std::string(e.what()),
                     Catch::Matchers::ContainsSubstring("ERROR, WARNING or NONE"));
    }
}

TEST_CASE("Options: processor options map onto validation options", "[options]") {
    REQUIRE(validation_options_from({}).scope_hierarchy == scope_cycle_validation::error);

    std::map<std::string, std::string> options{
        {"libctdi.disableInterComponentScopeValidation", "none"},
        {"libctdi.somethingElse", "ignored"}};
    auto parsed = validation_options_from(options);
    REQUIRE(parsed.scope_hierarchy == scope_cycle_validation::none);
    REQUIRE(parsed.terminal_scope == "Singleton");
    REQUIRE(parsed.duplicate_listing_limit == 10);

    options["libctdi.disableInterComponentScopeValidation"] = "sometimes";
    REQUIRE_THROWS_AS(validation_options_from(options), invalid_option);
}

TEST_CASE("Options: each level maps to a diagnostic severity", "[options]") {
    REQUIRE(diagnostic_severity(scope_cycle_validation::error) == severity_level::error);
    REQUIRE(diagnostic_severity(scope_cycle_validation::warning) == severity_level::warning);
    REQUIRE_FALSE(diagnostic_severity(scope_cycle_validation::none).has_value());
    REQUIRE(to_string(scope_cycle_validation::warning) == "WARNING");
}

TEST_CASE("Options: defaults", "[options]") {
    validation_options validation;
    REQUIRE(validation.scope_hierarchy == scope_cycle_validation::error);
    REQUIRE(plan_options{}.batch_size == 100);
}
