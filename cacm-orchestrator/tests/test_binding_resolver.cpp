/**
 * @file test_binding_resolver.cpp
 * @brief Unit tests for binding parsing, resolution and output writes
 */

#include <catch2/catch.hpp>
#include "../src/binding_resolver.hpp"

using namespace cacm;
using namespace cacm::orchestrator;

namespace {

Value sample_inputs() {
    return Value::parse(R"({
      "params": {"type": "object", "value": {"clientId": "ACME", "limits": [10, 20, 30]}},
      "companyName": {"type": "string", "value": "Acme Corp"},
      "undeclaredValue": {"type": "string", "description": "no value given"},
      "rawThreshold": 0.5
    })");
}

} // anonymous namespace

TEST_CASE("Binding Parsing", "[binding]") {
    SECTION("References by namespace") {
        auto inputs_ref = std::get<Reference>(parse_binding("cacm.inputs.params.value.clientId"));
        REQUIRE(inputs_ref.ns == BindingNamespace::INPUTS);
        REQUIRE(inputs_ref.segments.size() == 3);
        REQUIRE(inputs_ref.segments[2] == "clientId");

        auto outputs_ref = std::get<Reference>(parse_binding("cacm.outputs.score"));
        REQUIRE(outputs_ref.ns == BindingNamespace::OUTPUTS);
        REQUIRE(outputs_ref.to_string() == "cacm.outputs.score");

        auto scratch_ref = std::get<Reference>(parse_binding("intermediate.ratios.current"));
        REQUIRE(scratch_ref.ns == BindingNamespace::INTERMEDIATE);
        REQUIRE(scratch_ref.segments.size() == 2);
    }

    SECTION("Literals") {
        REQUIRE(std::holds_alternative<Literal>(parse_binding("hello")));
        REQUIRE(std::holds_alternative<Literal>(parse_binding(42)));
        REQUIRE(std::holds_alternative<Literal>(parse_binding(Value{{"a", 1}})));
        REQUIRE(std::holds_alternative<Literal>(parse_binding("cacm.other.thing")));
        REQUIRE(std::get<Literal>(parse_binding(3.5)).value == 3.5);
    }

    SECTION("Malformed references") {
        REQUIRE_THROWS_AS(parse_binding("cacm.outputs."), BindingParseError);
        REQUIRE_THROWS_AS(parse_binding("intermediate.a..b"), BindingParseError);
        REQUIRE_THROWS_AS(parse_binding("cacm.inputs.trailing."), BindingParseError);
        REQUIRE_THROWS_AS(parse_reference("plain text"), BindingParseError);
    }
}

TEST_CASE("Binding Resolution of Inputs", "[binding]") {
    BindingResolver resolver(sample_inputs());

    SECTION("Single segment resolves to the declared value") {
        auto result = resolver.resolve("cacm.inputs.companyName");
        REQUIRE(result.resolved);
        REQUIRE_FALSE(result.is_literal);
        REQUIRE(result.value == "Acme Corp");
    }

    SECTION("Nested path through the declaration") {
        auto result = resolver.resolve("cacm.inputs.params.value.clientId");
        REQUIRE(result.resolved);
        REQUIRE(result.value == "ACME");
    }

    SECTION("Nested path directly into the value") {
        auto result = resolver.resolve("cacm.inputs.params.clientId");
        REQUIRE(result.resolved);
        REQUIRE(result.value == "ACME");
    }

    SECTION("Array index") {
        auto result = resolver.resolve("cacm.inputs.params.value.limits.1");
        REQUIRE(result.resolved);
        REQUIRE(result.value == 20);

        REQUIRE_FALSE(resolver.resolve("cacm.inputs.params.value.limits.7").resolved);
    }

    SECTION("Non-object declaration is its own value") {
        auto result = resolver.resolve("cacm.inputs.rawThreshold");
        REQUIRE(result.resolved);
        REQUIRE(result.value == 0.5);
    }

    SECTION("Declaration without value is unresolved") {
        auto result = resolver.resolve("cacm.inputs.undeclaredValue");
        REQUIRE_FALSE(result.resolved);
        REQUIRE(result.error_message.find("declares no value") != std::string::npos);
    }

    SECTION("Unknown input") {
        auto result = resolver.resolve("cacm.inputs.nope");
        REQUIRE_FALSE(result.resolved);
        REQUIRE(result.value.is_null());
        REQUIRE(result.error_message.find("cacm.inputs.nope") != std::string::npos);
    }

    SECTION("Repeated resolution is stable") {
        auto first = resolver.resolve("cacm.inputs.params.value");
        auto second = resolver.resolve("cacm.inputs.params.value");
        REQUIRE(first.value == second.value);
    }
}

TEST_CASE("Binding Resolution of Literals", "[binding]") {
    BindingResolver resolver;

    auto text = resolver.resolve("Analyze the client");
    REQUIRE(text.resolved);
    REQUIRE(text.is_literal);
    REQUIRE(text.value == "Analyze the client");

    auto number = resolver.resolve(7);
    REQUIRE(number.resolved);
    REQUIRE(number.value == 7);

    auto malformed = resolver.resolve("cacm.outputs.");
    REQUIRE_FALSE(malformed.resolved);
    REQUIRE(malformed.error_message.find("Malformed binding") != std::string::npos);
}

TEST_CASE("Binding Writes and Visibility", "[binding]") {
    BindingResolver resolver(sample_inputs());

    SECTION("Intermediate value is invisible before it is written") {
        REQUIRE_FALSE(resolver.resolve("intermediate.ratio").resolved);
        resolver.write("intermediate.ratio", 1.25);
        REQUIRE(resolver.resolve("intermediate.ratio").value == 1.25);
    }

    SECTION("Nested targets create intermediate objects") {
        resolver.write("cacm.outputs.report.summary.text", "Stable outlook");
        REQUIRE(resolver.outputs()["report"]["summary"]["text"] == "Stable outlook");
        REQUIRE(resolver.contains("cacm.outputs.report.summary"));
    }

    SECTION("Whole result objects can be addressed by sub-path") {
        resolver.write("intermediate.financials", Value{{"ratios", {{"current", 1.8}}}});
        auto result = resolver.resolve("intermediate.financials.ratios.current");
        REQUIRE(result.resolved);
        REQUIRE(result.value == 1.8);
    }

    SECTION("Array elements can be replaced by index") {
        resolver.write("intermediate.list", Value::array({1, 2, 3}));
        resolver.write("intermediate.list.1", "two");
        REQUIRE(resolver.intermediate()["list"][1] == "two");
    }

    SECTION("Inputs are read-only") {
        REQUIRE_THROWS_AS(resolver.write("cacm.inputs.companyName", "x"), BindingWriteError);
    }

    SECTION("Writing through a scalar fails") {
        resolver.write("cacm.outputs.score", 700);
        REQUIRE_THROWS_AS(resolver.write("cacm.outputs.score.band", "A"), BindingWriteError);
        REQUIRE(resolver.outputs()["score"] == 700);
    }

    SECTION("Malformed target") {
        REQUIRE_THROWS_AS(resolver.write("outputs.score", 1), BindingParseError);
    }

    SECTION("Missing outputs stay unresolved") {
        auto result = resolver.resolve("cacm.outputs.missingKey");
        REQUIRE_FALSE(result.resolved);
        REQUIRE_FALSE(resolver.contains("cacm.outputs.missingKey"));
    }
}

TEST_CASE("Missing Markers", "[binding]") {
    Value marker = make_missing_marker("cacm.outputs.x", "not bound");
    REQUIRE(is_missing_marker(marker));
    REQUIRE(marker["$missing"] == "cacm.outputs.x");
    REQUIRE(marker["reason"] == "not bound");

    REQUIRE_FALSE(is_missing_marker(Value{{"value", 1}}));
    REQUIRE_FALSE(is_missing_marker("cacm.outputs.x"));
}
