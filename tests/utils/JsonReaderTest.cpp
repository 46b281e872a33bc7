/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace Strata;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK(!nullVal.isObject());

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);

  JsonValue numberVal(3.14);
  BOOST_CHECK(numberVal.isNumber());
  BOOST_CHECK_CLOSE(numberVal.asNumber(), 3.14, 0.001);
  BOOST_CHECK_EQUAL(JsonValue(42.0).asInt(), 42);

  JsonValue stringVal(std::string("hello"));
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "hello");
  BOOST_CHECK(!stringVal.isNumber());
}

BOOST_AUTO_TEST_CASE(TestKeyLookup) {
  JsonValue numberVal(8.0);
  BOOST_CHECK(numberVal.find("decay") == nullptr);
  BOOST_CHECK(numberVal["decay"].isNull());

  JsonObject obj;
  obj["decay"] = JsonValue(true);
  JsonValue objectVal(obj);
  const JsonValue* decay = objectVal.find("decay");
  BOOST_REQUIRE(decay != nullptr);
  BOOST_CHECK(decay->asBool());
  BOOST_CHECK(objectVal.find("restore") == nullptr);
  BOOST_CHECK(objectVal["restore"].isNull());
  BOOST_CHECK_EQUAL(objectVal.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestArrayIndexing) {
  JsonArray arr;
  arr.push_back(JsonValue(1.0));
  arr.push_back(JsonValue(std::string("granite")));

  JsonValue arrayVal(arr);
  BOOST_CHECK(arrayVal.isArray());
  BOOST_CHECK_EQUAL(arrayVal.size(), 2u);
  BOOST_CHECK_EQUAL(arrayVal[size_t{1}].asString(), "granite");
  BOOST_CHECK(arrayVal[size_t{5}].isNull());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderTests)

BOOST_AUTO_TEST_CASE(TestParseSettingsDocument) {
  const std::string json = R"({
    "storage": { "root": "/tmp/strata", "persistent_id": "colony_7" },
    "decay": { "enabled": true, "rainfall_reference": 4000, "failure_mtb_days": 300.5 },
    "eligibility": { "excluded_defs": ["void_monolith", "beacon"] }
  })";

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(json));
  BOOST_CHECK(reader.getLastError().empty());

  const JsonValue& root = reader.getRoot();
  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root["storage"]["persistent_id"].asString(), "colony_7");
  BOOST_CHECK_EQUAL(root["decay"]["enabled"].asBool(), true);
  BOOST_CHECK_EQUAL(root["decay"]["rainfall_reference"].asInt(), 4000);
  BOOST_CHECK_CLOSE(root["decay"]["failure_mtb_days"].asNumber(), 300.5, 0.001);
  BOOST_CHECK_EQUAL(root["eligibility"]["excluded_defs"].size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestEscapesAndUnicode) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"text": "line\nnext \"quoted\" \u00e9"})"));
  const std::string& text = reader.getRoot()["text"].asString();
  BOOST_CHECK_EQUAL(text, "line\nnext \"quoted\" \xC3\xA9");
}

BOOST_AUTO_TEST_CASE(TestNumbers) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("[-12, 0.5, 2.5e2, 1E-2]"));
  const JsonValue& root = reader.getRoot();
  BOOST_CHECK_EQUAL(root[size_t{0}].asInt(), -12);
  BOOST_CHECK_CLOSE(root[size_t{1}].asNumber(), 0.5, 0.001);
  BOOST_CHECK_CLOSE(root[size_t{2}].asNumber(), 250.0, 0.001);
  BOOST_CHECK_CLOSE(root[size_t{3}].asNumber(), 0.01, 0.001);
}

BOOST_AUTO_TEST_CASE(TestErrorsCarryPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\"a\":\n  tru }"));
  BOOST_CHECK(reader.getLastError().find("line 2") != std::string::npos);

  BOOST_CHECK(!reader.parse("{\"a\": \"open"));
  BOOST_CHECK(reader.getLastError().find("Unterminated string") != std::string::npos);

  BOOST_CHECK(!reader.parse("{} extra"));
  BOOST_CHECK(reader.getLastError().find("Unexpected trailing characters") != std::string::npos);

  BOOST_CHECK(!reader.parse("[1,]"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  const std::string deep = std::string(200, '[') + std::string(200, ']');
  JsonReader reader;
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(reader.getLastError().find("Maximum nesting depth exceeded") != std::string::npos);

  const std::string shallow = std::string(20, '[') + std::string(20, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_CASE(TestParseResetsPreviousState) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(reader.parse("{\"ok\": false}"));
  BOOST_CHECK(reader.getLastError().empty());
  BOOST_CHECK_EQUAL(reader.getRoot()["ok"].asBool(), false);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  const auto path = std::filesystem::temp_directory_path() / "strata_json_reader_test.json";
  {
    std::ofstream file(path);
    file << "{\"restore\": {\"search_radius\": 12}}";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path.string()));
  BOOST_CHECK_EQUAL(reader.getRoot()["restore"]["search_radius"].asInt(), 12);

  std::error_code ec;
  std::filesystem::remove(path, ec);

  BOOST_CHECK(!reader.loadFromFile(path.string()));
  BOOST_CHECK(reader.getLastError().find("Failed to open file") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
