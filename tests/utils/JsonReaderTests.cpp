/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTests
#include <boost/test/unit_test.hpp>

#include "utils/JsonReader.hpp"

using namespace Formicary;

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("true"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), true);

  BOOST_CHECK(reader.parse("-123"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -123);

  BOOST_CHECK(reader.parse("1.5e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 150.0, 0.001);

  BOOST_CHECK(reader.parse("\"tunnel\\nrow\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "tunnel\nrow");
}

BOOST_AUTO_TEST_CASE(TestConfigDocument) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({
    "world": { "width": 120, "height": 60 },
    "pheromone": { "decay_food": 0.05, "enabled": true },
    "tags": ["a", "b"]
  })"));

  const JsonValue& root = reader.getRoot();
  BOOST_REQUIRE(root.isObject());
  BOOST_CHECK_EQUAL(root["world"]["width"].asInt(), 120);
  BOOST_CHECK_CLOSE(root["pheromone"]["decay_food"].asNumber(), 0.05, 0.001);
  BOOST_CHECK(root["pheromone"]["enabled"].asBool());
  BOOST_CHECK_EQUAL(root["tags"].size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"count": 3, "name": "nest"})"));
  const JsonValue& root = reader.getRoot();

  BOOST_CHECK(!root.hasKey("missing"));
  BOOST_CHECK(root["missing"].isNull());
  BOOST_CHECK(!root["name"].tryAsInt().has_value());
  BOOST_CHECK_EQUAL(root["count"].tryAsInt().value_or(-1), 3);
  BOOST_CHECK(root["count"].tryAsObject() == nullptr);
  BOOST_CHECK(root.tryAsObject() != nullptr);
}

BOOST_AUTO_TEST_CASE(TestInvalidDocumentsReportPosition) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\"width\": }"));
  BOOST_CHECK(!reader.getLastError().empty());
  BOOST_CHECK(reader.getLastError().find("Line 1") != std::string::npos);

  BOOST_CHECK(!reader.parse("{\"a\": 1,}"));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse("{\"a\": 1} trailing"));
  BOOST_CHECK(!reader.parse(""));
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("does/not/exist.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
