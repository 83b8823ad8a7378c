/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTests
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace CloudDefenders;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestScalarTypes) {
  JsonValue nothing;
  BOOST_CHECK(nothing.isNull());
  BOOST_CHECK_EQUAL(nothing.getType(), JsonType::Null);

  JsonValue vsync(true);
  BOOST_CHECK(vsync.isBool());
  BOOST_CHECK_EQUAL(vsync.asBool(), true);

  JsonValue lives(3);
  JsonValue tick(0.0166);
  BOOST_CHECK(lives.isNumber());
  BOOST_CHECK_EQUAL(lives.asInt(), 3);
  BOOST_CHECK_CLOSE(tick.asNumber(), 0.0166, 0.001);

  JsonValue name("cost-spike");
  BOOST_CHECK(name.isString());
  BOOST_CHECK_EQUAL(name.asString(), "cost-spike");
}

BOOST_AUTO_TEST_CASE(TestTryAccessors) {
  JsonValue type("firewall");
  JsonValue range(80);

  BOOST_CHECK(type.tryAsString().has_value());
  BOOST_CHECK_EQUAL(range.tryAsInt().value(), 80);
  BOOST_CHECK(!type.tryAsInt().has_value());
  BOOST_CHECK(!range.tryAsString().has_value());
  BOOST_CHECK(!range.tryAsBool().has_value());
  BOOST_CHECK(range.tryAsObject() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestMissingLookupsReadAsNull) {
  JsonObject playfield;
  playfield["width"] = JsonValue(800);
  const JsonValue root(playfield);

  BOOST_CHECK(root.hasKey("width"));
  BOOST_CHECK(!root.hasKey("height"));
  BOOST_CHECK(root["height"].isNull());
  BOOST_CHECK(root["width"]["nested"].isNull());
  BOOST_CHECK(root[size_t{0}].isNull());
}

BOOST_AUTO_TEST_CASE(TestMutableIndexCreatesObject) {
  JsonValue root;
  root["waves"]["max_waves"] = JsonValue(15);

  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 1u);
  BOOST_CHECK_EQUAL(root["waves"]["max_waves"].asInt(), 15);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonWriterTests)

BOOST_AUTO_TEST_CASE(TestCompactOutputSortsKeys) {
  JsonObject stats;
  stats["speed"] = JsonValue(120);
  stats["damage"] = JsonValue(35);
  stats["boss"] = JsonValue(false);
  stats["name"] = JsonValue("Cost Spike");

  BOOST_CHECK_EQUAL(JsonValue(stats).toString(),
                    "{\"boss\":false,\"damage\":35,\"name\":\"Cost Spike\",\"speed\":120}");
}

BOOST_AUTO_TEST_CASE(TestNumbersAndEscapes) {
  BOOST_CHECK_EQUAL(JsonValue(2.5).toString(), "2.5");
  BOOST_CHECK_EQUAL(JsonValue(-40).toString(), "-40");
  BOOST_CHECK_EQUAL(JsonValue("line\n\"quoted\"").toString(), "\"line\\n\\\"quoted\\\"\"");
}

BOOST_AUTO_TEST_CASE(TestIndentedOutput) {
  JsonArray types;
  types.push_back(JsonValue("cost-spike"));
  types.push_back(JsonValue("data-breach"));
  JsonObject wave;
  wave["types"] = JsonValue(types);

  BOOST_CHECK_EQUAL(JsonValue(wave).toString(2),
                    "{\n  \"types\": [\n    \"cost-spike\",\n    \"data-breach\"\n  ]\n}");
  BOOST_CHECK_EQUAL(JsonValue(JsonObject{}).toString(2), "{}");
}

BOOST_AUTO_TEST_CASE(TestWrittenTextParsesBack) {
  JsonValue root;
  root["simulation"]["tick_rate"] = JsonValue(0.02);
  root["graphics"]["fullscreen"] = JsonValue(true);

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(root.toString(2)));
  BOOST_CHECK_CLOSE(reader.getRoot()["simulation"]["tick_rate"].asNumber(), 0.02, 0.001);
  BOOST_CHECK_EQUAL(reader.getRoot()["graphics"]["fullscreen"].asBool(), true);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestScalars) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("-30"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -30);

  BOOST_CHECK(reader.parse("0.08"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 0.08, 0.001);

  BOOST_CHECK(reader.parse("1.2E1"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 12.0, 0.001);

  BOOST_CHECK(reader.parse("  \t\n  42  \r\n  "));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"Press SPACE\\tto start\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "Press SPACE\tto start");

  BOOST_CHECK(reader.parse("\"a\\/b\\\\c\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "a/b\\c");

  BOOST_CHECK(reader.parse("\"\\u0053\\u0033\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "S3");

  // Two and three byte UTF-8
  BOOST_CHECK(reader.parse("\"\\u00e9\\u20ac\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xC3\xA9\xE2\x82\xAC");

  // Surrogate pair
  BOOST_CHECK(reader.parse("\"\\ud83d\\ude80\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x9A\x80");
}

BOOST_AUTO_TEST_CASE(TestSettingsDocument) {
  JsonReader reader;

  const std::string settingsJson = R"({
    "playfield": { "width": 800, "height": 600 },
    "waves": {
      "max_waves": 15,
      "time_between_waves": 3.0,
      "unlocks": [3, 6, 10]
    },
    "graphics": { "fullscreen": false },
    "game": { "max_lives": 3, "title": "Cloud Defenders" }
  })";

  BOOST_REQUIRE(reader.parse(settingsJson));
  const auto &root = reader.getRoot();

  BOOST_CHECK_EQUAL(root.size(), 4u);
  BOOST_CHECK_EQUAL(root["playfield"]["width"].asInt(), 800);
  BOOST_CHECK_CLOSE(root["waves"]["time_between_waves"].asNumber(), 3.0, 0.001);
  BOOST_CHECK_EQUAL(root["graphics"]["fullscreen"].asBool(), false);
  BOOST_CHECK_EQUAL(root["game"]["title"].asString(), "Cloud Defenders");

  const auto &unlocks = root["waves"]["unlocks"];
  BOOST_REQUIRE(unlocks.isArray());
  BOOST_CHECK_EQUAL(unlocks.size(), 3u);
  BOOST_CHECK_EQUAL(unlocks[2].asInt(), 10);
}

BOOST_AUTO_TEST_CASE(TestDuplicateKeyLastWins) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{\"max_lives\": 3, \"max_lives\": 5}"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 1u);
  BOOST_CHECK_EQUAL(reader.getRoot()["max_lives"].asInt(), 5);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestSyntaxErrors) {
  JsonReader reader;

  const char *invalid[] = {
      "cloud",                    // bare word
      "{\"width\": 800,}",        // trailing comma in object
      "[3, 6, 10,]",              // trailing comma in array
      "{\"width\": 800",          // unclosed object
      "[1, 2",                    // unclosed array
      "{\"width\" 800}",          // missing colon
      "{width: 800}",             // unquoted key
      "[1 2]",                    // missing comma
      "15.",                      // no fraction digits
      "1e",                       // no exponent digits
      "007",                      // leading zeros
      "\"open",                   // unterminated string
      "\"bad\\q\"",               // invalid escape
      "\"\\u12G4\"",              // invalid unicode escape
      "\"\\ude80\"",              // lone low surrogate
      "truthy",                   // bad literal
      "1 2",                      // trailing content
      ""                          // empty input
  };

  for (const char *text : invalid) {
    BOOST_TEST_CONTEXT("input: " << text) {
      BOOST_CHECK(!reader.parse(text));
      BOOST_CHECK(!reader.getLastError().empty());
    }
  }
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\n  \"width\": @\n}"));
  BOOST_CHECK(reader.getLastError().find("line 2") != std::string::npos);
  BOOST_CHECK(reader.getLastError().find("column 12") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestFailedParseClearsRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{\"max_waves\": 15}"));

  BOOST_CHECK(!reader.parse("{\"max_waves\": }"));
  BOOST_CHECK(reader.getRoot().isNull());

  reader.clearError();
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;

  const std::string tooDeep(JsonReader::MAX_DEPTH + 2, '[');
  BOOST_CHECK(!reader.parse(tooDeep));
  BOOST_CHECK(reader.getLastError().find("depth") != std::string::npos);

  const std::string deepEnough = std::string(JsonReader::MAX_DEPTH, '[') +
                                 std::string(JsonReader::MAX_DEPTH, ']');
  BOOST_CHECK(reader.parse(deepEnough));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  const std::string filename = "json_reader_test_settings.json";
  {
    std::ofstream file(filename);
    file << R"({ "collision": { "cell_size": 64 }, "simulation": { "random_seed": 42 } })";
  }

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(filename));
  BOOST_CHECK_EQUAL(reader.getRoot()["collision"]["cell_size"].asInt(), 64);
  BOOST_CHECK_EQUAL(reader.getRoot()["simulation"]["random_seed"].asInt(), 42);

  std::remove(filename.c_str());
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("non_existent_file.json"));
  BOOST_CHECK(reader.getLastError().find("Cannot open file") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
