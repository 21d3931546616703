/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>

using namespace DelveEngine;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  JsonValue flag(true);
  BOOST_CHECK(flag.isBool());
  BOOST_CHECK_EQUAL(flag.toString(), "true");

  JsonValue health(42);
  JsonValue chance(0.33);
  BOOST_CHECK(health.isNumber());
  BOOST_CHECK_EQUAL(health.asInt(), 42);
  BOOST_CHECK_EQUAL(health.toString(), "42");
  BOOST_CHECK_CLOSE(chance.asNumber(), 0.33, 0.001);

  JsonValue name("goblin");
  BOOST_CHECK(name.isString());
  BOOST_CHECK_EQUAL(name.toString(), "\"goblin\"");
}

BOOST_AUTO_TEST_CASE(TestMissingKeysReadAsNull) {
  JsonObject obj;
  obj["id"] = JsonValue("slime");
  JsonValue mob(obj);

  BOOST_CHECK(mob.hasKey("id"));
  BOOST_CHECK(mob["loot"].isNull());
  BOOST_CHECK(mob["loot"]["item"].isNull());
  BOOST_CHECK(mob["id"][3].isNull());
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue text("rock");
  JsonValue count(4);

  BOOST_CHECK_EQUAL(text.tryAsString().value(), "rock");
  BOOST_CHECK_EQUAL(count.tryAsInt().value(), 4);
  BOOST_CHECK(!text.tryAsInt().has_value());
  BOOST_CHECK(!count.tryAsString().has_value());
  BOOST_CHECK(text.tryAsArray() == nullptr);
  BOOST_CHECK(count.tryAsObject() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestFallbackLookups) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({ "seed": 1337, "scale": 1.25, "final": true, "floor": "mine" })"));
  const JsonValue& root = reader.getRoot();

  BOOST_CHECK_EQUAL(root.getInt("seed", 0), 1337);
  BOOST_CHECK_EQUAL(root.getInt("missing", -1), -1);
  BOOST_CHECK_EQUAL(root.getInt("floor", 9), 9);      // wrong type
  BOOST_CHECK_CLOSE(root.getNumber("scale", 0.0), 1.25, 0.001);
  BOOST_CHECK_EQUAL(root.getBool("final", false), true);
  BOOST_CHECK_EQUAL(root.getBool("seed", false), false);
  BOOST_CHECK_EQUAL(root.getString("floor", ""), "mine");
  BOOST_CHECK_EQUAL(root.getString("name", "entrance"), "entrance");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("-17"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -17);

  BOOST_CHECK(reader.parse("2.5e1"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 25.0, 0.001);

  BOOST_CHECK(reader.parse("\"dwarf_king\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "dwarf_king");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"line\\nbreak\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "line\nbreak");

  BOOST_CHECK(reader.parse("\"say \\\"hi\\\"\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "say \"hi\"");

  BOOST_CHECK(reader.parse("\"\\u0041\\u00e9\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A\xC3\xA9");

  // Surrogate pair for U+1F600
  BOOST_CHECK(reader.parse("\"\\ud83d\\ude00\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x98\x80");
}

BOOST_AUTO_TEST_CASE(TestNestedFloorDefinition) {
  JsonReader reader;

  const std::string floorJson = R"({
        "name": "entrance",
        "difficulty": 1.0,
        "spawns": [
            { "kind": "chest", "count": [1, 2] },
            { "kind": "weighted_mobs", "count": [2, 3],
              "mobs": [ { "mob": "slime", "weight": 3 } ] }
        ],
        "map": ["#####", "#S..#", "#####"]
    })";

  BOOST_REQUIRE(reader.parse(floorJson));
  const auto &root = reader.getRoot();

  BOOST_CHECK_EQUAL(root["name"].asString(), "entrance");
  const auto &spawns = root["spawns"];
  BOOST_REQUIRE(spawns.isArray());
  BOOST_CHECK_EQUAL(spawns.size(), 2u);
  BOOST_CHECK_EQUAL(spawns[0]["count"][1].asInt(), 2);
  BOOST_CHECK_EQUAL(spawns[1]["mobs"][0]["mob"].asString(), "slime");
  BOOST_CHECK_EQUAL(root["map"][1].asString(), "#S..#");
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;
  BOOST_CHECK(reader.parse("  \t\n  [ 1 ,\r\n 2 ]  \n"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestToStringReparses) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"b":[1,2.5,"x\ty"],"a":{"n":null,"t":true}})"));
  const std::string compact = reader.getRoot().toString();
  BOOST_CHECK_EQUAL(compact, R"({"a":{"n":null,"t":true},"b":[1,2.5,"x\ty"]})");

  JsonReader again;
  BOOST_REQUIRE(again.parse(reader.getRoot().toString(true)));
  BOOST_CHECK_EQUAL(again.getRoot().toString(), compact);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  const char *invalid[] = {
      "goblin",                 // bare word
      "{\"key\": 1,}",          // trailing comma in object
      "[1, 2,]",                // trailing comma in array
      "{\"key\": 1",            // missing closing brace
      "[1, 2",                  // missing closing bracket
      "123.",                   // no fraction digits
      "\"open",                 // unterminated string
      "\"bad\\x\"",             // invalid escape
      "1 2",                    // multiple root values
      "{\"key\" 1}",            // missing colon
      "{7: 1}",                 // non-string key
      "[1 2]",                  // missing comma
      "truee",
      "nul",
      "\"\\ud83d\"",            // unpaired surrogate
  };

  for (const char *text : invalid) {
    BOOST_TEST_CONTEXT("input " << text) {
      BOOST_CHECK(!reader.parse(text));
      BOOST_CHECK(!reader.getLastError().empty());
      BOOST_CHECK(reader.getRoot().isNull());
    }
  }
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"a\": 1,\n  \"b\": @\n}"));
  BOOST_CHECK(reader.getLastError().find("Line 3") != std::string::npos);

  // A later success clears the previous error
  BOOST_CHECK(reader.parse("{}"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  const std::string deep = std::string(500, '[') + std::string(500, ']');
  BOOST_CHECK(!reader.parse(deep));

  const std::string shallow = std::string(20, '[') + std::string(20, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestSaveAndLoad) {
  const std::string filename = "json_reader_test_temp.json";

  JsonObject player;
  player["name"] = JsonValue("Tester");
  player["max_health"] = JsonValue(100);
  JsonObject root;
  root["player"] = JsonValue(player);
  root["magic_find"] = JsonValue(25.5);

  BOOST_REQUIRE(JsonReader::saveToFile(filename, JsonValue(root)));

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(filename));
  BOOST_CHECK_EQUAL(reader.getRoot()["player"]["name"].asString(), "Tester");
  BOOST_CHECK_EQUAL(reader.getRoot()["player"]["max_health"].asInt(), 100);
  BOOST_CHECK_CLOSE(reader.getRoot()["magic_find"].asNumber(), 25.5, 0.001);

  std::remove(filename.c_str());
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("non_existent_file.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestUnparsableFile) {
  const std::string filename = "json_reader_bad_temp.json";
  {
    std::ofstream file(filename);
    file << "{ \"floors\": [ }";
  }

  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile(filename));
  BOOST_CHECK(!reader.getLastError().empty());

  std::remove(filename.c_str());
}

BOOST_AUTO_TEST_SUITE_END()
