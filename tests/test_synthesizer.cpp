/*
test_synthesizer.cpp

MIT License

Copyright (c) 2025 René Nicolaus

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include "loconf.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

using loconf::Array;
using loconf::Object;
using loconf::Value;

namespace
{
  std::string DumpsText(const Value& value, const loconf::DumpOptions& options = {})
  {
    std::string text;
    loconf::Error error;
    EXPECT_EQ(loconf::Dumps(value, text, options, &error), loconf::ErrorCode::OK) << error.message;
    return text;
  }
}

TEST(Synthesizer, TopLevelMap)
{
  EXPECT_EQ(DumpsText(Object{{"a", 1}}), "a: 1\n");
  EXPECT_EQ(DumpsText(Object{{"a", 1}, {"b c", "x"}}), "a: 1\n\"b c\": \"x\"\n");
  EXPECT_EQ(DumpsText(Object{{"a", Array{}}}), "a: []\n");
  EXPECT_EQ(DumpsText(Object{}), "{}");
}

TEST(Synthesizer, MultilineRule)
{
  EXPECT_EQ(DumpsText(Object{{"x", Array{1, 2, 3}}}), "x: [\n    1,\n    2,\n    3,\n]\n");
  EXPECT_EQ(DumpsText(Array{1, 2}), "[\n    1,\n    2,\n]");
  EXPECT_EQ(DumpsText(Array{1}), "[1]");
  EXPECT_EQ(
    DumpsText(Object{{"outer", Object{{"list", Array{true, nullptr}}, {"n", 1.5}}}}),
    "outer: {\n    list: [\n        true,\n        null,\n    ],\n    n: 1.5,\n}\n");
}

TEST(Synthesizer, Options)
{
  loconf::DumpOptions flat;
  flat.indented = false;
  EXPECT_EQ(DumpsText(Object{{"a", 1}}, flat), "{a: 1}");
  EXPECT_EQ(DumpsText(Object{{"a", Array{1, 2}}, {"b", Object{{"c", 3}}}}, flat), "{a: [1, 2], b: {c: 3}}");

  loconf::DumpOptions quoted;
  quoted.bareKeys = false;
  EXPECT_EQ(DumpsText(Object{{"a", 1}}, quoted), "\"a\": 1\n");

  loconf::DumpOptions expanded;
  expanded.inlineSmallContainers = false;
  EXPECT_EQ(DumpsText(Object{{"a", Array{1}}}, expanded), "a: [\n    1,\n]\n");
  EXPECT_EQ(DumpsText(Object{{"a", Array{}}}, expanded), "a: []\n");

  loconf::DumpOptions braced;
  braced.topLevelMap = false;
  EXPECT_EQ(DumpsText(Object{{"a", 1}, {"b", 2}}, braced), "{\n    a: 1,\n    b: 2,\n}");
}

TEST(Synthesizer, Primitives)
{
  loconf::DumpOptions flat;
  flat.indented = false;
  EXPECT_EQ(DumpsText(Array{"tab\there", -12, 3.0, false, nullptr}, flat), "[\"tab\\there\", -12, 3.0, false, null]");
  // Keywords and non-identifiers stay quoted even as keys
  EXPECT_EQ(DumpsText(Object{{"true", 1}, {7, 2}}, flat), "{\"true\": 1, 7: 2}");
}

TEST(Synthesizer, RejectsUnrepresentableValues)
{
  std::string text;
  loconf::Error error;
  EXPECT_EQ(
    loconf::Dumps(Object{{Array{1}, 2}}, text, {}, &error),
    loconf::ErrorCode::InvalidKeyType);
  EXPECT_EQ(
    loconf::Dumps(Array{std::numeric_limits<double>::quiet_NaN()}, text, {}, &error),
    loconf::ErrorCode::InvalidValue);
  EXPECT_EQ(
    loconf::Dumps(Object{{"inf", std::numeric_limits<double>::infinity()}}, text, {}, &error),
    loconf::ErrorCode::InvalidValue);
  EXPECT_THROW(loconf::DumpsOrThrow(Object{{Object{}, 1}}), loconf::Exception);

  EXPECT_EQ(loconf::Dumps(Object{{"a", 1}, {"a", 2}}, text, {}, &error), loconf::ErrorCode::DuplicateKey);
  EXPECT_EQ(
    loconf::Dumps(Array{Object{{1, "x"}, {"b", 2}, {1.0, "y"}}}, text, {}, &error),
    loconf::ErrorCode::DuplicateKey);

  loconf::DocumentProxy document = loconf::LoadsRoundtrip("a: 1\n");
  try
  {
    document["a"] = Object{{"a", 1}, {"a", 2}};
    FAIL() << "expected a duplicate key error";
  }
  catch (const loconf::Exception& e)
  {
    EXPECT_EQ(e.error.code, loconf::ErrorCode::DuplicateKey);
  }
  EXPECT_EQ(document.ToString(), "a: 1\n");
}

TEST(Synthesizer, IntegersMustFitInSigned64Bits)
{
  EXPECT_EQ(Value(std::uint64_t(9223372036854775807ull)).asInt(), std::numeric_limits<std::int64_t>::max());
  EXPECT_EQ(Value(std::uint32_t(4000000000u)).asInt(), 4000000000);
  try
  {
    Value value(std::uint64_t(1) << 63);
    FAIL() << "expected an out of range integer to be rejected";
  }
  catch (const loconf::Exception& e)
  {
    EXPECT_EQ(e.error.code, loconf::ErrorCode::InvalidValue);
  }
}

TEST(Synthesizer, ProjectionRecoversValue)
{
  const Value values[] = {
    Value(Object{{"name", "loconf"}, {"tags", Array{"a", "b c"}}, {"nested", Object{{"n", nullptr}, {"f", 0.25}}}}),
    Value(Array{Array{}, Object{}, Array{1, Array{2, 3}}}),
    Value("plain"),
    Value(-1),
  };
  for (const Value& value : values)
  {
    for (int indent : {-1, 0, 2})
    {
      loconf::Settings settings;
      settings.indent = indent;
      loconf::Tokens tokens;
      ASSERT_EQ(loconf::Synthesize(value, settings, false, true, tokens), loconf::ErrorCode::OK);
      tokens.push_back(loconf::Token{loconf::TokenKind::Eof, {}});

      loconf::Document document;
      ASSERT_EQ(loconf::ParseFromTokens(tokens, document), loconf::ErrorCode::OK);
      EXPECT_TRUE(loconf::ToValue(*document.val) == value);
    }
  }
}

TEST(Synthesizer, SettingsIndented)
{
  loconf::Settings settings;
  settings.bareKeys = false;
  settings.indent = 1;
  loconf::Settings child = settings.Indented();
  EXPECT_EQ(child.indent, 2);
  EXPECT_FALSE(child.bareKeys);
  EXPECT_EQ(settings.indent, 1);

  loconf::Settings inlineSettings;
  loconf::Tokens tokens;
  ASSERT_EQ(loconf::Synthesize(Array{1, 2}, inlineSettings, false, false, tokens), loconf::ErrorCode::OK);
  EXPECT_EQ(tokens.size(), 6u);
}
