/*
test_proxy.cpp

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

#include <sstream>
#include <string>

using loconf::Array;
using loconf::Object;
using loconf::Value;

TEST(DocumentProxy, ReadsByPath)
{
  loconf::DocumentProxy document = loconf::LoadsRoundtrip("a: {b: [1, 'two']}\n");
  EXPECT_EQ(document["a"]["b"][0].ToValue().asInt(), 1);
  EXPECT_EQ(document["a"]["b"][-1].ToValue().asString(), "two");
  EXPECT_TRUE(document.ToValue() == Value(Object{{"a", Object{{"b", Array{1, "two"}}}}}));

  loconf::DocumentProxy view = document["a"]["b"];
  ASSERT_EQ(view.GetPath().size(), 2u);
  EXPECT_TRUE(view.GetPath()[1] == Value("b"));
}

TEST(DocumentProxy, AssignsThroughViews)
{
  loconf::DocumentProxy document = loconf::LoadsRoundtrip("a: {b: 1, c: 2}\n");
  document["a"]["b"] = 9;
  EXPECT_EQ(loconf::DumpsRoundtrip(document), "a: {b: 9, c: 2}\n");

  loconf::DocumentProxy view = document["a"];
  view["c"] = Array{1, 2};
  EXPECT_EQ(document.ToString(), "a: {b: 9, c: [1, 2]}\n");
  EXPECT_EQ(view.ToString(), document.ToString());
  EXPECT_EQ(view["b"].ToValue().asInt(), 9);
}

TEST(DocumentProxy, AssignsTheRoot)
{
  loconf::DocumentProxy document = loconf::LoadsRoundtrip("a: 1\n");
  document = Value(Object{{"b", 2}});
  EXPECT_EQ(loconf::DumpsRoundtrip(document), "{b: 2}");
}

TEST(DocumentProxy, ReplacesKeys)
{
  loconf::DocumentProxy document = loconf::LoadsRoundtrip("a: 1\nb: 2\nl: [1]\n");
  document["a"].ReplaceKey("c");
  EXPECT_EQ(loconf::DumpsRoundtrip(document), "c: 1\nb: 2\nl: [1]\n");

  try
  {
    document["c"].ReplaceKey("b");
    FAIL() << "expected a duplicate key error";
  }
  catch (const loconf::Exception& e)
  {
    EXPECT_EQ(e.error.code, loconf::ErrorCode::DuplicateKey);
    EXPECT_STRNE(e.what(), "");
  }

  auto codeOf = [&](auto&& edit) {
    try
    {
      edit();
    }
    catch (const loconf::Exception& e)
    {
      return e.error.code;
    }
    return loconf::ErrorCode::OK;
  };
  EXPECT_EQ(codeOf([&] { document["l"][0].ReplaceKey("k"); }), loconf::ErrorCode::NotAMap);
  EXPECT_EQ(codeOf([&] { document["c"].ReplaceKey(Array{1}); }), loconf::ErrorCode::InvalidKeyType);
  EXPECT_EQ(codeOf([&] { document.ReplaceKey("k"); }), loconf::ErrorCode::NotAMap);
  EXPECT_EQ(codeOf([&] { document["missing"] = 1; }), loconf::ErrorCode::KeyNotFound);
  EXPECT_EQ(codeOf([&] { document["c"]["x"] = 1; }), loconf::ErrorCode::NotIndexable);
  EXPECT_EQ(codeOf([&] { document["missing"].ToValue(); }), loconf::ErrorCode::KeyNotFound);

  // Failed edits leave the document as it was
  EXPECT_EQ(loconf::DumpsRoundtrip(document), "c: 1\nb: 2\nl: [1]\n");
}

TEST(DocumentProxy, Erases)
{
  loconf::DocumentProxy document = loconf::LoadsRoundtrip("a: 1\nb: [1, 2, 3]\n");
  document.Erase("a");
  EXPECT_EQ(document.ToString(), "b: [1, 2, 3]\n");
  document["b"][1].Erase();
  EXPECT_EQ(document.ToString(), "b: [1, 3]\n");
  document["b"].Erase(-1);
  EXPECT_EQ(document.ToString(), "b: [1]\n");

  EXPECT_THROW(document.Erase("b"), loconf::Exception);
  EXPECT_THROW(document.Erase(), loconf::Exception);
  EXPECT_EQ(document.ToString(), "b: [1]\n");
}

TEST(DocumentProxy, NumericKeys)
{
  loconf::DocumentProxy document = loconf::LoadsRoundtrip("1: 'x'\n");
  EXPECT_EQ(document[1.0].ToValue().asString(), "x");
  document[1.0] = "y";
  EXPECT_EQ(document.ToString(), "1: \"y\"\n");
}

TEST(DocumentProxy, RequiresARootValue)
{
  try
  {
    loconf::DocumentProxy document{loconf::Document{}};
    FAIL() << "expected an empty document to be rejected";
  }
  catch (const loconf::Exception& e)
  {
    EXPECT_EQ(e.error.code, loconf::ErrorCode::InvalidValue);
  }
}

TEST(DocumentProxy, CopiesShareTheDocument)
{
  loconf::DocumentProxy document = loconf::LoadsRoundtrip("a: 1\n");
  loconf::DocumentProxy copy(document);
  copy["a"] = 2;
  EXPECT_EQ(document.ToString(), "a: 2\n");
  EXPECT_EQ(&copy.GetDocument(), &document.GetDocument());
}

TEST(OneShot, LoadsAndDumps)
{
  Value value = loconf::LoadsOrThrow("# settings\nname: 'loconf'\nsizes: [1, 2.5]\n");
  EXPECT_TRUE(value == Value(Object{{"name", "loconf"}, {"sizes", Array{1, 2.5}}}));
  EXPECT_EQ(loconf::DumpsOrThrow(value), "name: \"loconf\"\nsizes: [\n    1,\n    2.5,\n]\n");

  Value parsed;
  loconf::Error error;
  EXPECT_EQ(loconf::Loads("a: [", parsed, &error), loconf::ErrorCode::UnexpectedEnd);
  EXPECT_TRUE(parsed.isNull());
  EXPECT_THROW(loconf::LoadsOrThrow("a: 1\na: 2\n"), loconf::Exception);
  EXPECT_THROW(loconf::LoadsRoundtrip("a:"), loconf::Exception);
}

TEST(OneShot, Streams)
{
  std::istringstream input("# comment\nk: v_is_quoted_below\n");
  EXPECT_THROW(loconf::LoadOrThrow(input), loconf::Exception);

  std::istringstream valid("k: 'v'\n");
  EXPECT_TRUE(loconf::LoadOrThrow(valid) == Value(Object{{"k", "v"}}));

  std::ostringstream output;
  loconf::DumpOrThrow(Object{{"k", Array{}}}, output);
  EXPECT_EQ(output.str(), "k: []\n");

  std::istringstream roundtrip("# keep\nk: 1  # me\n");
  loconf::DocumentProxy document = loconf::LoadRoundtrip(roundtrip);
  document["k"] = 2;
  std::ostringstream edited;
  loconf::DumpRoundtrip(document, edited);
  EXPECT_EQ(edited.str(), "# keep\nk: 2  # me\n");
}

TEST(OneShot, Files)
{
  const std::string path = testing::TempDir() + "loconf_roundtrip.conf";
  Value value(Object{{"host", "localhost"}, {"port", 8080}});

  loconf::Error error;
  ASSERT_EQ(loconf::DumpFile(path, value, {}, &error), loconf::ErrorCode::OK) << error.message;
  EXPECT_TRUE(loconf::LoadFileOrThrow(path) == value);

  loconf::DocumentProxy document = loconf::LoadRoundtripFile(path);
  document["port"] = 9090;
  loconf::DumpRoundtripFile(document, path);

  Value reloaded;
  ASSERT_EQ(loconf::LoadFile(path, reloaded, &error), loconf::ErrorCode::OK) << error.message;
  EXPECT_EQ(reloaded.asObject()[1].second.asInt(), 9090);
  EXPECT_EQ(loconf::LoadRoundtripFile(path).ToString(), "host: \"localhost\"\nport: 9090\n");

  Value missing;
  EXPECT_EQ(
    loconf::LoadFile(testing::TempDir() + "loconf_does_not_exist.conf", missing, &error),
    loconf::ErrorCode::IoError);
  EXPECT_THROW(loconf::LoadRoundtripFile(testing::TempDir() + "loconf_does_not_exist.conf"), loconf::Exception);
}
