/*
loconf.hpp

ABOUT

Single-file lossless configuration library for C++. Documents are parsed into a tree that keeps every
source character, values are read and edited by path, and untouched regions are written back byte-for-byte.

REVISION HISTORY

v0.1 (2026-10-18) - First release.


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

#ifndef LOCONF_HPP
#define LOCONF_HPP

#ifdef _WIN32
  #ifdef _MBCS
    #error "_MBCS is defined, but only Unicode is supported"
  #endif
  #undef _UNICODE
  #define _UNICODE
  #undef UNICODE
  #define UNICODE

  #undef NOMINMAX
  #define NOMINMAX

  #undef STRICT
  #define STRICT

  #ifndef _WIN32_WINNT
    #define _WIN32_WINNT _WIN32_WINNT_WINXP
  #endif
  #ifdef _MSC_VER
    #include <SDKDDKVer.h>
  #endif

  #undef WIN32_LEAN_AND_MEAN
  #define WIN32_LEAN_AND_MEAN
  #include <windows.h>
#endif

#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <cmath>
#include <algorithm>
#include <charconv>
#include <exception>
#include <istream>
#include <iterator>
#include <limits>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace loconf
{
#ifdef _WIN32
  // Convert UTF-8 to UTF-16; keep the trailing null when forFileStream is true so _wfopen can use data()
  inline std::wstring ConvertStringToWString(const std::string& value, bool forFileStream = false)
  {
    int numChars = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, value.c_str(), -1, nullptr, 0);
    if (numChars <= 0)
    {
      return {};
    }

    std::wstring wstr(static_cast<std::size_t>(numChars), L'\0');
    int written = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, value.c_str(), -1, wstr.data(), numChars);
    if (written <= 0)
    {
      return {};
    }

    if (!forFileStream && !wstr.empty() && wstr.back() == L'\0')
    {
      wstr.pop_back();
    }

    return wstr;
  }

  // Cross-platform FILE opener that accepts UTF-8 paths and uses wide APIs on Windows
  inline std::unique_ptr<std::FILE, decltype(&std::fclose)>
  OpenFileUTF8(const std::string& path, const std::string& mode)
  {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> fileStream(nullptr, &std::fclose);
    std::wstring modeW = ConvertStringToWString(mode, true);
    std::wstring pathW = ConvertStringToWString(path, true);
    std::FILE* file = nullptr;
    if (_wfopen_s(&file, pathW.c_str(), modeW.c_str()) == 0)
    {
      fileStream.reset(file);
    }
    return fileStream;
  }
#else
  inline std::unique_ptr<std::FILE, decltype(&std::fclose)>
  OpenFileUTF8(const std::string& path, const std::string& mode)
  {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> fileStream(nullptr, &std::fclose);
    fileStream.reset(std::fopen(path.c_str(), mode.c_str()));
    return fileStream;
  }
#endif

  struct LocationEntry
  {
    std::size_t line = 1;
    std::size_t column = 1;
  };

  enum class ErrorCode : std::uint8_t
  {
    OK,
    UnexpectedChar,
    UnexpectedEnd,
    UnexpectedToken,
    InvalidNumber,
    InvalidEscape,
    InvalidUtf8,
    UnterminatedString,
    InvalidIndentChar,
    DuplicateKey,
    NotIndexable,
    KeyNotFound,
    IndexOutOfRange,
    InvalidPath,
    CannotDeleteLastTopLevelItem,
    NotAMap,
    InvalidKeyType,
    InvalidValue,
    IoError,
    InternalError,
  };

  struct Error
  {
    ErrorCode code = ErrorCode::OK;
    LocationEntry where{};
    std::string message;

    explicit operator bool() const
    {
      return code != ErrorCode::OK;
    }
  };

  // Exception type used by the throwing wrappers and the document proxy
  struct Exception : std::exception
  {
    Error error;
    explicit Exception(Error e) : error(std::move(e))
    {}
    const char* what() const noexcept override
    {
      return error.message.c_str();
    }
  };

  struct Value;

  using Array = std::vector<Value>;
  using Object = std::vector<std::pair<Value, Value>>; // Insertion ordered; keys are primitive values

  struct Value : std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>
  {
    using Base = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;

    Value() : Base(std::in_place_type<std::nullptr_t>, nullptr)
    {}

    Value(std::nullptr_t) : Base(std::in_place_type<std::nullptr_t>, nullptr)
    {}

    Value(bool value) : Base(std::in_place_type<bool>, value)
    {}

    template <
      typename T,
      typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
    Value(T value) : Base(std::in_place_type<std::int64_t>, ToInt64(value))
    {}

    Value(double value) : Base(std::in_place_type<double>, value)
    {}

    Value(const char* value) : Base(std::in_place_type<std::string>, value)
    {}

    Value(std::string value) : Base(std::in_place_type<std::string>, std::move(value))
    {}

    Value(Array value) : Base(std::in_place_type<Array>, std::move(value))
    {}

    Value(Object value) : Base(std::in_place_type<Object>, std::move(value))
    {}

    bool isNull() const
    {
      return std::holds_alternative<std::nullptr_t>(*this);
    }

    bool isBool() const
    {
      return std::holds_alternative<bool>(*this);
    }

    bool isInt() const
    {
      return std::holds_alternative<std::int64_t>(*this);
    }

    bool isFloat() const
    {
      return std::holds_alternative<double>(*this);
    }

    bool isString() const
    {
      return std::holds_alternative<std::string>(*this);
    }

    bool isArray() const
    {
      return std::holds_alternative<Array>(*this);
    }

    bool isObject() const
    {
      return std::holds_alternative<Object>(*this);
    }

    bool asBool() const
    {
      return std::get<bool>(*this);
    }

    std::int64_t asInt() const
    {
      return std::get<std::int64_t>(*this);
    }

    double asFloat() const
    {
      return std::get<double>(*this);
    }

    const std::string& asString() const
    {
      return std::get<std::string>(*this);
    }

    const Array& asArray() const
    {
      return std::get<Array>(*this);
    }

    const Object& asObject() const
    {
      return std::get<Object>(*this);
    }

    Array& asArray()
    {
      return std::get<Array>(*this);
    }

    Object& asObject()
    {
      return std::get<Object>(*this);
    }

    friend bool operator==(const Value& a, const Value& b)
    {
      return static_cast<const Base&>(a) == static_cast<const Base&>(b);
    }

    friend bool operator!=(const Value& a, const Value& b)
    {
      return !(a == b);
    }

  private:
    // Unsigned values above INT64_MAX have no exact representation
    template <typename T>
    static std::int64_t ToInt64(T value)
    {
      if constexpr (std::is_unsigned<T>::value)
      {
        if (static_cast<std::uint64_t>(value) > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        {
          throw Exception(Error{ErrorCode::InvalidValue, {}, "Integer does not fit in a signed 64-bit value"});
        }
      }
      return static_cast<std::int64_t>(value);
    }
  };

  enum class TokenKind : std::uint8_t
  {
    Bom,
    Indent, // Spaces at the start of a line
    Space, // Spaces / tabs inside a line
    NewLine,
    Comment, // '#' up to (not including) the line ending
    Colon,
    Comma,
    MapStart,
    MapEnd,
    ListStart,
    ListEnd,
    String,
    BareWordKey,
    Bool,
    Null,
    Int,
    Float,
    Eof,
  };

  struct Token
  {
    TokenKind kind = TokenKind::Eof;
    std::string src;
  };

  using Tokens = std::vector<Token>;

  enum class PrimitiveKind : std::uint8_t
  {
    String,
    BareWordKey,
    Bool,
    Null,
    Int,
    Float,
  };

  struct Node;
  struct Item;

  // Nodes and items are immutable once built; edits rebuild the path to the root and share everything else
  using NodePtr = std::shared_ptr<const Node>;
  using ItemPtr = std::shared_ptr<const Item>;

  struct Primitive
  {
    PrimitiveKind kind = PrimitiveKind::Null;
    Value val;
    std::string src;
  };

  struct Container
  {
    Tokens head; // Opening bracket and the rest of its line; empty for the braceless root map
    std::vector<ItemPtr> items;
    Tokens tail; // Closing indent and bracket

    bool IsTopLevelStyle() const
    {
      return head.empty();
    }

    bool IsMultiline() const
    {
      return IsTopLevelStyle() || head.back().kind == TokenKind::NewLine;
    }
  };

  struct List : Container
  {};

  struct Map : Container
  {};

  struct Node : std::variant<Primitive, List, Map>
  {
    using Base = std::variant<Primitive, List, Map>;
    using variant::variant;

    bool isPrimitive() const
    {
      return std::holds_alternative<Primitive>(*this);
    }

    bool isList() const
    {
      return std::holds_alternative<List>(*this);
    }

    bool isMap() const
    {
      return std::holds_alternative<Map>(*this);
    }

    const Primitive& asPrimitive() const
    {
      return std::get<Primitive>(*this);
    }

    const List& asList() const
    {
      return std::get<List>(*this);
    }

    const Map& asMap() const
    {
      return std::get<Map>(*this);
    }

    // nullptr for primitives
    const Container* asContainer() const
    {
      if (const List* list = std::get_if<List>(&base()))
      {
        return list;
      }
      if (const Map* map = std::get_if<Map>(&base()))
      {
        return map;
      }
      return nullptr;
    }

    const Base& base() const
    {
      return *this;
    }
  };

  struct Item
  {
    Tokens head; // Indentation and comment lines before the item
    NodePtr key; // Map entries only
    Tokens separator; // ':' and the spaces around it
    NodePtr val;
    Tokens tail; // Comma, trailing comment, line ending
  };

  // The document is the root item: head holds the leading trivia, tail the trivia before end of input.
  using Document = Item;

  // Map keys and list indices from the document root
  using Path = std::vector<Value>;

  namespace detail
  {
    constexpr int kIndentWidth = 4;

    inline ErrorCode Fail(ErrorCode code, Error* error, std::string_view message)
    {
      if (error)
      {
        error->code = code;
        error->where = {};
        error->message.assign(message.begin(), message.end());
      }
      return code;
    }

    inline bool IsIdentifierStart(char c)
    {
      return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
    }

    inline bool IsIdentifierChar(char c)
    {
      return IsIdentifierStart(c) || (c >= '0' && c <= '9') || c == '-' || c == '_';
    }

    inline bool IsDigit(char c)
    {
      return c >= '0' && c <= '9';
    }

    inline bool IsKeyword(std::string_view word)
    {
      return word == "true" || word == "false" || word == "null";
    }

    inline int HexValue(char c)
    {
      if (c >= '0' && c <= '9')
      {
        return c - '0';
      }
      if (c >= 'a' && c <= 'f')
      {
        return 10 + (c - 'a');
      }
      if (c >= 'A' && c <= 'F')
      {
        return 10 + (c - 'A');
      }
      return -1;
    }

    inline void AppendUTF8(std::string& out, std::uint32_t codePoint)
    {
      if (codePoint <= 0x7F)
      {
        out.push_back(static_cast<char>(codePoint));
      }
      else if (codePoint <= 0x7FF)
      {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
      else if (codePoint <= 0xFFFF)
      {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
      else
      {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
    }

    inline bool HasBOM(std::string_view src)
    {
      return src.size() >= 3 && static_cast<unsigned char>(src[0]) == 0xEF &&
        static_cast<unsigned char>(src[1]) == 0xBB && static_cast<unsigned char>(src[2]) == 0xBF;
    }

    inline bool ValidateUTF8(
      std::string_view stringView,
      bool allowLeadingBOM,
      std::size_t& badIndex,
      std::size_t& badLine,
      std::size_t& badCol)
    {
      std::size_t index = 0;
      badLine = 1;
      badCol = 1;

      auto bumpCol = [&](std::uint32_t codePoint) {
        if (codePoint == '\n')
        {
          ++badLine;
          badCol = 1;
        }
        else
        {
          ++badCol;
        }
      };

      while (index < stringView.size())
      {
        unsigned char c = static_cast<unsigned char>(stringView[index]);

        if (index == 0 && allowLeadingBOM && HasBOM(stringView))
        {
          index += 3;
          continue;
        }
        else if (index > 0 && HasBOM(stringView.substr(index)))
        {
          badIndex = index;
          return false; // BOM not at start
        }

        if (c <= 0x7F)
        {
          ++index;
          bumpCol(c);
          continue;
        }

        std::uint32_t codePoint = 0;
        std::size_t length = 0;
        if ((c & 0xE0) == 0xC0)
        {
          length = 2;
          codePoint = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
          length = 3;
          codePoint = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
          length = 4;
          codePoint = c & 0x07;
        }
        else
        {
          badIndex = index;
          return false;
        }

        if (index + length > stringView.size())
        {
          badIndex = index;
          return false;
        }
        for (std::size_t k = 1; k < length; ++k)
        {
          unsigned char cc = static_cast<unsigned char>(stringView[index + k]);
          if ((cc & 0xC0) != 0x80)
          {
            badIndex = index;
            return false;
          }
          codePoint = (codePoint << 6) | (cc & 0x3F);
        }

        if (
          (length == 2 && codePoint < 0x80) || (length == 3 && codePoint < 0x800) ||
          (length == 4 && (codePoint < 0x10000 || codePoint > 0x10FFFF)) ||
          (codePoint >= 0xD800 && codePoint <= 0xDFFF))
        {
          badIndex = index;
          return false;
        }

        index += length;
        bumpCol(codePoint);
      }
      return true;
    }

    inline bool ReadHex4(std::string_view body, std::size_t& index, std::uint32_t& codePoint)
    {
      if (index + 4 > body.size())
      {
        return false;
      }
      codePoint = 0;
      for (std::size_t k = 0; k < 4; ++k)
      {
        int hexValue = HexValue(body[index++]);
        if (hexValue < 0)
        {
          return false;
        }
        codePoint = (codePoint << 4) | static_cast<std::uint32_t>(hexValue);
      }
      return true;
    }

    // src is the full literal including its quotes
    inline ErrorCode DecodeString(std::string_view src, std::string& out, std::string& message)
    {
      if (src.size() < 2 || (src.front() != '"' && src.front() != '\'') || src.back() != src.front())
      {
        message = "Malformed string literal";
        return ErrorCode::UnterminatedString;
      }
      std::string_view body = src.substr(1, src.size() - 2);
      std::string result;
      std::size_t index = 0;
      while (index < body.size())
      {
        char c = body[index++];
        if (c != '\\')
        {
          result.push_back(c);
          continue;
        }
        if (index >= body.size())
        {
          message = "Invalid escape in string";
          return ErrorCode::InvalidEscape;
        }
        char e = body[index++];
        switch (e)
        {
          case '"': result.push_back('"'); break;
          case '\'': result.push_back('\''); break;
          case '\\': result.push_back('\\'); break;
          case 'n': result.push_back('\n'); break;
          case 'r': result.push_back('\r'); break;
          case 't': result.push_back('\t'); break;
          case 'u':
          {
            std::uint32_t codePoint = 0;
            if (!ReadHex4(body, index, codePoint))
            {
              message = "Invalid hex in unicode escape";
              return ErrorCode::InvalidEscape;
            }
            if (codePoint >= 0xD800 && codePoint <= 0xDBFF)
            {
              // Expect low surrogate
              if (index + 1 >= body.size() || body[index] != '\\' || body[index + 1] != 'u')
              {
                message = "Unpaired surrogate";
                return ErrorCode::InvalidEscape;
              }
              index += 2;
              std::uint32_t lowSurrogate = 0;
              if (!ReadHex4(body, index, lowSurrogate))
              {
                message = "Invalid hex in unicode escape";
                return ErrorCode::InvalidEscape;
              }
              if (lowSurrogate < 0xDC00 || lowSurrogate > 0xDFFF)
              {
                message = "Invalid low surrogate";
                return ErrorCode::InvalidEscape;
              }
              codePoint = 0x10000 + (((codePoint - 0xD800) << 10) | (lowSurrogate - 0xDC00));
            }
            else if (codePoint >= 0xDC00 && codePoint <= 0xDFFF)
            {
              message = "Unpaired surrogate";
              return ErrorCode::InvalidEscape;
            }
            AppendUTF8(result, codePoint);
            break;
          }
          default: message = "Invalid escape in string"; return ErrorCode::InvalidEscape;
        }
      }
      out = std::move(result);
      return ErrorCode::OK;
    }

    inline std::string EncodeString(std::string_view value)
    {
      static const char hexDigits[] = "0123456789abcdef";
      std::string out;
      out.push_back('"');
      for (char c : value)
      {
        switch (c)
        {
          case '"': out += "\\\""; break;
          case '\\': out += "\\\\"; break;
          case '\n': out += "\\n"; break;
          case '\r': out += "\\r"; break;
          case '\t': out += "\\t"; break;
          default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
              out += "\\u00";
              out.push_back(hexDigits[(c >> 4) & 0xF]);
              out.push_back(hexDigits[c & 0xF]);
            }
            else
            {
              out.push_back(c);
            }
            break;
        }
      }
      out.push_back('"');
      return out;
    }

    // Decimal, 0x, 0o and 0b forms with an optional sign
    inline ErrorCode DecodeInt(std::string_view src, std::int64_t& out, std::string& message)
    {
      std::string_view digits = src;
      bool negative = false;
      if (!digits.empty() && (digits.front() == '+' || digits.front() == '-'))
      {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
      }
      int base = 10;
      if (digits.size() >= 2 && digits[0] == '0')
      {
        switch (digits[1])
        {
          case 'x':
          case 'X': base = 16; break;
          case 'o':
          case 'O': base = 8; break;
          case 'b':
          case 'B': base = 2; break;
          default: break;
        }
        if (base != 10)
        {
          digits.remove_prefix(2);
        }
      }
      std::uint64_t magnitude = 0;
      auto result = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
      if (digits.empty() || result.ec != std::errc() || result.ptr != digits.data() + digits.size())
      {
        message = result.ec == std::errc::result_out_of_range ? "Integer literal out of range" : "Invalid integer literal";
        return ErrorCode::InvalidNumber;
      }
      const std::uint64_t maxValue = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
      if (magnitude > (negative ? maxValue + 1 : maxValue))
      {
        message = "Integer literal out of range";
        return ErrorCode::InvalidNumber;
      }
      if (negative)
      {
        out = magnitude == maxValue + 1 ? std::numeric_limits<std::int64_t>::min()
                                        : -static_cast<std::int64_t>(magnitude);
      }
      else
      {
        out = static_cast<std::int64_t>(magnitude);
      }
      return ErrorCode::OK;
    }

    inline std::string EncodeInt(std::int64_t value)
    {
      return std::to_string(value);
    }

    inline ErrorCode DecodeFloat(std::string_view src, double& out, std::string& message)
    {
      std::string tempValue(src.begin(), src.end());
      char* endPtr = nullptr;
      errno = 0;
      double value = std::strtod(tempValue.c_str(), &endPtr);
      if (tempValue.empty() || !endPtr || *endPtr != '\0')
      {
        message = "Invalid float literal";
        return ErrorCode::InvalidNumber;
      }
      if (errno == ERANGE && !std::isfinite(value))
      {
        message = "Float literal out of range";
        return ErrorCode::InvalidNumber;
      }
      out = value;
      return ErrorCode::OK;
    }

    // Shortest text that reads back to the same double, always recognizable as a float
    inline std::string EncodeFloat(double value)
    {
      char buffer[64];
      auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
      std::string text(buffer, result.ptr);
      if (text.find_first_of(".eE") == std::string::npos)
      {
        text += ".0";
      }
      return text;
    }

    inline std::string EncodeBool(bool value)
    {
      return value ? "true" : "false";
    }

    inline std::string EncodeNull()
    {
      return "null";
    }
  } // namespace detail

  // Strings matching this can be written as unquoted map keys
  inline bool IsBareWord(std::string_view value)
  {
    if (value.empty() || !detail::IsIdentifierStart(value.front()))
    {
      return false;
    }
    for (char c : value)
    {
      if (!detail::IsIdentifierChar(c))
      {
        return false;
      }
    }
    return !detail::IsKeyword(value);
  }

  class Tokenizer
  {
  public:
    explicit Tokenizer(std::string_view src) : mSrc(src)
    {}

    ErrorCode Tokenize(Tokens& out, Error* error = nullptr)
    {
      // Reset previous state for a fresh run
      mError = {};
      mPos = 0;
      mLine = 1;
      mCol = 1;

      std::size_t badIndex = 0;
      std::size_t badLine = 1;
      std::size_t badCol = 1;
      if (!detail::ValidateUTF8(mSrc, true, badIndex, badLine, badCol))
      {
        mPos = badIndex;
        mLine = badLine;
        mCol = badCol;
        return Finish(Fail(ErrorCode::InvalidUtf8, "Invalid UTF-8 encoding"), error);
      }

      Tokens tokens;
      if (detail::HasBOM(mSrc))
      {
        tokens.push_back(Token{TokenKind::Bom, std::string(mSrc.substr(0, 3))});
        mPos = 3;
      }

      while (!EndOfFile())
      {
        ErrorCode errorCode = NextToken(tokens);
        if (errorCode != ErrorCode::OK)
        {
          return Finish(errorCode, error);
        }
      }
      tokens.push_back(Token{TokenKind::Eof, {}});

      out = std::move(tokens);
      if (error)
      {
        *error = {};
      }
      return ErrorCode::OK;
    }

    const Error& LastError() const
    {
      return mError;
    }

  private:
    std::string_view mSrc;
    std::size_t mPos = 0;
    std::size_t mLine = 1;
    std::size_t mCol = 1;
    Error mError;

    char Peek(std::size_t offset = 0) const
    {
      return mPos + offset < mSrc.size() ? mSrc[mPos + offset] : '\0';
    }

    bool EndOfFile() const
    {
      return mPos >= mSrc.size();
    }

    char Get()
    {
      if (mPos >= mSrc.size())
      {
        return '\0';
      }
      char c = mSrc[mPos++];
      if (c == '\n')
      {
        ++mLine;
        mCol = 1;
      }
      else
      {
        ++mCol;
      }
      return c;
    }

    bool Match(char c)
    {
      if (Peek() == c)
      {
        Get();
        return true;
      }
      return false;
    }

    ErrorCode Fail(ErrorCode code, std::string_view message)
    {
      mError.code = code;
      mError.where = LocationEntry{mLine, mCol};
      mError.message.assign(message.begin(), message.end());
      return code;
    }

    ErrorCode Finish(ErrorCode code, Error* error)
    {
      if (error)
      {
        *error = mError;
      }
      return code;
    }

    bool IsNumberStart() const
    {
      char c = Peek();
      return detail::IsDigit(c) || ((c == '+' || c == '-') && detail::IsDigit(Peek(1)));
    }

    ErrorCode NextToken(Tokens& tokens)
    {
      std::size_t start = mPos;
      bool atLineStart = mCol == 1;
      TokenKind kind = TokenKind::Eof;
      char c = Peek();

      if (c == ' ' || c == '\t')
      {
        while (Peek() == ' ' || Peek() == '\t')
        {
          if (Peek() == '\t' && atLineStart)
          {
            return Fail(ErrorCode::InvalidIndentChar, "Tabs are not allowed in indentation");
          }
          Get();
        }
        kind = atLineStart ? TokenKind::Indent : TokenKind::Space;
      }
      else if (c == '\n')
      {
        Get();
        kind = TokenKind::NewLine;
      }
      else if (c == '\r')
      {
        Get();
        if (!Match('\n'))
        {
          return Fail(ErrorCode::UnexpectedChar, "Carriage return without line feed");
        }
        kind = TokenKind::NewLine;
      }
      else if (c == '#')
      {
        while (!EndOfFile() && Peek() != '\n' && Peek() != '\r')
        {
          Get();
        }
        kind = TokenKind::Comment;
      }
      else if (c == ':' || c == ',' || c == '{' || c == '}' || c == '[' || c == ']')
      {
        Get();
        switch (c)
        {
          case ':': kind = TokenKind::Colon; break;
          case ',': kind = TokenKind::Comma; break;
          case '{': kind = TokenKind::MapStart; break;
          case '}': kind = TokenKind::MapEnd; break;
          case '[': kind = TokenKind::ListStart; break;
          default: kind = TokenKind::ListEnd; break;
        }
      }
      else if (c == '"' || c == '\'')
      {
        ErrorCode errorCode = ScanString(c);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        kind = TokenKind::String;
      }
      else if (IsNumberStart())
      {
        kind = ScanNumber();
      }
      else if (detail::IsIdentifierStart(c))
      {
        while (detail::IsIdentifierChar(Peek()))
        {
          Get();
        }
        std::string_view word = mSrc.substr(start, mPos - start);
        if (word == "true" || word == "false")
        {
          kind = TokenKind::Bool;
        }
        else if (word == "null")
        {
          kind = TokenKind::Null;
        }
        else
        {
          kind = TokenKind::BareWordKey;
        }
      }
      else
      {
        return Fail(ErrorCode::UnexpectedChar, "Unexpected character");
      }

      tokens.push_back(Token{kind, std::string(mSrc.substr(start, mPos - start))});
      return ErrorCode::OK;
    }

    // Finds the extent of a quoted literal; escapes are decoded by the parser
    ErrorCode ScanString(char quote)
    {
      Get();
      while (!EndOfFile())
      {
        char c = Get();
        if (c == quote)
        {
          return ErrorCode::OK;
        }
        if (c == '\n' || c == '\r')
        {
          return Fail(ErrorCode::UnterminatedString, "Newline in string literal");
        }
        if (c == '\\')
        {
          if (Peek() == '\n' || Peek() == '\r')
          {
            return Fail(ErrorCode::UnterminatedString, "Newline in string literal");
          }
          Get();
        }
      }
      return Fail(ErrorCode::UnterminatedString, "Unterminated string literal");
    }

    TokenKind ScanNumber()
    {
      if (Peek() == '+' || Peek() == '-')
      {
        Get();
      }
      char second = Peek(1);
      bool isPrefixed = Peek() == '0' &&
        (second == 'x' || second == 'X' || second == 'o' || second == 'O' || second == 'b' || second == 'B');
      bool isFloat = false;
      while (!EndOfFile())
      {
        char c = Peek();
        if (!detail::IsDigit(c) && !detail::IsIdentifierStart(c) && c != '.')
        {
          break;
        }
        Get();
        if (!isPrefixed && (c == '.' || c == 'e' || c == 'E'))
        {
          isFloat = true;
          if (c != '.' && (Peek() == '+' || Peek() == '-'))
          {
            Get();
          }
        }
      }
      return isFloat ? TokenKind::Float : TokenKind::Int;
    }
  };

  inline ErrorCode Tokenize(std::string_view src, Tokens& out, Error* error = nullptr)
  {
    Tokenizer tokenizer(src);
    return tokenizer.Tokenize(out, error);
  }

  namespace detail
  {
    inline bool IsPrimitiveToken(TokenKind kind)
    {
      switch (kind)
      {
        case TokenKind::String:
        case TokenKind::BareWordKey:
        case TokenKind::Bool:
        case TokenKind::Null:
        case TokenKind::Int:
        case TokenKind::Float: return true;
        default: return false;
      }
    }

    inline bool IsTrivia(TokenKind kind)
    {
      return kind == TokenKind::Indent || kind == TokenKind::Space || kind == TokenKind::Comment ||
        kind == TokenKind::NewLine;
    }

    inline ErrorCode DecodePrimitive(const Token& token, NodePtr& out, std::string& message)
    {
      Primitive primitive;
      primitive.src = token.src;
      switch (token.kind)
      {
        case TokenKind::String:
        {
          std::string value;
          ErrorCode errorCode = DecodeString(token.src, value, message);
          if (errorCode != ErrorCode::OK)
          {
            return errorCode;
          }
          primitive.kind = PrimitiveKind::String;
          primitive.val = std::move(value);
          break;
        }
        case TokenKind::BareWordKey:
          primitive.kind = PrimitiveKind::BareWordKey;
          primitive.val = token.src;
          break;
        case TokenKind::Bool:
          primitive.kind = PrimitiveKind::Bool;
          primitive.val = token.src == "true";
          break;
        case TokenKind::Null:
          primitive.kind = PrimitiveKind::Null;
          primitive.val = nullptr;
          break;
        case TokenKind::Int:
        {
          std::int64_t value = 0;
          ErrorCode errorCode = DecodeInt(token.src, value, message);
          if (errorCode != ErrorCode::OK)
          {
            return errorCode;
          }
          primitive.kind = PrimitiveKind::Int;
          primitive.val = value;
          break;
        }
        case TokenKind::Float:
        {
          double value = 0.0;
          ErrorCode errorCode = DecodeFloat(token.src, value, message);
          if (errorCode != ErrorCode::OK)
          {
            return errorCode;
          }
          primitive.kind = PrimitiveKind::Float;
          primitive.val = value;
          break;
        }
        default: message = "Expected a primitive value"; return ErrorCode::UnexpectedToken;
      }
      out = std::make_shared<const Node>(std::move(primitive));
      return ErrorCode::OK;
    }

    inline const Value& KeyOf(const Item& item)
    {
      return item.key->asPrimitive().val;
    }

    // Ints and floats with the same numeric value name the same key
    inline bool KeysEqual(const Value& a, const Value& b)
    {
      if (a.isInt() && b.isFloat())
      {
        return static_cast<double>(a.asInt()) == b.asFloat();
      }
      if (a.isFloat() && b.isInt())
      {
        return a.asFloat() == static_cast<double>(b.asInt());
      }
      return a == b;
    }
  } // namespace detail

  // Recursive descent over a token stream. Every token ends up in exactly one head / separator / tail, so
  // concatenating the tree's tokens reproduces the input.
  class Parser
  {
  public:
    explicit Parser(const Tokens& tokens) : mTokens(tokens)
    {}

    ErrorCode Parse(Document& out, Error* error = nullptr)
    {
      mError = {};
      Document document;
      TakeIf(TokenKind::Bom, document.head);
      TakeTrivia(document.head);

      ErrorCode errorCode = ErrorCode::OK;
      if (Peek().kind == TokenKind::Eof)
      {
        errorCode = Fail(ErrorCode::UnexpectedEnd, "Empty document");
      }
      else if (IsTopLevelMapStart())
      {
        errorCode = ParseTopLevelMap(document.val);
      }
      else
      {
        errorCode = ParseValue(document.val);
      }

      if (errorCode == ErrorCode::OK)
      {
        TakeTrivia(document.tail);
        if (Peek().kind != TokenKind::Eof)
        {
          errorCode = Fail(ErrorCode::UnexpectedToken, "Trailing content after top-level value");
        }
      }

      if (errorCode == ErrorCode::OK)
      {
        out = std::move(document);
      }
      return Finish(errorCode, error);
    }

    // A lone primitive followed by end of input; containers are rejected as keys
    ErrorCode ParseKey(NodePtr& out, Error* error = nullptr)
    {
      mError = {};
      ErrorCode errorCode = ErrorCode::OK;
      TokenKind kind = Peek().kind;
      if (kind == TokenKind::MapStart || kind == TokenKind::ListStart)
      {
        errorCode = Fail(ErrorCode::InvalidKeyType, "Map keys must be primitive values");
      }
      else
      {
        errorCode = ParsePrimitive(out);
        if (errorCode == ErrorCode::OK && Peek().kind != TokenKind::Eof)
        {
          errorCode = Fail(ErrorCode::UnexpectedToken, "Trailing tokens after key");
        }
      }
      return Finish(errorCode, error);
    }

    const Error& LastError() const
    {
      return mError;
    }

  private:
    const Tokens& mTokens;
    std::size_t mPos = 0;
    std::size_t mLine = 1;
    std::size_t mCol = 1;
    Error mError;

    const Token& Peek(std::size_t offset = 0) const
    {
      static const Token eof{TokenKind::Eof, {}};
      std::size_t index = mPos + offset;
      return index < mTokens.size() ? mTokens[index] : eof;
    }

    const Token& Get()
    {
      const Token& token = Peek();
      if (mPos < mTokens.size())
      {
        ++mPos;
      }
      if (token.kind != TokenKind::Bom)
      {
        for (char c : token.src)
        {
          if (c == '\n')
          {
            ++mLine;
            mCol = 1;
          }
          else
          {
            ++mCol;
          }
        }
      }
      return token;
    }

    bool TakeIf(TokenKind kind, Tokens& into)
    {
      if (Peek().kind != kind)
      {
        return false;
      }
      into.push_back(Get());
      return true;
    }

    void TakeTrivia(Tokens& into)
    {
      while (detail::IsTrivia(Peek().kind))
      {
        into.push_back(Get());
      }
    }

    // Comment / blank lines and the indentation in front of the next item
    void TakeLeadingLines(Tokens& into)
    {
      while (true)
      {
        TakeIf(TokenKind::Indent, into);
        if (TakeIf(TokenKind::Comment, into))
        {
          if (!TakeIf(TokenKind::NewLine, into))
          {
            return;
          }
          continue;
        }
        if (TakeIf(TokenKind::NewLine, into))
        {
          continue;
        }
        return;
      }
    }

    TokenKind NextContentKind() const
    {
      std::size_t offset = 0;
      while (detail::IsTrivia(Peek(offset).kind))
      {
        ++offset;
      }
      return Peek(offset).kind;
    }

    ErrorCode Fail(ErrorCode code, std::string_view message)
    {
      mError.code = code;
      mError.where = LocationEntry{mLine, mCol};
      mError.message.assign(message.begin(), message.end());
      return code;
    }

    ErrorCode Finish(ErrorCode code, Error* error)
    {
      if (error)
      {
        *error = code == ErrorCode::OK ? Error{} : mError;
      }
      return code;
    }

    bool IsTopLevelMapStart() const
    {
      if (!detail::IsPrimitiveToken(Peek().kind))
      {
        return false;
      }
      std::size_t offset = Peek(1).kind == TokenKind::Space ? 2 : 1;
      return Peek(offset).kind == TokenKind::Colon;
    }

    ErrorCode ParsePrimitive(NodePtr& out)
    {
      const Token& token = Peek();
      if (token.kind == TokenKind::Eof)
      {
        return Fail(ErrorCode::UnexpectedEnd, "Unexpected end of input");
      }
      std::string message;
      ErrorCode errorCode = detail::DecodePrimitive(token, out, message);
      if (errorCode != ErrorCode::OK)
      {
        return Fail(errorCode, message);
      }
      Get();
      return ErrorCode::OK;
    }

    ErrorCode ParseValue(NodePtr& out)
    {
      switch (Peek().kind)
      {
        case TokenKind::MapStart: return ParseContainer<Map>(TokenKind::MapEnd, out);
        case TokenKind::ListStart: return ParseContainer<List>(TokenKind::ListEnd, out);
        case TokenKind::BareWordKey: return Fail(ErrorCode::UnexpectedToken, "Bare words are only valid as map keys");
        case TokenKind::String:
        case TokenKind::Bool:
        case TokenKind::Null:
        case TokenKind::Int:
        case TokenKind::Float: return ParsePrimitive(out);
        case TokenKind::Eof: return Fail(ErrorCode::UnexpectedEnd, "Unexpected end of input while parsing value");
        default: return Fail(ErrorCode::UnexpectedToken, "Unexpected token while parsing value");
      }
    }

    ErrorCode ParseMapEntry(const Container& map, Item& item)
    {
      const Token& token = Peek();
      if (token.kind == TokenKind::Eof)
      {
        return Fail(ErrorCode::UnexpectedEnd, "Unexpected end of input while parsing a map key");
      }
      if (!detail::IsPrimitiveToken(token.kind))
      {
        return Fail(ErrorCode::UnexpectedToken, "Expected a map key");
      }
      std::string message;
      NodePtr key;
      ErrorCode errorCode = detail::DecodePrimitive(token, key, message);
      if (errorCode != ErrorCode::OK)
      {
        return Fail(errorCode, message);
      }
      for (const ItemPtr& existing : map.items)
      {
        if (detail::KeysEqual(detail::KeyOf(*existing), key->asPrimitive().val))
        {
          return Fail(ErrorCode::DuplicateKey, "Duplicate map key");
        }
      }
      Get();
      item.key = std::move(key);

      TakeIf(TokenKind::Space, item.separator);
      if (!TakeIf(TokenKind::Colon, item.separator))
      {
        return Fail(ErrorCode::UnexpectedToken, "Expected ':' after a map key");
      }
      TakeIf(TokenKind::Space, item.separator);
      return ParseValue(item.val);
    }

    ErrorCode ParseItem(const Container& container, bool isMap, Item& item)
    {
      return isMap ? ParseMapEntry(container, item) : ParseValue(item.val);
    }

    // Braceless map at the document root: one entry per line, no commas
    ErrorCode ParseTopLevelMap(NodePtr& out)
    {
      Map map;
      Tokens pendingHead;
      while (true)
      {
        Item item;
        item.head = std::move(pendingHead);
        pendingHead.clear();
        ErrorCode errorCode = ParseMapEntry(map, item);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        TakeIf(TokenKind::Space, item.tail);
        TakeIf(TokenKind::Comment, item.tail);
        if (!TakeIf(TokenKind::NewLine, item.tail) && Peek().kind != TokenKind::Eof)
        {
          return Fail(ErrorCode::UnexpectedToken, "Expected a new line after a top-level entry");
        }
        map.items.push_back(std::make_shared<const Item>(std::move(item)));

        // Trivia before end of input belongs to the document
        if (NextContentKind() == TokenKind::Eof)
        {
          break;
        }
        TakeTrivia(pendingHead);
      }
      out = std::make_shared<const Node>(std::move(map));
      return ErrorCode::OK;
    }

    template <typename ContainerType>
    ErrorCode ParseContainer(TokenKind endKind, NodePtr& out)
    {
      ContainerType container;
      container.head.push_back(Get());
      const bool isMap = std::is_same<ContainerType, Map>::value;

      // Multiline when the opening bracket ends its line
      std::size_t offset = Peek().kind == TokenKind::Space ? 1 : 0;
      if (Peek(offset).kind == TokenKind::Comment)
      {
        ++offset;
      }
      ErrorCode errorCode = ErrorCode::OK;
      if (Peek(offset).kind == TokenKind::NewLine)
      {
        TakeIf(TokenKind::Space, container.head);
        TakeIf(TokenKind::Comment, container.head);
        TakeIf(TokenKind::NewLine, container.head);
        errorCode = ParseMultilineItems(container, isMap, endKind);
      }
      else
      {
        TakeIf(TokenKind::Space, container.head);
        errorCode = ParseInlineItems(container, isMap, endKind);
      }
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      out = std::make_shared<const Node>(std::move(container));
      return ErrorCode::OK;
    }

    ErrorCode ParseInlineItems(Container& container, bool isMap, TokenKind endKind)
    {
      while (true)
      {
        if (Peek().kind == endKind)
        {
          container.tail.push_back(Get());
          return ErrorCode::OK;
        }

        Item item;
        ErrorCode errorCode = ParseItem(container, isMap, item);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        TakeIf(TokenKind::Space, item.tail);
        bool hasComma = TakeIf(TokenKind::Comma, item.tail);
        TakeIf(TokenKind::Space, item.tail);
        container.items.push_back(std::make_shared<const Item>(std::move(item)));

        TokenKind next = Peek().kind;
        if (next == TokenKind::NewLine || next == TokenKind::Comment)
        {
          return Fail(ErrorCode::UnexpectedToken, "Inline containers cannot span multiple lines");
        }
        if (next == TokenKind::Eof)
        {
          return Fail(ErrorCode::UnexpectedEnd, "Unterminated container");
        }
        if (!hasComma && next != endKind)
        {
          return Fail(ErrorCode::UnexpectedToken, "Expected ',' or a closing bracket");
        }
      }
    }

    ErrorCode ParseMultilineItems(Container& container, bool isMap, TokenKind endKind)
    {
      while (true)
      {
        Tokens head;
        TakeLeadingLines(head);
        if (Peek().kind == endKind)
        {
          container.tail = std::move(head);
          container.tail.push_back(Get());
          return ErrorCode::OK;
        }
        if (Peek().kind == TokenKind::Eof)
        {
          return Fail(ErrorCode::UnexpectedEnd, "Unterminated container");
        }

        Item item;
        item.head = std::move(head);
        ErrorCode errorCode = ParseItem(container, isMap, item);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        TakeIf(TokenKind::Space, item.tail);
        bool hasComma = TakeIf(TokenKind::Comma, item.tail);
        TakeIf(TokenKind::Space, item.tail);
        if (TakeIf(TokenKind::Comment, item.tail))
        {
          if (!TakeIf(TokenKind::NewLine, item.tail))
          {
            return Fail(ErrorCode::UnexpectedEnd, "Unterminated container");
          }
        }
        else
        {
          TakeIf(TokenKind::NewLine, item.tail);
        }
        if (!hasComma && NextContentKind() != endKind)
        {
          return Fail(ErrorCode::UnexpectedToken, "Expected ',' between container items");
        }
        container.items.push_back(std::make_shared<const Item>(std::move(item)));
      }
    }
  };

  inline ErrorCode ParseFromTokens(const Tokens& tokens, Document& out, Error* error = nullptr)
  {
    Parser parser(tokens);
    return parser.Parse(out, error);
  }

  inline ErrorCode ParseDocument(std::string_view src, Document& out, Error* error = nullptr)
  {
    Tokens tokens;
    ErrorCode errorCode = Tokenize(src, tokens, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    return ParseFromTokens(tokens, out, error);
  }

  namespace detail
  {
    inline void AppendSource(const Tokens& tokens, std::string& out)
    {
      for (const Token& token : tokens)
      {
        out += token.src;
      }
    }

    inline void UnparseItem(const Item& item, std::string& out);

    struct UnparseVisitor
    {
      std::string& out;

      void operator()(const Primitive& primitive) const
      {
        out += primitive.src;
      }

      void operator()(const Container& container) const
      {
        AppendSource(container.head, out);
        for (const ItemPtr& item : container.items)
        {
          UnparseItem(*item, out);
        }
        AppendSource(container.tail, out);
      }
    };

    inline void UnparseItem(const Item& item, std::string& out)
    {
      AppendSource(item.head, out);
      if (item.key)
      {
        std::visit(UnparseVisitor{out}, item.key->base());
      }
      AppendSource(item.separator, out);
      if (item.val)
      {
        std::visit(UnparseVisitor{out}, item.val->base());
      }
      AppendSource(item.tail, out);
    }
  } // namespace detail

  inline std::string Unparse(const Node& node)
  {
    std::string out;
    std::visit(detail::UnparseVisitor{out}, node.base());
    return out;
  }

  inline std::string Unparse(const Document& document)
  {
    std::string out;
    detail::UnparseItem(document, out);
    return out;
  }

  inline Value ToValue(const Node& node);

  namespace detail
  {
    struct ValueVisitor
    {
      Value operator()(const Primitive& primitive) const
      {
        return primitive.val;
      }

      Value operator()(const List& list) const
      {
        Array array;
        array.reserve(list.items.size());
        for (const ItemPtr& item : list.items)
        {
          array.push_back(ToValue(*item->val));
        }
        return Value(std::move(array));
      }

      Value operator()(const Map& map) const
      {
        Object object;
        object.reserve(map.items.size());
        for (const ItemPtr& item : map.items)
        {
          object.emplace_back(KeyOf(*item), ToValue(*item->val));
        }
        return Value(std::move(object));
      }
    };
  } // namespace detail

  // Native value of a subtree; formatting is dropped
  inline Value ToValue(const Node& node)
  {
    return std::visit(detail::ValueVisitor{}, node.base());
  }

  // Formatting policy for synthesized values. indent == -1 renders everything inline; otherwise it is the
  // nesting depth of the container being rendered.
  struct Settings
  {
    int indent = -1;
    bool bareKeys = true;
    bool inlineSmallContainers = true;

    Settings Indented() const
    {
      Settings settings = *this;
      ++settings.indent;
      return settings;
    }
  };

  namespace detail
  {
    struct ContainerStyle
    {
      TokenKind startKind;
      const char* start;
      TokenKind endKind;
      const char* end;
    };

    constexpr ContainerStyle kMapStyle{TokenKind::MapStart, "{", TokenKind::MapEnd, "}"};
    constexpr ContainerStyle kListStyle{TokenKind::ListStart, "[", TokenKind::ListEnd, "]"};

    inline std::string IndentText(int level)
    {
      return std::string(static_cast<std::size_t>(level * kIndentWidth), ' ');
    }

    inline ErrorCode AppendValueTokens(
      const Value& value,
      const Settings& settings,
      bool asKey,
      bool asTopLevelMap,
      Tokens& out,
      Error* error);

    inline ErrorCode
    AppendMapItemTokens(const std::pair<Value, Value>& entry, const Settings& settings, Tokens& out, Error* error)
    {
      if (entry.first.isArray() || entry.first.isObject())
      {
        return Fail(ErrorCode::InvalidKeyType, error, "Map keys must be primitive values");
      }
      ErrorCode errorCode = AppendValueTokens(entry.first, settings, true, false, out, error);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      out.push_back(Token{TokenKind::Colon, ":"});
      out.push_back(Token{TokenKind::Space, " "});
      return AppendValueTokens(entry.second, settings, false, false, out, error);
    }

    inline ErrorCode AppendListItemTokens(const Value& value, const Settings& settings, Tokens& out, Error* error)
    {
      return AppendValueTokens(value, settings, false, false, out, error);
    }

    template <typename Items, typename ItemWriter>
    ErrorCode AppendInlineContainer(
      const Items& items,
      const Settings& settings,
      const ContainerStyle& style,
      ItemWriter writeItem,
      Tokens& out,
      Error* error)
    {
      out.push_back(Token{style.startKind, style.start});
      for (std::size_t index = 0; index < items.size(); ++index)
      {
        if (index > 0)
        {
          out.push_back(Token{TokenKind::Comma, ","});
          out.push_back(Token{TokenKind::Space, " "});
        }
        ErrorCode errorCode = writeItem(items[index], settings, out, error);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
      }
      out.push_back(Token{style.endKind, style.end});
      return ErrorCode::OK;
    }

    // One item per line, one indent level deeper than the container, each followed by a comma
    template <typename Items, typename ItemWriter>
    ErrorCode AppendMultilineContainer(
      const Items& items,
      const Settings& settings,
      const ContainerStyle& style,
      ItemWriter writeItem,
      Tokens& out,
      Error* error)
    {
      const Settings childSettings = settings.Indented();
      out.push_back(Token{style.startKind, style.start});
      out.push_back(Token{TokenKind::NewLine, "\n"});
      for (const auto& item : items)
      {
        out.push_back(Token{TokenKind::Indent, IndentText(childSettings.indent)});
        ErrorCode errorCode = writeItem(item, childSettings, out, error);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        out.push_back(Token{TokenKind::Comma, ","});
        out.push_back(Token{TokenKind::NewLine, "\n"});
      }
      if (settings.indent > 0)
      {
        out.push_back(Token{TokenKind::Indent, IndentText(settings.indent)});
      }
      out.push_back(Token{style.endKind, style.end});
      return ErrorCode::OK;
    }

    template <typename Items, typename ItemWriter>
    ErrorCode AppendContainer(
      const Items& items,
      const Settings& settings,
      const ContainerStyle& style,
      ItemWriter writeItem,
      Tokens& out,
      Error* error)
    {
      if (settings.indent < 0 || items.empty() || (settings.inlineSmallContainers && items.size() < 2))
      {
        return AppendInlineContainer(items, settings, style, writeItem, out, error);
      }
      return AppendMultilineContainer(items, settings, style, writeItem, out, error);
    }

    inline bool HasDuplicateKey(const Object& object)
    {
      for (std::size_t index = 1; index < object.size(); ++index)
      {
        for (std::size_t previous = 0; previous < index; ++previous)
        {
          if (KeysEqual(object[previous].first, object[index].first))
          {
            return true;
          }
        }
      }
      return false;
    }

    inline ErrorCode AppendTopLevelMapTokens(const Object& object, const Settings& settings, Tokens& out, Error* error)
    {
      for (const auto& entry : object)
      {
        ErrorCode errorCode = AppendMapItemTokens(entry, settings, out, error);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        out.push_back(Token{TokenKind::NewLine, "\n"});
      }
      return ErrorCode::OK;
    }

    inline ErrorCode AppendValueTokens(
      const Value& value,
      const Settings& settings,
      bool asKey,
      bool asTopLevelMap,
      Tokens& out,
      Error* error)
    {
      const bool topLevelMap = asTopLevelMap && settings.indent == 0;
      if (value.isString())
      {
        const std::string& text = value.asString();
        if (settings.bareKeys && asKey && IsBareWord(text))
        {
          out.push_back(Token{TokenKind::BareWordKey, text});
        }
        else
        {
          out.push_back(Token{TokenKind::String, EncodeString(text)});
        }
      }
      else if (value.isBool())
      {
        out.push_back(Token{TokenKind::Bool, EncodeBool(value.asBool())});
      }
      else if (value.isNull())
      {
        out.push_back(Token{TokenKind::Null, EncodeNull()});
      }
      else if (value.isInt())
      {
        out.push_back(Token{TokenKind::Int, EncodeInt(value.asInt())});
      }
      else if (value.isFloat())
      {
        if (!std::isfinite(value.asFloat()))
        {
          return Fail(ErrorCode::InvalidValue, error, "Non-finite floats have no textual form");
        }
        out.push_back(Token{TokenKind::Float, EncodeFloat(value.asFloat())});
      }
      else if (value.isObject())
      {
        const Object& object = value.asObject();
        if (HasDuplicateKey(object))
        {
          return Fail(ErrorCode::DuplicateKey, error, "Duplicate map key");
        }
        if (!object.empty() && topLevelMap)
        {
          return AppendTopLevelMapTokens(object, settings, out, error);
        }
        return AppendContainer(object, settings, kMapStyle, AppendMapItemTokens, out, error);
      }
      else
      {
        return AppendContainer(value.asArray(), settings, kListStyle, AppendListItemTokens, out, error);
      }
      return ErrorCode::OK;
    }
  } // namespace detail

  // Token stream for a native value under the given formatting policy. The stream is not terminated with Eof.
  inline ErrorCode Synthesize(
    const Value& value,
    const Settings& settings,
    bool asKey,
    bool asTopLevelMap,
    Tokens& out,
    Error* error = nullptr)
  {
    Tokens tokens;
    ErrorCode errorCode = detail::AppendValueTokens(value, settings, asKey, asTopLevelMap, tokens, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    out = std::move(tokens);
    return ErrorCode::OK;
  }

  namespace detail
  {
    // Run the parser over the synthesized tokens so the subtree is a real parse result, not a hand-built one
    inline ErrorCode
    SynthesizeNode(const Value& value, const Settings& settings, bool asTopLevelMap, NodePtr& out, Error* error)
    {
      Tokens tokens;
      ErrorCode errorCode = Synthesize(value, settings, false, asTopLevelMap, tokens, error);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      tokens.push_back(Token{TokenKind::Eof, {}});
      Document document;
      Error parseError;
      if (ParseFromTokens(tokens, document, &parseError) != ErrorCode::OK)
      {
        return Fail(ErrorCode::InternalError, error, "Synthesized tokens failed to parse: " + parseError.message);
      }
      out = document.val;
      return ErrorCode::OK;
    }

    inline ErrorCode SynthesizeKey(const Value& value, const Settings& settings, NodePtr& out, Error* error)
    {
      Tokens tokens;
      ErrorCode errorCode = Synthesize(value, settings, true, false, tokens, error);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      tokens.push_back(Token{TokenKind::Eof, {}});
      Parser parser(tokens);
      return parser.ParseKey(out, error);
    }
  } // namespace detail

  // Index of key within a container node. Map keys compare by decoded value; list indices may be negative.
  inline ErrorCode Locate(const Node& node, const Value& key, std::size_t& index, Error* error = nullptr)
  {
    if (node.isMap())
    {
      const Map& map = node.asMap();
      for (std::size_t position = 0; position < map.items.size(); ++position)
      {
        if (detail::KeysEqual(detail::KeyOf(*map.items[position]), key))
        {
          index = position;
          return ErrorCode::OK;
        }
      }
      return detail::Fail(ErrorCode::KeyNotFound, error, "Key not found");
    }
    if (node.isList())
    {
      if (!key.isInt())
      {
        return detail::Fail(ErrorCode::IndexOutOfRange, error, "List indices must be integers");
      }
      const std::int64_t size = static_cast<std::int64_t>(node.asList().items.size());
      std::int64_t position = key.asInt();
      if (position < 0)
      {
        position += size;
      }
      if (position < 0 || position >= size)
      {
        return detail::Fail(ErrorCode::IndexOutOfRange, error, "List index out of range");
      }
      index = static_cast<std::size_t>(position);
      return ErrorCode::OK;
    }
    return detail::Fail(ErrorCode::NotIndexable, error, "Value is not indexable");
  }

  // Item at the end of path; the document itself for an empty path. The pointer lives as long as root.
  inline ErrorCode Get(const Document& root, const Path& path, const Item*& out, Error* error = nullptr)
  {
    const Item* current = &root;
    for (const Value& key : path)
    {
      std::size_t index = 0;
      ErrorCode errorCode = Locate(*current->val, key, index, error);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      current = current->val->asContainer()->items[index].get();
    }
    out = current;
    return ErrorCode::OK;
  }

  namespace detail
  {
    inline bool EndsWithNewLine(const Tokens& tokens)
    {
      return !tokens.empty() && tokens.back().kind == TokenKind::NewLine;
    }

    inline NodePtr WithItems(const Node& node, std::vector<ItemPtr> items)
    {
      if (node.isMap())
      {
        Map map = node.asMap();
        map.items = std::move(items);
        return std::make_shared<const Node>(std::move(map));
      }
      List list = node.asList();
      list.items = std::move(items);
      return std::make_shared<const Node>(std::move(list));
    }

    // Path-copying update: transform builds the new items of the terminal item's container, and every
    // ancestor is rebuilt with just the one changed child swapped in.
    template <typename Transform>
    ErrorCode ModifyItems(
      const Item& item,
      const Path& path,
      std::size_t depth,
      const Transform& transform,
      Item& out,
      Error* error)
    {
      std::size_t index = 0;
      ErrorCode errorCode = Locate(*item.val, path[depth], index, error);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      const Container& container = *item.val->asContainer();

      std::vector<ItemPtr> items;
      if (depth + 1 == path.size())
      {
        errorCode = transform(*item.val, index, items, error);
      }
      else
      {
        Item child;
        errorCode = ModifyItems(*container.items[index], path, depth + 1, transform, child, error);
        if (errorCode == ErrorCode::OK)
        {
          items = container.items;
          items[index] = std::make_shared<const Item>(std::move(child));
        }
      }
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }

      out = item;
      out.val = WithItems(*item.val, std::move(items));
      return ErrorCode::OK;
    }

    inline ErrorCode EraseItem(const Container& container, std::size_t index, std::vector<ItemPtr>& out, Error* error)
    {
      const Item& removed = *container.items[index];
      const bool isLineBased = container.IsMultiline() && !container.IsTopLevelStyle();
      std::vector<ItemPtr> items = container.items;
      items.erase(items.begin() + static_cast<std::ptrdiff_t>(index));

      if (container.IsTopLevelStyle() && items.empty())
      {
        return Fail(
          ErrorCode::CannotDeleteLastTopLevelItem,
          error,
          "Deleting the last entry of a top-level map would leave an invalid document");
      }
      // The new last item of an inline container must not keep its separating comma
      else if (!container.IsMultiline() && index + 1 == container.items.size())
      {
        if (!items.empty())
        {
          auto last = std::make_shared<Item>(*items.back());
          last->tail.clear();
          items.back() = std::move(last);
        }
      }
      // The removed item shared the previous item's line; the previous item takes over its line ending
      else if (isLineBased && index >= 1 && removed.head.empty() && EndsWithNewLine(removed.tail))
      {
        auto previous = std::make_shared<Item>(*items[index - 1]);
        previous->tail = removed.tail;
        items[index - 1] = std::move(previous);
      }
      // The following item shared the removed item's line; it now starts the line and needs the indentation
      else if (
        isLineBased && index + 1 < container.items.size() && !removed.head.empty() &&
        !EndsWithNewLine(removed.tail))
      {
        auto next = std::make_shared<Item>(*items[index]);
        next->head = removed.head;
        items[index] = std::move(next);
      }
      out = std::move(items);
      return ErrorCode::OK;
    }
  } // namespace detail

  // Replaces the value at path. Only the value changes: the item's indentation, comments and comma stay.
  inline ErrorCode
  SetValue(const Document& root, const Path& path, const Value& value, Document& out, Error* error = nullptr)
  {
    if (path.empty())
    {
      NodePtr node;
      ErrorCode errorCode = detail::SynthesizeNode(value, Settings{}, false, node, error);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      out = root;
      out.val = std::move(node);
      return ErrorCode::OK;
    }

    auto transform = [&value](const Node& parent, std::size_t index, std::vector<ItemPtr>& items, Error* error) {
      NodePtr node;
      ErrorCode errorCode = detail::SynthesizeNode(value, Settings{}, false, node, error);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      items = parent.asContainer()->items;
      auto item = std::make_shared<Item>(*items[index]);
      item->val = std::move(node);
      items[index] = std::move(item);
      return ErrorCode::OK;
    };
    return detail::ModifyItems(root, path, 0, transform, out, error);
  }

  // Renames the map entry at path, keeping its value and formatting
  inline ErrorCode SetKey(const Document& root, const Path& path, const Value& key, Document& out, Error* error = nullptr)
  {
    if (path.empty())
    {
      return detail::Fail(ErrorCode::NotAMap, error, "Index into a map to replace a key");
    }

    auto transform = [&key](const Node& parent, std::size_t index, std::vector<ItemPtr>& items, Error* error) {
      if (!parent.isMap())
      {
        return detail::Fail(ErrorCode::NotAMap, error, "Only map entries have keys");
      }
      NodePtr keyNode;
      ErrorCode errorCode = detail::SynthesizeKey(key, Settings{}, keyNode, error);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      const Map& map = parent.asMap();
      const Value& newKey = keyNode->asPrimitive().val;
      for (std::size_t position = 0; position < map.items.size(); ++position)
      {
        if (position != index && detail::KeysEqual(detail::KeyOf(*map.items[position]), newKey))
        {
          return detail::Fail(ErrorCode::DuplicateKey, error, "A map entry with this key already exists");
        }
      }
      items = map.items;
      auto item = std::make_shared<Item>(*items[index]);
      item->key = std::move(keyNode);
      items[index] = std::move(item);
      return ErrorCode::OK;
    };
    return detail::ModifyItems(root, path, 0, transform, out, error);
  }

  // Removes the item at path and repairs the commas / line breaks around it
  inline ErrorCode Erase(const Document& root, const Path& path, Document& out, Error* error = nullptr)
  {
    if (path.empty())
    {
      return detail::Fail(ErrorCode::InvalidPath, error, "Index into a container to delete an item");
    }

    auto transform = [](const Node& parent, std::size_t index, std::vector<ItemPtr>& items, Error* error) {
      return detail::EraseItem(*parent.asContainer(), index, items, error);
    };
    return detail::ModifyItems(root, path, 0, transform, out, error);
  }

  // A view of one location inside a shared document. Views derived from the same root share its cell, so an
  // edit through any of them is seen by all. Not synchronized: use from a single writer at a time.
  class DocumentProxy
  {
  public:
    explicit DocumentProxy(Document document) : mRoot(std::make_shared<Document>(std::move(document)))
    {
      if (!mRoot->val)
      {
        Error error;
        detail::Fail(ErrorCode::InvalidValue, &error, "Document has no root value");
        throw Exception(error);
      }
    }

    DocumentProxy(const DocumentProxy&) = default;
    DocumentProxy& operator=(const DocumentProxy&) = delete;

    DocumentProxy operator[](Value key) const
    {
      Path path = mPath;
      path.push_back(std::move(key));
      return DocumentProxy(mRoot, std::move(path));
    }

    DocumentProxy& operator=(const Value& value)
    {
      ReplaceValue(value);
      return *this;
    }

    void ReplaceValue(const Value& value)
    {
      Document document;
      Error error;
      if (SetValue(*mRoot, mPath, value, document, &error) != ErrorCode::OK)
      {
        throw Exception(error);
      }
      *mRoot = std::move(document);
    }

    void ReplaceKey(const Value& key)
    {
      Document document;
      Error error;
      if (SetKey(*mRoot, mPath, key, document, &error) != ErrorCode::OK)
      {
        throw Exception(error);
      }
      *mRoot = std::move(document);
    }

    void Erase(const Value& key)
    {
      (*this)[key].Erase();
    }

    void Erase()
    {
      Document document;
      Error error;
      if (loconf::Erase(*mRoot, mPath, document, &error) != ErrorCode::OK)
      {
        throw Exception(error);
      }
      *mRoot = std::move(document);
    }

    Value ToValue() const
    {
      const Item* item = nullptr;
      Error error;
      if (Get(*mRoot, mPath, item, &error) != ErrorCode::OK)
      {
        throw Exception(error);
      }
      return loconf::ToValue(*item->val);
    }

    // Text of the whole document, not just this view
    std::string ToString() const
    {
      return Unparse(*mRoot);
    }

    const Path& GetPath() const
    {
      return mPath;
    }

    const Document& GetDocument() const
    {
      return *mRoot;
    }

  private:
    DocumentProxy(std::shared_ptr<Document> root, Path path) : mRoot(std::move(root)), mPath(std::move(path))
    {}

    std::shared_ptr<Document> mRoot;
    Path mPath;
  };

  struct DumpOptions
  {
    bool indented = true; // Multiline containers; otherwise everything on one line
    bool bareKeys = true;
    bool topLevelMap = true; // Braceless root map
    bool inlineSmallContainers = true; // Containers with fewer than two items stay inline
  };

  namespace detail
  {
    inline ErrorCode ReadTextFile(const std::string& path, std::string& out, Error* error)
    {
      auto fileStream = OpenFileUTF8(path, "rb");
      if (!fileStream)
      {
        return Fail(ErrorCode::IoError, error, "Failed to open file");
      }
      if (std::fseek(fileStream.get(), 0, SEEK_END) != 0)
      {
        return Fail(ErrorCode::IoError, error, "Failed to read file");
      }
      long size = std::ftell(fileStream.get());
      if (size < 0 || std::fseek(fileStream.get(), 0, SEEK_SET) != 0)
      {
        return Fail(ErrorCode::IoError, error, "Failed to read file");
      }
      std::string data(static_cast<std::size_t>(size), '\0');
      if (!data.empty())
      {
        if (std::fread(&data[0], 1, static_cast<std::size_t>(size), fileStream.get()) != static_cast<std::size_t>(size))
        {
          return Fail(ErrorCode::IoError, error, "Failed to read file");
        }
      }
      out = std::move(data);
      return ErrorCode::OK;
    }

    inline ErrorCode WriteTextFile(const std::string& path, std::string_view text, Error* error)
    {
      auto fileStream = OpenFileUTF8(path, "wb");
      if (!fileStream)
      {
        return Fail(ErrorCode::IoError, error, "Failed to open file for writing");
      }
      if (!text.empty())
      {
        if (std::fwrite(text.data(), 1, text.size(), fileStream.get()) != text.size())
        {
          return Fail(ErrorCode::IoError, error, "Failed to write file");
        }
      }
      return ErrorCode::OK;
    }

    inline ErrorCode ReadStream(std::istream& stream, std::string& out, Error* error)
    {
      std::string data{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
      if (stream.bad())
      {
        return Fail(ErrorCode::IoError, error, "Failed to read stream");
      }
      out = std::move(data);
      return ErrorCode::OK;
    }

    inline ErrorCode WriteStream(std::ostream& stream, std::string_view text, Error* error)
    {
      stream.write(text.data(), static_cast<std::streamsize>(text.size()));
      if (!stream)
      {
        return Fail(ErrorCode::IoError, error, "Failed to write stream");
      }
      return ErrorCode::OK;
    }

    inline void ThrowIfFailed(ErrorCode errorCode, const Error& error)
    {
      if (errorCode != ErrorCode::OK)
      {
        throw Exception(error);
      }
    }
  } // namespace detail

  inline ErrorCode Loads(std::string_view src, Value& out, Error* error = nullptr)
  {
    Document document;
    ErrorCode errorCode = ParseDocument(src, document, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    out = ToValue(*document.val);
    return ErrorCode::OK;
  }

  inline ErrorCode Load(std::istream& stream, Value& out, Error* error = nullptr)
  {
    std::string data;
    ErrorCode errorCode = detail::ReadStream(stream, data, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    return Loads(data, out, error);
  }

  inline ErrorCode LoadFile(const std::string& path, Value& out, Error* error = nullptr)
  {
    std::string data;
    ErrorCode errorCode = detail::ReadTextFile(path, data, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    return Loads(data, out, error);
  }

  inline ErrorCode Dumps(const Value& value, std::string& out, const DumpOptions& options = {}, Error* error = nullptr)
  {
    Settings settings;
    settings.indent = options.indented ? 0 : -1;
    settings.bareKeys = options.bareKeys;
    settings.inlineSmallContainers = options.inlineSmallContainers;

    NodePtr node;
    ErrorCode errorCode = detail::SynthesizeNode(value, settings, options.topLevelMap, node, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    out = Unparse(*node);
    return ErrorCode::OK;
  }

  inline ErrorCode
  Dump(const Value& value, std::ostream& stream, const DumpOptions& options = {}, Error* error = nullptr)
  {
    std::string text;
    ErrorCode errorCode = Dumps(value, text, options, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    return detail::WriteStream(stream, text, error);
  }

  inline ErrorCode
  DumpFile(const std::string& path, const Value& value, const DumpOptions& options = {}, Error* error = nullptr)
  {
    std::string text;
    ErrorCode errorCode = Dumps(value, text, options, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    return detail::WriteTextFile(path, text, error);
  }

  // Throwing wrappers
  inline Value LoadsOrThrow(std::string_view src)
  {
    Value value;
    Error error;
    detail::ThrowIfFailed(Loads(src, value, &error), error);
    return value;
  }

  inline Value LoadOrThrow(std::istream& stream)
  {
    Value value;
    Error error;
    detail::ThrowIfFailed(Load(stream, value, &error), error);
    return value;
  }

  inline Value LoadFileOrThrow(const std::string& path)
  {
    Value value;
    Error error;
    detail::ThrowIfFailed(LoadFile(path, value, &error), error);
    return value;
  }

  inline std::string DumpsOrThrow(const Value& value, const DumpOptions& options = {})
  {
    std::string text;
    Error error;
    detail::ThrowIfFailed(Dumps(value, text, options, &error), error);
    return text;
  }

  inline void DumpOrThrow(const Value& value, std::ostream& stream, const DumpOptions& options = {})
  {
    Error error;
    detail::ThrowIfFailed(Dump(value, stream, options, &error), error);
  }

  inline DocumentProxy LoadsRoundtrip(std::string_view src)
  {
    Document document;
    Error error;
    detail::ThrowIfFailed(ParseDocument(src, document, &error), error);
    return DocumentProxy(std::move(document));
  }

  inline DocumentProxy LoadRoundtrip(std::istream& stream)
  {
    std::string data;
    Error error;
    detail::ThrowIfFailed(detail::ReadStream(stream, data, &error), error);
    return LoadsRoundtrip(data);
  }

  inline DocumentProxy LoadRoundtripFile(const std::string& path)
  {
    std::string data;
    Error error;
    detail::ThrowIfFailed(detail::ReadTextFile(path, data, &error), error);
    return LoadsRoundtrip(data);
  }

  inline std::string DumpsRoundtrip(const DocumentProxy& proxy)
  {
    return Unparse(proxy.GetDocument());
  }

  inline void DumpRoundtrip(const DocumentProxy& proxy, std::ostream& stream)
  {
    Error error;
    detail::ThrowIfFailed(detail::WriteStream(stream, DumpsRoundtrip(proxy), &error), error);
  }

  inline void DumpRoundtripFile(const DocumentProxy& proxy, const std::string& path)
  {
    Error error;
    detail::ThrowIfFailed(detail::WriteTextFile(path, DumpsRoundtrip(proxy), &error), error);
  }
}

#endif
