/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace DelveEngine {

namespace {

constexpr int MAX_NESTING_DEPTH = 128;

const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    case '\b':
      stream << "\\b";
      break;
    case '\f':
      stream << "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        static const char hex[] = "0123456789abcdef";
        stream << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}

void appendUtf8(std::string &out, uint32_t codePoint) {
  if (codePoint < 0x80) {
    out += static_cast<char>(codePoint);
  } else if (codePoint < 0x800) {
    out += static_cast<char>(0xC0 | (codePoint >> 6));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else if (codePoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codePoint >> 12));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codePoint >> 18));
    out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
}

} // namespace

// JsonValue

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) != 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : nullValue();
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray() || index >= asArray().size())
    return nullValue();
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

int JsonValue::getInt(const std::string &key, int fallback) const {
  return (*this)[key].tryAsInt().value_or(fallback);
}

double JsonValue::getNumber(const std::string &key, double fallback) const {
  return (*this)[key].tryAsNumber().value_or(fallback);
}

bool JsonValue::getBool(const std::string &key, bool fallback) const {
  return (*this)[key].tryAsBool().value_or(fallback);
}

std::string JsonValue::getString(const std::string &key,
                                 const std::string &fallback) const {
  return (*this)[key].tryAsString().value_or(fallback);
}

std::string JsonValue::toString(bool pretty) const {
  std::ostringstream oss;
  writeToStream(oss, pretty, 0);
  return oss.str();
}

void JsonValue::writeToStream(std::ostream &stream, bool pretty,
                              int depth) const {
  auto newline = [&](int level) {
    if (pretty) {
      stream << '\n' << std::string(static_cast<size_t>(level) * 2, ' ');
    }
  };

  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    stream << '[';
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ',';
      newline(depth + 1);
      arr[i].writeToStream(stream, pretty, depth + 1);
    }
    if (!arr.empty())
      newline(depth);
    stream << ']';
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    stream << '{';
    bool first = true;
    for (const auto &[key, value] : obj) {
      if (!first)
        stream << ',';
      first = false;
      newline(depth + 1);
      writeEscaped(stream, key);
      stream << (pretty ? ": " : ":");
      value.writeToStream(stream, pretty, depth + 1);
    }
    if (!obj.empty())
      newline(depth);
    stream << '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    JSON_ERROR(m_lastError);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (!parse(buffer.str())) {
    JSON_ERROR("Failed to parse " + path + ": " + m_lastError);
    return false;
  }
  JSON_DEBUG("Loaded " + path);
  return true;
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing content");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::saveToFile(const std::string &path, const JsonValue &value) {
  std::ofstream file(path);
  if (!file.is_open()) {
    JSON_ERROR("Could not open file for writing: " + path);
    return false;
  }
  file << value.toString(true) << '\n';
  return file.good();
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                  std::to_string(m_column) + ": " + message;
  }
  return false;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(nullptr), out);
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character '") + peek() + "'");
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // {
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after object key");
    }

    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    object[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      return fail("Expected ',' or '}' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // [
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    array.push_back(std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      return fail("Expected ',' or ']' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (true) {
    if (atEnd()) {
      return fail("Unterminated string");
    }
    char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    char escape = advance();
    switch (escape) {
    case '"':
      out += '"';
      break;
    case '\\':
      out += '\\';
      break;
    case '/':
      out += '/';
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      uint32_t codePoint = 0;
      if (!parseUnicodeEscape(codePoint))
        return false;
      // Surrogate pair
      if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u') {
          return fail("Unpaired high surrogate");
        }
        uint32_t low = 0;
        if (!parseUnicodeEscape(low))
          return false;
        if (low < 0xDC00 || low > 0xDFFF) {
          return fail("Invalid low surrogate");
        }
        codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codePoint);
      break;
    }
    default:
      return fail(std::string("Invalid escape sequence '\\") + escape + "'");
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    codePoint <<= 4;
    if (c >= '0' && c <= '9') {
      codePoint |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      codePoint |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      codePoint |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid unicode escape");
    }
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (digits() == 0) {
    return fail("Invalid number");
  }

  if (peek() == '.') {
    advance();
    if (digits() == 0) {
      return fail("Expected digits after decimal point");
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (digits() == 0) {
      return fail("Expected digits in exponent");
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (advance() != *p) {
      return fail(std::string("Invalid literal, expected '") + literal + "'");
    }
  }
  out = std::move(value);
  return true;
}

} // namespace DelveEngine
