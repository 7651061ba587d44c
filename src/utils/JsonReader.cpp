/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace TerraNav {

namespace {
constexpr int MAX_NESTING_DEPTH = 64;

const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

void appendUtf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"': stream << "\\\""; break;
    case '\\': stream << "\\\\"; break;
    case '\n': stream << "\\n"; break;
    case '\t': stream << "\\t"; break;
    case '\r': stream << "\\r"; break;
    default: stream << c; break;
    }
  }
  stream << '"';
}

void writeValue(std::ostream &stream, const JsonValue &value) {
  switch (value.getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (value.asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = value.asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << std::setprecision(std::numeric_limits<double>::max_digits10) << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, value.asString());
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = value.asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      writeValue(stream, arr[i]);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, member] : value.asObject()) {
      if (!first)
        stream << ",";
      first = false;
      writeEscaped(stream, key);
      stream << ":";
      writeValue(stream, member);
    }
    stream << "}";
    break;
  }
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

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (!obj)
    return nullValue();
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *arr = std::get_if<JsonArray>(&m_value);
  if (!arr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = std::get_if<JsonArray>(&m_value))
    return arr->size();
  if (const JsonObject *obj = tryAsObject())
    return obj->size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeValue(oss, *this);
  return oss.str();
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0))
    return false;

  skipWhitespace();
  if (m_position < m_input.size())
    return fail("Unexpected trailing characters");

  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
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
  while (m_position < m_input.size()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::expect(char c) {
  skipWhitespace();
  if (peek() != c)
    return fail(std::string("Expected '") + c + "'");
  advance();
  return true;
}

bool JsonReader::consumeLiteral(const char *literal) {
  for (const char *p = literal; *p; ++p) {
    if (peek() != *p)
      return fail(std::string("Invalid literal, expected '") + literal + "'");
    advance();
  }
  return true;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = message + " at line " + std::to_string(m_line) +
                  ", column " + std::to_string(m_column);
  }
  return false;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_NESTING_DEPTH)
    return fail("Maximum nesting depth exceeded");

  skipWhitespace();
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
    if (!consumeLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!consumeLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!consumeLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    return fail("Unexpected end of input");
  default:
    return parseNumber(out);
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject members;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(members));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"')
      return fail("Expected string key");

    std::string key;
    if (!parseString(key) || !expect(':'))
      return false;

    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    members[key] = std::move(value);

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect('}'))
      return false;
    break;
  }

  out = JsonValue(std::move(members));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray elements;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(elements));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth + 1))
      return false;
    elements.push_back(std::move(element));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect(']'))
      return false;
    break;
  }

  out = JsonValue(std::move(elements));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (true) {
    if (m_position >= m_input.size())
      return fail("Unterminated string");

    char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20)
      return fail("Control character in string");
    if (c != '\\') {
      out += c;
      continue;
    }

    char esc = advance();
    switch (esc) {
    case '"': out += '"'; break;
    case '\\': out += '\\'; break;
    case '/': out += '/'; break;
    case 'b': out += '\b'; break;
    case 'f': out += '\f'; break;
    case 'n': out += '\n'; break;
    case 'r': out += '\r'; break;
    case 't': out += '\t'; break;
    case 'u': {
      uint32_t cp = 0;
      if (!parseUnicodeEscape(cp))
        return false;
      // Surrogate pair
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        uint32_t low = 0;
        if (peek() != '\\')
          return fail("Unpaired surrogate in string");
        advance();
        if (advance() != 'u' || !parseUnicodeEscape(low) || low < 0xDC00 || low > 0xDFFF)
          return fail("Invalid surrogate pair in string");
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, cp);
      break;
    }
    default:
      return fail("Invalid escape sequence");
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    codePoint <<= 4;
    if (c >= '0' && c <= '9')
      codePoint |= static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f')
      codePoint |= static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      codePoint |= static_cast<uint32_t>(c - 'A' + 10);
    else
      return fail("Invalid unicode escape");
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t begin = m_position;
  auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

  if (peek() == '-')
    advance();
  if (!isDigit(peek()))
    return fail("Unexpected character");
  if (peek() == '0') {
    advance();
  } else {
    while (isDigit(peek()))
      advance();
  }
  if (peek() == '.') {
    advance();
    if (!isDigit(peek()))
      return fail("Expected digit after decimal point");
    while (isDigit(peek()))
      advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek()))
      return fail("Expected digit in exponent");
    while (isDigit(peek()))
      advance();
  }

  out = JsonValue(std::strtod(m_input.c_str() + begin, nullptr));
  return true;
}

} // namespace TerraNav
