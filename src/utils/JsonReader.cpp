/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>

namespace TileNav {

namespace {
const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}
} // namespace

// JsonValue

JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  case 5:
    return JsonType::Object;
  default:
    return JsonType::Null;
  }
}

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

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().contains(key);
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : nullValue();
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

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
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
    stream << "\"" << asString() << "\"";
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      arr[i].writeToStream(stream);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ",";
      first = false;
      stream << "\"" << key << "\":";
      value.writeToStream(stream);
    }
    stream << "}";
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_line = 1;
    m_column = 1;
    return fail("Could not open file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_lastError.clear();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (m_position >= m_input.size()) {
    return fail("Empty JSON input");
  }
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (m_position < m_input.size()) {
    return fail("Unexpected token after JSON value");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Nesting too deep");
  }

  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string str;
    if (!parseString(str))
      return false;
    out = JsonValue(std::move(str));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  default:
    if (isDigit(c) || c == '-') {
      return parseNumber(out);
    }
    if (c == '\0') {
      return fail("Unexpected end of input");
    }
    return fail("Unexpected character: " + std::string(1, c));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject result;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(result));
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
    if (peek() != ':') {
      return fail("Expected ':' after object key");
    }
    advance();

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    result[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      return fail("Expected '}' or ',' in object");
    }
  }

  out = JsonValue(std::move(result));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray result;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(result));
    return true;
  }

  while (true) {
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    result.push_back(std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      return fail("Expected ']' or ',' in array");
    }
  }

  out = JsonValue(std::move(result));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (m_position < m_input.size()) {
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (c == '\\') {
      char escaped = advance();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out += escaped;
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
        uint32_t codepoint = 0;
        if (!parseUnicodeEscape(codepoint))
          return false;
        appendUtf8(out, codepoint);
        break;
      }
      case '\0':
        return fail("Unexpected end of input in string escape");
      default:
        return fail("Invalid escape sequence: \\" + std::string(1, escaped));
      }
    } else if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    } else {
      out += c;
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    return fail("Invalid number format");
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek()))
      return fail("Invalid number format: expected digit after decimal point");
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek()))
      return fail("Invalid number format: expected digit in exponent");
    while (isDigit(peek()))
      advance();
  }

  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return fail("Invalid number format: " + std::string(first, last));
  }

  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  std::string_view expected(literal);
  if (m_input.compare(m_position, expected.size(), expected) != 0) {
    return fail(std::format("Invalid token starting with '{}'", literal[0]));
  }
  for (size_t i = 0; i < expected.size(); ++i)
    advance();
  out = std::move(value);
  return true;
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid Unicode escape sequence");
    }
    codepoint = (codepoint << 4) | digit;
  }
  return true;
}

char JsonReader::peek() const {
  return (m_position < m_input.size()) ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (true) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
    } else {
      break;
    }
  }
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  return false;
}

} // namespace TileNav
