/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Formicary {

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
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue nullValue;
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr)
    return nullValue;
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue;
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
    stream << '"' << asString() << '"';
    break;
  case JsonType::Array: {
    stream << '[';
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ',';
      arr[i].writeToStream(stream);
    }
    stream << ']';
    break;
  }
  case JsonType::Object: {
    stream << '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ',';
      first = false;
      stream << '"' << key << "\":";
      value.writeToStream(stream);
    }
    stream << '}';
    break;
  }
  }
}

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
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (atEnd()) {
    return fail("Empty JSON input");
  }
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected content after JSON value");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, size_t depth) {
  if (depth > MAX_DEPTH) {
    return fail("Nesting deeper than " + std::to_string(MAX_DEPTH) + " levels");
  }

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
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    if (atEnd()) {
      return fail("Unexpected end of input");
    }
    return fail(std::string("Unexpected character: ") + peek());
  }
}

bool JsonReader::parseObject(JsonValue &out, size_t depth) {
  advance(); // '{'
  JsonObject members;

  skipWhitespace();
  if (consume('}')) {
    out = JsonValue(std::move(members));
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
    if (!consume(':')) {
      return fail("Expected ':' after object key");
    }

    JsonValue member;
    if (!parseValue(member, depth + 1))
      return false;
    members[key] = std::move(member);

    skipWhitespace();
    if (consume(','))
      continue;
    if (consume('}'))
      break;
    return fail("Expected '}' or ',' in object");
  }

  out = JsonValue(std::move(members));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, size_t depth) {
  advance(); // '['
  JsonArray elements;

  skipWhitespace();
  if (consume(']')) {
    out = JsonValue(std::move(elements));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth + 1))
      return false;
    elements.push_back(std::move(element));

    skipWhitespace();
    if (consume(','))
      continue;
    if (consume(']'))
      break;
    return fail("Expected ']' or ',' in array");
  }

  out = JsonValue(std::move(elements));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (!atEnd()) {
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd())
      break;
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
    case 'u':
      if (!appendUnicodeEscape(out))
        return false;
      break;
    default:
      return fail(std::string("Invalid escape sequence: \\") + escaped);
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  uint32_t codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
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
    advance();
    codepoint = (codepoint << 4) | digit;
  }

  // Basic multilingual plane only, config files never need more
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;
  auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

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

  std::string text = m_input.substr(start, m_position - start);
  try {
    out = JsonValue(std::stod(text));
  } catch (const std::exception &e) {
    return fail("Number out of range: " + text + " (" + e.what() + ")");
  }
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  for (const char *c = literal; *c != '\0'; ++c) {
    if (peek() != *c) {
      return fail(std::string("Invalid token, expected '") + literal + "'");
    }
    advance();
  }
  out = std::move(value);
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
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

bool JsonReader::consume(char expected) {
  if (peek() != expected || atEnd())
    return false;
  advance();
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                std::to_string(m_column) + ": " + message;
  return false;
}

} // namespace Formicary
