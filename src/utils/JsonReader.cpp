/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Strata {

namespace {
constexpr int MAX_NESTING_DEPTH = 128;

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

bool isDigit(char c) { return c >= '0' && c <= '9'; }

const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}
} // namespace

// JsonValue implementation
const JsonValue *JsonValue::find(const std::string &key) const {
  if (!isObject())
    return nullptr;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return it != obj.end() ? &it->second : nullptr;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonValue *found = find(key);
  return found ? *found : nullValue();
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

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    setError("Failed to open file: " + path);
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected trailing characters");
    return false;
  }

  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size()) {
    return '\0';
  }
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
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

bool JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (advance() != *p) {
      setError(std::string("Invalid literal, expected '") + literal + "'");
      return false;
    }
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return false;
  }

  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!expectLiteral("true")) {
      return false;
    }
    out = JsonValue(true);
    return true;
  case 'f':
    if (!expectLiteral("false")) {
      return false;
    }
    out = JsonValue(false);
    return true;
  case 'n':
    if (!expectLiteral("null")) {
      return false;
    }
    out = JsonValue();
    return true;
  case '\0':
    setError("Unexpected end of input");
    return false;
  default:
    if (peek() == '-' || isDigit(peek())) {
      return parseNumber(out);
    }
    setError(std::string("Unexpected character '") + peek() + "'");
    return false;
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
      setError("Expected string key in object");
      return false;
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }
    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after object key '" + key + "'");
      return false;
    }
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    object[key] = std::move(value);
    skipWhitespace();

    char c = advance();
    if (c == '}') {
      break;
    }
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return false;
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
    if (!parseValue(value, depth)) {
      return false;
    }
    array.push_back(std::move(value));
    skipWhitespace();

    char c = advance();
    if (c == ']') {
      break;
    }
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return false;
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (true) {
    if (m_position >= m_input.size()) {
      setError("Unterminated string");
      return false;
    }
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Control character in string");
      return false;
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    char escape = advance();
    switch (escape) {
    case '"':
    case '\\':
    case '/':
      out += escape;
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
      if (!parseUnicodeEscape(codepoint)) {
        return false;
      }
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u') {
          setError("Unpaired high surrogate in string");
          return false;
        }
        uint32_t low = 0;
        if (!parseUnicodeEscape(low) || low < 0xDC00 || low > 0xDFFF) {
          setError("Invalid low surrogate in string");
          return false;
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      setError(std::string("Invalid escape sequence '\\") + escape + "'");
      return false;
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    codepoint <<= 4;
    if (c >= '0' && c <= '9') {
      codepoint |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      codepoint |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      codepoint |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid unicode escape");
      return false;
    }
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;
  if (peek() == '-') {
    advance();
  }
  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek())) {
      advance();
    }
  } else {
    setError("Invalid number");
    return false;
  }
  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Expected digit after decimal point");
      return false;
    }
    while (isDigit(peek())) {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!isDigit(peek())) {
      setError("Expected digit in exponent");
      return false;
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = message + " at line " + std::to_string(m_line) +
                  ", column " + std::to_string(m_column);
  }
}

} // namespace Strata
