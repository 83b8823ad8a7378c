/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace CloudDefenders {

namespace {

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
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

void writeEscaped(std::string &out, const std::string &text) {
  out += '"';
  for (char c : text) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
        out += buffer;
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

void writeNumber(std::string &out, double value) {
  if (!std::isfinite(value)) {
    out += "null";  // JSON has no NaN/Inf
    return;
  }
  if (value == std::floor(value) && std::abs(value) < 1e15) {
    out += std::to_string(static_cast<long long>(value));
    return;
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.9g", value);
  out += buffer;
}

void newline(std::string &out, int indent, int depth) {
  if (indent > 0) {
    out += '\n';
    out.append(static_cast<size_t>(indent * depth), ' ');
  }
}

} // namespace

std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null: return os << "Null";
  case JsonType::Boolean: return os << "Boolean";
  case JsonType::Number: return os << "Number";
  case JsonType::String: return os << "String";
  case JsonType::Array: return os << "Array";
  case JsonType::Object: return os << "Object";
  }
  return os << "Unknown";
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool()) return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber()) return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber()) return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString()) return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue nullValue;
  if (!isObject()) return nullValue;
  auto it = asObject().find(key);
  return it != asObject().end() ? it->second : nullValue;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue nullValue;
  if (!isArray() || index >= asArray().size()) return nullValue;
  return asArray()[index];
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

size_t JsonValue::size() const {
  if (isArray()) return asArray().size();
  if (isObject()) return asObject().size();
  return 0;
}

std::string JsonValue::toString(int indent) const {
  std::string out;
  write(out, indent, 0);
  return out;
}

void JsonValue::write(std::string &out, int indent, int depth) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number:
    writeNumber(out, asNumber());
    break;
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    const auto &array = asArray();
    out += '[';
    for (size_t i = 0; i < array.size(); ++i) {
      if (i > 0) out += ',';
      newline(out, indent, depth + 1);
      array[i].write(out, indent, depth + 1);
    }
    if (!array.empty()) newline(out, indent, depth);
    out += ']';
    break;
  }
  case JsonType::Object: {
    const auto &object = asObject();
    out += '{';
    bool first = true;
    for (const auto &[key, value] : object) {
      if (!first) out += ',';
      first = false;
      newline(out, indent, depth + 1);
      writeEscaped(out, key);
      out += indent > 0 ? ": " : ":";
      value.write(out, indent, depth + 1);
    }
    if (!object.empty()) newline(out, indent, depth);
    out += '}';
    break;
  }
  }
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Cannot open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const std::string content = buffer.str();
  return parse(content);
}

bool JsonReader::parse(std::string_view text) {
  m_input = text;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  bool ok = parseValue(root, 0);
  if (ok) {
    skipWhitespace();
    if (!atEnd()) {
      ok = fail("Unexpected trailing content");
    }
  }

  // m_input must not outlive the caller's buffer
  m_input = std::string_view();
  if (ok) {
    m_root = std::move(root);
  }
  return ok;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd()) return '\0';
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
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
    advance();
  }
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = message + " at line " + std::to_string(m_line) + ", column " +
                std::to_string(m_column);
  return false;
}

bool JsonReader::parseValue(JsonValue &out, size_t depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text)) return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!parseLiteral("true")) return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!parseLiteral("false")) return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!parseLiteral("null")) return false;
    out = JsonValue();
    return true;
  case '\0':
    if (atEnd()) return fail("Unexpected end of input");
    return fail("Unexpected character");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character '") + peek() + "'");
  }
}

bool JsonReader::parseObject(JsonValue &out, size_t depth) {
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
    if (peek() != '"') return fail("Expected string key");

    std::string key;
    if (!parseString(key)) return false;

    skipWhitespace();
    if (advance() != ':') return fail("Expected ':' after key");

    JsonValue value;
    if (!parseValue(value, depth + 1)) return false;
    object[key] = std::move(value);  // duplicate keys: last one wins

    skipWhitespace();
    char c = advance();
    if (c == '}') break;
    if (c != ',') return fail("Expected ',' or '}' in object");
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, size_t depth) {
  advance(); // [
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue value;
    if (!parseValue(value, depth + 1)) return false;
    array.push_back(std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == ']') break;
    if (c != ',') return fail("Expected ',' or ']' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (true) {
    if (atEnd()) return fail("Unterminated string");

    char c = advance();
    if (c == '"') return true;
    if (static_cast<unsigned char>(c) < 0x20) return fail("Control character in string");
    if (c != '\\') {
      out += c;
      continue;
    }

    char escape = advance();
    switch (escape) {
    case '"': out += '"'; break;
    case '\\': out += '\\'; break;
    case '/': out += '/'; break;
    case 'b': out += '\b'; break;
    case 'f': out += '\f'; break;
    case 'n': out += '\n'; break;
    case 'r': out += '\r'; break;
    case 't': out += '\t'; break;
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseUnicodeEscape(codepoint)) return false;

      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        // High surrogate; a low surrogate escape must follow
        if (advance() != '\\' || advance() != 'u') return fail("Unpaired surrogate");
        uint32_t low = 0;
        if (!parseUnicodeEscape(low)) return false;
        if (low < 0xDC00 || low > 0xDFFF) return fail("Invalid low surrogate");
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
        return fail("Unpaired surrogate");
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail("Invalid escape sequence");
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

  if (peek() == '-') advance();

  if (peek() == '0') {
    advance();
    if (peek() >= '0' && peek() <= '9') return fail("Leading zeros are not allowed");
  } else if (digits() == 0) {
    return fail("Expected digit");
  }

  if (peek() == '.') {
    advance();
    if (digits() == 0) return fail("Expected digit after decimal point");
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') advance();
    if (digits() == 0) return fail("Expected digit in exponent");
  }

  const std::string literal(m_input.substr(start, m_position - start));
  out = JsonValue(std::strtod(literal.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(std::string_view literal) {
  for (char expected : literal) {
    if (advance() != expected) {
      return fail("Invalid literal, expected '" + std::string(literal) + "'");
    }
  }
  return true;
}

} // namespace CloudDefenders
