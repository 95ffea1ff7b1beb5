#include "core/flat_json.hpp"

#include "core/text_utils.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace benchtel::core::json {

namespace {

class FlatObjectParser {
public:
  explicit FlatObjectParser(std::string_view input) : input_(input) {}

  bool Parse(FlatObject& object, std::string& error) {
    object.clear();
    SkipWhitespace();
    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();
    if (!Match('}')) {
      while (true) {
        SkipWhitespace();
        std::string key;
        if (!ParseString(key, error)) {
          return false;
        }
        SkipWhitespace();
        if (!ConsumeChar(':', "expected ':' after object key", error)) {
          return false;
        }
        SkipWhitespace();
        FlatValue value;
        if (!ParseValue(value, error)) {
          return false;
        }
        object[key] = std::move(value);

        SkipWhitespace();
        if (Match('}')) {
          break;
        }
        if (!ConsumeChar(',', "expected ',' between object entries", error)) {
          return false;
        }
      }
    }

    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON object", error);
    }
    return true;
  }

private:
  bool ParseValue(FlatValue& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '"') {
      std::string text;
      if (!ParseString(text, error)) {
        return false;
      }
      value = std::move(text);
      return true;
    }
    if (c == '[') {
      std::vector<std::string> items;
      if (!ParseStringArray(items, error)) {
        return false;
      }
      value = std::move(items);
      return true;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      return ParseNumber(value, error);
    }
    if (StartsWith(input_.substr(pos_), "null")) {
      AdvanceN(4);
      value = std::monostate{};
      return true;
    }
    if (c == '{') {
      return Fail("nested objects are not supported in flat records", error);
    }
    return Fail("expected string, number, string array or null", error);
  }

  bool ParseStringArray(std::vector<std::string>& items, std::string& error) {
    items.clear();
    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string item;
      if (!ParseString(item, error)) {
        return false;
      }
      items.push_back(std::move(item));
      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }
  }

  // Reads the four hex digits after `\u` and appends the code point as UTF-8.
  // Surrogate pairs are not combined; the writer only emits control bytes.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    unsigned int code_point = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape in string", error);
      }
      const char c = Advance();
      unsigned int digit = 0;
      if (c >= '0' && c <= '9') {
        digit = static_cast<unsigned int>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        digit = static_cast<unsigned int>(c - 'a') + 10U;
      } else if (c >= 'A' && c <= 'F') {
        digit = static_cast<unsigned int>(c - 'A') + 10U;
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
      code_point = (code_point << 4U) | digit;
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }
    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      if (AtEnd()) {
        return Fail("unterminated escape sequence in string", error);
      }
      switch (Advance()) {
      case '"':
        output.push_back('"');
        break;
      case '\\':
        output.push_back('\\');
        break;
      case '/':
        output.push_back('/');
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      case 'u':
        if (!ParseUnicodeEscape(output, error)) {
          return false;
        }
        break;
      default:
        return Fail("unsupported escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  bool ParseNumber(FlatValue& value, std::string& error) {
    const std::size_t start = pos_;
    bool integral = true;
    while (!AtEnd()) {
      const char c = Peek();
      if (c == '.' || c == 'e' || c == 'E') {
        integral = false;
      } else if (c != '-' && c != '+' && std::isdigit(static_cast<unsigned char>(c)) == 0) {
        break;
      }
      Advance();
    }

    const std::string_view token = input_.substr(start, pos_ - start);
    if (integral) {
      if (const auto parsed = ParseInteger(token); parsed.has_value()) {
        value = static_cast<std::int64_t>(*parsed);
        return true;
      }
    }
    if (const auto parsed = ParseDouble(token); parsed.has_value()) {
      value = *parsed;
      return true;
    }
    return Fail("invalid number token '" + std::string(token) + "'", error);
  }

  void SkipWhitespace() {
    while (!AtEnd() && IsSpace(Peek())) {
      Advance();
    }
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

void AppendValue(std::ostringstream& out, const FlatValue& value) {
  if (std::holds_alternative<std::int64_t>(value)) {
    out << std::get<std::int64_t>(value);
  } else if (std::holds_alternative<double>(value)) {
    const double real = std::get<double>(value);
    if (std::isfinite(real)) {
      out << FormatShortestDouble(real);
    } else {
      out << "null";
    }
  } else if (std::holds_alternative<std::string>(value)) {
    out << '"' << EscapeJson(std::get<std::string>(value)) << '"';
  } else if (std::holds_alternative<std::vector<std::string>>(value)) {
    const auto& items = std::get<std::vector<std::string>>(value);
    if (items.empty()) {
      out << "[]";
      return;
    }
    out << "[\n";
    for (std::size_t i = 0; i < items.size(); ++i) {
      out << "    \"" << EscapeJson(items[i]) << '"' << (i + 1U < items.size() ? ",\n" : "\n");
    }
    out << "  ]";
  } else {
    out << "null";
  }
}

const FlatValue* FindField(const FlatObject& object, std::string_view key) {
  const auto it = object.find(std::string(key));
  if (it == object.end()) {
    return nullptr;
  }
  return &it->second;
}

} // namespace

std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

std::string ToPrettyJson(const std::vector<FlatField>& fields) {
  std::ostringstream out;
  out << "{\n";
  for (std::size_t i = 0; i < fields.size(); ++i) {
    out << "  \"" << EscapeJson(fields[i].key) << "\": ";
    AppendValue(out, fields[i].value);
    out << (i + 1U < fields.size() ? ",\n" : "\n");
  }
  out << "}\n";
  return out.str();
}

bool ParseFlatObject(std::string_view input, FlatObject& object, std::string& error) {
  FlatObjectParser parser(input);
  return parser.Parse(object, error);
}

std::optional<double> FindNumber(const FlatObject& object, std::string_view key) {
  const FlatValue* value = FindField(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (const auto* real = std::get_if<double>(value)) {
    return *real;
  }
  if (const auto* integer = std::get_if<std::int64_t>(value)) {
    return static_cast<double>(*integer);
  }
  return std::nullopt;
}

std::optional<std::int64_t> FindInteger(const FlatObject& object, std::string_view key) {
  const FlatValue* value = FindField(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (const auto* integer = std::get_if<std::int64_t>(value)) {
    return *integer;
  }
  return std::nullopt;
}

std::optional<std::string> FindString(const FlatObject& object, std::string_view key) {
  const FlatValue* value = FindField(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (const auto* text = std::get_if<std::string>(value)) {
    return *text;
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>> FindStringList(const FlatObject& object,
                                                       std::string_view key) {
  const FlatValue* value = FindField(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (const auto* items = std::get_if<std::vector<std::string>>(value)) {
    return *items;
  }
  return std::nullopt;
}

} // namespace benchtel::core::json
