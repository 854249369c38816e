#include "rowan/reflect/argument_formatter.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::reflect {

namespace {

constexpr std::string_view kEllipsis = "...";

auto IsUtf8Continuation(char c) -> bool {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// At most `limit` bytes of `text`, never ending inside a UTF-8 sequence.
auto TruncateUtf8(std::string_view text, size_t limit) -> std::string_view {
  size_t cut = limit;
  while (cut > 0 && IsUtf8Continuation(text[cut])) {
    --cut;
  }
  return text.substr(0, cut);
}

auto FormatElements(
    const std::vector<Value>& elements, size_t depth, char open, char close)
    -> std::string;

auto FormatAtDepth(const Value& value, size_t depth) -> std::string {
  switch (value.Kind()) {
    case ValueKind::kNull:
      return "null";
    case ValueKind::kBool:
      return value.AsBool() ? "true" : "false";
    case ValueKind::kInt:
      return fmt::format("{}", value.AsInt());
    case ValueKind::kDouble:
      return fmt::format("{}", value.AsDouble());
    case ValueKind::kString: {
      const auto& text = value.AsString();
      if (text.size() > kMaxFormatStringLength) {
        auto head = TruncateUtf8(text, kMaxFormatStringLength);
        return fmt::format("\"{}\"{}", EscapeString(head), kEllipsis);
      }
      return fmt::format("\"{}\"", EscapeString(text));
    }
    case ValueKind::kArray:
      return FormatElements(value.Elements(), depth, '[', ']');
    case ValueKind::kTuple:
      return FormatElements(value.Elements(), depth, '(', ')');
    case ValueKind::kRow:
      return FormatElements(value.AsRow().GetData(), depth, '[', ']');
    case ValueKind::kSequence:
    case ValueKind::kAsyncSequence:
    case ValueKind::kDeferred:
    case ValueKind::kObject:
      return value.TypeName();
  }
  return value.TypeName();
}

auto FormatElements(
    const std::vector<Value>& elements, size_t depth, char open, char close)
    -> std::string {
  if (depth >= kMaxFormatDepth) {
    return fmt::format("{}{}{}", open, kEllipsis, close);
  }
  std::string result(1, open);
  for (size_t i = 0; i < elements.size(); ++i) {
    if (i != 0) {
      result += ", ";
    }
    if (i == kMaxFormatItems) {
      result += kEllipsis;
      break;
    }
    result += FormatAtDepth(elements[i], depth + 1);
  }
  result += close;
  return result;
}

}  // namespace

auto EscapeString(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\0':
        result += "\\0";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          result += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
        } else {
          result += c;
        }
    }
  }
  return result;
}

auto FormatArgument(const Value& value) -> std::string {
  return FormatAtDepth(value, 0);
}

}  // namespace rowan::reflect
