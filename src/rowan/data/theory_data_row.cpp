#include "rowan/data/theory_data_row.hpp"

#include <optional>
#include <ostream>

#include "rowan/reflect/argument_formatter.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

auto ToTheoryDataRow(const reflect::Value& item)
    -> std::optional<TheoryDataRow> {
  switch (item.Kind()) {
    case reflect::ValueKind::kArray:
    case reflect::ValueKind::kTuple:
      return TheoryDataRow(item.Elements());
    case reflect::ValueKind::kRow:
      return item.AsRow();
    default:
      return std::nullopt;
  }
}

void PrintTo(const TheoryDataRow& row, std::ostream* os) {
  *os << reflect::FormatArgument(reflect::Value::Array(row.GetData()));
  if (row.TestDisplayName()) {
    *os << " name=\"" << *row.TestDisplayName() << "\"";
  }
  if (row.Skip()) {
    *os << " skip=\"" << *row.Skip() << "\"";
  }
}

}  // namespace rowan::data
