#include "rowan/discovery/theory_discoverer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "rowan/common/logging.hpp"
#include "rowan/data/data_attribute.hpp"
#include "rowan/data/data_resolver.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/discovery/test_catalog.hpp"
#include "rowan/messages/message.hpp"
#include "rowan/messages/test_case_serialization.hpp"
#include "rowan/reflect/argument_formatter.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::discovery {

namespace {

constexpr std::string_view kMissing = "???";

struct SourcedRow {
  const data::DataAttribute* source;
  data::TheoryDataRow row;
};

void MergeTraits(data::TraitMap& into, const data::TraitMap& from) {
  for (const auto& [name, values] : from) {
    auto& target = into[name];
    target.insert(target.end(), values.begin(), values.end());
  }
}

// Why `theory` cannot be reported row by row, or nullopt if it can.
auto SingleCaseReason(const Theory& theory, const DiscoveryOptions& options)
    -> std::optional<std::string> {
  if (theory.skip) {
    return "theory is skipped";
  }
  if (!options.pre_enumerate_theories) {
    return "pre-enumeration is disabled";
  }
  for (const auto& source : theory.data_sources) {
    if (!source->SupportsDiscoveryEnumeration()) {
      return fmt::format(
          "{} disables discovery enumeration",
          source->Describe(theory.method));
    }
  }
  return std::nullopt;
}

}  // namespace

auto FormatDisplayName(
    std::string_view base_name, const reflect::TestMethod& method,
    const std::vector<reflect::Value>& arguments) -> std::string {
  const auto& parameters = method.Parameters();
  size_t count = std::max(parameters.size(), arguments.size());
  if (count == 0) {
    return std::string(base_name);
  }

  std::string result(base_name);
  result += '(';
  for (size_t i = 0; i < count; ++i) {
    if (i != 0) {
      result += ", ";
    }
    std::string_view name =
        i < parameters.size() ? std::string_view(parameters[i].name)
                              : kMissing;
    std::string value =
        i < arguments.size() ? reflect::FormatArgument(arguments[i])
                             : std::string(kMissing);
    result += fmt::format("{}: {}", name, value);
  }
  result += ')';
  return result;
}

auto MakeUniqueId(std::initializer_list<std::string_view> parts)
    -> std::string {
  constexpr uint64_t kFnvPrime = 0x00000100000001B3ULL;
  constexpr uint64_t kFnvBasis = 0xcbf29ce484222325ULL;
  uint64_t hash = kFnvBasis;
  for (std::string_view part : parts) {
    for (char c : part) {
      hash ^= static_cast<uint8_t>(c);
      hash *= kFnvPrime;
    }
    // Separator, so that {"ab", "c"} and {"a", "bc"} differ.
    hash ^= 0xff;
    hash *= kFnvPrime;
  }
  return fmt::format("{:016x}", hash);
}

TheoryDiscoverer::TheoryDiscoverer(
    const TestCatalog& catalog, DiscoveryOptions options)
    : catalog_(&catalog),
      options_(options),
      assembly_unique_id_(MakeUniqueId({catalog.AssemblyName()})) {
}

auto TheoryDiscoverer::Discover(const Theory& theory) const
    -> std::vector<messages::TestCaseDiscovered> {
  const auto& method = theory.method;
  auto single_case = [&](const std::string& reason) {
    common::Logger()->debug(
        "'{}' is reported as a single test case: {}", method.QualifiedName(),
        reason);
    std::vector<messages::TestCaseDiscovered> result;
    result.push_back(MakeTestCase(theory, nullptr, nullptr, 0));
    return result;
  };

  if (auto reason = SingleCaseReason(theory, options_)) {
    return single_case(*reason);
  }

  std::vector<SourcedRow> rows;
  for (const auto& source : theory.data_sources) {
    for (auto& row : data::Resolve(*source, method)) {
      for (const auto& argument : row.GetData()) {
        if (!messages::IsSerializable(argument)) {
          return single_case(
              fmt::format(
                  "{} yielded a non-serializable argument of type '{}'",
                  source->Describe(method), argument.TypeName()));
        }
      }
      rows.push_back(SourcedRow{.source = source.get(), .row = std::move(row)});
    }
  }
  if (rows.empty()) {
    return single_case("no data rows");
  }

  std::vector<messages::TestCaseDiscovered> result;
  result.reserve(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    result.push_back(MakeTestCase(theory, rows[i].source, &rows[i].row, i));
  }
  return result;
}

auto TheoryDiscoverer::Run(
    const MessageSink& sink, const TheoryFilter& filter) const -> int {
  messages::DiscoveryStarting starting;
  starting.SetAssemblyUniqueId(assembly_unique_id_);
  starting.SetAssemblyName(catalog_->AssemblyName());
  sink(starting);

  int count = 0;
  for (const auto& theory : catalog_->Theories()) {
    if (filter && !filter(theory)) {
      continue;
    }
    for (const auto& test_case : Discover(theory)) {
      sink(test_case);
      ++count;
    }
  }

  messages::DiscoveryComplete complete;
  complete.SetAssemblyUniqueId(assembly_unique_id_);
  complete.SetTestCasesToRun(count);
  sink(complete);
  return count;
}

auto TheoryDiscoverer::MakeTestCase(
    const Theory& theory, const data::DataAttribute* source,
    const data::TheoryDataRow* row, size_t index) const
    -> messages::TestCaseDiscovered {
  const auto& method = theory.method;
  const reflect::Type* type = method.DeclaringType();
  std::string class_name = type != nullptr ? type->FullName() : "";

  std::string collection_id =
      MakeUniqueId({assembly_unique_id_, "collection", class_name});
  std::optional<std::string> class_id;
  if (type != nullptr) {
    class_id = MakeUniqueId({collection_id, class_name});
  }
  std::string method_id =
      MakeUniqueId({class_id.value_or(collection_id), method.Name()});

  messages::SerializedTestCase identity{
      .class_name = class_name,
      .method_name = method.Name(),
      .arguments = std::nullopt};
  if (row != nullptr) {
    identity.arguments = row->GetData();
  }
  std::string serialization = messages::SerializeTestCase(identity);

  messages::TestCaseDiscovered test_case;
  test_case.SetAssemblyUniqueId(assembly_unique_id_);
  test_case.SetTestCollectionUniqueId(collection_id);
  test_case.SetTestClassUniqueId(class_id);
  test_case.SetTestMethodUniqueId(method_id);
  test_case.SetTestCaseUniqueId(
      MakeUniqueId({method_id, serialization, fmt::format("{}", index)}));
  test_case.SetSerialization(serialization);
  test_case.SetSourceFilePath(theory.source_file_path);
  test_case.SetSourceLineNumber(theory.source_line_number);
  test_case.SetTestMethodName(method.Name());
  if (type != nullptr) {
    test_case.SetTestClassName(std::string(type->Name()));
    test_case.SetTestClassNameWithNamespace(type->FullName());
    if (!type->Namespace().empty()) {
      test_case.SetTestClassNamespace(std::string(type->Namespace()));
    }
  } else {
    test_case.SetTestClassName(std::string());
    test_case.SetTestClassNameWithNamespace(std::string());
  }

  std::string base_name = method.QualifiedName();
  std::optional<std::string> skip = theory.skip;
  bool explicit_test = false;
  data::TraitMap traits = theory.traits;
  if (source != nullptr) {
    if (source->TestDisplayName()) {
      base_name = *source->TestDisplayName();
    }
    if (source->Skip()) {
      skip = source->Skip();
    }
    explicit_test = source->Explicit().value_or(explicit_test);
    MergeTraits(traits, source->Traits());
  }
  if (row != nullptr) {
    if (row->TestDisplayName()) {
      base_name = *row->TestDisplayName();
    }
    if (row->Skip()) {
      skip = row->Skip();
    }
    explicit_test = row->Explicit().value_or(explicit_test);
    MergeTraits(traits, row->Traits());
  }

  test_case.SetTestCaseDisplayName(
      row != nullptr ? FormatDisplayName(base_name, method, row->GetData())
                     : base_name);
  test_case.SetSkipReason(std::move(skip));
  test_case.SetExplicit(explicit_test);
  test_case.SetTraits(std::move(traits));
  return test_case;
}

}  // namespace rowan::discovery
