#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "rowan/data/data_attribute.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/discovery/test_catalog.hpp"
#include "rowan/messages/message.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::discovery {

struct DiscoveryOptions {
  // Resolve data during discovery and report one test case per row. When
  // off, every theory is reported as a single test case.
  bool pre_enumerate_theories = true;
};

// "Base(p1: v1, p2: v2)"; just "Base" when the method takes no parameters
// and no arguments are given. Values without a matching parameter are
// shown as "???: v", parameters without a value as "p: ???".
auto FormatDisplayName(
    std::string_view base_name, const reflect::TestMethod& method,
    const std::vector<reflect::Value>& arguments) -> std::string;

// Stable 16-digit hex id derived from `parts` (FNV-1a), identical across
// runs for identical input.
auto MakeUniqueId(std::initializer_list<std::string_view> parts)
    -> std::string;

// Turns theories into TestCaseDiscovered messages.
class TheoryDiscoverer {
 public:
  using MessageSink = std::function<void(const messages::Message&)>;
  using TheoryFilter = std::function<bool(const Theory&)>;

  TheoryDiscoverer(const TestCatalog& catalog, DiscoveryOptions options);

  // One test case per resolved row, or a single test case carrying no row
  // data when rows cannot be reported individually (pre-enumeration off,
  // a source that disables enumeration, a non-serializable row, a skipped
  // theory, no rows at all). Propagates DataResolutionError.
  [[nodiscard]] auto Discover(const Theory& theory) const
      -> std::vector<messages::TestCaseDiscovered>;

  // Sends DiscoveryStarting, every discovered test case of the theories
  // accepted by `filter`, then DiscoveryComplete. Returns the test case
  // count.
  auto Run(const MessageSink& sink, const TheoryFilter& filter = {}) const
      -> int;

  [[nodiscard]] auto AssemblyUniqueId() const -> const std::string& {
    return assembly_unique_id_;
  }

 private:
  [[nodiscard]] auto MakeTestCase(
      const Theory& theory, const data::DataAttribute* source,
      const data::TheoryDataRow* row, size_t index) const
      -> messages::TestCaseDiscovered;

  const TestCatalog* catalog_;
  DiscoveryOptions options_;
  std::string assembly_unique_id_;
};

}  // namespace rowan::discovery
