#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "rowan/messages/message.hpp"

namespace rowan::reporters {

// What reporters need to know about a running test after TestStarting.
struct TestMetadata {
  std::string test_display_name;
  bool explicit_test = false;
};

// Test metadata keyed by test unique id, so that later messages, which only
// carry the id, can be reported by name.
class MetadataCache {
 public:
  void Set(const messages::TestStarting& message);

  // nullopt for tests never seen starting. With `remove` the entry is
  // evicted; use it for the last message a test produces.
  auto TryGetTestMetadata(
      const messages::TestMessage& message, bool remove = false)
      -> std::optional<TestMetadata>;

  [[nodiscard]] auto Size() const -> size_t {
    return tests_.size();
  }

 private:
  std::unordered_map<std::string, TestMetadata> tests_;
};

}  // namespace rowan::reporters
