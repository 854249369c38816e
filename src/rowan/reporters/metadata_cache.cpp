#include "rowan/reporters/metadata_cache.hpp"

#include <optional>
#include <utility>

#include "rowan/messages/message.hpp"

namespace rowan::reporters {

void MetadataCache::Set(const messages::TestStarting& message) {
  tests_.insert_or_assign(
      message.TestUniqueId(),
      TestMetadata{
          .test_display_name = message.TestDisplayName(),
          .explicit_test = message.Explicit()});
}

auto MetadataCache::TryGetTestMetadata(
    const messages::TestMessage& message, bool remove)
    -> std::optional<TestMetadata> {
  auto it = tests_.find(message.TestUniqueId());
  if (it == tests_.end()) {
    return std::nullopt;
  }
  if (!remove) {
    return it->second;
  }
  TestMetadata metadata = std::move(it->second);
  tests_.erase(it);
  return metadata;
}

}  // namespace rowan::reporters
