#include "rowan/data/data_resolver.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "rowan/async/event_loop.hpp"
#include "rowan/common/internal_error.hpp"
#include "rowan/common/logging.hpp"
#include "rowan/common/overloaded.hpp"
#include "rowan/data/class_data_attribute.hpp"
#include "rowan/data/data_attribute.hpp"
#include "rowan/data/member_data_attribute.hpp"
#include "rowan/data/theory_data_row.hpp"

namespace rowan::data {

auto MakeDataAttribute(const DataSourceDescriptor& descriptor)
    -> std::unique_ptr<DataAttribute> {
  return std::visit(
      Overloaded{
          [](const ClassDataSource& source) -> std::unique_ptr<DataAttribute> {
            if (source.data_class == nullptr) {
              throw std::invalid_argument("class data requires a data class");
            }
            return std::make_unique<ClassDataAttribute>(*source.data_class);
          },
          [](const MemberDataSource& source) -> std::unique_ptr<DataAttribute> {
            auto attribute = std::make_unique<MemberDataAttribute>(
                source.member_name, source.parameters);
            attribute->SetMemberType(source.member_type);
            return attribute;
          },
      },
      descriptor);
}

auto Resolve(
    const DataSourceDescriptor& descriptor,
    const reflect::TestMethod* test_method) -> ResolvedDataSet {
  if (test_method == nullptr) {
    throw std::invalid_argument("data resolution requires a test method");
  }
  auto attribute = MakeDataAttribute(descriptor);
  return Resolve(*attribute, *test_method);
}

auto Resolve(
    const DataAttribute& attribute, const reflect::TestMethod& test_method)
    -> ResolvedDataSet {
  common::Logger()->debug(
      "resolving {} for '{}'", attribute.Describe(test_method),
      test_method.QualifiedName());
  async::EventLoop loop;
  auto rows = loop.RunUntilComplete(attribute.GetData(test_method));
  common::Logger()->debug(
      "resolved {} rows for '{}'", rows.size(), test_method.QualifiedName());
  return rows;
}

DataResolution::DataResolution(
    async::EventLoop& loop, const DataAttribute& attribute,
    const reflect::TestMethod& test_method)
    : loop_(&loop), task_(attribute.GetData(test_method, tracker_)) {
}

void DataResolution::Start() {
  if (started_) {
    return;
  }
  started_ = true;
  async::EventLoop::Activation active(*loop_);
  task_.Resume();
}

void DataResolution::Step() {
  if (!started_) {
    Start();
    return;
  }
  if (task_.Done()) {
    return;
  }
  if (!loop_->RunOne()) {
    common::ThrowInternalError(
        "DataResolution::Step",
        "resolution is suspended but nothing on the loop can resume it");
  }
}

auto DataResolution::Result() -> ResolvedDataSet {
  if (!Done()) {
    common::ThrowInternalError(
        "DataResolution::Result", "resolution has not completed");
  }
  return task_.Result();
}

}  // namespace rowan::data
