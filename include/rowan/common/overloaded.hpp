#pragma once

namespace rowan {

// Builds a std::visit visitor out of lambdas, one per alternative:
//
//   std::visit(Overloaded{
//       [](const ClassDataSource& s) { ... },
//       [](const MemberDataSource& s) { ... },
//   }, descriptor);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace rowan
