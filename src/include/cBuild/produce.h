#pragma once

#include "cBuild/build.h"

#include <optional>

namespace cBuild {

// Resolves Build implementation by requested type:
//   auto V = cBuild::produce<uint64_t>();
// Result is exactly what Build<T>::build() returns.
template <Buildable T> T produce() { return Build<T>::build(); }

template <TryBuildable T> std::optional<T> tryProduce() {
  return TryBuild<T>::tryBuild();
}

namespace detail {

// Returned by produce() without type argument. The type is inferred from the
// object which is initialized or assigned by it:
//   uint32_t V = cBuild::produce();
//   V = cBuild::produce();
//   take(cBuild::produce()); // void take(uint64_t);
// Only temporary can be converted, so `auto V = cBuild::produce();` never
// turns into some value. Overloads accepting more than one Buildable type
// make the conversion ambiguous.
class [[nodiscard]] DeferredProduce final {
public:
  DeferredProduce() = default;
  DeferredProduce(DeferredProduce const &) = delete;
  DeferredProduce &operator=(DeferredProduce const &) = delete;

  template <Buildable T> operator T() const && { return produce<T>(); }
};

} // namespace detail

[[nodiscard]] inline detail::DeferredProduce produce() { return {}; }

} // namespace cBuild
