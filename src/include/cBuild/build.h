#pragma once

#include <concepts>
#include <cstdint>
#include <optional>

namespace cBuild {

// Capability to produce a default value of exactly type T.
// There is no default implementation: every type opts in by specializing
// Build<T> with
//   static T build();
// Specializations for foreign types may live in any module, they only have to
// be visible at the call site of produce<T>().
template <typename T> struct Build {};

template <typename T>
concept Buildable = requires {
  { Build<T>::build() } -> std::same_as<T>;
};

// Implementations shipped with the library.
// All functions defined in lib/build/build.cc.
template <> struct Build<uint32_t> {
  static uint32_t build();
};

template <> struct Build<uint64_t> {
  static uint64_t build();
};

static_assert(Buildable<uint32_t>);
static_assert(Buildable<uint64_t>);

// Fallible variant of Build. Failure is a part of the signature:
//   static std::optional<T> tryBuild();
// The library does not provide any implementation of it.
template <typename T> struct TryBuild {};

template <typename T>
concept TryBuildable = requires {
  { TryBuild<T>::tryBuild() } -> std::same_as<std::optional<T>>;
};

} // namespace cBuild
