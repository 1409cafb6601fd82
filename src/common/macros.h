#pragma once

namespace mcache {
// a central place to define common macros for the project
// clang-format off
#define DEFINE_ARG(T, name)                                       \
 public:                                                          \
  inline auto name(const T& name) ->decltype(*this) {             \
    this->name##_ = name;                                         \
    return *this;                                                 \
  }                                                               \
  inline const T& name() const noexcept { return this->name##_; } \
  inline T& name() noexcept { return this->name##_; }             \
                                                                  \
  T name##_

// clang-format on

// concatenate two strings
#define MCACHE_STR_CAT(s1, s2) s1##s2

// create an anonymous variable
#define MCACHE_ANON_VAR(str) MCACHE_STR_CAT(str, __LINE__)

}  // namespace mcache
