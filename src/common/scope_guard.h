#pragma once
#include <type_traits>
#include <utility>

namespace mcache {

// RAII object that invokes a callback on destruction unless dismissed.
// used to roll back partially applied state on early returns.
template <typename Fun>
class ScopeGuard final {
 public:
  template <typename FuncArg>
  ScopeGuard(FuncArg&& f) : callback_(std::forward<FuncArg>(f)) {}

  // disallow copy and move
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() noexcept {
    if (!dismissed_) {
      callback_();
    }
  }

  // the rollback is no longer needed, e.g. the operation succeeded
  void dismiss() noexcept { dismissed_ = true; }

  bool dismissed() const noexcept { return dismissed_; }

 private:
  Fun callback_;
  bool dismissed_ = false;
};

// allow function-to-pointer implicit conversions
template <typename Fun>
ScopeGuard(Fun&&) -> ScopeGuard<std::decay_t<Fun>>;

}  // namespace mcache
