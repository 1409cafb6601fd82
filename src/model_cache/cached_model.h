#pragma once
#include <c10/core/Device.h>

#include <cstdint>

namespace mcache {

// A model held by the cache. The cache never looks inside a model: it only
// asks where its data lives, how large it is and moves it between devices.
class CachedModel {
 public:
  virtual ~CachedModel() = default;

  // the device the model's data currently lives on. the residency of a cache
  // record is always derived from this, since callers holding the model may
  // move it on their own.
  virtual c10::Device device() const = 0;

  // move the model's data to the given device.
  // throws (e.g. c10::Error) if the transfer fails, in which case the model may
  // be partially moved.
  virtual void to(const c10::Device& device) = 0;

  // number of bytes the model occupies
  virtual int64_t size_in_bytes() const = 0;

  // models that can't change device are handed out without locking
  virtual bool movable() const { return true; }
};

// devices match if their types match and, when both carry one, their indices.
// "cuda" matches the "cuda:0" reported by a tensor moved there.
inline bool is_same_device(const c10::Device& lhs, const c10::Device& rhs) {
  if (lhs.type() != rhs.type()) {
    return false;
  }
  return !lhs.has_index() || !rhs.has_index() || lhs.index() == rhs.index();
}

}  // namespace mcache
