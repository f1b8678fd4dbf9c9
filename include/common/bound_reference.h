#pragma once

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace autoscale {
namespace common {

/**
 * @brief Slot for a capability that is bound and unbound at runtime
 *
 * get() throws when nothing is bound; get_optional() returns nullptr instead.
 * unbind() only clears the slot if it still holds the given instance, so a
 * late unbind of a replaced capability is harmless.
 */
template <typename T> class BoundReference {
public:
  explicit BoundReference(std::string name) : name_(std::move(name)) {}

  void bind(std::shared_ptr<T> value) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::move(value);
  }

  void unbind(const std::shared_ptr<T> &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value_ == value) {
      value_.reset();
    }
  }

  void unbind() {
    std::lock_guard<std::mutex> lock(mutex_);
    value_.reset();
  }

  bool is_bound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_ != nullptr;
  }

  std::shared_ptr<T> get_optional() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
  }

  std::shared_ptr<T> get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!value_) {
      throw std::logic_error(name_ + " is not bound");
    }
    return value_;
  }

  const std::string &name() const { return name_; }

private:
  std::string name_;
  std::shared_ptr<T> value_;
  mutable std::mutex mutex_;
};

} // namespace common
} // namespace autoscale
