// qualsim/basic/box.hpp - Heap box with value semantics for recursive variants
#pragma once

#include <memory>
#include <utility>

namespace qualsim
{

/**
 * Owning pointer that copies its pointee.
 *
 * Lets recursive std::variant trees (conditions, effects) stay regular
 * value types: copying a tree deep-copies every boxed child.
 */
template <typename T>
class Box
{
public:
  Box() : ptr_(std::make_unique<T>()) {}
  Box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}
  Box(const Box & other) : ptr_(std::make_unique<T>(*other.ptr_)) {}
  Box(Box &&) noexcept = default;

  Box & operator=(const Box & other)
  {
    if (this != &other) {
      ptr_ = std::make_unique<T>(*other.ptr_);
    }
    return *this;
  }
  Box & operator=(Box &&) noexcept = default;

  T & operator*() { return *ptr_; }
  const T & operator*() const { return *ptr_; }
  T * operator->() { return ptr_.get(); }
  const T * operator->() const { return ptr_.get(); }
  [[nodiscard]] const T * get() const { return ptr_.get(); }

private:
  std::unique_ptr<T> ptr_;
};

}  // namespace qualsim
