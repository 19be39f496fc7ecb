#pragma once

#include <memory>
#include <utility>

#include "tether/common/type_tag.hpp"

namespace tether::runtime {

// Owned value of any type behind a runtime type tag. Shared by state cells
// and atom cells.
class ErasedValue {
 public:
  virtual ~ErasedValue() = default;

  [[nodiscard]] virtual auto Tag() const -> common::TypeTag = 0;

  // Typed access. Returns nullptr if the stored type is not T.
  template <typename T>
  [[nodiscard]] auto As() -> T*;
  template <typename T>
  [[nodiscard]] auto As() const -> const T*;

 protected:
  [[nodiscard]] virtual auto Address() -> void* = 0;
  [[nodiscard]] virtual auto Address() const -> const void* = 0;
};

template <typename T>
class BoxedValue final : public ErasedValue {
 public:
  explicit BoxedValue(T value) : value_(std::move(value)) {
  }

  [[nodiscard]] auto Tag() const -> common::TypeTag override {
    return common::TypeTag::Of<T>();
  }

 protected:
  [[nodiscard]] auto Address() -> void* override {
    return &value_;
  }
  [[nodiscard]] auto Address() const -> const void* override {
    return &value_;
  }

 private:
  T value_;
};

template <typename T>
auto ErasedValue::As() -> T* {
  if (!(Tag() == common::TypeTag::Of<T>())) {
    return nullptr;
  }
  return static_cast<T*>(Address());
}

template <typename T>
auto ErasedValue::As() const -> const T* {
  if (!(Tag() == common::TypeTag::Of<T>())) {
    return nullptr;
  }
  return static_cast<const T*>(Address());
}

template <typename T>
auto MakeErased(T value) -> std::unique_ptr<ErasedValue> {
  return std::make_unique<BoxedValue<T>>(std::move(value));
}

}  // namespace tether::runtime
