#pragma once

#include <string_view>
#include <typeindex>
#include <typeinfo>

namespace tether::common {

// Runtime tag identifying the C++ type held by a type-erased cell.
// Compared on every typed read; the name is only used in error messages.
class TypeTag {
 public:
  template <typename T>
  static auto Of() -> TypeTag {
    return TypeTag(typeid(T));
  }

  [[nodiscard]] auto Name() const -> std::string_view {
    return index_.name();
  }

  auto operator==(const TypeTag& other) const -> bool {
    return index_ == other.index_;
  }

 private:
  explicit TypeTag(const std::type_info& info) : index_(info) {
  }

  std::type_index index_;
};

}  // namespace tether::common
