#pragma once

#include <memory>
#include <string>

namespace Zweig {
struct ValueType {
  using uint = unsigned int;

  enum class Type { Int, Null, String, Double };

  virtual ~ValueType() = default;

  virtual Type GetType() const { return type_; }
  virtual uint GetSize() const { return size_; }
  virtual bool IsVariableSize() const { return false; }
  virtual std::string ToString() const = 0;

  bool Equals(const ValueType &other) const {
    return GetType() == other.GetType();
  }

  ValueType() : type_(ValueType::Type::Null), size_(0) {}
  ValueType(Type type) : type_(type) {}
  ValueType(Type type, uint size) : type_(type), size_(size) {}

private:
  Type type_;
  uint size_{};
};

using ValueTypeRef = std::shared_ptr<ValueType>;
} // namespace Zweig
