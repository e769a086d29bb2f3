#pragma once

#include <cstddef>
#include <utility>
#include <compare>
#include <ostream>
#include <functional>
#include <string_view>
#include <vt/type/NameTag.hpp>

namespace vt::type {

// Zero-cost nominal wrapper: holds exactly one Type, no extra storage.
// Construction is explicit; there is no conversion back to Type other than value().
template <NameTag Tag, typename Type>
class NamedType {
public:
  using value_type = Type;

  static constexpr std::string_view name_tag() {
    return Tag.toString();
  }
  static constexpr size_t size() {
    return sizeof(Type);
  }

  constexpr explicit NamedType(Type value) : _value(std::move(value)) {}

  static constexpr NamedType make(Type value) {
    return NamedType(std::move(value));
  }

  constexpr const Type& value() const noexcept { return _value; }

  friend bool operator == (const NamedType&, const NamedType&) = default;
  friend auto operator <=> (const NamedType&, const NamedType&) = default;

private:
  Type _value;
};

template <NameTag Tag, typename Type>
std::ostream& operator << (std::ostream& os, const NamedType<Tag, Type>& named) {
  os << Tag.toString() << '(' << named.value() << ')';
  return os;
}

static_assert( std::is_same_v<NamedType<"Bid", int>, NamedType<"Bid", int>>);
static_assert(!std::is_same_v<NamedType<"Bid", int>, NamedType<"Ask", int>>);
static_assert(!std::is_same_v<NamedType<"Bid", int>, NamedType<"Bid", short>>);
static_assert(!std::is_convertible_v<int, NamedType<"Bid", int>>);
static_assert(!std::is_convertible_v<NamedType<"Bid", int>, int>);
static_assert(!std::is_constructible_v<NamedType<"Bid", int>, NamedType<"Ask", int>>);
static_assert(sizeof(NamedType<"Bid", long>) == sizeof(long));

} // namespace vt::type

namespace std {

template <vt::type::NameTag Tag, typename Type>
struct hash<vt::type::NamedType<Tag, Type>> {
  size_t operator () (const vt::type::NamedType<Tag, Type>& named) const noexcept {
    return std::hash<Type>{}(named.value());
  }
};

} // namespace std
