#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <compare>
#include <ostream>
#include <concepts>
#include <functional>
#include <string_view>

#include <vt/type/NameTag.hpp>
#include <vt/type/Result.hpp>
#include <vt/utility/Format.hpp>

namespace vt::type {

/**
 * A Validator is a stateless policy:
 *   check(value)    - true iff value satisfies the invariant
 *   describe(value) - message reported when check() fails
 */
template <typename Validator, typename Type>
concept ValidatorFor = requires (const Type& value) {
  { Validator::check(value) } -> std::convertible_to<bool>;
  { Validator::describe(value) } -> std::convertible_to<std::string>;
};

// NamedType with a smart constructor: every live instance satisfies Validator.
// make() and from() are the only ways to obtain one; copies keep the invariant.
template <NameTag Tag, typename Type, typename Validator>
class RefinedType {
  static_assert(ValidatorFor<Validator, Type>, "Validator must provide check() and describe() for Type");

public:
  using value_type = Type;
  using validator_type = Validator;

  static constexpr std::string_view name_tag() {
    return Tag.toString();
  }
  static constexpr size_t size() {
    return sizeof(Type);
  }

  [[nodiscard]]
  static Result<RefinedType> make(Type raw) {
    if (!Validator::check(raw)) {
      return outcome::failure(ValidationError(Tag.toString(), toText(raw), Validator::describe(raw)));
    }
    return outcome::success(RefinedType(std::move(raw)));
  }

  // Throwing flavour of make()
  static RefinedType from(Type raw) {
    auto result = make(std::move(raw));
    if (!result) {
      throw result.error();
    }
    return std::move(result).value();
  }

  // No move members: a move copies, so the source still satisfies Validator
  RefinedType(const RefinedType&) = default;
  RefinedType& operator = (const RefinedType&) = default;

  const Type& value() const noexcept { return _value; }

  friend bool operator == (const RefinedType&, const RefinedType&) = default;
  friend auto operator <=> (const RefinedType&, const RefinedType&) = default;

private:
  explicit RefinedType(Type value) : _value(std::move(value)) {}

  static std::string toText(const Type& raw) {
    if constexpr (std::is_convertible_v<const Type&, std::string_view>) {
      return std::string(std::string_view(raw));
    } else {
      return frmt::format("{}", raw);
    }
  }

  Type _value;
};

template <NameTag Tag, typename Type, typename Validator>
std::ostream& operator << (std::ostream& os, const RefinedType<Tag, Type, Validator>& refined) {
  os << Tag.toString() << '(' << refined.value() << ')';
  return os;
}

} // namespace vt::type

namespace std {

template <vt::type::NameTag Tag, typename Type, typename Validator>
struct hash<vt::type::RefinedType<Tag, Type, Validator>> {
  size_t operator () (const vt::type::RefinedType<Tag, Type, Validator>& refined) const noexcept {
    return std::hash<Type>{}(refined.value());
  }
};

} // namespace std
