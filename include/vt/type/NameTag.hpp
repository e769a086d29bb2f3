#pragma once

#include <cstddef>
#include <type_traits>
#include <string_view>
#include <compare>
#include <ostream>

namespace vt::type {

// Compile-time string usable as a non-type template parameter.
// Two nominal types differ iff their tags (or wrapped types) differ.
template <size_t N>
struct NameTag {

  static constexpr size_t tag_size = N - 1;

  constexpr NameTag(const char (&str)[N]) noexcept {
    for (std::size_t i = 0; i < N; ++i) {
      _nametag[i] = str[i];
    }
  }

  constexpr std::string_view toString() const noexcept {
    return (N > 0 && _nametag[N - 1] == '\0')
        ? std::string_view(_nametag, N - 1)
        : std::string_view(_nametag, N);
  }

  constexpr explicit operator std::string_view() const noexcept {
    return toString();
  }

  constexpr auto operator <=> (const NameTag& other) const noexcept {
    return toString() <=> other.toString();
  }

  constexpr bool operator == (const NameTag& other) const noexcept {
    return toString() == other.toString();
  }

  // public: structural type requirement for NTTP
  char _nametag[N]{};
};

template <size_t N>
NameTag(const char (&)[N]) -> NameTag<N>;

template <size_t N>
std::ostream& operator << (std::ostream& os, const NameTag<N>& tag) {
  os << tag.toString();
  return os;
}

static_assert(NameTag("Barcode") == NameTag("Barcode"));
static_assert(NameTag("Barcode") <  NameTag("Catalog"));
static_assert(NameTag("Barcode").toString().size() == 7);

} // namespace vt::type
