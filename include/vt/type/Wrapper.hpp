#pragma once

#include <utility>

// Plain named wrapper class, no invariant beyond the wrapped type's own.
//
// e.g.:
//
// VT_WRAPPER(PlainBarcode, std::string);
// VT_WRAPPER(PlainDescription, std::string);
//
// Each generated class is its own type, so passing a PlainDescription where
// a PlainBarcode is expected does not compile. Any value is accepted though:
// PlainBarcode("not a code") is perfectly legal.
#define VT_WRAPPER(name, T) \
  class name \
  { \
    public: \
      using wrapped_type = T; \
      explicit name(T val) \
          : m_wrapped(std::move(val)) { \
      } \
  \
      name() = delete; \
  \
      auto val() const -> T { \
        return m_wrapped; \
      } \
  \
      auto cref() const -> const T& { \
        return m_wrapped; \
      } \
  \
      friend bool operator==(const name&, const name&) = default; \
  \
    private: \
      T m_wrapped; \
  }
