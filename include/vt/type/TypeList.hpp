#pragma once
#include <cstddef>
#include <boost/mp11/list.hpp>
#include <boost/mp11/set.hpp>
#include <boost/mp11/algorithm.hpp>

namespace vt::type {

using namespace boost::mp11;

template<typename... Args>
struct type_list: boost::mp11::mp_list<Args...> {};

// Nominal types of a record must be pairwise distinct, otherwise two fields
// could be swapped silently.
template <typename TypeList>
constexpr bool AllDistinct() {
  return mp_is_set<TypeList>::value;
}

static_assert(AllDistinct<type_list<int, double, char>>());
static_assert(!AllDistinct<type_list<int, double, int>>());

template <typename TypeList>
constexpr size_t TypeListDataSize() {
  if constexpr (mp_empty<TypeList>::value) {
    return 0;
  } else {
    return sizeof(mp_front<TypeList>) + TypeListDataSize<mp_pop_front<TypeList>>();
  }
}

static_assert(15 == TypeListDataSize<type_list<int, double, char, short>>());
static_assert(0 == TypeListDataSize<type_list<>>());

} // namespace vt::type
