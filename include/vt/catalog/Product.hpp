#pragma once

#include <ostream>
#include <vt/type/TypeList.hpp>
#include <vt/catalog/Barcode.hpp>
#include <vt/catalog/Description.hpp>

namespace vt::catalog {

struct Product {
  Barcode code;
  Description description;

  friend bool operator == (const Product&, const Product&) = default;
};

using ProductFields = type::type_list<Barcode, Description>;

static_assert(type::AllDistinct<ProductFields>());
static_assert(sizeof(Product) == type::TypeListDataSize<ProductFields>());

inline std::ostream& operator << (std::ostream& os, const Product& product) {
  os << "Product(" << product.code << ", " << product.description << ')';
  return os;
}

} // namespace vt::catalog
