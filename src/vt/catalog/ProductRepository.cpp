#include <algorithm>
#include <iterator>
#include <utility>

#include <vt/catalog/ProductRepository.hpp>
#include <vt/utility/Logging.hpp>

namespace vt::catalog {

// Storage first, index second: an index entry never points past _products
bool ProductRepository::add(Product product) {
  if (auto it = _index.find(product.code); it != _index.end()) {
    VT_LOG(warning) << "Duplicate product " << product.code << " ignored, keeping " << _products[it->second];
    return false;
  }
  VT_LOG(debug) << "Added " << product;
  _products.push_back(std::move(product));
  try {
    _index.emplace(_products.back().code, _products.size() - 1);
  } catch (...) {
    _products.pop_back();
    throw;
  }
  return true;
}

std::optional<Product> ProductRepository::findByBarcode(const Barcode& barcode) const {
  auto it = _index.find(barcode);
  if (it == _index.end()) {
    VT_LOG(debug) << "No product for " << barcode;
    return std::nullopt;
  }
  return _products[it->second];
}

std::vector<Product> ProductRepository::findByDescription(const Description& description) const {
  std::vector<Product> found;
  std::copy_if(_products.begin(), _products.end(), std::back_inserter(found), [&description](const Product& product) {
    return product.description == description;
  });
  VT_LOG(debug) << found.size() << " product(s) for " << description;
  return found;
}

} // namespace vt::catalog
