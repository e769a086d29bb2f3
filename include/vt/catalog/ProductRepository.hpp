#pragma once

#include <cstddef>
#include <vector>
#include <optional>
#include <unordered_map>

#include <vt/catalog/Product.hpp>

namespace vt::catalog {

// In-memory product store. Lookups take validated nominal values only,
// never raw text.
class ProductRepository {
public:
  ProductRepository() = default;

  // false if a product with the same barcode is already stored
  bool add(Product product);

  std::optional<Product> findByBarcode(const Barcode& barcode) const;

  // All products carrying exactly this description, in insertion order
  std::vector<Product> findByDescription(const Description& description) const;

  size_t size() const noexcept { return _products.size(); }
  bool empty() const noexcept { return _products.empty(); }

private:
  std::vector<Product> _products;
  std::unordered_map<Barcode, size_t> _index;
};

} // namespace vt::catalog
