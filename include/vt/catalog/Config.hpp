#pragma once

#include <string>
#include <vector>
#include <istream>
#include <boost/property_tree/ptree.hpp>

#include <vt/type/Result.hpp>
#include <vt/catalog/ProductRepository.hpp>

namespace vt::catalog {

namespace pt = boost::property_tree;

// Raw catalog line, not validated yet
struct CatalogEntry {
  std::string code;
  std::string description;
};

struct LoadReport {
  size_t loaded = 0;
  size_t duplicates = 0;
  std::vector<type::ValidationError> rejected;
};

/**
 * JSON catalog:
 *   {
 *     "log_level": "info",
 *     "products": [ { "code": "8-000137-001620", "description": "Multivitamin and minerals" } ]
 *   }
 * Parse errors surface as pt::json_parser_error.
 */
class Config {
public:
  explicit Config(const char *filename = nullptr);
  explicit Config(std::istream& in);

  std::string logLevel() const {
    return root.get<std::string>("log_level", "info");
  }

  const std::vector<CatalogEntry>& entries() const { return _entries; }

  // Validates every entry; valid ones land in the repository, the rest in the report.
  LoadReport populate(ProductRepository& repository) const;

  pt::ptree root;

private:
  void readEntries();

  std::vector<CatalogEntry> _entries;
};

} // namespace vt::catalog
