#include <utility>
#include <boost/foreach.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <vt/catalog/Config.hpp>
#include <vt/utility/Logging.hpp>

namespace vt::catalog {

Config::Config(const char *filename) {
  if (filename) {
    pt::read_json(filename, root);
    readEntries();
  }
}

Config::Config(std::istream& in) {
  pt::read_json(in, root);
  readEntries();
}

void Config::readEntries() {
  auto products = root.get_child_optional("products");
  if (!products) {
    return;
  }
  size_t position = 0;
  BOOST_FOREACH(const pt::ptree::value_type &v, products.value()) {
    auto code = v.second.get_optional<std::string>("code");
    if (!code) {
      VT_LOG(warning) << "Catalog entry #" << position << " has no code, skipped";
    } else {
      _entries.push_back({*code, v.second.get<std::string>("description", "")});
    }
    ++position;
  }
}

LoadReport Config::populate(ProductRepository& repository) const {
  LoadReport report;
  for (const auto& entry : _entries) {
    auto barcode = Barcode::make(entry.code);
    if (!barcode) {
      VT_LOG(warning) << "Rejected catalog entry: " << barcode.error().what();
      report.rejected.push_back(barcode.error());
      continue;
    }
    if (repository.add(Product{std::move(barcode).value(), Description(entry.description)})) {
      ++report.loaded;
    } else {
      ++report.duplicates;
    }
  }
  VT_LOG(info) << "Catalog loaded: " << report.loaded << " product(s), "
               << report.rejected.size() << " rejected, " << report.duplicates << " duplicate(s)";
  return report;
}

} // namespace vt::catalog
