#include <iostream>
#include <string>
#include <string_view>
#include <sstream>
#include <exception>

#include <vt/catalog/Config.hpp>
#include <vt/catalog/ProductRepository.hpp>
#include <vt/utility/Format.hpp>
#include <vt/utility/Logging.hpp>

namespace {

constexpr const char* SAMPLE_CATALOG = R"({
  "log_level": "warning",
  "products": [
    { "code": "8-000137-001620", "description": "Multivitamin and minerals" },
    { "code": "1-234567-890123", "description": "Apple iPhone 12 Pro" },
    { "code": "0-987654-321098", "description": "Apple MacBook Pro" }
  ]
})";

vt::catalog::Config loadConfig(const char* filename) {
  if (filename) {
    return vt::catalog::Config(filename);
  }
  std::istringstream sample(SAMPLE_CATALOG);
  return vt::catalog::Config(sample);
}

bool lookup(const vt::catalog::ProductRepository& repository, const std::string& raw) {
  using vt::catalog::Barcode;
  auto barcode = Barcode::make(raw);
  if (!barcode) {
    std::cout << frmt::format("{}: {}", raw, barcode.error().what()) << std::endl;
    return false;
  }
  if (auto product = repository.findByBarcode(barcode.value())) {
    std::cout << *product << (madeInItaly(product->code) ? " made in Italy" : "") << std::endl;
  } else {
    std::cout << barcode.value() << " not in catalog" << std::endl;
  }
  return true;
}

} // namespace

int main(int argc, char* argv[]) {
  // vt_demo [catalog.json] [code ...]; a first argument ending in .json is the catalog
  const char* filename = nullptr;
  int first_code = 1;
  if (argc > 1 && std::string_view(argv[1]).ends_with(".json")) {
    filename = argv[1];
    first_code = 2;
  }

  try {
    auto config = loadConfig(filename);
    if (!vt::utility::setLogLevel(config.logLevel())) {
      VT_LOG(warning) << "Unknown log_level '" << config.logLevel() << "' in catalog";
    }
    vt::utility::setLogFilter();

    vt::catalog::ProductRepository repository;
    auto report = config.populate(repository);
    for (const auto& error : report.rejected) {
      std::cerr << frmt::format("catalog: {}", error.what()) << std::endl;
    }

    bool all_valid = true;
    for (int i = first_code; i < argc; ++i) {
      all_valid = lookup(repository, argv[i]) && all_valid;
    }
    return all_valid ? 0 : 1;
  }
  catch (const std::exception& ex) {
    std::cerr << frmt::format("vt_demo fatal error '{}'", ex.what()) << std::endl;
    return 2;
  }
}
