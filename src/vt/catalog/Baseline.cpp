#include <utility>

#include <vt/catalog/Baseline.hpp>
#include <vt/catalog/Barcode.hpp>

namespace vt::catalog::baseline {

type::Result<CheckedBarcode> CheckedBarcode::make(std::string code) {
  if (!BarcodeFormat::check(code)) {
    auto message = BarcodeFormat::describe(code);
    return type::outcome::failure(type::ValidationError("CheckedBarcode", std::move(code), message));
  }
  return type::outcome::success(CheckedBarcode(std::move(code)));
}

} // namespace vt::catalog::baseline
