#include <regex>

#include <vt/catalog/Barcode.hpp>
#include <vt/utility/Format.hpp>

namespace vt::catalog {

bool BarcodeFormat::check(const std::string& code) {
  static const std::regex format(R"([0-9]-[0-9]{6}-[0-9]{6})");
  return std::regex_match(code, format);
}

std::string BarcodeFormat::describe(const std::string& code) {
  return frmt::format("The given code {} has not the right format", code);
}

char countryCode(const Barcode& barcode) noexcept {
  return barcode.value().front();
}

bool madeInItaly(const Barcode& barcode) noexcept {
  return countryCode(barcode) == '8';
}

} // namespace vt::catalog
