#pragma once

#include <string>
#include <vt/type/Newtype.hpp>

namespace vt::catalog {

// One digit, hyphen, six digits, hyphen, six digits: "8-000137-001620".
// ASCII digits only, the whole text must match.
struct BarcodeFormat {
  static bool check(const std::string& code);
  static std::string describe(const std::string& code);
};

VT_REFINED_NEWTYPE(Barcode, std::string, BarcodeFormat);

static_assert(sizeof(Barcode) == sizeof(std::string));
static_assert(!std::is_constructible_v<Barcode, std::string>);
static_assert(!std::is_convertible_v<Barcode, std::string>);

// Leading digit of the code
char countryCode(const Barcode& barcode) noexcept;

bool madeInItaly(const Barcode& barcode) noexcept;

} // namespace vt::catalog
