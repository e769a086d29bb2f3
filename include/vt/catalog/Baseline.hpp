#pragma once

#include <string>
#include <vt/type/Result.hpp>
#include <vt/type/Wrapper.hpp>

// The two steps before Barcode/Description: plain wrappers, then a
// hand-written smart constructor. Kept to show what each step fixes.
namespace vt::catalog::baseline {

// Distinct types, but no invariant at all
VT_WRAPPER(PlainBarcode, std::string);
VT_WRAPPER(PlainDescription, std::string);

// Invariant enforced by the only factory. Same checks as Barcode, written by hand.
class CheckedBarcode {
public:
  [[nodiscard]]
  static type::Result<CheckedBarcode> make(std::string code);

  // Moves copy; an emptied _code would break the invariant
  CheckedBarcode(const CheckedBarcode&) = default;
  CheckedBarcode& operator = (const CheckedBarcode&) = default;

  const std::string& code() const noexcept { return _code; }

  friend bool operator == (const CheckedBarcode&, const CheckedBarcode&) = default;

private:
  explicit CheckedBarcode(std::string code) : _code(std::move(code)) {}

  std::string _code;
};

} // namespace vt::catalog::baseline
