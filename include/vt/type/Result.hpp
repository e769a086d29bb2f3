#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <utility>
#include <boost/outcome/result.hpp>

namespace vt::type {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

/**
 * Rejection of a raw value by a smart constructor.
 * what() is the human readable message; input() is the rejected value verbatim.
 */
class ValidationError : public std::invalid_argument {
public:
  // outcome requires a default constructible error type
  ValidationError() : std::invalid_argument("") {}

  ValidationError(std::string_view type_name, std::string input, const std::string& message)
    : std::invalid_argument(message), _type_name(type_name), _input(std::move(input)) {}

  const std::string& typeName() const noexcept { return _type_name; }
  const std::string& input() const noexcept { return _input; }
  std::string_view message() const noexcept { return what(); }

private:
  std::string _type_name;
  std::string _input;
};

// value() on a failed Result throws outcome::bad_result_access_with<ValidationError>
template <typename Type>
using Result = outcome::checked<Type, ValidationError>;

} // namespace vt::type
