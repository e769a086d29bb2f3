#pragma once

#include <vt/type/NamedType.hpp>
#include <vt/type/RefinedType.hpp>

// Declare a zero-cost nominal type named after the alias.
//
// e.g.:
//
// VT_NEWTYPE(Description, std::string);
// VT_REFINED_NEWTYPE(Barcode, std::string, BarcodeFormat);
//
// Both wrap std::string, are the size of std::string, and neither converts
// into the other. Equality, ordering, std::hash and operator<< are derived
// from the wrapped type. The tag is the alias name, so two newtypes with the
// same name and the same wrapped type are the same type.
#define VT_NEWTYPE(name, T) \
  using name = ::vt::type::NamedType<#name, T>

#define VT_REFINED_NEWTYPE(name, T, validator) \
  using name = ::vt::type::RefinedType<#name, T, validator>
