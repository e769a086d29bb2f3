#pragma once

#include <string>
#include <vt/type/Newtype.hpp>
#include <vt/catalog/Barcode.hpp>

namespace vt::catalog {

// Free-form text, empty included. Nothing to validate, so the constructor is public.
VT_NEWTYPE(Description, std::string);

static_assert(sizeof(Description) == sizeof(std::string));
static_assert(!std::is_convertible_v<std::string, Description>);
static_assert(!std::is_convertible_v<Description, Barcode>);
static_assert(!std::is_convertible_v<Barcode, Description>);
static_assert(!std::is_constructible_v<Description, Barcode>);
static_assert(!std::is_constructible_v<Barcode, Description>);

} // namespace vt::catalog
