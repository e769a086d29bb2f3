#pragma once
#if __GNUC__ < 13
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/core.h>
namespace frmt = fmt;
#else
#include <format>
namespace frmt = std;
#endif
