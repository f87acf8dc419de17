#ifndef _BASE_DEFINES_H_
#define _BASE_DEFINES_H_

#include <cassert>
#include <cstdint>
#include <memory>
#include <functional>

#if !defined(XFER_POSIX) && !defined(_WIN32)
#define XFER_POSIX 1
#endif

#if defined(_WIN32) && defined(XFER_BUILD_SHARED)
#define XFER_CPP_EXPORT __declspec(dllexport)
#else
#define XFER_CPP_EXPORT
#endif

// XFER_CONST_INIT
#if defined(__clang__)
#define XFER_CONST_INIT [[clang::require_constant_initialization]]
#else
#define XFER_CONST_INIT
#endif

#endif
