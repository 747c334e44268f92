// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

// Define FLOATCONV_ASSERT before including any floatconv header to replace the internal checks.
#ifndef FLOATCONV_ASSERT
#include <cassert>
#define FLOATCONV_ASSERT(X) assert(X)
#endif

#ifndef FLOATCONV_NEVER_INLINE
#if _MSC_VER
#define FLOATCONV_NEVER_INLINE __declspec(noinline) inline
#elif __GNUC__
#define FLOATCONV_NEVER_INLINE __attribute__((noinline)) inline
#else
#define FLOATCONV_NEVER_INLINE inline
#endif
#endif
