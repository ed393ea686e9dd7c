#pragma once

#if defined(_MSC_VER)
#pragma warning( push )
#pragma warning( disable : 4820)
#elif defined(__clang__)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#endif

#include <SDL3/SDL.h>

#if defined(_MSC_VER)
#pragma warning( pop )
#elif defined(__clang__)
# pragma clang diagnostic pop
#elif defined(__GNUC__)
# pragma GCC diagnostic pop
#endif
