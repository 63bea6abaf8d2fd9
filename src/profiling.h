#pragma once

#if defined ( __clang__ ) || defined ( __GNUC__ )
#define TracyFunction __PRETTY_FUNCTION__
#elif defined ( _MSC_VER )
# define TracyFunction __FUNCSIG__
#endif
#include <tracy/Tracy.hpp>
