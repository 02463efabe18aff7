////////////////////////////////////////////////////////////////////////////////
//
// cuesplit/aux/features.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_7BF37BC7_1BC9_41FC_801C_252EFE1EA715
#define CUESPLIT_INCLUDED_7BF37BC7_1BC9_41FC_801C_252EFE1EA715


////////////////////////////////////////////////////////////////////////////////
// Preprocessor utilities.
////////////////////////////////////////////////////////////////////////////////

#define CUESPLIT_PP_CAT_AUX(a, b) a ## b
#define CUESPLIT_PP_CAT(a, b) CUESPLIT_PP_CAT_AUX(a, b)
#define CUESPLIT_PP_ANON(tag) CUESPLIT_PP_CAT(tag, __LINE__)


////////////////////////////////////////////////////////////////////////////////
// Feature detection.
////////////////////////////////////////////////////////////////////////////////

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif
#ifndef __has_builtin
#define __has_builtin(x) 0
#endif

#if defined(__GNUC__) && defined(__GNUC_MINOR__)
# define CUESPLIT_GCC_PREREQ(major, minor) \
    ((__GNUC__ << 16) + __GNUC_MINOR__ >= ((major) << 16) + (minor))
#else
# define CUESPLIT_GCC_PREREQ(major, minor) false
#endif

#if defined(__unix) \
 || defined(__unix__) \
 || (defined(__APPLE__) && defined(__MACH__))
# define CUESPLIT_HAS_POSIX
#endif


////////////////////////////////////////////////////////////////////////////////
// Debug.
////////////////////////////////////////////////////////////////////////////////

#if defined(CUESPLIT_DEBUG)
# include <cassert>
# define CUESPLIT_ASSERT(...) assert(__VA_ARGS__)
#else
# define CUESPLIT_ASSERT(...)
#endif


////////////////////////////////////////////////////////////////////////////////
// Optimization hints.
////////////////////////////////////////////////////////////////////////////////

#if __has_builtin(__builtin_unreachable) || CUESPLIT_GCC_PREREQ(4, 5)
# define CUESPLIT_UNREACHABLE() __builtin_unreachable()
#else
# define CUESPLIT_UNREACHABLE()
#endif

#if __has_builtin(__builtin_expect) || CUESPLIT_GCC_PREREQ(4, 0)
# define CUESPLIT_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), false)
#else
# define CUESPLIT_UNLIKELY(...) !!(__VA_ARGS__)
#endif


////////////////////////////////////////////////////////////////////////////////
// Attributes.
////////////////////////////////////////////////////////////////////////////////

#if __has_attribute(always_inline) || CUESPLIT_GCC_PREREQ(3, 1)
# define CUESPLIT_INLINE __attribute__((always_inline)) inline
#else
# define CUESPLIT_INLINE inline
#endif

#if __has_attribute(format) || CUESPLIT_GCC_PREREQ(4, 4)
# define CUESPLIT_PRINTF_FORMAT(...) \
    __attribute__((format(printf, __VA_ARGS__)))
#else
# define CUESPLIT_PRINTF_FORMAT(...)
#endif

#if __has_attribute(pure) || CUESPLIT_GCC_PREREQ(3, 0)
# define CUESPLIT_READONLY __attribute__((pure))
#else
# define CUESPLIT_READONLY
#endif


#endif  // CUESPLIT_INCLUDED_7BF37BC7_1BC9_41FC_801C_252EFE1EA715
