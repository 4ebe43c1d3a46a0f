// <ParksimAssert> -*- C++ -*-


#ifndef __PARKSIM_ASSERT_H__
#define __PARKSIM_ASSERT_H__

#include <cstring>
#include <cerrno>
#include <exception>
#include <string>
#include <iostream>
#include <sstream>
#include "parksim/utils/ParksimException.hpp"


/*!
 * \file ParksimAssert.hpp
 * \brief Set of macros used for assertions and performance enhancement
 */


/*!
 * \def PARKSIM_EXPECT_FALSE
 * \brief A macro for hinting to the compiler a particular condition
 *        should be considered most likely false
 *
 * \code
 * if(PARKSIM_EXPECT_FALSE(my_usually_false_condition)) {}
 * \endcode
 */
#define PARKSIM_EXPECT_FALSE(x) __builtin_expect((x), false)

/*!
 * \def PARKSIM_EXPECT_TRUE
 * \brief A macro for hinting to the compiler a particular condition
 *        should be considered most likely true
 */
#define PARKSIM_EXPECT_TRUE(x) __builtin_expect((x), true)

#ifndef DO_NOT_DOCUMENT

#define PARKSIM_ADD_FILE_INFORMATION(ex, file, line)            \
    ex << ": in file: '" << file << "', on line: " << std::dec << line;

#define PARKSIM_THROW_EXCEPTION(reason, file, line)             \
    parksim::ParksimException ex(reason);                       \
    PARKSIM_ADD_FILE_INFORMATION(ex, file, line)                \
    throw ex;

#define parksim_assert1(e) \
    if(__builtin_expect(!(e), 0)) { PARKSIM_THROW_EXCEPTION(#e, __FILE__, __LINE__) }

#define parksim_assert2(e, insertions)                                          \
    if(__builtin_expect(!(e), 0)) { parksim::ParksimException ex(std::string(#e) + ": " ); \
                                    ex << insertions;                             \
                                    PARKSIM_ADD_FILE_INFORMATION(ex, __FILE__, __LINE__); \
                                    throw ex; }

#define parksim_throw(message) \
    { \
        std::stringstream msg; \
        msg << message; \
        parksim::ParksimException ex(std::string("abort: ") + msg.str()); \
        PARKSIM_ADD_FILE_INFORMATION(ex, __FILE__, __LINE__); \
        throw ex; \
    }

#define PARKSIM_VA_NARGS_IMPL(_1, _2, _3, _4, _5, N, ...) N
#define PARKSIM_VA_NARGS(...) PARKSIM_VA_NARGS_IMPL(__VA_ARGS__, 5, 4, 3, 2, 1)
#define parksim_assert_impl2(count, ...) parksim_assert##count(__VA_ARGS__)
#define parksim_assert_impl(count, ...)  parksim_assert_impl2(count, __VA_ARGS__)

// DO_NOT_DOCUMENT
#endif

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wvariadic-macros"
/*!
 * \def parksim_assert
 * \brief Simple variadic assertion that will throw a ParksimException
 *        if the condition fails
 *
 * \throw ParksimException including file and line information if \a e
 *        evaluates to false
 * \note This assertion remains even if compiling with NDEBUG
 *
 * How to use:
 * \code
 *   parksim_assert(condition);
 *   parksim_assert(condition, "My nasty gram");
 *   parksim_assert(condition, "ostream supported message with a value: " << value);
 * \endcode
 */
#define parksim_assert(...) parksim_assert_impl(PARKSIM_VA_NARGS(__VA_ARGS__), __VA_ARGS__)

#pragma GCC diagnostic pop

/*!
 * \def parksim_assert_errno
 * \brief Simple assert macro that throws a ParksimException with a string
 *        representation of errno
 */
#define parksim_assert_errno(_cond) \
    parksim_assert(_cond, std::string(std::strerror(errno)))

// __PARKSIM_ASSERT_H__
#endif
