// <ParksimTester> -*- C++ -*-


#ifndef __PARKSIM_TESTER_H__
#define __PARKSIM_TESTER_H__

/**
 * \file   ParksimTester.hpp
 *
 * \brief File that defines the ParksimTester class and testing Macros
 */

#include <iostream>
#include <sstream>
#include <cstring>
#include <cstdint>
#include <string>
#include <type_traits>
#include <boost/algorithm/string/predicate.hpp>
#include "parksim/utils/Colors.hpp"
#include "parksim/utils/MathUtils.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace parksim
{
    /**
     * \class ParksimTester
     * \brief A simple testing class
     *
     * The user of this framework should not have to instantiate this
     * class directly. Use the TEST_INIT macro.
     *
     * Example usage:
     * \code
     * TEST_INIT;
     *
     * int main() {
     *     EXPECT_TRUE(true);
     *     EXPECT_FALSE(false);
     *     EXPECT_NOTHROW(int a = 3;);
     *     EXPECT_THROW(throw a;);
     *     EXPECT_EQUAL(2+2, 4);
     *     EXPECT_NOTEQUAL(2+2, 5);
     *
     *     REPORT_ERROR;
     *     return ERROR_CODE;
     * }
     * \endcode
     */
    class ParksimTester
    {
    public:

        //! Record a failed check when \a val is false
        bool expect(bool val, const char * test_type, const uint32_t line, const char * file) {
            if(!val) {
                failed_(test_type, line, file) << PARKSIM_CURRENT_COLOR_NORMAL << std::endl;
            }
            return val;
        }

        //! Compare values of possibly different types; \a expected is the
        //! outcome of the comparison the test asks for
        template<typename T, typename U=T>
        bool expectEqual(const T& v1, const U& v2, bool expected, const char * test_type,
                         const uint32_t line, const char * file) {
            if(compare(v1, v2) == expected) {
                return true;
            }
            failed_(test_type, line, file) << ". Value: '" << v1
                                           << (expected ? "' should equal '" : "' should NOT equal '")
                                           << v2 << "'" << PARKSIM_CURRENT_COLOR_NORMAL << std::endl;
            return false;
        }

        // Integers of different signedness are compared in the type of the
        // left operand
        template<typename T, typename U>
        static typename std::enable_if<std::is_integral<T>::value
                                       && std::is_integral<U>::value
                                       && (std::is_signed<T>::value != std::is_signed<U>::value), bool>::type
        compare(const T& t, const U& u) {
            return (t == static_cast<T>(u));
        }

        template<typename T, typename U>
        static typename std::enable_if<!(std::is_integral<T>::value
                                         && std::is_integral<U>::value
                                         && (std::is_signed<T>::value != std::is_signed<U>::value)), bool>::type
        compare(const T& t, const U& u) {
            return (t == u);
        }

        template<typename T>
        typename std::enable_if<std::is_floating_point<T>::value, bool>::type
        expectEqualWithinTolerance(const T & v1, const T & v2, const T & tol,
                                   const char * test_type, const uint32_t line,
                                   const char * file) {
            if(tol < 0) {
                failed_(test_type, line, file) << ". Negative tolerance supplied."
                                               << PARKSIM_CURRENT_COLOR_NORMAL << std::endl;
                return false;
            }
            if(!utils::approximatelyEqual(v1, v2, tol)) {
                failed_(test_type, line, file) << ". Value: '" << v1 << "' should be equal to '"
                                               << v2 << "' within tolerance '" << tol << "'"
                                               << PARKSIM_CURRENT_COLOR_NORMAL << std::endl;
                return false;
            }
            return true;
        }

        void throwTestFailed(const char * test_type, const uint32_t line, const char * file,
                             const char * exception_what="") {
            cerr_ << PARKSIM_CURRENT_COLOR_BRIGHT_RED << "Throw Test Fail:'" << test_type << "' FAILED on line "
                  << line << " in file " << file << std::endl;
            if(exception_what != nullptr && std::strlen(exception_what) != 0) {
                cerr_ << "  Exception: " << exception_what << std::endl;
            }
            cerr_ << PARKSIM_CURRENT_COLOR_NORMAL << std::endl;
            ++num_errors_;
        }

        static ParksimTester * getInstance() {
            static ParksimTester inst;
            return & inst;
        }

        static uint32_t getErrorCode(const ParksimTester * tester = getInstance()) {
            return tester->num_errors_;
        }

    private:

        ParksimTester() = default;

        //! Count a failure and start its report line
        std::ostream & failed_(const char * test_type, const uint32_t line, const char * file) {
            ++num_errors_;
            return cerr_ << PARKSIM_CURRENT_COLOR_BRIGHT_RED << "Test '" << test_type
                         << "' FAILED on line " << line << " in file " << file;
        }

        uint32_t num_errors_ = 0;
        std::ostream & cerr_ = std::cerr;
    };


    /**
     * \def TEST_INIT
     * \brief Initialized the test.  Should be placed OUTSIDE of a
     * code block SOMEWHERE in the test source
     */
#define TEST_INIT

    /**
     * \def EXPECT_TRUE(x)
     * \brief Determine if the block \a x evaluates to true
     */
#define EXPECT_TRUE(x) parksim::ParksimTester::getInstance()->expect((x), #x, __LINE__, __FILE__)

    /**
     * \def EXPECT_EQUAL(x,y)
     * \brief Determine if the block \a x is equal (using operator== on x) to y
     * \pre x must be printable to cout/cerr using the insertion operator
     */
#define EXPECT_EQUAL(x, y) parksim::ParksimTester::getInstance()->expectEqual((x), (y), true, #x, __LINE__, __FILE__)

    /**
     * \def EXPECT_NOTEQUAL(x,y)
     * \brief Determine if the block \a x is not equal (using operator== on x) to y
     */
#define EXPECT_NOTEQUAL(x, y) parksim::ParksimTester::getInstance()->expectEqual((x), (y), false, #x, __LINE__, __FILE__)

   /**
     * \def EXPECT_WITHIN_TOLERANCE(x,y,tol)
     * \brief Determine if the block \a x is equal to y within a specified
     * tolerance. Types must match exactly.
     */
#define EXPECT_WITHIN_TOLERANCE(x, y, tol) parksim::ParksimTester::getInstance()->  \
    expectEqualWithinTolerance((x), (y), (tol), #x, __LINE__, __FILE__)

    /**
     * \def EXPECT_FALSE(x)
     * \brief Determine if the block \a x evaluates to false
     */
#define EXPECT_FALSE(x) parksim::ParksimTester::getInstance()->expect(!(x), #x, __LINE__, __FILE__)

    /**
     * \def EXPECT_THROW(x)
     * \brief Determine if the block \a x correctly throws an exception
     */
#define EXPECT_THROW(x) {                                               \
        bool did_it_throw = false;                                      \
        try {x;}                                                        \
        catch(...)                                                      \
        { did_it_throw = true; }                                        \
        if(did_it_throw == false) {                                     \
            parksim::ParksimTester::getInstance()->throwTestFailed(#x, __LINE__, __FILE__); \
        }                                                               \
   }

    /**
     * \def EXPECT_THROW_TYPE(x, extype)
     * \brief Determine if the block \a x throws an exception of type \a extype
     */
#define EXPECT_THROW_TYPE(x, extype) {                                  \
        bool did_it_throw = false;                                      \
        try {x;}                                                        \
        catch(extype &)                                                 \
        { did_it_throw = true; }                                        \
        catch(...)                                                      \
        { }                                                             \
        if(did_it_throw == false) {                                     \
            parksim::ParksimTester::getInstance()->throwTestFailed(#x, __LINE__, __FILE__, "did not throw " #extype); \
        }                                                               \
   }

#define EXPECT_THROW_MSG_CONTAINS(x, expected_msg) {    \
        bool did_it_throw = false;              \
        try { x; }                              \
        catch(parksim::ParksimException& ex)    \
        { did_it_throw = true;                  \
            if (boost::algorithm::contains(ex.what(), expected_msg) != true) { \
                std::cerr << "Expected msg: " << expected_msg << std::endl; \
                std::cerr << "Actual msg:   " << ex.what() << std::endl; \
                parksim::ParksimTester::getInstance()->throwTestFailed(#x, __LINE__, __FILE__, ex.what()); \
            }                                   \
        }                                       \
        if(did_it_throw == false) {             \
            parksim::ParksimTester::getInstance()->throwTestFailed(#x, __LINE__, __FILE__, "did not throw"); \
        }                                       \
   }

    /**
     * \def EXPECT_NOTHROW(x)
     * \brief Determine if the block \a x throws an exception incorrectly
     */
#define EXPECT_NOTHROW(x) {                                             \
        bool did_it_throw = false;                                      \
        std::string exception_what;                                     \
        try { x; }                                                      \
        catch(std::exception& e)                                        \
        { did_it_throw = true;                                          \
            exception_what = e.what();                                  \
        }                                                               \
        catch(...)                                                      \
        { did_it_throw = true; }                                        \
        if(did_it_throw == true) {                                      \
            parksim::ParksimTester::getInstance()->throwTestFailed(#x, __LINE__, __FILE__, exception_what.c_str()); \
        }                                                               \
    }

    /**
     * \def ERROR_CODE
     * \brief The number of errors found in the testing
     */
#define ERROR_CODE parksim::ParksimTester::getErrorCode()

    /**
     * \def REPORT_ERROR
     * \brief Prints the error code with a nice pretty message
     * \note This is separate from returning ERROR_CODE, which must be done
     * after this macro.
     */
#define REPORT_ERROR                                                    \
    if(ERROR_CODE != 0) {                                               \
        std::cout << std::dec << "\n" << PARKSIM_UNMANAGED_COLOR_BRIGHT_RED << ERROR_CODE \
                  << " ERROR(S) found during test.\n" << PARKSIM_UNMANAGED_COLOR_NORMAL << std::endl; \
    } else {                                                            \
        std::cout << std::dec << "\n"                                   \
                  << "TESTS PASSED -- No errors found during test.\n" << std::endl; \
    }
}

// __PARKSIM_TESTER_H__
#endif
