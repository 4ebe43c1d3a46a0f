// <LexicalCast> -*- C++ -*-

#ifndef __PARKSIM_LEXICAL_CAST_H__
#define __PARKSIM_LEXICAL_CAST_H__

#include <cstdint>
#include <string>
#include <type_traits>
#include <typeinfo>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

// For YAML converter (bool string -> bool)
#include <yaml-cpp/node/node.h>
#include <yaml-cpp/node/convert.h>

#include "parksim/utils/ParksimException.hpp"

/*!
 * \file LexicalCast.hpp
 * \brief Conversion of configuration strings to typed values
 */

namespace parksim
{
namespace utils
{
    /*!
     * \brief Type name used in messages and parameter listings
     */
    template <class T> inline const char * typeName() { return typeid(T).name(); }
    template <> inline const char * typeName<bool>() { return "bool"; }
    template <> inline const char * typeName<uint32_t>() { return "uint32_t"; }
    template <> inline const char * typeName<uint64_t>() { return "uint64_t"; }
    template <> inline const char * typeName<int32_t>() { return "int32_t"; }
    template <> inline const char * typeName<int64_t>() { return "int64_t"; }
    template <> inline const char * typeName<double>() { return "double"; }
    template <> inline const char * typeName<std::string>() { return "string"; }

    /*!
     * \brief Cast \a str to a T. Leading and trailing whitespace is
     * ignored.
     * \throw InvalidConfiguration if \a str does not represent a T
     */
    template <class T>
    inline T lexicalCast(const std::string& str) {
        const std::string s = boost::algorithm::trim_copy(str);
        if(std::is_unsigned<T>::value && !s.empty() && s[0] == '-'){
            throw InvalidConfiguration("Unable to cast string \"") << str
                << "\" to " << typeName<T>() << ": value is negative";
        }
        try {
            return boost::lexical_cast<T>(s);
        }
        catch(boost::bad_lexical_cast &) {
            throw InvalidConfiguration("Unable to cast string \"") << str
                << "\" to " << typeName<T>();
        }
    }

    template <>
    inline std::string lexicalCast(const std::string& str) {
        return str;
    }

    template <>
    inline bool lexicalCast(const std::string& str) {
        bool out;
        YAML::Node node(YAML::NodeType::Scalar);
        node = boost::algorithm::trim_copy(str);

        // YAML boolean literals (true/false, on/off, yes/no)
        if(false == YAML::convert<bool>::decode(node, out)){
            int out_int;
            if(false == YAML::convert<int>::decode(node, out_int)){ // Fall back to 1/0 support
                throw InvalidConfiguration("Unable to cast string \"") << str << "\" to bool";
            }
            out = out_int != 0;
        }
        return out;
    }

} // namespace utils
} // namespace parksim

// __PARKSIM_LEXICAL_CAST_H__
#endif
