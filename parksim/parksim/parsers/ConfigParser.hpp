// <ConfigParser> -*- C++ -*-

#pragma once

#include <string>

#include "parksim/simulation/ParameterSet.hpp"


// Special-case config file nodes

#define PARKSIM_INCLUDE_KEYS {"#include", "include"}
#define PARKSIM_COMMENT_KEY_START "//" // In addition to normal yaml '#' comments

namespace parksim
{
    /*!
     * \brief Configuration file parsers
     */
    namespace ConfigParser
    {

        /*!
         * \brief Base of parsers which apply a configuration file to a
         * ParameterSet
         */
        class ConfigParser
        {
        public:

            explicit ConfigParser(const std::string& filename) :
                filename_(filename)
            { }

            virtual ~ConfigParser() {}

            const std::string& getFilename() const {
                return filename_;
            }

            /*!
             * \brief Apply the content of the file to \a ps
             * \throw InvalidConfiguration on a malformed file, unknown
             * parameter name or invalid value
             */
            virtual void consumeParameters(ParameterSet& ps, bool verbose=false) = 0;

        protected:

            const std::string filename_;
        };
    }
} // namespace parksim
