// <ParameterSet> -*- C++ -*-

#pragma once

#include <iostream>
#include <iomanip>
#include <string>
#include <ostream>
#include <vector>
#include <unordered_map>

#include "parksim/simulation/Parameter.hpp"


namespace parksim
{
    /*!
     * \brief Generic container of Parameters.
     *
     * Subclass this and declare members with the PARAMETER macro:
     * \code
     * class MyParams : public parksim::ParameterSet
     * {
     * public:
     *     PARAMETER(uint32_t, param1, 0, "The first parameter")
     * };
     * MyParams p;
     * p.getParameter("param1")->setValueFromString("7");
     * std::cout << p.param1 << std::endl; // 7
     * p.getParameter("param2"); // InvalidConfiguration: no such parameter
     * \endcode
     */
    class ParameterSet
    {
        friend class ParameterBase; //!< For invoking addParameter_

    public:
        //! Target of the PARAMETER macro
        ParameterSet* __this_ps;

        ParameterSet(const ParameterSet& rhp) = delete; //!< Copying disabled. Do not override
        void operator=(const ParameterSet& rhp) = delete; //!< Copying disabled. Do not override

        //! Vector of ParameterBase pointers
        typedef std::vector<ParameterBase*> ParameterVector;

        //! Mapping of parameter names to parameters (for fast lookup by name)
        typedef std::unordered_map<std::string, ParameterBase*> ParameterPairs;

        ParameterSet() :
            __this_ps(this)
        { }

        virtual ~ParameterSet() {}

        /*!
         * \brief Check every parameter against its validators
         * \param err_names Names of failing parameters and constraints are
         * appended here
         * \return true if every parameter is valid
         */
        bool validateIndependently(std::string& err_names) const;

        /*!
         * \brief Get a parameter by name
         * \param must_exist Throw if there is no such parameter
         * \return The parameter, or nullptr if it does not exist and
         * \a must_exist is false
         * \throw InvalidConfiguration if \a must_exist and not found
         */
        ParameterBase* getParameter(const std::string& name, bool must_exist=true);

        const ParameterBase* getParameter(const std::string& name, bool must_exist=true) const;

        bool hasParameter(const std::string& name) const {
            return keys_.find(name) != keys_.end();
        }

        /*!
         * \brief Value of parameter \a name as a ValueType
         * \throw InvalidConfiguration if not found or of another type
         */
        template <class ValueType>
        const ValueType& getParameterValueAs(const std::string& name) const {
            const ParameterBase* pb = getParameter(name, true);
            const Parameter<ValueType>* p = dynamic_cast<const Parameter<ValueType>*>(pb);
            if(nullptr == p){
                throw InvalidConfiguration("Parameter \"") << name << "\" is of type "
                    << pb->getTypeName() << ", not " << detail::ParameterTraits<ValueType>::typeName();
            }
            return p->getValue();
        }

        //! Parameters in declaration order
        const ParameterVector& getParameters() const {
            return params_;
        }

        std::vector<std::string> getNames() const;

        uint32_t getNumParameters() const {
            return static_cast<uint32_t>(params_.size());
        }

        //! Table of every parameter with its type, value, default and description
        std::string dumpList() const;

    private:

        void addParameter_(ParameterBase* p);

        ParameterVector params_;
        ParameterPairs keys_;
    }; // class ParameterSet

} // namespace parksim


/*!
 * \brief Parameter declaration
 * \param type Parameter value type. Use parentheses around default values
 * containing commas, e.g. (std::vector<double>{0, 120})
 * \param name Name of the parameter. This will be a member of the ParameterSet
 * \param def Default value
 * \param doc Description
 */
#define PARAMETER(type, name, def, doc)                                 \
    parksim::Parameter<type> name {#name, def, doc, __this_ps};

//! ParameterSet Pretty-Printing stream operator
inline std::ostream& operator<< (std::ostream& out, parksim::ParameterSet const & ps){
    out << ps.dumpList();
    return out;
}
