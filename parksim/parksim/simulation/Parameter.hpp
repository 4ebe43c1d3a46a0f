// <Parameter> -*- C++ -*-

/*!
 * \file Parameter.hpp
 * \brief Named, typed, documented configuration values
 */

#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "parksim/utils/LexicalCast.hpp"
#include "parksim/utils/ParksimAssert.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace parksim
{
    class ParameterSet;

    namespace detail
    {
        //! Conversion of scalar parameter values to and from strings
        template <class T>
        struct ParameterTraits
        {
            static constexpr bool is_vector = false;

            static std::string typeName() {
                return utils::typeName<T>();
            }

            static T fromStrings(const std::string& pname, const std::vector<std::string>& strs) {
                if(strs.size() != 1){
                    throw InvalidConfiguration("Parameter \"") << pname << "\" is a scalar of type "
                        << typeName() << " but was given " << strs.size() << " values";
                }
                return utils::lexicalCast<T>(strs[0]);
            }

            static std::string toString(const T& val) {
                std::stringstream ss;
                ss << std::boolalpha << val;
                return ss.str();
            }
        };

        //! Conversion of vector parameter values to and from strings
        template <class T>
        struct ParameterTraits<std::vector<T>>
        {
            static constexpr bool is_vector = true;

            static std::string typeName() {
                return std::string("vector<") + utils::typeName<T>() + ">";
            }

            static std::vector<T> fromStrings(const std::string&, const std::vector<std::string>& strs) {
                std::vector<T> out;
                out.reserve(strs.size());
                for(const auto& s : strs){
                    out.push_back(utils::lexicalCast<T>(s));
                }
                return out;
            }

            static std::string toString(const std::vector<T>& val) {
                std::stringstream ss;
                ss << std::boolalpha << '[';
                for(size_t i = 0; i < val.size(); ++i){
                    if(i != 0){
                        ss << ", ";
                    }
                    ss << val[i];
                }
                ss << ']';
                return ss.str();
            }
        };
    } // namespace detail

    /*!
     * \brief Non-templated base class for generic parameter access
     *
     * Values can be assigned from strings regardless of the parameter type.
     * Vector parameters accept a list of strings, or a single string holding
     * a comma-separated list optionally wrapped in brackets ("[1, 2, 3]").
     */
    class ParameterBase
    {
    public:

        ParameterBase(const ParameterBase&) = delete;
        ParameterBase& operator=(const ParameterBase&) = delete;

        ParameterBase(const std::string& name, const std::string& desc) :
            name_(name),
            desc_(desc)
        { }

        virtual ~ParameterBase() {}

        const std::string& getName() const {
            return name_;
        }

        const std::string& getDesc() const {
            return desc_;
        }

        //! Number of times this parameter has been written since construction
        uint32_t getWriteCount() const {
            return write_count_;
        }

        virtual std::string getTypeName() const = 0;

        virtual std::string getValueAsString() const = 0;

        virtual std::string getDefaultAsString() const = 0;

        virtual bool isVector() const = 0;

        //! Is the current value equal to the default
        virtual bool isDefault() const = 0;

        /*!
         * \brief Assign from a string
         * \throw InvalidConfiguration if the string cannot be cast to the
         * parameter type or the value fails validation
         */
        void setValueFromString(const std::string& str);

        /*!
         * \brief Assign from a list of strings. A scalar parameter takes
         * exactly one.
         * \throw InvalidConfiguration as setValueFromString
         */
        void setValueFromStringVector(const std::vector<std::string>& strs) {
            setValueFromStringVectorImpl_(strs);
        }

        /*!
         * \brief Run every validator attached to this parameter
         * \param errs Names of failed constraints are appended here
         * \return true if all passed
         */
        virtual bool validate(std::string& errs) const = 0;

        std::string stringize() const {
            std::stringstream ss;
            ss << "<param " << getTypeName() << " " << name_ << "="
               << getValueAsString() << ", def=" << getDefaultAsString()
               << ", write=" << write_count_ << ">";
            return ss.str();
        }

    protected:

        virtual void setValueFromStringVectorImpl_(const std::vector<std::string>& strs) = 0;

        //! Register with the owning set
        void addToSet_(ParameterSet* ps);

        uint32_t write_count_ = 0;

    private:

        const std::string name_;
        const std::string desc_;
    };

    /*!
     * \brief Parameter instance, templated to contain only a specific type.
     * Declare these inside a ParameterSet with the PARAMETER macro.
     *
     * Validators are checked whenever the value is set. A value failing
     * one is rejected and the previous value is kept.
     *
     * \code
     * PARAMETER(uint32_t, num_rides, 3, "Number of rides in the park")
     * // ...
     * num_rides.addValidator("positive", [](const uint32_t& v) { return v > 0; });
     * \endcode
     */
    template <class ValueType>
    class Parameter : public ParameterBase
    {
        typedef detail::ParameterTraits<ValueType> traits;

    public:

        typedef ValueType value_type;

        //! Validation predicate. Returns true when the value is acceptable
        typedef std::function<bool (const ValueType&)> Validator;

        /*!
         * \brief Constructor used by the PARAMETER macro
         */
        Parameter(const std::string& name,
                  const ValueType& def,
                  const std::string& doc,
                  ParameterSet* ps) :
            ParameterBase(name, doc),
            def_val_(def),
            val_(def)
        {
            parksim_assert(ps, "Must construct parameter " << name << " with valid ParameterSet");
            addToSet_(ps);
        }

        const ValueType& getValue() const {
            return val_;
        }

        const ValueType& getDefault() const {
            return def_val_;
        }

        operator const ValueType&() const {
            return val_;
        }

        Parameter& operator=(const ValueType& v) {
            setValue(v);
            return *this;
        }

        /*!
         * \brief Set the value and check it against every validator
         * \throw InvalidConfiguration if a validator rejects \a v
         */
        void setValue(const ValueType& v) {
            ValueType prev = val_;
            val_ = v;
            std::string errs;
            if(!validate(errs)){
                val_ = std::move(prev);
                throw InvalidConfiguration("Parameter \"") << getName() << "\" cannot be set to "
                    << traits::toString(v) << ": violates " << errs;
            }
            ++write_count_;
        }

        //! Attach a validator named \a constraint
        void addValidator(const std::string& constraint, const Validator& v) {
            validators_.emplace_back(constraint, v);
        }

        std::string getTypeName() const override final {
            return traits::typeName();
        }

        std::string getValueAsString() const override final {
            return traits::toString(val_);
        }

        std::string getDefaultAsString() const override final {
            return traits::toString(def_val_);
        }

        bool isVector() const override final {
            return traits::is_vector;
        }

        bool isDefault() const override final {
            return val_ == def_val_;
        }

        bool validate(std::string& errs) const override {
            bool ok = true;
            for(const auto& v : validators_){
                if(!v.second(val_)){
                    if(!errs.empty()){
                        errs += ", ";
                    }
                    errs += "\"" + v.first + "\"";
                    ok = false;
                }
            }
            return ok;
        }

    private:

        void setValueFromStringVectorImpl_(const std::vector<std::string>& strs) override final {
            setValue(traits::fromStrings(getName(), strs));
        }

        const ValueType def_val_;
        ValueType val_;
        std::vector<std::pair<std::string, Validator>> validators_;
    };

} // namespace parksim
