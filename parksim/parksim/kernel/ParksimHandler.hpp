// <ParksimHandler.hpp> -*- C++ -*-

/**
 * \file   ParksimHandler.hpp
 * \brief  File that contains the macro used to generate process continuations.
 */

#pragma once

#include <iostream>
#include <cinttypes>
#include <string>

namespace parksim
{
#ifndef DO_NOT_DOCUMENT
    /**
     * \class ParksimHandler
     *
     * Based on the delegate concept document
     * http://www.codeproject.com/Articles/11015/The-Impossibly-Fast-C-Delegates
     * by Sergey Ryazanov
     *
     * A copyable delegate bound to a member function of a simulation
     * process. A process stores the handler it wants to be resumed at as
     * its continuation.
     *
     * Don't use this class directly: use the CREATE_PARKSIM_HANDLER macro
     * provided at the end of this file.
     */
    class ParksimHandler
    {
    public:
        friend std::ostream & operator<<(std::ostream & os, const ParksimHandler & md);

        /*!
         * \brief Named constructor. Creates an unbound handler
         */
        explicit ParksimHandler(const char * name = "<unbound>") :
            object_ptr(nullptr),
            stub_ptr(nullptr),
            name_(name)
        {}

        ParksimHandler(const ParksimHandler& rhp) = default;

        ParksimHandler& operator=(const ParksimHandler&) = default;

        template <class T, void (T::*TMethod)()>
        static ParksimHandler from_member(T* object_ptr, const char * name = "")
        {
            ParksimHandler d(name);
            d.object_ptr = object_ptr;
            d.stub_ptr = &method_stub<T, TMethod>;
            return d;
        }

        void operator()() const
        {
            (*stub_ptr)(object_ptr);
        }

        const char * getName() const {
            return name_;
        }

        bool operator==(const ParksimHandler & rhs) const {
            return (object_ptr == rhs.object_ptr) && (stub_ptr == rhs.stub_ptr);
        }

        bool operator!=(const ParksimHandler & rhs) const {
            return !operator==(rhs);
        }

        operator bool() const {
            return (object_ptr != nullptr);
        }

    private:

        typedef void (*stub_type)(void* object_ptr);

        void* object_ptr;
        stub_type stub_ptr;

        const char * name_;

        template <class T, void (T::*TMethod)()>
        static void method_stub(void* object_ptr)
        {
            T* p = static_cast<T*>(object_ptr);
            (p->*TMethod)();
        }
    };

    inline std::ostream & operator<<(std::ostream & os, const ParksimHandler & md)
    {
        os << md.getName();
        return os;
    }

#endif

    /*!
     * \def CREATE_PARKSIM_HANDLER(clname, meth)
     *
     * Creates a \c ParksimHandler type given the class name (\c clname)
     * and a class method (\c meth). The method must take no arguments
     * and return void.
     *
     * \code
     * hold_(5.0, CREATE_PARKSIM_HANDLER(Visitor, finishRide_));
     * \endcode
     */
#define CREATE_PARKSIM_HANDLER(clname, meth)                           \
    parksim::ParksimHandler::from_member<clname, &clname::meth>         \
    (this, #clname"::"#meth"()")

} // namespace parksim
