// <CategoryManager> -*- C++ -*-

#pragma once

#include <string>

namespace parksim
{
    namespace log
    {
        class categories
        {
        public:

            static constexpr char INFO_STR[] = "info";
            static constexpr char WARN_STR[] = "warning";
            static constexpr char DEBUG_STR[] = "debug";

            //! Observing with this category matches any category
            static constexpr char ANY_STR[] = "*";

        }; // class categories
    } // namespace log
} // namespace parksim
