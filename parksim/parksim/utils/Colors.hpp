// <Colors> -*- C++ -*-


/*!
 * \file Colors.hpp
 * \brief Color codes for PARKSIM console output
 */

#pragma once

#include <unistd.h>
#include <cstdio>

#define PARKSIM_UNMANAGED_COLOR_NORMAL          "\033[0;0m"
#define PARKSIM_UNMANAGED_COLOR_BOLD            "\033[0;1m"
#define PARKSIM_UNMANAGED_COLOR_RED             "\033[0;31m"
#define PARKSIM_UNMANAGED_COLOR_GREEN           "\033[0;32m"
#define PARKSIM_UNMANAGED_COLOR_YELLOW          "\033[0;33m"
#define PARKSIM_UNMANAGED_COLOR_CYAN            "\033[0;36m"
#define PARKSIM_UNMANAGED_COLOR_BRIGHT_RED      "\033[1;31m"
#define PARKSIM_UNMANAGED_COLOR_BRIGHT_GREEN    "\033[1;32m"
#define PARKSIM_UNMANAGED_COLOR_BRIGHT_CYAN     "\033[1;36m"

//! Macros for accessing the colors through the default scheme. Colors are
//! suppressed when stderr is not a terminal.
#define PARKSIM_CURRENT_COLOR_NORMAL       parksim::color::ColorScheme::getDefaultScheme().color(PARKSIM_UNMANAGED_COLOR_NORMAL)
#define PARKSIM_CURRENT_COLOR_BOLD         parksim::color::ColorScheme::getDefaultScheme().color(PARKSIM_UNMANAGED_COLOR_BOLD)
#define PARKSIM_CURRENT_COLOR_RED          parksim::color::ColorScheme::getDefaultScheme().color(PARKSIM_UNMANAGED_COLOR_RED)
#define PARKSIM_CURRENT_COLOR_GREEN        parksim::color::ColorScheme::getDefaultScheme().color(PARKSIM_UNMANAGED_COLOR_GREEN)
#define PARKSIM_CURRENT_COLOR_YELLOW       parksim::color::ColorScheme::getDefaultScheme().color(PARKSIM_UNMANAGED_COLOR_YELLOW)
#define PARKSIM_CURRENT_COLOR_BRIGHT_RED   parksim::color::ColorScheme::getDefaultScheme().color(PARKSIM_UNMANAGED_COLOR_BRIGHT_RED)
#define PARKSIM_CURRENT_COLOR_BRIGHT_GREEN parksim::color::ColorScheme::getDefaultScheme().color(PARKSIM_UNMANAGED_COLOR_BRIGHT_GREEN)
#define PARKSIM_CURRENT_COLOR_BRIGHT_CYAN  parksim::color::ColorScheme::getDefaultScheme().color(PARKSIM_UNMANAGED_COLOR_BRIGHT_CYAN)

namespace parksim
{
namespace color
{
    /*!
     * \brief Decides whether escape codes are emitted at all
     */
    class ColorScheme
    {
    public:
        ColorScheme() :
            enabled_(isatty(fileno(stderr)) != 0)
        { }

        static ColorScheme & getDefaultScheme() {
            static ColorScheme scheme;
            return scheme;
        }

        const char * color(const char * code) const {
            return enabled_ ? code : "";
        }

        void enabled(bool on) {
            enabled_ = on;
        }

        bool enabled() const {
            return enabled_;
        }

    private:
        bool enabled_;
    };
} // namespace color
} // namespace parksim
