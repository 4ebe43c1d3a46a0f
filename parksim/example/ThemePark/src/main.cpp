// <main.cpp> -*- C++ -*-


#include <iostream>

#include "parksim/app/CommandLineSimulator.hpp"
#include "parksim/parksim.hpp"

// User-friendly usage that correspond with
// parksim::app::CommandLineSimulator options
const char USAGE[] =
    "Usage:\n"
    "    [-c <config.yaml>]          # Apply a YAML parameter file\n"
    "    [-p <name> <value>]...      # Override one parameter\n"
    "    [-r <minutes>] [--seed <n>]\n"
    "    [-l <category> <dest> [<origin>]]\n"
    "    [--report <file>] [--report-format text|csv]\n"
    "    [-h]\n"
    "\n";

int main(int argc, char **argv)
{
    // Helper class for parsing command line arguments, applying the
    // configuration, and running the simulation
    parksim::app::CommandLineSimulator cls(USAGE);

    // Parse command line options and configure the park
    int err_code = 0;
    if(!cls.parse(argc, argv, err_code)){
        return err_code; // Any errors already printed to cerr
    }

    return cls.runSimulator();
}
