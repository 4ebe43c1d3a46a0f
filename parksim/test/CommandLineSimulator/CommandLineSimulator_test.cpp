// <CommandLineSimulator_test> -*- C++ -*-

/**
 * \file CommandLineSimulator_test
 * \brief Command line parsing, configuration ordering and report output
 */

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "parksim/app/CommandLineSimulator.hpp"
#include "parksim/utils/ParksimTester.hpp"

TEST_INIT

namespace
{
    const char USAGE[] = "Usage:\n    CommandLineSimulator_test [options]\n";

    bool contains(const std::string & haystack, const std::string & needle)
    {
        return haystack.find(needle) != std::string::npos;
    }

    //! Parse \a args as if given after the program name
    bool parseArgs(parksim::app::CommandLineSimulator & cls,
                   const std::vector<const char*> & args,
                   int & err_code)
    {
        std::vector<const char*> argv;
        argv.push_back("CommandLineSimulator_test");
        argv.insert(argv.end(), args.begin(), args.end());
        return cls.parse(static_cast<int>(argv.size()), argv.data(), err_code);
    }
}

void testParameterOrdering()
{
    {
        // -p after -c overrides the file
        std::stringstream out;
        parksim::app::CommandLineSimulator cls(USAGE, out);
        int err_code = -1;
        EXPECT_TRUE(parseArgs(cls, {"-c", "configs/small.yaml", "-p", "num_rides", "5"}, err_code));
        EXPECT_EQUAL(err_code, 0);
        EXPECT_TRUE(cls.isParsed());
        EXPECT_EQUAL(cls.getParameters().num_rides.getValue(), 5);
        EXPECT_EQUAL(cls.getParameters().seed.getValue(), 7);
        EXPECT_EQUAL(cls.getNumConfigApplicators(), 2);
    }
    {
        // the file given last wins
        std::stringstream out;
        parksim::app::CommandLineSimulator cls(USAGE, out);
        int err_code = -1;
        EXPECT_TRUE(parseArgs(cls, {"-p", "num_rides", "5", "--config-file", "configs/small.yaml"}, err_code));
        EXPECT_EQUAL(cls.getParameters().num_rides.getValue(), 2);
    }
    {
        // shorthands for run_time and seed, repeated -p allowed
        std::stringstream out;
        parksim::app::CommandLineSimulator cls(USAGE, out);
        int err_code = -1;
        EXPECT_TRUE(parseArgs(cls, {"-r", "30", "--seed", "11",
                                    "-p", "service_min", "1", "-p", "service_max", "2"}, err_code));
        EXPECT_EQUAL(cls.getParameters().run_time.getValue(), 30.0);
        EXPECT_EQUAL(cls.getParameters().seed.getValue(), 11);
        EXPECT_EQUAL(cls.getParameters().service_max.getValue(), 2.0);
        EXPECT_EQUAL(cls.getNumConfigApplicators(), 4);
    }
}

void testParseErrors()
{
    std::stringstream out;
    int err_code = -1;

    parksim::app::CommandLineSimulator help(USAGE, out);
    EXPECT_FALSE(parseArgs(help, {"--help"}, err_code));
    EXPECT_EQUAL(err_code, 0);
    EXPECT_FALSE(help.isParsed());

    parksim::app::CommandLineSimulator bad_option(USAGE, out);
    EXPECT_FALSE(parseArgs(bad_option, {"--not-an-option"}, err_code));
    EXPECT_EQUAL(err_code, 1);

    parksim::app::CommandLineSimulator unknown_param(USAGE, out);
    err_code = -1;
    EXPECT_FALSE(parseArgs(unknown_param, {"-p", "num_coasters", "2"}, err_code));
    EXPECT_EQUAL(err_code, 1);

    parksim::app::CommandLineSimulator bad_value(USAGE, out);
    err_code = -1;
    EXPECT_FALSE(parseArgs(bad_value, {"-p", "num_rides", "many"}, err_code));
    EXPECT_EQUAL(err_code, 1);

    parksim::app::CommandLineSimulator missing_file(USAGE, out);
    err_code = -1;
    EXPECT_FALSE(parseArgs(missing_file, {"-c", "configs/does_not_exist.yaml"}, err_code));
    EXPECT_EQUAL(err_code, 1);

    parksim::app::CommandLineSimulator bad_format(USAGE, out);
    err_code = -1;
    EXPECT_FALSE(parseArgs(bad_format, {"--report-format", "xml"}, err_code));
    EXPECT_EQUAL(err_code, 1);

    // Not parsed yet
    parksim::app::CommandLineSimulator unparsed(USAGE, out);
    EXPECT_THROW(unparsed.runSimulator());
}

void testLogTaps()
{
    std::stringstream out;
    parksim::app::CommandLineSimulator cls(USAGE, out);
    int err_code = -1;
    EXPECT_TRUE(parseArgs(cls, {"-l", "info", "stdout", "park",
                                "--log", "warning", "stderr"}, err_code));
    EXPECT_EQUAL(cls.getTaps().size(), 2);
}

void testNoRun()
{
    std::stringstream out;
    parksim::app::CommandLineSimulator cls(USAGE, out);
    int err_code = -1;
    EXPECT_TRUE(parseArgs(cls, {"--no-run", "--show-parameters", "-p", "num_rides", "4"}, err_code));
    EXPECT_EQUAL(cls.runSimulator(), 0);
    EXPECT_TRUE(cls.getSnapshot() == nullptr);
    EXPECT_TRUE(contains(out.str(), "Parameters:"));
    EXPECT_TRUE(contains(out.str(), "num_rides"));
    EXPECT_FALSE(contains(out.str(), "Simulation Complete!"));
}

void testInvalidConfigurationAtRun()
{
    // service_min above service_max is only caught when the config is built
    std::stringstream out;
    parksim::app::CommandLineSimulator cls(USAGE, out);
    int err_code = -1;
    EXPECT_TRUE(parseArgs(cls, {"-p", "service_min", "9"}, err_code));
    EXPECT_EQUAL(cls.runSimulator(), 1);
    EXPECT_TRUE(cls.getSnapshot() == nullptr);
}

void testRunTextReport()
{
    std::stringstream out;
    parksim::app::CommandLineSimulator cls(USAGE, out);
    int err_code = -1;
    EXPECT_TRUE(parseArgs(cls, {"-c", "configs/small.yaml", "--distributions"}, err_code));
    EXPECT_EQUAL(cls.runSimulator(), 0);

    const std::string text = out.str();
    EXPECT_TRUE(contains(text, "Theme Park Ride Simulation Starting..."));
    EXPECT_TRUE(contains(text, "Simulation Complete!"));
    EXPECT_TRUE(contains(text, "Simulation Results"));
    EXPECT_TRUE(contains(text, "- Total visitors: "));
    EXPECT_TRUE(contains(text, "Visitor arrivals over time:"));

    EXPECT_TRUE(cls.getSnapshot() != nullptr);
    EXPECT_EQUAL(cls.getSnapshot()->getResourceCount(), 2);
    EXPECT_EQUAL(cls.getSnapshot()->getHorizon(), 120.0);
    EXPECT_EQUAL(cls.getSnapshot()->getTotalFailures(), 0);
}

void testRunCsvReportToFile()
{
    const std::string filename = "CommandLineSimulator_test.csv";
    std::stringstream out;
    parksim::app::CommandLineSimulator cls(USAGE, out);
    int err_code = -1;
    EXPECT_TRUE(parseArgs(cls, {"-c", "configs/small.yaml",
                                "--report", filename.c_str(),
                                "--report-format", "CSV"}, err_code));
    EXPECT_EQUAL(cls.runSimulator(), 0);
    EXPECT_TRUE(contains(out.str(), "Report written to " + filename));
    EXPECT_FALSE(contains(out.str(), "Simulation Results"));

    std::ifstream in(filename);
    EXPECT_TRUE(in.good());
    std::stringstream csv;
    csv << in.rdbuf();
    EXPECT_EQUAL(csv.str().find("section,name,value\n"), 0);
    EXPECT_TRUE(contains(csv.str(), "summary,rides,2\n"));
    EXPECT_TRUE(contains(csv.str(), "summary,horizon,120\n"));
}

int main()
{
    testParameterOrdering();
    testParseErrors();
    testLogTaps();
    testNoRun();
    testInvalidConfigurationAtRun();
    testRunTextReport();
    testRunCsvReportToFile();

    REPORT_ERROR;
    return ERROR_CODE;
}
