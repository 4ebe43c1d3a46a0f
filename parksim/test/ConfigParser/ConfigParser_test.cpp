// <ConfigParser_test> -*- C++ -*-

/**
 * \file ConfigParser_test
 * \brief Reading parameter values from YAML files, with includes
 *
 * Runs from the directory holding configs/
 */

#include <sstream>
#include <string>
#include <vector>

#include "parksim/log/Tap.hpp"
#include "parksim/model/ThemeParkParameterSet.hpp"
#include "parksim/parsers/ConfigParserYAML.hpp"
#include "parksim/utils/ParksimException.hpp"
#include "parksim/utils/ParksimTester.hpp"

TEST_INIT

using YamlParser = parksim::ConfigParser::YAML;

void testBasicFile()
{
    parksim::ThemeParkParameterSet ps;
    YamlParser parser("configs/basic.yaml");
    EXPECT_EQUAL(parser.getFilename(), std::string("configs/basic.yaml"));
    parser.consumeParameters(ps);

    EXPECT_EQUAL(parser.getNumApplied(), 4);
    EXPECT_EQUAL(ps.num_rides.getValue(), 4);
    EXPECT_TRUE(ps.ride_capacity.getValue() == (std::vector<uint32_t>{5, 6, 7, 8}));
    EXPECT_EQUAL(ps.seed.getValue(), 9);
    EXPECT_EQUAL(ps.selection_policy.getValue(), std::string("unconditional"));

    const parksim::SimulationConfig cfg = ps.makeConfig();
    EXPECT_EQUAL(cfg.getCapacity(3), 8);
}

void testInclude()
{
    parksim::ThemeParkParameterSet ps;
    YamlParser parser("configs/with_include.yaml");
    parser.consumeParameters(ps, true);

    // The include is resolved next to the including file
    EXPECT_EQUAL(parser.getFilesRead().size(), 2);
    EXPECT_EQUAL(ps.run_time.getValue(), 120.0);
    EXPECT_EQUAL(ps.num_rides.getValue(), 2);
    EXPECT_TRUE(ps.ride_capacity.getValue() == (std::vector<uint32_t>{3}));
    EXPECT_EQUAL(ps.service_min.getValue(), 1.0);
    EXPECT_EQUAL(parser.getNumApplied(), 5);
}

void testIncludeSearchPath()
{
    parksim::ThemeParkParameterSet ps;
    EXPECT_THROW_MSG_CONTAINS(YamlParser("configs/from_search_path.yaml").consumeParameters(ps),
                              "Could not resolve location of included file");

    YamlParser parser("configs/from_search_path.yaml", {"configs/shared"});
    parser.consumeParameters(ps);
    EXPECT_EQUAL(ps.num_rides.getValue(), 5);
}

void testUnknownParameter()
{
    parksim::ThemeParkParameterSet ps;
    EXPECT_THROW_MSG_CONTAINS(YamlParser("configs/unknown.yaml").consumeParameters(ps),
                              "Unknown parameter \"not_a_parameter\"");

    parksim::ThemeParkParameterSet lenient;
    std::stringstream warnings;
    {
        parksim::log::Tap t("warning", warnings);
        YamlParser parser("configs/unknown.yaml");
        parser.allowUnknownParameters(true);
        EXPECT_TRUE(parser.doesAllowUnknownParameters());
        EXPECT_NOTHROW(parser.consumeParameters(lenient));
        EXPECT_EQUAL(parser.getNumApplied(), 1);
    }
    EXPECT_EQUAL(lenient.num_rides.getValue(), 2);
    EXPECT_TRUE(warnings.str().find("Ignoring unknown parameter \"not_a_parameter\"") != std::string::npos);
}

void testErrors()
{
    parksim::ThemeParkParameterSet ps;

    EXPECT_THROW_TYPE(YamlParser("configs/does_not_exist.yaml"), parksim::InvalidConfiguration);
    EXPECT_THROW_MSG_CONTAINS(YamlParser("configs/bad_value.yaml").consumeParameters(ps), "(line 2)");
    EXPECT_THROW_MSG_CONTAINS(YamlParser("configs/recursive_a.yaml").consumeParameters(ps), "Recursive include");
    EXPECT_THROW_MSG_CONTAINS(YamlParser("configs/missing_include.yaml").consumeParameters(ps), "nowhere.yaml");
    EXPECT_THROW_MSG_CONTAINS(YamlParser("configs/not_a_map.yaml").consumeParameters(ps), "must contain a map");
    EXPECT_THROW_MSG_CONTAINS(YamlParser("configs/malformed.yaml").consumeParameters(ps), "Error parsing");
    EXPECT_THROW_MSG_CONTAINS(YamlParser("configs/nested.yaml").consumeParameters(ps),
                              "scalar or a sequence");

    // Values before the bad one were applied, the bad one was not
    parksim::ThemeParkParameterSet partial;
    EXPECT_THROW(YamlParser("configs/bad_value.yaml").consumeParameters(partial));
    EXPECT_EQUAL(partial.seed.getValue(), 1);
    EXPECT_EQUAL(partial.num_rides.getValue(), 3);
}

void testEmptyFile()
{
    parksim::ThemeParkParameterSet ps;
    YamlParser parser("configs/empty.yaml");
    EXPECT_NOTHROW(parser.consumeParameters(ps));
    EXPECT_EQUAL(parser.getNumApplied(), 0);
    EXPECT_TRUE(ps.num_rides.isDefault());
}

int main()
{
    testBasicFile();
    testInclude();
    testIncludeSearchPath();
    testUnknownParameter();
    testErrors();
    testEmptyFile();

    REPORT_ERROR;
    return ERROR_CODE;
}
