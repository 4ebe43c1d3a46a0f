// <CommandLineSimulator> -*- C++ -*-


/*!
 * \file CommandLineSimulator.cpp
 * \brief Class for configuring and running a theme park simulation based
 * on command-line arguments
 */

#include "parksim/app/CommandLineSimulator.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/parsers.hpp>
#include <exception>
#include <utility>

#include "parksim/model/ThemePark.hpp"
#include "parksim/parsers/ConfigParserYAML.hpp"
#include "parksim/report/format/CSV.hpp"
#include "parksim/report/format/Text.hpp"
#include "parksim/utils/ParksimAssert.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace parksim {
namespace app {

//! Width of options help in characters
static const uint32_t OPTIONS_DOC_WIDTH = 120;

CommandLineSimulator::CommandLineSimulator(const std::string& usage,
                                           std::ostream& out) :
    usage_(usage),
    out_(out),
    parksim_opts_("General Options", OPTIONS_DOC_WIDTH),
    param_opts_("Parameter Options", OPTIONS_DOC_WIDTH),
    log_opts_("Logging Options", OPTIONS_DOC_WIDTH),
    report_opts_("Report Options", OPTIONS_DOC_WIDTH),
    app_opts_("Application-Specific Options", OPTIONS_DOC_WIDTH)
{
    parksim_opts_.add_options()
        ("help,h", "Show this help message")
        ("run-time,r",
         named_value<std::string>("MINUTES"),
         "Minutes of simulated time. Same as -p run_time MINUTES")
        ("seed",
         named_value<std::string>("SEED"),
         "Seed of the random stream. Same as -p seed SEED")
        ("no-run",
         "Apply the configuration and stop before running. Useful with --show-parameters")
        ;

    param_opts_.add_options()
        ("parameter,p",
         named_value<std::vector<std::string>>("NAME VALUE", 2, 2)->multitoken(),
         "Set parameter NAME to VALUE. Vector values are comma separated, "
         "optionally in brackets. Example: -p ride_capacity \"[10,20,10]\"")
        ("config-file,c",
         named_value<std::string>("FILENAME"),
         "Apply a YAML file of 'name: value' parameters. Files and -p options "
         "are applied in the order given")
        ("show-parameters",
         "Print every parameter with its final value before running")
        ;

    log_opts_.add_options()
        ("log,l",
         named_value<std::vector<std::string>>("CATEGORY DEST [ORIGIN]", 2, 3)->multitoken(),
         "Write log messages of CATEGORY (info, warning, debug or '*') to DEST. "
         "DEST is 'stdout', 'stderr' or a file name. ORIGIN limits the tap to one "
         "source and its children, for example 'ride.0' or 'visitors'")
        ;

    report_opts_.add_options()
        ("report",
         named_value<std::string>("FILENAME"),
         "Write the report to FILENAME instead of stdout")
        ("report-format",
         named_value<std::string>("FORMAT"),
         "Report format: 'text' (default) or 'csv'")
        ("distributions",
         "Add queue time, ride usage and arrival distribution tables to text reports")
        ;
}

CommandLineSimulator::~CommandLineSimulator()
{
}

void CommandLineSimulator::printUsageHelp() const
{
    std::cout << usage_ << std::endl;
    std::cout << parksim_opts_ << std::endl
              << param_opts_ << std::endl
              << log_opts_ << std::endl
              << report_opts_ << std::endl;
    if(!app_opts_.options().empty()){
        std::cout << app_opts_ << std::endl;
    }
}

bool CommandLineSimulator::parse(int argc,
                                 const char* const argv[],
                                 int& err_code)
{
    po::options_description all_opts("All Options", OPTIONS_DOC_WIDTH);
    all_opts.add(parksim_opts_)
            .add(param_opts_)
            .add(log_opts_)
            .add(report_opts_)
            .add(app_opts_);

    std::vector<ConfigApplicator> applicators;
    std::vector<std::vector<std::string>> log_taps;

    try{
        po::parsed_options opts = po::command_line_parser(argc, argv)
            .options(all_opts)
            .run();

        // Interpret configuration and logging options in the order given on
        // the command line. Everything consumed here is removed before the
        // remaining options are stored so that repeated options are allowed
        for(size_t i = 0; i < opts.options.size(); /*increment conditionally*/){
            const po::option& o = opts.options[i];
            if(o.string_key == "parameter"){
                if(o.value.size() != 2){
                    std::cerr << "command-line option \"" << o.string_key << "\" had " << o.value.size()
                              << " tokens but requires 2.\nExample:\n   -p num_rides 4"
                              << std::endl;
                    printUsageHelp();
                    err_code = 1;
                    return false;
                }
                applicators.push_back({ConfigApplicator::Kind::PARAMETER, o.value[0], o.value[1]});
                opts.options.erase(opts.options.begin() + i);
            }else if(o.string_key == "run-time" || o.string_key == "seed"){
                const std::string pname = (o.string_key == "run-time") ? "run_time" : "seed";
                applicators.push_back({ConfigApplicator::Kind::PARAMETER, pname, o.value.at(0)});
                opts.options.erase(opts.options.begin() + i);
            }else if(o.string_key == "config-file"){
                applicators.push_back({ConfigApplicator::Kind::FILE, o.value.at(0), ""});
                opts.options.erase(opts.options.begin() + i);
            }else if(o.string_key == "log"){
                if(o.value.size() < 2 || o.value.size() > 3){
                    std::cerr << "command-line option \"" << o.string_key << "\" had " << o.value.size()
                              << " tokens but requires 2 or 3.\nExample:\n   -l info stdout ride.0"
                              << std::endl;
                    printUsageHelp();
                    err_code = 1;
                    return false;
                }
                log_taps.push_back(o.value);
                opts.options.erase(opts.options.begin() + i);
            }else{
                ++i;
            }
        }

        po::store(opts, vm_);
        po::notify(vm_);
    }catch(po::multiple_occurrences& ex){
        std::cerr << "Error:\n  " << ex.what() << " from option \"" << ex.get_option_name() << "\""
                  << std::endl;
        printUsageHelp();
        err_code = 1;
        return false;
    }catch(po::error& ex){
        std::cerr << "Error:\n  " << ex.what() << std::endl;
        printUsageHelp();
        err_code = 1;
        return false;
    }

    if(vm_.count("help")){
        printUsageHelp();
        err_code = 0;
        return false;
    }

    show_parameters_ = vm_.count("show-parameters") > 0;
    no_run_ = vm_.count("no-run") > 0;
    show_distributions_ = vm_.count("distributions") > 0;
    if(vm_.count("report")){
        report_file_ = vm_["report"].as<std::string>();
    }
    if(vm_.count("report-format")){
        report_format_ = boost::algorithm::to_lower_copy(vm_["report-format"].as<std::string>());
        if(report_format_ != REPORT_FORMAT_TEXT && report_format_ != REPORT_FORMAT_CSV){
            std::cerr << "Error:\n  unknown report format \"" << report_format_
                      << "\". Expected \"" << REPORT_FORMAT_TEXT << "\" or \""
                      << REPORT_FORMAT_CSV << "\"" << std::endl;
            err_code = 1;
            return false;
        }
    }

    try{
        for(const ConfigApplicator& ca : applicators){
            applyConfig_(ca);
        }
        for(const auto& tokens : log_taps){
            attachTap_(tokens);
        }
    }catch(ParksimException& ex){
        std::cerr << "Error:\n  " << ex.what() << std::endl;
        err_code = 1;
        return false;
    }

    is_parsed_ = true;
    err_code = 0;
    return true;
}

void CommandLineSimulator::applyConfig_(const ConfigApplicator& ca)
{
    if(ca.kind == ConfigApplicator::Kind::FILE){
        ConfigParser::YAML parser(ca.name);
        parser.consumeParameters(params_);
    }else{
        params_.getParameter(ca.name)->setValueFromString(ca.value);
    }
    ++config_applicators_used_;
}

void CommandLineSimulator::attachTap_(const std::vector<std::string>& tokens)
{
    parksim_assert(tokens.size() == 2 || tokens.size() == 3);
    const std::string& category = tokens[0];
    const std::string& dest = tokens[1];
    const std::string origin = tokens.size() == 3 ? tokens[2] : std::string();

    if(dest == DEST_STDOUT){
        taps_.emplace_back(new log::Tap(category, std::cout, origin));
    }else if(dest == DEST_STDERR){
        taps_.emplace_back(new log::Tap(category, std::cerr, origin));
    }else{
        taps_.emplace_back(new log::Tap(category, dest, origin));
    }
}

int CommandLineSimulator::runSimulator()
{
    parksim_assert(is_parsed_, "runSimulator called before a successful parse");

    try{
        if(show_parameters_){
            out_ << "Parameters:\n" << params_.dumpList() << std::endl;
        }
        SimulationConfig cfg = params_.makeConfig();
        if(no_run_){
            return 0;
        }

        out_ << "Theme Park Ride Simulation Starting..." << std::endl;
        snapshot_.reset(new StatisticsSnapshot(runSimulation(cfg)));
        out_ << "Simulation Complete!" << std::endl;

        writeReport_();
    }catch(ParksimException& ex){
        std::cerr << "Error:\n  " << ex.what() << std::endl;
        return 1;
    }catch(std::ios_base::failure& ex){
        std::cerr << "Error:\n  failed writing report: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

void CommandLineSimulator::writeReport_() const
{
    parksim_assert(snapshot_ != nullptr);
    if(report_file_.empty()){
        out_ << std::endl;
        if(report_format_ == REPORT_FORMAT_CSV){
            report::format::CSV(snapshot_.get(), out_).write();
        }else{
            report::format::Text fmt(snapshot_.get(), out_);
            fmt.setShowDistributions(show_distributions_);
            fmt.write();
        }
        return;
    }

    if(report_format_ == REPORT_FORMAT_CSV){
        report::format::CSV(snapshot_.get(), report_file_).write();
    }else{
        report::format::Text fmt(snapshot_.get(), report_file_);
        fmt.setShowDistributions(show_distributions_);
        fmt.write();
    }
    out_ << "Report written to " << report_file_ << std::endl;
}

} // namespace app
} // namespace parksim
