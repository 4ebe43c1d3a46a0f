// <CommandLineSimulator> -*- C++ -*-


/*!
 * \file CommandLineSimulator.hpp
 * \brief Class for configuring and running a theme park simulation based
 * on command-line arguments
 */

#ifndef __PARKSIM_COMMAND_LINE_SIMULATOR_H__
#define __PARKSIM_COMMAND_LINE_SIMULATOR_H__

#include <boost/program_options.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "parksim/log/Tap.hpp"
#include "parksim/model/ThemeParkParameterSet.hpp"
#include "parksim/statistics/StatisticsSnapshot.hpp"

namespace po = boost::program_options;

namespace parksim {
namespace app {

/*!
 * \brief Typed program option value carrying its own name for the help
 * text and its own token count bounds
 */
template <typename ArgT>
class named_value_type : public po::typed_value<ArgT>
{
    unsigned min_;
    unsigned max_;
    std::string my_name_;

public:

    typedef po::typed_value<ArgT> base_t;

    named_value_type(std::string const& name, ArgT* val, unsigned min, unsigned max) :
        po::typed_value<ArgT>(val),
        min_(min),
        max_(max),
        my_name_(name)
    { }

    virtual ~named_value_type() {}

    //! boost semantic for getting name of this option
    virtual std::string name() const override { return my_name_; }

    named_value_type* multitoken()
    {
        base_t::multitoken();
        return this;
    }

    virtual unsigned min_tokens() const override { return min_; }

    virtual unsigned max_tokens() const override { return max_; }
};

/*!
 * \brief Helper for creating a named_value_type for an option in an
 * options_description
 */
template <typename ArgT>
inline named_value_type<ArgT>* named_value(std::string const& name,
                                           unsigned min=1,
                                           unsigned max=1,
                                           ArgT* val=nullptr)
{
    return new named_value_type<ArgT>(name, val, min, max);
}

/*!
 * \brief Command line front-end of the theme park simulator
 *
 * Parses the command line, applies configuration files and individual
 * parameter values to a ThemeParkParameterSet in the order they were
 * given, attaches log taps, runs the simulation and writes its report.
 *
 * \code
 * parksim::app::CommandLineSimulator cls(USAGE);
 * int err_code = 0;
 * if(!cls.parse(argc, argv, err_code)){
 *     return err_code;
 * }
 * return cls.runSimulator();
 * \endcode
 */
class CommandLineSimulator
{
public:

    //! Report formats accepted by --report-format
    static constexpr char REPORT_FORMAT_TEXT[] = "text";
    static constexpr char REPORT_FORMAT_CSV[]  = "csv";

    //! Log destinations with a special meaning in --log
    static constexpr char DEST_STDOUT[] = "stdout";
    static constexpr char DEST_STDERR[] = "stderr";

    CommandLineSimulator() = delete;

    /*!
     * \param usage String describing usage of the simulator, printed before
     * the options on --help
     * \param out Stream receiving banners and the default report
     */
    explicit CommandLineSimulator(const std::string& usage,
                                  std::ostream& out=std::cout);

    virtual ~CommandLineSimulator();

    /*!
     * \brief Parse the command line and apply every configuration source
     * \param err_code Set to the process exit code when false is returned
     * \return true if the caller should go on to runSimulator. false on
     * --help or when an error was printed to cerr
     */
    bool parse(int argc, const char* const argv[], int& err_code);

    bool isParsed() const {
        return is_parsed_;
    }

    /*!
     * \brief Build the configuration, run the simulation and write the
     * report
     * \return process exit code: 0 on success, 1 on a configuration or
     * runtime error (already printed to cerr)
     * \pre parse returned true
     */
    int runSimulator();

    //! Options added by the application before parse
    po::options_description& getApplicationOptions() {
        return app_opts_;
    }

    const po::variables_map& getVariablesMap() const {
        return vm_;
    }

    ThemeParkParameterSet& getParameters() {
        return params_;
    }

    const ThemeParkParameterSet& getParameters() const {
        return params_;
    }

    //! Snapshot of the last runSimulator, nullptr before a run
    const StatisticsSnapshot* getSnapshot() const {
        return snapshot_.get();
    }

    //! Number of config files and -p values applied during parse
    uint32_t getNumConfigApplicators() const {
        return config_applicators_used_;
    }

    const std::vector<std::unique_ptr<log::Tap>>& getTaps() const {
        return taps_;
    }

    //! Print usage and all options to cout
    void printUsageHelp() const;

private:

    //! One configuration source, kept in command-line order
    struct ConfigApplicator
    {
        enum class Kind { FILE, PARAMETER };
        Kind kind;
        std::string name;  ///< file name or parameter name
        std::string value; ///< parameter value, unused for files
    };

    void applyConfig_(const ConfigApplicator& ca);

    void attachTap_(const std::vector<std::string>& tokens);

    void writeReport_() const;

    std::string usage_;
    std::ostream& out_;

    po::options_description parksim_opts_;
    po::options_description param_opts_;
    po::options_description log_opts_;
    po::options_description report_opts_;
    po::options_description app_opts_;
    po::variables_map vm_;

    ThemeParkParameterSet params_;

    std::vector<std::unique_ptr<log::Tap>> taps_;
    std::unique_ptr<StatisticsSnapshot> snapshot_;

    std::string report_file_;
    std::string report_format_ = REPORT_FORMAT_TEXT;
    bool show_parameters_ = false;
    bool no_run_ = false;
    bool show_distributions_ = false;
    bool is_parsed_ = false;
    uint32_t config_applicators_used_ = 0;
};

} // namespace app
} // namespace parksim

// __PARKSIM_COMMAND_LINE_SIMULATOR_H__
#endif
