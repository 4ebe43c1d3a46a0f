// <ConfigParserYAML> -*- C++ -*-

#pragma once

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <boost/filesystem/path.hpp>

#include "parksim/parsers/ConfigParser.hpp"

namespace parksim
{
    namespace ConfigParser
    {
        /*!
         * \brief Applies a YAML file of parameter values to a ParameterSet.
         *
         * The file is a map of parameter names to values. A value is a
         * scalar, or a sequence of scalars for vector parameters:
         * \code
         * run_time: 600
         * ride_capacity: [8, 10, 12]
         * include: crowded_afternoon.yaml   # applied here, in order
         * \endcode
         * Included files are looked up relative to the including file first,
         * then in each of the include paths. Keys starting with "//" are
         * ignored.
         */
        class YAML : public ConfigParser
        {
        public:

            /*!
             * \param filename File to read
             * \param include_paths Extra directories searched for includes
             */
            YAML(const std::string& filename,
                 const std::vector<std::string>& include_paths = {});

            void consumeParameters(ParameterSet& ps, bool verbose=false) override;

            /*!
             * \brief When set, unknown parameter names are reported on the
             * global warning log instead of failing the parse
             */
            void allowUnknownParameters(bool allow) {
                allow_unknown_ = allow;
            }

            bool doesAllowUnknownParameters() const {
                return allow_unknown_;
            }

            //! Number of parameter values applied by the last consumeParameters
            uint32_t getNumApplied() const {
                return num_applied_;
            }

            //! Every file read by the last consumeParameters, in order
            const std::vector<std::string>& getFilesRead() const {
                return files_read_;
            }

        private:

            void consumeFile_(const boost::filesystem::path& file,
                              ParameterSet& ps,
                              bool verbose,
                              std::vector<boost::filesystem::path>& stack);

            void applyValue_(const std::string& key,
                             const ::YAML::Node& value,
                             const boost::filesystem::path& file,
                             ParameterSet& ps,
                             bool verbose);

            boost::filesystem::path resolveInclude_(const std::string& include,
                                                    const boost::filesystem::path& from) const;

            const std::vector<std::string> include_paths_;
            bool allow_unknown_ = false;
            uint32_t num_applied_ = 0;
            std::vector<std::string> files_read_;
        };
    }
} // namespace parksim
