// <ConfigParserYAML> -*- C++ -*-

#include "parksim/parsers/ConfigParserYAML.hpp"

#include <yaml-cpp/exceptions.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/operations.hpp>
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "parksim/log/MessageSource.hpp"
#include "parksim/utils/ParksimAssert.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace bfs = boost::filesystem;

namespace parksim
{
    namespace ConfigParser
    {
        YAML::YAML(const std::string& filename,
                   const std::vector<std::string>& include_paths) :
            ConfigParser(filename),
            include_paths_(include_paths)
        {
            if(!bfs::exists(filename)){
                throw InvalidConfiguration("Configuration file \"") << filename << "\" does not exist";
            }
        }

        void YAML::consumeParameters(ParameterSet& ps, bool verbose)
        {
            num_applied_ = 0;
            files_read_.clear();
            std::vector<bfs::path> stack;
            consumeFile_(bfs::path(filename_), ps, verbose, stack);
        }

        void YAML::consumeFile_(const bfs::path& file,
                                ParameterSet& ps,
                                bool verbose,
                                std::vector<bfs::path>& stack)
        {
            const bfs::path canon = bfs::weakly_canonical(file);
            if(std::find(stack.begin(), stack.end(), canon) != stack.end()){
                InvalidConfiguration ex("Recursive include detected in configuration file ");
                ex << file.string() << ". Include chain: ";
                for(const auto& p : stack){
                    ex << p.string() << " -> ";
                }
                ex << canon.string();
                throw ex;
            }
            stack.push_back(canon);
            files_read_.push_back(file.string());

            if(verbose){
                std::cout << "Reading parameters from \"" << file.string() << "\"" << std::endl;
            }

            ::YAML::Node root;
            try {
                root = ::YAML::LoadFile(file.string());
            }
            catch(::YAML::Exception& ex) {
                throw InvalidConfiguration("Error parsing configuration file \"") << file.string()
                    << "\": " << ex.what();
            }

            if(root.IsNull()){
                stack.pop_back();
                return; // Empty file
            }
            if(!root.IsMap()){
                throw InvalidConfiguration("Configuration file \"") << file.string()
                    << "\" must contain a map of parameter names to values";
            }

            static const std::vector<std::string> include_keys(PARKSIM_INCLUDE_KEYS);
            for(const auto& kv : root){
                const std::string key = kv.first.as<std::string>();
                if(boost::algorithm::starts_with(key, PARKSIM_COMMENT_KEY_START)){
                    continue;
                }

                if(std::find(include_keys.begin(), include_keys.end(), key) != include_keys.end()){
                    if(!kv.second.IsScalar()){
                        throw InvalidConfiguration("Include directive in \"") << file.string()
                            << "\" (line " << (kv.first.Mark().line + 1) << ") must name a single file";
                    }
                    const bfs::path incl = resolveInclude_(kv.second.as<std::string>(), file);
                    consumeFile_(incl, ps, verbose, stack);
                    continue;
                }

                applyValue_(key, kv.second, file, ps, verbose);
            }

            stack.pop_back();
        }

        void YAML::applyValue_(const std::string& key,
                               const ::YAML::Node& value,
                               const bfs::path& file,
                               ParameterSet& ps,
                               bool verbose)
        {
            ParameterBase* p = ps.getParameter(key, false);
            if(nullptr == p){
                if(allow_unknown_){
                    log::MessageSource::getGlobalWarn() << "Ignoring unknown parameter \"" << key
                                                        << "\" in " << file.string();
                    return;
                }
                InvalidConfiguration ex("Unknown parameter \"");
                ex << key << "\" in \"" << file.string() << "\" (line "
                   << (value.Mark().line + 1) << ")";
                throw ex;
            }

            try {
                if(value.IsSequence()){
                    std::vector<std::string> elements;
                    for(const auto& item : value){
                        if(!item.IsScalar()){
                            throw InvalidConfiguration("Sequence elements must be scalars");
                        }
                        elements.push_back(item.as<std::string>());
                    }
                    p->setValueFromStringVector(elements);
                }
                else if(value.IsScalar()){
                    p->setValueFromString(value.as<std::string>());
                }
                else{
                    throw InvalidConfiguration("Value must be a scalar or a sequence of scalars");
                }
            }
            catch(InvalidConfiguration& ex) {
                throw InvalidConfiguration("In \"") << file.string() << "\" (line "
                    << (value.Mark().line + 1) << "), parameter \"" << key << "\": " << ex.what();
            }

            ++num_applied_;
            if(verbose){
                std::cout << "  " << key << " = " << p->getValueAsString() << std::endl;
            }
        }

        bfs::path YAML::resolveInclude_(const std::string& include, const bfs::path& from) const
        {
            const bfs::path incl(include);
            if(incl.is_absolute()){
                if(bfs::exists(incl)){
                    return incl;
                }
            }
            else{
                const bfs::path beside = from.parent_path() / incl;
                if(bfs::exists(beside)){
                    return beside;
                }
                for(const auto& incl_path : include_paths_){
                    const bfs::path combined = bfs::path(incl_path) / incl;
                    if(bfs::exists(combined)){
                        return combined;
                    }
                }
            }

            InvalidConfiguration e("Could not resolve location of included file: '");
            e << include << "' in source file: " << from.string() << "\nSearch paths: \n";
            e << "\t" << from.parent_path().string() << '\n';
            for(const auto& incl_path : include_paths_){
                e << "\t" << incl_path << '\n';
            }
            throw e;
        }
    }
} // namespace parksim
