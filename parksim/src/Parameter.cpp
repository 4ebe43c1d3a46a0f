// <Parameter.cpp> -*- C++ -*-

#include "parksim/simulation/Parameter.hpp"
#include "parksim/simulation/ParameterSet.hpp"

#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace parksim
{

void ParameterBase::setValueFromString(const std::string& str)
{
    if(!isVector()){
        setValueFromStringVectorImpl_({str});
        return;
    }

    std::string list = boost::algorithm::trim_copy(str);
    if(list.size() >= 2 && list.front() == '[' && list.back() == ']'){
        list = list.substr(1, list.size() - 2);
    }
    std::vector<std::string> elements;
    if(!boost::algorithm::trim_copy(list).empty()){
        boost::algorithm::split(elements, list, boost::algorithm::is_any_of(","));
    }
    setValueFromStringVectorImpl_(elements);
}

void ParameterBase::addToSet_(ParameterSet* ps)
{
    ps->addParameter_(this);
}

void ParameterSet::addParameter_(ParameterBase* p)
{
    parksim_assert(keys_.find(p->getName()) == keys_.end(),
                   "Parameter \"" << p->getName() << "\" is declared twice");
    params_.push_back(p);
    keys_[p->getName()] = p;
}

bool ParameterSet::validateIndependently(std::string& err_names) const
{
    bool ok = true;
    for(const ParameterBase* p : params_){
        std::string errs;
        if(!p->validate(errs)){
            err_names += p->getName() + " (" + errs + ") ";
            ok = false;
        }
    }
    return ok;
}

ParameterBase* ParameterSet::getParameter(const std::string& name, bool must_exist)
{
    const ParameterSet* cthis = this;
    return const_cast<ParameterBase*>(cthis->getParameter(name, must_exist));
}

const ParameterBase* ParameterSet::getParameter(const std::string& name, bool must_exist) const
{
    auto itr = keys_.find(name);
    if(itr == keys_.end()){
        if(must_exist){
            InvalidConfiguration ex("No parameter named \"");
            ex << name << "\". Known parameters: ";
            const auto names = getNames();
            for(size_t i = 0; i < names.size(); ++i){
                ex << (i == 0 ? "" : ", ") << names[i];
            }
            throw ex;
        }
        return nullptr;
    }
    return itr->second;
}

std::vector<std::string> ParameterSet::getNames() const
{
    std::vector<std::string> names;
    names.reserve(params_.size());
    for(const ParameterBase* p : params_){
        names.push_back(p->getName());
    }
    return names;
}

std::string ParameterSet::dumpList() const
{
    size_t name_w = 4;
    size_t type_w = 4;
    size_t val_w = 5;
    for(const ParameterBase* p : params_){
        name_w = std::max(name_w, p->getName().size());
        type_w = std::max(type_w, p->getTypeName().size());
        val_w = std::max(val_w, p->getValueAsString().size());
    }

    std::stringstream ss;
    ss << std::left
       << std::setw(name_w) << "Name" << "  "
       << std::setw(type_w) << "Type" << "  "
       << std::setw(val_w) << "Value" << "  "
       << "Description\n";
    for(const ParameterBase* p : params_){
        ss << std::setw(name_w) << p->getName() << "  "
           << std::setw(type_w) << p->getTypeName() << "  "
           << std::setw(val_w) << p->getValueAsString() << "  "
           << p->getDesc();
        if(!p->isDefault()){
            ss << " (default " << p->getDefaultAsString() << ")";
        }
        ss << '\n';
    }
    return ss.str();
}

} // namespace parksim
