// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include "core/config/config_helper.hpp"


#include <exception>
#include <functional>
#include <map>
#include <utility>


#include <linden/core/config/config.hpp>


namespace lnd {
namespace config {
namespace {


using criterion_configurer =
    std::function<std::shared_ptr<const stop::CriterionFactory>(
        const pnode&, std::shared_ptr<const Executor>, const type_descriptor&)>;


std::vector<std::shared_ptr<const stop::CriterionFactory>>
parse_minimal_criteria(const pnode& config,
                       std::shared_ptr<const Executor> exec,
                       const type_descriptor& td)
{
    auto map_iteration = [](const pnode& config,
                            std::shared_ptr<const Executor> exec,
                            const type_descriptor& td) {
        pnode iter_config{{{"max_iters", config.get("iteration")}}};
        return configure_iter(iter_config, std::move(exec), td);
    };
    auto create_residual_mapping = [](const std::string& key,
                                      const std::string& baseline,
                                      criterion_configurer configure_fn) {
        return std::make_pair(
            key, criterion_configurer{
                     [=](const pnode& config,
                         std::shared_ptr<const Executor> exec,
                         const type_descriptor& td) {
                         pnode res_config{
                             {{"baseline", pnode{baseline}},
                              {"reduction_factor", config.get(key)}}};
                         return configure_fn(res_config, std::move(exec), td);
                     }});
    };
    std::map<std::string, criterion_configurer> criterion_map{
        {{"iteration", map_iteration},
         create_residual_mapping("relative_residual_norm", "rhs_norm",
                                 configure_residual),
         create_residual_mapping("initial_residual_norm", "initial_resnorm",
                                 configure_residual),
         create_residual_mapping("absolute_residual_norm", "absolute",
                                 configure_residual),
         create_residual_mapping("relative_implicit_residual_norm", "rhs_norm",
                                 configure_implicit_residual),
         create_residual_mapping("initial_implicit_residual_norm",
                                 "initial_resnorm",
                                 configure_implicit_residual),
         create_residual_mapping("absolute_implicit_residual_norm", "absolute",
                                 configure_implicit_residual)}};

    type_descriptor updated_td = update_type(config, td);

    // check the keys before the map lookups below throw
    {
        config_check_decorator config_check(config);
        for (const auto& it : criterion_map) {
            config_check.get(it.first);
        }
    }

    std::vector<std::shared_ptr<const stop::CriterionFactory>> res;
    for (const auto& it : config.get_map()) {
        if (it.first == "value_type") {
            continue;
        }
        res.emplace_back(criterion_map.at(it.first)(config, exec, updated_td));
    }
    return res;
}


}  // anonymous namespace


config_check_decorator::config_check_decorator(
    const pnode& config, const std::set<std::string>& additional_allowed_keys)
    : allowed_keys_(additional_allowed_keys), config_(config)
{
    // we allow value_type in all class such that they can change their
    // own/child value_type
    allowed_keys_.insert("value_type");
    // type for choose the class
    allowed_keys_.insert("type");
}


config_check_decorator::~config_check_decorator() noexcept(false)
{
    if (config_.get_tag() != pnode::tag_t::map ||
        std::uncaught_exceptions() > 0) {
        // we only check the key in the map
        return;
    }
    auto set_output = [](auto& set) {
        std::string output = "[";
        for (const auto& item : set) {
            output = output + " " + item;
        }
        output += " ]";
        return output;
    };
    for (const auto& item : config_.get_map()) {
        auto search = allowed_keys_.find(item.first);
        LND_THROW_IF_INVALID(
            search != allowed_keys_.end(),
            item.first + " is not a allowed key. The allowed keys here is " +
                set_output(allowed_keys_));
    }
}


const pnode& config_check_decorator::get(const std::string& key)
{
    allowed_keys_.insert(key);
    return config_.get(key);
}


std::shared_ptr<const stop::CriterionFactory> parse_criterion(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td)
{
    LND_THROW_IF_INVALID(config.get_tag() == pnode::tag_t::map,
                         "A criterion must be defined as a map.");
    static const std::map<std::string, criterion_configurer> criterion_map{
        {{"Iteration", configure_iter},
         {"ResidualNorm", configure_residual},
         {"ImplicitResidualNorm", configure_implicit_residual},
         {"Combined", configure_combined}}};
    auto& type = config.get("type");
    if (!type) {
        LND_MISSING_CONFIG_ENTRY("type");
    }
    auto search = criterion_map.find(type.get_string());
    if (search == criterion_map.end()) {
        LND_INVALID_CONFIG_VALUE("type", type.get_string());
    }
    return search->second(config, std::move(exec), td);
}


std::vector<std::shared_ptr<const stop::CriterionFactory>> parse_criteria(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td)
{
    if (config.get_tag() == pnode::tag_t::array) {
        std::vector<std::shared_ptr<const stop::CriterionFactory>> res;
        for (const auto& it : config.get_array()) {
            res.push_back(parse_criterion(it, exec, td));
        }
        return res;
    }
    if (config.get_tag() == pnode::tag_t::map) {
        if (config.get("type")) {
            return {parse_criterion(config, std::move(exec), td)};
        }
        return parse_minimal_criteria(config, std::move(exec), td);
    }
    LND_INVALID_STATE("Criteria must either be defined as an array or a map.");
}


}  // namespace config
}  // namespace lnd
