// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <string>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/config/config.hpp>
#include <linden/core/stop/combined.hpp>
#include <linden/core/stop/iteration.hpp>
#include <linden/core/stop/residual_norm.hpp>


#include "core/config/config_helper.hpp"


namespace lnd {
namespace config {
namespace {


inline stop::mode get_mode(const std::string& str)
{
    if (str == "absolute") {
        return stop::mode::absolute;
    } else if (str == "initial_resnorm") {
        return stop::mode::initial_resnorm;
    } else if (str == "rhs_norm") {
        return stop::mode::rhs_norm;
    }
    LND_INVALID_CONFIG_VALUE("baseline", str);
}


template <typename Criterion>
std::shared_ptr<const stop::CriterionFactory> configure_residual_norm(
    const pnode& config, std::shared_ptr<const Executor> exec)
{
    using absolute_type = typename Criterion::absolute_type;
    config_check_decorator config_check(config);
    auto params = Criterion::build();
    if (auto& obj = config_check.get("reduction_factor")) {
        params.with_reduction_factor(get_value<absolute_type>(obj));
    }
    if (auto& obj = config_check.get("baseline")) {
        params.with_baseline(get_mode(obj.get_string()));
    }
    return params.on(std::move(exec));
}


template <typename ValueType>
class ResidualNormConfigurer {
public:
    static std::shared_ptr<const stop::CriterionFactory> parse(
        const pnode& config, std::shared_ptr<const Executor> exec,
        const type_descriptor&)
    {
        return configure_residual_norm<stop::ResidualNorm<ValueType>>(
            config, std::move(exec));
    }
};


template <typename ValueType>
class ImplicitResidualNormConfigurer {
public:
    static std::shared_ptr<const stop::CriterionFactory> parse(
        const pnode& config, std::shared_ptr<const Executor> exec,
        const type_descriptor&)
    {
        return configure_residual_norm<stop::ImplicitResidualNorm<ValueType>>(
            config, std::move(exec));
    }
};


}  // anonymous namespace


std::shared_ptr<const stop::CriterionFactory> configure_iter(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td)
{
    auto params = stop::Iteration::build();
    config_check_decorator config_check(config);
    if (auto& obj = config_check.get("max_iters")) {
        params.with_max_iters(get_value<size_type>(obj));
    }
    return params.on(std::move(exec));
}


std::shared_ptr<const stop::CriterionFactory> configure_residual(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td)
{
    auto updated = update_type(config, td);
    return dispatch_value_type<ResidualNormConfigurer>(updated, config,
                                                       std::move(exec));
}


std::shared_ptr<const stop::CriterionFactory> configure_implicit_residual(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td)
{
    auto updated = update_type(config, td);
    return dispatch_value_type<ImplicitResidualNormConfigurer>(
        updated, config, std::move(exec));
}


std::shared_ptr<const stop::CriterionFactory> configure_combined(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td)
{
    auto updated = update_type(config, td);
    config_check_decorator config_check(config);
    auto& obj = config_check.get("criteria");
    if (!obj) {
        LND_MISSING_CONFIG_ENTRY("criteria");
    }
    return stop::Combined::build()
        .with_criteria(parse_criteria(obj, exec, updated))
        .on(exec);
}


}  // namespace config
}  // namespace lnd
