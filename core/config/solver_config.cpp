// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/config/config.hpp>
#include <linden/core/solver/cg.hpp>
#include <linden/core/solver/cgls.hpp>


#include "core/config/config_helper.hpp"


namespace lnd {
namespace config {
namespace {


template <typename SolverParam>
inline void common_solver_parse(SolverParam& params,
                                config_check_decorator& config_check,
                                std::shared_ptr<const Executor> exec,
                                const type_descriptor& td_for_child)
{
    if (auto& obj = config_check.get("criteria")) {
        params.with_criteria(parse_criteria(obj, exec, td_for_child));
    }
}


template <typename ValueType>
class CgConfigurer {
public:
    static std::shared_ptr<LinOpFactory> parse(
        const pnode& config, std::shared_ptr<const Executor> exec,
        const type_descriptor& td_for_child)
    {
        auto params = solver::Cg<ValueType>::build();
        config_check_decorator config_check(config);
        common_solver_parse(params, config_check, exec, td_for_child);
        return params.on(std::move(exec));
    }
};


template <typename ValueType>
class CglsConfigurer {
public:
    static std::shared_ptr<LinOpFactory> parse(
        const pnode& config, std::shared_ptr<const Executor> exec,
        const type_descriptor& td_for_child)
    {
        auto params = solver::Cgls<ValueType>::build();
        config_check_decorator config_check(config);
        common_solver_parse(params, config_check, exec, td_for_child);
        if (auto& obj = config_check.get("damping")) {
            params.with_damping(get_value<remove_complex<ValueType>>(obj));
        }
        return params.on(std::move(exec));
    }
};


}  // anonymous namespace


std::shared_ptr<LinOpFactory> configure_cg(const pnode& config,
                                           std::shared_ptr<const Executor> exec,
                                           const type_descriptor& td)
{
    auto updated = update_type(config, td);
    return dispatch_value_type<CgConfigurer>(updated, config, std::move(exec));
}


std::shared_ptr<LinOpFactory> configure_cgls(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td)
{
    auto updated = update_type(config, td);
    return dispatch_value_type<CglsConfigurer>(updated, config,
                                               std::move(exec));
}


}  // namespace config
}  // namespace lnd
