// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/config/config.hpp>


#include <functional>
#include <map>
#include <string>


#include <linden/core/base/exception_helpers.hpp>


#include "core/config/config_helper.hpp"


namespace lnd {
namespace config {


std::shared_ptr<LinOpFactory> parse(const pnode& config,
                                    std::shared_ptr<const Executor> exec,
                                    const type_descriptor& td)
{
    static const std::map<
        std::string,
        std::function<std::shared_ptr<LinOpFactory>(
            const pnode&, std::shared_ptr<const Executor>,
            const type_descriptor&)>>
        build_map{{{"solver::Cg", configure_cg},
                   {"solver::Cgls", configure_cgls}}};
    LND_THROW_IF_INVALID(config.get_tag() == pnode::tag_t::map,
                         "The solver config must be a map.");
    if (auto& obj = config.get("type")) {
        auto search = build_map.find(obj.get_string());
        if (search == build_map.end()) {
            LND_INVALID_CONFIG_VALUE("type", obj.get_string());
        }
        return search->second(config, std::move(exec), td);
    }
    LND_MISSING_CONFIG_ENTRY("type");
}


std::shared_ptr<Executor> parse_executor(const pnode& config)
{
    std::string type;
    int num_threads = 0;
    if (config.get_tag() == pnode::tag_t::string) {
        type = config.get_string();
    } else {
        config_check_decorator config_check(config);
        auto& obj = config_check.get("type");
        if (!obj) {
            LND_MISSING_CONFIG_ENTRY("type");
        }
        type = obj.get_string();
        if (auto& threads = config_check.get("num_threads")) {
            LND_THROW_IF_INVALID(type == "omp",
                                 "num_threads is only valid for omp");
            num_threads = get_value<int>(threads);
        }
    }
    if (type == "reference") {
        return ReferenceExecutor::create();
    } else if (type == "omp") {
        return OmpExecutor::create(num_threads);
    }
    LND_INVALID_CONFIG_VALUE("type", type);
}


eagerness parse_eagerness(const pnode& config)
{
    eagerness result{};
    if (!config) {
        return result;
    }
    config_check_decorator config_check(config);
    if (auto& obj = config_check.get("realize_forward")) {
        result.realize_forward = get_value<bool>(obj);
    }
    if (auto& obj = config_check.get("realize_adjoint")) {
        result.realize_adjoint = get_value<bool>(obj);
    }
    if (auto& obj = config_check.get("defer_forward_input")) {
        result.defer_forward_input = get_value<bool>(obj);
    }
    if (auto& obj = config_check.get("defer_adjoint_input")) {
        result.defer_adjoint_input = get_value<bool>(obj);
    }
    return result;
}


}  // namespace config
}  // namespace lnd
