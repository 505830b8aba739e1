// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_EXTENSIONS_CONFIG_JSON_CONFIG_HPP_
#define LND_PUBLIC_EXTENSIONS_CONFIG_JSON_CONFIG_HPP_


#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>


#include <nlohmann/json.hpp>


#include <linden/core/config/property_tree.hpp>


namespace lnd {
namespace ext {
namespace config {


/**
 * parse_json takes a nlohmann json object to generate the property tree
 * object
 */
inline ::lnd::config::pnode parse_json(const nlohmann::json& input)
{
    using ::lnd::config::pnode;
    const auto parse_array = [](const auto& arr) {
        pnode::array_type nodes;
        for (auto it : arr) {
            nodes.emplace_back(parse_json(it));
        }
        return pnode{nodes};
    };
    const auto parse_map = [](const auto& map) {
        pnode::map_type nodes;
        for (auto& el : map.items()) {
            nodes.emplace(el.key(), parse_json(el.value()));
        }
        return pnode{nodes};
    };
    const auto parse_data = [](const auto& data) {
        if (data.is_number_integer()) {
            return pnode{data.template get<std::int64_t>()};
        }
        if (data.is_boolean()) {
            return pnode{data.template get<bool>()};
        }
        if (data.is_number_float()) {
            return pnode{data.template get<double>()};
        }
        if (data.is_string()) {
            return pnode{data.template get<std::string>()};
        }
        throw std::runtime_error(
            "property_tree can not handle this data content: " +
            data.dump());
    };

    if (input.is_array()) {
        return parse_array(input);
    }
    if (input.is_object()) {
        return parse_map(input);
    }
    return parse_data(input);
}


/**
 * parse_json_file takes the json file to generate the property tree object
 */
inline ::lnd::config::pnode parse_json_file(const std::string& filename)
{
    std::ifstream fstream(filename);
    if (!fstream) {
        throw std::runtime_error("can not open the json file: " + filename);
    }
    return parse_json(nlohmann::json::parse(fstream));
}


}  // namespace config
}  // namespace ext
}  // namespace lnd


#endif  // LND_PUBLIC_EXTENSIONS_CONFIG_JSON_CONFIG_HPP_
