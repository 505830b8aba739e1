// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_EXTENSIONS_CONFIG_YAML_CONFIG_HPP_
#define LND_PUBLIC_EXTENSIONS_CONFIG_YAML_CONFIG_HPP_


#include <cstdint>
#include <stdexcept>
#include <string>


#include <yaml-cpp/yaml.h>


#include <linden/core/config/property_tree.hpp>


namespace lnd {
namespace ext {
namespace config {
namespace detail {


template <typename T>
bool try_decode(const YAML::Node& data, T& out)
{
    return YAML::convert<T>::decode(data, out);
}


inline ::lnd::config::pnode parse_yaml_scalar(const YAML::Node& data)
{
    using ::lnd::config::pnode;
    const std::string tag = data.Tag();
    if (tag == "tag:yaml.org,2002:int") {
        return pnode{data.as<std::int64_t>()};
    } else if (tag == "tag:yaml.org,2002:float") {
        return pnode{data.as<double>()};
    } else if (tag == "tag:yaml.org,2002:bool") {
        return pnode{data.as<bool>()};
    } else if (tag == "tag:yaml.org,2002:str" || tag == "!") {
        // quoted scalars are strings
        return pnode{data.as<std::string>()};
    }
    std::int64_t integer{};
    if (try_decode(data, integer)) {
        return pnode{integer};
    }
    double real{};
    if (try_decode(data, real)) {
        return pnode{real};
    }
    bool boolean{};
    if (try_decode(data, boolean)) {
        return pnode{boolean};
    }
    return pnode{data.as<std::string>()};
}


}  // namespace detail


/**
 * parse_yaml takes a yaml-cpp node object to generate the property tree
 * object
 *
 * Scalars are read as integer, real, boolean or string, in this order,
 * unless a yaml tag or quotes fix their type. The merge key `<<` inserts the
 * aliased map (or maps) into the current map, the keys of the map itself
 * override the merged ones.
 *
 * @throws std::runtime_error  if the node is null or cannot be converted
 */
inline ::lnd::config::pnode parse_yaml(const YAML::Node& input)
{
    using ::lnd::config::pnode;
    auto parse_array = [](const YAML::Node& arr) {
        pnode::array_type nodes;
        for (const auto& it : arr) {
            nodes.emplace_back(parse_yaml(it));
        }
        return pnode{nodes};
    };
    auto parse_map = [](const YAML::Node& map) {
        pnode::map_type nodes;
        auto merge = [&nodes](const pnode& node) {
            for (const auto& item : node.get_map()) {
                nodes.emplace(item.first, item.second);
            }
        };
        // explicit keys win over the merged ones, whatever their order
        for (auto it = map.begin(); it != map.end(); ++it) {
            auto key = it->first.as<std::string>();
            if (key != "<<") {
                nodes[key] = parse_yaml(it->second);
            }
        }
        for (auto it = map.begin(); it != map.end(); ++it) {
            if (it->first.as<std::string>() != "<<") {
                continue;
            }
            auto node = parse_yaml(it->second);
            if (node.get_tag() == pnode::tag_t::array) {
                for (const auto& item : node.get_array()) {
                    merge(item);
                }
            } else if (node.get_tag() == pnode::tag_t::map) {
                merge(node);
            } else {
                throw std::runtime_error("can not handle this alias: " +
                                         YAML::Dump(it->second));
            }
        }
        return pnode{nodes};
    };

    if (input.IsDefined()) {
        if (input.IsMap()) {
            return parse_map(input);
        } else if (input.IsSequence()) {
            return parse_array(input);
        } else if (input.IsScalar()) {
            return detail::parse_yaml_scalar(input);
        }
    }
    throw std::runtime_error("can not handle this data type: " +
                             YAML::Dump(input));
}


/**
 * parse_yaml_file takes the yaml file to generate the property tree object
 *
 * @param filename  the yaml file
 *
 * @throws YAML::BadFile  if the file cannot be opened
 */
inline ::lnd::config::pnode parse_yaml_file(const std::string& filename)
{
    return parse_yaml(YAML::LoadFile(filename));
}


}  // namespace config
}  // namespace ext
}  // namespace lnd


#endif  // LND_PUBLIC_EXTENSIONS_CONFIG_YAML_CONFIG_HPP_
