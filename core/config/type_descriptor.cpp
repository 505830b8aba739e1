// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/config/type_descriptor.hpp>


#include "core/config/config_helper.hpp"


namespace lnd {
namespace config {


type_descriptor::type_descriptor(std::string value_typestr)
    : value_typestr_(std::move(value_typestr))
{}


const std::string& type_descriptor::get_value_typestr() const
{
    return value_typestr_;
}


dtype type_descriptor::get_dtype() const
{
    return dtype_from_string(value_typestr_);
}


type_descriptor update_type(const pnode& config, const type_descriptor& td)
{
    if (config.get_tag() != pnode::tag_t::map) {
        return td;
    }
    if (auto& obj = config.get("value_type")) {
        return type_descriptor{obj.get_string()};
    }
    return td;
}


}  // namespace config
}  // namespace lnd
