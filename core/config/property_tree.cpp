// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/config/property_tree.hpp>


#include <linden/core/base/exception_helpers.hpp>


namespace lnd {
namespace config {


pnode::pnode() : tag_(tag_t::empty) {}


pnode::pnode(bool boolean) : tag_(tag_t::boolean)
{
    union_data_.boolean_ = boolean;
}


pnode::pnode(const std::string& str) : tag_(tag_t::string) { str_ = str; }


pnode::pnode(double real) : tag_(tag_t::real) { union_data_.real_ = real; }


pnode::pnode(const char* str) : pnode(std::string(str)) {}


pnode::pnode(const array_type& array) : tag_(tag_t::array), array_(array) {}


pnode::pnode(const map_type& map) : tag_(tag_t::map), map_(map) {}


pnode::operator bool() const noexcept { return tag_ != tag_t::empty; }


bool pnode::operator==(const pnode& rhs) const
{
    if (tag_ != rhs.get_tag()) {
        return false;
    }
    switch (tag_) {
    case tag_t::empty:
        return true;
    case tag_t::array:
        return array_ == rhs.array_;
    case tag_t::map:
        return map_ == rhs.map_;
    case tag_t::boolean:
        return union_data_.boolean_ == rhs.union_data_.boolean_;
    case tag_t::integer:
        return union_data_.integer_ == rhs.union_data_.integer_;
    case tag_t::real:
        return union_data_.real_ == rhs.union_data_.real_;
    case tag_t::string:
        return str_ == rhs.str_;
    }
    return false;
}


bool pnode::operator!=(const pnode& rhs) const { return !(*this == rhs); }


pnode::tag_t pnode::get_tag() const { return tag_; }


const pnode::array_type& pnode::get_array() const
{
    this->throw_if_not_contain(tag_t::array);
    return array_;
}


const pnode::map_type& pnode::get_map() const
{
    this->throw_if_not_contain(tag_t::map);
    return map_;
}


bool pnode::get_boolean() const
{
    this->throw_if_not_contain(tag_t::boolean);
    return union_data_.boolean_;
}


std::int64_t pnode::get_integer() const
{
    this->throw_if_not_contain(tag_t::integer);
    return union_data_.integer_;
}


double pnode::get_real() const
{
    this->throw_if_not_contain(tag_t::real);
    return union_data_.real_;
}


const std::string& pnode::get_string() const
{
    this->throw_if_not_contain(tag_t::string);
    return str_;
}


const pnode& pnode::get(const std::string& key) const
{
    this->throw_if_not_contain(tag_t::map);
    auto it = map_.find(key);
    if (it != map_.end()) {
        return it->second;
    }
    return pnode::empty_node();
}


const pnode& pnode::get(int index) const
{
    this->throw_if_not_contain(tag_t::array);
    return array_.at(index);
}


void pnode::throw_if_not_contain(tag_t tag) const
{
    static auto str_tag = [](tag_t tag) -> std::string {
        switch (tag) {
        case tag_t::empty:
            return "empty";
        case tag_t::array:
            return "array";
        case tag_t::map:
            return "map";
        case tag_t::real:
            return "real";
        case tag_t::boolean:
            return "boolean";
        case tag_t::integer:
            return "integer";
        case tag_t::string:
            return "string";
        }
        return "unknown";
    };
    bool is_valid = (tag_ == tag);
    std::string msg =
        "Contains " + str_tag(tag_) + ", but try to get " + str_tag(tag);
    LND_THROW_IF_INVALID(is_valid, msg);
}


const pnode& pnode::empty_node()
{
    static pnode empty_pnode{};
    return empty_pnode;
}


}  // namespace config
}  // namespace lnd
