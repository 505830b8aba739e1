// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_CONFIG_PROPERTY_TREE_HPP_
#define LND_PUBLIC_CORE_CONFIG_PROPERTY_TREE_HPP_


#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <vector>


namespace lnd {
namespace config {


/**
 * pnode describes a tree of properties.
 *
 * A pnode can either be empty, hold a value (a string, integer, real, or bool
 * value), contain an array of pnode., or contain a mapping between strings
 * and pnodes.
 */
class pnode final {
public:
    using key_type = std::string;
    using map_type = std::map<key_type, pnode>;
    using array_type = std::vector<pnode>;

    /**
     * tag_t is the indicator for the current node storage.
     */
    enum class tag_t { empty, array, boolean, real, integer, string, map };

    /**
     * Default constructor: create an empty node
     */
    explicit pnode();

    /**
     * Constructor for bool
     *
     * @param boolean  the bool type value
     */
    explicit pnode(bool boolean);

    /**
     * Constructor for integer with all integer type
     *
     * @tparam T  input type
     *
     * @param integer  the integer type value
     */
    template <typename T,
              std::enable_if_t<std::is_integral<T>::value &&
                               !std::is_same<T, bool>::value>* = nullptr>
    explicit pnode(T integer);

    /**
     * Constructor for string
     *
     * @param str  string type value
     */
    explicit pnode(const std::string& str);

    /**
     * Constructor for char* (otherwise, it will use bool)
     *
     * @param str  the string like "..."
     */
    explicit pnode(const char* str);

    /**
     * Constructor for double (and also float)
     *
     * @param real  the floating point type value
     */
    explicit pnode(double real);

    /**
     * Constructor for array
     *
     * @param array  an pnode array
     */
    explicit pnode(const array_type& array);

    /**
     * Constructor for map
     *
     * @param map  a (string, pnode)-map
     */
    explicit pnode(const map_type& map);

    /**
     * bool conversion. It's true if and only if it contains data.
     */
    explicit operator bool() const noexcept;

    /**
     * Check whether the representing data of two pnodes are the same
     */
    bool operator==(const pnode& rhs) const;

    /**
     * Check whether the representing data of two pnodes are different.
     */
    bool operator!=(const pnode& rhs) const;

    /**
     * Get the current node tag.
     *
     * @return the tag
     */
    tag_t get_tag() const;

    /**
     * Access the array stored in this property node. Throws
     * InvalidStateError if the property node does not store an array.
     *
     * @return the array
     */
    const array_type& get_array() const;

    /**
     * Access the map stored in this property node. Throws InvalidStateError
     * if the property node does not store a map.
     *
     * @return the map
     */
    const map_type& get_map() const;

    /**
     * Access the boolean value stored in this property node. Throws
     * InvalidStateError if the property node does not store a boolean value.
     *
     * @return the boolean value
     */
    bool get_boolean() const;

    /**
     * @copydoc get_boolean()
     */
    std::int64_t get_integer() const;

    /**
     * @copydoc get_boolean()
     */
    double get_real() const;

    /**
     * @copydoc get_boolean()
     */
    const std::string& get_string() const;

    /**
     * This function is to access the data under the map. It will throw
     * InvalidStateError when the property node does not store a map. If
     * there is no such key in the map, it will return an empty node.
     *
     * @param key  the key for the node of the map
     *
     * @return node if the map has the key, otherwise an empty node
     */
    const pnode& get(const std::string& key) const;

    /**
     * This function is to access the data under the array. It will throw
     * InvalidStateError when the property node does not store an array, and
     * std::out_of_range for an invalid index.
     *
     * @param index  the node index in array
     *
     * @return node in the index
     */
    const pnode& get(int index) const;

private:
    void throw_if_not_contain(tag_t tag) const;

    static const pnode& empty_node();

    tag_t tag_;
    array_type array_;  // for array
    map_type map_;      // for map
    // value
    std::string str_;
    union {
        std::int64_t integer_;
        double real_;
        bool boolean_;
    } union_data_;
};


template <typename T,
          std::enable_if_t<std::is_integral<T>::value &&
                           !std::is_same<T, bool>::value>*>
pnode::pnode(T integer) : tag_(tag_t::integer)
{
    union_data_.integer_ = static_cast<std::int64_t>(integer);
}


}  // namespace config
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_CONFIG_PROPERTY_TREE_HPP_
