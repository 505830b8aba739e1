// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_CONFIG_TYPE_DESCRIPTOR_HPP_
#define LND_PUBLIC_CORE_CONFIG_TYPE_DESCRIPTOR_HPP_


#include <string>


#include <linden/core/base/dtype.hpp>
#include <linden/core/base/types.hpp>


namespace lnd {
namespace config {


/**
 * This class describes the value type used by config::parse as a string. A
 * config entry `value_type` overrides it for the object it describes and all
 * of its children.
 *
 * The accepted names are the dtype names ("float32", "float64", "complex64",
 * "complex128") and the C++ spellings ("float", "double", "complex<float>",
 * "complex<double>").
 */
class type_descriptor final {
public:
    /**
     * type_descriptor constructor.
     *
     * @param value_typestr  the value type string
     */
    explicit type_descriptor(std::string value_typestr = "float64");

    /**
     * @return the value type string.
     */
    const std::string& get_value_typestr() const;

    /**
     * @return the dtype named by the value type string.
     *
     * @throws InvalidStateError  if the name is unknown
     */
    dtype get_dtype() const;

private:
    std::string value_typestr_;
};


/**
 * make_type_descriptor is a helper function to properly set up the descriptor
 * from a template type.
 *
 * @tparam ValueType  the value type in descriptor
 */
template <typename ValueType = default_precision>
type_descriptor make_type_descriptor()
{
    return type_descriptor{to_string(dtype_of<ValueType>())};
}


}  // namespace config
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_CONFIG_TYPE_DESCRIPTOR_HPP_
