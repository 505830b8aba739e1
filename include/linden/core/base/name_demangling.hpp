// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_NAME_DEMANGLING_HPP_
#define LND_PUBLIC_CORE_BASE_NAME_DEMANGLING_HPP_


#ifdef __GNUG__
#include <cxxabi.h>
#endif  // __GNUG__


#include <cstdlib>
#include <memory>
#include <string>
#include <typeinfo>


namespace lnd {


/**
 * @brief The name_demangling namespace.
 *
 * @ingroup name_demangling
 */
namespace name_demangling {


inline std::string get_type_name(const std::type_info& tinfo)
{
#ifdef __GNUG__
    int status{};
    std::unique_ptr<char[], void (*)(void*)> name(
        abi::__cxa_demangle(tinfo.name(), nullptr, nullptr, &status),
        std::free);
    if (!status)
        return std::string(name.get());
    else
#endif  // __GNUG__
        return std::string(tinfo.name());
}


/**
 * This function uses name demangling facilities to get the name of the static
 * type (`T`) of the object passed in arguments.
 *
 * @tparam T  the type of the object to demangle
 *
 * @param unused
 */
template <typename T>
std::string get_static_type(const T&)
{
    return get_type_name(typeid(T));
}


/**
 * This function uses name demangling facilities to get the name of the
 * dynamic type of the object passed in arguments.
 *
 * @tparam T  the type of the object to demangle
 *
 * @param t  the object we get the dynamic type of
 */
template <typename T>
std::string get_dynamic_type(const T& t)
{
    return get_type_name(typeid(t));
}


}  // namespace name_demangling
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_NAME_DEMANGLING_HPP_
