// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_CORE_BASE_DISPATCH_HELPER_HPP_
#define LND_CORE_BASE_DISPATCH_HELPER_HPP_


#include <complex>
#include <memory>
#include <type_traits>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/vector.hpp>


namespace lnd {
namespace detail {


template <typename T, typename MaybeConstU>
using with_same_constness_t = std::conditional_t<
    std::is_const<typename std::remove_reference_t<MaybeConstU>>::value,
    const T, T>;


/**
 * @copydoc run(T*, Func&&, Args&&...)
 *
 * @note this is the end case
 */
template <typename ReturnType, typename T, typename Func, typename... Args>
ReturnType run_impl(T* obj, Func&&, Args&&...)
{
    throw NotSupported(__FILE__, __LINE__, __func__,
                       name_demangling::get_dynamic_type(*obj));
}

/**
 * @copydoc run(T*, Func&&, Args&&...)
 *
 * @note This has additionally the return type encoded.
 */
template <typename ReturnType, typename K, typename... Types, typename T,
          typename Func, typename... Args>
ReturnType run_impl(T* obj, Func&& f, Args&&... args)
{
    if (auto dobj = dynamic_cast<with_same_constness_t<K, T>*>(obj)) {
        return f(dobj, std::forward<Args>(args)...);
    } else {
        return run_impl<ReturnType, Types...>(obj, std::forward<Func>(f),
                                              std::forward<Args>(args)...);
    }
}


}  // namespace detail


/**
 * run uses template to go through the list and select the valid
 * template and run it.
 *
 * @tparam K  the current type tried in the conversion
 * @tparam ...Types  the other types will be tried in the conversion if K fails
 * @tparam T  the type of input object
 * @tparam Func  the function will run if the object can be converted to K
 * @tparam ...Args  the additional arguments for the Func
 *
 * @param obj  the input object waiting converted
 * @param f  the function will run if obj can be converted successfully
 * @param args  the additional arguments for the function
 *
 * @return the result of f
 */
template <typename K, typename... Types, typename T, typename Func,
          typename... Args>
auto run(T* obj, Func&& f, Args&&... args)
{
    using ReturnType = std::invoke_result_t<
        Func, detail::with_same_constness_t<K, T>*, Args...>;
    return detail::run_impl<ReturnType, K, Types...>(
        obj, std::forward<Func>(f), std::forward<Args>(args)...);
}


/**
 * Calls `f` with the array cast to its concrete Vector type.
 *
 * @param obj  the array
 * @param f  a generic callable accepting a pointer to any Vector type
 */
template <typename Func>
auto vector_dispatch(const Array* obj, Func&& f)
{
    return run<Vector<float>, Vector<double>, Vector<std::complex<float>>,
               Vector<std::complex<double>>>(obj, std::forward<Func>(f));
}


}  // namespace lnd


#endif  // LND_CORE_BASE_DISPATCH_HELPER_HPP_
