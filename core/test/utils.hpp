// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_CORE_TEST_UTILS_HPP_
#define LND_CORE_TEST_UTILS_HPP_


#include <cmath>
#include <complex>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>


#include <gtest/gtest.h>


#include <linden/core/base/executor.hpp>
#include <linden/core/base/math.hpp>
#include <linden/core/base/name_demangling.hpp>
#include <linden/core/base/types.hpp>
#include <linden/core/lazy/node.hpp>
#include <linden/core/log/logger.hpp>


#include "core/test/utils/assertions.hpp"


namespace lnd {
namespace test {
namespace detail {


template <typename FirstList, typename SecondList>
struct merge_type_list {};

template <template <typename...> class OuterWrapper, typename... Args1,
          typename... Args2>
struct merge_type_list<OuterWrapper<Args1...>, OuterWrapper<Args2...>> {
    using type = OuterWrapper<Args1..., Args2...>;
};


template <template <typename...> class NewInnerWrapper, typename ListType>
struct add_internal_wrapper {};

template <template <typename...> class NewInnerWrapper,
          template <typename...> class OuterWrapper, typename... Args>
struct add_internal_wrapper<NewInnerWrapper, OuterWrapper<Args...>> {
    using type = OuterWrapper<NewInnerWrapper<Args>...>;
};


}  // namespace detail


template <typename FirstList, typename SecondList>
using merge_type_list_t =
    typename detail::merge_type_list<FirstList, SecondList>::type;

template <template <typename...> class NewInnerWrapper, typename ListType>
using add_internal_wrapper_t =
    typename detail::add_internal_wrapper<NewInnerWrapper, ListType>::type;


using RealValueTypes = ::testing::Types<float, double>;

using ComplexValueTypes = add_internal_wrapper_t<std::complex, RealValueTypes>;

using ValueTypes = merge_type_list_t<RealValueTypes, ComplexValueTypes>;


template <typename Precision, typename OutputType>
struct reduction_factor {
    using nc_output = remove_complex<OutputType>;
    using nc_precision = remove_complex<Precision>;
    static constexpr nc_output value{
        std::numeric_limits<nc_precision>::epsilon() * nc_output{10} *
        (is_complex<Precision>() ? nc_output{1.4142} : one<nc_output>())};
};


template <typename Precision, typename OutputType>
constexpr remove_complex<OutputType>
    reduction_factor<Precision, OutputType>::value;


/**
 * A logger counting the executor events, to check how often and what the
 * executor realizes.
 */
class RealizeCounter : public log::Logger {
public:
    static std::shared_ptr<RealizeCounter> create()
    {
        return std::shared_ptr<RealizeCounter>(new RealizeCounter());
    }

    int realize_count() const noexcept { return realize_count_; }

    int evaluated_nodes() const noexcept { return evaluated_nodes_; }

    /**
     * Returns the number of realize calls for nodes longer than a scalar.
     */
    int non_scalar_realize_count() const noexcept
    {
        return non_scalar_realize_count_;
    }

    size_type last_pending() const noexcept { return last_pending_; }

protected:
    RealizeCounter()
        : log::Logger(log::Logger::realize_started_mask |
                      log::Logger::node_evaluation_completed_mask)
    {}

    void on_realize_started(const Executor*, const lazy::Node* node,
                            const size_type& num_pending) const override
    {
        ++realize_count_;
        if (node->get_size() != 1) {
            ++non_scalar_realize_count_;
        }
        last_pending_ = num_pending;
    }

    void on_node_evaluation_completed(const Executor*,
                                      const lazy::Node*) const override
    {
        ++evaluated_nodes_;
    }

private:
    mutable int realize_count_{};
    mutable int non_scalar_realize_count_{};
    mutable int evaluated_nodes_{};
    mutable size_type last_pending_{};
};


}  // namespace test
}  // namespace lnd


template <typename Precision, typename OutputType = Precision>
using r = typename lnd::test::reduction_factor<Precision, OutputType>;


template <typename T>
using I = std::initializer_list<T>;


struct TypenameNameGenerator {
    template <typename T>
    static std::string GetName(int i)
    {
        return lnd::name_demangling::get_type_name(typeid(T));
    }
};


#endif  // LND_CORE_TEST_UTILS_HPP_
