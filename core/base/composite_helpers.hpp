// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_CORE_BASE_COMPOSITE_HELPERS_HPP_
#define LND_CORE_BASE_COMPOSITE_HELPERS_HPP_


#include <memory>
#include <string>
#include <vector>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/lin_op.hpp>
#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/base/vector.hpp>


#include "core/base/dispatch_helper.hpp"


namespace lnd {
namespace detail {


using operator_list = std::vector<std::shared_ptr<const LinOp>>;


/**
 * Names the i-th operator of a composite in error messages.
 */
inline std::string operator_name(size_type i)
{
    return "operator " + std::to_string(i);
}


/**
 * Names the block in the given row and column in error messages.
 */
inline std::string block_name(size_type row, size_type col)
{
    return "block (" + std::to_string(row) + ", " + std::to_string(col) + ")";
}


/**
 * Throws DtypeMismatch if the two operators are not both real or both
 * complex.
 */
#define LND_ASSERT_SAME_KIND_NAMED(_op1, _name1, _op2, _name2)                 \
    if (!::lnd::is_same_kind((_op1)->get_dtype(), (_op2)->get_dtype())) {      \
        throw ::lnd::DtypeMismatch(                                            \
            __FILE__, __LINE__, __func__, _name1,                              \
            ::lnd::to_string((_op1)->get_dtype()), _name2,                     \
            ::lnd::to_string((_op2)->get_dtype()),                             \
            "expected values of the same kind (real or complex)");             \
    }


/**
 * Throws DimensionMismatch naming both operators if the condition fails.
 */
#define LND_ASSERT_SIZES_NAMED(_condition, _op1, _name1, _op2, _name2,         \
                               _clarification)                                 \
    if (!(_condition)) {                                                       \
        throw ::lnd::DimensionMismatch(                                        \
            __FILE__, __LINE__, __func__, _name1, (_op1)->get_size()[0],       \
            (_op1)->get_size()[1], _name2, (_op2)->get_size()[0],              \
            (_op2)->get_size()[1], _clarification);                            \
    }


/**
 * Returns the operator, which must not be null.
 */
inline const LinOp& checked_operator(const std::shared_ptr<const LinOp>& op)
{
    LND_THROW_IF_INVALID(op != nullptr, "operator must not be null");
    return *op;
}


/**
 * Returns the first operator of a non-empty list without null entries.
 */
inline const LinOp* first_operator(const operator_list& operators)
{
    LND_THROW_IF_INVALID(!operators.empty(),
                         "at least one operator is required");
    for (const auto& op : operators) {
        LND_THROW_IF_INVALID(op != nullptr, "operators must not be null");
    }
    return operators.front().get();
}


/**
 * Returns the common dtype of the operators, which all have to be real or
 * all complex.
 *
 * @throws DtypeMismatch  if real and complex operators are mixed
 */
inline dtype promote_dtypes(const operator_list& operators)
{
    auto first = first_operator(operators);
    auto type = first->get_dtype();
    for (size_type i = 1; i < operators.size(); ++i) {
        LND_ASSERT_SAME_KIND_NAMED(first, operator_name(0), operators[i],
                                   operator_name(i));
        type = promote(type, operators[i]->get_dtype());
    }
    return type;
}


/**
 * Computes a + b, with b converted to the value type of a.
 */
inline std::unique_ptr<Array> add_arrays(const Array* a, const Array* b)
{
    LND_ASSERT_EQUAL_DIMENSIONS(a, b);
    return vector_dispatch(a, [&](auto dense_a) -> std::unique_ptr<Array> {
        using value_type =
            typename std::decay_t<decltype(*dense_a)>::value_type;
        auto dense_b = make_temporary_conversion<value_type>(b);
        return dense_a->add(dense_b.get());
    });
}


/**
 * Computes the elementwise complex conjugate of an array.
 */
inline std::unique_ptr<Array> conj_array(const Array* a)
{
    return vector_dispatch(a, [](auto dense_a) -> std::unique_ptr<Array> {
        return dense_a->conj();
    });
}


/**
 * Splits an array into consecutive parts starting at the given offsets. The
 * last offset is the length of the array.
 */
inline std::vector<std::unique_ptr<Array>> split_array(
    const Array* a, const std::vector<size_type>& offsets)
{
    return vector_dispatch(
        a, [&](auto dense_a) -> std::vector<std::unique_ptr<Array>> {
            std::vector<std::unique_ptr<Array>> parts;
            for (auto& part : dense_a->split(offsets)) {
                parts.push_back(std::move(part));
            }
            return parts;
        });
}


/**
 * Concatenates arrays. All parts are converted to the value type of the
 * first one.
 */
inline std::unique_ptr<Array> concatenate_arrays(
    std::shared_ptr<const Executor> exec,
    const std::vector<std::unique_ptr<Array>>& parts)
{
    LND_THROW_IF_INVALID(!parts.empty(), "nothing to concatenate");
    return vector_dispatch(
        parts.front().get(), [&](auto first) -> std::unique_ptr<Array> {
            using vector_type = std::decay_t<decltype(*first)>;
            using value_type = typename vector_type::value_type;
            std::vector<std::shared_ptr<const vector_type>> converted;
            std::vector<const vector_type*> raw;
            for (const auto& part : parts) {
                converted.push_back(
                    make_temporary_conversion<value_type>(part.get()));
                raw.push_back(converted.back().get());
            }
            return vector_type::concatenate(exec, raw);
        });
}


}  // namespace detail
}  // namespace lnd


#endif  // LND_CORE_BASE_COMPOSITE_HELPERS_HPP_
