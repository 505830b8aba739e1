// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_ARRAY_HPP_
#define LND_PUBLIC_CORE_BASE_ARRAY_HPP_


#include <memory>


#include <linden/core/base/dim.hpp>
#include <linden/core/base/dtype.hpp>
#include <linden/core/base/executor.hpp>
#include <linden/core/base/types.hpp>


namespace lnd {


namespace lazy {
class Node;
}  // namespace lazy


/**
 * An Array is a handle to a vector of values which is either eager or lazy.
 *
 * An eager array holds its values in memory. A lazy array refers to a node of
 * a deferred computation graph: its length and value type are known, but its
 * values are only computed by realize(). Both kinds of handles are immutable,
 * all operations create new handles.
 *
 * Arrays report their size as a column vector (length x 1), so they can be
 * checked against operators with the same assertions operators are checked
 * against each other.
 *
 * The concrete handle type is Vector<ValueType>.
 */
class Array {
public:
    virtual ~Array() = default;

    Array& operator=(const Array&) = delete;

    /**
     * Returns the executor of the array.
     */
    std::shared_ptr<const Executor> get_executor() const noexcept
    {
        return exec_;
    }

    /**
     * Returns the size of the array as a (length x 1) column.
     */
    dim<2> get_size() const noexcept { return dim<2>{length_, 1}; }

    /**
     * Returns the number of values of the array.
     */
    size_type get_length() const noexcept { return length_; }

    /**
     * Returns the value type of the array.
     */
    dtype get_dtype() const noexcept { return dtype_; }

    /**
     * Checks whether the array is a lazy handle.
     */
    virtual bool is_lazy() const noexcept = 0;

    /**
     * Returns an eager handle with the values of this array. For a lazy
     * array, the executor evaluates the pending part of its graph; the lazy
     * handle itself stays lazy.
     *
     * @throws BackendExecutionError  if the evaluation fails
     */
    std::unique_ptr<Array> realize() const { return this->realize_impl(); }

    /**
     * Returns a lazy handle with the values of this array. An eager array is
     * wrapped in a source node of the deferred graph without copying values.
     */
    std::unique_ptr<Array> as_lazy() const { return this->as_lazy_impl(); }

    /**
     * Returns a new handle to the same values (or the same graph node).
     */
    std::unique_ptr<Array> clone() const { return this->clone_impl(); }

    /**
     * Returns the graph node representing this array. For an eager array,
     * this is an evaluated source node.
     */
    virtual std::shared_ptr<const lazy::Node> get_generic_node() const = 0;

protected:
    Array(std::shared_ptr<const Executor> exec, size_type length, dtype type)
        : exec_{std::move(exec)}, length_{length}, dtype_{type}
    {}

    Array(const Array&) = default;

    virtual std::unique_ptr<Array> realize_impl() const = 0;

    virtual std::unique_ptr<Array> as_lazy_impl() const = 0;

    virtual std::unique_ptr<Array> clone_impl() const = 0;

private:
    std::shared_ptr<const Executor> exec_;
    size_type length_;
    dtype dtype_;
};


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_ARRAY_HPP_
