// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_VECTOR_HPP_
#define LND_PUBLIC_CORE_BASE_VECTOR_HPP_


#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>


#include <linden/core/base/array.hpp>
#include <linden/core/base/math.hpp>
#include <linden/core/lazy/node.hpp>


namespace lnd {


/**
 * Vector is the array handle holding values of type ValueType.
 *
 * An eager Vector shares its values with all copies of the handle, a lazy
 * Vector shares its graph node. All operations return new handles and never
 * modify their operands. The result of an operation is eager if all operands
 * are eager, and lazy otherwise: eager operands of a lazy operation are
 * wrapped into source nodes of the graph.
 *
 * Scalars are Vectors of length 1. Operations which take scalar arguments
 * accept lazy scalars, so a sequence of vector updates whose coefficients
 * depend on earlier reductions stays entirely deferred.
 *
 * @tparam ValueType  precision of the vector values
 *
 * @ingroup Array
 */
template <typename ValueType = default_precision>
class Vector : public Array {
public:
    using value_type = ValueType;
    using storage_type = std::vector<ValueType>;
    using node_type = lazy::TypedNode<ValueType>;
    using absolute_type = Vector<remove_complex<ValueType>>;
    using complex_type = Vector<to_complex<ValueType>>;
    using next_precision_type = Vector<next_precision<ValueType>>;
    using kernel_type = std::function<storage_type(const storage_type&)>;

    /**
     * Creates an eager vector holding the given values.
     *
     * @param exec  the executor of the vector
     * @param values  the values
     */
    static std::unique_ptr<Vector> create(std::shared_ptr<const Executor> exec,
                                          storage_type values);

    /**
     * Creates an eager vector sharing the given values.
     *
     * @param exec  the executor of the vector
     * @param values  the values
     */
    static std::unique_ptr<Vector> create(
        std::shared_ptr<const Executor> exec,
        std::shared_ptr<const storage_type> values);

    /**
     * Creates an eager vector of the given length filled with a value.
     *
     * @param exec  the executor of the vector
     * @param length  the length of the vector
     * @param value  the value of all entries
     */
    static std::unique_ptr<Vector> create_filled(
        std::shared_ptr<const Executor> exec, size_type length,
        ValueType value);

    /**
     * Creates a lazy vector whose graph starts with a source node holding
     * the given values.
     *
     * @param exec  the executor realizing the vector
     * @param values  the values
     */
    static std::unique_ptr<Vector> create_lazy(
        std::shared_ptr<const Executor> exec, storage_type values);

    /**
     * Creates a lazy vector referring to a graph node.
     *
     * @param exec  the executor realizing the vector
     * @param node  the graph node
     */
    static std::unique_ptr<Vector> create_lazy(
        std::shared_ptr<const Executor> exec,
        std::shared_ptr<const node_type> node);

    /**
     * Concatenates vectors. The result is lazy if any of the parts is lazy.
     *
     * @param exec  the executor of the result
     * @param parts  the vectors to concatenate, at least one
     */
    static std::unique_ptr<Vector> concatenate(
        std::shared_ptr<const Executor> exec,
        const std::vector<const Vector*>& parts);

    bool is_lazy() const noexcept override { return node_ != nullptr; }

    /**
     * Returns the values of an eager vector.
     *
     * @throws InvalidStateError  if the vector is lazy
     */
    const storage_type& get_data() const;

    /**
     * @copydoc get_data()
     */
    const ValueType* get_const_values() const
    {
        return this->get_data().data();
    }

    /**
     * Returns a single value of an eager vector.
     *
     * @param idx  the index of the value
     *
     * @throws InvalidStateError  if the vector is lazy
     * @throws OutOfBoundsError  if idx is out of bounds
     */
    ValueType at(size_type idx) const;

    /**
     * Returns the value of a vector of length 1. A lazy scalar is realized.
     *
     * @throws DimensionMismatch  if the vector is not of length 1
     */
    ValueType value() const;

    /**
     * Returns the typed graph node of the vector. For an eager vector, this
     * creates an evaluated source node sharing the values.
     */
    std::shared_ptr<const node_type> get_node() const;

    std::shared_ptr<const lazy::Node> get_generic_node() const override
    {
        return this->get_node();
    }

    /** @copydoc Array::realize() */
    std::unique_ptr<Vector> realize() const;

    /** @copydoc Array::as_lazy() */
    std::unique_ptr<Vector> as_lazy() const;

    /** @copydoc Array::clone() */
    std::unique_ptr<Vector> clone() const;

    /**
     * Computes this + b.
     */
    std::unique_ptr<Vector> add(const Vector* b) const;

    /**
     * Computes this - b.
     */
    std::unique_ptr<Vector> sub(const Vector* b) const;

    /**
     * Computes the elementwise product of this and b.
     */
    std::unique_ptr<Vector> multiply(const Vector* b) const;

    /**
     * Computes alpha * this for a constant alpha.
     */
    std::unique_ptr<Vector> scale(ValueType alpha) const;

    /**
     * Computes alpha * this for a scalar vector alpha.
     */
    std::unique_ptr<Vector> scale(const Vector* alpha) const;

    /**
     * Computes this + alpha * b for a scalar vector alpha.
     */
    std::unique_ptr<Vector> add_scaled(const Vector* alpha,
                                       const Vector* b) const;

    /**
     * Computes this - alpha * b for a scalar vector alpha.
     */
    std::unique_ptr<Vector> sub_scaled(const Vector* alpha,
                                       const Vector* b) const;

    /**
     * Computes the scalar this / b of two scalar vectors. A zero denominator
     * yields zero.
     */
    std::unique_ptr<Vector> divide(const Vector* b) const;

    /**
     * Computes the elementwise complex conjugate.
     */
    std::unique_ptr<Vector> conj() const;

    /**
     * Computes the scalar sum_i conj(this_i) * b_i.
     */
    std::unique_ptr<Vector> compute_conj_dot(const Vector* b) const;

    /**
     * Computes the scalar ||this||^2.
     */
    std::unique_ptr<absolute_type> compute_squared_norm2() const;

    /**
     * Computes the scalar ||this||.
     */
    std::unique_ptr<absolute_type> compute_norm2() const;

    /**
     * Returns the values [begin, end).
     */
    std::unique_ptr<Vector> slice(size_type begin, size_type end) const;

    /**
     * Splits the vector into consecutive parts.
     *
     * @param offsets  the starting positions of the parts, followed by the
     *                 length of the vector; at least one part
     */
    std::vector<std::unique_ptr<Vector>> split(
        const std::vector<size_type>& offsets) const;

    /**
     * Converts the vector to the other precision of the same kind.
     */
    std::unique_ptr<next_precision_type> convert_to_next_precision() const;

    /**
     * Converts the vector to the complex type of the same precision.
     */
    std::unique_ptr<complex_type> make_complex() const;

    /**
     * Applies a kernel to the vector values, immediately if the vector is
     * eager, and as a new graph node if it is lazy. This is how primitive
     * operators define their math.
     *
     * @param label  description of the operation
     * @param size  the length of the vector produced by the kernel
     * @param kernel  the operation
     */
    std::unique_ptr<Vector> transform(std::string label, size_type size,
                                      kernel_type kernel) const;

protected:
    Vector(std::shared_ptr<const Executor> exec,
           std::shared_ptr<const storage_type> values);

    Vector(std::shared_ptr<const Executor> exec,
           std::shared_ptr<const node_type> node);

    Vector(const Vector&) = default;

    std::unique_ptr<Array> realize_impl() const override
    {
        return this->realize();
    }

    std::unique_ptr<Array> as_lazy_impl() const override
    {
        return this->as_lazy();
    }

    std::unique_ptr<Array> clone_impl() const override
    {
        return this->clone();
    }

private:
    std::shared_ptr<const storage_type> values_;
    std::shared_ptr<const node_type> node_;
};


/**
 * Creates and initializes an eager vector.
 *
 * ```cpp
 * auto x = lnd::initialize<lnd::Vector<double>>({1.0, 2.0, 3.0}, exec);
 * ```
 *
 * @tparam VectorType  the vector type
 *
 * @param vals  values of the vector
 * @param exec  the executor of the vector
 */
template <typename VectorType>
std::unique_ptr<VectorType> initialize(
    std::initializer_list<typename VectorType::value_type> vals,
    std::shared_ptr<const Executor> exec)
{
    return VectorType::create(
        std::move(exec), typename VectorType::storage_type(vals));
}


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_VECTOR_HPP_
