// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/vector.hpp>


#include <algorithm>
#include <numeric>


#include <linden/core/base/exception_helpers.hpp>


namespace lnd {
namespace {


template <typename InType>
using value_list = std::vector<const std::vector<InType>*>;


/**
 * Applies a kernel to the values of the inputs. The kernel runs right away if
 * all inputs are eager, otherwise it becomes a new node of the deferred graph
 * reading the nodes of the inputs.
 *
 * The kernel maps the list of input values to the output values and has to
 * produce `size` values.
 */
template <typename OutType, typename InType, typename Kernel>
std::unique_ptr<Vector<OutType>> apply_kernel(
    std::shared_ptr<const Executor> exec, std::string label, size_type size,
    const std::vector<const Vector<InType>*>& inputs, Kernel kernel)
{
    const bool lazy =
        std::any_of(inputs.begin(), inputs.end(),
                    [](const Vector<InType>* in) { return in->is_lazy(); });
    if (!lazy) {
        value_list<InType> values;
        for (auto in : inputs) {
            values.push_back(&in->get_data());
        }
        auto result = kernel(values);
        if (result.size() != size) {
            throw DimensionMismatch(__FILE__, __LINE__, __func__, label, size,
                                    1, "kernel result", result.size(), 1,
                                    "kernel produced a vector of the wrong "
                                    "length");
        }
        return Vector<OutType>::create(std::move(exec), std::move(result));
    }
    std::vector<std::shared_ptr<const lazy::TypedNode<InType>>> typed_inputs;
    lazy::Node::input_list node_inputs;
    for (auto in : inputs) {
        typed_inputs.push_back(in->get_node());
        node_inputs.push_back(typed_inputs.back());
    }
    auto node = lazy::TypedNode<OutType>::create(
        std::move(label), size, std::move(node_inputs),
        [typed_inputs, kernel]() {
            std::vector<std::shared_ptr<const std::vector<InType>>> results;
            value_list<InType> values;
            for (const auto& in : typed_inputs) {
                results.push_back(in->get_result());
                values.push_back(results.back().get());
            }
            return kernel(values);
        });
    return Vector<OutType>::create_lazy(std::move(exec), std::move(node));
}


}  // anonymous namespace


template <typename ValueType>
Vector<ValueType>::Vector(std::shared_ptr<const Executor> exec,
                          std::shared_ptr<const storage_type> values)
    : Array(std::move(exec), values->size(), dtype_of<ValueType>()),
      values_{std::move(values)}
{}


template <typename ValueType>
Vector<ValueType>::Vector(std::shared_ptr<const Executor> exec,
                          std::shared_ptr<const node_type> node)
    : Array(std::move(exec), node->get_size(), dtype_of<ValueType>()),
      node_{std::move(node)}
{}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::create(
    std::shared_ptr<const Executor> exec, storage_type values)
{
    return create(std::move(exec),
                  std::make_shared<const storage_type>(std::move(values)));
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::create(
    std::shared_ptr<const Executor> exec,
    std::shared_ptr<const storage_type> values)
{
    LND_THROW_IF_INVALID(values != nullptr, "values must not be null");
    return std::unique_ptr<Vector>(new Vector(std::move(exec), values));
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::create_filled(
    std::shared_ptr<const Executor> exec, size_type length, ValueType value)
{
    return create(std::move(exec), storage_type(length, value));
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::create_lazy(
    std::shared_ptr<const Executor> exec, storage_type values)
{
    return create_lazy(std::move(exec),
                       node_type::create_source(
                           std::make_shared<const storage_type>(
                               std::move(values))));
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::create_lazy(
    std::shared_ptr<const Executor> exec,
    std::shared_ptr<const node_type> node)
{
    LND_THROW_IF_INVALID(node != nullptr, "node must not be null");
    return std::unique_ptr<Vector>(new Vector(std::move(exec), node));
}


template <typename ValueType>
const typename Vector<ValueType>::storage_type& Vector<ValueType>::get_data()
    const
{
    LND_THROW_IF_INVALID(!this->is_lazy(),
                         "the values of a lazy vector are only available "
                         "after realize()");
    return *values_;
}


template <typename ValueType>
ValueType Vector<ValueType>::at(size_type idx) const
{
    LND_ENSURE_IN_BOUNDS(idx, this->get_length());
    return this->get_data()[idx];
}


template <typename ValueType>
ValueType Vector<ValueType>::value() const
{
    LND_ASSERT_EQUAL_DIMENSIONS(this, dim<2>(1, 1));
    if (this->is_lazy()) {
        return this->realize()->at(0);
    }
    return this->at(0);
}


template <typename ValueType>
std::shared_ptr<const typename Vector<ValueType>::node_type>
Vector<ValueType>::get_node() const
{
    if (this->is_lazy()) {
        return node_;
    }
    return node_type::create_source(values_);
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::realize() const
{
    if (!this->is_lazy()) {
        return this->clone();
    }
    auto exec = this->get_executor();
    LND_THROW_IF_INVALID(exec != nullptr,
                         "a lazy vector needs an executor to be realized");
    exec->realize(node_);
    return create(exec, node_->get_result());
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::as_lazy() const
{
    return create_lazy(this->get_executor(), this->get_node());
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::clone() const
{
    return std::unique_ptr<Vector>(new Vector(*this));
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::add(const Vector* b) const
{
    LND_ASSERT_EQUAL_DIMENSIONS(this, b);
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "add", this->get_length(), {this, b},
        [](const value_list<ValueType>& in) {
            storage_type out(in[0]->size());
            for (size_type i = 0; i < out.size(); ++i) {
                out[i] = (*in[0])[i] + (*in[1])[i];
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::sub(const Vector* b) const
{
    LND_ASSERT_EQUAL_DIMENSIONS(this, b);
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "sub", this->get_length(), {this, b},
        [](const value_list<ValueType>& in) {
            storage_type out(in[0]->size());
            for (size_type i = 0; i < out.size(); ++i) {
                out[i] = (*in[0])[i] - (*in[1])[i];
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::multiply(
    const Vector* b) const
{
    LND_ASSERT_EQUAL_DIMENSIONS(this, b);
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "multiply", this->get_length(), {this, b},
        [](const value_list<ValueType>& in) {
            storage_type out(in[0]->size());
            for (size_type i = 0; i < out.size(); ++i) {
                out[i] = (*in[0])[i] * (*in[1])[i];
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::scale(
    ValueType alpha) const
{
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "scale", this->get_length(), {this},
        [alpha](const value_list<ValueType>& in) {
            storage_type out(*in[0]);
            for (auto& value : out) {
                value *= alpha;
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::scale(
    const Vector* alpha) const
{
    LND_ASSERT_EQUAL_DIMENSIONS(alpha, dim<2>(1, 1));
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "scale", this->get_length(), {this, alpha},
        [](const value_list<ValueType>& in) {
            const auto factor = (*in[1])[0];
            storage_type out(*in[0]);
            for (auto& value : out) {
                value *= factor;
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::add_scaled(
    const Vector* alpha, const Vector* b) const
{
    LND_ASSERT_EQUAL_DIMENSIONS(alpha, dim<2>(1, 1));
    LND_ASSERT_EQUAL_DIMENSIONS(this, b);
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "add_scaled", this->get_length(),
        {this, alpha, b}, [](const value_list<ValueType>& in) {
            const auto factor = (*in[1])[0];
            storage_type out(*in[0]);
            for (size_type i = 0; i < out.size(); ++i) {
                out[i] += factor * (*in[2])[i];
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::sub_scaled(
    const Vector* alpha, const Vector* b) const
{
    LND_ASSERT_EQUAL_DIMENSIONS(alpha, dim<2>(1, 1));
    LND_ASSERT_EQUAL_DIMENSIONS(this, b);
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "sub_scaled", this->get_length(),
        {this, alpha, b}, [](const value_list<ValueType>& in) {
            const auto factor = (*in[1])[0];
            storage_type out(*in[0]);
            for (size_type i = 0; i < out.size(); ++i) {
                out[i] -= factor * (*in[2])[i];
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::divide(
    const Vector* b) const
{
    LND_ASSERT_EQUAL_DIMENSIONS(this, dim<2>(1, 1));
    LND_ASSERT_EQUAL_DIMENSIONS(b, dim<2>(1, 1));
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "divide", 1, {this, b},
        [](const value_list<ValueType>& in) {
            const auto denominator = (*in[1])[0];
            return storage_type{lnd::is_zero(denominator)
                                    ? zero<ValueType>()
                                    : (*in[0])[0] / denominator};
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::conj() const
{
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "conj", this->get_length(), {this},
        [](const value_list<ValueType>& in) {
            storage_type out(*in[0]);
            for (auto& value : out) {
                value = lnd::conj(value);
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::compute_conj_dot(
    const Vector* b) const
{
    LND_ASSERT_EQUAL_DIMENSIONS(this, b);
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "conj_dot", 1, {this, b},
        [](const value_list<ValueType>& in) {
            auto result = zero<ValueType>();
            for (size_type i = 0; i < in[0]->size(); ++i) {
                result += lnd::conj((*in[0])[i]) * (*in[1])[i];
            }
            return storage_type{result};
        });
}


template <typename ValueType>
std::unique_ptr<typename Vector<ValueType>::absolute_type>
Vector<ValueType>::compute_squared_norm2() const
{
    using absolute_value = remove_complex<ValueType>;
    return apply_kernel<absolute_value, ValueType>(
        this->get_executor(), "squared_norm2", 1,
        std::vector<const Vector*>{this}, [](const value_list<ValueType>& in) {
            auto result = zero<absolute_value>();
            for (const auto& value : *in[0]) {
                result += lnd::squared_norm(value);
            }
            return std::vector<absolute_value>{result};
        });
}


template <typename ValueType>
std::unique_ptr<typename Vector<ValueType>::absolute_type>
Vector<ValueType>::compute_norm2() const
{
    using absolute_value = remove_complex<ValueType>;
    return apply_kernel<absolute_value, ValueType>(
        this->get_executor(), "norm2", 1, std::vector<const Vector*>{this},
        [](const value_list<ValueType>& in) {
            auto result = zero<absolute_value>();
            for (const auto& value : *in[0]) {
                result += lnd::squared_norm(value);
            }
            return std::vector<absolute_value>{lnd::sqrt(result)};
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::slice(
    size_type begin, size_type end) const
{
    LND_ENSURE_IN_BOUNDS(end, this->get_length() + 1);
    LND_ENSURE_IN_BOUNDS(begin, end + 1);
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), "slice", end - begin, {this},
        [begin, end](const value_list<ValueType>& in) {
            return storage_type(in[0]->begin() + begin,
                                in[0]->begin() + end);
        });
}


template <typename ValueType>
std::vector<std::unique_ptr<Vector<ValueType>>> Vector<ValueType>::split(
    const std::vector<size_type>& offsets) const
{
    LND_THROW_IF_INVALID(offsets.size() >= 2,
                         "split needs the offsets of at least one part");
    LND_ASSERT_EQ(offsets.back(), this->get_length());
    std::vector<std::unique_ptr<Vector>> parts;
    for (size_type i = 0; i + 1 < offsets.size(); ++i) {
        parts.push_back(this->slice(offsets[i], offsets[i + 1]));
    }
    return parts;
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::concatenate(
    std::shared_ptr<const Executor> exec,
    const std::vector<const Vector*>& parts)
{
    LND_THROW_IF_INVALID(!parts.empty(), "nothing to concatenate");
    size_type size = 0;
    for (auto part : parts) {
        size += part->get_length();
    }
    return apply_kernel<ValueType, ValueType>(
        std::move(exec), "concatenate", size, parts,
        [size](const value_list<ValueType>& in) {
            storage_type out;
            out.reserve(size);
            for (auto part : in) {
                out.insert(out.end(), part->begin(), part->end());
            }
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<typename Vector<ValueType>::next_precision_type>
Vector<ValueType>::convert_to_next_precision() const
{
    using next_value = next_precision<ValueType>;
    return apply_kernel<next_value, ValueType>(
        this->get_executor(), "convert", this->get_length(),
        std::vector<const Vector*>{this}, [](const value_list<ValueType>& in) {
            std::vector<next_value> out(in[0]->size());
            std::transform(in[0]->begin(), in[0]->end(), out.begin(),
                           [](const ValueType& value) {
                               return convert_value<next_value>(value);
                           });
            return out;
        });
}


template <typename ValueType>
std::unique_ptr<typename Vector<ValueType>::complex_type>
Vector<ValueType>::make_complex() const
{
    using complex_value = to_complex<ValueType>;
    return apply_kernel<complex_value, ValueType>(
        this->get_executor(), "make_complex", this->get_length(),
        std::vector<const Vector*>{this}, [](const value_list<ValueType>& in) {
            return std::vector<complex_value>(in[0]->begin(), in[0]->end());
        });
}


template <typename ValueType>
std::unique_ptr<Vector<ValueType>> Vector<ValueType>::transform(
    std::string label, size_type size, kernel_type kernel) const
{
    LND_THROW_IF_INVALID(static_cast<bool>(kernel),
                         "transform needs a kernel");
    return apply_kernel<ValueType, ValueType>(
        this->get_executor(), std::move(label), size, {this},
        [kernel](const value_list<ValueType>& in) { return kernel(*in[0]); });
}


#define LND_DECLARE_VECTOR(_type) class Vector<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_VECTOR);


}  // namespace lnd
