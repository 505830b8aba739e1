// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/lazy/node.hpp>


#include <linden/core/base/exception_helpers.hpp>


namespace lnd {
namespace lazy {


Node::Node(std::string label, dtype type, size_type size, input_list inputs,
           bool evaluated)
    : id_{next_id()},
      label_{std::move(label)},
      dtype_{type},
      size_{size},
      inputs_{std::move(inputs)},
      evaluated_{evaluated}
{}


Node::input_list Node::get_inputs() const
{
    std::lock_guard<std::mutex> guard{inputs_mutex_};
    return inputs_;
}


void Node::release_graph() const noexcept
{
    this->release_operation();
    input_list pending;
    {
        std::lock_guard<std::mutex> guard{inputs_mutex_};
        pending.swap(inputs_);
    }
    // inputs only referenced from here are unlinked before they are destroyed
    while (!pending.empty()) {
        auto node = std::move(pending.back());
        pending.pop_back();
        if (node.use_count() == 1) {
            node->release_operation();
            std::lock_guard<std::mutex> guard{node->inputs_mutex_};
            for (auto& input : node->inputs_) {
                pending.push_back(std::move(input));
            }
            node->inputs_.clear();
        }
    }
}


uint64 Node::next_id()
{
    static std::atomic<uint64> counter{0};
    return counter++;
}


void Node::evaluate() const
{
    if (evaluated_.load()) {
        return;
    }
    std::lock_guard<std::mutex> guard{mutex_};
    if (evaluated_.load()) {
        return;
    }
    for (const auto& input : this->get_inputs()) {
        LND_THROW_IF_INVALID(input->is_evaluated(),
                             "input #" + std::to_string(input->get_id()) +
                                 " of node #" + std::to_string(id_) +
                                 " is not evaluated");
    }
    const auto produced = this->evaluate_impl();
    if (produced != size_) {
        throw DimensionMismatch(__FILE__, __LINE__, __func__, label_, size_,
                                1, "kernel result", produced, 1,
                                "kernel produced a vector of the wrong length");
    }
    evaluated_.store(true);
    this->release_operation();
    input_list released;
    std::lock_guard<std::mutex> inputs_guard{inputs_mutex_};
    released.swap(inputs_);
}


template <typename ValueType>
std::shared_ptr<const TypedNode<ValueType>> TypedNode<ValueType>::create(
    std::string label, size_type size, input_list inputs, kernel_type kernel)
{
    return std::shared_ptr<const TypedNode>(new TypedNode(
        std::move(label), size, std::move(inputs), std::move(kernel)));
}


template <typename ValueType>
std::shared_ptr<const TypedNode<ValueType>> TypedNode<ValueType>::create_source(
    std::shared_ptr<const storage_type> values)
{
    return std::shared_ptr<const TypedNode>(new TypedNode(std::move(values)));
}


template <typename ValueType>
TypedNode<ValueType>::TypedNode(std::string label, size_type size,
                                input_list inputs, kernel_type kernel)
    : Node(std::move(label), dtype_of<ValueType>(), size, std::move(inputs)),
      kernel_{std::move(kernel)}
{}


template <typename ValueType>
TypedNode<ValueType>::TypedNode(std::shared_ptr<const storage_type> values)
    : Node("from_array", dtype_of<ValueType>(), values->size(), {}, true),
      result_{std::move(values)}
{}


template <typename ValueType>
TypedNode<ValueType>::~TypedNode()
{
    this->release_graph();
}


template <typename ValueType>
std::shared_ptr<const typename TypedNode<ValueType>::storage_type>
TypedNode<ValueType>::get_result() const
{
    LND_THROW_IF_INVALID(this->is_evaluated(),
                         "node #" + std::to_string(this->get_id()) + " (" +
                             this->get_label() + ") is not evaluated");
    return result_;
}


template <typename ValueType>
size_type TypedNode<ValueType>::evaluate_impl() const
{
    auto result = std::make_shared<const storage_type>(kernel_());
    const auto size = result->size();
    if (size == this->get_size()) {
        result_ = std::move(result);
    }
    return size;
}


template <typename ValueType>
void TypedNode<ValueType>::release_operation() const noexcept
{
    kernel_ = nullptr;
}


#define LND_DECLARE_TYPED_NODE(_type) class TypedNode<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_TYPED_NODE);


}  // namespace lazy
}  // namespace lnd
