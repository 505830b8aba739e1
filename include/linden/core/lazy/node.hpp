// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_LAZY_NODE_HPP_
#define LND_PUBLIC_CORE_LAZY_NODE_HPP_


#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>


#include <linden/core/base/dtype.hpp>
#include <linden/core/base/types.hpp>


namespace lnd {
/**
 * @brief The lazy namespace contains the deferred computation graph.
 *
 * @ingroup lazy
 */
namespace lazy {


/**
 * A Node is one pending operation of a deferred computation graph. It knows
 * the dtype and the length of the vector it produces without computing it,
 * and refers to the nodes it depends on.
 *
 * Nodes are immutable once created: new operations append new nodes. A node is
 * evaluated at most once, its result is kept by the node, so consumers sharing
 * a node never trigger a recomputation. Evaluation is driven by an Executor,
 * which evaluates all inputs of a node before the node itself.
 *
 * Once evaluated, a node drops its operation and its references to the
 * inputs and only keeps the result. Destroying a pending graph does not
 * recurse, so graphs of any depth can be released.
 */
class Node {
public:
    using input_list = std::vector<std::shared_ptr<const Node>>;

    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /**
     * Returns the unique id of the node. Ids are increasing in creation
     * order.
     */
    uint64 get_id() const noexcept { return id_; }

    /**
     * Returns the label describing the operation of this node.
     */
    const std::string& get_label() const noexcept { return label_; }

    /**
     * Returns the value type of the produced vector.
     */
    dtype get_dtype() const noexcept { return dtype_; }

    /**
     * Returns the length of the produced vector.
     */
    size_type get_size() const noexcept { return size_; }

    /**
     * Returns the nodes this node depends on. The list is empty once the
     * node is evaluated.
     */
    input_list get_inputs() const;

    /**
     * Checks whether the result of this node is available.
     */
    bool is_evaluated() const noexcept { return evaluated_.load(); }

    /**
     * Evaluates the node unless it was already evaluated. All inputs have to
     * be evaluated beforehand.
     *
     * This is thread-safe: concurrent calls evaluate the node only once.
     *
     * @throws InvalidStateError  if one of the inputs is not evaluated
     * @throws DimensionMismatch  if the operation produced a vector of the
     *                            wrong length
     */
    void evaluate() const;

protected:
    Node(std::string label, dtype type, size_type size, input_list inputs,
         bool evaluated = false);

    /**
     * Runs the operation of the node and stores its result. Returns the
     * length of the produced vector.
     */
    virtual size_type evaluate_impl() const = 0;

    /**
     * Drops the operation, including all references it holds to other nodes.
     */
    virtual void release_operation() const noexcept = 0;

    /**
     * Releases the operation and the inputs of this node, and iteratively of
     * all inputs which are only referenced by it. Has to be called from the
     * destructor of the most derived class.
     */
    void release_graph() const noexcept;

private:
    static uint64 next_id();

    uint64 id_;
    std::string label_;
    dtype dtype_;
    size_type size_;
    mutable input_list inputs_;
    mutable std::mutex inputs_mutex_;
    mutable std::mutex mutex_;
    mutable std::atomic<bool> evaluated_;
};


/**
 * A Node producing a vector of values of type ValueType.
 *
 * The operation is given as a kernel without arguments, which captures the
 * typed nodes it reads from and queries their results via get_result().
 *
 * @tparam ValueType  precision of the produced values
 */
template <typename ValueType>
class TypedNode : public Node {
public:
    using value_type = ValueType;
    using storage_type = std::vector<ValueType>;
    using kernel_type = std::function<storage_type()>;

    /**
     * Creates a node computing its values with the given kernel.
     *
     * @param label  description of the operation
     * @param size  the length of the vector the kernel produces
     * @param inputs  the nodes read by the kernel
     * @param kernel  the operation
     */
    static std::shared_ptr<const TypedNode> create(std::string label,
                                                   size_type size,
                                                   input_list inputs,
                                                   kernel_type kernel);

    /**
     * Creates an already evaluated source node wrapping existing values.
     * The values are shared, not copied.
     *
     * @param values  the values of the node
     */
    static std::shared_ptr<const TypedNode> create_source(
        std::shared_ptr<const storage_type> values);

    /**
     * Returns the values produced by this node.
     *
     * @throws InvalidStateError  if the node was not evaluated yet
     */
    std::shared_ptr<const storage_type> get_result() const;

    ~TypedNode() override;

protected:
    TypedNode(std::string label, size_type size, input_list inputs,
              kernel_type kernel);

    explicit TypedNode(std::shared_ptr<const storage_type> values);

    size_type evaluate_impl() const override;

    void release_operation() const noexcept override;

private:
    mutable kernel_type kernel_;
    mutable std::shared_ptr<const storage_type> result_;
};


}  // namespace lazy
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_LAZY_NODE_HPP_
