// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_EXECUTOR_HPP_
#define LND_PUBLIC_CORE_BASE_EXECUTOR_HPP_


#include <exception>
#include <memory>
#include <string>
#include <vector>


#include <linden/core/base/types.hpp>
#include <linden/core/log/logger.hpp>


namespace lnd {


namespace lazy {
class Node;
}  // namespace lazy


/**
 * The first step in using the Linden library consists of creating an
 * executor. Executors are the backend contexts which evaluate deferred
 * computation graphs. They are passed explicitly to every vector and operator,
 * so there is no global runtime state, and tests can substitute their own
 * executor.
 *
 * Eager vectors are computed right away on the calling thread. Lazy vectors
 * only record the operations applied to them; a call to realize() hands the
 * graph reachable from a node to the executor, which evaluates every node not
 * evaluated yet, each of them after all of its inputs. realize() blocks until
 * the result is available or an evaluation failed.
 *
 * Currently, the following executors are supported:
 *
 * +  ReferenceExecutor evaluates the nodes one after the other, in dependency
 *    order.
 * +  OmpExecutor evaluates all nodes whose inputs are available concurrently
 *    with OpenMP.
 *
 * @ingroup Executor
 */
class Executor : public log::EnableLogging<Executor>,
                 public std::enable_shared_from_this<Executor> {
public:
    virtual ~Executor() = default;

    Executor(Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(Executor&) = delete;
    Executor& operator=(Executor&&) = delete;

    /**
     * Evaluates all pending nodes the given node depends on, and the node
     * itself. Nodes evaluated before are not evaluated again.
     *
     * @param node  the node to realize
     *
     * @throws BackendExecutionError  if the evaluation of a node fails. The
     *                                original exception is nested.
     */
    void realize(const std::shared_ptr<const lazy::Node>& node) const;

    /**
     * Returns the name of the executor, used in log and error messages.
     */
    virtual std::string get_name() const = 0;

protected:
    Executor() = default;

    /**
     * Evaluates a list of independent nodes (none of them depends on another
     * one of the list). Failures are not thrown but reported in the returned
     * list, which holds one entry per node (nullptr if the node succeeded).
     *
     * @param nodes  the nodes to evaluate
     */
    virtual std::vector<std::exception_ptr> run(
        const std::vector<const lazy::Node*>& nodes) const = 0;

    /**
     * Evaluates a single node and captures the failure, if any.
     */
    static std::exception_ptr evaluate_node(const lazy::Node* node) noexcept;
};


/**
 * This is the Executor subclass which evaluates nodes sequentially on the
 * calling thread.
 *
 * @ingroup exec_ref
 * @ingroup Executor
 */
class ReferenceExecutor : public Executor {
public:
    /**
     * Creates a new ReferenceExecutor.
     */
    static std::shared_ptr<ReferenceExecutor> create()
    {
        return std::shared_ptr<ReferenceExecutor>(new ReferenceExecutor());
    }

    std::string get_name() const override { return "reference"; }

protected:
    ReferenceExecutor() = default;

    std::vector<std::exception_ptr> run(
        const std::vector<const lazy::Node*>& nodes) const override;
};


/**
 * This is the Executor subclass which evaluates all nodes of a dependency
 * level concurrently using OpenMP.
 *
 * @ingroup exec_omp
 * @ingroup Executor
 */
class OmpExecutor : public Executor {
public:
    /**
     * Creates a new OmpExecutor.
     *
     * @param num_threads  the number of threads to use, or 0 to use the
     *                     OpenMP default
     */
    static std::shared_ptr<OmpExecutor> create(int num_threads = 0)
    {
        return std::shared_ptr<OmpExecutor>(new OmpExecutor(num_threads));
    }

    std::string get_name() const override { return "omp"; }

    /**
     * Returns the number of threads the executor uses.
     */
    int get_num_threads() const noexcept;

protected:
    explicit OmpExecutor(int num_threads) : num_threads_{num_threads} {}

    std::vector<std::exception_ptr> run(
        const std::vector<const lazy::Node*>& nodes) const override;

private:
    int num_threads_;
};


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_EXECUTOR_HPP_
