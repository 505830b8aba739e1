// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/executor.hpp>


#include <algorithm>
#include <memory>
#include <unordered_map>


#include <linden/core/base/exception.hpp>
#include <linden/core/lazy/node.hpp>


namespace lnd {
namespace {


enum class visit_state { visiting, visited };


/**
 * Groups the pending nodes reachable from `root` into dependency levels: the
 * nodes of a level only depend on evaluated nodes or nodes of earlier levels.
 */
std::vector<std::vector<const lazy::Node*>> collect_pending_levels(
    const std::shared_ptr<const lazy::Node>& root,
    std::vector<std::shared_ptr<const lazy::Node>>& pending)
{
    std::unordered_map<const lazy::Node*, visit_state> state;
    std::unordered_map<const lazy::Node*, lazy::Node::input_list> inputs;
    std::unordered_map<const lazy::Node*, size_type> level;
    std::vector<const lazy::Node*> order;
    std::vector<const lazy::Node*> stack;
    if (!root->is_evaluated()) {
        pending.push_back(root);
        stack.push_back(root.get());
    }
    while (!stack.empty()) {
        auto current = stack.back();
        auto it = state.find(current);
        if (it == state.end()) {
            state.emplace(current, visit_state::visiting);
            // the copy keeps the inputs alive while they are collected
            auto& current_inputs = inputs[current] = current->get_inputs();
            for (const auto& input : current_inputs) {
                if (!input->is_evaluated() &&
                    state.find(input.get()) == state.end()) {
                    pending.push_back(input);
                    stack.push_back(input.get());
                }
            }
        } else {
            stack.pop_back();
            if (it->second == visit_state::visiting) {
                it->second = visit_state::visited;
                order.push_back(current);
            }
        }
    }
    // order is a post-order, so all inputs precede their consumers
    size_type num_levels = 0;
    for (auto node : order) {
        size_type node_level = 0;
        for (const auto& input : inputs[node]) {
            auto input_level = level.find(input.get());
            if (input_level != level.end()) {
                node_level = std::max(node_level, input_level->second + 1);
            }
        }
        level[node] = node_level;
        num_levels = std::max(num_levels, node_level + 1);
    }
    std::vector<std::vector<const lazy::Node*>> levels(num_levels);
    for (auto node : order) {
        levels[level[node]].push_back(node);
    }
    return levels;
}


}  // anonymous namespace


void Executor::realize(const std::shared_ptr<const lazy::Node>& node) const
{
    std::vector<std::shared_ptr<const lazy::Node>> pending_nodes;
    const auto levels = collect_pending_levels(node, pending_nodes);
    size_type num_pending = 0;
    for (const auto& nodes : levels) {
        num_pending += nodes.size();
    }
    this->template log<log::Logger::realize_started>(this, node.get(),
                                                     num_pending);
    for (const auto& nodes : levels) {
        for (auto pending : nodes) {
            this->template log<log::Logger::node_evaluation_started>(this,
                                                                     pending);
        }
        const auto errors = this->run(nodes);
        for (size_type i = 0; i < nodes.size(); ++i) {
            if (!errors[i]) {
                this->template log<log::Logger::node_evaluation_completed>(
                    this, nodes[i]);
            }
        }
        for (size_type i = 0; i < nodes.size(); ++i) {
            if (!errors[i]) {
                continue;
            }
            try {
                std::rethrow_exception(errors[i]);
            } catch (const std::exception& err) {
                this->template log<log::Logger::node_evaluation_failed>(
                    this, nodes[i], std::string{err.what()});
                std::throw_with_nested(BackendExecutionError(
                    __FILE__, __LINE__, this->get_name(), nodes[i]->get_id(),
                    nodes[i]->get_label(), err.what()));
            } catch (...) {
                const std::string reason{"unknown exception"};
                this->template log<log::Logger::node_evaluation_failed>(
                    this, nodes[i], reason);
                std::throw_with_nested(BackendExecutionError(
                    __FILE__, __LINE__, this->get_name(), nodes[i]->get_id(),
                    nodes[i]->get_label(), reason));
            }
        }
    }
    this->template log<log::Logger::realize_completed>(this, node.get(),
                                                       num_pending);
}


std::exception_ptr Executor::evaluate_node(const lazy::Node* node) noexcept
{
    try {
        node->evaluate();
    } catch (...) {
        return std::current_exception();
    }
    return nullptr;
}


std::vector<std::exception_ptr> ReferenceExecutor::run(
    const std::vector<const lazy::Node*>& nodes) const
{
    std::vector<std::exception_ptr> errors(nodes.size());
    for (size_type i = 0; i < nodes.size(); ++i) {
        errors[i] = evaluate_node(nodes[i]);
    }
    return errors;
}


}  // namespace lnd
