// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/log/stream.hpp>


#include <sstream>


#include <linden/core/base/array.hpp>
#include <linden/core/base/executor.hpp>
#include <linden/core/base/lin_op.hpp>
#include <linden/core/base/name_demangling.hpp>
#include <linden/core/base/vector.hpp>
#include <linden/core/lazy/node.hpp>
#include <linden/core/stop/criterion.hpp>
#include <linden/core/stop/stopping_status.hpp>


#include "core/base/dispatch_helper.hpp"


namespace lnd {
namespace log {
namespace {


std::ostream& operator<<(std::ostream& os, const Array* array)
{
    if (array->is_lazy()) {
        return os << "<lazy>" << std::endl;
    }
    vector_dispatch(array, [&os](auto dense) {
        os << "[" << std::endl;
        for (const auto& value : dense->get_data()) {
            os << '\t' << value << std::endl;
        }
        os << "]" << std::endl;
    });
    return os;
}


std::ostream& operator<<(std::ostream& os, const stopping_status* status)
{
    os << "[" << std::endl;
    os << "\tConverged: " << status->has_converged() << std::endl;
    os << "\tStopped: " << status->has_stopped() << " with id "
       << static_cast<int>(status->get_id()) << std::endl;
    os << "\tFinalized: " << status->is_finalized() << std::endl;
    return os << "]" << std::endl;
}


std::string node_name(const lazy::Node* node)
{
    std::ostringstream oss;
    oss << "Node[" << node->get_label() << "#" << node->get_id() << ","
        << node->get_dtype() << "," << node->get_size() << "]";
    return oss.str();
}


#define LND_ENABLE_DEMANGLE_NAME(_object_type)                               \
    std::string demangle_name(const _object_type* object)                    \
    {                                                                        \
        std::ostringstream oss;                                              \
        oss << #_object_type "[";                                            \
        if (object == nullptr) {                                             \
            oss << name_demangling::get_dynamic_type(object);                \
        } else {                                                             \
            oss << name_demangling::get_dynamic_type(*object);               \
        }                                                                    \
        oss << "," << static_cast<const void*>(object) << "]";               \
        return oss.str();                                                    \
    }                                                                        \
    static_assert(true,                                                      \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")

LND_ENABLE_DEMANGLE_NAME(Array);
LND_ENABLE_DEMANGLE_NAME(LinOp);
LND_ENABLE_DEMANGLE_NAME(LinOpFactory);
LND_ENABLE_DEMANGLE_NAME(stop::Criterion);
LND_ENABLE_DEMANGLE_NAME(Executor);


}  // namespace


void Stream::on_linop_forward_started(const LinOp* op, const Array* x) const
{
    *os_ << prefix_ << "forward started on A " << demangle_name(op)
         << " with x " << demangle_name(x) << std::endl;
    if (verbose_) {
        *os_ << demangle_name(x) << x << std::endl;
    }
}


void Stream::on_linop_forward_completed(const LinOp* op, const Array* x,
                                        const Array* y) const
{
    *os_ << prefix_ << "forward completed on A " << demangle_name(op)
         << " with x " << demangle_name(x) << " and y " << demangle_name(y)
         << std::endl;
    if (verbose_) {
        *os_ << demangle_name(x) << x << std::endl;
        *os_ << demangle_name(y) << y << std::endl;
    }
}


void Stream::on_linop_adjoint_started(const LinOp* op, const Array* y) const
{
    *os_ << prefix_ << "adjoint started on A " << demangle_name(op)
         << " with y " << demangle_name(y) << std::endl;
    if (verbose_) {
        *os_ << demangle_name(y) << y << std::endl;
    }
}


void Stream::on_linop_adjoint_completed(const LinOp* op, const Array* y,
                                        const Array* x) const
{
    *os_ << prefix_ << "adjoint completed on A " << demangle_name(op)
         << " with y " << demangle_name(y) << " and x " << demangle_name(x)
         << std::endl;
    if (verbose_) {
        *os_ << demangle_name(y) << y << std::endl;
        *os_ << demangle_name(x) << x << std::endl;
    }
}


void Stream::on_realize_started(const Executor* exec, const lazy::Node* node,
                                const size_type& num_pending) const
{
    *os_ << prefix_ << "realize started for " << node_name(node) << " on "
         << demangle_name(exec) << " with " << num_pending
         << " pending nodes" << std::endl;
}


void Stream::on_realize_completed(const Executor* exec, const lazy::Node* node,
                                  const size_type& num_evaluated) const
{
    *os_ << prefix_ << "realize completed for " << node_name(node) << " on "
         << demangle_name(exec) << " after evaluating " << num_evaluated
         << " nodes" << std::endl;
}


void Stream::on_node_evaluation_started(const Executor* exec,
                                        const lazy::Node* node) const
{
    *os_ << prefix_ << node_name(node) << " started on "
         << demangle_name(exec) << std::endl;
}


void Stream::on_node_evaluation_completed(const Executor* exec,
                                          const lazy::Node* node) const
{
    *os_ << prefix_ << node_name(node) << " completed on "
         << demangle_name(exec) << std::endl;
}


void Stream::on_node_evaluation_failed(const Executor* exec,
                                       const lazy::Node* node,
                                       const std::string& reason) const
{
    *os_ << prefix_ << node_name(node) << " failed on " << demangle_name(exec)
         << ": " << reason << std::endl;
}


void Stream::on_linop_factory_generate_started(const LinOpFactory* factory,
                                               const LinOp* input) const
{
    *os_ << prefix_ << "generate started for " << demangle_name(factory)
         << " with input " << demangle_name(input) << std::endl;
}


void Stream::on_linop_factory_generate_completed(const LinOpFactory* factory,
                                                 const LinOp* input,
                                                 const LinOp* output) const
{
    *os_ << prefix_ << "generate completed for " << demangle_name(factory)
         << " with input " << demangle_name(input) << " produced "
         << demangle_name(output) << std::endl;
}


void Stream::on_criterion_check_started(const stop::Criterion* criterion,
                                        const size_type& num_iterations,
                                        const Array* residual,
                                        const Array* residual_norm,
                                        const Array* solution,
                                        const uint8& stopping_id,
                                        const bool& set_finalized) const
{
    *os_ << prefix_ << "check started for " << demangle_name(criterion)
         << " at iteration " << num_iterations << " with ID "
         << static_cast<int>(stopping_id) << " and finalized set to "
         << set_finalized << std::endl;
    if (verbose_) {
        if (residual != nullptr) {
            *os_ << demangle_name(residual) << residual << std::endl;
        }
        if (residual_norm != nullptr) {
            *os_ << demangle_name(residual_norm) << residual_norm
                 << std::endl;
        }
        if (solution != nullptr) {
            *os_ << demangle_name(solution) << solution << std::endl;
        }
    }
}


void Stream::on_criterion_check_completed(
    const stop::Criterion* criterion, const size_type& num_iterations,
    const Array* residual, const Array* residual_norm, const Array* solution,
    const uint8& stopping_id, const bool& set_finalized,
    const stopping_status* status, const bool& one_changed,
    const bool& converged) const
{
    *os_ << prefix_ << "check completed for " << demangle_name(criterion)
         << " at iteration " << num_iterations << " with ID "
         << static_cast<int>(stopping_id) << " and finalized set to "
         << set_finalized << ". It changed the status " << one_changed
         << ", stopped the iteration process " << converged << std::endl;
    if (verbose_) {
        *os_ << status;
        if (residual != nullptr) {
            *os_ << demangle_name(residual) << residual << std::endl;
        }
        if (residual_norm != nullptr) {
            *os_ << demangle_name(residual_norm) << residual_norm
                 << std::endl;
        }
        if (solution != nullptr) {
            *os_ << demangle_name(solution) << solution << std::endl;
        }
    }
}


void Stream::on_iteration_complete(const LinOp* solver,
                                   const size_type& num_iterations,
                                   const Array* residual,
                                   const Array* solution,
                                   const Array* implicit_sq_residual_norm,
                                   const stopping_status* status,
                                   const bool& stopped) const
{
    *os_ << prefix_ << "iteration " << num_iterations
         << " completed with solver " << demangle_name(solver)
         << " with residual " << demangle_name(residual) << ", solution "
         << demangle_name(solution) << ", implicit_sq_residual_norm "
         << demangle_name(implicit_sq_residual_norm);
    if (status != nullptr) {
        *os_ << ". Stopped the iteration process " << std::boolalpha
             << stopped << std::noboolalpha;
    }
    *os_ << std::endl;
    if (verbose_) {
        if (residual != nullptr) {
            *os_ << demangle_name(residual) << residual << std::endl;
        }
        if (solution != nullptr) {
            *os_ << demangle_name(solution) << solution << std::endl;
        }
        if (implicit_sq_residual_norm != nullptr) {
            *os_ << demangle_name(implicit_sq_residual_norm)
                 << implicit_sq_residual_norm << std::endl;
        }
        if (status != nullptr) {
            *os_ << status;
        }
    }
}


}  // namespace log
}  // namespace lnd
