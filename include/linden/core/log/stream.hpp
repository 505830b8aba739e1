// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_LOG_STREAM_HPP_
#define LND_PUBLIC_CORE_LOG_STREAM_HPP_


#include <iostream>
#include <memory>
#include <string>


#include <linden/core/log/logger.hpp>


namespace lnd {
namespace log {


/**
 * Stream is a Logger which logs every event to a stream. This can typically be
 * used to log to a file or to the console.
 *
 * In verbose mode, the values of the eager arrays passed to an event are
 * printed as well. Lazy arrays are printed as `<lazy>`: logging never
 * triggers the evaluation of a deferred graph.
 *
 * @ingroup log
 */
class Stream : public Logger {
public:
    /**
     * Creates a Stream logger. This dynamically allocates the memory,
     * constructs the object and returns an std::unique_ptr to this object.
     *
     * @param enabled_events  the events enabled for this logger. By default all
     *                        events.
     * @param os  the stream used for this logger
     * @param verbose  whether we want detailed information or not. This
     *                 includes always printing residuals and other
     *                 information which can give a large output.
     *
     * @return an std::unique_ptr to the the constructed object
     */
    static std::unique_ptr<Stream> create(
        const Logger::mask_type& enabled_events = Logger::all_events_mask,
        std::ostream& os = std::cerr, bool verbose = false)
    {
        return std::unique_ptr<Stream>(new Stream(enabled_events, os, verbose));
    }

protected:
    /* Internal solver events */
    void on_linop_forward_started(const LinOp* op,
                                  const Array* x) const override;

    void on_linop_forward_completed(const LinOp* op, const Array* x,
                                    const Array* y) const override;

    void on_linop_adjoint_started(const LinOp* op,
                                  const Array* y) const override;

    void on_linop_adjoint_completed(const LinOp* op, const Array* y,
                                    const Array* x) const override;

    /* Executor events */
    void on_realize_started(const Executor* exec, const lazy::Node* node,
                            const size_type& num_pending) const override;

    void on_realize_completed(const Executor* exec, const lazy::Node* node,
                              const size_type& num_evaluated) const override;

    void on_node_evaluation_started(const Executor* exec,
                                    const lazy::Node* node) const override;

    void on_node_evaluation_completed(const Executor* exec,
                                      const lazy::Node* node) const override;

    void on_node_evaluation_failed(const Executor* exec,
                                   const lazy::Node* node,
                                   const std::string& reason) const override;

    /* LinOpFactory events */
    void on_linop_factory_generate_started(const LinOpFactory* factory,
                                           const LinOp* input) const override;

    void on_linop_factory_generate_completed(
        const LinOpFactory* factory, const LinOp* input,
        const LinOp* output) const override;

    /* Criterion events */
    void on_criterion_check_started(const stop::Criterion* criterion,
                                    const size_type& num_iterations,
                                    const Array* residual,
                                    const Array* residual_norm,
                                    const Array* solution,
                                    const uint8& stopping_id,
                                    const bool& set_finalized) const override;

    void on_criterion_check_completed(
        const stop::Criterion* criterion, const size_type& num_iterations,
        const Array* residual, const Array* residual_norm,
        const Array* solution, const uint8& stopping_id,
        const bool& set_finalized, const stopping_status* status,
        const bool& one_changed, const bool& converged) const override;

    /* Internal solver events */
    void on_iteration_complete(const LinOp* solver,
                               const size_type& num_iterations,
                               const Array* residual, const Array* solution,
                               const Array* implicit_sq_residual_norm,
                               const stopping_status* status,
                               const bool& stopped) const override;

    /**
     * Creates a Stream logger.
     *
     * @param enabled_events  the events enabled for this logger. By default all
     *                        events.
     * @param os  the stream used for this logger
     * @param verbose  whether we want detailed information or not. This
     *                 includes always printing residuals and other
     *                 information which can give a large output.
     */
    explicit Stream(
        const Logger::mask_type& enabled_events = Logger::all_events_mask,
        std::ostream& os = std::cerr, bool verbose = false)
        : Logger(enabled_events), os_(&os), verbose_(verbose)
    {}

private:
    std::ostream* os_;
    static constexpr const char* prefix_ = "[LOG] >>> ";
    bool verbose_;
};


}  // namespace log
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_LOG_STREAM_HPP_
