// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_LOG_CONVERGENCE_HPP_
#define LND_PUBLIC_CORE_LOG_CONVERGENCE_HPP_


#include <memory>


#include <linden/core/base/array.hpp>
#include <linden/core/log/logger.hpp>


namespace lnd {
namespace log {


/**
 * Convergence is a Logger which logs data strictly from the
 * `criterion_check_completed` and `iteration_complete` events. The purpose of
 * this logger is to give a simple access to standard data generated by the
 * solver once it has stopped with minimal overhead.
 *
 * This logger also computes the residual norm from the residual if the
 * residual norm was not available. The norm is a handle computed the same
 * way as the residual: for a lazy solver run, it is lazy and only evaluated
 * when it is realized by the caller.
 *
 * @ingroup log
 */
class Convergence : public Logger {
public:
    /**
     * Creates a convergence logger. This dynamically allocates the memory,
     * constructs the object and returns an std::unique_ptr to this object.
     *
     * @param enabled_events  the events enabled for this logger. By default
     *                        the criterion check and iteration complete events
     *
     * @return an std::unique_ptr to the the constructed object
     */
    static std::unique_ptr<Convergence> create(
        const mask_type& enabled_events = Logger::criterion_events_mask |
                                          Logger::iteration_complete_mask)
    {
        return std::unique_ptr<Convergence>(new Convergence(enabled_events));
    }

    /**
     * Returns true if the solver has converged.
     *
     * @return the bool flag for convergence status
     */
    bool has_converged() const noexcept { return convergence_status_; }

    /**
     * Returns the number of iterations
     *
     * @return the number of iterations
     */
    const size_type& get_num_iterations() const noexcept
    {
        return num_iterations_;
    }

    /**
     * Returns the residual
     *
     * @return the residual
     */
    const Array* get_residual() const noexcept { return residual_.get(); }

    /**
     * Returns the residual norm
     *
     * @return the residual norm
     */
    const Array* get_residual_norm() const noexcept
    {
        return residual_norm_.get();
    }

    /**
     * Returns the implicit squared residual norm
     *
     * @return the implicit squared residual norm
     */
    const Array* get_implicit_sq_resnorm() const noexcept
    {
        return implicit_sq_resnorm_.get();
    }

protected:
    void on_criterion_check_completed(
        const stop::Criterion* criterion, const size_type& num_iterations,
        const Array* residual, const Array* residual_norm,
        const Array* solution, const uint8& stopping_id,
        const bool& set_finalized, const stopping_status* status,
        const bool& one_changed, const bool& stopped) const override;

    void on_iteration_complete(const LinOp* solver,
                               const size_type& num_iterations,
                               const Array* residual, const Array* solution,
                               const Array* implicit_sq_residual_norm,
                               const stopping_status* status,
                               const bool& stopped) const override;

    /**
     * Creates a Convergence logger.
     *
     * @param enabled_events  the events enabled for this logger. By default
     *                        the criterion check and iteration complete events
     */
    explicit Convergence(
        const mask_type& enabled_events = Logger::criterion_events_mask |
                                          Logger::iteration_complete_mask)
        : Logger(enabled_events)
    {}

private:
    /**
     * Stores the data of a stopped solve.
     */
    void record(const size_type& num_iterations, const Array* residual,
                const Array* residual_norm,
                const Array* implicit_sq_residual_norm,
                const stopping_status* status, bool stopped) const;

    mutable bool convergence_status_{false};
    mutable size_type num_iterations_{};
    mutable std::unique_ptr<Array> residual_{};
    mutable std::unique_ptr<Array> residual_norm_{};
    mutable std::unique_ptr<Array> implicit_sq_resnorm_{};
};


}  // namespace log
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_LOG_CONVERGENCE_HPP_
