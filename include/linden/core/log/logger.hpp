// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_LOG_LOGGER_HPP_
#define LND_PUBLIC_CORE_LOG_LOGGER_HPP_


#include <algorithm>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>


#include <linden/core/base/types.hpp>


namespace lnd {


/* Eliminate circular dependencies the hard way */
class Array;
class Executor;
class LinOp;
class LinOpFactory;
class stopping_status;

namespace lazy {
class Node;
}  // namespace lazy

namespace stop {
class Criterion;
}  // namespace stop


namespace log {


/**
 * The Logger class represents a simple Logger object. It comprises all masks
 * and events internally. Every new logging event addition should be done here.
 * The Logger class also provides a default implementation for most events which
 * do nothing, therefore it is not an obligation to change all classes which
 * derive from Logger, although it is good practice.
 * The logger class is built using event masks to control which events should be
 * logged, and which should not.
 *
 * @internal The class uses bitset to facilitate picking a combination of events
 * to log. In addition, the class design allows to not propagate empty messages
 * for events which are not tracked.
 * See #LND_LOGGER_REGISTER_EVENT(_id, _event_name, ...).
 */
class Logger {
public:
    /** @internal std::bitset allows to store any number of bits */
    using mask_type = lnd::uint64;

    /**
     * Maximum amount of events (bits) with the current implementation
     */
    static constexpr size_type event_count_max = sizeof(mask_type) * byte_size;

    /**
     * Bitset Mask which activates all events
     */
    static constexpr mask_type all_events_mask = ~mask_type{0};

    virtual ~Logger() = default;

    /**
     * Helper macro to define functions and masks for each event.
     * A mask named _event_name##_mask is created for each event. `_id` is
     * the number assigned to this event and should be unique.
     *
     * @internal the templated function `on(Params)` will trigger the event
     * call only if the user activates this event through the mask. If the
     * event is activated, we rely on polymorphism and the virtual method
     * `on_##_event_name()` to either call the Logger class's function,
     * which does nothing, or the overriden version in the derived class if
     * any.
     *
     * @param _id  the unique id of the event
     *
     * @param _event_name  the name of the event
     *
     * @param ...  a variable list of arguments representing the event's
     *             arguments
     */
#define LND_LOGGER_REGISTER_EVENT(_id, _event_name, ...)             \
protected:                                                           \
    virtual void on_##_event_name(__VA_ARGS__) const {}              \
                                                                     \
public:                                                              \
    template <size_type Event, typename... Params>                   \
    std::enable_if_t<Event == _id && (_id < event_count_max)> on(    \
        Params&&... params) const                                    \
    {                                                                \
        if (enabled_events_ & (mask_type{1} << _id)) {               \
            this->on_##_event_name(std::forward<Params>(params)...); \
        }                                                            \
    }                                                                \
    static constexpr size_type _event_name{_id};                     \
    static constexpr mask_type _event_name##_mask{mask_type{1} << _id};

    /**
     * LinOp's forward started event.
     *
     * @param op  the operator being applied
     * @param x  the input vector
     */
    LND_LOGGER_REGISTER_EVENT(0, linop_forward_started, const LinOp* op,
                              const Array* x)

    /**
     * LinOp's forward completed event.
     *
     * @param op  the operator which was applied
     * @param x  the input vector
     * @param y  the result (eager or lazy)
     */
    LND_LOGGER_REGISTER_EVENT(1, linop_forward_completed, const LinOp* op,
                              const Array* x, const Array* y)

    /**
     * LinOp's adjoint started event.
     *
     * @param op  the operator being applied
     * @param y  the input vector
     */
    LND_LOGGER_REGISTER_EVENT(2, linop_adjoint_started, const LinOp* op,
                              const Array* y)

    /**
     * LinOp's adjoint completed event.
     *
     * @param op  the operator which was applied
     * @param y  the input vector
     * @param x  the result (eager or lazy)
     */
    LND_LOGGER_REGISTER_EVENT(3, linop_adjoint_completed, const LinOp* op,
                              const Array* y, const Array* x)

    /**
     * Executor's realize started event.
     *
     * @param exec  the executor
     * @param node  the node which is being realized
     * @param num_pending  the number of nodes which need to be evaluated
     */
    LND_LOGGER_REGISTER_EVENT(4, realize_started, const Executor* exec,
                              const lazy::Node* node,
                              const size_type& num_pending)

    /**
     * Executor's realize completed event.
     *
     * @param exec  the executor
     * @param node  the node which was realized
     * @param num_evaluated  the number of nodes which were evaluated
     */
    LND_LOGGER_REGISTER_EVENT(5, realize_completed, const Executor* exec,
                              const lazy::Node* node,
                              const size_type& num_evaluated)

    /**
     * Node evaluation started event.
     *
     * @param exec  the executor
     * @param node  the node which is going to be evaluated
     */
    LND_LOGGER_REGISTER_EVENT(6, node_evaluation_started,
                              const Executor* exec, const lazy::Node* node)

    /**
     * Node evaluation completed event.
     *
     * @param exec  the executor
     * @param node  the node which was evaluated
     */
    LND_LOGGER_REGISTER_EVENT(7, node_evaluation_completed,
                              const Executor* exec, const lazy::Node* node)

    /**
     * Node evaluation failed event.
     *
     * @param exec  the executor
     * @param node  the node whose evaluation failed
     * @param reason  the message of the failure
     */
    LND_LOGGER_REGISTER_EVENT(8, node_evaluation_failed, const Executor* exec,
                              const lazy::Node* node,
                              const std::string& reason)

    /**
     * LinOp Factory's generate started event.
     *
     * @param factory  the factory used
     * @param input  the LinOp object used as input for the generation
     */
    LND_LOGGER_REGISTER_EVENT(9, linop_factory_generate_started,
                              const LinOpFactory* factory,
                              const LinOp* input)

    /**
     * LinOp Factory's generate completed event.
     *
     * @param factory  the factory used
     * @param input  the LinOp object used as input for the generation
     * @param output  the generated LinOp object
     */
    LND_LOGGER_REGISTER_EVENT(10, linop_factory_generate_completed,
                              const LinOpFactory* factory, const LinOp* input,
                              const LinOp* output)

    /**
     * stop::Criterion's check started event.
     *
     * @param criterion  the criterion used
     * @param num_iterations  the number of iterations
     * @param residual  the residual vector (optional)
     * @param residual_norm  the residual norm (optional)
     * @param solution  the current solution (optional)
     * @param stopping_id  the id of the stopping criterion
     * @param set_finalized  whether this finalizes the iteration
     */
    LND_LOGGER_REGISTER_EVENT(11, criterion_check_started,
                              const stop::Criterion* criterion,
                              const size_type& num_iterations,
                              const Array* residual,
                              const Array* residual_norm,
                              const Array* solution, const uint8& stopping_id,
                              const bool& set_finalized)

    /**
     * stop::Criterion's check completed event.
     *
     * @param criterion  the criterion used
     * @param num_iterations  the number of iterations
     * @param residual  the residual vector (optional)
     * @param residual_norm  the residual norm (optional)
     * @param solution  the current solution (optional)
     * @param stopping_id  the id of the stopping criterion
     * @param set_finalized  whether this finalizes the iteration
     * @param status  the stopping status of the right hand side
     * @param one_changed  whether the status changed
     * @param converged  whether the criterion decided to stop
     */
    LND_LOGGER_REGISTER_EVENT(12, criterion_check_completed,
                              const stop::Criterion* criterion,
                              const size_type& num_iterations,
                              const Array* residual,
                              const Array* residual_norm,
                              const Array* solution, const uint8& stopping_id,
                              const bool& set_finalized,
                              const stopping_status* status,
                              const bool& one_changed, const bool& converged)

    /**
     * Register the `iteration_complete` event which logs every completed
     * iterations.
     *
     * @param solver  the solver executing the iteration
     * @param num_iterations  the number of completed iterations
     * @param residual  the residual vector
     * @param solution  the solution vector
     * @param implicit_sq_residual_norm  the implicit squared residual norm
     * @param status  the stopping status of the right hand side
     * @param stopped  whether the solver is going to stop
     */
    LND_LOGGER_REGISTER_EVENT(13, iteration_complete, const LinOp* solver,
                              const size_type& num_iterations,
                              const Array* residual, const Array* solution,
                              const Array* implicit_sq_residual_norm,
                              const stopping_status* status,
                              const bool& stopped)

#undef LND_LOGGER_REGISTER_EVENT

    /**
     * Bitset Mask which activates all linop events
     */
    static constexpr mask_type linop_events_mask =
        linop_forward_started_mask | linop_forward_completed_mask |
        linop_adjoint_started_mask | linop_adjoint_completed_mask;

    /**
     * Bitset Mask which activates all executor events
     */
    static constexpr mask_type executor_events_mask =
        realize_started_mask | realize_completed_mask |
        node_evaluation_started_mask | node_evaluation_completed_mask |
        node_evaluation_failed_mask;

    /**
     * Bitset Mask which activates all linop factory events
     */
    static constexpr mask_type linop_factory_events_mask =
        linop_factory_generate_started_mask |
        linop_factory_generate_completed_mask;

    /**
     * Bitset Mask which activates all criterion events
     */
    static constexpr mask_type criterion_events_mask =
        criterion_check_started_mask | criterion_check_completed_mask;

    /**
     * Returns the mask of the events enabled for this logger.
     */
    mask_type get_mask() const noexcept { return enabled_events_; }

protected:
    /**
     * Constructor for a Logger object.
     *
     * @param enabled_events  the events enabled for this Logger. These can be
     *                        of the following form:
     *                        1. `all_event_mask` which logs every event;
     *                        2. an OR combination of masks, e.g.
     *                           `iteration_complete_mask|realize_started_mask`
     *                           which activates both of these events;
     *                        3. all events with exclusion through XOR, e.g.
     *                           `all_events_mask^linop_events_mask`.
     */
    explicit Logger(const mask_type& enabled_events = all_events_mask)
        : enabled_events_{enabled_events}
    {}

private:
    mask_type enabled_events_;
};


/**
 * Loggable class is an interface which should be implemented by classes wanting
 * to support logging. For most cases, one can rely on the EnableLogging mixin
 * which provides a default implementation of this interface.
 */
class Loggable {
public:
    virtual ~Loggable() = default;

    /**
     * Adds a new logger to the list of subscribed loggers.
     *
     * @param logger  the logger to add
     */
    virtual void add_logger(std::shared_ptr<const Logger> logger) = 0;

    /**
     * Removes a logger from the list of subscribed loggers.
     *
     * @param logger  the logger to remove
     *
     * @note The comparison is done using the logger's object unique identity.
     *       Thus, two loggers constructed in the same way are not considered
     *       equal.
     */
    virtual void remove_logger(const Logger* logger) = 0;

    /**
     * Returns the vector containing all loggers registered at this object.
     */
    virtual const std::vector<std::shared_ptr<const Logger>>& get_loggers()
        const = 0;

    /** Remove all loggers registered at this object. */
    virtual void clear_loggers() = 0;
};


/**
 * EnableLogging is a mixin which should be inherited by any class which wants
 * to enable logging. All the received events are passed to the loggers this
 * class contains.
 *
 * @tparam ConcreteLoggable  the object being logged [CRTP parameter]
 * @tparam PolymorphicBase  the polymorphic base of this class. By default
 *                          it is Loggable. Change it if you want to use a new
 *                          superclass of `Loggable` as polymorphic base of this
 *                          class.
 */
template <typename ConcreteLoggable, typename PolymorphicBase = Loggable>
class EnableLogging : public PolymorphicBase {
public:
    void add_logger(std::shared_ptr<const Logger> logger) override
    {
        loggers_.push_back(logger);
    }

    void remove_logger(const Logger* logger) override
    {
        auto idx =
            find_if(begin(loggers_), end(loggers_),
                    [&logger](const auto& l) { return l.get() == logger; });
        if (idx != end(loggers_)) {
            loggers_.erase(idx);
        }
    }

    const std::vector<std::shared_ptr<const Logger>>& get_loggers()
        const override
    {
        return loggers_;
    }

    void clear_loggers() override { loggers_.clear(); }

protected:
    template <size_type Event, typename... Params>
    void log(Params&&... params) const
    {
        for (auto& logger : loggers_) {
            logger->template on<Event>(std::forward<Params>(params)...);
        }
    }

    std::vector<std::shared_ptr<const Logger>> loggers_;
};


}  // namespace log
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_LOG_LOGGER_HPP_
