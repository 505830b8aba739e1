// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_LIN_OP_HPP_
#define LND_PUBLIC_CORE_BASE_LIN_OP_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/abstract_factory.hpp>
#include <linden/core/base/array.hpp>
#include <linden/core/base/dim.hpp>
#include <linden/core/base/dtype.hpp>
#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/executor.hpp>
#include <linden/core/base/types.hpp>
#include <linden/core/base/utils.hpp>
#include <linden/core/log/logger.hpp>


namespace lnd {


/**
 * The eagerness of an operator controls when its results are computed.
 *
 * By default, an operator preserves the kind of its input: an eager input
 * yields an eager result, a lazy input a lazy result. The flags override this
 * per direction:
 *
 * +  `realize_forward` / `realize_adjoint` realize a lazy result before it is
 *    returned,
 * +  `defer_forward_input` / `defer_adjoint_input` turn an eager input into a
 *    lazy one before the operator is applied.
 */
struct eagerness {
    bool realize_forward{false};
    bool realize_adjoint{false};
    bool defer_forward_input{false};
    bool defer_adjoint_input{false};

    /**
     * Returns the eagerness of the adjoint operator, with the forward and
     * adjoint flags swapped.
     */
    eagerness transpose() const noexcept
    {
        return {realize_adjoint, realize_forward, defer_adjoint_input,
                defer_forward_input};
    }

    friend bool operator==(const eagerness& x, const eagerness& y) noexcept
    {
        return x.realize_forward == y.realize_forward &&
               x.realize_adjoint == y.realize_adjoint &&
               x.defer_forward_input == y.defer_forward_input &&
               x.defer_adjoint_input == y.defer_adjoint_input;
    }

    friend bool operator!=(const eagerness& x, const eagerness& y) noexcept
    {
        return !(x == y);
    }
};


/**
 * The LinOp is the operator contract of Linden: an object of shape M x N
 * defining the forward map y = A x and the adjoint map x = A^H y.
 *
 * Operators are immutable after construction and can be applied any number
 * of times, also concurrently. They never modify their input: forward() and
 * adjoint() return new array handles. Whether the result is computed right
 * away or recorded in a deferred graph follows the input (see eagerness).
 *
 * Concrete operators implement forward_impl() and adjoint_impl(); the public
 * forward() and adjoint() validate the input length, apply the eagerness
 * flags and notify the loggers.
 *
 * Linear operators built from other operators (Scaled, Sum, Composition,
 * Adjoint, BlockOperator, ...) keep shared references to their children and
 * define their maps by delegating to them.
 *
 * @ingroup LinOp
 */
class LinOp : public log::EnableLogging<LinOp> {
public:
    virtual ~LinOp() = default;

    LinOp(const LinOp&) = delete;
    LinOp& operator=(const LinOp&) = delete;

    /**
     * Applies the operator to a vector of length N and returns the result
     * of length M.
     *
     * @param x  the input vector
     *
     * @return the result, lazy if x is lazy or defer_forward_input is set,
     *         eager otherwise or if realize_forward is set
     *
     * @throws DimensionMismatch  if x is not of length N
     * @throws DtypeMismatch  if x is complex and the operator is real
     */
    std::unique_ptr<Array> forward(ptr_param<const Array> x) const;

    /**
     * Applies the adjoint of the operator to a vector of length M and returns
     * the result of length N.
     *
     * @param y  the input vector
     *
     * @return the result, lazy if y is lazy or defer_adjoint_input is set,
     *         eager otherwise or if realize_adjoint is set
     *
     * @throws DimensionMismatch  if y is not of length M
     * @throws DtypeMismatch  if y is complex and the operator is real
     */
    std::unique_ptr<Array> adjoint(ptr_param<const Array> y) const;

    /**
     * Returns the size of the operator: (M, N) for an operator mapping
     * vectors of length N to vectors of length M.
     */
    const dim<2>& get_size() const noexcept { return size_; }

    /**
     * Returns the value type of the operator.
     */
    dtype get_dtype() const noexcept { return dtype_; }

    /**
     * Returns the eagerness flags of the operator.
     */
    const eagerness& get_eagerness() const noexcept { return eagerness_; }

    /**
     * Returns the executor of the operator.
     */
    std::shared_ptr<const Executor> get_executor() const noexcept
    {
        return exec_;
    }

    /**
     * Returns the operators this operator is built from. Primitive operators
     * have no children.
     */
    virtual std::vector<std::shared_ptr<const LinOp>> get_children() const
    {
        return {};
    }

protected:
    /**
     * Creates a linear operator.
     *
     * @param exec  the executor of the operator
     * @param size  the size of the operator
     * @param type  the value type of the operator
     * @param flags  the eagerness of the operator
     */
    LinOp(std::shared_ptr<const Executor> exec, const dim<2>& size,
          dtype type, const eagerness& flags = {});

    /**
     * Implementers of LinOp should override this function instead of
     * forward(const Array*).
     *
     * Performs the forward map. The length of `x` was already checked.
     */
    virtual std::unique_ptr<Array> forward_impl(const Array* x) const = 0;

    /**
     * Implementers of LinOp should override this function instead of
     * adjoint(const Array*).
     *
     * Performs the adjoint map. The length of `y` was already checked.
     */
    virtual std::unique_ptr<Array> adjoint_impl(const Array* y) const = 0;

    /**
     * Applies the forward map of `op` without realizing the result, even if
     * `op` has realize_forward set.
     */
    static std::unique_ptr<Array> forward_deferred(const LinOp* op,
                                                   const Array* x);

    /**
     * Applies the adjoint map of `op` without realizing the result, even if
     * `op` has realize_adjoint set.
     */
    static std::unique_ptr<Array> adjoint_deferred(const LinOp* op,
                                                   const Array* y);

    /**
     * Throws a DimensionMismatch if x cannot be passed to forward.
     */
    void validate_forward_parameters(const Array* x) const;

    /**
     * Throws a DimensionMismatch if y cannot be passed to adjoint.
     */
    void validate_adjoint_parameters(const Array* y) const;

private:
    std::unique_ptr<Array> apply_forward(const Array* x, bool realize) const;

    std::unique_ptr<Array> apply_adjoint(const Array* y, bool realize) const;

    std::shared_ptr<const Executor> exec_;
    dim<2> size_;
    dtype dtype_;
    eagerness eagerness_;
};


/**
 * A LinOpFactory represents a higher order mapping which transforms one
 * linear operator into another.
 *
 * In Linden, every iterative solver is a LinOpFactory: the factory holds the
 * solver parameters, and generating it on a system operator A yields the
 * solver, a LinOp approximating the (pseudo-)inverse of A:
 *
 * ```cpp
 * auto solver = lnd::solver::Cgls<double>::build()
 *                   .with_criteria(lnd::stop::Iteration::build()
 *                                      .with_max_iters(50u)
 *                                      .on(exec))
 *                   .on(exec)
 *                   ->generate(A);
 * ```
 *
 * @ingroup LinOp
 */
class LinOpFactory
    : public AbstractFactory<LinOp, std::shared_ptr<const LinOp>> {
public:
    using AbstractFactory<LinOp, std::shared_ptr<const LinOp>>::AbstractFactory;

    std::unique_ptr<LinOp> generate(std::shared_ptr<const LinOp> input) const
    {
        this->template log<log::Logger::linop_factory_generate_started>(
            this, input.get());
        auto generated = AbstractFactory::generate(input);
        this->template log<log::Logger::linop_factory_generate_completed>(
            this, input.get(), generated.get());
        return generated;
    }
};


/**
 * This is an alias for the EnableDefaultFactory mixin, which correctly sets
 * the template parameters to enable a subclass of LinOpFactory.
 *
 * @tparam ConcreteFactory  the concrete factory which is being implemented
 *                          [CRTP parameter]
 * @tparam ConcreteLinOp  the concrete LinOp type which this factory produces,
 *                        needs to have a constructor which takes a
 *                        const ConcreteFactory *, and an
 *                        std::shared_ptr<const LinOp> as parameters.
 * @tparam ParametersType  a subclass of enable_parameters_type template which
 *                         defines all of the parameters of the factory
 *
 * @ingroup LinOp
 */
template <typename ConcreteFactory, typename ConcreteLinOp,
          typename ParametersType>
using EnableDefaultLinOpFactory =
    EnableDefaultFactory<ConcreteFactory, ConcreteLinOp, ParametersType,
                         LinOpFactory>;


/**
 * This macro will generate a default implementation of a LinOpFactory for the
 * LinOp subclass it is defined in.
 *
 * It is required to first call the macro #LND_CREATE_FACTORY_PARAMETERS()
 * before this one in order to instantiate the parameters type first.
 *
 * The list of parameters for the factory should be defined in a code block
 * after the macro definition, and should contain a list of
 * LND_FACTORY_PARAMETER_* declarations. The class should provide a constructor
 * with signature
 * _lin_op(const _factory_name *, std::shared_ptr<const LinOp>)
 * which the factory will use a callback to construct the object.
 *
 * A minimal example of a linear operator is the following:
 *
 * ```c++
 * struct MyLinOp : public LinOp {
 *     LND_CREATE_FACTORY_PARAMETERS(parameters, Factory)
 *     {
 *         // a factory parameter named "my_value", of type int and default
 *         // value of 5
 *         int LND_FACTORY_PARAMETER(my_value, 5);
 *     };
 *     LND_ENABLE_LIN_OP_FACTORY(MyLinOp, parameters, Factory);
 *     LND_ENABLE_BUILD_METHOD(Factory);
 * };
 * ```
 *
 * @param _lin_op  concrete operator for which the factory is to be created
 *                 [CRTP parameter]
 * @param _parameters_name  name of the parameters member in the class
 *                          (its type is `<_parameters_name>_type`, the
 *                          protected member's name is `<_parameters_name>_`,
 *                          and the public getter's name is
 *                          `get_<_parameters_name>()`)
 * @param _factory_name  name of the generated factory type
 *
 * @ingroup LinOp
 */
#define LND_ENABLE_LIN_OP_FACTORY(_lin_op, _parameters_name, _factory_name)  \
public:                                                                      \
    const _parameters_name##_type& get_##_parameters_name() const            \
    {                                                                        \
        return _parameters_name##_;                                          \
    }                                                                        \
                                                                             \
    class _factory_name                                                      \
        : public ::lnd::EnableDefaultLinOpFactory<_factory_name, _lin_op,    \
                                                  _parameters_name##_type> { \
        friend struct ::lnd::enable_parameters_type<_parameters_name##_type, \
                                                    _factory_name>;          \
        using ::lnd::EnableDefaultLinOpFactory<                              \
            _factory_name, _lin_op,                                          \
            _parameters_name##_type>::EnableDefaultLinOpFactory;             \
    };                                                                       \
    friend ::lnd::EnableDefaultLinOpFactory<_factory_name, _lin_op,          \
                                            _parameters_name##_type>;        \
                                                                             \
protected:                                                                   \
    _parameters_name##_type _parameters_name##_;                             \
                                                                             \
public:                                                                      \
    static_assert(true,                                                      \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


/**
 * This macro will generate the parameters type of a factory. It has to be
 * followed by the body of the structure, containing LND_FACTORY_PARAMETER
 * declarations.
 *
 * @param _parameters_name  name of the parameters member in the class
 * @param _factory_name  name of the generated factory type
 *
 * @ingroup LinOp
 */
#define LND_CREATE_FACTORY_PARAMETERS(_parameters_name, _factory_name)   \
public:                                                                  \
    class _factory_name;                                                 \
    struct _parameters_name##_type                                       \
        : public ::lnd::enable_parameters_type<_parameters_name##_type, \
                                               _factory_name>


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_LIN_OP_HPP_
