// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_ABSTRACT_FACTORY_HPP_
#define LND_PUBLIC_CORE_BASE_ABSTRACT_FACTORY_HPP_


#include <memory>
#include <type_traits>


#include <linden/core/base/executor.hpp>
#include <linden/core/base/utils.hpp>
#include <linden/core/log/logger.hpp>


namespace lnd {


/**
 * The AbstractFactory is a generic interface template that enables easy
 * implementation of the abstract factory design pattern.
 *
 * The interface provides the AbstractFactory::generate() method that can
 * produce products of type `AbstractProductType` using an object of
 * `ComponentsType` (which can be constructed on the fly from parameters to its
 * constructors).
 * The generate() method is not declared as virtual, as this allows subclasses
 * to hide the method with a variant that preserves the compile-time type of
 * the objects. Instead, implementers should override the generate_impl()
 * method, which is declared virtual.
 *
 * Implementers of concrete factories should consider using the
 * EnableDefaultFactory mixin to obtain default implementations of utility
 * methods of PolymorphicObject and AbstractFactory.
 *
 * @tparam AbstractProductType  the type of products the factory produces
 * @tparam ComponentsType  the type of components the factory needs to produce
 *                         the product
 */
template <typename AbstractProductType, typename ComponentsType>
class AbstractFactory
    : public log::EnableLogging<
          AbstractFactory<AbstractProductType, ComponentsType>> {
public:
    using abstract_product_type = AbstractProductType;
    using components_type = ComponentsType;

    virtual ~AbstractFactory() = default;

    /**
     * Creates a new product from the given components.
     *
     * The method will create an ComponentsType object from the arguments of
     * this method, and pass it to the generate_impl() function which will
     * create a new AbstractProductType.
     *
     * @tparam Args  types of arguments passed to the constructor of
     *               ComponentsType
     *
     * @param args  arguments passed to the constructor of ComponentsType
     *
     * @return an instance of AbstractProductType
     */
    template <typename... Args>
    std::unique_ptr<abstract_product_type> generate(Args&&... args) const
    {
        return this->generate_impl({std::forward<Args>(args)...});
    }

    /**
     * Returns the executor of the products.
     */
    std::shared_ptr<const Executor> get_executor() const noexcept
    {
        return exec_;
    }

protected:
    /**
     * Constructs a new factory on the specified executor.
     *
     * @param exec  the executor where the factory should be constructed
     */
    explicit AbstractFactory(std::shared_ptr<const Executor> exec)
        : exec_{std::move(exec)}
    {}

    /**
     * Constructs a new product from the given components.
     *
     * @param args  the components from which to create the product
     *
     * @return an instance of AbstractProductType
     */
    virtual std::unique_ptr<abstract_product_type> generate_impl(
        components_type args) const = 0;

private:
    std::shared_ptr<const Executor> exec_;
};


/**
 * This mixin provides a default implementation of a concrete factory.
 *
 * It implements the generate_impl() method of the abstract factory, and
 * hides its generate() method with a variant returning the concrete product
 * type.
 *
 * @tparam ConcreteFactory  the concrete factory which is being implemented
 *                          [CRTP parameter]
 * @tparam ProductType  the concrete type of products which this factory
 *                      produces, has to be a subclass of
 *                      PolymorphicBase::abstract_product_type
 * @tparam ParametersType  a type representing the parameters of the factory,
 *                         has to inherit from the
 *                         enable_parameters_type mixin
 * @tparam PolymorphicBase  parent of ConcreteFactory in the polymorphic
 *                          hierarchy, has to be a subclass of
 *                          AbstractFactory
 */
template <typename ConcreteFactory, typename ProductType,
          typename ParametersType, typename PolymorphicBase>
class EnableDefaultFactory : public PolymorphicBase {
public:
    using product_type = ProductType;
    using parameters_type = ParametersType;
    using polymorphic_base = PolymorphicBase;
    using abstract_product_type =
        typename PolymorphicBase::abstract_product_type;
    using components_type = typename PolymorphicBase::components_type;

    template <typename... Args>
    std::unique_ptr<product_type> generate(Args&&... args) const
    {
        auto product =
            this->polymorphic_base::generate(std::forward<Args>(args)...);
        return std::unique_ptr<product_type>(
            static_cast<product_type*>(product.release()));
    }

    /**
     * Returns the parameters of the factory.
     *
     * @return the parameters of the factory
     */
    const parameters_type& get_parameters() const noexcept
    {
        return parameters_;
    };

    /**
     * Creates a new ParametersType object which can be used to instantiate a
     * new ConcreteFactory.
     *
     * This method does not construct the factory directly, but returns a new
     * parameters_type object, which can be used to set the parameters of the
     * factory. Once the parameters have been set, the
     * parameters_type::on() method can be used to obtain an instance
     * of the factory with those parameters.
     *
     * @return a default parameters_type object
     */
    static parameters_type create() { return {}; }

protected:
    /**
     * Creates a new factory using the specified executor and parameters.
     *
     * @param exec  the executor where the factory should be constructed
     * @param parameters  the parameters structure for the factory
     */
    explicit EnableDefaultFactory(std::shared_ptr<const Executor> exec,
                                  const parameters_type& parameters = {})
        : PolymorphicBase(std::move(exec)), parameters_{parameters}
    {}

    std::unique_ptr<abstract_product_type> generate_impl(
        components_type args) const override
    {
        return std::unique_ptr<abstract_product_type>(
            new product_type(self(), args));
    }

private:
    LND_ENABLE_SELF(ConcreteFactory);

    ParametersType parameters_;
};


/**
 * The enable_parameters_type mixin is used to create a base implementation of
 * the factory parameters structure.
 *
 * It provides only the on() method which can be used to instantiate
 * the factory give the parameters stored in the structure.
 *
 * @tparam ConcreteParametersType  the concrete parameters type which is being
 *                                 implemented [CRTP parameter]
 * @tparam Factory  the concrete factory for which these parameters are being
 *                  used
 */
template <typename ConcreteParametersType, typename Factory>
struct enable_parameters_type {
    using factory = Factory;

    /**
     * Creates a new factory on the specified executor.
     *
     * @param exec  the executor where the factory should be created
     *
     * @return a new factory instance
     */
    std::unique_ptr<Factory> on(std::shared_ptr<const Executor> exec) const
    {
        return std::unique_ptr<Factory>(new Factory(exec, *self()));
    }

protected:
    LND_ENABLE_SELF(ConcreteParametersType);
};


/**
 * Creates a scalar factory parameter in the factory parameters structure.
 *
 * @param _name  name of the parameter
 * @param __VA_ARGS__  default value of the parameter
 *
 * @see LND_ENABLE_LIN_OP_FACTORY for more details, and usage example
 */
#define LND_FACTORY_PARAMETER(_name, ...)                                 \
    mutable _name{__VA_ARGS__};                                           \
                                                                          \
    auto with_##_name(const decltype(_name)& value)                       \
        const->const std::decay_t<decltype(*this)>&                       \
    {                                                                     \
        using type = decltype(this->_name);                               \
        this->_name = type{value};                                        \
        return *this;                                                     \
    }                                                                     \
    static_assert(true,                                                   \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


/**
 * Creates a vector factory parameter in the factory parameters structure.
 * The `with_<_name>` method accepts either a vector or the individual
 * entries.
 *
 * @param _name  name of the parameter
 * @param __VA_ARGS__  default value of the parameter
 */
#define LND_FACTORY_PARAMETER_VECTOR(_name, ...)                          \
    mutable _name{__VA_ARGS__};                                           \
                                                                          \
    template <typename... Args>                                           \
    auto with_##_name(Args&&... value)                                    \
        const->const std::decay_t<decltype(*this)>&                       \
    {                                                                     \
        using type = decltype(this->_name);                               \
        this->_name = type{std::forward<Args>(value)...};                 \
        return *this;                                                     \
    }                                                                     \
    static_assert(true,                                                   \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


/**
 * Defines a build method for the factory, simplifying its construction by
 * removing the repetitive typing of factory's name.
 *
 * @param _factory_name  the factory for which to define the method
 */
#define LND_ENABLE_BUILD_METHOD(_factory_name)                               \
    static auto build()->decltype(_factory_name::create())                   \
    {                                                                        \
        return _factory_name::create();                                      \
    }                                                                        \
    static_assert(true,                                                      \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_ABSTRACT_FACTORY_HPP_
