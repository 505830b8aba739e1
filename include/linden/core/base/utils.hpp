// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_UTILS_HPP_
#define LND_PUBLIC_CORE_BASE_UTILS_HPP_


#include <memory>
#include <type_traits>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/name_demangling.hpp>


namespace lnd {


/**
 * Marks the object pointed to by `p` as shared.
 *
 * @param p  a pointer to the object. It has to be a unique_ptr or an rvalue
 *
 * @return a shared_ptr that holds the object
 */
template <typename OwningPointer>
inline std::shared_ptr<typename std::remove_cv_t<
    std::remove_reference_t<OwningPointer>>::element_type>
share(OwningPointer&& p)
{
    static_assert(!std::is_lvalue_reference<OwningPointer>::value,
                  "p must be an rvalue or temporary");
    return std::shared_ptr<typename std::remove_cv_t<
        std::remove_reference_t<OwningPointer>>::element_type>(std::move(p));
}


/**
 * This class is used for function parameters in the place of raw pointers.
 * Pointer parameters should be used for everything that does not involve
 * transfer of ownership. It can be converted to from raw pointers,
 * shared pointers and unique pointers of the specified type or any derived
 * type.
 *
 * @tparam T  the type pointed to by this pointer
 */
template <typename T>
class ptr_param {
public:
    /** Initializes the ptr_param from a raw pointer. */
    ptr_param(T* ptr) : ptr_{ptr} {}

    /** Initializes the ptr_param from a shared_ptr. */
    template <typename U,
              std::enable_if_t<std::is_base_of<T, U>::value>* = nullptr>
    ptr_param(const std::shared_ptr<U>& ptr) : ptr_param{ptr.get()}
    {}

    /** Initializes the ptr_param from a unique_ptr. */
    template <typename U, typename Deleter,
              std::enable_if_t<std::is_base_of<T, U>::value>* = nullptr>
    ptr_param(const std::unique_ptr<U, Deleter>& ptr) : ptr_param{ptr.get()}
    {}

    /** Initializes the ptr_param from a ptr_param of a derived type. */
    template <typename U,
              std::enable_if_t<std::is_base_of<T, U>::value>* = nullptr>
    ptr_param(const ptr_param<U>& ptr) : ptr_param{ptr.get()}
    {}

    ptr_param(const ptr_param&) = default;

    ptr_param(ptr_param&&) = default;

    /** @return a reference to the underlying pointee. */
    T& operator*() const { return *ptr_; }

    /** @return the underlying pointer. */
    T* operator->() const { return ptr_; }

    /** @return the underlying pointer. */
    T* get() const { return ptr_; }

    /** @return true iff the underlying pointer is non-null. */
    explicit operator bool() const { return ptr_; }

    ptr_param& operator=(const ptr_param&) = delete;

    ptr_param& operator=(ptr_param&&) = delete;

private:
    T* ptr_;
};


/**
 * Performs polymorphic type conversion.
 *
 * @tparam T  requested result type
 * @tparam U  static type of the passed object
 *
 * @param obj  the object which should be converted
 *
 * @return If successful, returns a pointer to the subtype, otherwise throws
 *         NotSupported.
 */
template <typename T, typename U>
inline std::decay_t<T>* as(U* obj)
{
    if (auto p = dynamic_cast<std::decay_t<T>*>(obj)) {
        return p;
    } else {
        throw NotSupported(__FILE__, __LINE__,
                           std::string{"lnd::as<"} +
                               name_demangling::get_type_name(typeid(T)) + ">",
                           name_demangling::get_type_name(typeid(*obj)));
    }
}

/**
 * @copydoc as(U*)
 *
 * @note This is the version for constant objects.
 */
template <typename T, typename U>
inline const std::decay_t<T>* as(const U* obj)
{
    if (auto p = dynamic_cast<const std::decay_t<T>*>(obj)) {
        return p;
    } else {
        throw NotSupported(__FILE__, __LINE__,
                           std::string{"lnd::as<"} +
                               name_demangling::get_type_name(typeid(T)) + ">",
                           name_demangling::get_type_name(typeid(*obj)));
    }
}


/**
 * @copydoc as(U*)
 *
 * @note This is the version for shared pointers.
 */
template <typename T, typename U>
inline std::shared_ptr<const std::decay_t<T>> as(std::shared_ptr<const U> obj)
{
    auto ptr = std::dynamic_pointer_cast<const std::decay_t<T>>(obj);
    if (ptr) {
        return ptr;
    } else {
        throw NotSupported(__FILE__, __LINE__,
                           std::string{"lnd::as<"} +
                               name_demangling::get_type_name(typeid(T)) + ">",
                           name_demangling::get_type_name(typeid(*obj)));
    }
}


/**
 * This is a mixin which adds a static `create` method to the class, which
 * forwards its arguments to the (usually protected) constructor and wraps the
 * new object in a unique_ptr. The class has to befriend
 * EnableCreateMethod<ConcreteType>.
 *
 * @tparam ConcreteType  the concrete type being created
 */
template <typename ConcreteType>
class EnableCreateMethod {
public:
    /**
     * Creates a new object of ConcreteType.
     */
    template <typename... Args>
    static std::unique_ptr<ConcreteType> create(Args&&... args)
    {
        return std::unique_ptr<ConcreteType>(
            new ConcreteType(std::forward<Args>(args)...));
    }
};


/**
 * Adds the `self()` helper, which returns `this` cast to the concrete type.
 */
#define LND_ENABLE_SELF(_type)                                   \
    _type* self() noexcept { return static_cast<_type*>(this); } \
                                                                 \
    const _type* self() const noexcept                           \
    {                                                            \
        return static_cast<const _type*>(this);                  \
    }


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_UTILS_HPP_
