// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_CORE_CONFIG_CONFIG_HELPER_HPP_
#define LND_CORE_CONFIG_CONFIG_HELPER_HPP_


#include <complex>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <type_traits>
#include <vector>


#include <linden/core/base/dtype.hpp>
#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/executor.hpp>
#include <linden/core/base/lin_op.hpp>
#include <linden/core/base/math.hpp>
#include <linden/core/config/property_tree.hpp>
#include <linden/core/config/type_descriptor.hpp>
#include <linden/core/stop/criterion.hpp>


namespace lnd {
namespace config {


#define LND_INVALID_CONFIG_VALUE(_entry, _value)                            \
    LND_INVALID_STATE(std::string("The value >" + _value +                  \
                                  "< is invalid for the entry >" + _entry + \
                                  "<"))


#define LND_MISSING_CONFIG_ENTRY(_entry) \
    LND_INVALID_STATE(std::string("The entry >") + _entry + "< is missing")


/**
 * Returns the type descriptor with the value type replaced by the `value_type`
 * entry of config, if there is one.
 */
type_descriptor update_type(const pnode& config, const type_descriptor& td);


/**
 * config_check_decorator records the keys accessed through it and, when it
 * goes out of scope, throws if the config map contains a key which was
 * neither accessed nor explicitly allowed. `type` and `value_type` are always
 * allowed.
 */
class config_check_decorator {
public:
    config_check_decorator(
        const pnode& config,
        const std::set<std::string>& additional_allowed_keys = {});

    ~config_check_decorator() noexcept(false);

    const pnode& get(const std::string& key);

private:
    std::set<std::string> allowed_keys_;
    const pnode& config_;
};


/**
 * get_value gets the corresponding type value from config.
 *
 * This is specialization for bool type
 */
template <typename ValueType>
inline std::enable_if_t<std::is_same<ValueType, bool>::value, bool> get_value(
    const pnode& config)
{
    return config.get_boolean();
}


/**
 * get_value gets the corresponding type value from config.
 *
 * This is specialization for integral type
 */
template <typename IndexType>
inline std::enable_if_t<std::is_integral<IndexType>::value &&
                            !std::is_same<IndexType, bool>::value,
                        IndexType>
get_value(const pnode& config)
{
    auto val = config.get_integer();
    LND_THROW_IF_INVALID(
        (std::is_signed<IndexType>::value || val >= 0) &&
            static_cast<long double>(val) <=
                static_cast<long double>(
                    std::numeric_limits<IndexType>::max()) &&
            static_cast<long double>(val) >=
                static_cast<long double>(
                    std::numeric_limits<IndexType>::min()),
        "the config value is out of the range of the require type.");
    return static_cast<IndexType>(val);
}


/**
 * get_value gets the corresponding type value from config.
 *
 * This is specialization for floating point type. Integer entries are
 * accepted as well.
 */
template <typename ValueType>
inline std::enable_if_t<std::is_floating_point<ValueType>::value, ValueType>
get_value(const pnode& config)
{
    auto val = config.get_tag() == pnode::tag_t::integer
                   ? static_cast<double>(config.get_integer())
                   : config.get_real();
    // the max, min of floating point only consider positive value.
    LND_THROW_IF_INVALID(
        val <= std::numeric_limits<ValueType>::max() &&
            val >= -std::numeric_limits<ValueType>::max(),
        "the config value is out of the range of the require type.");
    return static_cast<ValueType>(val);
}


/**
 * get_value gets the corresponding type value from config.
 *
 * This is specialization for complex type
 */
template <typename ValueType>
inline std::enable_if_t<is_complex<ValueType>(), ValueType> get_value(
    const pnode& config)
{
    using real_type = remove_complex<ValueType>;
    if (config.get_tag() == pnode::tag_t::array) {
        real_type real(0);
        real_type imag(0);
        if (config.get_array().size() >= 1) {
            real = get_value<real_type>(config.get(0));
        }
        if (config.get_array().size() >= 2) {
            imag = get_value<real_type>(config.get(1));
        }
        LND_THROW_IF_INVALID(
            config.get_array().size() <= 2,
            "complex value array expression only accept up to two elements");
        return ValueType{real, imag};
    }
    return static_cast<ValueType>(get_value<real_type>(config));
}


/**
 * Calls `Configurer<ValueType>::parse(config, exec, td)` for the value type
 * named by td.
 */
template <template <typename> class Configurer, typename... Args>
auto dispatch_value_type(const type_descriptor& td, Args&&... args)
    -> decltype(Configurer<double>::parse(std::forward<Args>(args)..., td))
{
    switch (td.get_dtype()) {
    case dtype::float32:
        return Configurer<float>::parse(std::forward<Args>(args)..., td);
    case dtype::float64:
        return Configurer<double>::parse(std::forward<Args>(args)..., td);
    case dtype::complex64:
        return Configurer<std::complex<float>>::parse(
            std::forward<Args>(args)..., td);
    case dtype::complex128:
        return Configurer<std::complex<double>>::parse(
            std::forward<Args>(args)..., td);
    }
    LND_INVALID_CONFIG_VALUE("value_type", td.get_value_typestr());
}


/**
 * Creates a single criterion factory from a criterion map with a `type`.
 */
std::shared_ptr<const stop::CriterionFactory> parse_criterion(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td);


std::shared_ptr<const stop::CriterionFactory> configure_iter(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td);


std::shared_ptr<const stop::CriterionFactory> configure_residual(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td);


std::shared_ptr<const stop::CriterionFactory> configure_implicit_residual(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td);


std::shared_ptr<const stop::CriterionFactory> configure_combined(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td);


std::shared_ptr<LinOpFactory> configure_cg(const pnode& config,
                                           std::shared_ptr<const Executor> exec,
                                           const type_descriptor& td);


std::shared_ptr<LinOpFactory> configure_cgls(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td);


}  // namespace config
}  // namespace lnd


#endif  // LND_CORE_CONFIG_CONFIG_HELPER_HPP_
