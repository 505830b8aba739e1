// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_DIM_HPP_
#define LND_PUBLIC_CORE_BASE_DIM_HPP_


#include <iostream>


#include <linden/core/base/types.hpp>


namespace lnd {


/**
 * A type representing the dimensions of a multidimensional object.
 *
 * @tparam Dimensionality  number of dimensions of the object
 * @tparam DimensionType  datatype used to represent each dimension
 */
template <size_type Dimensionality, typename DimensionType = size_type>
struct dim {
    static constexpr size_type dimensionality = Dimensionality;

    using dimension_type = DimensionType;

    /**
     * Creates a dimension object with all dimensions set to the same value.
     *
     * @param size  the size of each dimension
     */
    constexpr dim(const dimension_type& size = dimension_type{})
    {
        for (size_type i = 0; i < dimensionality; ++i) {
            dimensions_[i] = size;
        }
    }

    /**
     * Creates a dimension object with the specified dimensions.
     *
     * @param first  first dimension
     * @param rest  other dimensions
     */
    template <typename... Rest,
              typename = std::enable_if_t<sizeof...(Rest) ==
                                          Dimensionality - 1>>
    constexpr dim(const dimension_type& first, const Rest&... rest)
        : dimensions_{first, static_cast<dimension_type>(rest)...}
    {}

    constexpr const dimension_type& operator[](
        const size_type& dimension) const noexcept
    {
        return dimensions_[dimension];
    }

    dimension_type& operator[](const size_type& dimension) noexcept
    {
        return dimensions_[dimension];
    }

    /**
     * Checks if all dimensions evaluate to true.
     */
    constexpr explicit operator bool() const
    {
        for (size_type i = 0; i < dimensionality; ++i) {
            if (!dimensions_[i]) {
                return false;
            }
        }
        return true;
    }

    friend constexpr bool operator==(const dim& x, const dim& y)
    {
        for (size_type i = 0; i < dimensionality; ++i) {
            if (x.dimensions_[i] != y.dimensions_[i]) {
                return false;
            }
        }
        return true;
    }

    friend constexpr bool operator!=(const dim& x, const dim& y)
    {
        return !(x == y);
    }

    friend std::ostream& operator<<(std::ostream& os, const dim& x)
    {
        os << "(";
        for (size_type i = 0; i < dimensionality; ++i) {
            os << (i == 0 ? "" : ", ") << x.dimensions_[i];
        }
        return os << ")";
    }

private:
    dimension_type dimensions_[dimensionality];
};


/**
 * Returns a dim<2> object with its dimensions swapped.
 *
 * @param dimensions  original object
 *
 * @return a dim<2> object with its dimensions swapped
 */
template <typename DimensionType>
constexpr dim<2, DimensionType> transpose(
    const dim<2, DimensionType>& dimensions) noexcept
{
    return {dimensions[1], dimensions[0]};
}


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_DIM_HPP_
