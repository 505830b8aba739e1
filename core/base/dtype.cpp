// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/dtype.hpp>


#include <map>
#include <ostream>


#include <linden/core/base/exception_helpers.hpp>


namespace lnd {


std::string to_string(dtype type)
{
    switch (type) {
    case dtype::float32:
        return "float32";
    case dtype::float64:
        return "float64";
    case dtype::complex64:
        return "complex64";
    case dtype::complex128:
        return "complex128";
    }
    return "unknown";
}


dtype dtype_from_string(const std::string& name)
{
    static const std::map<std::string, dtype> names{
        {"float32", dtype::float32},
        {"float64", dtype::float64},
        {"complex64", dtype::complex64},
        {"complex128", dtype::complex128},
        {"float", dtype::float32},
        {"double", dtype::float64},
        {"complex<float>", dtype::complex64},
        {"complex<double>", dtype::complex128}};
    auto it = names.find(name);
    LND_THROW_IF_INVALID(it != names.end(), "unknown dtype " + name);
    return it->second;
}


std::ostream& operator<<(std::ostream& os, dtype type)
{
    return os << to_string(type);
}


}  // namespace lnd
