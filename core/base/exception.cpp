// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/exception.hpp>


namespace lnd {


Error::Error(const std::string& file, int line, const std::string& what)
    : what_(file + ":" + std::to_string(line) + ": " + what)
{}


const char* Error::what() const noexcept { return what_.c_str(); }


NotImplemented::NotImplemented(const std::string& file, int line,
                               const std::string& func)
    : Error(file, line, func + " is not implemented")
{}


NotSupported::NotSupported(const std::string& file, int line,
                           const std::string& func, const std::string& obj_type)
    : Error(file, line,
            "Operation " + func + " does not support parameters of type " +
                obj_type)
{}


DimensionMismatch::DimensionMismatch(
    const std::string& file, int line, const std::string& func,
    const std::string& first_name, size_type first_rows, size_type first_cols,
    const std::string& second_name, size_type second_rows,
    size_type second_cols, const std::string& clarification)
    : Error(file, line,
            func + ": attempting to combine operators " + first_name + " [" +
                std::to_string(first_rows) + " x " +
                std::to_string(first_cols) + "] and " + second_name + " [" +
                std::to_string(second_rows) + " x " +
                std::to_string(second_cols) + "]: " + clarification)
{}


BadDimension::BadDimension(const std::string& file, int line,
                           const std::string& func, const std::string& op_name,
                           size_type op_num_rows, size_type op_num_cols,
                           const std::string& clarification)
    : Error(file, line,
            func + ": Object " + op_name + " has dimensions [" +
                std::to_string(op_num_rows) + " x " +
                std::to_string(op_num_cols) + "]: " + clarification)
{}


DtypeMismatch::DtypeMismatch(const std::string& file, int line,
                             const std::string& func,
                             const std::string& first_name,
                             const std::string& first_dtype,
                             const std::string& second_name,
                             const std::string& second_dtype,
                             const std::string& clarification)
    : Error(file, line,
            func + ": attempting to combine " + first_name + " <" +
                first_dtype + "> and " + second_name + " <" + second_dtype +
                ">: " + clarification)
{}


ValueMismatch::ValueMismatch(const std::string& file, int line,
                             const std::string& func, size_type val1,
                             size_type val2, const std::string& clarification)
    : Error(file, line,
            func + ": Value mismatch : " + std::to_string(val1) + " and " +
                std::to_string(val2) + " : " + clarification)
{}


OutOfBoundsError::OutOfBoundsError(const std::string& file, int line,
                                   size_type index, size_type bound)
    : Error(file, line,
            "trying to access index " + std::to_string(index) +
                " in a memory block of " + std::to_string(bound) + " elements")
{}


InvalidStateError::InvalidStateError(const std::string& file, int line,
                                     const std::string& func,
                                     const std::string& clarification)
    : Error(file, line,
            func + ": Invalid state encountered : " + clarification)
{}


BackendExecutionError::BackendExecutionError(const std::string& file, int line,
                                             const std::string& executor,
                                             uint64 node_id,
                                             const std::string& node_label,
                                             const std::string& reason)
    : Error(file, line,
            executor + ": evaluation of node #" + std::to_string(node_id) +
                " (" + node_label + ") failed: " + reason),
      node_id_{node_id},
      node_label_{node_label}
{}


}  // namespace lnd
