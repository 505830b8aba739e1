// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_EXCEPTION_HPP_
#define LND_PUBLIC_CORE_BASE_EXCEPTION_HPP_


#include <exception>
#include <string>


#include <linden/core/base/types.hpp>


namespace lnd {


/**
 * The Error class is used to report exceptional behaviour in library
 * functions. Linden uses the C++ exception mechanism to this end, and the
 * Error class represents a base class for all types of errors. The exact list
 * of errors which could occur during the execution of a certain library
 * routine is provided in the documentation of that routine.
 *
 * As an example, applying an operator to a vector of incompatible length will
 * result in a DimensionMismatch error:
 *
 * ```cpp
 * try {
 *     auto y = op->forward(x);
 * } catch (const lnd::DimensionMismatch& err) {
 *     std::cerr << err.what() << std::endl;
 * }
 * ```
 */
class Error : public std::exception {
public:
    /**
     * Initializes an error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param what  The error message
     */
    Error(const std::string& file, int line, const std::string& what);

    /**
     * Returns a human-readable string with a more detailed description of the
     * error.
     */
    const char* what() const noexcept override;

private:
    const std::string what_;
};


/**
 * NotImplemented is thrown in case an operation has not yet
 * been implemented (but will be implemented in the future).
 */
class NotImplemented : public Error {
public:
    /**
     * Initializes a NotImplemented error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param func  The name of the not-yet implemented function
     */
    NotImplemented(const std::string& file, int line, const std::string& func);
};


/**
 * NotSupported is thrown in case it is not possible to
 * perform the requested operation on the given object type.
 */
class NotSupported : public Error {
public:
    /**
     * Initializes a NotSupported error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param func  The name of the function where the error occurred
     * @param obj_type  The object type on which the requested operation
     *                  cannot be performed.
     */
    NotSupported(const std::string& file, int line, const std::string& func,
                 const std::string& obj_type);
};


/**
 * DimensionMismatch is thrown if an operation is being applied to operators
 * or vectors of incompatible size.
 */
class DimensionMismatch : public Error {
public:
    /**
     * Initializes a dimension mismatch error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param func  The function name where the error occurred
     * @param first_name  The name of the first operator
     * @param first_rows  The output dimension of the first operator
     * @param first_cols  The input dimension of the first operator
     * @param second_name  The name of the second operator
     * @param second_rows  The output dimension of the second operator
     * @param second_cols  The input dimension of the second operator
     * @param clarification  An additional message describing the error further
     */
    DimensionMismatch(const std::string& file, int line,
                      const std::string& func, const std::string& first_name,
                      size_type first_rows, size_type first_cols,
                      const std::string& second_name, size_type second_rows,
                      size_type second_cols, const std::string& clarification);
};


/**
 * BadDimension is thrown if an operation is being applied to an operator
 * of incorrect shape.
 */
class BadDimension : public Error {
public:
    /**
     * Initializes a bad dimension error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param func  The function name where the error occurred
     * @param op_name  The name of the operator
     * @param op_num_rows  The row dimension of the operator
     * @param op_num_cols  The column dimension of the operator
     * @param clarification  An additional message further describing the error
     */
    BadDimension(const std::string& file, int line, const std::string& func,
                 const std::string& op_name, size_type op_num_rows,
                 size_type op_num_cols, const std::string& clarification);
};


/**
 * DtypeMismatch is thrown if operators or vectors of numeric types that
 * cannot be reconciled are combined, e.g. a complex vector is passed to a
 * real operator.
 */
class DtypeMismatch : public Error {
public:
    /**
     * Initializes a dtype mismatch error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param func  The function name where the error occurred
     * @param first_name  The name of the first object
     * @param first_dtype  The value type of the first object
     * @param second_name  The name of the second object
     * @param second_dtype  The value type of the second object
     * @param clarification  An additional message further describing the error
     */
    DtypeMismatch(const std::string& file, int line, const std::string& func,
                  const std::string& first_name, const std::string& first_dtype,
                  const std::string& second_name,
                  const std::string& second_dtype,
                  const std::string& clarification);
};


/**
 * ValueMismatch is thrown if two values are not equal.
 */
class ValueMismatch : public Error {
public:
    /**
     * Initializes a value mismatch error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param func  The function name where the error occurred
     * @param val1  The first value to be compared.
     * @param val2  The second value to be compared.
     * @param clarification  An additional message further describing the error
     */
    ValueMismatch(const std::string& file, int line, const std::string& func,
                  size_type val1, size_type val2,
                  const std::string& clarification);
};


/**
 * OutOfBoundsError is thrown if a memory access is detected to be
 * out-of-bounds.
 */
class OutOfBoundsError : public Error {
public:
    /**
     * Initializes an OutOfBoundsError.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param index  The position that was accessed
     * @param bound  The first out-of-bound index
     */
    OutOfBoundsError(const std::string& file, int line, size_type index,
                     size_type bound);
};


/**
 * Exception thrown if an object is in an invalid state.
 */
class InvalidStateError : public Error {
public:
    /**
     * Initializes an invalid state error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param func  The function name where the error occurred
     * @param clarification  A message describing the invalid state
     */
    InvalidStateError(const std::string& file, int line,
                      const std::string& func,
                      const std::string& clarification);
};


/**
 * BackendExecutionError is thrown by an Executor if the evaluation of a node
 * of a deferred computation graph fails.
 *
 * The original exception is attached as a nested exception (see
 * std::throw_with_nested) and can be retrieved with std::rethrow_if_nested.
 */
class BackendExecutionError : public Error {
public:
    /**
     * Initializes a backend execution error.
     *
     * @param file  The name of the offending source file
     * @param line  The source code line number where the error occurred
     * @param executor  The name of the executor running the node
     * @param node_id  The id of the failed node
     * @param node_label  The label of the failed node
     * @param reason  The message of the original failure
     */
    BackendExecutionError(const std::string& file, int line,
                          const std::string& executor, uint64 node_id,
                          const std::string& node_label,
                          const std::string& reason);

    /**
     * Returns the id of the node which failed.
     */
    uint64 get_node_id() const noexcept { return node_id_; }

    /**
     * Returns the label of the node which failed.
     */
    const std::string& get_node_label() const noexcept { return node_label_; }

private:
    uint64 node_id_;
    std::string node_label_;
};


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_EXCEPTION_HPP_
