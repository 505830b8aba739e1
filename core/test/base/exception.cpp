// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/exception.hpp>


#include <string>


#include <gtest/gtest.h>


namespace {


TEST(ExceptionClasses, ErrorReturnsCorrectWhatMessage)
{
    lnd::Error error("test_file.cpp", 1, "test error");
    ASSERT_EQ(std::string("test_file.cpp:1: test error"), error.what());
}


TEST(ExceptionClasses, NotImplementedReturnsCorrectWhatMessage)
{
    lnd::NotImplemented error("test_file.cpp", 25, "test_func");
    ASSERT_EQ(std::string("test_file.cpp:25: test_func is not implemented"),
              error.what());
}


TEST(ExceptionClasses, NotSupportedReturnsCorrectWhatMessage)
{
    lnd::NotSupported error("test_file.cpp", 123, "test_func", "test_obj");
    ASSERT_EQ(
        std::string("test_file.cpp:123: Operation test_func does not support "
                    "parameters of type test_obj"),
        error.what());
}


TEST(ExceptionClasses, DimensionMismatchReturnsCorrectWhatMessage)
{
    lnd::DimensionMismatch error("test_file.cpp", 243, "test_func", "a", 3, 4,
                                 "b", 2, 5, "my_clarify");
    ASSERT_EQ(std::string("test_file.cpp:243: test_func: attempting to "
                          "combine operators a [3 x 4] and b [2 x 5]: "
                          "my_clarify"),
              error.what());
}


TEST(ExceptionClasses, BadDimensionReturnsCorrectWhatMessage)
{
    lnd::BadDimension error("test_file.cpp", 243, "test_func", "a", 3, 4,
                            "my_clarify");
    ASSERT_EQ(std::string("test_file.cpp:243: test_func: Object a has "
                          "dimensions [3 x 4]: my_clarify"),
              error.what());
}


TEST(ExceptionClasses, DtypeMismatchReturnsCorrectWhatMessage)
{
    lnd::DtypeMismatch error("test_file.cpp", 7, "test_func", "op", "float64",
                             "x", "complex128", "my_clarify");
    ASSERT_EQ(std::string("test_file.cpp:7: test_func: attempting to combine "
                          "op <float64> and x <complex128>: my_clarify"),
              error.what());
}


TEST(ExceptionClasses, ValueMismatchReturnsCorrectWhatMessage)
{
    lnd::ValueMismatch error("test_file.cpp", 123, "test_func", 3, 4,
                             "my_clarify");
    ASSERT_EQ(std::string("test_file.cpp:123: test_func: Value mismatch : 3 "
                          "and 4 : my_clarify"),
              error.what());
}


TEST(ExceptionClasses, OutOfBoundsErrorReturnsCorrectWhatMessage)
{
    lnd::OutOfBoundsError error("test_file.cpp", 11, 10, 5);
    ASSERT_EQ(std::string("test_file.cpp:11: trying to access index 10 in a "
                          "memory block of 5 elements"),
              error.what());
}


TEST(ExceptionClasses, InvalidStateErrorReturnsCorrectWhatMessage)
{
    lnd::InvalidStateError error("test_file.cpp", 15, "test_func",
                                 "my_clarify");
    ASSERT_EQ(std::string("test_file.cpp:15: test_func: Invalid state "
                          "encountered : my_clarify"),
              error.what());
}


TEST(ExceptionClasses, BackendExecutionErrorReturnsCorrectWhatMessage)
{
    lnd::BackendExecutionError error("test_file.cpp", 42, "omp", 17, "scale",
                                     "out of memory");
    ASSERT_EQ(std::string("test_file.cpp:42: omp: evaluation of node #17 "
                          "(scale) failed: out of memory"),
              error.what());
    ASSERT_EQ(error.get_node_id(), 17);
    ASSERT_EQ(error.get_node_label(), "scale");
}


}  // namespace
