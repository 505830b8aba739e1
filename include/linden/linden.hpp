// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_LINDEN_HPP_
#define LND_LINDEN_HPP_


#include <linden/core/base/abstract_factory.hpp>
#include <linden/core/base/adjoint.hpp>
#include <linden/core/base/array.hpp>
#include <linden/core/base/block_operator.hpp>
#include <linden/core/base/composition.hpp>
#include <linden/core/base/conjugate.hpp>
#include <linden/core/base/dim.hpp>
#include <linden/core/base/dtype.hpp>
#include <linden/core/base/exception.hpp>
#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/executor.hpp>
#include <linden/core/base/lin_op.hpp>
#include <linden/core/base/math.hpp>
#include <linden/core/base/name_demangling.hpp>
#include <linden/core/base/power.hpp>
#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/base/scaled.hpp>
#include <linden/core/base/sum.hpp>
#include <linden/core/base/types.hpp>
#include <linden/core/base/utils.hpp>
#include <linden/core/base/vector.hpp>
#include <linden/core/config/config.hpp>
#include <linden/core/config/property_tree.hpp>
#include <linden/core/config/type_descriptor.hpp>
#include <linden/core/lazy/node.hpp>
#include <linden/core/log/convergence.hpp>
#include <linden/core/log/logger.hpp>
#include <linden/core/log/stream.hpp>
#include <linden/core/matrix/dense.hpp>
#include <linden/core/matrix/diagonal.hpp>
#include <linden/core/matrix/function.hpp>
#include <linden/core/matrix/identity.hpp>
#include <linden/core/matrix/zero.hpp>
#include <linden/core/solver/cg.hpp>
#include <linden/core/solver/cgls.hpp>
#include <linden/core/solver/solver_base.hpp>
#include <linden/core/stop/combined.hpp>
#include <linden/core/stop/criterion.hpp>
#include <linden/core/stop/iteration.hpp>
#include <linden/core/stop/residual_norm.hpp>
#include <linden/core/stop/stopping_status.hpp>


#endif  // LND_LINDEN_HPP_
