// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_BLOCK_OPERATOR_HPP_
#define LND_PUBLIC_CORE_BASE_BLOCK_OPERATOR_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/dim.hpp>
#include <linden/core/base/lin_op.hpp>


namespace lnd {


/**
 * A BlockOperator represents a linear operator that is partitioned into
 * multiple blocks.
 *
 * For example, a BlockOperator can be used to define the operator:
 * ```
 * | A   B |
 * | C   D |
 * ```
 * where A, B, C, D itself are matrices of compatible size. This can be
 * created with:
 * ```c++
 * std::shared_ptr<const LinOp> A = ...;
 * std::shared_ptr<const LinOp> B = ...;
 * std::shared_ptr<const LinOp> C = ...;
 * std::shared_ptr<const LinOp> D = ...;
 * auto bop = BlockOperator::create({{A, B}, {C, D}});
 * ```
 * The requirements on the individual blocks passed to the create method are:
 * - In each block-row, all blocks have the same number of rows.
 * - In each block-column, all blocks have the same number of columns.
 * - Each block-row and each block-column has at least one non-null block.
 * Blocks may be null, in which case they are treated as zero operators.
 *
 * The input of the forward map is split along the block-columns, each
 * block-row sums up the results of its blocks, and the results of the
 * block-rows are concatenated. The adjoint map does the same with the roles
 * of rows and columns swapped.
 *
 * The eagerness is taken from the first non-null block.
 *
 * @ingroup LinOp
 */
class BlockOperator : public LinOp {
public:
    /**
     * Create a BlockOperator from a 2D vector of blocks.
     *
     * @param blocks  the blocks, at least one block-row and block-column
     *
     * @throws DimensionMismatch  if blocks in a block-row or block-column
     *                            differ in size
     * @throws DtypeMismatch  if real and complex blocks are mixed
     * @throws InvalidStateError  if a block-row or block-column has no
     *                            non-null block
     */
    static std::unique_ptr<BlockOperator> create(
        std::vector<std::vector<std::shared_ptr<const LinOp>>> blocks);

    /**
     * Get the block dimension of this, i.e. the number of blocks per row and
     * column.
     *
     * @return  The block dimension.
     */
    dim<2> get_block_size() const { return block_size_; }

    /**
     * Const access to a specific block.
     *
     * @param i  block row.
     * @param j  block column.
     *
     * @return  the block stored at (i, j), which may be null.
     */
    const LinOp* block_at(size_type i, size_type j) const
    {
        LND_ENSURE_IN_BOUNDS(i, block_size_[0]);
        LND_ENSURE_IN_BOUNDS(j, block_size_[1]);
        return blocks_[i * block_size_[1] + j].get();
    }

    /**
     * Returns the offsets of the block-rows, followed by the number of rows.
     */
    const std::vector<size_type>& get_row_offsets() const noexcept
    {
        return row_offsets_;
    }

    /**
     * Returns the offsets of the block-columns, followed by the number of
     * columns.
     */
    const std::vector<size_type>& get_col_offsets() const noexcept
    {
        return col_offsets_;
    }

    std::vector<std::shared_ptr<const LinOp>> get_children() const override;

protected:
    explicit BlockOperator(
        std::vector<std::vector<std::shared_ptr<const LinOp>>> blocks);

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::vector<std::shared_ptr<const LinOp>> blocks_;
    dim<2> block_size_;
    std::vector<size_type> row_offsets_;
    std::vector<size_type> col_offsets_;
};


/**
 * Stacks operators with the same number of columns vertically:
 * [A_1; A_2; ...; A_k].
 *
 * @param operators  the operators, at least one
 */
std::shared_ptr<const LinOp> vstack(
    std::vector<std::shared_ptr<const LinOp>> operators);


/**
 * Stacks operators with the same number of rows horizontally:
 * [A_1, A_2, ..., A_k].
 *
 * @param operators  the operators, at least one
 */
std::shared_ptr<const LinOp> hstack(
    std::vector<std::shared_ptr<const LinOp>> operators);


/**
 * Creates the block diagonal operator diag(A_1, ..., A_k). The blocks may be
 * of any size.
 *
 * @param operators  the diagonal blocks, at least one
 */
std::shared_ptr<const LinOp> block_diag(
    std::vector<std::shared_ptr<const LinOp>> operators);


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_BLOCK_OPERATOR_HPP_
