// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/block_operator.hpp>


#include <algorithm>
#include <iterator>
#include <utility>


#include <linden/core/base/exception_helpers.hpp>


#include "core/base/composite_helpers.hpp"


namespace lnd {
namespace {


using block_list = std::vector<std::vector<std::shared_ptr<const LinOp>>>;


size_type find_non_zero_in_row(const block_list& blocks, size_type row)
{
    auto it = std::find_if(blocks[row].begin(), blocks[row].end(),
                           [](const auto& b) { return b.get() != nullptr; });
    LND_THROW_IF_INVALID(it != blocks[row].end(),
                         "Encountered row with only nullptrs.");
    return static_cast<size_type>(std::distance(blocks[row].begin(), it));
}


size_type find_non_zero_in_col(const block_list& blocks, size_type col)
{
    auto it = std::find_if(blocks.begin(), blocks.end(), [col](const auto& b) {
        return b[col].get() != nullptr;
    });
    LND_THROW_IF_INVALID(it != blocks.end(),
                         "Encountered columns with only nullptrs.");
    return static_cast<size_type>(std::distance(blocks.begin(), it));
}


const block_list& validate_blocks(const block_list& blocks)
{
    LND_THROW_IF_INVALID(!blocks.empty() && !blocks.front().empty(),
                         "Blocks must be a non-empty 2D std::vector.");
    // all rows have same number of columns
    for (size_type row = 1; row < blocks.size(); ++row) {
        LND_ASSERT_EQ(blocks[row].size(), blocks.front().size());
    }
    const auto first_col = find_non_zero_in_row(blocks, 0);
    const auto& first = blocks[0][first_col];
    // within each row and each column the blocks have the same number of rows
    // and columns respectively, and all blocks are of the same kind
    for (size_type row = 0; row < blocks.size(); ++row) {
        const auto row_ref = find_non_zero_in_row(blocks, row);
        for (size_type col = 0; col < blocks.front().size(); ++col) {
            const auto col_ref = find_non_zero_in_col(blocks, col);
            const auto& block = blocks[row][col];
            if (!block) {
                continue;
            }
            const auto& in_col = blocks[col_ref][col];
            const auto& in_row = blocks[row][row_ref];
            LND_ASSERT_SIZES_NAMED(
                block->get_size()[1] == in_col->get_size()[1], in_col,
                detail::block_name(col_ref, col), block,
                detail::block_name(row, col),
                "expected matching column length");
            LND_ASSERT_SIZES_NAMED(
                block->get_size()[0] == in_row->get_size()[0], in_row,
                detail::block_name(row, row_ref), block,
                detail::block_name(row, col), "expected matching row length");
            LND_ASSERT_SAME_KIND_NAMED(first, detail::block_name(0, first_col),
                                       block, detail::block_name(row, col));
        }
    }
    return blocks;
}


const LinOp* first_block(const block_list& blocks)
{
    const auto& valid = validate_blocks(blocks);
    return valid[0][find_non_zero_in_row(valid, 0)].get();
}


template <typename Fn>
std::vector<size_type> compute_offsets(size_type num_blocks, Fn&& get_size)
{
    std::vector<size_type> offsets;
    size_type offset = 0;
    for (size_type i = 0; i < num_blocks; ++i) {
        offsets.push_back(offset);
        offset += get_size(i);
    }
    offsets.push_back(offset);
    return offsets;
}


std::vector<size_type> compute_row_offsets(const block_list& blocks)
{
    return compute_offsets(blocks.size(), [&](size_type row) {
        return blocks[row][find_non_zero_in_row(blocks, row)]->get_size()[0];
    });
}


std::vector<size_type> compute_col_offsets(const block_list& blocks)
{
    return compute_offsets(blocks.front().size(), [&](size_type col) {
        return blocks[find_non_zero_in_col(blocks, col)][col]->get_size()[1];
    });
}


dim<2> compute_global_size(const block_list& blocks)
{
    validate_blocks(blocks);
    return {compute_row_offsets(blocks).back(),
            compute_col_offsets(blocks).back()};
}


dtype compute_dtype(const block_list& blocks)
{
    auto type = first_block(blocks)->get_dtype();
    for (const auto& row : blocks) {
        for (const auto& block : row) {
            if (block) {
                type = promote(type, block->get_dtype());
            }
        }
    }
    return type;
}


}  // namespace


std::unique_ptr<BlockOperator> BlockOperator::create(block_list blocks)
{
    return std::unique_ptr<BlockOperator>(new BlockOperator(std::move(blocks)));
}


BlockOperator::BlockOperator(block_list blocks)
    : LinOp(first_block(blocks)->get_executor(), compute_global_size(blocks),
            compute_dtype(blocks), first_block(blocks)->get_eagerness()),
      block_size_(blocks.size(), blocks.front().size()),
      row_offsets_(compute_row_offsets(blocks)),
      col_offsets_(compute_col_offsets(blocks))
{
    for (auto& row : blocks) {
        for (auto& block : row) {
            blocks_.push_back(std::move(block));
        }
    }
}


std::vector<std::shared_ptr<const LinOp>> BlockOperator::get_children() const
{
    std::vector<std::shared_ptr<const LinOp>> children;
    std::copy_if(blocks_.begin(), blocks_.end(), std::back_inserter(children),
                 [](const auto& b) { return b != nullptr; });
    return children;
}


std::unique_ptr<Array> BlockOperator::forward_impl(const Array* x) const
{
    auto block_x = detail::split_array(x, col_offsets_);
    std::vector<std::unique_ptr<Array>> block_y;
    for (size_type row = 0; row < block_size_[0]; ++row) {
        std::unique_ptr<Array> row_result;
        for (size_type col = 0; col < block_size_[1]; ++col) {
            if (!block_at(row, col)) {
                continue;
            }
            auto part = block_at(row, col)->forward(block_x[col]);
            if (row_result) {
                row_result = detail::add_arrays(row_result.get(), part.get());
            } else {
                row_result = std::move(part);
            }
        }
        block_y.push_back(std::move(row_result));
    }
    return detail::concatenate_arrays(this->get_executor(), block_y);
}


std::unique_ptr<Array> BlockOperator::adjoint_impl(const Array* y) const
{
    auto block_y = detail::split_array(y, row_offsets_);
    std::vector<std::unique_ptr<Array>> block_x;
    for (size_type col = 0; col < block_size_[1]; ++col) {
        std::unique_ptr<Array> col_result;
        for (size_type row = 0; row < block_size_[0]; ++row) {
            if (!block_at(row, col)) {
                continue;
            }
            auto part = block_at(row, col)->adjoint(block_y[row]);
            if (col_result) {
                col_result = detail::add_arrays(col_result.get(), part.get());
            } else {
                col_result = std::move(part);
            }
        }
        block_x.push_back(std::move(col_result));
    }
    return detail::concatenate_arrays(this->get_executor(), block_x);
}


std::shared_ptr<const LinOp> vstack(
    std::vector<std::shared_ptr<const LinOp>> operators)
{
    detail::first_operator(operators);
    block_list blocks;
    for (auto& op : operators) {
        blocks.push_back({std::move(op)});
    }
    return BlockOperator::create(std::move(blocks));
}


std::shared_ptr<const LinOp> hstack(
    std::vector<std::shared_ptr<const LinOp>> operators)
{
    detail::first_operator(operators);
    return BlockOperator::create(block_list{std::move(operators)});
}


std::shared_ptr<const LinOp> block_diag(
    std::vector<std::shared_ptr<const LinOp>> operators)
{
    detail::first_operator(operators);
    const auto num_blocks = operators.size();
    block_list blocks(num_blocks,
                      std::vector<std::shared_ptr<const LinOp>>(num_blocks));
    for (size_type i = 0; i < num_blocks; ++i) {
        blocks[i][i] = std::move(operators[i]);
    }
    return BlockOperator::create(std::move(blocks));
}


}  // namespace lnd
