// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/config/property_tree.hpp>


#include <cstdint>
#include <stdexcept>
#include <string>


#include <gtest/gtest.h>


#include <linden/core/base/exception.hpp>


using namespace lnd::config;


void assert_others_throw(const pnode& node)
{
    auto tag = node.get_tag();
    if (tag != pnode::tag_t::array) {
        ASSERT_THROW(node.get_array(), lnd::InvalidStateError);
        ASSERT_THROW(node.get(0), lnd::InvalidStateError);
    }
    if (tag != pnode::tag_t::map) {
        ASSERT_THROW(node.get_map(), lnd::InvalidStateError);
        ASSERT_THROW(node.get("random"), lnd::InvalidStateError);
    }
    if (tag != pnode::tag_t::boolean) {
        ASSERT_THROW(node.get_boolean(), lnd::InvalidStateError);
    }
    if (tag != pnode::tag_t::integer) {
        ASSERT_THROW(node.get_integer(), lnd::InvalidStateError);
    }
    if (tag != pnode::tag_t::real) {
        ASSERT_THROW(node.get_real(), lnd::InvalidStateError);
    }
    if (tag != pnode::tag_t::string) {
        ASSERT_THROW(node.get_string(), lnd::InvalidStateError);
    }
}


TEST(PropertyTree, CreateEmpty)
{
    pnode root;

    ASSERT_EQ(root.get_tag(), pnode::tag_t::empty);
    assert_others_throw(root);
}


TEST(PropertyTree, CreateStringData)
{
    pnode str(std::string("cgls"));
    pnode char_str("cgls");

    ASSERT_EQ(str.get_tag(), pnode::tag_t::string);
    ASSERT_EQ(str.get_string(), "cgls");
    assert_others_throw(str);
    ASSERT_EQ(char_str, str);
}


TEST(PropertyTree, CreateBoolData)
{
    pnode boolean(true);

    ASSERT_EQ(boolean.get_tag(), pnode::tag_t::boolean);
    ASSERT_TRUE(boolean.get_boolean());
    assert_others_throw(boolean);
}


TEST(PropertyTree, CreateIntegerData)
{
    pnode integer(50);
    pnode integer_u32(std::uint32_t(50));
    pnode integer_64(std::int64_t(50));

    for (auto& node : {integer, integer_u32, integer_64}) {
        ASSERT_EQ(node.get_tag(), pnode::tag_t::integer);
        ASSERT_EQ(node.get_integer(), 50);
        assert_others_throw(node);
    }
}


TEST(PropertyTree, CreateRealData)
{
    pnode real(1e-8);
    pnode real_float(float(0.5));

    ASSERT_EQ(real.get_tag(), pnode::tag_t::real);
    ASSERT_EQ(real.get_real(), 1e-8);
    ASSERT_EQ(real_float.get_real(), 0.5);
    assert_others_throw(real);
}


TEST(PropertyTree, CreateMap)
{
    pnode root({{"type", pnode{"solver::Cgls"}},
                {"damping", pnode{0.5}},
                {"criteria",
                 pnode{pnode::map_type{{"iteration", pnode{50}}}}}});

    ASSERT_EQ(root.get_tag(), pnode::tag_t::map);
    ASSERT_EQ(root.get("type").get_string(), "solver::Cgls");
    ASSERT_EQ(root.get("damping").get_real(), 0.5);
    ASSERT_EQ(root.get("criteria").get("iteration").get_integer(), 50);
    assert_others_throw(root);
}


TEST(PropertyTree, CreateArray)
{
    pnode root(pnode::array_type{pnode{"reference"}, pnode{"omp"}});

    ASSERT_EQ(root.get_tag(), pnode::tag_t::array);
    ASSERT_EQ(root.get(0).get_string(), "reference");
    ASSERT_EQ(root.get(1).get_string(), "omp");
    ASSERT_THROW(root.get(2), std::out_of_range);
    ASSERT_EQ(root.get_array().size(), 2);
    assert_others_throw(root);
}


TEST(PropertyTree, ConversionToBool)
{
    pnode empty;
    pnode non_empty{"test"};

    ASSERT_FALSE(empty);
    ASSERT_TRUE(non_empty);
}


TEST(PropertyTree, ReturnsEmptyIfNotFound)
{
    pnode ptree(pnode::map_type{{"max_iters", pnode{2}}});

    auto obj = ptree.get("na");

    ASSERT_EQ(obj.get_tag(), pnode::tag_t::empty);
}


TEST(PropertyTree, UseInCondition)
{
    pnode ptree(pnode::map_type{{"max_iters", pnode{2}}});
    int first = 0;
    int second = 0;

    if (auto& obj = ptree.get("max_iters")) {
        first = static_cast<int>(obj.get_integer());
    }
    if (auto& obj = ptree.get("na")) {
        second = -1;
    } else {
        second = 1;
    }

    ASSERT_EQ(first, 2);
    ASSERT_EQ(second, 1);
}


TEST(PropertyTree, ComparesByTagAndContent)
{
    ASSERT_EQ(pnode{}, pnode{});
    ASSERT_NE(pnode{1}, pnode{1.0});
    ASSERT_NE(pnode{"1"}, pnode{1});
    ASSERT_EQ(pnode(pnode::array_type{pnode{1}, pnode{true}}),
              pnode(pnode::array_type{pnode{1}, pnode{true}}));
    ASSERT_NE(pnode(pnode::map_type{{"a", pnode{1}}}),
              pnode(pnode::map_type{{"a", pnode{2}}}));
}
