#include "test_framework.hpp"
#include "sv/core/shape_utils.hpp"
#include "sv/core/errors.hpp"
#include <stdexcept>

using sv::Shape;
using sv::Strides;
namespace d = sv::detail;

TEST("core/shape_utils/numel_and_strides") {
    ASSERT_EQ(d::numel({}), 1u);
    ASSERT_EQ(d::numel({2, 0, 3}), 0u);
    ASSERT_EQ(d::strides_for({2, 3, 4}), (Shape{12, 4, 1}));
    ASSERT_EQ(d::byte_strides_for({2, 3}, 8), (Strides{24, 8}));
    ASSERT_EQ(d::byte_strides_for({}, 8), Strides{});
}

TEST("core/shape_utils/ravel_unravel") {
    ASSERT_EQ(d::unravel_index(7, {2, 4}), (Shape{1, 3}));
    ASSERT_EQ(d::ravel_index({1, 3}, {32, 8}), 56);
    ASSERT_EQ(d::ravel_index({1, 2}, {0, -8}), -16);
}

TEST("core/shape_utils/broadcast_two_rules") {
    ASSERT_EQ(d::broadcast_two({1, 3}, {3, 1}), (Shape{3, 3}));
    ASSERT_EQ(d::broadcast_two({5, 1, 4}, {2, 1}), (Shape{5, 2, 4}));
    ASSERT_EQ(d::broadcast_two({}, {2}), (Shape{2}));
    // a size-1 axis stretches to 0 as well
    ASSERT_EQ(d::broadcast_two({1}, {0}), (Shape{0}));
    ASSERT_EQ(d::broadcast_two({0}, {1}), (Shape{0}));
    ASSERT_THROWS_AS(d::broadcast_two({2}, {3}), sv::BroadcastError);
}

TEST("core/shape_utils/floor_div_rounds_down") {
    ASSERT_EQ(d::floor_div(7, 2), 3);
    ASSERT_EQ(d::floor_div(-1, 2), -1);
    ASSERT_EQ(d::floor_div(-4, 2), -2);
    ASSERT_EQ(d::floor_div(0, 3), 0);
}

TEST("core/shape_utils/shape_str_format") {
    ASSERT_EQ(d::shape_str(Shape{3, 4}), std::string("(3, 4)"));
    ASSERT_EQ(d::shape_str(Shape{3}), std::string("(3,)"));
    ASSERT_EQ(d::shape_str(Shape{}), std::string("()"));
    ASSERT_EQ(d::shape_str(Strides{-8, 0}), std::string("(-8, 0)"));
}

TEST("core/shape_utils/checked_nbytes_detects_overflow") {
    ASSERT_EQ(*d::checked_nbytes({2, 3}, 8), 48u);
    ASSERT_EQ(*d::checked_nbytes({}, 4), 4u);
    // 2^61 * 8 = 2^64
    ASSERT_FALSE(d::checked_nbytes({std::size_t{1} << 61}, 8).has_value());
    // 2^63 is one past PTRDIFF_MAX
    ASSERT_FALSE(d::checked_nbytes({std::size_t{1} << 60}, 8).has_value());
    ASSERT_EQ(*d::checked_nbytes({std::size_t{1} << 62, 0}, 8), 0u);
    ASSERT_EQ(d::nbytes_for({4}, 2), 8u);
    ASSERT_THROWS_AS(d::nbytes_for({std::size_t{1} << 40, std::size_t{1} << 40}, 1), std::length_error);
}
