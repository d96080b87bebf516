#include "test_framework.hpp"
#include "test_helpers.hpp"
#include "sv/ops/broadcast.hpp"
#include "sv/core/config.hpp"
#include "sv/core/errors.hpp"
#include "sv/core/log.hpp"

using sv::ArrayPtr;
using sv::Options;
using sv::Shape;
using sv::Strides;
using sv::broadcast_arrays;
using sv::broadcast_shapes;

TEST("ops/broadcast_shapes/unifies_right_aligned") {
    ASSERT_EQ(broadcast_shapes({{1, 3}, {3, 1}}), (Shape{3, 3}));
    ASSERT_EQ(broadcast_shapes({{6, 7}, {5, 6, 1}, {7}, {5, 1, 7}}), (Shape{5, 6, 7}));
    ASSERT_EQ(broadcast_shapes({{2}}), (Shape{2}));
    ASSERT_EQ(broadcast_shapes({}), Shape{});
    ASSERT_EQ(broadcast_shapes({{}, {}}), Shape{});
    ASSERT_EQ(broadcast_shapes({{1}, {0}}), (Shape{0}));
}

TEST("ops/broadcast_shapes/mismatch_names_both_args") {
    try {
        (void)broadcast_shapes({{1, 3}, {2, 1}, {4, 3}});
        throw tfw::Failure("expected BroadcastError");
    } catch (const sv::BroadcastError& e) {
        ASSERT_EQ(std::string(e.what()),
                  std::string("shape mismatch: objects cannot be broadcast to a single shape.  "
                              "Mismatch is between arg 1 with shape (2, 1) and arg 2 with shape (4, 3)."));
    }
}

TEST("ops/broadcast_shapes/no_argument_limit") {
    std::vector<Shape> shapes(100, Shape{1, 1});
    shapes[37] = {4, 1};
    shapes[99] = {1, 5};
    ASSERT_EQ(broadcast_shapes(shapes), (Shape{4, 5}));
}

TEST("ops/broadcast_shapes/result_must_fit_in_memory") {
    const std::size_t big = std::size_t{1} << 62;
    ASSERT_THROWS_AS(broadcast_shapes({{big}, {4, 1}}), sv::BroadcastError);
    ASSERT_EQ(broadcast_shapes({{big}, {1, 1}}), (Shape{1, big}));
    // each input fits on its own; the common shape (4, 2^62) does not
    auto wide = sv::broadcast_to(sv::Array::from_vector(std::vector<std::uint8_t>{1}, {1}),
                                 sv::ShapeArg{std::int64_t(big)});
    ASSERT_THROWS_AS(broadcast_arrays({svtest::iota({4, 1}), wide}), sv::BroadcastError);
}

TEST("ops/broadcast_arrays/row_and_column") {
    auto a = svtest::iota({1, 3});
    auto b = svtest::iota({3, 1});
    auto out = broadcast_arrays({a, b});
    ASSERT_EQ(out.size(), 2u);
    ASSERT_EQ(out[0]->shape(), (Shape{3, 3}));
    ASSERT_EQ(out[1]->shape(), (Shape{3, 3}));
    ASSERT_EQ(out[0]->strides(), (Strides{0, 8}));
    ASSERT_EQ(out[1]->strides(), (Strides{8, 0}));
    ASSERT_EQ(out[0]->to_vector<std::int64_t>(), (std::vector<std::int64_t>{0, 1, 2, 0, 1, 2, 0, 1, 2}));
    ASSERT_EQ(out[1]->to_vector<std::int64_t>(), (std::vector<std::int64_t>{0, 0, 0, 1, 1, 1, 2, 2, 2}));
    ASSERT_TRUE(out[0]->storage() == a->storage());
    ASSERT_TRUE(out[1]->storage() == b->storage());
}

TEST("ops/broadcast_arrays/same_shape_returns_inputs") {
    auto a = svtest::grid(2, 2);
    auto b = svtest::grid(2, 2);
    auto out = broadcast_arrays({a, b});
    ASSERT_EQ(out.size(), 2u);
    ASSERT_TRUE(out[0] == a);
    ASSERT_TRUE(out[1] == b);
    ASSERT_TRUE(broadcast_arrays({}).empty());
    auto single = broadcast_arrays({a});
    ASSERT_TRUE(single.size() == 1 && single[0] == a);
}

TEST("ops/broadcast_arrays/many_inputs") {
    std::vector<ArrayPtr> in;
    for (int i = 0; i < 70; ++i) in.push_back(svtest::iota({1}));
    in[50] = svtest::iota({4});
    in[69] = svtest::iota({3, 1});
    auto out = broadcast_arrays(in);
    ASSERT_EQ(out.size(), 70u);
    for (const auto& o : out) ASSERT_EQ(o->shape(), (Shape{3, 4}));
    ASSERT_EQ(out[50]->at<std::int64_t>({2, 3}), 3);
    ASSERT_EQ(out[69]->at<std::int64_t>({2, 3}), 2);
}

TEST("ops/broadcast_arrays/incompatible_inputs") {
    auto a = svtest::iota({2});
    auto b = svtest::iota({3});
    ASSERT_THROWS_AS(broadcast_arrays({a, b}), sv::BroadcastError);
    ASSERT_THROWS_AS(broadcast_arrays({a, nullptr}), std::invalid_argument);
}

TEST("ops/broadcast_arrays/results_writable_and_flagged") {
    sv::config::ScopedConfig keep;
    sv::config::set_warn_on_write(true);
    sv::config::set_log_level(sv::config::LogLevel::Warn);

    std::vector<std::string> lines;
    sv::log::ScopedSink capture([&](sv::config::LogLevel lv, const std::string& m) {
        if (lv == sv::config::LogLevel::Warn) lines.push_back(m);
    });

    auto a = svtest::iota({3});
    auto b = svtest::iota({2, 1});
    auto out = broadcast_arrays({a, b});
    ASSERT_TRUE(out[0]->writeable());
    ASSERT_TRUE(out[0]->warn_on_write());
    ASSERT_TRUE(lines.empty());

    out[0]->set<std::int64_t>({1, 2}, 50);
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_TRUE(lines[0].find("(2, 3)") != std::string::npos);
    // the write lands in the shared cell
    ASSERT_EQ(a->at<std::int64_t>({2}), 50);
    ASSERT_EQ(out[0]->at<std::int64_t>({0, 2}), 50);

    // warned once per array
    out[0]->set<std::int64_t>({0, 0}, 9);
    ASSERT_EQ(lines.size(), 1u);
    out[1]->set<std::int64_t>({0, 0}, 9);
    ASSERT_EQ(lines.size(), 2u);
}

TEST("ops/broadcast_arrays/warning_can_be_disabled") {
    sv::config::ScopedConfig keep;
    sv::config::set_warn_on_write(false);
    sv::config::set_log_level(sv::config::LogLevel::Debug);
    int warns = 0;
    sv::log::ScopedSink capture([&](sv::config::LogLevel lv, const std::string&) {
        if (lv == sv::config::LogLevel::Warn) ++warns;
    });
    auto out = broadcast_arrays({svtest::iota({3}), svtest::iota({2, 1})});
    ASSERT_FALSE(out[0]->warn_on_write());
    out[0]->set<std::int64_t>({0, 0}, 1);
    ASSERT_EQ(warns, 0);
}

TEST("ops/broadcast_arrays/readonly_input_stays_readonly") {
    auto a = svtest::iota({3});
    auto ro = sv::broadcast_to(a, sv::ShapeArg{3});
    auto out = broadcast_arrays({ro, svtest::iota({2, 1})});
    ASSERT_FALSE(out[0]->writeable());
    ASSERT_FALSE(out[0]->warn_on_write());
    ASSERT_TRUE(out[1]->writeable());
}

TEST("ops/broadcast_arrays/subtypes_and_options") {
    auto t = svtest::TaggedArray::from(svtest::iota({3}), "t");
    auto plain = broadcast_arrays({t, svtest::iota({2, 1})});
    ASSERT_TRUE(plain[0]->is_base_type());

    auto kept = broadcast_arrays({t, svtest::iota({2, 1})}, Options{{"subok", true}});
    ASSERT_TRUE(svtest::as_tagged(kept[0]) != nullptr);
    ASSERT_EQ(svtest::as_tagged(kept[0])->tag, std::string("t"));

    // same shape with subok keeps the subtype object itself
    auto same = broadcast_arrays({t}, true);
    ASSERT_TRUE(same[0] == t);

    try {
        (void)broadcast_arrays({t}, Options{{"writeable", true}});
        throw tfw::Failure("expected UnexpectedOptionError");
    } catch (const sv::UnexpectedOptionError& e) {
        ASSERT_EQ(std::string(e.what()),
                  std::string("broadcast_arrays() got an unexpected keyword argument 'writeable'"));
    }
}
