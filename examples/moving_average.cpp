// examples/moving_average.cpp - strided views without copies
// - Moving average of a series via sliding_window_view
// - 2-d local maxima over 3x3 neighbourhoods
// - Outer sum through broadcast_arrays
//
// usage: sv_moving_average [window]   (default 4)

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "sv/all.hpp"

static void print_row(const std::vector<double>& v) {
    for (double x : v) std::cout << std::setw(8) << std::fixed << std::setprecision(2) << x;
    std::cout << "\n";
}

static std::vector<double> moving_average(const sv::ArrayPtr& series, std::size_t w) {
    auto win = sv::sliding_window_view(series, sv::ShapeArg{std::int64_t(w)});
    std::vector<double> out(win->shape()[0], 0.0);
    for (std::size_t i = 0; i < out.size(); ++i) {
        for (std::size_t k = 0; k < w; ++k) out[i] += win->at<double>({i, k});
        out[i] /= double(w);
    }
    return out;
}

int main(int argc, char** argv) {
    const std::size_t window = argc > 1 ? std::size_t(std::strtoul(argv[1], nullptr, 10)) : 4;

    try {
        // ---- 1-d moving average ----
        std::vector<double> prices{10, 11, 13, 12, 15, 18, 17, 16, 19, 22, 21, 24};
        auto series = sv::Array::from_vector(prices, {prices.size()});
        std::cout << "series:\n";
        print_row(prices);
        std::cout << "moving average (window " << window << "):\n";
        print_row(moving_average(series, window));

        // every other window start
        auto strided = sv::sliding_window_view(series, sv::ShapeArg{std::int64_t(window)}, sv::ShapeArg{2});
        std::cout << "windows with step 2: " << sv::detail::shape_str(strided->shape()) << "\n";

        // ---- 3x3 local maxima ----
        const std::size_t H = 5, W = 6;
        std::vector<double> img(H * W);
        for (std::size_t i = 0; i < H; ++i)
            for (std::size_t j = 0; j < W; ++j)
                img[i * W + j] = double((i * 7 + j * 3) % 10);
        auto image = sv::Array::from_vector(img, {H, W});
        auto patches = sv::sliding_window_view(image, sv::ShapeArg{3, 3});
        std::cout << "3x3 maxima " << sv::detail::shape_str(patches->shape()) << ":\n";
        for (std::size_t r = 0; r < patches->shape()[0]; ++r) {
            std::vector<double> row;
            for (std::size_t c = 0; c < patches->shape()[1]; ++c) {
                double m = patches->at<double>({r, c, 0, 0});
                for (std::size_t a = 0; a < 3; ++a)
                    for (std::size_t b = 0; b < 3; ++b) m = std::max(m, patches->at<double>({r, c, a, b}));
                row.push_back(m);
            }
            print_row(row);
        }

        // ---- outer sum ----
        auto col = sv::Array::from_vector(std::vector<double>{0, 10, 20}, {3, 1});
        auto row = sv::Array::from_vector(std::vector<double>{1, 2, 3, 4}, {1, 4});
        auto both = sv::broadcast_arrays({col, row});
        std::cout << "outer sum " << sv::detail::shape_str(both[0]->shape()) << ":\n";
        const auto a = both[0]->to_vector<double>();
        const auto b = both[1]->to_vector<double>();
        for (std::size_t i = 0; i < 3; ++i) {
            std::vector<double> r;
            for (std::size_t j = 0; j < 4; ++j) r.push_back(a[i * 4 + j] + b[i * 4 + j]);
            print_row(r);
        }
    } catch (const sv::Error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
