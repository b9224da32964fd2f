#include "raster_scorer.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

DensityRasterScorer::DensityRasterScorer(const RasterWeights& weights) : w_(weights) {}

double DensityRasterScorer::score(const cv::Mat& page) const {
    if (page.empty()) return 0.0;

    cv::Mat bgr;
    if (page.channels() == 1) {
        cv::cvtColor(page, bgr, cv::COLOR_GRAY2BGR);
    } else if (page.channels() == 4) {
        cv::cvtColor(page, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = page;
    }
    if (bgr.depth() != CV_8U) {
        bgr.convertTo(bgr, CV_8U);
    }

    const double total = std::max(1.0, static_cast<double>(bgr.rows) * bgr.cols);
    long black = 0;
    long mid = 0;
    long edges = 0;

    for (int y = 0; y < bgr.rows; ++y) {
        const auto* row = bgr.ptr<cv::Vec3b>(y);
        double prev = 255.0;
        for (int x = 0; x < bgr.cols; ++x) {
            const auto& px = row[x];
            double lum = (px[2] * 3.0 + px[1] * 6.0 + px[0]) / 10.0;
            if (lum < w_.black_threshold) black++;
            else if (lum < w_.mid_threshold) mid++;

            if (x > 0 && std::abs(lum - prev) > w_.edge_delta) edges++;
            prev = lum;
        }
    }

    double black_density = black / total;
    double dark_density = (black + mid) / total;
    double mid_density = mid / total;
    double edge_density = edges / total;
    double bimodal = black_density / std::max(1e-6, dark_density);

    return black_density * w_.black_weight + edge_density * w_.edge_weight +
           bimodal * w_.bimodal_weight - mid_density * w_.mid_weight;
}
