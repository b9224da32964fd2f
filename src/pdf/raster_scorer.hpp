#pragma once

#include <core/types.hpp>
#include <opencv2/core.hpp>

// Scores a low-resolution page render for table-like content. Used when the
// text layer is missing or unhelpful.
class RasterPageScorer {
public:
    virtual ~RasterPageScorer() = default;
    virtual double score(const cv::Mat& page) const = 0;
};

// Chart pages are mostly white with dense crisp black text and rules.
// Rewards black-pixel density, horizontal edges and a bimodal (black vs
// grey) distribution; penalizes mid-tone coverage such as photos.
class DensityRasterScorer : public RasterPageScorer {
public:
    explicit DensityRasterScorer(const RasterWeights& weights = RasterWeights{});
    double score(const cv::Mat& page) const override;

private:
    RasterWeights w_;
};
