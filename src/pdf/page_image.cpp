#include "page_image.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <opencv2/imgcodecs.hpp>
#include <vector>

ModelImage encode_jpeg(const cv::Mat& image, int quality) {
    std::vector<uchar> buf;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    if (image.empty() || !cv::imencode(".jpg", image, buf, params)) {
        throw ValidationError("Failed to encode page image");
    }

    ModelImage out;
    out.bytes.assign(reinterpret_cast<const char*>(buf.data()), buf.size());
    out.mime_type = "image/jpeg";
    out.width = image.cols;
    out.height = image.rows;
    return out;
}

ModelImage render_page_for_model(PdfDocument& doc, int page, const PdfConfig& config) {
    RenderRequest req;
    req.dpi = config.model_dpi;
    req.max_dimension = config.model_max_dimension;
    req.max_pixels = MODEL_MAX_PIXELS;
    return encode_jpeg(doc.render_page(page, req), config.model_jpeg_quality);
}
