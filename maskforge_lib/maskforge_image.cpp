//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cmath>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "maskforge_log.h"
#include "maskforge_image.h"

LOG_CONTEXT("image", info);

namespace
{
    using namespace maskforge_lib;
    using maskforge_2d::vec2d;

    //////////////////////////////////////////////////////////////////////
    // fillPoly takes fixed point vertices, 8 fractional bits

    int constexpr poly_shift = 8;
    double constexpr poly_scale = 1 << poly_shift;

    // fixed point limit is 2^23 pixels, anything further out is pinned well off the image
    double constexpr poly_limit = 1 << 22;

    //////////////////////////////////////////////////////////////////////
    // a Mat header over the image's own pixels, no copy

    cv::Mat as_mat(gray_image &image)
    {
        return cv::Mat(image.height, image.width, CV_8UC1, image.pixels.data());
    }

    cv::Mat as_mat(gray_image const &image)
    {
        return cv::Mat(image.height, image.width, CV_8UC1, const_cast<uint8_t *>(image.pixels.data()));
    }

    //////////////////////////////////////////////////////////////////////

    gray_image from_mat(cv::Mat const &mat)
    {
        gray_image result(mat.cols, mat.rows);
        cv::Mat target = as_mat(result);
        mat.copyTo(target);
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    cv::Point to_poly_point(vec2d const &p)
    {
        // pixel centres are on the integers for OpenCV
        double x = std::clamp(p.x - 0.5, -poly_limit, poly_limit);
        double y = std::clamp(p.y - 0.5, -poly_limit, poly_limit);
        return cv::Point(static_cast<int>(lround(x * poly_scale)), static_cast<int>(lround(y * poly_scale)));
    }

}    // namespace

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    bool image_size_ok(double width, double height)
    {
        if(!(width >= 1) || !(height >= 1) || width > max_image_side || height > max_image_side) {
            return false;
        }
        return width * height <= static_cast<double>(max_image_pixels);
    }

    //////////////////////////////////////////////////////////////////////

    void fill(gray_image &image, uint8_t value)
    {
        std::fill(image.pixels.begin(), image.pixels.end(), value);
    }

    //////////////////////////////////////////////////////////////////////

    void mirror_horizontal(gray_image &image)
    {
        if(!image.empty()) {
            cv::Mat m = as_mat(image);
            cv::flip(m, m, 1);
        }
    }

    //////////////////////////////////////////////////////////////////////

    void invert(gray_image &image)
    {
        if(!image.empty()) {
            cv::Mat m = as_mat(image);
            cv::bitwise_not(m, m);
        }
    }

    //////////////////////////////////////////////////////////////////////
    // THRESH_BINARY is v > t, one less makes it v >= t

    void threshold(gray_image &image, int threshold_value)
    {
        if(!image.empty()) {
            cv::Mat m = as_mat(image);
            cv::threshold(m, m, threshold_value - 1, 255, cv::THRESH_BINARY);
        }
    }

    //////////////////////////////////////////////////////////////////////

    gray_image crop(gray_image const &image, int x, int y, int w, int h)
    {
        gray_image result(w, h);
        paste(result, image, -x, -y);
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    gray_image center_square_crop(gray_image const &image)
    {
        if(image.width == image.height) {
            return image;
        }
        int side = std::min(image.width, image.height);
        int left = (image.width - side) / 2;
        int top = (image.height - side) / 2;
        return from_mat(as_mat(image)(cv::Rect(left, top, side, side)));
    }

    //////////////////////////////////////////////////////////////////////

    gray_image resize_lanczos(gray_image const &image, int new_width, int new_height)
    {
        if(new_width <= 0 || new_height <= 0 || image.empty()) {
            return gray_image{};
        }

        LOG_DEBUG("resize {} to {}x{}", image, new_width, new_height);

        if(image.width == new_width && image.height == new_height) {
            return image;
        }

        gray_image result(new_width, new_height);
        cv::Mat target = as_mat(result);
        cv::resize(as_mat(image), target, target.size(), 0, 0, cv::INTER_LANCZOS4);
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    gray_image ellipse_mask(int w, int h)
    {
        gray_image mask(w, h, 0);
        if(!mask.empty()) {
            cv::Mat m = as_mat(mask);
            cv::RotatedRect box(cv::Point2f((w - 1) / 2.0f, (h - 1) / 2.0f), cv::Size2f(static_cast<float>(w), static_cast<float>(h)), 0);
            cv::ellipse(m, box, cv::Scalar(255), cv::FILLED, cv::LINE_8);
        }
        return mask;
    }

    //////////////////////////////////////////////////////////////////////

    bool paste(gray_image &dst, gray_image const &src, int x, int y, gray_image const *mask)
    {
        cv::Rect placed(x, y, src.width, src.height);
        cv::Rect visible = placed & cv::Rect(0, 0, dst.width, dst.height);

        bool clipped = visible != placed;

        if(visible.empty()) {
            return clipped;
        }

        cv::Rect from = visible - placed.tl();
        cv::Mat target = as_mat(dst)(visible);

        if(mask != nullptr) {
            as_mat(src)(from).copyTo(target, as_mat(*mask)(from));
        } else {
            as_mat(src)(from).copyTo(target);
        }
        return clipped;
    }

    //////////////////////////////////////////////////////////////////////

    void fill_polygons(gray_image &image, std::vector<std::vector<vec2d>> const &contours, uint8_t value)
    {
        std::vector<std::vector<cv::Point>> polygons;
        polygons.reserve(contours.size());

        for(auto const &contour : contours) {
            if(contour.size() < 3) {
                continue;
            }
            std::vector<cv::Point> &polygon = polygons.emplace_back();
            polygon.reserve(contour.size());
            for(auto const &p : contour) {
                polygon.push_back(to_poly_point(p));
            }
        }

        if(polygons.empty() || image.empty()) {
            return;
        }

        cv::Mat m = as_mat(image);
        cv::fillPoly(m, polygons, cv::Scalar(value), cv::LINE_8, poly_shift);
    }

    //////////////////////////////////////////////////////////////////////

    void fill_polygon(gray_image &image, std::vector<vec2d> const &contour, uint8_t value)
    {
        fill_polygons(image, { contour }, value);
    }

}    // namespace maskforge_lib
