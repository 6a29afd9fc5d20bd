#include "paddle_utils.hpp"
#include "clipper2/clipper.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace PaddleUtils {

    std::pair<cv::Mat, float> ResizeKeepRatio(const cv::Mat& img, int max_side) {
        int h = img.rows;
        int w = img.cols;
        float scale = 1.0f;
        if (std::max(h, w) > max_side) {
            scale = static_cast<float>(max_side) / static_cast<float>(std::max(h, w));
        }

        int new_h = static_cast<int>(h * scale);
        int new_w = static_cast<int>(w * scale);

        // The detector downsamples by 32.
        if (new_h % 32 != 0) new_h = (new_h / 32 + 1) * 32;
        if (new_w % 32 != 0) new_w = (new_w / 32 + 1) * 32;

        cv::Mat resized;
        cv::resize(img, resized, cv::Size(new_w, new_h));
        return {resized, scale};
    }

    cv::Mat NormalizeImageNet(const cv::Mat& img) {
        // Input is already scaled to [0, 1].
        cv::Mat float_img;
        img.convertTo(float_img, CV_32FC3);
        cv::Mat mean(float_img.size(), CV_32FC3, cv::Scalar(0.485, 0.456, 0.406));
        cv::Mat std(float_img.size(), CV_32FC3, cv::Scalar(0.229, 0.224, 0.225));
        cv::subtract(float_img, mean, float_img);
        cv::divide(float_img, std, float_img);
        return cv::dnn::blobFromImage(float_img);
    }

    double PathPerimeter(const Clipper2Lib::Path64& path) {
        double perimeter = 0.0;
        if (path.size() < 2) return 0.0;
        for (size_t i = 0; i < path.size(); ++i) {
            const auto& p1 = path[i];
            const auto& p2 = path[(i + 1) % path.size()];
            perimeter += std::hypot(static_cast<double>(p2.x - p1.x), static_cast<double>(p2.y - p1.y));
        }
        return perimeter;
    }

    // Grows a shrunk text kernel back to the full word extent.
    std::vector<cv::Point2f> Unclip(const std::vector<cv::Point2f>& box, float ratio) {
        Clipper2Lib::Path64 path;
        for (const auto& p : box) {
            path.push_back(Clipper2Lib::Point64(p.x, p.y));
        }

        double area = std::abs(Clipper2Lib::Area(path));
        double length = PathPerimeter(path);
        if (length == 0) return box;

        double distance = area * ratio / length;
        Clipper2Lib::Paths64 solution;
        Clipper2Lib::ClipperOffset offset;
        offset.AddPath(path, Clipper2Lib::JoinType::Round, Clipper2Lib::EndType::Polygon);
        offset.Execute(distance, solution);

        if (solution.empty() || solution[0].empty()) {
            return box;
        }

        std::vector<cv::Point> contour;
        for (const Clipper2Lib::Point64& p : solution[0]) {
            contour.push_back(cv::Point(static_cast<int>(p.x), static_cast<int>(p.y)));
        }
        cv::RotatedRect rect = cv::minAreaRect(contour);
        cv::Point2f points[4];
        rect.points(points);
        return {points[0], points[1], points[2], points[3]};
    }

    float BoxScore(const cv::Mat& prob_map, const std::vector<cv::Point2f>& box) {
        std::vector<cv::Point> int_box;
        for (const auto& p : box) int_box.push_back(cv::Point(p.x, p.y));

        cv::Mat mask = cv::Mat::zeros(prob_map.rows, prob_map.cols, CV_8U);
        cv::fillPoly(mask, std::vector<std::vector<cv::Point>>{int_box}, 1);
        return cv::mean(prob_map, mask)[0];
    }

    std::vector<cv::Point2f> QuadFromContour(const std::vector<cv::Point>& contour) {
        cv::RotatedRect rect = cv::minAreaRect(contour);
        cv::Point2f points[4];
        rect.points(points);
        return {points[0], points[1], points[2], points[3]};
    }

    std::vector<WordBox> PostprocessDetection(const float* prob_map, const cv::Size& original_shape, const cv::Size& resized_shape, float scale) {
        cv::Mat prob_mat(resized_shape.height, resized_shape.width, CV_32F, const_cast<float*>(prob_map));
        cv::Mat bitmap = prob_mat > 0.3;

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(bitmap, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

        std::vector<WordBox> boxes;
        for (const auto& contour : contours) {
            if (contour.size() < 4) continue;

            std::vector<cv::Point2f> box_f = QuadFromContour(contour);
            if (BoxScore(prob_mat, box_f) < 0.6) continue;

            std::vector<cv::Point2f> unclipped_box_f = Unclip(box_f, 1.5);

            WordBox final_box;
            for (auto& p : unclipped_box_f) {
                p.x /= scale;
                p.y /= scale;
                p.x = std::min(std::max(0.0f, p.x), static_cast<float>(original_shape.width - 1));
                p.y = std::min(std::max(0.0f, p.y), static_cast<float>(original_shape.height - 1));
                final_box.push_back(cv::Point(p.x, p.y));
            }

            if (cv::contourArea(final_box) < 80) continue;

            boxes.push_back(final_box);
        }
        std::sort(boxes.begin(), boxes.end(), [](const WordBox& a, const WordBox& b) {
            return a[0].y < b[0].y;
        });
        return boxes;
    }

    std::vector<LineBoxes> GroupTextLines(const std::vector<WordBox>& boxes) {
        struct Entry {
            cv::Rect rect;
            const WordBox* box;
        };
        std::vector<Entry> entries;
        for (const auto& box : boxes) {
            if (box.empty()) continue;
            entries.push_back({cv::boundingRect(box), &box});
        }
        std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
            return a.rect.y + a.rect.height / 2 < b.rect.y + b.rect.height / 2;
        });

        std::vector<std::vector<Entry>> rows;
        int row_top = 0;
        int row_bottom = 0;
        for (const auto& entry : entries) {
            if (!rows.empty()) {
                int overlap = std::min(row_bottom, entry.rect.y + entry.rect.height) - std::max(row_top, entry.rect.y);
                int min_height = std::min(row_bottom - row_top, entry.rect.height);
                if (overlap * 2 >= min_height) {
                    rows.back().push_back(entry);
                    row_top = std::min(row_top, entry.rect.y);
                    row_bottom = std::max(row_bottom, entry.rect.y + entry.rect.height);
                    continue;
                }
            }
            rows.push_back({entry});
            row_top = entry.rect.y;
            row_bottom = entry.rect.y + entry.rect.height;
        }

        std::vector<LineBoxes> lines;
        for (auto& row : rows) {
            std::sort(row.begin(), row.end(), [](const Entry& a, const Entry& b) {
                return a.rect.x < b.rect.x;
            });
            LineBoxes line;
            for (const auto& entry : row) line.push_back(*entry.box);
            lines.push_back(line);
        }
        return lines;
    }

    cv::Mat WarpQuad(const cv::Mat& image, const WordBox& quad) {
        if (quad.size() != 4) return cv::Mat();
        std::vector<cv::Point2f> quad_f;
        for (const auto& p : quad) quad_f.push_back(cv::Point2f(p.x, p.y));

        float w = std::max(cv::norm(quad_f[0] - quad_f[1]), cv::norm(quad_f[2] - quad_f[3]));
        float h = std::max(cv::norm(quad_f[0] - quad_f[3]), cv::norm(quad_f[1] - quad_f[2]));
        if (w < 1 || h < 1) return cv::Mat();

        std::vector<cv::Point2f> dst_pts = {{0, 0}, {w, 0}, {w, h}, {0, h}};
        cv::Mat M = cv::getPerspectiveTransform(quad_f, dst_pts);

        cv::Mat crop;
        cv::warpPerspective(image, crop, M, cv::Size(static_cast<int>(w), static_cast<int>(h)), cv::INTER_CUBIC, cv::BORDER_REPLICATE);

        // Vertical text is read rotated.
        if (crop.rows > 0 && crop.cols > 0 && (static_cast<float>(crop.rows) / crop.cols >= 1.5)) {
            cv::rotate(crop, crop, cv::ROTATE_90_COUNTERCLOCKWISE);
        }
        return crop;
    }

    std::vector<cv::Mat> SplitWideCrop(const cv::Mat& crop, int chunk_width, int overlap) {
        if (crop.cols <= chunk_width) return {crop};
        std::vector<cv::Mat> chunks;
        for (int start = 0; start < crop.cols; start += (chunk_width - overlap)) {
            int end = std::min(start + chunk_width, crop.cols);
            chunks.push_back(crop(cv::Rect(start, 0, end - start, crop.rows)).clone());
            if (end == crop.cols) break;
        }
        return chunks;
    }

    cv::Mat PreprocessRecognition(const cv::Mat& img) {
        if (img.empty()) return cv::Mat();

        const int rec_h = 48;
        const int rec_w = 320;

        cv::Mat src = img;
        if (src.channels() == 1) {
            cv::cvtColor(src, src, cv::COLOR_GRAY2RGB);
        }

        const float ratio = static_cast<float>(src.cols) / static_cast<float>(src.rows);
        int resized_w = static_cast<int>(std::ceil(rec_h * ratio));
        if (resized_w <= 0) return cv::Mat();

        cv::Mat resized;
        cv::resize(src, resized, cv::Size(resized_w, rec_h), 0, 0, cv::INTER_LINEAR);

        cv::Mat norm_img;
        if (resized.depth() == CV_8U) {
            resized.convertTo(norm_img, CV_32FC3, 1.0 / 255.0);
        } else {
            resized.convertTo(norm_img, CV_32FC3);
        }

        // Zero-pad to (rec_h, rec_w, 3)
        cv::Mat padding_img = cv::Mat::zeros(rec_h, rec_w, CV_32FC3);
        int width_to_copy = std::min(resized_w, rec_w);
        norm_img(cv::Rect(0, 0, width_to_copy, rec_h))
            .copyTo(padding_img(cv::Rect(0, 0, width_to_copy, rec_h)));

        return cv::dnn::blobFromImage(padding_img, 1.0, cv::Size(), cv::Scalar(), false, false, CV_32F);
    }

    std::string DecodeRecognition(const float* preds, const std::vector<int64_t>& preds_shape, const std::vector<std::string>& charset) {
        std::string text;
        int64_t last_idx = 0;
        int64_t num_tokens = preds_shape[1];
        int64_t num_chars = preds_shape[2];

        for (int64_t t = 0; t < num_tokens; ++t) {
            int64_t max_idx = 0;
            float max_prob = -1.0f;
            for (int64_t c = 0; c < num_chars; ++c) {
                if (preds[t * num_chars + c] > max_prob) {
                    max_prob = preds[t * num_chars + c];
                    max_idx = c;
                }
            }
            // CTC: index 0 is blank, repeats collapse.
            if (max_idx > 0 && max_idx != last_idx && max_idx < static_cast<int64_t>(charset.size())) {
                text += charset[max_idx];
            }
            last_idx = max_idx;
        }
        return text;
    }

    std::vector<std::string> SplitWords(const std::string& text) {
        std::vector<std::string> words;
        std::istringstream ss(text);
        std::string word;
        while (ss >> word) {
            words.push_back(word);
        }
        return words;
    }
}
