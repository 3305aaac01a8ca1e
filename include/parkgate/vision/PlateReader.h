#pragma once
#include <opencv2/core.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tesseract { class TessBaseAPI; }

namespace parkgate {
namespace vision {

// image -> plate text. Failure is an empty optional, never an exception.
class PlateReader {
public:
    virtual ~PlateReader() = default;
    virtual std::optional<std::string> extract(const cv::Mat& image) = 0;
};

// Uppercase, drop everything that is not A-Z / 0-9, accept 3..10 characters.
std::optional<std::string> normalizePlateText(const std::string& raw);

// OCR 预处理: 灰度 -> 高斯模糊 -> 自适应阈值 -> 闭运算
cv::Mat preprocessForOcr(const cv::Mat& image);

struct TesseractOptions {
    std::string tessdata_prefix;          // 空: 使用 TESSDATA_PREFIX 环境变量
    std::string language = "eng";
    int timeout_ms = 2000;                // 识别截止时间
};

class TesseractPlateReader : public PlateReader {
public:
    explicit TesseractPlateReader(const TesseractOptions& opts);
    ~TesseractPlateReader() override;

    TesseractPlateReader(const TesseractPlateReader&) = delete;
    TesseractPlateReader& operator=(const TesseractPlateReader&) = delete;

    bool ready() const { return ready_; }
    std::optional<std::string> extract(const cv::Mat& image) override;

private:
    TesseractOptions opts_;
    std::unique_ptr<tesseract::TessBaseAPI> api_;
    std::mutex api_mutex_;  // TessBaseAPI is not reentrant
    bool ready_ = false;
};

} // namespace vision
} // namespace parkgate
