#include "parkgate/vision/PlateReader.h"
#include <opencv2/imgproc.hpp>
#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>
#include <cctype>
#include <iostream>

namespace parkgate {
namespace vision {

std::optional<std::string> normalizePlateText(const std::string& raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (char c : raw) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) cleaned.push_back(static_cast<char>(std::toupper(uc)));
    }
    if (cleaned.size() < 3 || cleaned.size() > 10) return std::nullopt;
    return cleaned;
}

cv::Mat preprocessForOcr(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.clone();
    }

    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);

    cv::Mat thresh;
    cv::adaptiveThreshold(blurred, thresh, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY, 11, 2);

    cv::Mat cleaned;
    cv::Mat kernel = cv::Mat::ones(2, 2, CV_8U);
    cv::morphologyEx(thresh, cleaned, cv::MORPH_CLOSE, kernel);
    return cleaned;
}

TesseractPlateReader::TesseractPlateReader(const TesseractOptions& opts)
    : opts_(opts), api_(new tesseract::TessBaseAPI()) {
    const char* prefix = opts_.tessdata_prefix.empty() ? nullptr : opts_.tessdata_prefix.c_str();
    if (api_->Init(prefix, opts_.language.c_str(), tesseract::OEM_DEFAULT) != 0) {
        std::cerr << "[Plate] Error: could not initialise tesseract (language "
                  << opts_.language << ")\n";
        return;
    }
    api_->SetPageSegMode(tesseract::PSM_SINGLE_LINE);
    api_->SetVariable("tessedit_char_whitelist", "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789");
    api_->SetVariable("debug_file", "/dev/null");
    ready_ = true;
    std::cout << "[Plate] Tesseract " << api_->Version() << " ready\n";
}

TesseractPlateReader::~TesseractPlateReader() {
    if (api_) api_->End();
}

std::optional<std::string> TesseractPlateReader::extract(const cv::Mat& image) {
    if (!ready_ || image.empty()) return std::nullopt;

    try {
        cv::Mat processed = preprocessForOcr(image);

        std::string text;
        {
            std::lock_guard<std::mutex> lock(api_mutex_);
            api_->SetImage(processed.data, processed.cols, processed.rows,
                           processed.channels(), static_cast<int>(processed.step1()));

            tesseract::ETEXT_DESC monitor;
            monitor.set_deadline_msecs(opts_.timeout_ms);
            if (api_->Recognize(&monitor) != 0) {
                std::cerr << "[Plate] Warning: recognition failed or timed out\n";
                api_->Clear();
                return std::nullopt;
            }
            std::unique_ptr<char[]> raw(api_->GetUTF8Text());
            if (raw) text = raw.get();
            api_->Clear();
        }

        auto plate = normalizePlateText(text);
        if (plate) {
            std::cout << "[Plate] Extracted number plate: " << *plate << "\n";
        } else {
            std::cerr << "[Plate] Warning: no number plate text extracted\n";
        }
        return plate;
    } catch (const std::exception& ex) {
        std::cerr << "[Plate] Error extracting number plate: " << ex.what() << "\n";
        return std::nullopt;
    }
}

} // namespace vision
} // namespace parkgate
