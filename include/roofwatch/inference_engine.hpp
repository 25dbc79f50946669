#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>
#include <opencv2/ml.hpp>

#include "classifier.hpp"
#include "frame_types.hpp"

#ifdef ROOFWATCH_USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace roofwatch {

// Grayscale, resized to img_size x img_size, scaled to [0, 1] and flattened
// into a single CV_32F row. Throws InvalidFrame for empty or odd images.
cv::Mat prepare_features(const cv::Mat& image, int img_size);

// Classifier backed by a trained model file. .yml/.yaml/.xml/.json files are
// OpenCV logistic regression models; .onnx files run through OpenCV DNN or,
// when built with it, ONNX Runtime.
class InferenceEngine : public Classifier {
public:
    InferenceEngine(const std::string& model_path,
                    int img_size,
                    double threshold,
                    bool use_onnxruntime);

    // Wraps an already trained logistic regression model.
    InferenceEngine(cv::Ptr<cv::ml::LogisticRegression> model, int img_size, double threshold);

    bool ready() const override { return ready_; }

    ClassificationResult classify(const Frame& frame) const override;

    // Raw P(OPEN) for an image.
    double open_score(const cv::Mat& image) const;

    const std::string& model_path() const { return model_path_; }
    std::string backend_name() const;
    int input_size() const { return input_size_; }

private:
    enum class Backend { NONE, LOGISTIC, OPENCV_DNN, ORT };

    void load_logistic(const std::string& path);
    void load_dnn(const std::string& path);
    double score_logistic(const cv::Mat& features) const;
    double score_dnn(const cv::Mat& features) const;

    std::string model_path_;
    int input_size_;
    double threshold_;
    bool ready_{false};
    Backend backend_{Backend::NONE};

    cv::Ptr<cv::ml::LogisticRegression> logistic_;
    cv::Mat thetas_;  // 1 x (pixels + 1), CV_64F, bias first
    mutable cv::dnn::Net net_;
    mutable std::mutex net_mu_;

#ifdef ROOFWATCH_USE_ONNXRUNTIME
    bool load_ort(const std::string& path);
    double score_ort(const cv::Mat& features) const;

    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "roofwatch"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<std::string> input_name_strs_;
    std::vector<const char*> input_names_;
    std::vector<std::string> output_name_strs_;
    std::vector<const char*> output_names_;
#endif
};

}  // namespace roofwatch
