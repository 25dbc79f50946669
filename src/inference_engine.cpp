#include "roofwatch/inference_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

#include <opencv2/imgproc.hpp>

#include "roofwatch/errors.hpp"
#include "roofwatch/log.hpp"

namespace roofwatch {

namespace {

std::string extension_of(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

double sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

// Single value: probability, or a logit if it falls outside [0, 1].
// Two values: probabilities for {CLOSED, OPEN} or logits, index 1 is OPEN.
double score_from_output(const float* data, size_t count) {
    if (count == 1) {
        double v = data[0];
        return (v >= 0.0 && v <= 1.0) ? v : sigmoid(v);
    }
    if (count == 2) {
        double a = data[0];
        double b = data[1];
        if (a >= 0.0 && b >= 0.0 && std::abs(a + b - 1.0) < 1e-3) return b;
        double m = std::max(a, b);
        double ea = std::exp(a - m);
        double eb = std::exp(b - m);
        return eb / (ea + eb);
    }
    throw InvalidFrame("unexpected model output size " + std::to_string(count));
}

}  // namespace

cv::Mat prepare_features(const cv::Mat& image, int img_size) {
    if (image.empty()) throw InvalidFrame("empty image");
    if (img_size <= 0) throw InvalidFrame("invalid model input size");

    cv::Mat gray;
    switch (image.channels()) {
        case 1: gray = image; break;
        case 3: cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw InvalidFrame("unsupported channel count " + std::to_string(image.channels()));
    }

    double scale = 1.0;
    switch (gray.depth()) {
        case CV_8U: scale = 1.0 / 255.0; break;
        case CV_16U: scale = 1.0 / 65535.0; break;
        case CV_32F: scale = 1.0; break;
        default:
            throw InvalidFrame("unsupported pixel depth");
    }

    cv::Mat small;
    cv::resize(gray, small, cv::Size(img_size, img_size), 0, 0, cv::INTER_AREA);
    cv::Mat features;
    small.convertTo(features, CV_32F, scale);
    return features.reshape(1, 1).clone();
}

InferenceEngine::InferenceEngine(const std::string& model_path,
                                 int img_size,
                                 double threshold,
                                 bool use_onnxruntime)
    : model_path_(model_path), input_size_(img_size), threshold_(threshold) {
    const std::string ext = extension_of(model_path);
    try {
        if (ext == ".onnx") {
#ifdef ROOFWATCH_USE_ONNXRUNTIME
            if (use_onnxruntime && load_ort(model_path)) return;
#else
            if (use_onnxruntime) {
                log_warn("Built without ONNX Runtime; using OpenCV DNN for " + model_path);
            }
#endif
            load_dnn(model_path);
        } else {
            load_logistic(model_path);
        }
    } catch (const std::exception& e) {
        log_error("Could not load model " + model_path + ": " + e.what());
        ready_ = false;
        backend_ = Backend::NONE;
    }
}

InferenceEngine::InferenceEngine(cv::Ptr<cv::ml::LogisticRegression> model, int img_size, double threshold)
    : model_path_("<memory>"), input_size_(img_size), threshold_(threshold), logistic_(std::move(model)) {
    if (logistic_ && logistic_->isTrained()) {
        cv::Mat thetas = logistic_->get_learnt_thetas();
        if (thetas.rows == 1) {
            thetas.convertTo(thetas_, CV_64F);
            backend_ = Backend::LOGISTIC;
            ready_ = true;
        }
    }
}

void InferenceEngine::load_logistic(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        log_error("Model file not found: " + path);
        return;
    }
    logistic_ = cv::ml::LogisticRegression::load(path);
    if (!logistic_ || !logistic_->isTrained()) {
        log_error("Model file holds no trained logistic regression: " + path);
        logistic_.release();
        return;
    }

    cv::Mat thetas = logistic_->get_learnt_thetas();
    if (thetas.rows != 1) {
        log_error("Model is not a binary OPEN/CLOSED classifier: " + path);
        logistic_.release();
        return;
    }
    thetas.convertTo(thetas_, CV_64F);

    // Bias term first, then one weight per pixel.
    const int features = thetas_.cols - 1;
    const int side = static_cast<int>(std::lround(std::sqrt(static_cast<double>(features))));
    if (side > 0 && side * side == features && side != input_size_) {
        log_warn("Model expects " + std::to_string(side) + "x" + std::to_string(side) +
                 " input, overriding configured size " + std::to_string(input_size_));
        input_size_ = side;
    }

    backend_ = Backend::LOGISTIC;
    ready_ = true;
    log_info("Loaded logistic regression model: " + path);
}

void InferenceEngine::load_dnn(const std::string& path) {
    net_ = cv::dnn::readNet(path);
    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    backend_ = Backend::OPENCV_DNN;
    ready_ = !net_.empty();
    if (ready_) log_info("Loaded OpenCV DNN model: " + path);
}

std::string InferenceEngine::backend_name() const {
    switch (backend_) {
        case Backend::LOGISTIC: return "logistic";
        case Backend::OPENCV_DNN: return "opencv-dnn";
        case Backend::ORT: return "onnxruntime";
        default: return "none";
    }
}

ClassificationResult InferenceEngine::classify(const Frame& frame) const {
    if (!ready_) throw ModelNotLoaded("no roof model loaded (" + model_path_ + ")");
    return make_result(frame, open_score(frame.pixels()), threshold_);
}

double InferenceEngine::open_score(const cv::Mat& image) const {
    if (!ready_) throw ModelNotLoaded("no roof model loaded (" + model_path_ + ")");
    cv::Mat features = prepare_features(image, input_size_);
    switch (backend_) {
        case Backend::LOGISTIC: return score_logistic(features);
        case Backend::OPENCV_DNN: return score_dnn(features);
#ifdef ROOFWATCH_USE_ONNXRUNTIME
        case Backend::ORT: return score_ort(features);
#endif
        default: break;
    }
    throw ModelNotLoaded("no usable model backend");
}

double InferenceEngine::score_logistic(const cv::Mat& features) const {
    if (features.cols + 1 != thetas_.cols) {
        throw InvalidFrame("feature count " + std::to_string(features.cols) +
                           " does not match model (" + std::to_string(thetas_.cols - 1) + ")");
    }
    cv::Mat x;
    features.convertTo(x, CV_64F);
    const double* theta = thetas_.ptr<double>(0);
    const double logit = theta[0] + x.dot(thetas_.colRange(1, thetas_.cols));
    return sigmoid(logit);
}

double InferenceEngine::score_dnn(const cv::Mat& features) const {
    cv::Mat image = features.reshape(1, input_size_);
    cv::Mat blob = cv::dnn::blobFromImage(image, 1.0, cv::Size(input_size_, input_size_),
                                          cv::Scalar(), false, false);
    cv::Mat pred;
    {
        std::lock_guard<std::mutex> lock(net_mu_);
        try {
            net_.setInput(blob);
            pred = net_.forward().clone();
        } catch (const cv::Exception& e) {
            throw InvalidFrame(std::string("model rejected input: ") + e.what());
        }
    }
    if (pred.type() != CV_32F) pred.convertTo(pred, CV_32F);
    cv::Mat flat = pred.reshape(1, 1);
    return score_from_output(flat.ptr<float>(0), flat.total());
}

#ifdef ROOFWATCH_USE_ONNXRUNTIME
bool InferenceEngine::load_ort(const std::string& path) {
    try {
        Ort::SessionOptions opts;
        opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
        session_ = std::make_unique<Ort::Session>(env_, path.c_str(), opts);

        Ort::AllocatorWithDefaultOptions allocator;
        const size_t in_count = session_->GetInputCount();
        for (size_t i = 0; i < in_count; ++i) {
            auto name = session_->GetInputNameAllocated(i, allocator);
            input_name_strs_.push_back(name.get());
        }
        const size_t out_count = session_->GetOutputCount();
        for (size_t i = 0; i < out_count; ++i) {
            auto name = session_->GetOutputNameAllocated(i, allocator);
            output_name_strs_.push_back(name.get());
        }
        for (const auto& s : input_name_strs_) input_names_.push_back(s.c_str());
        for (const auto& s : output_name_strs_) output_names_.push_back(s.c_str());

        backend_ = Backend::ORT;
        ready_ = true;
        log_info("Loaded ORT model: " + path);
        return true;
    } catch (const std::exception& e) {
        log_warn(std::string("ONNX Runtime load failed (") + e.what() + "); falling back to OpenCV DNN.");
        session_.reset();
        return false;
    }
}

double InferenceEngine::score_ort(const cv::Mat& features) const {
    std::vector<float> blob(features.ptr<float>(0), features.ptr<float>(0) + features.total());
    std::vector<int64_t> input_shape{1, 1, input_size_, input_size_};

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(mem_info_, blob.data(), blob.size(),
                                                              input_shape.data(), input_shape.size());
    std::vector<Ort::Value> outputs;
    try {
        outputs = session_->Run(Ort::RunOptions{nullptr},
                                input_names_.data(), &input_tensor, 1,
                                output_names_.data(), output_names_.size());
    } catch (const Ort::Exception& e) {
        throw InvalidFrame(std::string("model rejected input: ") + e.what());
    }
    if (outputs.empty()) throw InvalidFrame("model produced no output");

    auto& out = outputs.front();
    const float* data = out.GetTensorData<float>();
    const size_t count = out.GetTensorTypeAndShapeInfo().GetElementCount();
    return score_from_output(data, count);
}
#endif

}  // namespace roofwatch
