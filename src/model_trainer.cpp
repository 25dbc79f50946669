#include "roofwatch/model_trainer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>

#include "roofwatch/errors.hpp"
#include "roofwatch/frame_types.hpp"
#include "roofwatch/inference_engine.hpp"
#include "roofwatch/log.hpp"

namespace roofwatch {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> list_pngs(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".png" && entry.is_regular_file()) out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace

TrainingSet load_training_set(const std::string& root, int img_size) {
    TrainingSet set;
    std::set<std::vector<float>> seen;

    for (const auto& [folder, value] : {std::make_pair(std::string("open"), 1.0f),
                                        std::make_pair(std::string("closed"), 0.0f)}) {
        for (const auto& path : list_pngs(fs::path(root) / folder)) {
            cv::Mat image = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
            if (image.empty()) {
                log_warn("Skipping unreadable training image: " + path.string());
                set.unreadable++;
                continue;
            }
            cv::Mat row = prepare_features(image, img_size);
            std::vector<float> key(row.ptr<float>(0), row.ptr<float>(0) + row.total());
            if (!seen.insert(key).second) {
                set.duplicates++;
                continue;
            }
            set.samples.push_back(row);
            set.labels.push_back(value);
            set.files.push_back(path.string());
            if (value > 0.5f) set.open_count++; else set.closed_count++;
        }
    }
    return set;
}

cv::Ptr<cv::ml::LogisticRegression> train_model(const TrainingSet& set, const TrainOptions& options) {
    if (set.open_count == 0 || set.closed_count == 0) {
        throw std::invalid_argument("training needs at least one OPEN and one CLOSED image (open: " +
                                    std::to_string(set.open_count) + ", closed: " +
                                    std::to_string(set.closed_count) + ")");
    }
    const int features = options.img_size * options.img_size;
    if (set.samples.cols != features) {
        throw std::invalid_argument("training images were prepared with " + std::to_string(set.samples.cols) +
                                    " features, --img " + std::to_string(options.img_size) + " needs " +
                                    std::to_string(features));
    }

    auto model = cv::ml::LogisticRegression::create();
    model->setLearningRate(options.learning_rate);
    model->setIterations(options.iterations);
    model->setRegularization(cv::ml::LogisticRegression::REG_L2);
    model->setTrainMethod(cv::ml::LogisticRegression::BATCH);
    model->setMiniBatchSize(1);

    auto data = cv::ml::TrainData::create(set.samples, cv::ml::ROW_SAMPLE, set.labels);
    if (!model->train(data)) {
        throw std::runtime_error("logistic regression training failed");
    }
    log_info("Trained roof model on " + std::to_string(set.open_count) + " OPEN and " +
             std::to_string(set.closed_count) + " CLOSED images");
    return model;
}

ValidationReport validate_model(const std::string& model_path, const std::string& root,
                                int img_size, double threshold) {
    InferenceEngine engine(model_path, img_size, threshold, false);
    if (!engine.ready()) throw ModelNotLoaded("cannot validate, model not loaded: " + model_path);

    ValidationReport report;
    for (const auto& [folder, actual] : {std::make_pair(std::string("open"), 1),
                                         std::make_pair(std::string("closed"), 0)}) {
        for (const auto& path : list_pngs(fs::path(root) / folder)) {
            cv::Mat image = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
            if (image.empty()) {
                log_warn("Skipping unreadable validation image: " + path.string());
                continue;
            }
            RoofLabel label = label_for_score(engine.open_score(image), threshold);
            int predicted = label == RoofLabel::OPEN ? 1 : 0;
            report.total++;
            report.confusion[actual][predicted]++;
            if (predicted == actual) {
                report.correct++;
            } else {
                report.misclassified.push_back(path.string());
            }
        }
    }
    return report;
}

}  // namespace roofwatch
