#pragma once

#include <string>
#include <vector>

#include <opencv2/ml.hpp>

namespace roofwatch {

struct TrainingSet {
    cv::Mat samples;   // one CV_32F row per image
    cv::Mat labels;    // CV_32F column, 1 = OPEN, 0 = CLOSED
    std::vector<std::string> files;
    int open_count{0};
    int closed_count{0};
    int duplicates{0};
    int unreadable{0};
};

struct TrainOptions {
    int img_size{32};   // side of the square the training set was prepared at
    double learning_rate{0.05};
    int iterations{1000};
};

struct ValidationReport {
    int total{0};
    int correct{0};
    // confusion[actual][predicted], index 0 = CLOSED, 1 = OPEN
    int confusion[2][2]{{0, 0}, {0, 0}};
    std::vector<std::string> misclassified;

    double accuracy() const { return total ? static_cast<double>(correct) / total : 0.0; }
};

// Reads `<root>/open` and `<root>/closed`. Images that are identical after
// preprocessing are counted once.
TrainingSet load_training_set(const std::string& root, int img_size);

// Throws std::invalid_argument unless both classes are present and the
// samples were prepared at options.img_size.
cv::Ptr<cv::ml::LogisticRegression> train_model(const TrainingSet& set, const TrainOptions& options);

ValidationReport validate_model(const std::string& model_path, const std::string& root,
                                int img_size, double threshold);

}  // namespace roofwatch
