#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "roofwatch/errors.hpp"
#include "roofwatch/inference_engine.hpp"
#include "roofwatch/model_trainer.hpp"

namespace fs = std::filesystem;

namespace {

struct TrainArgs {
    std::string command;
    std::vector<std::string> positional;
    int img_size{32};
    double threshold{0.5};
    double learning_rate{0.05};
    int iterations{1000};
};

bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

void print_usage() {
    std::cout << "Usage: roofwatch_train train <data-dir> <model-out> [--img N] [--lr X] [--iterations N]\n"
              << "       roofwatch_train validate <model> <data-dir> [--img N] [--threshold P]\n"
              << "       roofwatch_train classify <model> <image>... [--img N] [--threshold P]\n"
              << "<data-dir> holds open/ and closed/ folders of PNG images.\n";
}

TrainArgs parse(int argc, char** argv) {
    TrainArgs args;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 < argc) return argv[i + 1];
            throw std::invalid_argument(std::string("missing value for ") + arg);
        };
        if (arg_eq(arg, "--img")) {
            args.img_size = std::stoi(next());
            i++;
        } else if (arg_eq(arg, "--threshold")) {
            args.threshold = std::stod(next());
            i++;
        } else if (arg_eq(arg, "--lr")) {
            args.learning_rate = std::stod(next());
            i++;
        } else if (arg_eq(arg, "--iterations")) {
            args.iterations = std::stoi(next());
            i++;
        } else if (arg_eq(arg, "--help") || arg_eq(arg, "-h")) {
            print_usage();
            std::exit(0);
        } else if (std::strncmp(arg, "--", 2) == 0) {
            throw std::invalid_argument(std::string("unknown option ") + arg);
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.emplace_back(arg);
        }
    }
    if (args.img_size <= 0) throw std::invalid_argument("--img must be positive");
    if (args.threshold < 0.0 || args.threshold > 1.0) throw std::invalid_argument("--threshold must be within [0, 1]");
    return args;
}

int run_train(const TrainArgs& args) {
    if (args.positional.size() != 2) throw std::invalid_argument("train needs <data-dir> <model-out>");
    roofwatch::TrainingSet set = roofwatch::load_training_set(args.positional[0], args.img_size);
    std::cout << "[INFO] open: " << set.open_count << ", closed: " << set.closed_count
              << ", duplicates skipped: " << set.duplicates << ", unreadable: " << set.unreadable << "\n";

    roofwatch::TrainOptions opts;
    opts.img_size = args.img_size;
    opts.learning_rate = args.learning_rate;
    opts.iterations = args.iterations;
    auto model = roofwatch::train_model(set, opts);

    fs::path out(args.positional[1]);
    if (out.has_parent_path()) fs::create_directories(out.parent_path());
    model->save(out.string());
    std::cout << "[INFO] Model written to " << out.string() << "\n";
    return 0;
}

int run_validate(const TrainArgs& args) {
    if (args.positional.size() != 2) throw std::invalid_argument("validate needs <model> <data-dir>");
    roofwatch::ValidationReport report =
        roofwatch::validate_model(args.positional[0], args.positional[1], args.img_size, args.threshold);
    std::cout << "Images   : " << report.total << "\n"
              << "Accuracy : " << cv::format("%.2f%%", report.accuracy() * 100.0) << "\n"
              << "             pred CLOSED  pred OPEN\n"
              << "CLOSED     " << cv::format("%11d  %9d", report.confusion[0][0], report.confusion[0][1]) << "\n"
              << "OPEN       " << cv::format("%11d  %9d", report.confusion[1][0], report.confusion[1][1]) << "\n";
    for (const auto& path : report.misclassified) {
        std::cout << "  misclassified: " << path << "\n";
    }
    return report.total > 0 && report.correct == report.total ? 0 : 1;
}

int run_classify(const TrainArgs& args) {
    if (args.positional.size() < 2) throw std::invalid_argument("classify needs <model> <image>...");
    roofwatch::InferenceEngine engine(args.positional[0], args.img_size, args.threshold, false);
    if (!engine.ready()) throw roofwatch::ModelNotLoaded("cannot load model " + args.positional[0]);

    int failures = 0;
    for (size_t i = 1; i < args.positional.size(); ++i) {
        const fs::path path(args.positional[i]);
        try {
            roofwatch::Frame frame(path, fs::last_write_time(path));
            roofwatch::ClassificationResult r = engine.classify(frame);
            std::cout << path.filename().string() << ": " << roofwatch::label_to_string(r.label)
                      << cv::format(" (confidence %.2f, P(open) %.3f)", r.confidence, r.open_score) << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[WARN] " << path.string() << ": " << e.what() << "\n";
            failures++;
        }
    }
    return failures == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        TrainArgs args = parse(argc, argv);
        if (args.command == "train") return run_train(args);
        if (args.command == "validate") return run_validate(args);
        if (args.command == "classify") return run_classify(args);
        print_usage();
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        print_usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
