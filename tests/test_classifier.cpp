#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include <opencv2/ml.hpp>

#include "roofwatch/classifier.hpp"
#include "roofwatch/errors.hpp"
#include "roofwatch/inference_engine.hpp"
#include "roofwatch/model_trainer.hpp"
#include "test_util.hpp"

using namespace roofwatch;
using roofwatch::test_util::TempDir;
using roofwatch::test_util::write_bytes;
using roofwatch::test_util::write_frame;

namespace {

Frame frame_at(const std::filesystem::path& path) {
    return Frame(path, std::filesystem::last_write_time(path));
}

// Two bright open frames and two dark closed frames.
void write_training_data(const TempDir& dir) {
    write_frame(dir / "data/open/a.png", 200);
    write_frame(dir / "data/open/b.png", 220);
    write_frame(dir / "data/closed/a.png", 40);
    write_frame(dir / "data/closed/b.png", 20);
}

}  // namespace

TEST(ClassifierTest, ScoreOnThresholdIsClosed) {
    EXPECT_EQ(label_for_score(0.5, 0.5), RoofLabel::CLOSED);
    EXPECT_EQ(label_for_score(0.5001, 0.5), RoofLabel::OPEN);
    EXPECT_EQ(label_for_score(0.0, 0.0), RoofLabel::CLOSED);
    EXPECT_EQ(label_for_score(1.0, 1.0), RoofLabel::CLOSED);
}

TEST(ClassifierTest, ConfidenceIsProbabilityOfReportedLabel) {
    Frame frame("cam/frame.png", {});
    auto open = make_result(frame, 0.8, 0.5);
    EXPECT_EQ(open.label, RoofLabel::OPEN);
    EXPECT_DOUBLE_EQ(open.confidence, 0.8);
    EXPECT_EQ(open.frame_path, "cam/frame.png");

    auto closed = make_result(frame, 0.3, 0.5);
    EXPECT_EQ(closed.label, RoofLabel::CLOSED);
    EXPECT_DOUBLE_EQ(closed.confidence, 0.7);
    EXPECT_DOUBLE_EQ(closed.open_score, 0.3);
    EXPECT_NE(closed.evaluated_at, Clock::time_point{});
}

TEST(ClassifierTest, NanScoreIsInvalidFrame) {
    Frame frame("frame.png", {});
    EXPECT_THROW(make_result(frame, std::numeric_limits<double>::quiet_NaN(), 0.5), InvalidFrame);
}

TEST(PrepareFeaturesTest, GrayscaleScaledRow) {
    cv::Mat img(48, 64, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::Mat row = prepare_features(img, 16);
    EXPECT_EQ(row.rows, 1);
    EXPECT_EQ(row.cols, 16 * 16);
    EXPECT_EQ(row.type(), CV_32F);
    EXPECT_NEAR(row.at<float>(0, 0), 1.0f, 1e-5);
    EXPECT_NEAR(row.at<float>(0, 255), 1.0f, 1e-5);
}

TEST(PrepareFeaturesTest, RejectsEmptyImage) {
    EXPECT_THROW(prepare_features(cv::Mat(), 16), InvalidFrame);
}

TEST(InferenceEngineTest, MissingModelIsNotReady) {
    TempDir dir;
    write_frame(dir / "frame.png", 100);
    InferenceEngine engine((dir / "nope.yml").string(), 32, 0.5, false);
    EXPECT_FALSE(engine.ready());
    EXPECT_EQ(engine.backend_name(), "none");
    EXPECT_THROW(engine.classify(frame_at(dir / "frame.png")), ModelNotLoaded);
}

TEST(InferenceEngineTest, CorruptModelIsNotReady) {
    TempDir dir;
    write_bytes(dir / "broken.yml", "%YAML:1.0\nnot a model\n");
    InferenceEngine engine((dir / "broken.yml").string(), 32, 0.5, false);
    EXPECT_FALSE(engine.ready());
}

TEST(InferenceEngineTest, TrainedModelSeparatesOpenFromClosed) {
    TempDir dir;
    write_training_data(dir);
    TrainingSet set = load_training_set((dir / "data").string(), 32);
    ASSERT_EQ(set.open_count, 2);
    ASSERT_EQ(set.closed_count, 2);

    InferenceEngine engine(train_model(set, TrainOptions{}), 32, 0.5);
    ASSERT_TRUE(engine.ready());
    EXPECT_EQ(engine.backend_name(), "logistic");

    auto bright = engine.classify(frame_at(write_frame(dir / "bright.png", 210)));
    auto dark = engine.classify(frame_at(write_frame(dir / "dark.png", 30)));
    EXPECT_EQ(bright.label, RoofLabel::OPEN);
    EXPECT_EQ(dark.label, RoofLabel::CLOSED);
    EXPECT_GT(bright.open_score, dark.open_score);
    EXPECT_GT(bright.confidence, 0.5);
    EXPECT_GT(dark.confidence, 0.5);
}

TEST(InferenceEngineTest, SameImageSameAnswer) {
    TempDir dir;
    write_training_data(dir);
    InferenceEngine engine(train_model(load_training_set((dir / "data").string(), 32), TrainOptions{}), 32, 0.5);
    const auto path = write_frame(dir / "frame.png", 150);
    auto first = engine.classify(frame_at(path));
    auto second = engine.classify(frame_at(path));
    EXPECT_EQ(first.label, second.label);
    EXPECT_DOUBLE_EQ(first.open_score, second.open_score);
}

TEST(InferenceEngineTest, SavedModelLoadsFromFile) {
    TempDir dir;
    write_training_data(dir);
    auto model = train_model(load_training_set((dir / "data").string(), 32), TrainOptions{});
    const auto model_path = (dir / "roof.yml").string();
    model->save(model_path);

    InferenceEngine engine(model_path, 32, 0.5, false);
    ASSERT_TRUE(engine.ready());
    EXPECT_EQ(engine.input_size(), 32);
    EXPECT_EQ(engine.classify(frame_at(write_frame(dir / "bright.png", 210))).label, RoofLabel::OPEN);

    ValidationReport report = validate_model(model_path, (dir / "data").string(), 32, 0.5);
    EXPECT_EQ(report.total, 4);
    EXPECT_EQ(report.correct, 4);
    EXPECT_DOUBLE_EQ(report.accuracy(), 1.0);
    EXPECT_TRUE(report.misclassified.empty());
}

TEST(ModelTrainerTest, DuplicatesAreCountedOnce) {
    TempDir dir;
    write_frame(dir / "data/open/a.png", 200);
    write_frame(dir / "data/open/copy.png", 200);
    write_frame(dir / "data/closed/a.png", 30);
    write_bytes(dir / "data/closed/bad.png", "garbage");

    TrainingSet set = load_training_set((dir / "data").string(), 16);
    EXPECT_EQ(set.open_count, 1);
    EXPECT_EQ(set.closed_count, 1);
    EXPECT_EQ(set.duplicates, 1);
    EXPECT_EQ(set.unreadable, 1);
    EXPECT_EQ(set.samples.rows, 2);
    EXPECT_EQ(set.samples.cols, 16 * 16);
}

TEST(ModelTrainerTest, NeedsBothClasses) {
    TempDir dir;
    write_frame(dir / "data/open/a.png", 200);
    TrainingSet set = load_training_set((dir / "data").string(), 16);
    EXPECT_THROW(train_model(set, TrainOptions{}), std::invalid_argument);
}

TEST(ModelTrainerTest, ImageSizeMustMatchTrainingSet) {
    TempDir dir;
    write_training_data(dir);
    TrainingSet set = load_training_set((dir / "data").string(), 16);

    EXPECT_THROW(train_model(set, TrainOptions{}), std::invalid_argument);

    TrainOptions opts;
    opts.img_size = 16;
    auto model = train_model(set, opts);
    ASSERT_FALSE(model.empty());
    EXPECT_TRUE(model->isTrained());
}
