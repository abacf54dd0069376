#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "tsmodel.hpp"
#include "csv_reader.hpp"

#include <boost/property_tree/json_parser.hpp>

namespace fs = std::filesystem;

int tests_passed = 0;
int tests_failed = 0;

void test_assert(bool condition, const std::string& test_name) {
    if (condition) {
        std::cout << "[PASS] " << test_name << std::endl;
        tests_passed++;
    } else {
        std::cout << "[FAIL] " << test_name << std::endl;
        tests_failed++;
    }
}

template <typename E, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

tsm::Record parse_json(const std::string& text) {
    std::istringstream iss(text);
    tsm::Record record;
    boost::property_tree::read_json(iss, record);
    return record;
}

tsm::Timestamp at_minute(int minute) {
    return tsm::Timestamp(std::chrono::minutes(minute));
}

// Returns the last rows of its input, optionally widened past the output contract
struct TailStrategy {
    static constexpr const char* kind = "TailStrategy";
    static inline int predict_calls = 0;

    struct TrainOptions {
        size_t extra_width = 0;
        bool fail = false;
    };

    struct PredictOptions {
        int rows = 1;

        void sign(tsm::CallSignature& signature) const { signature.keyword("rows", rows); }
    };

    void train(const tsm::Tensor&, const TrainOptions& options) {
        if (options.fail) {
            throw std::runtime_error("training failed");
        }
        extra_width = options.extra_width;
    }

    tsm::Tensor predict(const tsm::Tensor& data, const PredictOptions& options) const {
        ++predict_calls;
        size_t rows = static_cast<size_t>(options.rows);
        size_t width = data.row_width() + extra_width;
        tsm::Tensor out({rows, width});
        for (size_t r = 0; r < rows; ++r) {
            for (size_t c = 0; c < data.row_width(); ++c) {
                out.at(r, c) = data.at(data.rows() - rows + r, c);
            }
        }
        return out;
    }

    void save(tsm::BinaryWriter& w) const { w.write_size(extra_width); }
    void load(tsm::BinaryReader& r) { extra_width = r.read_size(); }

    size_t extra_width = 0;
};

// Echoes the last row of a frame; `corrupt` duplicates a column name
struct LastRowFrames {
    using Input = tsm::TimeFrame;
    using Output = tsm::TimeFrame;

    static constexpr const char* kind = "LastRowFrames";

    struct TrainOptions {};

    struct PredictOptions {
        bool corrupt = false;

        void sign(tsm::CallSignature& signature) const { signature.keyword("corrupt", corrupt); }
    };

    void train(const tsm::TimeFrame&, const TrainOptions&) {}

    tsm::TimeFrame predict(const tsm::TimeFrame& data, const PredictOptions& options) const {
        tsm::TimeFrame last = data.slice(data.size() - 1, data.size());
        if (!options.corrupt) {
            return last;
        }
        auto columns = last.columns();
        columns.back() = columns.front();
        return tsm::TimeFrame(last.index(), columns, last.rows());
    }

    void save(tsm::BinaryWriter&) const {}
    void load(tsm::BinaryReader&) {}
};

tsm::TimeFrame small_frame() {
    return tsm::make_data_model<tsm::TimeFrame>(
        std::vector<tsm::Timestamp>{at_minute(0), at_minute(1), at_minute(2)},
        std::vector<std::string>{"x", "y"},
        tsm::matrix::Matrix{{1, 10}, {2, 20}, {3, 30}});
}

void test_tensor() {
    std::cout << "\n=== Testing Tensor ===" << std::endl;

    tsm::Tensor t = tsm::Tensor::from_rows({{1, 2, 3}, {4, 5, 6}});
    test_assert(t.shape() == tsm::Shape({2, 3}), "from_rows shape");
    test_assert(t.at(1, 2) == 6.0, "Row-major access");
    test_assert(t.slice_rows(1, 2).shape() == tsm::Shape({1, 3}), "Row slice shape");

    tsm::Tensor empty = tsm::Tensor::from_rows({}, 7);
    test_assert(empty.shape() == tsm::Shape({0, 7}), "Empty tensor keeps its width");
    test_assert(tsm::shape_to_string(empty.shape()) == "(0, 7)", "Shape formatting");
    test_assert(tsm::shape_to_string({7}) == "(7,)", "One-dimensional shape formatting");

    test_assert(throws<tsm::InvalidArgumentError>([] { tsm::Tensor({2, 2}, {1, 2, 3}); }),
                "Value count must match shape");
}

void test_shape_contract() {
    std::cout << "\n=== Testing Shape Contract ===" << std::endl;

    using tsm::ShapeContract;
    test_assert(ShapeContract::conforms(tsm::Tensor({5, 7}), {7}), "Leading dimension is free");
    test_assert(ShapeContract::conforms(tsm::Tensor({3, 4, 7}), {4, 7}), "Several trailing dimensions");
    test_assert(!ShapeContract::conforms(tsm::Tensor({5, 6}), {7}), "Trailing mismatch rejected");
    test_assert(!ShapeContract::conforms(tsm::Tensor({7}), {5, 7}), "Too few dimensions rejected");

    bool named = false;
    try {
        ShapeContract::validate(tsm::Tensor({5, 6}), {7}, "training input");
    } catch (const tsm::ShapeError& e) {
        named = std::string(e.what()).find("training input") != std::string::npos;
    }
    test_assert(named, "ShapeError names the checkpoint");

    test_assert(throws<tsm::InvalidArgumentError>([] { ShapeContract::check_declared({}, "input_shape"); }),
                "Empty declared shape rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] { ShapeContract::check_declared({0, 3}, "input_shape"); }),
                "Zero extent rejected");
}

void test_time_frame() {
    std::cout << "\n=== Testing TimeFrame Integrity ===" << std::endl;

    tsm::TimeFrame frame = small_frame();
    test_assert(frame.check_integrity(), "Valid frame passes");
    test_assert(frame.values().shape() == tsm::Shape({3, 2}), "Values tensor shape");

    auto build = [](std::vector<tsm::Timestamp> index, std::vector<std::string> columns, tsm::matrix::Matrix rows) {
        return tsm::make_data_model<tsm::TimeFrame>(std::move(index), std::move(columns), std::move(rows));
    };
    test_assert(throws<tsm::IntegrityError>([&] {
        build({at_minute(0), at_minute(1)}, {"x", "x"}, {{1, 2}, {3, 4}});
    }), "Duplicate column names rejected");
    test_assert(throws<tsm::IntegrityError>([&] {
        build({at_minute(1), at_minute(1)}, {"x"}, {{1}, {2}});
    }), "Non-increasing timestamps rejected");
    test_assert(throws<tsm::IntegrityError>([&] {
        build({at_minute(0)}, {"x", "y"}, {{1}});
    }), "Short row rejected");
    test_assert(throws<tsm::IntegrityError>([&] {
        build({at_minute(0)}, {"x"}, {{std::nan("")}});
    }), "Non-finite value rejected");
    test_assert(throws<tsm::IntegrityError>([&] { build({}, {}, {}); }), "Frame without columns rejected");

    tsm::TimeFrame parsed = tsm::TimeFrame::from_record(parse_json(
        R"({"columns": ["x", "y"], "timestamps": [0, 60000, 120000], "rows": [[1, 10], [2, 20], [3, 30]]})"));
    test_assert(parsed.size() == 3 && parsed.columns() == frame.columns(), "Frame from record");
    test_assert(parsed.index() == frame.index(), "Record timestamps are epoch milliseconds");

    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::TimeFrame::from_record(parse_json(R"({"columns": ["x"], "timestamps": [0], "rows": [[1]], "unit": "s"})"));
    }), "Unknown record field rejected");
    test_assert(throws<tsm::IntegrityError>([] {
        tsm::TimeFrame::from_record(parse_json(R"({"columns": ["x"], "timestamps": [0, 1], "rows": [[1]]})"));
    }), "Inconsistent record rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::TimeFrame::from_record(parse_json(R"({"columns": ["x"], "timestamps": ["noon"], "rows": [[1]]})"));
    }), "Non-numeric timestamp rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::TimeFrame::from_record(parse_json(R"({"columns": ["x"], "timestamps": [0], "rows": [["one"]]})"));
    }), "Non-numeric cell rejected");
}

void test_median_gap() {
    std::cout << "\n=== Testing Sampling Interval ===" << std::endl;

    test_assert(small_frame().median_gap() == std::chrono::minutes(1), "Regular gap");

    // gaps 1, 1, 4 minutes
    tsm::TimeFrame odd({at_minute(0), at_minute(1), at_minute(2), at_minute(6)}, {"x"}, {{0}, {0}, {0}, {0}});
    test_assert(odd.median_gap() == std::chrono::minutes(1), "Median ignores the outlier");

    // gaps 1, 3 minutes
    tsm::TimeFrame even({at_minute(0), at_minute(1), at_minute(4)}, {"x"}, {{0}, {0}, {0}});
    test_assert(even.median_gap() == std::chrono::minutes(2), "Even count averages the central gaps");

    tsm::TimeFrame single({at_minute(0)}, {"x"}, {{0}});
    test_assert(throws<tsm::InvalidArgumentError>([&] { single.median_gap(); }),
                "Single timestamp has no gap");

    auto future = small_frame().future_index(3, std::chrono::minutes(1));
    test_assert(future.size() == 3 && future.front() == at_minute(3) && future.back() == at_minute(5),
                "Future index continues the last timestamp");
}

void test_model_lifecycle() {
    std::cout << "\n=== Testing Model Lifecycle ===" << std::endl;

    fs::path root = fs::temp_directory_path() / ("tsmodel_contracts_" + tsm::hash::random_token());

    test_assert(throws<tsm::InvalidArgumentError>([&] { tsm::Model<TailStrategy>({{}, {3}, root}); }),
                "Model rejects an empty input shape");
    test_assert(throws<tsm::InvalidArgumentError>([&] { tsm::Model<TailStrategy>({{3}, {0}, root}); }),
                "Model rejects a zero output extent");

    tsm::Model<TailStrategy> model({{3}, {3}, root});
    tsm::Tensor data = tsm::Tensor::from_rows({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}});

    test_assert(!model.trained(), "New model is untrained");
    test_assert(!model.cache().is_persistent(), "New model has a transient cache");
    test_assert(throws<tsm::ModelNotTrainedError>([&] { model.predict(data); }), "Predict before train fails");

    test_assert(throws<tsm::ShapeError>([&] { model.train(tsm::Tensor({3, 4})); }),
                "Training input shape checked");
    test_assert(!model.trained(), "Shape failure leaves model untrained");

    test_assert(throws<std::runtime_error>([&] { model.train(data, {0, true}); }),
                "Strategy failure propagates");
    test_assert(!model.trained(), "Strategy failure leaves model untrained");

    model.train(data);
    test_assert(model.trained(), "Train flips trained");
    test_assert(model.cache().is_persistent(), "Training attaches a persistent cache");
    test_assert(model.cache().location().parent_path() == root, "Cache lives under the cache root");
    test_assert(!fs::exists(model.cache().location()), "Cache directory created lazily");

    std::string identity = model.cache_identity();
    test_assert(throws<std::runtime_error>([&] { model.train(data, {0, true}); }) &&
                model.trained() && model.cache_identity() == identity,
                "Failed retrain keeps the previous training");

    TailStrategy::predict_calls = 0;
    tsm::Tensor first = model.predict(data, {2});
    tsm::Tensor second = model.predict(data, {2});
    test_assert(first.shape() == tsm::Shape({2, 3}) && first.at(1, 2) == 9.0, "Predict result");
    test_assert(first == second, "Repeated predict is identical");
    test_assert(TailStrategy::predict_calls == 1, "Repeated predict served from cache");
    test_assert(fs::exists(model.cache().location()), "First store creates the cache directory");

    tsm::Tensor batch = tsm::Tensor::from_rows({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}, {1, 1, 1}});
    test_assert(model.predict(batch, {2}).shape() == tsm::Shape({2, 3}), "Output shape independent of batch size");
    test_assert(throws<tsm::ShapeError>([&] { model.predict(tsm::Tensor({3, 2}), {1}); }),
                "Prediction input shape checked");

    fs::path previous = model.cache().location();
    model.train(data, {1, false});
    test_assert(model.cache().location() != previous, "Retraining allocates a new cache location");
    test_assert(fs::exists(previous), "Previous cache directory is left in place");

    size_t stores = model.cache().stats().stores;
    test_assert(throws<tsm::ShapeError>([&] { model.predict(data, {1}); }), "Output shape checked");
    test_assert(model.cache().stats().stores == stores, "Failed output is not cached");

    model.train(data);
    fs::path location = model.cache().location();
    model.predict(data, {0});
    model.clear_cache(true);
    test_assert(fs::exists(location), "Soft clear keeps the directory");
    model.clear_cache();
    test_assert(!fs::exists(location), "Clear removes the directory");

    fs::remove_all(root);
}

void test_integrity_model() {
    std::cout << "\n=== Testing Integrity Model ===" << std::endl;

    fs::path root = fs::temp_directory_path() / ("tsmodel_integrity_" + tsm::hash::random_token());
    tsm::IntegrityModel<LastRowFrames> model(root);
    tsm::TimeFrame frame = small_frame();

    test_assert(throws<tsm::ModelNotTrainedError>([&] { model.predict(frame); }), "Predict before train fails");

    tsm::TimeFrame broken({at_minute(0), at_minute(0)}, {"x"}, {{1}, {2}});
    test_assert(throws<tsm::IntegrityError>([&] { model.train(broken); }), "Training input integrity checked");
    test_assert(!model.trained(), "Integrity failure leaves model untrained");

    model.train(frame);
    test_assert(model.trained() && model.cache().is_persistent(), "Train attaches persistent cache");

    tsm::TimeFrame out = model.predict(frame);
    test_assert(out.size() == 1 && out.rows()[0][1] == 30.0, "Predict result");
    model.predict(frame);
    test_assert(model.cache().stats().hits == 1, "Repeated predict served from cache");

    test_assert(throws<tsm::IntegrityError>([&] { model.predict(broken); }), "Prediction input integrity checked");

    size_t stores = model.cache().stats().stores;
    test_assert(throws<tsm::IntegrityError>([&] { model.predict(frame, {true}); }), "Output integrity checked");
    test_assert(model.cache().stats().stores == stores, "Failed output is not cached");

    tsm::TimeFrame unchecked = model.predict(frame, {true}, false);
    test_assert(!unchecked.check_integrity(), "Output check can be disabled");

    fs::remove_all(root);
}

void test_config() {
    std::cout << "\n=== Testing Configuration ===" << std::endl;

    tsm::ModelConfig config = tsm::ModelConfig::from_record(parse_json(
        R"({"input_shape": [7], "output_shape": [7], "cache_root": "cache", "max_lag": 12, "log_level": "info"})"));
    test_assert(config.input_shape == tsm::Shape({7}) && config.output_shape == tsm::Shape({7}), "Shapes read");
    test_assert(config.max_lag == 12 && config.steps == 200, "Explicit and default values");
    test_assert(config.model_options().cache_root == fs::path("cache"), "Cache root forwarded");

    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::ModelConfig::from_record(parse_json(R"({"input_shape": [7], "output_shape": [7], "lags": 3})"));
    }), "Unknown key rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::ModelConfig::from_record(parse_json(R"({"input_shape": [7]})"));
    }), "Missing output shape rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::ModelConfig::from_record(parse_json(R"({"input_shape": [-7], "output_shape": [7]})"));
    }), "Negative extent rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::ModelConfig::from_record(parse_json(R"({"input_shape": ["x"], "output_shape": [7]})"));
    }), "Non-numeric extent rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::ModelConfig::from_record(parse_json(R"({"input_shape": [7], "output_shape": [7], "max_lag": "ten"})"));
    }), "Non-numeric max_lag rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::ModelConfig::from_record(parse_json(R"({"input_shape": [7], "output_shape": [7], "steps": "-x"})"));
    }), "Non-numeric steps rejected");
    test_assert(throws<tsm::InvalidArgumentError>([] {
        tsm::ModelConfig::from_record(parse_json(R"({"input_shape": [7], "output_shape": [7], "max_lag": 0})"));
    }), "Non-positive max_lag rejected");
    test_assert(throws<tsm::PathAccessError>([] { tsm::ModelConfig::from_file("/nonexistent/config.json"); }),
                "Missing config file rejected");

    test_assert(throws<tsm::InvalidArgumentError>([] { tsm::logging::set_level("chatty"); }),
                "Unknown log level rejected");
    tsm::logging::set_level("warn");
    test_assert(tsm::logging::logger()->level() == spdlog::level::warn, "Log level applied");
}

void test_csv_frame() {
    std::cout << "\n=== Testing CSV Frames ===" << std::endl;

    fs::path dir = fs::temp_directory_path() / ("tsmodel_csv_" + tsm::hash::random_token());
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "load.csv");
        out << "time, cpu, \"mem\"\r\n"
            << "1700000000000,1.5,10\r\n"
            << "1700000300000,2.5,11\r\n"
            << "1700000600000,3.5\r\n"
            << "1700000900000,4.5,13\r\n";
    }
    {
        std::ofstream out(dir / "gaps.csv");
        out << "time,cpu\n1700000000000,1\n1700000300000,n/a\n";
    }

    tsm::TimeFrame frame = tsm::CSVReader::read_frame((dir / "load.csv").string(), "time");
    test_assert(frame.columns() == std::vector<std::string>({"cpu", "mem"}), "Header cells trimmed");
    test_assert(frame.size() == 3, "Short rows skipped");
    test_assert(frame.index()[1] - frame.index()[0] == std::chrono::minutes(5), "Epoch milliseconds parsed");
    test_assert(frame.values().at(2, 0) == 4.5 && frame.values().at(2, 1) == 13, "Values read");

    tsm::TimeFrame picked = tsm::CSVReader::read_frame((dir / "load.csv").string(), "time", {"mem"});
    test_assert(picked.columns() == std::vector<std::string>({"mem"}), "Column selection");

    test_assert(throws<std::runtime_error>([&] {
        tsm::CSVReader::read_frame((dir / "load.csv").string(), "time", {"disk"});
    }), "Missing column rejected");
    test_assert(throws<tsm::IntegrityError>([&] {
        tsm::CSVReader::read_frame((dir / "gaps.csv").string(), "time");
    }), "Non-numeric value fails integrity");

    fs::remove_all(dir);
}

int main() {
    std::cout << "Model Contracts - Test Suite" << std::endl;
    std::cout << "============================" << std::endl;

    try {
        test_tensor();
        test_shape_contract();
        test_time_frame();
        test_median_gap();
        test_model_lifecycle();
        test_integrity_model();
        test_config();
        test_csv_frame();
    } catch (const std::exception& e) {
        std::cout << "\n[ERROR] Exception: " << e.what() << std::endl;
        tests_failed++;
    }

    std::cout << "\n============================" << std::endl;
    std::cout << "Tests passed: " << tests_passed << std::endl;
    std::cout << "Tests failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
