#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <vector>
#include "tsmodel.hpp"
#include "csv_reader.hpp"

// Seven correlated counters sampled once per minute
tsm::TimeFrame synthetic_frame(size_t rows) {
    std::vector<std::string> columns = {"a", "b", "c", "d", "e", "f", "g"};
    std::vector<tsm::Timestamp> index;
    tsm::matrix::Matrix values;

    tsm::Timestamp start{std::chrono::hours(24 * 365 * 50)};
    double level = 1000.0;
    for (size_t t = 0; t < rows; ++t) {
        level += 2.0 + 3.0 * std::sin(t * 0.05) + (std::rand() % 7 - 3);
        std::vector<double> row;
        for (size_t j = 0; j < columns.size(); ++j) {
            row.push_back(std::round(level * (1.0 + 0.1 * j) + 10.0 * std::cos(t * 0.1 + j)));
        }
        index.push_back(start + std::chrono::minutes(t));
        values.push_back(row);
    }
    return tsm::make_data_model<tsm::TimeFrame>(index, columns, values);
}

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

int main(int argc, char* argv[]) {
    std::cout << "=== AutoRegModel Example ===" << std::endl;
    std::cout << "Usage: " << argv[0] << " [config.json] [data.csv time_column]" << std::endl;

    try {
        tsm::ModelConfig config;
        config.input_shape = {7};
        config.output_shape = {7};
        config.max_lag = 30;
        config.steps = 30;
        if (argc > 1) {
            config = tsm::ModelConfig::from_file(argv[1]);
        }
        config.apply_logging();

        tsm::TimeFrame frame = argc > 3 ? tsm::CSVReader::read_frame(argv[2], argv[3])
                                        : synthetic_frame(1200);
        std::cout << "Loaded " << frame.size() << " rows x " << frame.columns().size() << " columns"
                  << std::endl;

        size_t split = std::min<size_t>(frame.size(), 1001);
        tsm::TimeFrame past = frame.slice(0, split);

        tsm::AutoRegModel model(config.model_options());
        std::cout << "\nTraining with max_lag=" << config.max_lag << "..." << std::endl;
        auto start = std::chrono::steady_clock::now();
        model.train(past.values(), {config.max_lag});
        std::cout << "Trained in " << std::fixed << std::setprecision(1) << elapsed_ms(start) << " ms"
                  << std::endl;
        std::cout << "Cache location: " << model.cache().location() << std::endl;

        // The second identical call is served from the cache
        for (int call = 1; call <= 2; ++call) {
            start = std::chrono::steady_clock::now();
            tsm::Tensor forecast = model.predict(past.values(), {config.steps});
            std::cout << "predict #" << call << ": shape " << tsm::shape_to_string(forecast.shape())
                      << " in " << elapsed_ms(start) << " ms" << std::endl;
        }

        std::cout << "\nForecasting two hours ahead..." << std::endl;
        tsm::TimeFrame future = model.predict_duration(past, std::chrono::hours(2));
        std::cout << "Forecast rows: " << future.size() << std::endl;
        for (size_t i = 0; i < std::min<size_t>(future.size(), 5); ++i) {
            std::cout << "  Step " << (i + 1) << ":";
            for (double v : future.rows()[i]) {
                std::cout << " " << std::setprecision(0) << v;
            }
            std::cout << std::endl;
        }

        std::filesystem::path file = "autoreg_model.bin.gz";
        model.dump(file);
        tsm::AutoRegModel reloaded = tsm::load<tsm::AutoRegModel>(file);
        tsm::Tensor again = reloaded.predict(past.values(), {config.steps});
        std::cout << "\nReloaded from " << file << ", forecast matches: "
                  << (again == model.predict(past.values(), {config.steps}) ? "yes" : "no") << std::endl;

        std::cout << "Cache hits: " << model.cache().stats().hits
                  << ", misses: " << model.cache().stats().misses << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
