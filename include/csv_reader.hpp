#ifndef TSM_CSV_READER_HPP
#define TSM_CSV_READER_HPP

#include "contract.hpp"
#include "time_frame.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tsm {

/**
 * Simple CSV Reader for time series data
 */
class CSVReader {
public:
    struct Dataset {
        std::vector<std::string> headers;
        std::vector<std::vector<double>> data;  // rows x cols
        std::map<std::string, size_t> column_index;

        size_t index_of(const std::string& name) const {
            auto it = column_index.find(name);
            if (it == column_index.end()) {
                throw std::runtime_error("Column not found: " + name);
            }
            return it->second;
        }

        std::vector<double> get_column(const std::string& name) const {
            size_t idx = index_of(name);
            std::vector<double> col;
            col.reserve(data.size());
            for (const auto& row : data) {
                col.push_back(row[idx]);
            }
            return col;
        }

        std::vector<std::vector<double>> get_columns(const std::vector<std::string>& names) const {
            std::vector<size_t> indices;
            for (const auto& name : names) {
                indices.push_back(index_of(name));
            }

            std::vector<std::vector<double>> result;
            result.reserve(data.size());
            for (const auto& row : data) {
                std::vector<double> new_row;
                new_row.reserve(indices.size());
                for (size_t idx : indices) {
                    new_row.push_back(row[idx]);
                }
                result.push_back(new_row);
            }
            return result;
        }

        size_t num_rows() const { return data.size(); }
    };

    /**
     * Read a CSV with a header line. Non-numeric cells become NaN; rows
     * narrower or wider than the header are skipped.
     */
    static Dataset read(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file: " + filename);
        }

        Dataset dataset;
        std::string line;
        if (std::getline(file, line)) {
            for (auto& name : split(line)) {
                dataset.column_index[name] = dataset.headers.size();
                dataset.headers.push_back(name);
            }
        }

        while (std::getline(file, line)) {
            if (line.empty() || line == "\r") continue;

            std::vector<double> row;
            for (const auto& cell : split(line)) {
                row.push_back(parse_number(cell));
            }
            if (row.size() == dataset.headers.size()) {
                dataset.data.push_back(std::move(row));
            }
        }
        return dataset;
    }

    /**
     * Read a time-indexed CSV into a TimeFrame
     * @param time_column Column holding epoch milliseconds
     * @param columns Value columns in output order; empty selects every
     *        column except the time column
     * @throws std::runtime_error on a missing column
     * @throws IntegrityError if the result is not a valid frame
     */
    static TimeFrame read_frame(const std::string& filename, const std::string& time_column,
                                const std::vector<std::string>& columns = {}) {
        Dataset dataset = read(filename);

        std::vector<std::string> names = columns;
        if (names.empty()) {
            for (const auto& header : dataset.headers) {
                if (header != time_column) names.push_back(header);
            }
        }

        std::vector<Timestamp> index;
        index.reserve(dataset.num_rows());
        for (double ms : dataset.get_column(time_column)) {
            if (!std::isfinite(ms)) {
                throw std::runtime_error("Invalid timestamp in column " + time_column);
            }
            auto since_epoch = std::chrono::milliseconds(std::llround(ms));
            index.push_back(Timestamp(std::chrono::duration_cast<Duration>(since_epoch)));
        }

        auto rows = dataset.get_columns(names);
        return make_data_model<TimeFrame>(std::move(index), std::move(names), std::move(rows));
    }

private:
    // Comma separated cells, trimmed of blanks and quotes
    static std::vector<std::string> split(const std::string& line) {
        std::vector<std::string> cells;
        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            cell.erase(0, cell.find_first_not_of(" \t\r\n\""));
            cell.erase(cell.find_last_not_of(" \t\r\n\"") + 1);
            cells.push_back(cell);
        }
        return cells;
    }

    static double parse_number(const std::string& cell) {
        try {
            return std::stod(cell);
        } catch (const std::invalid_argument&) {
            return std::numeric_limits<double>::quiet_NaN();
        } catch (const std::out_of_range&) {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }
};

} // namespace tsm

#endif // TSM_CSV_READER_HPP
