#include "time_frame.hpp"
#include <cmath>
#include <set>

namespace tsm {

TimeFrame::TimeFrame(std::vector<Timestamp> index, std::vector<std::string> columns, matrix::Matrix rows)
    : index_(std::move(index)), columns_(std::move(columns)), rows_(std::move(rows)) {}

TimeFrame TimeFrame::from_record(const Record& record) {
    require_known_fields(record, {"columns", "timestamps", "rows"}, type_name);

    const Record empty;

    std::vector<std::string> columns;
    for (const auto& item : record.get_child("columns", empty)) {
        columns.push_back(item.second.get_value<std::string>());
    }

    std::vector<Timestamp> index;
    for (const auto& item : record.get_child("timestamps", empty)) {
        auto stamp = item.second.get_value_optional<int64_t>();
        if (!stamp) {
            throw InvalidArgumentError("Field 'timestamps' must hold epoch milliseconds, got '" +
                                       item.second.get_value<std::string>() + "'");
        }
        auto ms = std::chrono::milliseconds(*stamp);
        index.push_back(Timestamp(std::chrono::duration_cast<Duration>(ms)));
    }

    matrix::Matrix rows;
    for (const auto& row : record.get_child("rows", empty)) {
        std::vector<double> values;
        for (const auto& cell : row.second) {
            auto value = cell.second.get_value_optional<double>();
            if (!value) {
                throw InvalidArgumentError("Field 'rows' must hold numbers, got '" +
                                           cell.second.get_value<std::string>() + "'");
            }
            values.push_back(*value);
        }
        rows.push_back(std::move(values));
    }

    return make_data_model<TimeFrame>(std::move(index), std::move(columns), std::move(rows));
}

bool TimeFrame::check_integrity() const {
    if (columns_.empty()) return false;

    std::set<std::string> unique(columns_.begin(), columns_.end());
    if (unique.size() != columns_.size()) return false;

    if (index_.size() != rows_.size()) return false;

    for (size_t t = 0; t < rows_.size(); ++t) {
        if (rows_[t].size() != columns_.size()) return false;
        for (double v : rows_[t]) {
            if (!std::isfinite(v)) return false;
        }
        if (t > 0 && index_[t] <= index_[t - 1]) return false;
    }
    return true;
}

Tensor TimeFrame::values() const {
    return Tensor::from_rows(rows_, columns_.size());
}

TimeFrame TimeFrame::slice(size_t begin, size_t end) const {
    if (begin > end || end > rows_.size()) {
        throw InvalidArgumentError("Frame slice [" + std::to_string(begin) + ", " +
                                   std::to_string(end) + ") out of range");
    }
    std::vector<Timestamp> index(index_.begin() + begin, index_.begin() + end);
    matrix::Matrix rows(rows_.begin() + begin, rows_.begin() + end);
    return TimeFrame(std::move(index), columns_, std::move(rows));
}

Duration TimeFrame::median_gap() const {
    if (index_.size() < 2) {
        throw InvalidArgumentError("At least two timestamps are needed to estimate the sampling interval");
    }

    std::vector<double> gaps;
    gaps.reserve(index_.size() - 1);
    for (size_t t = 1; t < index_.size(); ++t) {
        gaps.push_back(static_cast<double>((index_[t] - index_[t - 1]).count()));
    }

    double median = stats::median(gaps);
    if (median <= 0.0) {
        throw InvalidArgumentError("Sampling interval must be positive");
    }
    auto ticks = std::max<Duration::rep>(1, static_cast<Duration::rep>(std::llround(median)));
    return Duration(ticks);
}

std::vector<Timestamp> TimeFrame::future_index(size_t steps, Duration gap) const {
    if (index_.empty()) {
        throw InvalidArgumentError("Cannot extend an empty index");
    }
    std::vector<Timestamp> result;
    result.reserve(steps);
    Timestamp t = index_.back();
    for (size_t k = 0; k < steps; ++k) {
        t += gap;
        result.push_back(t);
    }
    return result;
}

// ============================================================
// Cache encodings
// ============================================================

void encode_argument(BinaryWriter& w, const TimeFrame& frame) {
    w.write('F');
    CacheCodec<TimeFrame>::encode(w, frame);
}

void CacheCodec<TimeFrame>::encode(BinaryWriter& w, const TimeFrame& frame) {
    w.write_size(frame.columns().size());
    for (const auto& name : frame.columns()) {
        w.write_string(name);
    }
    w.write_size(frame.index().size());
    for (const auto& t : frame.index()) {
        w.write(static_cast<int64_t>(t.time_since_epoch().count()));
    }
    w.write_tensor(frame.values());
}

TimeFrame CacheCodec<TimeFrame>::decode(BinaryReader& r) {
    std::vector<std::string> columns(r.read_size());
    for (auto& name : columns) {
        name = r.read_string();
    }
    std::vector<Timestamp> index(r.read_size());
    for (auto& t : index) {
        t = Timestamp(Duration(static_cast<Duration::rep>(r.read<int64_t>())));
    }
    Tensor values = r.read_tensor();
    if (values.rows() != index.size() || (values.rows() > 0 && values.row_width() != columns.size())) {
        throw std::runtime_error("Corrupt stream: frame layout mismatch");
    }
    return TimeFrame(std::move(index), std::move(columns), values.to_rows());
}

} // namespace tsm
