#ifndef TSM_TIME_FRAME_HPP
#define TSM_TIME_FRAME_HPP

#include "contract.hpp"
#include "memo_cache.hpp"
#include "tensor.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace tsm {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

/**
 * Time-indexed table: one timestamp and one row of values per sample.
 *
 * Integrity:
 * - at least one column, column names unique
 * - exactly one timestamp per row, every row as wide as the column list
 * - timestamps strictly increasing
 * - all values finite
 */
class TimeFrame : public DataModel {
public:
    static constexpr const char* type_name = "TimeFrame";

    TimeFrame() = default;
    TimeFrame(std::vector<Timestamp> index, std::vector<std::string> columns, matrix::Matrix rows);

    /**
     * Build from a record with the fields
     *   "columns":    ["a", "b", ...]
     *   "timestamps": [epoch milliseconds, ...]
     *   "rows":       [[1, 2, ...], ...]
     * Unknown fields throw InvalidArgumentError, a failed check IntegrityError.
     */
    static TimeFrame from_record(const Record& record);

    bool check_integrity() const override;

    const std::vector<Timestamp>& index() const { return index_; }
    const std::vector<std::string>& columns() const { return columns_; }
    const matrix::Matrix& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }

    // Values as a (rows, columns) tensor
    Tensor values() const;

    // Rows [begin, end)
    TimeFrame slice(size_t begin, size_t end) const;

    /**
     * Median interval between consecutive timestamps, at least one tick.
     * @throws InvalidArgumentError with fewer than two timestamps or a
     *         non-positive median
     */
    Duration median_gap() const;

    /**
     * `steps` timestamps continuing the index: last + gap, last + 2 * gap, ...
     */
    std::vector<Timestamp> future_index(size_t steps, Duration gap) const;

private:
    std::vector<Timestamp> index_;
    std::vector<std::string> columns_;
    matrix::Matrix rows_;
};

void encode_argument(BinaryWriter& w, const TimeFrame& frame);

template <>
struct CacheCodec<TimeFrame> {
    static void encode(BinaryWriter& w, const TimeFrame& frame);
    static TimeFrame decode(BinaryReader& r);
};

} // namespace tsm

#endif // TSM_TIME_FRAME_HPP
