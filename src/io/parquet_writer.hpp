#ifndef LANDCALC_PARQUET_WRITER_HPP
#define LANDCALC_PARQUET_WRITER_HPP

#include "../projection_engine.hpp"
#include <string>

namespace landcalc {

class ParquetWriter {
public:
    /**
     * Write the projection's line-item cash flows to a Parquet file, one row
     * per non-zero (line item, period) pair.
     *
     * Output schema:
     *   - period_index: uint32 (0-indexed)
     *   - period_end: utf8 (YYYY-MM-DD)
     *   - section_id: utf8
     *   - line_id: utf8
     *   - description: utf8
     *   - amount: float64 (signed cash flow)
     *
     * @param projection Projection to export
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written or Arrow is unavailable
     */
    static void write_cash_flows(const Projection& projection, const std::string& filepath);
};

} // namespace landcalc

#endif // LANDCALC_PARQUET_WRITER_HPP
