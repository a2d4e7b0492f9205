#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace landcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

} // anonymous namespace

void ParquetWriter::write_cash_flows(const Projection& projection, const std::string& filepath) {
    auto schema = arrow::schema({
        arrow::field("period_index", arrow::uint32()),
        arrow::field("period_end", arrow::utf8()),
        arrow::field("section_id", arrow::utf8()),
        arrow::field("line_id", arrow::utf8()),
        arrow::field("description", arrow::utf8()),
        arrow::field("amount", arrow::float64())
    });

    arrow::UInt32Builder period_builder;
    arrow::StringBuilder period_end_builder;
    arrow::StringBuilder section_builder;
    arrow::StringBuilder line_builder;
    arrow::StringBuilder description_builder;
    arrow::DoubleBuilder amount_builder;

    for (const Section& section : projection.sections) {
        for (const LineItem& line : section.line_items) {
            for (const PeriodAmount& pa : line.periods) {
                std::string period_end = pa.period_index < projection.periods.size()
                    ? projection.periods[pa.period_index].end_date.to_iso()
                    : std::string();
                check(period_builder.Append(static_cast<uint32_t>(pa.period_index)), "append period_index");
                check(period_end_builder.Append(period_end), "append period_end");
                check(section_builder.Append(section.section_id), "append section_id");
                check(line_builder.Append(line.line_id), "append line_id");
                check(description_builder.Append(line.description), "append description");
                check(amount_builder.Append(pa.amount), "append amount");
            }
        }
    }

    std::shared_ptr<arrow::Array> period_array;
    std::shared_ptr<arrow::Array> period_end_array;
    std::shared_ptr<arrow::Array> section_array;
    std::shared_ptr<arrow::Array> line_array;
    std::shared_ptr<arrow::Array> description_array;
    std::shared_ptr<arrow::Array> amount_array;
    check(period_builder.Finish(&period_array), "finish period_index array");
    check(period_end_builder.Finish(&period_end_array), "finish period_end array");
    check(section_builder.Finish(&section_array), "finish section_id array");
    check(line_builder.Finish(&line_array), "finish line_id array");
    check(description_builder.Finish(&description_array), "finish description array");
    check(amount_builder.Finish(&amount_array), "finish amount array");

    auto table = arrow::Table::Make(schema, {period_array, period_end_array, section_array,
                                             line_array, description_array, amount_array});

    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 opened.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *opened;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 64 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_cash_flows(const Projection& /* projection */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace landcalc
