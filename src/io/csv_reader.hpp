#ifndef LANDCALC_CSV_READER_HPP
#define LANDCALC_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace landcalc {

// Line-oriented CSV reader. Double-quoted cells may contain the delimiter
// and "" escapes; cells are trimmed of surrounding whitespace.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

private:
    std::istream& is_;
    char delimiter_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace landcalc

#endif // LANDCALC_CSV_READER_HPP
