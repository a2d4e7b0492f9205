#ifndef LANDCALC_IO_JSON_WRITER_HPP
#define LANDCALC_IO_JSON_WRITER_HPP

#include "../projection_engine.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace landcalc {
namespace io {

// Projection as a JSON document. Empty optional metrics become null;
// period series stay sparse ({"period": i, "amount": x}).
nlohmann::json projection_to_json(const Projection& projection);

// Write a Projection to JSON format
void write_projection_json(std::ostream& os, const Projection& projection,
                           bool pretty_print = true);

// Write a Projection to a JSON file
void write_projection_json(const std::string& filepath, const Projection& projection,
                           bool pretty_print = true);

} // namespace io
} // namespace landcalc

#endif // LANDCALC_IO_JSON_WRITER_HPP
