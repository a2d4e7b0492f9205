#ifndef LANDCALC_RECORD_LOADER_HPP
#define LANDCALC_RECORD_LOADER_HPP

#include "../budget.hpp"
#include "../config.hpp"
#include "../in_memory_provider.hpp"
#include "../loan.hpp"
#include "../parcel.hpp"
#include "../project.hpp"
#include <istream>
#include <string>
#include <vector>

namespace landcalc {

// CSV loaders for project records. Columns are matched by header name, so
// order is free and unknown columns are ignored. Empty cells mean "absent"
// for optional fields and zero for amounts.
//
// Throws std::runtime_error when a file cannot be opened, a required column
// is missing or a cell does not parse.

// Required: fact_id, amount
std::vector<BudgetItem> load_budget_items(std::istream& is);
std::vector<BudgetItem> load_budget_items(const std::string& filepath);

// Required: parcel_id
std::vector<ParcelSale> load_parcel_sales(std::istream& is);
std::vector<ParcelSale> load_parcel_sales(const std::string& filepath);

// Required: acquisition_id, amount
std::vector<AcquisitionCost> load_acquisition_costs(std::istream& is);
std::vector<AcquisitionCost> load_acquisition_costs(const std::string& filepath);

// Required: loan_id, structure_type. container_ids are ';'-separated.
std::vector<Loan> load_loans(std::istream& is);
std::vector<Loan> load_loans(const std::string& filepath);

// Required: division_id
std::vector<Division> load_divisions(std::istream& is);
std::vector<Division> load_divisions(const std::string& filepath);

// Load every configured input file; empty paths yield no records
ProjectInputs load_project_inputs(const ProjectConfig& config);

} // namespace landcalc

#endif // LANDCALC_RECORD_LOADER_HPP
