#include "record_loader.hpp"
#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace landcalc {

namespace {

// Header-indexed view over the rows of one CSV file
class CsvTable {
public:
    CsvTable(std::istream& is, std::string kind) : kind_(std::move(kind)) {
        CsvReader reader(is);
        std::vector<std::string> header = reader.read_row();
        for (size_t i = 0; i < header.size(); ++i) {
            columns_[header[i]] = i;
        }
        while (reader.has_more()) {
            std::vector<std::string> row = reader.read_row();
            if (row.empty()) {
                continue;
            }
            rows_.push_back(std::move(row));
        }
    }

    void require(std::initializer_list<const char*> names) const {
        for (const char* name : names) {
            if (columns_.find(name) == columns_.end()) {
                throw std::runtime_error(kind_ + " CSV requires column: " + name);
            }
        }
    }

    size_t size() const { return rows_.size(); }

    std::string text(size_t row, const std::string& column) const {
        auto it = columns_.find(column);
        if (it == columns_.end() || it->second >= rows_[row].size()) {
            return "";
        }
        return rows_[row][it->second];
    }

    std::optional<double> optional_number(size_t row, const std::string& column) const {
        std::string cell = text(row, column);
        if (cell.empty()) {
            return std::nullopt;
        }
        try {
            size_t used = 0;
            double value = std::stod(cell, &used);
            if (used != cell.size()) {
                throw std::invalid_argument(cell);
            }
            return value;
        } catch (const std::logic_error&) {
            throw std::runtime_error(kind_ + " CSV row " + std::to_string(row + 2) +
                                     ": invalid number '" + cell + "' in column " + column);
        }
    }

    double number(size_t row, const std::string& column, double fallback = 0.0) const {
        return optional_number(row, column).value_or(fallback);
    }

    std::optional<int64_t> optional_integer(size_t row, const std::string& column) const {
        std::optional<double> value = optional_number(row, column);
        if (!value) {
            return std::nullopt;
        }
        return static_cast<int64_t>(*value);
    }

    int64_t integer(size_t row, const std::string& column) const {
        std::optional<int64_t> value = optional_integer(row, column);
        if (!value) {
            throw std::runtime_error(kind_ + " CSV row " + std::to_string(row + 2) +
                                     ": missing value in column " + column);
        }
        return *value;
    }

    std::optional<size_t> optional_period(size_t row, const std::string& column) const {
        std::optional<int64_t> value = optional_integer(row, column);
        if (!value || *value < 1) {
            return std::nullopt;
        }
        return static_cast<size_t>(*value);
    }

    std::optional<int> optional_int(size_t row, const std::string& column) const {
        std::optional<int64_t> value = optional_integer(row, column);
        if (!value) {
            return std::nullopt;
        }
        return static_cast<int>(*value);
    }

    bool flag(size_t row, const std::string& column, bool fallback) const {
        std::string cell = text(row, column);
        if (cell.empty()) {
            return fallback;
        }
        std::transform(cell.begin(), cell.end(), cell.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return cell == "1" || cell == "true" || cell == "yes" || cell == "y";
    }

private:
    std::string kind_;
    std::map<std::string, size_t> columns_;
    std::vector<std::vector<std::string>> rows_;
};

std::ifstream open_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return file;
}

std::vector<int64_t> parse_id_list(const std::string& text) {
    std::vector<int64_t> ids;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ';')) {
        if (token.empty()) {
            continue;
        }
        try {
            ids.push_back(std::stoll(token));
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid container id '" + token + "'");
        }
    }
    return ids;
}

} // anonymous namespace

// ============================================================================
// Budget
// ============================================================================

std::vector<BudgetItem> load_budget_items(std::istream& is) {
    CsvTable table(is, "Budget");
    table.require({"fact_id", "amount"});

    std::vector<BudgetItem> items;
    items.reserve(table.size());
    for (size_t r = 0; r < table.size(); ++r) {
        BudgetItem item;
        item.fact_id = table.integer(r, "fact_id");
        item.container_id = table.optional_integer(r, "container_id");
        item.container_label = table.text(r, "container_label");
        item.description = table.text(r, "description");
        item.activity = table.text(r, "activity");
        item.amount = table.number(r, "amount");
        item.start_period = table.optional_period(r, "start_period");
        item.periods_to_complete = table.optional_int(r, "periods_to_complete");
        item.end_period = table.optional_period(r, "end_period");
        item.timing_method = parse_timing_method(table.text(r, "timing_method"));
        item.curve_steepness = table.optional_number(r, "curve_steepness");
        item.escalation_rate = table.optional_number(r, "escalation_rate");
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<BudgetItem> load_budget_items(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_budget_items(file);
}

// ============================================================================
// Parcels
// ============================================================================

std::vector<ParcelSale> load_parcel_sales(std::istream& is) {
    CsvTable table(is, "Parcel");
    table.require({"parcel_id"});

    std::vector<ParcelSale> parcels;
    parcels.reserve(table.size());
    for (size_t r = 0; r < table.size(); ++r) {
        ParcelSale p;
        p.parcel_id = table.integer(r, "parcel_id");
        p.parcel_code = table.text(r, "parcel_code");
        p.container_id = table.optional_integer(r, "container_id");
        p.container_label = table.text(r, "container_label");
        p.division_id = table.optional_integer(r, "division_id");
        p.sale_period = table.optional_period(r, "sale_period");
        p.units = table.number(r, "units");
        p.acres = table.number(r, "acres");
        p.gross_revenue = table.number(r, "gross_revenue");
        p.net_revenue = table.number(r, "net_revenue");
        p.commissions = table.number(r, "commissions");
        p.legal_costs = table.number(r, "legal_costs");
        p.closing_costs = table.number(r, "closing_costs");
        p.title_costs = table.number(r, "title_costs");
        p.subdivision_costs = table.number(r, "subdivision_costs");
        parcels.push_back(std::move(p));
    }
    return parcels;
}

std::vector<ParcelSale> load_parcel_sales(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_parcel_sales(file);
}

// ============================================================================
// Acquisitions
// ============================================================================

std::vector<AcquisitionCost> load_acquisition_costs(std::istream& is) {
    CsvTable table(is, "Acquisition");
    table.require({"acquisition_id", "amount"});

    std::vector<AcquisitionCost> costs;
    costs.reserve(table.size());
    for (size_t r = 0; r < table.size(); ++r) {
        AcquisitionCost cost;
        cost.acquisition_id = table.integer(r, "acquisition_id");
        cost.description = table.text(r, "description");
        cost.amount = table.number(r, "amount");
        cost.applied_to_purchase = table.flag(r, "applied_to_purchase", true);
        costs.push_back(std::move(cost));
    }
    return costs;
}

std::vector<AcquisitionCost> load_acquisition_costs(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_acquisition_costs(file);
}

// ============================================================================
// Loans
// ============================================================================

std::vector<Loan> load_loans(std::istream& is) {
    CsvTable table(is, "Loan");
    table.require({"loan_id", "structure_type"});

    std::vector<Loan> loans;
    loans.reserve(table.size());
    for (size_t r = 0; r < table.size(); ++r) {
        Loan loan;
        loan.loan_id = table.integer(r, "loan_id");
        loan.loan_name = table.text(r, "loan_name");
        loan.structure_type = parse_structure_type(table.text(r, "structure_type"));
        loan.commitment_amount = table.number(r, "commitment_amount");
        loan.loan_amount = table.optional_number(r, "loan_amount");
        loan.interest_rate_pct = table.number(r, "interest_rate_pct");
        loan.loan_term_months = table.optional_int(r, "loan_term_months");
        loan.loan_term_years = table.optional_int(r, "loan_term_years");
        loan.amortization_months = table.optional_int(r, "amortization_months").value_or(0);
        loan.amortization_years = table.optional_int(r, "amortization_years");
        loan.interest_only_months = table.optional_int(r, "interest_only_months").value_or(0);
        loan.origination_fee_pct = table.number(r, "origination_fee_pct");
        loan.loan_to_cost_pct = table.number(r, "loan_to_cost_pct");
        loan.interest_reserve_inflator = table.optional_number(r, "interest_reserve_inflator");
        loan.repayment_acceleration = table.optional_number(r, "repayment_acceleration");
        loan.release_price_pct = table.number(r, "release_price_pct");
        loan.minimum_release_amount = table.number(r, "minimum_release_amount");
        loan.appraisal_costs = table.number(r, "appraisal_costs");
        loan.legal_costs = table.number(r, "legal_costs");
        loan.other_closing_costs = table.number(r, "other_closing_costs");
        loan.net_loan_proceeds = table.optional_number(r, "net_loan_proceeds");
        loan.interest_reserve_amount = table.number(r, "interest_reserve_amount");
        loan.draw_trigger_type = table.text(r, "draw_trigger_type");
        loan.takes_out_loan_id = table.optional_integer(r, "takes_out_loan_id");
        loan.container_ids = parse_id_list(table.text(r, "container_ids"));

        std::string start = table.text(r, "loan_start_date");
        if (!start.empty()) {
            loan.loan_start_date = Date::parse_iso(start);
        }
        loans.push_back(std::move(loan));
    }
    return loans;
}

std::vector<Loan> load_loans(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_loans(file);
}

// ============================================================================
// Divisions
// ============================================================================

std::vector<Division> load_divisions(std::istream& is) {
    CsvTable table(is, "Division");
    table.require({"division_id"});

    std::vector<Division> divisions;
    divisions.reserve(table.size());
    for (size_t r = 0; r < table.size(); ++r) {
        Division d;
        d.division_id = table.integer(r, "division_id");
        d.display_name = table.text(r, "display_name");
        d.option_deposit_pct = table.optional_number(r, "option_deposit_pct");
        d.option_deposit_cap_pct = table.optional_number(r, "option_deposit_cap_pct");
        d.retail_lot_price = table.optional_number(r, "retail_lot_price");
        d.premium_pct = table.optional_number(r, "premium_pct");
        divisions.push_back(std::move(d));
    }
    return divisions;
}

std::vector<Division> load_divisions(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_divisions(file);
}

// ============================================================================
// Project
// ============================================================================

ProjectInputs load_project_inputs(const ProjectConfig& config) {
    ProjectInputs inputs;
    inputs.project = config.project;
    inputs.dcf = config.dcf;

    if (!config.inputs.budget.empty()) {
        inputs.budget = load_budget_items(config.inputs.budget);
    }
    if (!config.inputs.parcels.empty()) {
        inputs.parcels = load_parcel_sales(config.inputs.parcels);
    }
    if (!config.inputs.acquisitions.empty()) {
        inputs.acquisitions = load_acquisition_costs(config.inputs.acquisitions);
    }
    if (!config.inputs.loans.empty()) {
        inputs.loans = load_loans(config.inputs.loans);
    }
    if (!config.inputs.divisions.empty()) {
        inputs.divisions = load_divisions(config.inputs.divisions);
    }

    return inputs;
}

} // namespace landcalc
