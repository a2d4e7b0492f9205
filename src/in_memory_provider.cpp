#include "in_memory_provider.hpp"
#include "errors.hpp"
#include <algorithm>

namespace landcalc {

namespace {

bool contains(const std::vector<int64_t>& ids, const std::optional<int64_t>& id) {
    return id && std::find(ids.begin(), ids.end(), *id) != ids.end();
}

// A parcel belongs to a filtered container through its phase or its division
bool parcel_in_filter(const ParcelSale& parcel, const ContainerFilter& containers) {
    if (!containers) {
        return true;
    }
    return contains(*containers, parcel.container_id) || contains(*containers, parcel.division_id);
}

} // anonymous namespace

InMemoryDataProvider::InMemoryDataProvider(ProjectInputs inputs) {
    add_project(std::move(inputs));
}

void InMemoryDataProvider::add_project(ProjectInputs inputs) {
    const int64_t id = inputs.project.project_id;
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [id](const ProjectInputs& p) { return p.project.project_id == id; });
    if (it != projects_.end()) {
        *it = std::move(inputs);
    } else {
        projects_.push_back(std::move(inputs));
    }
}

const ProjectInputs& InMemoryDataProvider::get(int64_t project_id) const {
    for (const ProjectInputs& p : projects_) {
        if (p.project.project_id == project_id) {
            return p;
        }
    }
    throw NotFoundError("project " + std::to_string(project_id));
}

std::optional<ProjectRecord> InMemoryDataProvider::find_project(int64_t project_id) const {
    for (const ProjectInputs& p : projects_) {
        if (p.project.project_id == project_id) {
            return p.project;
        }
    }
    return std::nullopt;
}

DcfAssumptions InMemoryDataProvider::dcf_assumptions(int64_t project_id) const {
    return get(project_id).dcf;
}

std::vector<BudgetItem> InMemoryDataProvider::budget_items(int64_t project_id,
                                                           const ContainerFilter& containers) const {
    const ProjectInputs& p = get(project_id);
    if (!containers) {
        return p.budget;
    }
    std::vector<BudgetItem> out;
    for (const BudgetItem& item : p.budget) {
        if (contains(*containers, item.container_id)) {
            out.push_back(item);
        }
    }
    return out;
}

std::vector<AcquisitionCost> InMemoryDataProvider::acquisition_costs(int64_t project_id) const {
    return get(project_id).acquisitions;
}

AcreageSplit InMemoryDataProvider::parcel_acreage(int64_t project_id,
                                                  const ContainerFilter& containers) const {
    AcreageSplit split;
    for (const ParcelSale& parcel : get(project_id).parcels) {
        split.total_acres += parcel.acres;
        if (parcel_in_filter(parcel, containers)) {
            split.filtered_acres += parcel.acres;
        }
    }
    return split;
}

std::vector<ParcelSale> InMemoryDataProvider::parcel_sales(int64_t project_id,
                                                           const ContainerFilter& containers) const {
    std::vector<ParcelSale> out;
    for (const ParcelSale& parcel : get(project_id).parcels) {
        if (parcel_in_filter(parcel, containers)) {
            out.push_back(parcel);
        }
    }
    return out;
}

std::vector<Loan> InMemoryDataProvider::loans(int64_t project_id,
                                              const ContainerFilter& containers) const {
    std::vector<Loan> out;
    for (const Loan& loan : get(project_id).loans) {
        if (loan.in_scope(containers)) {
            out.push_back(loan);
        }
    }
    return out;
}

std::vector<Division> InMemoryDataProvider::divisions(int64_t project_id) const {
    return get(project_id).divisions;
}

} // namespace landcalc
