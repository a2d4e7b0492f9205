#ifndef LANDCALC_IN_MEMORY_PROVIDER_HPP
#define LANDCALC_IN_MEMORY_PROVIDER_HPP

#include "data_provider.hpp"
#include <vector>

namespace landcalc {

// Everything a single project needs, held in memory
struct ProjectInputs {
    ProjectRecord project;
    DcfAssumptions dcf;
    std::vector<BudgetItem> budget;
    std::vector<AcquisitionCost> acquisitions;
    std::vector<ParcelSale> parcels;
    std::vector<Loan> loans;
    std::vector<Division> divisions;
};

// Provider over materialised vectors; holds any number of projects
class InMemoryDataProvider : public ProjectDataProvider {
public:
    InMemoryDataProvider() = default;
    explicit InMemoryDataProvider(ProjectInputs inputs);

    // Adds or replaces the project with the same id
    void add_project(ProjectInputs inputs);

    size_t size() const { return projects_.size(); }

    std::optional<ProjectRecord> find_project(int64_t project_id) const override;
    DcfAssumptions dcf_assumptions(int64_t project_id) const override;
    std::vector<BudgetItem> budget_items(int64_t project_id,
                                         const ContainerFilter& containers) const override;
    std::vector<AcquisitionCost> acquisition_costs(int64_t project_id) const override;
    AcreageSplit parcel_acreage(int64_t project_id,
                                const ContainerFilter& containers) const override;
    std::vector<ParcelSale> parcel_sales(int64_t project_id,
                                         const ContainerFilter& containers) const override;
    std::vector<Loan> loans(int64_t project_id,
                            const ContainerFilter& containers) const override;
    std::vector<Division> divisions(int64_t project_id) const override;

private:
    // Throws NotFoundError
    const ProjectInputs& get(int64_t project_id) const;

    std::vector<ProjectInputs> projects_;
};

} // namespace landcalc

#endif // LANDCALC_IN_MEMORY_PROVIDER_HPP
