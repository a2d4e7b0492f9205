/**
 * @file data_provider.hpp
 * @brief Read-only access to the records a projection consumes
 *
 * The projection engine never talks to a store directly. Everything it needs
 * (budget, parcels, loans, divisions, project and DCF assumptions) arrives
 * through this interface fully materialised, so a projection is a pure
 * function of what the provider returns.
 */

#ifndef LANDCALC_DATA_PROVIDER_HPP
#define LANDCALC_DATA_PROVIDER_HPP

#include "budget.hpp"
#include "loan.hpp"
#include "parcel.hpp"
#include "project.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace landcalc {

using ContainerFilter = std::optional<std::vector<int64_t>>;

/**
 * @brief Abstract source of projection inputs
 *
 * Container filters are division ids. An empty optional means the whole
 * project. Implementations must be safe to query repeatedly with the same
 * arguments and return the same answer each time.
 */
class ProjectDataProvider {
public:
    virtual ~ProjectDataProvider() = default;

    /**
     * @brief Look up the project record
     * @return Empty when the project does not exist
     */
    virtual std::optional<ProjectRecord> find_project(int64_t project_id) const = 0;

    virtual DcfAssumptions dcf_assumptions(int64_t project_id) const = 0;

    /**
     * @brief Budget items, restricted to the filtered containers when a filter is given
     */
    virtual std::vector<BudgetItem> budget_items(int64_t project_id,
                                                 const ContainerFilter& containers) const = 0;

    virtual std::vector<AcquisitionCost> acquisition_costs(int64_t project_id) const = 0;

    /**
     * @brief Total project acreage and the acreage of filtered parcels
     */
    virtual AcreageSplit parcel_acreage(int64_t project_id,
                                        const ContainerFilter& containers) const = 0;

    virtual std::vector<ParcelSale> parcel_sales(int64_t project_id,
                                                 const ContainerFilter& containers) const = 0;

    /**
     * @brief Loans in scope: all loans without a filter, else loans assigned
     *        to at least one filtered container
     */
    virtual std::vector<Loan> loans(int64_t project_id,
                                    const ContainerFilter& containers) const = 0;

    virtual std::vector<Division> divisions(int64_t project_id) const = 0;
};

} // namespace landcalc

#endif // LANDCALC_DATA_PROVIDER_HPP
