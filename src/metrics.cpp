#include "metrics.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace landcalc {

namespace {

constexpr int kNewtonMaxIterations = 100;
constexpr double kIrrTolerance = 1e-10;
constexpr double kIrrLowerBound = -0.9999;
constexpr double kIrrUpperBound = 10.0;

// NPV derivative with respect to the rate
double npv_derivative(double rate, const std::vector<double>& cash_flows) {
    double d = 0.0;
    for (size_t t = 1; t < cash_flows.size(); ++t) {
        double tt = static_cast<double>(t);
        d -= tt * cash_flows[t] / std::pow(1.0 + rate, tt + 1.0);
    }
    return d;
}

std::optional<double> newton_irr(const std::vector<double>& cash_flows) {
    double rate = 0.1;
    for (int i = 0; i < kNewtonMaxIterations; ++i) {
        double f = npv(rate, cash_flows);
        double df = npv_derivative(rate, cash_flows);
        if (df == 0.0 || !std::isfinite(f) || !std::isfinite(df)) {
            return std::nullopt;
        }
        double next = rate - f / df;
        if (!std::isfinite(next) || next <= -1.0) {
            return std::nullopt;
        }
        if (std::abs(next - rate) < kIrrTolerance) {
            return next;
        }
        rate = next;
    }
    return std::nullopt;
}

std::optional<double> bisection_irr(const std::vector<double>& cash_flows) {
    // Scan for the bracket closest to zero, then bisect it
    const int steps = 1000;
    const double width = (kIrrUpperBound - kIrrLowerBound) / steps;
    std::optional<std::pair<double, double>> best;
    double prev_rate = kIrrLowerBound;
    double prev_value = npv(prev_rate, cash_flows);
    for (int i = 1; i <= steps; ++i) {
        double rate = kIrrLowerBound + width * i;
        double value = npv(rate, cash_flows);
        if (std::isfinite(prev_value) && std::isfinite(value) &&
            (prev_value == 0.0 || (prev_value < 0.0) != (value < 0.0))) {
            if (!best || std::abs(prev_rate) < std::abs(best->first)) {
                best = std::make_pair(prev_rate, rate);
            }
        }
        prev_rate = rate;
        prev_value = value;
    }
    if (!best) {
        return std::nullopt;
    }

    double lo = best->first;
    double hi = best->second;
    double f_lo = npv(lo, cash_flows);
    for (int i = 0; i < 200 && hi - lo > kIrrTolerance; ++i) {
        double mid = 0.5 * (lo + hi);
        double f_mid = npv(mid, cash_flows);
        if (f_mid == 0.0) {
            return mid;
        }
        if ((f_lo < 0.0) == (f_mid < 0.0)) {
            lo = mid;
            f_lo = f_mid;
        } else {
            hi = mid;
        }
    }
    return 0.5 * (lo + hi);
}

std::string to_upper(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

CostsByCategory bucket_costs(const CostSchedule& costs) {
    CostsByCategory buckets;
    for (const auto& entry : costs.category_summary) {
        const std::string name = to_upper(entry.first);
        const double total = entry.second.total;
        if (name.find("ACQUISITION") != std::string::npos) {
            buckets.acquisition += total;
        } else if (name.find("PLANNING") != std::string::npos ||
                   name.find("ENGINEERING") != std::string::npos) {
            buckets.planning += total;
        } else if (name.find("IMPROVEMENT") != std::string::npos ||
                   name.find("DEVELOPMENT") != std::string::npos) {
            buckets.development += total;
        } else if (name.find("FINANCING") != std::string::npos) {
            buckets.financing += total;
        } else if (name.find("CONTINGENCY") != std::string::npos) {
            buckets.contingency += total;
        } else {
            buckets.other += total;
        }
    }
    return buckets;
}

} // anonymous namespace

CostsByCategory::CostsByCategory()
    : acquisition(0.0),
      planning(0.0),
      development(0.0),
      financing(0.0),
      contingency(0.0),
      other(0.0) {}

SummaryMetrics::SummaryMetrics()
    : total_gross_revenue(0.0),
      total_commissions(0.0),
      total_transaction_costs(0.0),
      total_subdivision_costs(0.0),
      total_revenue_deductions(0.0),
      total_net_revenue(0.0),
      total_costs(0.0),
      gross_profit(0.0),
      peak_equity(0.0),
      total_cash_in(0.0),
      total_cash_out(0.0),
      net_cash_flow(0.0) {}

// ============================================================================
// Financial Functions
// ============================================================================

double npv(double rate, const std::vector<double>& cash_flows) {
    double total = 0.0;
    for (size_t t = 0; t < cash_flows.size(); ++t) {
        total += cash_flows[t] / std::pow(1.0 + rate, static_cast<double>(t));
    }
    return total;
}

std::optional<double> irr(const std::vector<double>& cash_flows) {
    bool has_positive = std::any_of(cash_flows.begin(), cash_flows.end(),
                                    [](double cf) { return cf > 0.0; });
    bool has_negative = std::any_of(cash_flows.begin(), cash_flows.end(),
                                    [](double cf) { return cf < 0.0; });
    if (!has_positive || !has_negative) {
        return std::nullopt;
    }

    if (auto rate = newton_irr(cash_flows)) {
        return rate;
    }
    return bisection_irr(cash_flows);
}

double monthly_rate_from_annual(double annual_rate) {
    return std::pow(1.0 + annual_rate, 1.0 / 12.0) - 1.0;
}

std::optional<double> equity_multiple(double total_inflows, double total_outflows) {
    double out = std::abs(total_outflows);
    if (out == 0.0) {
        return std::nullopt;
    }
    return total_inflows / out;
}

// ============================================================================
// Aggregation
// ============================================================================

std::vector<double> build_net_cash_flows(const std::vector<Section>& sections, size_t period_count) {
    std::vector<double> flows(period_count, 0.0);
    for (const Section& section : sections) {
        if (!contributes_to_net_cash_flow(section.kind)) {
            continue;
        }
        for (const LineItem& item : section.line_items) {
            for (const PeriodAmount& pa : item.periods) {
                if (pa.period_index < period_count) {
                    flows[pa.period_index] += pa.amount;
                }
            }
        }
    }
    return flows;
}

std::vector<double> aggregate_to_annual(const std::vector<double>& monthly,
                                        const std::vector<Period>& periods) {
    std::map<int, double> by_year;
    for (size_t i = 0; i < monthly.size() && i < periods.size(); ++i) {
        by_year[periods[i].start_date.year] += monthly[i];
    }
    std::vector<double> annual;
    annual.reserve(by_year.size());
    for (const auto& entry : by_year) {
        annual.push_back(entry.second);
    }
    return annual;
}

// ============================================================================
// Summary
// ============================================================================

SummaryMetrics calculate_summary_metrics(const std::vector<Section>& sections,
                                         const std::vector<Period>& periods,
                                         const AbsorptionSchedule& absorption,
                                         const CostSchedule& costs,
                                         std::optional<double> discount_rate) {
    SummaryMetrics m;

    m.total_gross_revenue = absorption.total_gross_revenue;
    m.total_commissions = absorption.total_commissions;
    m.total_transaction_costs = absorption.total_closing_costs;
    m.total_subdivision_costs = absorption.total_subdivision_costs;
    m.total_revenue_deductions =
        m.total_commissions + m.total_transaction_costs + m.total_subdivision_costs;
    m.total_net_revenue = absorption.total_net_revenue;

    m.total_costs = costs.total_costs;
    m.costs_by_category = bucket_costs(costs);
    m.gross_profit = m.total_net_revenue - m.total_costs;
    if (m.total_net_revenue > 0.0) {
        m.gross_margin = m.gross_profit / m.total_net_revenue;
    }

    const std::vector<double> flows = build_net_cash_flows(sections, periods.size());
    m.annual_cash_flows = aggregate_to_annual(flows, periods);

    if (m.annual_cash_flows.size() >= 2) {
        m.irr = irr(m.annual_cash_flows);
    }
    if (discount_rate && *discount_rate > 0.0) {
        m.npv = npv(monthly_rate_from_annual(*discount_rate), flows);
    }

    double running = 0.0;
    m.cumulative_cash_flow.reserve(flows.size());
    for (size_t i = 0; i < flows.size(); ++i) {
        const double cf = flows[i];
        if (cf > 0.0) {
            m.total_cash_in += cf;
        } else if (cf < 0.0) {
            m.total_cash_out -= cf;
        }
        running += cf;
        m.cumulative_cash_flow.push_back(running);
        m.peak_equity = std::min(m.peak_equity, running);
        if (!m.payback_period && running >= 0.0) {
            m.payback_period = i;
        }
    }

    m.equity_multiple = equity_multiple(m.total_cash_in, m.total_cash_out);
    m.net_cash_flow = m.total_cash_in - m.total_cash_out;

    return m;
}

} // namespace landcalc
