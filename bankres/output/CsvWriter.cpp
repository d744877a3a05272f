#include <bankres/output/CsvWriter.hpp>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace bankres { namespace output {

namespace {
const char *param_header = "Run,Iteration,Seed,Width,Height,PlannedSteps,Agents,InitialCash,ReserveRatio,RichThreshold,ComfortableCash";
const char *stats_header = "Step,Rich,Poor,MiddleClass,Wallets,Savings,Loans,Money,Reserves,AvailableToLend,Gini,Trades,TradeVolume";
const size_t stats_fields = 13;

// Configured values are written as given (default stream precision); computed statistics with
// full round-trip precision.
const int param_precision = 6;
const int stats_precision = std::numeric_limits<double>::max_digits10;

void write_params(std::ostream &os, const RunResult &r) {
    const Parameters &p = r.parameters;
    os << std::setprecision(param_precision)
        << r.run << ',' << r.iteration << ',' << p.seed << ',' << p.width << ',' << p.height << ','
        << r.planned_steps << ',' << p.agents << ',' << p.initial_cash << ',' << p.reserve_ratio << ','
        << p.rich_threshold << ',' << p.comfortable_cash;
}

void write_stats(std::ostream &os, const StepStats &s) {
    os << std::setprecision(stats_precision)
        << s.step << ',' << s.rich << ',' << s.poor << ',' << s.middle_class << ',' << s.wallets << ','
        << s.savings << ',' << s.loans << ',' << s.money << ',' << s.reserves << ','
        << s.available_to_lend << ',' << s.gini << ',' << s.trades << ',' << s.trade_volume;
}
}

void writeStepTable(std::ostream &os, const std::vector<RunResult> &results, bool header) {
    if (header) os << param_header << ',' << stats_header << '\n';
    for (const auto &r : results) {
        for (const auto &s : r.steps) {
            write_params(os, r);
            os << ',';
            write_stats(os, s);
            os << '\n';
        }
    }
}

void writeRunTable(std::ostream &os, const std::vector<RunResult> &results) {
    os << param_header << ",Status,Error,StepsCompleted," << stats_header << '\n';
    for (const auto &r : results) {
        write_params(os, r);
        os << ',' << (r.ok ? "ok" : "failed") << ',' << quote(r.error) << ',' << r.steps_completed << ',';
        if (r.steps.empty())
            os << std::string(stats_fields - 1, ',');
        else
            write_stats(os, r.steps.back());
        os << '\n';
    }
}

void writeAgentTable(std::ostream &os, const std::vector<RunResult> &results) {
    os << "Run,Step,AgentId,Cash,Savings,Loans,Wealth\n";
    for (const auto &r : results) {
        for (const auto &a : r.agents) {
            os << r.run << ',' << a.step << ',' << a.id << ',' << a.cash << ',' << a.savings << ','
                << a.loans << ',' << a.wealth << '\n';
        }
    }
}

void save(const std::string &path, const std::function<void(std::ostream&)> &writer) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (not out)
        throw std::runtime_error("Unable to open " + path + " for writing");
    writer(out);
    out.flush();
    if (not out)
        throw std::runtime_error("Error writing " + path);
}

std::string quote(const std::string &field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos)
        return field;

    std::string q("\"");
    for (const char c : field) {
        if (c == '"') q += '"';
        q += c;
    }
    q += '"';
    return q;
}

}}
