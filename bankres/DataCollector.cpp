#include <bankres/DataCollector.hpp>
#include <bankres/Bank.hpp>
#include <bankres/Model.hpp>
#include <algorithm>
#include <utility>

namespace bankres {

DataCollector::DataCollector(money_t rich_threshold, money_t poor_threshold, bool collect_agents)
    : rich_threshold_{rich_threshold}, poor_threshold_{poor_threshold}, collect_agents_{collect_agents}
{}

void DataCollector::collect(const Model &model, const std::vector<Trade> &trades) {
    StepStats s;
    s.step = model.t();

    std::vector<money_t> holdings;
    holdings.reserve(model.people().size());
    for (const auto &p : model.people()) {
        // A person exactly at a threshold is in none of the classes
        if (p->savings() > rich_threshold_) s.rich++;
        if (p->loans() > poor_threshold_) s.poor++;
        if (p->loans() < poor_threshold_ and p->savings() < rich_threshold_) s.middle_class++;

        s.wallets += p->cash();
        s.savings += p->savings();
        s.loans += p->loans();
        holdings.push_back(p->cash() + p->savings());

        if (collect_agents_) {
            AgentRecord r;
            r.step = s.step;
            r.id = p->id();
            r.cash = p->cash();
            r.savings = p->savings();
            r.loans = p->loans();
            r.wealth = p->wealth();
            agents_.push_back(r);
        }
    }
    s.money = s.wallets + s.savings;
    s.reserves = model.bank().reserveRequirement();
    s.available_to_lend = model.bank().availableToLend();
    s.gini = gini(std::move(holdings));

    s.trades = trades.size();
    for (const auto &t : trades) s.trade_volume += t.amount;

    steps_.push_back(s);
}

double DataCollector::gini(std::vector<money_t> values) {
    const size_t n = values.size();
    if (n == 0) return 0.0;

    std::sort(values.begin(), values.end());
    double total = 0, weighted = 0;
    for (size_t i = 0; i < n; i++) {
        total += values[i];
        weighted += static_cast<double>(i + 1) * values[i];
    }
    if (total <= 0) return 0.0;

    return 2.0 * weighted / (n * total) - (n + 1.0) / n;
}

}
