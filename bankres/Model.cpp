#include <bankres/Model.hpp>
#include <bankres/debug.hpp>
#include <bankres/errors.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

namespace bankres {

const Parameters& Model::validated(const Parameters &params) {
    params.validate();
    return params;
}

Model::Model(const Parameters &params)
    : params_(validated(params)),
    rng_(params_.seed),
    bank_(params_.reserve_ratio),
    grid_(params_.width, params_.height, params_.topology, params_.neighbourhood),
    schedule_(params_.activation),
    data_(params_.rich_threshold, params_.poor_threshold, params_.collect_agent_data)
{
    people_.reserve(params_.agents);
    for (id_t id = 1; id <= params_.agents; id++) {
        Position p = grid_.randomCell(rng_);
        people_.emplace_back(new Person(id, p, bank_, params_.initial_cash));
        grid_.place(id, p);
        schedule_.add(id);
        initial_money_ += params_.initial_cash;
    }
    BANKRES_DBG("created model: " << params_);
}

Person& Model::person(id_t id) {
    if (id == 0 or id > people_.size())
        throw std::out_of_range("no person with id " + std::to_string(id));
    return *people_[id - 1];
}

const Person& Model::person(id_t id) const {
    if (id == 0 or id > people_.size())
        throw std::out_of_range("no person with id " + std::to_string(id));
    return *people_[id - 1];
}

void Model::step() {
    if (stage_ != RunStage::idle)
        throw std::logic_error("Model::step() cannot be called during a step");

    try {
        t_++;
        trades_.clear();

        stage_ = RunStage::activate;
        schedule_.step(rng_, [this](id_t id) {
            Person &p = person(id);
            Trade trade = p.step(*this);
            if (trade) trades_.push_back(trade);
            if (p.cash() < 0) {
                std::ostringstream msg;
                msg << "negative cash after activation at step " << t_ << ": " << p;
                throw InvariantViolation(msg.str());
            }
        });

        stage_ = RunStage::settle;
        for (auto &p : people_)
            p->settle(params_.comfortable_cash, params_.offset_loans_with_savings);
        checkConsistency();

        stage_ = RunStage::record;
        data_.collect(*this, trades_);
    }
    catch (...) {
        // Leave the model out of its step before reporting the failure
        stage_ = RunStage::idle;
        throw;
    }
    stage_ = RunStage::idle;

    BANKRES_DBG("step " << t_ << ": " << trades_.size() << " trades, savings=" << bank_.deposits()
            << " loans=" << bank_.loans());
}

step_t Model::run(step_t steps, const std::atomic<bool> *abort) {
    step_t done = 0;
    while (done < steps) {
        if (abort and abort->load()) {
            BANKRES_DBG("run aborted after " << done << " of " << steps << " steps");
            break;
        }
        step();
        done++;
    }
    return done;
}

void Model::checkConsistency() const {
    money_t savings = 0, loans = 0, money = 0;
    for (const auto &p : people_) {
        if (p->cash() < 0 or p->savings() < 0 or p->loans() < 0) {
            std::ostringstream msg;
            msg << "negative balance at step " << t_ << ": " << *p;
            throw InvariantViolation(msg.str());
        }
        savings += p->savings();
        loans += p->loans();
        money += p->cash() + p->savings();
    }

    if (savings != bank_.deposits())
        throw InvariantViolation("bank deposits " + std::to_string(bank_.deposits())
                + " do not match total savings " + std::to_string(savings));
    if (loans != bank_.loans())
        throw InvariantViolation("bank loans " + std::to_string(bank_.loans())
                + " do not match total loans " + std::to_string(loans));
    if (money != initial_money_ + bank_.loansIssued() - bank_.loansRepaid())
        throw InvariantViolation("total money " + std::to_string(money) + " is not the initial "
                + std::to_string(initial_money_) + " plus net lending "
                + std::to_string(bank_.loansIssued() - bank_.loansRepaid()));
}

}
