#include <bankres/BatchRunner.hpp>
#include <bankres/Model.hpp>
#include <bankres/debug.hpp>
#include <bankres/errors.hpp>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

namespace bankres {

std::vector<ParameterSweep::Point> ParameterSweep::combinations() const {
    // Unswept axes contribute the single base value
    auto axis = [](const auto &values, const auto &base) {
        using T = typename std::decay<decltype(base)>::type;
        return values.empty() ? std::vector<T>{base} : std::vector<T>(values.begin(), values.end());
    };
    const auto wd = axis(width, base.width);
    const auto ht = axis(height, base.height);
    const auto ag = axis(agents, base.agents);
    const auto ic = axis(initial_cash, base.initial_cash);
    const auto rr = axis(reserve_ratio, base.reserve_ratio);
    const auto rt = axis(rich_threshold, base.rich_threshold);
    const auto cc = axis(comfortable_cash, base.comfortable_cash);
    const auto st = axis(steps, default_steps);

    std::vector<Point> combos;
    combos.reserve(wd.size() * ht.size() * ag.size() * ic.size() * rr.size() * rt.size() * cc.size() * st.size());
    for (auto w : wd) for (auto h : ht) for (auto a : ag) for (auto i : ic) for (auto r : rr) for (auto t : rt)
    for (auto c : cc) for (auto n : st) {
        Point pt;
        pt.parameters = base;
        pt.parameters.width = w;
        pt.parameters.height = h;
        pt.parameters.agents = a;
        pt.parameters.initial_cash = i;
        pt.parameters.reserve_ratio = r;
        pt.parameters.rich_threshold = t;
        pt.parameters.comfortable_cash = c;
        pt.steps = n;
        combos.push_back(pt);
    }
    return combos;
}

void ParameterSweep::validate() const {
    if (iterations == 0)
        throw ConfigurationError("a sweep needs at least one iteration");
    for (const auto &pt : combinations()) {
        if (pt.steps == 0)
            throw ConfigurationError("a sweep needs at least one step per run");
        pt.parameters.validate();
    }
}

RunResult RunResult::capture(const Model &model, size_t run, unsigned int iteration) {
    RunResult r;
    r.run = run;
    r.iteration = iteration;
    r.parameters = model.parameters();
    r.planned_steps = model.t();
    r.ok = true;
    r.steps = model.statistics();
    r.steps_completed = static_cast<step_t>(r.steps.size());
    r.agents = model.data().agents();
    return r;
}

BatchRunner::BatchRunner(ParameterSweep sweep) : sweep_(std::move(sweep)) {
    sweep_.validate();

    size_t run = 1;
    for (const auto &pt : sweep_.combinations()) {
        for (unsigned int it = 1; it <= sweep_.iterations; it++, run++) {
            RunResult r;
            r.run = run;
            r.iteration = it;
            r.parameters = pt.parameters;
            r.planned_steps = pt.steps;
            r.parameters.seed = sweep_.base_seed + (run - 1);
            planned_.push_back(std::move(r));
        }
    }
}

void BatchRunner::maxThreads(unsigned long max_threads) {
    if (running_)
        throw std::runtime_error("Cannot change number of threads during a BatchRunner runAll() call");
    max_threads_ = max_threads;
}

void BatchRunner::onRunFinished(std::function<void(const RunResult&)> callback) {
    on_finished_ = std::move(callback);
}

void BatchRunner::onStep(std::function<void(const RunResult&, Model&)> hook) {
    on_step_ = std::move(hook);
}

size_t BatchRunner::failures() const {
    return std::count_if(results_.begin(), results_.end(), [](const RunResult &r) { return not r.ok; });
}

void BatchRunner::runAll() {
    if (running_.exchange(true))
        throw std::runtime_error("BatchRunner::runAll() is already running");

    results_ = planned_;
    next_ = 0;
    abort_ = false;
    BANKRES_TDBG("starting " << results_.size() << " runs on " << max_threads_ << " threads");

    if (max_threads_ == 0) {
        work();
    }
    else {
        const size_t n = std::min<size_t>(max_threads_, results_.size());
        std::vector<std::thread> pool;
        pool.reserve(n);
        for (size_t i = 0; i < n; i++)
            pool.emplace_back(&BatchRunner::work, this);
        for (auto &t : pool)
            t.join();
    }

    BANKRES_TDBG("finished " << results_.size() << " runs, " << failures() << " failed");
    running_ = false;
}

void BatchRunner::work() {
    size_t i;
    while ((i = next_++) < results_.size())
        runOne(i);
}

void BatchRunner::runOne(size_t i) {
    RunResult &r = results_[i];
    std::unique_ptr<Model> model;
    try {
        model.reset(new Model(r.parameters));
        while (model->t() < r.planned_steps and not abort_) {
            model->step();
            if (on_step_) on_step_(r, *model);
        }
        r.ok = model->t() == r.planned_steps;
        if (not r.ok) r.error = "aborted";
    }
    catch (const std::exception &e) {
        r.ok = false;
        r.error = e.what();
        BANKRES_DBG("run " << r.run << " failed: " << e.what());
    }

    if (model) {
        // A failed step records nothing, so this holds exactly the completed steps
        r.steps = model->statistics();
        r.agents = model->data().agents();
    }
    r.steps_completed = static_cast<step_t>(r.steps.size());

    if (on_finished_) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_finished_(r);
    }
}

}
