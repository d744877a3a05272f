#pragma once
#include <bankres/DataCollector.hpp>
#include <bankres/Parameters.hpp>
#include <bankres/noncopyable.hpp>
#include <bankres/types.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace bankres {

class Model;

/** A parameter sweep: a base configuration, lists of values for the swept parameters, and how
 * many times and for how long each combination is run.
 *
 * An empty value list means the parameter is not swept and keeps its value from `base` (or, for
 * `steps`, `default_steps`).  The combinations are enumerated with the first axis (width)
 * varying slowest and the last axis (steps) varying fastest, as in a nested loop in declaration
 * order.
 */
struct ParameterSweep {
    /// Values for every parameter that is not swept
    Parameters base;

    /// Grid widths to sweep
    std::vector<int> width;
    /// Grid heights to sweep
    std::vector<int> height;
    /// Population sizes to sweep
    std::vector<unsigned int> agents;
    /// Initial cash amounts to sweep
    std::vector<money_t> initial_cash;
    /// Reserve ratios to sweep
    std::vector<double> reserve_ratio;
    /// Rich thresholds to sweep
    std::vector<money_t> rich_threshold;
    /// Comfortable cash thresholds to sweep
    std::vector<money_t> comfortable_cash;
    /// Run lengths (in steps) to sweep
    std::vector<step_t> steps;

    /// Number of steps in every run when `steps` is empty
    step_t default_steps = 1000;
    /// Number of runs (with different seeds) of every combination
    unsigned int iterations = 1;
    /// Seed of the first run; run `i` (1-based) uses `base_seed + i - 1`
    std::uint64_t base_seed = 0;

    /// One point of the sweep: model parameters (without a seed) and run length.
    struct Point {
        Parameters parameters;
        step_t steps = 0;
    };

    /** Returns every combination, in enumeration order. */
    std::vector<Point> combinations() const;

    /** Checks the sweep: `iterations` and every run length must be positive and every
     * combination must pass Parameters::validate().
     *
     * \throws ConfigurationError describing the first problem found.
     */
    void validate() const;
};

/** The outcome of one run of a batch. */
struct RunResult {
    /// The run number, starting at 1, in enumeration order
    size_t run = 0;
    /// Which repetition of its parameter combination this run is, starting at 1
    unsigned int iteration = 0;
    /// The parameters of the run, including its seed
    Parameters parameters;
    /// The number of steps the run was to make
    step_t planned_steps = 0;
    /// True if the run completed all of its steps
    bool ok = false;
    /// Why the run failed, if it did
    std::string error;
    /// Number of steps completed (and recorded)
    step_t steps_completed = 0;
    /// The statistics of every completed step
    std::vector<StepStats> steps;
    /// Per-agent records, if agent data collection was enabled
    std::vector<AgentRecord> agents;

    /** Builds a (successful) result from a model that has been run: copies the model's
     * parameters, statistics and agent records.  The planned length is the number of steps run.
     */
    static RunResult capture(const Model &model, size_t run = 1, unsigned int iteration = 1);
};

/** Runs every combination of a ParameterSweep, `iterations` times each, and collects the results.
 *
 * Each run is isolated: it owns its Model, and an exception thrown by one run is recorded in that
 * run's RunResult (as a failed run, with the statistics of the steps it completed) without
 * affecting any other run.  Invalid configurations, on the other hand, are rejected when the
 * BatchRunner is constructed, before anything runs.
 */
class BatchRunner final : private noncopyable {
    public:
        /** Creates a runner for the given sweep.
         *
         * \throws ConfigurationError if the sweep is invalid.
         */
        explicit BatchRunner(ParameterSweep sweep);

        /// The sweep being run.
        const ParameterSweep& sweep() const { return sweep_; }

        /** Sets the maximum number of worker threads for runAll().  The default, 0, runs everything
         * on the calling thread.  Because runs share nothing, results are identical for any
         * number of threads; only the order of calls to the finished callback varies.
         *
         * \throws std::runtime_error if called during runAll().
         */
        void maxThreads(unsigned long max_threads);

        /// Returns the maximum number of worker threads.
        unsigned long maxThreads() const { return max_threads_; }

        /** Sets a callback invoked after each run finishes (successfully or not).  Calls are
         * serialized, but when using threads they may come from any worker thread and in any
         * order.  The callback must not throw.
         */
        void onRunFinished(std::function<void(const RunResult&)> callback);

        /** Sets a hook invoked after every recorded step of every run, with the run's plan (run
         * number, iteration, parameters and length) and its model, e.g. to report progress or to intervene in a run.  If the hook
         * throws, that run stops and is reported as failed with the exception's message; other
         * runs are unaffected.  With worker threads the hook is called concurrently for
         * different runs.
         */
        void onStep(std::function<void(const RunResult&, Model&)> hook);

        /// The total number of runs: combinations times iterations.
        size_t runCount() const { return planned_.size(); }

        /** Runs every planned run and stores the results (replacing those of any previous call).
         *
         * \throws std::runtime_error if called during another runAll() call.
         */
        void runAll();

        /** Requests that the current runAll() call stop early.  Runs in progress stop before their next step and are
         * reported as failed with the error "aborted"; runs not yet started are reported the same
         * way, with zero steps completed.
         */
        void abort() { abort_ = true; }

        /// The results of the last runAll() call, in run order.
        const std::vector<RunResult>& results() const { return results_; }

        /// The number of failed runs in results().
        size_t failures() const;

    private:
        ParameterSweep sweep_;
        // Run plan: parameters (with seed) and iteration of each run, in run order
        std::vector<RunResult> planned_;
        std::vector<RunResult> results_;
        unsigned long max_threads_ = 0;
        std::atomic<bool> running_{false};
        std::atomic<bool> abort_{false};
        std::atomic<size_t> next_{0};
        std::function<void(const RunResult&)> on_finished_;
        std::function<void(const RunResult&, Model&)> on_step_;
        std::mutex callback_mutex_;

        // Executes run `i` of the plan into results_[i]
        void runOne(size_t i);

        // Worker loop: takes runs off the shared queue until none remain
        void work();
};

}
