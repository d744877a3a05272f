/// Parameter sweep of the Bank Reserves model.  Runs every combination of the swept parameters and
/// writes the statistics of every step of every run to a CSV file once the whole batch is done.

#include "cli.hpp"
#include <bankres/BatchRunner.hpp>
#include <bankres/output/CsvWriter.hpp>
#include <boost/format.hpp>
#include <iostream>
#include <string>

using namespace bankres;
namespace po = boost::program_options;
using boost::format;

int main(int argc, char *argv[]) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this help")
        ("width", po::value<std::string>()->default_value("20"), "grid widths to sweep")
        ("height", po::value<std::string>()->default_value("20"), "grid heights to sweep")
        ("agents", po::value<std::string>()->default_value("25,100,150,200"), "population sizes to sweep")
        ("initial-cash", po::value<std::string>()->default_value("10"), "initial cash amounts to sweep")
        ("reserve-ratio", po::value<std::string>()->default_value("0,0.5,1"), "reserve ratios to sweep")
        ("rich-threshold", po::value<std::string>()->default_value("5,10,15,20"), "rich thresholds to sweep")
        ("comfortable-cash", po::value<std::string>()->default_value("0"), "working cash thresholds to sweep")
        ("iterations", po::value<unsigned int>()->default_value(1), "runs of each combination")
        ("steps", po::value<std::string>()->default_value("1000"), "run lengths (steps per run) to sweep")
        ("threads", po::value<unsigned long>()->default_value(0), "worker threads (0 runs everything on the main thread)")
        ("output,o", po::value<std::string>()->default_value("BankReservesModel_Step_Data.csv"), "step table CSV file")
        ("runs-output", po::value<std::string>()->default_value("BankReservesModel_Run_Data.csv"), "run summary CSV file")
        ;
    cli::add_model_options(desc);

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << "Usage: " << argv[0] << " [options]\n\n" << desc << "\n";
            return 0;
        }

        ParameterSweep sweep;
        cli::apply_model_options(vm, sweep.base);
        sweep.width = cli::parse_list<int>("width", vm["width"].as<std::string>());
        sweep.height = cli::parse_list<int>("height", vm["height"].as<std::string>());
        sweep.agents = cli::parse_list<unsigned int>("agents", vm["agents"].as<std::string>());
        sweep.initial_cash = cli::parse_list<money_t>("initial-cash", vm["initial-cash"].as<std::string>());
        sweep.reserve_ratio = cli::parse_list<double>("reserve-ratio", vm["reserve-ratio"].as<std::string>());
        sweep.rich_threshold = cli::parse_list<money_t>("rich-threshold", vm["rich-threshold"].as<std::string>());
        sweep.comfortable_cash = cli::parse_list<money_t>("comfortable-cash", vm["comfortable-cash"].as<std::string>());
        sweep.iterations = vm["iterations"].as<unsigned int>();
        sweep.steps = cli::parse_list<step_t>("steps", vm["steps"].as<std::string>());
        sweep.base_seed = sweep.base.seed;

        BatchRunner runner(sweep);
        runner.maxThreads(vm["threads"].as<unsigned long>());

        const size_t total = runner.runCount();
        std::cerr << format("Running %d runs (base seed %d)\n") % total % sweep.base_seed;
        runner.onRunFinished([total](const RunResult &r) {
            if (r.ok)
                std::cerr << format("  run %d/%d done: grid=%dx%d steps=%d agents=%d reserve_ratio=%g rich_threshold=%d\n")
                    % r.run % total % r.parameters.width % r.parameters.height % r.planned_steps
                    % r.parameters.agents % r.parameters.reserve_ratio % r.parameters.rich_threshold;
            else
                std::cerr << format("  run %d/%d FAILED after %d steps: %s\n") % r.run % total % r.steps_completed % r.error;
        });
        runner.runAll();

        const auto &results = runner.results();
        output::save(vm["output"].as<std::string>(), [&](std::ostream &os) { output::writeStepTable(os, results); });
        output::save(vm["runs-output"].as<std::string>(), [&](std::ostream &os) { output::writeRunTable(os, results); });
        if (vm.count("agent-output"))
            output::save(vm["agent-output"].as<std::string>(), [&](std::ostream &os) { output::writeAgentTable(os, results); });

        std::cerr << format("Wrote %s (%d failed runs)\n") % vm["output"].as<std::string>() % runner.failures();
        return runner.failures() == 0 ? 0 : 1;
    }
    catch (const po::error &e) {
        std::cerr << "Error: " << e.what() << "\n\n" << desc << "\n";
        return 2;
    }
    catch (const ConfigurationError &e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
