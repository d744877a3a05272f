/// Single run of the Bank Reserves model.  Prints a line of statistics every `--report` steps and
/// writes the statistics collected so far to a CSV file at each checkpoint step.

#include "cli.hpp"
#include <bankres/BatchRunner.hpp>
#include <bankres/Model.hpp>
#include <bankres/output/CsvWriter.hpp>
#include <boost/format.hpp>
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace bankres;
namespace po = boost::program_options;
using boost::format;

int main(int argc, char *argv[]) {
    const Parameters d;
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this help")
        ("width", po::value<int>()->default_value(d.width), "grid width")
        ("height", po::value<int>()->default_value(d.height), "grid height")
        ("agents", po::value<unsigned int>()->default_value(d.agents), "population size")
        ("initial-cash", po::value<money_t>()->default_value(d.initial_cash), "initial cash of every person")
        ("reserve-ratio", po::value<double>()->default_value(d.reserve_ratio), "bank reserve ratio")
        ("rich-threshold", po::value<money_t>()->default_value(d.rich_threshold), "savings above which a person counts as rich")
        ("comfortable-cash", po::value<money_t>()->default_value(d.comfortable_cash), "working cash kept out of the bank")
        ("steps", po::value<step_t>()->default_value(1000), "number of steps")
        ("checkpoints", po::value<std::string>()->default_value("100,500,1000"), "steps at which to write the CSV file")
        ("report", po::value<step_t>()->default_value(100), "print statistics every this many steps (0 for never)")
        ("output-prefix", po::value<std::string>()->default_value("BankReservesModel_Step_Data_Single_Run"), "CSV file name prefix")
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

        Parameters params;
        cli::apply_model_options(vm, params);
        params.width = vm["width"].as<int>();
        params.height = vm["height"].as<int>();
        params.agents = vm["agents"].as<unsigned int>();
        params.initial_cash = vm["initial-cash"].as<money_t>();
        params.reserve_ratio = vm["reserve-ratio"].as<double>();
        params.rich_threshold = vm["rich-threshold"].as<money_t>();
        params.comfortable_cash = vm["comfortable-cash"].as<money_t>();
        const step_t steps = vm["steps"].as<step_t>();
        const step_t report = vm["report"].as<step_t>();
        const auto checkpoints = cli::parse_list<step_t>("checkpoints", vm["checkpoints"].as<std::string>());
        const std::string prefix = vm["output-prefix"].as<std::string>();

        Model model(params);
        std::cerr << "Model: " << params << "\n";

        for (step_t i = 0; i < steps; i++) {
            model.step();
            const StepStats &s = model.statistics().back();

            if (report > 0 and s.step % report == 0)
                std::cout << format("step %5d: rich=%d poor=%d middle=%d wallets=%d savings=%d loans=%d gini=%.3f\n")
                    % s.step % s.rich % s.poor % s.middle_class % s.wallets % s.savings % s.loans % s.gini;

            if (std::find(checkpoints.begin(), checkpoints.end(), s.step) != checkpoints.end()) {
                const std::vector<RunResult> results{RunResult::capture(model)};
                const std::string file = prefix + std::to_string(s.step) + ".csv";
                output::save(file, [&](std::ostream &os) { output::writeStepTable(os, results); });
                if (vm.count("agent-output"))
                    output::save(vm["agent-output"].as<std::string>(), [&](std::ostream &os) { output::writeAgentTable(os, results); });
                std::cerr << "Wrote " << file << "\n";
            }
        }
        return 0;
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
