#pragma once
// Command line helpers shared by the bankres example drivers.

#include <bankres/Parameters.hpp>
#include <bankres/errors.hpp>
#include <bankres/random/rng.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace bankres { namespace cli {

namespace po = boost::program_options;

/** Parses a comma-separated list such as "25,100,150" into values of type T.
 *
 * \throws ConfigurationError naming `option` if the list is empty or any element doesn't parse.
 */
template <typename T>
std::vector<T> parse_list(const std::string &option, const std::string &text) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, text, boost::algorithm::is_any_of(","));
    std::vector<T> values;
    for (auto &part : parts) {
        boost::algorithm::trim(part);
        if (part.empty()) continue;
        try {
            values.push_back(boost::lexical_cast<T>(part));
        }
        catch (const boost::bad_lexical_cast&) {
            throw ConfigurationError("invalid value '" + part + "' for --" + option);
        }
    }
    if (values.empty())
        throw ConfigurationError("--" + option + " needs at least one value");
    return values;
}

/// Parses "bounded" or "torus".
inline Topology parse_topology(const std::string &s) {
    if (s == "bounded") return Topology::bounded;
    if (s == "torus") return Topology::torus;
    throw ConfigurationError("invalid topology '" + s + "' (expected bounded or torus)");
}

/// Parses "moore" or "von_neumann".
inline Neighbourhood parse_neighbourhood(const std::string &s) {
    if (s == "moore") return Neighbourhood::moore;
    if (s == "von_neumann") return Neighbourhood::von_neumann;
    throw ConfigurationError("invalid neighbourhood '" + s + "' (expected moore or von_neumann)");
}

/// Parses "random" or "sequential".
inline Activation parse_activation(const std::string &s) {
    if (s == "random") return Activation::random;
    if (s == "sequential") return Activation::sequential;
    throw ConfigurationError("invalid activation '" + s + "' (expected random or sequential)");
}

/** Adds the options describing the model's environment (everything a batch never sweeps) to
 * `desc`.
 */
inline void add_model_options(po::options_description &desc) {
    const Parameters d;
    desc.add_options()
        ("topology", po::value<std::string>()->default_value(to_string(d.topology)), "grid edges: bounded or torus")
        ("neighbourhood", po::value<std::string>()->default_value(to_string(d.neighbourhood)), "movement: moore or von_neumann")
        ("activation", po::value<std::string>()->default_value(to_string(d.activation)), "activation order: random or sequential")
        ("poor-threshold", po::value<money_t>()->default_value(d.poor_threshold), "loans above which a person counts as poor")
        ("no-offset", "do not use savings to pay down loans during settlement")
        ("agent-output", po::value<std::string>(), "also write per-agent balances to this CSV file")
        ("seed", po::value<std::uint64_t>(), "random seed (default: drawn from the system)")
        ;
}

/** Fills the environment fields of `p` from parsed options added by add_model_options().  The
 * seed is taken from --seed, or drawn from the system if absent.
 */
inline void apply_model_options(const po::variables_map &vm, Parameters &p) {
    p.topology = parse_topology(vm["topology"].as<std::string>());
    p.neighbourhood = parse_neighbourhood(vm["neighbourhood"].as<std::string>());
    p.activation = parse_activation(vm["activation"].as<std::string>());
    p.poor_threshold = vm["poor-threshold"].as<money_t>();
    p.offset_loans_with_savings = vm.count("no-offset") == 0;
    p.collect_agent_data = vm.count("agent-output") > 0;
    p.seed = vm.count("seed") ? vm["seed"].as<std::uint64_t>() : random::seed();
}

}}
