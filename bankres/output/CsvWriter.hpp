#pragma once
#include <bankres/BatchRunner.hpp>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace bankres {
/// Namespace for writing run results out as delimited tables
namespace output {

/** Writes the step table: a header line followed by one row per (run, step), with the run's
 * parameters followed by that step's statistics:
 *
 *     Run,Iteration,Seed,Width,Height,PlannedSteps,Agents,InitialCash,ReserveRatio,RichThreshold,
 *     ComfortableCash,Step,Rich,Poor,MiddleClass,Wallets,Savings,Loans,Money,Reserves,
 *     AvailableToLend,Gini,Trades,TradeVolume
 *
 * (all on one line).  Parameters are written with the stream's default precision, statistics
 * with full round-trip precision.  Failed runs contribute the rows of the steps they completed.  If `header`
 * is false the header line is omitted.
 */
void writeStepTable(std::ostream &os, const std::vector<RunResult> &results, bool header = true);

/** Writes the run summary table: one row per run with its parameters, `Status` (`ok` or
 * `failed`), the error message (see quote()), the number of completed steps and the statistics
 * of its last completed step (empty fields if it completed none).
 */
void writeRunTable(std::ostream &os, const std::vector<RunResult> &results);

/** Writes the agent table, `Run,Step,AgentId,Cash,Savings,Loans,Wealth`, one row per recorded
 * agent record.  Runs without agent data collection contribute no rows.
 */
void writeAgentTable(std::ostream &os, const std::vector<RunResult> &results);

/** Opens `path` for writing (truncating any existing file) and passes the stream to `writer`,
 * e.g.:
 *
 *     output::save("steps.csv", [&](std::ostream &os) { output::writeStepTable(os, results); });
 *
 * \throws std::runtime_error if the file cannot be opened or written.
 */
void save(const std::string &path, const std::function<void(std::ostream&)> &writer);

/** Quotes a field for CSV output if it contains a comma, quote or newline; embedded quotes are
 * doubled.  Other fields are returned unchanged.
 */
std::string quote(const std::string &field);

}}
