#pragma once
#include <cstdint>
#include <cstddef>

/** \file bankres/types.hpp basic types
 *
 * This header includes the basic typedefs for bankres::id_t, bankres::step_t and
 * bankres::money_t.
 */

namespace bankres {
/** Integer type that stores a unique id for each Person in a Model.
 *
 * - ids are assigned by the Model when the population is created, sequentially starting at 1.
 * - An id of 0 is never assigned.
 * - ids are unique within a Model; people are never removed during a run, so ids are never
 *   reused.
 *
 * Note that attempting to use this name via `using namespace bankres;` can result in ambiguous
 * use (conflicting with the `id_t` C typedef from system headers); import it explicitly (`using
 * bankres::id_t;`) or always qualify it.
 */
using id_t = std::uint64_t;

/** Unsigned integer type counting simulation steps.  Step 1 is the first completed step; 0 means
 * no step has run yet.
 */
using step_t = std::uint32_t;

/** Integer type for amounts of money.  Every trade moves a whole number of dollars, so balances
 * are kept exact; the type is signed so that a payer's transient deficit (before it is covered
 * by savings and loans) is representable.
 */
using money_t = std::int64_t;

/** std::size_t alias primarily for internal bankres use. */
using size_t = std::size_t;

}
