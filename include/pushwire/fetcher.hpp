/**
 * @file fetcher.hpp
 * @brief Message Fetcher: pull the relay queue, dedup through the ledger,
 *        confirm delivery.
 *
 * @details
 * One call to `fetch_pending()`:
 *  1. `GET messages` with the current token.
 *  2. Sort the batch by id, ascending. The relay normally sends it sorted;
 *     the sort makes the order a property of this function instead.
 *  3. Pass each message through `Ledger::accept()`. Only accepted ones are
 *     returned, so a second call with nothing new on the relay returns an
 *     empty sequence even if the relay sends the same batch again.
 *  4. Post the delivery receipt for the highest fetched id, so the relay drops
 *     the batch. A failed receipt is logged only: the ledger already prevents
 *     the redelivered batch from reaching the user.
 *
 * Any failure of step 1 (network, auth, malformed reply) is reported as
 * FetchError with the underlying code in the reason. The session treats it as
 * transient.
 *
 * Runs on the worker thread. Not reentrant; the session keeps at most one
 * fetch in flight.
 */
#ifndef PUSHWIRE_FETCHER_HPP
#define PUSHWIRE_FETCHER_HPP

#include <vector>

#include "pushwire/credentials.hpp"
#include "pushwire/errors.hpp"
#include "pushwire/ledger.hpp"
#include "pushwire/message.hpp"
#include "pushwire/relay_api.hpp"

namespace pushwire {

class MessageFetcher {
public:
  MessageFetcher(IRelayApi& api, ICredentialStore& credentials, Ledger& ledger);

  /// Newly accepted messages, ascending id. Empty is a valid result.
  bool fetch_pending(std::vector<MessagePtr>& out, Error& err);

private:
  IRelayApi&        api_;
  ICredentialStore& credentials_;
  Ledger&           ledger_;
};

} // namespace pushwire

#endif // PUSHWIRE_FETCHER_HPP
