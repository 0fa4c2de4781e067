#include "pushwire/fetcher.hpp"
#include "pushwire/log.hpp"

#include <algorithm>
#include <string>

namespace pushwire {

MessageFetcher::MessageFetcher(IRelayApi& api, ICredentialStore& credentials, Ledger& ledger)
: api_(api), credentials_(credentials), ledger_(ledger) {}

bool MessageFetcher::fetch_pending(std::vector<MessagePtr>& out, Error& err) {
  out.clear();

  const auto token = credentials_.get_token();
  if (!token) {
    err.set(ErrorCode::FetchError, "auth_error: no token");
    return false;
  }

  std::vector<MessagePtr> batch;
  Error api_err;
  if (!api_.fetch_messages(*token, batch, api_err)) {
    err.set(ErrorCode::FetchError, std::string(to_string(api_err.code)) + ": " + api_err.reason);
    return false;
  }
  if (batch.empty()) return true;

  std::stable_sort(batch.begin(), batch.end(),
                   [](const MessagePtr& a, const MessagePtr& b) { return a->id < b->id; });

  for (const auto& m : batch) {
    if (ledger_.accept(*m)) out.push_back(m);
  }

  const int64_t highest = batch.back()->id;
  Error receipt_err;
  if (!api_.update_highest_message(*token, highest, receipt_err)) {
    log::warn("delivery_receipt_failed", {{"id", std::to_string(highest)},
                                          {"code", to_string(receipt_err.code)},
                                          {"reason", receipt_err.reason}});
  }

  log::info("fetch_done", {{"fetched", std::to_string(batch.size())},
                           {"accepted", std::to_string(out.size())},
                           {"last_id", std::to_string(ledger_.last_message_id())}});
  return true;
}

} // namespace pushwire
