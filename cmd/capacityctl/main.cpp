#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "capacity/manager/v1.hpp"

using namespace capacity::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  capacityctl <addr> start-auction lifetime <tps> | daily <days>      (root)\n"
            << "  capacityctl <addr> bid <account> <auction_id> <amount>\n"
            << "  capacityctl <addr> claim <account> <auction_id> [beneficiary]\n"
            << "  capacityctl <addr> auction <auction_id>\n"
            << "  capacityctl <addr> lock <account> <amount>\n"
            << "  capacityctl <addr> unlock <account> <local_id>\n"
            << "  capacityctl <addr> subscription <owner> <local_id>\n"
            << "  capacityctl <addr> subscriptions [owner]\n"
            << "  capacityctl <addr> validate <signer> <owner> <local_id> <operation> <estimated_cost>\n"
            << "  capacityctl <addr> call <signer> <owner> <local_id> <operation> <estimated_cost>\n"
            << "  capacityctl <addr> stats\n"
            << "  capacityctl <addr> events\n";
}

static uint64_t ParseU64(const std::string& s) {
  try {
    size_t     pos   = 0;
    const auto value = std::stoull(s, &pos);
    if (pos == s.size()) return value;
  } catch (const std::exception&) {
  }
  std::cerr << "invalid number: '" << s << "'\n";
  std::exit(1);
}

static uint32_t ParseU32(const std::string& s) {
  const auto value = ParseU64(s);
  if (value > UINT32_MAX) {
    std::cerr << "number out of range: '" << s << "'\n";
    std::exit(1);
  }
  return static_cast<uint32_t>(value);
}

static Origin SignedOrigin(const std::string& account) {
  Origin origin;
  origin.set_signed_(account);
  return origin;
}

static Origin RootOrigin() {
  Origin origin;
  origin.set_root(true);
  return origin;
}

static const char* RejectionName(Rejection rejection) {
  switch (rejection) {
    case REJECTION_NONE:
      return "none";
    case REJECTION_NOT_FOUND:
      return "not_found";
    case REJECTION_SUBSCRIPTION_EXPIRED:
      return "subscription_expired";
    case REJECTION_QUOTA_EXHAUSTED:
      return "quota_exhausted";
    case REJECTION_BAD_ORIGIN:
      return "bad_origin";
    default:
      return "unknown";
  }
}

static void PrintSubscription(const Subscription& s) {
  std::cout << s.key().owner() << "/" << s.key().local_id() << " free_weight=" << s.free_weight();
  if (s.mode().has_lifetime()) {
    std::cout << " mode=lifetime tps=" << s.mode().lifetime().tps();
  } else {
    std::cout << " mode=daily days=" << s.mode().daily().days();
  }
  if (s.has_expiration_time_ms()) std::cout << " expires_ms=" << s.expiration_time_ms();
  if (s.has_locked_amount()) std::cout << " locked=" << s.locked_amount();
  std::cout << "\n";
}

static ExemptionRequest MakeExemption(char** argv) {
  // argv: signer owner local_id operation estimated_cost
  ExemptionRequest req;
  *req.mutable_origin() = SignedOrigin(argv[0]);
  if (std::string(argv[1]) != argv[0]) {
    req.set_owner(argv[1]);
  }
  req.set_local_id(ParseU32(argv[2]));
  req.mutable_operation()->set_name(argv[3]);
  req.mutable_operation()->set_estimated_cost(ParseU64(argv[4]));
  return req;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto auction_stub      = CapacityAuctionService::NewStub(channel);
  auto subscription_stub = CapacitySubscriptionService::NewStub(channel);
  auto admin_stub        = CapacityAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "start-auction") {
    if (argc < 5) return 1;

    StartAuctionRequest req;
    *req.mutable_origin() = RootOrigin();
    const std::string kind = argv[3];
    if (kind == "lifetime") {
      req.mutable_mode()->mutable_lifetime()->set_tps(ParseU32(argv[4]));
    } else if (kind == "daily") {
      req.mutable_mode()->mutable_daily()->set_days(ParseU32(argv[4]));
    } else {
      std::cerr << "unsupported mode: " << kind << "\n";
      return 1;
    }

    StartAuctionResponse resp;
    auto                 status = auction_stub->StartAuction(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "auction_id=" << resp.auction_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "bid") {
    if (argc < 6) return 1;

    BidRequest req;
    *req.mutable_origin() = SignedOrigin(argv[3]);
    req.set_auction_id(ParseU32(argv[4]));
    req.set_amount(ParseU64(argv[5]));

    BidResponse resp;
    auto        status = auction_stub->Bid(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "winner=" << resp.auction().winner() << " best_price=" << resp.auction().best_price() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "claim") {
    if (argc < 5) return 1;

    ClaimRequest req;
    *req.mutable_origin() = SignedOrigin(argv[3]);
    req.set_auction_id(ParseU32(argv[4]));
    if (argc >= 6) req.set_beneficiary(argv[5]);

    ClaimResponse resp;
    auto          status = auction_stub->Claim(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "subscription=" << resp.subscription().owner() << "/" << resp.subscription().local_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "auction") {
    if (argc < 4) return 1;

    GetAuctionRequest req;
    req.set_auction_id(ParseU32(argv[3]));

    GetAuctionResponse resp;
    auto               status = auction_stub->GetAuction(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& a = resp.auction();
    std::cout << "id=" << a.id() << " state=" << AuctionState_Name(a.state()) << " best_price=" << a.best_price();
    if (a.has_winner()) std::cout << " winner=" << a.winner();
    if (a.has_subscription_id()) std::cout << " subscription_id=" << a.subscription_id();
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lock") {
    if (argc < 5) return 1;

    StartLifetimeRequest req;
    *req.mutable_origin() = SignedOrigin(argv[3]);
    req.set_amount(ParseU64(argv[4]));

    StartLifetimeResponse resp;
    auto                  status = subscription_stub->StartLifetime(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSubscription(resp.subscription());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "unlock") {
    if (argc < 5) return 1;

    StopLifetimeRequest req;
    *req.mutable_origin() = SignedOrigin(argv[3]);
    req.set_local_id(ParseU32(argv[4]));

    google::protobuf::Empty resp;
    auto                    status = subscription_stub->StopLifetime(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "unlocked\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "subscription") {
    if (argc < 5) return 1;

    GetSubscriptionRequest req;
    req.mutable_key()->set_owner(argv[3]);
    req.mutable_key()->set_local_id(ParseU32(argv[4]));

    GetSubscriptionResponse resp;
    auto                    status = subscription_stub->GetSubscription(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSubscription(resp.subscription());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "subscriptions") {
    ListSubscriptionsRequest req;
    if (argc >= 4) req.set_owner(argv[3]);

    ListSubscriptionsResponse resp;
    auto                      status = subscription_stub->ListSubscriptions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& s : resp.subscriptions()) {
      PrintSubscription(s);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "validate") {
    if (argc < 8) return 1;

    ValidateResponse resp;
    auto             status = subscription_stub->Validate(&ctx, MakeExemption(argv + 3), &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "rejection=" << RejectionName(resp.rejection());
    if (!resp.message().empty()) std::cout << " message=\"" << resp.message() << "\"";
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "call") {
    if (argc < 8) return 1;

    CallResponse resp;
    auto         status = subscription_stub->Call(&ctx, MakeExemption(argv + 3), &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "success=" << (resp.success() ? "true" : "false") << " actual_cost=" << resp.actual_cost();
    if (!resp.error().empty()) std::cout << " error=\"" << resp.error() << "\"";
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "auctions=" << resp.auctions() << "\n";
    std::cout << "auctions_claimed=" << resp.auctions_claimed() << "\n";
    std::cout << "subscriptions=" << resp.subscriptions() << "\n";
    std::cout << "lock_backed=" << resp.lock_backed() << "\n";
    std::cout << "locked_total=" << resp.locked_total() << "\n";
    std::cout << "open_reservations=" << resp.open_reservations() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    DrainEventsRequest  req;
    DrainEventsResponse resp;

    auto status = admin_stub->DrainEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& e : resp.events()) {
      std::cout << e.timestamp_ms() << " " << EventKind_Name(e.kind()) << " account=" << e.account() << " auction_id=" << e.auction_id()
                << " local_id=" << e.local_id() << " amount=" << e.amount() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
