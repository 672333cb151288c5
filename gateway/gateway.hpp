#ifndef GATEWAY_GATEWAY_HPP
#define GATEWAY_GATEWAY_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "envelope/codec.hpp"
#include "gateway/ordering.hpp"
#include "gateway/problem_set.hpp"
#include "relay/channel.hpp"

namespace gateway {

enum class State { INIT, CONNECTING, SERVING, FINALIZING, DONE, FAILED };
const char* StateName(State state);

enum class CallStatus { OK, TIMEOUT, HANDLER_ERROR, TRANSPORT_ERROR };
const char* CallStatusName(CallStatus status);

// Bookkeeping for one problem. answer is set once the call resolves, to the
// default answer when the call failed.
struct CallRecord {
  std::string problem_id;
  relay::Deadline started_at;
  relay::Deadline deadline;
  std::chrono::milliseconds elapsed{0};
  CallStatus status = CallStatus::OK;
  absl::optional<int64_t> answer;
  absl::optional<std::string> raw_error;
};

struct GatewayOptions {
  std::chrono::milliseconds deadline{360000};
  OrderMode order = OrderMode::RANDOM;
  uint64_t order_seed = 0;
  // Where the result set is written. Nothing is written when empty.
  std::string output;
  // Where the call records are written, if not empty.
  std::string records;
};

// Produces a connected channel, or throws relay::connection_unavailable.
using Connector = std::function<std::unique_ptr<relay::Channel>()>;

// Feeds the problems to the solver one at a time and collects the answers.
// Run() goes INIT -> CONNECTING -> SERVING -> FINALIZING -> DONE, or ends in
// FAILED if the solver is never reachable or the results cannot be saved.
// While finalizing, a solver that is still reachable is told to shut down.
class Gateway {
 public:
  Gateway(GatewayOptions options, std::vector<Problem> problems,
          Connector connect);

  State Run();

  State CurrentState() const { return state_; }
  const std::string& FailureReason() const { return failure_reason_; }
  bool TransportBroken() const { return transport_broken_; }

  // Evaluation order, as indices into the problem list.
  const std::vector<size_t>& Order() const { return order_; }
  // One record per problem served, in evaluation order.
  const std::vector<CallRecord>& Records() const { return records_; }
  // One row per problem, in the original problem order.
  std::vector<ResultRow> Results() const;

 private:
  bool Connect();
  void ServeAll();
  bool Finalize();
  // Asks the solver to exit. Failures are logged, the results are kept.
  void StopSolver();
  CallRecord Serve(const Problem& problem);
  void Fail(const std::string& reason);

  GatewayOptions options_;
  std::vector<Problem> problems_;
  Connector connect_;
  envelope::Codec codec_;

  State state_ = State::INIT;
  std::string failure_reason_;
  bool transport_broken_ = false;
  std::vector<size_t> order_;
  std::vector<CallRecord> records_;
  std::vector<int64_t> answers_;
  std::unique_ptr<relay::Channel> channel_;
};

// Formats records as id,status,answer,elapsed_ms,error rows.
std::string FormatRecords(const std::vector<CallRecord>& records);

}  // namespace gateway

#endif
