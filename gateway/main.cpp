#include "gateway/gateway.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "relay/channel.hpp"
#include "util/flags.hpp"

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Feeds the problems in --input to the solver listening on --address and "
      "writes its answers to --output.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  util::ApplyEnvironment();

  gateway::GatewayOptions options;
  std::vector<gateway::Problem> problems;
  try {
    options.order = gateway::ParseOrderMode(FLAGS_order);
    problems = gateway::LoadProblems(FLAGS_input);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Cannot start: " << e.what();
    return 1;
  }
  options.deadline = std::chrono::milliseconds(FLAGS_deadline_ms);
  options.order_seed = FLAGS_order_seed;
  options.output = FLAGS_output;
  options.records = FLAGS_records;

  relay::ConnectOptions connect_options;
  connect_options.address = FLAGS_address;
  connect_options.grace_period = std::chrono::milliseconds(FLAGS_grace_period_ms);

  gateway::Gateway gateway(
      options, std::move(problems),
      [&connect_options] { return relay::Dial(connect_options); });
  gateway::State state = gateway.Run();
  LOG(INFO) << "Run ended in state " << gateway::StateName(state);
  return state == gateway::State::DONE ? 0 : 1;
}
