#include "absl/memory/memory.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "relay/listener.hpp"
#include "responder/responder.hpp"
#include "solver/inference_server.hpp"
#include "solver/reference_run.hpp"
#include "util/csv.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

// Returns once the gateway sent the shutdown call.
int Serve(solver::InferenceServer* server) {
  responder::Responder responder;
  server->Bind(&responder);
  std::unique_ptr<relay::Listener> listener =
      relay::Listener::Listen(FLAGS_address);
  responder.Serve(listener.get());
  listener->Close();
  return 0;
}

int Debug(solver::InferenceServer* server) {
  LOG(INFO) << "Local run, scoring against " << FLAGS_reference;
  solver::ReferenceScore score = solver::ScoreReference(
      server, util::ParseCsv(util::File::Read(FLAGS_reference)));
  LOG(INFO) << solver::FormatScore(score);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Hosts the solver behind the relay. Set KAGGLE_IS_COMPETITION_RERUN to "
      "serve, otherwise the reference problems are scored in-process.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  util::ApplyEnvironment();

  try {
    solver::InferenceServer server(
        solver::LoadModel(FLAGS_model),
        absl::make_unique<solver::ReferenceSolver>());
    if (util::EnvFlag(util::kScoredRunEnv)) return Serve(&server);
    return Debug(&server);
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
