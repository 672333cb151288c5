#include "solver/inference_server.hpp"

#include "glog/logging.h"
#include "util/csv.hpp"
#include "util/file.hpp"

namespace solver {

int64_t Model::Lookup(const std::string& problem) const {
  auto it = answers_.find(problem);
  if (it == answers_.end()) return -1;
  return it->second;
}

std::shared_ptr<const Model> LoadModel(const std::string& path) {
  if (path.empty()) return std::make_shared<const Model>();
  util::CsvTable table = util::ParseCsv(util::File::Read(path));
  size_t problem_col = table.Column("problem");
  size_t answer_col = table.Column("answer");
  std::map<std::string, int64_t> answers;
  for (const auto& row : table.rows) {
    answers[row[problem_col]] = std::stoll(row[answer_col]);
  }
  LOG(INFO) << "Loaded " << answers.size() << " reference answers from "
            << path;
  return std::make_shared<const Model>(std::move(answers));
}

int64_t ReferenceSolver::Predict(const Model& model,
                                 const std::string& problem) {
  int64_t answer = model.Lookup(problem);
  return answer < 0 ? 0 : answer;
}

void InferenceServer::Bind(responder::Responder* responder) {
  responder->Register<proto::PredictRequest, proto::PredictResponse>(
      kPredictEndpoint, [this](const proto::PredictRequest& request) {
        return Handle(request);
      });
  responder->RegisterShutdown(kShutdownEndpoint);
  responder->Require({kPredictEndpoint, kShutdownEndpoint});
}

int64_t InferenceServer::Predict(const std::string& problem) {
  return ClampAnswer(solver_->Predict(*model_, problem));
}

proto::PredictResponse InferenceServer::Handle(
    const proto::PredictRequest& request) {
  proto::PredictResponse response;
  response.set_answer(Predict(request.problem()));
  LOG(INFO) << "Answered " << request.id() << ": " << response.answer();
  return response;
}

}  // namespace solver
