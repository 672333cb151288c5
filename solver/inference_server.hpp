#ifndef SOLVER_INFERENCE_SERVER_HPP
#define SOLVER_INFERENCE_SERVER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "proto/solver.pb.h"
#include "responder/responder.hpp"
#include "solver/contract.hpp"

namespace solver {

// State loaded once at startup and shared read-only by every prediction.
class Model {
 public:
  Model() = default;
  explicit Model(std::map<std::string, int64_t> answers)
      : answers_(std::move(answers)) {}

  // Known answer for a statement, or -1.
  int64_t Lookup(const std::string& problem) const;
  size_t Size() const { return answers_.size(); }

 private:
  std::map<std::string, int64_t> answers_;
};

// Loads a reference table with columns id,problem,answer. An empty path
// gives an empty model.
std::shared_ptr<const Model> LoadModel(const std::string& path);

class Solver {
 public:
  virtual int64_t Predict(const Model& model, const std::string& problem) = 0;

  Solver() = default;
  virtual ~Solver() = default;
  Solver(const Solver&) = delete;
  Solver& operator=(const Solver&) = delete;
};

// Answers the problems it finds in the model, 0 otherwise.
class ReferenceSolver : public Solver {
 public:
  int64_t Predict(const Model& model, const std::string& problem) override;
};

// Exposes a Solver as the predict endpoint.
class InferenceServer {
 public:
  InferenceServer(std::shared_ptr<const Model> model,
                  std::unique_ptr<Solver> solver)
      : model_(std::move(model)), solver_(std::move(solver)) {}

  // Registers the predict and shutdown endpoints and checks that nothing is
  // missing.
  void Bind(responder::Responder* responder);

  // Clamped answer for the problem. Used directly by local debug runs.
  int64_t Predict(const std::string& problem);

  proto::PredictResponse Handle(const proto::PredictRequest& request);

 private:
  std::shared_ptr<const Model> model_;
  std::unique_ptr<Solver> solver_;
};

}  // namespace solver

#endif
