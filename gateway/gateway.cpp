#include "gateway/gateway.hpp"

#include "glog/logging.h"
#include "proto/solver.pb.h"
#include "relay/errors.hpp"
#include "solver/contract.hpp"
#include "util/csv.hpp"
#include "util/file.hpp"

namespace gateway {

namespace {

const auto SHUTDOWN_DEADLINE = std::chrono::seconds(10);  // NOLINT

std::string DescribeError(const proto::Error& error) {
  return proto::Error::Kind_Name(error.kind()) + ": " + error.message();
}

}  // namespace

const char* StateName(State state) {
  switch (state) {
    case State::INIT:
      return "INIT";
    case State::CONNECTING:
      return "CONNECTING";
    case State::SERVING:
      return "SERVING";
    case State::FINALIZING:
      return "FINALIZING";
    case State::DONE:
      return "DONE";
    case State::FAILED:
      return "FAILED";
  }
  return "?";
}

const char* CallStatusName(CallStatus status) {
  switch (status) {
    case CallStatus::OK:
      return "ok";
    case CallStatus::TIMEOUT:
      return "timeout";
    case CallStatus::HANDLER_ERROR:
      return "handler_error";
    case CallStatus::TRANSPORT_ERROR:
      return "transport_error";
  }
  return "?";
}

Gateway::Gateway(GatewayOptions options, std::vector<Problem> problems,
                 Connector connect)
    : options_(std::move(options)),
      problems_(std::move(problems)),
      connect_(std::move(connect)),
      answers_(problems_.size(), solver::kDefaultAnswer) {
  codec_.Register<proto::PredictRequest, proto::PredictResponse>(
      solver::kPredictEndpoint);
  codec_.Register<proto::Shutdown, proto::Shutdown>(solver::kShutdownEndpoint);
  order_ = EvaluationOrder(problems_.size(), options_.order,
                           options_.order_seed);
  LOG(INFO) << "Loaded " << problems_.size() << " problems, "
            << OrderModeName(options_.order) << " order";
}

State Gateway::Run() {
  CHECK(state_ == State::INIT) << "Run() called twice";
  if (!Connect()) return state_;
  ServeAll();
  Finalize();
  return state_;
}

bool Gateway::Connect() {
  state_ = State::CONNECTING;
  try {
    channel_ = connect_();
  } catch (const relay::connection_unavailable& e) {
    Fail(e.what());
    return false;
  }
  return true;
}

void Gateway::ServeAll() {
  state_ = State::SERVING;
  for (size_t index : order_) {
    const Problem& problem = problems_[index];
    CallRecord record = Serve(problem);
    answers_[index] = *record.answer;
    LOG_IF(WARNING, record.status != CallStatus::OK)
        << problem.id << ": " << CallStatusName(record.status) << " after "
        << record.elapsed.count() << "ms: " << record.raw_error.value_or("");
    records_.push_back(std::move(record));
    if (transport_broken_) {
      LOG(ERROR) << "Connection to the solver lost, "
                 << problems_.size() - records_.size()
                 << " problem(s) left unanswered";
      break;
    }
  }
}

CallRecord Gateway::Serve(const Problem& problem) {
  CallRecord record;
  record.problem_id = problem.id;
  record.started_at = relay::Clock::now();
  record.deadline = record.started_at + options_.deadline;

  proto::PredictRequest request;
  request.set_id(problem.id);
  request.set_problem(problem.statement);
  try {
    proto::Envelope response = channel_->Call(
        codec_.Wrap(solver::kPredictEndpoint, request), record.deadline);
    envelope::Decoded decoded = codec_.UnwrapResponse(response);
    if (decoded.is_error) {
      record.status = CallStatus::HANDLER_ERROR;
      record.raw_error =
          DescribeError(static_cast<const proto::Error&>(*decoded.value));
    } else {
      record.status = CallStatus::OK;
      record.answer = solver::ClampAnswer(
          static_cast<const proto::PredictResponse&>(*decoded.value).answer());
    }
  } catch (const relay::timeout& e) {
    record.status = CallStatus::TIMEOUT;
    record.raw_error = e.what();
  } catch (const relay::transport_broken& e) {
    record.status = CallStatus::TRANSPORT_ERROR;
    record.raw_error = e.what();
    transport_broken_ = true;
  } catch (const relay::relay_error& e) {
    // Corrupt or unexpected response; the connection itself is still fine.
    record.status = CallStatus::TRANSPORT_ERROR;
    record.raw_error = e.what();
  }
  record.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      relay::Clock::now() - record.started_at);
  if (!record.answer) record.answer = solver::kDefaultAnswer;
  VLOG(1) << problem.id << " -> " << *record.answer;
  return record;
}

std::vector<ResultRow> Gateway::Results() const {
  std::vector<ResultRow> rows;
  for (size_t i = 0; i < problems_.size(); i++) {
    rows.push_back(ResultRow{problems_[i].id, answers_[i]});
  }
  return rows;
}

bool Gateway::Finalize() {
  state_ = State::FINALIZING;
  if (channel_) {
    if (!transport_broken_) StopSolver();
    channel_->Close();
    channel_.reset();
  }
  try {
    std::vector<ResultRow> rows = Results();
    ValidateResults(problems_, rows);
    if (!options_.records.empty()) {
      util::File::Write(options_.records, FormatRecords(records_));
    }
    if (!options_.output.empty()) {
      util::File::Write(options_.output, FormatResults(rows));
      LOG(INFO) << "Wrote " << rows.size() << " answers to "
                << options_.output;
    }
  } catch (const std::exception& e) {
    Fail(std::string("Cannot save results: ") + e.what());
    return false;
  }
  state_ = State::DONE;
  return true;
}

void Gateway::StopSolver() {
  try {
    proto::Envelope response = channel_->Call(
        codec_.Wrap(solver::kShutdownEndpoint, proto::Shutdown()),
        relay::Clock::now() + SHUTDOWN_DEADLINE);
    envelope::Decoded decoded = codec_.UnwrapResponse(response);
    if (decoded.is_error) {
      LOG(WARNING) << "Solver refused to shut down: "
                   << DescribeError(
                          static_cast<const proto::Error&>(*decoded.value));
    }
  } catch (const relay::relay_error& e) {
    LOG(WARNING) << "Cannot shut the solver down: " << e.what();
  }
}

void Gateway::Fail(const std::string& reason) {
  LOG(ERROR) << "Run failed while " << StateName(state_) << ": " << reason;
  failure_reason_ = reason;
  state_ = State::FAILED;
}

std::string FormatRecords(const std::vector<CallRecord>& records) {
  std::string out =
      util::FormatCsvRow({"id", "status", "answer", "elapsed_ms", "error"});
  for (const CallRecord& record : records) {
    out += util::FormatCsvRow(
        {record.problem_id, CallStatusName(record.status),
         std::to_string(record.answer.value_or(solver::kDefaultAnswer)),
         std::to_string(record.elapsed.count()),
         record.raw_error.value_or("")});
  }
  return out;
}

}  // namespace gateway
