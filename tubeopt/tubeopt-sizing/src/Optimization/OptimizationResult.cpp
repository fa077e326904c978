#include "tubeopt-sizing/src/Optimization/OptimizationResult.hpp"

namespace tubeopt_sizing
{

std::string_view toString(SolverStatus status)
{
  switch (status)
  {
    case SolverStatus::Success:
      return "success";
    case SolverStatus::ObjectiveToleranceReached:
      return "objective tolerance reached";
    case SolverStatus::StepToleranceReached:
      return "step tolerance reached";
    case SolverStatus::StopValueReached:
      return "stop value reached";
    case SolverStatus::MaxEvaluationsReached:
      return "maximum evaluations reached";
    case SolverStatus::MaxTimeReached:
      return "maximum time reached";
    case SolverStatus::RoundoffLimited:
      return "roundoff limited";
    case SolverStatus::ForcedStop:
      return "forced stop";
    case SolverStatus::InvalidArguments:
      return "invalid arguments";
    case SolverStatus::OutOfMemory:
      return "out of memory";
    case SolverStatus::Failure:
      return "failure";
  }
  return "unknown";
}

bool isSuccess(SolverStatus status)
{
  return status == SolverStatus::Success ||
         status == SolverStatus::ObjectiveToleranceReached ||
         status == SolverStatus::StepToleranceReached;
}

}  // namespace tubeopt_sizing
