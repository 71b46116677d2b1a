#pragma once

#include <string>
#include <variant>
#include <vector>

#include "controller/types.hpp"
#include "deployer/job_event_matcher.hpp"

namespace rollout::deployer {

// One mutate -> wait unit of a deployment. `formation` is the complete
// document to write; `expected` the confirmations to wait for, counted only
// against events from `release_id`.
struct PlanStep {
  controller::Formation formation;
  ExpectedEvents expected;
  std::string release_id;
};

using Plan = std::vector<PlanStep>;

// Replaces one unit at a time: for each type in lexicographic order, one new
// instance is started and confirmed before one old instance is stopped.
struct OneByOneStrategy {};

// Starts every new instance, then stops every old one.
struct AllAtOnceStrategy {};

using Strategy = std::variant<OneByOneStrategy, AllAtOnceStrategy>;

Strategy MakeStrategy(controller::StrategyKind kind);
controller::StrategyKind KindOf(const Strategy& strategy);

// Builds the step list moving `current` (the old release's formation) to the
// deployment's new release. Types with a zero count contribute no steps.
Plan BuildPlan(const Strategy& strategy, const controller::Deployment& deployment,
               const controller::Formation& current);

}  // namespace rollout::deployer
