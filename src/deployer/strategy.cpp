#include "deployer/strategy.hpp"

#include <type_traits>

namespace rollout::deployer {

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

controller::Formation MakeFormation(const controller::Deployment& deployment,
                                    const std::string& release_id,
                                    const controller::ProcessCounts& processes) {
  controller::Formation formation;
  formation.app_id = deployment.app_id;
  formation.release_id = release_id;
  formation.processes = processes;
  return formation;
}

Plan BuildOneByOne(const controller::Deployment& deployment,
                   const controller::Formation& current) {
  Plan plan;
  controller::ProcessCounts old_counts = current.processes;
  controller::ProcessCounts new_counts;
  for (const auto& [type, count] : current.processes) {
    for (int i = 0; i < count; ++i) {
      ++new_counts[type];
      PlanStep start;
      start.formation = MakeFormation(deployment, deployment.new_release_id, new_counts);
      start.expected[type][controller::JobState::kUp] = 1;
      start.release_id = deployment.new_release_id;
      plan.push_back(std::move(start));

      --old_counts[type];
      PlanStep stop;
      stop.formation = MakeFormation(deployment, deployment.old_release_id, old_counts);
      stop.expected[type][controller::JobState::kDown] = 1;
      stop.release_id = deployment.old_release_id;
      plan.push_back(std::move(stop));
    }
  }
  return plan;
}

Plan BuildAllAtOnce(const controller::Deployment& deployment,
                    const controller::Formation& current) {
  ExpectedEvents ups;
  ExpectedEvents downs;
  controller::ProcessCounts stopped;
  for (const auto& [type, count] : current.processes) {
    stopped[type] = 0;
    if (count > 0) {
      ups[type][controller::JobState::kUp] = count;
      downs[type][controller::JobState::kDown] = count;
    }
  }
  Plan plan;
  if (ups.empty()) {
    return plan;
  }
  PlanStep start;
  start.formation = MakeFormation(deployment, deployment.new_release_id, current.processes);
  start.expected = std::move(ups);
  start.release_id = deployment.new_release_id;
  plan.push_back(std::move(start));

  PlanStep stop;
  stop.formation = MakeFormation(deployment, deployment.old_release_id, stopped);
  stop.expected = std::move(downs);
  stop.release_id = deployment.old_release_id;
  plan.push_back(std::move(stop));
  return plan;
}

}  // namespace

Strategy MakeStrategy(controller::StrategyKind kind) {
  switch (kind) {
    case controller::StrategyKind::kAllAtOnce:
      return AllAtOnceStrategy{};
    case controller::StrategyKind::kOneByOne:
      break;
  }
  return OneByOneStrategy{};
}

controller::StrategyKind KindOf(const Strategy& strategy) {
  return std::visit(
      [](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, OneByOneStrategy>) {
          return controller::StrategyKind::kOneByOne;
        } else if constexpr (std::is_same_v<T, AllAtOnceStrategy>) {
          return controller::StrategyKind::kAllAtOnce;
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled strategy");
        }
      },
      strategy);
}

Plan BuildPlan(const Strategy& strategy, const controller::Deployment& deployment,
               const controller::Formation& current) {
  return std::visit(
      [&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, OneByOneStrategy>) {
          return BuildOneByOne(deployment, current);
        } else if constexpr (std::is_same_v<T, AllAtOnceStrategy>) {
          return BuildAllAtOnce(deployment, current);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled strategy");
        }
      },
      strategy);
}

}  // namespace rollout::deployer
