#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "stack-sim/src/Diagnostics/SettlementDetector.hpp"
#include "stack-sim/src/Environment/ReferenceFrame.hpp"
#include "stack-sim/src/Environment/TowerModel.hpp"
#include "stack-sim/src/Stability/StabilityMonitor.hpp"

namespace
{

using std::chrono::milliseconds;

constexpr milliseconds kFrame{16};
constexpr milliseconds kDuration{6000};
constexpr milliseconds kSlideStart{2000};
constexpr milliseconds kSlideEnd{3500};
constexpr milliseconds kReportInterval{500};

// Two-layer tower on a wide foundation; the top piece is the one that slides.
uint32_t buildTower(stack_sim::TowerModel& tower)
{
  tower.addBase(stack_sim::Coordinate{4.0, 0.5, 4.0},
                stack_sim::ReferenceFrame{stack_sim::Coordinate{0.0, -0.5, 0.0}});

  stack_sim::Coordinate const slab{1.0, 0.5, 1.0};
  tower.addPiece(
    slab, stack_sim::ReferenceFrame{stack_sim::Coordinate{-1.0, 0.5, -1.0}}, 1.0);
  tower.addPiece(
    slab, stack_sim::ReferenceFrame{stack_sim::Coordinate{1.0, 0.5, -1.0}}, 1.0);
  tower.addPiece(
    slab, stack_sim::ReferenceFrame{stack_sim::Coordinate{1.0, 0.5, 1.0}}, 1.0);
  tower.addPiece(
    slab, stack_sim::ReferenceFrame{stack_sim::Coordinate{-1.0, 0.5, 1.0}}, 1.0);

  return tower
    .addPiece(stack_sim::Coordinate{1.0, 0.5, 1.0},
              stack_sim::ReferenceFrame{stack_sim::Coordinate{0.0, 1.5, 0.0}},
              4.0)
    .getInstanceId();
}

// Scripted stand-in for the physics step: drags the top piece along +x.
void stepTopPiece(stack_sim::TowerModel& tower,
                  uint32_t topId,
                  milliseconds simTime)
{
  auto* top = tower.findObject(topId);
  if (top == nullptr)
  {
    return;
  }

  if (simTime < kSlideStart || simTime >= kSlideEnd)
  {
    top->setVelocities(stack_sim::Vector3D{}, stack_sim::Vector3D{});
    return;
  }

  double const speed = 1.6;  // [m/s]
  double const dt = std::chrono::duration<double>{kFrame}.count();
  stack_sim::Coordinate position = top->getPosition();
  position.x() += speed * dt;
  top->setPose(position, top->getOrientation());
  top->setVelocities(stack_sim::Vector3D{speed, 0.0, 0.0}, stack_sim::Vector3D{});
}

}  // namespace

int main(int argc, char** argv)
{
  spdlog::set_level(spdlog::level::info);
  if (argc > 1 && std::string_view{argv[1]} == "--debug")
  {
    spdlog::set_level(spdlog::level::debug);
  }

  try
  {
    stack_sim::TowerModel tower;
    uint32_t const topId = buildTower(tower);

    stack_sim::StabilityMonitor monitor;
    stack_sim::SettlementDetector settlement;

    milliseconds nextReport{0};
    for (milliseconds simTime{0}; simTime <= kDuration; simTime += kFrame)
    {
      stepTopPiece(tower, topId, simTime);

      monitor.update(simTime, tower.getObjects());
      settlement.update(simTime, tower.getObjects());

      if (simTime >= nextReport)
      {
        auto const info = monitor.getStabilityInfo();
        spdlog::info("t={:.2f}s stability={:.1f} ({}) hull={} oscillation={:.4f}",
                     std::chrono::duration<double>{simTime}.count(),
                     info.overallStability,
                     stack_sim::toString(monitor.getLevel()),
                     info.supportPolygon.getVertexCount(),
                     info.oscillationMagnitude);
        nextReport += kReportInterval;
      }

      if (monitor.hasCollapsed(settlement.isTowerSettled()))
      {
        spdlog::warn("Tower collapsed at t={:.2f}s",
                     std::chrono::duration<double>{simTime}.count());
        break;
      }
    }

    auto const stats = settlement.getStats();
    spdlog::info("Settled {}/{} pieces ({:.0f}%), tower settled: {}",
                 stats.settledPieces,
                 stats.totalPieces,
                 stats.settlementPercentage,
                 stats.isTowerSettled);
  }
  catch (const std::exception& e)
  {
    spdlog::error("stack_exe: {}", e.what());
    return 1;
  }

  return 0;
}
