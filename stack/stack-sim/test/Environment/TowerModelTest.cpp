// Ticket: 0002_tower_model
// Test: TowerModel ownership and id assignment

#include <gtest/gtest.h>

#include <stdexcept>

#include "stack-sim/src/Environment/TowerModel.hpp"
#include "stack-sim/test/Helpers/TowerScenario.hpp"

namespace stack_sim
{
namespace test
{

TEST(TowerModel, Empty)
{
  TowerModel const tower;

  EXPECT_TRUE(tower.getObjects().empty());
  EXPECT_EQ(tower.getPieceCount(), 0u);
  EXPECT_DOUBLE_EQ(tower.getHeight(), 0.0);
}

TEST(TowerModel, AddBaseAndPieces_AssignsMonotonicIds)
{
  TowerModel tower;

  auto const baseId =
    tower.addBase(Coordinate{5.0, 0.5, 5.0},
                  ReferenceFrame{Coordinate{0.0, -0.5, 0.0}})
      .getInstanceId();
  auto const firstId = tower
                         .addPiece(TowerScenario::cubeHalfExtents(),
                                   ReferenceFrame{Coordinate{0.0, 0.5, 0.0}},
                                   1.0)
                         .getInstanceId();
  auto const secondId = tower
                          .addPiece(TowerScenario::cubeHalfExtents(),
                                    ReferenceFrame{Coordinate{0.0, 1.5, 0.0}},
                                    2.0)
                          .getInstanceId();

  EXPECT_LT(baseId, firstId);
  EXPECT_LT(firstId, secondId);
  EXPECT_EQ(tower.getObjects().size(), 3u);
  EXPECT_EQ(tower.getPieceCount(), 2u);
  EXPECT_NEAR(tower.getHeight(), 2.0, 1e-12);
}

TEST(TowerModel, IdsAreNotReusedAfterClear)
{
  TowerModel tower;
  auto const before = tower
                        .addPiece(TowerScenario::cubeHalfExtents(),
                                  ReferenceFrame{},
                                  1.0)
                        .getInstanceId();

  tower.clear();
  auto const after = tower
                       .addPiece(TowerScenario::cubeHalfExtents(),
                                 ReferenceFrame{},
                                 1.0)
                       .getInstanceId();

  EXPECT_GT(after, before);
  EXPECT_EQ(tower.getObjects().size(), 1u);
}

TEST(TowerModel, AddPiece_InvalidMass_Throws)
{
  TowerModel tower;

  EXPECT_THROW(
    tower.addPiece(TowerScenario::cubeHalfExtents(), ReferenceFrame{}, 0.0),
    std::invalid_argument);
  EXPECT_TRUE(tower.getObjects().empty());
}

TEST(TowerModel, RemoveObject)
{
  TowerModel tower;
  auto const id = tower
                    .addPiece(TowerScenario::cubeHalfExtents(),
                              ReferenceFrame{Coordinate{0.0, 0.5, 0.0}},
                              1.0)
                    .getInstanceId();

  tower.removeObject(id);

  EXPECT_TRUE(tower.getObjects().empty());
  EXPECT_EQ(tower.findObject(id), nullptr);
}

TEST(TowerModel, RemoveObject_UnknownId_Throws)
{
  TowerModel tower;

  EXPECT_THROW(tower.removeObject(99), std::out_of_range);
}

TEST(TowerModel, FindObject_AllowsPoseWriteBack)
{
  TowerModel tower;
  auto const id = tower
                    .addPiece(TowerScenario::cubeHalfExtents(),
                              ReferenceFrame{Coordinate{0.0, 0.5, 0.0}},
                              1.0)
                    .getInstanceId();

  StackedObject* piece = tower.findObject(id);
  ASSERT_NE(piece, nullptr);
  piece->setPose(Coordinate{0.0, 3.5, 0.0}, piece->getOrientation());

  EXPECT_NEAR(tower.getHeight(), 4.0, 1e-12);
}

}  // namespace test
}  // namespace stack_sim
