#include <chrono>
#include <exception>
#include <string>

#include "shatter-sim/src/DestructionWorld.hpp"
#include "shatter-sim/src/Effects/BuiltinEffects.hpp"
#include "shatter-sim/src/Environment/WorldScene.hpp"
#include "shatter-sim/src/Utils/Logging.hpp"

using namespace shatter_sim;

namespace
{

constexpr int kFrameCount = 240;
constexpr std::chrono::milliseconds kFrameTime{16};

}  // namespace

// Headless demo: a wrecking ball welded to a moving cart ploughs through a
// wall, the debris flies off as puppets and is cleaned up after a few seconds.
// Usage: shatter-exe [recording.db]
int main(int argc, char** argv)
{
  try
  {
    setLogLevel("info");

    WorldScene scene;
    scene.addBox(Coordinate{0, 5, 0}, Vector3D{2, 10, 20}, {"Wall"});
    scene.addBox(Coordinate{0, -0.5, 0}, Vector3D{60, 1, 60}, {"Floor"});
    const SolidObjectId cart = scene.addBox(Coordinate{-20, 3, 0}, Vector3D{2, 2, 2});
    scene.setAnchored(cart, false);
    scene.setVelocity(cart, Velocity{8.0, 0.0, 0.0}, Vector3D{0.0, 0.0, 0.0});

    Settings settings;
    settings.defaultGridSize = 1.0;
    settings.useSmoothCleanup = true;
    settings.defaultSmoothCleanupDelay = 3.0;
    DestructionWorld world{scene, settings};

    if (argc > 1)
    {
      world.enableRecording(argv[1]);
    }

    Hitbox& ball = world.createHitbox(
      OrientedShape{ShapeKind::Ball, ReferenceFrame{Coordinate{-18, 3, 0}}, Vector3D::uniform(4.0)});
    ball.config().params.filterTagged = {"Wall"};
    ball.config().params.onVoxelDestruct = std::string{BuiltinEffects::kRoughName};
    ball.config().destructDelay = 0.1;
    ball.weldTo(cart);
    ball.start();

    for (int frame = 0; frame < kFrameCount; ++frame)
    {
      scene.advance(std::chrono::duration<double>{kFrameTime}.count());
      world.tick(kFrameTime * frame);
      if (frame % 60 == 0)
      {
        world.printState();
      }
    }

    world.printState();
    world.disableRecording();
  }
  catch (const std::exception& e)
  {
    logger()->error("shatter-exe failed: {}", e.what());
    return 1;
  }
  return 0;
}
