#pragma once

#include "core/GameState.hpp"
#include "core/Target.hpp"
#include <vector>

namespace reflex::controller {

class TargetController {
public:
    using Duration = reflex::core::Seconds;

    /// Controller does not own the GameState; caller keeps it alive.
    explicit TargetController(reflex::core::GameState& game);

    /// A target was clicked. For a bomb, `caughtInBlast` lists the targets
    /// the collision layer found inside the blast radius; the ones a bomb
    /// can destroy score their points.
    void handleHit(const reflex::core::Target& target,
                   const std::vector<reflex::core::Target>& caughtInBlast = {});

    /// A target fell out of the play area without being clicked.
    /// Only letting a good target through is penalised.
    void handleMiss(const reflex::core::Target& target);

    // Called by the host loop every frame with the real elapsed time
    void update(Duration elapsed);

private:
    reflex::core::GameState& game_;
};

} // namespace reflex::controller
