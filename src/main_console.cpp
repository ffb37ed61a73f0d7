#include <iostream>
#include <string>
#include <vector>

#include "core/GameState.hpp"
#include "core/GameEvents.hpp"
#include "core/Target.hpp"
#include "core/Types.hpp"
#include "controller/TargetController.hpp"

using namespace reflex::core;

namespace {

// Prints every notification the engine emits and remembers what was spawned
class ConsoleListener : public IGameListener {
public:
    void onScoreChanged(int score) override {
        std::cout << "[EVENT] score -> " << score << '\n';
    }
    void onGameOver() override {
        std::cout << "[EVENT] game over\n";
    }
    void onComboChanged(int count, int multiplier) override {
        std::cout << "[EVENT] combo -> " << count << " (x" << multiplier << ")\n";
    }
    void onPowerUpActivated(PowerUpType type, double durationSeconds) override {
        std::cout << "[EVENT] " << toString(type) << " on for " << durationSeconds << "s\n";
    }
    void onPowerUpDeactivated(PowerUpType type) override {
        std::cout << "[EVENT] " << toString(type) << " off\n";
    }
    void onTargetSpawned(TargetKind kind) override {
        std::cout << "[EVENT] spawned " << toString(kind) << '\n';
        pending.push_back(Target{kind, 1});
    }

    std::vector<Target> pending;
};

const char* statusName(GameStatus status) {
    switch (status) {
    case GameStatus::NotStarted: return "NotStarted";
    case GameStatus::Running:    return "Running";
    case GameStatus::Stopped:    return "Stopped";
    case GameStatus::GameOver:   return "GameOver";
    }
    return "?";
}

void printGame(const GameState& game, const ConsoleListener& listener) {
    std::cout << "\n==== REFLEX CONSOLE VIEW ====\n";
    std::cout << "Score: " << game.score()
              << " | Combo: " << game.comboCount() << " (x" << game.comboMultiplier() << ")"
              << " | Status: " << statusName(game.status()) << '\n';
    std::cout << "Spawn interval: " << game.spawnInterval() << "s"
              << " | Time scale: " << game.timeScale() << '\n';
    std::cout << "Power-ups:";
    for (PowerUpType t : {PowerUpType::SlowMotion, PowerUpType::DoubleScore,
                          PowerUpType::Shield, PowerUpType::TimeFreeze}) {
        if (game.isPowerUpActive(t)) std::cout << ' ' << toString(t);
    }
    std::cout << "\nTargets in play: " << listener.pending.size() << '\n';

    std::cout << "Commands:\n"
              << "  c = click oldest target, m = let oldest target fall\n"
              << "  g = click a good target, b = click a bad target\n"
              << "  1..4 = slow motion / double score / shield / time freeze\n"
              << "  t = advance 0.5s, T = advance 2s\n"
              << "  r = restart, q = quit\n";
}

} // namespace

int main() {
    GameState game{};
    reflex::controller::TargetController controller{game};
    ConsoleListener listener;
    game.addListener(&listener);

    game.spawner().setCandidates({
        TargetKind::Good, TargetKind::Good, TargetKind::Good, TargetKind::Bad,
        TargetKind::PowerUpSlowMotion, TargetKind::PowerUpDoubleScore,
        TargetKind::PowerUpShield, TargetKind::PowerUpTimeFreeze,
        TargetKind::Bomb, TargetKind::Moving, TargetKind::Tiny, TargetKind::Giant
    });

    game.startSession();
    // Score starts at zero, so the very first hit must be a good one
    game.hitGood(1);

    std::string cmd;
    printGame(game, listener);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        switch (c) {
        case 'c':
        case 'm':
            if (listener.pending.empty()) {
                std::cout << "No target in play.\n";
                break;
            }
            {
                Target target = listener.pending.front();
                listener.pending.erase(listener.pending.begin());
                if (c == 'c') {
                    // Whatever else is in play is close enough to be blasted
                    std::vector<Target> nearby;
                    if (target.kind == TargetKind::Bomb) {
                        nearby.swap(listener.pending);
                    }
                    controller.handleHit(target, nearby);
                } else {
                    controller.handleMiss(target);
                }
            }
            break;
        case 'g':
            controller.handleHit(Target{TargetKind::Good, 1});
            break;
        case 'b':
            controller.handleHit(Target{TargetKind::Bad, 1});
            break;
        case '1':
            controller.handleHit(Target{TargetKind::PowerUpSlowMotion, 0});
            break;
        case '2':
            controller.handleHit(Target{TargetKind::PowerUpDoubleScore, 0});
            break;
        case '3':
            controller.handleHit(Target{TargetKind::PowerUpShield, 0});
            break;
        case '4':
            controller.handleHit(Target{TargetKind::PowerUpTimeFreeze, 0});
            break;
        case 't':
            controller.update(Seconds{0.5});
            break;
        case 'T':
            controller.update(Seconds{2.0});
            break;
        case 'r': case 'R':
            listener.pending.clear();
            game.stopSession();
            game.startSession();
            game.hitGood(1);
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        printGame(game, listener);

        if (game.status() == GameStatus::GameOver) {
            std::cout << "GAME OVER. Press 'r' to restart or 'q' to quit.\n";
        }
    }

    game.removeListener(&listener);
    return 0;
}
