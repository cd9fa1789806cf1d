#ifndef VELLUM_GAMECLOCK_HPP
#define VELLUM_GAMECLOCK_HPP

#include <cstdint>  // For uint64_t

namespace vellum {

// Counts fixed simulation steps and the simulated seconds they covered.
class GameClock {
   private:
    uint64_t ticks;  // Fixed steps taken
    double seconds;  // Sum of the step lengths

   public:
    GameClock() : ticks(0), seconds(0.0) {}

    // Advances the clock by one step of 'dt' seconds
    void tick(double dt) {
        ticks++;
        seconds += dt;
    }

    void reset() {
        ticks = 0;
        seconds = 0.0;
    }

    uint64_t getTicks() const { return ticks; }

    double getSeconds() const { return seconds; }
};

}  // namespace vellum

#endif  // VELLUM_GAMECLOCK_HPP
