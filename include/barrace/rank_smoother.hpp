#pragma once

#include <barrace/frame.hpp>

#include <string>
#include <vector>

namespace barrace
{

// Share of the remaining distance a bar covers toward its target slot each
// frame.
inline constexpr float kRankSmoothing = 0.15f;

inline constexpr float lerp(float a, float b, float t)
{
    return a + (b - a) * t;
}

// Eases each series' vertical slot toward its rank in the current frame.
//
// Holds the only cross-frame state of a render, so every render constructs its
// own instance; nothing here is shared between renders.
class RankSmoother
{
   public:
    // Seeds slot i for order[i].
    explicit RankSmoother(std::vector<std::string> order, float smoothing = kRankSmoothing);

    // Rank the frame (value descending, ties keep seed order), move every slot
    // a fixed fraction toward its target and return the new slots.
    const Positions& advance(const Frame& frame);

    // Target slot of every series for one frame, without touching state.
    Positions target_slots(const Frame& frame) const;

    const Positions&                positions() const { return positions_; }
    const std::vector<std::string>& order() const { return order_; }
    float                           smoothing() const { return smoothing_; }

   private:
    std::vector<std::string> order_;
    float                    smoothing_;
    Positions                positions_;
};

// Run a fresh RankSmoother over the whole frame sequence and return the eased
// slots of every frame, so that frames can be laid out independently.
std::vector<Positions> ease_positions(const std::vector<Frame>&       frames,
                                      const std::vector<std::string>& order,
                                      float                           smoothing = kRankSmoothing);

}  // namespace barrace
