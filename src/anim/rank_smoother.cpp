#include <barrace/rank_smoother.hpp>

#include <algorithm>
#include <numeric>

namespace barrace
{

RankSmoother::RankSmoother(std::vector<std::string> order, float smoothing)
    : order_(std::move(order)), smoothing_(std::clamp(smoothing, 0.0f, 1.0f))
{
    positions_.reserve(order_.size());
    for (size_t i = 0; i < order_.size(); ++i)
        positions_[order_[i]] = static_cast<float>(i);
}

Positions RankSmoother::target_slots(const Frame& frame) const
{
    std::vector<size_t> ranked(order_.size());
    std::iota(ranked.begin(), ranked.end(), size_t{0});

    std::vector<double> values(order_.size());
    for (size_t i = 0; i < order_.size(); ++i)
        values[i] = frame.value(order_[i]);

    // Highest value on top; equal values keep the seed order
    std::stable_sort(ranked.begin(),
                     ranked.end(),
                     [&values](size_t a, size_t b) { return values[a] > values[b]; });

    Positions targets;
    targets.reserve(order_.size());
    for (size_t slot = 0; slot < ranked.size(); ++slot)
        targets[order_[ranked[slot]]] = static_cast<float>(slot);
    return targets;
}

const Positions& RankSmoother::advance(const Frame& frame)
{
    Positions   targets  = target_slots(frame);
    const float max_slot = order_.empty() ? 0.0f : static_cast<float>(order_.size() - 1);
    for (const auto& name : order_)
    {
        float& slot = positions_[name];
        slot        = std::clamp(lerp(slot, targets[name], smoothing_), 0.0f, max_slot);
    }
    return positions_;
}

std::vector<Positions> ease_positions(const std::vector<Frame>&       frames,
                                      const std::vector<std::string>& order,
                                      float                           smoothing)
{
    RankSmoother smoother(order, smoothing);

    std::vector<Positions> eased;
    eased.reserve(frames.size());
    for (const auto& frame : frames)
        eased.push_back(smoother.advance(frame));
    return eased;
}

}  // namespace barrace
