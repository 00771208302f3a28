#include "WeightPolicy.hpp"

#include <algorithm>
#include <stdexcept>

WeightPolicy::WeightPolicy(PolicyKind kind,
                           std::shared_ptr<CrimeMap const> crimeData,
                           std::shared_ptr<EdgeCostModel const> costModel)
    : policyKind(kind)
    , crime(std::move(crimeData))
    , model(std::move(costModel))
{
}

WeightPolicy WeightPolicy::safe(std::shared_ptr<CrimeMap const> crimeData)
{
    return WeightPolicy(PolicyKind::Safe, std::move(crimeData), nullptr);
}

WeightPolicy WeightPolicy::fast()
{
    return WeightPolicy(PolicyKind::Fast, nullptr, nullptr);
}

WeightPolicy WeightPolicy::balanced(std::shared_ptr<CrimeMap const> crimeData)
{
    return WeightPolicy(PolicyKind::Balanced, std::move(crimeData), nullptr);
}

WeightPolicy WeightPolicy::custom(std::shared_ptr<EdgeCostModel const> costModel)
{
    if (!costModel)
        throw std::invalid_argument("custom weight policy needs a cost model");

    return WeightPolicy(PolicyKind::Custom, nullptr, std::move(costModel));
}

double WeightPolicy::crimeAt(std::string const& station) const
{
    unsigned int count = kDefaultCrimeCount;

    if (crime)
    {
        auto it = crime->find(station);
        if (it != crime->end())
            count = it->second;
    }

    return static_cast<double>(std::min(count, kCrimeCap));
}

double WeightPolicy::operator()(EdgeStep const& step) const
{
    double const t = static_cast<double>(step.minutes);

    switch (policyKind)
    {
    case PolicyKind::Safe:
    {
        // 0 incidents ride at 1x, 20 or more at 3x.
        double const multiplier = 1.0 + crimeAt(step.toStation) / 10.0;
        return t * multiplier + (step.isTransfer ? kSafeTransferPenalty : 0.0);
    }
    case PolicyKind::Fast:
        return t + (step.isTransfer ? kFastTransferPenalty : 0.0);

    case PolicyKind::Balanced:
    {
        // 50% time, 35% crime, 15% transfer avoidance.
        double const crimeCost    = crimeAt(step.toStation) * 0.5;
        double const transferCost = step.isTransfer ? kBalancedTransferPenalty : 0.0;
        return 0.5 * t + 0.35 * crimeCost + 0.15 * transferCost;
    }
    case PolicyKind::Custom:
        return model->cost(step);
    }

    throw std::logic_error("unhandled weight policy");
}

std::string toString(PolicyKind kind)
{
    switch (kind)
    {
    case PolicyKind::Safe:     return "safe";
    case PolicyKind::Fast:     return "fast";
    case PolicyKind::Balanced: return "balanced";
    case PolicyKind::Custom:   return "custom";
    }
    return "unknown";
}
