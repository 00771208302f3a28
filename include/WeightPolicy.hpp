#pragma once
#include <memory>
#include <string>
#include "Types.hpp"

// Everything a cost function may look at for one relaxed edge.
struct EdgeStep
{
    std::string const& fromStation;
    std::string const& toStation;
    std::string const& fromLine;
    std::string const& toLine;
    int minutes;
    bool isTransfer;
};

// Capability interface for cost policies beyond the three built-in ones.
// Implementations must be pure and return a finite, non-negative cost.
class EdgeCostModel
{
public:
    virtual ~EdgeCostModel() = default;
    virtual double cost(EdgeStep const& step) const = 0;
};

enum class PolicyKind
{
    Safe,
    Fast,
    Balanced,
    Custom
};

class WeightPolicy
{
private:
    PolicyKind policyKind;
    std::shared_ptr<CrimeMap const> crime;
    std::shared_ptr<EdgeCostModel const> model;

    WeightPolicy(PolicyKind kind,
                 std::shared_ptr<CrimeMap const> crimeData,
                 std::shared_ptr<EdgeCostModel const> costModel);

    double crimeAt(std::string const& station) const;

public:
    static constexpr unsigned int kDefaultCrimeCount = 5;
    static constexpr unsigned int kCrimeCap          = 20;

    static constexpr double kSafeTransferPenalty     = 5.0;
    static constexpr double kFastTransferPenalty     = 8.0;
    static constexpr double kBalancedTransferPenalty = 6.0;

    static WeightPolicy safe(std::shared_ptr<CrimeMap const> crimeData);
    static WeightPolicy fast();
    static WeightPolicy balanced(std::shared_ptr<CrimeMap const> crimeData);
    static WeightPolicy custom(std::shared_ptr<EdgeCostModel const> costModel);

    double operator()(EdgeStep const& step) const;

    PolicyKind kind() const noexcept { return policyKind; }
};

std::string toString(PolicyKind kind);
