#pragma once

#include "strategy.hpp"
#include <vector>

namespace fillsched {

// Shortest fill first, ties by id.
std::vector<Lot> sptOrder(std::vector<Lot> lots);

// Longest fill first, ties by id.
std::vector<Lot> lptOrder(std::vector<Lot> lots);

// Lots grouped by type. Group order follows cfg.cfs_cluster_order
// (descending total vials or lot count, ties by type name); inside a group
// cfg.cfs_within decides (id, spt or lpt).
std::vector<std::vector<Lot>> cfsClusters(const std::vector<Lot>& lots, const FillConfig& cfg);

class SptPack : public OrderingStrategy {
public:
    std::string getName() const override { return "spt-pack"; }
protected:
    std::vector<Lot> order(const std::vector<Lot>& lots, const FillConfig& cfg) const override;
};

class LptPack : public OrderingStrategy {
public:
    std::string getName() const override { return "lpt-pack"; }
protected:
    std::vector<Lot> order(const std::vector<Lot>& lots, const FillConfig& cfg) const override;
};

// Cluster-first-sequence: keeps same-type lots together to cut changeovers.
class CfsPack : public OrderingStrategy {
public:
    std::string getName() const override { return "cfs-pack"; }
protected:
    std::vector<Lot> order(const std::vector<Lot>& lots, const FillConfig& cfg) const override;
};

} // namespace fillsched
