#include "heuristics.hpp"
#include <algorithm>
#include <map>

namespace fillsched {

static bool byId(const Lot& a, const Lot& b) {
    return a.getId() < b.getId();
}

std::vector<Lot> sptOrder(std::vector<Lot> lots) {
    std::sort(lots.begin(), lots.end(), [](const Lot& a, const Lot& b) {
        if (a.getFillHours() != b.getFillHours()) return a.getFillHours() < b.getFillHours();
        return byId(a, b);
    });
    return lots;
}

std::vector<Lot> lptOrder(std::vector<Lot> lots) {
    std::sort(lots.begin(), lots.end(), [](const Lot& a, const Lot& b) {
        if (a.getFillHours() != b.getFillHours()) return a.getFillHours() > b.getFillHours();
        return byId(a, b);
    });
    return lots;
}

std::vector<std::vector<Lot>> cfsClusters(const std::vector<Lot>& lots, const FillConfig& cfg) {
    std::map<std::string, std::vector<Lot>> byType;
    for (const auto& lot : lots) byType[lot.getType()].push_back(lot);

    struct Group {
        std::string type;
        long long vials;
        std::vector<Lot> lots;
    };
    std::vector<Group> groups;
    for (auto& kv : byType) {
        long long vials = 0;
        for (const auto& lot : kv.second) vials += lot.getVialCount();
        groups.push_back({kv.first, vials, std::move(kv.second)});
    }

    const bool byCount = cfg.cfs_cluster_order == "by_count";
    std::sort(groups.begin(), groups.end(), [byCount](const Group& a, const Group& b) {
        if (byCount && a.lots.size() != b.lots.size()) return a.lots.size() > b.lots.size();
        if (!byCount && a.vials != b.vials) return a.vials > b.vials;
        return a.type < b.type;
    });

    std::vector<std::vector<Lot>> clusters;
    clusters.reserve(groups.size());
    for (auto& g : groups) {
        if (cfg.cfs_within == "spt") {
            clusters.push_back(sptOrder(std::move(g.lots)));
        } else if (cfg.cfs_within == "lpt") {
            clusters.push_back(lptOrder(std::move(g.lots)));
        } else {
            std::sort(g.lots.begin(), g.lots.end(), byId);
            clusters.push_back(std::move(g.lots));
        }
    }
    return clusters;
}

std::vector<Lot> SptPack::order(const std::vector<Lot>& lots, const FillConfig&) const {
    return sptOrder(lots);
}

std::vector<Lot> LptPack::order(const std::vector<Lot>& lots, const FillConfig&) const {
    return lptOrder(lots);
}

std::vector<Lot> CfsPack::order(const std::vector<Lot>& lots, const FillConfig& cfg) const {
    std::vector<Lot> ordered;
    ordered.reserve(lots.size());
    for (auto& cluster : cfsClusters(lots, cfg)) {
        ordered.insert(ordered.end(), cluster.begin(), cluster.end());
    }
    return ordered;
}

} // namespace fillsched
