#include "line_packer.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace fillsched {

PackState openLine(const FillConfig& cfg, Hours start_time) {
    PackState s;
    s.current_time = start_time + cleanDuration(cfg);
    s.last_clean_end = s.current_time;
    return s;
}

PlacementPreview previewPlacement(const PackState& state, const Lot& lot, const FillConfig& cfg) {
    PlacementPreview p;
    Hours chg = changeoverDuration(cfg, state.last_type, lot.getType());
    Hours needed = chg + lot.getFillHours();
    Hours budget = windowBudget(cfg, state.last_clean_end, state.current_time);
    if (requiresForcedClean(budget, needed)) {
        p.forced_clean = true;
        chg = changeoverDuration(cfg, std::nullopt, lot.getType());
        needed = chg + lot.getFillHours();
        budget = windowCapacity(cfg);
    }
    p.changeover = chg;
    p.needed = needed;
    p.budget_after = budget - needed;
    return p;
}

PackState advance(const PackState& state, const Lot& lot, const FillConfig& cfg) {
    PlacementPreview p = previewPlacement(state, lot, cfg);
    PackState next = state;
    if (p.forced_clean) {
        next.current_time += cleanDuration(cfg);
        next.last_clean_end = next.current_time;
        next.last_type.reset();
    }
    next.current_time += p.needed;
    next.last_type = lot.getType();
    return next;
}

void checkOversize(const std::vector<Lot>& lots, const FillConfig& cfg) {
    for (const auto& lot : lots) {
        if (!isOversize(cfg, lot.getFillHours())) continue;
        std::ostringstream oss;
        oss << "Lot " << lot.getId() << ": " << lot.getVialCount() << " vials (~" << lot.getFillHours()
            << " h) exceeds the " << windowCapacity(cfg) << " h clean window";
        throw OversizeLotError(oss.str(), lot.getId());
    }
}

LinePacker::LinePacker(const FillConfig& cfg, Hours start_time) : cfg_(cfg) {
    state_.current_time = start_time;
    appendClean("Block reset");
}

void LinePacker::appendClean(const std::string& note) {
    Activity a;
    a.kind = ActivityKind::Clean;
    a.start = state_.current_time;
    a.end = a.start + cleanDuration(cfg_);
    a.line_id = cfg_.line_id;
    a.note = note;
    schedule_.append(a);
    state_.current_time = a.end;
    state_.last_clean_end = a.end;
    state_.last_type.reset();
}

void LinePacker::clean(const std::string& note) {
    appendClean(note);
}

bool LinePacker::place(const Lot& lot) {
    // never commit an oversize fill, whoever the caller is
    if (isOversize(cfg_, lot.getFillHours())) checkOversize({lot}, cfg_);
    PlacementPreview p = previewPlacement(state_, lot, cfg_);
    if (p.forced_clean) {
        spdlog::trace("forced clean at {:.2f} h before lot {}", state_.current_time, lot.getId());
        clean("Window full");
    }
    if (p.changeover > 0.0) {
        Activity chg;
        chg.kind = ActivityKind::Changeover;
        chg.start = state_.current_time;
        chg.end = chg.start + p.changeover;
        chg.line_id = cfg_.line_id;
        std::ostringstream note;
        note << state_.last_type.value_or("") << "->" << lot.getType() << " " << p.changeover << "h";
        chg.note = note.str();
        schedule_.append(chg);
        state_.current_time = chg.end;
    }
    Activity fill;
    fill.kind = ActivityKind::Fill;
    fill.lot = lot;
    fill.start = state_.current_time;
    fill.end = fill.start + lot.getFillHours();
    fill.line_id = cfg_.line_id;
    fill.note = std::to_string(lot.getVialCount()) + " vials";
    schedule_.append(fill);
    state_.current_time = fill.end;
    state_.last_type = lot.getType();
    return p.forced_clean;
}

Schedule planInOrder(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg) {
    if (lots.empty()) return Schedule{};
    checkOversize(lots, cfg);
    LinePacker packer(cfg, start_time);
    for (const auto& lot : lots) packer.place(lot);
    return packer.finish();
}

std::vector<Lot> orderLotsBySequence(const std::vector<Lot>& lots, const std::vector<std::string>& sequence,
                                     std::vector<std::string>* unknown) {
    std::unordered_map<std::string, const Lot*> byId;
    for (const auto& lot : lots) byId.emplace(lot.getId(), &lot);
    std::vector<Lot> ordered;
    ordered.reserve(lots.size());
    std::unordered_set<std::string> used;
    for (const auto& id : sequence) {
        auto it = byId.find(id);
        if (it == byId.end()) {
            if (unknown) unknown->push_back(id);
            continue;
        }
        if (!used.insert(id).second) continue;
        ordered.push_back(*it->second);
    }
    for (const auto& lot : lots) {
        if (!used.count(lot.getId())) ordered.push_back(lot);
    }
    return ordered;
}

} // namespace fillsched
