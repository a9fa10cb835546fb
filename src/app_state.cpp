#include "app_state.h"

#include <utility>

namespace hullforge {

int StateStore::Subscribe(uint32_t mask, Listener listener) {
    if (!listener || mask == 0) return -1;
    Subscription sub;
    sub.id = next_id_++;
    sub.mask = mask;
    sub.listener = std::move(listener);
    subscriptions_.push_back(std::move(sub));
    return subscriptions_.back().id;
}

bool StateStore::Unsubscribe(int id) {
    for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it) {
        if (it->id != id) continue;
        subscriptions_.erase(it);
        return true;
    }
    return false;
}

void StateStore::SetUnits(LengthUnit units) {
    if (state_.units == units) return;
    state_.units = units;
    notify(kFieldUnits);
}

void StateStore::SetDebug(bool on) { set_flag(&state_.debug, on, kFieldDebug); }
void StateStore::SetWireframe(bool on) { set_flag(&state_.wireframe, on, kFieldWireframe); }
void StateStore::SetAddWeightActive(bool on) { set_flag(&state_.addWeightActive, on, kFieldAddWeightActive); }
void StateStore::SetShowHull(bool on) { set_flag(&state_.showHull, on, kFieldShowHull); }
void StateStore::SetShowDeck(bool on) { set_flag(&state_.showDeck, on, kFieldShowDeck); }
void StateStore::SetShowStations(bool on) { set_flag(&state_.showStations, on, kFieldShowStations); }
void StateStore::SetShowWaterlines(bool on) { set_flag(&state_.showWaterlines, on, kFieldShowWaterlines); }

void StateStore::SetLod(const LodConfig &lod) {
    if (state_.lod.stationMultiplier == lod.stationMultiplier &&
        state_.lod.waterlineMultiplier == lod.waterlineMultiplier &&
        state_.lod.enableSmoothing == lod.enableSmoothing) {
        return;
    }
    state_.lod = lod;
    notify(kFieldLod);
}

void StateStore::NotifyAll() { notify(kFieldAll); }

void StateStore::set_flag(bool *field, bool value, StateField which) {
    if (*field == value) return;
    *field = value;
    notify(which);
}

void StateStore::notify(uint32_t changed) {
    // Listeners may subscribe or unsubscribe while being notified.
    const std::vector<Subscription> snapshot = subscriptions_;
    for (const Subscription &sub : snapshot) {
        if ((sub.mask & changed) == 0) continue;
        sub.listener(state_, changed);
    }
}

}  // namespace hullforge
