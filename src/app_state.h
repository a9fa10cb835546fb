#ifndef HULLFORGE_APP_STATE_H_
#define HULLFORGE_APP_STATE_H_

#include <cstdint>
#include <functional>
#include <vector>

#include "lod_policy.h"
#include "offset_table.h"

namespace hullforge {

// Bit flags naming the ViewerState fields a subscriber listens to.
enum StateField : uint32_t {
    kFieldUnits = 1u << 0,
    kFieldDebug = 1u << 1,
    kFieldWireframe = 1u << 2,
    kFieldAddWeightActive = 1u << 3,
    kFieldShowHull = 1u << 4,
    kFieldShowDeck = 1u << 5,
    kFieldShowStations = 1u << 6,
    kFieldShowWaterlines = 1u << 7,
    kFieldLod = 1u << 8,
    kFieldVisibility = kFieldShowHull | kFieldShowDeck | kFieldShowStations | kFieldShowWaterlines,
    kFieldAll = 0x1ffu,
};

struct ViewerState {
    LengthUnit units = LengthUnit::Meter;
    bool debug = false;
    bool wireframe = false;
    bool addWeightActive = false;
    bool showHull = true;
    bool showDeck = true;
    bool showStations = false;
    bool showWaterlines = false;
    LodConfig lod = {};
};

// Owns one ViewerState and notifies subscribers whose mask intersects the
// fields that actually changed. Setters with an unchanged value are silent.
class StateStore {
public:
    using Listener = std::function<void(const ViewerState &state, uint32_t changed)>;

    StateStore() = default;
    explicit StateStore(const ViewerState &initial) : state_(initial) {}

    StateStore(const StateStore &) = delete;
    StateStore &operator=(const StateStore &) = delete;

    const ViewerState &state() const { return state_; }

    // Returns a handle for Unsubscribe.
    int Subscribe(uint32_t mask, Listener listener);
    bool Unsubscribe(int id);

    void SetUnits(LengthUnit units);
    void SetDebug(bool on);
    void SetWireframe(bool on);
    void SetAddWeightActive(bool on);
    void SetShowHull(bool on);
    void SetShowDeck(bool on);
    void SetShowStations(bool on);
    void SetShowWaterlines(bool on);
    void SetLod(const LodConfig &lod);

    // Replays the current state to every subscriber with all fields flagged.
    void NotifyAll();

private:
    struct Subscription {
        int id = 0;
        uint32_t mask = 0;
        Listener listener;
    };

    void set_flag(bool *field, bool value, StateField which);
    void notify(uint32_t changed);

    ViewerState state_;
    std::vector<Subscription> subscriptions_;
    int next_id_ = 1;
};

}  // namespace hullforge

#endif  // HULLFORGE_APP_STATE_H_
