#pragma once

#include <weave/core/Error.hpp>
#include <weave/event/Events.hpp>
#include <weave/runtime/EventDispatch.hpp>
#include <weave/runtime/StateUpdate.hpp>
#include <weave/runtime/TreeBuilder.hpp>
#include <weave/widget/Template.hpp>
#include <weave/widget/Widget.hpp>
#include <weave/widget/WidgetContainer.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace WV {

struct RuntimeOptions {
    // Propagation for events posted with an explicit target and no strategy.
    DispatchStrategy targeted_strategy = DispatchStrategy::BubbleUp;
    // Events beyond this count stay queued for the next tick. Values below 1 are raised to 1.
    std::size_t max_events_per_tick = 256;
    bool        log_ticks           = false;
};

struct TickReport {
    std::uint64_t      tick              = 0;
    std::size_t        events_dispatched = 0;
    std::size_t        events_consumed   = 0;
    std::size_t        events_deferred   = 0;
    std::size_t        states_updated    = 0;
    std::vector<Error> errors;
};

/**
 * Owns one widget tree and drives it tick by tick.
 *
 * A tick first drains the event queue (in posting order), then runs every
 * State in tree order. Properties are settled when tick() returns. Events
 * posted from inside handlers or states are delivered on the next tick.
 *
 * Untargeted key events go to the focused widget (BubbleUp) or, with nothing
 * focused, top-down from the root. Untargeted mouse events go top-down; a
 * pointer collaborator that hit-tests should post with the hit widget as target.
 *
 * Handlers and states may call mount() and remove(). While an event is being
 * dispatched or states are updating, the request is checked right away but the
 * tree only changes once that event (or the state phase) has finished; until
 * then a removed widget stays reachable and a mounted one is not yet findable.
 */
class Runtime {
public:
    [[nodiscard]] static auto Create(Template root, RuntimeOptions options = {}) -> Expected<Runtime>;

    template <Widget W>
    [[nodiscard]] static auto Create(RuntimeOptions options = {}) -> Expected<Runtime> {
        return Create(W::Create(), options);
    }

    Runtime(Runtime&&) noexcept            = default;
    Runtime& operator=(Runtime&&) noexcept = default;
    Runtime(Runtime const&)                = delete;
    Runtime& operator=(Runtime const&)     = delete;

    [[nodiscard]] auto root() -> WidgetContainer& { return *root_; }
    [[nodiscard]] auto root() const -> WidgetContainer const& { return *root_; }
    [[nodiscard]] auto find(WidgetId id) const -> WidgetContainer*;
    [[nodiscard]] auto widget_count() const -> std::size_t { return index_.size(); }

    auto post_event(Event event, std::optional<WidgetId> target = std::nullopt) -> void;
    auto post_event(Event event, WidgetId target, DispatchStrategy strategy) -> void;
    [[nodiscard]] auto pending_events() const -> std::size_t { return queue_.size(); }

    // Moves focus, updating the Focused property of both widgets where declared.
    auto focus(WidgetId id) -> Expected<void>;
    auto clear_focus() -> void;
    [[nodiscard]] auto focused() const -> std::optional<WidgetId> { return focused_; }

    auto mount(WidgetId parent, Template tmpl) -> Expected<WidgetId>;
    auto remove(WidgetId id) -> Expected<void>;

    auto tick() -> TickReport;

    [[nodiscard]] auto options() const -> RuntimeOptions const& { return options_; }
    [[nodiscard]] auto ticks() const -> std::uint64_t { return tick_count_; }

private:
    struct PendingEvent {
        Event                           event;
        std::optional<WidgetId>         target;
        std::optional<DispatchStrategy> strategy;
    };

    Runtime(std::unique_ptr<WidgetContainer> root, TreeBuilder builder, RuntimeOptions options);

    // Tree change requested from inside a handler or state; subtree is null for a removal.
    struct DeferredChange {
        WidgetId                         target = 0;
        std::unique_ptr<WidgetContainer> subtree;
    };

    auto remove_now(WidgetContainer& widget) -> Expected<void>;
    auto queued_mounts(WidgetId parent) const -> std::size_t;
    auto apply_deferred(TickReport& report) -> void;
    auto index_subtree(WidgetContainer& widget) -> void;
    auto unindex_subtree(WidgetContainer const& widget) -> void;
    auto set_focused_property(WidgetId id, bool value) -> void;
    auto dispatch_pending(TickReport& report) -> void;
    auto dispatch_one(PendingEvent const& pending, TickReport& report) -> void;

    std::unique_ptr<WidgetContainer>                 root_;
    TreeBuilder                                      builder_;
    RuntimeOptions                                   options_;
    phmap::flat_hash_map<WidgetId, WidgetContainer*> index_;
    std::deque<PendingEvent>                         queue_;
    std::vector<DeferredChange>                      deferred_;
    std::optional<WidgetId>                          focused_;
    std::uint64_t                                    tick_count_ = 0;
    bool                                             in_phase_   = false;
};

} // namespace WV
