#include <weave/runtime/Runtime.hpp>

#include <weave/widget/Properties.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <variant>

namespace WV {

namespace {

auto widget_not_found(WidgetId id, std::string_view context) -> Error {
    return Error{Error::Code::WidgetNotFound, std::string(context) + ": no widget #" + std::to_string(id)};
}

// Marks the span during which handlers or states run against the live tree.
class PhaseGuard {
public:
    explicit PhaseGuard(bool& flag)
        : flag_(flag) {
        flag_ = true;
    }
    ~PhaseGuard() { flag_ = false; }

    PhaseGuard(PhaseGuard const&)            = delete;
    PhaseGuard& operator=(PhaseGuard const&) = delete;

private:
    bool& flag_;
};

} // namespace

auto Runtime::Create(Template root, RuntimeOptions options) -> Expected<Runtime> {
    TreeBuilder builder;
    auto        tree = builder.build(std::move(root));
    if (!tree)
        return std::unexpected(tree.error());
    return Runtime{std::move(*tree), builder, options};
}

Runtime::Runtime(std::unique_ptr<WidgetContainer> root, TreeBuilder builder, RuntimeOptions options)
    : root_(std::move(root))
    , builder_(builder)
    , options_(options) {
    if (options_.max_events_per_tick == 0) {
        wv_log("max_events_per_tick of 0 raised to 1", "Runtime");
        options_.max_events_per_tick = 1;
    }
    index_subtree(*root_);
    wv_log("Runtime created with " + std::to_string(index_.size()) + " widgets", "Runtime");
}

auto Runtime::find(WidgetId id) const -> WidgetContainer* {
    auto it = index_.find(id);
    if (it == index_.end())
        return nullptr;
    return it->second;
}

auto Runtime::post_event(Event event, std::optional<WidgetId> target) -> void {
    queue_.push_back(PendingEvent{std::move(event), target, std::nullopt});
}

auto Runtime::post_event(Event event, WidgetId target, DispatchStrategy strategy) -> void {
    queue_.push_back(PendingEvent{std::move(event), target, strategy});
}

auto Runtime::focus(WidgetId id) -> Expected<void> {
    if (!find(id))
        return std::unexpected(widget_not_found(id, "focus"));
    if (focused_ == id)
        return {};
    auto previous = std::exchange(focused_, id);
    if (previous)
        set_focused_property(*previous, false);
    set_focused_property(id, true);
    wv_log("Focus moved to #" + std::to_string(id), "Runtime");
    return {};
}

auto Runtime::clear_focus() -> void {
    if (auto previous = std::exchange(focused_, std::nullopt))
        set_focused_property(*previous, false);
}

auto Runtime::mount(WidgetId parent, Template tmpl) -> Expected<WidgetId> {
    auto* target = find(parent);
    if (!target)
        return std::unexpected(widget_not_found(parent, "mount"));

    if (!in_phase_) {
        auto child = builder_.attach(*target, std::move(tmpl));
        if (!child)
            return std::unexpected(child.error());
        index_subtree(**child);
        return (*child)->id();
    }

    auto capacity = parentTypeCapacity(target->parent_type());
    if (capacity && target->child_count() + queued_mounts(parent) >= *capacity) {
        return std::unexpected(Error{Error::Code::ArityViolation,
                                     "widget '" + target->debug_name() + "' ("
                                         + std::string(parentTypeToString(target->parent_type()))
                                         + ") cannot take another child"});
    }
    auto subtree = builder_.build(std::move(tmpl));
    if (!subtree)
        return std::unexpected(subtree.error());
    auto id = (*subtree)->id();
    deferred_.push_back(DeferredChange{parent, std::move(*subtree)});
    return id;
}

auto Runtime::remove(WidgetId id) -> Expected<void> {
    auto* widget = find(id);
    if (!widget)
        return std::unexpected(widget_not_found(id, "remove"));
    if (!in_phase_)
        return remove_now(*widget);

    if (!widget->parent()) {
        return std::unexpected(Error{Error::Code::NotSupported,
                                     "widget '" + widget->debug_name() + "' is a root and cannot be detached"});
    }
    deferred_.push_back(DeferredChange{id, nullptr});
    return {};
}

auto Runtime::tick() -> TickReport {
    TickReport report{};
    report.tick = ++tick_count_;

    dispatch_pending(report);

    StateUpdateReport updates;
    {
        PhaseGuard phase{in_phase_};
        updates = UpdateStates(*root_);
    }
    report.states_updated = updates.states_updated;
    for (auto& failure : updates.failures)
        report.errors.push_back(std::move(failure.error));
    apply_deferred(report);

    if (options_.log_ticks) {
        wv_log("Tick " + std::to_string(report.tick) + ": " + std::to_string(report.events_dispatched)
                   + " events (" + std::to_string(report.events_consumed) + " consumed, "
                   + std::to_string(report.events_deferred) + " deferred), "
                   + std::to_string(report.states_updated) + " states, " + std::to_string(report.errors.size())
                   + " errors",
               "Runtime");
    }
    return report;
}

auto Runtime::remove_now(WidgetContainer& widget) -> Expected<void> {
    auto id       = widget.id();
    auto detached = TreeBuilder::Detach(widget);
    if (!detached)
        return std::unexpected(detached.error());
    unindex_subtree(**detached);
    if (focused_ && !index_.contains(*focused_))
        focused_.reset();
    wv_log("Removed subtree rooted at #" + std::to_string(id), "Runtime");
    return {};
}

auto Runtime::queued_mounts(WidgetId parent) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(deferred_.begin(), deferred_.end(), [parent](auto const& change) {
        return change.subtree && change.target == parent;
    }));
}

// Applies mount/remove requests made while handlers or states were running, in request order.
auto Runtime::apply_deferred(TickReport& report) -> void {
    auto changes = std::exchange(deferred_, {});
    for (auto& change : changes) {
        if (!change.subtree) {
            // Already gone when an ancestor was removed first.
            if (auto* widget = find(change.target)) {
                if (auto status = remove_now(*widget); !status)
                    report.errors.push_back(std::move(status.error()));
            }
            continue;
        }
        auto* parent = find(change.target);
        if (!parent) {
            report.errors.push_back(widget_not_found(change.target, "deferred mount"));
            continue;
        }
        auto adopted = TreeBuilder::Adopt(*parent, std::move(change.subtree));
        if (!adopted) {
            report.errors.push_back(std::move(adopted.error()));
            continue;
        }
        index_subtree(**adopted);
    }
}

auto Runtime::index_subtree(WidgetContainer& widget) -> void {
    widget.visit([this](WidgetContainer& node) { index_.insert_or_assign(node.id(), &node); });
}

auto Runtime::unindex_subtree(WidgetContainer const& widget) -> void {
    widget.visit([this](WidgetContainer const& node) { index_.erase(node.id()); });
}

auto Runtime::set_focused_property(WidgetId id, bool value) -> void {
    auto* widget = find(id);
    if (!widget || !widget->has_property<Focused>())
        return;
    if (auto status = widget->set_property(Focused{value}); !status) {
        wv_log("Failed to update focus of #" + std::to_string(id) + ": " + describeError(status.error()),
               "Runtime", "ERROR");
    }
}

auto Runtime::dispatch_pending(TickReport& report) -> void {
    // Only what was queued before this tick; anything posted while dispatching waits.
    auto budget = std::min(queue_.size(), options_.max_events_per_tick);
    for (std::size_t i = 0; i < budget; ++i) {
        auto pending = std::move(queue_.front());
        queue_.pop_front();
        dispatch_one(pending, report);
    }
    report.events_deferred = queue_.size();
}

auto Runtime::dispatch_one(PendingEvent const& pending, TickReport& report) -> void {
    WidgetContainer* target   = nullptr;
    DispatchStrategy strategy = DispatchStrategy::TopDown;

    if (pending.target) {
        target = find(*pending.target);
        if (!target) {
            auto error = widget_not_found(*pending.target, "dispatch " + describeEvent(pending.event));
            wv_log(describeError(error), "Dispatch", "ERROR");
            report.errors.push_back(std::move(error));
            return;
        }
        strategy = pending.strategy.value_or(options_.targeted_strategy);
    } else if (std::holds_alternative<KeyEvent>(pending.event) && focused_) {
        target   = find(*focused_);
        strategy = pending.strategy.value_or(options_.targeted_strategy);
    }

    if (!target) {
        target   = root_.get();
        strategy = DispatchStrategy::TopDown;
    }

    ++report.events_dispatched;
    DispatchResult result;
    {
        PhaseGuard phase{in_phase_};
        result = DispatchEvent(pending.event, *target, strategy);
    }
    if (result.consumed)
        ++report.events_consumed;
    apply_deferred(report);
}

} // namespace WV
