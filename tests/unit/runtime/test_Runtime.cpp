#include <weave/runtime/Runtime.hpp>
#include <weave/widget/Properties.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace WV;

namespace {

// Appends printable keys to its Label while Focused.
auto typing_target(std::string name) -> Template {
    return Template{}
        .with_property(Label{})
        .with_property(Focused{})
        .with_debug_name(std::move(name))
        .with_event_handler(KeyEventHandler{}.on_key_down([](Key key, WidgetContainer& widget) {
            if (!widget.get_property<Focused>()->value)
                return false;
            auto character = key.printable();
            if (!character)
                return false;
            auto label = widget.borrow_mut_property<Label>();
            if (!label)
                return false;
            (*label)->text += utf32ToUtf8(*character);
            return true;
        }));
}

// root(Multi) -> [first, second]
auto two_inputs() -> Runtime {
    auto runtime = Runtime::Create(Template{}
                                       .as_parent_type(ParentType::Multi)
                                       .with_debug_name("Root")
                                       .with_child(typing_target("First"))
                                       .with_child(typing_target("Second")));
    REQUIRE(runtime);
    return std::move(*runtime);
}

auto label_of(Runtime& runtime, std::size_t index) -> std::string {
    return runtime.root().child(index)->get_property<Label>()->text;
}

} // namespace

TEST_SUITE("runtime.runtime") {
    TEST_CASE("Creation indexes every widget") {
        auto runtime = two_inputs();
        CHECK(runtime.widget_count() == 3);
        CHECK(runtime.find(runtime.root().id()) == &runtime.root());
        CHECK(runtime.find(runtime.root().child(1)->id()) == runtime.root().child(1));
        CHECK(runtime.find(999) == nullptr);
        CHECK(runtime.ticks() == 0);
        CHECK_FALSE(runtime.focused());
    }

    TEST_CASE("Invalid root templates are rejected") {
        auto runtime = Runtime::Create(Template{}.with_child(Template{}));
        REQUIRE_FALSE(runtime);
        CHECK(runtime.error().code == Error::Code::ArityViolation);
    }

    TEST_CASE("Focus moves the Focused property") {
        auto  runtime = two_inputs();
        auto* first   = runtime.root().child(0);
        auto* second  = runtime.root().child(1);

        REQUIRE(runtime.focus(first->id()));
        CHECK(first->get_property<Focused>()->value);
        CHECK_FALSE(second->get_property<Focused>()->value);

        REQUIRE(runtime.focus(second->id()));
        CHECK_FALSE(first->get_property<Focused>()->value);
        CHECK(second->get_property<Focused>()->value);
        CHECK(runtime.focused() == second->id());

        runtime.clear_focus();
        CHECK_FALSE(second->get_property<Focused>()->value);
        CHECK_FALSE(runtime.focused());

        auto missing = runtime.focus(4242);
        REQUIRE_FALSE(missing);
        CHECK(missing.error().code == Error::Code::WidgetNotFound);
    }

    TEST_CASE("Focusing a widget without Focused still routes keys to it") {
        auto runtime = two_inputs();
        REQUIRE(runtime.focus(runtime.root().id()));
        CHECK(runtime.focused() == runtime.root().id());
    }

    TEST_CASE("Untargeted keys go to the focused widget") {
        auto runtime = two_inputs();
        REQUIRE(runtime.focus(runtime.root().child(1)->id()));

        runtime.post_event(KeyDown(Key::FromCharacter(U'h')));
        runtime.post_event(KeyDown(Key::FromCharacter(U'i')));
        CHECK(runtime.pending_events() == 2);

        auto report = runtime.tick();
        CHECK(report.tick == 1);
        CHECK(report.events_dispatched == 2);
        CHECK(report.events_consumed == 2);
        CHECK(report.errors.empty());
        CHECK(runtime.pending_events() == 0);
        CHECK(label_of(runtime, 0).empty());
        CHECK(label_of(runtime, 1) == "hi");
    }

    TEST_CASE("Without focus keys travel top-down and nobody types") {
        auto runtime = two_inputs();
        runtime.post_event(KeyDown(Key::FromCharacter(U'x')));
        auto report = runtime.tick();
        CHECK(report.events_dispatched == 1);
        CHECK(report.events_consumed == 0);
        CHECK(label_of(runtime, 0).empty());
        CHECK(label_of(runtime, 1).empty());
    }

    TEST_CASE("Targeted events honour the requested strategy") {
        auto  runtime = two_inputs();
        auto* first   = runtime.root().child(0);
        REQUIRE(first->set_property(Focused{true}));

        runtime.post_event(KeyDown(Key::FromCharacter(U'a')), first->id());
        runtime.post_event(KeyDown(Key::FromCharacter(U'b')), first->id(), DispatchStrategy::Direct);
        auto report = runtime.tick();
        CHECK(report.events_consumed == 2);
        CHECK(label_of(runtime, 0) == "ab");
    }

    TEST_CASE("Events for unknown widgets are reported") {
        auto runtime = two_inputs();
        runtime.post_event(KeyDown(Key::FromCharacter(U'a')), WidgetId{777});
        auto report = runtime.tick();
        CHECK(report.events_dispatched == 0);
        REQUIRE(report.errors.size() == 1);
        CHECK(report.errors[0].code == Error::Code::WidgetNotFound);
    }

    TEST_CASE("Events beyond the per tick budget wait for the next tick") {
        RuntimeOptions options;
        options.max_events_per_tick = 2;
        auto runtime = Runtime::Create(typing_target("Input"), options);
        REQUIRE(runtime);
        REQUIRE(runtime->focus(runtime->root().id()));

        for (char32_t ch : std::u32string{U"abcde"})
            runtime->post_event(KeyDown(Key::FromCharacter(ch)));

        auto first = runtime->tick();
        CHECK(first.events_dispatched == 2);
        CHECK(first.events_deferred == 3);
        CHECK(runtime->root().get_property<Label>()->text == "ab");

        (void)runtime->tick();
        auto last = runtime->tick();
        CHECK(last.events_dispatched == 1);
        CHECK(last.events_deferred == 0);
        CHECK(runtime->root().get_property<Label>()->text == "abcde");
        CHECK(runtime->ticks() == 3);
    }

    TEST_CASE("Events posted while dispatching are delivered on the next tick") {
        Runtime* runtime_ptr = nullptr;
        int      echoes      = 0;

        auto echo = KeyEventHandler{}.on_key_down([&runtime_ptr, &echoes](Key key, WidgetContainer& widget) {
            ++echoes;
            if (key.code == KeyCode::Enter)
                runtime_ptr->post_event(KeyDown(Key{KeyCode::Tab}), widget.id());
            return true;
        });

        auto runtime = Runtime::Create(Template{}.with_event_handler(std::move(echo)));
        REQUIRE(runtime);
        runtime_ptr = &*runtime;

        runtime->post_event(KeyDown(Key{KeyCode::Enter}), runtime->root().id());
        auto first = runtime->tick();
        CHECK(first.events_dispatched == 1);
        CHECK(first.events_deferred == 1);
        CHECK(echoes == 1);

        auto second = runtime->tick();
        CHECK(second.events_dispatched == 1);
        CHECK(second.events_deferred == 0);
        CHECK(echoes == 2);
    }

    TEST_CASE("Mounting and removing subtrees keeps the index in sync") {
        auto runtime = two_inputs();
        auto root    = runtime.root().id();

        SharedProperty<Label> label{Label{"mounted"}};
        auto mounted = runtime.mount(root, Template{}
                                               .as_parent_type(ParentType::Single)
                                               .with_shared_property(label)
                                               .with_property(Focused{})
                                               .with_child(Template{}.with_shared_property(label)));
        REQUIRE(mounted);
        CHECK(runtime.widget_count() == 5);
        CHECK(label.holders() == 3);
        auto* widget = runtime.find(*mounted);
        REQUIRE(widget);
        CHECK(widget->parent() == &runtime.root());

        auto rejected = runtime.mount(*mounted, Template{});
        REQUIRE_FALSE(rejected);
        CHECK(rejected.error().code == Error::Code::ArityViolation);
        CHECK(runtime.widget_count() == 5);

        REQUIRE(runtime.focus(*mounted));
        REQUIRE(runtime.remove(*mounted));
        CHECK(runtime.widget_count() == 3);
        CHECK(runtime.find(*mounted) == nullptr);
        CHECK_FALSE(runtime.focused());
        CHECK(label.holders() == 1);

        auto again = runtime.remove(*mounted);
        REQUIRE_FALSE(again);
        CHECK(again.error().code == Error::Code::WidgetNotFound);

        auto root_removal = runtime.remove(root);
        REQUIRE_FALSE(root_removal);
        CHECK(root_removal.error().code == Error::Code::NotSupported);

        auto missing_parent = runtime.mount(31337, Template{});
        REQUIRE_FALSE(missing_parent);
        CHECK(missing_parent.error().code == Error::Code::WidgetNotFound);
    }

    TEST_CASE("Mounted widgets get fresh ids") {
        auto runtime = two_inputs();
        auto mounted = runtime.mount(runtime.root().id(), Template{});
        REQUIRE(mounted);
        std::vector<WidgetId> ids;
        runtime.root().visit([&ids](WidgetContainer const& widget) { ids.push_back(widget.id()); });
        std::vector<WidgetId> const expected{1, 2, 3, 4};
        CHECK(ids == expected);
        CHECK(*mounted == 4);
    }

    TEST_CASE("State failures are collected in the tick report") {
        struct Failing final : State {
            auto update(WidgetContainer& widget) -> Expected<void> override {
                auto water_mark = widget.get_property<WaterMark>();
                if (!water_mark)
                    return std::unexpected(water_mark.error());
                return {};
            }
        };

        auto runtime = Runtime::Create(Template{}.with_state(std::make_shared<Failing>()));
        REQUIRE(runtime);
        auto report = runtime->tick();
        CHECK(report.states_updated == 1);
        REQUIRE(report.errors.size() == 1);
        CHECK(report.errors[0].code == Error::Code::PropertyNotFound);
    }

    TEST_CASE("A handler may remove its own widget while the event bubbles") {
        int  root_calls = 0;
        auto runtime    = Runtime::Create(Template{}
                                              .as_parent_type(ParentType::Multi)
                                              .with_debug_name("Root")
                                              .with_event_handler(KeyEventHandler{}.on_key_down([&root_calls](Key, WidgetContainer&) {
                                                  ++root_calls;
                                                  return false;
                                              })));
        REQUIRE(runtime);
        Runtime* self = &*runtime;

        auto popup = runtime->mount(runtime->root().id(),
                                    Template{}.with_debug_name("Popup").with_event_handler(
                                        KeyEventHandler{}.on_key_down([self](Key key, WidgetContainer& widget) {
                                            if (key.code != KeyCode::Escape)
                                                return false;
                                            CHECK(self->remove(widget.id()));
                                            CHECK(self->find(widget.id()) == &widget);
                                            return false;
                                        })));
        REQUIRE(popup);
        CHECK(runtime->widget_count() == 2);

        runtime->post_event(KeyDown(Key{KeyCode::Escape}), *popup, DispatchStrategy::BubbleUp);
        auto report = runtime->tick();
        CHECK(report.events_dispatched == 1);
        CHECK(report.errors.empty());
        CHECK(root_calls == 1);
        CHECK(runtime->find(*popup) == nullptr);
        CHECK(runtime->root().child_count() == 0);
        CHECK(runtime->widget_count() == 1);
    }

    TEST_CASE("Removing a sibling during top-down dispatch waits for the event to finish") {
        Runtime* self         = nullptr;
        WidgetId second       = 0;
        int      second_calls = 0;

        auto runtime = Runtime::Create(Template{}
                                           .as_parent_type(ParentType::Multi)
                                           .with_child(Template{}.with_debug_name("Remover").with_event_handler(
                                               KeyEventHandler{}.on_key_down([&self, &second](Key, WidgetContainer&) {
                                                   CHECK(self->remove(second));
                                                   return false;
                                               })))
                                           .with_child(Template{}.with_debug_name("Second").with_event_handler(
                                               KeyEventHandler{}.on_key_down([&second_calls](Key, WidgetContainer&) {
                                                   ++second_calls;
                                                   return false;
                                               }))));
        REQUIRE(runtime);
        self   = &*runtime;
        second = runtime->root().child(1)->id();

        runtime->post_event(KeyDown(Key::FromCharacter(U'x')));
        auto report = runtime->tick();
        CHECK(report.errors.empty());
        CHECK(report.events_dispatched == 1);
        CHECK(second_calls == 1);
        CHECK(runtime->find(second) == nullptr);
        CHECK(runtime->root().child_count() == 1);
        CHECK(runtime->widget_count() == 2);
    }

    TEST_CASE("Widgets mounted from a handler appear after the event") {
        std::optional<WidgetId> mounted;
        std::optional<Error>    second_attempt;
        Runtime*                self = nullptr;

        auto runtime = Runtime::Create(Template{}
                                           .as_parent_type(ParentType::Single)
                                           .with_debug_name("Slot")
                                           .with_event_handler(KeyEventHandler{}.on_key_down(
                                               [&self, &mounted, &second_attempt](Key, WidgetContainer& widget) {
                                                   auto first = self->mount(widget.id(), Template{}.with_debug_name("Child"));
                                                   REQUIRE(first);
                                                   mounted = *first;
                                                   CHECK(self->find(*first) == nullptr);
                                                   auto second = self->mount(widget.id(), Template{});
                                                   if (!second)
                                                       second_attempt = second.error();
                                                   return true;
                                               })));
        REQUIRE(runtime);
        self = &*runtime;

        runtime->post_event(KeyDown(Key{KeyCode::Enter}), runtime->root().id());
        auto report = runtime->tick();
        CHECK(report.errors.empty());
        REQUIRE(mounted);
        REQUIRE(second_attempt);
        CHECK(second_attempt->code == Error::Code::ArityViolation);
        auto* child = runtime->find(*mounted);
        REQUIRE(child);
        CHECK(child->parent() == &runtime->root());
        CHECK(runtime->root().child_count() == 1);
    }

    TEST_CASE("A state may remove its own widget") {
        struct SelfRemoving final : State {
            explicit SelfRemoving(Runtime*& runtime)
                : runtime(runtime) {}

            auto update(WidgetContainer& widget) -> Expected<void> override {
                ++updates;
                return runtime->remove(widget.id());
            }

            Runtime*& runtime;
            int       updates = 0;
        };

        Runtime* self  = nullptr;
        auto     state = std::make_shared<SelfRemoving>(self);
        auto     runtime = Runtime::Create(Template{}
                                               .as_parent_type(ParentType::Multi)
                                               .with_child(Template{}.with_state(state))
                                               .with_child(Template{}.with_property(Label{"stays"})));
        REQUIRE(runtime);
        self = &*runtime;

        auto report = runtime->tick();
        CHECK(report.errors.empty());
        CHECK(report.states_updated == 1);
        CHECK(state->updates == 1);
        CHECK(runtime->root().child_count() == 1);
        CHECK(runtime->root().child(0)->get_property<Label>()->text == "stays");
        CHECK(state.use_count() == 1);

        (void)runtime->tick();
        CHECK(state->updates == 1);
    }

    TEST_CASE("A per tick limit of zero still drains one event") {
        RuntimeOptions options;
        options.max_events_per_tick = 0;
        auto runtime = Runtime::Create(typing_target("Input"), options);
        REQUIRE(runtime);
        CHECK(runtime->options().max_events_per_tick == 1);
        REQUIRE(runtime->focus(runtime->root().id()));

        runtime->post_event(KeyDown(Key::FromCharacter(U'a')));
        runtime->post_event(KeyDown(Key::FromCharacter(U'b')));
        auto report = runtime->tick();
        CHECK(report.events_dispatched == 1);
        CHECK(report.events_deferred == 1);
        (void)runtime->tick();
        CHECK(runtime->pending_events() == 0);
        CHECK(runtime->root().get_property<Label>()->text == "ab");
    }
}
