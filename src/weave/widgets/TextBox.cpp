#include <weave/widgets/TextBox.hpp>

#include <weave/event/EventHandler.hpp>
#include <weave/widget/Properties.hpp>
#include <weave/widget/SharedProperty.hpp>
#include <weave/widget/WidgetContainer.hpp>
#include <weave/widgets/Primitives.hpp>
#include <weave/widgets/Stack.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdint>
#include <memory>
#include <utility>

namespace WV::Widgets {

namespace {

constexpr std::uint32_t kCommandModifiers = Mod_Ctrl | Mod_Alt | Mod_Meta;

} // namespace

auto TextBoxState::update(WidgetContainer& widget) -> Expected<void> {
    if (auto error = std::exchange(handler_error_, std::nullopt))
        return std::unexpected(std::move(*error));

    auto focused = widget.get_property<Focused>();
    if (!focused)
        return std::unexpected(focused.error());
    focused_ = focused->value;

    auto label = widget.borrow_mut_property<Label>();
    if (!label)
        return std::unexpected(label.error());

    if ((*label)->text == text_) {
        updated_ = false;
        return {};
    }

    if (updated_) {
        (*label)->text = text_;
    } else {
        text_ = (*label)->text;
    }
    updated_ = false;
    return {};
}

auto TextBoxState::handle_key(KeyEvent const& event, WidgetContainer& widget) -> bool {
    auto focused = widget.get_property<Focused>();
    if (!focused) {
        wv_log("TextBox key handler: " + describeError(focused.error()), "State", "ERROR");
        if (!handler_error_)
            handler_error_ = focused.error();
        return false;
    }
    focused_ = focused->value;
    if (!focused_ || (event.modifiers & kCommandModifiers) != 0)
        return false;

    auto const& key = event.key;

    if (auto character = key.printable()) {
        text_ += utf32ToUtf8(*character);
    } else if (key.code == KeyCode::Backspace) {
        (void)popLastCodepoint(text_);
    } else {
        return false;
    }

    updated_ = true;
    return true;
}

auto TextBox::Create() -> Template {
    return Create(Args{});
}

auto TextBox::Create(Args args) -> Template {
    auto selector = Selector("textbox");
    if (args.id)
        selector = selector.with_id(*args.id);

    SharedProperty<Label>     label{Label{args.text}};
    SharedProperty<WaterMark> water_mark{WaterMark{std::move(args.water_mark)}};
    SharedProperty<Selector>  shared_selector{std::move(selector)};
    auto                      state = std::make_shared<TextBoxState>(std::move(args.text));

    return Template{}
        .with_debug_name("TextBox")
        .as_parent_type(ParentType::Single)
        .with_property(Focused{args.focused})
        .with_child(Container::Create()
                        .with_child(Stack::Create()
                                        .with_child(ScrollViewer::Create().with_child(
                                            WaterMarkTextBlock::Create()
                                                .with_shared_property(label)
                                                .with_shared_property(shared_selector)
                                                .with_shared_property(water_mark)))
                                        .with_child(Cursor::Create()))
                        .with_shared_property(shared_selector))
        .with_state(state)
        .with_shared_property(label)
        .with_shared_property(shared_selector)
        .with_shared_property(water_mark)
        .with_event_handler(KeyEventHandler{}.on_key_down([state](KeyEvent const& event, WidgetContainer& widget) -> bool {
            return state->handle_key(event, widget);
        }));
}

} // namespace WV::Widgets
