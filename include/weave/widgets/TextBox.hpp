#pragma once

#include <weave/event/Events.hpp>
#include <weave/widget/State.hpp>
#include <weave/widget/Template.hpp>

#include <optional>
#include <string>

namespace WV::Widgets {

/**
 * Text processing of the TextBox.
 *
 * Keeps a private text buffer and reconciles it with the widget's Label once
 * per tick:
 * - Label equals the buffer: nothing to do.
 * - The buffer was edited since the last update: the buffer is written to Label.
 * - Otherwise Label changed from outside: Label is copied into the buffer.
 * When both changed within one tick the buffer wins.
 *
 * A key handler failure (no Focused property) is returned by the next update,
 * which puts it into the tick report.
 */
class TextBoxState final : public State {
public:
    TextBoxState() = default;
    explicit TextBoxState(std::string text)
        : text_(std::move(text)) {}

    auto update(WidgetContainer& widget) -> Expected<void> override;

    // Key-down handling; returns true when the key edited the buffer.
    // Chords with Ctrl, Alt or Meta held are left to other handlers.
    auto handle_key(KeyEvent const& event, WidgetContainer& widget) -> bool;

    [[nodiscard]] auto text() const -> std::string const& { return text_; }
    [[nodiscard]] auto focused() const -> bool { return focused_; }
    [[nodiscard]] auto updated() const -> bool { return updated_; }

private:
    std::string          text_;
    bool                 focused_ = false;
    bool                 updated_ = false;
    std::optional<Error> handler_error_;
};

/**
 * Single line text input.
 *
 * Shared properties: Label (the text), WaterMark (placeholder shown while the
 * Label is empty), Selector (theme lookup, "textbox").
 * Properties: Focused, set by the focus owner.
 *
 * Structure: TextBox -> Container -> Stack -> [ScrollViewer -> WaterMarkTextBlock, Cursor].
 * Typing edits the text only while focused.
 */
struct TextBox {
    struct Args {
        std::string                text;
        std::string                water_mark;
        bool                       focused = false;
        std::optional<std::string> id;
    };

    static auto Create() -> Template;
    static auto Create(Args args) -> Template;
};

} // namespace WV::Widgets
