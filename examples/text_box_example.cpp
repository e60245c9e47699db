#include <weave/Weave.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace WV;
using namespace WV::Widgets;

namespace {

auto env_truthy(char const* value) -> bool {
    if (!value) {
        return false;
    }
    std::string normalized{value};
    for (auto& ch : normalized) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

auto log_error(Expected<void> const& status, std::string const& context) -> bool {
    if (status) {
        return true;
    }
    std::cerr << "text_box_example: " << context << " failed: " << describeError(status.error()) << std::endl;
    return false;
}

auto report_tick(TickReport const& report) -> void {
    std::cout << "tick " << report.tick << ": " << report.events_dispatched << " events, "
              << report.events_consumed << " consumed" << std::endl;
    for (auto const& error : report.errors) {
        std::cerr << "  error " << describeError(error) << std::endl;
    }
}

auto label_text(WidgetContainer const& widget) -> std::string {
    auto label = widget.get_property<Label>();
    return label ? label->text : std::string{"<" + describeError(label.error()) + ">"};
}

} // namespace

// Usage: text_box_example [text-to-type]
// A '<' in the text is sent as Backspace. WEAVE_EXAMPLE_DUMP=1 prints the final widget tree.
int main(int argc, char** argv) {
#ifdef WV_LOG_DEBUG
    WV::set_thread_name("Example");
    (void)WV::logger().configure_from_environment();
#endif

    std::string_view script = argc > 1 ? argv[1] : "hello<<p";

    auto runtime = Runtime::Create(Stack::Create()
                                       .with_child(TextBox::Create(TextBox::Args{.water_mark = "Search", .id = "search"}))
                                       .with_child(TextBlock::Create().with_property(Label{"Type into the box above"})));
    if (!runtime) {
        std::cerr << "text_box_example: " << describeError(runtime.error()) << std::endl;
        return EXIT_FAILURE;
    }

    auto* text_box = runtime->root().child(0);

    // Keys sent before focusing are ignored by the text box.
    runtime->post_event(KeyDown(Key::FromCharacter(U'x')), text_box->id());
    report_tick(runtime->tick());
    std::cout << "unfocused label: '" << label_text(*text_box) << "'" << std::endl;

    if (!log_error(runtime->focus(text_box->id()), "focus")) {
        return EXIT_FAILURE;
    }

    for (char ch : script) {
        auto key = ch == '<' ? Key{KeyCode::Backspace} : Key::FromCharacter(static_cast<unsigned char>(ch));
        runtime->post_event(KeyDown(key));
        report_tick(runtime->tick());
        std::cout << "  label: '" << label_text(*text_box) << "'" << std::endl;
    }

    runtime->clear_focus();
    report_tick(runtime->tick());

    if (env_truthy(std::getenv("WEAVE_EXAMPLE_DUMP"))) {
        std::cout << DumpTreeString(runtime->root()) << std::endl;
    }
    return EXIT_SUCCESS;
}
