#include <weave/theme/Selector.hpp>

#include <doctest/doctest.h>

using namespace WV::Theme;

TEST_SUITE("theme.selector") {
    TEST_CASE("Selectors render in CSS order") {
        CHECK(Selector{}.to_string().empty());
        CHECK(Selector{"textbox"}.to_string() == "textbox");
        CHECK(Selector{"textbox"}.with_id("search").to_string() == "textbox#search");
        CHECK(Selector{}.with_class("primary").to_string() == "*.primary");

        auto selector = Selector{"button"}.with_class("primary").with_class("large").with_pseudo_class("focus");
        CHECK(selector.to_string() == "button.large.primary:focus");
    }

    TEST_CASE("Builders leave the source selector untouched") {
        Selector const base{"textbox"};
        auto           derived = base.with_id("name").with("input");
        CHECK(base.to_string() == "textbox");
        CHECK_FALSE(base.id());
        REQUIRE(derived.element());
        CHECK(*derived.element() == "input");
        CHECK(derived.to_string() == "input#name");
        CHECK_FALSE(base == derived);
    }

    TEST_CASE("Pseudo classes toggle") {
        Selector selector{"textbox"};
        CHECK(selector.set_pseudo_class("focus", true));
        CHECK_FALSE(selector.set_pseudo_class("focus", true));
        CHECK(selector.has_pseudo_class("focus"));
        CHECK(selector.to_string() == "textbox:focus");
        CHECK(selector.set_pseudo_class("focus", false));
        CHECK_FALSE(selector.set_pseudo_class("focus", false));
        CHECK(selector == Selector{"textbox"});
    }

    TEST_CASE("Selectors serialize as their string form") {
        nlohmann::json j = Selector{"cursor"}.with_class("blink");
        CHECK(j == "cursor.blink");
        CHECK(Selector{"cursor"}.with_class("blink").has_class("blink"));
        CHECK(Selector{}.empty());
        CHECK_FALSE(Selector{"x"}.empty());
    }
}
