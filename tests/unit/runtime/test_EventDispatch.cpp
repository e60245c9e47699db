#include <weave/runtime/EventDispatch.hpp>
#include <weave/runtime/TreeBuilder.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace WV;

namespace {

// Records every widget the event reaches.
auto recorder(std::vector<std::string>& log, std::string name, bool consume) -> KeyEventHandler {
    return KeyEventHandler{}.on_key_down([&log, name, consume](Key, WidgetContainer&) {
        log.push_back(name);
        return consume;
    });
}

// root -> [left -> [leaf], right]
auto sample_tree(std::vector<std::string>& log, std::string const& consumer) -> std::unique_ptr<WidgetContainer> {
    auto node = [&log, &consumer](std::string name) {
        return Template{}.with_debug_name(name).with_event_handler(recorder(log, name, name == consumer));
    };
    TreeBuilder builder;
    auto        tree = builder.build(node("root")
                                         .as_parent_type(ParentType::Multi)
                                         .with_child(node("left").as_parent_type(ParentType::Single).with_child(node("leaf")))
                                         .with_child(node("right")));
    REQUIRE(tree);
    return std::move(*tree);
}

auto key() -> Event {
    return KeyDown(Key::FromCharacter(U'k'));
}

} // namespace

TEST_SUITE("runtime.dispatch") {
    TEST_CASE("Direct delivers to the target only") {
        std::vector<std::string> log;
        auto                     root = sample_tree(log, "");
        auto*                    leaf = root->child(0)->child(0);

        auto result = DispatchEvent(key(), *leaf, DispatchStrategy::Direct);
        CHECK_FALSE(result.consumed);
        CHECK_FALSE(result.consumed_by);
        CHECK(result.widgets_visited == 1);
        std::vector<std::string> const expected{"leaf"};
        CHECK(log == expected);
    }

    TEST_CASE("BubbleUp walks the ancestors and stops at the first consumer") {
        std::vector<std::string> log;
        auto                     root = sample_tree(log, "left");
        auto*                    left = root->child(0);
        auto*                    leaf = left->child(0);

        auto result = DispatchEvent(key(), *leaf, DispatchStrategy::BubbleUp);
        CHECK(result.consumed);
        REQUIRE(result.consumed_by);
        CHECK(*result.consumed_by == left->id());
        CHECK(result.widgets_visited == 2);
        std::vector<std::string> const expected{"leaf", "left"};
        CHECK(log == expected);
    }

    TEST_CASE("BubbleUp reaches the root when nobody consumes") {
        std::vector<std::string> log;
        auto                     root = sample_tree(log, "");
        auto result = DispatchEvent(key(), *root->child(0)->child(0), DispatchStrategy::BubbleUp);
        CHECK_FALSE(result.consumed);
        std::vector<std::string> const expected{"leaf", "left", "root"};
        CHECK(log == expected);
    }

    TEST_CASE("TopDown visits the subtree in pre-order") {
        std::vector<std::string> log;
        auto                     root = sample_tree(log, "");
        auto result = DispatchEvent(key(), *root, DispatchStrategy::TopDown);
        CHECK_FALSE(result.consumed);
        CHECK(result.widgets_visited == 4);
        std::vector<std::string> const expected{"root", "left", "leaf", "right"};
        CHECK(log == expected);

        std::vector<std::string> stop_log;
        auto                     stopping = sample_tree(stop_log, "leaf");
        auto stopped = DispatchEvent(key(), *stopping, DispatchStrategy::TopDown);
        CHECK(stopped.consumed);
        std::vector<std::string> const until_leaf{"root", "left", "leaf"};
        CHECK(stop_log == until_leaf);
    }

    TEST_CASE("Widgets without handlers are passed over") {
        TreeBuilder builder;
        auto        tree = builder.build(Template{}.as_parent_type(ParentType::Single).with_child(Template{}));
        REQUIRE(tree);
        auto result = DispatchEvent(key(), **tree, DispatchStrategy::TopDown);
        CHECK_FALSE(result.consumed);
        CHECK(result.widgets_visited == 2);
    }

    TEST_CASE("Strategies have stable names") {
        CHECK(dispatchStrategyToString(DispatchStrategy::Direct) == "direct");
        CHECK(dispatchStrategyToString(DispatchStrategy::BubbleUp) == "bubble_up");
        CHECK(dispatchStrategyToString(DispatchStrategy::TopDown) == "top_down");
    }
}
