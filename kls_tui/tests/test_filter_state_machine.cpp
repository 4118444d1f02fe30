#include "fake_terminal.hpp"
#include "panels/filter_state_machine.hpp"
#include <gtest/gtest.h>

using namespace kls::tui;
using kls::tui::fakes::CanvasLog;
using kls::tui::fakes::make_canvas;

class FilterStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<CanvasLog>();
        panel_.attach(make_canvas(4, log_), 0, 40);
        panel_.replace_rows({"alpha", "beta", "gamma", "abacus"});
    }

    FilterOutcome press(char c) {
        return FilterStateMachine::handle(panel_, InputEvent::character(c));
    }

    FilterOutcome press(Key key) {
        return FilterStateMachine::handle(panel_, InputEvent::special(key));
    }

    Panel panel_{"Namespaces", 1};
    std::shared_ptr<CanvasLog> log_;
};

TEST_F(FilterStateMachineTest, TypingThenErasingEndsInEmptyFilter) {
    EXPECT_EQ(press('/'), FilterOutcome::Handled);
    EXPECT_EQ(panel_.state(), FilterState::EmptyFilter);

    press('a');
    EXPECT_EQ(panel_.state(), FilterState::FilledFilter);
    press('b');
    EXPECT_EQ(panel_.filter_text(), "ab");
    EXPECT_EQ(panel_.filtered_rows().elements(), (std::vector<std::string>{"abacus"}));

    press(Key::Backspace);
    EXPECT_EQ(panel_.state(), FilterState::FilledFilter);
    EXPECT_EQ(panel_.filter_text(), "a");

    press(Key::Backspace);
    EXPECT_EQ(panel_.state(), FilterState::EmptyFilter);
    EXPECT_EQ(panel_.filter_text(), "");
    EXPECT_EQ(panel_.filtered_rows().size(), 4u);

    EXPECT_EQ(press(Key::Escape), FilterOutcome::Handled);
    EXPECT_EQ(panel_.state(), FilterState::Normal);
    EXPECT_EQ(panel_.filter_text(), "");
}

TEST_F(FilterStateMachineTest, CancelFromFilledFilterRestoresAllRows) {
    press('/');
    press('g');
    ASSERT_EQ(panel_.filtered_rows().size(), 1u);

    EXPECT_EQ(press(Key::Escape), FilterOutcome::SelectionChanged);
    EXPECT_EQ(panel_.state(), FilterState::Normal);
    EXPECT_EQ(panel_.filtered_rows().size(), 4u);
    EXPECT_EQ(panel_.selected_offset(), 0u);
}

TEST_F(FilterStateMachineTest, UppercaseInputIsLowered) {
    press('/');
    press('B');
    EXPECT_EQ(panel_.filter_text(), "b");
    EXPECT_EQ(panel_.filtered_rows().elements(), (std::vector<std::string>{"beta", "abacus"}));
}

TEST_F(FilterStateMachineTest, RowSetChangeRedrawsFullyOtherwiseFooterOnly) {
    press('/');
    const int wipes = log_->wipes;
    const int footers = log_->footer_clears;

    // Every row contains an "a"
    EXPECT_EQ(press('a'), FilterOutcome::Handled);
    EXPECT_EQ(log_->wipes, wipes);
    EXPECT_EQ(log_->footer_clears, footers + 1);
    EXPECT_EQ(log_->rows[4 + 5 - 2], "/a");

    EXPECT_EQ(press('l'), FilterOutcome::SelectionChanged);
    EXPECT_EQ(log_->wipes, wipes + 1);
}

TEST_F(FilterStateMachineTest, EnteringFilterRedrawsFooter) {
    const int footers = log_->footer_clears;
    press('/');
    EXPECT_EQ(log_->footer_clears, footers + 1);
    EXPECT_EQ(log_->rows[4 + 5 - 2], "/");

    press(Key::Backspace);
    EXPECT_EQ(panel_.state(), FilterState::Normal);
    EXPECT_EQ(log_->footer_clears, footers + 2);
}

TEST_F(FilterStateMachineTest, CancelOrQuitInNormalExits) {
    EXPECT_EQ(press(Key::Escape), FilterOutcome::Exit);
    EXPECT_EQ(press('q'), FilterOutcome::Exit);
}

TEST_F(FilterStateMachineTest, QIsFilterTextWhileFiltering) {
    press('/');
    EXPECT_NE(press('q'), FilterOutcome::Exit);
    EXPECT_EQ(panel_.filter_text(), "q");
    EXPECT_TRUE(panel_.filtered_rows().empty());
    EXPECT_FALSE(panel_.selected_row().has_value());
}

TEST_F(FilterStateMachineTest, NavigationAndUnfilterableKeysAreLeftToDispatcher) {
    EXPECT_EQ(press(Key::Down), FilterOutcome::Unhandled);
    EXPECT_EQ(press(Key::Enter), FilterOutcome::Unhandled);
    EXPECT_EQ(press('x'), FilterOutcome::Unhandled);

    press('/');
    EXPECT_EQ(press(Key::Tab), FilterOutcome::Unhandled);
    EXPECT_EQ(press('.'), FilterOutcome::Unhandled);
    EXPECT_EQ(panel_.state(), FilterState::EmptyFilter);

    EXPECT_EQ(press('-'), FilterOutcome::SelectionChanged);
    EXPECT_EQ(panel_.state(), FilterState::FilledFilter);
}
