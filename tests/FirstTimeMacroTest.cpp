#include <gtest/gtest.h>

#include "FirstTime.hpp"

namespace fc {
namespace {

// Mirrors a view with setup work in a lifecycle hook that runs repeatedly
class ProfileView {
public:
    virtual ~ProfileView() = default;

    virtual void willAppear() {
        FC_IF_FIRST_TIME(tracker_) {
            ++base_setup;
        }
    }

    int base_setup = 0;

protected:
    CallSiteTracker tracker_;
};

class EditableProfileView : public ProfileView {
public:
    void willAppear() override {
        FC_IF_FIRST_TIME(tracker_) {
            ++setup_before_base;
        }
        ProfileView::willAppear();
        FC_IF_FIRST_TIME(tracker_) {
            ++setup_after_base;
        }
    }

    int setup_before_base = 0;
    int setup_after_base = 0;
};

TEST(FirstTimeMacroTest, BlockRunsOncePerInstance) {
    ProfileView view;
    for (int i = 0; i < 5; ++i) view.willAppear();
    EXPECT_EQ(view.base_setup, 1);
}

TEST(FirstTimeMacroTest, PositionAroundBaseCallDoesNotMatter) {
    EditableProfileView view;
    for (int i = 0; i < 5; ++i) view.willAppear();
    EXPECT_EQ(view.setup_before_base, 1);
    EXPECT_EQ(view.base_setup, 1);
    EXPECT_EQ(view.setup_after_base, 1);
}

TEST(FirstTimeMacroTest, EachInstanceRunsItsOwnFirstTime) {
    EditableProfileView a;
    EditableProfileView b;
    a.willAppear();
    a.willAppear();
    b.willAppear();
    EXPECT_EQ(a.setup_before_base + a.base_setup + a.setup_after_base, 3);
    EXPECT_EQ(b.setup_before_base + b.base_setup + b.setup_after_base, 3);
}

TEST(FirstTimeMacroTest, ElseBranchSeesRepeats) {
    CallSiteTracker tracker;
    int firsts = 0;
    int repeats = 0;
    for (int i = 0; i < 4; ++i) {
        FC_IF_FIRST_TIME(tracker) { ++firsts; } else { ++repeats; }
    }
    EXPECT_EQ(firsts, 1);
    EXPECT_EQ(repeats, 3);
}

} // namespace
} // namespace fc
