#include <gtest/gtest.h>

#include "filtered.hpp"
#include "filters/ref_filters.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace
{
    struct Settings
    {
        int retries = 3;
    };
}    // namespace

TEST(RefFiltersTest, new_if_null_replaces_null_only)
{
    auto made = filters::new_if_null(std::shared_ptr<Settings>{});
    ASSERT_NE(made, nullptr);
    EXPECT_EQ(made->retries, 3);

    auto kept = std::make_shared<Settings>(Settings{7});
    EXPECT_EQ(filters::new_if_null(kept), kept);
}

TEST(RefFiltersTest, error_if_null_throws_on_null)
{
    EXPECT_THROW(filters::error_if_null(std::shared_ptr<Settings>{}), std::invalid_argument);

    auto kept = std::make_shared<Settings>();
    EXPECT_EQ(filters::error_if_null(kept), kept);
}

TEST(RefFiltersTest, filtered_pointer_is_never_null)
{
    using Items = std::shared_ptr<std::vector<int>>;
    Filtered<Items> items{filters::new_if_null<std::vector<int>>};
    ASSERT_NE(items.value(), nullptr);
    EXPECT_TRUE(items.value()->empty());

    items.set_value(nullptr);
    ASSERT_NE(items.value(), nullptr);
}

TEST(RefFiltersTest, rejecting_filter_keeps_previous_pointer)
{
    auto first = std::make_shared<Settings>();
    Filtered<std::shared_ptr<Settings>> settings{filters::error_if_null<Settings>, first};

    EXPECT_THROW(settings.set_value(nullptr), std::invalid_argument);
    EXPECT_EQ(settings.value(), first);
}
