#include <gtest/gtest.h>
#include "rastermath/function_args.hpp"

using rastermath::FunctionArgs;

TEST(FunctionArgsTest, SetAndGet) {
    FunctionArgs args;
    args.set("axis", int64_t{1}).set("scale", 0.5).set("method", std::string("mean")).set("skip", true);

    EXPECT_EQ(args.size(), 4u);
    EXPECT_EQ(args.get<int64_t>("axis"), 1);
    EXPECT_DOUBLE_EQ(args.get<double>("scale"), 0.5);
    EXPECT_EQ(args.get<std::string>("method"), "mean");
    EXPECT_TRUE(args.get<bool>("skip"));
}

TEST(FunctionArgsTest, KeepsInsertionOrder) {
    FunctionArgs args;
    args.set("z", int64_t{1}).set("a", int64_t{2}).set("m", int64_t{3});
    args.set("a", int64_t{20});

    std::vector<std::string> names;
    for (const auto& [name, value] : args) names.push_back(name);
    EXPECT_EQ(names, (std::vector<std::string>{"z", "a", "m"}));
    EXPECT_EQ(args.get<int64_t>("a"), 20);
}

TEST(FunctionArgsTest, MissingOrMistypedValues) {
    FunctionArgs args;
    args.set("scale", 2.0);

    EXPECT_FALSE(args.contains("axis"));
    EXPECT_THROW(args.get<int64_t>("axis"), std::out_of_range);
    EXPECT_THROW(args.get<int64_t>("scale"), std::invalid_argument);
    EXPECT_EQ(args.get_or<int64_t>("axis", 7), 7);
    EXPECT_EQ(args.get_or<int64_t>("scale", 7), 7);
    EXPECT_DOUBLE_EQ(args.get_or<double>("scale", 1.0), 2.0);
}
