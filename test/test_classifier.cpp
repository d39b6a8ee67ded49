#include <cerrno>

#include <gtest/gtest.h>

#include "classifier.h"

using at::Marker;
using at::Token;
using at::Type;

static Token make_token(Marker marker, const char *tail, bool basic = false)
{
    Token token;
    token.name = basic ? "E" : "+FOO";
    token.marker = marker;
    token.tail = tail;
    token.basic = basic;
    return token;
}

TEST(Classifier, MarkerToType)
{
    EXPECT_EQ(at::type_of(Marker::assign_query), Type::test);
    EXPECT_EQ(at::type_of(Marker::query), Type::read);
    EXPECT_EQ(at::type_of(Marker::assign), Type::set);
    EXPECT_EQ(at::type_of(Marker::none), Type::execute);
}

TEST(Classifier, TestAndReadTakeNoParameters)
{
    at::Config config;
    Type type;

    EXPECT_EQ(at::classify(make_token(Marker::assign_query, ""), config, type), 0);
    EXPECT_EQ(type, Type::test);

    EXPECT_EQ(at::classify(make_token(Marker::assign_query, "1"), config, type), -E2BIG);

    EXPECT_EQ(at::classify(make_token(Marker::query, ""), config, type), 0);
    EXPECT_EQ(type, Type::read);

    EXPECT_EQ(at::classify(make_token(Marker::query, "x"), config, type), -E2BIG);
}

TEST(Classifier, EmptySetIsDialectDependent)
{
    at::Config config;
    Type type;

    EXPECT_EQ(at::classify(make_token(Marker::assign, ""), config, type), 0);
    EXPECT_EQ(type, Type::set);

    config.strict_empty_set = true;
    EXPECT_EQ(at::classify(make_token(Marker::assign, ""), config, type), -ENODATA);
    EXPECT_EQ(at::classify(make_token(Marker::assign, "  "), config, type), -ENODATA);
    EXPECT_EQ(at::classify(make_token(Marker::assign, ","), config, type), 0);
    EXPECT_EQ(at::classify(make_token(Marker::assign, "1"), config, type), 0);
}

TEST(Classifier, ExecuteParameters)
{
    at::Config config;
    Type type;

    EXPECT_EQ(at::classify(make_token(Marker::none, ""), config, type), 0);
    EXPECT_EQ(type, Type::execute);

    EXPECT_EQ(at::classify(make_token(Marker::none, "1"), config, type), -E2BIG);
    EXPECT_EQ(at::classify(make_token(Marker::none, "0", true), config, type), 0);

    config.execute_parameters = true;
    EXPECT_EQ(at::classify(make_token(Marker::none, "1"), config, type), 0);
    EXPECT_EQ(type, Type::execute);
}
