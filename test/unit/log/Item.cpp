#include "log/Item.hpp"

#include <gtest/gtest.h>

bool Log::Item::operator==(const Log::Item &) const = default;

void checkLogItem(const Log::Item &ref, const Log::Item &test, bool checkTimestamps = true)
{
    /* Compare the object. */
    // Compare each field first so we see what changed.
    if (checkTimestamps) {
        EXPECT_EQ(ref.logTime, test.logTime);
        EXPECT_EQ(ref.contextTime, test.contextTime);
        EXPECT_EQ(ref.systemTime, test.systemTime);
    }
    EXPECT_EQ(ref.level, test.level);
    EXPECT_EQ(ref.kind, test.kind);
    EXPECT_EQ(ref.subject, test.subject);
    EXPECT_EQ(ref.message, test.message);
    EXPECT_EQ(ref.contextName, test.contextName);
    EXPECT_EQ(ref.contextIndex, test.contextIndex);

    // Compare the whole object, so we don't get caught out by a new field.
    Log::Item modRef = ref;
    if (!checkTimestamps) {
        modRef.logTime = test.logTime;
        modRef.contextTime = test.contextTime;
        modRef.systemTime = test.systemTime;
    }
    EXPECT_EQ(modRef, test);
}

namespace
{

TEST(LogItem, Default)
{
    Log::Item item;
    EXPECT_EQ("[Info] @ 0.000000 s = [0] + 0.000000 s = 1970-01-01 00:00:00: [] ", item.format());
}

TEST(LogItem, Simple)
{
    Log::Item item = {
        .logTime = std::chrono::seconds(314159),
        .contextTime = std::chrono::seconds(271828),
        .systemTime = std::chrono::system_clock::time_point(std::chrono::seconds(1 << 30)),
        .level = Log::Level::warning,
        .kind = "Simple",
        .message = "Enjoy!",
        .contextName = "Simple log item",
        .contextIndex = 42
    };

    EXPECT_EQ("[Warning] @ 314159.000000 s = Simple log item[42] + 271828.000000 s = 2004-01-10 13:37:04: "
              "[Simple] Enjoy!", item.format());

    std::string colour = item.format(true);
    EXPECT_EQ("[\x1b[33;1mWarning\x1b[m] @ \x1b[34m314159.000000 s\x1b[m = "
              "\x1b[36;1mSimple log item\x1b[m[\x1b[36;1m42\x1b[m] + \x1b[34m271828.000000 s\x1b[m = "
              "\x1b[34m2004-01-10 13:37:04\x1b[m: [\x1b[35;1mSimple\x1b[m] Enjoy!", colour);
}

TEST(LogItem, Subject)
{
    Log::Item item = {
        .level = Log::Level::error,
        .kind = "operation",
        .subject = "fetch#3",
        .message = "operation fetch#3 failed: std::runtime_error: boom",
        .contextName = "service"
    };

    EXPECT_EQ("[Error] @ 0.000000 s = service[0] + 0.000000 s = 1970-01-01 00:00:00: [operation] (fetch#3) "
              "operation fetch#3 failed: std::runtime_error: boom", item.format());
    EXPECT_EQ("[\x1b[31;1mError\x1b[m] @ \x1b[34m0.000000 s\x1b[m = \x1b[36;1mservice\x1b[m[\x1b[36;1m0\x1b[m] + "
              "\x1b[34m0.000000 s\x1b[m = \x1b[34m1970-01-01 00:00:00\x1b[m: [\x1b[35;1moperation\x1b[m] "
              "(\x1b[33mfetch#3\x1b[m) operation fetch#3 failed: std::runtime_error: boom", item.format(true));
}

TEST(LogItem, LevelNames)
{
    EXPECT_STREQ("Debug", Log::levelToName(Log::Level::debug));
    EXPECT_STREQ("Info", Log::levelToName(Log::Level::info));
    EXPECT_STREQ("Warning", Log::levelToName(Log::Level::warning));
    EXPECT_STREQ("Error", Log::levelToName(Log::Level::error));
    EXPECT_STREQ("Fatal", Log::levelToName(Log::Level::fatal));
}

} // namespace
