#include "ConsoleUtils.hpp"
#include <gtest/gtest.h>
#include <sstream>

#if defined(__linux__)
#include <sys/mman.h>
#endif

TEST(ConsoleUtilsTest, LockProcessMemoryIsSafeToCall)
{
    EXPECT_NO_THROW(wipecert::ui::cli::lockProcessMemory());

#if defined(__linux__)
    munlockall();
#endif
}

TEST(ConsoleUtilsTest, ConfirmAcceptsExactWordAndPrintsPrompt)
{
    std::istringstream in{ "  YES \n" };
    std::ostringstream out{};
    EXPECT_TRUE(wipecert::ui::cli::confirmDestruction(in, out, "YES"));
    EXPECT_EQ(out.str(), "Type 'YES' to continue: ");
}

TEST(ConsoleUtilsTest, ConfirmRejectsAnythingElse)
{
    std::ostringstream out{};

    std::istringstream lower{ "yes\n" };
    EXPECT_FALSE(wipecert::ui::cli::confirmDestruction(lower, out, "YES"));

    std::istringstream empty{ "\n" };
    EXPECT_FALSE(wipecert::ui::cli::confirmDestruction(empty, out, "YES"));

    std::istringstream closed{};
    EXPECT_FALSE(wipecert::ui::cli::confirmDestruction(closed, out, "YES"));
}
