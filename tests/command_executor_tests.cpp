/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <screenwatch.h>

#include <csignal>
#include <cstdlib>

using namespace ScreenWatch;

// ============================================================================
// ExecutionResult
// ============================================================================

TEST(ExecutionResult, DefaultIsLaunchFailure)
{
    ExecutionResult result;

    EXPECT_EQ(result.m_status, ExecutionResult::LAUNCH_FAILED);
    EXPECT_EQ(result.m_exit_code, -1);
    EXPECT_FALSE(result.IsSuccess());
}

TEST(ExecutionResult, StatusToString)
{
    EXPECT_EQ(ExecutionResult::StatusToString(ExecutionResult::EXITED), "EXITED");
    EXPECT_EQ(ExecutionResult::StatusToString(ExecutionResult::SIGNALED), "SIGNALED");
    EXPECT_EQ(ExecutionResult::StatusToString(ExecutionResult::LAUNCH_FAILED), "LAUNCH_FAILED");
}

// ============================================================================
// CommandExecutor
// ============================================================================

TEST(CommandExecutor, SuccessfulCommand)
{
    CommandExecutor executor;

    ExecutionResult result = executor.Run("exit 0");

    EXPECT_EQ(result.m_status, ExecutionResult::EXITED);
    EXPECT_EQ(result.m_exit_code, 0);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_GE(result.m_duration_ms, 0);
}

TEST(CommandExecutor, NonZeroExit)
{
    CommandExecutor executor;

    ExecutionResult result = executor.Run("exit 1");

    EXPECT_EQ(result.m_status, ExecutionResult::EXITED);
    EXPECT_EQ(result.m_exit_code, 1);
    EXPECT_FALSE(result.IsSuccess());
}

TEST(CommandExecutor, ShellSyntaxSupported)
{
    CommandExecutor executor;

    ExecutionResult result = executor.Run("true && exit 3 || exit 4");

    EXPECT_EQ(result.m_status, ExecutionResult::EXITED);
    EXPECT_EQ(result.m_exit_code, 3);
}

TEST(CommandExecutor, CommandNotFound)
{
    CommandExecutor executor;

    ExecutionResult result = executor.Run("screenwatch-no-such-command-xyz --flag");

    EXPECT_EQ(result.m_status, ExecutionResult::LAUNCH_FAILED);
    EXPECT_EQ(result.m_exit_code, 127);
    EXPECT_NE(result.m_error_message.find("command not found"), std::string::npos);
}

TEST(CommandExecutor, EmptyCommand)
{
    CommandExecutor executor;

    ExecutionResult result = executor.Run("   ");

    EXPECT_EQ(result.m_status, ExecutionResult::LAUNCH_FAILED);
    EXPECT_EQ(result.m_error_message, "empty command");
}

TEST(CommandExecutor, OutputCaptured)
{
    CommandExecutor executor;

    ExecutionResult result = executor.Run("echo detected; echo 'no profile matched' >&2; exit 2");

    EXPECT_EQ(result.m_exit_code, 2);
    ASSERT_TRUE(result.m_stdout_snippet.has_value());
    EXPECT_EQ(*result.m_stdout_snippet, "detected");
    ASSERT_TRUE(result.m_stderr_snippet.has_value());
    EXPECT_EQ(*result.m_stderr_snippet, "no profile matched");
}

TEST(CommandExecutor, NoOutputGivesNoSnippet)
{
    CommandExecutor executor;

    ExecutionResult result = executor.Run("true");

    EXPECT_FALSE(result.m_stdout_snippet.has_value());
    EXPECT_FALSE(result.m_stderr_snippet.has_value());
}

TEST(CommandExecutor, CaptureIsBounded)
{
    CommandExecutor executor;

    // Writes well over the capture limit. The command must still run to completion without blocking on the pipe.
    ExecutionResult result = executor.Run("i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done");

    EXPECT_TRUE(result.IsSuccess());
    ASSERT_TRUE(result.m_stdout_snippet.has_value());
    EXPECT_LE(result.m_stdout_snippet->size(), CommandExecutor::MAX_CAPTURE_BYTES);
}

TEST(CommandExecutor, EnvironmentInherited)
{
    setenv("SCREENWATCH_EXECUTOR_TEST_VAR", "inherited", 1);

    CommandExecutor executor;

    ExecutionResult result = executor.Run("test \"$SCREENWATCH_EXECUTOR_TEST_VAR\" = inherited");

    EXPECT_TRUE(result.IsSuccess());

    unsetenv("SCREENWATCH_EXECUTOR_TEST_VAR");
}

TEST(CommandExecutor, TerminatedBySignal)
{
    CommandExecutor executor;

    ExecutionResult result = executor.Run("kill -TERM $$");

    EXPECT_EQ(result.m_status, ExecutionResult::SIGNALED);
    EXPECT_EQ(result.m_exit_code, 128 + SIGTERM);
    EXPECT_FALSE(result.IsSuccess());
}
