#include <gtest/gtest.h>

#include "remote/SshRemoteCopy.hpp"
#include "util/Subprocess.hpp"
#include "fakes.hpp"

using namespace lc::remote;
using namespace lc::util;
using namespace lc::pipeline;
using namespace lc::test;
using namespace std::chrono_literals;

namespace {

ProcessResult failed(const int exitCode, std::string stderrText, const bool timedOut = false) {
    ProcessResult r;
    r.exitCode = exitCode;
    r.stderrOutput = std::move(stderrText);
    r.timedOut = timedOut;
    return r;
}

}

TEST(SshRemoteCopyTest, BuildsBatchModeCommand) {
    const SshRemoteCopy ssh(SshTarget{"results.lab", "courier"}, 1min);

    const std::vector<std::string> expected = {
        "ssh", "-o", "BatchMode=yes", "-o", "ConnectTimeout=5",
        "-o", "ControlMaster=no", "-o", "ControlPath=none",
        "courier@results.lab", "test -d '/data'"
    };
    EXPECT_EQ(ssh.buildCommand("test -d '/data'"), expected);
}

TEST(SshRemoteCopyTest, AddsPortAndIdentityWhenConfigured) {
    const SshRemoteCopy ssh(SshTarget{"results.lab", "courier", 2222, "/etc/labcourier/id_ed25519", 250ms}, 1min);

    const std::vector<std::string> expected = {
        "ssh", "-o", "BatchMode=yes", "-o", "ConnectTimeout=1",
        "-o", "ControlMaster=no", "-o", "ControlPath=none",
        "-p", "2222", "-i", "/etc/labcourier/id_ed25519",
        "courier@results.lab", "true"
    };
    EXPECT_EQ(ssh.buildCommand("true"), expected);
}

TEST(SshRemoteCopyTest, RequiresHostAndUser) {
    EXPECT_THROW(SshRemoteCopy(SshTarget{"", "courier"}, 1min), std::invalid_argument);
    EXPECT_THROW(SshRemoteCopy(SshTarget{"results.lab", ""}, 1min), std::invalid_argument);
}

TEST(SshRemoteCopyTest, SuccessIsNotAnError) {
    EXPECT_FALSE(SshRemoteCopy::classify(failed(0, ""), "copy", "h").has_value());
}

TEST(SshRemoteCopyTest, AuthenticationFailuresAreTerminal) {
    for (const auto* text : {"courier@h: Permission denied (publickey).\n",
                             "Host key verification failed.\n",
                             "@@@ WARNING: REMOTE HOST IDENTIFICATION HAS CHANGED! @@@\n"}) {
        const auto err = SshRemoteCopy::classify(failed(255, text), "copy", "h");
        ASSERT_TRUE(err.has_value()) << text;
        EXPECT_EQ(err->reason(), FailureReason::AuthFailure) << text;
        EXPECT_FALSE(err->retryable()) << text;
    }
}

TEST(SshRemoteCopyTest, ConnectionProblemsAreNetworkFailures) {
    const auto refused = SshRemoteCopy::classify(
        failed(255, "ssh: connect to host h port 22: Connection refused\n"), "copy", "h");
    ASSERT_TRUE(refused.has_value());
    EXPECT_EQ(refused->reason(), FailureReason::NetworkFailure);
    EXPECT_TRUE(refused->retryable());

    const auto timeout = SshRemoteCopy::classify(failed(137, "", true), "copy", "h");
    ASSERT_TRUE(timeout.has_value());
    EXPECT_EQ(timeout->reason(), FailureReason::NetworkFailure);
    EXPECT_TRUE(timeout->retryable());
}

TEST(SshRemoteCopyTest, RemoteCommandFailuresAreRemoteIO) {
    const auto err = SshRemoteCopy::classify(
        failed(1, "bash: /data/results/.x.part: Permission denied\n"), "copy", "h");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->reason(), FailureReason::RemoteIOFailure);
    EXPECT_TRUE(err->retryable());
    EXPECT_NE(std::string(err->what()).find("Permission denied"), std::string::npos);
}

TEST(ShellQuoteTest, QuotesSpacesAndSingleQuotes) {
    EXPECT_EQ(shellQuote("/data/results"), "'/data/results'");
    EXPECT_EQ(shellQuote("ward 12"), "'ward 12'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(shellQuote("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(SubprocessTest, CapturesExitCodeAndStderr) {
    const auto r = Subprocess::run({"sh", "-c", "echo oops >&2; exit 3"}, std::nullopt, 10s);
    EXPECT_FALSE(r.ok());
    EXPECT_FALSE(r.timedOut);
    EXPECT_EQ(r.exitCode, 3);
    EXPECT_EQ(r.stderrOutput, "oops\n");
}

TEST(SubprocessTest, FeedsStdinFromFile) {
    const TempDir dir;
    writeFile(dir / "in.txt", "payload");
    const auto out = dir / "out.txt";

    const auto r = Subprocess::run({"sh", "-c", "cat > " + shellQuote(out.string())}, dir / "in.txt", 10s);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(readFile(out), "payload");
}

TEST(SubprocessTest, KillsChildOnTimeout) {
    const auto started = std::chrono::steady_clock::now();
    const auto r = Subprocess::run({"sleep", "10"}, std::nullopt, 200ms);
    EXPECT_TRUE(r.timedOut);
    EXPECT_FALSE(r.ok());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(SubprocessTest, MissingProgramFailsWithoutThrowing) {
    const auto r = Subprocess::run({"labcourier-no-such-program"}, std::nullopt, 10s);
    EXPECT_EQ(r.exitCode, 127);
}
