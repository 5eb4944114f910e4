#include <gtest/gtest.h>
#include <ssh/shell_session.hpp>
#include <ssh/session.hpp>
#include "fake_shell.hpp"

using namespace std::chrono_literals;

// A session over a FakeShell that has already printed its banner and prompt.
struct SessionRig {
    FakeShell* shell;
    std::unique_ptr<ShellSession> session;

    explicit SessionRig(SessionConfig cfg = fake_config(), const std::string& banner = "Welcome\r\n$ ") {
        auto fake = std::make_unique<FakeShell>();
        shell = fake.get();
        shell->feed(banner);
        session = std::make_unique<ShellSession>(std::move(fake), cfg);
    }
};

TEST(ShellSession, WaitForPromptConsumesBanner) {
    SessionRig rig;
    auto r = rig.session->wait_for_prompt();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(rig.session->buffer().empty());
}

TEST(ShellSession, PromptNotFoundWhenShellStaysQuiet) {
    SessionRig rig(fake_config(), "Last login: yesterday\r\n");

    auto start = std::chrono::steady_clock::now();
    auto r = rig.session->wait_for_prompt();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.status, Status::PromptNotFound);
    EXPECT_NE(r.error.find("Last login"), std::string::npos);
    EXPECT_GE(elapsed, 1s);
}

TEST(ShellSession, InvalidPromptPatternIsReported) {
    auto cfg = fake_config();
    cfg.prompt = "([";
    SessionRig rig(cfg);

    auto r = rig.session->wait_for_prompt();
    EXPECT_EQ(r.status, Status::InvalidPattern);
}

TEST(ShellSession, SendCommandReadsThroughPrompt) {
    SessionRig rig;
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    rig.shell->set_responder([](const std::string& line) {
        return line == "ls" ? std::string("file1  file2\r\n") : std::string();
    });

    auto r = rig.session->send_command("ls");

    EXPECT_TRUE(r.matched()) << r.error;
    EXPECT_EQ(r.text, "ls\r\nfile1  file2\r\n$ ");
    EXPECT_EQ(rig.shell->written(), "ls\n");
}

TEST(ShellSession, CommandsStayInStep) {
    SessionRig rig;
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    rig.shell->set_responder([](const std::string& line) { return "out-" + line + "\r\n"; });

    auto a = rig.session->send_command("a");
    auto b = rig.session->send_command("b");

    EXPECT_EQ(a.text, "a\r\nout-a\r\n$ ");
    EXPECT_EQ(b.text, "b\r\nout-b\r\n$ ");
}

TEST(ShellSession, NoPromptTimesOutWithPartialOutput) {
    SessionRig rig(fake_config(1s));
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    rig.shell->set_auto_prompt(false);

    auto start = std::chrono::steady_clock::now();
    auto r = rig.session->send_command("sleep 100");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(r.status, Status::NoMatch);
    EXPECT_EQ(r.text, "sleep 100\r\n");
    EXPECT_GE(elapsed, 1s);
    EXPECT_LT(elapsed, 1600ms);
    EXPECT_TRUE(rig.session->buffer().empty());
}

TEST(ShellSession, WaitForListMatchesConfirmation) {
    SessionRig rig;
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    rig.shell->set_auto_prompt(false);
    rig.shell->set_responder([](const std::string&) { return std::string("Proceed? [y/n] "); });

    auto r = rig.session->send_command_wait_for_list("rm -i f", {"\\[y/n\\] $"});

    EXPECT_TRUE(r.matched()) << r.error;
    EXPECT_EQ(r.pattern_index, 0u);
    EXPECT_EQ(r.text, "rm -i f\r\nProceed? [y/n] ");
}

TEST(ShellSession, WaitForListFallsBackToPrompt) {
    SessionRig rig;
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());

    auto r = rig.session->send_command_wait_for_list("true", {"password: $"});

    EXPECT_TRUE(r.matched());
    EXPECT_EQ(r.pattern_index, 1u);
    EXPECT_EQ(r.text, "true\r\n$ ");
}

TEST(ShellSession, CallerPatternTakesPrecedenceOverPrompt) {
    SessionRig rig;
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    rig.shell->set_echo(false);
    rig.shell->set_responder([](const std::string&) { return std::string("confirm> "); });

    auto r = rig.session->send_command_wait_for_list("go", {"confirm> "});

    EXPECT_TRUE(r.matched());
    EXPECT_EQ(r.pattern_index, 0u);
    EXPECT_EQ(r.text, "confirm> ");
    auto rest = rig.session->read_until_pattern("\\$ $", 1000ms);
    EXPECT_EQ(rest.text, "$ ");
}

TEST(ShellSession, WriteThenReadUntilLiteral) {
    SessionRig rig;
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    rig.shell->set_responder([](const std::string&) { return std::string("Password: "); });
    rig.shell->set_auto_prompt(false);

    auto r = rig.session->write_then_read_until("sudo -k true", "Password: ", 1000ms);

    EXPECT_TRUE(r.matched());
    EXPECT_EQ(r.text, "sudo -k true\r\nPassword: ");
}

TEST(ShellSession, WriteFailureIsLostConnection) {
    SessionRig rig;
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    rig.shell->set_fail_writes(true);

    auto r = rig.session->send_command("ls");
    EXPECT_EQ(r.status, Status::LostConnection);
}

TEST(ShellSession, WriteAfterCloseIsLostConnection) {
    SessionRig rig;
    rig.session->close();

    EXPECT_FALSE(rig.session->is_open());
    EXPECT_TRUE(rig.shell->closed());
    auto w = rig.session->write("ls");
    EXPECT_EQ(w.status, Status::LostConnection);
}

TEST(ShellSession, CloseIsIdempotent) {
    SessionRig rig;
    rig.session->close();
    rig.session->close();
    EXPECT_TRUE(rig.session->reader_stopped());
}

TEST(ShellSession, RemoteHangupEndsReadEarly) {
    SessionRig rig(fake_config(10s));
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    rig.shell->feed("logout\r\n");
    rig.shell->finish();

    auto start = std::chrono::steady_clock::now();
    auto r = rig.session->read_until_pattern("\\$ $", 10s);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(r.status, Status::StreamClosed);
    EXPECT_EQ(r.text, "logout\r\n");
    EXPECT_LT(elapsed, 2s);
}

TEST(ShellSession, AliveTracksReaderAndClose) {
    SessionRig rig;
    ASSERT_TRUE(rig.session->wait_for_prompt().is_ok());
    EXPECT_TRUE(rig.session->alive());

    rig.session->close();
    EXPECT_FALSE(rig.session->alive());
}

TEST(SessionManager, RepeatedConnectFailuresAreReported) {
    auto cfg = fake_config(1s);
    cfg.host = "127.0.0.1";
    cfg.port = 1;

    // Library setup happens once; each attempt fails on the TCP connect
    for (int i = 0; i < 2; ++i) {
        SessionManager transport(cfg);
        auto r = transport.establish();
        EXPECT_EQ(r.status, Status::ConnectionFailed);
        EXPECT_FALSE(transport.check_alive());
    }
}
