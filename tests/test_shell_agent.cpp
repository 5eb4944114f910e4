#include <gtest/gtest.h>
#include <ssh/shell_agent.hpp>
#include "fake_shell.hpp"

using namespace std::chrono_literals;

// Agent wired to FakeShells instead of SSH. Each connect builds a fresh
// shell; `shell` always points at the latest one.
struct AgentRig {
    int connects = 0;
    bool refuse = false;
    FakeShell* shell = nullptr;
    FakeShell::Responder responder;
    ShellAgent agent;

    AgentRig() : agent(fake_config(), [this](const SessionConfig& cfg, StatusCallback) {
        return open(cfg);
    }) {}

    Result<std::unique_ptr<ShellSession>> open(const SessionConfig& cfg) {
        using R = Result<std::unique_ptr<ShellSession>>;
        ++connects;
        if (refuse) return R::Err(Status::ConnectionFailed, "connection refused");

        auto fake = std::make_unique<FakeShell>();
        shell = fake.get();
        if (responder) shell->set_responder(responder);
        shell->feed("Welcome\r\n$ ");

        auto session = std::make_unique<ShellSession>(std::move(fake), cfg);
        auto prompt = session->wait_for_prompt();
        if (prompt.is_err()) return R::Err(prompt.status, prompt.error);
        return R::Ok(std::move(session));
    }
};

TEST(ShellAgent, ConnectsLazilyOnFirstCommand) {
    AgentRig rig;
    EXPECT_FALSE(rig.agent.connected());
    EXPECT_EQ(rig.agent.session(), nullptr);

    auto r = rig.agent.send_command("true");

    EXPECT_TRUE(r.matched()) << r.error;
    EXPECT_TRUE(rig.agent.connected());
    EXPECT_EQ(rig.connects, 1);
}

TEST(ShellAgent, ConnectIsNoOpWhenConnected) {
    AgentRig rig;
    ASSERT_TRUE(rig.agent.connect().is_ok());
    ASSERT_TRUE(rig.agent.connect().is_ok());
    rig.agent.send_command("true");

    EXPECT_EQ(rig.connects, 1);
}

TEST(ShellAgent, FailedConnectIsLostConnection) {
    AgentRig rig;
    rig.refuse = true;

    auto r = rig.agent.send_command("ls");

    EXPECT_EQ(r.status, Status::LostConnection);
    EXPECT_NE(r.error.find("connection refused"), std::string::npos);
    EXPECT_FALSE(rig.agent.connected());
    EXPECT_TRUE(rig.agent.history().empty());
}

TEST(ShellAgent, ConnectPropagatesStatus) {
    AgentRig rig;
    rig.refuse = true;

    auto c = rig.agent.connect();
    EXPECT_EQ(c.status, Status::ConnectionFailed);
}

TEST(ShellAgent, StripCommandRemovesEcho) {
    AgentRig rig;
    rig.responder = [](const std::string&) { return std::string("file1\r\n"); };

    auto r = rig.agent.send_command_strip_command("ls");

    EXPECT_TRUE(r.matched());
    EXPECT_EQ(r.text, "file1\r\n$ ");
}

TEST(ShellAgent, StripCommandKeepsOutputWithoutEcho) {
    AgentRig rig;
    ASSERT_TRUE(rig.agent.connect().is_ok());
    rig.shell->set_echo(false);
    rig.shell->set_responder([](const std::string&) { return std::string("file1\r\n"); });

    auto r = rig.agent.send_command_strip_command("ls");

    EXPECT_EQ(r.text, "file1\r\n$ ");
}

TEST(ShellAgent, WaitForListAppendsPromptLast) {
    AgentRig rig;

    auto r = rig.agent.send_command_wait_for_list("echo", {"never-here"});

    EXPECT_TRUE(r.matched());
    EXPECT_EQ(r.pattern_index, 1u);
}

TEST(ShellAgent, WaitForListReportsCallerPattern) {
    AgentRig rig;
    rig.responder = [](const std::string&) { return std::string("(yes/no) "); };
    ASSERT_TRUE(rig.agent.connect().is_ok());
    rig.shell->set_auto_prompt(false);

    auto r = rig.agent.send_command_wait_for_list("ssh other", {"\\(yes/no\\) $"});

    EXPECT_TRUE(r.matched());
    EXPECT_EQ(r.pattern_index, 0u);
}

TEST(ShellAgent, LogoutForcesReconnect) {
    AgentRig rig;
    ASSERT_TRUE(rig.agent.send_command("true").matched());
    FakeShell* first = rig.shell;

    rig.agent.logout();
    EXPECT_FALSE(rig.agent.connected());
    EXPECT_TRUE(first->closed());

    auto r = rig.agent.send_command("true");
    EXPECT_TRUE(r.matched());
    EXPECT_EQ(rig.connects, 2);
    EXPECT_NE(rig.shell, first);
}

TEST(ShellAgent, RecordsHistory) {
    AgentRig rig;
    rig.agent.send_command("cd /tmp");
    rig.agent.send_command_no_wait("ls");

    ASSERT_EQ(rig.agent.history().size(), 2u);
    EXPECT_EQ(rig.agent.history()[0], "cd /tmp");
    EXPECT_EQ(rig.agent.history()[1], "ls");
}

TEST(ShellAgent, NoWaitLeavesOutputBuffered) {
    AgentRig rig;
    ASSERT_TRUE(rig.agent.send_command_no_wait("pwd").is_ok());

    auto r = rig.agent.session()->read_until("$ ", 1000ms);
    EXPECT_EQ(r.text, "pwd\r\n$ ");
}

TEST(ShellAgent, RemoteHangupMarksDisconnected) {
    AgentRig rig;
    ASSERT_TRUE(rig.agent.connect().is_ok());
    rig.shell->set_echo(false);
    rig.shell->set_auto_prompt(false);
    rig.shell->finish();

    auto r = rig.agent.send_command("ls");

    EXPECT_EQ(r.status, Status::StreamClosed);
    EXPECT_FALSE(rig.agent.connected());
}

TEST(ShellAgent, WriteFailureMarksDisconnected) {
    AgentRig rig;
    ASSERT_TRUE(rig.agent.connect().is_ok());
    rig.shell->set_fail_writes(true);

    auto r = rig.agent.send_command("ls");

    EXPECT_EQ(r.status, Status::LostConnection);
    EXPECT_FALSE(rig.agent.connected());
}
