#include <gtest/gtest.h>
#include <managers/session.hpp>
#include <core/log.hpp>
#include "fake_shell.hpp"
#include <thread>

using namespace std::chrono_literals;

static const std::string kPrompt = "[alice@box ~]$ ";

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_enabled(false);
        shell = std::make_shared<FakeShell>();
        options.init_timeout = 2s;
        options.command_timeout = 2s;
        options.drain_timeout = 500ms;
        options.poll_interval = 10ms;
        target.host = "box.example.org";
        target.user = "alice";
    }

    std::unique_ptr<Session> start_session() {
        auto s = std::make_unique<Session>("main", target, options);
        auto r = s->start(shell);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return s;
    }

    static int count(const std::string& hay, const std::string& needle) {
        int n = 0;
        for (auto pos = hay.find(needle); pos != std::string::npos;
             pos = hay.find(needle, pos + needle.size())) {
            n++;
        }
        return n;
    }

    template <typename Pred>
    static bool eventually(Pred pred, std::chrono::milliseconds limit = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }

    std::shared_ptr<FakeShell> shell;
    SessionOptions options;
    SessionTarget target;
};

TEST_F(SessionTest, StartsReadyWithFirstPromptAsChunkZero) {
    auto s = start_session();
    EXPECT_EQ(s->state(), SessionState::Ready);

    auto chunks = s->replay();
    ASSERT_FALSE(chunks.empty());
    EXPECT_EQ(chunks[0].sequence, 0u);
    EXPECT_EQ(chunks[0].data, kPrompt);
    EXPECT_TRUE(chunks[0].prompt_boundary);
    EXPECT_EQ(chunks[0].prompt_offset, 0u);

    // Init noise is not history
    EXPECT_EQ(s->history_text().find("Last login"), std::string::npos);
    EXPECT_EQ(s->history_text().find("SHELLCAST"), std::string::npos);
    EXPECT_EQ(s->info().user, "alice");
}

TEST_F(SessionTest, EchoStdoutIsExact) {
    auto s = start_session();
    auto r = s->exec("echo \"testing terminal fix\"");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "testing terminal fix\r\n");
    EXPECT_EQ(r.value.exit_code, 0);
    EXPECT_EQ(count(r.value.stdout_data, "echo"), 0);
    EXPECT_EQ(count(r.value.stdout_data, kPrompt), 0);
}

TEST_F(SessionTest, OnePromptPerEmission) {
    auto s = start_session();
    ASSERT_TRUE(s->exec("echo hello").is_ok());

    // prompt, "echo hello" echo, output, prompt (then the status query round trip)
    std::string text = s->history_text();
    std::string expected_head = kPrompt + "echo hello\r\nhello\r\n" + kPrompt;
    ASSERT_GE(text.size(), expected_head.size());
    EXPECT_EQ(text.substr(0, expected_head.size()), expected_head);

    int boundaries = 0;
    for (const auto& c : s->replay()) {
        if (c.prompt_boundary) boundaries++;
    }
    EXPECT_EQ(boundaries, count(text, kPrompt));
    EXPECT_EQ(boundaries, shell->prompts_emitted() - 1);   // minus the pre-init login prompt
}

TEST_F(SessionTest, SequentialCommandsEachPrecededByPrompt) {
    auto s = start_session();

    auto pwd = s->exec("pwd");
    ASSERT_TRUE(pwd.is_ok()) << pwd.error;
    EXPECT_EQ(pwd.value.stdout_data, "/home/alice\r\n");

    auto who = s->exec("whoami");
    ASSERT_TRUE(who.is_ok()) << who.error;
    EXPECT_EQ(who.value.stdout_data, "alice\r\n");

    std::string text = s->history_text();
    EXPECT_NE(text.find(kPrompt + "pwd\r\n"), std::string::npos);
    EXPECT_NE(text.find(kPrompt + "whoami\r\n"), std::string::npos);

    // The chunk holding each echo starts right after a boundary chunk
    auto chunks = s->replay();
    for (std::size_t i = 0; i < chunks.size(); i++) {
        if (chunks[i].data.rfind("pwd\r\n", 0) == 0 || chunks[i].data.rfind("whoami\r\n", 0) == 0) {
            ASSERT_GT(i, 0u);
            EXPECT_TRUE(chunks[i - 1].prompt_boundary);
        }
    }
}

TEST_F(SessionTest, ExitCodeAndWorkingDirectory) {
    auto s = start_session();
    EXPECT_EQ(s->exec("false").value.exit_code, 1);
    EXPECT_EQ(s->exec("nosuchcmd").value.exit_code, 127);

    ASSERT_TRUE(s->exec("cd /var/log").is_ok());
    auto pwd = s->exec("pwd");
    EXPECT_EQ(pwd.value.stdout_data, "/var/log\r\n");
    EXPECT_NE(s->history_text().find("[alice@box log]$ "), std::string::npos);
}

TEST_F(SessionTest, ByteByByteDelivery) {
    shell->set_delivery_size(1);
    auto s = start_session();
    auto r = s->exec("echo split");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "split\r\n");
    EXPECT_EQ(r.value.exit_code, 0);
}

TEST_F(SessionTest, ConcurrentSubmitIsBusy) {
    auto s = start_session();
    auto first = s->submit("sleep 0.3");
    EXPECT_EQ(s->state(), SessionState::Executing);

    auto second = s->submit("pwd").get();
    EXPECT_EQ(second.code, ErrorCode::Busy);

    auto r = first.get();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "");
    EXPECT_EQ(s->state(), SessionState::Ready);
}

TEST_F(SessionTest, TimeoutThenRecovery) {
    auto s = start_session();
    shell->set_unresponsive(true);
    auto r = s->exec("pwd", 150ms);
    EXPECT_EQ(r.code, ErrorCode::Timeout);
    EXPECT_EQ(s->state(), SessionState::Ready);

    shell->set_unresponsive(false);
    auto ok = s->exec("whoami");
    ASSERT_TRUE(ok.is_ok()) << ok.error;
    EXPECT_EQ(ok.value.stdout_data, "alice\r\n");
}

TEST_F(SessionTest, ExecAfterTimeoutGetsItsOwnOutput) {
    auto s = start_session();
    auto r = s->exec("sleep 1", 100ms);
    EXPECT_EQ(r.code, ErrorCode::Timeout);

    // The sleep's prompt arrives after this submit and must not end it
    auto ok = s->exec("echo hi");
    ASSERT_TRUE(ok.is_ok()) << ok.error;
    EXPECT_EQ(ok.value.stdout_data, "hi\r\n");
    EXPECT_EQ(ok.value.exit_code, 0);

    auto next = s->exec("whoami");
    ASSERT_TRUE(next.is_ok()) << next.error;
    EXPECT_EQ(next.value.stdout_data, "alice\r\n");
}

TEST_F(SessionTest, TypedLineRejectedWhileExecuting) {
    auto s = start_session();
    auto fut = s->submit("sleep 5");
    ASSERT_EQ(s->state(), SessionState::Executing);

    auto typed = s->send_input("echo injected\n");
    EXPECT_EQ(typed.code, ErrorCode::Busy);
    EXPECT_EQ(shell->written().find("injected"), std::string::npos);

    // Control characters still reach the shell
    ASSERT_TRUE(s->send_signal("SIGINT").is_ok());
    auto r = fut.get();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "^C\r\n");
    EXPECT_EQ(r.value.exit_code, 130);

    EXPECT_TRUE(s->send_input("echo typed\n").is_ok());
}

TEST_F(SessionTest, InterruptLongCommand) {
    auto s = start_session();
    auto r = s->exec("sleep 30", 100ms);
    EXPECT_EQ(r.code, ErrorCode::Timeout);

    std::size_t before = s->history().size();
    ASSERT_TRUE(s->send_signal("SIGINT").is_ok());
    EXPECT_NE(shell->written().find('\x03'), std::string::npos);
    ASSERT_TRUE(eventually([&] { return s->history().size() > before; }));
    ASSERT_TRUE(eventually([&] { return s->history_text().find("^C\r\n" + kPrompt) != std::string::npos; }));

    auto ok = s->exec("echo back");
    ASSERT_TRUE(ok.is_ok()) << ok.error;
    EXPECT_EQ(ok.value.stdout_data, "back\r\n");
    EXPECT_EQ(ok.value.exit_code, 0);
}

TEST_F(SessionTest, SignalMapping) {
    auto s = start_session();
    EXPECT_TRUE(s->send_signal("int").is_ok());
    EXPECT_TRUE(s->send_signal("SIGTSTP").is_ok());
    EXPECT_EQ(s->send_signal("SIGKILL").code, ErrorCode::InvalidArgument);

    std::string w = shell->written();
    EXPECT_NE(w.find('\x03'), std::string::npos);
    EXPECT_NE(w.find('\x1a'), std::string::npos);
}

TEST_F(SessionTest, AttachSeesReplayAndLive) {
    auto s = start_session();
    ASSERT_TRUE(s->exec("echo one").is_ok());

    auto obs = s->attach();
    ASSERT_TRUE(s->exec("echo two").is_ok());

    std::string seen;
    uint64_t expected_seq = 0;
    while (true) {
        auto ev = obs.next(50ms);
        if (ev.type != ObserverEvent::Type::Chunk) break;
        EXPECT_EQ(ev.chunk.sequence, expected_seq++);
        seen += ev.chunk.data;
    }
    EXPECT_EQ(seen, s->history_text());
}

TEST_F(SessionTest, ReattachReplaysIdentically) {
    auto s = start_session();
    ASSERT_TRUE(s->exec("pwd").is_ok());

    auto collect = [](Observer& obs) {
        std::vector<std::string> out;
        while (true) {
            auto ev = obs.next(20ms);
            if (ev.type != ObserverEvent::Type::Chunk) break;
            out.push_back(ev.chunk.data);
        }
        return out;
    };

    auto a = s->attach();
    auto first = collect(a);
    a.detach();
    auto b = s->attach();
    EXPECT_EQ(collect(b), first);
}

TEST_F(SessionTest, ChannelFailureEndsObserversWithError) {
    auto s = start_session();
    ASSERT_TRUE(s->exec("echo before").is_ok());
    auto obs = s->attach();

    shell->fail("connection reset");
    ASSERT_TRUE(eventually([&] { return s->state() == SessionState::Failed; }));
    EXPECT_NE(s->info().error.find("connection reset"), std::string::npos);

    ObserverEvent ev;
    do {
        ev = obs.next(200ms);
    } while (ev.type == ObserverEvent::Type::Chunk);
    ASSERT_EQ(ev.type, ObserverEvent::Type::End);
    EXPECT_NE(ev.error.find("connection reset"), std::string::npos);

    // History survives the failure
    EXPECT_NE(s->history_text().find("before\r\n"), std::string::npos);
    EXPECT_EQ(s->exec("pwd").code, ErrorCode::SessionClosed);
}

TEST_F(SessionTest, FailureDuringCommandResolvesSessionClosed) {
    auto s = start_session();
    auto fut = s->submit("sleep 30", 5s);
    shell->fail("broken pipe");
    auto r = fut.get();
    EXPECT_EQ(r.code, ErrorCode::SessionClosed);
}

TEST_F(SessionTest, CloseThenAttachGetsReplayAndEnd) {
    auto s = start_session();
    ASSERT_TRUE(s->exec("whoami").is_ok());
    std::size_t chunks = s->replay().size();

    s->close();
    EXPECT_EQ(s->state(), SessionState::Closed);
    EXPECT_EQ(s->submit("pwd").get().code, ErrorCode::SessionClosed);
    EXPECT_EQ(s->send_input("x").code, ErrorCode::SessionClosed);

    auto obs = s->attach();
    std::size_t got = 0;
    ObserverEvent ev;
    while ((ev = obs.next(20ms)).type == ObserverEvent::Type::Chunk) got++;
    EXPECT_EQ(got, chunks);
    EXPECT_EQ(ev.type, ObserverEvent::Type::End);
    EXPECT_TRUE(ev.error.empty());
}

TEST_F(SessionTest, CloseEndsLiveObserver) {
    auto s = start_session();
    auto obs = s->attach();
    s->close();

    ObserverEvent ev;
    while ((ev = obs.next(50ms)).type == ObserverEvent::Type::Chunk) {}
    EXPECT_EQ(ev.type, ObserverEvent::Type::End);
}

TEST_F(SessionTest, RemoteHangupFailsSession) {
    auto s = start_session();
    shell->hang_up();
    ASSERT_TRUE(eventually([&] { return s->state() == SessionState::Failed; }));
}

TEST_F(SessionTest, InitTimeoutIsConnectError) {
    shell->set_ignore_init(true);
    options.init_timeout = 200ms;
    Session s("stuck", target, options);
    auto r = s.start(shell);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::ConnectError);
    EXPECT_EQ(s.state(), SessionState::Failed);
}

TEST_F(SessionTest, BadPromptTemplateIsConnectError) {
    options.prompt_template = "{cwd}> ";
    Session s("bad", target, options);
    auto r = s.start(shell);
    EXPECT_EQ(r.code, ErrorCode::ConnectError);
}

TEST_F(SessionTest, CommandRecordsAreCapped) {
    options.max_command_records = 3;
    auto s = start_session();
    s->exec("true", std::nullopt, CommandSource::Agent);
    s->exec("false", std::nullopt, CommandSource::User);
    s->exec("pwd");
    s->exec("whoami", std::nullopt, CommandSource::System);
    s->exec("exit");   // rejected, not recorded

    auto records = s->command_records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].command, "false");
    EXPECT_EQ(records[0].status, "failure");
    EXPECT_EQ(records[0].exit_code, 1);
    EXPECT_EQ(records[0].source, CommandSource::User);
    EXPECT_EQ(records[2].command, "whoami");
    EXPECT_EQ(records[2].status, "success");
    EXPECT_EQ(records[2].source, CommandSource::System);
}

TEST_F(SessionTest, TimedOutCommandIsRecorded) {
    auto s = start_session();
    s->exec("sleep 10", 50ms);
    auto records = s->command_records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "timeout");
}

TEST_F(SessionTest, SendInputReachesShell) {
    auto s = start_session();
    ASSERT_TRUE(s->send_input("echo typed\n").is_ok());
    ASSERT_TRUE(eventually([&] { return s->history_text().find("typed\r\n" + kPrompt) != std::string::npos; }));
}
