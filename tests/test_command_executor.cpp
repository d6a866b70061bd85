#include <gtest/gtest.h>
#include <managers/command_executor.hpp>
#include <ssh/marker_protocol.hpp>
#include <core/log.hpp>
#include <thread>

using namespace std::chrono_literals;

// Records writes; the test plays the remote side by appending to history.
class RecordingChannel : public RemoteChannel {
public:
    Result<void> write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_.empty()) return Result<void>::Err(error_, ErrorCode::ChannelError);
        writes_.push_back(data);
        return Result<void>::Ok();
    }
    ReadResult read(std::chrono::milliseconds) override { return ReadResult::idle(); }
    void close() override {}
    bool is_open() const override { return true; }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }
    void set_error(const std::string& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = e;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> writes_;
    std::string error_;
};

class CommandExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_enabled(false);
        channel = std::make_shared<RecordingChannel>();
        executor = std::make_unique<CommandExecutor>(channel, 4096);
        history.add_listener([this](const OutputChunk& c) { executor->on_chunk(c); });
        history.append(kPrompt, 0u);
    }

    // Append output that ends with one prompt
    void remote_prompted(const std::string& body) {
        uint64_t start = history.byte_count() + body.size();
        history.append(body + kPrompt, start);
    }

    bool wait_for_writes(std::size_t n, std::chrono::milliseconds limit = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (channel->writes().size() >= n) return true;
            std::this_thread::sleep_for(1ms);
        }
        return false;
    }

    // Echo and reply for the most recently written status query
    std::string status_reply(int status) {
        std::string query = channel->writes().back();   // " echo __SHELLCAST_ST''ATUS__ <id> $?\n"
        std::string id = query.substr(query.find("__ ") + 3);
        id = id.substr(0, id.find(' '));
        return query.substr(0, query.size() - 1) + "\r\n__SHELLCAST_STATUS__ " + id + " "
               + std::to_string(status) + "\r\n";
    }

    // Play a complete command round trip
    void answer(const std::string& cmd, const std::string& output, int status) {
        std::size_t before = channel->writes().size();
        remote_prompted(cmd + "\r\n" + output);
        ASSERT_TRUE(wait_for_writes(before + 1));
        remote_prompted(status_reply(status));
    }

    static constexpr const char* kPrompt = "[alice@box ~]$ ";
    std::shared_ptr<RecordingChannel> channel;
    std::unique_ptr<CommandExecutor> executor;
    HistoryBuffer history;
};

TEST_F(CommandExecutorTest, CommandThenStatusQuery) {
    auto fut = executor->submit("ls", 2s);
    ASSERT_EQ(channel->writes().size(), 1u);
    EXPECT_EQ(channel->writes()[0], "ls\n");
    EXPECT_TRUE(executor->busy());

    answer("ls", "a.txt\r\nb.txt\r\n", 0);
    auto r = fut.get();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "a.txt\r\nb.txt\r\n");
    EXPECT_EQ(r.value.exit_code, 0);
    EXPECT_EQ(channel->writes()[1], build_status_command(1));
    EXPECT_FALSE(executor->busy());
    EXPECT_EQ(executor->last_state(), CommandState::Completed);
}

TEST_F(CommandExecutorTest, StatusWrittenOnlyAfterPrompt) {
    auto fut = executor->submit("sleep 1", 2s);
    history.append("sleep 1\r\n");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(channel->writes().size(), 1u);

    remote_prompted("");
    ASSERT_TRUE(wait_for_writes(2));
    remote_prompted(status_reply(0));
    auto r = fut.get();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.stdout_data, "");
}

TEST_F(CommandExecutorTest, NonZeroExitCode) {
    auto fut = executor->submit("false", 2s);
    answer("false", "", 1);
    auto r = fut.get();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.exit_code, 1);
}

TEST_F(CommandExecutorTest, PromptSplitOverChunks) {
    auto fut = executor->submit("whoami", 2s);
    uint64_t prompt_at = history.byte_count() + 15;   // "whoami\r\nalice\r\n"
    history.append("whoami\r\nalice\r\n[alice@b");
    history.append("ox ~]$ ", prompt_at);
    ASSERT_TRUE(wait_for_writes(2));
    remote_prompted(status_reply(0));

    auto r = fut.get();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.stdout_data, "alice\r\n");
}

TEST_F(CommandExecutorTest, BusyWhileAwaitingPrompt) {
    auto first = executor->submit("sleep 5", 2s);
    auto pending = executor->pending();
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->state, CommandState::AwaitingPrompt);

    auto second = executor->submit("pwd", 2s).get();
    EXPECT_EQ(second.code, ErrorCode::Busy);
    EXPECT_EQ(channel->writes().size(), 1u);

    answer("sleep 5", "", 0);
    auto r = first.get();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.stdout_data, "");
}

TEST_F(CommandExecutorTest, TimeoutReleasesLock) {
    auto r = executor->submit("hang", 100ms).get();
    EXPECT_EQ(r.code, ErrorCode::Timeout);
    EXPECT_FALSE(executor->busy());
    EXPECT_EQ(executor->last_state(), CommandState::TimedOut);

    auto fut = executor->submit("echo ok", 2s);
    answer("echo ok", "ok\r\n", 0);
    auto ok = fut.get();
    ASSERT_TRUE(ok.is_ok()) << ok.error;
    EXPECT_EQ(ok.value.stdout_data, "ok\r\n");
}

TEST_F(CommandExecutorTest, OutputBudgetExceededIsTimeout) {
    auto fut = executor->submit("yes", 10s);
    history.append("yes\r\n");
    for (int i = 0; i < 3000; i++) history.append("y\r\n");

    auto r = fut.get();
    EXPECT_EQ(r.code, ErrorCode::Timeout);
    EXPECT_FALSE(executor->busy());
}

TEST_F(CommandExecutorTest, RejectsShellTerminatingCommands) {
    EXPECT_EQ(executor->submit("exit", 1s).get().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(executor->submit("exit 3", 1s).get().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(executor->submit("  logout", 1s).get().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(executor->submit("", 1s).get().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(executor->submit("echo a\necho b", 1s).get().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(channel->writes().empty());

    EXPECT_TRUE(CommandExecutor::validate_command("exiting_soon").is_ok());
}

TEST_F(CommandExecutorTest, WriteFailureIsChannelError) {
    channel->set_error("broken pipe");
    auto r = executor->submit("pwd", 1s).get();
    EXPECT_EQ(r.code, ErrorCode::ChannelError);
    EXPECT_FALSE(executor->busy());
    EXPECT_EQ(executor->last_state(), CommandState::Failed);
}

TEST_F(CommandExecutorTest, ShutdownWakesInFlightCommand) {
    auto fut = executor->submit("sleep 100", 10s);
    executor->shutdown(50ms);

    auto r = fut.get();
    EXPECT_EQ(r.code, ErrorCode::SessionClosed);
    EXPECT_EQ(executor->last_state(), CommandState::Failed);
    EXPECT_EQ(executor->submit("pwd", 1s).get().code, ErrorCode::SessionClosed);
}

TEST_F(CommandExecutorTest, ShutdownDrainsCompletingCommand) {
    auto fut = executor->submit("pwd", 5s);
    std::thread remote([this] { answer("pwd", "/home/alice\r\n", 0); });
    executor->shutdown(2s);
    remote.join();

    auto r = fut.get();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "/home/alice\r\n");
}

TEST_F(CommandExecutorTest, PromptBeforeEchoIsSkipped) {
    // A prompt still owed by an earlier, timed-out command
    auto fut = executor->submit("echo hi", 2s);
    remote_prompted("");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(channel->writes().size(), 1u);

    answer("echo hi", "hi\r\n", 0);
    auto r = fut.get();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "hi\r\n");
    EXPECT_EQ(r.value.exit_code, 0);
}

TEST_F(CommandExecutorTest, LaterPromptReplacesOutput) {
    // Typeahead echoed by the tty, then the stale prompt, then the real run
    auto fut = executor->submit("echo hi", 2s);
    remote_prompted("echo hi\r\n");
    ASSERT_TRUE(wait_for_writes(2));
    remote_prompted("hi\r\n");
    remote_prompted(status_reply(0));

    auto r = fut.get();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "hi\r\n");
    EXPECT_EQ(r.value.exit_code, 0);
}

TEST_F(CommandExecutorTest, StatusReplyOfEarlierQueryIgnored) {
    auto fut = executor->submit("true", 2s);
    remote_prompted("true\r\n");
    ASSERT_TRUE(wait_for_writes(2));
    remote_prompted("__SHELLCAST_STATUS__ 99 1\r\n");
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(executor->busy());

    remote_prompted(status_reply(0));
    auto r = fut.get();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_code, 0);
    EXPECT_EQ(r.value.stdout_data, "");
}

TEST_F(CommandExecutorTest, MissingStatusLineIsTimeoutNotSuccess) {
    auto fut = executor->submit("ls", 300ms);
    remote_prompted("ls\r\na.txt\r\n");
    ASSERT_TRUE(wait_for_writes(2));
    remote_prompted("garbage\r\n");

    auto r = fut.get();
    EXPECT_EQ(r.code, ErrorCode::Timeout);
}

TEST_F(CommandExecutorTest, DroppedFutureDoesNotBlock) {
    auto start = std::chrono::steady_clock::now();
    {
        auto dropped = executor->submit("sleep 100", 5s);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_TRUE(executor->busy());

    executor->shutdown(0ms);
    EXPECT_FALSE(executor->busy());
}
