/**
 * @file serial_console_test.cpp
 * @brief Unit tests for ui::SerialConsole line editing and dispatch
 */

#include <algorithm>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "ui/serial_console.hpp"

extern "C" {
#include "esp_err.h"
}

namespace {

// In-memory transport: Feed() queues keystrokes, output() collects writes
class ScriptedTransport : public ui::ConsoleTransport {
 public:
  size_t Read(char* buf, size_t len) override {
    const size_t count = std::min(len, pending_.size() - read_pos_);
    pending_.copy(buf, count, read_pos_);
    read_pos_ += count;
    return count;
  }

  void Write(const char* data, size_t len) override { output_.append(data, len); }

  void Feed(const std::string& keys) { pending_ += keys; }
  const std::string& output() const { return output_; }
  void ClearOutput() { output_.clear(); }

 private:
  std::string pending_;
  size_t read_pos_ = 0;
  std::string output_;
};

class SerialConsoleTest : public ::testing::Test {
 protected:
  void SetUp() override {
    console_.RegisterCommand(
        "echo",
        [this](const std::vector<std::string>& args) {
          calls_.push_back(args);
          return ESP_OK;
        },
        "echo <words> - Record arguments");
    console_.RegisterCommand(
        "fail", [](const std::vector<std::string>&) { return ESP_ERR_INVALID_STATE; },
        "fail - Always fails");
    console_.RegisterCommand(
        "theme", [](const std::vector<std::string>&) { return ESP_OK; },
        "theme <dark|light>",
        [](const std::string&, size_t) {
          return std::vector<std::string>{"theme dark ", "theme light "};
        });
    console_.RegisterCommand(
        "tempo", [](const std::vector<std::string>&) { return ESP_OK; }, "tempo");
    console_.Init("Test Console");
    transport_.ClearOutput();
  }

  void Type(const std::string& keys) {
    transport_.Feed(keys);
    console_.Poll();
  }

  bool OutputContains(const std::string& text) const {
    return transport_.output().find(text) != std::string::npos;
  }

  ScriptedTransport transport_;
  ui::SerialConsole console_{&transport_};
  std::vector<std::vector<std::string>> calls_;
};

}  // namespace

TEST(SerialConsoleInitTest, BannerAndPrompt) {
  ScriptedTransport transport;
  ui::SerialConsole console(&transport);
  console.Init("Pomotodo Test");
  EXPECT_NE(std::string::npos, transport.output().find("Pomotodo Test"));
  EXPECT_NE(std::string::npos, transport.output().find("Type 'help'"));
  EXPECT_EQ(console.GetPrompt(),
            transport.output().substr(transport.output().size() - console.GetPrompt().size()));
}

TEST_F(SerialConsoleTest, EchoesTypedCharacters) {
  Type("ech");
  EXPECT_EQ("ech", transport_.output());
  EXPECT_TRUE(calls_.empty());
}

TEST_F(SerialConsoleTest, EnterDispatchesTokenizedLine) {
  Type("echo  one   two\r\n");
  ASSERT_EQ(1u, calls_.size());
  EXPECT_EQ((std::vector<std::string>{"echo", "one", "two"}), calls_[0]);
  EXPECT_TRUE(OutputContains("\r\n" + console_.GetPrompt()));
}

TEST_F(SerialConsoleTest, CrLfCountsAsOneEnter) {
  Type("echo a\r\necho b\n");
  ASSERT_EQ(2u, calls_.size());
  EXPECT_EQ("b", calls_[1][1]);
}

TEST_F(SerialConsoleTest, BlankLineOnlyPrintsPrompt) {
  Type("   \r");
  EXPECT_TRUE(calls_.empty());
  EXPECT_EQ("   \r\n" + console_.GetPrompt(), transport_.output());
}

TEST_F(SerialConsoleTest, BackspaceEditsLine) {
  Type("echo abx\x7f" "c\r");
  ASSERT_EQ(1u, calls_.size());
  EXPECT_EQ("abc", calls_[0][1]);
}

TEST_F(SerialConsoleTest, CursorInsertInMiddle) {
  // "echo ac", left arrow, insert 'b'
  Type("echo ac\x1b[Db\r");
  ASSERT_EQ(1u, calls_.size());
  EXPECT_EQ("abc", calls_[0][1]);
}

TEST_F(SerialConsoleTest, CtrlCDiscardsLine) {
  Type("echo lost\x03");
  EXPECT_TRUE(OutputContains("^C\r\n"));
  Type("\r");
  EXPECT_TRUE(calls_.empty());
}

TEST_F(SerialConsoleTest, UpArrowRecallsHistory) {
  Type("echo first\r");
  Type("echo second\r");
  Type("\x1b[A\x1b[A\r");
  ASSERT_EQ(3u, calls_.size());
  EXPECT_EQ("first", calls_[2][1]);
}

TEST_F(SerialConsoleTest, DownArrowPastNewestClearsLine) {
  Type("echo only\r");
  Type("\x1b[A\x1b[B\r");
  EXPECT_EQ(1u, calls_.size());
}

TEST_F(SerialConsoleTest, HistoryKeepsNewestEntries) {
  for (int i = 0; i < 10; ++i) {
    Type("echo " + std::to_string(i) + "\r");
  }
  // Oldest reachable entry is #2 (8 entries kept); extra presses stay there
  std::string up;
  for (int i = 0; i < 12; ++i) {
    up += "\x1b[A";
  }
  Type(up + "\r");
  ASSERT_EQ(11u, calls_.size());
  EXPECT_EQ("2", calls_.back()[1]);
}

TEST_F(SerialConsoleTest, TabCompletesUniqueVerb) {
  Type("ec\t");
  Type("hi\r");
  ASSERT_EQ(1u, calls_.size());
  EXPECT_EQ((std::vector<std::string>{"echo", "hi"}), calls_[0]);
}

TEST_F(SerialConsoleTest, TabListsAmbiguousVerbs) {
  Type("t\t");
  EXPECT_TRUE(OutputContains("Possible commands:"));
  EXPECT_TRUE(OutputContains("  theme\r\n"));
  EXPECT_TRUE(OutputContains("  tempo\r\n"));
  EXPECT_TRUE(calls_.empty());
}

TEST_F(SerialConsoleTest, TabDelegatesArgumentCompletion) {
  Type("theme \t");
  EXPECT_TRUE(OutputContains("Possible completions:"));
  EXPECT_TRUE(OutputContains("  theme dark \r\n"));
}

TEST_F(SerialConsoleTest, TabCompletesHelpTopics) {
  Type("help t\t");
  EXPECT_TRUE(OutputContains("  help theme\r\n"));
  EXPECT_TRUE(OutputContains("  help tempo\r\n"));

  transport_.ClearOutput();
  Type("\x03help ec\t\r");
  EXPECT_TRUE(OutputContains("echo - echo <words> - Record arguments"));
}

TEST_F(SerialConsoleTest, TabAfterUnknownVerbDoesNothing) {
  Type("bogus x\t");
  EXPECT_FALSE(OutputContains("Possible"));
  Type("\r");
  EXPECT_TRUE(OutputContains("Unknown command: bogus"));
}

TEST_F(SerialConsoleTest, UnknownCommandIsReported) {
  Type("bogus\r");
  EXPECT_TRUE(OutputContains("Unknown command: bogus"));
  EXPECT_TRUE(OutputContains("Type 'help'"));
}

TEST_F(SerialConsoleTest, HandlerErrorIsPrintedByName) {
  Type("fail\r");
  EXPECT_TRUE(OutputContains("Error: ESP_ERR_INVALID_STATE"));
}

TEST_F(SerialConsoleTest, HelpListsRegisteredCommands) {
  Type("help\r");
  EXPECT_TRUE(OutputContains("Available commands:"));
  EXPECT_TRUE(OutputContains("echo"));
  EXPECT_TRUE(OutputContains("Record arguments"));

  transport_.ClearOutput();
  Type("help nothing\r");
  EXPECT_TRUE(OutputContains("Unknown command: nothing"));
  EXPECT_TRUE(OutputContains("Error: ESP_ERR_NOT_FOUND"));
}

TEST_F(SerialConsoleTest, ReRegisteringReplacesHandler) {
  const size_t before = console_.GetCommands().size();
  int replaced = 0;
  console_.RegisterCommand(
      "echo",
      [&replaced](const std::vector<std::string>&) {
        ++replaced;
        return ESP_OK;
      },
      "echo v2");
  EXPECT_EQ(before, console_.GetCommands().size());
  Type("echo x\r");
  EXPECT_EQ(1, replaced);
  EXPECT_TRUE(calls_.empty());
}

TEST_F(SerialConsoleTest, TooManyArgumentsIsRejected) {
  std::string line = "echo";
  for (size_t i = 0; i < ui::MAX_ARGS; ++i) {
    line += " a";
  }
  console_.Execute(line);
  EXPECT_TRUE(calls_.empty());
  EXPECT_TRUE(OutputContains("Too many arguments"));
}

TEST_F(SerialConsoleTest, LineSinkReceivesLinesInsteadOfExecuting) {
  std::vector<std::string> lines;
  console_.SetLineSink([&lines](const std::string& line) { lines.push_back(line); });
  Type("echo queued\r");
  EXPECT_TRUE(calls_.empty());
  ASSERT_EQ(1u, lines.size());
  EXPECT_EQ("echo queued", lines[0]);

  console_.Execute(lines[0]);
  ASSERT_EQ(1u, calls_.size());
  EXPECT_EQ("queued", calls_[0][1]);
}

TEST_F(SerialConsoleTest, OverlongInputIsTruncated) {
  Type("echo " + std::string(ui::MAX_LINE * 2, 'x') + "\r");
  ASSERT_EQ(1u, calls_.size());
  EXPECT_EQ(ui::MAX_LINE - 1 - 5, calls_[0][1].size());
}
