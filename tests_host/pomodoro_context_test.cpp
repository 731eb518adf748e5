/**
 * @file pomodoro_context_test.cpp
 * @brief Unit tests for app::PomodoroContext (timer/ledger coupling and persistence)
 */

#include <string>
#include <vector>

#include "app/pomodoro_context.hpp"
#include "config/record_codec.hpp"
#include "gtest/gtest.h"

namespace {

using app::PhaseNotice;
using app::PomodoroContext;
using pomodoro::Phase;

class MemoryRecordStore : public config::RecordStore {
 public:
  esp_err_t Load(std::string* payload) override {
    ++loads;
    if (load_error != ESP_OK) {
      return load_error;
    }
    if (!has_payload) {
      return ESP_ERR_NOT_FOUND;
    }
    *payload = stored;
    return ESP_OK;
  }

  esp_err_t Save(const std::string& payload) override {
    ++saves;
    if (save_error != ESP_OK) {
      return save_error;
    }
    stored = payload;
    has_payload = true;
    return ESP_OK;
  }

  config::PersistedRecord Decoded() const {
    config::PersistedRecord record;
    EXPECT_EQ(ESP_OK, config::RecordCodec::Decode(stored, &record));
    return record;
  }

  std::string stored;
  bool has_payload = false;
  esp_err_t load_error = ESP_OK;
  esp_err_t save_error = ESP_OK;
  int loads = 0;
  int saves = 0;
};

class PomodoroContextTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(ESP_OK, context_.Load());
    ASSERT_EQ(ESP_OK, context_.TakePersistenceWarning());
  }

  // One-minute phases keep tick loops short
  void UseShortPhases(uint32_t interval = 4) {
    config::TimerSettings settings = context_.settings();
    settings.focus_minutes = 1;
    settings.short_break_minutes = 1;
    settings.long_break_minutes = 1;
    settings.long_break_interval = interval;
    ASSERT_EQ(ESP_OK, context_.ApplyTimerSettings(settings));
  }

  std::optional<PhaseNotice> RunPhase() {
    std::optional<PhaseNotice> notice;
    for (uint32_t i = 0; i < config::kTicksPerMinute && !notice.has_value(); ++i) {
      notice = context_.Tick();
    }
    return notice;
  }

  uint32_t AddTask(const std::string& text, uint32_t estimate) {
    uint32_t id = 0;
    EXPECT_EQ(ESP_OK, context_.AddTask(text, estimate, &id));
    return id;
  }

  MemoryRecordStore store_;
  PomodoroContext context_{&store_};
};

}  // namespace

TEST_F(PomodoroContextTest, FirstBootWritesDefaults) {
  EXPECT_EQ(1, store_.loads);
  EXPECT_TRUE(store_.has_payload);
  const config::PersistedRecord record = store_.Decoded();
  EXPECT_EQ(25u, record.settings.focus_minutes);
  EXPECT_TRUE(record.tasks.empty());
  EXPECT_EQ(Phase::kIdle, context_.timer().phase());
  EXPECT_EQ(25u * 60u, context_.timer().PhaseDuration(Phase::kFocus));
}

TEST(PomodoroContextLoadTest, RestoresStoredRecord) {
  MemoryRecordStore store;
  config::PersistedRecord record;
  record.settings.focus_minutes = 40;
  record.settings.dark_mode = true;
  tasks::Task task;
  task.id = 9;
  task.text = "Saved task";
  task.estimated_pomodoros = 3;
  task.completed_pomodoros = 1;
  record.tasks.push_back(task);
  record.next_task_id = 10;
  ASSERT_EQ(ESP_OK, config::RecordCodec::Encode(record, &store.stored));
  store.has_payload = true;

  PomodoroContext context(&store);
  ASSERT_EQ(ESP_OK, context.Load());

  EXPECT_EQ(40u, context.settings().focus_minutes);
  EXPECT_TRUE(context.Snapshot().dark_mode);
  ASSERT_EQ(1u, context.ledger().size());
  EXPECT_EQ("Saved task", context.ledger().Find(9)->text);
  EXPECT_EQ(10u, context.ledger().next_id());
  EXPECT_EQ(40u * 60u, context.timer().PhaseDuration(Phase::kFocus));
  EXPECT_EQ(0, store.saves);
}

TEST(PomodoroContextLoadTest, CorruptRecordFallsBackToDefaultsAndIsRewritten) {
  MemoryRecordStore store;
  store.stored = "not json at all";
  store.has_payload = true;

  PomodoroContext context(&store);
  ASSERT_EQ(ESP_OK, context.Load());
  EXPECT_EQ(25u, context.settings().focus_minutes);
  EXPECT_TRUE(context.ledger().empty());
  EXPECT_EQ(1, store.saves);
  EXPECT_EQ(ESP_OK, context.TakePersistenceWarning());
}

TEST(PomodoroContextLoadTest, ReadFailureKeepsDefaultsAndRaisesWarning) {
  MemoryRecordStore store;
  store.load_error = ESP_FAIL;

  PomodoroContext context(&store);
  ASSERT_EQ(ESP_OK, context.Load());
  EXPECT_EQ(25u, context.settings().focus_minutes);
  EXPECT_EQ(0, store.saves);
  EXPECT_EQ(ESP_FAIL, context.TakePersistenceWarning());
  EXPECT_EQ(ESP_OK, context.TakePersistenceWarning());
}

TEST_F(PomodoroContextTest, LedgerMutationsAreWrittenThrough) {
  const int saves_before = store_.saves;
  const uint32_t id = AddTask("Write tests", 2);
  EXPECT_EQ(saves_before + 1, store_.saves);
  ASSERT_EQ(1u, store_.Decoded().tasks.size());

  ASSERT_EQ(ESP_OK, context_.EditTask(id, "Write more tests"));
  EXPECT_EQ("Write more tests", store_.Decoded().tasks[0].text);

  ASSERT_EQ(ESP_OK, context_.DeleteTask(id));
  EXPECT_TRUE(store_.Decoded().tasks.empty());
}

TEST_F(PomodoroContextTest, FailedMutationDoesNotWrite) {
  const int saves_before = store_.saves;
  EXPECT_EQ(ESP_ERR_NOT_FOUND, context_.DeleteTask(42));
  EXPECT_EQ(ESP_ERR_INVALID_ARG, context_.AddTask("   "));
  EXPECT_EQ(saves_before, store_.saves);
}

TEST_F(PomodoroContextTest, ActiveTaskIsNotPersisted) {
  const uint32_t id = AddTask("a", 2);
  const int saves_before = store_.saves;
  ASSERT_EQ(ESP_OK, context_.SetActiveTask(id));
  EXPECT_EQ(saves_before, store_.saves);
  EXPECT_EQ(id, context_.Snapshot().active_task);
}

TEST_F(PomodoroContextTest, FailedSaveKeepsMemoryStateAndRaisesWarning) {
  store_.save_error = ESP_ERR_NO_MEM;
  uint32_t id = 0;
  ASSERT_EQ(ESP_OK, context_.AddTask("kept in RAM", 1, &id));
  EXPECT_NE(nullptr, context_.ledger().Find(id));
  EXPECT_EQ(ESP_ERR_NO_MEM, context_.TakePersistenceWarning());
  EXPECT_EQ(ESP_OK, context_.TakePersistenceWarning());

  store_.save_error = ESP_OK;
  EXPECT_EQ(ESP_OK, context_.Flush());
  EXPECT_EQ(1u, store_.Decoded().tasks.size());
}

TEST_F(PomodoroContextTest, FocusCompletionCreditsActiveTaskOnce) {
  UseShortPhases();
  const uint32_t id = AddTask("focus work", 3);
  ASSERT_EQ(ESP_OK, context_.SetActiveTask(id));
  ASSERT_EQ(ESP_OK, context_.Start());

  const std::optional<PhaseNotice> notice = RunPhase();
  ASSERT_TRUE(notice.has_value());
  EXPECT_EQ(Phase::kFocus, notice->event.ended);
  EXPECT_EQ(Phase::kShortBreak, notice->event.next);
  EXPECT_EQ(id, notice->credited_task);
  EXPECT_EQ(1u, context_.ledger().Find(id)->completed_pomodoros);
  EXPECT_EQ(1u, store_.Decoded().tasks[0].completed_pomodoros);

  // The break waits for Start; its completion credits nothing
  EXPECT_FALSE(context_.timer().running());
  ASSERT_EQ(ESP_OK, context_.Start());
  const std::optional<PhaseNotice> break_notice = RunPhase();
  ASSERT_TRUE(break_notice.has_value());
  EXPECT_EQ(Phase::kShortBreak, break_notice->event.ended);
  EXPECT_FALSE(break_notice->credited_task.has_value());
  EXPECT_EQ(1u, context_.ledger().Find(id)->completed_pomodoros);
}

TEST_F(PomodoroContextTest, FocusCompletionWithoutActiveTaskCreditsNothing) {
  UseShortPhases();
  const uint32_t id = AddTask("idle task", 2);
  ASSERT_EQ(ESP_OK, context_.Start());
  const std::optional<PhaseNotice> notice = RunPhase();
  ASSERT_TRUE(notice.has_value());
  EXPECT_FALSE(notice->credited_task.has_value());
  EXPECT_EQ(0u, context_.ledger().Find(id)->completed_pomodoros);
}

TEST_F(PomodoroContextTest, SkippedFocusCreditsAndPauseDoesNot) {
  const uint32_t id = AddTask("skip me", 2);
  ASSERT_EQ(ESP_OK, context_.SetActiveTask(id));
  ASSERT_EQ(ESP_OK, context_.Start());
  for (int i = 0; i < 10; ++i) {
    context_.Tick();
  }
  ASSERT_EQ(ESP_OK, context_.Pause());
  EXPECT_EQ(0u, context_.ledger().Find(id)->completed_pomodoros);

  const std::optional<PhaseNotice> notice = context_.Skip();
  ASSERT_TRUE(notice.has_value());
  EXPECT_TRUE(notice->event.skipped);
  EXPECT_EQ(id, notice->credited_task);
  EXPECT_EQ(1u, context_.ledger().Find(id)->completed_pomodoros);
}

TEST_F(PomodoroContextTest, CreditReachingEstimateCompletesTask) {
  UseShortPhases();
  const uint32_t id = AddTask("one shot", 1);
  ASSERT_EQ(ESP_OK, context_.SetActiveTask(id));
  ASSERT_EQ(ESP_OK, context_.Start());
  ASSERT_TRUE(RunPhase().has_value());

  EXPECT_TRUE(context_.ledger().Find(id)->done);
  EXPECT_FALSE(context_.Snapshot().active_task.has_value());
  EXPECT_TRUE(store_.Decoded().tasks[0].done);
}

TEST_F(PomodoroContextTest, SkipWhileIdleDoesNothing) {
  EXPECT_FALSE(context_.Skip().has_value());
  EXPECT_EQ(Phase::kIdle, context_.timer().phase());
}

TEST_F(PomodoroContextTest, TogglePauseStartsPausesAndResumes) {
  ASSERT_EQ(ESP_OK, context_.TogglePause());
  EXPECT_EQ(Phase::kFocus, context_.timer().phase());
  EXPECT_TRUE(context_.timer().running());
  ASSERT_EQ(ESP_OK, context_.TogglePause());
  EXPECT_FALSE(context_.timer().running());
  ASSERT_EQ(ESP_OK, context_.TogglePause());
  EXPECT_TRUE(context_.timer().running());
}

TEST_F(PomodoroContextTest, ApplyTimerSettingsSelectsPausedFocusAndPersists) {
  ASSERT_EQ(ESP_OK, context_.Start());
  ASSERT_TRUE(context_.Skip().has_value());
  ASSERT_EQ(1u, context_.timer().sessions_completed());
  config::TimerSettings settings = context_.settings();
  settings.focus_minutes = 50;
  ASSERT_EQ(ESP_OK, context_.ApplyTimerSettings(settings));

  EXPECT_EQ(Phase::kFocus, context_.timer().phase());
  EXPECT_FALSE(context_.timer().running());
  EXPECT_EQ(50u * 60u, context_.timer().remaining_ticks());
  EXPECT_EQ(0u, context_.timer().sessions_completed());
  EXPECT_EQ(50u * 60u, context_.timer().PhaseDuration(Phase::kFocus));
  EXPECT_EQ(50u, store_.Decoded().settings.focus_minutes);
}

TEST_F(PomodoroContextTest, InvalidSettingsChangeNothing) {
  ASSERT_EQ(ESP_OK, context_.Start());
  const int saves_before = store_.saves;
  config::TimerSettings settings = context_.settings();
  settings.long_break_interval = 0;
  std::string error;
  EXPECT_EQ(ESP_ERR_INVALID_ARG, context_.ApplyTimerSettings(settings, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(4u, context_.settings().long_break_interval);
  EXPECT_EQ(Phase::kFocus, context_.timer().phase());
  EXPECT_TRUE(context_.timer().running());
  EXPECT_EQ(saves_before, store_.saves);
}

TEST_F(PomodoroContextTest, ThemeIsPersistedSeparatelyFromTimerSettings) {
  ASSERT_EQ(ESP_OK, context_.SetDarkMode(true));
  EXPECT_TRUE(store_.Decoded().settings.dark_mode);

  config::TimerSettings settings = context_.settings();
  settings.dark_mode = false;
  settings.short_break_minutes = 10;
  ASSERT_EQ(ESP_OK, context_.ApplyTimerSettings(settings));
  EXPECT_TRUE(context_.settings().dark_mode);
}

TEST_F(PomodoroContextTest, LongBreakAfterConfiguredInterval) {
  UseShortPhases(2);
  ASSERT_EQ(ESP_OK, context_.Start());

  std::optional<PhaseNotice> notice = RunPhase();
  ASSERT_TRUE(notice.has_value());
  EXPECT_EQ(Phase::kShortBreak, notice->event.next);
  ASSERT_EQ(ESP_OK, context_.Start());
  ASSERT_TRUE(RunPhase().has_value());

  ASSERT_EQ(ESP_OK, context_.Start());
  notice = RunPhase();
  ASSERT_TRUE(notice.has_value());
  EXPECT_EQ(Phase::kLongBreak, notice->event.next);
  EXPECT_EQ(0u, notice->event.sessions_completed);
}

TEST_F(PomodoroContextTest, TaskIndexFollowsLedgerChanges) {
  EXPECT_TRUE(context_.TaskIndex().empty());
  UseShortPhases();
  const uint32_t first = AddTask("first", 1);
  const uint32_t second = AddTask("second", 2);
  ASSERT_EQ(ESP_OK, context_.ReorderTask(second, 0));

  std::vector<app::TaskIndexEntry> index = context_.TaskIndex();
  ASSERT_EQ(2u, index.size());
  EXPECT_EQ(second, index[0].id);
  EXPECT_EQ(first, index[1].id);
  EXPECT_FALSE(index[1].done);

  // A credit that completes the task shows up without a ledger command
  ASSERT_EQ(ESP_OK, context_.SetActiveTask(first));
  ASSERT_EQ(ESP_OK, context_.Start());
  ASSERT_TRUE(RunPhase().has_value());
  index = context_.TaskIndex();
  ASSERT_EQ(2u, index.size());
  EXPECT_TRUE(index[1].done);

  ASSERT_EQ(ESP_OK, context_.DeleteTask(second));
  EXPECT_EQ(ESP_ERR_NOT_FOUND, context_.DeleteTask(second));
  index = context_.TaskIndex();
  ASSERT_EQ(1u, index.size());
  EXPECT_EQ(first, index[0].id);
}

TEST_F(PomodoroContextTest, TaskIndexIsRestoredOnLoad) {
  AddTask("persisted", 1);
  PomodoroContext reloaded(&store_);
  ASSERT_EQ(ESP_OK, reloaded.Load());
  ASSERT_EQ(1u, reloaded.TaskIndex().size());
  EXPECT_EQ(context_.ledger().tasks()[0].id, reloaded.TaskIndex()[0].id);
}
