#include <gtest/gtest.h>
#include "job_table.hpp"

namespace thumbgrid {

class JobTableTest : public ::testing::Test {
protected:
    JobTable table_;
};

TEST_F(JobTableTest, AddKeepsInsertionOrder) {
    JobId a = table_.add("a.mp4");
    JobId b = table_.add("b.mov");
    JobId c = table_.add("c.m4v");

    auto jobs = table_.jobs();
    ASSERT_EQ(jobs.size(), 3u);
    EXPECT_EQ(jobs[0].source_path, "a.mp4");
    EXPECT_EQ(jobs[1].source_path, "b.mov");
    EXPECT_EQ(jobs[2].source_path, "c.m4v");
    EXPECT_TRUE(jobs[1].id == b);

    const VideoJob* found = table_.find(c);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->state, JobState::Queued);
    EXPECT_EQ(found->status, "Queued");
    EXPECT_DOUBLE_EQ(found->progress, 0.0);
    EXPECT_FALSE(found->is_complete());
    EXPECT_TRUE(a != c);
}

TEST_F(JobTableTest, StaleHandleDoesNotAliasReusedSlot) {
    JobId old_id = table_.add("old.mp4");
    ASSERT_TRUE(table_.remove(old_id));
    EXPECT_EQ(table_.find(old_id), nullptr);
    EXPECT_FALSE(table_.remove(old_id));

    JobId new_id = table_.add("new.mp4");
    EXPECT_EQ(new_id.index, old_id.index);
    EXPECT_NE(new_id.generation, old_id.generation);
    EXPECT_EQ(table_.find(old_id), nullptr);
    ASSERT_NE(table_.find(new_id), nullptr);
    EXPECT_EQ(table_.find(new_id)->source_path, "new.mp4");
}

TEST_F(JobTableTest, ClearCompletedRemovesTerminalJobsOnly) {
    JobId done = table_.add("done.mp4");
    JobId cancelled = table_.add("cancelled.mp4");
    JobId failed = table_.add("failed.mp4");
    JobId running = table_.add("running.mp4");
    JobId queued = table_.add("queued.mp4");

    table_.find(done)->state = JobState::Complete;
    table_.find(cancelled)->state = JobState::Cancelled;
    table_.find(failed)->state = JobState::Failed;
    table_.find(running)->state = JobState::Extracting;

    EXPECT_EQ(table_.clear_completed(), 3u);
    ASSERT_EQ(table_.size(), 2u);
    EXPECT_TRUE(table_.order()[0] == running);
    EXPECT_TRUE(table_.order()[1] == queued);
    EXPECT_EQ(table_.find(done), nullptr);
}

TEST_F(JobTableTest, ClearInvalidatesEveryHandle) {
    JobId a = table_.add("a.mp4");
    JobId b = table_.add("b.mp4");

    table_.clear();
    EXPECT_TRUE(table_.empty());
    EXPECT_EQ(table_.find(a), nullptr);
    EXPECT_EQ(table_.find(b), nullptr);

    JobId c = table_.add("c.mp4");
    EXPECT_NE(table_.find(c), nullptr);
    EXPECT_EQ(table_.size(), 1u);
}

TEST_F(JobTableTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(JobState::Queued));
    EXPECT_FALSE(is_terminal(JobState::Loading));
    EXPECT_FALSE(is_terminal(JobState::Extracting));
    EXPECT_FALSE(is_terminal(JobState::Selecting));
    EXPECT_FALSE(is_terminal(JobState::Composing));
    EXPECT_TRUE(is_terminal(JobState::Complete));
    EXPECT_TRUE(is_terminal(JobState::Cancelled));
    EXPECT_TRUE(is_terminal(JobState::Failed));

    EXPECT_EQ(to_string(JobState::Selecting), "Selecting");
    EXPECT_EQ(to_string(JobState::Failed), "Failed");
}

} // namespace thumbgrid
