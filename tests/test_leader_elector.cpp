/**
 * Unit tests for master election on top of a coordination group
 */

#include "cluster/leader_elector.h"
#include "cluster/local_coordination.h"
#include "test_fakes.h"
#include <gtest/gtest.h>
#include <mutex>
#include <vector>

using namespace autoscale::cluster;
using namespace autoscale::testing;

namespace {

class RecordingLeadershipListener : public ILeadershipListener {
public:
    void membership_event(MembershipEvent event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<MembershipEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<MembershipEvent> events_;
};

// Group that can be driven by hand and throws once closed
class ScriptedGroup : public Group {
public:
    void add(std::weak_ptr<IGroupListener> listener) override {
        listener_ = std::move(listener);
    }
    void remove(const std::shared_ptr<IGroupListener> &) override {
        listener_.reset();
    }
    void update(const MembershipState &state) override {
        if (stale) {
            throw StaleGroupStateError("membership torn down");
        }
        ++updates;
        last_state = state;
    }
    bool is_master() const override { return master; }
    void start() override { started = true; }
    void close() override { closed = true; }
    const std::string &id() const override { return id_; }

    void emit(GroupEvent event) {
        if (auto listener = listener_.lock()) {
            listener->group_event(*this, event);
        }
    }

    bool has_listener() const { return !listener_.expired(); }

    bool master = false;
    bool stale = false;
    bool started = false;
    bool closed = false;
    int updates = 0;
    MembershipState last_state;

private:
    std::string id_ = "/autoscale/controllers/autoscaler-0";
    std::weak_ptr<IGroupListener> listener_;
};

class ScriptedCoordination : public CoordinationService {
public:
    std::shared_ptr<Group> join(const std::string &group_path,
                                const std::string &node_type) override {
        joined_path = group_path;
        joined_type = node_type;
        return group;
    }

    std::shared_ptr<ScriptedGroup> group = std::make_shared<ScriptedGroup>();
    std::string joined_path;
    std::string joined_type;
};

} // namespace

// ============================================================================
// Against a scripted group
// ============================================================================

class LeaderElectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        LeaderElectorConfig config;
        config.group_path = "/autoscale/controllers";
        config.node_type = "autoscaler";
        config.node_id = "node-a";
        elector_ = std::make_shared<LeaderElector>(coordination_, config);
        elector_->set_listener(listener_);
    }

    void TearDown() override {
        if (elector_) {
            elector_->deactivate();
        }
    }

    std::shared_ptr<ScriptedCoordination> coordination_ =
        std::make_shared<ScriptedCoordination>();
    std::shared_ptr<RecordingLeadershipListener> listener_ =
        std::make_shared<RecordingLeadershipListener>();
    std::shared_ptr<LeaderElector> elector_;
};

TEST_F(LeaderElectorTest, ActivateJoinsPublishesAndStarts) {
    elector_->activate();

    auto &group = *coordination_->group;
    EXPECT_EQ(coordination_->joined_path, "/autoscale/controllers");
    EXPECT_EQ(coordination_->joined_type, "autoscaler");
    EXPECT_TRUE(group.started);
    EXPECT_EQ(group.updates, 1);
    EXPECT_EQ(group.last_state.node_id, "node-a");
    EXPECT_TRUE(elector_->is_active());
    EXPECT_EQ(elector_->member_id(), group.id());
}

TEST_F(LeaderElectorTest, ForwardsEventsInOrder) {
    elector_->activate();
    auto &group = *coordination_->group;

    group.emit(GroupEvent::CONNECTED);
    group.emit(GroupEvent::CHANGED);
    group.emit(GroupEvent::DISCONNECTED);

    EXPECT_EQ(listener_->events(),
              (std::vector<MembershipEvent>{MembershipEvent::JOINED,
                                            MembershipEvent::CHANGED,
                                            MembershipEvent::DISCONNECTED}));
}

TEST_F(LeaderElectorTest, NotMasterUntilConnected) {
    elector_->activate();
    auto &group = *coordination_->group;
    group.master = true;

    EXPECT_FALSE(elector_->is_master());
    group.emit(GroupEvent::CONNECTED);
    EXPECT_TRUE(elector_->is_master());
    group.emit(GroupEvent::DISCONNECTED);
    EXPECT_FALSE(elector_->is_master());
}

TEST_F(LeaderElectorTest, RepublishSwallowsStaleState) {
    elector_->activate();
    auto &group = *coordination_->group;

    EXPECT_TRUE(elector_->republish_state());
    group.stale = true;
    EXPECT_FALSE(elector_->republish_state());
    EXPECT_EQ(group.updates, 2);
}

TEST_F(LeaderElectorTest, DeactivateClosesGroup) {
    elector_->activate();
    auto group = coordination_->group;
    group->emit(GroupEvent::CONNECTED);

    elector_->deactivate();

    EXPECT_TRUE(group->closed);
    EXPECT_FALSE(elector_->is_active());
    EXPECT_FALSE(elector_->is_master());
    EXPECT_FALSE(elector_->republish_state());
}

TEST_F(LeaderElectorTest, ExpiredListenerIsSkipped) {
    elector_->activate();
    listener_.reset();

    EXPECT_NO_THROW(coordination_->group->emit(GroupEvent::CHANGED));
}

TEST_F(LeaderElectorTest, DroppingActiveElectorClosesGroup) {
    elector_->activate();
    auto group = coordination_->group;
    std::weak_ptr<LeaderElector> watched = elector_;

    elector_.reset();

    EXPECT_TRUE(watched.expired());
    EXPECT_TRUE(group->closed);
    EXPECT_FALSE(group->has_listener());
}

// ============================================================================
// Against the local coordination service
// ============================================================================

TEST(LeaderElectorElectionTest, ExactlyOneMasterAcrossFailover) {
    auto service = std::make_shared<LocalCoordinationService>();
    auto listener_a = std::make_shared<RecordingLeadershipListener>();
    auto listener_b = std::make_shared<RecordingLeadershipListener>();

    LeaderElectorConfig config_a;
    config_a.node_id = "a";
    LeaderElectorConfig config_b;
    config_b.node_id = "b";
    auto a = std::make_shared<LeaderElector>(service, config_a);
    auto b = std::make_shared<LeaderElector>(service, config_b);
    a->set_listener(listener_a);
    b->set_listener(listener_b);

    a->activate();
    b->activate();
    ASSERT_TRUE(wait_until([&]() {
        return listener_a->count() >= 2 && listener_b->count() >= 1;
    }));

    EXPECT_TRUE(a->is_master());
    EXPECT_FALSE(b->is_master());
    EXPECT_EQ(listener_a->events().front(), MembershipEvent::JOINED);

    a->deactivate();
    ASSERT_TRUE(wait_until([&]() { return listener_b->count() >= 2; }));
    EXPECT_TRUE(b->is_master());
    EXPECT_FALSE(a->is_master());
    EXPECT_EQ(listener_b->events().back(), MembershipEvent::CHANGED);

    b->deactivate();
}

TEST(LeaderElectorElectionTest, DroppingActiveElectorLeavesGroup) {
    auto service = std::make_shared<LocalCoordinationService>();
    auto listener_a = std::make_shared<RecordingLeadershipListener>();
    auto listener_b = std::make_shared<RecordingLeadershipListener>();

    LeaderElectorConfig config;
    auto a = std::make_shared<LeaderElector>(service, config);
    auto b = std::make_shared<LeaderElector>(service, config);
    a->set_listener(listener_a);
    b->set_listener(listener_b);
    a->activate();
    b->activate();
    ASSERT_TRUE(wait_until([&]() { return listener_a->count() >= 2; }));
    std::weak_ptr<LeaderElector> watched = a;

    a.reset();

    // The dispatcher may still hold the elector for an in-flight event
    ASSERT_TRUE(wait_until([&]() { return watched.expired(); }));
    ASSERT_TRUE(wait_until([&]() {
        return service->members_of(config.group_path).size() == 1u;
    }));
    EXPECT_TRUE(wait_until([&]() { return b->is_master(); }));

    b->deactivate();
}

TEST(MembershipEventTest, Names) {
    EXPECT_STREQ(membership_event_to_string(MembershipEvent::JOINED), "JOINED");
    EXPECT_STREQ(membership_event_to_string(MembershipEvent::CHANGED),
                 "CHANGED");
}
