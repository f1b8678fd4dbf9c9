/**
 * Unit tests for the requirements store and the simulated cluster
 */

#include "reconcile/reconciliation_engine.h"
#include "reconcile/requirements_store.h"
#include "reconcile/simulated_cluster.h"
#include "test_fakes.h"
#include <gtest/gtest.h>
#include <atomic>
#include <cstdio>
#include <fstream>

using namespace autoscale::reconcile;
using namespace autoscale::testing;

// ============================================================================
// RequirementsStore
// ============================================================================

class RequirementsStoreTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
    }

    std::string temp_path() {
        path_ = ::testing::TempDir() + "autoscale_requirements_test.json";
        return path_;
    }

    RequirementsStore store_;
    std::string path_;
};

TEST_F(RequirementsStoreTest, ReturnsCopyOfCurrentDocument) {
    store_.set_requirements({ProfileRequirement("web", 2)});

    auto document = store_.get_requirements();
    document.add_or_replace(ProfileRequirement("db", 1));

    EXPECT_EQ(store_.get_requirements().size(), 1u);
    EXPECT_EQ(store_.generation(), 1u);
}

TEST_F(RequirementsStoreTest, NotifiesTrackedCallbacks) {
    std::atomic<int> calls{0};
    auto callback = std::make_shared<std::function<void()>>([&]() { ++calls; });
    store_.track_configuration(callback);
    store_.track_configuration(callback);
    EXPECT_EQ(store_.tracked_count(), 1u);

    store_.set_requirements({ProfileRequirement("web", 2)});

    EXPECT_TRUE(wait_until([&]() { return calls.load() >= 1; }));
    store_.untrack_configuration(callback);
    EXPECT_EQ(store_.tracked_count(), 0u);
}

TEST_F(RequirementsStoreTest, UntrackedCallbackIsNotCalled) {
    std::atomic<int> calls{0};
    auto callback = std::make_shared<std::function<void()>>([&]() { ++calls; });
    store_.track_configuration(callback);
    store_.untrack_configuration(callback);

    store_.set_requirements({ProfileRequirement("web", 2)});
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_EQ(calls.load(), 0);
}

TEST_F(RequirementsStoreTest, ThrowingCallbackDoesNotStopOthers) {
    std::atomic<int> calls{0};
    auto failing = std::make_shared<std::function<void()>>(
        []() { throw std::runtime_error("listener broke"); });
    auto counting =
        std::make_shared<std::function<void()>>([&]() { ++calls; });
    store_.track_configuration(failing);
    store_.track_configuration(counting);

    store_.set_requirements({ProfileRequirement("web", 2)});

    EXPECT_TRUE(wait_until([&]() { return calls.load() >= 1; }));
}

TEST_F(RequirementsStoreTest, SavesAndLoadsFile) {
    store_.set_requirements(
        {ProfileRequirement("web", 3, {"db"}), ProfileRequirement("db", 1)});
    auto path = temp_path();

    ASSERT_TRUE(store_.save_file(path).is_ok());

    RequirementsStore loaded;
    auto result = loaded.load_file(path);
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(loaded.get_requirements(), store_.get_requirements());
}

TEST_F(RequirementsStoreTest, LoadFailureKeepsDocument) {
    store_.set_requirements({ProfileRequirement("web", 2)});
    auto path = temp_path();
    {
        std::ofstream file(path);
        file << R"({"profileRequirements": [{"profile": "web", "minimumInstances": -2}]})";
    }

    auto result = store_.load_file(path);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(store_.get_requirements().find("web")->minimum_instances, 2);
    EXPECT_TRUE(store_.load_file("/nonexistent/requirements.json").is_err());
}

// ============================================================================
// SimulatedCluster
// ============================================================================

class SimulatedClusterTest : public ::testing::Test {
protected:
    std::shared_ptr<RequirementsStore> store_ =
        std::make_shared<RequirementsStore>();
    std::shared_ptr<SimulatedCluster> cluster_ =
        std::make_shared<SimulatedCluster>(store_, "3.0");
    ReconciliationEngine engine_;

    ReconciliationReport pass() {
        return engine_.run(cluster_->get_requirements(), *cluster_, *cluster_,
                           *cluster_);
    }
};

TEST_F(SimulatedClusterTest, ScaleUpProvisionsPendingInstances) {
    store_->set_requirements({ProfileRequirement("web", 2)});

    auto report = pass();

    EXPECT_EQ(report.scale_up_commands, 1u);
    auto instances = cluster_->containers_for_profile("web");
    ASSERT_EQ(instances.size(), 2u);
    EXPECT_TRUE(instances[0].provisioning_pending);
    EXPECT_FALSE(instances[0].alive);

    // Pending instances count, so a second pass is idle
    EXPECT_EQ(pass().commands_issued(), 0u);

    EXPECT_EQ(cluster_->settle(), 2u);
    EXPECT_TRUE(cluster_->containers_for_profile("web")[0].alive);
}

TEST_F(SimulatedClusterTest, DependencyChainConvergesOverPasses) {
    store_->set_requirements(
        {ProfileRequirement("web", 3, {"db"}), ProfileRequirement("db", 1)});
    cluster_->add_instance("web", true, false);

    auto first = pass();
    EXPECT_EQ(first.find("web")->outcome, ProfileOutcome::GATED);
    EXPECT_EQ(cluster_->countable_count("db"), 1u);

    auto second = pass();
    EXPECT_EQ(second.find("web")->outcome, ProfileOutcome::SCALED_UP);
    EXPECT_EQ(cluster_->countable_count("web"), 3u);
}

TEST_F(SimulatedClusterTest, ScaleDownPrefersPendingThenNewest) {
    auto oldest = cluster_->add_instance("web", true, false);
    cluster_->add_instance("web", true, false);
    cluster_->add_instance("web", false, true);
    store_->set_requirements({ProfileRequirement("web", 1)});

    pass();

    auto remaining = cluster_->containers_for_profile("web");
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, oldest);
}

TEST_F(SimulatedClusterTest, FailedInstancesAreReplaced) {
    store_->set_requirements({ProfileRequirement("web", 2)});
    auto a = cluster_->add_instance("web", true, false);
    cluster_->add_instance("web", true, false);
    ASSERT_TRUE(cluster_->fail_instance(a));
    EXPECT_FALSE(cluster_->fail_instance("missing"));

    auto report = pass();

    EXPECT_EQ(report.find("web")->observed, 1);
    EXPECT_EQ(report.find("web")->outcome, ProfileOutcome::SCALED_UP);
    cluster_->settle();
    EXPECT_EQ(cluster_->countable_count("web"), 2u);
    EXPECT_EQ(cluster_->all_instances().size(), 2u);
}

TEST_F(SimulatedClusterTest, UnscalableProfileHasNoAutoscaler) {
    store_->set_requirements({ProfileRequirement("legacy", 1)});
    cluster_->set_unscalable("legacy", true);

    auto report = pass();

    EXPECT_EQ(report.find("legacy")->outcome, ProfileOutcome::NO_AUTOSCALER);
    EXPECT_TRUE(cluster_->all_instances().empty());
}

TEST_F(SimulatedClusterTest, DefaultVersionCanChange) {
    EXPECT_EQ(cluster_->get_default_version_id(), "3.0");
    cluster_->set_default_version_id("3.1");

    EXPECT_EQ(cluster_->get_default_version_id(), "3.1");
}
