#include <gtest/gtest.h>
#include <managers/instance_directory.hpp>
#include "fake_transport.hpp"
#include <fmt/format.h>
#include <atomic>
#include <thread>

static const char* INSTANCES_PATH = "/api/service/remote_service_instances";

static std::string overview(const std::vector<std::string>& node_ids) {
    std::string remote;
    for (size_t i = 0; i < node_ids.size(); ++i) {
        if (i > 0) remote += ",";
        remote += fmt::format(R"({{"uuid":"{0}","remarks":"node-{0}"}})", node_ids[i]);
    }
    return fmt::format(R"({{"status":200,"data":{{"remote":[{}]}}}})", remote);
}

static std::string instance(const std::string& id, const std::string& name, int status = 0) {
    return fmt::format(R"({{"instanceUuid":"{}","status":{},"config":{{"nickname":"{}"}}}})",
                       id, status, name);
}

class InstanceDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        fake = std::make_shared<FakeTransport>();
        PanelConfig panel;
        panel.url = "http://panel";
        panel.api_key = "k";
        client = std::make_unique<RemoteClient>(panel, RouteTable::for_layout("v10").value, fake);
        directory = std::make_unique<InstanceDirectory>(*client, 100);
    }

    // n1 answers a bare list, n2 the wrapped form
    void script_default_fleet() {
        fake->on_json("/api/overview", overview({"n1", "n2"}));
        fake->on(INSTANCES_PATH, [](const HttpRequest& req) {
            std::string node = FakeTransport::query_param(req.url, "daemonId");
            if (node == "n1") {
                return FakeTransport::json(200, R"({"status":200,"data":[)" +
                    instance("u1", "B", 3) + "," + instance("u2", "A") + "]}");
            }
            return FakeTransport::json(200, R"({"status":200,"data":{"page":1,"maxPage":1,"data":[)" +
                instance("u3", "A", 2) + "]}}");
        });
    }

    std::shared_ptr<FakeTransport> fake;
    std::unique_ptr<RemoteClient> client;
    std::unique_ptr<InstanceDirectory> directory;
};

// ── Refresh ──

TEST_F(InstanceDirectoryTest, EmptyBeforeFirstRefresh) {
    auto snap = directory->snapshot();
    ASSERT_NE(snap, nullptr);
    EXPECT_TRUE(snap->instances.empty());
    EXPECT_EQ(directory->resolve("1").status, ResolveOutcome::NOT_FOUND);
}

TEST_F(InstanceDirectoryTest, SortedByNameWithStableTies) {
    script_default_fleet();
    auto outcome = directory->refresh();
    ASSERT_TRUE(outcome.ok());

    const auto& inst = outcome.snapshot->instances;
    ASSERT_EQ(inst.size(), 3u);
    EXPECT_EQ(inst[0].unique_id, "u2");
    EXPECT_EQ(inst[1].unique_id, "u3");
    EXPECT_EQ(inst[2].unique_id, "u1");
    for (size_t i = 0; i < inst.size(); ++i) {
        EXPECT_EQ(inst[i].position, static_cast<int>(i + 1));
    }
    EXPECT_EQ(inst[1].node_id, "n2");
    EXPECT_EQ(inst[1].status, InstanceStatus::Starting);
}

TEST_F(InstanceDirectoryTest, IndicesExcludeSharedNames) {
    script_default_fleet();
    auto snap = directory->refresh().snapshot;

    EXPECT_EQ(snap->ambiguous_names, std::set<std::string>{"A"});
    EXPECT_EQ(snap->name_index.size(), 1u);
    EXPECT_EQ(snap->name_index.count("B"), 1u);
    EXPECT_EQ(snap->id_index.size(), 3u);
}

TEST_F(InstanceDirectoryTest, ListingUsesLayoutParams) {
    script_default_fleet();
    directory->refresh();

    auto listings = fake->sent_to(INSTANCES_PATH);
    ASSERT_EQ(listings.size(), 2u);
    EXPECT_EQ(FakeTransport::query_param(listings[0].url, "page"), "1");
    EXPECT_EQ(FakeTransport::query_param(listings[0].url, "page_size"), "100");
}

TEST_F(InstanceDirectoryTest, FailedNodeSkipped) {
    fake->on_json("/api/overview", overview({"n1", "n2"}));
    fake->on(INSTANCES_PATH, [](const HttpRequest& req) {
        if (FakeTransport::query_param(req.url, "daemonId") == "n1") {
            return FakeTransport::json(500, R"({"status":500,"data":"daemon offline"})");
        }
        return FakeTransport::json(200, R"({"status":200,"data":[)" + instance("u3", "C") + "]}");
    });

    auto outcome = directory->refresh();
    ASSERT_TRUE(outcome.ok());
    ASSERT_EQ(outcome.snapshot->instances.size(), 1u);
    EXPECT_EQ(outcome.snapshot->instances[0].unique_id, "u3");
    EXPECT_EQ(outcome.snapshot->skipped_nodes, std::vector<std::string>{"n1"});
    EXPECT_EQ(outcome.snapshot->nodes.size(), 2u);
}

TEST_F(InstanceDirectoryTest, UnrecognizedListingSkipsNode) {
    fake->on_json("/api/overview", overview({"n1"}));
    fake->on_json(INSTANCES_PATH, R"({"status":200,"data":{"items":[]}})");

    auto outcome = directory->refresh();
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.snapshot->instances.empty());
    EXPECT_EQ(outcome.snapshot->skipped_nodes.size(), 1u);
}

TEST_F(InstanceDirectoryTest, FollowsMaxPage) {
    fake->on_json("/api/overview", overview({"n1"}));
    fake->on(INSTANCES_PATH, [](const HttpRequest& req) {
        std::string page = FakeTransport::query_param(req.url, "page");
        std::string id = "u" + page;
        return FakeTransport::json(200, fmt::format(
            R"({{"status":200,"data":{{"page":{},"maxPage":3,"data":[{}]}}}})",
            page, instance(id, "I" + page)));
    });

    auto outcome = directory->refresh();
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.snapshot->instances.size(), 3u);
    EXPECT_EQ(fake->sent_to(INSTANCES_PATH).size(), 3u);
}

TEST_F(InstanceDirectoryTest, FailedLaterPageSkipsWholeNode) {
    fake->on_json("/api/overview", overview({"n1"}));
    fake->on(INSTANCES_PATH, [](const HttpRequest& req) {
        if (FakeTransport::query_param(req.url, "page") == "2") {
            return FakeTransport::failure(HttpResponse::READ_TIMEOUT, "timed out");
        }
        return FakeTransport::json(200, R"({"status":200,"data":{"page":1,"maxPage":2,"data":[)" +
                                        instance("u1", "A") + "]}}");
    });

    auto outcome = directory->refresh();
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.snapshot->instances.empty());
    EXPECT_EQ(outcome.snapshot->skipped_nodes.size(), 1u);
}

TEST_F(InstanceDirectoryTest, NoNodesKeepsHeldSnapshot) {
    script_default_fleet();
    ASSERT_TRUE(directory->refresh().ok());
    auto held = directory->snapshot();

    fake->on_json("/api/overview", R"({"status":200,"data":{"remote":[]}})");
    auto outcome = directory->refresh();
    EXPECT_EQ(outcome.status, RefreshOutcome::NO_NODES);
    EXPECT_EQ(directory->snapshot(), held);
}

TEST_F(InstanceDirectoryTest, NoNodesCarriesRemoteError) {
    fake->on_json("/api/overview", R"({"status":403,"data":"Permission denied"})", 403);
    auto outcome = directory->refresh();
    EXPECT_EQ(outcome.status, RefreshOutcome::NO_NODES);
    EXPECT_EQ(outcome.error, "Permission denied");
}

// ── Resolve ──

TEST_F(InstanceDirectoryTest, ResolveByPosition) {
    script_default_fleet();
    directory->refresh();

    auto r = directory->resolve(" 3 ");
    ASSERT_TRUE(r.found());
    EXPECT_EQ(r.ref.unique_id, "u1");
    EXPECT_EQ(r.ref.node_id, "n1");
    EXPECT_EQ(r.identifier, "3");
}

TEST_F(InstanceDirectoryTest, OutOfRangePositionsNotFound) {
    script_default_fleet();
    directory->refresh();

    EXPECT_EQ(directory->resolve("0").status, ResolveOutcome::NOT_FOUND);
    EXPECT_EQ(directory->resolve("4").status, ResolveOutcome::NOT_FOUND);
    EXPECT_EQ(directory->resolve("99999999999999999999").status, ResolveOutcome::NOT_FOUND);
}

TEST_F(InstanceDirectoryTest, ResolveByUniqueName) {
    script_default_fleet();
    directory->refresh();

    auto r = directory->resolve("B");
    ASSERT_TRUE(r.found());
    EXPECT_EQ(r.ref.unique_id, "u1");
}

TEST_F(InstanceDirectoryTest, SharedNameIsAmbiguousButIdsResolve) {
    script_default_fleet();
    directory->refresh();

    EXPECT_EQ(directory->resolve("A").status, ResolveOutcome::AMBIGUOUS);

    auto by_id = directory->resolve("u3");
    ASSERT_TRUE(by_id.found());
    EXPECT_EQ(by_id.ref.node_id, "n2");
}

TEST_F(InstanceDirectoryTest, UnknownAndEmptyNotFound) {
    script_default_fleet();
    directory->refresh();

    EXPECT_EQ(directory->resolve("nope").status, ResolveOutcome::NOT_FOUND);
    EXPECT_EQ(directory->resolve("   ").status, ResolveOutcome::NOT_FOUND);
}

TEST_F(InstanceDirectoryTest, NamesAreCaseSensitive) {
    script_default_fleet();
    directory->refresh();
    EXPECT_EQ(directory->resolve("b").status, ResolveOutcome::NOT_FOUND);
}

// ── Concurrency ──

// Refresh alternates between fleet "na" (2 instances) and fleet "nb"
// (3 instances). A reader must never see indices from one fleet over the
// instances of the other.
TEST_F(InstanceDirectoryTest, ReadersSeeWholeSnapshots) {
    std::atomic<int> overview_calls{0};
    fake->on("/api/overview", [&overview_calls](const HttpRequest&) {
        bool second = overview_calls.fetch_add(1) % 2 == 1;
        return FakeTransport::json(200, overview({second ? "nb" : "na"}));
    });
    fake->on(INSTANCES_PATH, [](const HttpRequest& req) {
        if (FakeTransport::query_param(req.url, "daemonId") == "na") {
            return FakeTransport::json(200, R"({"status":200,"data":[)" +
                instance("a1", "alpha") + "," + instance("a2", "apex") + "]}");
        }
        return FakeTransport::json(200, R"({"status":200,"data":[)" +
            instance("b1", "beta") + "," + instance("b2", "bravo") + "," +
            instance("b3", "brick") + "]}");
    });
    ASSERT_TRUE(directory->refresh().ok());

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> unresolved{0};

    std::thread writer([&]() {
        for (int i = 0; i < 200; ++i) {
            directory->refresh();
        }
        done = true;
    });

    std::thread reader([&]() {
        while (!done) {
            auto snap = directory->snapshot();
            if (snap->nodes.size() != 1) {
                ++torn;
                continue;
            }
            const std::string& node = snap->nodes[0].id;
            size_t expected = node == "na" ? 2 : 3;
            if (snap->instances.size() != expected ||
                snap->id_index.size() != expected ||
                snap->name_index.size() != expected) {
                ++torn;
                continue;
            }
            for (const auto& inst : snap->instances) {
                auto by_id = snap->id_index.find(inst.unique_id);
                auto by_name = snap->name_index.find(inst.name);
                if (inst.node_id != node || inst.unique_id[0] != node[1] ||
                    by_id == snap->id_index.end() || by_name == snap->name_index.end() ||
                    snap->instances[by_id->second].unique_id != inst.unique_id ||
                    snap->instances[by_name->second].name != inst.name) {
                    ++torn;
                }
            }

            auto first = directory->resolve("1");
            if (!first.found() || first.ref.unique_id[0] != first.ref.node_id[1]) {
                ++unresolved;
            }
        }
    });

    writer.join();
    reader.join();
    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(unresolved.load(), 0);
}

// ── Snapshot building ──

TEST(BuildSnapshot, DigitNameOnlyReachableById) {
    std::vector<InstanceInfo> collected = {
        {0, "7", "u-seven", "n1", InstanceStatus::Stopped},
    };
    auto snap = build_snapshot({{"n1", "Main"}}, collected);
    ASSERT_EQ(snap.instances.size(), 1u);
    EXPECT_EQ(snap.name_index.count("7"), 1u);
    EXPECT_NE(snap.find_instance("u-seven"), nullptr);
    EXPECT_NE(snap.find_node("n1"), nullptr);
    EXPECT_EQ(snap.find_node("n9"), nullptr);
}

TEST(BuildSnapshot, TiesKeepCollectedOrder) {
    std::vector<NodeInfo> nodes = {{"n1", "one"}, {"n2", "two"}};
    std::vector<InstanceInfo> collected = {
        {0, "B", "u1", "n1", InstanceStatus::Unknown},
        {0, "A", "u2", "n2", InstanceStatus::Unknown},
        {0, "A", "u3", "n1", InstanceStatus::Unknown},
    };
    auto snap = build_snapshot(nodes, collected);

    ASSERT_EQ(snap.instances.size(), 3u);
    EXPECT_EQ(snap.instances[0].unique_id, "u2");
    EXPECT_EQ(snap.instances[1].unique_id, "u3");
    EXPECT_EQ(snap.instances[2].unique_id, "u1");
    EXPECT_EQ(snap.instances[2].position, 3);
    EXPECT_EQ(snap.ambiguous_names, std::set<std::string>{"A"});
    ASSERT_EQ(snap.name_index.size(), 1u);
    EXPECT_EQ(snap.instances[snap.name_index.at("B")].unique_id, "u1");

    for (const auto& name : snap.ambiguous_names) {
        EXPECT_EQ(snap.name_index.count(name), 0u);
    }
    for (const auto& inst : snap.instances) {
        EXPECT_EQ(snap.id_index.count(inst.unique_id), 1u);
    }
}
