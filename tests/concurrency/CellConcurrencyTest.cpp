#include "Jail.h"
#include "common/TestUtils.h"
#include "mocks/FakeNodeManager.h"
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>

namespace JAIL {
namespace Test {

namespace {

/**
 * @brief Backend whose "block" method parks until released and which tracks overlap
 */
class BlockingRpcClient : public IRpcClient {
public:
    std::string call(const std::string &method, const json &params) override {
        int now = ++inFlight_;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {
        }

        if (method == "block") {
            blocked_.set_value();
            releaseSignal_.wait();
        } else if (method == "slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(Utils::getBaseDelay(20)));
        }

        --inFlight_;
        return params.empty() ? "null" : params[0].dump();
    }

    void waitUntilBlocked() {
        blockedSignal_.wait();
    }

    void release() {
        release_.set_value();
    }

    int getMaxInFlight() const {
        return maxInFlight_.load();
    }

private:
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
    std::promise<void> blocked_;
    std::shared_future<void> blockedSignal_{blocked_.get_future().share()};
    std::promise<void> release_;
    std::shared_future<void> releaseSignal_{release_.get_future().share()};
};

constexpr const char *BASE_SCRIPT = R"(
function call(path, args) {
    return _status_catalog[path].apply(null, JSON.parse(args));
}
)";

constexpr const char *CELL_SCRIPT = R"(
var _status_catalog = {
    rpc: function (method, tag) {
        return jeth.send({id: tag, method: method, params: [tag]}).result;
    },
    ping: function () { return 'pong'; }
};
)";

}  // namespace

class CellConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<BlockingRpcClient>();
        nodes_ = std::make_shared<FakeNodeManager>(client_);
    }

    std::unique_ptr<Jail> makeJail(std::chrono::milliseconds gateTimeout) {
        JailConfig config;
        config.gateTimeout = gateTimeout;
        return std::make_unique<Jail>(config, nodes_, BASE_SCRIPT);
    }

    std::shared_ptr<BlockingRpcClient> client_;
    std::shared_ptr<FakeNodeManager> nodes_;
};

TEST_F(CellConcurrencyTest, CallsIntoOneCellNeverOverlap) {
    auto jail = makeJail(std::chrono::seconds(30));
    ASSERT_EQ(jail->parse("shared", CELL_SCRIPT), R"({"result":{}})");

    std::vector<std::future<std::string>> results;
    for (int i = 0; i < 6; ++i) {
        results.push_back(std::async(std::launch::async, [&jail, i]() {
            return jail->call("shared", "rpc", R"(["slow", )" + std::to_string(i) + "]");
        }));
    }

    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(results[i].get(), R"({"result":)" + std::to_string(i) + "}");
    }
    EXPECT_EQ(client_->getMaxInFlight(), 1);
}

TEST_F(CellConcurrencyTest, BusyCellRejectsAfterBoundedWait) {
    auto jail = makeJail(Utils::SHORT_GATE_WAIT);
    ASSERT_EQ(jail->parse("shared", CELL_SCRIPT), R"({"result":{}})");

    auto blocked = std::async(std::launch::async, [&jail]() { return jail->call("shared", "rpc", R"(["block", 1])"); });
    client_->waitUntilBlocked();

    auto rejected = Utils::parse(jail->call("shared", "ping", "[]"));
    ASSERT_TRUE(rejected.contains("error"));
    EXPECT_NE(rejected["error"].get<std::string>().find("busy"), std::string::npos);

    client_->release();
    EXPECT_EQ(blocked.get(), R"({"result":1})");

    EXPECT_EQ(jail->call("shared", "ping", "[]"), R"({"result":"pong"})");
}

TEST_F(CellConcurrencyTest, BlockedCellDoesNotBlockOthers) {
    auto jail = makeJail(std::chrono::seconds(30));
    ASSERT_EQ(jail->parse("a", CELL_SCRIPT), R"({"result":{}})");
    ASSERT_EQ(jail->parse("b", CELL_SCRIPT), R"({"result":{}})");

    auto blocked = std::async(std::launch::async, [&jail]() { return jail->call("a", "rpc", R"(["block", 1])"); });
    client_->waitUntilBlocked();

    auto other = std::async(std::launch::async, [&jail]() { return jail->call("b", "ping", "[]"); });
    ASSERT_EQ(other.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(other.get(), R"({"result":"pong"})");

    // Re-bootstrapping another cell is not held up either
    EXPECT_EQ(jail->parse("c", CELL_SCRIPT), R"({"result":{}})");

    client_->release();
    EXPECT_EQ(blocked.get(), R"({"result":1})");
}

TEST_F(CellConcurrencyTest, ConcurrentBootstrapOfDistinctCells) {
    auto jail = makeJail(std::chrono::seconds(30));

    std::vector<std::future<std::string>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(std::async(std::launch::async, [&jail, i]() {
            return jail->parse("cell-" + std::to_string(i), CELL_SCRIPT);
        }));
    }
    for (auto &result : results) {
        EXPECT_EQ(result.get(), R"({"result":{}})");
    }

    EXPECT_EQ(jail->getCellIds().size(), 8u);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(jail->call("cell-" + std::to_string(i), "ping", "[]"), R"({"result":"pong"})");
    }
}

TEST_F(CellConcurrencyTest, CallDuringBootstrapWaitsForFinishedCell) {
    auto jail = makeJail(std::chrono::seconds(30));

    auto bootstrap = std::async(std::launch::async, [&jail]() {
        return jail->parse("fresh", R"(
            var tag = jeth.send({id: 1, method: 'block', params: [3]}).result;
            var _status_catalog = {tag: function () { return tag; }};
        )");
    });
    client_->waitUntilBlocked();
    ASSERT_TRUE(jail->hasCell("fresh"));

    auto early = std::async(std::launch::async, [&jail]() { return jail->call("fresh", "tag", "[]"); });
    EXPECT_EQ(early.wait_for(std::chrono::milliseconds(Utils::getBaseDelay(50))), std::future_status::timeout);

    client_->release();
    EXPECT_EQ(bootstrap.get(), R"({"result":{}})");
    EXPECT_EQ(early.get(), R"({"result":3})");
}

TEST_F(CellConcurrencyTest, ReplacedCellFinishesInFlightCall) {
    auto jail = makeJail(std::chrono::seconds(30));
    ASSERT_EQ(jail->parse("chat", CELL_SCRIPT), R"({"result":{}})");

    auto blocked = std::async(std::launch::async, [&jail]() { return jail->call("chat", "rpc", R"(["block", 7])"); });
    client_->waitUntilBlocked();

    EXPECT_EQ(jail->parse("chat", CELL_SCRIPT), R"({"result":{}})");

    client_->release();
    EXPECT_EQ(blocked.get(), R"({"result":7})");
    EXPECT_EQ(jail->call("chat", "ping", "[]"), R"({"result":"pong"})");
}

}  // namespace Test
}  // namespace JAIL
