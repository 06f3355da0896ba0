#include "Jail.h"
#include "common/JailError.h"
#include "common/TestUtils.h"
#include "mocks/FakeNodeManager.h"
#include "mocks/MockRpcClient.h"
#include "node/RequestContextHooks.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace JAIL {
namespace Test {

namespace {

// Stand-in for the base library: dispatches call(path, args) into the catalog
constexpr const char *BASE_SCRIPT = R"(
function call(path, args) {
    var fn = _status_catalog[path];
    if (typeof fn !== 'function') {
        throw new Error('unknown command: ' + path);
    }
    return fn.apply(null, JSON.parse(args));
}
)";

constexpr const char *PING_SCRIPT = R"(var _status_catalog = {ping: function(){return "pong"}};)";

}  // namespace

class JailTest : public ::testing::Test {
protected:
    void SetUp() override {
        Jail::reset();
        client_ = std::make_shared<::testing::NiceMock<MockRpcClient>>();
        nodes_ = std::make_shared<FakeNodeManager>(client_);
        jail_ = std::make_unique<Jail>(JailConfig{}, nodes_, BASE_SCRIPT);
    }

    void TearDown() override {
        jail_.reset();
        Jail::reset();
    }

    std::shared_ptr<::testing::NiceMock<MockRpcClient>> client_;
    std::shared_ptr<FakeNodeManager> nodes_;
    std::unique_ptr<Jail> jail_;
};

TEST_F(JailTest, PingExample) {
    EXPECT_EQ(jail_->parse("chat-1", PING_SCRIPT), R"({"result":{}})");
    EXPECT_EQ(jail_->call("chat-1", "ping", "[]"), R"({"result":"pong"})");
}

TEST_F(JailTest, ParseReturnsCatalogJson) {
    auto envelope = Utils::parse(jail_->parse("chat-1", R"(
        var _status_catalog = {commands: {send: {title: "Send"}}, version: 2};
    )"));
    EXPECT_EQ(envelope["result"]["commands"]["send"]["title"], "Send");
    EXPECT_EQ(envelope["result"]["version"], 2);
}

TEST_F(JailTest, BootstrapInstallsBridgeAndHelpers) {
    ASSERT_EQ(jail_->parse("chat-1", R"(
        var _status_catalog = {
            send: typeof jeth.send,
            sendAsync: typeof jeth.sendAsync,
            bn: typeof bn
        };
    )"),
              R"({"result":{"bn":"function","send":"function","sendAsync":"function"}})");
}

TEST_F(JailTest, BaseScriptRunsBeforeCellScript) {
    jail_->setBaseScript(std::string(BASE_SCRIPT) + "var greeting = 'hi';");
    EXPECT_EQ(jail_->parse("chat-1", "var _status_catalog = {greeting: greeting};"),
              R"({"result":{"greeting":"hi"}})");
}

TEST_F(JailTest, BaseScriptFailureIsReported) {
    jail_->setBaseScript("this is not javascript");
    auto envelope = Utils::parse(jail_->parse("chat-1", PING_SCRIPT));
    ASSERT_TRUE(envelope.contains("error"));
    EXPECT_NE(envelope["error"].get<std::string>().find("SyntaxError"), std::string::npos);
}

TEST_F(JailTest, ScriptFailureIsReported) {
    auto envelope = Utils::parse(jail_->parse("chat-1", "throw new Error('bad script');"));
    ASSERT_TRUE(envelope.contains("error"));
    EXPECT_NE(envelope["error"].get<std::string>().find("bad script"), std::string::npos);
}

TEST_F(JailTest, MissingCatalogIsReported) {
    auto envelope = Utils::parse(jail_->parse("chat-1", "var unrelated = 1;"));
    ASSERT_TRUE(envelope.contains("error"));
    EXPECT_NE(envelope["error"].get<std::string>().find("_status_catalog"), std::string::npos);
}

TEST_F(JailTest, UndefinedCatalogIsNull) {
    EXPECT_EQ(jail_->parse("chat-1", "var _status_catalog;"), R"({"result":null})");
}

TEST_F(JailTest, CallUnknownCellFailsWithoutCreatingIt) {
    EXPECT_EQ(jail_->call("ghost", "ping", "[]"), R"({"error":"Cell[ghost] doesn't exist."})");
    EXPECT_FALSE(jail_->hasCell("ghost"));
    EXPECT_TRUE(jail_->getCellIds().empty());
}

TEST_F(JailTest, CallFailsFastWhenNodeIsDown) {
    ASSERT_EQ(jail_->parse("chat-1", PING_SCRIPT), R"({"result":{}})");
    nodes_->setRunning(false);

    EXPECT_EQ(jail_->call("chat-1", "ping", "[]"), R"({"error":"node is not running"})");
}

TEST_F(JailTest, ClientResolutionIsCachedButFailuresAreRetried) {
    ASSERT_EQ(jail_->parse("chat-1", PING_SCRIPT), R"({"result":{}})");

    nodes_->setRunning(false);
    EXPECT_NE(jail_->call("chat-1", "ping", "[]").find("error"), std::string::npos);

    nodes_->setRunning(true);
    EXPECT_EQ(jail_->call("chat-1", "ping", "[]"), R"({"result":"pong"})");
    EXPECT_EQ(jail_->call("chat-1", "ping", "[]"), R"({"result":"pong"})");
    EXPECT_EQ(nodes_->getClientResolutions(), 1);

    // Cached handle outlives node availability checks
    nodes_->setRunning(false);
    EXPECT_EQ(jail_->call("chat-1", "ping", "[]"), R"({"result":"pong"})");
}

TEST_F(JailTest, ReBootstrapDiscardsPreviousState) {
    ASSERT_EQ(jail_->parse("chat-1", R"(
        var leftover = 'old';
        var _status_catalog = {probe: function () { return typeof leftover === 'undefined' ? 'gone' : 'kept'; }};
    )"),
              R"({"result":{}})");
    EXPECT_EQ(jail_->call("chat-1", "probe", "[]"), R"({"result":"kept"})");
    auto before = jail_->getCell("chat-1");

    ASSERT_EQ(jail_->parse("chat-1", R"(
        var _status_catalog = {probe: function () { return typeof leftover === 'undefined' ? 'gone' : 'kept'; }};
    )"),
              R"({"result":{}})");
    EXPECT_EQ(jail_->call("chat-1", "probe", "[]"), R"({"result":"gone"})");
    EXPECT_NE(jail_->getCell("chat-1"), before);
    EXPECT_EQ(jail_->getCellIds().size(), 1u);
}

TEST_F(JailTest, UndefinedCallResultIsNull) {
    ASSERT_EQ(jail_->parse("chat-1", R"(
        var _status_catalog = {nothing: function () {}, literal: function () { return 'undefined'; }};
    )"),
              R"({"result":{}})");
    EXPECT_EQ(jail_->call("chat-1", "nothing", "[]"), R"({"result":null})");
    EXPECT_EQ(jail_->call("chat-1", "literal", "[]"), R"({"result":null})");
}

TEST_F(JailTest, CallArgumentsArePassedThrough) {
    ASSERT_EQ(jail_->parse("chat-1", "var _status_catalog = {add: function (a, b) { return a + b; }};"),
              R"({"result":{}})");
    EXPECT_EQ(jail_->call("chat-1", "add", "[2, 40]"), R"({"result":42})");
}

TEST_F(JailTest, StringResultIsTreatedAsJsonText) {
    ASSERT_EQ(jail_->parse("chat-1", R"(
        var _status_catalog = {render: function () { return JSON.stringify({markup: ['text', {}, 'hi']}); }};
    )"),
              R"({"result":{}})");
    EXPECT_EQ(jail_->call("chat-1", "render", "[]"), R"({"result":{"markup":["text",{},"hi"]}})");
}

TEST_F(JailTest, ScriptExceptionsBecomeErrorEnvelope) {
    ASSERT_EQ(jail_->parse("chat-1", PING_SCRIPT), R"({"result":{}})");

    auto envelope = Utils::parse(jail_->call("chat-1", "missing", "[]"));
    ASSERT_TRUE(envelope.contains("error"));
    EXPECT_NE(envelope["error"].get<std::string>().find("unknown command: missing"), std::string::npos);
}

TEST_F(JailTest, CellWithoutCallEntryPointReportsError) {
    jail_->setBaseScript("");
    ASSERT_EQ(jail_->parse("chat-1", PING_SCRIPT), R"({"result":{}})");

    auto envelope = Utils::parse(jail_->call("chat-1", "ping", "[]"));
    ASSERT_TRUE(envelope.contains("error"));
    EXPECT_NE(envelope["error"].get<std::string>().find("call"), std::string::npos);
}

TEST_F(JailTest, BatchExample) {
    EXPECT_CALL(*client_, call("eth_blockNumber", json::array())).WillOnce(Return(R"("0x4b7")"));
    EXPECT_CALL(*client_, call("bogus_method", json::array()))
        .WillOnce(Throw(RpcError(-32601, "the method bogus_method does not exist/is not available")));

    ASSERT_EQ(jail_->parse("chat-1", R"(
        var _status_catalog = {
            batch: function () {
                return jeth.send([{"id":1,"method":"eth_blockNumber","params":[]},
                                  {"id":2,"method":"bogus_method","params":[]}]);
            }
        };
    )"),
              R"({"result":{}})");

    auto envelope = Utils::parse(jail_->call("chat-1", "batch", "[]"));
    const auto &responses = envelope["result"];
    ASSERT_TRUE(responses.is_array());
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["result"], "0x4b7");
    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[1]["error"]["code"], -32601);
}

TEST_F(JailTest, NullBackendResultReachesScriptAsNull) {
    EXPECT_CALL(*client_, call("eth_getTransactionReceipt", _)).WillOnce(Return("null"));

    ASSERT_EQ(jail_->parse("chat-1", R"(
        var _status_catalog = {
            receipt: function (hash) {
                var r = jeth.send({id: 11, method: 'eth_getTransactionReceipt', params: [hash]});
                return r.result === null ? 'native-null' : typeof r.result;
            }
        };
    )"),
              R"({"result":{}})");

    EXPECT_EQ(jail_->call("chat-1", "receipt", R"(["0xabc"])"), R"({"result":"native-null"})");
}

TEST_F(JailTest, ScriptCanIssueRpcDuringBootstrap) {
    EXPECT_CALL(*client_, call("net_version", _)).WillOnce(Return(R"("1")"));

    EXPECT_EQ(jail_->parse("chat-1", R"(
        var _status_catalog = {network: jeth.send({id: 1, method: 'net_version', params: []}).result};
    )"),
              R"({"result":{"network":"1"}})");
}

TEST_F(JailTest, RequestContextHooksSeeMessageIds) {
    auto hooks = std::make_shared<RequestContextHooks>();
    jail_->setNodeManager(std::make_shared<FakeNodeManager>(client_, hooks));
    EXPECT_CALL(*client_, call("eth_sendTransaction", _)).WillOnce(Return(R"("0xtxhash")"));

    ASSERT_EQ(jail_->parse("chat-1", R"(
        var contexts = [];
        function addContext(id, key, value) { contexts.push(key + '=' + value); }
        var _status_catalog = {
            pay: function () {
                _status_message_id = 'msg-42';
                jeth.send({id: 1, method: 'eth_sendTransaction', params: [{}]});
                return contexts.join(';');
            }
        };
    )"),
              R"({"result":{}})");

    EXPECT_EQ(jail_->call("chat-1", "pay", "[]"),
              R"({"result":"message_id=msg-42;eth_sendTransaction=true"})");
}

TEST_F(JailTest, GetVMExposesTheCell) {
    ASSERT_EQ(jail_->parse("chat-1", "var marker = 'here'; var _status_catalog = {};"), R"({"result":{}})");

    auto vm = jail_->getVM("chat-1");
    ASSERT_NE(vm, nullptr);
    EXPECT_EQ(vm->getId(), "chat-1");
    EXPECT_EQ(vm->evaluate("marker").getText(), "here");
}

TEST_F(JailTest, ReplacedCellHeldByCallerLosesBridgeWithRegistry) {
    ASSERT_EQ(jail_->parse("chat-1", PING_SCRIPT), R"({"result":{}})");
    auto replaced = jail_->getVM("chat-1");
    ASSERT_EQ(jail_->parse("chat-1", PING_SCRIPT), R"({"result":{}})");
    ASSERT_NE(jail_->getVM("chat-1"), replaced);

    jail_.reset();

    EXPECT_EQ(replaced->getBridge(), nullptr);
    auto result = replaced->evaluate(R"(
        try {
            jeth.send({id: 1, method: 'eth_blockNumber', params: []});
            'sent'
        } catch (e) {
            e.message
        }
    )");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getText(), "RPC bridge is not available in this context");
}

TEST_F(JailTest, GetVMUnknownCellThrowsCellNotFound) {
    try {
        jail_->getVM("ghost");
        FAIL() << "Expected JailException";
    } catch (const JailException &e) {
        EXPECT_EQ(e.code(), ErrorCode::CellNotFound);
        EXPECT_STREQ(e.what(), "Cell[ghost] doesn't exist.");
    }
}

TEST_F(JailTest, TracksCellIds) {
    jail_->parse("a", PING_SCRIPT);
    jail_->parse("b", PING_SCRIPT);
    jail_->parse("a", PING_SCRIPT);

    auto ids = jail_->getCellIds();
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(jail_->hasCell("a"));
    EXPECT_FALSE(jail_->hasCell("c"));
}

TEST_F(JailTest, CustomBridgeAndCatalogNames) {
    JailConfig config;
    config.bridgeName = "provider";
    config.catalogName = "commands";
    Jail custom(config, nodes_, "");

    EXPECT_EQ(custom.parse("x", "var commands = {bridge: typeof provider.send, legacy: typeof jeth};"),
              R"({"result":{"bridge":"function","legacy":"undefined"}})");
}

TEST_F(JailTest, ClientLibraryPreambleWiresWeb3) {
    JailConfig config;
    config.clientLibrary = R"(
        function require(name) {
            if (name === 'web3') {
                return function Web3(provider) { this.currentProvider = provider; };
            }
            if (name === 'bignumber.js') {
                return function Bignumber(value) { this.text = String(value); };
            }
            throw new Error('no module ' + name);
        }
    )";
    Jail withLibrary(config, nodes_, "");

    EXPECT_EQ(withLibrary.parse("x", "var _status_catalog = {wired: web3.currentProvider === jeth, n: bn(5).text};"),
              R"({"result":{"n":"5","wired":true}})");
}

TEST_F(JailTest, SingletonKeepsIdentityAndReplacesBaseScript) {
    EXPECT_FALSE(Jail::isInitialized());

    Jail &first = Jail::initialize("var base = 1;");
    Jail &second = Jail::initialize("var base = 2;");

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(&Jail::getInstance(), &first);
    EXPECT_EQ(first.getBaseScript(), "var base = 2;");
    EXPECT_TRUE(Jail::isInitialized());
}

TEST_F(JailTest, SingletonWithoutNodeManagerReportsNodeUnavailable) {
    Jail &jail = Jail::initialize(BASE_SCRIPT);
    ASSERT_EQ(jail.parse("chat-1", PING_SCRIPT), R"({"result":{}})");
    EXPECT_EQ(jail.call("chat-1", "ping", "[]"), R"({"error":"node is not running"})");

    jail.setNodeManager(nodes_);
    EXPECT_EQ(jail.call("chat-1", "ping", "[]"), R"({"result":"pong"})");
}

TEST_F(JailTest, ResetDiscardsSingletonCells) {
    Jail::getInstance().parse("chat-1", PING_SCRIPT);
    Jail::reset();
    EXPECT_FALSE(Jail::getInstance().hasCell("chat-1"));
}

}  // namespace Test
}  // namespace JAIL
