// ============================================================================
// CONTROL CLIENT UNIT TESTS
// ============================================================================
// SupervisorControlClient against a scripted XML-RPC server
// ============================================================================

#include <gtest/gtest.h>
#include <procbridge/core/control/curl_rpc_transport.hpp>
#include <procbridge/core/control/supervisor_control_client.hpp>
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

using namespace ProcBridge;
using namespace ProcBridge::Testing;

/**
 * Minimal daemon model: process states keyed by name, start/stop change
 * them, unknown names fault with BAD_NAME.
 */
class ControlClientTest : public ::testing::Test {
protected:
    std::unique_ptr<SupervisorControlClient> makeClient(ControlOptions options = fastOptions()) {
        auto transport = std::make_unique<FakeRpcTransport>(
            [this](const std::string& method, const std::string& body) { return serve(method, body); });
        transport_ = transport.get();
        return std::make_unique<SupervisorControlClient>(std::move(transport), options);
    }

    static ControlOptions fastOptions() {
        ControlOptions o;
        o.timeout = std::chrono::milliseconds(500);
        o.maxRetries = 2;
        o.retryBackoff = std::chrono::milliseconds(1);
        return o;
    }

    static std::string argOf(const std::string& body) {
        auto b = body.find("<string>");
        auto e = body.find("</string>");
        if (b == std::string::npos || e == std::string::npos) return std::string();
        return body.substr(b + 8, e - b - 8);
    }

    std::string serve(const std::string& method, const std::string& body) {
        auto failure = failures.find(method);
        if (failure != failures.end()) return failure->second();
        return serveDefault(method, body);
    }

    std::string serveDefault(const std::string& method, const std::string& body) {
        if (method == "supervisor.getAllProcessInfo") {
            std::vector<std::string> items;
            for (const auto& name : order) items.push_back(xmlProcessInfo(name, states[name], pidOf(name)));
            return xmlResponse(xmlArray(items));
        }
        if (method == "supervisor.getAllConfigInfo") {
            std::vector<std::string> items;
            for (const auto& kv : priorities) {
                items.push_back("<value><struct>"
                                "<member><name>name</name><value><string>" + kv.first + "</string></value></member>"
                                "<member><name>group</name><value><string>" + kv.first + "</string></value></member>"
                                "<member><name>process_prio</name><value><int>" + std::to_string(kv.second) +
                                "</int></value></member></struct></value>");
            }
            return xmlResponse(xmlArray(items));
        }

        const std::string name = argOf(body);
        if (method == "supervisor.shutdown") return xmlResponse(xmlBool(true));
        if (!states.count(name)) return xmlFault(10, "BAD_NAME: " + name);

        if (method == "supervisor.getProcessInfo")
            return xmlResponse(xmlProcessInfo(name, states[name], pidOf(name)));
        if (method == "supervisor.startProcess") {
            if (states[name] == "RUNNING") return xmlFault(60, "ALREADY_STARTED: " + name);
            states[name] = "RUNNING";
            return xmlResponse(xmlBool(true));
        }
        if (method == "supervisor.stopProcess") {
            if (states[name] != "RUNNING" && states[name] != "STARTING") return xmlFault(70, "NOT_RUNNING: " + name);
            states[name] = "STOPPED";
            return xmlResponse(xmlBool(true));
        }
        return xmlFault(1, "UNKNOWN_METHOD");
    }

    int pidOf(const std::string& name) {
        return states[name] == "RUNNING" ? 1000 + static_cast<int>(name.size()) : 0;
    }

    void addProcess(const std::string& name, const std::string& state) {
        order.push_back(name);
        states[name] = state;
    }

    size_t count(const std::string& method) const {
        auto methods = transport_->methods();
        return static_cast<size_t>(std::count(methods.begin(), methods.end(), method));
    }

    std::vector<std::string> order;
    std::map<std::string, std::string> states;
    std::map<std::string, int> priorities;
    std::map<std::string, std::function<std::string()>> failures;
    FakeRpcTransport* transport_ = nullptr;
};

// ============================================================================
// READS
// ============================================================================

TEST_F(ControlClientTest, ListReturnsAllProcessesWithStates) {
    addProcess("api", "RUNNING");
    addProcess("worker1", "FATAL");
    addProcess("cron", "STOPPED");
    auto client = makeClient();

    auto start = std::chrono::steady_clock::now();
    auto outcome = client->list();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));

    ASSERT_TRUE(outcome.ok()) << outcome.message;
    ASSERT_EQ(outcome.value.size(), 3u);
    EXPECT_EQ(outcome.value[0].state, ProcessState::RUNNING);
    EXPECT_TRUE(outcome.value[0].pid.has_value());
    EXPECT_EQ(outcome.value[1].name, "worker1");
    EXPECT_EQ(outcome.value[1].state, ProcessState::FATAL);
    EXPECT_FALSE(outcome.value[1].pid.has_value());
    EXPECT_EQ(outcome.value[2].state, ProcessState::STOPPED);
}

TEST_F(ControlClientTest, InfoUnknownNameIsNotFound) {
    auto client = makeClient();
    auto outcome = client->info("ghost");
    EXPECT_EQ(outcome.error, ControlError::NOT_FOUND);
}

TEST_F(ControlClientTest, ReadsAreRetriedOnTransportFailure) {
    addProcess("api", "RUNNING");
    int failuresLeft = 2;
    failures["supervisor.getAllProcessInfo"] = [this, &failuresLeft]() -> std::string {
        if (failuresLeft-- > 0) throw TransportError("connection refused");
        return serveDefault("supervisor.getAllProcessInfo", "");
    };
    auto client = makeClient();

    auto outcome = client->list();
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.value.size(), 1u);
    EXPECT_EQ(client->callCount(), 3u);
}

TEST_F(ControlClientTest, ReadGivesUpAfterMaxRetries) {
    failures["supervisor.getAllProcessInfo"] = []() -> std::string { throw TimeoutError("timed out"); };
    auto client = makeClient();

    auto outcome = client->list();
    EXPECT_EQ(outcome.error, ControlError::UNREACHABLE);
    EXPECT_EQ(count("supervisor.getAllProcessInfo"), 3u);
}

TEST_F(ControlClientTest, UnauthorizedIsRejected) {
    failures["supervisor.getAllProcessInfo"] = []() -> std::string { throw RpcHttpError(401, "HTTP 401"); };
    auto client = makeClient();

    auto outcome = client->list();
    EXPECT_EQ(outcome.error, ControlError::REJECTED);
    EXPECT_EQ(count("supervisor.getAllProcessInfo"), 1u);
}

TEST_F(ControlClientTest, GarbageResponseIsUnreachable) {
    failures["supervisor.getProcessInfo"] = []() -> std::string { return "<html>oops</html>"; };
    auto client = makeClient();
    EXPECT_EQ(client->info("api").error, ControlError::UNREACHABLE);
}

// ============================================================================
// COMMANDS
// ============================================================================

TEST_F(ControlClientTest, StartReadsBackState) {
    addProcess("api", "STOPPED");
    auto client = makeClient();

    ControlResult r = client->start("api");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.message, "api state=RUNNING");
    ASSERT_TRUE(r.state.has_value());
    EXPECT_EQ(*r.state, ProcessState::RUNNING);
}

TEST_F(ControlClientTest, StartAlreadyRunningIsRejected) {
    addProcess("api", "RUNNING");
    auto client = makeClient();

    ControlResult r = client->start("api");
    EXPECT_EQ(r.error, ControlError::REJECTED);
    EXPECT_EQ(r.faultCode, SupervisorFault::ALREADY_STARTED);
}

TEST_F(ControlClientTest, StopUnknownIsNotFound) {
    auto client = makeClient();
    EXPECT_EQ(client->stop("ghost").error, ControlError::NOT_FOUND);
}

TEST_F(ControlClientTest, MutatingCallsAreNotRetried) {
    addProcess("api", "STOPPED");
    failures["supervisor.startProcess"] = []() -> std::string { throw TransportError("reset by peer"); };
    auto client = makeClient();

    EXPECT_EQ(client->start("api").error, ControlError::UNREACHABLE);
    EXPECT_EQ(count("supervisor.startProcess"), 1u);
}

TEST_F(ControlClientTest, RestartStopsThenStarts) {
    addProcess("api", "RUNNING");
    auto client = makeClient();

    ControlResult r = client->restart("api");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.op, ControlOp::RESTART);
    EXPECT_EQ(count("supervisor.stopProcess"), 1u);
    EXPECT_EQ(count("supervisor.startProcess"), 1u);
}

TEST_F(ControlClientTest, RestartOfStoppedProcessStarts) {
    addProcess("api", "STOPPED");
    auto client = makeClient();

    ControlResult r = client->restart("api");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(states["api"], "RUNNING");
}

TEST_F(ControlClientTest, RestartNeverStartsAfterUnreachableStop) {
    addProcess("api", "RUNNING");
    failures["supervisor.stopProcess"] = []() -> std::string { throw TimeoutError("timed out"); };
    auto client = makeClient();

    ControlResult r = client->restart("api");
    EXPECT_EQ(r.error, ControlError::UNREACHABLE);
    EXPECT_EQ(count("supervisor.startProcess"), 0u);
}

TEST_F(ControlClientTest, RestartUnknownIsNotFound) {
    auto client = makeClient();
    ControlResult r = client->restart("ghost");
    EXPECT_EQ(r.error, ControlError::NOT_FOUND);
    EXPECT_EQ(count("supervisor.startProcess"), 0u);
}

TEST_F(ControlClientTest, StartReadBackStaysWithinCallTimeout) {
    addProcess("api", "STOPPED");
    ControlOptions options = fastOptions();
    options.timeout = std::chrono::milliseconds(200);
    options.maxRetries = 2;
    failures["supervisor.getProcessInfo"] = []() -> std::string {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        throw TimeoutError("getProcessInfo timed out");
    };
    auto client = makeClient(options);

    auto begin = std::chrono::steady_clock::now();
    ControlResult r = client->start("api");
    auto elapsed = std::chrono::steady_clock::now() - begin;

    // Accepted by the daemon, state unknown; no read-back retries past the budget
    EXPECT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.message, "api start accepted");
    EXPECT_EQ(count("supervisor.getProcessInfo"), 1u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(400));
}

TEST_F(ControlClientTest, RestartSharesOneCallTimeout) {
    addProcess("api", "RUNNING");
    ControlOptions options = fastOptions();
    options.timeout = std::chrono::milliseconds(150);
    failures["supervisor.stopProcess"] = [this]() -> std::string {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        states["api"] = "STOPPED";
        return xmlResponse(xmlBool(true));
    };
    auto client = makeClient(options);

    auto begin = std::chrono::steady_clock::now();
    ControlResult r = client->restart("api");
    auto elapsed = std::chrono::steady_clock::now() - begin;

    // The stop used up the budget: the read-back and the start never go out
    EXPECT_EQ(r.error, ControlError::UNREACHABLE);
    EXPECT_EQ(count("supervisor.startProcess"), 0u);
    EXPECT_EQ(count("supervisor.getProcessInfo"), 0u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(350));
}

// ============================================================================
// STOP ALL
// ============================================================================

TEST_F(ControlClientTest, StopAllOnEmptySetIsEmptySuccess) {
    auto client = makeClient();
    auto outcome = client->stopAll();
    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.value.empty());
}

TEST_F(ControlClientTest, StopAllStopsRunningByPriority) {
    addProcess("alpha", "RUNNING");
    addProcess("beta", "RUNNING");
    addProcess("gamma", "STOPPED");
    addProcess("delta", "STARTING");
    priorities = {{"alpha", 100}, {"beta", 900}, {"delta", 500}};
    auto client = makeClient();

    auto outcome = client->stopAll();
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    ASSERT_EQ(outcome.value.size(), 3u);
    EXPECT_EQ(outcome.value[0].name, "beta");
    EXPECT_EQ(outcome.value[1].name, "delta");
    EXPECT_EQ(outcome.value[2].name, "alpha");
    EXPECT_EQ(outcome.message, "stopped 3 of 3 processes");
}

TEST_F(ControlClientTest, StopAllReportsPartialFailures) {
    addProcess("api", "RUNNING");
    addProcess("stuck", "RUNNING");
    addProcess("worker", "RUNNING");
    int stopCalls = 0;
    failures["supervisor.stopProcess"] = [this, &stopCalls]() -> std::string {
        ++stopCalls;
        if (stopCalls == 1) states["api"] = "STOPPED";
        if (stopCalls == 2) throw TimeoutError("stuck did not stop");
        if (stopCalls == 3) states["worker"] = "STOPPED";
        return xmlResponse(xmlBool(true));
    };
    auto client = makeClient();

    // No configured priorities: name order api, stuck, worker
    auto outcome = client->stopAll();
    EXPECT_TRUE(outcome.ok());
    ASSERT_EQ(outcome.value.size(), 3u);
    EXPECT_TRUE(outcome.value[0].ok());
    EXPECT_EQ(outcome.value[1].name, "stuck");
    EXPECT_EQ(outcome.value[1].error, ControlError::UNREACHABLE);
    EXPECT_TRUE(outcome.value[2].ok());
    EXPECT_EQ(outcome.message, "stopped 2 of 3 processes");
}

TEST_F(ControlClientTest, StopAllIsBoundedByOneCallTimeout) {
    addProcess("alpha", "RUNNING");
    addProcess("beta", "RUNNING");
    addProcess("gamma", "RUNNING");
    ControlOptions options = fastOptions();
    options.timeout = std::chrono::milliseconds(200);
    failures["supervisor.stopProcess"] = [this]() -> std::string {
        std::this_thread::sleep_for(std::chrono::milliseconds(120));
        return xmlResponse(xmlBool(true));
    };
    auto client = makeClient(options);

    auto begin = std::chrono::steady_clock::now();
    auto outcome = client->stopAll();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    ASSERT_TRUE(outcome.ok()) << outcome.message;
    ASSERT_EQ(outcome.value.size(), 3u);
    EXPECT_EQ(outcome.value[2].name, "gamma");
    EXPECT_EQ(outcome.value[2].error, ControlError::UNREACHABLE);
    EXPECT_LE(count("supervisor.stopProcess"), 2u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(400));
}

TEST_F(ControlClientTest, StopAllSkipsExcludedNames) {
    addProcess("procbridge", "RUNNING");
    addProcess("api", "RUNNING");
    ControlOptions options = fastOptions();
    options.stopAllExclude = {"ProcBridge"};
    auto client = makeClient(options);

    auto outcome = client->stopAll();
    ASSERT_EQ(outcome.value.size(), 1u);
    EXPECT_EQ(outcome.value[0].name, "api");
    EXPECT_EQ(states["procbridge"], "RUNNING");
}

TEST_F(ControlClientTest, StopAllUnreachableListFails) {
    failures["supervisor.getAllProcessInfo"] = []() -> std::string { throw TransportError("no socket"); };
    auto client = makeClient();
    EXPECT_EQ(client->stopAll().error, ControlError::UNREACHABLE);
}

// ============================================================================
// CONCURRENCY & EXECUTE
// ============================================================================

TEST_F(ControlClientTest, ConcurrentCallersAreSerialised) {
    addProcess("api", "RUNNING");
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    failures["supervisor.getProcessInfo"] = [&]() -> std::string {
        int now = ++inFlight;
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --inFlight;
        return xmlResponse(xmlProcessInfo("api", "RUNNING", 42));
    };
    auto client = makeClient();

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 5; ++j) {
                if (client->info("api").ok()) ++ok;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), 20);
    EXPECT_EQ(maxInFlight.load(), 1);
}

TEST_F(ControlClientTest, BusySessionTimesOutAsUnreachable) {
    addProcess("api", "RUNNING");
    ControlOptions options = fastOptions();
    options.timeout = std::chrono::milliseconds(50);
    options.maxRetries = 0;
    failures["supervisor.getAllProcessInfo"] = []() -> std::string {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return xmlResponse(xmlArray({}));
    };
    auto client = makeClient(options);

    std::thread slow([&]() { client->list(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto outcome = client->info("api");
    slow.join();

    EXPECT_EQ(outcome.error, ControlError::UNREACHABLE);
    EXPECT_NE(outcome.message.find("busy"), std::string::npos);
}

TEST_F(ControlClientTest, ExecuteParsedCommand) {
    addProcess("api", "STOPPED");
    auto client = makeClient();

    ControlResult r = client->execute(ControlCommand::parse("start api"));
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.op, ControlOp::START);

    ControlResult listed = client->execute(ControlCommand::parse("list"));
    EXPECT_TRUE(listed.ok());
    EXPECT_EQ(listed.message, "1 processes");
}

TEST(ControlCommand, ParsesGrammar) {
    EXPECT_EQ(ControlCommand::parse("stop-all").op, ControlOp::STOP_ALL);
    EXPECT_EQ(ControlCommand::parse("stop_all").op, ControlOp::STOP_ALL);
    ControlCommand restart = ControlCommand::parse("restart api");
    EXPECT_EQ(restart.op, ControlOp::RESTART);
    EXPECT_EQ(restart.name, "api");
    EXPECT_EQ(ControlCommand::parse("restart").name, "");

    EXPECT_THROW(ControlCommand::parse(""), std::invalid_argument);
    EXPECT_THROW(ControlCommand::parse("reboot api"), std::invalid_argument);
    EXPECT_THROW(ControlCommand::parse("list api"), std::invalid_argument);
    EXPECT_THROW(ControlCommand::parse("start a b"), std::invalid_argument);
}

TEST(CurlRpcTransport, ResolvesServerUrls) {
    std::string url;
    std::string socket;

    CurlRpcTransport::resolveUrl("unix:///tmp/supervisor.sock", url, socket);
    EXPECT_EQ(url, "http://localhost/RPC2");
    EXPECT_EQ(socket, "/tmp/supervisor.sock");

    CurlRpcTransport::resolveUrl("http://127.0.0.1:9001", url, socket);
    EXPECT_EQ(url, "http://127.0.0.1:9001/RPC2");
    EXPECT_TRUE(socket.empty());

    CurlRpcTransport::resolveUrl("http://127.0.0.1:9001/RPC2", url, socket);
    EXPECT_EQ(url, "http://127.0.0.1:9001/RPC2");

    EXPECT_THROW(CurlRpcTransport::resolveUrl("ftp://host", url, socket), std::invalid_argument);
    EXPECT_THROW(CurlRpcTransport::resolveUrl("unix://", url, socket), std::invalid_argument);
}
