#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <json/json.h>
#include "../src/JsonRpcPeer.hpp"
#include "../src/Logger.hpp"
#include "../src/RequestDispatcher.hpp"
#include "../src/WorkerPool.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

using namespace std::chrono_literals;

// Collects every frame the peer writes.
struct Wire {
    std::mutex mutex;
    std::vector<Json::Value> frames;

    bool write(const std::string& line) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value value;
        std::string errs;
        reader->parse(line.data(), line.data() + line.size(), &value, &errs);
        std::lock_guard<std::mutex> lock(mutex);
        frames.push_back(value);
        return true;
    }

    std::vector<Json::Value> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames;
    }

    // Waits until a frame with this id carries a result or error.
    std::optional<Json::Value> responseFor(int id, std::chrono::milliseconds within = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + within;
        while (std::chrono::steady_clock::now() < deadline) {
            for (const auto& frame : snapshot()) {
                if (frame["id"].isInt() && frame["id"].asInt() == id && !frame.isMember("method")) {
                    return frame;
                }
            }
            std::this_thread::sleep_for(5ms);
        }
        return std::nullopt;
    }
};

static std::string response(const Json::Value& id, const Json::Value& result) {
    return JsonRpcPeer::serialize(JsonRpcPeer::createResponse(id, result));
}

static bool ready(std::future<Json::Value>& future, std::chrono::milliseconds within = 2000ms) {
    return future.wait_for(within) == std::future_status::ready;
}

int main() {
    try {
        Logger logger;
        logger.setConsoleEnabled(false);
        int violations = 0;
        logger.addObserver([&violations](LogLevel, const std::string&, const std::string& message) {
            if (message.find("Protocol violation") != std::string::npos) ++violations;
        });
        std::atomic<int> listenerFailures{0};
        std::atomic<int> taskFailures{0};
        logger.addObserver([&](LogLevel level, const std::string& component, const std::string& message) {
            if (message.find("Notification listener failed") != std::string::npos) ++listenerFailures;
            if (level == LogLevel::Error && component == "pool-test" && message.find("Worker task failed") != std::string::npos) {
                ++taskFailures;
            }
        });

        // Out-of-order responses reach the right callers
        {
            Wire wire;
            JsonRpcPeer peer(logger, "test", [&wire](const std::string& line) { return wire.write(line); }, 5000ms, 2);
            std::vector<JsonRpcPeer::PendingCall> calls;
            for (int i = 0; i < 5; ++i) {
                Json::Value params;
                params["n"] = i;
                calls.push_back(peer.sendRequest("work", params));
            }
            auto sent = wire.snapshot();
            ASSERT_TRUE(sent.size() == 5);
            ASSERT_TRUE(sent[0]["method"].asString() == "work");
            ASSERT_TRUE(sent[0]["jsonrpc"].asString() == "2.0");
            for (int i = 0; i < 5; ++i) {
                ASSERT_TRUE(calls[i].id.asInt() == i + 1);
            }
            ASSERT_TRUE(peer.outstanding() == 5);

            // An unknown id is dropped without disturbing anyone
            violations = 0;
            peer.handleFrame(response(Json::Value(999), Json::Value("stray")));
            ASSERT_TRUE(violations == 1);
            ASSERT_TRUE(peer.outstanding() == 5);

            for (int i = 4; i >= 0; --i) {
                peer.handleFrame(response(calls[i].id, Json::Value(calls[i].id.asInt() * 10)));
            }
            for (int i = 0; i < 5; ++i) {
                ASSERT_TRUE(ready(calls[i].response));
                Json::Value got = calls[i].response.get();
                ASSERT_TRUE(got["result"].asInt() == (i + 1) * 10);
            }
            ASSERT_TRUE(peer.outstanding() == 0);
        }

        // Timeouts resolve locally; late responses are orphaned
        {
            Wire wire;
            JsonRpcPeer peer(logger, "test", [&wire](const std::string& line) { return wire.write(line); }, 5000ms, 1);
            auto slow = peer.sendRequest("slow", Json::Value(), 50ms);
            auto other = peer.sendRequest("other", Json::Value());
            ASSERT_TRUE(ready(slow.response));
            Json::Value timedOut = slow.response.get();
            ASSERT_TRUE(timedOut["error"]["code"].asInt() == rpc::kTimeout);
            ASSERT_TRUE(timedOut["id"].asInt() == slow.id.asInt());
            ASSERT_TRUE(peer.outstanding() == 1);
            ASSERT_TRUE(!peer.closed());

            violations = 0;
            peer.handleFrame(response(slow.id, Json::Value("late")));
            ASSERT_TRUE(violations == 1);

            peer.handleFrame(response(other.id, Json::Value("fine")));
            ASSERT_TRUE(ready(other.response));
            ASSERT_TRUE(other.response.get()["result"].asString() == "fine");
        }

        // Cancellation
        {
            Wire wire;
            JsonRpcPeer peer(logger, "test", [&wire](const std::string& line) { return wire.write(line); }, 5000ms, 1);
            auto call = peer.sendRequest("long", Json::Value());
            ASSERT_TRUE(peer.cancel(call.id));
            ASSERT_TRUE(!peer.cancel(call.id));
            ASSERT_TRUE(ready(call.response, 10ms));
            ASSERT_TRUE(call.response.get()["error"]["code"].asInt() == rpc::kCancelled);
            violations = 0;
            peer.handleFrame(response(call.id, Json::Value(1)));
            ASSERT_TRUE(violations == 1);
        }

        // Duplicate in-flight ids are rejected; handlers run off the reader
        {
            Wire wire;
            JsonRpcPeer peer(logger, "test", [&wire](const std::string& line) { return wire.write(line); }, 5000ms, 2);
            std::promise<void> release;
            std::shared_future<void> gate = release.get_future().share();
            std::atomic<int> handled{0};
            peer.setRequestHandler([gate, &handled](const Json::Value& request) {
                gate.wait();
                ++handled;
                return JsonRpcPeer::createResponse(request["id"], Json::Value("done"));
            });

            std::string request = R"({"jsonrpc":"2.0","id":7,"method":"use_tool","params":{}})";
            peer.handleFrame(request);
            peer.handleFrame(request);
            auto rejected = wire.responseFor(7);
            ASSERT_TRUE(rejected.has_value());
            ASSERT_TRUE((*rejected)["error"]["code"].asInt() == rpc::kInvalidRequest);
            ASSERT_TRUE(handled == 0);

            release.set_value();
            auto deadline = std::chrono::steady_clock::now() + 2000ms;
            bool answered = false;
            while (!answered && std::chrono::steady_clock::now() < deadline) {
                for (const auto& frame : wire.snapshot()) {
                    if (frame["id"].asInt() == 7 && frame["result"].asString() == "done") answered = true;
                }
                std::this_thread::sleep_for(5ms);
            }
            ASSERT_TRUE(answered);
            ASSERT_TRUE(handled == 1);

            // Once finished the id may be reused
            peer.handleFrame(request);
            auto deadline2 = std::chrono::steady_clock::now() + 2000ms;
            while (handled < 2 && std::chrono::steady_clock::now() < deadline2) {
                std::this_thread::sleep_for(5ms);
            }
            ASSERT_TRUE(handled == 2);
        }

        // Routing through a dispatcher, notifications and malformed frames
        {
            Wire wire;
            JsonRpcPeer peer(logger, "test", [&wire](const std::string& line) { return wire.write(line); }, 5000ms, 1);
            RequestDispatcher dispatcher;
            dispatcher.registerTool("add", "Adds", [](const Json::Value& args) {
                return Json::Value(args["a"].asInt() + args["b"].asInt());
            });
            peer.setDispatcher(dispatcher);

            peer.handleFrame(R"({"jsonrpc":"2.0","id":1,"method":"use_tool","params":{"tool_name":"add","arguments":{"a":2,"b":3}}})");
            peer.handleFrame(R"({"jsonrpc":"2.0","id":2,"method":"use_tool","params":{"tool_name":"sub"}})");
            peer.handleFrame(R"({"jsonrpc":"2.0","id":3,"method":"bogus"})");
            auto sum = wire.responseFor(1);
            ASSERT_TRUE(sum.has_value() && (*sum)["result"].asInt() == 5);
            auto unknownTool = wire.responseFor(2);
            ASSERT_TRUE(unknownTool.has_value() && (*unknownTool)["error"]["code"].asInt() == rpc::kInvalidParams);
            auto unknownMethod = wire.responseFor(3);
            ASSERT_TRUE(unknownMethod.has_value() && (*unknownMethod)["error"]["code"].asInt() == rpc::kMethodNotFound);

            std::vector<std::string> seen;
            std::mutex seenMutex;
            int failing = peer.subscribe([](const Json::Value&) { throw std::runtime_error("listener broke"); });
            int token = peer.subscribe([&seen, &seenMutex](const Json::Value& notification) {
                std::lock_guard<std::mutex> lock(seenMutex);
                seen.push_back(notification["method"].asString());
            });
            peer.handleFrame(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"p":1}})");
            ASSERT_TRUE(seen.size() == 1 && seen[0] == "notifications/progress");
            ASSERT_TRUE(listenerFailures == 1);

            peer.unsubscribe(token);
            peer.unsubscribe(failing);
            peer.handleFrame(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"p":2}})");
            ASSERT_TRUE(seen.size() == 1);
            ASSERT_TRUE(listenerFailures == 1);

            std::size_t before = wire.snapshot().size();
            violations = 0;
            peer.handleFrame("this is not json");
            peer.handleFrame("[1,2,3]");
            peer.handleFrame(R"({"jsonrpc":"2.0","id":50,"result":1,"error":{"code":1,"message":"x"}})");
            peer.handleFrame("");
            ASSERT_TRUE(violations == 3);
            ASSERT_TRUE(wire.snapshot().size() == before);

            ASSERT_TRUE(peer.sendNotification("notifications/initialized", Json::Value()));
            auto frames = wire.snapshot();
            ASSERT_TRUE(frames.back()["method"].asString() == "notifications/initialized");
            ASSERT_TRUE(!frames.back().isMember("id"));
        }

        // A handler that throws past the peer is logged by the worker pool
        {
            {
                WorkerPool pool(logger, "pool-test", 1);
                ASSERT_TRUE(pool.post([] { throw std::runtime_error("task broke"); }));
                std::atomic<bool> ran{false};
                ASSERT_TRUE(pool.post([&ran] { ran = true; }));
                pool.shutdown();
                ASSERT_TRUE(ran);
                ASSERT_TRUE(!pool.post([] {}));
            }
            ASSERT_TRUE(taskFailures == 1);
        }

        // Termination fails outstanding calls and later requests
        {
            Wire wire;
            JsonRpcPeer peer(logger, "test", [&wire](const std::string& line) { return wire.write(line); }, 5000ms, 1);
            auto a = peer.sendRequest("a", Json::Value());
            auto b = peer.sendRequest("b", Json::Value());
            peer.handleClosed("child exited");
            ASSERT_TRUE(peer.closed());
            ASSERT_TRUE(ready(a.response, 10ms) && ready(b.response, 10ms));
            ASSERT_TRUE(a.response.get()["error"]["code"].asInt() == rpc::kProcessTerminated);
            ASSERT_TRUE(b.response.get()["error"]["code"].asInt() == rpc::kProcessTerminated);
            auto after = peer.sendRequest("c", Json::Value());
            ASSERT_TRUE(ready(after.response, 10ms));
            ASSERT_TRUE(after.response.get()["error"]["code"].asInt() == rpc::kProcessTerminated);
            ASSERT_TRUE(!peer.sendNotification("n", Json::Value()));
        }

        // A failing writer resolves the call immediately
        {
            JsonRpcPeer peer(logger, "test", [](const std::string&) { return false; }, 5000ms, 1);
            auto call = peer.sendRequest("x", Json::Value());
            ASSERT_TRUE(ready(call.response, 10ms));
            ASSERT_TRUE(call.response.get()["error"]["code"].asInt() == rpc::kProcessTerminated);
            ASSERT_TRUE(peer.outstanding() == 0);
        }

        std::cout << "All JsonRpcPeer tests passed." << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
