#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "test_support.hpp"
#include "../shared/cpp/bus/include/in_memory_bus.hpp"
#include "../shared/cpp/bus/include/recent_ids.hpp"
#include "../shared/cpp/common/include/errors.hpp"

using json = nlohmann::json;
using std::chrono::milliseconds;

void test_broadcast() {
    std::cout << "Testing broadcast delivery..." << std::endl;
    auto broker = std::make_shared<InMemoryBroker>();
    InMemoryBus a(broker, "a"), b(broker, "b"), pub(broker, "pub");
    std::atomic<int> got_a{0}, got_b{0};
    auto s1 = a.subscribe("photos.organized", [&](const Message& m) {
        assert(m.sender == "pub");
        assert(m.kind == MessageKind::Event);
        ++got_a;
    });
    auto s2 = b.subscribe("photos.organized", [&](const Message&) { ++got_b; });

    pub.publish("photos.organized", json{{"organized_count", 3}});
    pub.publish("photos.other", json::object());
    assert(wait_until([&]{ return got_a == 1 && got_b == 1; }));

    s1.cancel();
    assert(!s1.active());
    pub.publish("photos.organized", json::object());
    assert(wait_until([&]{ return got_b == 2; }));
    sleep_ms(30);
    assert(got_a == 1);
    std::cout << "  PASS" << std::endl;
}

void test_consumer_group() {
    std::cout << "Testing consumer group delivery..." << std::endl;
    auto broker = std::make_shared<InMemoryBroker>();
    InMemoryBus w1(broker, "w1"), w2(broker, "w2"), watcher(broker, "watcher"), pub(broker, "pub");
    std::atomic<int> n1{0}, n2{0}, seen{0};
    auto s1 = w1.subscribe("jobs", [&](const Message&) { ++n1; }, SubscribeOptions::consumer_group("workers"));
    auto s2 = w2.subscribe("jobs", [&](const Message&) { ++n2; }, SubscribeOptions::consumer_group("workers"));
    auto s3 = watcher.subscribe("jobs", [&](const Message&) { ++seen; });
    assert(broker->subscriber_count("jobs") == 3);

    for (int i = 0; i < 10; ++i) pub.publish("jobs", json{{"i", i}});
    assert(wait_until([&]{ return n1 + n2 == 10 && seen == 10; }));
    sleep_ms(30);
    assert(n1 + n2 == 10);
    assert(n1 > 0 && n2 > 0);

    bool threw = false;
    try {
        w1.subscribe("jobs", [](const Message&) {}, SubscribeOptions::consumer_group(""));
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  PASS" << std::endl;
}

void test_fifo_per_publisher() {
    std::cout << "Testing per-publisher ordering..." << std::endl;
    auto broker = std::make_shared<InMemoryBroker>();
    InMemoryBus sub(broker, "sub"), pub(broker, "pub");
    std::mutex mtx;
    std::vector<int> order;
    auto s = sub.subscribe("seq", [&](const Message& m) {
        std::lock_guard<std::mutex> lock(mtx);
        order.push_back(m.payload.at("n").get<int>());
    });
    for (int i = 0; i < 200; ++i) pub.publish("seq", json{{"n", i}});
    assert(wait_until([&]{ std::lock_guard<std::mutex> lock(mtx); return order.size() == 200; }));
    for (int i = 0; i < 200; ++i) assert(order[i] == i);
    std::cout << "  PASS" << std::endl;
}

void test_request_response() {
    std::cout << "Testing request/response..." << std::endl;
    auto broker = std::make_shared<InMemoryBroker>();
    InMemoryBus server(broker, "server"), client(broker, "client");
    auto s = server.subscribe("math.double", [&](const Message& m) {
        assert(m.kind == MessageKind::Request);
        assert(m.reply_to.has_value());
        server.respond(m, ok_payload(m.payload.at("x").get<int>() * 2));
    });

    Message r = client.request("math.double", json{{"x", 21}}, milliseconds(1000));
    assert(r.kind == MessageKind::Response);
    assert(is_ok_payload(r.payload));
    assert(r.payload["result"] == 42);

    // concurrent requests each get their own answer
    std::vector<PendingRequest> pending;
    for (int i = 0; i < 5; ++i) pending.push_back(client.request_async("math.double", json{{"x", i}}, milliseconds(1000)));
    for (int i = 0; i < 5; ++i) {
        Message m = pending[i].get();
        assert(m.correlation_id == pending[i].correlation_id());
        assert(m.payload["result"] == i * 2);
    }
    std::cout << "  PASS" << std::endl;
}

void test_request_timeout() {
    std::cout << "Testing request timeout..." << std::endl;
    auto broker = std::make_shared<InMemoryBroker>();
    InMemoryBus server(broker, "server"), client(broker, "client");
    std::atomic<int> answered{0};
    auto s = server.subscribe("slow.op", [&](const Message& m) {
        sleep_ms(150);
        server.respond(m, ok_payload("late"));
        ++answered;
    });

    auto start = std::chrono::steady_clock::now();
    bool threw = false;
    try {
        client.request("slow.op", json::object(), milliseconds(50));
    } catch (const TimeoutError&) {
        threw = true;
    }
    assert(threw);
    assert(std::chrono::steady_clock::now() - start < milliseconds(140));

    // the late response lands on a torn-down reply topic and goes nowhere
    assert(wait_until([&]{ return answered == 1; }));
    std::cout << "  PASS" << std::endl;
}

void test_uncorrelated_response_discarded() {
    std::cout << "Testing uncorrelated response..." << std::endl;
    auto broker = std::make_shared<InMemoryBroker>();
    InMemoryBus client(broker, "client"), stray(broker, "stray");

    auto pending = client.request_async("nobody.listens", json::object(), milliseconds(100));
    Message bogus;
    bogus.topic = "_reply." + client.client_id() + "." + pending.correlation_id();
    bogus.kind = MessageKind::Response;
    bogus.correlation_id = "not-" + pending.correlation_id();
    bogus.payload = ok_payload("forged");
    stray.publish(bogus);

    bool threw = false;
    try {
        pending.get();
    } catch (const TimeoutError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  PASS" << std::endl;
}

void test_cancelled_request() {
    std::cout << "Testing cancelled request..." << std::endl;
    InMemoryBus client("client");
    auto pending = client.request_async("nobody.listens", json::object(), milliseconds(1000));
    pending.cancel();
    bool threw = false;
    try {
        pending.get();
    } catch (const TimeoutError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  PASS" << std::endl;
}

void test_respond_requires_reply_to() {
    std::cout << "Testing respond without reply_to..." << std::endl;
    InMemoryBus bus("x");
    Message ev = make_event("some.event", json::object());
    bool threw = false;
    try {
        bus.respond(ev, ok_payload(nullptr));
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        bus.publish("", json::object());
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  PASS" << std::endl;
}

void test_bus_unavailable() {
    std::cout << "Testing publish retries..." << std::endl;
    RetryPolicy retry;
    retry.max_attempts = 3;
    retry.initial_backoff = milliseconds(5);
    InMemoryBus bus("flaky", retry);
    bus.set_reachable(false);

    bool threw = false;
    try {
        bus.publish("any.topic", json::object());
    } catch (const BusUnavailable&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        bus.subscribe("any.topic", [](const Message&) {});
    } catch (const BusUnavailable&) {
        threw = true;
    }
    assert(threw);

    bus.set_reachable(true);
    std::atomic<int> got{0};
    auto s = bus.subscribe("any.topic", [&](const Message&) { ++got; });
    bus.publish("any.topic", json::object());
    assert(wait_until([&]{ return got == 1; }));
    std::cout << "  PASS" << std::endl;
}

void test_cancel_from_handler() {
    std::cout << "Testing cancel inside handler..." << std::endl;
    InMemoryBus bus("self");
    std::atomic<int> got{0};
    Subscription sub;
    std::mutex mtx;
    {
        std::lock_guard<std::mutex> lock(mtx);
        sub = bus.subscribe("once", [&](const Message&) {
            ++got;
            std::lock_guard<std::mutex> lock(mtx);
            sub.cancel();
        });
    }
    bus.publish("once", json::object());
    bus.publish("once", json::object());
    assert(wait_until([&]{ return got >= 1; }));
    sleep_ms(30);
    assert(got == 1);
    std::cout << "  PASS" << std::endl;
}

void test_message_json() {
    std::cout << "Testing message JSON form..." << std::endl;
    Message m;
    m.id = "m1";
    m.topic = "agent.a1.dispatch";
    m.kind = MessageKind::Request;
    m.payload = json{{"task_id", "t1"}};
    m.correlation_id = "c1";
    m.reply_to = std::string("_reply.orch.c1");
    m.sender = "orch";
    m.sent_at = std::chrono::system_clock::time_point(milliseconds(1700000000000));

    json j = message_to_json(m);
    assert(j["kind"] == "request");
    assert(j["reply_to"] == "_reply.orch.c1");
    Message back = message_from_json(j);
    assert(back.topic == m.topic && back.kind == m.kind && back.correlation_id == "c1");
    assert(back.reply_to && *back.reply_to == "_reply.orch.c1");
    assert(back.sent_at == m.sent_at);

    json ev = {{"topic", "x.y"}, {"reply_to", nullptr}};
    Message e = message_from_json(ev);
    assert(e.kind == MessageKind::Event);
    assert(!e.reply_to);

    bool threw = false;
    try {
        message_from_json(json{{"kind", "event"}});
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        message_from_json(json{{"topic", "x"}, {"kind", "broadcast"}});
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);

    json err = error_payload("boom", "handler", true);
    assert(!is_ok_payload(err));
    assert(err["fatal"] == true);
    std::cout << "  PASS" << std::endl;
}

void test_recent_ids() {
    std::cout << "Testing RecentIds..." << std::endl;
    RecentIds ids(2);
    assert(ids.insert("a"));
    assert(!ids.insert("a"));
    assert(ids.insert("b"));
    assert(ids.insert("c"));
    // "a" fell out of the window
    assert(ids.insert("a"));
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== bus tests ===" << std::endl;
    test_broadcast();
    test_consumer_group();
    test_fifo_per_publisher();
    test_request_response();
    test_request_timeout();
    test_uncorrelated_response_discarded();
    test_cancelled_request();
    test_respond_requires_reply_to();
    test_bus_unavailable();
    test_cancel_from_handler();
    test_message_json();
    test_recent_ids();
    std::cout << "All bus tests passed." << std::endl;
    return 0;
}
