#include "dhcpwarden/enforcer.h"
#include "fake_http_client.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace dhcpwarden;

namespace {

class ThrowingHttpClient : public HttpClient {
public:
    bool perform(const HttpRequest &, HttpResponse &, std::string &) override {
        throw std::runtime_error("socket exploded");
    }
    void clear_cookies() override {}
};

std::vector<bool> patched_states(const FakeHttpClient &fake) {
    std::vector<bool> out;
    for (const auto &r : fake.requests) {
        if (r.method != "PATCH") continue;
        out.push_back(nlohmann::json::parse(r.body)["config"]["dhcp"]["active"].get<bool>());
    }
    return out;
}

void healthy(FakeHttpClient &fake) {
    fake.respond("GET", HEALTH_TARGET, 200, "ok");
    fake.respond("POST", AUTH_TARGET, 200, login_ok_body());
    fake.respond("PATCH", DHCP_TARGET, 200, R"({"success":true})");
}

struct Pair {
    FakeHttpClient *a{nullptr};
    FakeHttpClient *b{nullptr};
    std::vector<NodeContext> nodes;
};

Pair make_pair_of_nodes() {
    Pair p;
    p.nodes.push_back(make_fake_node("A", 0, p.a));
    p.nodes.push_back(make_fake_node("B", 1, p.b));
    return p;
}

long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

size_t count_events(const std::vector<NodeEvent> &events, NodeEventKind kind) {
    size_t n = 0;
    for (const auto &e : events) {
        if (e.kind == kind) ++n;
    }
    return n;
}

} // namespace

int main() {
    // Both reachable: A elected, A enabled, B disabled
    {
        Pair p = make_pair_of_nodes();
        healthy(*p.a);
        healthy(*p.b);
        std::vector<NodeEvent> events;
        ReportSink sink;
        sink.callback = [&](const NodeEvent &e) { events.push_back(e); };
        ElectionEnforcer enforcer(make_test_config(2), std::move(p.nodes), sink);

        CycleResult res = enforcer.run_cycle();
        assert(res.cycle == 1);
        assert(res.elected && *res.elected == 0);
        assert(enforcer.nodes()[*res.elected].name() == "A");
        assert(patched_states(*p.a) == std::vector<bool>{true});
        assert(patched_states(*p.b) == std::vector<bool>{false});
        assert(res.mutations.size() == 2);
        assert(res.mutations[0].outcome == MutationOutcome::APPLIED);
        assert(res.mutations[1].outcome == MutationOutcome::APPLIED);

        // Every outcome is reported once
        assert(count_events(events, NodeEventKind::ONLINE) == 2);
        assert(count_events(events, NodeEventKind::ELECTED) == 1);
        assert(count_events(events, NodeEventKind::DHCP_APPLIED) == 2);
        assert(events.size() == 5);
        for (const auto &e : events) assert(e.cycle == 1);

        // Second cycle reuses both sessions and re-asserts the same states
        res = enforcer.run_cycle();
        assert(res.cycle == 2);
        assert(res.elected && *res.elected == 0);
        assert(p.a->count("POST", AUTH_TARGET) == 1);
        assert(p.b->count("POST", AUTH_TARGET) == 1);
        assert((patched_states(*p.a) == std::vector<bool>{true, true}));
        assert((patched_states(*p.b) == std::vector<bool>{false, false}));
    }

    // A unreachable: B elected, A gets neither login nor PATCH
    {
        Pair p = make_pair_of_nodes();
        p.a->fail("GET", HEALTH_TARGET, "connection refused");
        healthy(*p.b);
        ElectionEnforcer enforcer(make_test_config(2), std::move(p.nodes), ReportSink{});

        CycleResult res = enforcer.run_cycle();
        assert(res.elected && *res.elected == 1);
        assert(!res.reachable[0] && res.reachable[1]);
        assert(p.a->requests.size() == 1);
        assert(p.a->count("POST", AUTH_TARGET) == 0);
        assert(p.a->count("PATCH", DHCP_TARGET) == 0);
        assert(res.mutations[0].outcome == MutationOutcome::SKIPPED_UNREACHABLE);
        assert(patched_states(*p.b) == std::vector<bool>{true});

        // A comes back: leadership returns to it, B is disabled
        p.a->reset("GET", HEALTH_TARGET);
        healthy(*p.a);
        res = enforcer.run_cycle();
        assert(res.elected && *res.elected == 0);
        assert(patched_states(*p.a) == std::vector<bool>{true});
        assert((patched_states(*p.b) == std::vector<bool>{true, false}));
    }

    // Nothing reachable: no leader, no authentication, no mutation
    {
        Pair p = make_pair_of_nodes();
        p.a->respond("GET", HEALTH_TARGET, 503, "");
        p.b->fail("GET", HEALTH_TARGET, "timed out");
        std::vector<NodeEvent> events;
        ReportSink sink;
        sink.callback = [&](const NodeEvent &e) { events.push_back(e); };
        ElectionEnforcer enforcer(make_test_config(2), std::move(p.nodes), sink);

        CycleResult res = enforcer.run_cycle();
        assert(!res.elected);
        for (auto *fake : {p.a, p.b}) {
            assert(fake->count("POST", AUTH_TARGET) == 0);
            assert(fake->count("PATCH", DHCP_TARGET) == 0);
        }
        assert(count_events(events, NodeEventKind::OFFLINE) == 2);
        assert(count_events(events, NodeEventKind::NO_LEADER) == 1);
        assert(count_events(events, NodeEventKind::SKIPPED_UNREACHABLE) == 2);
        for (const auto &e : events) {
            if (e.kind == NodeEventKind::SKIPPED_UNREACHABLE) assert(!e.desired_enabled);
        }
    }

    // Authorization failure: session cleared, one re-login next cycle before the retry
    {
        Pair p = make_pair_of_nodes();
        p.a->respond("GET", HEALTH_TARGET, 200, "ok");
        p.a->respond("POST", AUTH_TARGET, 200, login_ok_body("first", "c1"));
        p.a->respond("POST", AUTH_TARGET, 200, login_ok_body("second", "c2"));
        p.a->respond("PATCH", DHCP_TARGET, 401, "");
        p.a->respond("PATCH", DHCP_TARGET, 200, R"({"success":true})");
        healthy(*p.b);
        ElectionEnforcer enforcer(make_test_config(2), std::move(p.nodes), ReportSink{});

        CycleResult res = enforcer.run_cycle();
        assert(res.mutations[0].outcome == MutationOutcome::SESSION_REJECTED);
        assert(!enforcer.nodes()[0].state.session);
        assert(p.a->count("POST", AUTH_TARGET) == 1);
        assert(p.a->cookie_clears == 1);
        // B is unaffected by A's failure
        assert(res.mutations[1].outcome == MutationOutcome::APPLIED);

        size_t before = p.a->requests.size();
        res = enforcer.run_cycle();
        assert(res.mutations[0].outcome == MutationOutcome::APPLIED);
        assert(p.a->count("POST", AUTH_TARGET) == 2);
        // GET, POST, PATCH in that order
        assert(p.a->requests.size() == before + 3);
        assert(p.a->requests[before + 1].method == "POST");
        assert(p.a->requests[before + 2].method == "PATCH");
        const auto &sid_header = p.a->requests[before + 2].headers.front();
        assert(sid_header.first == "sid" && sid_header.second == "second");
    }

    // Transient mutation failure keeps the session, no re-login next cycle
    {
        Pair p = make_pair_of_nodes();
        p.a->respond("GET", HEALTH_TARGET, 200, "ok");
        p.a->respond("POST", AUTH_TARGET, 200, login_ok_body());
        p.a->respond("PATCH", DHCP_TARGET, 502, "");
        p.a->respond("PATCH", DHCP_TARGET, 200, R"({"success":true})");
        healthy(*p.b);
        ElectionEnforcer enforcer(make_test_config(2), std::move(p.nodes), ReportSink{});

        assert(enforcer.run_cycle().mutations[0].outcome == MutationOutcome::FAILED);
        assert(enforcer.nodes()[0].state.session);
        assert(enforcer.run_cycle().mutations[0].outcome == MutationOutcome::APPLIED);
        assert(p.a->count("POST", AUTH_TARGET) == 1);
    }

    // Priority comes from the node, not its position in the list
    {
        FakeHttpClient *low = nullptr;
        FakeHttpClient *high = nullptr;
        std::vector<NodeContext> nodes;
        nodes.push_back(make_fake_node("Backup", 5, low));
        nodes.push_back(make_fake_node("Main", 1, high));
        healthy(*low);
        healthy(*high);
        ElectionEnforcer enforcer(make_test_config(2), std::move(nodes), ReportSink{});
        CycleResult res = enforcer.run_cycle();
        assert(res.elected);
        assert(enforcer.nodes()[*res.elected].name() == "Main");
        assert(patched_states(*high) == std::vector<bool>{true});
        assert(patched_states(*low) == std::vector<bool>{false});
    }

    // elect_leader over fixed reachability vectors; never more than one enabled
    {
        FakeHttpClient *unused = nullptr;
        std::vector<NodeContext> nodes;
        for (uint32_t i = 0; i < 3; ++i) nodes.push_back(make_fake_node("n" + std::to_string(i), i, unused));
        for (int mask = 0; mask < 8; ++mask) {
            for (int i = 0; i < 3; ++i) nodes[i].state.reachable = (mask >> i) & 1;
            auto leader = elect_leader(nodes);
            if (mask == 0) {
                assert(!leader);
                continue;
            }
            int expected = 0;
            while (!((mask >> expected) & 1)) ++expected;
            assert(leader && *leader == static_cast<size_t>(expected));
        }
    }

    // A node whose transport throws is isolated; the other still converges
    {
        FakeHttpClient *b = nullptr;
        std::vector<NodeContext> nodes;
        FakeHttpClient *ignored = nullptr;
        NodeContext a = make_fake_node("A", 0, ignored);
        a.http = std::make_unique<ThrowingHttpClient>();
        nodes.push_back(std::move(a));
        nodes.push_back(make_fake_node("B", 1, b));
        healthy(*b);
        ElectionEnforcer enforcer(make_test_config(2), std::move(nodes), ReportSink{});
        CycleResult res = enforcer.run_cycle();
        assert(!res.reachable[0]);
        assert(res.elected && *res.elected == 1);
        assert(patched_states(*b) == std::vector<bool>{true});
    }

    // Three nodes: exactly one enable per cycle
    {
        FakeHttpClient *f[3] = {nullptr, nullptr, nullptr};
        std::vector<NodeContext> nodes;
        for (uint32_t i = 0; i < 3; ++i) nodes.push_back(make_fake_node("n" + std::to_string(i), i, f[i]));
        f[0]->fail("GET", HEALTH_TARGET, "down");
        healthy(*f[1]);
        healthy(*f[2]);
        ElectionEnforcer enforcer(make_test_config(3), std::move(nodes), ReportSink{});
        enforcer.run_cycle();
        size_t enabled = 0;
        for (auto *fake : f) {
            for (bool state : patched_states(*fake)) enabled += state ? 1 : 0;
        }
        assert(enabled == 1);
        assert(patched_states(*f[1]) == std::vector<bool>{true});
    }

    // Stop requested mid-cycle: the cycle completes, no sleep follows
    {
        Pair p = make_pair_of_nodes();
        healthy(*p.a);
        healthy(*p.b);
        std::atomic<bool> stop{false};
        uint64_t last_cycle = 0;
        ReportSink sink;
        sink.callback = [&](const NodeEvent &e) {
            last_cycle = e.cycle;
            if (e.kind == NodeEventKind::ELECTED) stop.store(true);
        };
        WardenConfig cfg = make_test_config(2);
        cfg.check_interval_seconds = 60;
        ElectionEnforcer enforcer(cfg, std::move(p.nodes), sink);
        auto start = std::chrono::steady_clock::now();
        enforcer.run(stop);
        assert(elapsed_ms(start) < 5000);
        assert(last_cycle == 1);
        assert((patched_states(*p.a) == std::vector<bool>{true}));
        assert((patched_states(*p.b) == std::vector<bool>{false}));
    }

    // The loop repeats after the interval and reuses sessions
    {
        Pair p = make_pair_of_nodes();
        healthy(*p.a);
        healthy(*p.b);
        std::atomic<bool> stop{false};
        uint64_t last_cycle = 0;
        ReportSink sink;
        sink.callback = [&](const NodeEvent &e) {
            last_cycle = e.cycle;
            if (e.cycle == 2 && e.kind == NodeEventKind::ELECTED) stop.store(true);
        };
        ElectionEnforcer enforcer(make_test_config(2), std::move(p.nodes), sink);
        auto start = std::chrono::steady_clock::now();
        enforcer.run(stop);
        assert(elapsed_ms(start) >= 900);
        assert(last_cycle == 2);
        assert(p.a->count("GET", HEALTH_TARGET) == 2);
        assert(p.a->count("POST", AUTH_TARGET) == 1);
        assert((patched_states(*p.a) == std::vector<bool>{true, true}));
    }

    // Stop during the sleep ends it early
    {
        Pair p = make_pair_of_nodes();
        healthy(*p.a);
        healthy(*p.b);
        std::atomic<bool> stop{false};
        uint64_t last_cycle = 0;
        ReportSink sink;
        sink.callback = [&](const NodeEvent &e) { last_cycle = e.cycle; };
        WardenConfig cfg = make_test_config(2);
        cfg.check_interval_seconds = 60;
        ElectionEnforcer enforcer(cfg, std::move(p.nodes), sink);
        std::thread stopper([&stop]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            stop.store(true);
        });
        auto start = std::chrono::steady_clock::now();
        enforcer.run(stop);
        stopper.join();
        assert(elapsed_ms(start) < 5000);
        assert(last_cycle == 1);
    }
    return 0;
}
